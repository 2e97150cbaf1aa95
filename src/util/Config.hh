/* Copyright (C) 2026 IceRegrid Authors
 *
 * This file is part of IceRegrid.
 *
 * IceRegrid is free software; you can redistribute it and/or modify it under the
 * terms of the GNU General Public License as published by the Free Software
 * Foundation; either version 3 of the License, or (at your option) any later
 * version.
 *
 * IceRegrid is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS
 * FOR A PARTICULAR PURPOSE.  See the GNU General Public License for more
 * details.
 *
 * You should have received a copy of the GNU General Public License
 * along with IceRegrid; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin St, Fifth Floor, Boston, MA  02110-1301  USA
 */

#ifndef _ICEREGRID_CONFIG_H_
#define _ICEREGRID_CONFIG_H_

#include <string>

#include "iceregrid/util/ConfigInterface.hh"

namespace iceregrid {

//! A configuration database that can be initialized from attributes of a NetCDF variable.
class NetCDFConfig : public Config {
public:
  NetCDFConfig(const std::string &variable_name);
  ~NetCDFConfig();

protected:
  void read_impl(const File &file);

  bool is_set_impl(const std::string &name) const;

  Doubles all_doubles_impl() const;
  double get_number_impl(const std::string &name) const;
  void set_number_impl(const std::string &name, double value);

  Strings all_strings_impl() const;
  std::string get_string_impl(const std::string &name) const;
  void set_string_impl(const std::string &name, const std::string &value);

  Flags all_flags_impl() const;
  bool get_flag_impl(const std::string& name) const;
  void set_flag_impl(const std::string& name, bool value);
protected:
  std::string m_variable_name;
  Doubles m_numbers;
  Strings m_strings;
  Flags m_flags;
};

//! @brief Default configuration database: contains all parameters used by IceRegrid, with
//! their documentation, types, and command-line options.
class DefaultConfig : public NetCDFConfig {
public:
  DefaultConfig();
  ~DefaultConfig() = default;

  typedef std::shared_ptr<DefaultConfig> Ptr;
  typedef std::shared_ptr<const DefaultConfig> ConstPtr;
private:
  void add_number(const std::string &name, double value, const std::string &type,
                  const std::string &units, const std::string &option,
                  const std::string &doc);
  void add_string(const std::string &name, const std::string &value,
                  const std::string &option, const std::string &doc);
  void add_keyword(const std::string &name, const std::string &value,
                   const std::string &choices, const std::string &option,
                   const std::string &doc);
  void add_flag(const std::string &name, bool value,
                const std::string &option, const std::string &doc);
};

} // end of namespace iceregrid

#endif /* _ICEREGRID_CONFIG_H_ */
