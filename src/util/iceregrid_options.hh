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
#ifndef ICEREGRID_OPTIONS_H
#define ICEREGRID_OPTIONS_H

#include <string>
#include <vector>

namespace iceregrid {

class Logger;

//! Handle `-usage`, `-help` and `-version`, and check that `required_options` are set.
/*!
 * Returns true if the driver should stop.
 */
bool show_usage_check_req_opts(const Logger &log,
                               const std::string &execname,
                               const std::vector<std::string> &required_options,
                               const std::string &usage);

//! Command-line options read from the PETSc options database.
namespace options {

//! An option value and whether it was set on the command line.
template <typename T>
class Option {
public:
  Option()
    : m_value(), m_is_set(false) {
    // empty
  }
  operator T() const {
    return m_value;
  }
  T value() const {
    return m_value;
  }
  bool is_set() const {
    return m_is_set;
  }
protected:
  void set(const T &value, bool is_set) {
    m_value  = value;
    m_is_set = is_set;
  }
private:
  T m_value;
  bool m_is_set;
};

enum ArgumentFlag {ALLOW_EMPTY, DONT_ALLOW_EMPTY};

class String : public Option<std::string> {
public:
  //! An option without a default: if set, it requires an argument.
  String(const std::string &option, const std::string &description);

  String(const std::string &option, const std::string &description,
         const std::string &default_value, ArgumentFlag flag = DONT_ALLOW_EMPTY);
private:
  void process(const std::string &option, const std::string &description,
               const std::string &default_value, ArgumentFlag flag);
};

//! A string option restricted to a comma-separated list of `choices`.
class Keyword : public Option<std::string> {
public:
  Keyword(const std::string &option, const std::string &description,
          const std::string &choices, const std::string &default_value);
};

class Integer : public Option<int> {
public:
  Integer(const std::string &option, const std::string &description, int default_value);
};

class Real : public Option<double> {
public:
  Real(const std::string &option, const std::string &description, double default_value);
};

//! True if `option` is set. Does not accept an argument.
bool Bool(const std::string &option, const std::string &description);

} // end of namespace options

} // end of namespace iceregrid

#endif /* ICEREGRID_OPTIONS_H */
