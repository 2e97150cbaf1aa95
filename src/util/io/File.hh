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
#ifndef ICEREGRID_FILE_H
#define ICEREGRID_FILE_H

#include <string>
#include <vector>

#include "iceregrid/util/io/IO_Flags.hh"

namespace iceregrid {

//! Variable name that stands for "global attributes" in attribute calls.
extern const char *global_attributes;

//! A NetCDF file opened with the serial NetCDF library.
/*!
 * Values are read and written as `double`; NetCDF converts them to and from the type of
 * the variable. Errors reported by NetCDF are thrown as RuntimeError.
 */
class File {
public:
  File(const std::string &filename, io::Mode mode);
  ~File();

  std::string filename() const;

  //! Flush data to disk.
  void sync() const;

  //! Length of a dimension (zero if it does not exist).
  unsigned int dimension_length(const std::string &name) const;

  //! Names of dimensions of a variable, slowest-varying first.
  std::vector<std::string> dimensions(const std::string &variable_name) const;

  bool find_variable(const std::string &variable_name) const;

  void read_variable(const std::string &variable_name,
                     const std::vector<unsigned int> &start,
                     const std::vector<unsigned int> &count,
                     double *output) const;

  std::vector<double> read_variable(const std::string &variable_name) const;

  void write_variable(const std::string &variable_name,
                      const std::vector<unsigned int> &start,
                      const std::vector<unsigned int> &count,
                      const double *input) const;

  unsigned int nattributes(const std::string &variable_name) const;
  std::string attribute_name(const std::string &variable_name, unsigned int n) const;
  io::Type attribute_type(const std::string &variable_name, const std::string &name) const;

  std::vector<double> read_double_attribute(const std::string &variable_name,
                                            const std::string &name) const;
  std::string read_text_attribute(const std::string &variable_name,
                                  const std::string &name) const;

  //! Prepend `text` to the global `history` attribute.
  void append_history(const std::string &text) const;
private:
  struct Impl;
  Impl *m_impl;

  int variable_id(const std::string &variable_name) const;

  void redef() const;
  void enddef() const;
  void write_attribute(const std::string &variable_name, const std::string &name,
                       const std::string &value) const;

  File(const File &other);
  File & operator=(const File &);
};

} // end of namespace iceregrid

#endif /* ICEREGRID_FILE_H */
