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

#ifndef ICEREGRID_NETCDFFIELDIO_H
#define ICEREGRID_NETCDFFIELDIO_H

#include <set>

#include "iceregrid/fields/FieldIO.hh"
#include "iceregrid/util/io/File.hh"

namespace iceregrid {

//! A source file using CISM (structured) or MPAS (unstructured) layout.
/*!
 * The layout is detected using coordinate variables: `x1` means CISM, `xCell` means MPAS.
 */
class SourceFile : public FieldSource {
public:
  explicit SourceFile(const std::string &filename);
  virtual ~SourceFile() = default;

  SourceLayout layout() const;
  bool has_field(const std::string &name) const;
  bool time_dependent(const std::string &name) const;
  unsigned int n_levels(const std::string &name) const;
  std::vector<double> read(const std::string &name, unsigned int time_index) const;
  std::vector<double> vertical_levels(const std::string &name) const;
  PointSet points(GridType grid) const;

private:
  File m_file;
  SourceLayout m_layout;
  std::string m_time_dimension;
  std::set<std::string> m_horizontal_dimensions;

  std::string vertical_dimension(const std::string &name) const;
};

//! An MPAS-LI file that interpolated fields are written to. Modified in place.
class DestinationFile : public FieldDestination {
public:
  explicit DestinationFile(const std::string &filename);
  virtual ~DestinationFile() = default;

  bool has_field(const std::string &name) const;
  bool time_dependent(const std::string &name) const;
  std::vector<double> vertical_levels(const std::string &name) const;
  PointSet points() const;
  void write(const std::string &name, unsigned int time_index,
             const std::vector<double> &values);

  //! Prepend a line to the `history` attribute.
  void append_history(const std::string &text) const;

private:
  File m_file;
};

} // end of namespace iceregrid

#endif /* ICEREGRID_NETCDFFIELDIO_H */
