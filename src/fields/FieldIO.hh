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

#ifndef ICEREGRID_FIELDIO_H
#define ICEREGRID_FIELDIO_H

#include <string>
#include <vector>

#include "iceregrid/fields/FieldRegistry.hh"
#include "iceregrid/geometry/PointSet.hh"

namespace iceregrid {

//! Provides source fields, their grids and vertical coordinates.
class FieldSource {
public:
  virtual ~FieldSource() = default;

  virtual SourceLayout layout() const = 0;

  virtual bool has_field(const std::string &name) const = 0;

  //! True if a field has a time dimension.
  virtual bool time_dependent(const std::string &name) const = 0;

  //! Number of vertical levels of a field (1 if a field has no vertical dimension).
  virtual unsigned int n_levels(const std::string &name) const = 0;

  //! Read one time level of a field.
  /*!
   * Values of layered fields are stored layer by layer: `result[k * N + p]` is the value
   * at the level `k` and the point `p` of the corresponding grid.
   *
   * `time_index` is ignored if the field does not depend on time.
   */
  virtual std::vector<double> read(const std::string &name, unsigned int time_index) const = 0;

  //! Sigma coordinates of vertical levels of a layered field.
  virtual std::vector<double> vertical_levels(const std::string &name) const = 0;

  //! Points of a grid. Throws if the grid is not present.
  virtual PointSet points(GridType grid) const = 0;
};

//! Stores interpolated fields.
class FieldDestination {
public:
  virtual ~FieldDestination() = default;

  virtual bool has_field(const std::string &name) const = 0;

  virtual bool time_dependent(const std::string &name) const = 0;

  //! Sigma coordinates of vertical levels of a layered field.
  virtual std::vector<double> vertical_levels(const std::string &name) const = 0;

  virtual PointSet points() const = 0;

  //! Write one time level of a field.
  /*!
   * Values of layered fields are stored column by column: `values[p * M + k]` is the
   * value at the point `p` and the level `k`.
   *
   * `time_index` is ignored if the field does not depend on time.
   */
  virtual void write(const std::string &name, unsigned int time_index,
                     const std::vector<double> &values) = 0;
};

} // end of namespace iceregrid

#endif /* ICEREGRID_FIELDIO_H */
