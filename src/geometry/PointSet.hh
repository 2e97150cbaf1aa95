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

#ifndef ICEREGRID_POINTSET_H
#define ICEREGRID_POINTSET_H

#include <cstddef>
#include <vector>

namespace iceregrid {

//! An ordered set of points in the horizontal plane.
/*!
 * A point is identified by its position in the set.
 *
 * A *structured* point set is the Cartesian product of two strictly monotonic (ascending
 * or descending) axes. Points are ordered with `y` as the slow index and `x` as the fast
 * index, i.e. point `(i, j)` has the index `j * Nx + i`. This matches the `[y][x]` storage
 * order of fields on structured grids.
 *
 * An *unstructured* point set is an explicit list of points (e.g. mesh cell centers).
 */
class PointSet {
public:
  static PointSet Structured(const std::vector<double> &x_axis,
                             const std::vector<double> &y_axis);

  static PointSet Unstructured(const std::vector<double> &x,
                               const std::vector<double> &y);

  size_t size() const;

  double x(size_t k) const;
  double y(size_t k) const;

  const std::vector<double>& x() const;
  const std::vector<double>& y() const;

  bool structured() const;

  //! Structured point sets only.
  const std::vector<double>& x_axis() const;
  const std::vector<double>& y_axis() const;

  double x_min() const;
  double x_max() const;
  double y_min() const;
  double y_max() const;
private:
  PointSet();

  bool m_structured;

  // coordinates of all points
  std::vector<double> m_x, m_y;

  // axes of a structured point set
  std::vector<double> m_x_axis, m_y_axis;
};

} // end of namespace iceregrid

#endif /* ICEREGRID_POINTSET_H */
