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

#ifndef ICEREGRID_TRIANGULATION_H
#define ICEREGRID_TRIANGULATION_H

#include <array>
#include <vector>

#include "iceregrid/util/error_handling.hh"

namespace iceregrid {

class Logger;
class PointSet;

//! Thrown if a point set does not contain 3 non-collinear points.
class DegenerateGeometry : public RuntimeError {
public:
  DegenerateGeometry(const ErrorLocation &location, const std::string &message);
};

//! Result of locating a point in a triangulation.
struct Location {
  //! false if the point is outside of the convex hull of the triangulated point set
  bool inside;
  //! indexes (in the triangulated point set) of the vertices of the enclosing triangle
  std::array<int, 3> vertex;
  //! barycentric coordinates with respect to `vertex`; `weight[2] = 1 - (weight[0] + weight[1])`
  std::array<double, 3> weight;
};

//! Planar Delaunay triangulation of a point set.
/*!
 * Points on the boundary of the convex hull (on a hull edge or at a hull vertex) are
 * inside.
 */
class Triangulation {
public:
  Triangulation(const PointSet &points, const Logger &log,
                unsigned int max_points_warning);
  ~Triangulation();

  Location locate(double x, double y) const;

  std::vector<Location> locate(const PointSet &query) const;

  //! Number of vertices (duplicate input points are merged).
  size_t n_vertices() const;
private:
  struct Impl;
  Impl *m_impl;

  // disable copying and assignments
  Triangulation(const Triangulation &other);
  Triangulation & operator=(const Triangulation &);
};

} // end of namespace iceregrid

#endif /* ICEREGRID_TRIANGULATION_H */
