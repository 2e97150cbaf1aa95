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

#include <CGAL/Exact_predicates_inexact_constructions_kernel.h>
#include <CGAL/Delaunay_triangulation_2.h>
#include <CGAL/Triangulation_vertex_base_with_info_2.h>

#include <utility>

#include "iceregrid/geometry/Triangulation.hh"
#include "iceregrid/geometry/PointSet.hh"
#include "iceregrid/util/Logger.hh"

namespace iceregrid {

typedef CGAL::Exact_predicates_inexact_constructions_kernel K;
typedef CGAL::Triangulation_vertex_base_with_info_2<unsigned int, K> Vertex_base;
typedef CGAL::Triangulation_data_structure_2<Vertex_base> Data_structure;
typedef CGAL::Delaunay_triangulation_2<K, Data_structure> Delaunay_triangulation;

typedef K::Point_2 Point;
typedef Delaunay_triangulation::Face_handle Face_handle;
typedef Delaunay_triangulation::Vertex_handle Vertex_handle;

DegenerateGeometry::DegenerateGeometry(const ErrorLocation &location,
                                       const std::string &message)
  : RuntimeError(location, message) {
  // empty
}

struct Triangulation::Impl {
  Delaunay_triangulation dt;
  //! the face found by the previous query; used as a hint
  mutable Face_handle hint;
};

Triangulation::Triangulation(const PointSet &points, const Logger &log,
                             unsigned int max_points_warning)
  : m_impl(new Impl) {

  try {
    size_t n_points = points.size();

    if (n_points == 0) {
      throw RuntimeError(ICEREGRID_ERROR_LOCATION,
                         "cannot triangulate an empty point set");
    }

    if (n_points > max_points_warning) {
      log.message(1,
                  "ICEREGRID WARNING: triangulating %d points; triangulation of more than %d"
                  " points may fail or be slow\n",
                  (int)n_points, (int)max_points_warning);
    }

    std::vector<std::pair<Point, unsigned int> > input;
    input.reserve(n_points);
    for (size_t k = 0; k < n_points; ++k) {
      input.emplace_back(Point(points.x(k), points.y(k)), (unsigned int)k);
    }

    try {
      m_impl->dt.insert(input.begin(), input.end());
    } catch (std::exception &e) {
      if (n_points > max_points_warning) {
        throw DegenerateGeometry(ICEREGRID_ERROR_LOCATION,
                                 std::string("triangulation failed: ") + e.what());
      }
      throw RuntimeError(ICEREGRID_ERROR_LOCATION,
                         std::string("triangulation failed: ") + e.what());
    }

    if (m_impl->dt.dimension() < 2) {
      throw DegenerateGeometry(ICEREGRID_ERROR_LOCATION,
                               "a triangulation requires at least 3 non-collinear points");
    }
  } catch (...) {
    delete m_impl;
    throw;
  }
}

Triangulation::~Triangulation() {
  delete m_impl;
}

size_t Triangulation::n_vertices() const {
  return m_impl->dt.number_of_vertices();
}

/*!
 * Returns a finite face incident to `v`.
 */
static Face_handle finite_incident_face(const Delaunay_triangulation &dt, Vertex_handle v) {
  Delaunay_triangulation::Face_circulator f = dt.incident_faces(v), done(f);
  do {
    if (not dt.is_infinite(f)) {
      return f;
    }
  } while (++f != done);

  // unreachable in a 2D triangulation
  throw RuntimeError(ICEREGRID_ERROR_LOCATION, "a vertex without finite incident faces");
}

Location Triangulation::locate(double x, double y) const {
  const Delaunay_triangulation &dt = m_impl->dt;

  Location result;
  result.inside = false;
  result.vertex = {{-1, -1, -1}};
  result.weight = {{0.0, 0.0, 0.0}};

  Point p(x, y);
  Delaunay_triangulation::Locate_type type;
  int li = 0;

  Face_handle face = dt.locate(p, type, li, m_impl->hint);

  switch (type) {
  case Delaunay_triangulation::OUTSIDE_CONVEX_HULL:
  case Delaunay_triangulation::OUTSIDE_AFFINE_HULL:
    return result;
  case Delaunay_triangulation::VERTEX:
    if (dt.is_infinite(face)) {
      face = finite_incident_face(dt, face->vertex(li));
    }
    break;
  case Delaunay_triangulation::EDGE:
    // a point on a hull edge: use the finite face on the other side of this edge
    if (dt.is_infinite(face)) {
      face = face->neighbor(li);
    }
    break;
  case Delaunay_triangulation::FACE:
    break;
  }

  m_impl->hint = face;

  const Point
    &p0 = face->vertex(0)->point(),
    &p1 = face->vertex(1)->point(),
    &p2 = face->vertex(2)->point();

  const double
    x0 = p0.x(), y0 = p0.y(),
    x1 = p1.x(), y1 = p1.y(),
    x2 = p2.x(), y2 = p2.y();

  double det = (y1 - y2) * (x0 - x2) + (x2 - x1) * (y0 - y2);

  double
    l0 = ((y1 - y2) * (x - x2) + (x2 - x1) * (y - y2)) / det,
    l1 = ((y2 - y0) * (x - x2) + (x0 - x2) * (y - y2)) / det;

  result.inside = true;
  result.vertex = {{(int)face->vertex(0)->info(),
                    (int)face->vertex(1)->info(),
                    (int)face->vertex(2)->info()}};
  result.weight = {{l0, l1, 1.0 - (l0 + l1)}};

  return result;
}

std::vector<Location> Triangulation::locate(const PointSet &query) const {
  std::vector<Location> result(query.size());

  for (size_t k = 0; k < query.size(); ++k) {
    result[k] = locate(query.x(k), query.y(k));
  }

  return result;
}

} // end of namespace iceregrid
