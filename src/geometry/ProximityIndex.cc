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
#include <CGAL/Search_traits_2.h>
#include <CGAL/Search_traits_adapter.h>
#include <CGAL/Orthogonal_k_neighbor_search.h>
#include <CGAL/property_map.h>

#include <boost/iterator/zip_iterator.hpp>
#include <boost/tuple/tuple.hpp>

#include <algorithm>

#include "iceregrid/geometry/ProximityIndex.hh"
#include "iceregrid/geometry/PointSet.hh"
#include "iceregrid/util/error_handling.hh"

namespace iceregrid {

typedef CGAL::Exact_predicates_inexact_constructions_kernel K;
typedef K::Point_2 Point;
typedef boost::tuple<Point, int> Point_and_index;

typedef CGAL::Search_traits_2<K> Traits_base;
typedef CGAL::Search_traits_adapter<Point_and_index,
                                    CGAL::Nth_of_tuple_property_map<0, Point_and_index>,
                                    Traits_base> Traits;
typedef CGAL::Orthogonal_k_neighbor_search<Traits> Neighbor_search;
typedef Neighbor_search::Tree Tree;
typedef Neighbor_search::Distance Distance;

struct ProximityIndex::Impl {
  Tree tree;
  unsigned int n_points;
};

ProximityIndex::ProximityIndex(const PointSet &points)
  : m_impl(new Impl) {

  if (points.size() == 0) {
    delete m_impl;
    throw RuntimeError(ICEREGRID_ERROR_LOCATION,
                       "cannot build a proximity index for an empty point set");
  }

  std::vector<Point> P;
  std::vector<int> index;
  P.reserve(points.size());
  index.reserve(points.size());
  for (size_t k = 0; k < points.size(); ++k) {
    P.emplace_back(points.x(k), points.y(k));
    index.push_back((int)k);
  }

  m_impl->n_points = points.size();
  m_impl->tree.insert(boost::make_zip_iterator(boost::make_tuple(P.begin(), index.begin())),
                      boost::make_zip_iterator(boost::make_tuple(P.end(), index.end())));
  m_impl->tree.build();
}

ProximityIndex::~ProximityIndex() {
  delete m_impl;
}

int ProximityIndex::nearest(double x, double y) const {
  Point query(x, y);
  Distance distance;

  // Ask for more neighbors while all of them are at the same distance: there may be more
  // points at this distance.
  unsigned int N = std::min(4u, m_impl->n_points);
  while (true) {
    Neighbor_search search(m_impl->tree, query, N, 0.0, true, distance);

    auto it = search.begin();
    double d_min = it->second;
    int result = boost::get<1>(it->first);
    unsigned int n_tied = 0;

    for (; it != search.end(); ++it) {
      if (it->second == d_min) {
        result = std::max(result, boost::get<1>(it->first));
        n_tied += 1;
      }
    }

    if (n_tied < N or N == m_impl->n_points) {
      return result;
    }

    N = std::min(2 * N, m_impl->n_points);
  }
}

std::vector<int> ProximityIndex::nearest(const PointSet &query) const {
  std::vector<int> result(query.size());

  for (size_t k = 0; k < query.size(); ++k) {
    result[k] = nearest(query.x(k), query.y(k));
  }

  return result;
}

} // end of namespace iceregrid
