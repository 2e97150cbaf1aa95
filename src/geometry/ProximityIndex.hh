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

#ifndef ICEREGRID_PROXIMITYINDEX_H
#define ICEREGRID_PROXIMITYINDEX_H

#include <vector>

namespace iceregrid {

class PointSet;

//! A k-d tree used to find the nearest point of a point set.
class ProximityIndex {
public:
  ProximityIndex(const PointSet &points);
  ~ProximityIndex();

  //! Index of the point nearest to (x, y).
  /*!
   * If several points are at exactly the same distance the one with the largest index is
   * used.
   */
  int nearest(double x, double y) const;

  std::vector<int> nearest(const PointSet &query) const;
private:
  struct Impl;
  Impl *m_impl;

  // disable copying and assignments
  ProximityIndex(const ProximityIndex &other);
  ProximityIndex & operator=(const ProximityIndex &);
};

} // end of namespace iceregrid

#endif /* ICEREGRID_PROXIMITYINDEX_H */
