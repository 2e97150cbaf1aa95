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

#ifndef ICEREGRID_REGRIDDER_H
#define ICEREGRID_REGRIDDER_H

#include <map>
#include <memory>

#include "iceregrid/geometry/PointSet.hh"
#include "iceregrid/regrid/HorizontalInterpolation.hh"

namespace iceregrid {

class Context;
class FieldSource;

//! Horizontal interpolation from all grids of a source to a target point set.
/*!
 * Interpolation objects are created when a field on a grid is interpolated for the first
 * time and re-used after that.
 */
class Regridder {
public:
  Regridder(std::shared_ptr<const Context> ctx, Method method,
            const FieldSource &source, const PointSet &target);

  Method method() const;

  const PointSet& target() const;

  //! Interpolation from the grid `grid`. Throws if `method` cannot be used on `grid`.
  const HorizontalInterpolation& interpolation(GridType grid);

  //! True if the interpolation from `grid` was already created.
  bool initialized(GridType grid) const;
private:
  //! Source grid and the corresponding interpolation.
  struct GridTopology {
    std::shared_ptr<PointSet> points;
    std::shared_ptr<HorizontalInterpolation> interpolation;
  };

  std::shared_ptr<const Context> m_ctx;
  Method m_method;
  const FieldSource &m_source;
  PointSet m_target;
  std::map<GridType, GridTopology> m_grids;

  std::shared_ptr<HorizontalInterpolation> allocate(const PointSet &points) const;
};

} // end of namespace iceregrid

#endif /* ICEREGRID_REGRIDDER_H */
