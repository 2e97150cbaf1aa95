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

#ifndef ICEREGRID_VERTICALRELAYERING_H
#define ICEREGRID_VERTICALRELAYERING_H

#include <vector>

#include "iceregrid/util/interpolation.hh"

namespace iceregrid {

class Logger;

//! Sigma coordinates of layer centers corresponding to layer thickness fractions.
std::vector<double> layer_centers(const std::vector<double> &fractions);

//! Sigma coordinates of layer interfaces corresponding to layer thickness fractions.
std::vector<double> layer_interfaces(const std::vector<double> &fractions);

//! Piecewise-linear re-sampling of columns from one set of vertical levels to another.
/*!
 * Values below the lowest source level are set to the value at the lowest source level,
 * values above the highest source level to the value at the highest one.
 *
 * If the lowest (highest) source level is within `tolerance` from the lowest (highest)
 * target level and does not cover it, the source level is moved by `tolerance`.
 */
class VerticalRelayering {
public:
  VerticalRelayering(const std::vector<double> &source_levels,
                     const std::vector<double> &target_levels,
                     double tolerance,
                     const Logger &log);

  size_t n_source() const;
  size_t n_target() const;

  //! Source levels after adjustment.
  const std::vector<double>& source_levels() const;
  const std::vector<double>& target_levels() const;

  //! True if target levels below the lowest source level use constant extrapolation.
  bool extrapolates_below() const;
  //! True if target levels above the highest source level use constant extrapolation.
  bool extrapolates_above() const;

  std::vector<double> relayer(const std::vector<double> &column) const;

  void relayer(const double *column, double *result) const;
private:
  std::vector<double> m_source_levels;
  std::vector<double> m_target_levels;
  bool m_extrapolates_below;
  bool m_extrapolates_above;
  Interpolation m_interpolation;
};

} // end of namespace iceregrid

#endif /* ICEREGRID_VERTICALRELAYERING_H */
