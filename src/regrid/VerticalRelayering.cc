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

#include "iceregrid/regrid/VerticalRelayering.hh"
#include "iceregrid/util/Logger.hh"
#include "iceregrid/util/error_handling.hh"
#include "iceregrid/util/iceregrid_utilities.hh"

namespace iceregrid {

std::vector<double> layer_centers(const std::vector<double> &fractions) {
  size_t N = fractions.size();
  std::vector<double> result(N);

  if (N == 0) {
    return result;
  }

  result[0] = 0.5 * fractions[0];
  for (size_t k = 1; k < N; ++k) {
    result[k] = result[k - 1] + 0.5 * fractions[k - 1] + 0.5 * fractions[k];
  }

  return result;
}

std::vector<double> layer_interfaces(const std::vector<double> &fractions) {
  size_t N = fractions.size();
  std::vector<double> result(N + 1);

  result[0] = 0.0;
  for (size_t k = 1; k <= N; ++k) {
    result[k] = result[k - 1] + fractions[k - 1];
  }

  return result;
}

/*!
 * Move the lowest and the highest source levels to cover target levels if they are
 * within `tolerance`.
 */
static std::vector<double> adjust_levels(const std::vector<double> &source,
                                         const std::vector<double> &target,
                                         double tolerance) {
  if (source.empty()) {
    throw RuntimeError(ICEREGRID_ERROR_LOCATION, "source vertical levels are empty");
  }

  if (target.empty()) {
    throw RuntimeError(ICEREGRID_ERROR_LOCATION, "target vertical levels are empty");
  }

  if (not is_nondecreasing(source)) {
    throw RuntimeError(ICEREGRID_ERROR_LOCATION,
                       "source vertical levels have to be non-decreasing");
  }

  if (not is_nondecreasing(target)) {
    throw RuntimeError(ICEREGRID_ERROR_LOCATION,
                       "target vertical levels have to be non-decreasing");
  }

  std::vector<double> result = source;

  double
    source_min = source.front(),
    source_max = source.back(),
    target_min = target.front(),
    target_max = target.back();

  if (source_min > target_min and source_min - tolerance < target_min) {
    result.front() -= tolerance;
  }

  if (source_max < target_max and source_max + tolerance > target_max) {
    result.back() += tolerance;
  }

  return result;
}

VerticalRelayering::VerticalRelayering(const std::vector<double> &source_levels,
                                       const std::vector<double> &target_levels,
                                       double tolerance,
                                       const Logger &log)
  : m_source_levels(adjust_levels(source_levels, target_levels, tolerance)),
    m_target_levels(target_levels),
    m_extrapolates_below(false),
    m_extrapolates_above(false),
    m_interpolation(m_source_levels, m_target_levels) {

  m_extrapolates_below = m_source_levels.front() > m_target_levels.front();
  m_extrapolates_above = m_source_levels.back() < m_target_levels.back();

  if (m_extrapolates_below) {
    log.message(1,
                "ICEREGRID WARNING: the lowest source level (%f) is above the lowest"
                " destination level (%f).\n"
                "  Values at the first source level will be used for all destination levels"
                " in this region.\n",
                m_source_levels.front(), m_target_levels.front());
  }

  if (m_extrapolates_above) {
    log.message(1,
                "ICEREGRID WARNING: the highest source level (%f) is below the highest"
                " destination level (%f).\n"
                "  Values at the last source level will be used for all destination levels"
                " in this region.\n",
                m_source_levels.back(), m_target_levels.back());
  }
}

size_t VerticalRelayering::n_source() const {
  return m_source_levels.size();
}

size_t VerticalRelayering::n_target() const {
  return m_target_levels.size();
}

const std::vector<double>& VerticalRelayering::source_levels() const {
  return m_source_levels;
}

const std::vector<double>& VerticalRelayering::target_levels() const {
  return m_target_levels;
}

bool VerticalRelayering::extrapolates_below() const {
  return m_extrapolates_below;
}

bool VerticalRelayering::extrapolates_above() const {
  return m_extrapolates_above;
}

std::vector<double> VerticalRelayering::relayer(const std::vector<double> &column) const {
  if (column.size() != n_source()) {
    throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                  "a column has %d values (expected %d)",
                                  (int)column.size(), (int)n_source());
  }

  std::vector<double> result(n_target());
  relayer(column.data(), result.data());
  return result;
}

void VerticalRelayering::relayer(const double *column, double *result) const {
  m_interpolation.interpolate(column, result);
}

} // end of namespace iceregrid
