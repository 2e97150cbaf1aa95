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

#include <cmath>

#include "iceregrid/regrid/HorizontalInterpolation.hh"
#include "iceregrid/geometry/PointSet.hh"
#include "iceregrid/util/error_handling.hh"
#include "iceregrid/util/iceregrid_utilities.hh"

namespace iceregrid {

std::string grid_name(GridType grid) {
  switch (grid) {
  case PRIMARY_GRID:
    return "x1";
  case STAGGERED_GRID:
    return "x0";
  default:
  case CELL_GRID:
    return "cell";
  }
}

GridType grid_from_string(const std::string &name) {
  if (name == "x1") {
    return PRIMARY_GRID;
  }
  if (name == "x0") {
    return STAGGERED_GRID;
  }
  if (name == "cell") {
    return CELL_GRID;
  }
  throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                "unknown grid type: '%s'", name.c_str());
}

std::string method_name(Method method) {
  switch (method) {
  case BILINEAR:
    return "bilinear";
  case BARYCENTRIC:
    return "barycentric";
  case NEAREST:
    return "nearest";
  default:
  case SPARSE:
    return "esmf";
  }
}

Method method_from_string(const std::string &tag) {
  if (tag == "b" or tag == "bilinear") {
    return BILINEAR;
  }
  if (tag == "d" or tag == "barycentric") {
    return BARYCENTRIC;
  }
  if (tag == "n" or tag == "nearest") {
    return NEAREST;
  }
  if (tag == "e" or tag == "esmf") {
    return SPARSE;
  }
  throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                "unknown interpolation method: '%s'", tag.c_str());
}

void check_compatibility(Method method, GridType grid) {
  if (method == BILINEAR and grid == CELL_GRID) {
    throw RuntimeError(ICEREGRID_ERROR_LOCATION,
                       "bilinear interpolation requires a structured source grid");
  }

  if (method == SPARSE and grid != PRIMARY_GRID) {
    throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                  "sparse weights are supported on the '%s' grid only"
                                  " (got '%s')",
                                  grid_name(PRIMARY_GRID).c_str(), grid_name(grid).c_str());
  }
}

HorizontalInterpolation::HorizontalInterpolation(size_t n_source, size_t n_target)
  : m_n_source(n_source),
    m_n_target(n_target) {
  // empty
}

size_t HorizontalInterpolation::n_source() const {
  return m_n_source;
}

size_t HorizontalInterpolation::n_target() const {
  return m_n_target;
}

std::vector<double> HorizontalInterpolation::interpolate(const std::vector<double> &source) const {
  if (source.size() != m_n_source) {
    throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                  "input has %d values (expected %d)",
                                  (int)source.size(), (int)m_n_source);
  }

  std::vector<double> result(m_n_target);
  interpolate(source.data(), result.data());
  return result;
}

void HorizontalInterpolation::interpolate(const double *source, double *target) const {
  interpolate_impl(source, target);
}

Bilinear::Bilinear(const PointSet &source, const PointSet &target)
  : HorizontalInterpolation(source.size(), target.size()) {

  if (not source.structured()) {
    throw RuntimeError(ICEREGRID_ERROR_LOCATION,
                       "bilinear interpolation requires a structured source grid");
  }

  m_x_axis = source.x_axis();
  m_y_axis = source.y_axis();
  m_x      = target.x();
  m_y      = target.y();

  for (size_t k = 0; k < m_x.size(); ++k) {
    if (not (std::isfinite(m_x[k]) and std::isfinite(m_y[k]))) {
      throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                    "destination point %d has non-finite coordinates",
                                    (int)k);
    }
  }
}

/*!
 * Find the index `i` of the cell [axis[i], axis[i + 1]] containing `x` and the relative
 * position `alpha` of `x` in it.
 *
 * The initial guess uses the spacing of the first cell. It is then corrected to support
 * non-uniform grids.
 *
 * If `x` is outside of the grid `alpha` is outside of [0, 1].
 */
static void locate_cell(const std::vector<double> &axis, double x, int &i, double &alpha) {
  const int N = axis.size();

  double dx = axis[1] - axis[0];
  double s  = dx > 0.0 ? 1.0 : -1.0;

  // clip before converting to int: `x` may be far outside of the grid
  i = (int)clip(std::floor((x - axis[0]) / dx), 0.0, (double)(N - 2));

  while (i > 0 and s * (x - axis[i]) < 0.0) {
    --i;
  }
  while (i < N - 2 and s * (x - axis[i + 1]) > 0.0) {
    ++i;
  }

  alpha = (x - axis[i]) / (axis[i + 1] - axis[i]);
}

void Bilinear::interpolate_impl(const double *source, double *target) const {
  const int Nx = m_x_axis.size();

  for (size_t k = 0; k < m_x.size(); ++k) {
    int i = 0, j = 0;
    double alpha = 0.0, beta = 0.0;

    locate_cell(m_x_axis, m_x[k], i, alpha);
    locate_cell(m_y_axis, m_y[k], j, beta);

    const double
      f_00 = source[j * Nx + i],
      f_10 = source[j * Nx + i + 1],
      f_01 = source[(j + 1) * Nx + i],
      f_11 = source[(j + 1) * Nx + i + 1];

    target[k] = ((1.0 - alpha) * (1.0 - beta) * f_00 +
                 alpha * (1.0 - beta) * f_10 +
                 (1.0 - alpha) * beta * f_01 +
                 alpha * beta * f_11);
  }
}

Barycentric::Barycentric(const PointSet &source, const PointSet &target,
                         const Logger &log, unsigned int max_points_warning)
  : HorizontalInterpolation(source.size(), target.size()),
    m_weights(source, target, log, max_points_warning) {
  // empty
}

const BarycentricWeights& Barycentric::weights() const {
  return m_weights;
}

void Barycentric::interpolate_impl(const double *source, double *target) const {
  const size_t N = n_target();

  for (size_t k = 0; k < N; ++k) {
    const auto &v = m_weights.vertices(k);
    const auto &w = m_weights.weights(k);

    target[k] = w[0] * source[v[0]] + w[1] * source[v[1]] + w[2] * source[v[2]];
  }

  // points outside of the convex hull of the source grid: use the nearest neighbor
  const auto &points  = m_weights.extrapolation_points();
  const auto &sources = m_weights.extrapolation_sources();
  for (size_t k = 0; k < points.size(); ++k) {
    target[points[k]] = source[sources[k]];
  }
}

NearestNeighbor::NearestNeighbor(const PointSet &source, const PointSet &target)
  : HorizontalInterpolation(source.size(), target.size()),
    m_weights(source, target) {
  // empty
}

const NearestWeights& NearestNeighbor::weights() const {
  return m_weights;
}

void NearestNeighbor::interpolate_impl(const double *source, double *target) const {
  const auto &index = m_weights.source();

  for (size_t k = 0; k < index.size(); ++k) {
    target[k] = source[index[k]];
  }
}

SparseMatrix::SparseMatrix(const SparseWeights &weights, size_t n_source, size_t n_target)
  : HorizontalInterpolation(n_source, n_target),
    m_weights(weights) {

  const auto &row = m_weights.row();
  const auto &col = m_weights.col();

  for (size_t k = 0; k < m_weights.size(); ++k) {
    if (row[k] < 1 or row[k] > (int)n_target) {
      throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                    "sparse weights: row[%d] = %d is out of range [1, %d]",
                                    (int)k, row[k], (int)n_target);
    }

    if (col[k] < 0 or col[k] >= (int)n_source) {
      throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                    "sparse weights: col[%d] = %d is out of range [0, %d]",
                                    (int)k, col[k], (int)n_source - 1);
    }
  }
}

void SparseMatrix::interpolate_impl(const double *source, double *target) const {
  const auto &S   = m_weights.S();
  const auto &row = m_weights.row();
  const auto &col = m_weights.col();

  for (size_t k = 0; k < n_target(); ++k) {
    target[k] = 0.0;
  }

  for (size_t k = 0; k < S.size(); ++k) {
    target[row[k] - 1] += S[k] * source[col[k]];
  }
}

} // end of namespace iceregrid
