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

#ifndef ICEREGRID_HORIZONTALINTERPOLATION_H
#define ICEREGRID_HORIZONTALINTERPOLATION_H

#include <string>
#include <vector>

#include "iceregrid/regrid/WeightTable.hh"

namespace iceregrid {

class Logger;
class PointSet;

//! Source grid topologies.
enum GridType {
  //! primary structured grid (`x1`, `y1`)
  PRIMARY_GRID = 0,
  //! staggered structured grid (`x0`, `y0`)
  STAGGERED_GRID = 1,
  //! unstructured cell centers (`xCell`, `yCell`)
  CELL_GRID = 2
};

std::string grid_name(GridType grid);
GridType grid_from_string(const std::string &name);

//! Horizontal interpolation methods.
enum Method {BILINEAR, BARYCENTRIC, NEAREST, SPARSE};

std::string method_name(Method method);
//! Convert a method tag (`b`, `d`, `e`, `n` or a long name) to a Method.
Method method_from_string(const std::string &tag);

//! Throws RuntimeError if `method` cannot be used with a source field on `grid`.
void check_compatibility(Method method, GridType grid);

//! Interpolation of fields from a source point set to a target point set.
class HorizontalInterpolation {
public:
  virtual ~HorizontalInterpolation() = default;

  size_t n_source() const;
  size_t n_target() const;

  std::vector<double> interpolate(const std::vector<double> &source) const;

  //! Interpolate `n_source()` values in `source`, writing `n_target()` values to `target`.
  void interpolate(const double *source, double *target) const;
protected:
  HorizontalInterpolation(size_t n_source, size_t n_target);

  virtual void interpolate_impl(const double *source, double *target) const = 0;
private:
  size_t m_n_source;
  size_t m_n_target;
};

//! Bilinear interpolation from a structured point set.
/*!
 * Target points outside of the source grid use the nearest edge cell (i.e. linear
 * extrapolation).
 */
class Bilinear : public HorizontalInterpolation {
public:
  Bilinear(const PointSet &source, const PointSet &target);
protected:
  void interpolate_impl(const double *source, double *target) const;
private:
  std::vector<double> m_x_axis, m_y_axis;
  std::vector<double> m_x, m_y;
};

//! Barycentric interpolation using the Delaunay triangulation of the source point set.
class Barycentric : public HorizontalInterpolation {
public:
  Barycentric(const PointSet &source, const PointSet &target,
              const Logger &log, unsigned int max_points_warning);

  const BarycentricWeights& weights() const;
protected:
  void interpolate_impl(const double *source, double *target) const;
private:
  BarycentricWeights m_weights;
};

//! Nearest neighbor interpolation.
class NearestNeighbor : public HorizontalInterpolation {
public:
  NearestNeighbor(const PointSet &source, const PointSet &target);

  const NearestWeights& weights() const;
protected:
  void interpolate_impl(const double *source, double *target) const;
private:
  NearestWeights m_weights;
};

//! Interpolation using a sparse matrix of precomputed weights.
/*!
 * Computes
 *
 *     target[row[k] - 1] += S[k] * source[col[k]]
 *
 * for all k, starting with zero.
 */
class SparseMatrix : public HorizontalInterpolation {
public:
  SparseMatrix(const SparseWeights &weights, size_t n_source, size_t n_target);
protected:
  void interpolate_impl(const double *source, double *target) const;
private:
  SparseWeights m_weights;
};

} // end of namespace iceregrid

#endif /* ICEREGRID_HORIZONTALINTERPOLATION_H */
