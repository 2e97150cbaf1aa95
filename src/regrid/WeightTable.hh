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

#ifndef ICEREGRID_WEIGHTTABLE_H
#define ICEREGRID_WEIGHTTABLE_H

#include <array>
#include <vector>

namespace iceregrid {

class File;
class Logger;
class PointSet;

//! Triangulation-based interpolation weights.
/*!
 * For each target point: indexes of the three vertices of the enclosing triangle of the
 * source triangulation and the corresponding barycentric coordinates.
 *
 * Target points outside of the convex hull of the source point set form the
 * *extrapolation set*; each of them is paired with the nearest source point. For these
 * points the vertex indexes are all set to the nearest source point and the weights to
 * (1, 0, 0).
 *
 * If the source point set is degenerate (fewer than 3 non-collinear points) all target
 * points are in the extrapolation set.
 */
class BarycentricWeights {
public:
  BarycentricWeights(const PointSet &source, const PointSet &target,
                     const Logger &log, unsigned int max_points_warning);

  size_t n_source() const;
  size_t n_target() const;

  const std::array<int, 3>& vertices(size_t k) const;
  const std::array<double, 3>& weights(size_t k) const;

  //! Indexes of target points outside of the convex hull of the source point set.
  const std::vector<int>& extrapolation_points() const;
  //! Nearest source points corresponding to extrapolation_points().
  const std::vector<int>& extrapolation_sources() const;

  //! True if the source point set could not be triangulated.
  bool degenerate() const;
private:
  size_t m_n_source;
  bool m_degenerate;
  std::vector<std::array<int, 3> > m_vertices;
  std::vector<std::array<double, 3> > m_weights;
  std::vector<int> m_extrapolation_points;
  std::vector<int> m_extrapolation_sources;
};

//! Index of the nearest source point for each target point.
class NearestWeights {
public:
  NearestWeights(const PointSet &source, const PointSet &target);

  size_t n_source() const;
  size_t n_target() const;

  int source(size_t k) const;
  const std::vector<int>& source() const;
private:
  size_t m_n_source;
  std::vector<int> m_source;
};

//! A sparse interpolation matrix stored as (row, column, weight) triples.
/*!
 * Rows are 1-based target point indexes. Columns index flattened source fields.
 */
class SparseWeights {
public:
  SparseWeights(const std::vector<double> &S,
                const std::vector<int> &row,
                const std::vector<int> &col);

  size_t size() const;

  const std::vector<double>& S() const;
  const std::vector<int>& row() const;
  const std::vector<int>& col() const;
private:
  std::vector<double> m_S;
  std::vector<int> m_row;
  std::vector<int> m_col;
};

//! Read sparse weights from variables `S`, `row`, and `col` of a weight file.
SparseWeights read_sparse_weights(const File &file);

} // end of namespace iceregrid

#endif /* ICEREGRID_WEIGHTTABLE_H */
