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
#include <limits>

#include "iceregrid/regrid/WeightTable.hh"
#include "iceregrid/geometry/PointSet.hh"
#include "iceregrid/geometry/ProximityIndex.hh"
#include "iceregrid/geometry/Triangulation.hh"
#include "iceregrid/util/Logger.hh"
#include "iceregrid/util/error_handling.hh"
#include "iceregrid/util/io/File.hh"

namespace iceregrid {

BarycentricWeights::BarycentricWeights(const PointSet &source, const PointSet &target,
                                       const Logger &log, unsigned int max_points_warning)
  : m_n_source(source.size()),
    m_degenerate(false) {

  size_t N = target.size();

  m_vertices.resize(N);
  m_weights.resize(N);

  ProximityIndex index(source);

  std::vector<Location> locations;
  try {
    Triangulation triangulation(source, log, max_points_warning);

    locations = triangulation.locate(target);
  } catch (DegenerateGeometry &e) {
    log.message(1,
                "ICEREGRID WARNING: cannot triangulate the source point set (%s).\n"
                "  Using nearest neighbor interpolation for all %d destination points.\n",
                e.what(), (int)N);
    m_degenerate = true;

    Location outside;
    outside.inside = false;
    outside.vertex = {{-1, -1, -1}};
    outside.weight = {{0.0, 0.0, 0.0}};
    locations.assign(N, outside);
  }

  for (size_t k = 0; k < N; ++k) {
    const Location &L = locations[k];

    if (L.inside) {
      m_vertices[k] = L.vertex;
      m_weights[k]  = L.weight;
    } else {
      int n = index.nearest(target.x(k), target.y(k));

      m_vertices[k] = {{n, n, n}};
      m_weights[k]  = {{1.0, 0.0, 0.0}};

      m_extrapolation_points.push_back((int)k);
      m_extrapolation_sources.push_back(n);
    }
  }

  log.message(2, "  %d of %d destination points require extrapolation\n",
              (int)m_extrapolation_points.size(), (int)N);
}

size_t BarycentricWeights::n_source() const {
  return m_n_source;
}

size_t BarycentricWeights::n_target() const {
  return m_vertices.size();
}

const std::array<int, 3>& BarycentricWeights::vertices(size_t k) const {
  return m_vertices.at(k);
}

const std::array<double, 3>& BarycentricWeights::weights(size_t k) const {
  return m_weights.at(k);
}

const std::vector<int>& BarycentricWeights::extrapolation_points() const {
  return m_extrapolation_points;
}

const std::vector<int>& BarycentricWeights::extrapolation_sources() const {
  return m_extrapolation_sources;
}

bool BarycentricWeights::degenerate() const {
  return m_degenerate;
}

NearestWeights::NearestWeights(const PointSet &source, const PointSet &target)
  : m_n_source(source.size()) {
  ProximityIndex index(source);

  m_source = index.nearest(target);
}

size_t NearestWeights::n_source() const {
  return m_n_source;
}

size_t NearestWeights::n_target() const {
  return m_source.size();
}

int NearestWeights::source(size_t k) const {
  return m_source.at(k);
}

const std::vector<int>& NearestWeights::source() const {
  return m_source;
}

SparseWeights::SparseWeights(const std::vector<double> &S,
                             const std::vector<int> &row,
                             const std::vector<int> &col)
  : m_S(S), m_row(row), m_col(col) {
  if (S.size() != row.size() or S.size() != col.size()) {
    throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                  "sparse weights: S, row, and col have to have the same length"
                                  " (got %d, %d, %d)",
                                  (int)S.size(), (int)row.size(), (int)col.size());
  }
}

size_t SparseWeights::size() const {
  return m_S.size();
}

const std::vector<double>& SparseWeights::S() const {
  return m_S;
}

const std::vector<int>& SparseWeights::row() const {
  return m_row;
}

const std::vector<int>& SparseWeights::col() const {
  return m_col;
}

static std::vector<int> read_indexes(const File &file, const std::string &name) {
  std::vector<double> tmp = file.read_variable(name);

  std::vector<int> result(tmp.size());
  for (size_t k = 0; k < tmp.size(); ++k) {
    double v = tmp[k];
    if (not std::isfinite(v) or v != std::floor(v) or
        std::fabs(v) > std::numeric_limits<int>::max()) {
      throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                    "%s[%d] = %g is not a valid index",
                                    name.c_str(), (int)k, v);
    }
    result[k] = (int)v;
  }
  return result;
}

SparseWeights read_sparse_weights(const File &file) {
  try {
    for (auto name : {"S", "row", "col"}) {
      if (not file.find_variable(name)) {
        throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                      "variable '%s' is missing", name);
      }
    }

    return SparseWeights(file.read_variable("S"),
                         read_indexes(file, "row"),
                         read_indexes(file, "col"));
  } catch (RuntimeError &e) {
    e.add_context("reading sparse interpolation weights from '%s'",
                  file.filename().c_str());
    throw;
  }
}

} // end of namespace iceregrid
