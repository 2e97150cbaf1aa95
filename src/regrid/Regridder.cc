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

#include "iceregrid/regrid/Regridder.hh"
#include "iceregrid/fields/FieldIO.hh"
#include "iceregrid/regrid/WeightTable.hh"
#include "iceregrid/util/ConfigInterface.hh"
#include "iceregrid/util/Context.hh"
#include "iceregrid/util/Logger.hh"
#include "iceregrid/util/error_handling.hh"
#include "iceregrid/util/iceregrid_utilities.hh"
#include "iceregrid/util/io/File.hh"

namespace iceregrid {

Regridder::Regridder(std::shared_ptr<const Context> ctx, Method method,
                     const FieldSource &source, const PointSet &target)
  : m_ctx(ctx),
    m_method(method),
    m_source(source),
    m_target(target) {
  // empty
}

Method Regridder::method() const {
  return m_method;
}

const PointSet& Regridder::target() const {
  return m_target;
}

bool Regridder::initialized(GridType grid) const {
  return m_grids.find(grid) != m_grids.end();
}

std::shared_ptr<HorizontalInterpolation> Regridder::allocate(const PointSet &points) const {
  auto config = m_ctx->config();
  const Logger &log = *m_ctx->log();

  switch (m_method) {
  case BILINEAR:
    return std::make_shared<Bilinear>(points, m_target);
  case BARYCENTRIC:
    {
      auto max_points = config->get_number("triangulation.max_points_warning");
      return std::make_shared<Barycentric>(points, m_target, log, (unsigned int)max_points);
    }
  case NEAREST:
    return std::make_shared<NearestNeighbor>(points, m_target);
  default:
  case SPARSE:
    {
      std::string filename = config->get_string("regrid.weight_file");
      if (filename.empty()) {
        throw RuntimeError(ICEREGRID_ERROR_LOCATION,
                           "interpolation using sparse weights requires a weight file"
                           " (set regrid.weight_file using -w)");
      }

      log.message(2, "  Reading interpolation weights from '%s'...\n", filename.c_str());

      File file(filename, io::ICEREGRID_READONLY);
      return std::make_shared<SparseMatrix>(read_sparse_weights(file),
                                            points.size(), m_target.size());
    }
  }
}

const HorizontalInterpolation& Regridder::interpolation(GridType grid) {
  auto it = m_grids.find(grid);
  if (it != m_grids.end()) {
    return *it->second.interpolation;
  }

  try {
    check_compatibility(m_method, grid);

    const Logger &log = *m_ctx->log();

    log.message(2, "* Initializing %s interpolation from the '%s' grid...\n",
                method_name(m_method).c_str(), grid_name(grid).c_str());

    double start = get_time();

    GridTopology topology;
    topology.points        = std::make_shared<PointSet>(m_source.points(grid));
    topology.interpolation = allocate(*topology.points);

    log.message(2, "  done in %f seconds\n", get_time() - start);

    m_grids[grid] = topology;

    return *topology.interpolation;
  } catch (RuntimeError &e) {
    e.add_context("initializing %s interpolation from the '%s' grid",
                  method_name(m_method).c_str(), grid_name(grid).c_str());
    throw;
  }
}

} // end of namespace iceregrid
