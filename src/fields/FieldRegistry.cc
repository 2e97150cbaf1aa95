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

#include "iceregrid/fields/FieldRegistry.hh"

namespace iceregrid {

std::string layout_name(SourceLayout layout) {
  if (layout == STRUCTURED_LAYOUT) {
    return "CISM";
  }
  return "MPAS";
}

static const double seconds_per_year = 365.0 * 24.0 * 3600.0;

//! Ice density used by CISM, kg/m^3.
static const double cism_ice_density = 910.0;

static FieldDescriptor field(const std::string &target, const std::string &source,
                             double scale, double offset, GridType grid,
                             bool layered = false, Clamp clamp = CLAMP_NONE) {
  FieldDescriptor result;
  result.target  = target;
  result.source  = source;
  result.scale   = scale;
  result.offset  = offset;
  result.grid    = grid;
  result.layered = layered;
  result.clamp   = clamp;
  return result;
}

static std::vector<FieldDescriptor> cism_fields(bool thickness_only) {
  const GridType x1 = PRIMARY_GRID, x0 = STAGGERED_GRID;

  std::vector<FieldDescriptor> result{
    field("thickness", "thk", 1.0, 0.0, x1, false, CLAMP_NON_NEGATIVE)
  };

  if (thickness_only) {
    return result;
  }

  // CISM surface mass balance is in mm/year water equivalent; MPAS-LI uses kg/(m^2 s)
  const double smb_scale = cism_ice_density / seconds_per_year / 1000.0;

  std::vector<FieldDescriptor> other{
    field("bedTopography", "topg", 1.0, 0.0, x1),
    field("sfcMassBal", "smb", smb_scale, 0.0, x1),
    field("sfcMassBalUncertainty", "smb_std", smb_scale, 0.0, x1),
    field("floatingBasalMassBal", "subm", cism_ice_density / seconds_per_year, 0.0, x1),
    field("temperature", "tempstag", 1.0, 273.15, x1, true),
    field("basalHeatFlux", "bheatflx", 1.0, 0.0, x1),
    field("surfaceAirTemperature", "artm", 1.0, 273.15, x1),
    field("beta", "beta", 1.0, 0.0, x0),
    field("observedSurfaceVelocityX", "vx", 1.0 / seconds_per_year, 0.0, x1),
    field("observedSurfaceVelocityY", "vy", 1.0 / seconds_per_year, 0.0, x1),
    field("observedSurfaceVelocityUncertainty", "vErr", 1.0 / seconds_per_year, 0.0, x1),
    field("observedThicknessTendency", "dHdt", 1.0 / seconds_per_year, 0.0, x1),
    field("observedThicknessTendencyUncertainty", "dHdtErr", 1.0 / seconds_per_year, 0.0, x1),
    field("thicknessUncertainty", "topgerr", 1.0, 0.0, x1),
    field("ismip6shelfMelt_basin", "ismip6shelfMelt_basin", 1.0, 0.0, x1),
    field("ismip6shelfMelt_deltaT", "ismip6shelfMelt_deltaT", 1.0, 0.0, x1),
  };

  result.insert(result.end(), other.begin(), other.end());

  return result;
}

static std::vector<FieldDescriptor> mpas_fields(bool thickness_only) {
  std::vector<FieldDescriptor> result{
    field("thickness", "thickness", 1.0, 0.0, CELL_GRID, false, CLAMP_NON_NEGATIVE)
  };

  if (thickness_only) {
    return result;
  }

  // field names are the same in source and destination files
  for (auto name : {"bedTopography", "sfcMassBal", "floatingBasalMassBal"}) {
    result.push_back(field(name, name, 1.0, 0.0, CELL_GRID));
  }

  result.push_back(field("temperature", "temperature", 1.0, 0.0, CELL_GRID, true));

  for (auto name : {"basalHeatFlux",
                    "surfaceAirTemperature",
                    "beta",
                    "observedSurfaceVelocityX",
                    "observedSurfaceVelocityY",
                    "observedSurfaceVelocityUncertainty",
                    "observedThicknessTendency",
                    "observedThicknessTendencyUncertainty",
                    "thicknessUncertainty",
                    "basalFrictionFlux"}) {
    result.push_back(field(name, name, 1.0, 0.0, CELL_GRID));
  }

  return result;
}

std::vector<FieldDescriptor> field_registry(SourceLayout layout, bool thickness_only) {
  if (layout == STRUCTURED_LAYOUT) {
    return cism_fields(thickness_only);
  }
  return mpas_fields(thickness_only);
}

} // end of namespace iceregrid
