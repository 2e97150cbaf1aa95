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

#include <catch2/catch.hpp>

#include "iceregrid/fields/FieldRegistry.hh"

using namespace iceregrid;

static const FieldDescriptor* find(const std::vector<FieldDescriptor> &fields,
                                   const std::string &name) {
  for (const auto &f : fields) {
    if (f.target == name) {
      return &f;
    }
  }
  return nullptr;
}

TEST_CASE("fields copied from CISM files", "[registry]") {
  auto fields = field_registry(STRUCTURED_LAYOUT, false);

  REQUIRE(not fields.empty());

  CHECK(fields[0].target == "thickness");
  CHECK(fields[0].source == "thk");
  CHECK(fields[0].clamp == CLAMP_NON_NEGATIVE);

  auto temperature = find(fields, "temperature");
  REQUIRE(temperature != nullptr);
  CHECK(temperature->source == "tempstag");
  CHECK(temperature->layered);
  CHECK(temperature->offset == 273.15);
  CHECK(temperature->grid == PRIMARY_GRID);

  auto beta = find(fields, "beta");
  REQUIRE(beta != nullptr);
  CHECK(beta->grid == STAGGERED_GRID);

  auto smb = find(fields, "sfcMassBal");
  REQUIRE(smb != nullptr);
  CHECK(smb->scale == Approx(910.0 / (365.0 * 24.0 * 3600.0) / 1000.0));

  for (const auto &f : fields) {
    if (f.target != "thickness") {
      CHECK(f.clamp == CLAMP_NONE);
    }
  }
}

TEST_CASE("fields copied from MPAS files", "[registry]") {
  auto fields = field_registry(UNSTRUCTURED_LAYOUT, false);

  REQUIRE(fields.size() == 15);

  for (const auto &f : fields) {
    CHECK(f.grid == CELL_GRID);
    CHECK(f.target == f.source);
    CHECK(f.scale == 1.0);
    CHECK(f.offset == 0.0);
  }

  REQUIRE(find(fields, "temperature") != nullptr);
  CHECK(find(fields, "temperature")->layered);
  CHECK(find(fields, "basalFrictionFlux") != nullptr);
}

TEST_CASE("thickness only", "[registry]") {
  for (auto layout : {STRUCTURED_LAYOUT, UNSTRUCTURED_LAYOUT}) {
    auto fields = field_registry(layout, true);

    REQUIRE(fields.size() == 1);
    CHECK(fields[0].target == "thickness");
    CHECK(fields[0].clamp == CLAMP_NON_NEGATIVE);
  }
}
