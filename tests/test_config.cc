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

#include "iceregrid/util/Config.hh"
#include "iceregrid/util/error_handling.hh"

using namespace iceregrid;

TEST_CASE("default configuration", "[config]") {
  DefaultConfig config;

  CHECK(config.get_string("input.file") == "cism.nc");
  CHECK(config.get_string("output.file") == "landice_grid.nc");
  CHECK(config.get_string("regrid.method") == "b");
  CHECK(config.get_string("regrid.weight_file").empty());
  CHECK_FALSE(config.get_flag("regrid.thickness_only"));
  CHECK(config.get_number("time.start") == 0.0);
  CHECK(config.get_number("time.end") == 0.0);
  CHECK(config.get_number("vertical.boundary_tolerance") == 1e-6);
  CHECK(config.get_number("triangulation.max_points_warning") == 16777215.0);

  CHECK(config.type("regrid.method") == "keyword");
  CHECK(config.option("regrid.method") == "m");
  CHECK(config.option("input.file") == "s");
  CHECK(config.type("time.start") == "integer");
}

TEST_CASE("parameters set by the user take precedence over defaults", "[config]") {
  DefaultConfig config;

  config.set_string("regrid.method", "d", CONFIG_USER);
  config.set_string("regrid.method", "n", CONFIG_DEFAULT);

  CHECK(config.get_string("regrid.method") == "d");

  config.set_string("regrid.method", "n", CONFIG_FORCE);
  CHECK(config.get_string("regrid.method") == "n");

  CHECK(config.parameters_set_by_user().count("regrid.method") == 1);
}

TEST_CASE("numbers are validated when used", "[config]") {
  DefaultConfig config;

  config.set_number("time.end", 1.5);
  CHECK_THROWS_AS(config.get_number("time.end"), RuntimeError);

  config.set_number("time.start", -1.0);
  CHECK_THROWS_AS(config.get_number("time.start"), RuntimeError);

  config.set_number("vertical.boundary_tolerance", -1.0);
  CHECK_THROWS_AS(config.get_number("vertical.boundary_tolerance"), RuntimeError);
}

TEST_CASE("importing overrides", "[config]") {
  DefaultConfig config;

  NetCDFConfig overrides("iceregrid_overrides");
  overrides.set_string("regrid.method", "e");
  overrides.set_string("regrid.thickness_only", "yes");
  overrides.set_number("time.end", 3.0);

  config.import_from(overrides);

  CHECK(config.get_string("regrid.method") == "e");
  CHECK(config.get_flag("regrid.thickness_only"));
  CHECK(config.get_number("time.end") == 3.0);

  NetCDFConfig unknown("iceregrid_overrides");
  unknown.set_number("no.such.parameter", 1.0);
  CHECK_THROWS_AS(config.import_from(unknown), RuntimeError);
}
