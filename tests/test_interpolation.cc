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

#include "iceregrid/util/interpolation.hh"
#include "iceregrid/util/error_handling.hh"

using namespace iceregrid;

TEST_CASE("linear interpolation in 1D", "[interpolation]") {
  std::vector<double> x{0.0, 1.0, 3.0};
  std::vector<double> values{0.0, 2.0, 6.0};

  Interpolation I(x, {-1.0, 0.0, 0.5, 2.0, 3.0, 4.0});

  auto result = I.interpolate(values);

  CHECK(result[0] == 0.0);
  CHECK(result[1] == 0.0);
  CHECK(result[2] == Approx(1.0));
  CHECK(result[3] == Approx(4.0));
  CHECK(result[4] == 6.0);
  CHECK(result[5] == 6.0);

  // constant extrapolation
  CHECK(I.left(0) == I.right(0));
  CHECK(I.alpha(0) == 0.0);
  CHECK(I.left(5) == 2);
  CHECK(I.right(5) == 2);
}

TEST_CASE("invalid input grids", "[interpolation]") {
  CHECK_THROWS_AS(Interpolation(std::vector<double>{1.0, 0.0}, std::vector<double>{0.5}),
                  RuntimeError);
  CHECK_THROWS_AS(Interpolation(std::vector<double>{}, std::vector<double>{0.5}),
                  RuntimeError);
}
