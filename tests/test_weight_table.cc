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

#include "iceregrid/geometry/PointSet.hh"
#include "iceregrid/regrid/WeightTable.hh"
#include "iceregrid/util/Logger.hh"

using namespace iceregrid;

TEST_CASE("barycentric weights", "[weights]") {
  StringLogger log(MPI_COMM_WORLD, 2);

  auto source = PointSet::Structured({0.0, 1.0, 2.0, 3.0}, {0.0, 1.0, 2.0});
  auto target = PointSet::Unstructured({0.3, 1.5, 2.9, -1.0, 1.0, 4.0},
                                       {0.4, 1.9, 0.1, 1.0, 1.0, 3.0});

  BarycentricWeights W(source, target, log, 100);

  REQUIRE(W.n_source() == 12);
  REQUIRE(W.n_target() == 6);
  CHECK_FALSE(W.degenerate());

  SECTION("points inside the convex hull") {
    for (size_t k : {0, 1, 2, 4}) {
      const auto &w = W.weights(k);
      const auto &v = W.vertices(k);

      double x = 0.0, y = 0.0;
      for (int n = 0; n < 3; ++n) {
        CHECK(w[n] >= -1e-12);
        CHECK(v[n] >= 0);
        CHECK(v[n] < 12);
        x += w[n] * source.x(v[n]);
        y += w[n] * source.y(v[n]);
      }
      CHECK(w[0] + w[1] + w[2] == Approx(1.0));
      CHECK(x == Approx(target.x(k)));
      CHECK(y == Approx(target.y(k)));
    }
  }

  SECTION("the extrapolation set") {
    const auto &points  = W.extrapolation_points();
    const auto &sources = W.extrapolation_sources();

    REQUIRE(points.size() == 2);
    CHECK(points[0] == 3);
    CHECK(points[1] == 5);

    // (-1, 1) is closest to (0, 1), (4, 3) to (3, 2)
    CHECK(sources[0] == 4);
    CHECK(sources[1] == 11);

    CHECK(W.vertices(3)[0] == 4);
    CHECK(W.weights(3)[0] == 1.0);
    CHECK(W.weights(3)[1] == 0.0);
  }

  CHECK(log.get().find("2 of 6 destination points require extrapolation") != std::string::npos);
}

TEST_CASE("nearest neighbor weights", "[weights]") {
  auto source = PointSet::Unstructured({0.0, 10.0, 20.0}, {0.0, 0.0, 0.0});
  auto target = PointSet::Unstructured({4.0, 6.0, 100.0, -5.0}, {1.0, 1.0, 0.0, 0.0});

  NearestWeights W(source, target);

  REQUIRE(W.n_target() == 4);
  CHECK(W.source(0) == 0);
  CHECK(W.source(1) == 1);
  CHECK(W.source(2) == 2);
  CHECK(W.source(3) == 0);
}
