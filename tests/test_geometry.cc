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
#include "iceregrid/geometry/ProximityIndex.hh"
#include "iceregrid/geometry/Triangulation.hh"
#include "iceregrid/util/Logger.hh"
#include "iceregrid/util/error_handling.hh"

using namespace iceregrid;

TEST_CASE("structured point sets are flattened with x as the fast index", "[geometry]") {
  auto points = PointSet::Structured({0.0, 1.0, 2.0, 3.0}, {0.0, 1.0, 2.0});

  REQUIRE(points.structured());
  REQUIRE(points.size() == 12);

  // k = j * Nx + i
  CHECK(points.x(5) == 1.0);
  CHECK(points.y(5) == 1.0);
  CHECK(points.x(11) == 3.0);
  CHECK(points.y(11) == 2.0);

  CHECK(points.x_min() == 0.0);
  CHECK(points.x_max() == 3.0);
  CHECK(points.y_max() == 2.0);
}

TEST_CASE("invalid point sets are rejected", "[geometry]") {
  // not monotonic
  CHECK_THROWS_AS(PointSet::Structured({0.0, 2.0, 1.0}, {0.0, 1.0}), RuntimeError);
  // repeated values
  CHECK_THROWS_AS(PointSet::Structured({0.0, 1.0}, {1.0, 1.0}), RuntimeError);
  // too short
  CHECK_THROWS_AS(PointSet::Structured({0.0}, {0.0, 1.0}), RuntimeError);
  // different lengths
  CHECK_THROWS_AS(PointSet::Unstructured({0.0, 1.0}, {0.0}), RuntimeError);

  // descending axes are fine
  CHECK_NOTHROW(PointSet::Structured({3.0, 2.0, 0.0}, {1.0, 0.0}));
}

TEST_CASE("points inside a triangle get non-negative weights summing to one", "[geometry]") {
  StringLogger log(MPI_COMM_WORLD, 2);

  auto source = PointSet::Unstructured({0.0, 2.0, 0.0}, {0.0, 0.0, 2.0});

  Triangulation triangulation(source, log, 100);

  REQUIRE(triangulation.n_vertices() == 3);

  auto L = triangulation.locate(0.5, 0.5);

  REQUIRE(L.inside);

  double sum = 0.0, x = 0.0, y = 0.0;
  for (int k = 0; k < 3; ++k) {
    CHECK(L.weight[k] >= 0.0);
    sum += L.weight[k];
    x += L.weight[k] * source.x(L.vertex[k]);
    y += L.weight[k] * source.y(L.vertex[k]);
  }
  CHECK(sum == Approx(1.0));
  CHECK(x == Approx(0.5));
  CHECK(y == Approx(0.5));

  CHECK_FALSE(triangulation.locate(10.0, 10.0).inside);
}

TEST_CASE("points on the boundary of the convex hull are inside", "[geometry]") {
  StringLogger log(MPI_COMM_WORLD, 2);

  auto source = PointSet::Unstructured({0.0, 2.0, 0.0}, {0.0, 0.0, 2.0});

  Triangulation triangulation(source, log, 100);

  SECTION("a hull vertex") {
    auto L = triangulation.locate(2.0, 0.0);
    REQUIRE(L.inside);

    double x = 0.0;
    for (int k = 0; k < 3; ++k) {
      x += L.weight[k] * source.x(L.vertex[k]);
    }
    CHECK(x == Approx(2.0));
  }

  SECTION("a hull edge") {
    auto L = triangulation.locate(1.0, 0.0);
    REQUIRE(L.inside);

    double x = 0.0, y = 0.0;
    for (int k = 0; k < 3; ++k) {
      CHECK(L.weight[k] >= -1e-12);
      x += L.weight[k] * source.x(L.vertex[k]);
      y += L.weight[k] * source.y(L.vertex[k]);
    }
    CHECK(x == Approx(1.0));
    CHECK(y == Approx(0.0).margin(1e-12));
  }
}

TEST_CASE("degenerate point sets cannot be triangulated", "[geometry]") {
  StringLogger log(MPI_COMM_WORLD, 2);

  auto collinear = PointSet::Unstructured({0.0, 1.0, 2.0}, {0.0, 0.0, 0.0});
  CHECK_THROWS_AS(Triangulation(collinear, log, 100), DegenerateGeometry);

  auto empty = PointSet::Unstructured({}, {});
  CHECK_THROWS_AS(Triangulation(empty, log, 100), RuntimeError);
}

TEST_CASE("large point sets trigger a warning", "[geometry]") {
  StringLogger log(MPI_COMM_WORLD, 2);

  auto source = PointSet::Structured({0.0, 1.0, 2.0}, {0.0, 1.0, 2.0});

  Triangulation triangulation(source, log, 4);

  CHECK(log.get().find("ICEREGRID WARNING") != std::string::npos);
  CHECK(triangulation.locate(0.5, 0.5).inside);
}

TEST_CASE("nearest neighbor queries", "[geometry]") {
  auto source = PointSet::Unstructured({0.0, 2.0, 0.0}, {0.0, 0.0, 2.0});

  ProximityIndex index(source);

  CHECK(index.nearest(0.1, 0.2) == 0);
  CHECK(index.nearest(1.9, -1.0) == 1);

  // (10, 10) is equidistant from points 1 and 2; the larger index wins
  CHECK(index.nearest(10.0, 10.0) == 2);

  auto result = index.nearest(PointSet::Unstructured({0.0, 2.5}, {-1.0, 0.0}));
  REQUIRE(result.size() == 2);
  CHECK(result[0] == 0);
  CHECK(result[1] == 1);

  CHECK_THROWS_AS(ProximityIndex(PointSet::Unstructured({}, {})), RuntimeError);
}

TEST_CASE("ties between many equidistant points are resolved consistently", "[geometry]") {
  // 8 points on a circle around the origin
  std::vector<double> x{1.0, 0.0, -1.0, 0.0, 2.0, 0.0, -2.0, 0.0},
    y{0.0, 1.0, 0.0, -1.0, 0.0, 2.0, 0.0, -2.0};

  ProximityIndex index(PointSet::Unstructured(x, y));

  CHECK(index.nearest(0.0, 0.0) == 3);
}
