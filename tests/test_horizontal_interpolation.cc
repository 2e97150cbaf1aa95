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

#include <cmath>

#include "iceregrid/geometry/PointSet.hh"
#include "iceregrid/regrid/HorizontalInterpolation.hh"
#include "iceregrid/util/Logger.hh"
#include "iceregrid/util/error_handling.hh"

using namespace iceregrid;

//! Evaluate `f` at all points of `points`.
template<class F>
static std::vector<double> sample(const PointSet &points, F f) {
  std::vector<double> result(points.size());
  for (size_t k = 0; k < points.size(); ++k) {
    result[k] = f(points.x(k), points.y(k));
  }
  return result;
}

static double plane(double x, double y) {
  return x + 2.0 * y;
}

TEST_CASE("bilinear interpolation at a cell center", "[horizontal]") {
  auto source = PointSet::Structured({0.0, 1.0, 2.0, 3.0}, {0.0, 1.0, 2.0});
  auto target = PointSet::Unstructured({1.5}, {0.5});

  Bilinear bilinear(source, target);

  auto result = bilinear.interpolate(sample(source, plane));

  REQUIRE(result.size() == 1);
  CHECK(result[0] == Approx(2.5));
}

TEST_CASE("bilinear interpolation reproduces affine functions", "[horizontal]") {
  auto target = PointSet::Unstructured({0.0, 0.25, 1.7, 2.9, 3.0, 1.0},
                                       {0.0, 1.75, 0.3, 1.2, 2.0, 1.0});

  auto check = [&target](const PointSet &source) {
    Bilinear bilinear(source, target);

    auto result = bilinear.interpolate(sample(source, plane));

    for (size_t k = 0; k < target.size(); ++k) {
      CHECK(result[k] == Approx(plane(target.x(k), target.y(k))));
    }
  };

  SECTION("uniform grid") {
    check(PointSet::Structured({0.0, 1.0, 2.0, 3.0}, {0.0, 1.0, 2.0}));
  }

  SECTION("non-uniform grid") {
    check(PointSet::Structured({0.0, 0.1, 2.5, 3.0}, {0.0, 1.5, 2.0}));
  }

  SECTION("descending axes") {
    check(PointSet::Structured({3.0, 2.0, 1.0, 0.0}, {2.0, 1.0, 0.0}));
  }
}

TEST_CASE("bilinear interpolation uses edge cells outside of the domain", "[horizontal]") {
  auto source = PointSet::Structured({0.0, 1.0, 2.0, 3.0}, {0.0, 1.0, 2.0});
  auto target = PointSet::Unstructured({-1.0, 5.0, 1.5}, {0.5, 3.0, -2.0});

  Bilinear bilinear(source, target);

  auto result = bilinear.interpolate(sample(source, plane));

  for (size_t k = 0; k < target.size(); ++k) {
    CHECK(result[k] == Approx(plane(target.x(k), target.y(k))));
  }

  CHECK_THROWS_AS(Bilinear(PointSet::Unstructured({0.0}, {0.0}), target), RuntimeError);
}

TEST_CASE("bilinear interpolation far outside of the domain", "[horizontal]") {
  auto source = PointSet::Structured({0.0, 1.0, 2.0, 3.0}, {0.0, 1.0, 2.0});

  SECTION("cell indexes are clipped before conversion") {
    auto target = PointSet::Unstructured({1.0e12, -1.0e12}, {0.5, 1.0e11});

    Bilinear bilinear(source, target);

    auto result = bilinear.interpolate(sample(source, plane));

    CHECK(result[0] == Approx(plane(1.0e12, 0.5)));
    CHECK(result[1] == Approx(plane(-1.0e12, 1.0e11)));
  }

  SECTION("non-finite destination coordinates are rejected") {
    auto nan = PointSet::Unstructured({1.0, std::nan("")}, {1.0, 1.0});
    auto inf = PointSet::Unstructured({1.0}, {HUGE_VAL});

    CHECK_THROWS_AS(Bilinear(source, nan), RuntimeError);
    CHECK_THROWS_AS(Bilinear(source, inf), RuntimeError);
  }
}

TEST_CASE("barycentric interpolation and the extrapolation fallback", "[horizontal]") {
  StringLogger log(MPI_COMM_WORLD, 2);

  auto source = PointSet::Unstructured({0.0, 2.0, 0.0}, {0.0, 0.0, 2.0});
  auto target = PointSet::Unstructured({0.5, 10.0, 0.2}, {0.5, 10.0, 1.1});

  Barycentric barycentric(source, target, log, 100);

  std::vector<double> values{1.0, 3.0, 5.0};
  auto result = barycentric.interpolate(values);

  // inside: the plane 1 + x + 2y
  CHECK(result[0] == Approx(2.5));
  CHECK(result[2] == Approx(1.0 + 0.2 + 2.2));
  CHECK(result[2] >= 1.0);
  CHECK(result[2] <= 5.0);

  // outside: the value at the nearest source point
  CHECK(result[1] == 5.0);

  const auto &W = barycentric.weights();
  REQUIRE(W.extrapolation_points().size() == 1);
  CHECK(W.extrapolation_points()[0] == 1);
  CHECK(W.extrapolation_sources()[0] == 2);
}

TEST_CASE("barycentric interpolation falls back to nearest neighbors", "[horizontal]") {
  StringLogger log(MPI_COMM_WORLD, 2);

  auto source = PointSet::Unstructured({0.0, 1.0, 2.0}, {0.0, 0.0, 0.0});
  auto target = PointSet::Unstructured({0.9, 5.0}, {0.0, 1.0});

  Barycentric barycentric(source, target, log, 100);

  CHECK(barycentric.weights().degenerate());
  CHECK(log.get().find("ICEREGRID WARNING") != std::string::npos);

  auto result = barycentric.interpolate({10.0, 20.0, 30.0});
  CHECK(result[0] == 20.0);
  CHECK(result[1] == 30.0);
}

TEST_CASE("nearest neighbor interpolation", "[horizontal]") {
  auto source = PointSet::Structured({0.0, 1.0}, {0.0, 1.0});
  auto target = PointSet::Unstructured({0.1, 0.9, 5.0}, {0.2, 0.1, 5.0});

  NearestNeighbor nearest(source, target);

  auto result = nearest.interpolate({1.0, 2.0, 3.0, 4.0});

  CHECK(result[0] == 1.0);
  CHECK(result[1] == 2.0);
  CHECK(result[2] == 4.0);
}

TEST_CASE("sparse matrix interpolation is linear", "[horizontal]") {
  // target[0] = 0.5 * (s[0] + s[1]), target[1] = s[2]
  SparseWeights weights({0.5, 0.5, 1.0}, {1, 1, 2}, {0, 1, 2});

  SparseMatrix matrix(weights, 3, 2);

  std::vector<double> u{1.0, 3.0, -2.0}, v{4.0, 0.0, 7.0}, w(3);
  const double a = 2.0, b = -0.5;
  for (int k = 0; k < 3; ++k) {
    w[k] = a * u[k] + b * v[k];
  }

  auto Au = matrix.interpolate(u);
  auto Av = matrix.interpolate(v);
  auto Aw = matrix.interpolate(w);

  CHECK(Au[0] == Approx(2.0));
  CHECK(Au[1] == Approx(-2.0));

  for (int k = 0; k < 2; ++k) {
    CHECK(Aw[k] == Approx(a * Au[k] + b * Av[k]));
  }
}

TEST_CASE("sparse matrix rows without weights are zero", "[horizontal]") {
  SparseWeights weights({1.0, 2.0}, {2, 2}, {0, 0});

  SparseMatrix matrix(weights, 1, 3);

  auto result = matrix.interpolate({3.0});

  CHECK(result[0] == 0.0);
  CHECK(result[1] == 9.0);
  CHECK(result[2] == 0.0);
}

TEST_CASE("sparse matrix indexes are checked", "[horizontal]") {
  CHECK_THROWS_AS(SparseMatrix(SparseWeights({1.0}, {0}, {0}), 1, 1), RuntimeError);
  CHECK_THROWS_AS(SparseMatrix(SparseWeights({1.0}, {2}, {0}), 1, 1), RuntimeError);
  CHECK_THROWS_AS(SparseMatrix(SparseWeights({1.0}, {1}, {1}), 1, 1), RuntimeError);
  CHECK_THROWS_AS(SparseMatrix(SparseWeights({1.0}, {1}, {-1}), 1, 1), RuntimeError);

  CHECK_THROWS_AS(SparseWeights({1.0, 2.0}, {1}, {0}), RuntimeError);
}

TEST_CASE("inputs of a wrong size are rejected", "[horizontal]") {
  auto source = PointSet::Structured({0.0, 1.0}, {0.0, 1.0});
  auto target = PointSet::Unstructured({0.5}, {0.5});

  NearestNeighbor nearest(source, target);

  CHECK_THROWS_AS(nearest.interpolate({1.0, 2.0}), RuntimeError);
}

TEST_CASE("interpolation methods and grid types", "[horizontal]") {
  CHECK(method_from_string("b") == BILINEAR);
  CHECK(method_from_string("bilinear") == BILINEAR);
  CHECK(method_from_string("d") == BARYCENTRIC);
  CHECK(method_from_string("e") == SPARSE);
  CHECK(method_from_string("esmf") == SPARSE);
  CHECK(method_from_string("n") == NEAREST);
  CHECK_THROWS_AS(method_from_string("x"), RuntimeError);

  CHECK(grid_from_string("x0") == STAGGERED_GRID);
  CHECK(grid_name(CELL_GRID) == "cell");
  CHECK_THROWS_AS(grid_from_string("x2"), RuntimeError);

  CHECK_NOTHROW(check_compatibility(BILINEAR, PRIMARY_GRID));
  CHECK_NOTHROW(check_compatibility(BILINEAR, STAGGERED_GRID));
  CHECK_THROWS_AS(check_compatibility(BILINEAR, CELL_GRID), RuntimeError);

  for (auto grid : {PRIMARY_GRID, STAGGERED_GRID, CELL_GRID}) {
    CHECK_NOTHROW(check_compatibility(BARYCENTRIC, grid));
    CHECK_NOTHROW(check_compatibility(NEAREST, grid));
  }

  CHECK_NOTHROW(check_compatibility(SPARSE, PRIMARY_GRID));
  CHECK_THROWS_AS(check_compatibility(SPARSE, STAGGERED_GRID), RuntimeError);
  CHECK_THROWS_AS(check_compatibility(SPARSE, CELL_GRID), RuntimeError);
}
