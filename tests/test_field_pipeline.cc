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

#include <map>
#include <memory>

#include <catch2/catch.hpp>

#include "iceregrid/fields/FieldIO.hh"
#include "iceregrid/fields/FieldPipeline.hh"
#include "iceregrid/regrid/Regridder.hh"
#include "iceregrid/util/Config.hh"
#include "iceregrid/util/Context.hh"
#include "iceregrid/util/Logger.hh"
#include "iceregrid/util/error_handling.hh"

using namespace iceregrid;

//! A source that keeps all fields in memory.
class MemorySource : public FieldSource {
public:
  struct Field {
    //! one record per time level (one record if the field does not depend on time)
    std::vector<std::vector<double> > records;
    bool time_dependent;
    //! vertical levels of a layered field; empty otherwise
    std::vector<double> levels;
  };

  MemorySource(SourceLayout layout)
    : m_layout(layout) {
    // empty
  }

  void add_grid(GridType grid, const PointSet &points) {
    m_grids.insert({grid, points});
  }

  void add_field(const std::string &name, const Field &field) {
    m_fields[name] = field;
  }

  SourceLayout layout() const {
    return m_layout;
  }

  bool has_field(const std::string &name) const {
    return m_fields.find(name) != m_fields.end();
  }

  bool time_dependent(const std::string &name) const {
    return m_fields.at(name).time_dependent;
  }

  unsigned int n_levels(const std::string &name) const {
    const auto &levels = m_fields.at(name).levels;
    return levels.empty() ? 1 : levels.size();
  }

  std::vector<double> read(const std::string &name, unsigned int time_index) const {
    const auto &field = m_fields.at(name);
    return field.records.at(field.time_dependent ? time_index : 0);
  }

  std::vector<double> vertical_levels(const std::string &name) const {
    return m_fields.at(name).levels;
  }

  PointSet points(GridType grid) const {
    auto it = m_grids.find(grid);
    if (it == m_grids.end()) {
      throw RuntimeError(ICEREGRID_ERROR_LOCATION, "grid not found");
    }
    return it->second;
  }

private:
  SourceLayout m_layout;
  std::map<GridType, PointSet> m_grids;
  std::map<std::string, Field> m_fields;
};

//! A destination that records all writes.
class MemoryDestination : public FieldDestination {
public:
  MemoryDestination(const PointSet &points)
    : m_points(points) {
    // empty
  }

  void add_field(const std::string &name, bool time_dependent,
                 const std::vector<double> &levels = {}) {
    m_time_dependent[name] = time_dependent;
    m_levels[name]         = levels;
  }

  bool has_field(const std::string &name) const {
    return m_time_dependent.find(name) != m_time_dependent.end();
  }

  bool time_dependent(const std::string &name) const {
    return m_time_dependent.at(name);
  }

  std::vector<double> vertical_levels(const std::string &name) const {
    return m_levels.at(name);
  }

  PointSet points() const {
    return m_points;
  }

  void write(const std::string &name, unsigned int time_index,
             const std::vector<double> &values) {
    unsigned int t = m_time_dependent.at(name) ? time_index : 0;
    written[name][t] = values;
    n_writes += 1;
  }

  //! values written, by field name and time index
  std::map<std::string, std::map<unsigned int, std::vector<double> > > written;
  int n_writes = 0;
private:
  PointSet m_points;
  std::map<std::string, bool> m_time_dependent;
  std::map<std::string, std::vector<double> > m_levels;
};

static std::shared_ptr<Context> test_context(std::shared_ptr<Logger> log) {
  auto config = std::make_shared<DefaultConfig>();
  return std::make_shared<Context>(MPI_COMM_WORLD, config, log);
}

static FieldDescriptor descriptor(const std::string &target, const std::string &source,
                                  GridType grid) {
  FieldDescriptor result;
  result.target  = target;
  result.source  = source;
  result.scale   = 1.0;
  result.offset  = 0.0;
  result.grid    = grid;
  result.layered = false;
  result.clamp   = CLAMP_NONE;
  return result;
}

TEST_CASE("negative thickness is replaced by zero", "[pipeline]") {
  auto log = std::make_shared<StringLogger>(MPI_COMM_WORLD, 2);
  auto ctx = test_context(log);

  auto cells = PointSet::Unstructured({0.0, 1.0, 2.0}, {0.0, 0.0, 0.0});

  MemorySource source(UNSTRUCTURED_LAYOUT);
  source.add_grid(CELL_GRID, cells);
  source.add_field("thickness", {{{-0.5, 0.0, 3.2}}, false, {}});

  MemoryDestination destination(cells);
  destination.add_field("thickness", true);

  Regridder regridder(ctx, NEAREST, source, cells);
  FieldPipeline pipeline(ctx, source, destination, regridder);

  auto fields = field_registry(UNSTRUCTURED_LAYOUT, true);
  pipeline.run(fields, 0, 0);

  const auto &result = destination.written["thickness"][0];
  REQUIRE(result.size() == 3);
  CHECK(result[0] == 0.0);
  CHECK(result[1] == 0.0);
  CHECK(result[2] == 3.2);

  CHECK(log->get().find("removed negative thickness at 1 points") != std::string::npos);
}

TEST_CASE("clamping reports the number of points and the minimum", "[pipeline]") {
  std::vector<double> values{-0.5, 2.0, -3.0, 0.0};
  double min_value = 0.0;

  CHECK(clamp_non_negative(values, min_value) == 2);
  CHECK(min_value == -3.0);
  CHECK(values == std::vector<double>{0.0, 2.0, 0.0, 0.0});
}

TEST_CASE("fields missing in the source or the destination are skipped", "[pipeline]") {
  auto log = std::make_shared<StringLogger>(MPI_COMM_WORLD, 2);
  auto ctx = test_context(log);

  auto cells = PointSet::Unstructured({0.0, 1.0}, {0.0, 0.0});

  MemorySource source(UNSTRUCTURED_LAYOUT);
  source.add_grid(CELL_GRID, cells);
  source.add_field("bedTopography", {{{1.0, 2.0}}, false, {}});

  MemoryDestination destination(cells);
  destination.add_field("thickness", false);

  Regridder regridder(ctx, BARYCENTRIC, source, cells);
  FieldPipeline pipeline(ctx, source, destination, regridder);

  CHECK_FALSE(pipeline.process(descriptor("thickness", "thickness", CELL_GRID), 0, 0));
  CHECK_FALSE(pipeline.process(descriptor("bedTopography", "bedTopography", CELL_GRID), 0, 0));

  CHECK(destination.n_writes == 0);
  CHECK(log->get().find("is not in the source file") != std::string::npos);
  CHECK(log->get().find("is not in the destination file") != std::string::npos);

  // no interpolation was set up
  CHECK_FALSE(regridder.initialized(CELL_GRID));
}

TEST_CASE("scale and offset", "[pipeline]") {
  auto ctx = test_context(std::make_shared<StringLogger>(MPI_COMM_WORLD, 2));

  auto grid = PointSet::Structured({0.0, 1.0}, {0.0, 1.0});
  auto target = PointSet::Unstructured({0.5, 0.0}, {0.5, 1.0});

  MemorySource source(STRUCTURED_LAYOUT);
  source.add_grid(PRIMARY_GRID, grid);
  source.add_field("artm", {{{-10.0, -10.0, -20.0, -20.0}}, false, {}});

  MemoryDestination destination(target);
  destination.add_field("surfaceAirTemperature", false);

  Regridder regridder(ctx, BILINEAR, source, target);
  FieldPipeline pipeline(ctx, source, destination, regridder);

  auto field = descriptor("surfaceAirTemperature", "artm", PRIMARY_GRID);
  field.scale  = 2.0;
  field.offset = 273.15;

  auto result = pipeline.compute(field, 0);

  CHECK(result[0] == Approx(2.0 * -15.0 + 273.15));
  CHECK(result[1] == Approx(2.0 * -20.0 + 273.15));
}

TEST_CASE("time levels are copied by index", "[pipeline]") {
  auto ctx = test_context(std::make_shared<StringLogger>(MPI_COMM_WORLD, 2));

  auto cells = PointSet::Unstructured({0.0, 1.0, 0.0}, {0.0, 0.0, 1.0});

  MemorySource source(UNSTRUCTURED_LAYOUT);
  source.add_grid(CELL_GRID, cells);
  source.add_field("sfcMassBal", {{{1.0, 1.0, 1.0}, {2.0, 2.0, 2.0}, {3.0, 3.0, 3.0}}, true, {}});
  source.add_field("bedTopography", {{{5.0, 6.0, 7.0}}, false, {}});

  MemoryDestination destination(cells);
  destination.add_field("sfcMassBal", true);
  destination.add_field("bedTopography", false);

  Regridder regridder(ctx, BARYCENTRIC, source, cells);
  FieldPipeline pipeline(ctx, source, destination, regridder);

  pipeline.run({descriptor("sfcMassBal", "sfcMassBal", CELL_GRID),
                descriptor("bedTopography", "bedTopography", CELL_GRID)}, 1, 2);

  auto &smb = destination.written["sfcMassBal"];
  REQUIRE(smb.size() == 2);
  CHECK(smb[1][0] == Approx(2.0));
  CHECK(smb[2][2] == Approx(3.0));

  // static fields are written once per time level
  auto &topg = destination.written["bedTopography"];
  REQUIRE(topg.size() == 1);
  CHECK(topg[0][1] == Approx(6.0));
  CHECK(destination.n_writes == 4);

  CHECK_THROWS_AS(pipeline.run({}, 2, 1), RuntimeError);
}

TEST_CASE("layered fields are interpolated horizontally, then vertically", "[pipeline]") {
  auto ctx = test_context(std::make_shared<StringLogger>(MPI_COMM_WORLD, 2));

  auto grid = PointSet::Structured({0.0, 1.0}, {0.0, 1.0});
  auto target = PointSet::Unstructured({0.5, 1.0}, {0.5, 0.0});

  // two layers at sigma = 0 and 1, stored layer by layer
  MemorySource source(STRUCTURED_LAYOUT);
  source.add_grid(PRIMARY_GRID, grid);
  source.add_field("tempstag",
                   {{{-10.0, -10.0, -10.0, -10.0, -20.0, -20.0, -30.0, -30.0}}, true, {0.0, 1.0}});

  MemoryDestination destination(target);
  destination.add_field("temperature", true, {0.0, 0.5, 1.0});

  Regridder regridder(ctx, BILINEAR, source, target);
  FieldPipeline pipeline(ctx, source, destination, regridder);

  auto field = descriptor("temperature", "tempstag", PRIMARY_GRID);
  field.layered = true;
  field.offset  = 273.15;

  auto result = pipeline.compute(field, 0);

  // values are stored column by column
  REQUIRE(result.size() == 6);
  CHECK(result[0] == Approx(-10.0 + 273.15));
  CHECK(result[1] == Approx(-17.5 + 273.15));
  CHECK(result[2] == Approx(-25.0 + 273.15));
  CHECK(result[3] == Approx(-10.0 + 273.15));
  CHECK(result[4] == Approx(-15.0 + 273.15));
  CHECK(result[5] == Approx(-20.0 + 273.15));
}

TEST_CASE("interpolation objects are created once per grid", "[pipeline]") {
  auto ctx = test_context(std::make_shared<StringLogger>(MPI_COMM_WORLD, 2));

  auto grid = PointSet::Structured({0.0, 1.0, 2.0}, {0.0, 1.0});
  auto target = PointSet::Unstructured({0.5}, {0.5});

  MemorySource source(STRUCTURED_LAYOUT);
  source.add_grid(PRIMARY_GRID, grid);

  Regridder regridder(ctx, NEAREST, source, target);

  CHECK_FALSE(regridder.initialized(PRIMARY_GRID));

  const auto &A = regridder.interpolation(PRIMARY_GRID);
  const auto &B = regridder.interpolation(PRIMARY_GRID);

  CHECK(&A == &B);
  CHECK(regridder.initialized(PRIMARY_GRID));
  CHECK(A.n_source() == 6);

  // the staggered grid is not present
  CHECK_THROWS_AS(regridder.interpolation(STAGGERED_GRID), RuntimeError);
}

TEST_CASE("incompatible methods are rejected", "[pipeline]") {
  auto ctx = test_context(std::make_shared<StringLogger>(MPI_COMM_WORLD, 2));

  auto grid = PointSet::Structured({0.0, 1.0}, {0.0, 1.0});
  auto target = PointSet::Unstructured({0.5}, {0.5});

  MemorySource source(STRUCTURED_LAYOUT);
  source.add_grid(PRIMARY_GRID, grid);
  source.add_grid(STAGGERED_GRID, grid);
  source.add_field("thk", {{{1.0, 1.0, 1.0, 1.0}}, false, {}});
  source.add_field("beta", {{{1.0, 1.0, 1.0, 1.0}}, false, {}});

  MemoryDestination destination(target);
  destination.add_field("thickness", false);

  Regridder regridder(ctx, SPARSE, source, target);
  FieldPipeline pipeline(ctx, source, destination, regridder);

  auto beta = descriptor("beta", "beta", STAGGERED_GRID);

  // 'beta' is not in the destination file, so it will be skipped
  CHECK_NOTHROW(pipeline.check({beta}));

  destination.add_field("beta", false);
  CHECK_THROWS_AS(pipeline.check({beta}), RuntimeError);
  CHECK_THROWS_AS(regridder.interpolation(STAGGERED_GRID), RuntimeError);

  // sparse weights require a weight file
  CHECK_THROWS_AS(regridder.interpolation(PRIMARY_GRID), RuntimeError);

  Regridder bilinear(ctx, BILINEAR, source, target);
  CHECK_THROWS_AS(bilinear.interpolation(CELL_GRID), RuntimeError);
}
