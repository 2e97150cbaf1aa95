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

#include <algorithm>

#include "iceregrid/fields/NetCDFFieldIO.hh"
#include "iceregrid/regrid/VerticalRelayering.hh"
#include "iceregrid/util/error_handling.hh"
#include "iceregrid/util/iceregrid_utilities.hh"

namespace iceregrid {

static bool has_dimension(const std::vector<std::string> &dimensions,
                          const std::string &name) {
  return std::find(dimensions.begin(), dimensions.end(), name) != dimensions.end();
}

/*!
 * Compute `start` and `count` used to access time level `time_index` of a variable.
 *
 * Returns the number of values.
 */
static size_t hyperslab(const File &file,
                        const std::vector<std::string> &dimensions,
                        const std::string &time_dimension,
                        unsigned int time_index,
                        std::vector<unsigned int> &start,
                        std::vector<unsigned int> &count) {
  start.clear();
  count.clear();

  size_t size = 1;
  for (const auto &d : dimensions) {
    if (d == time_dimension) {
      start.push_back(time_index);
      count.push_back(1);
    } else {
      unsigned int length = file.dimension_length(d);
      start.push_back(0);
      count.push_back(length);
      size *= length;
    }
  }
  return size;
}

/*!
 * Read the sigma coordinate of layer thickness fractions stored in `file`.
 */
static std::vector<double> layer_thickness_fractions(const File &file) {
  if (not file.find_variable("layerThicknessFractions")) {
    throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                  "variable 'layerThicknessFractions' is missing in '%s'",
                                  file.filename().c_str());
  }
  return file.read_variable("layerThicknessFractions");
}

SourceFile::SourceFile(const std::string &filename)
  : m_file(filename, io::ICEREGRID_READONLY) {

  if (m_file.find_variable("x1")) {
    m_layout                = STRUCTURED_LAYOUT;
    m_time_dimension        = "time";
    m_horizontal_dimensions = {"x0", "x1", "y0", "y1"};
  } else if (m_file.find_variable("xCell")) {
    m_layout                = UNSTRUCTURED_LAYOUT;
    m_time_dimension        = "Time";
    m_horizontal_dimensions = {"nCells"};
  } else {
    throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                  "unknown file type: '%s' contains neither 'x1' nor 'xCell'",
                                  filename.c_str());
  }
}

SourceLayout SourceFile::layout() const {
  return m_layout;
}

bool SourceFile::has_field(const std::string &name) const {
  return m_file.find_variable(name);
}

bool SourceFile::time_dependent(const std::string &name) const {
  return has_dimension(m_file.dimensions(name), m_time_dimension);
}

//! Name of the vertical dimension of a field (empty if there is none).
std::string SourceFile::vertical_dimension(const std::string &name) const {
  for (const auto &d : m_file.dimensions(name)) {
    if (d != m_time_dimension and not member(d, m_horizontal_dimensions)) {
      return d;
    }
  }
  return "";
}

unsigned int SourceFile::n_levels(const std::string &name) const {
  std::string z = vertical_dimension(name);

  if (z.empty()) {
    return 1;
  }
  return m_file.dimension_length(z);
}

std::vector<double> SourceFile::read(const std::string &name, unsigned int time_index) const {
  try {
    auto dimensions = m_file.dimensions(name);

    if (has_dimension(dimensions, m_time_dimension)) {
      unsigned int n_records = m_file.dimension_length(m_time_dimension);
      if (time_index >= n_records) {
        throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                      "time index %d is out of range (%d time levels)",
                                      time_index, n_records);
      }
    }

    std::vector<unsigned int> start, count;
    size_t size = hyperslab(m_file, dimensions, m_time_dimension, time_index, start, count);

    std::vector<double> result(size);
    m_file.read_variable(name, start, count, result.data());

    // Store layered fields layer by layer. This requires transposing if the vertical
    // dimension follows horizontal ones.
    std::string z = vertical_dimension(name);
    if (not z.empty()) {
      int z_index = -1, horizontal_index = -1;
      for (size_t k = 0; k < dimensions.size(); ++k) {
        if (dimensions[k] == z) {
          z_index = k;
        }
        if (horizontal_index < 0 and member(dimensions[k], m_horizontal_dimensions)) {
          horizontal_index = k;
        }
      }

      if (horizontal_index >= 0 and z_index > horizontal_index) {
        const size_t
          n_levels = m_file.dimension_length(z),
          n_points = size / n_levels;

        std::vector<double> tmp(size);
        for (size_t p = 0; p < n_points; ++p) {
          for (size_t k = 0; k < n_levels; ++k) {
            tmp[k * n_points + p] = result[p * n_levels + k];
          }
        }
        result.swap(tmp);
      }
    }

    return result;
  } catch (RuntimeError &e) {
    e.add_context("reading '%s' (time index %d) from '%s'",
                  name.c_str(), time_index, m_file.filename().c_str());
    throw;
  }
}

std::vector<double> SourceFile::vertical_levels(const std::string &name) const {
  std::string z = vertical_dimension(name);

  if (z.empty()) {
    throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                  "'%s' in '%s' does not have a vertical dimension",
                                  name.c_str(), m_file.filename().c_str());
  }

  if (m_layout == STRUCTURED_LAYOUT) {
    if (not m_file.find_variable(z)) {
      throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                    "coordinate variable '%s' is missing in '%s'",
                                    z.c_str(), m_file.filename().c_str());
    }
    return m_file.read_variable(z);
  }

  std::vector<double> fractions = layer_thickness_fractions(m_file);

  unsigned int N = m_file.dimension_length(z);
  if (N == fractions.size()) {
    return layer_centers(fractions);
  }

  if (N == fractions.size() + 1) {
    return layer_interfaces(fractions);
  }

  throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                "unsupported vertical dimension '%s' of '%s' in '%s':"
                                " %d levels, %d layers",
                                z.c_str(), name.c_str(), m_file.filename().c_str(),
                                N, (int)fractions.size());
}

/*!
 * Read coordinate variables `x` and `y`.
 */
static void read_coordinates(const File &file, const std::string &x, const std::string &y,
                             std::vector<double> &x_values, std::vector<double> &y_values) {
  for (const auto &name : {x, y}) {
    if (not file.find_variable(name)) {
      throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                    "coordinate variable '%s' is missing in '%s'",
                                    name.c_str(), file.filename().c_str());
    }
  }

  x_values = file.read_variable(x);
  y_values = file.read_variable(y);
}

PointSet SourceFile::points(GridType grid) const {
  std::vector<double> x, y;

  if (m_layout == STRUCTURED_LAYOUT and grid == PRIMARY_GRID) {
    read_coordinates(m_file, "x1", "y1", x, y);
    return PointSet::Structured(x, y);
  }

  if (m_layout == STRUCTURED_LAYOUT and grid == STAGGERED_GRID) {
    read_coordinates(m_file, "x0", "y0", x, y);
    return PointSet::Structured(x, y);
  }

  if (m_layout == UNSTRUCTURED_LAYOUT and grid == CELL_GRID) {
    read_coordinates(m_file, "xCell", "yCell", x, y);
    return PointSet::Unstructured(x, y);
  }

  throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                "a %s file cannot contain fields on the '%s' grid",
                                layout_name(m_layout).c_str(), grid_name(grid).c_str());
}

DestinationFile::DestinationFile(const std::string &filename)
  : m_file(filename, io::ICEREGRID_READWRITE) {
  // empty
}

bool DestinationFile::has_field(const std::string &name) const {
  return m_file.find_variable(name);
}

bool DestinationFile::time_dependent(const std::string &name) const {
  return has_dimension(m_file.dimensions(name), "Time");
}

std::vector<double> DestinationFile::vertical_levels(const std::string &name) const {
  auto dimensions = m_file.dimensions(name);

  if (has_dimension(dimensions, "nVertLevels")) {
    auto result = layer_centers(layer_thickness_fractions(m_file));

    if (result.size() != m_file.dimension_length("nVertLevels")) {
      throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                    "the length of 'layerThicknessFractions' (%d) does not"
                                    " match nVertLevels (%d)",
                                    (int)result.size(), m_file.dimension_length("nVertLevels"));
    }
    return result;
  }

  if (has_dimension(dimensions, "nVertInterfaces")) {
    auto result = layer_interfaces(layer_thickness_fractions(m_file));

    if (result.size() != m_file.dimension_length("nVertInterfaces")) {
      throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                    "the length of 'layerThicknessFractions' plus one (%d)"
                                    " does not match nVertInterfaces (%d)",
                                    (int)result.size(),
                                    m_file.dimension_length("nVertInterfaces"));
    }
    return result;
  }

  throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                "unsupported vertical dimension of '%s' in '%s'"
                                " (dimensions: %s)",
                                name.c_str(), m_file.filename().c_str(),
                                join(dimensions, ", ").c_str());
}

PointSet DestinationFile::points() const {
  std::vector<double> x, y;
  read_coordinates(m_file, "xCell", "yCell", x, y);
  return PointSet::Unstructured(x, y);
}

void DestinationFile::write(const std::string &name, unsigned int time_index,
                            const std::vector<double> &values) {
  try {
    std::vector<unsigned int> start, count;
    size_t size = hyperslab(m_file, m_file.dimensions(name), "Time", time_index,
                            start, count);

    if (size != values.size()) {
      throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                    "got %d values (expected %d)",
                                    (int)values.size(), (int)size);
    }

    m_file.write_variable(name, start, count, values.data());
    m_file.sync();
  } catch (RuntimeError &e) {
    e.add_context("writing '%s' (time index %d) to '%s'",
                  name.c_str(), time_index, m_file.filename().c_str());
    throw;
  }
}

void DestinationFile::append_history(const std::string &text) const {
  m_file.append_history(text);
}

} // end of namespace iceregrid
