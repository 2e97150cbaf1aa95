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

#include "iceregrid/util/Config.hh"
#include "iceregrid/util/error_handling.hh"
#include "iceregrid/util/io/File.hh"
#include "iceregrid/util/io/IO_Flags.hh"

namespace iceregrid {

NetCDFConfig::NetCDFConfig(const std::string &variable_name)
  : m_variable_name(variable_name) {
  // empty
}

NetCDFConfig::~NetCDFConfig() {
  // empty
}

//! Read parameters stored as attributes of the variable `m_variable_name`.
/*!
 * Text attributes become strings (including values of flags), numeric attributes become
 * numbers.
 */
void NetCDFConfig::read_impl(const File &file) {
  try {
    if (not file.find_variable(m_variable_name)) {
      throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                    "variable '%s' is missing", m_variable_name.c_str());
    }

    unsigned int n_attributes = file.nattributes(m_variable_name);

    for (unsigned int k = 0; k < n_attributes; ++k) {
      std::string name = file.attribute_name(m_variable_name, k);

      if (name == "long_name") {
        continue;
      }

      io::Type type = file.attribute_type(m_variable_name, name);

      if (type == io::ICEREGRID_CHAR) {
        m_strings[name] = file.read_text_attribute(m_variable_name, name);
      } else {
        std::vector<double> values = file.read_double_attribute(m_variable_name, name);
        if (values.size() != 1) {
          throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                        "attribute '%s' has to be a scalar", name.c_str());
        }
        m_numbers[name] = values[0];
      }
    }
  } catch (RuntimeError &e) {
    e.add_context("reading configuration parameters from '%s'", file.filename().c_str());
    throw;
  }
}

bool NetCDFConfig::is_set_impl(const std::string &name) const {
  return (m_numbers.find(name) != m_numbers.end() or
          m_strings.find(name) != m_strings.end() or
          m_flags.find(name) != m_flags.end());
}

Config::Doubles NetCDFConfig::all_doubles_impl() const {
  return m_numbers;
}

double NetCDFConfig::get_number_impl(const std::string &name) const {
  auto j = m_numbers.find(name);
  if (j == m_numbers.end()) {
    throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                  "parameter '%s' is unset. (Parameters read from '%s'.)",
                                  name.c_str(), m_variable_name.c_str());
  }
  return j->second;
}

void NetCDFConfig::set_number_impl(const std::string &name, double value) {
  m_numbers[name] = value;
}

Config::Strings NetCDFConfig::all_strings_impl() const {
  return m_strings;
}

std::string NetCDFConfig::get_string_impl(const std::string &name) const {
  auto j = m_strings.find(name);
  if (j == m_strings.end()) {
    throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                  "parameter '%s' is unset. (Parameters read from '%s'.)",
                                  name.c_str(), m_variable_name.c_str());
  }
  return j->second;
}

void NetCDFConfig::set_string_impl(const std::string &name, const std::string &value) {
  m_strings[name] = value;
}

Config::Flags NetCDFConfig::all_flags_impl() const {
  return m_flags;
}

bool NetCDFConfig::get_flag_impl(const std::string &name) const {
  auto j = m_flags.find(name);
  if (j == m_flags.end()) {
    throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                  "flag '%s' is unset. (Parameters read from '%s'.)",
                                  name.c_str(), m_variable_name.c_str());
  }
  return j->second;
}

void NetCDFConfig::set_flag_impl(const std::string &name, bool value) {
  m_flags[name] = value;
}

void DefaultConfig::add_number(const std::string &name, double value, const std::string &type,
                               const std::string &units, const std::string &option,
                               const std::string &doc) {
  m_numbers[name]          = value;
  m_strings[name + "_type"]  = type;
  m_strings[name + "_units"] = units;
  m_strings[name + "_doc"]   = doc;
  if (not option.empty()) {
    m_strings[name + "_option"] = option;
  }
}

void DefaultConfig::add_string(const std::string &name, const std::string &value,
                               const std::string &option, const std::string &doc) {
  m_strings[name]           = value;
  m_strings[name + "_type"] = "string";
  m_strings[name + "_doc"]  = doc;
  if (not option.empty()) {
    m_strings[name + "_option"] = option;
  }
}

void DefaultConfig::add_keyword(const std::string &name, const std::string &value,
                                const std::string &choices, const std::string &option,
                                const std::string &doc) {
  add_string(name, value, option, doc);
  m_strings[name + "_type"]    = "keyword";
  m_strings[name + "_choices"] = choices;
}

void DefaultConfig::add_flag(const std::string &name, bool value,
                             const std::string &option, const std::string &doc) {
  m_flags[name]             = value;
  m_strings[name + "_type"] = "flag";
  m_strings[name + "_doc"]  = doc;
  if (not option.empty()) {
    m_strings[name + "_option"] = option;
  }
}

DefaultConfig::DefaultConfig()
  : NetCDFConfig("iceregrid_config") {

  add_string("input.file", "cism.nc", "s",
             "source file (CISM or MPAS layout)");

  add_string("output.file", "landice_grid.nc", "d",
             "destination MPAS-LI file; modified in place");

  add_keyword("regrid.method", "b", "b,d,e,n,bilinear,barycentric,esmf,nearest", "m",
              "horizontal interpolation method: bilinear (b), barycentric (d),"
              " sparse weights from an ESMF weight file (e) or nearest neighbor (n)");

  add_string("regrid.weight_file", "", "w",
             "NetCDF file containing sparse interpolation weights S, row, col"
             " (required by the 'e' method)");

  add_flag("regrid.thickness_only", false, "thickness_only",
           "interpolate the thickness field only");

  add_number("time.start", 0, "integer", "", "time_start",
             "index of the first time level to interpolate");
  m_numbers["time.start_valid_min"] = 0;

  add_number("time.end", 0, "integer", "", "time_end",
             "index of the last time level to interpolate (inclusive)");
  m_numbers["time.end_valid_min"] = 0;

  add_number("vertical.boundary_tolerance", 1e-6, "number", "1", "vertical_tolerance",
             "source vertical coordinate bounds within this distance of destination bounds"
             " are moved to match them");
  m_numbers["vertical.boundary_tolerance_valid_min"] = 0;

  add_number("triangulation.max_points_warning", 16777215, "integer", "", "",
             "warn if a triangulated point set is larger than this (2^24 - 1)");
}

} // end of namespace iceregrid
