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

#include "iceregrid/util/io/File.hh"

// The following is a stupid kludge necessary to make NetCDF 4.x work in
// serial mode in an MPI program:
#ifndef MPI_INCLUDED
#define MPI_INCLUDED 1
#endif
#include <netcdf.h>

#include <cstdio>               // stderr, fprintf
#include <numeric>              // std::accumulate

#include "iceregrid/util/error_handling.hh"

namespace iceregrid {

const char *global_attributes = "ICEREGRID_GLOBAL";

//! \brief Converts a NetCDF error code into a RuntimeError.
static void check(const ErrorLocation &where, int return_code) {
  if (return_code != NC_NOERR) {
    throw RuntimeError(where, nc_strerror(return_code));
  }
}

static io::Type nc_type_to_io_type(nc_type input) {
  switch (input) {
  case NC_BYTE:
    return io::ICEREGRID_BYTE;
  case NC_CHAR:
  case NC_STRING:
    return io::ICEREGRID_CHAR;
  case NC_SHORT:
    return io::ICEREGRID_SHORT;
  case NC_INT:
    return io::ICEREGRID_INT;
  case NC_FLOAT:
    return io::ICEREGRID_FLOAT;
  case NC_DOUBLE:
    return io::ICEREGRID_DOUBLE;
  default:
    return io::ICEREGRID_NAT;
  }
}

struct File::Impl {
  std::string filename;
  int ncid;
};

File::File(const std::string &filename, io::Mode mode)
  : m_impl(new Impl) {
  m_impl->filename = filename;
  m_impl->ncid     = -1;

  int open_mode = mode == io::ICEREGRID_READONLY ? NC_NOWRITE : NC_WRITE;

  int stat = nc_open(filename.c_str(), open_mode, &m_impl->ncid);
  if (stat != NC_NOERR) {
    delete m_impl;
    throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION, "failed to open \"%s\": %s",
                                  filename.c_str(), nc_strerror(stat));
  }
}

File::~File() {
  if (m_impl->ncid >= 0) {
    int stat = nc_close(m_impl->ncid);
    if (stat != NC_NOERR) {
      fprintf(stderr, "File::~File: failed to close %s: %s\n",
              m_impl->filename.c_str(), nc_strerror(stat));
    }
  }
  delete m_impl;
}

std::string File::filename() const {
  return m_impl->filename;
}

void File::redef() const {
  int stat = nc_redef(m_impl->ncid);
  // NC_EINDEFINE means "already in define mode"
  if (stat != NC_EINDEFINE) {
    check(ICEREGRID_ERROR_LOCATION, stat);
  }
}

void File::enddef() const {
  int stat = nc_enddef(m_impl->ncid);
  // NC_ENOTINDEFINE means "already in data mode"
  if (stat != NC_ENOTINDEFINE) {
    check(ICEREGRID_ERROR_LOCATION, stat);
  }
}

void File::sync() const {
  int stat = nc_sync(m_impl->ncid);
  check(ICEREGRID_ERROR_LOCATION, stat);
}

unsigned int File::dimension_length(const std::string &name) const {
  int dimid = -1;
  int stat = nc_inq_dimid(m_impl->ncid, name.c_str(), &dimid);
  if (stat != NC_NOERR) {
    return 0;
  }

  size_t length = 0;
  stat = nc_inq_dimlen(m_impl->ncid, dimid, &length);
  check(ICEREGRID_ERROR_LOCATION, stat);

  return static_cast<unsigned int>(length);
}

int File::variable_id(const std::string &variable_name) const {
  if (variable_name == global_attributes) {
    return NC_GLOBAL;
  }

  int varid = -1;
  int stat = nc_inq_varid(m_impl->ncid, variable_name.c_str(), &varid);
  if (stat != NC_NOERR) {
    throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                  "variable '%s' not found in '%s'",
                                  variable_name.c_str(), m_impl->filename.c_str());
  }
  return varid;
}

bool File::find_variable(const std::string &short_name) const {
  int varid = -1;
  return nc_inq_varid(m_impl->ncid, short_name.c_str(), &varid) == NC_NOERR;
}

std::vector<std::string> File::dimensions(const std::string &variable_name) const {
  int varid = variable_id(variable_name);

  int ndims = 0;
  int stat = nc_inq_varndims(m_impl->ncid, varid, &ndims);
  check(ICEREGRID_ERROR_LOCATION, stat);

  if (ndims == 0) {
    return {};
  }

  std::vector<int> dimids(ndims);
  stat = nc_inq_vardimid(m_impl->ncid, varid, dimids.data());
  check(ICEREGRID_ERROR_LOCATION, stat);

  std::vector<std::string> result;
  for (auto d : dimids) {
    char name[NC_MAX_NAME + 1];
    stat = nc_inq_dimname(m_impl->ncid, d, name);
    check(ICEREGRID_ERROR_LOCATION, stat);
    result.emplace_back(name);
  }
  return result;
}

void File::read_variable(const std::string &variable_name,
                         const std::vector<unsigned int> &start,
                         const std::vector<unsigned int> &count,
                         double *ip) const {
  try {
    int varid = variable_id(variable_name);

    std::vector<size_t> nc_start(start.begin(), start.end());
    std::vector<size_t> nc_count(count.begin(), count.end());

    int stat = nc_get_vara_double(m_impl->ncid, varid, nc_start.data(), nc_count.data(), ip);
    check(ICEREGRID_ERROR_LOCATION, stat);
  } catch (RuntimeError &e) {
    e.add_context("reading variable '%s' from '%s'", variable_name.c_str(),
                  m_impl->filename.c_str());
    throw;
  }
}

std::vector<double> File::read_variable(const std::string &variable_name) const {
  std::vector<unsigned int> start, count;
  for (const auto &d : dimensions(variable_name)) {
    start.push_back(0);
    count.push_back(dimension_length(d));
  }

  size_t size = std::accumulate(count.begin(), count.end(), (size_t)1,
                                [](size_t a, unsigned int b) { return a * b; });

  std::vector<double> result(size);
  read_variable(variable_name, start, count, result.data());

  return result;
}

void File::write_variable(const std::string &variable_name,
                          const std::vector<unsigned int> &start,
                          const std::vector<unsigned int> &count,
                          const double *op) const {
  try {
    int varid = variable_id(variable_name);

    std::vector<size_t> nc_start(start.begin(), start.end());
    std::vector<size_t> nc_count(count.begin(), count.end());

    int stat = nc_put_vara_double(m_impl->ncid, varid, nc_start.data(), nc_count.data(), op);
    check(ICEREGRID_ERROR_LOCATION, stat);
  } catch (RuntimeError &e) {
    e.add_context("writing variable '%s' to '%s'", variable_name.c_str(),
                  m_impl->filename.c_str());
    throw;
  }
}

unsigned int File::nattributes(const std::string &var_name) const {
  int varid = variable_id(var_name);

  int result = 0;
  int stat = nc_inq_varnatts(m_impl->ncid, varid, &result);
  check(ICEREGRID_ERROR_LOCATION, stat);

  return result;
}

std::string File::attribute_name(const std::string &var_name, unsigned int n) const {
  int varid = variable_id(var_name);

  char name[NC_MAX_NAME + 1];
  int stat = nc_inq_attname(m_impl->ncid, varid, (int)n, name);
  check(ICEREGRID_ERROR_LOCATION, stat);

  return name;
}

io::Type File::attribute_type(const std::string &var_name, const std::string &att_name) const {
  int varid = variable_id(var_name);

  nc_type type = NC_NAT;
  int stat = nc_inq_atttype(m_impl->ncid, varid, att_name.c_str(), &type);
  if (stat == NC_ENOTATT) {
    return io::ICEREGRID_NAT;
  }
  check(ICEREGRID_ERROR_LOCATION, stat);

  return nc_type_to_io_type(type);
}

void File::write_attribute(const std::string &var_name, const std::string &att_name,
                           const std::string &value) const {
  try {
    int varid = variable_id(var_name);

    int stat = nc_put_att_text(m_impl->ncid, varid, att_name.c_str(),
                               value.size(), value.c_str());
    check(ICEREGRID_ERROR_LOCATION, stat);
  } catch (RuntimeError &e) {
    e.add_context("writing the attribute %s:%s to '%s'",
                  var_name.c_str(), att_name.c_str(), m_impl->filename.c_str());
    throw;
  }
}

std::vector<double> File::read_double_attribute(const std::string &var_name,
                                                const std::string &att_name) const {
  int varid = variable_id(var_name);

  size_t length = 0;
  int stat = nc_inq_attlen(m_impl->ncid, varid, att_name.c_str(), &length);
  if (stat == NC_ENOTATT) {
    return {};
  }
  check(ICEREGRID_ERROR_LOCATION, stat);

  std::vector<double> result(length);
  stat = nc_get_att_double(m_impl->ncid, varid, att_name.c_str(), result.data());
  check(ICEREGRID_ERROR_LOCATION, stat);

  return result;
}

//! Returns an empty string if the attribute is not present.
std::string File::read_text_attribute(const std::string &var_name,
                                      const std::string &att_name) const {
  int varid = variable_id(var_name);

  size_t length = 0;
  int stat = nc_inq_attlen(m_impl->ncid, varid, att_name.c_str(), &length);
  if (stat == NC_ENOTATT) {
    return "";
  }
  check(ICEREGRID_ERROR_LOCATION, stat);

  nc_type type = NC_NAT;
  stat = nc_inq_atttype(m_impl->ncid, varid, att_name.c_str(), &type);
  check(ICEREGRID_ERROR_LOCATION, stat);

  if (type == NC_STRING) {
    char *value = NULL;
    stat = nc_get_att_string(m_impl->ncid, varid, att_name.c_str(), &value);
    check(ICEREGRID_ERROR_LOCATION, stat);

    std::string result = value != NULL ? value : "";
    nc_free_string(1, &value);
    return result;
  }

  if (type != NC_CHAR) {
    throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                  "attribute %s:%s in '%s' is not a string",
                                  var_name.c_str(), att_name.c_str(),
                                  m_impl->filename.c_str());
  }

  std::string result(length, '\0');
  stat = nc_get_att_text(m_impl->ncid, varid, att_name.c_str(), &result[0]);
  check(ICEREGRID_ERROR_LOCATION, stat);

  // some writers include the terminating null character
  size_t end = result.find('\0');
  if (end != std::string::npos) {
    result.resize(end);
  }

  return result;
}

//! Prepend `history` to the global `history` attribute.
void File::append_history(const std::string &history) const {
  try {
    std::string old_history = read_text_attribute(global_attributes, "history");
    redef();
    write_attribute(global_attributes, "history", history + old_history);
    enddef();
  } catch (RuntimeError &e) {
    e.add_context("appending to the history attribute in \"" + m_impl->filename + "\"");
    throw;
  }
}

} // end of namespace iceregrid
