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

#include "iceregrid/geometry/PointSet.hh"
#include "iceregrid/util/error_handling.hh"
#include "iceregrid/util/iceregrid_utilities.hh"

namespace iceregrid {

static void check_axis(const std::vector<double> &axis, const char *name) {
  if (axis.size() < 2) {
    throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                  "a structured grid axis '%s' has to contain at least 2 points"
                                  " (got %d)", name, (int)axis.size());
  }

  bool ascending = axis[1] > axis[0];

  for (size_t k = 1; k < axis.size(); ++k) {
    double dx = axis[k] - axis[k - 1];
    if ((ascending and not (dx > 0.0)) or (not ascending and not (dx < 0.0))) {
      throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                    "a structured grid axis '%s' has to be strictly monotonic"
                                    " (%s[%d] = %f, %s[%d] = %f)",
                                    name, name, (int)k - 1, axis[k - 1], name, (int)k, axis[k]);
    }
  }
}

static void check_not_empty(const PointSet &points) {
  if (points.size() == 0) {
    throw RuntimeError(ICEREGRID_ERROR_LOCATION, "the point set is empty");
  }
}

PointSet::PointSet()
  : m_structured(false) {
  // empty
}

PointSet PointSet::Structured(const std::vector<double> &x_axis,
                              const std::vector<double> &y_axis) {
  check_axis(x_axis, "x");
  check_axis(y_axis, "y");

  PointSet result;
  result.m_structured = true;
  result.m_x_axis     = x_axis;
  result.m_y_axis     = y_axis;

  size_t Nx = x_axis.size(), Ny = y_axis.size();

  result.m_x.resize(Nx * Ny);
  result.m_y.resize(Nx * Ny);

  for (size_t j = 0; j < Ny; ++j) {
    for (size_t i = 0; i < Nx; ++i) {
      result.m_x[j * Nx + i] = x_axis[i];
      result.m_y[j * Nx + i] = y_axis[j];
    }
  }

  return result;
}

PointSet PointSet::Unstructured(const std::vector<double> &x,
                                const std::vector<double> &y) {
  if (x.size() != y.size()) {
    throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                  "x and y coordinates of an unstructured point set have to"
                                  " have the same length (got %d and %d)",
                                  (int)x.size(), (int)y.size());
  }

  PointSet result;
  result.m_structured = false;
  result.m_x          = x;
  result.m_y          = y;

  return result;
}

size_t PointSet::size() const {
  return m_x.size();
}

double PointSet::x(size_t k) const {
  return m_x[k];
}

double PointSet::y(size_t k) const {
  return m_y[k];
}

const std::vector<double>& PointSet::x() const {
  return m_x;
}

const std::vector<double>& PointSet::y() const {
  return m_y;
}

bool PointSet::structured() const {
  return m_structured;
}

const std::vector<double>& PointSet::x_axis() const {
  if (not m_structured) {
    throw RuntimeError(ICEREGRID_ERROR_LOCATION, "an unstructured point set has no x axis");
  }
  return m_x_axis;
}

const std::vector<double>& PointSet::y_axis() const {
  if (not m_structured) {
    throw RuntimeError(ICEREGRID_ERROR_LOCATION, "an unstructured point set has no y axis");
  }
  return m_y_axis;
}

double PointSet::x_min() const {
  check_not_empty(*this);
  return vector_min(m_x);
}

double PointSet::x_max() const {
  check_not_empty(*this);
  return vector_max(m_x);
}

double PointSet::y_min() const {
  check_not_empty(*this);
  return vector_min(m_y);
}

double PointSet::y_max() const {
  check_not_empty(*this);
  return vector_max(m_y);
}

} // end of namespace iceregrid
