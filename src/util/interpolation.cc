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

#include <gsl/gsl_interp.h>

#include "iceregrid/util/interpolation.hh"
#include "iceregrid/util/error_handling.hh"

namespace iceregrid {

Interpolation::Interpolation(const std::vector<double> &input_x,
                             const std::vector<double> &output_x)
  : Interpolation(input_x.data(), input_x.size(),
                  output_x.data(), output_x.size()) {
  // empty
}

Interpolation::Interpolation(const double *input_x, unsigned int input_x_size,
                             const double *output_x, unsigned int output_x_size) {

  if (input_x_size == 0) {
    throw RuntimeError(ICEREGRID_ERROR_LOCATION,
                       "an input grid for interpolation has to contain at least one point");
  }

  // the trivial case (the code below requires input_x_size >= 2)
  if (input_x_size < 2) {
    m_left.assign(output_x_size, 0);
    m_right.assign(output_x_size, 0);
    m_alpha.assign(output_x_size, 0.0);
    return;
  }

  for (unsigned int i = 0; i < input_x_size - 1; ++i) {
    if (input_x[i] > input_x[i + 1]) {
      throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                    "an input grid for interpolation has to be non-decreasing"
                                    " (x[%d] = %f > x[%d] = %f)",
                                    i, input_x[i], i + 1, input_x[i + 1]);
    }
  }

  init_linear(input_x, input_x_size, output_x, output_x_size);
}

/**
 * Compute linear interpolation indexes and weights.
 */
void Interpolation::init_linear(const double *input_x, unsigned int input_x_size,
                                const double *output_x, unsigned int output_x_size) {
  m_left.resize(output_x_size);
  m_right.resize(output_x_size);
  m_alpha.resize(output_x_size);

  for (unsigned int i = 0; i < output_x_size; ++i) {
    double x = output_x[i];

    // note: use "input_x_size" instead of "input_x_size - 1" to support extrapolation on
    // the right
    unsigned int
      L = gsl_interp_bsearch(input_x, x, 0, input_x_size),
      R = L + 1;

    double alpha = 0.0;
    if (x >= input_x[L] and R < input_x_size) {
      // regular case (input_x[L] <= x < input_x[R], so the denominator is positive)
      alpha = (x - input_x[L]) / (input_x[R] - input_x[L]);
    } else {
      // extrapolation
      alpha = 0.0;
      R = L;
    }

    m_left[i]  = L;
    m_right[i] = R;
    m_alpha[i] = alpha;
  }
}

const std::vector<int>& Interpolation::left() const {
  return m_left;
}

const std::vector<int>& Interpolation::right() const {
  return m_right;
}

const std::vector<double>& Interpolation::alpha() const {
  return m_alpha;
}

int Interpolation::left(size_t j) const {
  return m_left[j];
}

int Interpolation::right(size_t j) const {
  return m_right[j];
}

double Interpolation::alpha(size_t j) const {
  return m_alpha[j];
}

std::vector<double> Interpolation::interpolate(const std::vector<double> &input_values) const {
  std::vector<double> result(m_alpha.size());

  interpolate(input_values.data(), result.data());

  return result;
}

void Interpolation::interpolate(const double *input, double *output) const {
  size_t n = m_alpha.size();
  for (size_t k = 0; k < n; ++k) {
    const int
      L = m_left[k],
      R = m_right[k];
    output[k] = input[L] + m_alpha[k] * (input[R] - input[L]);
  }
}

} // end of namespace iceregrid
