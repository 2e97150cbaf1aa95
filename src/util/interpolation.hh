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

#ifndef _ICEREGRID_INTERPOLATION_H_
#define _ICEREGRID_INTERPOLATION_H_

#include <cstddef>
#include <vector>

namespace iceregrid {

/**
 * Linear interpolation indexes and weights for transferring columns of values between two
 * fixed 1D grids.
 *
 * `left[i]` and `right[i]` are indexes in the input grid such that
 * ~~~ c++
 * input_x[left[i]] <= output_x[i] < input_x[right[i]]
 * ~~~
 * and `alpha[i]` is the weight used like this:
 * ~~~ c++
 * result[k] = input_values[L] + alpha[k] * (input_values[R] - input_values[L]);
 * ~~~
 *
 * Points outside of the interval covered by the input grid use *constant extrapolation*:
 * `left[i] == right[i]` and `alpha[i] == 0`.
 *
 * The input grid has to be non-decreasing. Repeated input coordinates are allowed; the
 * value at the last of the repeated points is used.
 */
class Interpolation {
public:
  Interpolation(const std::vector<double> &input_x,
                const std::vector<double> &output_x);
  Interpolation(const double *input_x, unsigned int input_x_size,
                const double *output_x, unsigned int output_x_size);

  const std::vector<int>& left() const;
  const std::vector<int>& right() const;
  const std::vector<double>& alpha() const;

  int left(size_t i) const;
  int right(size_t i) const;
  double alpha(size_t i) const;

  std::vector<double> interpolate(const std::vector<double> &input_values) const;

  void interpolate(const double *input, double *output) const;
private:
  std::vector<int> m_left, m_right;
  std::vector<double> m_alpha;

  void init_linear(const double *input_x, unsigned int input_x_size,
                   const double *output_x, unsigned int output_x_size);
};

} // end of namespace iceregrid

#endif /* _ICEREGRID_INTERPOLATION_H_ */
