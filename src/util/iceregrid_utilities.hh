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
#ifndef ICEREGRID_UTILITIES_H
#define ICEREGRID_UTILITIES_H

#include <algorithm>            // std::min, std::max
#include <set>
#include <string>
#include <vector>

#include <mpi.h>

namespace iceregrid {

//! Wall clock time in seconds. Used to report how long building weights takes.
double get_time();

//! Time stamp and command line, used in the `history` attribute of output files.
std::string timestamp(MPI_Comm com);
std::string args_string();

//! IceRegrid revision and versions of libraries it uses.
std::string version();

bool is_nondecreasing(const std::vector<double> &a);

double vector_min(const std::vector<double> &input);
double vector_max(const std::vector<double> &input);

template<typename T>
inline T clip(T x, T a, T b) {
  return std::min(std::max(a, x), b);
}

std::string printf(const char *format, ...) __attribute__((format(printf, 1, 2)));

bool ends_with(const std::string &str, const std::string &suffix);
std::string join(const std::vector<std::string> &strings, const std::string &separator);
std::set<std::string> set_split(const std::string &input, char separator);
bool member(const std::string &string, const std::set<std::string> &set);

//! Parse a number or an integer, throwing RuntimeError if `input` is not one.
double parse_number(const std::string &input);
long int parse_integer(const std::string &input);

} // end of namespace iceregrid

#endif /* ICEREGRID_UTILITIES_H */
