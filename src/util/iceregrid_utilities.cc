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

#include "iceregrid/util/iceregrid_utilities.hh"

#include <cstdarg>              // va_list, va_start(), va_end()
#include <sstream>              // istringstream
#include <cstdio>               // vsnprintf
#include <cstdlib>              // strtol(), strtod()
#include <ctime>                // time(), strftime()

#include <gsl/gsl_version.h>    // GSL_VERSION
#include <CGAL/version.h>       // CGAL_VERSION_STR

// The following is a stupid kludge necessary to make NetCDF 4.x work in
// serial mode in an MPI program:
#ifndef MPI_INCLUDED
#define MPI_INCLUDED 1
#endif
#include <netcdf.h>             // nc_inq_libvers

#include <petscsys.h>
#include <petsctime.h>          // PetscTime

#include "iceregrid/util/error_handling.hh"

#ifndef ICEREGRID_REVISION
#define ICEREGRID_REVISION "unknown revision"
#endif

namespace iceregrid {

//! Returns true if `str` ends with `suffix` and false otherwise.
bool ends_with(const std::string &str, const std::string &suffix) {
  if (suffix.size() > str.size()) {
    return false;
  }

  return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

//! Concatenate `strings`, inserting `separator` between elements.
std::string join(const std::vector<std::string> &strings, const std::string &separator) {
  if (strings.empty()) {
    return "";
  }

  auto j = strings.begin();
  std::string result = *j;
  ++j;
  while (j != strings.end()) {
    result += separator + *j;
    ++j;
  }
  return result;
}

//! Non-empty tokens of a `separator`-separated list.
std::set<std::string> set_split(const std::string &input, char separator) {
  std::istringstream stream(input);
  std::string token;
  std::set<std::string> result;

  while (std::getline(stream, token, separator)) {
    if (not token.empty()) {
      result.insert(token);
    }
  }
  return result;
}

//! Checks if a vector of doubles is non-decreasing.
bool is_nondecreasing(const std::vector<double> &a) {
  for (size_t k = 1; k < a.size(); ++k) {
    if (a[k - 1] > a[k]) {
      return false;
    }
  }
  return true;
}

bool member(const std::string &string, const std::set<std::string> &set) {
  return (set.find(string) != set.end());
}

static const int TEMPORARY_STRING_LENGTH = 32768;

std::string version() {
  char buffer[TEMPORARY_STRING_LENGTH];
  std::string result;

  result += iceregrid::printf("IceRegrid (%s)\n", ICEREGRID_REVISION);

  PetscGetVersion(buffer, TEMPORARY_STRING_LENGTH);
  result += buffer;
  result += "\n";

  int string_length = TEMPORARY_STRING_LENGTH;
  MPI_Get_library_version(buffer, &string_length);
  result += buffer;
  result += "\n";

  result += iceregrid::printf("NetCDF %s.\n", nc_inq_libvers());
  result += iceregrid::printf("GSL %s.\n", GSL_VERSION);
  result += iceregrid::printf("CGAL %s.\n", CGAL_VERSION_STR);

  return result;
}

//! Creates a time-stamp used for the history NetCDF attribute.
std::string timestamp(MPI_Comm com) {
  time_t now;
  tm tm_now;
  char date_str[50];
  now = time(NULL);
  localtime_r(&now, &tm_now);
  // Format specifiers for strftime():
  //   %c = the locale's date and time
  strftime(date_str, sizeof(date_str), "%c", &tm_now);

  MPI_Bcast(date_str, 50, MPI_CHAR, 0, com);

  return std::string(date_str);
}

//! \brief Uses argc and argv to create the string with current command-line arguments.
std::string args_string() {
  int argc;
  char **argv;
  PetscErrorCode ierr = PetscGetArgs(&argc, &argv);
  ICEREGRID_CHK(ierr, "PetscGetArgs");

  std::vector<std::string> arguments;
  for (int j = 0; j < argc; j++) {
    std::string argument = argv[j];

    // enclose arguments containing spaces with double quotes:
    if (argument.find(" ") != std::string::npos) {
      argument = "\"" + argument + "\"";
    }

    arguments.emplace_back(argument);
  }

  return join(arguments, " ");
}

double get_time() {
  PetscLogDouble result;
  PetscErrorCode ierr = PetscTime(&result); ICEREGRID_CHK(ierr, "PetscTime");
  return result;
}

std::string printf(const char *format, ...) {
  std::string result(1024, ' ');
  va_list arglist, arglist_copy;

  va_start(arglist, format);
  va_copy(arglist_copy, arglist);

  int length = vsnprintf(&result[0], result.size(), format, arglist);
  if (length >= (int)result.size()) {
    result.resize(length + 1);
    vsnprintf(&result[0], result.size(), format, arglist_copy);
  }

  va_end(arglist_copy);
  va_end(arglist);

  return result.substr(0, length > 0 ? length : 0);
}

double vector_min(const std::vector<double> &input) {
  double my_min = input[0];
  for (auto x : input) {
    my_min = std::min(x, my_min);
  }
  return my_min;
}

double vector_max(const std::vector<double> &input) {
  double my_max = input[0];
  for (auto x : input) {
    my_max = std::max(x, my_max);
  }
  return my_max;
}

double parse_number(const std::string &input) {
  char *endptr = NULL;
  double result = strtod(input.c_str(), &endptr);
  if (input.empty() or *endptr != '\0') {
    throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                  "Can't parse %s (expected a floating point number)",
                                  input.c_str());
  }
  return result;
}

long int parse_integer(const std::string &input) {
  char *endptr = NULL;
  long int result = strtol(input.c_str(), &endptr, 10);
  if (input.empty() or *endptr != '\0') {
    throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                  "Can't parse %s (expected an integer)",
                                  input.c_str());
  }
  return result;
}

} // end of namespace iceregrid
