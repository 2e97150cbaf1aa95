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

#include <stdarg.h>
#include <petscsys.h>

#include "iceregrid/util/Logger.hh"
#include "iceregrid/util/iceregrid_options.hh"
#include "iceregrid/util/error_handling.hh"

namespace iceregrid {

Logger::Logger(MPI_Comm com, int threshold)
  : m_com(com), m_threshold(threshold) {
  // empty
}

Logger::~Logger() {
  // empty
}

void Logger::message(int threshold, const char format[], ...) const {
  if (threshold > m_threshold) {
    return;
  }

  char buffer[8192];
  va_list argp;

  va_start(argp, format);
  vsnprintf(buffer, sizeof(buffer), format, argp);
  va_end(argp);

  message_impl(buffer);
}

void Logger::message(int threshold, const std::string &text) const {
  if (threshold > m_threshold) {
    return;
  }

  message_impl(text.c_str());
}

void Logger::error(const char format[], ...) const {
  char buffer[8192];
  va_list argp;

  va_start(argp, format);
  vsnprintf(buffer, sizeof(buffer), format, argp);
  va_end(argp);

  error_impl(buffer);
}

void Logger::message_impl(const char buffer[]) const {
  PetscErrorCode ierr = PetscFPrintf(m_com, PETSC_STDOUT, "%s", buffer);
  ICEREGRID_CHK(ierr, "PetscFPrintf");
}

void Logger::error_impl(const char buffer[]) const {
  PetscErrorCode ierr = PetscFPrintf(m_com, stderr, "%s", buffer);
  ICEREGRID_CHK(ierr, "PetscFPrintf");
}

void Logger::set_threshold(int level) {
  m_threshold = level;
}

int Logger::get_threshold() const {
  return m_threshold;
}

Logger::Ptr logger_from_options(MPI_Comm com) {
  options::Integer verbosity("-verbose", "set logger verbosity threshold", PROGRESS);

  return Logger::Ptr(new Logger(com, verbosity));
}

StringLogger::StringLogger(MPI_Comm com, int threshold)
  : Logger(com, threshold) {
  // empty
}

void StringLogger::message_impl(const char buffer[]) const {
  m_data << buffer;
}

void StringLogger::error_impl(const char buffer[]) const {
  m_data << buffer;
}

std::string StringLogger::get() const {
  return m_data.str();
}

} // end of namespace iceregrid
