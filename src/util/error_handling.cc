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

#include "iceregrid/util/error_handling.hh"
#include <petsc.h>

#include <stdexcept>
#include <stdarg.h>

namespace iceregrid {

ErrorLocation::ErrorLocation()
  : filename(NULL), line_number(0) {
  // empty
}

ErrorLocation::ErrorLocation(const char *name, int line)
  : filename(name), line_number(line) {
  // empty
}

RuntimeError::RuntimeError(const ErrorLocation &location, const std::string &message)
  : std::runtime_error(message), m_location(location) {
  // empty
}

RuntimeError RuntimeError::formatted(const ErrorLocation &location, const char format[], ...) {
  char buffer[8192];
  va_list argp;

  va_start(argp, format);
  vsnprintf(buffer, sizeof(buffer), format, argp);
  va_end(argp);

  return RuntimeError(location, buffer);
}

RuntimeError::~RuntimeError() throw() {
  // empty
}

void RuntimeError::add_context(const std::string &message) {
  m_context.push_back(message);
}

void RuntimeError::add_context(const char format[], ...) {
  char buffer[8192];
  va_list argp;

  va_start(argp, format);
  vsnprintf(buffer, sizeof(buffer), format, argp);
  va_end(argp);

  // convert to std::string to avoid recursion
  this->add_context(std::string(buffer));
}

//! Insert `padding` after every newline in `message`.
static std::string indent(const std::string &message, const std::string &padding) {
  std::string result = message;

  size_t k = result.find('\n', 0);
  while (k != std::string::npos) {
    result.insert(k + 1, padding);
    k = result.find('\n', k + 1);
  }

  return result;
}

void RuntimeError::print(MPI_Comm com) {
  PetscErrorCode ierr = 0;
  std::string error = "ICEREGRID ERROR: ";

  std::string message = indent(this->what(), std::string(error.size(), ' '));

  ierr = PetscPrintf(com,
                     "%s%s\n", error.c_str(), message.c_str()); CHKERRCONTINUE(ierr);

  // compute how much padding we need to align things:
  std::string while_str = std::string(error.size(), ' ') + "while ";
  std::string padding = std::string(while_str.size() + 1, ' '); // 1 extra space

  for (const auto &j : m_context) {
    message = indent(j, padding);

    ierr = PetscPrintf(com,
                       "%s%s\n", while_str.c_str(), message.c_str()); CHKERRCONTINUE(ierr);
  }

  if (m_location.filename != NULL) {
    padding = std::string(error.size(), ' ');
    ierr = PetscPrintf(com,
                       "%sError location: %s, line %d\n",
                       padding.c_str(), m_location.filename, m_location.line_number); CHKERRCONTINUE(ierr);
  }
}

/** Handle fatal errors by printing an informative error message.
 *
 * Should be called from a catch(...) block *only*.
 */
void handle_fatal_errors(MPI_Comm com) {
  PetscErrorCode ierr;
  try {
    throw;                      // re-throw the current exception
  }
  catch (RuntimeError &e) {
    e.print(com);
  }
  catch (std::exception &e) {
    ierr = PetscPrintf(PETSC_COMM_SELF,
                       "\n"
                       "ICEREGRID ERROR: Caught a C++ standard library exception: \"%s\".\n"
                       "                 This is probably a bug in IceRegrid.\n"
                       "\n",
                       e.what()); CHKERRCONTINUE(ierr);
  } catch (...) {
    ierr = PetscPrintf(PETSC_COMM_SELF,
                       "\n"
                       "ICEREGRID ERROR: Caught an unexpected exception.\n"
                       "                 This is probably a bug in IceRegrid.\n"
                       "\n");
    CHKERRCONTINUE(ierr);
  }
}

void check_c_call(int errcode, int success,
                  const char* function_name, const char *file, int line) {
  if (errcode != success) {
    throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                  "External library function %s failed at %s:%d",
                                  function_name, file, line);
  }
}

void check_petsc_call(int errcode,
                      const char* function_name, const char *file, int line) {
  // tell PETSc to print the error message
  CHKERRCONTINUE(errcode);
  check_c_call(errcode, 0, function_name, file, line);
}

} // end of namespace iceregrid
