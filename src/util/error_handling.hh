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

#ifndef _ICEREGRID_ERROR_HANDLING_H_
#define _ICEREGRID_ERROR_HANDLING_H_

#include <mpi.h>                // MPI_Comm
#include <stdexcept>
#include <string>
#include <vector>

namespace iceregrid {

//! Source location of an error; empty unless built with ICEREGRID_DEBUG.
struct ErrorLocation {
  ErrorLocation();
  ErrorLocation(const char *name, int line);

  const char *filename;
  int line_number;
};

#if ICEREGRID_DEBUG==1
#define ICEREGRID_ERROR_LOCATION iceregrid::ErrorLocation(__FILE__, __LINE__)
#else
#define ICEREGRID_ERROR_LOCATION iceregrid::ErrorLocation()
#endif

//! The exception thrown by all IceRegrid code.
/*!
 * Callers that catch it on the way up can record what they were doing using
 * add_context(). print() reports the message followed by these records, innermost first.
 */
class RuntimeError : public std::runtime_error {
public:
  RuntimeError(const ErrorLocation &location, const std::string &message);
  ~RuntimeError() throw();

  static RuntimeError formatted(const ErrorLocation &location, const char format[], ...)
    __attribute__((format(printf, 2, 3)));

  void add_context(const std::string &message);
  void add_context(const char format[], ...) __attribute__((format(printf, 2, 3)));

  void print(MPI_Comm com);
protected:
  std::vector<std::string> m_context;
  ErrorLocation m_location;
};

//! Report the exception being handled. Call from a `catch (...)` block only.
void handle_fatal_errors(MPI_Comm com);

//! Throw if `errcode` is not `success`.
void check_c_call(int errcode, int success, const char* function_name,
                  const char *file, int line);

//! Throw if a PETSc call failed.
void check_petsc_call(int errcode, const char* function_name,
                      const char *file, int line);

#define ICEREGRID_C_CHK(errcode,success,name)                           \
  do { iceregrid::check_c_call(errcode, success, name, __FILE__, __LINE__); } while (0)
#define ICEREGRID_CHK(errcode,name)                                     \
  do { iceregrid::check_petsc_call(errcode, name, __FILE__, __LINE__); } while (0)

} // end of namespace iceregrid

#endif /* _ICEREGRID_ERROR_HANDLING_H_ */
