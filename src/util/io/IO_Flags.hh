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

#ifndef ICEREGRID_IO_FLAGS_H
#define ICEREGRID_IO_FLAGS_H

namespace iceregrid {
namespace io {

// This is a subset of NetCDF data-types.
enum Type : int {
  ICEREGRID_NAT    = 0,         /* NAT = 'Not A Type' (c.f. NaN) */
  ICEREGRID_BYTE   = 1,         /* signed 1 byte integer */
  ICEREGRID_CHAR   = 2,         /* ISO/ASCII character */
  ICEREGRID_SHORT  = 3,         /* signed 2 byte integer */
  ICEREGRID_INT    = 4,         /* signed 4 byte integer */
  ICEREGRID_FLOAT  = 5,         /* single precision floating point number */
  ICEREGRID_DOUBLE = 6          /* double precision floating point number */
};

// This is a subset of NetCDF file modes. Use values that don't match
// NetCDF flags so that we can detect errors caused by passing these
// straight to NetCDF.
enum Mode : int {
  //! open an existing file for reading only
  ICEREGRID_READONLY = 7,
  //! open an existing file for reading and writing
  ICEREGRID_READWRITE = 8
};

} // end of namespace io
} // end of namespace iceregrid

#endif /* ICEREGRID_IO_FLAGS_H */
