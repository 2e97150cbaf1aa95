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

#ifndef _ICEREGRID_PETSCINITIALIZER_H_
#define _ICEREGRID_PETSCINITIALIZER_H_

namespace iceregrid {
namespace petsc {

/** Ensures that PETSc is properly finalized at the end of a run.
 */
class Initializer {
public:
  Initializer(int argc, char **argv, const char *help);
  ~Initializer();
};

} // end of namespace petsc
} // end of namespace iceregrid

#endif /* _ICEREGRID_PETSCINITIALIZER_H_ */
