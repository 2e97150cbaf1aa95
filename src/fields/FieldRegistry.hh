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

#ifndef ICEREGRID_FIELDREGISTRY_H
#define ICEREGRID_FIELDREGISTRY_H

#include <string>
#include <vector>

#include "iceregrid/regrid/HorizontalInterpolation.hh"

namespace iceregrid {

//! Source file layouts.
enum SourceLayout {
  //! CISM-style: fields on structured grids (`x1`/`y1`, `x0`/`y0`)
  STRUCTURED_LAYOUT,
  //! MPAS-style: fields on cell centers (`xCell`/`yCell`)
  UNSTRUCTURED_LAYOUT
};

std::string layout_name(SourceLayout layout);

//! Post-processing applied to interpolated values.
enum Clamp {CLAMP_NONE, CLAMP_NON_NEGATIVE};

//! Describes how to compute a destination field from a source field.
struct FieldDescriptor {
  //! name of the field in the destination file
  std::string target;
  //! name of the field in the source file
  std::string source;
  double scale;
  double offset;
  GridType grid;
  //! true if the field has a vertical dimension
  bool layered;
  Clamp clamp;
};

//! Fields copied from a source file using a given layout, in processing order.
/*!
 * If `thickness_only` is set the list contains the ice thickness only.
 */
std::vector<FieldDescriptor> field_registry(SourceLayout layout, bool thickness_only);

} // end of namespace iceregrid

#endif /* ICEREGRID_FIELDREGISTRY_H */
