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

#ifndef ICEREGRID_FIELDPIPELINE_H
#define ICEREGRID_FIELDPIPELINE_H

#include <memory>
#include <vector>

#include "iceregrid/fields/FieldRegistry.hh"

namespace iceregrid {

class Context;
class FieldDestination;
class FieldSource;
class Regridder;

//! Replace negative values with zeros.
/*!
 * Returns the number of modified values. Sets `min_value` to the smallest of the original
 * values (or zero if there were no negative values).
 */
int clamp_non_negative(std::vector<double> &values, double &min_value);

//! Interpolates fields from a source to a destination, one time level at a time.
class FieldPipeline {
public:
  FieldPipeline(std::shared_ptr<const Context> ctx,
                const FieldSource &source,
                FieldDestination &destination,
                Regridder &regridder);

  //! Throws if the interpolation method cannot be used for one of the fields present in
  //! both the source and the destination.
  void check(const std::vector<FieldDescriptor> &fields) const;

  //! Process all `fields` at time levels from `time_start` to `time_end` (inclusive).
  void run(const std::vector<FieldDescriptor> &fields,
           unsigned int time_start, unsigned int time_end);

  //! Process one field. Returns false if it was skipped.
  bool process(const FieldDescriptor &field,
               unsigned int time_start, unsigned int time_end);

  //! Compute values of a destination field at a given time level.
  std::vector<double> compute(const FieldDescriptor &field, unsigned int time_index);
private:
  std::shared_ptr<const Context> m_ctx;
  const FieldSource &m_source;
  FieldDestination &m_destination;
  Regridder &m_regridder;

  bool present(const FieldDescriptor &field) const;
  void scale_and_offset(const FieldDescriptor &field, std::vector<double> &values) const;
  void report_range(const char *label, const std::string &name,
                    const std::vector<double> &values) const;
};

} // end of namespace iceregrid

#endif /* ICEREGRID_FIELDPIPELINE_H */
