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

#include <algorithm>

#include "iceregrid/fields/FieldPipeline.hh"
#include "iceregrid/fields/FieldIO.hh"
#include "iceregrid/regrid/Regridder.hh"
#include "iceregrid/regrid/VerticalRelayering.hh"
#include "iceregrid/util/ConfigInterface.hh"
#include "iceregrid/util/Context.hh"
#include "iceregrid/util/Logger.hh"
#include "iceregrid/util/error_handling.hh"
#include "iceregrid/util/iceregrid_utilities.hh"

namespace iceregrid {

int clamp_non_negative(std::vector<double> &values, double &min_value) {
  int result = 0;
  min_value = 0.0;

  for (auto &v : values) {
    if (v < 0.0) {
      min_value = std::min(min_value, v);
      v = 0.0;
      result += 1;
    }
  }

  return result;
}

FieldPipeline::FieldPipeline(std::shared_ptr<const Context> ctx,
                             const FieldSource &source,
                             FieldDestination &destination,
                             Regridder &regridder)
  : m_ctx(ctx),
    m_source(source),
    m_destination(destination),
    m_regridder(regridder) {
  // empty
}

bool FieldPipeline::present(const FieldDescriptor &field) const {
  return m_destination.has_field(field.target) and m_source.has_field(field.source);
}

void FieldPipeline::check(const std::vector<FieldDescriptor> &fields) const {
  for (const auto &field : fields) {
    if (not present(field)) {
      continue;
    }

    try {
      check_compatibility(m_regridder.method(), field.grid);
    } catch (RuntimeError &e) {
      e.add_context("checking the interpolation method for '%s'", field.target.c_str());
      throw;
    }
  }
}

void FieldPipeline::run(const std::vector<FieldDescriptor> &fields,
                        unsigned int time_start, unsigned int time_end) {
  if (time_end < time_start) {
    throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                  "invalid range of time levels: start = %d > end = %d",
                                  time_start, time_end);
  }

  for (const auto &field : fields) {
    process(field, time_start, time_end);
  }
}

bool FieldPipeline::process(const FieldDescriptor &field,
                            unsigned int time_start, unsigned int time_end) {
  const Logger &log = *m_ctx->log();

  log.message(2, "\n## %s ##\n", field.target.c_str());

  if (not m_destination.has_field(field.target)) {
    log.message(1, "ICEREGRID WARNING: field '%s' is not in the destination file. Skipping.\n",
                field.target.c_str());
    return false;
  }

  if (not m_source.has_field(field.source)) {
    log.message(1, "ICEREGRID WARNING: field '%s' is not in the source file. Skipping.\n",
                field.source.c_str());
    return false;
  }

  try {
    for (unsigned int t = time_start; t <= time_end; ++t) {
      log.message(2, "  -- Interpolating time level %d\n", t);

      double start = get_time();

      std::vector<double> values = compute(field, t);

      log.message(2, "  interpolation done in %f seconds\n", get_time() - start);

      m_destination.write(field.target, t, values);
    }
  } catch (RuntimeError &e) {
    e.add_context("interpolating '%s' from '%s'", field.target.c_str(), field.source.c_str());
    throw;
  }

  return true;
}

void FieldPipeline::report_range(const char *label, const std::string &name,
                                 const std::vector<double> &values) const {
  if (values.empty()) {
    return;
  }

  m_ctx->log()->message(3, "  %s %s min/max: %f %f\n", label, name.c_str(),
                        vector_min(values), vector_max(values));
}

void FieldPipeline::scale_and_offset(const FieldDescriptor &field,
                                     std::vector<double> &values) const {
  if (field.scale != 1.0) {
    for (auto &v : values) {
      v *= field.scale;
    }
    report_range("scaled", field.target, values);
  }

  if (field.offset != 0.0) {
    for (auto &v : values) {
      v += field.offset;
    }
    report_range("offset", field.target, values);
  }
}

std::vector<double> FieldPipeline::compute(const FieldDescriptor &field,
                                           unsigned int time_index) {
  const Logger &log = *m_ctx->log();

  std::vector<double> input = m_source.read(field.source, time_index);
  report_range("input", field.source, input);

  const HorizontalInterpolation &H = m_regridder.interpolation(field.grid);

  log.message(2, "  ...Interpolating to %s using the %s method...\n",
              field.target.c_str(), method_name(m_regridder.method()).c_str());

  std::vector<double> result;

  if (not field.layered) {
    result = H.interpolate(input);
    report_range("interpolated", field.target, result);

    scale_and_offset(field, result);
  } else {
    const size_t
      n_levels = m_source.n_levels(field.source),
      N_source = H.n_source(),
      N_target = H.n_target();

    if (input.size() != n_levels * N_source) {
      throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                    "'%s' has %d values (expected %d levels times %d points)",
                                    field.source.c_str(), (int)input.size(),
                                    (int)n_levels, (int)N_source);
    }

    // interpolate horizontally, one layer at a time
    std::vector<double> layers(n_levels * N_target);
    for (size_t k = 0; k < n_levels; ++k) {
      H.interpolate(&input[k * N_source], &layers[k * N_target]);
    }
    report_range("interpolated (all source layers)", field.target, layers);

    scale_and_offset(field, layers);

    std::vector<double>
      source_levels = m_source.vertical_levels(field.source),
      target_levels = m_destination.vertical_levels(field.target);

    if (source_levels.size() != n_levels) {
      throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                    "'%s' has %d levels but its vertical coordinate has %d",
                                    field.source.c_str(), (int)n_levels,
                                    (int)source_levels.size());
    }

    double tolerance = m_ctx->config()->get_number("vertical.boundary_tolerance");

    VerticalRelayering relayering(source_levels, target_levels, tolerance, log);

    // interpolate vertically, one column at a time
    const size_t M = relayering.n_target();
    result.resize(N_target * M);
    std::vector<double> column(n_levels);
    for (size_t p = 0; p < N_target; ++p) {
      for (size_t k = 0; k < n_levels; ++k) {
        column[k] = layers[k * N_target + p];
      }
      relayering.relayer(column.data(), &result[p * M]);
    }
    report_range("relayered", field.target, result);
  }

  if (field.clamp == CLAMP_NON_NEGATIVE) {
    double min_value = 0.0;
    int n_clamped = clamp_non_negative(result, min_value);

    if (n_clamped > 0) {
      log.message(2, "  removed negative %s at %d points (min: %f)\n",
                  field.target.c_str(), n_clamped, min_value);
    }
  }

  return result;
}

} // end of namespace iceregrid
