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

static char help[] =
  "Interpolates fields from a CISM or MPAS-LI file to an existing MPAS-LI grid file.\n"
  "Time levels are copied by index, without processing time stamps.\n";

#include <memory>
#include <petscsys.h>           // PETSC_COMM_WORLD

#include "iceregrid/fields/FieldPipeline.hh"
#include "iceregrid/fields/FieldRegistry.hh"
#include "iceregrid/fields/NetCDFFieldIO.hh"
#include "iceregrid/regrid/Regridder.hh"
#include "iceregrid/util/ConfigInterface.hh"
#include "iceregrid/util/Context.hh"
#include "iceregrid/util/Logger.hh"
#include "iceregrid/util/error_handling.hh"
#include "iceregrid/util/iceregrid_options.hh"
#include "iceregrid/util/iceregrid_utilities.hh"
#include "iceregrid/util/petscwrappers/PetscInitializer.hh"

using namespace iceregrid;

static void report_extent(const Logger &log, const char *name, const PointSet &points) {
  log.message(2,
              "%s extents:\n"
              "  x min, max: %f %f\n"
              "  y min, max: %f %f\n",
              name,
              points.x_min(), points.x_max(),
              points.y_min(), points.y_max());
}

int main(int argc, char *argv[]) {

  MPI_Comm com = MPI_COMM_WORLD;
  petsc::Initializer petsc(argc, argv, help);

  com = PETSC_COMM_WORLD;

  int exit_code = 0;
  try {
    std::shared_ptr<Context> ctx = context_from_options(com, true);

    Logger::Ptr log = ctx->log();
    Config::Ptr config = ctx->config();

    std::string usage =
      "  iceregrid [-s SOURCE.nc] [-d DESTINATION.nc] [-m METHOD] [-w WEIGHTS.nc] [OTHER OPTIONS]\n"
      "where:\n"
      "  -s               source file (CISM or MPAS-LI)\n"
      "  -d               destination MPAS-LI file (modified in place)\n"
      "  -m               interpolation method: b (bilinear), d (barycentric),\n"
      "                   e (sparse weights from an ESMF weight file), n (nearest neighbor)\n"
      "  -w               ESMF weight file (used by -m e)\n"
      "  -thickness_only  interpolate ice thickness only\n"
      "  -time_start N    first time level to interpolate (0-based)\n"
      "  -time_end N      last time level to interpolate (0-based, inclusive)\n"
      "notes:\n"
      "  * the destination file has to contain all the fields to be interpolated\n"
      "  * xtime is not copied\n";
    {
      bool done = show_usage_check_req_opts(*log, "iceregrid", {}, usage);
      if (done) {
        return 0;
      }
    }

    std::string
      source_filename      = config->get_string("input.file"),
      destination_filename = config->get_string("output.file");

    Method method = method_from_string(config->get_string("regrid.method"));

    int
      time_start = config->get_number("time.start"),
      time_end   = config->get_number("time.end");

    bool thickness_only = config->get_flag("regrid.thickness_only");

    log->message(2, "* Source file: %s\n", source_filename.c_str());
    log->message(2, "* Destination file to be modified: %s\n", destination_filename.c_str());
    log->message(2, "* Interpolation method: %s\n", method_name(method).c_str());

    if (time_end < time_start) {
      throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                    "invalid range of time levels: start = %d > end = %d",
                                    time_start, time_end);
    }

    if (method == SPARSE and config->get_string("regrid.weight_file").empty()) {
      throw RuntimeError(ICEREGRID_ERROR_LOCATION,
                         "the 'e' interpolation method requires a weight file (-w)");
    }

    DestinationFile destination(destination_filename);
    SourceFile source(source_filename);

    log->message(2, "* Source file uses %s layout\n", layout_name(source.layout()).c_str());

    if (source.layout() == UNSTRUCTURED_LAYOUT and (method == BILINEAR or method == SPARSE)) {
      throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                    "%s interpolation is not supported for source files"
                                    " using the MPAS layout",
                                    method_name(method).c_str());
    }

    PointSet target = destination.points();

    report_extent(*log, "Destination grid", target);
    if (source.layout() == UNSTRUCTURED_LAYOUT) {
      report_extent(*log, "Source grid", source.points(CELL_GRID));
    } else {
      report_extent(*log, "Source grid (x1, y1)", source.points(PRIMARY_GRID));
    }

    Regridder regridder(ctx, method, source, target);

    auto fields = field_registry(source.layout(), thickness_only);

    FieldPipeline pipeline(ctx, source, destination, regridder);

    pipeline.check(fields);

    pipeline.run(fields, time_start, time_end);

    if (time_end > time_start) {
      log->message(1,
                   "ICEREGRID WARNING: multiple time levels have been copied, but xtime has not.\n"
                   "  Be sure to copy or assign xtime values in the destination file if needed.\n");
    }

    destination.append_history(timestamp(com) + ": " + args_string() + "\n");

    log->message(2, "\nInterpolation completed.\n");

    print_unused_parameters(*log, 3, *config);
  }
  catch (...) {
    handle_fatal_errors(com);
    exit_code = 1;
  }

  return exit_code;
}
