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

#ifndef ICEREGRID_CONTEXT_H
#define ICEREGRID_CONTEXT_H

#include <memory>

#include <mpi.h>

namespace iceregrid {

class Config;
class Logger;

//! The communicator, configuration and logger of one regridding run.
class Context {
public:
  Context(MPI_Comm com, std::shared_ptr<Config> config, std::shared_ptr<Logger> log);

  MPI_Comm com() const;

  std::shared_ptr<const Config> config() const;
  std::shared_ptr<Config> config();

  std::shared_ptr<const Logger> log() const;
  std::shared_ptr<Logger> log();
private:
  MPI_Comm m_com;
  std::shared_ptr<Config> m_config;
  std::shared_ptr<Logger> m_log;
};

//! Set up logging and configuration from command-line options. Prints the configuration
//! at the "diagnostics" verbosity if `print` is set.
std::shared_ptr<Context> context_from_options(MPI_Comm com, bool print = false);

} // end of namespace iceregrid

#endif /* ICEREGRID_CONTEXT_H */
