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

#include "iceregrid/util/Context.hh"
#include "iceregrid/util/ConfigInterface.hh"
#include "iceregrid/util/Logger.hh"

namespace iceregrid {

Context::Context(MPI_Comm com, std::shared_ptr<Config> config, std::shared_ptr<Logger> log)
  : m_com(com), m_config(config), m_log(log) {
  // empty
}

MPI_Comm Context::com() const {
  return m_com;
}

std::shared_ptr<Config> Context::config() {
  return m_config;
}

std::shared_ptr<const Config> Context::config() const {
  return m_config;
}

std::shared_ptr<const Logger> Context::log() const {
  return m_log;
}

std::shared_ptr<Logger> Context::log() {
  return m_log;
}

std::shared_ptr<Context> context_from_options(MPI_Comm com, bool print) {
  auto log = logger_from_options(com);

  auto config = config_from_options(*log);

  if (print) {
    print_config(*log, DIAGNOSTICS, *config);
  }

  return std::make_shared<Context>(com, config, log);
}

} // end of namespace iceregrid
