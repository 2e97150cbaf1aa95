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

#ifndef _ICEREGRID_LOGGER_H_
#define _ICEREGRID_LOGGER_H_

#include <memory>
#include <sstream>
#include <string>

#include <mpi.h>                // MPI_Comm

namespace iceregrid {

//! Verbosity thresholds: warnings, one line per field, field ranges and statistics.
enum LoggerLevel {WARNING = 1, PROGRESS = 2, DIAGNOSTICS = 3};

//! Prints messages with a verbosity at or below the threshold on rank 0 of `com`.
class Logger {
public:
  Logger(MPI_Comm com, int threshold);
  virtual ~Logger();

  typedef std::shared_ptr<Logger> Ptr;
  typedef std::shared_ptr<const Logger> ConstPtr;

  void message(int threshold, const char format[], ...) const __attribute__((format(printf, 3, 4)));
  void message(int threshold, const std::string &text) const;

  //! Print to stderr regardless of the threshold.
  void error(const char format[], ...) const __attribute__((format(printf, 2, 3)));

  void set_threshold(int level);
  int get_threshold() const;
protected:
  virtual void message_impl(const char buffer[]) const;
  virtual void error_impl(const char buffer[]) const;
private:
  MPI_Comm m_com;
  int m_threshold;
  Logger(const Logger&);
  Logger & operator=(const Logger &);
};

//! Collects messages in memory. Used to check warnings in tests.
class StringLogger : public Logger {
public:
  StringLogger(MPI_Comm com, int threshold);

  std::string get() const;
protected:
  void message_impl(const char buffer[]) const;
  void error_impl(const char buffer[]) const;
private:
  mutable std::ostringstream m_data;
};

//! Logger with the threshold set by `-verbose`.
Logger::Ptr logger_from_options(MPI_Comm com);

} // end of namespace iceregrid

#endif /* _ICEREGRID_LOGGER_H_ */
