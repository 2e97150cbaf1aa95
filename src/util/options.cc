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

#include <cstring> // memset

#include <petscsys.h>

#include "iceregrid/util/error_handling.hh"
#include "iceregrid/util/Logger.hh"
#include "iceregrid/util/iceregrid_utilities.hh"
#include "iceregrid/util/iceregrid_options.hh"

namespace iceregrid {

static void show_usage(const Logger &log, const std::string &execname, const std::string &usage) {
  log.message(1,
             "%s is an IceRegrid executable.\n"
             "Options cheat-sheet:\n",
             execname.c_str());
  log.message(1, usage);
  log.message(1,
             "Do '%s -help | grep foo' to see IceRegrid and PETSc options with 'foo'.\n",
             execname.c_str());
}

//! @brief In a single call a driver program can provide a usage string to
//! the user and check if required options are given, and if not, end.
bool show_usage_check_req_opts(const Logger &log,
                               const std::string &execname,
                               const std::vector<std::string> &required_options,
                               const std::string &usage) {
  const bool
    keep_running = false,
    terminate = true;

  log.message(2, "%s %s\n", execname.c_str(), iceregrid::version().c_str());

  if (options::Bool("-version", "stop after printing the IceRegrid version")) {
    return terminate;
  }

  if (options::Bool("-usage", "print IceRegrid usage")) {
    show_usage(log, execname, usage);
    return terminate;
  }

  bool req_absent = false;
  for (const auto &opt : required_options) {
    if (not options::Bool(opt, "a required option")) {
      req_absent = true;
      log.error("ICEREGRID ERROR: option %s required\n", opt.c_str());
    }
  }

  if (req_absent) {
    log.error("\n");
    show_usage(log, execname, usage);
    return terminate;
  }

  // show usage message with -help, but don't stop
  if (options::Bool("-help", "print help on all options")) {
    show_usage(log, execname, usage);
  }
  return keep_running;
}

namespace options {

String::String(const std::string& option,
               const std::string& description) {
  process(option, description, "", DONT_ALLOW_EMPTY);
}

String::String(const std::string& option,
               const std::string& description,
               const std::string& default_value,
               ArgumentFlag argument_flag) {
  process(option, description, default_value, argument_flag);
}

static const int TEMPORARY_STRING_LENGTH = 32768;

void String::process(const std::string& option,
                     const std::string& description,
                     const std::string& default_value,
                     ArgumentFlag argument_flag) {

  char string[TEMPORARY_STRING_LENGTH];
  memset(string, 0, TEMPORARY_STRING_LENGTH);

  PetscBool flag = PETSC_FALSE;

  PetscErrorCode ierr;
  ierr = PetscOptionsGetString(NULL, // default option database
                               NULL, // no prefix
                               option.c_str(),
                               string,
                               TEMPORARY_STRING_LENGTH,
                               &flag);
  ICEREGRID_CHK(ierr, "PetscOptionsGetString");

  std::string result = string;

  if (flag == PETSC_TRUE) {
    if (result.empty()) {
      if (argument_flag == ALLOW_EMPTY) {
        this->set("", true);
      } else {
        throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                      "command line option '%s'\n"
                                      "(%s)\n"
                                      "requires an argument.",
                                      option.c_str(), description.c_str());
      }
    } else {
      this->set(result, true);
    }
  } else {
    this->set(default_value, false);
  }
}

Keyword::Keyword(const std::string& option,
                 const std::string& description,
                 const std::string& choices,
                 const std::string& default_value) {

  if (choices.empty()) {
    throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION, "empty choices argument");
  }

  std::string list = "[" + choices + "]";
  std::string long_description = description + " Choose one of " + list;

  String input(option, long_description, default_value, DONT_ALLOW_EMPTY);

  // use the default value if the option was not set
  if (not input.is_set()) {
    this->set(input, input.is_set());
    return;
  }

  std::string word = input;

  auto choices_set = set_split(choices, ',');

  if (choices_set.find(word) != choices_set.end()) {
    this->set(word, true);
  } else {
    throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                  "invalid %s argument: '%s'. Please choose one of %s.\n",
                                  option.c_str(), word.c_str(), list.c_str());
  }
}

Integer::Integer(const std::string& option,
                 const std::string& description,
                 int default_value) {

  String input(option, description,
               iceregrid::printf("%d", default_value),
               DONT_ALLOW_EMPTY);

  if (input.is_set()) {
    long int result = 0;
    try {
      result = parse_integer(input);
    } catch (RuntimeError &e) {
      e.add_context("processing command-line option '%s %s'",
                    option.c_str(), input.value().c_str());
      throw;
    }
    this->set(static_cast<int>(result), true);
  } else {
    this->set(default_value, false);
  }
}

Real::Real(const std::string& option,
           const std::string& description,
           double default_value) {

  String input(option, description,
               iceregrid::printf("%f", default_value),
               DONT_ALLOW_EMPTY);

  if (input.is_set()) {
    double result = 0.0;
    try {
      result = parse_number(input);
    } catch (RuntimeError &e) {
      e.add_context("processing command-line option '%s %s'",
                    option.c_str(), input.value().c_str());
      throw;
    }
    this->set(result, true);
  } else {
    this->set(default_value, false);
  }
}

bool Bool(const std::string& option,
          const std::string& description) {
  return String(option, description, "", ALLOW_EMPTY).is_set();
}

} // end of namespace options
} // end of namespace iceregrid
