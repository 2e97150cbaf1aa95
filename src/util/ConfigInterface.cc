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

#include <algorithm>            // std::max()
#include <cmath>                // std::round()

#include "iceregrid/util/ConfigInterface.hh"
#include "iceregrid/util/Config.hh"
#include "iceregrid/util/Logger.hh"
#include "iceregrid/util/error_handling.hh"
#include "iceregrid/util/iceregrid_options.hh"
#include "iceregrid/util/iceregrid_utilities.hh"
#include "iceregrid/util/io/File.hh"
#include "iceregrid/util/io/IO_Flags.hh"

namespace iceregrid {

struct Config::Impl {
  //! @brief the name of the file this database was read from (if any)
  std::string filename;

  //! @brief Set of parameters set by the user. Used to warn about parameters that were set but were
  //! not used.
  std::set<std::string> parameters_set_by_user;
  //! @brief Set of parameters used in a run. Used to warn about parameters that were set but were
  //! not used.
  std::set<std::string> parameters_used;
};

Config::Config()
  : m_impl(new Impl) {
  // empty
}

Config::~Config() {
  delete m_impl;
}

void Config::read(const File &file) {
  this->read_impl(file);

  m_impl->filename = file.filename();
}

static bool string_to_flag(const std::string &name, const std::string &value) {
  if (member(value, {"on", "yes", "true", "True"})) {
    return true;
  }

  if (member(value, {"off", "no", "false", "False"})) {
    return false;
  }

  throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                "invalid value of the flag %s: '%s'",
                                name.c_str(), value.c_str());
}

/*!
 * Import parameters from `other`. Text values of flags ("true", "false", ...) are converted.
 *
 * Throws RuntimeError if `other` contains a parameter this database does not know about.
 */
void Config::import_from(const Config &other) {
  auto flags   = this->all_flags();
  auto strings = this->all_strings();
  auto numbers = this->all_doubles();

  for (const auto &p : other.all_doubles()) {
    if (numbers.find(p.first) != numbers.end()) {
      this->set_number(p.first, p.second, CONFIG_USER);
    } else {
      throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                    "unrecognized parameter %s in %s",
                                    p.first.c_str(), other.m_impl->filename.c_str());
    }
  }

  for (const auto &p : other.all_strings()) {
    if (flags.find(p.first) != flags.end()) {
      this->set_flag(p.first, string_to_flag(p.first, p.second), CONFIG_USER);
    } else if (strings.find(p.first) != strings.end()) {
      this->set_string(p.first, p.second, CONFIG_USER);
    } else {
      throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                    "unrecognized parameter %s in %s",
                                    p.first.c_str(), other.m_impl->filename.c_str());
    }
  }

  for (const auto &p : other.all_flags()) {
    if (flags.find(p.first) != flags.end()) {
      this->set_flag(p.first, p.second, CONFIG_USER);
    } else {
      throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                    "unrecognized parameter %s in %s",
                                    p.first.c_str(), other.m_impl->filename.c_str());
    }
  }
}

const std::set<std::string>& Config::parameters_set_by_user() const {
  return m_impl->parameters_set_by_user;
}

const std::set<std::string>& Config::parameters_used() const {
  return m_impl->parameters_used;
}

bool Config::is_set(const std::string &name) const {
  return this->is_set_impl(name);
}

Config::Doubles Config::all_doubles() const {
  return this->all_doubles_impl();
}

double Config::get_number(const std::string &name, UseFlag flag) const {
  auto value = get_number_impl(name);

  if (flag == REMEMBER_THIS_USE) {
    // check the valid range (if set) and remember that this parameter was used
    m_impl->parameters_used.insert(name);

    if (type(name) == "integer" and std::round(value) != value) {
      throw RuntimeError::formatted(
          ICEREGRID_ERROR_LOCATION,
          "integer parameter '%s' was set to a number with a non-zero fractional part (%f)",
          name.c_str(), value);
    }

    auto min = valid_min(name);
    if (min.first and value < min.second) {
      throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                    "Please set '%s' to a number greater than or equal to %f",
                                    name.c_str(), min.second);
    }
  }

  return value;
}

void Config::set_number(const std::string &name, double value,
                        ConfigSettingFlag flag) {
  std::set<std::string> &set_by_user = m_impl->parameters_set_by_user;

  if (flag == CONFIG_USER) {
    set_by_user.insert(name);
  }

  // stop if we're setting the default value and this parameter was set by user already
  if (flag == CONFIG_DEFAULT and
      set_by_user.find(name) != set_by_user.end()) {
    return;
  }

  this->set_number_impl(name, value);
}

Config::Strings Config::all_strings() const {
  return this->all_strings_impl();
}

std::string Config::get_string(const std::string &name, UseFlag flag) const {
  if (flag == REMEMBER_THIS_USE) {
    m_impl->parameters_used.insert(name);
  }
  return this->get_string_impl(name);
}

void Config::set_string(const std::string &name,
                        const std::string &value,
                        ConfigSettingFlag flag) {
  std::set<std::string> &set_by_user = m_impl->parameters_set_by_user;

  if (flag == CONFIG_USER) {
    set_by_user.insert(name);
  }

  if (flag == CONFIG_DEFAULT and
      set_by_user.find(name) != set_by_user.end()) {
    return;
  }

  this->set_string_impl(name, value);
}

Config::Flags Config::all_flags() const {
  return this->all_flags_impl();
}

bool Config::get_flag(const std::string& name, UseFlag flag) const {
  if (flag == REMEMBER_THIS_USE) {
    m_impl->parameters_used.insert(name);
  }
  return this->get_flag_impl(name);
}

void Config::set_flag(const std::string& name, bool value,
                      ConfigSettingFlag flag) {
  std::set<std::string> &set_by_user = m_impl->parameters_set_by_user;

  if (flag == CONFIG_USER) {
    set_by_user.insert(name);
  }

  if (flag == CONFIG_DEFAULT and
      set_by_user.find(name) != set_by_user.end()) {
    return;
  }

  this->set_flag_impl(name, value);
}

static bool special_parameter(const std::string &name) {
  for (const auto &suffix : {"_doc", "_units", "_type", "_option", "_choices", "_valid_min"}) {
    if (ends_with(name, suffix)) {
      return true;
    }
  }

  // The NetCDF-based override database stores parameters as attributes of a variable
  // and CF conventions require that all variables have a "long name."
  return (name == "long_name");
}

void print_config(const Logger &log, int verbosity_threshhold, const Config &config) {
  const int v = verbosity_threshhold;

  log.message(v, "### Configuration parameters:\n");

  size_t width = 0;
  for (const auto &d : config.all_doubles()) {
    width = std::max(width, d.first.size());
  }
  for (const auto &s : config.all_strings()) {
    width = std::max(width, s.first.size());
  }
  for (const auto &b : config.all_flags()) {
    width = std::max(width, b.first.size());
  }

  for (const auto &s : config.all_strings()) {
    if (special_parameter(s.first)) {
      continue;
    }
    log.message(v, "  %-*s = \"%s\"\n", (int)width, s.first.c_str(), s.second.c_str());
  }

  for (const auto &d : config.all_doubles()) {
    if (special_parameter(d.first)) {
      continue;
    }
    log.message(v, "  %-*s = %g %s\n", (int)width, d.first.c_str(), d.second,
                config.units(d.first).c_str());
  }

  for (const auto &b : config.all_flags()) {
    log.message(v, "  %-*s = %s\n", (int)width, b.first.c_str(), b.second ? "true" : "false");
  }

  log.message(v, "###\n");
}

void print_unused_parameters(const Logger &log, int verbosity_threshhold,
                             const Config &config) {
  const std::set<std::string> &parameters_set = config.parameters_set_by_user();
  const std::set<std::string> &parameters_used = config.parameters_used();

  if (options::Bool("-options_left", "report unused options")) {
    verbosity_threshhold = log.get_threshold();
  }

  for (const auto &p : parameters_set) {

    if (special_parameter(p)) {
      continue;
    }

    if (parameters_used.find(p) == parameters_used.end()) {
      log.message(verbosity_threshhold,
                  "ICEREGRID WARNING: flag or parameter \"%s\" was set but was not used!\n",
                  p.c_str());
    }
  }
}

// command-line options

//! Get a flag from a command-line option.
/*!
 * `-foo`, `-foo true`, `-foo yes` and `-foo on` set the flag; `-foo false`, `-foo no`,
 * `-foo off` and `-no_foo` clear it.
 */
static void set_flag_from_option(Config &config, const std::string &option,
                                 const std::string &parameter_name) {

  bool value      = config.get_flag(parameter_name, Config::FORGET_THIS_USE);
  std::string doc = config.doc(parameter_name);

  options::String opt("-" + option, doc, value ? "true" : "false", options::ALLOW_EMPTY);

  if (opt.is_set()) {
    if (opt.value().empty()) {
      value = true;
    } else {
      value = string_to_flag(parameter_name, opt.value());
    }
  }

  bool no_foo_is_set = options::Bool("-no_" + option, doc);

  if (no_foo_is_set) {
    if (opt.is_set()) {
      throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                    "Inconsistent command-line options:"
                                    " both -%s and -no_%s are set.\n",
                                    option.c_str(), option.c_str());
    }

    value = false;
  }

  if (opt.is_set() or no_foo_is_set) {
    config.set_flag(parameter_name, value, CONFIG_USER);
  }
}

static void set_number_from_option(Config &config, const std::string &option,
                                   const std::string &parameter) {
  options::Real opt("-" + option, config.doc(parameter),
                    config.get_number(parameter, Config::FORGET_THIS_USE));
  if (opt.is_set()) {
    config.set_number(parameter, opt, CONFIG_USER);
  }
}

static void set_integer_from_option(Config &config, const std::string &option,
                                    const std::string &parameter) {
  options::Integer opt("-" + option, config.doc(parameter),
                       (int)config.get_number(parameter, Config::FORGET_THIS_USE));
  if (opt.is_set()) {
    config.set_number(parameter, opt, CONFIG_USER);
  }
}

static void set_string_from_option(Config &config, const std::string &option,
                                   const std::string &parameter) {

  options::String value("-" + option, config.doc(parameter),
                        config.get_string(parameter, Config::FORGET_THIS_USE));
  if (value.is_set()) {
    config.set_string(parameter, value, CONFIG_USER);
  }
}

//! \brief Set a keyword parameter from a command-line option.
/*!
 * The option requires an argument, which has to match one of the keywords given in a
 * comma-separated list `choices`.
 */
static void set_keyword_from_option(Config &config, const std::string &option,
                                    const std::string &parameter,
                                    const std::string &choices) {

  options::Keyword keyword("-" + option, config.doc(parameter), choices,
                           config.get_string(parameter, Config::FORGET_THIS_USE));

  if (keyword.is_set()) {
    config.set_string(parameter, keyword, CONFIG_USER);
  }
}

void set_parameter_from_options(Config &config, const std::string &name) {

  // skip special parameters ("attributes" of parameters)
  if (special_parameter(name)) {
    return;
  }

  // Use parameter name as its own command-line option by default. name_option can specify
  // a different (shorter) command-line option.
  std::string option = name;

  if (not config.option(name).empty()) {
    std::string short_option = config.option(name);
    std::string description  = config.doc(name);

    if (options::Bool("-" + short_option, description) or
        options::Bool("-no_" + short_option, description)) {
      if (options::Bool("-" + option, description)) {
        throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                      "both -%s and -%s are set (please use one or the other)",
                                      option.c_str(), short_option.c_str());
      }

      // Use the short option only if the user set it, otherwise used the full (long) option below.
      option = short_option;
    }
  }

  std::string type = config.type(name);

  if (type == "string") {
    set_string_from_option(config, option, name);
  } else if (type == "flag") {
    set_flag_from_option(config, option, name);
  } else if (type == "number") {
    set_number_from_option(config, option, name);
  } else if (type == "integer") {
    set_integer_from_option(config, option, name);
  } else if (type == "keyword") {
    set_keyword_from_option(config, option, name, config.choices(name));
  } else {
    throw RuntimeError::formatted(ICEREGRID_ERROR_LOCATION,
                                  "parameter type \"%s\" of \"%s\" is invalid",
                                  type.c_str(), name.c_str());
  }
}

void set_config_from_options(Config &config) {
  for (const auto &d : config.all_doubles()) {
    set_parameter_from_options(config, d.first);
  }

  for (const auto &s : config.all_strings()) {
    set_parameter_from_options(config, s.first);
  }

  for (const auto &b : config.all_flags()) {
    set_parameter_from_options(config, b.first);
  }
}

Config::Ptr config_from_options(const Logger &log) {

  auto config = std::make_shared<DefaultConfig>();

  options::String override_filename("-config_override", "Config override file name");

  if (override_filename.is_set()) {
    log.message(2, "Reading configuration overrides from '%s'...\n",
                override_filename.value().c_str());

    NetCDFConfig overrides("iceregrid_overrides");
    File file(override_filename, io::ICEREGRID_READONLY);
    overrides.read(file);

    config->import_from(overrides);
  }

  set_config_from_options(*config);

  return config;
}

std::string Config::doc(const std::string &parameter) const {
  return this->get_string(parameter + "_doc", Config::FORGET_THIS_USE);
}

std::string Config::units(const std::string &parameter) const {
  if (this->is_set(parameter + "_units")) {
    return this->get_string(parameter + "_units", Config::FORGET_THIS_USE);
  }
  return "";
}

std::string Config::type(const std::string &parameter) const {
  return this->get_string(parameter + "_type", Config::FORGET_THIS_USE);
}

std::string Config::option(const std::string &parameter) const {
  if (this->is_set(parameter + "_option")) {
    return this->get_string(parameter + "_option", Config::FORGET_THIS_USE);
  }

  return "";
}

std::string Config::choices(const std::string &parameter) const {
  return this->get_string(parameter + "_choices", Config::FORGET_THIS_USE);
}

std::pair<bool, double> Config::valid_min(const std::string &parameter) const {
  if (is_set(parameter + "_valid_min")) {
    return { true, get_number(parameter + "_valid_min", Config::FORGET_THIS_USE) };
  }
  return { false, 0.0 };
}

} // end of namespace iceregrid
