/*
  Licensed to the Apache Software Foundation (ASF) under one
  or more contributor license agreements.  See the NOTICE file
  distributed with this work for additional information
  regarding copyright ownership.  The ASF licenses this file
  to you under the Apache License, Version 2.0 (the
  "License"); you may not use this file except in compliance
  with the License.  You may obtain a copy of the License at

  http://www.apache.org/licenses/LICENSE-2.0

  Unless required by applicable law or agreed to in writing, software
  distributed under the License is distributed on an "AS IS" BASIS,
  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
  See the License for the specific language governing permissions and
  limitations under the License.
*/

//////////////////////////////////////////////////////////////////////////////////////////////
// flags.cc: parsing of the rule flags
//
//
#include <charconv>

#include "uri_rewrite/flags.h"
#include "lulu.h"

namespace uri_rewrite
{
bool
RuleFlags::add(RuleModifiers mod, std::string_view token, ParseError &error)
{
  if (_mods & mod) {
    error.set(ParseErrc::DUPLICATE_FLAG, "flag '" + std::string(token) + "' given more than once");
    return false;
  }
  _mods = static_cast<RuleModifiers>(_mods | mod);

  return true;
}

bool
RuleFlags::parse(std::string_view list, ParseError &error)
{
  _mods   = RULE_NONE;
  _status = DEFAULT_REDIRECT_STATUS;

  while (!list.empty()) {
    size_t           comma = list.find(',');
    std::string_view token = trim(list.substr(0, comma));

    list = (comma == std::string_view::npos) ? std::string_view() : list.substr(comma + 1);
    if (token.empty()) {
      continue; // "[L,,F]" is sloppy, but harmless
    }

    std::string_view name  = token;
    std::string_view value;
    bool             has_value = false;
    size_t           eq        = token.find('=');

    if (eq != std::string_view::npos) {
      name      = trim(token.substr(0, eq));
      value     = trim(token.substr(eq + 1));
      has_value = true;
    }

    if (iequals(name, "L") || iequals(name, "last")) {
      if (has_value) {
        error.set(ParseErrc::UNKNOWN_FLAG, "flag '" + std::string(token) + "' does not take a value");
        return false;
      }
      if (!add(RULE_LAST, token, error)) {
        return false;
      }
    } else if (iequals(name, "F") || iequals(name, "forbidden")) {
      if (has_value) {
        error.set(ParseErrc::UNKNOWN_FLAG, "flag '" + std::string(token) + "' does not take a value");
        return false;
      }
      if (!add(RULE_FORBIDDEN, token, error)) {
        return false;
      }
    } else if (iequals(name, "R") || iequals(name, "redirect")) {
      if (!add(RULE_REDIRECT, token, error)) {
        return false;
      }
      if (!value.empty()) {
        unsigned int code = 0;
        auto [ptr, ec]    = std::from_chars(value.data(), value.data() + value.size(), code);

        if (ec == std::errc::invalid_argument || ptr != value.data() + value.size()) {
          error.set(ParseErrc::INVALID_REDIRECT_CODE, "redirect code '" + std::string(value) + "' is not a number");
          return false;
        }
        if (ec != std::errc() || value.size() != 3 || code < MIN_STATUS || code > MAX_STATUS) {
          error.set(ParseErrc::INVALID_REDIRECT_CODE, "redirect code " + std::string(value) + " is not a valid HTTP status (" +
                                                         std::to_string(MIN_STATUS) + "-" + std::to_string(MAX_STATUS) + ")");
          return false;
        }
        _status = static_cast<uint16_t>(code);
      }
    } else {
      error.set(ParseErrc::UNKNOWN_FLAG, "unknown flag '" + std::string(token) + "'");
      return false;
    }
  }

  if (empty()) {
    error.set(ParseErrc::EMPTY_FLAGS, "flag list is empty");
    return false;
  }

  // A rule either stops the loop (L) or ends the request (R, F), and only one way.
  if (_mods != RULE_LAST && _mods != RULE_REDIRECT && _mods != RULE_FORBIDDEN) {
    error.set(ParseErrc::MUTUALLY_EXCLUSIVE_FLAGS, "flags " + to_string() + " are mutually exclusive, use only one of L, R or F");
    return false;
  }

  return true;
}

std::string
RuleFlags::to_string() const
{
  std::string s;

  if (empty()) {
    return s;
  }

  if (last()) {
    s += "L";
  }
  if (redirect()) {
    s += s.empty() ? "" : ",";
    s += "R=" + std::to_string(_status);
  }
  if (forbidden()) {
    s += s.empty() ? "" : ",";
    s += "F";
  }

  return "[" + s + "]";
}

} // namespace uri_rewrite
