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
//
// Rule flags, the [L,R=301,F] part of a rule.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "uri_rewrite/errors.h"

namespace uri_rewrite
{
// Rule modifiers
enum RuleModifiers {
  RULE_NONE      = 0,
  RULE_LAST      = 1,
  RULE_REDIRECT  = 2,
  RULE_FORBIDDEN = 4,
};

class RuleFlags
{
public:
  static constexpr uint16_t DEFAULT_REDIRECT_STATUS = 302;
  static constexpr uint16_t MIN_STATUS              = 100;
  static constexpr uint16_t MAX_STATUS              = 599;

  RuleFlags() = default;

  // Parse the contents of the brackets, e.g. "L" or "R=301, L". Names are case insensitive. On failure, sets
  // the code and message of @a error and returns false, leaving this object in an unspecified state.
  bool parse(std::string_view list, ParseError &error);

  bool
  empty() const
  {
    return _mods == RULE_NONE;
  }

  bool
  last() const
  {
    return _mods & RULE_LAST;
  }

  bool
  redirect() const
  {
    return _mods & RULE_REDIRECT;
  }

  bool
  forbidden() const
  {
    return _mods & RULE_FORBIDDEN;
  }

  // Only meaningful when redirect() is true.
  uint16_t
  redirect_status() const
  {
    return _status;
  }

  RuleModifiers
  modifiers() const
  {
    return _mods;
  }

  // Canonical form, "[L,R=302]", or the empty string when there are no flags.
  std::string to_string() const;

private:
  bool add(RuleModifiers mod, std::string_view token, ParseError &error);

  RuleModifiers _mods   = RULE_NONE;
  uint16_t      _status = DEFAULT_REDIRECT_STATUS;
};

} // namespace uri_rewrite
