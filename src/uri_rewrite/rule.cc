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
// rule.cc: Implementation of the rewrite rule class.
//
//
#include <string>

#include "uri_rewrite/rule.h"
#include "lulu.h"

namespace uri_rewrite
{
bool
Rule::initialize(const Parser &p, int lineno, std::string_view line, ParseError &error)
{
  std::string re_error;
  int         re_erroffset = 0;

  _lineno = lineno;
  _line.assign(line.data(), line.size());

  if (!_regex.compile(p.get_pattern(), re_error, re_erroffset, RE_UTF | RE_NEVER_BACKSLASH_C)) {
    error.set(ParseErrc::INVALID_PATTERN, "failed to compile regex '" + p.get_pattern() + "': " + re_error + " at offset " +
                                            std::to_string(re_erroffset));
    return false;
  }
  _capture_count = _regex.get_capture_count();

  if (!_replacement.initialize(p.get_replacement(), _capture_count, error)) {
    return false;
  }

  if (p.has_flags() && !_flags.parse(p.get_flags(), error)) {
    return false;
  }

  Dbg(dbg_ctl, "Adding rule: %s (%d capture group(s))", to_string().c_str(), _capture_count);

  return true;
}

std::string
Rule::to_string() const
{
  std::string s = "Rewrite " + _regex.pattern() + " " + _replacement.source();

  if (!_flags.empty()) {
    s += " " + _flags.to_string();
  }

  return s;
}

} // namespace uri_rewrite
