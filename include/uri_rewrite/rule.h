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
// Implement the classes for the rewrite rules.
//
#pragma once

#include <string>
#include <string_view>

#include "uri_rewrite/Regex.h"
#include "uri_rewrite/errors.h"
#include "uri_rewrite/flags.h"
#include "uri_rewrite/parser.h"
#include "uri_rewrite/replacement.h"

namespace uri_rewrite
{
///////////////////////////////////////////////////////////////////////////////
// Class holding one rewrite rule: the compiled pattern, the replacement and the flags.
// A Rule does not change after initialize(), and can be evaluated from any number of
// threads at the same time.
//
class Rule
{
public:
  Rule() = default;

  // Compile the pattern, and validate the replacement and flags, from a successfully parsed line.
  // @a lineno and @a line are only kept for introspection and diagnostics.
  bool initialize(const Parser &p, int lineno, std::string_view line, ParseError &error);

  // Match against @a subject. Returns what Regex::exec() returns, i.e. > 0 on a match,
  // RE_ERROR_NOMATCH when there is none and some other negative value on errors.
  int
  match(std::string_view subject, RegexMatches &matches, const RegexMatchContext *ctx = nullptr) const
  {
    return _regex.exec(subject, matches, 0, ctx);
  }

  // The new working URI, after a successful match().
  std::string
  substitute(const RegexMatches &matches, std::string_view subject) const
  {
    return _replacement.expand(matches, subject);
  }

  const RuleFlags &
  flags() const
  {
    return _flags;
  }

  const ReplacementTemplate &
  replacement() const
  {
    return _replacement;
  }

  const std::string &
  pattern_string() const
  {
    return _regex.pattern();
  }

  int
  capture_count() const
  {
    return _capture_count;
  }

  int
  lineno() const
  {
    return _lineno;
  }

  const std::string &
  line() const
  {
    return _line;
  }

  // "Rewrite <pattern> <replacement> [flags]", for debug output.
  std::string to_string() const;

private:
  Regex               _regex;
  ReplacementTemplate _replacement;
  RuleFlags           _flags;
  int                 _capture_count = 0;
  int                 _lineno        = 0;
  std::string         _line;
};

} // namespace uri_rewrite
