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
// Interface for the rule line parser
//
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "uri_rewrite/errors.h"

namespace uri_rewrite
{
///////////////////////////////////////////////////////////////////////////////
// Splits one line of rule text into its parts:
//
//   <keyword> <pattern> <replacement> [<flags>]
//
// This only does the lexical part (tokens, quoting, brackets, the keyword). Compiling the pattern,
// and making sense of the replacement and the flags, is up to the Rule.
//
class Parser
{
public:
  Parser() = default;

  // noncopyable
  Parser(const Parser &)         = delete;
  void operator=(const Parser &) = delete;

  // Returns false and fills in the code and message of @a error if the line is malformed. A blank line, or
  // a comment, is not an error, check empty() after a successful parse.
  bool parse_line(std::string_view original_line, ParseError &error);

  bool
  empty() const
  {
    return _empty;
  }

  const std::string &
  get_keyword() const
  {
    return _keyword;
  }

  const std::string &
  get_pattern() const
  {
    return _pattern;
  }

  const std::string &
  get_replacement() const
  {
    return _replacement;
  }

  bool
  has_flags() const
  {
    return _has_flags;
  }

  // The text between the brackets, without the brackets.
  const std::string &
  get_flags() const
  {
    return _flags;
  }

  const std::vector<std::string> &
  get_tokens() const
  {
    return _tokens;
  }

  // Is this one of the keywords introducing a rewrite rule (case insensitive)?
  static bool is_rule_keyword(std::string_view token);

protected:
  std::vector<std::string> _tokens;

private:
  bool tokenize(std::string_view line, ParseError &error);
  bool preprocess(ParseError &error);

  bool        _empty     = false;
  bool        _has_flags = false;
  std::string _keyword;
  std::string _pattern;
  std::string _replacement;
  std::string _flags;
};

} // namespace uri_rewrite
