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
// Error codes for rule parsing (construction time) and URI rewriting (call time).
//
#pragma once

#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace uri_rewrite
{
enum class ParseErrc {
  UNKNOWN_DIRECTIVE = 1,      ///< First token is not a known rule keyword
  MALFORMED_LINE,             ///< Bad quoting, flags without brackets, trailing garbage ...
  MISSING_PATTERN,            ///< Keyword without a pattern
  MISSING_REPLACEMENT,        ///< Pattern without a replacement
  INVALID_PATTERN,            ///< Pattern failed to compile
  BACKREFERENCE_OUT_OF_RANGE, ///< $N with N larger than the pattern's capture count
  INVALID_REPLACEMENT,        ///< Replacement is not valid UTF-8
  UNKNOWN_FLAG,               ///< Flag name not in the vocabulary
  INVALID_REDIRECT_CODE,      ///< R=code with a non numeric, or not a 100-599, code
  EMPTY_FLAGS,                ///< [] with nothing in it
  DUPLICATE_FLAG,             ///< Same flag given twice on one rule
  MUTUALLY_EXCLUSIVE_FLAGS,   ///< More than one of L, R and F on one rule
  CONFIG_ERROR,               ///< Configuration, or rules file, could not be loaded
};

enum class RewriteErrc {
  INVALID_INPUT = 1,    ///< URI contains bytes the engine refuses to process, or is too long
  MATCH_LIMIT_EXCEEDED, ///< A pattern hit the configured backtracking limits
};

class parse_category_impl : public std::error_category
{
public:
  /// @return Name of the category.
  char const *name() const noexcept override;

  /// @return Text for @c code.
  std::string message(int code) const override;
};

class rewrite_category_impl : public std::error_category
{
public:
  char const *name() const noexcept override;
  std::string message(int code) const override;
};

const std::error_category &parse_category();
const std::error_category &rewrite_category();

inline std::error_code
make_error_code(ParseErrc e)
{
  return {static_cast<int>(e), parse_category()};
}

inline std::error_code
make_error_code(RewriteErrc e)
{
  return {static_cast<int>(e), rewrite_category()};
}

// The one error a failed rule set parse produces. Line number and line are those of the offending rule line
// (lineno is 0 for errors not tied to a line, e.g. a missing rules file).
//
struct ParseError {
  std::error_code code;
  int             lineno = 0;
  std::string     line;
  std::string     message;

  explicit
  operator bool() const
  {
    return static_cast<bool>(code);
  }

  void
  set(ParseErrc e, std::string msg)
  {
    code    = make_error_code(e);
    message = std::move(msg);
  }

  void
  clear()
  {
    code.clear();
    lineno = 0;
    line.clear();
    message.clear();
  }

  // "line N: <message>: <line>", or just the message when there is no line.
  std::string to_string() const;
};

} // namespace uri_rewrite

namespace std
{
template <> struct is_error_code_enum<uri_rewrite::ParseErrc> : true_type {
};

template <> struct is_error_code_enum<uri_rewrite::RewriteErrc> : true_type {
};
} // namespace std
