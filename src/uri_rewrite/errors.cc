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

#include "uri_rewrite/errors.h"

namespace uri_rewrite
{
char const *
parse_category_impl::name() const noexcept
{
  return "uri_rewrite.parse";
}

std::string
parse_category_impl::message(int code) const
{
  switch (static_cast<ParseErrc>(code)) {
  case ParseErrc::UNKNOWN_DIRECTIVE:
    return "unknown directive";
  case ParseErrc::MALFORMED_LINE:
    return "malformed line";
  case ParseErrc::MISSING_PATTERN:
    return "rule is missing a pattern";
  case ParseErrc::MISSING_REPLACEMENT:
    return "rule is missing a replacement";
  case ParseErrc::INVALID_PATTERN:
    return "invalid regular expression in rule pattern";
  case ParseErrc::BACKREFERENCE_OUT_OF_RANGE:
    return "backreference exceeds the pattern's capture groups";
  case ParseErrc::INVALID_REPLACEMENT:
    return "replacement is not valid UTF-8";
  case ParseErrc::UNKNOWN_FLAG:
    return "unknown flag";
  case ParseErrc::INVALID_REDIRECT_CODE:
    return "invalid redirect status code";
  case ParseErrc::EMPTY_FLAGS:
    return "empty flag list";
  case ParseErrc::DUPLICATE_FLAG:
    return "flag given more than once";
  case ParseErrc::MUTUALLY_EXCLUSIVE_FLAGS:
    return "flags are mutually exclusive";
  case ParseErrc::CONFIG_ERROR:
    return "configuration error";
  }

  return "unknown parse error " + std::to_string(code);
}

char const *
rewrite_category_impl::name() const noexcept
{
  return "uri_rewrite.rewrite";
}

std::string
rewrite_category_impl::message(int code) const
{
  switch (static_cast<RewriteErrc>(code)) {
  case RewriteErrc::INVALID_INPUT:
    return "invalid input URI";
  case RewriteErrc::MATCH_LIMIT_EXCEEDED:
    return "pattern match limit exceeded";
  }

  return "unknown rewrite error " + std::to_string(code);
}

const std::error_category &
parse_category()
{
  static const parse_category_impl instance;
  return instance;
}

const std::error_category &
rewrite_category()
{
  static const rewrite_category_impl instance;
  return instance;
}

std::string
ParseError::to_string() const
{
  std::string text = message.empty() ? code.message() : message;

  if (lineno > 0) {
    text = "line " + std::to_string(lineno) + ": " + text;
    if (!line.empty()) {
      text += ": " + line;
    }
  }

  return text;
}

} // namespace uri_rewrite
