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
// The replacement half of a rule: literal text with $N backreferences, split into segments
// once at parse time so that expansion is a simple concatenation.
//
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "uri_rewrite/errors.h"
#include "uri_rewrite/Regex.h"

namespace uri_rewrite
{
class ReplacementTemplate
{
public:
  // The replacement token meaning "leave the URI alone, only apply the flags".
  static constexpr std::string_view PASSTHROUGH_TOKEN = "-";

  struct Segment {
    std::string literal;   // Used when index < 0
    int         index = -1; // Backreference, 0 is the whole match

    bool
    is_backref() const
    {
      return index >= 0;
    }
  };

  ReplacementTemplate() = default;

  // Parse @a text, checking every backreference against @a capture_count. On failure, @a error is set
  // (code and message only, the caller knows the line) and false is returned.
  bool initialize(std::string_view text, int capture_count, ParseError &error);

  // Build the replacement for one match. @a subject is the string that was matched, which is also
  // the result for the passthrough ("-") replacement.
  std::string expand(const RegexMatches &matches, std::string_view subject) const;

  bool
  is_passthrough() const
  {
    return _passthrough;
  }

  // Highest backreference used, -1 if none.
  int
  max_backref() const
  {
    return _max_backref;
  }

  const std::vector<Segment> &
  segments() const
  {
    return _segments;
  }

  const std::string &
  source() const
  {
    return _source;
  }

private:
  void add_literal(std::string_view s);

  std::string          _source;
  std::vector<Segment> _segments;
  size_t               _literal_len = 0;
  int                  _max_backref = -1;
  bool                 _passthrough = false;
};

} // namespace uri_rewrite
