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
// replacement.cc: parse and expand replacement templates
//
//
#include <cctype>
#include <charconv>

#include "uri_rewrite/replacement.h"
#include "lulu.h"

namespace uri_rewrite
{
void
ReplacementTemplate::add_literal(std::string_view s)
{
  if (s.empty()) {
    return;
  }

  // Merge adjacent literals, "$$" and friends would otherwise leave lots of tiny segments.
  if (!_segments.empty() && !_segments.back().is_backref()) {
    _segments.back().literal.append(s);
  } else {
    _segments.push_back({std::string(s), -1});
  }
  _literal_len += s.size();
}

// Supported syntax:
//   $N    - backreference, N is the longest run of digits
//   ${N}  - backreference, for when the group is followed by a literal digit
//   $$    - a literal '$'
//   $x    - anything else after a '$' is kept verbatim
bool
ReplacementTemplate::initialize(std::string_view text, int capture_count, ParseError &error)
{
  _source.assign(text.data(), text.size());
  _segments.clear();
  _literal_len = 0;
  _max_backref = -1;
  _passthrough = (text == PASSTHROUGH_TOKEN);

  if (_passthrough) {
    return true;
  }

  // Captures of a UTF-8 subject are UTF-8, so with valid literals the expansion is too.
  if (!valid_utf8(text)) {
    error.set(ParseErrc::INVALID_REPLACEMENT, "replacement '" + _source + "' is not valid UTF-8");
    return false;
  }

  size_t start = 0; // Start of the pending literal
  size_t i     = 0;

  while (i < text.size()) {
    if (text[i] != '$' || i + 1 >= text.size()) {
      ++i;
      continue;
    }

    char   next = text[i + 1];
    size_t digits_start, digits_end, consumed;

    if (next == '$') {
      add_literal(text.substr(start, i - start + 1)); // Keep one of the two '$'
      i     += 2;
      start  = i;
      continue;
    } else if (std::isdigit(static_cast<unsigned char>(next))) {
      digits_start = i + 1;
      digits_end   = digits_start;
      while (digits_end < text.size() && std::isdigit(static_cast<unsigned char>(text[digits_end]))) {
        ++digits_end;
      }
      consumed = digits_end - i;
    } else if (next == '{') {
      size_t close = text.find('}', i + 2);

      digits_start = i + 2;
      digits_end   = close;
      if (close == std::string_view::npos || close == digits_start) {
        error.set(ParseErrc::MALFORMED_LINE, "unterminated or empty ${} in replacement '" + _source + "'");
        return false;
      }
      for (size_t j = digits_start; j < digits_end; ++j) {
        if (!std::isdigit(static_cast<unsigned char>(text[j]))) {
          error.set(ParseErrc::MALFORMED_LINE, "non numeric backreference ${" +
                                                 std::string(text.substr(digits_start, digits_end - digits_start)) +
                                                 "} in replacement '" + _source + "'");
          return false;
        }
      }
      consumed = close + 1 - i;
    } else {
      // Not a substitution, just a dollar sign
      ++i;
      continue;
    }

    std::string_view digits = text.substr(digits_start, digits_end - digits_start);
    int              ix     = 0;
    auto [ptr, ec]          = std::from_chars(digits.data(), digits.data() + digits.size(), ix);

    if (ec != std::errc() || ix > capture_count) {
      error.set(ParseErrc::BACKREFERENCE_OUT_OF_RANGE, "using unavailable captured substring (" +
                                                         std::string(text.substr(i, consumed)) + ") in replacement '" +
                                                         _source + "', the pattern has " + std::to_string(capture_count) +
                                                         " capture group(s)");
      return false;
    }

    add_literal(text.substr(start, i - start));
    _segments.push_back({std::string(), ix});
    if (ix > _max_backref) {
      _max_backref = ix;
    }

    i     += consumed;
    start  = i;
  }

  add_literal(text.substr(start));
  Dbg(dbg_ctl, "    Replacement '%s' has %zu segment(s), max backreference %d", _source.c_str(), _segments.size(), _max_backref);

  return true;
}

std::string
ReplacementTemplate::expand(const RegexMatches &matches, std::string_view subject) const
{
  if (_passthrough) {
    return std::string(subject);
  }

  std::string result;
  size_t      len = _literal_len;

  for (const auto &seg : _segments) {
    if (seg.is_backref()) {
      len += matches[seg.index].size(); // Empty for groups that did not participate
    }
  }
  result.reserve(len);

  for (const auto &seg : _segments) {
    if (seg.is_backref()) {
      result.append(matches[seg.index]);
    } else {
      result.append(seg.literal);
    }
  }

  return result;
}

} // namespace uri_rewrite
