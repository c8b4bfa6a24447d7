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
// parser.cc: implementation of the rule line parser
//
//
#include <cctype>
#include <string>

#include "uri_rewrite/parser.h"
#include "lulu.h"

namespace uri_rewrite
{
enum ParserState { PARSER_DEFAULT, PARSER_IN_QUOTE, PARSER_IN_FLAGS };

// Position of the flags in a rule line, after the keyword, pattern and replacement.
static constexpr size_t FLAGS_TOKEN_INDEX = 3;

bool
Parser::is_rule_keyword(std::string_view token)
{
  return iequals(token, "Rewrite") || iequals(token, "RewriteRule") || iequals(token, "Rule");
}

bool
Parser::parse_line(std::string_view original_line, ParseError &error)
{
  std::string_view line = trim(original_line);

  _tokens.clear();
  _empty     = false;
  _has_flags = false;

  if (line.empty() || line[0] == '#') {
    // blank, or a comment line (it may have had leading whitespace before the #)
    _empty = true;
    return true;
  }

  if (!tokenize(line, error)) {
    _tokens.clear();
    return false;
  }

  return preprocess(error);
}

bool
Parser::tokenize(std::string_view line, ParseError &error)
{
  ParserState state            = PARSER_DEFAULT;
  bool        extracting_token = false;
  std::string token;

  for (size_t i = 0; i < line.size(); ++i) {
    char c = line[i];

    switch (state) {
    case PARSER_DEFAULT:
      if (std::isspace(static_cast<unsigned char>(c))) {
        if (extracting_token) {
          _tokens.push_back(std::move(token));
          token.clear();
          extracting_token = false;
        }
      } else if (!extracting_token && c == '"') {
        state            = PARSER_IN_QUOTE;
        extracting_token = true; // Eat the leading quote
      } else if (!extracting_token && c == '[' && _tokens.size() == FLAGS_TOKEN_INDEX) {
        state            = PARSER_IN_FLAGS;
        extracting_token = true;
        token.push_back(c);
      } else {
        extracting_token = true;
        token.push_back(c);
      }
      break;

    case PARSER_IN_QUOTE:
      if (c == '\\' && i + 1 < line.size() && line[i + 1] == '"') {
        token.push_back('"');
        ++i;
      } else if (c == '"') {
        if (i + 1 < line.size() && !std::isspace(static_cast<unsigned char>(line[i + 1]))) {
          error.set(ParseErrc::MALFORMED_LINE, "closing quote must be followed by whitespace");
          return false;
        }
        // An empty quoted string is still a token, e.g. an empty replacement.
        _tokens.push_back(std::move(token));
        token.clear();
        state            = PARSER_DEFAULT;
        extracting_token = false;
      } else {
        token.push_back(c);
      }
      break;

    case PARSER_IN_FLAGS:
      token.push_back(c);
      if (c == ']') {
        _tokens.push_back(std::move(token));
        token.clear();
        state            = PARSER_DEFAULT;
        extracting_token = false;
      }
      break;
    }
  }

  if (state == PARSER_IN_QUOTE) {
    error.set(ParseErrc::MALFORMED_LINE, "unterminated quotation");
    return false;
  } else if (state == PARSER_IN_FLAGS) {
    error.set(ParseErrc::MALFORMED_LINE, "flags have to be enclosed in [], missing closing ]");
    return false;
  }

  if (extracting_token) {
    /* we hit the end of the line while parsing a token, let's add it */
    _tokens.push_back(std::move(token));
  }

  return true;
}

// Give the tokens their meaning: keyword, pattern, replacement and the optional flags.
bool
Parser::preprocess(ParseError &error)
{
  if (_tokens.empty()) {
    _empty = true;
    return true;
  }

  _keyword = _tokens[0];
  if (!is_rule_keyword(_keyword)) {
    error.set(ParseErrc::UNKNOWN_DIRECTIVE, "unknown directive '" + _keyword + "', expected Rewrite");
    return false;
  }

  if (_tokens.size() < 2) {
    error.set(ParseErrc::MISSING_PATTERN, "rule is missing a pattern");
    return false;
  }
  _pattern = _tokens[1];

  if (_tokens.size() < 3) {
    error.set(ParseErrc::MISSING_REPLACEMENT, "rule is missing a replacement");
    return false;
  }
  _replacement = _tokens[2];

  if (_tokens.size() > FLAGS_TOKEN_INDEX) {
    const std::string &m = _tokens[FLAGS_TOKEN_INDEX];

    if (m.size() < 2 || m.front() != '[' || m.back() != ']') {
      error.set(ParseErrc::MALFORMED_LINE, "flags have to be enclosed in [], got '" + m + "'");
      return false;
    }
    _flags     = m.substr(1, m.size() - 2);
    _has_flags = true;
  }

  if (_tokens.size() > FLAGS_TOKEN_INDEX + 1) {
    error.set(ParseErrc::MALFORMED_LINE, "unexpected text after the flags: '" + _tokens[FLAGS_TOKEN_INDEX + 1] + "'");
    return false;
  }

  return true;
}

} // namespace uri_rewrite
