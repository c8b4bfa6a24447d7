/** @file

  Unit tests for the rule line parser.

  @section license License

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

#include "catch.hpp"

#include "uri_rewrite/parser.h"

using namespace uri_rewrite;

namespace
{
std::error_code
line_error(std::string_view line)
{
  Parser     p;
  ParseError error;

  INFO("line: " << line);
  CHECK_FALSE(p.parse_line(line, error));
  CHECK_FALSE(error.message.empty());

  return error.code;
}
} // namespace

TEST_CASE("Parser", "[uri_rewrite][parser]")
{
  Parser     p;
  ParseError error;

  SECTION("plain rule")
  {
    REQUIRE(p.parse_line("Rewrite /a /b", error));
    CHECK_FALSE(p.empty());
    CHECK(p.get_keyword() == "Rewrite");
    CHECK(p.get_pattern() == "/a");
    CHECK(p.get_replacement() == "/b");
    CHECK_FALSE(p.has_flags());
    CHECK(p.get_tokens().size() == 3);
  }

  SECTION("keywords are case insensitive, whitespace is flexible")
  {
    REQUIRE(p.parse_line("  rewriterule\t/a   /b   [L]  ", error));
    CHECK(p.get_pattern() == "/a");
    CHECK(p.get_replacement() == "/b");
    REQUIRE(p.has_flags());
    CHECK(p.get_flags() == "L");

    REQUIRE(p.parse_line("RULE /x /y", error));
    CHECK(p.get_keyword() == "RULE");
    CHECK_FALSE(p.has_flags());
  }

  SECTION("flags may contain whitespace")
  {
    REQUIRE(p.parse_line("Rewrite ^/old/(.*) /new/$1 [R=301, L]", error));
    CHECK(p.get_replacement() == "/new/$1");
    CHECK(p.get_flags() == "R=301, L");
  }

  SECTION("brackets in the pattern are not flags")
  {
    REQUIRE(p.parse_line("Rewrite [a-z]+ /x", error));
    CHECK(p.get_pattern() == "[a-z]+");
    CHECK_FALSE(p.has_flags());
  }

  SECTION("empty flags are left to the flag parser")
  {
    REQUIRE(p.parse_line("Rewrite /a /b []", error));
    CHECK(p.has_flags());
    CHECK(p.get_flags().empty());
  }

  SECTION("comments and blank lines")
  {
    REQUIRE(p.parse_line("", error));
    CHECK(p.empty());
    REQUIRE(p.parse_line("   \t ", error));
    CHECK(p.empty());
    REQUIRE(p.parse_line("# Rewrite /a /b", error));
    CHECK(p.empty());
    REQUIRE(p.parse_line("    # indented comment", error));
    CHECK(p.empty());
  }

  SECTION("quoted tokens")
  {
    REQUIRE(p.parse_line(R"(Rewrite "^/a b$" "/c \"d\"" [L])", error));
    CHECK(p.get_pattern() == "^/a b$");
    CHECK(p.get_replacement() == "/c \"d\"");
    CHECK(p.get_flags() == "L");
  }

  SECTION("backslashes are kept outside of \\\"")
  {
    REQUIRE(p.parse_line(R"(Rewrite "^/a\.html$" /b)", error));
    CHECK(p.get_pattern() == R"(^/a\.html$)");
  }

  SECTION("empty quoted replacement")
  {
    REQUIRE(p.parse_line(R"(Rewrite ^/a$ "")", error));
    CHECK(p.get_replacement().empty());
  }

  SECTION("a parser can be reused")
  {
    REQUIRE(p.parse_line("Rewrite /a /b [F]", error));
    REQUIRE(p.parse_line("Rewrite /c /d", error));
    CHECK(p.get_pattern() == "/c");
    CHECK_FALSE(p.has_flags());
  }

  SECTION("keyword lookup")
  {
    CHECK(Parser::is_rule_keyword("Rewrite"));
    CHECK(Parser::is_rule_keyword("REWRITERULE"));
    CHECK(Parser::is_rule_keyword("rule"));
    CHECK_FALSE(Parser::is_rule_keyword("Redirect"));
    CHECK_FALSE(Parser::is_rule_keyword(""));
  }
}

TEST_CASE("Parser errors", "[uri_rewrite][parser]")
{
  CHECK(line_error("Redirect /a /b") == ParseErrc::UNKNOWN_DIRECTIVE);
  CHECK(line_error("/a /b [L]") == ParseErrc::UNKNOWN_DIRECTIVE);

  CHECK(line_error("Rewrite") == ParseErrc::MISSING_PATTERN);
  CHECK(line_error("Rewrite /a") == ParseErrc::MISSING_REPLACEMENT);

  CHECK(line_error("Rewrite /a /b L") == ParseErrc::MALFORMED_LINE);
  CHECK(line_error("Rewrite /a /b [L") == ParseErrc::MALFORMED_LINE);
  CHECK(line_error("Rewrite /a /b [L] extra") == ParseErrc::MALFORMED_LINE);
  CHECK(line_error("Rewrite /a /b [L]x") == ParseErrc::MALFORMED_LINE);
  CHECK(line_error("Rewrite /a /b [L] [F]") == ParseErrc::MALFORMED_LINE);
  CHECK(line_error(R"(Rewrite "/a /b)") == ParseErrc::MALFORMED_LINE);
  CHECK(line_error(R"(Rewrite "/a"x /b)") == ParseErrc::MALFORMED_LINE);
}
