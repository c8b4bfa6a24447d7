/** @file

  Unit tests for rule flag parsing.

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

#include "uri_rewrite/flags.h"

using namespace uri_rewrite;

namespace
{
std::error_code
flag_error(std::string_view list)
{
  RuleFlags  flags;
  ParseError error;

  CHECK_FALSE(flags.parse(list, error));
  CHECK_FALSE(error.message.empty());

  return error.code;
}
} // namespace

TEST_CASE("RuleFlags", "[uri_rewrite][flags]")
{
  RuleFlags  flags;
  ParseError error;

  SECTION("last")
  {
    REQUIRE(flags.parse("L", error));
    CHECK(flags.last());
    CHECK_FALSE(flags.redirect());
    CHECK_FALSE(flags.forbidden());
    CHECK(flags.modifiers() == RULE_LAST);
    CHECK(flags.to_string() == "[L]");
  }

  SECTION("redirect with the default status")
  {
    REQUIRE(flags.parse("R", error));
    CHECK(flags.redirect());
    CHECK(flags.redirect_status() == 302);
    CHECK(flags.to_string() == "[R=302]");
  }

  SECTION("redirect with an empty status")
  {
    REQUIRE(flags.parse("R=", error));
    CHECK(flags.redirect_status() == RuleFlags::DEFAULT_REDIRECT_STATUS);
  }

  SECTION("redirect with a status")
  {
    REQUIRE(flags.parse("R=301", error));
    CHECK(flags.redirect_status() == 301);
    REQUIRE(flags.parse("R=100", error));
    CHECK(flags.redirect_status() == 100);
    REQUIRE(flags.parse("R=599", error));
    CHECK(flags.redirect_status() == 599);
  }

  SECTION("forbidden")
  {
    REQUIRE(flags.parse("F", error));
    CHECK(flags.forbidden());
    CHECK(flags.to_string() == "[F]");
  }

  SECTION("case and whitespace")
  {
    REQUIRE(flags.parse(" r=307 ", error));
    CHECK(flags.redirect());
    CHECK(flags.redirect_status() == 307);
    CHECK(flags.modifiers() == RULE_REDIRECT);
    CHECK(flags.to_string() == "[R=307]");
    REQUIRE(flags.parse(" l", error));
    CHECK(flags.last());
  }

  SECTION("long names")
  {
    REQUIRE(flags.parse("last", error));
    CHECK(flags.last());
    REQUIRE(flags.parse("Redirect=308", error));
    CHECK(flags.redirect_status() == 308);
    REQUIRE(flags.parse("FORBIDDEN", error));
    CHECK(flags.forbidden());
  }

  SECTION("stray commas are ignored")
  {
    REQUIRE(flags.parse(",F,", error));
    CHECK(flags.forbidden());
    CHECK(flags.modifiers() == RULE_FORBIDDEN);
  }

  SECTION("reparsing starts from scratch")
  {
    REQUIRE(flags.parse("R=301", error));
    REQUIRE(flags.parse("F", error));
    CHECK_FALSE(flags.last());
    CHECK_FALSE(flags.redirect());
    CHECK(flags.redirect_status() == 302);
  }
}

TEST_CASE("RuleFlags errors", "[uri_rewrite][flags]")
{
  CHECK(flag_error("X") == ParseErrc::UNKNOWN_FLAG);
  CHECK(flag_error("L,NC") == ParseErrc::UNKNOWN_FLAG);
  CHECK(flag_error("L=1") == ParseErrc::UNKNOWN_FLAG);
  CHECK(flag_error("F=403") == ParseErrc::UNKNOWN_FLAG);

  CHECK(flag_error("R=abc") == ParseErrc::INVALID_REDIRECT_CODE);
  CHECK(flag_error("R=3O1") == ParseErrc::INVALID_REDIRECT_CODE);
  CHECK(flag_error("R=-1") == ParseErrc::INVALID_REDIRECT_CODE);
  CHECK(flag_error("R=99") == ParseErrc::INVALID_REDIRECT_CODE);
  CHECK(flag_error("R=600") == ParseErrc::INVALID_REDIRECT_CODE);
  CHECK(flag_error("R=99999999999999999999") == ParseErrc::INVALID_REDIRECT_CODE);
  CHECK(flag_error("R=0302") == ParseErrc::INVALID_REDIRECT_CODE);
  CHECK(flag_error("R=00301") == ParseErrc::INVALID_REDIRECT_CODE);
  CHECK(flag_error("R=+301") == ParseErrc::INVALID_REDIRECT_CODE);

  CHECK(flag_error("L,L") == ParseErrc::DUPLICATE_FLAG);
  CHECK(flag_error("R,R=301") == ParseErrc::DUPLICATE_FLAG);
  CHECK(flag_error("F,forbidden") == ParseErrc::DUPLICATE_FLAG);

  CHECK(flag_error("") == ParseErrc::EMPTY_FLAGS);
  CHECK(flag_error(" , ") == ParseErrc::EMPTY_FLAGS);

  CHECK(flag_error("L,R") == ParseErrc::MUTUALLY_EXCLUSIVE_FLAGS);
  CHECK(flag_error("R=301,L") == ParseErrc::MUTUALLY_EXCLUSIVE_FLAGS);
  CHECK(flag_error("L,F") == ParseErrc::MUTUALLY_EXCLUSIVE_FLAGS);
  CHECK(flag_error("R,F") == ParseErrc::MUTUALLY_EXCLUSIVE_FLAGS);
  CHECK(flag_error("last,Redirect=308,FORBIDDEN") == ParseErrc::MUTUALLY_EXCLUSIVE_FLAGS);
  // Duplicates are reported before the combination
  CHECK(flag_error("L,F,L") == ParseErrc::DUPLICATE_FLAG);

  SECTION("the message names the flags")
  {
    RuleFlags  flags;
    ParseError error;

    REQUIRE_FALSE(flags.parse("F, r=301", error));
    CHECK(error.message.find("[R=301,F]") != std::string::npos);
  }
}
