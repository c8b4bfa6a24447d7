/** @file

  Unit tests for replacement templates.

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

#include <string>

#include "catch.hpp"

#include "uri_rewrite/replacement.h"

using namespace uri_rewrite;

namespace
{
// Match @a subject with @a pattern and expand @a replacement against it.
std::string
expand(std::string_view pattern, std::string_view replacement, std::string_view subject)
{
  Regex               re;
  ReplacementTemplate tmpl;
  ParseError          error;

  REQUIRE(re.compile(pattern, RE_UTF));
  REQUIRE(tmpl.initialize(replacement, re.get_capture_count(), error));

  RegexMatches matches(re.get_capture_count() + 1);

  REQUIRE(re.exec(subject, matches) > 0);

  return tmpl.expand(matches, subject);
}

std::error_code
init_error(std::string_view replacement, int capture_count, ParseError &error)
{
  ReplacementTemplate tmpl;

  CHECK_FALSE(tmpl.initialize(replacement, capture_count, error));

  return error.code;
}
} // namespace

TEST_CASE("ReplacementTemplate parsing", "[uri_rewrite][replacement]")
{
  ReplacementTemplate tmpl;
  ParseError          error;

  SECTION("literal only")
  {
    REQUIRE(tmpl.initialize("/static/index.html", 0, error));
    CHECK_FALSE(tmpl.is_passthrough());
    CHECK(tmpl.max_backref() == -1);
    REQUIRE(tmpl.segments().size() == 1);
    CHECK(tmpl.segments()[0].literal == "/static/index.html");
  }

  SECTION("backreferences")
  {
    REQUIRE(tmpl.initialize("/tmp/$1/$2.bak", 2, error));
    CHECK(tmpl.max_backref() == 2);
    REQUIRE(tmpl.segments().size() == 5);
    CHECK(tmpl.segments()[0].literal == "/tmp/");
    CHECK(tmpl.segments()[1].index == 1);
    CHECK(tmpl.segments()[2].literal == "/");
    CHECK(tmpl.segments()[3].index == 2);
    CHECK(tmpl.segments()[4].literal == ".bak");
  }

  SECTION("dollar escapes are merged into one literal")
  {
    REQUIRE(tmpl.initialize("/price/$$1/$x$", 0, error));
    CHECK(tmpl.max_backref() == -1);
    REQUIRE(tmpl.segments().size() == 1);
    CHECK(tmpl.segments()[0].literal == "/price/$1/$x$");
  }

  SECTION("passthrough")
  {
    REQUIRE(tmpl.initialize("-", 0, error));
    CHECK(tmpl.is_passthrough());
    CHECK(tmpl.segments().empty());
  }

  SECTION("empty replacement is not a passthrough")
  {
    REQUIRE(tmpl.initialize("", 0, error));
    CHECK_FALSE(tmpl.is_passthrough());
    CHECK(tmpl.segments().empty());
  }

  SECTION("backreference out of range")
  {
    CHECK(init_error("/x/$2", 1, error) == ParseErrc::BACKREFERENCE_OUT_OF_RANGE);
    CHECK(error.message.find("using unavailable captured substring ($2)") != std::string::npos);
  }

  SECTION("longest digit run is the group")
  {
    CHECK(init_error("/x/$10", 1, error) == ParseErrc::BACKREFERENCE_OUT_OF_RANGE);
  }

  SECTION("$1 without any group")
  {
    CHECK(init_error("/x/$1", 0, error) == ParseErrc::BACKREFERENCE_OUT_OF_RANGE);
  }

  SECTION("UTF-8 literals")
  {
    REQUIRE(tmpl.initialize("/caf\xc3\xa9/$1", 1, error));
    CHECK(tmpl.segments()[0].literal == "/caf\xc3\xa9/");
  }

  SECTION("literals that are not UTF-8")
  {
    CHECK(init_error("/x/\xff", 0, error) == ParseErrc::INVALID_REPLACEMENT);
    CHECK(error.message.find("not valid UTF-8") != std::string::npos);
    CHECK(init_error("/$1\xc3", 1, error) == ParseErrc::INVALID_REPLACEMENT);
    CHECK(init_error("/\xc3\x28", 0, error) == ParseErrc::INVALID_REPLACEMENT);
    CHECK(init_error("/\xc0\xaf", 0, error) == ParseErrc::INVALID_REPLACEMENT);
    CHECK(init_error("/\xed\xa0\x80", 0, error) == ParseErrc::INVALID_REPLACEMENT);
  }

  SECTION("bad braces")
  {
    CHECK(init_error("/x/${1", 1, error) == ParseErrc::MALFORMED_LINE);
    CHECK(init_error("/x/${}", 1, error) == ParseErrc::MALFORMED_LINE);
    CHECK(init_error("/x/${a}", 1, error) == ParseErrc::MALFORMED_LINE);
    CHECK(init_error("/x/${2}", 1, error) == ParseErrc::BACKREFERENCE_OUT_OF_RANGE);
  }
}

TEST_CASE("ReplacementTemplate expansion", "[uri_rewrite][replacement]")
{
  CHECK(expand("^/file/(.*)$", "/tmp/$1", "/file/my/document.txt") == "/tmp/my/document.txt");
  CHECK(expand("^/(a)(b)$", "/$2$1$2", "/ab") == "/bab");
  CHECK(expand("^/old/.*$", "[$0]", "/old/thing") == "[/old/thing]");
  CHECK(expand("^/v(\\d)/(.*)$", "/v${1}0/$2", "/v2/api") == "/v20/api");
  CHECK(expand("^/a$", "/b", "/a") == "/b");
  CHECK(expand("^/a$", "", "/a") == "");

  SECTION("group that did not participate expands to nothing")
  {
    CHECK(expand("^/p(x)?/(.*)$", "/q$1/$2", "/p/z") == "/q/z");
    CHECK(expand("^/p(x)?/(.*)$", "/q$1/$2", "/px/z") == "/qx/z");
  }

  SECTION("passthrough expands to the subject")
  {
    CHECK(expand("^/blocked/", "-", "/blocked/y") == "/blocked/y");
  }
}
