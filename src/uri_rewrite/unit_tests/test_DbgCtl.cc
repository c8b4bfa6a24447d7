/** @file

  Unit tests for the debug controls and the diagnostics output.

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

#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

#include "catch.hpp"

#include "uri_rewrite/DbgCtl.h"
#include "uri_rewrite/engine.h"

using namespace uri_rewrite;

namespace
{
class CaptureDebugInterface : public DebugInterface
{
public:
  struct Message {
    std::string tag;
    DiagsLevel  level;
    std::string text;
  };

  void
  print_va(const char *debug_tag, DiagsLevel diags_level, const SourceLocation *, const char *format_string,
           va_list ap) const override
  {
    char buf[1024];

    vsnprintf(buf, sizeof(buf), format_string, ap);

    std::lock_guard<std::mutex> lock(_mutex);
    _messages.push_back({debug_tag ? debug_tag : "", diags_level, buf});
  }

  std::vector<Message>
  messages() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _messages;
  }

  bool
  has(std::string_view tag, DiagsLevel level) const
  {
    for (auto const &m : messages()) {
      if (m.tag == tag && m.level == level) {
        return true;
      }
    }
    return false;
  }

private:
  mutable std::mutex           _mutex;
  mutable std::vector<Message> _messages;
};

// Install a capturing interface for the length of a test, and put the debug state back afterwards.
struct CaptureScope {
  CaptureDebugInterface capture;

  CaptureScope() { DebugInterface::set_instance(&capture); }

  ~CaptureScope()
  {
    DebugInterface::set_instance(nullptr);
    DbgCtl::update(false, "");
  }
};
} // namespace

TEST_CASE("DbgCtl", "[uri_rewrite][debug]")
{
  CaptureScope scope;
  DbgCtl       alpha{"uri_rewrite_test.alpha"};
  DbgCtl       beta{"other.beta"};

  SECTION("off by default")
  {
    CHECK_FALSE(DbgCtl::global_on());
    CHECK_FALSE(alpha.on());
    Dbg(alpha, "not printed");
    CHECK(scope.capture.messages().empty());
  }

  SECTION("tags are matched against the configured expression")
  {
    REQUIRE(DbgCtl::update(true, "^uri_rewrite_test"));
    CHECK(DbgCtl::global_on());
    CHECK(alpha.on());
    CHECK_FALSE(beta.on());

    Dbg(alpha, "hello %d", 42);
    Dbg(beta, "not printed");

    auto msgs = scope.capture.messages();

    REQUIRE(msgs.size() == 1);
    CHECK(msgs[0].tag == "uri_rewrite_test.alpha");
    CHECK(msgs[0].level == DL_Debug);
    CHECK(msgs[0].text == "hello 42");
  }

  SECTION("an empty expression matches every tag")
  {
    REQUIRE(DbgCtl::update(true, ""));
    CHECK(alpha.on());
    CHECK(beta.on());
  }

  SECTION("controls created later pick up the current tags")
  {
    REQUIRE(DbgCtl::update(true, "gamma"));

    DbgCtl gamma{"uri_rewrite_test.gamma"};

    CHECK(gamma.on());
    CHECK_FALSE(alpha.on());
  }

  SECTION("tags set while disabled")
  {
    REQUIRE(DbgCtl::update(false, "alpha"));
    CHECK(alpha.tag_on());
    CHECK_FALSE(alpha.on());
  }

  SECTION("a bad expression leaves the configuration alone")
  {
    REQUIRE(DbgCtl::update(true, "alpha"));
    CHECK_FALSE(DbgCtl::update(false, "("));
    CHECK(DbgCtl::global_on());
    CHECK(alpha.on());
    CHECK_FALSE(beta.on());
  }
}

TEST_CASE("Diagnostics from the engine", "[uri_rewrite][debug]")
{
  CaptureScope scope;

  SECTION("parse errors are reported as errors")
  {
    ParseError error;

    CHECK(Engine::from_rules("Rewrite /a /b [Q]\n", error) == nullptr);
    REQUIRE(scope.capture.has("", DL_Error));

    bool found = false;

    for (auto const &m : scope.capture.messages()) {
      if (m.level == DL_Error && m.text.find("line 1: ") != std::string::npos) {
        found = true;
        // The line number is given once
        CHECK(m.text.find("line 1: ", m.text.find("line 1: ") + 1) == std::string::npos);
      }
    }
    CHECK(found);
  }

  SECTION("evaluation debug output")
  {
    REQUIRE(DbgCtl::update(true, "^uri_rewrite\\.eval$"));

    ParseError error;
    auto       engine = Engine::from_rules("Rewrite ^/a$ /b [L]\n", error);

    REQUIRE(engine);
    // Only the evaluation tag is on, nothing from parsing
    CHECK_FALSE(scope.capture.has("uri_rewrite", DL_Debug));

    RewriteResult result;

    REQUIRE_FALSE(engine->rewrite("/a", result));
    CHECK(scope.capture.has("uri_rewrite.eval", DL_Debug));
  }

  SECTION("parse debug output")
  {
    REQUIRE(DbgCtl::update(true, "^uri_rewrite$"));

    ParseError error;

    REQUIRE(Engine::from_rules("Rewrite ^/a$ /b [L]\n", error));
    CHECK(scope.capture.has("uri_rewrite", DL_Debug));
    CHECK_FALSE(scope.capture.has("uri_rewrite.eval", DL_Debug));
  }
}

TEST_CASE("DebugInterface", "[uri_rewrite][debug]")
{
  CHECK(std::string(DebugInterface::level_name(DL_Error)) == "ERROR");
  CHECK(std::string(DebugInterface::level_name(DL_Debug)) == "DEBUG");
  CHECK(std::string(DebugInterface::level_name(DL_Undefined)) == "UNDEFINED");

  CaptureDebugInterface capture;

  DebugInterface::set_instance(&capture);
  CHECK(DebugInterface::get_instance() == &capture);
  DebugInterface::set_instance(nullptr);
  CHECK(DebugInterface::get_instance() != &capture);
  CHECK(DebugInterface::get_instance() != nullptr);
}
