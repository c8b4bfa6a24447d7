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
// The rewrite engine, an ordered set of rules evaluated against one URI at a time.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "uri_rewrite/Regex.h"
#include "uri_rewrite/config.h"
#include "uri_rewrite/errors.h"
#include "uri_rewrite/rule.h"

namespace uri_rewrite
{
///////////////////////////////////////////////////////////////////////////////
// The outcome of one rewrite() call. The host maps this to what it does with the request:
// internal rewrite, a 3xx redirect, a 403, or nothing at all.
//
class RewriteResult
{
public:
  enum Type {
    UNCHANGED,  // No rule changed the URI
    REWRITTEN,  // uri() is the new URI
    REDIRECTED, // Redirect to uri() with status()
    FORBIDDEN,  // Block the request
  };

  RewriteResult() = default;

  static RewriteResult
  unchanged()
  {
    return RewriteResult();
  }

  static RewriteResult
  rewritten(std::string uri)
  {
    return RewriteResult(REWRITTEN, std::move(uri), 0);
  }

  static RewriteResult
  redirected(uint16_t status, std::string location)
  {
    return RewriteResult(REDIRECTED, std::move(location), status);
  }

  static RewriteResult
  forbidden()
  {
    return RewriteResult(FORBIDDEN, std::string(), 0);
  }

  Type
  type() const
  {
    return _type;
  }

  // The rewritten URI, or the redirect location. Empty otherwise.
  const std::string &
  uri() const
  {
    return _uri;
  }

  // Redirect status, 0 unless REDIRECTED.
  uint16_t
  status() const
  {
    return _status;
  }

  bool operator==(const RewriteResult &) const = default;

  std::string to_string() const;

  static const char *type_name(Type t);

private:
  RewriteResult(Type type, std::string uri, uint16_t status) : _type(type), _uri(std::move(uri)), _status(status) {}

  Type        _type   = UNCHANGED;
  std::string _uri;
  uint16_t    _status = 0;
};

std::ostream &operator<<(std::ostream &os, const RewriteResult &result);

///////////////////////////////////////////////////////////////////////////////
// The engine. Once built it never changes, so a single instance can serve any number of threads
// without locking. To change the rules, build a new Engine and swap it in.
//
class Engine
{
public:
  // noncopyable
  Engine(const Engine &)         = delete;
  void operator=(const Engine &) = delete;

  // Build an engine from rule text. Returns nullptr, with @a error describing the first bad line, if
  // any line fails to parse.
  static std::unique_ptr<Engine> from_rules(std::string_view text, ParseError &error);

  // Build an engine from a loaded configuration: the rules (inline or from the rules file), the input
  // and match limits, and the debug settings.
  static std::unique_ptr<Engine> from_config(const EngineConfig &config, ParseError &error);

  // Rewrite @a uri. On success the returned code is empty and @a result holds the outcome; otherwise
  // it is one of the RewriteErrc codes and @a result is left alone.
  std::error_code rewrite(std::string_view uri, RewriteResult &result) const;

  size_t
  size() const
  {
    return _rules.size();
  }

  const Rule &
  rule(size_t ix) const
  {
    return _rules.at(ix);
  }

  size_t
  max_uri_length() const
  {
    return _max_uri_length;
  }

private:
  Engine() = default;

  bool parse_rules(std::string_view text, ParseError &error);
  void set_limits(const EngineConfig &config);

  std::vector<Rule> _rules;
  RegexMatchContext _match_context;
  bool              _has_match_context = false;
  size_t            _max_uri_length    = EngineConfig::DEFAULT_MAX_URI_LENGTH;
  int               _max_captures      = 0;
};

} // namespace uri_rewrite
