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
// engine.cc: building the rule set, and the rewrite loop.
//
//
#include <algorithm>
#include <ostream>

#include "uri_rewrite/engine.h"
#include "uri_rewrite/parser.h"
#include "lulu.h"

namespace uri_rewrite
{
namespace
{
  // True if @a uri is well formed UTF-8, without any ASCII control characters.
  bool
  valid_input(std::string_view uri)
  {
    for (unsigned char c : uri) {
      if (c < 0x20 || c == 0x7f) {
        return false;
      }
    }

    return valid_utf8(uri);
  }
} // namespace

const char *
RewriteResult::type_name(Type t)
{
  switch (t) {
  case UNCHANGED:
    return "UNCHANGED";
  case REWRITTEN:
    return "REWRITTEN";
  case REDIRECTED:
    return "REDIRECTED";
  case FORBIDDEN:
    return "FORBIDDEN";
  }

  return "UNKNOWN";
}

std::string
RewriteResult::to_string() const
{
  switch (_type) {
  case REWRITTEN:
    return std::string(type_name(_type)) + "(" + _uri + ")";
  case REDIRECTED:
    return std::string(type_name(_type)) + "(" + std::to_string(_status) + ", " + _uri + ")";
  default:
    return type_name(_type);
  }
}

std::ostream &
operator<<(std::ostream &os, const RewriteResult &result)
{
  return os << result.to_string();
}

std::unique_ptr<Engine>
Engine::from_rules(std::string_view text, ParseError &error)
{
  std::unique_ptr<Engine> engine(new Engine());

  if (!engine->parse_rules(text, error)) {
    return nullptr;
  }

  return engine;
}

std::unique_ptr<Engine>
Engine::from_config(const EngineConfig &config, ParseError &error)
{
  std::string text;

  error.clear();
  if (!config.apply_debug(error) || !config.rules_text(text, error)) {
    Error("Error loading rewrite rules: %s", error.to_string().c_str());
    return nullptr;
  }

  std::unique_ptr<Engine> engine(new Engine());

  engine->set_limits(config);
  if (!engine->parse_rules(text, error)) {
    return nullptr;
  }

  if (engine->size() == 0) {
    Warning("No rewrite rules in %s, every URI will be left unchanged",
            config.rules_file.empty() ? "the inline rules" : config.rules_file.c_str());
  } else {
    Note("Loaded %zu rewrite rule(s) from %s", engine->size(),
         config.rules_file.empty() ? "the inline rules" : config.rules_file.c_str());
  }

  return engine;
}

void
Engine::set_limits(const EngineConfig &config)
{
  _max_uri_length = config.max_uri_length;

  if (config.match_limit > 0) {
    _match_context.setMatchLimit(config.match_limit);
    _has_match_context = true;
  }
  if (config.depth_limit > 0) {
    _match_context.setDepthLimit(config.depth_limit);
    _has_match_context = true;
  }
}

///////////////////////////////////////////////////////////////////////////////
// Rule parser, one rule per line. The first bad line fails the whole rule set,
// there is never a partially built engine.
//
bool
Engine::parse_rules(std::string_view text, ParseError &error)
{
  size_t pos    = 0;
  int    lineno = 0;

  error.clear();
  _rules.clear();
  _max_captures = 0;

  Dbg(dbg_ctl, "Parsing started, %zu bytes of rules", text.size());

  while (pos < text.size()) {
    size_t           eol  = text.find('\n', pos);
    std::string_view line = text.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);

    pos = (eol == std::string_view::npos) ? text.size() : eol + 1;
    ++lineno;
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }

    Dbg(dbg_ctl, "Reading line: %d: %.*s", lineno, static_cast<int>(line.size()), line.data());

    Parser p;
    Rule   rule;

    if (!p.parse_line(line, error) || (!p.empty() && !rule.initialize(p, lineno, trim(line), error))) {
      error.lineno = lineno;
      error.line.assign(line.data(), line.size());
      Error("Error parsing rewrite rules: %s", error.to_string().c_str());
      _rules.clear();
      return false;
    }

    if (p.empty()) {
      continue;
    }

    _max_captures = std::max(_max_captures, rule.capture_count());
    _rules.push_back(std::move(rule));
  }

  Dbg(dbg_ctl, "Parsing done, %zu rule(s) loaded", _rules.size());

  return true;
}

///////////////////////////////////////////////////////////////////////////////
// The rewrite loop. Rules are tried in order against the working URI; on each match
// F stops with FORBIDDEN, R stops with a redirect to the substitution, L stops with
// the substitution. Without any of those the substitution becomes the new working URI.
//
std::error_code
Engine::rewrite(std::string_view uri, RewriteResult &result) const
{
  if (uri.size() > _max_uri_length) {
    Dbg(eval_dbg_ctl, "URI of %zu bytes is longer than the maximum of %zu", uri.size(), _max_uri_length);
    return make_error_code(RewriteErrc::INVALID_INPUT);
  }
  if (!valid_input(uri)) {
    Dbg(eval_dbg_ctl, "URI contains control characters, or is not valid UTF-8");
    return make_error_code(RewriteErrc::INVALID_INPUT);
  }

  const RegexMatchContext *ctx = _has_match_context ? &_match_context : nullptr;
  RegexMatches             matches(_max_captures + 1);
  std::string              working(uri);

  for (const auto &rule : _rules) {
    int rc = rule.match(working, matches, ctx);

    if (rc == RE_ERROR_NOMATCH) {
      continue;
    } else if (rc < 0) {
      if (re_error_is_limit(rc)) {
        Dbg(eval_dbg_ctl, "Rule at line %d hit the match limits on '%s'", rule.lineno(), working.c_str());
        return make_error_code(RewriteErrc::MATCH_LIMIT_EXCEEDED);
      }
      Dbg(eval_dbg_ctl, "Rule at line %d failed on '%s': %s", rule.lineno(), working.c_str(), Regex::error_message(rc).c_str());
      return make_error_code(RewriteErrc::INVALID_INPUT);
    }

    const RuleFlags &flags = rule.flags();

    if (flags.forbidden()) {
      Dbg(eval_dbg_ctl, "Rule at line %d matched '%s', forbidden", rule.lineno(), working.c_str());
      result = RewriteResult::forbidden();
      return {};
    }

    working = rule.substitute(matches, working);
    Dbg(eval_dbg_ctl, "Rule at line %d matched, working URI is now '%s'", rule.lineno(), working.c_str());

    if (flags.redirect()) {
      result = RewriteResult::redirected(flags.redirect_status(), std::move(working));
      return {};
    }
    if (flags.last()) {
      break;
    }
  }

  result = (working == uri) ? RewriteResult::unchanged() : RewriteResult::rewritten(std::move(working));

  return {};
}

} // namespace uri_rewrite
