/** @file

  Loading the engine configuration from YAML.

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

#include "uri_rewrite/config.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

#include <yaml-cpp/yaml.h>

#include "uri_rewrite/Regex.h"
#include "YamlCfg.h"
#include "lulu.h"

namespace uri_rewrite
{
namespace
{
#define TSDECL(id) constexpr char TS_##id[] = #id
  TSDECL(uri_rewrite);
  TSDECL(rules);
  TSDECL(rules_file);
  TSDECL(max_uri_length);
  TSDECL(match_limit);
  TSDECL(depth_limit);
  TSDECL(debug);
  TSDECL(enabled);
  TSDECL(tags);
#undef TSDECL

  namespace fs = std::filesystem;

  // Read an integer in [min, max]. Values are read signed, so a negative number is reported as out of range
  // rather than wrapping around.
  template <typename T>
  bool
  get_bounded(Yaml::Map &map, const char *key, T &value, int64_t min, int64_t max)
  {
    int64_t n = 0;

    if (!map.get(key, n)) {
      return false;
    }
    if (n < min || n > max) {
      throw YAML::ParserException(map[key].Mark(), std::string("'") + key + "' has to be between " + std::to_string(min) +
                                                     " and " + std::to_string(max));
    }
    value = static_cast<T>(n);
    return true;
  }

  // Fill in @a cfg from the top level node. Throws on anything that is not a valid configuration.
  void
  load_node(EngineConfig &cfg, const YAML::Node &root, const fs::path &base_dir)
  {
    if (!root || root.IsNull()) {
      throw YAML::ParserException(YAML::Mark::null_mark(), "configuration is empty");
    }

    Yaml::Map  top(root, "top level");
    YAML::Node node = top[TS_uri_rewrite];

    if (!node) {
      throw YAML::ParserException(root.Mark(), std::string("expected a toplevel '") + TS_uri_rewrite + "' node");
    }
    top.done();

    Yaml::Map m(node, TS_uri_rewrite);
    bool      has_rules = m.get(TS_rules, cfg.rules);
    bool      has_file  = m.get(TS_rules_file, cfg.rules_file);

    if (has_rules == has_file) {
      throw YAML::ParserException(node.Mark(), std::string("exactly one of '") + TS_rules + "' and '" + TS_rules_file +
                                                 "' has to be given");
    }

    if (has_file) {
      fs::path p{cfg.rules_file};

      if (p.empty()) {
        throw YAML::ParserException(m[TS_rules_file].Mark(), std::string("'") + TS_rules_file + "' is empty");
      }
      if (p.is_relative() && !base_dir.empty()) {
        cfg.rules_file = (base_dir / p).string();
      }
    }

    get_bounded(m, TS_max_uri_length, cfg.max_uri_length, 1, std::numeric_limits<int64_t>::max());
    get_bounded(m, TS_match_limit, cfg.match_limit, 0, std::numeric_limits<uint32_t>::max());
    get_bounded(m, TS_depth_limit, cfg.depth_limit, 0, std::numeric_limits<uint32_t>::max());

    if (YAML::Node debug = m[TS_debug]; debug) {
      Yaml::Map dm(debug, TS_debug);

      cfg.has_debug = true;
      dm.get(TS_enabled, cfg.debug_enabled);
      if (dm.get(TS_tags, cfg.debug_tags) && !cfg.debug_tags.empty()) {
        Regex check;

        if (!check.compile(cfg.debug_tags)) {
          throw YAML::ParserException(dm[TS_tags].Mark(), "debug tags '" + cfg.debug_tags + "' is not a valid regular expression");
        }
      }
      dm.done();
    }

    m.done();
  }
} // namespace

bool
EngineConfig::parse(std::string_view yaml_text, std::string_view base_dir, ParseError &error)
{
  *this = EngineConfig{};

  try {
    YAML::Node root = YAML::Load(std::string(yaml_text));

    load_node(*this, root, fs::path{base_dir});
  } catch (std::exception &ex) {
    error.set(ParseErrc::CONFIG_ERROR, std::string("invalid configuration: ") + ex.what());
    return false;
  }

  Dbg(dbg_ctl, "Loaded configuration, rules from %s, max_uri_length=%zu match_limit=%u depth_limit=%u",
      rules_file.empty() ? "inline text" : rules_file.c_str(), max_uri_length, match_limit, depth_limit);

  return true;
}

bool
EngineConfig::load(const std::string &path, ParseError &error)
{
  *this = EngineConfig{};

  try {
    YAML::Node root = YAML::LoadFile(path);

    load_node(*this, root, fs::path{path}.parent_path());
  } catch (std::exception &ex) {
    error.set(ParseErrc::CONFIG_ERROR, "failed to load " + path + ": " + ex.what());
    return false;
  }

  Dbg(dbg_ctl, "Loaded configuration file %s", path.c_str());

  return true;
}

bool
EngineConfig::rules_text(std::string &text, ParseError &error) const
{
  if (rules_file.empty()) {
    text = rules;
    return true;
  }

  std::ifstream f(rules_file);

  if (!f.is_open()) {
    error.set(ParseErrc::CONFIG_ERROR, "unable to open rules file " + rules_file);
    return false;
  }

  std::ostringstream buf;

  buf << f.rdbuf();
  if (f.bad()) {
    error.set(ParseErrc::CONFIG_ERROR, "error reading rules file " + rules_file);
    return false;
  }
  text = buf.str();

  Dbg(dbg_ctl, "Read %zu bytes of rules from %s", text.size(), rules_file.c_str());

  return true;
}

bool
EngineConfig::apply_debug(ParseError &error) const
{
  if (!has_debug) {
    return true;
  }

  if (!DbgCtl::update(debug_enabled, debug_tags)) {
    error.set(ParseErrc::CONFIG_ERROR, "debug tags '" + debug_tags + "' is not a valid regular expression");
    return false;
  }

  return true;
}

} // namespace uri_rewrite
