/** @file

  Engine configuration, loaded from YAML.

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

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "uri_rewrite/errors.h"

namespace uri_rewrite
{
/** Everything needed to build an Engine, besides the rules themselves.
 *
 * The YAML form is
 * @code
 *   uri_rewrite:
 *     rules_file: rewrite.rules
 *     max_uri_length: 8192
 *     match_limit: 100000
 *     depth_limit: 10000
 *     debug:
 *       enabled: true
 *       tags: uri_rewrite.*
 * @endcode
 * with @c rules (inline rule text) as the alternative to @c rules_file.
 */
struct EngineConfig {
  static constexpr size_t DEFAULT_MAX_URI_LENGTH = 65536;

  std::string rules;      ///< Inline rule text.
  std::string rules_file; ///< Path of the rule file, already resolved against the YAML file's directory.

  size_t   max_uri_length = DEFAULT_MAX_URI_LENGTH; ///< Longer input URIs are rejected.
  uint32_t match_limit    = 0;                      ///< PCRE2 match limit, 0 keeps the library default.
  uint32_t depth_limit    = 0;                      ///< PCRE2 depth limit, 0 keeps the library default.

  bool        has_debug     = false; ///< Was there a debug section at all?
  bool        debug_enabled = false;
  std::string debug_tags;

  /** Load the configuration from the YAML file at @a path.
   *
   * @return @c false, with @a error set to CONFIG_ERROR, if the file can't be read or is not a valid configuration.
   */
  bool load(const std::string &path, ParseError &error);

  /** Load the configuration from YAML text. A relative @c rules_file is taken relative to @a base_dir.
   */
  bool parse(std::string_view yaml_text, std::string_view base_dir, ParseError &error);

  /** Get the rule text, reading @c rules_file if that is where the rules are.
   */
  bool rules_text(std::string &text, ParseError &error) const;

  /** Push the debug section (if any) to DbgCtl.
   */
  bool apply_debug(ParseError &error) const;
};

} // namespace uri_rewrite
