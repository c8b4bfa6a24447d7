/** @file

  Implementation file for YamlCfg.h.

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

#include "YamlCfg.h"

#include <algorithm>

namespace uri_rewrite
{
namespace Yaml
{
  Map::Map(const YAML::Node &map, std::string_view what) : _map{map}, _what{what}
  {
    if (!_map.IsMap()) {
      throw YAML::ParserException(_map.Mark(), "'" + _what + "' has to be a map");
    }
  }

  YAML::Node
  Map::operator[](std::string_view key)
  {
    std::string       k{key};
    YAML::Node const &cmap = _map; // Lookups on a const node don't add the key to the map
    auto              n    = cmap[k];

    if (n && std::find(_used_key.begin(), _used_key.end(), k) == _used_key.end()) {
      _used_key.push_back(std::move(k));
    }

    return n;
  }

  void
  Map::done()
  {
    if (_used_key.size() >= _map.size()) {
      return;
    }

    std::string msg{(_map.size() - _used_key.size()) > 1 ? "keys " : "key "};
    bool        first{true};

    for (auto const &kv : _map) {
      auto key = kv.first.as<std::string>();

      if (std::find(_used_key.begin(), _used_key.end(), key) == _used_key.end()) {
        if (!first) {
          msg += ", ";
        }
        first = false;
        msg += key;
      }
    }
    throw YAML::ParserException(_map.Mark(), msg + " invalid in '" + _what + "'");
  }

} // end namespace Yaml
} // end namespace uri_rewrite
