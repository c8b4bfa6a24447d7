/** @file

  Helpers for reading the YAML configuration with good error reporting.

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

#include <string>
#include <string_view>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace uri_rewrite
{
namespace Yaml
{
  // Wrapper for a YAML::Node that is a map in the configuration. Every key of the map has to be looked at,
  // anything left over is a key we don't know about, and done() reports it.
  //
  class Map
  {
  public:
    // Throws YAML::ParserException if 'map' isn't a map. @a what names the map in that error.
    //
    Map(const YAML::Node &map, std::string_view what);

    // Get the node for a key, an undefined node if the key is not there.
    //
    YAML::Node operator[](std::string_view key);

    // If @a key is present, convert it into @a value and return true. Conversion failures throw
    // (YAML::TypedBadConversion), with the mark of the offending node.
    //
    template <typename T>
    bool
    get(std::string_view key, T &value)
    {
      YAML::Node n = (*this)[key];

      if (!n) {
        return false;
      }
      value = n.as<T>();
      return true;
    }

    // Call this after the last lookup. Throws a YAML::ParserException listing the keys that were never
    // looked up.
    //
    void done();

    // No copy/move.
    //
    Map(Map const &)            = delete;
    Map &operator=(Map const &) = delete;

  private:
    YAML::Node               _map;
    std::string              _what;
    std::vector<std::string> _used_key;
  };

} // end namespace Yaml
} // end namespace uri_rewrite
