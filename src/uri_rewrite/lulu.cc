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

#include <cctype>
#include <cstdint>

#include "lulu.h"

namespace uri_rewrite
{
const char LIB_NAME[]      = "uri_rewrite";
const char LIB_NAME_EVAL[] = "uri_rewrite.eval";

DbgCtl dbg_ctl{LIB_NAME};
DbgCtl eval_dbg_ctl{LIB_NAME_EVAL};

std::string_view
trim(std::string_view s)
{
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
    s.remove_suffix(1);
  }

  return s;
}

bool
iequals(std::string_view a, std::string_view b)
{
  if (a.size() != b.size()) {
    return false;
  }

  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }

  return true;
}

bool
valid_utf8(std::string_view s)
{
  static constexpr uint32_t min_code_point[] = {0, 0, 0x80, 0x800, 0x10000};
  size_t                    i                = 0;

  while (i < s.size()) {
    unsigned char c = s[i];
    size_t        len;
    uint32_t      cp;

    if (c < 0x80) {
      ++i;
      continue;
    } else if ((c & 0xe0) == 0xc0) {
      len = 2;
      cp  = c & 0x1f;
    } else if ((c & 0xf0) == 0xe0) {
      len = 3;
      cp  = c & 0x0f;
    } else if ((c & 0xf8) == 0xf0) {
      len = 4;
      cp  = c & 0x07;
    } else {
      return false; // Stray continuation byte, or 0xf8 and up
    }

    if (i + len > s.size()) {
      return false;
    }
    for (size_t j = 1; j < len; ++j) {
      unsigned char cc = s[i + j];

      if ((cc & 0xc0) != 0x80) {
        return false;
      }
      cp = (cp << 6) | (cc & 0x3f);
    }
    if (cp < min_code_point[len] || cp > 0x10ffff || (cp >= 0xd800 && cp <= 0xdfff)) {
      return false;
    }
    i += len;
  }

  return true;
}

} // namespace uri_rewrite
