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
// Library private helpers: debug controls, and the diagnostics macros.
//
#pragma once

#include <string_view>

#include "uri_rewrite/DbgCtl.h"

namespace uri_rewrite
{
extern const char LIB_NAME[];
extern const char LIB_NAME_EVAL[];

extern DbgCtl dbg_ctl;      // Parsing and configuration
extern DbgCtl eval_dbg_ctl; // Per request evaluation, noisy

// Trim leading and trailing whitespace (space, tab, CR, LF) from a view.
std::string_view trim(std::string_view s);

// Case insensitive comparison, for keywords and flag names.
bool iequals(std::string_view a, std::string_view b);

// True if @a s is well formed UTF-8 (no overlong forms, surrogates or code points above U+10FFFF).
bool valid_utf8(std::string_view s);
} // namespace uri_rewrite

#define DiagsError(LEVEL, ...) uri_rewrite::diags_message(LEVEL, __FILE__, __FUNCTION__, __LINE__, __VA_ARGS__)

#define Note(...)    DiagsError(uri_rewrite::DL_Note, __VA_ARGS__)    // Log significant information
#define Warning(...) DiagsError(uri_rewrite::DL_Warning, __VA_ARGS__) // Log concerning information
#define Error(...)   DiagsError(uri_rewrite::DL_Error, __VA_ARGS__)   // Log operational failure

