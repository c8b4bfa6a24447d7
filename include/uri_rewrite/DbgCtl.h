/** @file

  DbgCtl class header file, plus the diagnostics sink all engine output goes through.

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

#include <atomic>
#include <cstdarg>
#include <string_view>

#if defined(__GNUC__) || defined(__clang__)
#define URI_REWRITE_PRINTFLIKE(fmt, arg) __attribute__((format(printf, fmt, arg)))
#else
#define URI_REWRITE_PRINTFLIKE(fmt, arg)
#endif

namespace uri_rewrite
{
// This is treated as an index into the level names, so keep the order.
enum DiagsLevel {
  DL_Diag = 0, // process does not die
  DL_Debug,    // process does not die
  DL_Status,   // process does not die
  DL_Note,     // process does not die
  DL_Warning,  // process does not die
  DL_Error,    // process does not die
  DL_Fatal,    // causes process termination in a host that honors it
  DL_Undefined // must be last, used as a sentinel
};

struct SourceLocation {
  const char *file = nullptr;
  const char *func = nullptr;
  int         line = 0;
};

// Everything the engine prints ends up in the current instance of this interface. The default instance writes
// to stderr; a host installs its own to route the output into its logs.
//
class DebugInterface
{
public:
  virtual ~DebugInterface() = default;
  virtual void print_va(const char *debug_tag, DiagsLevel diags_level, const SourceLocation *loc, const char *format_string,
                        va_list ap) const = 0;

  static DebugInterface *get_instance();

  // Passing nullptr restores the default (stderr) instance. The caller keeps ownership of @a di, which must
  // outlive its use as the instance.
  static void set_instance(DebugInterface *di);

  static const char *level_name(DiagsLevel dl);
};

class DbgCtl
{
public:
  // Tag is a debug tag.  Debug output associated with this control will be output when debug output
  // is enabled globally, and the tag matches the configured debug tag regular expression.
  //
  explicit DbgCtl(char const *tag);

  ~DbgCtl();

  // No copying, no moving, the registry holds on to our address.
  //
  DbgCtl(DbgCtl const &)            = delete;
  DbgCtl &operator=(DbgCtl const &) = delete;

  bool
  tag_on() const
  {
    return _tag_on.load(std::memory_order_relaxed);
  }

  char const *
  tag() const
  {
    return _tag;
  }

  bool
  on() const
  {
    return global_on() && tag_on();
  }

  static bool
  global_on()
  {
    return _config_mode.load(std::memory_order_relaxed);
  }

  // Enable or disable debug output, and set the regular expression that tags must match. An empty
  // @a tags expression matches every tag. Returns false (and leaves the configuration alone) if
  // @a tags does not compile.
  //
  static bool update(bool enabled, std::string_view tags);

  // For use in DbgPrint() only.
  //
  static void print(char const *tag, char const *file, char const *function, int line, char const *fmt_str, ...)
    URI_REWRITE_PRINTFLIKE(5, 6);

private:
  char const *const _tag;
  std::atomic<bool> _tag_on{false};

  class _RegistryAccessor;

  static std::atomic<bool> _config_mode;
};

// Unconditional diagnostics at the given level (Note, Warning, Error ...), routed through DebugInterface.
//
void diags_message(DiagsLevel level, char const *file, char const *function, int line, char const *fmt_str, ...)
  URI_REWRITE_PRINTFLIKE(5, 6);

} // namespace uri_rewrite

// Always generates output when called.
//
#define DbgPrint(CTL, ...) (uri_rewrite::DbgCtl::print((CTL).tag(), __FILE__, __FUNCTION__, __LINE__, __VA_ARGS__))

#define Dbg(CTL, ...)               \
  do {                              \
    if ((CTL).on()) {               \
      DbgPrint((CTL), __VA_ARGS__); \
    }                               \
  } while (false)
