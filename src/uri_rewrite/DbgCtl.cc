/** @file

  DbgCtl class, the tag registry and the default diagnostics output.

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

#include "uri_rewrite/DbgCtl.h"
#include "uri_rewrite/Regex.h"

#include <algorithm>
#include <cstdio>
#include <mutex>
#include <vector>

namespace uri_rewrite
{
namespace
{
  class StderrDebugInterface : public DebugInterface
  {
  public:
    void
    print_va(const char *debug_tag, DiagsLevel diags_level, const SourceLocation *loc, const char *format_string,
             va_list ap) const override
    {
      char buf[2048];

      vsnprintf(buf, sizeof(buf), format_string, ap);
      if (diags_level == DL_Debug && debug_tag) {
        if (loc && loc->file) {
          fprintf(stderr, "[uri_rewrite] %s: (%s) <%s:%d> %s\n", level_name(diags_level), debug_tag, loc->file, loc->line, buf);
        } else {
          fprintf(stderr, "[uri_rewrite] %s: (%s) %s\n", level_name(diags_level), debug_tag, buf);
        }
      } else {
        fprintf(stderr, "[uri_rewrite] %s: %s\n", level_name(diags_level), buf);
      }
    }
  };

  StderrDebugInterface          default_debug_interface;
  std::atomic<DebugInterface *> debug_interface{&default_debug_interface};

  const char *const level_names[] = {"DIAG", "DEBUG", "STATUS", "NOTE", "WARNING", "ERROR", "FATAL"};
} // namespace

DebugInterface *
DebugInterface::get_instance()
{
  return debug_interface.load(std::memory_order_acquire);
}

void
DebugInterface::set_instance(DebugInterface *di)
{
  debug_interface.store(di ? di : &default_debug_interface, std::memory_order_release);
}

const char *
DebugInterface::level_name(DiagsLevel dl)
{
  if (dl < DL_Diag || dl >= DL_Undefined) {
    return "UNDEFINED";
  }
  return level_names[dl];
}

//----------------------------------------------------------------------------
// The registry of all live DbgCtl instances, and the compiled expression their tags are checked against.
//
class DbgCtl::_RegistryAccessor
{
public:
  _RegistryAccessor() : _lock(data().mtx) {}

  void
  add(DbgCtl *ctl)
  {
    data().ctls.push_back(ctl);
    ctl->_tag_on.store(matches(ctl->_tag), std::memory_order_relaxed);
  }

  void
  remove(DbgCtl *ctl)
  {
    auto &ctls = data().ctls;

    ctls.erase(std::remove(ctls.begin(), ctls.end(), ctl), ctls.end());
  }

  void
  set_tags(Regex &&tags)
  {
    data().tags = std::move(tags);
    for (auto *ctl : data().ctls) {
      ctl->_tag_on.store(matches(ctl->_tag), std::memory_order_relaxed);
    }
  }

private:
  struct Data {
    std::mutex            mtx;
    std::vector<DbgCtl *> ctls;
    Regex                 tags; // An empty regex matches everything.
  };

  // Function-local, so DbgCtl instances at namespace scope in other translation units can register safely.
  static Data &
  data()
  {
    static Data d;
    return d;
  }

  bool
  matches(char const *tag) const
  {
    auto const &tags = data().tags;

    return tags.empty() || tags.exec(tag);
  }

  std::lock_guard<std::mutex> _lock;
};

std::atomic<bool> DbgCtl::_config_mode{false};

DbgCtl::DbgCtl(char const *tag) : _tag(tag)
{
  _RegistryAccessor ra;

  ra.add(this);
}

DbgCtl::~DbgCtl()
{
  _RegistryAccessor ra;

  ra.remove(this);
}

bool
DbgCtl::update(bool enabled, std::string_view tags)
{
  Regex re;

  if (!tags.empty() && !re.compile(tags)) {
    return false;
  }

  {
    _RegistryAccessor ra;

    ra.set_tags(std::move(re));
  }
  _config_mode.store(enabled, std::memory_order_relaxed);

  return true;
}

void
DbgCtl::print(char const *tag, char const *file, char const *function, int line, char const *fmt_str, ...)
{
  SourceLocation loc{file, function, line};
  va_list        args;

  va_start(args, fmt_str);
  DebugInterface::get_instance()->print_va(tag, DL_Debug, &loc, fmt_str, args);
  va_end(args);
}

void
diags_message(DiagsLevel level, char const *file, char const *function, int line, char const *fmt_str, ...)
{
  SourceLocation loc{file, function, line};
  va_list        args;

  va_start(args, fmt_str);
  DebugInterface::get_instance()->print_va(nullptr, level, &loc, fmt_str, args);
  va_end(args);
}

} // namespace uri_rewrite
