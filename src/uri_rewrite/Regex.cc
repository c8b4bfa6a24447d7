/** @file

  PCRE2 wrapper used to compile and match rewrite rule patterns.

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

#include "uri_rewrite/Regex.h"

#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>

#include <utility>

static_assert(uri_rewrite::RE_CASE_INSENSITIVE == PCRE2_CASELESS, "Update RE_CASE_INSENSITIVE for current PCRE2 version.");
static_assert(uri_rewrite::RE_UTF == PCRE2_UTF, "Update RE_UTF for current PCRE2 version.");
static_assert(uri_rewrite::RE_NEVER_BACKSLASH_C == PCRE2_NEVER_BACKSLASH_C,
              "Update RE_NEVER_BACKSLASH_C for current PCRE2 version.");

static_assert(uri_rewrite::RE_ERROR_NOMATCH == PCRE2_ERROR_NOMATCH, "Update RE_ERROR_NOMATCH for current PCRE2 version.");
static_assert(uri_rewrite::RE_ERROR_MATCHLIMIT == PCRE2_ERROR_MATCHLIMIT, "Update RE_ERROR_MATCHLIMIT for current PCRE2 version.");
static_assert(uri_rewrite::RE_ERROR_NULL == PCRE2_ERROR_NULL, "Update RE_ERROR_NULL for current PCRE2 version.");
static_assert(uri_rewrite::RE_ERROR_DEPTHLIMIT == PCRE2_ERROR_DEPTHLIMIT, "Update RE_ERROR_DEPTHLIMIT for current PCRE2 version.");
static_assert(uri_rewrite::RE_ERROR_HEAPLIMIT == PCRE2_ERROR_HEAPLIMIT, "Update RE_ERROR_HEAPLIMIT for current PCRE2 version.");

namespace uri_rewrite
{
//----------------------------------------------------------------------------
struct RegexMatches::_MatchData {
  static pcre2_match_data *
  get(_MatchDataPtr const &p)
  {
    return static_cast<pcre2_match_data *>(p._ptr);
  }
  static void
  set(_MatchDataPtr &p, pcre2_match_data *ptr)
  {
    p._ptr = ptr;
  }
};

RegexMatches::RegexMatches(uint32_t size)
{
  _MatchData::set(_match_data, pcre2_match_data_create(size, nullptr));
}

RegexMatches::~RegexMatches()
{
  auto *md = _MatchData::get(_match_data);
  if (md != nullptr) {
    pcre2_match_data_free(md);
  }
}

std::string_view
RegexMatches::operator[](size_t index) const
{
  if (!matched(index)) {
    return {};
  }

  PCRE2_SIZE *ovector = pcre2_get_ovector_pointer(_MatchData::get(_match_data));

  return _subject.substr(ovector[2 * index], ovector[2 * index + 1] - ovector[2 * index]);
}

bool
RegexMatches::matched(size_t index) const
{
  // Groups past the highest set group are left untouched by pcre2_match(), so don't trust the ovector for those.
  if (_size <= 0 || index >= static_cast<size_t>(_size)) {
    return false;
  }

  PCRE2_SIZE *ovector = pcre2_get_ovector_pointer(_MatchData::get(_match_data));

  return ovector[2 * index] != PCRE2_UNSET;
}

int32_t
RegexMatches::size() const
{
  return _size;
}

//----------------------------------------------------------------------------
struct RegexMatchContext::_MatchContext {
  static pcre2_match_context *
  get(_MatchContextPtr const &p)
  {
    return static_cast<pcre2_match_context *>(p._ptr);
  }
  static void
  set(_MatchContextPtr &p, pcre2_match_context *ptr)
  {
    p._ptr = ptr;
  }
};

RegexMatchContext::RegexMatchContext()
{
  _MatchContext::set(_match_context, pcre2_match_context_create(nullptr));
}

RegexMatchContext::~RegexMatchContext()
{
  if (_MatchContext::get(_match_context) != nullptr) {
    pcre2_match_context_free(_MatchContext::get(_match_context));
  }
}

void
RegexMatchContext::setMatchLimit(uint32_t limit)
{
  pcre2_set_match_limit(_MatchContext::get(_match_context), limit);
}

void
RegexMatchContext::setDepthLimit(uint32_t limit)
{
  pcre2_set_depth_limit(_MatchContext::get(_match_context), limit);
}

//----------------------------------------------------------------------------
struct Regex::_Code {
  static pcre2_code *
  get(_CodePtr const &p)
  {
    return static_cast<pcre2_code *>(p._ptr);
  }
  static void
  set(_CodePtr &p, pcre2_code *ptr)
  {
    p._ptr = ptr;
  }
};

Regex::Regex(Regex const &other) : _pattern(other._pattern)
{
  if (!other.empty()) {
    _Code::set(_code, pcre2_code_copy(_Code::get(other._code)));
  }
}

Regex &
Regex::operator=(Regex const &other)
{
  if (&other == this) {
    return *this;
  }

  if (!empty()) {
    pcre2_code_free(_Code::get(_code));
    _Code::set(_code, nullptr);
  }
  if (!other.empty()) {
    _Code::set(_code, pcre2_code_copy(_Code::get(other._code)));
  }
  _pattern = other._pattern;

  return *this;
}

Regex::Regex(Regex &&that) noexcept : _pattern(std::move(that._pattern))
{
  _Code::set(_code, _Code::get(that._code));
  _Code::set(that._code, nullptr);
}

Regex &
Regex::operator=(Regex &&other) noexcept
{
  if (&other != this) {
    pcre2_code *tmp = _Code::get(_code);

    _Code::set(_code, _Code::get(other._code));
    _Code::set(other._code, tmp);
    std::swap(_pattern, other._pattern);
  }
  return *this;
}

Regex::~Regex()
{
  if (!empty()) {
    pcre2_code_free(_Code::get(_code));
  }
}

bool
Regex::compile(std::string_view pattern, uint32_t flags)
{
  std::string error;
  int         erroffset;

  return this->compile(pattern, error, erroffset, flags);
}

bool
Regex::compile(std::string_view pattern, std::string &error, int &erroffset, uint32_t flags)
{
  if (!empty()) {
    error     = "regex already compiled";
    erroffset = 0;
    return false;
  }

  int         errorcode = 0;
  PCRE2_SIZE  error_off = 0;
  pcre2_code *code =
    pcre2_compile(reinterpret_cast<PCRE2_SPTR>(pattern.data()), pattern.size(), flags, &errorcode, &error_off, nullptr);

  if (code == nullptr) {
    error     = error_message(errorcode);
    erroffset = static_cast<int>(error_off);
    return false;
  }

  _Code::set(_code, code);
  _pattern.assign(pattern.data(), pattern.size());

  return true;
}

bool
Regex::exec(std::string_view subject) const
{
  if (empty()) {
    return false;
  }

  RegexMatches matches(1);

  // A result of 0 means the match succeeded but there was no room for the groups.
  return this->exec(subject, matches) >= 0;
}

int
Regex::exec(std::string_view subject, RegexMatches &matches) const
{
  return this->exec(subject, matches, 0, nullptr);
}

int
Regex::exec(std::string_view subject, RegexMatches &matches, uint32_t flags, RegexMatchContext const *const matchContext) const
{
  matches._size = 0;

  if (empty() || RegexMatches::_MatchData::get(matches._match_data) == nullptr) {
    return RE_ERROR_NULL;
  }

  // Older PCRE2 releases reject a null subject even when it is empty.
  if (subject.data() == nullptr) {
    subject = std::string_view("", 0);
  }

  pcre2_match_context *ctx = nullptr;
  if (matchContext != nullptr) {
    ctx = RegexMatchContext::_MatchContext::get(matchContext->_match_context);
  }

  int count = pcre2_match(_Code::get(_code), reinterpret_cast<PCRE2_SPTR>(subject.data()), subject.size(), 0, flags,
                          RegexMatches::_MatchData::get(matches._match_data), ctx);

  if (count >= 0) {
    matches._subject = subject;
    matches._size    = count;
  }

  return count;
}

int
Regex::get_capture_count() const
{
  uint32_t captures = 0;

  if (empty() || pcre2_pattern_info(_Code::get(_code), PCRE2_INFO_CAPTURECOUNT, &captures) != 0) {
    return -1;
  }

  return static_cast<int>(captures);
}

bool
Regex::empty() const
{
  return _Code::get(_code) == nullptr;
}

std::string
Regex::error_message(int errorcode)
{
  PCRE2_UCHAR buffer[256];
  int         len = pcre2_get_error_message(errorcode, buffer, sizeof(buffer));

  if (len < 0) {
    return "unknown PCRE2 error " + std::to_string(errorcode);
  }

  return {reinterpret_cast<char const *>(buffer), static_cast<size_t>(len)};
}

} // namespace uri_rewrite
