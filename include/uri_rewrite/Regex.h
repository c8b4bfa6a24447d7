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

#pragma once

#include <cstdint>
#include <string_view>
#include <string>

namespace uri_rewrite
{
/// @brief Compile and match flags for regular expression evaluation.
///
/// @internal These values are copied from pcre2.h, to avoid having to include it.  The values are checked (with
/// static_assert) in Regex.cc against PCRE2 named constants, in case they change in future PCRE2 releases.
enum REFlags {
  RE_CASE_INSENSITIVE  = 0x00000008u, ///< Ignore case (by default, matches are case sensitive).
  RE_UTF               = 0x00080000u, ///< Treat pattern and subjects as UTF-8.
  RE_NEVER_BACKSLASH_C = 0x00100000u  ///< Reject \C in the pattern, it can split a UTF-8 character.
};

/// @brief Error codes returned by regular expression operations.
///
/// @internal As with REFlags, these values are copied from pcre2.h, to avoid having to include it.
enum REErrors {
  RE_ERROR_NOMATCH    = -1,  ///< No match found.
  RE_ERROR_MATCHLIMIT = -47, ///< Match limit exceeded.
  RE_ERROR_NULL       = -51, ///< NULL code or subject was passed.
  RE_ERROR_DEPTHLIMIT = -53, ///< Nested backtracking depth limit exceeded.
  RE_ERROR_HEAPLIMIT  = -63  ///< Backtracking heap limit exceeded.
};

/// @return @c true if @a rc is one of the resource limit errors.
inline bool
re_error_is_limit(int rc)
{
  return rc == RE_ERROR_MATCHLIMIT || rc == RE_ERROR_DEPTHLIMIT || rc == RE_ERROR_HEAPLIMIT;
}

/// @brief Wrapper for PCRE2 match data.
class RegexMatches
{
  friend class Regex;

public:
  /** Construct a new RegexMatches object.
   *
   * @param size The number of capture groups (including group 0) to allocate space for.
   */
  explicit RegexMatches(uint32_t size = DEFAULT_MATCHES);
  ~RegexMatches();

  // noncopyable
  RegexMatches(const RegexMatches &)            = delete;
  RegexMatches &operator=(const RegexMatches &) = delete;

  /** Get the match at the given index.
   *
   * @return The match at the given index, empty if the group did not participate in the match.
   */
  std::string_view operator[](size_t index) const;

  /// @return @c true if group @a index participated in the last match.
  bool matched(size_t index) const;

  /// @return The value returned by the last successful match, the highest set group + 1.
  int32_t size() const;

private:
  constexpr static uint32_t DEFAULT_MATCHES = 10;

  std::string_view _subject;
  int32_t          _size = 0;

  /// @internal This effectively wraps a void* so that we can avoid requiring the pcre2.h include for the user of the Regex
  /// API (see Regex.cc).
  struct _MatchData;
  class _MatchDataPtr
  {
    friend struct _MatchData;

  private:
    void *_ptr = nullptr;
  };
  _MatchDataPtr _match_data;
};

/// @brief Wrapper for PCRE2 match context
class RegexMatchContext
{
  friend class Regex;

public:
  RegexMatchContext();
  ~RegexMatchContext();

  // noncopyable
  RegexMatchContext(RegexMatchContext const &)            = delete;
  RegexMatchContext &operator=(RegexMatchContext const &) = delete;

  /** Limits the amount of backtracking that can take place.
   */
  void setMatchLimit(uint32_t limit);

  /** Limits the depth of nested backtracking.
   */
  void setDepthLimit(uint32_t limit);

private:
  /// @internal This wraps a void* so to avoid requiring a pcre2 include.
  struct _MatchContext;
  struct _MatchContextPtr {
    void *_ptr = nullptr;
  };

  _MatchContextPtr _match_context;
};

/// @brief Wrapper for PCRE2 regular expression.
class Regex
{
public:
  Regex() = default;
  /** Deep copy constructor.
   *
   * Uses pcre2_code_copy() to duplicate the compiled pattern.
   */
  Regex(Regex const &other);
  Regex &operator=(Regex const &other);
  Regex(Regex &&that) noexcept;
  Regex &operator=(Regex &&other) noexcept;
  ~Regex();

  /** Compile the @a pattern into a regular expression.
   *
   * @param pattern Source pattern for regular expression.
   * @param flags Compilation flags.
   * @return @a true if compiled successfully, @a false otherwise.
   *
   * @a flags should be the bitwise @c or of @c REFlags values.
   */
  bool compile(std::string_view pattern, uint32_t flags = 0);

  /** Compile the @a pattern into a regular expression.
   *
   * @param pattern Source pattern for regular expression.
   * @param error String to receive error message.
   * @param erroffset Integer to receive the offset in @a pattern of the error.
   * @param flags Compilation flags.
   * @return @a true if compiled successfully, @a false otherwise.
   */
  bool compile(std::string_view pattern, std::string &error, int &erroffset, uint32_t flags = 0);

  /** Execute the regular expression.
   *
   * @param subject String to match against.
   * @return @c true if the pattern matched, @a false if not (or on any error).
   *
   * It is safe to call this method concurrently on the same instance of @a this.
   */
  bool exec(std::string_view subject) const;

  /** Execute the regular expression.
   *
   * @param subject String to match against.
   * @param matches Place to store the capture groups.
   * @return The number of capture groups. < 0 if an error occurred (@c RE_ERROR_NOMATCH if nothing matched). 0 if
   * @a matches is too small.
   *
   * It is safe to call this method concurrently on the same instance of @a this.
   */
  int exec(std::string_view subject, RegexMatches &matches) const;

  /** Execute the regular expression.
   *
   * @param subject String to match against.
   * @param matches Place to store the capture groups.
   * @param flags Match flags, as passed to pcre2_match().
   * @param matchContext optional context with matching limits.
   * @return As for the overload above.
   */
  int exec(std::string_view subject, RegexMatches &matches, uint32_t flags,
           RegexMatchContext const *const matchContext = nullptr) const;

  /// @return The number of capture groups in the compiled pattern.
  int get_capture_count() const;

  /// @return Is the compiled pattern empty?
  bool empty() const;

  /// @return The source text the pattern was compiled from.
  const std::string &
  pattern() const
  {
    return _pattern;
  }

  /// @return A human readable message for a PCRE2 error code.
  static std::string error_message(int errorcode);

private:
  /// @internal This effectively wraps a void* so that we can avoid requiring the pcre2.h include for the user of the Regex
  /// API (see Regex.cc).
  struct _Code;
  class _CodePtr
  {
    friend struct _Code;

  private:
    void *_ptr = nullptr;
  };
  _CodePtr    _code;
  std::string _pattern;
};

} // namespace uri_rewrite
