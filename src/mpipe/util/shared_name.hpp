/* mpipe: Core
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#pragma once

#include "mpipe/util/shared_name_fwd.hpp"
#include "mpipe/common.hpp"

namespace mpipe::util
{

/**
 * String-wrapping abstraction representing a name uniquely distinguishing a kernel-persistent
 * entity from all others in the system, or a fragment of such a name.  Conceptually it relates to `std::string`
 * similarly to how `filesystem::path` does: it encapsulates an `std::string` and allows for string operations like
 * concatenation, with some syntactic sugar for a simple *folder* convention.
 *
 * ### Construction/assignment from and conversion to strings ###
 * The `string` is accessible by `const&` via str() and similarly the NUL-terminated native_str().
 * Construction from `string`, util::String_view, `const char*` (etc.) is available exclusively via the `static`
 * quasi-ctors ct().  To assign use move assignment: `existing_sh_name = Shared_name::ct(src)`.
 *
 * Rationale: with an implicit ctor from strings, C++ ADL happily converts a `string` to Shared_name where nobody
 * asked for it (e.g., `os << some_string` would print the "beautified" form).  boost.asio's IP address classes
 * use `static` quasi-ctors to avoid this; so do we.
 *
 * ### How mpipe uses it ###
 * Each channel is identified by one Shared_name, the *channel name*, supplied identically by the sender and the
 * receiver.  The channel region (transport::Channel_region) is a SHM object named exactly that; each of the four
 * signals (transport::Rendezvous_signal) is named `channel_name / <suffix>`, i.e., the channel name, then
 * #S_SEPARATOR, then a fixed suffix such as `MessageSending`.  The suffixes are part of the wire contract with the
 * receiving side; see transport::signal_name().
 *
 * ### Conventions understood/enforced by Shared_name ###
 * Generally the class allows everything and does nothing smart that `std::string` wouldn't do.  However there is
 * *optional* support for a convention that yields names valid for every resource type we create:
 *   - Only alphanumerics [A-Za-z0-9] and the folder separator #S_SEPARATOR are allowed.
 *   - There are no sequences of 2+ adjacent #S_SEPARATOR chars.
 *   - The length does not exceed #S_MAX_LENGTH.
 *
 * sanitized() checks this; sanitize() tries to non-destructively enforce it.  Use them only when you specifically
 * need the convention checked (e.g., the name came from user input).
 *
 * ### Thread safety ###
 * Same as `std::string`.
 *
 * @internal
 * ### Rationale for max length ###
 * SHM object names (`man shm_open`) are limited to `NAME_MAX = 255` including a leading forward-slash and NUL.
 * The longest signal suffix plus separator is 16 characters; and we leave generous slack for the user's own
 * prefixing.  Hence 75.
 */
class Shared_name
{
public:
  // Constants.

  /// A (default-cted) Shared_name.  May be useful for functions returning `const Shared_name&`.
  static const Shared_name S_EMPTY;

  /// Max value of size() such that, if str() is used to name a supported shared resource, sys call won't barf.
  static const size_t S_MAX_LENGTH;

  /// Character we use, by convention, to separate conceptual folders within str().
  static const char S_SEPARATOR;

  // Constructors/destructor.

  /// Constructs empty() name.
  Shared_name();

  /**
   * Copy-constructs from an existing Shared_name.
   *
   * @param src
   *        Source object.
   */
  Shared_name(const Shared_name& src);

  /**
   * Move-constructs from an existing Shared_name, which is made empty() if not already so.
   *
   * @param src_moved
   *        Source object, which is potentially modified.
   */
  Shared_name(Shared_name&& src_moved);

  // `static` ctors.

  /**
   * Copy-constructs from a `char`-sequence container (including `string`, util::String_view, `vector<char>`).
   * The internal `string` is assigned from `src` via whichever `assign()` overload best applies.
   *
   * @tparam Source
   *         See above.
   * @param src
   *        String to copy.
   * @return The new object.
   */
  template<typename Source>
  static Shared_name ct(const Source& src);

  /**
   * Copy-constructs from a NUL-terminated `const char*` string.
   *
   * @param src
   *        String to copy.
   * @return The new object.
   */
  static Shared_name ct(const char* src);

  /**
   * Destructively move-constructs from an `std::string`, emptying that source object.
   *
   * @param src_moved
   *        String to move (make-empty).
   * @return The new object.
   */
  static Shared_name ct(std::string&& src_moved);

  // Methods.

  /**
   * Copy-assigns from an existing Shared_name.
   *
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Shared_name& operator=(const Shared_name& src);

  /**
   * Move-assigns from an existing Shared_name.
   *
   * @param src_moved
   *        Source object, which is potentially modified.
   * @return `*this`.
   */
  Shared_name& operator=(Shared_name&& src_moved);

  /**
   * Returns (sans copying) ref to immutable entire wrapped name string.  If you require a NUL-terminated string
   * (such as for a native call), use native_str().
   *
   * @return See above.
   */
  const std::string& str() const;

  /**
   * Returns (sans copying) pointer to NUL-terminated wrapped name string, suitable to pass into sys calls and
   * boost.interprocess when naming shared resources.
   *
   * @return See above.
   */
  const char* native_str() const;

  /**
   * Returns `str().size()`.
   * @return See above.
   */
  size_t size() const;

  /**
   * Returns `true` if and only if `str().empty() == true`.
   * @return See above.
   */
  bool empty() const;

  /// Makes it so `empty() == true`.
  void clear();

  /**
   * Returns `true` if and only if the contained name/fragment is *sanitized*: no characters besides
   * [A-Za-z0-9] and #S_SEPARATOR; no 2+ #S_SEPARATOR characters in a row; size() at most #S_MAX_LENGTH.
   * Linear-time, one scan.
   *
   * @return See above.
   */
  bool sanitized() const;

  /**
   * Best-effort attempt to turn sanitized() from `false` to `true`, unless it is already `true`; returns the final
   * value of sanitized().  If `false` is returned, str() is unchanged.  What it does:
   *   - Any '/' (forward-slash) character is transformed into #S_SEPARATOR.
   *   - Then any sequence of 2+ #S_SEPARATOR characters is collapsed into one.
   *
   * It does not change any other character, and it does not truncate.
   *
   * @return What sanitized() would return just before returning from the present function.
   */
  bool sanitize();

  /**
   * Appends a folder separator followed by the given other Shared_name.
   *
   * @param src_to_append
   *        Thing to append after appending separator.
   * @return `*this`.
   */
  Shared_name& operator/=(const Shared_name& src_to_append);

  /**
   * Appends a folder separator followed by `raw_name_to_append`.
   *
   * @tparam Source
   *         Anything `std::string::operator+=()` accepts.
   * @param raw_name_to_append
   *        Thing to append after appending separator.
   * @return `*this`.
   */
  template<typename Source>
  Shared_name& operator/=(const Source& raw_name_to_append);

  /**
   * Appends the given other Shared_name.
   *
   * @param src_to_append
   *        Thing to append.
   * @return `*this`.
   */
  Shared_name& operator+=(const Shared_name& src_to_append);

  /**
   * Appends `raw_name_to_append` (no separator).
   *
   * @tparam Source
   *         Anything `std::string::operator+=()` accepts.
   * @param raw_name_to_append
   *        Thing to append.
   * @return `*this`.
   */
  template<typename Source>
  Shared_name& operator+=(const Source& raw_name_to_append);

private:
  // Friends.

  // Friend for access to Shared_name.
  friend void swap(Shared_name& val1, Shared_name& val2);

  // Data.

  /// The name or name fragment; see str().
  std::string m_raw_name;
}; // class Shared_name

// Template implementations.

template<typename Source>
Shared_name Shared_name::ct(const Source& src) // Static.
{
  Shared_name result;
  result.m_raw_name.assign(src);
  return result;
}

template<typename Source>
Shared_name& Shared_name::operator+=(const Source& raw_name_to_append)
{
  m_raw_name += raw_name_to_append;
  return *this;
}

template<typename Source>
Shared_name& Shared_name::operator/=(const Source& raw_name_to_append)
{
  m_raw_name += S_SEPARATOR;
  return operator+=(raw_name_to_append);
}

} // namespace mpipe::util
