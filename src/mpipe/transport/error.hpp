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

#include "mpipe/common.hpp"

/**
 * Namespace containing the mpipe::transport module's extension of boost.system error conventions, so that that API
 * can return codes/messages from within its own new set of error codes/messages.  Note that many errors
 * mpipe::transport might report are system errors (e.g., from `shm_open()` or `ftruncate()`) and would not draw from
 * this set of codes/messages but rather from `boost::system::errc` via `system_category()`.
 *
 * See Flow's `flow::net_flow::error` doc header which was used as the model for this and similar.
 */
namespace mpipe::transport::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by mpipe::transport functions/methods *outside of*
 * system-triggered errors.  These values are convertible to #Error_code (a/k/a `boost::system::error_code`) and thus
 * extend the set of errors that #Error_code can represent.
 *
 * @internal
 *
 * When you add a value to this `enum`, also add its description to error.cpp's Category::message().  This
 * description must be identical to the description in the /// comment below, or at least as close as possible.
 *
 * When you add a value to this `enum`, also add its symbolic representation to error.cpp's Category::code_symbol().
 * This string must be identical to the symbol, minus the `S_`; e.g., Code::S_INVALID_ARGUMENT => `"INVALID_ARGUMENT"`.
 * This enables the consistent and human-friendly serialization `<<` and deserialization `>>` of a Code w/r/t
 * standard streams.
 *
 * Add new values at the end, but ahead of Code::S_END_SENTINEL.  Never delete a value; mark it deprecated instead.
 */
enum class Code
{
  /// Will not send message: local user already ended sending via API marking this.
  S_SENDS_FINISHED_CANNOT_SEND = S_CODE_LOWEST_INT_VALUE,

  /// Will not send message: the channel is not open, either because opening failed or because it was disposed.
  S_CHANNEL_CLOSED_CANNOT_SEND,

  /// Will not send message: a message is already being sent on this channel (re-entrant send from writer callback?).
  S_SEND_ALREADY_IN_PROGRESS,

  /// User called an API with 1 or more arguments against the API spec.
  S_INVALID_ARGUMENT,

  /// A (usually user-specified) timeout period has elapsed before a blocking operation completed.
  S_TIMEOUT,

  /// Channel region already exists under the given name, but its size is not one host memory page.
  S_REGION_SIZE_MISMATCH,

  /**
   * boost.interprocess emitted miscellaneous library exception sans a system code;
   * a WARNING message at throw-time should contain all possible details.
   */
  S_BIPC_MISC_LIBRARY_ERROR,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight #Error_code (a/k/a boost.system `error_code`)
 * representing that error.  This is needed to make the
 * `boost::system::error_code::error_code<Code>()` template implementation work; it glues the (completely general)
 * #Error_code to the (`mpipe::transport`-specific) error code set, so that one can implicitly convert from the
 * latter to the former.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding #Error_code.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes a transport::error::Code from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character.  If none is recognized, Code::S_END_SENTINEL is the result.
 * The recognized values are:
 *   - "1", "2", ...: Corresponds to the `int` conversion of that Code.
 *   - Case-insensitive encoding of the non-S_-prefix part of the actual Code member; e.g.,
 *     "INVALID_ARGUMENT" (or "invalid_argument" or "Invalid_argument" or...) for Code::S_INVALID_ARGUMENT.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a transport::error::Code to a standard output stream.  The output string is compatible with the reverse
 * `istream>>` operator: it looks like the identifier in C++ code; e.g.,
 * Code::S_INVALID_ARGUMENT => `"INVALID_ARGUMENT"`.  When printing an #Error_code storing a Code, continue to
 * do the standard thing instead: print the #Error_code itself plus its `.message()`.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace mpipe::transport::error

namespace boost::system
{

// Types.

/**
 * Specializes this `struct` so that boost.system makes `enum` `Code` convertible to `Error_code`.  The
 * non-specialized version of this sets `value` to `false`, so that arbitrary `enum`s can't just be used as
 * `Error_code`s.
 */
template<>
struct is_error_code_enum<::mpipe::transport::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
