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

#include "mpipe/util/util_fwd.hpp"

namespace mpipe::util
{

// Free functions.

/**
 * Returns new object equal to `Shared_name(src1) /= src2`.
 *
 * @relatesalso Shared_name
 * @param src1
 *        Object to precede the appended separator and copy of `src2`.
 * @param src2
 *        Object to append after separator.
 * @return See above.
 */
Shared_name operator/(const Shared_name& src1, const Shared_name& src2);

/**
 * Returns new object equal to `Shared_name(src1) /= raw_src2`.
 *
 * @relatesalso Shared_name
 * @param src1
 *        Object to precede the appended separator and copy of `raw_src2`.
 * @param raw_src2
 *        NUL-terminated string to append after separator.
 * @return See above.
 */
Shared_name operator/(const Shared_name& src1, const char* raw_src2);

/**
 * Returns new object equal to `Shared_name(src1) += src2`.
 *
 * @relatesalso Shared_name
 * @param src1
 *        Object to precede the copy of `src2`.
 * @param src2
 *        Object to append.
 * @return See above.
 */
Shared_name operator+(const Shared_name& src1, const Shared_name& src2);

/**
 * Returns new object equal to `Shared_name(src1) += raw_src2`.
 *
 * @relatesalso Shared_name
 * @param src1
 *        Object to precede the copy of `raw_src2`.
 * @param raw_src2
 *        NUL-terminated string to append.
 * @return See above.
 */
Shared_name operator+(const Shared_name& src1, const char* raw_src2);

/**
 * Prints embellished string representation of the given Shared_name to the given `ostream`: the character count,
 * a `|`, then str(); or `null` if empty.
 *
 * @relatesalso Shared_name
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Shared_name& val);

/**
 * Reads Shared_name from the given `istream`; equivalent to reading `string` and then `Shared_name::ct()`ing it.
 *
 * @relatesalso Shared_name
 *
 * @param is
 *        Input stream.
 * @param val
 *        Object to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Shared_name& val);

/**
 * Returns `true` if and only if `val1.str() == val2.str()`.
 *
 * @relatesalso Shared_name
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator==(const Shared_name& val1, const Shared_name& val2);

/**
 * Negation of similar `==`.
 *
 * @relatesalso Shared_name
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator!=(const Shared_name& val1, const Shared_name& val2);

/**
 * Returns `true` if and only if `val1.str() == val2`; so one can write `name == "something"`.
 *
 * @relatesalso Shared_name
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        String to compare.
 * @return See above.
 */
bool operator==(const Shared_name& val1, util::String_view val2);

/**
 * Negation of similar `==`.
 *
 * @relatesalso Shared_name
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        String to compare.
 * @return See above.
 */
bool operator!=(const Shared_name& val1, util::String_view val2);

/**
 * Returns `true` if and only if `val1.str() < val2.str()`.  Enables use in associative containers.
 *
 * @relatesalso Shared_name
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator<(const Shared_name& val1, const Shared_name& val2);

/**
 * Hasher of Shared_name for boost.unordered et al.
 *
 * @relatesalso Shared_name
 *
 * @param val
 *        Object to hash.
 * @return See above.
 */
size_t hash_value(const Shared_name& val);

/**
 * Swaps two objects.  Constant-time.  Suitable for standard ADL-swap pattern `using std::swap; swap(val1, val2);`.
 *
 * @relatesalso Shared_name
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 */
void swap(Shared_name& val1, Shared_name& val2);

} // namespace mpipe::util
