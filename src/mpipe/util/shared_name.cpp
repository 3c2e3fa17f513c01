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
#include "mpipe/util/shared_name.hpp"
#include <boost/functional/hash/hash.hpp>
#include <cctype>

namespace mpipe::util
{

// Initializers.

/* Underscore is legal in the names of every resource type we create (SHM objects, managed segments).  Making it the
 * folder separator leaves camelCase for separating words within a folder; hence `MessageSending` and friends. */
const char Shared_name::S_SEPARATOR = '_';

// See our doc header for discussion of chosen value.
const size_t Shared_name::S_MAX_LENGTH = 75;

const Shared_name Shared_name::S_EMPTY;

// Implementations.

Shared_name::Shared_name() = default;
Shared_name::Shared_name(const Shared_name&) = default;
Shared_name::Shared_name(Shared_name&&) = default;

Shared_name Shared_name::ct(const char* src) // Static.
{
  Shared_name result;
  result.m_raw_name.assign(src);
  return result;
}

Shared_name Shared_name::ct(std::string&& src_moved) // Static.
{
  Shared_name result;
  result.m_raw_name.assign(std::move(src_moved));
  return result;
}

Shared_name& Shared_name::operator=(const Shared_name&) = default;
Shared_name& Shared_name::operator=(Shared_name&&) = default;

Shared_name& Shared_name::operator+=(const Shared_name& src_to_append)
{
  return operator+=(src_to_append.str());
}

Shared_name& Shared_name::operator/=(const Shared_name& src_to_append)
{
  return operator/=(src_to_append.str());
}

Shared_name operator+(const Shared_name& src1, const Shared_name& src2)
{
  return Shared_name(src1) += src2;
}

Shared_name operator+(const Shared_name& src1, const char* raw_src2)
{
  return Shared_name(src1) += raw_src2;
}

Shared_name operator/(const Shared_name& src1, const Shared_name& src2)
{
  return Shared_name(src1) /= src2;
}

Shared_name operator/(const Shared_name& src1, const char* raw_src2)
{
  return Shared_name(src1) /= raw_src2;
}

const std::string& Shared_name::str() const
{
  return m_raw_name;
}

const char* Shared_name::native_str() const
{
  return m_raw_name.c_str();
}

size_t Shared_name::size() const
{
  return m_raw_name.size();
}

bool Shared_name::empty() const
{
  return m_raw_name.empty();
}

void Shared_name::clear()
{
  m_raw_name.clear();
}

bool Shared_name::sanitized() const
{
  using std::isalnum;

  // Keep in sync with sanitize().

  if (size() > S_MAX_LENGTH)
  {
    return false;
  }
  // else

  bool prev_is_sep = false;
  for (const auto ch : m_raw_name)
  {
    const bool is_sep = ch == S_SEPARATOR;
    // isalnum() is [A-Za-z0-9] in the "C" locale; we never set another.
    if ((!is_sep) && (!isalnum(static_cast<unsigned char>(ch))))
    {
      return false;
    }
    // else
    if (is_sep && prev_is_sep)
    {
      return false;
    }
    // else
    prev_is_sep = is_sep;
  }

  return true;
} // Shared_name::sanitized()

bool Shared_name::sanitize()
{
  using std::string;
  using std::isalnum;

  constexpr char SEPARATOR_ALT = '/';

  // Keep in sync with sanitized().

  /* Build the candidate in a separate buffer; only if it passes do we swap it in.  That way str() is untouched on
   * `return false`, at the cost of one allocation. */
  string result;
  result.reserve(size());

  for (const auto ch : m_raw_name)
  {
    const bool is_sep = (ch == S_SEPARATOR) || (ch == SEPARATOR_ALT);
    if ((!is_sep) && (!isalnum(static_cast<unsigned char>(ch))))
    {
      return false;
    }
    // else

    if (is_sep)
    {
      if ((!result.empty()) && (result.back() == S_SEPARATOR))
      {
        continue; // Collapse the run.
      }
      // else
      result += S_SEPARATOR;
    }
    else
    {
      result += ch;
    }

    if (result.size() > S_MAX_LENGTH)
    {
      return false;
    }
  } // for (ch : m_raw_name)

  m_raw_name.swap(result);
  return true;
} // Shared_name::sanitize()

std::ostream& operator<<(std::ostream& os, const Shared_name& val)
{
  // Output char count for convenience: these can be at a premium.
  if (val.empty())
  {
    return os << "null";
  }
  // else
  return os << val.size() << '|' << val.str();
}

std::istream& operator>>(std::istream& is, Shared_name& val)
{
  std::string str;
  is >> str;
  val = Shared_name::ct(std::move(str));
  return is;
}

bool operator==(const Shared_name& val1, const Shared_name& val2)
{
  return val1.str() == val2.str();
}

bool operator!=(const Shared_name& val1, const Shared_name& val2)
{
  return !(operator==(val1, val2));
}

bool operator==(const Shared_name& val1, util::String_view val2)
{
  return String_view(val1.str()) == val2;
}

bool operator!=(const Shared_name& val1, util::String_view val2)
{
  return !(operator==(val1, val2));
}

bool operator<(const Shared_name& val1, const Shared_name& val2)
{
  return val1.str() < val2.str();
}

size_t hash_value(const Shared_name& val)
{
  using boost::hash;
  using std::string;

  return hash<string>()(val.str());
}

void swap(Shared_name& val1, Shared_name& val2)
{
  using std::swap;
  swap(val1.m_raw_name, val2.m_raw_name);
}

} // namespace mpipe::util
