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

#pragma once

#include <mpipe/util/shared_name.hpp>
#include <flow/log/log.hpp>
#include <boost/noncopyable.hpp>
#include <string>
#include <vector>

namespace mpipe::test
{

/**
 * Returns the test name (`Suite.Test`) of the currently running gtest test.
 *
 * @return See above.
 */
std::string get_test_name();

/**
 * Returns a channel name unused by any other test, in this or any concurrently running test process:
 * it contains the process ID and a process-wide counter.  It is sanitized().
 *
 * @param tag
 *        Alphanumeric word to include, for readability of logs and `/dev/shm` listings.
 * @return See above.
 */
util::Shared_name unique_channel_name(util::String_view tag);

/**
 * Returns `n` bytes of a deterministic, non-repeating-within-256 pattern starting from `seed`.
 *
 * @param n
 *        Size.
 * @param seed
 *        First byte.
 * @return See above.
 */
std::vector<uint8_t> make_pattern(size_t n, uint8_t seed = 0);

/**
 * Owns a unique channel name (see unique_channel_name()) for the duration of a test: removes the channel's
 * persistent resources on construction (just in case) and destruction.
 */
class Scoped_channel_name :
  private boost::noncopyable
{
public:
  /**
   * Constructor.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param tag
   *        See unique_channel_name().
   */
  explicit Scoped_channel_name(flow::log::Logger* logger_ptr, util::String_view tag);

  /// Removes the channel's persistent resources, ignoring errors (some of them may never have been created).
  ~Scoped_channel_name();

  /**
   * The channel name.
   * @return See above.
   */
  const util::Shared_name& name() const;

private:
  /// Logger.
  flow::log::Logger* const m_logger_ptr;

  /// See name().
  const util::Shared_name m_name;
}; // class Scoped_channel_name

} // namespace mpipe::test
