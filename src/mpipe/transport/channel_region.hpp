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

#include "mpipe/transport/transport_fwd.hpp"
#include "mpipe/util/util_fwd.hpp"
#include "mpipe/util/shared_name.hpp"
#include <flow/log/log.hpp>
#include <boost/interprocess/shared_memory_object.hpp>
#include <boost/interprocess/mapped_region.hpp>
#include <boost/move/unique_ptr.hpp>
#include <boost/noncopyable.hpp>

namespace mpipe::transport
{

// Types.

/**
 * The shared memory region of one channel: a named, kernel-persistent SHM object exactly one host memory page
 * (util::host_page_size()) in size, mapped read-write into this process.  Its layout, in host-native byte order, is:
 *
 *   | Offset | Size      | Field              |
 *   |--------|-----------|--------------------|
 *   | 0      | 4         | `bytes_in_chunk`   |
 *   | 4      | 1         | `message_complete` |
 *   | 5      | 1         | reserved, never written |
 *   | 6      | page - 6  | payload            |
 *
 * This layout is a contract with the receiving side.  payload_capacity() is the C of the chunking protocol.
 *
 * At rest (no message in flight) `bytes_in_chunk == 0` and `message_complete == false`; reset_header() restores that.
 * A region just created is all zeroes, hence at rest.
 *
 * The class is a thin accessor: it knows nothing about the handshake; Output_writer drives it.  The header
 * fields are written by the sending side only; the receiver only reads them.
 *
 * ### Error reporting ###
 * Only the constructor can fail.  In that case the object is unusable: any further call except the destructor and
 * absolute_name() yields undefined behavior.
 */
class Channel_region :
  public flow::log::Log_context,
  private boost::noncopyable // And not movable.
{
public:
  // Constants.

  /// Offset of `bytes_in_chunk` (`uint32_t`): number of valid payload bytes in the published chunk.
  static constexpr size_t S_BYTES_IN_CHUNK_OFFSET = 0;

  /// Offset of `message_complete` (1 byte, 0 or 1): whether the published chunk is the last of its message.
  static constexpr size_t S_MESSAGE_COMPLETE_OFFSET = 4;

  /// Offset of the reserved padding byte.
  static constexpr size_t S_RESERVED_OFFSET = 5;

  /// Offset of the payload buffer; also the total header size.
  static constexpr size_t S_PAYLOAD_OFFSET = 6;

  // Constructors/destructor.

  /**
   * Opens the region of the given name, creating it (sized at one page, zero-filled) if it does not exist.
   * If it exists with a size other than one page, that is an error: likely another program's object has that name,
   * or the counterpart runs on a host with a different page size.  (An existing object of size 0, as left by
   * a creator that has not yet sized it, is sized by us.)
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param absolute_name
   *        Name of the region: the channel name.
   * @param mode_tag
   *        Tag (for now there is only the one mode).
   * @param perms_on_create
   *        Permissions to use if the object is created by us.  Suggest the use of
   *        util::shared_resource_permissions().
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        system codes from `shm_open()`, `ftruncate()`, `mmap()`; error::Code::S_REGION_SIZE_MISMATCH;
   *        error::Code::S_BIPC_MISC_LIBRARY_ERROR.
   */
  explicit Channel_region(flow::log::Logger* logger_ptr, const Shared_name& absolute_name,
                          util::Open_or_create mode_tag,
                          const util::Permissions& perms_on_create = util::Permissions(),
                          Error_code* err_code = 0);

  /// Unmaps the region; the SHM object itself persists; see remove_persistent().
  ~Channel_region();

  // Methods.

  /**
   * Returns name equal to `absolute_name` passed to ctor.
   * @return See above.
   */
  const Shared_name& absolute_name() const;

  /**
   * Size of the whole region: one host page.
   * @return See above.
   */
  size_t region_size() const;

  /**
   * Capacity of the payload buffer: `region_size() - S_PAYLOAD_OFFSET`.
   * @return See above.
   */
  size_t payload_capacity() const;

  /**
   * Reads `bytes_in_chunk`.
   * @return See above.
   */
  uint32_t bytes_in_chunk() const;

  /**
   * Writes `bytes_in_chunk`.
   * @param val
   *        Value; at most payload_capacity().
   */
  void set_bytes_in_chunk(uint32_t val);

  /**
   * Reads `message_complete`.
   * @return See above.
   */
  bool message_complete() const;

  /**
   * Writes `message_complete`.
   * @param val
   *        Value.
   */
  void set_message_complete(bool val);

  /// Restores the rest state of the header: `bytes_in_chunk = 0`, `message_complete = false`.
  void reset_header();

  /**
   * Returns `true` if and only if the header is in rest state.
   * @return See above.
   */
  bool at_rest() const;

  /**
   * The payload buffer (writable), of size payload_capacity().
   * @return See above.
   */
  util::Blob_mutable payload();

  /**
   * The payload buffer (read-only), of size payload_capacity().
   * @return See above.
   */
  util::Blob_const payload() const;

  /**
   * Removes the named persistent region.  The name is removed from the system immediately; the memory lives on until
   * every process has unmapped it.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param absolute_name
   *        Name of the region.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        system codes, most likely not-found or permission-denied.
   */
  static void remove_persistent(flow::log::Logger* logger_ptr, const Shared_name& absolute_name,
                                Error_code* err_code = 0);

private:
  // Methods.

  /**
   * First byte of the mapped region.
   * @return See above.
   */
  uint8_t* base() const;

  // Data.

  /// See absolute_name().
  const Shared_name m_absolute_name;

  /// Handle to the SHM object; null if ctor failed.
  boost::movelib::unique_ptr<bipc::shared_memory_object> m_shm;

  /// The mapping of `*m_shm`; null if ctor failed.
  boost::movelib::unique_ptr<bipc::mapped_region> m_region;
}; // class Channel_region

} // namespace mpipe::transport
