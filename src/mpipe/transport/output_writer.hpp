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
#include <flow/log/log.hpp>
#include <boost/noncopyable.hpp>

namespace mpipe::transport
{

// Types.

/**
 * The write-only byte sink handed to the writer callback of Message_sender::send_message(); it streams the bytes of
 * one message into the channel region, one chunk at a time.  It is not seekable or readable: it simply has no such
 * methods.
 *
 * ### Chunking ###
 * Bytes accumulate in the payload buffer (capacity C = Channel_region::payload_capacity()) starting at offset 0.
 * When a write() does not fit in the remaining space, the buffer is filled to capacity, and the full chunk is
 * *published*: `bytes_in_chunk = C`, then `S_CHUNK_READY` is raised, and the writer blocks until the receiver raises
 * `S_CHUNK_CONSUMED`.  Then the buffer is reused from offset 0.  This repeats as needed; hence a single write() of any
 * size is fine, and no chunk ever exceeds C.  Bytes that fit stay unpublished until a later overflow or close().
 *
 * ### Closing ###
 * close() publishes the final chunk: `message_complete = true`, plus `bytes_in_chunk` if any bytes are pending; then
 * the same handshake.  The handshake runs even if the message is empty: the receiver is waiting for it.  Then the
 * header is restored to rest state.  close() runs at most once; Message_sender::send_message() makes sure it runs
 * (if the callback did not call it); the destructor does the same as a last resort.
 *
 * ### Error reporting ###
 * Argument errors (error::Code::S_INVALID_ARGUMENT) and writing after close() (error::Code::S_SENDS_FINISHED_CANNOT_SEND)
 * are detected before anything is touched.  Otherwise errors can only come from the signals
 * (see Rendezvous_signal); the channel is then in an unknown state.
 *
 * ### Thread safety ###
 * None: use from the thread running the writer callback.
 */
class Output_writer :
  public flow::log::Log_context,
  private boost::noncopyable // And not movable.
{
public:
  // Constructors/destructor.

  /**
   * Constructs a writer for one message, ready to write at payload offset 0.  The region must be at rest.
   * The pointees must outlive `*this`.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param region
   *        The channel region.
   * @param chunk_ready
   *        The `S_CHUNK_READY` signal.
   * @param chunk_consumed
   *        The `S_CHUNK_CONSUMED` signal.
   */
  explicit Output_writer(flow::log::Logger* logger_ptr, Channel_region* region,
                         Rendezvous_signal* chunk_ready, Rendezvous_signal* chunk_consumed);

  /// If close() has not been called, calls it; logs (WARNING) any error it reports.  May block like close().
  ~Output_writer();

  // Methods.

  /**
   * Appends `length` bytes, starting at `offset` within `buffer`, to the message.  May block, as explained in the
   * class doc header, if the payload buffer overflows.
   *
   * @param buffer
   *        Source buffer.
   * @param offset
   *        Offset within `buffer` of the first byte to write.
   * @param length
   *        Number of bytes to write; may be 0.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_ARGUMENT (null `buffer` of non-zero size; `offset + length` beyond it),
   *        error::Code::S_SENDS_FINISHED_CANNOT_SEND (close() already called),
   *        those of Rendezvous_signal::raise() and Rendezvous_signal::wait_and_clear().
   */
  void write(const util::Blob_const& buffer, size_t offset, size_t length, Error_code* err_code = 0);

  /**
   * Equivalent to `write(blob, 0, blob.size(), err_code)`.
   *
   * @param blob
   *        Bytes to write.
   * @param err_code
   *        See other write().
   */
  void write(const util::Blob_const& blob, Error_code* err_code = 0);

  /**
   * Ends the message, as explained in the class doc header; blocks until the receiver has consumed the final chunk.
   * If already called, does nothing.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        those of Rendezvous_signal::raise() and Rendezvous_signal::wait_and_clear().
   */
  void close(Error_code* err_code = 0);

  /**
   * Returns `true` if and only if close() has been called.
   * @return See above.
   */
  bool closed() const;

  /**
   * Returns `true` if and only if close() has run and its final handshake succeeded, i.e., the receiver has
   * consumed the message's last chunk.  `closed() && !message_delivered()` means the close sequence failed, and the
   * receiver will not confirm the message.
   *
   * @return See above.
   */
  bool message_delivered() const;

  /**
   * C: the payload buffer capacity.
   * @return See above.
   */
  size_t payload_capacity() const;

  /**
   * Total bytes accepted by write() so far.
   * @return See above.
   */
  size_t n_bytes_written() const;

  /**
   * Number of chunks handed over so far (i.e., times `S_CHUNK_READY` was raised), including the final one
   * once close() has run.
   * @return See above.
   */
  size_t n_chunks_published() const;

private:
  // Methods.

  /**
   * Raises `S_CHUNK_READY` and awaits `S_CHUNK_CONSUMED`.  The header must be set by the caller.
   *
   * @param err_code
   *        Not null.
   */
  void hand_over_chunk(Error_code* err_code);

  // Data.

  /// See ctor.
  Channel_region* const m_region;

  /// See ctor.
  Rendezvous_signal* const m_chunk_ready;

  /// See ctor.
  Rendezvous_signal* const m_chunk_consumed;

  /// Payload bytes written into the current (not yet published) chunk; also the payload offset of the next byte.
  size_t m_bytes_in_chunk;

  /// See closed().
  bool m_closed;

  /// See message_delivered().
  bool m_message_delivered;

  /// See n_bytes_written().
  size_t m_n_bytes_written;

  /// See n_chunks_published().
  size_t m_n_chunks_published;
}; // class Output_writer

} // namespace mpipe::transport
