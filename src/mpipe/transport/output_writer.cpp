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
#include "mpipe/transport/output_writer.hpp"
#include "mpipe/transport/channel_region.hpp"
#include "mpipe/transport/rendezvous_signal.hpp"
#include "mpipe/transport/error.hpp"
#include <flow/error/error.hpp>
#include <flow/common.hpp>
#include <cstring>

namespace mpipe::transport
{

// Implementations.

Output_writer::Output_writer(flow::log::Logger* logger_ptr, Channel_region* region,
                             Rendezvous_signal* chunk_ready, Rendezvous_signal* chunk_consumed) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_region(region),
  m_chunk_ready(chunk_ready),
  m_chunk_consumed(chunk_consumed),
  m_bytes_in_chunk(0),
  m_closed(false),
  m_message_delivered(false),
  m_n_bytes_written(0),
  m_n_chunks_published(0)
{
  assert(m_region && m_chunk_ready && m_chunk_consumed);
  FLOW_LOG_TRACE("Output_writer [" << *this << "]: Ready; payload capacity [" << payload_capacity() << "].");
}

Output_writer::~Output_writer()
{
  if (m_closed)
  {
    return;
  }
  // else

  FLOW_LOG_TRACE("Output_writer [" << *this << "]: Destroying while not closed; closing now.");
  Error_code err_code;
  close(&err_code);
  if (err_code)
  {
    FLOW_LOG_WARNING("Output_writer [" << *this << "]: Close on destruction failed; the receiver may not have "
                     "seen the end of the message.  Error: [" << err_code << "] [" << err_code.message() << "].");
  }
}

void Output_writer::write(const util::Blob_const& blob, Error_code* err_code)
{
  write(blob, 0, blob.size(), err_code);
}

void Output_writer::write(const util::Blob_const& buffer, size_t offset, size_t length, Error_code* err_code)
{
  using flow::util::buffers_dump_string;
  using util::Blob_const;
  using util::blob_data;
  using std::memcpy;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { write(buffer, offset, length, actual_err_code); },
         err_code, "Output_writer::write()"))
  {
    return;
  }
  // else
  err_code->clear();

  if (((buffer.data() == 0) && (buffer.size() != 0))
      || (offset > buffer.size()) || (length > (buffer.size() - offset)))
  {
    FLOW_LOG_WARNING("Output_writer [" << *this << "]: Write request for [" << length << "] bytes at offset "
                     "[" << offset << "] of buffer @[" << buffer.data() << "] sized [" << buffer.size() << "] is "
                     "invalid.  Ignoring.");
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return;
  }
  // else

  if (m_closed)
  {
    FLOW_LOG_WARNING("Output_writer [" << *this << "]: Write request for [" << length << "] bytes after close.  "
                     "Ignoring.");
    *err_code = error::Code::S_SENDS_FINISHED_CANNOT_SEND;
    return;
  }
  // else

  FLOW_LOG_TRACE("Output_writer [" << *this << "]: Write request for [" << length << "] bytes; "
                 "[" << m_bytes_in_chunk << "] bytes already pending in chunk.");

  const size_t capacity = payload_capacity();
  const auto payload = m_region->payload();
  const uint8_t* src = blob_data(buffer) + offset;
  size_t remaining = capacity - m_bytes_in_chunk;

  while (length > remaining)
  {
    // Fill to capacity, hand over the full chunk, start over at offset 0.
    memcpy(blob_data(payload) + m_bytes_in_chunk, src, remaining);
    m_bytes_in_chunk = capacity;
    m_n_bytes_written += remaining;
    src += remaining;
    length -= remaining;

    FLOW_LOG_DATA("Output_writer [" << *this << "]: Full chunk contents: [\n"
                  << buffers_dump_string(Blob_const(blob_data(payload), capacity), "  ") << "].");
    m_region->set_bytes_in_chunk(uint32_t(capacity));
    hand_over_chunk(err_code);
    if (*err_code) // It logged.
    {
      return;
    }
    // else

    m_bytes_in_chunk = 0;
    remaining = capacity;
  } // while (length > remaining)

  if (length != 0)
  {
    memcpy(blob_data(payload) + m_bytes_in_chunk, src, length);
    m_bytes_in_chunk += length;
    m_n_bytes_written += length;
  }
} // Output_writer::write()

void Output_writer::close(Error_code* err_code)
{
  using flow::util::buffers_dump_string;
  using util::Blob_const;
  using util::blob_data;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { close(actual_err_code); },
         err_code, "Output_writer::close()"))
  {
    return;
  }
  // else
  err_code->clear();

  if (m_closed)
  {
    FLOW_LOG_TRACE("Output_writer [" << *this << "]: Close request, but already closed.  Ignoring.");
    return;
  }
  // else

  // Set it first: whatever happens below, there is no second attempt (including from the dtor).
  m_closed = true;

  FLOW_LOG_TRACE("Output_writer [" << *this << "]: Closing; final chunk has [" << m_bytes_in_chunk << "] bytes; "
                 "message total [" << m_n_bytes_written << "] bytes.");

  m_region->set_message_complete(true);
  if (m_bytes_in_chunk != 0)
  {
    FLOW_LOG_DATA("Output_writer [" << *this << "]: Final chunk contents: [\n"
                  << buffers_dump_string(Blob_const(blob_data(m_region->payload()), m_bytes_in_chunk), "  ")
                  << "].");
    m_region->set_bytes_in_chunk(uint32_t(m_bytes_in_chunk));
  }

  hand_over_chunk(err_code);
  m_message_delivered = !*err_code;

  // Rest state, even on error: the next message must not inherit a stale header.
  m_region->reset_header();
  m_bytes_in_chunk = 0;
} // Output_writer::close()

void Output_writer::hand_over_chunk(Error_code* err_code)
{
  assert(err_code);

  FLOW_LOG_TRACE("Output_writer [" << *this << "]: Publishing chunk #[" << m_n_chunks_published << "]: "
                 "bytes_in_chunk [" << m_region->bytes_in_chunk() << "], "
                 "message_complete [" << m_region->message_complete() << "].  Awaiting drain.");

  m_chunk_ready->raise(err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Output_writer [" << *this << "]: Could not raise chunk-ready signal.  "
                     "Error: [" << *err_code << "] [" << err_code->message() << "].");
    return;
  }
  // else
  ++m_n_chunks_published;

  m_chunk_consumed->wait_and_clear(err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Output_writer [" << *this << "]: Could not await chunk-consumed signal.  "
                     "Error: [" << *err_code << "] [" << err_code->message() << "].");
    return;
  }
  // else

  FLOW_LOG_TRACE("Output_writer [" << *this << "]: Chunk drained by receiver.");
} // Output_writer::hand_over_chunk()

bool Output_writer::closed() const
{
  return m_closed;
}

bool Output_writer::message_delivered() const
{
  return m_message_delivered;
}

size_t Output_writer::payload_capacity() const
{
  return m_region->payload_capacity();
}

size_t Output_writer::n_bytes_written() const
{
  return m_n_bytes_written;
}

size_t Output_writer::n_chunks_published() const
{
  return m_n_chunks_published;
}

std::ostream& operator<<(std::ostream& os, const Output_writer& val)
{
  return os << "[written[" << val.n_bytes_written() << "] chunks[" << val.n_chunks_published() << "] "
               "closed[" << val.closed() << "]]@" << static_cast<const void*>(&val);
}

} // namespace mpipe::transport
