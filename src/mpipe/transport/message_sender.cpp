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
#include "mpipe/transport/message_sender.hpp"
#include "mpipe/transport/channel_region.hpp"
#include "mpipe/transport/rendezvous_signal.hpp"
#include "mpipe/transport/output_writer.hpp"
#include "mpipe/transport/error.hpp"
#include <flow/error/error.hpp>
#include <flow/common.hpp>
#include <boost/move/make_unique.hpp>
#include <initializer_list>

namespace mpipe::transport
{

// Implementations.

Message_sender::Message_sender(flow::log::Logger* logger_ptr, const Shared_name& channel_name,
                               const util::Permissions& perms_on_create, Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_absolute_name(channel_name),
  m_sending(false),
  m_n_messages_sent(0)
{
  using flow::error::Runtime_error;
  using boost::movelib::make_unique;

  FLOW_LOG_INFO("Message_sender [" << *this << "]: Opening channel.");

  // As in Channel_region ctor: gather the result, then emit it per the usual semantics at the end.
  Error_code our_err_code;

  auto region = make_unique<Channel_region>(get_logger(), absolute_name(), util::OPEN_OR_CREATE, perms_on_create,
                                            &our_err_code);
  Signals signals;
  for (size_t idx = 0; (!our_err_code) && (idx != signals.size()); ++idx)
  {
    signals[idx] = make_unique<Rendezvous_signal>(get_logger(), signal_name(absolute_name(), Signal_role(idx)),
                                                  util::OPEN_OR_CREATE, perms_on_create, &our_err_code);
  }

  if (!our_err_code)
  {
    if (!region->at_rest())
    {
      /* The previous sender died mid-message (or something else wrote here).  We cannot fix the receiver's state,
       * but at least our header starts clean. */
      FLOW_LOG_WARNING("Message_sender [" << *this << "]: Region header not at rest on open "
                       "(bytes_in_chunk [" << region->bytes_in_chunk() << "], "
                       "message_complete [" << region->message_complete() << "]).  Resetting it.");
      region->reset_header();
    }

    /* Likewise the two signals we wait on: a flag left raised by an earlier run would let the first handshake
     * through before the receiver did anything. */
    for (const auto role : { Signal_role::S_CHUNK_CONSUMED, Signal_role::S_MESSAGE_CONSUMED })
    {
      if (signals[size_t(role)]->try_wait_and_clear(&our_err_code))
      {
        FLOW_LOG_WARNING("Message_sender [" << *this << "]: Signal [" << role << "] was raised on open "
                         "(left over from an earlier run).  Cleared it.");
      }
      if (our_err_code) // It logged.
      {
        break;
      }
    }
  } // if (!our_err_code)

  if (our_err_code)
  {
    // Whatever got opened is closed as `region` and `signals` go out of scope.
    FLOW_LOG_WARNING("Message_sender [" << *this << "]: Could not open channel; staying not-open.  "
                     "Error: [" << our_err_code << "] [" << our_err_code.message() << "].");
  }
  else
  {
    m_region = std::move(region);
    for (size_t idx = 0; idx != signals.size(); ++idx)
    {
      m_signals[idx] = std::move(signals[idx]);
    }

    FLOW_LOG_INFO("Message_sender [" << *this << "]: Channel open; payload capacity [" << payload_capacity() << "].");
  }

  if (err_code)
  {
    *err_code = our_err_code;
  }
  else if (our_err_code)
  {
    throw Runtime_error(our_err_code, "Message_sender::Message_sender()");
  }
} // Message_sender::Message_sender()

Message_sender::~Message_sender()
{
  dispose();
}

void Message_sender::dispose()
{
  if (!is_open())
  {
    return;
  }
  // else

  if (m_sending)
  {
    FLOW_LOG_WARNING("Message_sender [" << *this << "]: Dispose requested from within send_message().  Ignoring.");
    return;
  }
  // else

  FLOW_LOG_INFO("Message_sender [" << *this << "]: Disposing: detaching from channel after "
                "[" << m_n_messages_sent << "] messages sent.");
  for (auto& signal_ptr : m_signals)
  {
    signal_ptr.reset();
  }
  m_region.reset();
} // Message_sender::dispose()

void Message_sender::send_message(const Writer_func& writer_func, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { send_message(writer_func, actual_err_code); },
         err_code, "Message_sender::send_message()"))
  {
    return;
  }
  // else
  err_code->clear();

  if (!writer_func)
  {
    FLOW_LOG_WARNING("Message_sender [" << *this << "]: Send request with empty writer function.  Ignoring.");
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return;
  }
  // else
  if (!is_open())
  {
    FLOW_LOG_WARNING("Message_sender [" << *this << "]: Send request, but channel is not open.  Ignoring.");
    *err_code = error::Code::S_CHANNEL_CLOSED_CANNOT_SEND;
    return;
  }
  // else
  if (m_sending)
  {
    FLOW_LOG_WARNING("Message_sender [" << *this << "]: Send request while already sending message "
                     "#[" << m_n_messages_sent << "].  Ignoring.");
    *err_code = error::Code::S_SEND_ALREADY_IN_PROGRESS;
    return;
  }
  // else

  FLOW_LOG_TRACE("Message_sender [" << *this << "]: Sending message #[" << m_n_messages_sent << "].");

  m_sending = true;

  signal(Signal_role::S_SENDING_STARTED).raise(err_code);
  if (*err_code) // It logged.
  {
    m_sending = false;
    return;
  }
  // else

  {
    Output_writer writer(get_logger(), m_region.get(),
                         &(signal(Signal_role::S_CHUNK_READY)), &(signal(Signal_role::S_CHUNK_CONSUMED)));
    try
    {
      writer_func(writer);
    }
    catch (...)
    {
      /* Finish the protocol before letting it fly: the receiver gets the (truncated) message's end and we consume its
       * confirmation, so the next message starts in sync.  Whatever goes wrong here is secondary. */
      FLOW_LOG_WARNING("Message_sender [" << *this << "]: Writer function threw after writing "
                       "[" << writer.n_bytes_written() << "] bytes.  Ending message; then rethrowing.");
      Error_code cleanup_err_code;
      writer.close(&cleanup_err_code); // No-op if the writer function already closed (or tried to).
      if (cleanup_err_code)
      {
        FLOW_LOG_WARNING("Message_sender [" << *this << "]: Could not end message cleanly after writer function "
                         "threw.  Error: [" << cleanup_err_code << "] [" << cleanup_err_code.message() << "].");
      }
      else if (!writer.message_delivered())
      {
        // Its own close() failed earlier: the final chunk never reached the receiver, so no confirmation is coming.
        FLOW_LOG_WARNING("Message_sender [" << *this << "]: Writer function threw after a failed close; "
                         "not awaiting consumption confirmation.");
      }
      else
      {
        signal(Signal_role::S_MESSAGE_CONSUMED).wait_and_clear(&cleanup_err_code);
        if (cleanup_err_code)
        {
          FLOW_LOG_WARNING("Message_sender [" << *this << "]: Could not await consumption confirmation after "
                           "writer function threw.  "
                           "Error: [" << cleanup_err_code << "] [" << cleanup_err_code.message() << "].");
        }
      }
      m_sending = false;
      throw;
    }

    writer.close(err_code); // No-op if the writer function did it.
    if (*err_code) // It logged.
    {
      m_sending = false;
      return;
    }
    // else

    FLOW_LOG_TRACE("Message_sender [" << *this << "]: Message #[" << m_n_messages_sent << "] written: "
                   "[" << writer.n_bytes_written() << "] bytes in [" << writer.n_chunks_published() << "] chunks.  "
                   "Awaiting consumption confirmation.");
  } // Output_writer writer

  signal(Signal_role::S_MESSAGE_CONSUMED).wait_and_clear(err_code);
  m_sending = false;
  if (*err_code) // It logged.
  {
    return;
  }
  // else

  ++m_n_messages_sent;
  FLOW_LOG_TRACE("Message_sender [" << *this << "]: Message consumed by receiver.");
} // Message_sender::send_message()

Rendezvous_signal& Message_sender::signal(Signal_role role)
{
  assert(m_signals[size_t(role)] && "As advertised: signal() => undefined behavior if not open.");
  return *m_signals[size_t(role)];
}

const Shared_name& Message_sender::absolute_name() const
{
  return m_absolute_name;
}

bool Message_sender::is_open() const
{
  return bool(m_region);
}

size_t Message_sender::payload_capacity() const
{
  return is_open() ? m_region->payload_capacity() : 0;
}

size_t Message_sender::n_messages_sent() const
{
  return m_n_messages_sent;
}

void Message_sender::remove_persistent(flow::log::Logger* logger_ptr, const Shared_name& channel_name,
                                       Error_code* err_code) // Static.
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { remove_persistent(logger_ptr, channel_name, actual_err_code); },
         err_code, "Message_sender::remove_persistent()"))
  {
    return;
  }
  // else
  err_code->clear();

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_TRANSPORT);
  FLOW_LOG_INFO("Channel [" << channel_name << "]: Removing persistent region and signals.");

  Error_code one_err_code;
  Channel_region::remove_persistent(logger_ptr, channel_name, &one_err_code);
  if (one_err_code)
  {
    *err_code = one_err_code;
  }

  for (size_t idx = 0; idx != size_t(Signal_role::S_END_SENTINEL); ++idx)
  {
    Rendezvous_signal::remove_persistent(logger_ptr, signal_name(channel_name, Signal_role(idx)), &one_err_code);
    if (one_err_code && (!*err_code))
    {
      *err_code = one_err_code;
    }
  }
} // Message_sender::remove_persistent()

std::ostream& operator<<(std::ostream& os, const Message_sender& val)
{
  return os << "[channel[" << val.absolute_name() << "] open[" << val.is_open() << "]]@"
            << static_cast<const void*>(&val);
}

} // namespace mpipe::transport
