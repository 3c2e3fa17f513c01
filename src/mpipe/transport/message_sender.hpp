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
#include <boost/move/unique_ptr.hpp>
#include <boost/noncopyable.hpp>
#include <boost/array.hpp>

namespace mpipe::transport
{

// Types.

/**
 * The sending end of a one-way shared-memory message channel: sends messages, each an arbitrarily long byte
 * sequence, to the one receiving process attached to the same channel name; in order, exactly once, and at the
 * receiver's pace.
 *
 * ### Setup ###
 * Construction opens the channel: the Channel_region and the four `Rendezvous_signal`s named after `channel_name`
 * (see signal_name()) are opened, or created if absent; so it does not matter whether the sender or the receiver
 * starts first.  The resources are kernel-persistent and outlive both processes; remove them with
 * remove_persistent() when the channel is no longer needed.  dispose() (or destruction) merely detaches.
 *
 * ### Sending ###
 * send_message() sends one message.  The message's bytes are produced by a user callback writing into an
 * Output_writer.  The protocol, from the sender's point of view:
 *   -# Raise `S_SENDING_STARTED`.
 *   -# Run the callback.  Each time the payload buffer fills up, a chunk is handed over (`S_CHUNK_READY`, then
 *      wait for `S_CHUNK_CONSUMED`).
 *   -# Close the writer: hand over the final chunk marked `message_complete`.
 *   -# Wait for `S_MESSAGE_CONSUMED`.
 *
 * Every wait is unbounded: if the receiver stops responding, send_message() blocks forever.  There is no retry.
 *
 * ### Writer callback ###
 * The callback may write any number of bytes through any number of Output_writer::write() calls, and may close()
 * the writer itself; if it does not, send_message() does.  It must not keep the writer past its return, and must
 * not call send_message() on the same object (this is detected and rejected).  If it throws, the message is ended
 * anyway (so the receiver sees a complete, if truncated, message; and its confirmation is consumed), and then the
 * exception propagates out of send_message() unchanged.
 *
 * ### Thread safety ###
 * None: calls on one object must be serialized by the user.  One channel name must have at most one
 * Message_sender in use at a time, system-wide.
 */
class Message_sender :
  public flow::log::Log_context,
  private boost::noncopyable // And not movable.
{
public:
  // Types.

  /// The writer callback type of send_message().
  using Writer_func = Function<void (Output_writer& writer)>;

  // Constructors/destructor.

  /**
   * Opens the channel of the given name, as explained in the class doc header.  On error the object is in not-open
   * state: is_open() is `false`, and send_message() will fail.
   *
   * Leftovers of an earlier sender (a header not at rest; a raised `S_CHUNK_CONSUMED` or `S_MESSAGE_CONSUMED`) are
   * reset, with a WARNING.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param channel_name
   *        The channel name.
   * @param perms_on_create
   *        Permissions to use for each resource created by us.  Suggest the use of
   *        util::shared_resource_permissions().
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        those of Channel_region::Channel_region(), Rendezvous_signal::Rendezvous_signal() and
   *        Rendezvous_signal::try_wait_and_clear().
   */
  explicit Message_sender(flow::log::Logger* logger_ptr, const Shared_name& channel_name,
                          const util::Permissions& perms_on_create = util::Permissions(),
                          Error_code* err_code = 0);

  /// Calls dispose().
  ~Message_sender();

  // Methods.

  /**
   * Sends one message whose bytes are produced by `writer_func`; blocks until the receiver has consumed all of it.
   * See class doc header.
   *
   * @param writer_func
   *        Callback invoked synchronously exactly once (unless an error is detected first) with the Output_writer.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_ARGUMENT (`writer_func` is empty),
   *        error::Code::S_CHANNEL_CLOSED_CANNOT_SEND (not open),
   *        error::Code::S_SEND_ALREADY_IN_PROGRESS (called from within `writer_func`),
   *        those of Rendezvous_signal::raise() and Rendezvous_signal::wait_and_clear().
   *        In the first 3 cases nothing happens on the channel.  Exceptions thrown by `writer_func` propagate.
   */
  void send_message(const Writer_func& writer_func, Error_code* err_code = 0);

  /**
   * Detaches from the channel: unmaps the region and the signals.  The object is not-open afterwards.  Does nothing
   * if already not open.  Must not be called from the writer callback (it is then ignored, with a WARNING).
   */
  void dispose();

  /**
   * Returns name equal to `channel_name` passed to ctor.
   * @return See above.
   */
  const Shared_name& absolute_name() const;

  /**
   * Returns `true` if and only if the channel is open: constructed successfully and not disposed.
   * @return See above.
   */
  bool is_open() const;

  /**
   * C: the payload buffer capacity; 0 if not open.
   * @return See above.
   */
  size_t payload_capacity() const;

  /**
   * Number of messages whose consumption the receiver confirmed.
   * @return See above.
   */
  size_t n_messages_sent() const;

  /**
   * Removes the kernel-persistent resources of the given channel: its region and its four signals.  Each removal is
   * attempted regardless of the others' outcome.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param channel_name
   *        The channel name.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        the first error of Channel_region::remove_persistent() and Rendezvous_signal::remove_persistent().
   */
  static void remove_persistent(flow::log::Logger* logger_ptr, const Shared_name& channel_name,
                                Error_code* err_code = 0);

private:
  // Types.

  /// Short-hand for the signal handles, indexed by Signal_role.
  using Signals = boost::array<boost::movelib::unique_ptr<Rendezvous_signal>, size_t(Signal_role::S_END_SENTINEL)>;

  // Methods.

  /**
   * The signal of the given role.  Behavior undefined if not open.
   *
   * @param role
   *        Role.
   * @return See above.
   */
  Rendezvous_signal& signal(Signal_role role);

  // Data.

  /// See absolute_name().
  const Shared_name m_absolute_name;

  /// The channel region; null if not open.
  boost::movelib::unique_ptr<Channel_region> m_region;

  /// The signals; all null if not open.
  Signals m_signals;

  /// `true` while send_message() is executing.
  bool m_sending;

  /// See n_messages_sent().
  size_t m_n_messages_sent;
}; // class Message_sender

} // namespace mpipe::transport
