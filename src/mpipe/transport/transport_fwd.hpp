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

/**
 * mpipe module providing the one-way, single-sender/single-receiver shared-memory message channel.  A synopsis
 * follows.
 *
 * A *channel* is identified by a channel name (util::Shared_name) known to both processes.  Under that name live
 * two kinds of kernel-persistent resources:
 *   - One Channel_region: a SHM object exactly one host memory page in size, holding a tiny header
 *     (`bytes_in_chunk`, `message_complete`) followed by the payload buffer of capacity C = page size - 6.
 *   - Four Rendezvous_signal objects, one per Signal_role, named via signal_name().
 *
 * Message_sender is the sending side.  Its Message_sender::send_message() hands the user's writer callback an
 * Output_writer; bytes written to it flow through the payload buffer one chunk at a time, each chunk handed over
 * with a `S_CHUNK_READY`/`S_CHUNK_CONSUMED` handshake.  The whole message is bracketed by `S_SENDING_STARTED` and
 * `S_MESSAGE_CONSUMED`.  Thus arbitrarily large messages pass through a small buffer, in order and exactly once,
 * at the pace of the receiver.
 *
 * The receiving side is not part of this library; any process implementing the same handshake against the same
 * names interoperates.  (mpipe::test::Test_message_receiver is one such implementation, used by the tests.)
 */
namespace mpipe::transport
{

// Types.

// Find doc headers near the bodies of these compound types.

class Channel_region;
class Rendezvous_signal;
class Output_writer;
class Message_sender;

/// Convenience alias for the commonly used type util::Shared_name.
using Shared_name = util::Shared_name;

/**
 * The four roles of the rendezvous signals of one channel.  Each is raised by exactly one side and awaited by the
 * other.
 *
 * @internal
 * ### Maintenance ###
 * Do *not* change the order of these constants: the suffix table in rendezvous_signal.cpp is indexed by them.
 */
enum class Signal_role : size_t
{
  /// Sender-to-receiver: a new message is starting.
  S_SENDING_STARTED,

  /// Receiver-to-sender: the receiver has consumed the entire current message.
  S_MESSAGE_CONSUMED,

  /// Sender-to-receiver: a chunk is published in the payload buffer (possibly the final, possibly empty, one).
  S_CHUNK_READY,

  /// Receiver-to-sender: the receiver has drained the published chunk; the payload buffer may be reused.
  S_CHUNK_CONSUMED,

  /// Sentinel: not a valid value.  May be used to, e.g., size an `array<>` mapping from Signal_role.
  S_END_SENTINEL
}; // enum class Signal_role

// Free functions.

/**
 * Returns the name of the kernel-persistent signal of the given role within the channel of the given name:
 * `channel_name / suffix`, where suffix is one of `MessageSending`, `MessageRead`, `BytesWritten`, `BytesRead`
 * (for, respectively, the roles in the order they are declared in Signal_role).  These suffixes are part of the
 * contract with the receiving side and must never change.
 *
 * @param channel_name
 *        Channel name.
 * @param role
 *        Signal role.  Behavior undefined if it is `S_END_SENTINEL` (assertion may trip).
 * @return See above.
 */
Shared_name signal_name(const Shared_name& channel_name, Signal_role role);

/**
 * Prints string representation of the given Signal_role to the given `ostream`; it is the suffix that signal_name()
 * would use.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Signal_role val);

/**
 * Prints string representation of the given Channel_region to the given `ostream`.
 *
 * @relatesalso Channel_region
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Channel_region& val);

/**
 * Prints string representation of the given Rendezvous_signal to the given `ostream`.
 *
 * @relatesalso Rendezvous_signal
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Rendezvous_signal& val);

/**
 * Prints string representation of the given Output_writer to the given `ostream`.
 *
 * @relatesalso Output_writer
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Output_writer& val);

/**
 * Prints string representation of the given Message_sender to the given `ostream`.
 *
 * @relatesalso Message_sender
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Message_sender& val);

} // namespace mpipe::transport
