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
#include <boost/interprocess/managed_shared_memory.hpp>
#include <boost/move/unique_ptr.hpp>
#include <boost/noncopyable.hpp>

namespace mpipe::transport
{

// Types.

/**
 * A named, kernel-persistent, binary rendezvous signal usable across processes: one side raise()s it; the other
 * side wait_and_clear()s it, which blocks until it is raised and then resets it, so that exactly one wait is satisfied
 * per raise.  Raising an already-raised signal is a no-op: the signal is binary, not counting.
 *
 * This is the primitive underlying all four of the per-channel signals (see Signal_role and signal_name()).  It is
 * fine to construct it for the same name in several processes (or several times in one); all such objects refer to
 * the same signal, and whichever constructs first creates it.  The signal's state survives all objects referring to
 * it; so a raise with nobody waiting is remembered, until a wait consumes it.
 *
 * Besides the blocking wait_and_clear() (the only wait Message_sender uses) there are timed_wait_and_clear() and
 * try_wait_and_clear(); these are useful for a receiver implementation that must not hang forever, such as the
 * test receiver.
 *
 * ### Error reporting ###
 * All APIs use the Flow `Error_code* err_code = 0` convention.  The constructor may fail (system error from creating
 * or mapping the SHM segment); in that case the object is unusable: any further call except the destructor and
 * absolute_name() yields undefined behavior.  Errors after successful construction are unlikely and amount to
 * boost.interprocess mutex/condition errors, normalized to system or error::Code::S_BIPC_MISC_LIBRARY_ERROR codes.
 *
 * ### Thread safety ###
 * Concurrent calls on one object, or on several objects of the same name in any processes, are safe.
 *
 * @internal
 * ### Implementation ###
 * The signal is a tiny `bipc::managed_shared_memory` segment containing one unique instance of Shm_state: a
 * process-shared mutex, a condition variable, and the `raised` flag.  bipc's find-or-construct of the unique
 * instance is atomic w/r/t other processes opening the same segment; so there is no window where one side sees a
 * half-initialized state.  (A plain `bipc::shared_memory_object` would not give us that: the creator would have to
 * initialize the mutex after creation, racing against an opener.)
 */
class Rendezvous_signal :
  public flow::log::Log_context,
  private boost::noncopyable // And not movable.
{
public:
  // Constructors/destructor.

  /**
   * Opens the signal of the given name, creating it (in not-raised state) if it does not yet exist.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param absolute_name
   *        Name of the signal; see signal_name().
   * @param mode_tag
   *        Tag (for now there is only the one mode).
   * @param perms_on_create
   *        Permissions to use if the segment is created by us.  Suggest the use of
   *        util::shared_resource_permissions().
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        system codes from `shm_open()`, `ftruncate()`, `mmap()`; error::Code::S_BIPC_MISC_LIBRARY_ERROR.
   */
  explicit Rendezvous_signal(flow::log::Logger* logger_ptr, const Shared_name& absolute_name,
                             util::Open_or_create mode_tag,
                             const util::Permissions& perms_on_create = util::Permissions(),
                             Error_code* err_code = 0);

  /// Unmaps the signal; the signal itself (and its raised state) persists; see remove_persistent().
  ~Rendezvous_signal();

  // Methods.

  /**
   * Returns name equal to `absolute_name` passed to ctor.
   * @return See above.
   */
  const Shared_name& absolute_name() const;

  /**
   * Raises the signal, waking up one waiter if any; if already raised, does nothing.  Non-blocking (except for a
   * short mutex lock).
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        system codes and error::Code::S_BIPC_MISC_LIBRARY_ERROR (unlikely).
   */
  void raise(Error_code* err_code = 0);

  /**
   * Blocks until the signal is raised (returning immediately if it already is); then resets it to not-raised.
   * There is no timeout.
   *
   * @param err_code
   *        See raise().
   */
  void wait_and_clear(Error_code* err_code = 0);

  /**
   * Like wait_and_clear() but gives up after the given time, in which case the signal is untouched.
   *
   * @param timeout_from_now
   *        Maximum time to wait.
   * @param err_code
   *        See raise().
   * @return `true` if the signal was raised (and is now cleared); `false` on timeout or error.
   */
  bool timed_wait_and_clear(util::Fine_duration timeout_from_now, Error_code* err_code = 0);

  /**
   * Non-blocking: if the signal is raised resets it and returns `true`, else returns `false`.
   *
   * @param err_code
   *        See raise().
   * @return `true` if the signal was raised (and is now cleared); `false` if not, or on error.
   */
  bool try_wait_and_clear(Error_code* err_code = 0);

  /**
   * Removes the named persistent signal.  The name is removed from the system immediately; objects currently
   * referring to it keep working (with each other only) until destroyed.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param absolute_name
   *        Name of the signal.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        system codes, most likely not-found or permission-denied.
   */
  static void remove_persistent(flow::log::Logger* logger_ptr, const Shared_name& absolute_name,
                                Error_code* err_code = 0);

private:
  // Types.

  /// The flavors of wait_impl().
  enum class Wait_type
  {
    /// Check once and return.
    S_POLL,
    /// Block until raised.
    S_WAIT,
    /// Block until raised or a deadline.
    S_TIMED_WAIT
  };

  /// The data living inside the SHM segment.  Defined in .cpp.
  struct Shm_state;

  /// Short-hand for the SHM segment type.
  using Segment = bipc::managed_shared_memory;

  // Constants.

  /// Size of the SHM segment we create; generously fits Shm_state plus bipc's segment-management overhead.
  static const size_t S_SEGMENT_SIZE;

  // Methods.

  /**
   * Impl of the 3 wait flavors.
   *
   * @tparam WAIT_TYPE
   *         See Wait_type.
   * @param timeout_from_now
   *        Ignored unless `WAIT_TYPE == Wait_type::S_TIMED_WAIT`.
   * @param err_code
   *        See public wait methods.
   * @return `true` if the signal was raised and is now cleared.
   */
  template<Wait_type WAIT_TYPE>
  bool wait_impl(util::Fine_duration timeout_from_now, Error_code* err_code);

  // Data.

  /// See absolute_name().
  const Shared_name m_absolute_name;

  /// The mapped SHM segment; null if ctor failed.
  boost::movelib::unique_ptr<Segment> m_segment;

  /// Pointer to the state inside `*m_segment`; null if ctor failed.
  Shm_state* m_state;
}; // class Rendezvous_signal

} // namespace mpipe::transport
