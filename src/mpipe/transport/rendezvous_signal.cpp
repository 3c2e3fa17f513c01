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
#include "mpipe/transport/rendezvous_signal.hpp"
#include "mpipe/transport/error.hpp"
#include "mpipe/util/detail/util.hpp"
#include <flow/error/error.hpp>
#include <flow/common.hpp>
#include <boost/interprocess/sync/interprocess_mutex.hpp>
#include <boost/interprocess/sync/interprocess_condition.hpp>
#include <boost/interprocess/sync/scoped_lock.hpp>
#include <boost/move/make_unique.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/io/ios_state.hpp>
#include <boost/array.hpp>
#include <iomanip>

namespace mpipe::transport
{

// Types.

/// Everything that lives in the signal's SHM segment.  Constructed exactly once, by whichever process gets there first.
struct Rendezvous_signal::Shm_state
{
  // Constructors/destructor.

  /// Not-raised state.
  Shm_state();

  // Data.

  /// Protects #m_raised.
  bipc::interprocess_mutex m_mutex;

  /// Notified when #m_raised becomes `true`.
  bipc::interprocess_condition m_cond;

  /// Whether the signal is raised.  Protected by #m_mutex.
  bool m_raised;
}; // struct Rendezvous_signal::Shm_state

namespace
{

/// Suffixes of the signal names, indexed by Signal_role.  These are a cross-process contract; never change them.
const boost::array<const char*, size_t(Signal_role::S_END_SENTINEL)> SIGNAL_NAME_SUFFIX_MAP
  = {
      "MessageSending", // <= SENDING_STARTED
      "MessageRead", // <= MESSAGE_CONSUMED
      "BytesWritten", // <= CHUNK_READY
      "BytesRead" // <= CHUNK_CONSUMED
    };

} // namespace (anon)

// Initializers.

const size_t Rendezvous_signal::S_SEGMENT_SIZE = 4096;

// Implementations.

Rendezvous_signal::Shm_state::Shm_state() :
  m_raised(false)
{
  // That's it.
}

Rendezvous_signal::Rendezvous_signal(flow::log::Logger* logger_ptr, const Shared_name& absolute_name_arg,
                                     util::Open_or_create, const util::Permissions& perms_on_create,
                                     Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_absolute_name(absolute_name_arg),
  m_state(0)
{
  using flow::log::Sev;
  using boost::io::ios_all_saver;
  using boost::movelib::make_unique;

  if (get_logger() && get_logger()->should_log(Sev::S_TRACE, get_log_component()))
  {
    ios_all_saver saver(*(get_logger()->this_thread_ostream())); // Revert std::oct/etc. soon.
    FLOW_LOG_TRACE_WITHOUT_CHECKING
      ("Rendezvous_signal [" << *this << "]: Opening signal in open-or-create mode; "
       "perms = [" << std::setfill('0') << std::setw(4) << std::oct << perms_on_create.get_permissions() << "].");
  }

  /* m_segment and m_state are null.  Either call may throw; this will do the right thing including
   * leaving them null on any error.  Note we might throw exception because of this call. */
  util::op_with_possible_bipc_exception(get_logger(), err_code, error::Code::S_BIPC_MISC_LIBRARY_ERROR,
                                        "Rendezvous_signal(): bipc::managed_shared_memory()",
                                        [&]()
  {
    auto segment = make_unique<Segment>(util::OPEN_OR_CREATE, absolute_name().native_str(), S_SEGMENT_SIZE,
                                        static_cast<const void*>(0), perms_on_create);
    // Atomic w/r/t other openers of the segment (bipc locks the segment's internal mutex).
    m_state = segment->find_or_construct<Shm_state>(bipc::unique_instance)();
    m_segment = std::move(segment);
  });
} // Rendezvous_signal::Rendezvous_signal()

Rendezvous_signal::~Rendezvous_signal()
{
  FLOW_LOG_TRACE("Rendezvous_signal [" << *this << "]: Unmapping signal (already null? = [" << (!m_segment) << "]).");
}

const Shared_name& Rendezvous_signal::absolute_name() const
{
  return m_absolute_name;
}

void Rendezvous_signal::raise(Error_code* err_code)
{
  using Lock = bipc::scoped_lock<bipc::interprocess_mutex>;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { raise(actual_err_code); },
         err_code, "Rendezvous_signal::raise()"))
  {
    return;
  }
  // else

  assert(m_state && "As advertised: raise() => undefined behavior if not successfully cted.");

  bool was_raised;
  util::op_with_possible_bipc_exception(get_logger(), err_code, error::Code::S_BIPC_MISC_LIBRARY_ERROR,
                                        "Rendezvous_signal::raise(): bipc::interprocess_mutex::lock()",
                                        [&]()
  {
    Lock lock(m_state->m_mutex);
    was_raised = m_state->m_raised;
    if (!was_raised)
    {
      m_state->m_raised = true;
      m_state->m_cond.notify_one(); // Does not throw.
    }
  });
  if (*err_code) // It logged if truthy.
  {
    return;
  }
  // else

  FLOW_LOG_TRACE("Rendezvous_signal [" << *this << "]: Raised (was already raised => no-op? = "
                 "[" << was_raised << "]).");
} // Rendezvous_signal::raise()

void Rendezvous_signal::wait_and_clear(Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { wait_and_clear(actual_err_code); },
         err_code, "Rendezvous_signal::wait_and_clear()"))
  {
    return;
  }
  // else

  wait_impl<Wait_type::S_WAIT>(util::Fine_duration(), err_code);
}

bool Rendezvous_signal::timed_wait_and_clear(util::Fine_duration timeout_from_now, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, Rendezvous_signal::timed_wait_and_clear, timeout_from_now, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  return wait_impl<Wait_type::S_TIMED_WAIT>(timeout_from_now, err_code);
}

bool Rendezvous_signal::try_wait_and_clear(Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, Rendezvous_signal::try_wait_and_clear, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  return wait_impl<Wait_type::S_POLL>(util::Fine_duration(), err_code);
}

template<Rendezvous_signal::Wait_type WAIT_TYPE>
bool Rendezvous_signal::wait_impl([[maybe_unused]] util::Fine_duration timeout_from_now, Error_code* err_code)
{
  using boost::chrono::round;
  using boost::chrono::microseconds;
  using boost::posix_time::ptime;
  using boost::posix_time::microsec_clock;
  using Lock = bipc::scoped_lock<bipc::interprocess_mutex>;

  assert(err_code);
  assert(m_state && "As advertised: wait_*() => undefined behavior if not successfully cted.");

  [[maybe_unused]] ptime deadline;
  if constexpr(WAIT_TYPE == Wait_type::S_TIMED_WAIT)
  {
    // bipc waits on this clock when given a ptime.
    deadline = microsec_clock::universal_time()
               + boost::posix_time::microseconds(round<microseconds>(timeout_from_now).count());
    FLOW_LOG_TRACE("Rendezvous_signal [" << *this << "]: Blocking-timed-await-raised; "
                   "timeout ~[" << round<microseconds>(timeout_from_now) << "].");
  }
  else if constexpr(WAIT_TYPE == Wait_type::S_WAIT)
  {
    FLOW_LOG_TRACE("Rendezvous_signal [" << *this << "]: Blocking-await-raised.");
  }

  bool raised = false;
  /* Technically [timed_]wait() and lock() can throw, if the mutex is in a bad state.  The wrapper normalizes it
   * to *err_code. */
  util::op_with_possible_bipc_exception(get_logger(), err_code, error::Code::S_BIPC_MISC_LIBRARY_ERROR,
                                        "Rendezvous_signal::wait_impl(): "
                                          "bipc::interprocess_condition::[timed_]wait()",
                                        [&]()
  {
    Lock lock(m_state->m_mutex);

    if constexpr(WAIT_TYPE == Wait_type::S_WAIT)
    {
      while (!m_state->m_raised)
      {
        m_state->m_cond.wait(lock); // Lock unlocked throughout wait.
      }
    }
    else if constexpr(WAIT_TYPE == Wait_type::S_TIMED_WAIT)
    {
      while (!m_state->m_raised)
      {
        if (!m_state->m_cond.timed_wait(lock, deadline))
        {
          break; // Timeout reached; m_raised is checked once more below.
        }
      }
    }
    // else if (S_POLL) { Just check it. }

    raised = m_state->m_raised;
    m_state->m_raised = false;
  }); // op_with_possible_bipc_exception()

  if (*err_code) // It logged if truthy.
  {
    return false;
  }
  // else

  FLOW_LOG_TRACE("Rendezvous_signal [" << *this << "]: Poll/wait/timed-wait-raised: "
                 "was raised (now cleared)? = [" << raised << "].");
  return raised;
} // Rendezvous_signal::wait_impl()

void Rendezvous_signal::remove_persistent(flow::log::Logger* logger_ptr, const Shared_name& absolute_name,
                                          Error_code* err_code) // Static.
{
  util::remove_persistent_shm_object(logger_ptr, absolute_name, err_code);
}

Shared_name signal_name(const Shared_name& channel_name, Signal_role role)
{
  assert(role != Signal_role::S_END_SENTINEL);
  return channel_name / SIGNAL_NAME_SUFFIX_MAP[size_t(role)];
}

std::ostream& operator<<(std::ostream& os, Signal_role val)
{
  assert(val != Signal_role::S_END_SENTINEL);
  return os << SIGNAL_NAME_SUFFIX_MAP[size_t(val)];
}

std::ostream& operator<<(std::ostream& os, const Rendezvous_signal& val)
{
  return os << "[name[" << val.absolute_name() << "]]@" << static_cast<const void*>(&val);
}

} // namespace mpipe::transport
