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

/* flow/common.hpp must come first: it #defines FLOW_LOG_CFG_COMPONENT_ENUM_* for Flow's own component enum, and
 * mpipe/detail/common.hpp re-#defines them for ours. */
#include <flow/util/util.hpp>

#include "mpipe/detail/common.hpp"
#include <boost/interprocess/interprocess_fwd.hpp>

#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any mpipe/ API headers, use C++17 compile mode or later."
#endif

/**
 * Catch-all namespace for mpipe: a one-way, local-host message pipe between exactly one sending process and one
 * receiving process, running over a single page of shared memory plus four named rendezvous signals.
 *
 * Modules overview
 * ----------------
 *   - *mpipe::transport*: the point of the library.  Message_sender owns the channel's shared resources and
 *     sends one message at a time; the user writes the message's bytes into an Output_writer, which chunks them
 *     through the fixed-size payload area of a Channel_region, handshaking with the receiver via
 *     Rendezvous_signal objects after each chunk.
 *   - *mpipe::util*: miscellaneous building blocks; notably util::Shared_name, which names every shared resource.
 *   - *mpipe::test*: test-support library (not part of `mpipe_core`): test logger/config and a conforming
 *     receiver used to exercise the sender.
 *
 * Relationship with Flow and Boost
 * --------------------------------
 * mpipe requires Flow and Boost, not only internally but in its APIs.  `flow::log` is the logging system
 * (pass a `flow::log::Logger*` to constructors; null means log nowhere), and `flow::Error_code` conventions are
 * used for error reporting: each fallible API takes a trailing `Error_code* err_code = 0`; if null, an error is
 * thrown as `flow::error::Runtime_error`, else it is stored in `*err_code`.  boost.interprocess provides the
 * shared memory and process-shared synchronization primitives underneath.
 */
namespace mpipe
{

// Types.

/**
 * @namespace mpipe::bipc
 * @brief Short-hand for boost.interprocess namespace.
 */
namespace bipc = boost::interprocess;

/// Short-hand for `flow::Error_code` which is very common.
using Error_code = flow::Error_code;

/// Short-hand for polymorphic functor holder which is very common.  This is essentially `std::function`.
template<typename Signature>
using Function = flow::Function<Signature>;

#ifdef MPIPE_DOXYGEN_ONLY // Actual compilation will ignore the below; but Doxygen will scan it and generate docs.

/**
 * The `flow::log::Component` payload enumeration containing the log components used by mpipe internal logging.
 * The actual members are generated by `flow::log` macro magic from `log_component_enum_declare.macros.hpp`;
 * look there for the list.
 */
enum class Log_component
{
  /// Placeholder for Doxygen only; see above.
  S_END_SENTINEL
};

/**
 * The map generated by `flow::log` macro magic that maps each enumerated value in mpipe::Log_component to its
 * string representation as used in log output and verbosity config.  Pass it to
 * `flow::log::Config::init_component_names()` when setting up logging in a program using mpipe.
 */
extern const boost::unordered_multimap<Log_component, std::string> S_MPIPE_LOG_COMPONENT_NAME_MAP;

#endif // MPIPE_DOXYGEN_ONLY

} // namespace mpipe
