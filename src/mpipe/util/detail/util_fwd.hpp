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

#include "mpipe/util/util_fwd.hpp"
#include "mpipe/util/shared_name_fwd.hpp"
#include <flow/common.hpp>
#include <boost/array.hpp>

namespace mpipe::util
{

// Constants.

/**
 * Maps general Permissions_level specifier to low-level #Permissions value, when the underlying resource
 * is in the file-system and is either accessible (read-write in terms of file system) or inaccessible.
 * See any additional user-facing notes in shared_resource_permissions() doc header.
 */
extern const boost::array<Permissions, size_t(Permissions_level::S_END_SENTINEL)>
  SHARED_RESOURCE_PERMISSIONS_LVL_MAP;

// Free functions.

/**
 * Internal (to ::mpipe) utility that invokes the given function that invokes a boost.interprocess operation
 * that is documented to throw `bipc::interprocess_exception` on failure; if indeed it throws the utility
 * emits an error in the Flow error-reporting style.  On error it logs WARNING with all available details.
 *
 * ### Background ###
 * boost.interprocess reports errors by throwing a custom exception type, with no out-arg alternative.  mpipe
 * APIs emit errors the Flow way instead: a native-based #Error_code if the exception carries a native code;
 * else `misc_bipc_lib_error`.
 *
 * @tparam Func
 *         Functor that takes no args and returns nothing.
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param err_code
 *        `err_code` as-if passed to our API.  `*err_code` shall be set if not null depending on success/failure;
 *        if null and no problem, won't throw; if null and problem will throw `Runtime_error` containing a truthy
 *        #Error_code.  That's the usual Flow-style error emission semantics.
 * @param misc_bipc_lib_error
 *        If `func` throws without a native code, emit this value.
 * @param context
 *        Description for logging of the op being attempted, in case there is an error.  Compile-time-known strings
 *        are best, as this is not protected by a filtering macro and hence will be evaluated no matter what.
 * @param func
 *        `func()` shall be executed synchronously.
 */
template<typename Func>
void op_with_possible_bipc_exception(flow::log::Logger* logger_ptr, Error_code* err_code,
                                     const Error_code& misc_bipc_lib_error,
                                     String_view context,
                                     const Func& func);

/**
 * Removes the kernel-persistent SHM object (`bipc::shared_memory_object`, or the backing object of a
 * `bipc::managed_shared_memory`) with the given name.  The name is removed immediately; the underlying memory
 * lives on until every process that has it mapped unmaps it.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param name
 *        Name of the object.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        system codes from `unlink()`, most likely not-found or permission-denied.
 */
void remove_persistent_shm_object(flow::log::Logger* logger_ptr, const Shared_name& name, Error_code* err_code);

} // namespace mpipe::util
