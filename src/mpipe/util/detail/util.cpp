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
#include "mpipe/util/detail/util_fwd.hpp"
#include "mpipe/util/shared_name.hpp"
#include <flow/error/error.hpp>
#include <flow/common.hpp>
#include <boost/interprocess/shared_memory_object.hpp>
#include <cerrno>

namespace mpipe::util
{

// Initializers.

const boost::array<Permissions, size_t(Permissions_level::S_END_SENTINEL)>
  SHARED_RESOURCE_PERMISSIONS_LVL_MAP
    = {
        Permissions(0), // <= NO_ACCESS
        Permissions(0b110000000), // <= USER_ACCESS.  Value a/k/a 0600.
        Permissions(0b110110000), // <= GROUP_ACCESS.  Value a/k/a 660.
        Permissions(0b110110110) // <= UNRESTRICTED.  Value a/k/a 666.
      };

// Implementations.

void remove_persistent_shm_object(flow::log::Logger* logger_ptr, const Shared_name& name, Error_code* err_code)
{
  using bipc::shared_memory_object;
  using boost::system::system_category;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code)
           { remove_persistent_shm_object(logger_ptr, name, actual_err_code); },
         err_code, "remove_persistent_shm_object()"))
  {
    return;
  }
  // else

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_UTIL);

  FLOW_LOG_INFO("SHM object [" << name << "]: Removing persistent SHM object if possible.");
  const bool ok = shared_memory_object::remove(name.native_str()); // Does not throw.

  if (ok)
  {
    err_code->clear();
    return;
  }
  /* smo::remove() returns only a bool, no code.  In POSIX it ends in ::unlink() (via shm_unlink()), so errno
   * holds the reason. */
#ifndef FLOW_OS_LINUX
  static_assert(false, "Code in remove_persistent_shm_object() relies on Boost invoking Linux unlink() with errno.");
#endif
  const auto& sys_err_code = *err_code = Error_code(errno, system_category());
  FLOW_ERROR_SYS_ERROR_LOG_WARNING();
} // remove_persistent_shm_object()

} // namespace mpipe::util
