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
#include <boost/interprocess/mapped_region.hpp>

namespace mpipe::util
{

// Initializations.

const Open_or_create OPEN_OR_CREATE;

// Implementations.

Permissions shared_resource_permissions(Permissions_level permissions_lvl)
{
  const auto raw_lvl = size_t(permissions_lvl);
  assert((raw_lvl < size_t(Permissions_level::S_END_SENTINEL))
         && "Seems the sentinel enum value was specified, or there is an internal maintenance bug.");

  return SHARED_RESOURCE_PERMISSIONS_LVL_MAP[raw_lvl];
}

size_t host_page_size()
{
  // Queried once; it cannot change while we run.
  static const size_t S_PAGE_SIZE = bipc::mapped_region::get_page_size();
  return S_PAGE_SIZE;
}

const uint8_t* blob_data(const Blob_const& blob)
{
  return static_cast<const uint8_t*>(blob.data());
}

uint8_t* blob_data(const Blob_mutable& blob)
{
  return static_cast<uint8_t*>(blob.data());
}

} // namespace mpipe::util
