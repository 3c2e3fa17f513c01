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

#include "mpipe/common.hpp"
#include <flow/log/log.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/interprocess/permissions.hpp>
#include <boost/interprocess/creation_tags.hpp>

/**
 * mpipe module containing miscellaneous general-use facilities used by the other modules.  Of note is
 * util::Shared_name, which names each shared resource (the channel region and its signals).
 */
namespace mpipe::util
{

// Types.

// Find doc headers near the bodies of these compound types.

class Shared_name;

/**
 * Simple specifier of desired access permissions, translated into a #Permissions value via
 * shared_resource_permissions().  Assumes the POSIX-y groupings "user themselves," "user's group," and "everyone."
 *
 * @internal
 * ### Maintenance ###
 * Do *not* change the order of these constants: `*_PERMISSIONS_LVL_MAP` arrays are indexed by them.
 */
enum class Permissions_level : size_t
{
  /// Forbids all access, even by the creator's user.  Most likely this would be useful for testing or debugging.
  S_NO_ACCESS,

  /// Allows access by resource-owning user (in POSIX/Unix identified by UID) and no one else.
  S_USER_ACCESS,

  /// Allows access by resource-owning user's containing group(s) (in POSIX/Unix identified by GID) and owner.
  S_GROUP_ACCESS,

  /// Allows access by all.
  S_UNRESTRICTED,

  /// Sentinel: not a valid value.  May be used to, e.g., size an `array<>` mapping from Permissions_level.
  S_END_SENTINEL
}; // enum class Permissions_level

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;
/// Short-hand for Flow's `Fine_duration`.
using Fine_duration = flow::Fine_duration;

/**
 * Short-hand for an immutable blob somewhere in memory, stored as exactly a `void const *` and a `size_t`.
 * To create and access these use the boost.asio buffer APIs (`boost::asio::buffer()` and friends).
 */
using Blob_const = boost::asio::const_buffer;

/**
 * Short-hand for an mutable blob somewhere in memory, stored as exactly a `void*` and a `size_t`.
 * @see util::Blob_const.
 */
using Blob_mutable = boost::asio::mutable_buffer;

/// Tag type indicating an atomic open-if-exists-else-create operation.  @see #OPEN_OR_CREATE.
using Open_or_create = bipc::open_or_create_t;

/// Short-hand for Unix (POSIX) permissions class.
using Permissions = bipc::permissions;

// Constants.

/// Tag value indicating an open-if-exists-else-create operation.
extern const Open_or_create OPEN_OR_CREATE;

// Free functions.

/**
 * Maps general Permissions_level specifier to low-level #Permissions value, when the underlying resource
 * is in the file-system and is either accessible (read-write in terms of file system) or inaccessible.
 * Examples of such resources are the channel region (transport::Channel_region) and the signal segments
 * (transport::Rendezvous_signal), all of which live in /dev/shm in Linux.
 *
 * @param permissions_lvl
 *        The value to translate.  Behavior undefined if it is `S_END_SENTINEL` (assertion may trip).
 * @return The result.
 */
Permissions shared_resource_permissions(Permissions_level permissions_lvl);

/**
 * Returns the size of one page of memory on this host, as reported by the OS.  This is the size of every channel
 * region (transport::Channel_region).
 *
 * @return See above.
 */
size_t host_page_size();

/**
 * Syntactic-sugary helper that returns pointer to first byte in an immutable buffer, as `const uint8_t*`.
 *
 * @param blob
 *        The buffer.
 * @return See above.
 */
const uint8_t* blob_data(const Blob_const& blob);

/**
 * Syntactic-sugary helper that returns pointer to first byte in a mutable buffer, as `uint8_t*`.
 *
 * @param blob
 *        The buffer.
 * @return See above.
 */
uint8_t* blob_data(const Blob_mutable& blob);

} // namespace mpipe::util
