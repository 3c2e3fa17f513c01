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
#include "mpipe/transport/channel_region.hpp"
#include "mpipe/transport/error.hpp"
#include "mpipe/util/detail/util.hpp"
#include <flow/error/error.hpp>
#include <flow/common.hpp>
#include <boost/move/make_unique.hpp>
#include <boost/io/ios_state.hpp>
#include <cstring>
#include <iomanip>

namespace mpipe::transport
{

// Static initializations.

static_assert(Channel_region::S_MESSAGE_COMPLETE_OFFSET
                == Channel_region::S_BYTES_IN_CHUNK_OFFSET + sizeof(uint32_t),
              "bytes_in_chunk is a 4-byte field immediately followed by message_complete.");
static_assert((Channel_region::S_RESERVED_OFFSET == Channel_region::S_MESSAGE_COMPLETE_OFFSET + 1)
                && (Channel_region::S_PAYLOAD_OFFSET == Channel_region::S_RESERVED_OFFSET + 1),
              "message_complete and the reserved byte are 1 byte each, followed by the payload.");

// Implementations.

Channel_region::Channel_region(flow::log::Logger* logger_ptr, const Shared_name& absolute_name_arg,
                               util::Open_or_create, const util::Permissions& perms_on_create,
                               Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_absolute_name(absolute_name_arg)
{
  using flow::log::Sev;
  using flow::error::Runtime_error;
  using boost::io::ios_all_saver;
  using boost::movelib::make_unique;
  using bipc::shared_memory_object;
  using bipc::mapped_region;
  using bipc::offset_t;

  const size_t page_sz = util::host_page_size();

  if (get_logger() && get_logger()->should_log(Sev::S_INFO, get_log_component()))
  {
    ios_all_saver saver(*(get_logger()->this_thread_ostream())); // Revert std::oct/etc. soon.
    FLOW_LOG_INFO_WITHOUT_CHECKING
      ("Channel_region [" << *this << "]: Opening region in open-or-create mode; size [" << page_sz << "]; "
       "perms = [" << std::setfill('0') << std::setw(4) << std::oct << perms_on_create.get_permissions() << "].");
  }

  /* We cannot use the exec_void_and_throw_on_error() trick in a ctor; so gather the result here, and emit it the
   * same way at the end. */
  Error_code our_err_code;

  boost::movelib::unique_ptr<shared_memory_object> shm;
  offset_t cur_size = 0;
  util::op_with_possible_bipc_exception(get_logger(), &our_err_code, error::Code::S_BIPC_MISC_LIBRARY_ERROR,
                                        "Channel_region(): bipc::shared_memory_object()",
                                        [&]()
  {
    shm = make_unique<shared_memory_object>(util::OPEN_OR_CREATE, absolute_name().native_str(),
                                            bipc::read_write, perms_on_create);
    if (!shm->get_size(cur_size))
    {
      cur_size = 0;
    }
  });

  if (!our_err_code)
  {
    if (cur_size == 0)
    {
      // Just created (by us or the other side, who has not sized it yet).  Either way the outcome is the same.
      FLOW_LOG_TRACE("Channel_region [" << *this << "]: Object unsized; sizing to [" << page_sz << "].");
      util::op_with_possible_bipc_exception(get_logger(), &our_err_code, error::Code::S_BIPC_MISC_LIBRARY_ERROR,
                                            "Channel_region(): bipc::shared_memory_object::truncate()",
                                            [&]() { shm->truncate(offset_t(page_sz)); });
    }
    else if (size_t(cur_size) != page_sz)
    {
      FLOW_LOG_WARNING("Channel_region [" << *this << "]: Object exists with size [" << cur_size << "], but "
                       "expected size is one page [" << page_sz << "].  Refusing to use it.");
      our_err_code = error::Code::S_REGION_SIZE_MISMATCH;
    }
  }

  if (!our_err_code)
  {
    boost::movelib::unique_ptr<mapped_region> region;
    util::op_with_possible_bipc_exception(get_logger(), &our_err_code, error::Code::S_BIPC_MISC_LIBRARY_ERROR,
                                          "Channel_region(): bipc::mapped_region()",
                                          [&]() { region = make_unique<mapped_region>(*shm, bipc::read_write); });
    if (!our_err_code)
    {
      m_shm = std::move(shm);
      m_region = std::move(region);
      FLOW_LOG_TRACE("Channel_region [" << *this << "]: Mapped @[" << m_region->get_address() << "]; "
                     "payload capacity [" << payload_capacity() << "]; "
                     "header: bytes_in_chunk [" << bytes_in_chunk() << "], "
                     "message_complete [" << message_complete() << "].");
    }
  }

  if (err_code)
  {
    *err_code = our_err_code;
  }
  else if (our_err_code)
  {
    throw Runtime_error(our_err_code, "Channel_region::Channel_region()");
  }
} // Channel_region::Channel_region()

Channel_region::~Channel_region()
{
  FLOW_LOG_TRACE("Channel_region [" << *this << "]: Unmapping region (already null? = [" << (!m_region) << "]).");
}

const Shared_name& Channel_region::absolute_name() const
{
  return m_absolute_name;
}

uint8_t* Channel_region::base() const
{
  assert(m_region && "As advertised: region access => undefined behavior if not successfully cted.");
  return static_cast<uint8_t*>(m_region->get_address());
}

size_t Channel_region::region_size() const
{
  assert(m_region && "As advertised: region access => undefined behavior if not successfully cted.");
  return m_region->get_size();
}

size_t Channel_region::payload_capacity() const
{
  return region_size() - S_PAYLOAD_OFFSET;
}

uint32_t Channel_region::bytes_in_chunk() const
{
  uint32_t val;
  std::memcpy(&val, base() + S_BYTES_IN_CHUNK_OFFSET, sizeof(val));
  return val;
}

void Channel_region::set_bytes_in_chunk(uint32_t val)
{
  assert(val <= payload_capacity());
  std::memcpy(base() + S_BYTES_IN_CHUNK_OFFSET, &val, sizeof(val));
}

bool Channel_region::message_complete() const
{
  return base()[S_MESSAGE_COMPLETE_OFFSET] != 0;
}

void Channel_region::set_message_complete(bool val)
{
  base()[S_MESSAGE_COMPLETE_OFFSET] = val ? 1 : 0;
}

void Channel_region::reset_header()
{
  // Leave the reserved byte alone.
  set_bytes_in_chunk(0);
  set_message_complete(false);
}

bool Channel_region::at_rest() const
{
  return (bytes_in_chunk() == 0) && (!message_complete());
}

util::Blob_mutable Channel_region::payload()
{
  return util::Blob_mutable(base() + S_PAYLOAD_OFFSET, payload_capacity());
}

util::Blob_const Channel_region::payload() const
{
  return util::Blob_const(base() + S_PAYLOAD_OFFSET, payload_capacity());
}

void Channel_region::remove_persistent(flow::log::Logger* logger_ptr, const Shared_name& absolute_name,
                                       Error_code* err_code) // Static.
{
  util::remove_persistent_shm_object(logger_ptr, absolute_name, err_code);
}

std::ostream& operator<<(std::ostream& os, const Channel_region& val)
{
  return os << "[name[" << val.absolute_name() << "]]@" << static_cast<const void*>(&val);
}

} // namespace mpipe::transport
