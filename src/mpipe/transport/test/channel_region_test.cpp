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

#include "mpipe/transport/channel_region.hpp"
#include "mpipe/transport/error.hpp"
#include "mpipe/test/test_logger.hpp"
#include "mpipe/test/test_common_util.hpp"
#include <flow/error/error.hpp>
#include <gtest/gtest.h>
#include <boost/interprocess/shared_memory_object.hpp>
#include <boost/interprocess/mapped_region.hpp>
#include <cstring>

namespace mpipe::transport::test
{

namespace
{

using mpipe::test::Test_logger;
using mpipe::test::Scoped_channel_name;

/// Reads byte at `offset` of the SHM object `name` bypassing Channel_region.
uint8_t raw_byte(const Shared_name& name, size_t offset)
{
  bipc::shared_memory_object shm(bipc::open_only, name.native_str(), bipc::read_only);
  bipc::mapped_region region(shm, bipc::read_only);
  return static_cast<const uint8_t*>(region.get_address())[offset];
}

} // namespace (anon)

TEST(Channel_region, Layout)
{
  Test_logger logger;
  const Scoped_channel_name channel(&logger, "regionLayout");
  Channel_region region(&logger, channel.name(), util::OPEN_OR_CREATE);

  EXPECT_EQ(region.absolute_name(), channel.name());
  EXPECT_EQ(region.region_size(), util::host_page_size());
  EXPECT_EQ(region.payload_capacity(), util::host_page_size() - 6);
  EXPECT_EQ(region.payload().size(), region.payload_capacity());
  if (util::host_page_size() == 4096)
  {
    EXPECT_EQ(region.payload_capacity(), 4090u);
  }

  // Fresh => zeroes => at rest.
  EXPECT_TRUE(region.at_rest());
  EXPECT_EQ(region.bytes_in_chunk(), 0u);
  EXPECT_FALSE(region.message_complete());

  region.set_bytes_in_chunk(0x01020304);
  region.set_message_complete(true);
  EXPECT_FALSE(region.at_rest());

  // Host-native integer at offset 0; flag at offset 4; reserved byte at 5 untouched; payload at 6.
  uint32_t native_val;
  uint8_t raw[4];
  for (size_t idx = 0; idx != 4; ++idx)
  {
    raw[idx] = raw_byte(channel.name(), Channel_region::S_BYTES_IN_CHUNK_OFFSET + idx);
  }
  std::memcpy(&native_val, raw, sizeof(native_val));
  EXPECT_EQ(native_val, 0x01020304u);
  EXPECT_EQ(raw_byte(channel.name(), 4), 1);
  EXPECT_EQ(raw_byte(channel.name(), 5), 0);

  util::blob_data(region.payload())[0] = 0xAB;
  EXPECT_EQ(raw_byte(channel.name(), 6), 0xAB);

  region.reset_header();
  EXPECT_TRUE(region.at_rest());
  EXPECT_EQ(raw_byte(channel.name(), 4), 0);
  EXPECT_EQ(raw_byte(channel.name(), 5), 0);
  EXPECT_EQ(raw_byte(channel.name(), 6), 0xAB) << "Resetting the header leaves the payload alone.";
}

TEST(Channel_region, Shared_by_name)
{
  Test_logger logger;
  const Scoped_channel_name channel(&logger, "regionShared");
  Channel_region region1(&logger, channel.name(), util::OPEN_OR_CREATE);
  Channel_region region2(&logger, channel.name(), util::OPEN_OR_CREATE);

  region1.set_bytes_in_chunk(17);
  region1.set_message_complete(true);
  util::blob_data(region1.payload())[16] = 42;

  EXPECT_EQ(region2.bytes_in_chunk(), 17u);
  EXPECT_TRUE(region2.message_complete());
  EXPECT_EQ(util::blob_data(region2.payload())[16], 42);
}

TEST(Channel_region, Size_mismatch)
{
  Test_logger logger;
  const Scoped_channel_name channel(&logger, "regionMismatch");
  {
    bipc::shared_memory_object shm(bipc::create_only, channel.name().native_str(), bipc::read_write);
    shm.truncate(bipc::offset_t(util::host_page_size() * 2));
  }

  Error_code err_code;
  Channel_region region(&logger, channel.name(), util::OPEN_OR_CREATE, util::Permissions(), &err_code);
  EXPECT_EQ(err_code, Error_code(error::Code::S_REGION_SIZE_MISMATCH));

  EXPECT_THROW({ Channel_region region2(&logger, channel.name(), util::OPEN_OR_CREATE); },
               flow::error::Runtime_error);
}

TEST(Channel_region, Remove_persistent)
{
  Test_logger logger;
  const auto name = mpipe::test::unique_channel_name("regionRemove");
  {
    Channel_region region(&logger, name, util::OPEN_OR_CREATE);
    region.set_bytes_in_chunk(5);
  }
  {
    // Still there, state and all.
    Channel_region region(&logger, name, util::OPEN_OR_CREATE);
    EXPECT_EQ(region.bytes_in_chunk(), 5u);
  }

  Error_code err_code;
  Channel_region::remove_persistent(&logger, name, &err_code);
  EXPECT_FALSE(err_code);
  {
    Channel_region region(&logger, name, util::OPEN_OR_CREATE);
    EXPECT_TRUE(region.at_rest()) << "A new object should start zeroed.";
  }
  Channel_region::remove_persistent(&logger, name, &err_code);
  EXPECT_FALSE(err_code);
  Channel_region::remove_persistent(&logger, name, &err_code);
  EXPECT_TRUE(err_code);
}

} // namespace mpipe::transport::test
