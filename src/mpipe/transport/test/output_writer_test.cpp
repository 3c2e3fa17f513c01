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

#include "mpipe/transport/output_writer.hpp"
#include "mpipe/transport/channel_region.hpp"
#include "mpipe/transport/rendezvous_signal.hpp"
#include "mpipe/transport/error.hpp"
#include "mpipe/test/test_logger.hpp"
#include "mpipe/test/test_common_util.hpp"
#include "mpipe/test/test_message_receiver.hpp"
#include <flow/error/error.hpp>
#include <gtest/gtest.h>
#include <cstring>
#include <thread>

namespace mpipe::transport::test
{

namespace
{

using mpipe::test::Test_logger;
using mpipe::test::Scoped_channel_name;
using mpipe::test::Test_message_receiver;
using mpipe::test::make_pattern;
using util::Blob_const;

/// The sender-side resources an Output_writer needs, opened on a fresh channel.
struct Writer_fixture
{
  explicit Writer_fixture(const char* tag) :
    m_channel(&m_logger, tag),
    m_region(&m_logger, m_channel.name(), util::OPEN_OR_CREATE),
    m_chunk_ready(&m_logger, signal_name(m_channel.name(), Signal_role::S_CHUNK_READY), util::OPEN_OR_CREATE),
    m_chunk_consumed(&m_logger, signal_name(m_channel.name(), Signal_role::S_CHUNK_CONSUMED),
                     util::OPEN_OR_CREATE)
  {
    // That's it.
  }

  Test_logger m_logger;
  Scoped_channel_name m_channel;
  Channel_region m_region;
  Rendezvous_signal m_chunk_ready;
  Rendezvous_signal m_chunk_consumed;
}; // struct Writer_fixture

} // namespace (anon)

TEST(Output_writer, Small_writes_stay_pending)
{
  Writer_fixture fix("writerPending");
  Output_writer writer(&fix.m_logger, &fix.m_region, &fix.m_chunk_ready, &fix.m_chunk_consumed);
  EXPECT_EQ(writer.payload_capacity(), fix.m_region.payload_capacity());

  const auto bytes = make_pattern(100);
  writer.write(Blob_const(bytes.data(), 60));
  writer.write(Blob_const(bytes.data(), bytes.size()), 60, 40);
  EXPECT_EQ(writer.n_bytes_written(), 100u);
  EXPECT_EQ(writer.n_chunks_published(), 0u);
  EXPECT_FALSE(fix.m_chunk_ready.try_wait_and_clear()) << "Nothing should be published before overflow or close.";
  EXPECT_TRUE(fix.m_region.at_rest());
  EXPECT_EQ(std::memcmp(util::blob_data(fix.m_region.payload()), bytes.data(), bytes.size()), 0);

  // Pretend the receiver already drained the final chunk, so close() need not block.
  EXPECT_FALSE(writer.message_delivered());
  fix.m_chunk_consumed.raise();
  writer.close();
  EXPECT_TRUE(writer.closed());
  EXPECT_TRUE(writer.message_delivered());
  EXPECT_EQ(writer.n_chunks_published(), 1u);
  EXPECT_TRUE(fix.m_chunk_ready.try_wait_and_clear());
  EXPECT_TRUE(fix.m_region.at_rest()) << "Header should be back at rest after close.";
}

TEST(Output_writer, Invalid_arguments)
{
  Writer_fixture fix("writerInvalid");
  Output_writer writer(&fix.m_logger, &fix.m_region, &fix.m_chunk_ready, &fix.m_chunk_consumed);
  const auto bytes = make_pattern(10);
  const Blob_const blob(bytes.data(), bytes.size());

  Error_code err_code;
  writer.write(blob, 11, 0, &err_code);
  EXPECT_EQ(err_code, Error_code(error::Code::S_INVALID_ARGUMENT));
  writer.write(blob, 5, 6, &err_code);
  EXPECT_EQ(err_code, Error_code(error::Code::S_INVALID_ARGUMENT));
  writer.write(blob, 1, size_t(-1), &err_code);
  EXPECT_EQ(err_code, Error_code(error::Code::S_INVALID_ARGUMENT));
  writer.write(Blob_const(0, 5), &err_code);
  EXPECT_EQ(err_code, Error_code(error::Code::S_INVALID_ARGUMENT));
  EXPECT_THROW(writer.write(blob, 0, 11), flow::error::Runtime_error);

  EXPECT_EQ(writer.n_bytes_written(), 0u);
  EXPECT_FALSE(fix.m_chunk_ready.try_wait_and_clear());

  // Edge of validity: fine.
  writer.write(blob, 10, 0, &err_code);
  EXPECT_FALSE(err_code);
  writer.write(Blob_const(0, 0), &err_code);
  EXPECT_FALSE(err_code);
  writer.write(blob, 4, 6, &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(writer.n_bytes_written(), 6u);

  fix.m_chunk_consumed.raise();
  writer.close();
}

TEST(Output_writer, Write_after_close)
{
  Writer_fixture fix("writerClosed");
  Output_writer writer(&fix.m_logger, &fix.m_region, &fix.m_chunk_ready, &fix.m_chunk_consumed);

  // Empty message: the final handshake happens anyway.
  fix.m_chunk_consumed.raise();
  writer.close();
  EXPECT_TRUE(fix.m_chunk_ready.try_wait_and_clear());
  EXPECT_EQ(writer.n_chunks_published(), 1u);

  const auto bytes = make_pattern(10);
  Error_code err_code;
  writer.write(Blob_const(bytes.data(), bytes.size()), &err_code);
  EXPECT_EQ(err_code, Error_code(error::Code::S_SENDS_FINISHED_CANNOT_SEND));
  EXPECT_EQ(writer.n_bytes_written(), 0u);
  EXPECT_FALSE(fix.m_chunk_ready.try_wait_and_clear());

  // Second close: no-op (in particular does not block awaiting another drain).
  writer.close(&err_code);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(writer.n_chunks_published(), 1u);
  EXPECT_FALSE(fix.m_chunk_ready.try_wait_and_clear());
}

TEST(Output_writer, Destructor_closes)
{
  Writer_fixture fix("writerDtor");
  const auto bytes = make_pattern(33);
  fix.m_chunk_consumed.raise();
  {
    Output_writer writer(&fix.m_logger, &fix.m_region, &fix.m_chunk_ready, &fix.m_chunk_consumed);
    writer.write(Blob_const(bytes.data(), bytes.size()));
  }
  EXPECT_TRUE(fix.m_chunk_ready.try_wait_and_clear());
  EXPECT_TRUE(fix.m_region.at_rest());
}

TEST(Output_writer, Chunking_with_receiver)
{
  Writer_fixture fix("writerChunks");
  Test_message_receiver receiver(&fix.m_logger, fix.m_channel.name());
  Rendezvous_signal sending_started(&fix.m_logger, signal_name(fix.m_channel.name(), Signal_role::S_SENDING_STARTED),
                                    util::OPEN_OR_CREATE);
  const size_t cap = fix.m_region.payload_capacity();

  // One write of 3C + 5 bytes in the middle of a buffer: 3 full chunks, then 5 at close.
  const auto bytes = make_pattern(3 * cap + 5 + 20, 7);

  Test_message_receiver::Message msg;
  Error_code rcv_err_code;
  std::thread rcv_thread([&]() { receiver.receive_message(&msg, Test_message_receiver::S_DEFAULT_TIMEOUT,
                                                          &rcv_err_code); });

  try
  {
    sending_started.raise();
    Output_writer writer(&fix.m_logger, &fix.m_region, &fix.m_chunk_ready, &fix.m_chunk_consumed);
    writer.write(Blob_const(bytes.data(), bytes.size()), 10, 3 * cap + 5);
    EXPECT_EQ(writer.n_chunks_published(), 3u);
    writer.close();
    EXPECT_EQ(writer.n_chunks_published(), 4u);
    EXPECT_EQ(writer.n_bytes_written(), 3 * cap + 5);
    EXPECT_TRUE(writer.message_delivered());
  }
  catch (...)
  {
    rcv_thread.join(); // The receiver gives up on its own (timed waits).
    throw;
  }
  rcv_thread.join();

  ASSERT_FALSE(rcv_err_code) << rcv_err_code.message();
  ASSERT_EQ(msg.m_chunks.size(), 4u);
  for (size_t idx = 0; idx != 3; ++idx)
  {
    EXPECT_EQ(msg.m_chunks[idx].m_bytes_in_chunk, cap);
    EXPECT_FALSE(msg.m_chunks[idx].m_message_complete);
  }
  EXPECT_EQ(msg.m_chunks[3].m_bytes_in_chunk, 5u);
  EXPECT_TRUE(msg.m_chunks[3].m_message_complete);
  EXPECT_EQ(msg.m_bytes, std::vector<uint8_t>(bytes.begin() + 10, bytes.begin() + 10 + 3 * cap + 5));
}

} // namespace mpipe::transport::test
