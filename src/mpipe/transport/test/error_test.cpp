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

#include "mpipe/transport/error.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <string>

namespace mpipe::transport::test
{

TEST(Transport_error, Category_and_messages)
{
  using error::Code;

  for (int val = error::S_CODE_LOWEST_INT_VALUE; val != int(Code::S_END_SENTINEL); ++val)
  {
    const Error_code err_code = Code(val);
    EXPECT_TRUE(err_code) << "Code int value [" << val << "].";
    EXPECT_EQ(std::string(err_code.category().name()), "mpipe/transport");
    EXPECT_FALSE(err_code.message().empty());
  }

  const Error_code err_code = Code::S_INVALID_ARGUMENT;
  EXPECT_EQ(err_code, Error_code(Code::S_INVALID_ARGUMENT));
  EXPECT_NE(err_code, Error_code(Code::S_TIMEOUT));
}

TEST(Transport_error, Symbolic_stream_io)
{
  using error::Code;

  std::ostringstream os;
  os << Code::S_SEND_ALREADY_IN_PROGRESS << ' ' << Code::S_REGION_SIZE_MISMATCH;
  EXPECT_EQ(os.str(), "SEND_ALREADY_IN_PROGRESS REGION_SIZE_MISMATCH");

  Code code;
  std::istringstream is1("CHANNEL_CLOSED_CANNOT_SEND");
  is1 >> code;
  EXPECT_EQ(code, Code::S_CHANNEL_CLOSED_CANNOT_SEND);

  std::istringstream is2("invalid_argument");
  is2 >> code;
  EXPECT_EQ(code, Code::S_INVALID_ARGUMENT);

  std::istringstream is3(std::to_string(int(Code::S_SENDS_FINISHED_CANNOT_SEND)));
  is3 >> code;
  EXPECT_EQ(code, Code::S_SENDS_FINISHED_CANNOT_SEND);

  std::istringstream is4("NOT_A_CODE");
  is4 >> code;
  EXPECT_EQ(code, Code::S_END_SENTINEL);
}

} // namespace mpipe::transport::test
