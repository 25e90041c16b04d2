/* Flow-Xfer: Core
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


#include "xfer/transport/error.hpp"
#include "xfer/test/test_common_util.hpp"
#include <gtest/gtest.h>
#include <boost/lexical_cast.hpp>
#include <sstream>

namespace xfer::transport::error::test
{

using xfer::test::to_underlying;

TEST(Transport_error, Category)
{
  const Error_code err_code = Code::S_CONSUMER_FAILURE;
  EXPECT_TRUE(err_code);
  EXPECT_STREQ(err_code.category().name(), "xfer/transport");
  EXPECT_EQ(err_code.value(), to_underlying(Code::S_CONSUMER_FAILURE));
  EXPECT_FALSE(err_code.message().empty());
  EXPECT_EQ(err_code, make_error_code(Code::S_CONSUMER_FAILURE));
  EXPECT_NE(err_code, make_error_code(Code::S_PRODUCER_FAILURE));
}

TEST(Transport_error, Every_code_has_a_message)
{
  for (auto val = S_CODE_LOWEST_INT_VALUE; val != to_underlying(Code::S_END_SENTINEL); ++val)
  {
    const Error_code err_code = Code(val);
    EXPECT_TRUE(err_code);
    EXPECT_FALSE(err_code.message().empty()) << "code value " << val;
  }
}

TEST(Transport_error, Symbolic_serialization)
{
  using boost::lexical_cast;
  using std::string;
  using std::istringstream;

  const auto parse = [](const string& str) -> Code
  {
    istringstream is(str);
    Code val;
    is >> val;
    return val;
  };

  EXPECT_EQ(lexical_cast<string>(Code::S_WRITES_FINISHED_CANNOT_WRITE), "WRITES_FINISHED_CANNOT_WRITE");
  EXPECT_EQ(lexical_cast<string>(Code::S_TIMEOUT), "TIMEOUT");

  for (auto val = S_CODE_LOWEST_INT_VALUE; val != to_underlying(Code::S_END_SENTINEL); ++val)
  {
    EXPECT_EQ(parse(lexical_cast<string>(Code(val))), Code(val));
  }
  // Case-insensitive; numbers accepted; unknown => sentinel.
  EXPECT_EQ(parse("producer_failure"), Code::S_PRODUCER_FAILURE);
  EXPECT_EQ(parse(lexical_cast<string>(to_underlying(Code::S_INVALID_ARGUMENT))), Code::S_INVALID_ARGUMENT);
  EXPECT_EQ(parse("NO_SUCH_THING"), Code::S_END_SENTINEL);
}

} // namespace xfer::transport::error::test
