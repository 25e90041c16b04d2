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


#include "xfer/transport/stream_writer.hpp"
#include "xfer/transport/stream_reader.hpp"
#include "xfer/transport/byte_channel.hpp"
#include "xfer/transport/error.hpp"
#include "xfer/test/test_common_util.hpp"
#include "xfer/test/test_logger.hpp"
#include <gtest/gtest.h>
#include <boost/thread/thread.hpp>
#include <algorithm>

namespace xfer::transport::test
{

namespace
{

using xfer::test::Bytes;
using xfer::test::Test_logger;
using xfer::test::make_payload;
using xfer::test::split_payload;
using util::Blob_const;
using util::Blob_mutable;

} // Anonymous namespace

TEST(Stream_facades, Writer_reports_accepted)
{
  Test_logger logger;
  Byte_channel chan(&logger, "writer", 123, 0);
  Stream_writer writer(&chan);
  const auto payload = make_payload(100);

  EXPECT_EQ(writer.expected_size(), 123u);
  EXPECT_EQ(writer.write(Blob_const(payload.data(), 60)), 60u);
  EXPECT_EQ(writer.write(Blob_const(payload.data() + 60, 40)), 40u);
  EXPECT_EQ(writer.bytes_written(), 100u);
  EXPECT_TRUE(writer.close());

  Error_code err_code;
  EXPECT_EQ(writer.write(Blob_const(payload.data(), 1), &err_code), 0u);
  EXPECT_EQ(err_code, error::Code::S_WRITES_FINISHED_CANNOT_WRITE);
  EXPECT_FALSE(writer.error()); // Writing after close is the caller's mistake; the channel is fine.
}

TEST(Stream_facades, Read_is_short_only_at_end_of_stream)
{
  Test_logger logger;
  Byte_channel chan(&logger, "read", 150, 0);
  Stream_writer writer(&chan);
  Stream_reader reader(&chan);
  const auto payload = make_payload(150, 5);

  // Producer trickles 1-byte fragments; yet each read() must come back full (until the end).
  boost::thread producer([&]()
  {
    for (const auto& fragment : split_payload(payload, { 1 }))
    {
      writer.write(fragment);
    }
    writer.close();
  });

  Bytes received(300);
  EXPECT_EQ(reader.read(Blob_mutable(received.data(), 100)), 100u);
  EXPECT_EQ(reader.tell(), 100u);
  EXPECT_EQ(reader.read(Blob_mutable(received.data() + 100, 100)), 50u);
  EXPECT_EQ(reader.read(Blob_mutable(received.data() + 150, 100)), 0u);
  EXPECT_EQ(reader.read(Blob_mutable(received.data() + 150, 100)), 0u);
  producer.join();

  received.resize(150);
  EXPECT_EQ(received, payload);
  EXPECT_EQ(reader.size(), 150u);
  EXPECT_EQ(reader.tell(), 150u);
}

TEST(Stream_facades, Read_some_returns_what_is_pending)
{
  Test_logger logger;
  Byte_channel chan(&logger, "read-some", 0, 0);
  Stream_writer writer(&chan);
  Stream_reader reader(&chan);
  const auto payload = make_payload(10);

  writer.write(Blob_const(payload.data(), payload.size()));
  Bytes window(100);
  EXPECT_EQ(reader.read_some(Blob_mutable(window.data(), window.size())), 10u);

  Error_code err_code;
  EXPECT_EQ(reader.read(Blob_mutable(), &err_code), 0u);
  EXPECT_FALSE(err_code);
}

TEST(Stream_facades, Progress_callback)
{
  Test_logger logger;
  const auto payload = make_payload(10000, 6);
  Byte_channel chan(&logger, "progress", payload.size(), 0);
  Stream_writer writer(&chan);

  std::vector<size_t> progress;
  Stream_reader reader(&chan, [&](size_t n_read_total) { progress.push_back(n_read_total); });

  for (const auto& fragment : split_payload(payload, { 3000 }))
  {
    writer.write(fragment);
  }
  writer.close();

  Bytes window(1024);
  while (reader.read(Blob_mutable(window.data(), window.size())) != 0)
  {
    EXPECT_EQ(progress.back(), reader.tell());
  }

  ASSERT_FALSE(progress.empty());
  EXPECT_TRUE(std::is_sorted(progress.begin(), progress.end()));
  EXPECT_EQ(progress.back(), payload.size());
  // Invoked for non-empty reads only: no repeats at end-of-stream.
  EXPECT_EQ(std::adjacent_find(progress.begin(), progress.end()), progress.end());
}

TEST(Stream_facades, For_each_chunk)
{
  Test_logger logger;
  const auto payload = make_payload(1000, 7);
  Byte_channel chan(&logger, "chunks", payload.size(), 0);
  Stream_writer writer(&chan);
  Stream_reader reader(&chan);

  for (const auto& fragment : split_payload(payload, { 99, 1, 250 }))
  {
    writer.write(fragment);
  }
  writer.close();

  Bytes received;
  std::vector<size_t> chunk_sizes;
  Error_code err_code;
  const auto n = reader.for_each_chunk(64, [&](const Blob_const& chunk)
  {
    const auto start = static_cast<const uint8_t*>(chunk.data());
    received.insert(received.end(), start, start + chunk.size());
    chunk_sizes.push_back(chunk.size());
  }, &err_code);

  EXPECT_FALSE(err_code);
  EXPECT_EQ(n, payload.size());
  EXPECT_EQ(received, payload);
  ASSERT_EQ(chunk_sizes.size(), 16u); // 15 * 64 + 40.
  EXPECT_EQ(chunk_sizes.back(), 40u);
}

TEST(Stream_facades, Producer_abort_fails_reader)
{
  Test_logger logger;
  Byte_channel chan(&logger, "producer-abort", 100, 0);
  Stream_writer writer(&chan);
  Stream_reader reader(&chan);

  Error_code read_err_code;
  boost::thread consumer([&]()
  {
    Bytes window(100);
    reader.read(Blob_mutable(window.data(), window.size()), &read_err_code);
  });

  const auto payload = make_payload(30);
  writer.write(Blob_const(payload.data(), payload.size()));
  EXPECT_TRUE(writer.abort());
  consumer.join();

  EXPECT_EQ(read_err_code, error::Code::S_PRODUCER_FAILURE);
  EXPECT_EQ(reader.error(), error::Code::S_PRODUCER_FAILURE);
  EXPECT_FALSE(writer.abort());
}

TEST(Stream_facades, Consumer_abort_fails_writer)
{
  Test_logger logger;
  Byte_channel chan(&logger, "consumer-abort", 100, 0);
  Stream_writer writer(&chan);
  Stream_reader reader(&chan);

  EXPECT_TRUE(reader.abort());

  const auto payload = make_payload(30);
  Error_code err_code;
  EXPECT_EQ(writer.write(Blob_const(payload.data(), payload.size()), &err_code), 0u);
  EXPECT_EQ(err_code, error::Code::S_CONSUMER_FAILURE);
  EXPECT_EQ(writer.error(), error::Code::S_CONSUMER_FAILURE);
}

} // namespace xfer::transport::test
