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


#include "xfer/transport/byte_channel.hpp"
#include "xfer/transport/error.hpp"
#include "xfer/test/test_common_util.hpp"
#include "xfer/test/test_logger.hpp"
#include <flow/error/error.hpp>
#include <gtest/gtest.h>
#include <boost/thread/thread.hpp>
#include <atomic>

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
using boost::chrono::milliseconds;

/// How long to give another thread to (not) make progress, when checking that it is blocked.
const auto S_SETTLE_TIME = milliseconds(100);

/**
 * Takes until end-of-stream or error, in windows of `window_size`, appending everything to `*out`.
 *
 * @return The error (falsy on end-of-stream).
 */
Error_code drain(Byte_channel* chan, size_t window_size, Bytes* out)
{
  Bytes window(window_size);
  Error_code err_code;
  size_t n;
  while ((n = chan->take(Blob_mutable(window.data(), window.size()), &err_code)) != 0)
  {
    out->insert(out->end(), window.begin(), window.begin() + n);
  }
  return err_code;
}

} // Anonymous namespace

TEST(Byte_channel, Fifo_across_threads)
{
  Test_logger logger;
  const auto payload = make_payload(1024 * 1024 + 17, 1);
  // Small cap so the producer is often blocked on the consumer; fragment sizes coprime-ish to the take window.
  Byte_channel chan(&logger, "fifo", payload.size(), 10 * 1000);

  std::atomic<bool> accounting_ok(true);
  boost::thread producer([&]()
  {
    for (const auto& fragment : split_payload(payload, { 1, 1000, 333, 65536, 7 }))
    {
      Error_code err_code;
      chan.append(fragment, &err_code);
      if (err_code)
      {
        accounting_ok = false;
        return;
      }
    }
    chan.close();
  });

  Bytes received;
  Bytes window(4093);
  Error_code err_code;
  size_t n;
  while ((n = chan.take(Blob_mutable(window.data(), window.size()), &err_code)) != 0)
  {
    received.insert(received.end(), window.begin(), window.begin() + n);
    if (chan.total_read() > chan.total_written())
    {
      accounting_ok = false;
    }
  }
  producer.join();

  EXPECT_FALSE(err_code);
  EXPECT_TRUE(accounting_ok);
  EXPECT_EQ(received, payload);
  EXPECT_EQ(chan.total_written(), payload.size());
  EXPECT_EQ(chan.total_read(), payload.size());
  EXPECT_EQ(chan.pending_size(), 0u);
  EXPECT_TRUE(chan.drained());
}

TEST(Byte_channel, End_of_stream_is_idempotent)
{
  Test_logger logger;
  Byte_channel chan(&logger, "eos", 10, 0);
  const auto payload = make_payload(10);

  chan.append(Blob_const(payload.data(), payload.size()));
  EXPECT_FALSE(chan.drained());
  EXPECT_TRUE(chan.close());
  EXPECT_FALSE(chan.close()); // Second close is a no-op.
  EXPECT_FALSE(chan.drained()); // Closed but 10 bytes pending.

  Bytes window(100);
  Error_code err_code;
  EXPECT_EQ(chan.take(Blob_mutable(window.data(), window.size()), &err_code), 10u);
  EXPECT_FALSE(err_code);
  EXPECT_TRUE(chan.drained());
  for (int i = 0; i != 3; ++i)
  {
    EXPECT_EQ(chan.take(Blob_mutable(window.data(), window.size()), &err_code), 0u);
    EXPECT_FALSE(err_code);
  }
  EXPECT_EQ(chan.total_read(), 10u);
}

TEST(Byte_channel, Take_partial_chunks)
{
  Test_logger logger;
  Byte_channel chan(&logger, "partial", 30, 0);
  const auto payload = make_payload(30, 2);

  for (const auto& fragment : split_payload(payload, { 10 }))
  {
    chan.append(fragment);
  }
  EXPECT_EQ(chan.pending_size(), 30u);

  // Window straddles chunk boundaries: 4, 4, 4, ... .
  Bytes received;
  Bytes window(4);
  while (received.size() != payload.size())
  {
    const size_t n = chan.take(Blob_mutable(window.data(), window.size()));
    ASSERT_NE(n, 0u);
    ASSERT_LE(n, window.size());
    received.insert(received.end(), window.begin(), window.begin() + n);
    EXPECT_EQ(chan.total_written() - chan.total_read(), chan.pending_size());
  }
  EXPECT_EQ(received, payload);
}

TEST(Byte_channel, Empty_take_and_append_do_not_block)
{
  Test_logger logger;
  Byte_channel chan(&logger, "empty", 0, 1);

  Error_code err_code = error::Code::S_TIMEOUT; // Garbage; should be cleared.
  EXPECT_EQ(chan.take(Blob_mutable(), &err_code), 0u); // Open and nothing pending; yet returns at once.
  EXPECT_FALSE(err_code);

  const uint8_t byte = 7;
  chan.append(Blob_const(&byte, 1));
  chan.append(Blob_const(), &err_code); // At cap; but empty append need not wait.
  EXPECT_FALSE(err_code);
  EXPECT_EQ(chan.total_written(), 1u);
}

TEST(Byte_channel, Append_after_close)
{
  Test_logger logger;
  Byte_channel chan(&logger, "after-close", 0, 0);
  chan.close();

  const uint8_t byte = 0;
  Error_code err_code;
  chan.append(Blob_const(&byte, 1), &err_code);
  EXPECT_EQ(err_code, error::Code::S_WRITES_FINISHED_CANNOT_WRITE);
  EXPECT_EQ(chan.total_written(), 0u);

  // Null err_code => exception carrying the same code.
  try
  {
    chan.append(Blob_const(&byte, 1));
    ADD_FAILURE() << "Should have thrown.";
  }
  catch (const flow::error::Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), error::Code::S_WRITES_FINISHED_CANNOT_WRITE);
  }
}

TEST(Byte_channel, Fail_wakes_blocked_take)
{
  Test_logger logger;
  Byte_channel chan(&logger, "fail-take", 100, 0);

  std::atomic<bool> returned(false);
  Error_code take_err_code;
  size_t n_taken = 1;
  boost::thread consumer([&]()
  {
    Bytes window(10);
    n_taken = chan.take(Blob_mutable(window.data(), window.size()), &take_err_code);
    returned = true;
  });

  boost::this_thread::sleep_for(S_SETTLE_TIME);
  EXPECT_FALSE(returned); // Nothing pending, not closed: must be waiting.

  EXPECT_TRUE(chan.fail(error::Code::S_PRODUCER_FAILURE));
  consumer.join();
  EXPECT_EQ(n_taken, 0u);
  EXPECT_EQ(take_err_code, error::Code::S_PRODUCER_FAILURE);

  // First failure wins; both sides observe it from now on.
  EXPECT_FALSE(chan.fail(error::Code::S_CONSUMER_FAILURE));
  EXPECT_EQ(chan.error(), error::Code::S_PRODUCER_FAILURE);
  const uint8_t byte = 0;
  Error_code err_code;
  chan.append(Blob_const(&byte, 1), &err_code);
  EXPECT_EQ(err_code, error::Code::S_PRODUCER_FAILURE);
  EXPECT_FALSE(chan.close());
}

TEST(Byte_channel, Fail_drops_pending)
{
  Test_logger logger;
  Byte_channel chan(&logger, "fail-drop", 100, 0);
  const auto payload = make_payload(50);
  chan.append(Blob_const(payload.data(), payload.size()));
  chan.close();

  chan.fail(error::Code::S_CONSUMER_FAILURE);
  EXPECT_EQ(chan.pending_size(), 0u);
  EXPECT_EQ(chan.total_written(), 50u);

  Bytes received;
  EXPECT_EQ(drain(&chan, 16, &received), error::Code::S_CONSUMER_FAILURE);
  EXPECT_TRUE(received.empty());
}

TEST(Byte_channel, Backpressure)
{
  Test_logger logger;
  Byte_channel chan(&logger, "backpressure", 30, 10);
  const auto payload = make_payload(30, 3);

  chan.append(Blob_const(payload.data(), 10)); // Pending reaches the cap.
  EXPECT_EQ(chan.pending_size(), 10u);

  std::atomic<bool> appended(false);
  Error_code append_err_code;
  boost::thread producer([&]()
  {
    // Larger than the cap; must be accepted whole once below the cap.
    chan.append(Blob_const(payload.data() + 10, 20), &append_err_code);
    appended = true;
  });

  boost::this_thread::sleep_for(S_SETTLE_TIME);
  EXPECT_FALSE(appended);
  EXPECT_EQ(chan.total_written(), 10u);

  Bytes window(4);
  EXPECT_EQ(chan.take(Blob_mutable(window.data(), window.size())), 4u);
  producer.join();
  EXPECT_FALSE(append_err_code);
  EXPECT_EQ(chan.total_written(), 30u);
  EXPECT_EQ(chan.pending_size(), 26u);

  chan.close();
  Bytes received(window.begin(), window.end());
  EXPECT_FALSE(drain(&chan, 7, &received));
  EXPECT_EQ(received, payload);
}

TEST(Byte_channel, Fail_wakes_blocked_append)
{
  Test_logger logger;
  Byte_channel chan(&logger, "fail-append", 30, 10);
  const auto payload = make_payload(20);
  chan.append(Blob_const(payload.data(), 10));

  Error_code append_err_code;
  boost::thread producer([&]()
  {
    chan.append(Blob_const(payload.data() + 10, 10), &append_err_code);
  });

  boost::this_thread::sleep_for(S_SETTLE_TIME);
  chan.fail(error::Code::S_CONSUMER_FAILURE);
  producer.join();
  EXPECT_EQ(append_err_code, error::Code::S_CONSUMER_FAILURE);
  EXPECT_EQ(chan.total_written(), 10u);
}

TEST(Byte_channel, Wrong_size_estimate_is_tolerated)
{
  Test_logger logger;

  for (const size_t declared_size : { size_t(0), size_t(100), size_t(1000 * 1000) })
  {
    Byte_channel chan(&logger, "estimate", declared_size, 0);
    const auto payload = make_payload(1234, 4);
    for (const auto& fragment : split_payload(payload, { 100 }))
    {
      Error_code err_code;
      chan.append(fragment, &err_code);
      ASSERT_FALSE(err_code);
    }
    chan.close();

    Bytes received;
    EXPECT_FALSE(drain(&chan, 1000, &received));
    EXPECT_EQ(received, payload);
    EXPECT_EQ(chan.total_written(), payload.size());
    EXPECT_EQ(chan.expected_size(), declared_size);
  }
}

TEST(Byte_channel, Print)
{
  Test_logger logger;
  Byte_channel chan(&logger, "printable", 0, 0);
  EXPECT_NE(flow::util::ostream_op_string(chan).find("[printable]@"), std::string::npos);
}

} // namespace xfer::transport::test
