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

/// @file
#pragma once

#include "xfer/transport/transport_fwd.hpp"

namespace xfer::transport
{

// Types.

/**
 * Producer-facing facade of a Byte_channel: the minimal contract a producer (or an Adaptive_batcher in front of one)
 * needs -- write(), close(), abort() -- without Byte_channel's consumer-side operations.
 *
 * This layer does no throttling or buffering of its own; any blocking is Byte_channel::append() backpressure.
 * It is a thin, copyable handle: it does not own the Byte_channel, which must outlive it.
 *
 * ### Thread safety ###
 * Same as the producer-side methods of Byte_channel: call from the one producer thread; accessors from anywhere.
 */
class Stream_writer
{
public:
  // Constructors/destructor.

  /**
   * Constructs the facade over the given channel.
   *
   * @param channel
   *        The channel.  Must not be null; must outlive `*this`.
   */
  explicit Stream_writer(Byte_channel* channel);

  // Methods.

  /**
   * Writes `data` into the channel (Byte_channel::append()), possibly blocking on backpressure.
   *
   * @param data
   *        The bytes.  Copied before return.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        see Byte_channel::append().
   * @return `data.size()` on success; 0 on error.
   */
  size_t write(const util::Blob_const& data, Error_code* err_code = 0);

  /**
   * Marks end-of-input (Byte_channel::close()).
   * @return See Byte_channel::close().
   */
  bool close();

  /**
   * Producer-side abnormal termination: fails the channel (Byte_channel::fail()) with
   * error::Code::S_PRODUCER_FAILURE, so that the consumer's read unblocks with an error rather than hanging or
   * observing a clean (truncated) end-of-stream.
   *
   * @return See Byte_channel::fail().
   */
  bool abort();

  /**
   * Failure recorded on the channel by either side; falsy if none.  Lets a producer fail fast without writing.
   * @return See above.
   */
  Error_code error() const;

  /**
   * Total bytes accepted so far.
   * @return See above.
   */
  size_t bytes_written() const;

  /**
   * Declared payload size of the channel.
   * @return See above.
   */
  size_t expected_size() const;

  /**
   * The channel, for logging mostly.
   * @return See above.
   */
  const Byte_channel& channel() const;

private:
  // Data.

  /// The channel.  Not null.
  Byte_channel* m_channel;
}; // class Stream_writer

} // namespace xfer::transport
