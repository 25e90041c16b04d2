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
 * Consumer-facing facade of a Byte_channel: the file-like sequential-read contract an upload routine expects --
 * read() plus size() -- without any of Byte_channel's producer-side operations.
 *
 * ### read() versus read_some() ###
 * read_some() is Byte_channel::take() as-is: it returns as soon as *any* bytes are available, so it may return
 * fewer than requested mid-stream.  read() has the standard file-like reduction semantics instead: it keeps
 * taking until the target is full or end-of-stream; hence it returns fewer bytes than requested only at
 * end-of-stream.  Most upload routines assume the latter; and it lets them read fixed-size windows (e.g., multipart
 * parts) without caring how the producer happened to chop up the payload.
 *
 * In both cases 0 means end-of-stream (all bytes the producer wrote have been returned; producer closed); and
 * subsequent calls keep returning 0.  On failure (either side) the failure is emitted instead.
 *
 * ### Progress ###
 * tell() is the number of bytes returned so far: exactly the argument a per-read progress callback wants.
 * Optionally a `Progress_func` may be given to ctor; it is then invoked (from the reading thread, without any
 * internal lock held) after each non-empty Byte_channel::take(), with the new tell() value.
 *
 * It is a thin handle: it does not own the Byte_channel, which must outlive it.
 *
 * ### Thread safety ###
 * Same as the consumer-side methods of Byte_channel: call from the one consumer thread; accessors from anywhere.
 */
class Stream_reader
{
public:
  // Types.

  /// Progress callback: the argument is tell() after a read.
  using Progress_func = Function<void (size_t n_read_total)>;

  /// Callback for for_each_chunk(): receives one chunk, valid only until it returns.
  using Chunk_func = Function<void (const util::Blob_const& chunk)>;

  // Constructors/destructor.

  /**
   * Constructs the facade over the given channel.
   *
   * @param channel
   *        The channel.  Must not be null; must outlive `*this`.
   * @param on_progress_func
   *        If not empty, invoked as described in class doc header.
   */
  explicit Stream_reader(Byte_channel* channel, Progress_func&& on_progress_func = Progress_func());

  // Methods.

  /**
   * Reads into `target` until it is full or end-of-stream; blocks as needed.
   *
   * @param target
   *        Where to place the bytes.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        see Byte_channel::take().  Bytes read before the error, if any, are in `target` but are not counted
   *        in the return value; the transfer is over anyway.
   * @return Number of bytes placed in `target`: `target.size()` unless end-of-stream was reached; 0 on error.
   */
  size_t read(const util::Blob_mutable& target, Error_code* err_code = 0);

  /**
   * Reads whatever is available, up to `target.size()` bytes; blocks only while nothing is available.
   * I.e., Byte_channel::take().
   *
   * @param target
   *        Where to place the bytes.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        see Byte_channel::take().
   * @return See Byte_channel::take().
   */
  size_t read_some(const util::Blob_mutable& target, Error_code* err_code = 0);

  /**
   * Reads the rest of the stream in chunks of `chunk_size` bytes (the last one possibly shorter), invoking
   * `on_chunk_func` on each, until end-of-stream or error.  For consumers that pull the stream at their own pace
   * rather than being driven by an upload routine.
   *
   * @param chunk_size
   *        Max bytes per chunk.  Must be positive.
   * @param on_chunk_func
   *        Invoked synchronously for each chunk.  Exceptions it throws are not caught.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        see Byte_channel::take().
   * @return Total bytes passed to `on_chunk_func`.
   */
  size_t for_each_chunk(size_t chunk_size, const Chunk_func& on_chunk_func, Error_code* err_code = 0);

  /**
   * Consumer-side abnormal termination: fails the channel (Byte_channel::fail()) with
   * error::Code::S_CONSUMER_FAILURE, so the producer's next write fails instead of blocking or succeeding into a
   * dead sink.
   *
   * @return See Byte_channel::fail().
   */
  bool abort();

  /**
   * The declared payload size (which may turn out to be inaccurate; see Byte_channel).
   * @return See above.
   */
  size_t size() const;

  /**
   * Total bytes returned by reads so far.
   * @return See above.
   */
  size_t tell() const;

  /**
   * Failure recorded on the channel by either side; falsy if none.
   * @return See above.
   */
  Error_code error() const;

  /**
   * The channel, for logging mostly.
   * @return See above.
   */
  const Byte_channel& channel() const;

private:
  // Data.

  /// The channel.  Not null.
  Byte_channel* m_channel;

  /// See ctor.
  Progress_func m_on_progress_func;
}; // class Stream_reader

} // namespace xfer::transport
