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

#include "xfer/transport/batching_config.hpp"
#include "xfer/util/default_init_allocator.hpp"
#include <boost/noncopyable.hpp>
#include <vector>

namespace xfer::transport
{

// Types.

/**
 * Producer-side coalescing layer in front of a Stream_writer: accumulates incoming fragments and forwards them as one
 * write only once their total reaches the current flush threshold, which itself grows over the life of the stream.
 *
 * ### Why ###
 * A network source may well hand us fragments of a few hundred bytes each.  Writing each straight into the
 * Byte_channel would cost a lock, a copy, an allocation and a wake-up of the consumer per fragment.  Batching cuts
 * that down; growing the batch size as the transfer proceeds keeps latency low at the start (first bytes reach the
 * consumer soon) and overhead low later.
 *
 * ### Threshold schedule ###
 * The threshold (min_flush()) starts at Batching_config::m_base_unit.  After each flush, if it is below
 * max_flush() (`m_base_unit * m_max_multiplier`), it grows by `m_base_unit` (capped at max_flush()).  So it is
 * monotonically non-decreasing and never exceeds max_flush(); with base unit 4096 and multiplier 20 it goes
 * 4096, 8192, 12288, ..., 81920, 81920, ....
 *
 * A flush forwards *everything* accumulated, so a single flush may exceed the threshold (and even max_flush()) by
 * up to one fragment.
 *
 * ### States ###
 * Phase::S_ACCUMULATING is the steady state.  write() passes through Phase::S_FLUSHING while forwarding a batch
 * (only observable from within Stream_writer::write(), i.e., while blocked on backpressure).  Phase::S_CLOSING is
 * terminal; it is entered by:
 *   - close(): flushes the remainder regardless of threshold, then closes the Stream_writer.  Normal end.
 *   - abort(): producer cancelled.  The accumulated remainder is *discarded* -- it never reaches the consumer --
 *     and the channel is failed with error::Code::S_PRODUCER_FAILURE so the consumer unblocks with an error.
 *   - Any failure observed on the channel (typically the consumer side having failed): accumulated remainder
 *     discarded; that failure is emitted from then on.
 *   - Destruction while not yet terminal: same as abort(); unless the stream was already closed directly through
 *     the Stream_writer, in which case there is nothing to cancel.
 *
 * After closing normally, write() emits error::Code::S_WRITES_FINISHED_CANNOT_WRITE.
 *
 * ### Failing fast ###
 * Since most write() calls merely accumulate and do not touch the channel, a dead consumer would not otherwise be
 * noticed until the next flush.  Therefore each write() first checks Stream_writer::error() (non-blocking) and
 * fails right away if the channel has failed.
 *
 * ### Thread safety ###
 * None; it is meant to be used from the one producer thread only.  It touches the Byte_channel only through the
 * Stream_writer, which is where all synchronization lives.
 */
class Adaptive_batcher :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// State of `*this`; see class doc header.
  enum class Phase
  {
    /// Collecting fragments; nothing forwarded since the last flush.
    S_ACCUMULATING,
    /// Forwarding the accumulated batch to Stream_writer::write().
    S_FLUSHING,
    /// Terminal: closed, aborted, or failed.
    S_CLOSING
  };

  // Constructors/destructor.

  /**
   * Constructs the batcher in Phase::S_ACCUMULATING with nothing accumulated and threshold
   * `config.m_base_unit`.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname_str
   *        Human-readable nickname of the new object, as of this writing for use in `operator<<(ostream)` and
   *        logging only.
   * @param writer
   *        Where batches go.  Must not be null; must (along with its Byte_channel) outlive `*this`.
   * @param config
   *        Threshold schedule.  Must be valid (Batching_config::validate()) or undefined behavior (assertion may
   *        trip).  Batching_config::m_outstanding_cap is ignored here (it is the channel's business).
   */
  explicit Adaptive_batcher(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                            Stream_writer* writer, const Batching_config& config);

  /// If not yet in Phase::S_CLOSING, and the channel is not closed, performs abort().  Otherwise only logs.
  ~Adaptive_batcher();

  // Methods.

  /**
   * Accumulates a copy of `fragment`; then, if the accumulated size has reached min_flush(), forwards the whole of
   * it to the Stream_writer (possibly blocking on backpressure) and grows the threshold.
   *
   * @param fragment
   *        The bytes.  Copied before return.  Empty is allowed.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_WRITES_FINISHED_CANNOT_WRITE (already closed), whatever failure the channel recorded
   *        (e.g., error::Code::S_CONSUMER_FAILURE), error::Code::S_PRODUCER_FAILURE (already aborted).
   *        On error nothing accumulated will ever be forwarded.
   * @return Bytes forwarded by this call: 0 if merely accumulated (or error); else the size of the batch, which
   *         includes `fragment`.
   */
  size_t write(const util::Blob_const& fragment, Error_code* err_code = 0);

  /**
   * Signals end-of-input: forwards whatever is accumulated regardless of threshold, then closes the Stream_writer
   * (hence the consumer will see end-of-stream after the last byte).  Subsequent calls are no-ops returning 0.
   * If the channel has failed by the time the Stream_writer is closed, that failure is emitted, even if the
   * remainder was forwarded.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        whatever failure the channel recorded, error::Code::S_PRODUCER_FAILURE (already aborted).
   * @return Bytes forwarded by this call (possibly 0).
   */
  size_t close(Error_code* err_code = 0);

  /**
   * Producer cancellation: discards whatever is accumulated and fails the channel with
   * error::Code::S_PRODUCER_FAILURE (unless it already failed).  No-op if already in Phase::S_CLOSING.
   *
   * @return `true` if this call aborted; `false` if no-op.
   */
  bool abort();

  /**
   * Current flush threshold.
   * @return See above.
   */
  size_t min_flush() const;

  /**
   * Flush threshold ceiling; `Batching_config::max_flush()` from ctor.
   * @return See above.
   */
  size_t max_flush() const;

  /**
   * Bytes accumulated and not yet forwarded.
   * @return See above.
   */
  size_t pending_size() const;

  /**
   * Total bytes forwarded to the Stream_writer so far.
   * @return See above.
   */
  size_t bytes_flushed() const;

  /**
   * Current state.
   * @return See above.
   */
  Phase phase() const;

  /**
   * Returns nickname, a brief string suitable for logging.
   * @return See above.
   */
  const std::string& nickname() const;

private:
  // Types.

  /// Accumulation buffer: a byte vector that does not zero-fill on `resize()`.
  using Fragment_buf = std::vector<uint8_t, util::Default_init_allocator<uint8_t>>;

  // Methods.

  /**
   * Forwards all of #m_pending_fragment; on success clears it, grows the threshold and returns to
   * Phase::S_ACCUMULATING; on failure enters the terminal state via to_failed().
   * Pre-condition: #m_pending_fragment not empty; phase is Phase::S_ACCUMULATING.
   *
   * @param err_code
   *        Not null.  Result.
   * @return Bytes forwarded; 0 on error.
   */
  size_t flush(Error_code* err_code);

  /**
   * Enters Phase::S_CLOSING due to `err_code`, discarding the accumulated remainder and memorizing `err_code` for
   * subsequent calls.
   *
   * @param err_code
   *        Truthy failure.
   */
  void to_failed(const Error_code& err_code);

  // Constants.

  /// See nickname().
  const std::string m_nickname;

  /// See ctor.  Not null.
  Stream_writer* const m_writer;

  /// Threshold growth step: `Batching_config::m_base_unit` from ctor.
  const size_t m_base_unit;

  /// See max_flush().
  const size_t m_max_flush;

  // Data.

  /// See min_flush().
  size_t m_min_flush;

  /// Accumulated bytes not yet forwarded.
  Fragment_buf m_pending_fragment;

  /// See phase().
  Phase m_phase;

  /// See bytes_flushed().
  size_t m_bytes_flushed;

  /// Number of successful flushes; for logging.
  size_t m_n_flushes;

  /// Falsy unless Phase::S_CLOSING was entered abnormally; in which case the failure to emit from then on.
  Error_code m_err_code;
}; // class Adaptive_batcher

// Free functions: in *_fwd.hpp; plus the following one.

/**
 * Prints string representation of the given `Adaptive_batcher::Phase` to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Adaptive_batcher::Phase val);

} // namespace xfer::transport
