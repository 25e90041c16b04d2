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
#include <flow/util/blob.hpp>
#include <flow/util/util.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/noncopyable.hpp>
#include <deque>

namespace xfer::transport
{

// Types.

/**
 * Thread-safe, file-like rendezvous buffer carrying one stream of bytes from exactly one producer thread to exactly
 * one consumer thread; the stream's total size is declared (possibly wrongly) up-front.
 *
 * ### Roles ###
 * Methods are partitioned by which side may call them:
 *   - Producer: append(), close().
 *   - Consumer: take().
 *   - Either: fail(), and all the `const` accessors.
 *
 * Concurrently calling a producer method from two threads (or a consumer method from two threads) is not supported;
 * the whole point is a 1-1 handoff.  In practice one does not call these directly but via Stream_writer (producer)
 * and Stream_reader (consumer).
 *
 * ### Flow control ###
 * take() blocks while there is nothing pending and the stream is neither closed nor failed; it then returns up to
 * the requested number of bytes from the front of the pending FIFO.  That is all that's needed to make the consumer
 * wait on the producer.
 *
 * For the reverse -- producer waiting on a slow consumer, so that a fast producer cannot make us buffer the entire
 * payload -- append() blocks while the number of pending (written-but-not-yet-taken) bytes is at or above the
 * `outstanding_cap` given to ctor, unless that cap is 0 (unbounded).  Once below the cap, the *entire* `data` is
 * accepted, even if that takes pending above the cap.  Thus a single `data` larger than the cap cannot deadlock.
 *
 * ### End-of-stream ###
 * After close(), take() keeps returning pending bytes in order; once they are exhausted, every take() returns 0
 * (and not an error).  A 0 return from take() means end-of-stream and nothing else.  total_written() is then the
 * true payload length, which may well differ from expected_size(): a wrong estimate is tolerated and merely logged.
 *
 * ### Failure ###
 * fail() records an #Error_code, once (the first call wins), and wakes any blocked append() or take().  From then on
 * append() and take() emit that same #Error_code; pending bytes are dropped.  There are no retries at this level:
 * whatever side failed, the transfer is over.  The producer side conventionally fails with
 * error::Code::S_PRODUCER_FAILURE, the consumer side with error::Code::S_CONSUMER_FAILURE; but any truthy
 * #Error_code is accepted.  Failure after close() (even after full drain) is allowed and has the same effect.
 *
 * ### Accounting ###
 * total_written() (bytes accepted by append()) and total_read() (bytes returned by take()) are monotonically
 * non-decreasing; `total_read() <= total_written()` always; `total_written() - total_read() == pending_size()` until
 * failure.  Each is mutated only by its own side, but all of them only under the one internal mutex.
 *
 * ### Thread safety ###
 * As noted above: 1 producer thread and 1 consumer thread may call their respective methods concurrently; any thread
 * may call fail() and the accessors concurrently with anything.  All state is protected by a single mutex; and all
 * waiting is done on a single condition variable associated with it.  No other lock is ever taken while holding it,
 * and no user code is ever invoked while holding it.
 *
 * @internal
 * ### Impl notes ###
 * Pending bytes are kept as a FIFO of `flow::util::Blob`s, one per non-empty append(), plus the offset of the
 * not-yet-taken part of the front one.  So an append() costs one allocation and one copy; a take() costs one copy
 * and possibly some deallocations; no byte is ever moved within the FIFO.
 *
 * The condition variable is shared by both waits (take() waiting for bytes; append() waiting for room).  With
 * exactly 2 parties, `notify_all()` on each state change is simple and costs little.
 */
class Byte_channel :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs the channel in open state, with nothing pending and no failure.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname_str
   *        Human-readable nickname of the new object, as of this writing for use in `operator<<(ostream)` and
   *        logging only.
   * @param expected_size
   *        The declared payload size, reported by expected_size().  It is an estimate; see class doc header.
   * @param outstanding_cap
   *        Backpressure bound on pending bytes (see class doc header); 0 means unbounded.
   */
  explicit Byte_channel(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                        size_t expected_size, size_t outstanding_cap);

  /// Logs final accounting.  Must not be called while another thread is inside any method of `*this`.
  ~Byte_channel();

  // Methods.

  /**
   * Producer-only: appends a copy of `data` at the back of the pending FIFO, first blocking while the pending size
   * is at or above the outstanding-bytes cap (if any); wakes a take() waiting on bytes.  Empty `data` is allowed and
   * is a no-op (outside of error checks).
   *
   * @param data
   *        The bytes.  Copied before return; need not remain valid after.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_WRITES_FINISHED_CANNOT_WRITE (close() was already called),
   *        whatever was passed to fail() (before or during the wait).
   */
  void append(const util::Blob_const& data, Error_code* err_code = 0);

  /**
   * Producer-only: marks end-of-input; wakes a take() waiting on bytes, so it can observe end-of-stream once pending
   * bytes are drained.  Safe to call more than once (later calls no-op), and after fail() (no-op).
   *
   * @return `true` if this call closed the channel; `false` if it was already closed or failed.
   */
  bool close();

  /**
   * Consumer-only: blocks until there are pending bytes, or the channel is closed, or failed; then copies up to
   * `target.size()` bytes from the front of the pending FIFO into `target` and removes them from the FIFO; wakes
   * an append() waiting on room.
   *
   * If `target.size() == 0` this returns 0 immediately (unless failed), without blocking.  Otherwise a 0 return
   * means end-of-stream: closed and fully drained.  It will then keep returning 0 on each subsequent call.
   *
   * @param target
   *        Where to copy the bytes.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        whatever was passed to fail().
   * @return Number of bytes copied into `target`; 0 on error or end-of-stream (or empty `target`).
   */
  size_t take(const util::Blob_mutable& target, Error_code* err_code = 0);

  /**
   * Either side: records `err_code` as the reason for the channel being unusable; drops pending bytes; wakes any
   * blocked append() or take().  Only the first call has effect.
   *
   * @param err_code
   *        The failure; must be truthy.
   * @return `true` if this call recorded the failure; `false` if one was already recorded.
   */
  bool fail(const Error_code& err_code);

  /**
   * The failure passed to fail(); or falsy if none.  Does not block (beyond a brief lock).
   * @return See above.
   */
  Error_code error() const;

  /**
   * Whether close() has been called successfully.
   * @return See above.
   */
  bool closed() const;

  /**
   * `true` if and only if closed() and no bytes pending.  In that state take() returns 0 (unless failed).
   * @return See above.
   */
  bool drained() const;

  /**
   * Total bytes accepted by append() so far.  Final and equal to the true payload length once closed().
   * @return See above.
   */
  size_t total_written() const;

  /**
   * Total bytes returned by take() so far.
   * @return See above.
   */
  size_t total_read() const;

  /**
   * Bytes appended but not yet taken (0 after failure).
   * @return See above.
   */
  size_t pending_size() const;

  /**
   * `expected_size` from ctor.
   * @return See above.
   */
  size_t expected_size() const;

  /**
   * `outstanding_cap` from ctor.
   * @return See above.
   */
  size_t outstanding_cap() const;

  /**
   * Returns nickname, a brief string suitable for logging.  This is included in the output by the `ostream<<`
   * operator as well.  This method is thread-safe in that it always returns the same value.
   *
   * @return See above.
   */
  const std::string& nickname() const;

private:
  // Types.

  /// Short-hand for mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for #Mutex lock; also what the condition variable wants.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  // Methods.

  /**
   * Returns `true` if append() may proceed to append: room below the cap, or cap is 0.  Pre-condition:
   * #m_mutex locked.
   *
   * @return See above.
   */
  bool can_append() const;

  // Constants.

  /// See nickname().
  const std::string m_nickname;

  /// See expected_size().
  const size_t m_expected_size;

  /// See outstanding_cap().
  const size_t m_outstanding_cap;

  // Data.

  /// Protects everything below.
  mutable Mutex m_mutex;

  /**
   * Signaled (`notify_all()`) whenever anything another side might be waiting on changes: bytes appended, bytes
   * taken, closed, failed.
   */
  boost::condition_variable m_state_changed_cond;

  /// The pending-bytes FIFO: each element the bytes of one append(); front one partially taken per #m_front_offset.
  std::deque<flow::util::Blob> m_pending_q;

  /// How many bytes of `m_pending_q.front()` have been taken already.  0 if #m_pending_q is empty.
  size_t m_front_offset;

  /// See pending_size().
  size_t m_pending_size;

  /// See total_written().
  size_t m_total_written;

  /// See total_read().
  size_t m_total_read;

  /// See closed().
  bool m_closed;

  /// Whether take() has already returned end-of-stream once; for logging only.
  bool m_eos_reported;

  /// See error().
  Error_code m_err_code;
}; // class Byte_channel

} // namespace xfer::transport
