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

#include "xfer/transfer/transfer_fwd.hpp"
#include "xfer/transport/byte_channel.hpp"
#include "xfer/transport/stream_writer.hpp"
#include "xfer/transport/stream_reader.hpp"
#include "xfer/transport/adaptive_batcher.hpp"
#include <flow/async/single_thread_task_loop.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/noncopyable.hpp>

namespace xfer::transfer
{

// Types.

/**
 * Runs one transfer: owns the transport::Byte_channel and both its facades, plus an Adaptive_batcher for the
 * producer; executes the external upload routine against the transport::Stream_reader in a dedicated worker thread
 * (thread W); and lets the producer thread (thread U, the one that constructed `*this`) await the outcome.
 *
 * ### How to use ###
 *   - Construct, giving it the declared payload size (an estimate is fine), a transport::Batching_config, and the
 *     upload routine (#Upload_func).
 *   - start().  The routine begins executing in thread W; it will typically block in Stream_reader::read() right
 *     away, waiting for bytes.
 *   - Feed bytes via `batcher()->write()` as they arrive; then `batcher()->close()`.  (Alternatively `writer()` may
 *     be used directly, bypassing batching; but do not mix the two.)  If the source fails, `batcher()->abort()`.
 *   - await_completion().  On success it returns the true payload length (transport::Byte_channel::total_written()).
 *
 * ### Outcome ###
 * The transfer succeeds if and only if the routine returns without error *and* had read through end-of-stream.  Any
 * failure on either side aborts the whole thing:
 *   - Routine reports failure (via its `Error_code*` or by throwing): thread W immediately fails the channel with
 *     transport::error::Code::S_CONSUMER_FAILURE, so a producer blocked in (or entering) a write unblocks with that
 *     error instead of writing into a dead sink.  await_completion() emits the routine's own error.  If the routine
 *     threw a `flow::error::Runtime_error`, its code is that error; for any other `std::exception` it is
 *     transport::error::Code::S_CONSUMER_FAILURE.
 *   - Routine returns success without having reached end-of-stream: the payload would be truncated, so
 *     await_completion() emits transport::error::Code::S_CONSUMER_FINISHED_EARLY (and the channel is failed as above).
 *   - Producer aborts: the routine's reads fail with transport::error::Code::S_PRODUCER_FAILURE; typically the
 *     routine then fails with that, which is what await_completion() emits.  If the routine swallows the read
 *     failure and returns success anyway, the channel's failure is emitted nonetheless.
 *   - await_completion() deadline passes: the channel is failed with transport::error::Code::S_TIMEOUT (unblocking
 *     the routine's reads); once the routine returns, that is emitted.
 *
 * ### Thread safety ###
 * The public methods are to be called from thread U only; as are the producer-side methods of what `batcher()`
 * and `writer()` return.  The routine must use the `Stream_reader*` it receives only until it returns.
 *
 * @internal
 * ### Impl notes ###
 * The completion state (#m_done, #m_result_err_code) is shared between threads W and U; it is protected by
 * #m_mutex, with #m_done_cond signaled once upon completion.  #m_mutex is never held while calling into the
 * channel, and the channel never calls back into us; so no lock is nested in another.
 */
class Transfer_coordinator :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /**
   * The external upload routine.  It is executed once, in thread W, and should read the payload via
   * `reader->read()` (or similar) until end-of-stream, uploading it wherever; then return.  Failure is reported
   * by setting `*err_code` to a truthy value or by throwing.  `*err_code` is falsy on entry.
   */
  using Upload_func = Function<void (transport::Stream_reader* reader, Error_code* err_code)>;

  /// Short-hand for the progress callback type; see ctor.
  using Progress_func = transport::Stream_reader::Progress_func;

  // Constructors/destructor.

  /**
   * Sets up the channel, its facades and the batcher; does not start the routine (see start()).
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently; it is also given to the owned transport objects.
   * @param nickname_str
   *        Human-readable nickname of the new object, as of this writing for use in `operator<<(ostream)` and
   *        logging only.  Owned objects' nicknames are derived from it.
   * @param expected_size
   *        Declared payload size; an estimate is fine.  See transport::Byte_channel.
   * @param config
   *        Batching and backpressure configuration.
   * @param upload_func
   *        The upload routine.
   * @param on_progress_func
   *        If not empty: invoked from thread W after each non-empty read with the total bytes read so far.
   *
   * @throws flow::error::Runtime_error
   *         Code transport::error::Code::S_INVALID_ARGUMENT: `config` fails Batching_config::validate().
   */
  explicit Transfer_coordinator(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                                size_t expected_size, const transport::Batching_config& config,
                                Upload_func&& upload_func, Progress_func&& on_progress_func = Progress_func());

  /**
   * If the routine is still executing, fails the channel with transport::error::Code::S_OBJECT_SHUTDOWN_ABORTED
   * (so its reads unblock) and waits for it to return; then stops thread W.  If the producer has neither
   * closed nor aborted, the batcher then aborts.
   */
  ~Transfer_coordinator();

  // Methods.

  /**
   * Starts thread W and executes the routine in it.
   *
   * @return `true` on success; `false` if already called (no-op).
   */
  bool start();

  /**
   * Blocks until the routine has returned, or `timeout` passes, in which case the transfer is failed (see class
   * doc header); then reports the outcome.  start() must have been called.  May be called again; it will report
   * the same outcome immediately.
   *
   * @param timeout
   *        How long to wait; `util::Fine_duration::max()` means forever.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        transport::error::Code::S_TIMEOUT, transport::error::Code::S_CONSUMER_FINISHED_EARLY,
   *        whatever the routine reported, whatever failure the channel recorded.
   * @return The true payload length on success; 0 on error.
   */
  size_t await_completion(util::Fine_duration timeout, Error_code* err_code = 0);

  /**
   * The producer-side batcher.  The pointer is valid until `*this` is destroyed.
   * @return See above.
   */
  transport::Adaptive_batcher* batcher();

  /**
   * The producer-side writer, for unbatched writing.  The pointer is valid until `*this` is destroyed.
   * @return See above.
   */
  transport::Stream_writer* writer();

  /**
   * The channel, for monitoring.
   * @return See above.
   */
  const transport::Byte_channel& channel() const;

  /**
   * Returns nickname, a brief string suitable for logging.
   * @return See above.
   */
  const std::string& nickname() const;

private:
  // Types.

  /// Short-hand for mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for #Mutex lock.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  // Methods.

  /**
   * Body of thread W's one task: executes #m_upload_func, reconciles its result with the channel state, and
   * signals completion.
   */
  void run_upload();

  /**
   * Helper for the ctor's init list: validates `config` or throws.
   *
   * @param logger_ptr
   *        Logger.
   * @param config
   *        See ctor.
   * @return `config`.
   */
  static const transport::Batching_config& validated(flow::log::Logger* logger_ptr,
                                                     const transport::Batching_config& config);

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// The channel.  Declared before its users, so destroyed after them.
  transport::Byte_channel m_channel;

  /// Producer-side facade over #m_channel.
  transport::Stream_writer m_writer;

  /// Consumer-side facade over #m_channel; given to #m_upload_func.
  transport::Stream_reader m_reader;

  /// Batches writes into #m_writer.
  transport::Adaptive_batcher m_batcher;

  /// See ctor.
  Upload_func m_upload_func;

  /// Protects #m_started, #m_done, #m_result_err_code.
  mutable Mutex m_mutex;

  /// Signaled when #m_done becomes `true`.
  boost::condition_variable m_done_cond;

  /// Whether start() has been called.
  bool m_started;

  /// Whether run_upload() has finished (result in #m_result_err_code).
  bool m_done;

  /// Outcome as of #m_done.  Falsy means success.
  Error_code m_result_err_code;

  /// Thread W.  Declared last, so it is stopped (in dtor body) before anything above goes away.
  flow::async::Single_thread_task_loop m_worker;
}; // class Transfer_coordinator

} // namespace xfer::transfer
