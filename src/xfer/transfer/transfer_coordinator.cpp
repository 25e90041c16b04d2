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
#include "xfer/transfer/transfer_coordinator.hpp"
#include "xfer/transport/error.hpp"
#include <flow/async/util.hpp>
#include <flow/error/error.hpp>

namespace xfer::transfer
{

Transfer_coordinator::Transfer_coordinator(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                                           size_t expected_size, const transport::Batching_config& config,
                                           Upload_func&& upload_func, Progress_func&& on_progress_func) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSFER),
  m_nickname(nickname_str),
  m_channel(get_logger(), flow::util::ostream_op_string(m_nickname, "-chan"),
            expected_size, validated(get_logger(), config).m_outstanding_cap),
  m_writer(&m_channel),
  m_reader(&m_channel, std::move(on_progress_func)),
  m_batcher(get_logger(), flow::util::ostream_op_string(m_nickname, "-batch"), &m_writer, config),
  m_upload_func(std::move(upload_func)),
  m_started(false),
  m_done(false),
  /* (Linux) OS thread name will truncate to 15 chars; the nickname prefix should make it recognizable enough.
   * Not started until start(). */
  m_worker(get_logger(), flow::util::ostream_op_string("XferW-", m_nickname))
{
  assert(m_upload_func && "Need an upload routine.");

  FLOW_LOG_INFO("Transfer_coordinator [" << *this << "]: Created; declared size [" << expected_size << "]; "
                "config [" << config << "].  Upload routine shall run in thread W once started.");
}

Transfer_coordinator::~Transfer_coordinator()
{
  using transport::error::Code;

  // We are in thread U.

  bool started;
  bool still_running;
  {
    Lock_guard lock(m_mutex);
    started = m_started;
    still_running = m_started && (!m_done);
  }

  if (still_running)
  {
    FLOW_LOG_WARNING("Transfer_coordinator [" << *this << "]: Shutting down while the upload routine is still "
                     "executing in thread W.  Failing the channel so that it unblocks; then waiting for it to "
                     "return.");
    m_channel.fail(Code::S_OBJECT_SHUTDOWN_ABORTED);
  }
  else
  {
    FLOW_LOG_INFO("Transfer_coordinator [" << *this << "]: Shutting down.  Upload routine not executing.");
  }

  if (started)
  {
    m_worker.stop();
    // Thread W is (synchronously!) no more.
  }
  // The members are destroyed next; batcher first, channel last.

  FLOW_LOG_INFO("Transfer_coordinator [" << *this << "]: Thread W stopped.  Outcome was "
                "[" << m_result_err_code << "] [" << m_result_err_code.message() << "].");
} // Transfer_coordinator::~Transfer_coordinator()

bool Transfer_coordinator::start()
{
  {
    Lock_guard lock(m_mutex);
    if (m_started)
    {
      FLOW_LOG_WARNING("Transfer_coordinator [" << *this << "]: start() called again; ignoring.");
      return false;
    }
    // else
    m_started = true;
  }

  FLOW_LOG_INFO("Transfer_coordinator [" << *this << "]: Starting thread W and the upload routine in it.");

  m_worker.start([this]()
  {
    flow::async::reset_thread_pinning(get_logger()); // Don't inherit any strange core-affinity.  Float free.
  });

  m_worker.post([this]()
  {
    // We are in thread W.
    run_upload();
  });
  return true;
} // Transfer_coordinator::start()

void Transfer_coordinator::run_upload()
{
  using transport::error::Code;
  using flow::error::Runtime_error;

  // We are in thread W.

  FLOW_LOG_INFO("Transfer_coordinator [" << *this << "]: Upload routine starting.");

  Error_code err_code;
  try
  {
    m_upload_func(&m_reader, &err_code);
  }
  catch (const Runtime_error& exc)
  {
    FLOW_LOG_WARNING("Transfer_coordinator [" << *this << "]: Upload routine threw Runtime_error "
                     "[" << exc.what() << "].");
    err_code = exc.code() ? exc.code() : Error_code(Code::S_CONSUMER_FAILURE);
  }
  catch (const std::exception& exc)
  {
    FLOW_LOG_WARNING("Transfer_coordinator [" << *this << "]: Upload routine threw [" << exc.what() << "]; "
                     "treating it as consumer failure.");
    err_code = Code::S_CONSUMER_FAILURE;
  }

  if (err_code)
  {
    FLOW_LOG_WARNING("Transfer_coordinator [" << *this << "]: Upload routine failed with [" << err_code << "] "
                     "[" << err_code.message() << "] after reading [" << m_reader.tell() << "] bytes.  "
                     "Failing the channel so the producer does not write into a dead sink.");
    m_channel.fail(Code::S_CONSUMER_FAILURE); // No-op if e.g. the producer had failed it first.
  }
  else if (const auto channel_err_code = m_channel.error())
  {
    FLOW_LOG_WARNING("Transfer_coordinator [" << *this << "]: Upload routine reported success, but the channel "
                     "had failed with [" << channel_err_code << "] [" << channel_err_code.message() << "]; the "
                     "upload cannot be complete.  Reporting that failure.");
    err_code = channel_err_code;
  }
  else if (!m_channel.drained())
  {
    FLOW_LOG_WARNING("Transfer_coordinator [" << *this << "]: Upload routine reported success, but it stopped "
                     "after [" << m_reader.tell() << "] bytes, before end-of-stream (closed? = "
                     "[" << m_channel.closed() << "], written so far [" << m_channel.total_written() << "]).  "
                     "The upload would be truncated.  Failing the channel.");
    err_code = Code::S_CONSUMER_FINISHED_EARLY;
    m_channel.fail(Code::S_CONSUMER_FAILURE);
  }
  else
  {
    FLOW_LOG_INFO("Transfer_coordinator [" << *this << "]: Upload routine succeeded; read all "
                  "[" << m_reader.tell() << "] bytes through end-of-stream (declared size was "
                  "[" << m_reader.size() << "]).");
  }

  Lock_guard lock(m_mutex);
  m_result_err_code = err_code;
  m_done = true;
  m_done_cond.notify_all();
} // Transfer_coordinator::run_upload()

size_t Transfer_coordinator::await_completion(util::Fine_duration timeout, Error_code* err_code)
{
  using transport::error::Code;
  using util::Fine_duration;
  using boost::chrono::round;
  using boost::chrono::milliseconds;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(size_t, Transfer_coordinator::await_completion, timeout, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  // We are in thread U.

  const auto is_done = [&]() -> bool { return m_done; };
  bool timed_out = false;
  {
    Lock_guard lock(m_mutex);
    assert(m_started && "Call start() before await_completion().");

    if (!m_done)
    {
      FLOW_LOG_TRACE("Transfer_coordinator [" << *this << "]: Awaiting upload routine completion "
                     "(timeout [" << ((timeout == Fine_duration::max()) ? "none" : "set") << "]).");
      if (timeout == Fine_duration::max())
      {
        m_done_cond.wait(lock, is_done);
      }
      else
      {
        timed_out = !m_done_cond.wait_for(lock, timeout, is_done);
      }
    }
  } // Lock_guard lock(m_mutex);

  if (timed_out)
  {
    FLOW_LOG_WARNING("Transfer_coordinator [" << *this << "]: Upload routine did not complete within "
                     "[" << round<milliseconds>(timeout) << "].  Failing the channel; "
                     "then waiting for the routine to return.");
    m_channel.fail(Code::S_TIMEOUT);

    Lock_guard lock(m_mutex);
    m_done_cond.wait(lock, is_done);

    FLOW_LOG_WARNING("Transfer_coordinator [" << *this << "]: Upload routine returned after timeout with "
                     "[" << m_result_err_code << "] [" << m_result_err_code.message() << "].  Reporting timeout.");
    *err_code = Code::S_TIMEOUT;
    return 0;
  }
  // else

  Lock_guard lock(m_mutex);
  if (m_result_err_code)
  {
    *err_code = m_result_err_code;
    return 0;
  }
  // else

  err_code->clear();
  const size_t n = m_channel.total_written();
  FLOW_LOG_INFO("Transfer_coordinator [" << *this << "]: Transfer complete; payload length [" << n << "].");
  return n;
} // Transfer_coordinator::await_completion()

const transport::Batching_config& Transfer_coordinator::validated(flow::log::Logger* logger_ptr,
                                                                  const transport::Batching_config& config)
{
  config.validate(logger_ptr); // Throws on failure.
  return config;
}

transport::Adaptive_batcher* Transfer_coordinator::batcher()
{
  return &m_batcher;
}

transport::Stream_writer* Transfer_coordinator::writer()
{
  return &m_writer;
}

const transport::Byte_channel& Transfer_coordinator::channel() const
{
  return m_channel;
}

const std::string& Transfer_coordinator::nickname() const
{
  return m_nickname;
}

std::ostream& operator<<(std::ostream& os, const Transfer_coordinator& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val);
}

} // namespace xfer::transfer
