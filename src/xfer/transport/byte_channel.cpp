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
#include "xfer/transport/byte_channel.hpp"
#include "xfer/transport/error.hpp"
#include <flow/error/error.hpp>
#include <cstring>

namespace xfer::transport
{

Byte_channel::Byte_channel(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                           size_t expected_size, size_t outstanding_cap) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_nickname(nickname_str),
  m_expected_size(expected_size),
  m_outstanding_cap(outstanding_cap),
  m_front_offset(0),
  m_pending_size(0),
  m_total_written(0),
  m_total_read(0),
  m_closed(false),
  m_eos_reported(false)
{
  FLOW_LOG_INFO("Byte_channel [" << *this << "]: Created; expected payload size [" << m_expected_size << "]; "
                "outstanding-bytes cap [" << m_outstanding_cap << "] (0 = unbounded).");
}

Byte_channel::~Byte_channel()
{
  // No lock needed: by contract nobody else is in here.
  FLOW_LOG_INFO("Byte_channel [" << *this << "]: Shutting down.  Final state: "
                "closed? = [" << m_closed << "]; failure = [" << m_err_code << "] [" << m_err_code.message() << "]; "
                "written [" << m_total_written << "], read [" << m_total_read << "], "
                "pending (to be dropped) [" << m_pending_size << "].");
}

void Byte_channel::append(const util::Blob_const& data, Error_code* err_code)
{
  using flow::util::buffers_dump_string;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { append(data, actual_err_code); },
         err_code, "Byte_channel::append()"))
  {
    return;
  }
  // else

  Lock_guard lock(m_mutex);

  if (m_err_code)
  {
    FLOW_LOG_WARNING("Byte_channel [" << *this << "]: Append of [" << data.size() << "] bytes requested, but "
                     "the channel had already failed earlier with [" << m_err_code << "] "
                     "[" << m_err_code.message() << "]; emitting that.");
    *err_code = m_err_code;
    return;
  }
  // else
  if (m_closed)
  {
    FLOW_LOG_WARNING("Byte_channel [" << *this << "]: Append of [" << data.size() << "] bytes requested, but "
                     "the producer already closed the stream.");
    *err_code = error::Code::S_WRITES_FINISHED_CANNOT_WRITE;
    return;
  }
  // else

  if (data.size() == 0)
  {
    err_code->clear();
    return;
  }
  // else

  if (!can_append())
  {
    FLOW_LOG_TRACE("Byte_channel [" << *this << "]: Append of [" << data.size() << "] bytes must wait: "
                   "pending [" << m_pending_size << "] at or above cap [" << m_outstanding_cap << "].  "
                   "Blocking until consumer takes some, or failure.");
    m_state_changed_cond.wait(lock, [&]() -> bool { return m_err_code || can_append(); });

    if (m_err_code)
    {
      FLOW_LOG_WARNING("Byte_channel [" << *this << "]: While append of [" << data.size() << "] bytes was "
                       "waiting for room, the channel failed with [" << m_err_code << "] "
                       "[" << m_err_code.message() << "]; emitting that.");
      *err_code = m_err_code;
      return;
    }
    // else
    FLOW_LOG_TRACE("Byte_channel [" << *this << "]: Room available (pending [" << m_pending_size << "]); "
                   "proceeding.");
  }
  // else: Append for real.

  auto& chunk = m_pending_q.emplace_back(get_logger(), data.size());
  std::memcpy(chunk.begin(), data.data(), data.size());
  m_pending_size += data.size();
  m_total_written += data.size();

  FLOW_LOG_TRACE("Byte_channel [" << *this << "]: Appended [" << data.size() << "] bytes; "
                 "pending [" << m_pending_size << "] in [" << m_pending_q.size() << "] chunks; "
                 "written [" << m_total_written << "] of expected [" << m_expected_size << "].");
  FLOW_LOG_DATA("Blob contents: [\n" << buffers_dump_string(data, "  ") << "].");

  if ((m_total_written > m_expected_size) && ((m_total_written - data.size()) <= m_expected_size))
  {
    // Tolerated: the declared size is only an estimate.  Just mention it once.
    FLOW_LOG_INFO("Byte_channel [" << *this << "]: Total written [" << m_total_written << "] now exceeds "
                  "declared size [" << m_expected_size << "].  The estimate was low; continuing.");
  }

  err_code->clear();
  m_state_changed_cond.notify_all();
} // Byte_channel::append()

bool Byte_channel::close()
{
  Lock_guard lock(m_mutex);

  if (m_err_code)
  {
    FLOW_LOG_INFO("Byte_channel [" << *this << "]: Close requested, but the channel had already failed earlier "
                  "with [" << m_err_code << "] [" << m_err_code.message() << "]; no-op.");
    return false;
  }
  // else
  if (m_closed)
  {
    FLOW_LOG_TRACE("Byte_channel [" << *this << "]: Close requested, but already closed; no-op.");
    return false;
  }
  // else

  m_closed = true;

  if (m_total_written == m_expected_size)
  {
    FLOW_LOG_INFO("Byte_channel [" << *this << "]: Producer closed the stream; total written "
                  "[" << m_total_written << "] matches declared size.  "
                  "Pending [" << m_pending_size << "] left for consumer to drain.");
  }
  else
  {
    FLOW_LOG_INFO("Byte_channel [" << *this << "]: Producer closed the stream; total written "
                  "[" << m_total_written << "] differs from declared size [" << m_expected_size << "]; the former "
                  "is the true payload length.  Pending [" << m_pending_size << "] left for consumer to drain.");
  }

  m_state_changed_cond.notify_all();
  return true;
} // Byte_channel::close()

size_t Byte_channel::take(const util::Blob_mutable& target, Error_code* err_code)
{
  using flow::util::buffers_dump_string;
  using util::Blob_const;
  using std::min;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(size_t, Byte_channel::take, flow::util::bind_ns::cref(target), _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  Lock_guard lock(m_mutex);

  if ((!m_err_code) && (target.size() != 0) && m_pending_q.empty() && (!m_closed))
  {
    FLOW_LOG_TRACE("Byte_channel [" << *this << "]: Take of up to [" << target.size() << "] bytes must wait: "
                   "nothing pending, not closed.  Blocking until producer appends, closes, or failure.");
    m_state_changed_cond.wait(lock, [&]() -> bool { return m_err_code || (!m_pending_q.empty()) || m_closed; });
  }
  // else

  if (m_err_code)
  {
    FLOW_LOG_WARNING("Byte_channel [" << *this << "]: Take of up to [" << target.size() << "] bytes cannot "
                     "proceed: channel failed with [" << m_err_code << "] [" << m_err_code.message() << "]; "
                     "emitting that.");
    *err_code = m_err_code;
    return 0;
  }
  // else

  err_code->clear();

  if (target.size() == 0)
  {
    return 0;
  }
  // else

  if (m_pending_q.empty())
  {
    assert(m_closed);
    if (!m_eos_reported)
    {
      m_eos_reported = true;
      FLOW_LOG_INFO("Byte_channel [" << *this << "]: Reporting end-of-stream to consumer; all "
                    "[" << m_total_read << "] bytes written by producer have been taken.");
    }
    return 0;
  }
  // else: Copy from as many chunks as needed/available.

  const auto target_start = util::blob_data(target);
  size_t n_taken = 0;
  while ((n_taken != target.size()) && (!m_pending_q.empty()))
  {
    auto& chunk = m_pending_q.front();
    const size_t n_left_in_chunk = chunk.size() - m_front_offset;
    const size_t n = min(n_left_in_chunk, target.size() - n_taken);

    std::memcpy(target_start + n_taken, chunk.begin() + m_front_offset, n);
    n_taken += n;

    if (n == n_left_in_chunk)
    {
      m_pending_q.pop_front();
      m_front_offset = 0;
    }
    else
    {
      m_front_offset += n;
    }
  }

  m_pending_size -= n_taken;
  m_total_read += n_taken;
  assert(m_total_read <= m_total_written);

  FLOW_LOG_TRACE("Byte_channel [" << *this << "]: Took [" << n_taken << "] bytes (of up to "
                 "[" << target.size() << "] requested); pending [" << m_pending_size << "]; "
                 "read [" << m_total_read << "] of written [" << m_total_written << "].");
  FLOW_LOG_DATA("Blob contents: [\n" << buffers_dump_string(Blob_const(target_start, n_taken), "  ") << "].");

  m_state_changed_cond.notify_all();
  return n_taken;
} // Byte_channel::take()

bool Byte_channel::fail(const Error_code& err_code)
{
  assert(err_code && "Failing a channel with a falsy Error_code is meaningless.");

  Lock_guard lock(m_mutex);

  if (m_err_code)
  {
    FLOW_LOG_INFO("Byte_channel [" << *this << "]: Failure [" << err_code << "] [" << err_code.message() << "] "
                  "reported, but the channel had already failed with [" << m_err_code << "] "
                  "[" << m_err_code.message() << "]; ignoring the later one.");
    return false;
  }
  // else

  FLOW_LOG_WARNING("Byte_channel [" << *this << "]: Failure [" << err_code << "] [" << err_code.message() << "] "
                   "reported.  The transfer is over; both sides shall observe this from now on.  Dropping "
                   "[" << m_pending_size << "] pending bytes; written [" << m_total_written << "], "
                   "read [" << m_total_read << "], closed? = [" << m_closed << "].");

  m_err_code = err_code;
  m_pending_q.clear();
  m_front_offset = 0;
  m_pending_size = 0;

  m_state_changed_cond.notify_all();
  return true;
} // Byte_channel::fail()

bool Byte_channel::can_append() const
{
  return (m_outstanding_cap == 0) || (m_pending_size < m_outstanding_cap);
}

Error_code Byte_channel::error() const
{
  Lock_guard lock(m_mutex);
  return m_err_code;
}

bool Byte_channel::closed() const
{
  Lock_guard lock(m_mutex);
  return m_closed;
}

bool Byte_channel::drained() const
{
  Lock_guard lock(m_mutex);
  return m_closed && m_pending_q.empty();
}

size_t Byte_channel::total_written() const
{
  Lock_guard lock(m_mutex);
  return m_total_written;
}

size_t Byte_channel::total_read() const
{
  Lock_guard lock(m_mutex);
  return m_total_read;
}

size_t Byte_channel::pending_size() const
{
  Lock_guard lock(m_mutex);
  return m_pending_size;
}

size_t Byte_channel::expected_size() const
{
  return m_expected_size; // It's const; no need to lock.
}

size_t Byte_channel::outstanding_cap() const
{
  return m_outstanding_cap;
}

const std::string& Byte_channel::nickname() const
{
  return m_nickname;
}

std::ostream& operator<<(std::ostream& os, const Byte_channel& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val);
}

} // namespace xfer::transport
