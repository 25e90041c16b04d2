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
#include "xfer/transport/adaptive_batcher.hpp"
#include "xfer/transport/stream_writer.hpp"
#include "xfer/transport/byte_channel.hpp"
#include "xfer/transport/error.hpp"
#include <flow/error/error.hpp>
#include <cstring>

namespace xfer::transport
{

Adaptive_batcher::Adaptive_batcher(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                                   Stream_writer* writer, const Batching_config& config) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_nickname(nickname_str),
  m_writer(writer),
  m_base_unit(config.m_base_unit),
  m_max_flush(config.max_flush()),
  m_min_flush(m_base_unit),
  m_phase(Phase::S_ACCUMULATING),
  m_bytes_flushed(0),
  m_n_flushes(0)
{
  assert(m_writer && "Batcher needs a writer.");
  assert((m_base_unit != 0) && (m_max_flush >= m_base_unit) && "Invalid config; see Batching_config::validate().");

  // Usually a batch is forwarded once it reaches the threshold, never above max + 1 fragment.  Avoid early regrowth.
  m_pending_fragment.reserve(m_max_flush);

  FLOW_LOG_INFO("Adaptive_batcher [" << *this << "]: Created; config [" << config << "]; "
                "writing to [" << *m_writer << "].");
}

Adaptive_batcher::~Adaptive_batcher()
{
  if ((m_phase != Phase::S_CLOSING) && m_writer->channel().closed())
  {
    // Producer went around us and closed the stream through the writer.  Nothing to cancel.
    if (!m_pending_fragment.empty())
    {
      FLOW_LOG_WARNING("Adaptive_batcher [" << *this << "]: Destroyed after the stream was closed directly through "
                       "the writer; [" << m_pending_fragment.size() << "] accumulated bytes were never forwarded.");
      m_pending_fragment.clear();
    }
    m_phase = Phase::S_CLOSING;
  }
  else if (m_phase != Phase::S_CLOSING)
  {
    FLOW_LOG_WARNING("Adaptive_batcher [" << *this << "]: Destroyed without close() or abort(); treating this as "
                     "producer cancellation.");
    abort();
  }

  FLOW_LOG_INFO("Adaptive_batcher [" << *this << "]: Shutting down.  Forwarded [" << m_bytes_flushed << "] bytes "
                "in [" << m_n_flushes << "] batches; final threshold [" << m_min_flush << "]; "
                "failure = [" << m_err_code << "] [" << m_err_code.message() << "].");
}

size_t Adaptive_batcher::write(const util::Blob_const& fragment, Error_code* err_code)
{
  using flow::util::buffers_dump_string;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(size_t, Adaptive_batcher::write, flow::util::bind_ns::cref(fragment), _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (m_phase == Phase::S_CLOSING)
  {
    if (m_err_code)
    {
      FLOW_LOG_WARNING("Adaptive_batcher [" << *this << "]: Write of [" << fragment.size() << "] bytes requested, "
                       "but the transfer already failed with [" << m_err_code << "] "
                       "[" << m_err_code.message() << "]; emitting that.");
      *err_code = m_err_code;
    }
    else
    {
      FLOW_LOG_WARNING("Adaptive_batcher [" << *this << "]: Write of [" << fragment.size() << "] bytes requested, "
                       "but the producer already closed the stream.");
      *err_code = error::Code::S_WRITES_FINISHED_CANNOT_WRITE;
    }
    return 0;
  }
  // else

  assert(m_phase == Phase::S_ACCUMULATING);

  if (const auto channel_err_code = m_writer->error())
  {
    to_failed(channel_err_code);
    *err_code = channel_err_code;
    return 0;
  }
  // else

  if (fragment.size() != 0)
  {
    const size_t old_size = m_pending_fragment.size();
    m_pending_fragment.resize(old_size + fragment.size());
    std::memcpy(&m_pending_fragment[old_size], fragment.data(), fragment.size());
  }

  if (m_pending_fragment.size() < m_min_flush)
  {
    FLOW_LOG_TRACE("Adaptive_batcher [" << *this << "]: Accumulated fragment of [" << fragment.size() << "] bytes; "
                   "now holding [" << m_pending_fragment.size() << "], below threshold [" << m_min_flush << "].");
    FLOW_LOG_DATA("Blob contents: [\n" << buffers_dump_string(fragment, "  ") << "].");
    err_code->clear();
    return 0;
  }
  // else

  FLOW_LOG_TRACE("Adaptive_batcher [" << *this << "]: Accumulated fragment of [" << fragment.size() << "] bytes; "
                 "now holding [" << m_pending_fragment.size() << "], at/above threshold [" << m_min_flush << "]; "
                 "flushing.");
  return flush(err_code);
} // Adaptive_batcher::write()

size_t Adaptive_batcher::close(Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(size_t, Adaptive_batcher::close, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (m_phase == Phase::S_CLOSING)
  {
    if (m_err_code)
    {
      FLOW_LOG_WARNING("Adaptive_batcher [" << *this << "]: Close requested, but the transfer already failed with "
                       "[" << m_err_code << "] [" << m_err_code.message() << "]; emitting that.");
      *err_code = m_err_code;
    }
    else
    {
      FLOW_LOG_TRACE("Adaptive_batcher [" << *this << "]: Close requested, but already closed; no-op.");
      err_code->clear();
    }
    return 0;
  }
  // else

  size_t n_flushed = 0;
  if (!m_pending_fragment.empty())
  {
    FLOW_LOG_TRACE("Adaptive_batcher [" << *this << "]: Close requested; flushing the remaining "
                   "[" << m_pending_fragment.size() << "] bytes regardless of threshold [" << m_min_flush << "].");
    n_flushed = flush(err_code);
    if (*err_code)
    {
      return 0;
    }
  }
  else
  {
    err_code->clear();
  }

  if (!m_writer->close())
  {
    // The consumer side may have failed the channel at any point up to now, including after the last flush.
    if (const auto channel_err_code = m_writer->error())
    {
      to_failed(channel_err_code);
      *err_code = channel_err_code;
      return 0;
    }
    // else
    FLOW_LOG_INFO("Adaptive_batcher [" << *this << "]: Close requested, but the stream was already closed directly "
                  "through the writer.");
  }
  m_phase = Phase::S_CLOSING;

  FLOW_LOG_INFO("Adaptive_batcher [" << *this << "]: Closed.  Final batch [" << n_flushed << "] bytes; total "
                "forwarded [" << m_bytes_flushed << "] in [" << m_n_flushes << "] batches.  End-of-stream forwarded.");
  return n_flushed;
} // Adaptive_batcher::close()

bool Adaptive_batcher::abort()
{
  if (m_phase == Phase::S_CLOSING)
  {
    FLOW_LOG_TRACE("Adaptive_batcher [" << *this << "]: Abort requested, but already in terminal state; no-op.");
    return false;
  }
  // else

  FLOW_LOG_WARNING("Adaptive_batcher [" << *this << "]: Producer cancelled.  Discarding "
                   "[" << m_pending_fragment.size() << "] accumulated bytes; failing the channel so the consumer "
                   "does not wait forever.");
  m_writer->abort();
  to_failed(error::Code::S_PRODUCER_FAILURE);
  return true;
}

size_t Adaptive_batcher::flush(Error_code* err_code)
{
  using util::Blob_const;
  using std::min;

  assert(err_code);
  assert((!m_pending_fragment.empty()) && (m_phase == Phase::S_ACCUMULATING));

  m_phase = Phase::S_FLUSHING;
  const size_t n = m_writer->write(Blob_const(m_pending_fragment.data(), m_pending_fragment.size()), err_code);
  if (*err_code)
  {
    to_failed(*err_code);
    return 0;
  }
  // else

  assert(n == m_pending_fragment.size());
  m_pending_fragment.clear(); // Capacity stays; so steady-state operation allocates nothing here.
  m_bytes_flushed += n;
  ++m_n_flushes;

  if (m_min_flush < m_max_flush)
  {
    const size_t old_min_flush = m_min_flush;
    m_min_flush = min(m_min_flush + m_base_unit, m_max_flush);
    FLOW_LOG_INFO("Adaptive_batcher [" << *this << "]: Flushed batch #[" << m_n_flushes << "] of [" << n << "] "
                  "bytes (total [" << m_bytes_flushed << "]).  Threshold grows [" << old_min_flush << "] => "
                  "[" << m_min_flush << "] (ceiling [" << m_max_flush << "]).");
  }
  else
  {
    FLOW_LOG_TRACE("Adaptive_batcher [" << *this << "]: Flushed batch #[" << m_n_flushes << "] of [" << n << "] "
                   "bytes (total [" << m_bytes_flushed << "]).  Threshold at ceiling [" << m_max_flush << "].");
  }

  m_phase = Phase::S_ACCUMULATING;
  return n;
} // Adaptive_batcher::flush()

void Adaptive_batcher::to_failed(const Error_code& err_code)
{
  assert(err_code);

  if (!m_pending_fragment.empty())
  {
    FLOW_LOG_WARNING("Adaptive_batcher [" << *this << "]: Transfer failed with [" << err_code << "] "
                     "[" << err_code.message() << "]; discarding [" << m_pending_fragment.size() << "] accumulated "
                     "bytes that were never forwarded.");
  }
  else
  {
    FLOW_LOG_WARNING("Adaptive_batcher [" << *this << "]: Transfer failed with [" << err_code << "] "
                     "[" << err_code.message() << "].");
  }

  m_pending_fragment.clear();
  m_err_code = err_code;
  m_phase = Phase::S_CLOSING;
}

size_t Adaptive_batcher::min_flush() const
{
  return m_min_flush;
}

size_t Adaptive_batcher::max_flush() const
{
  return m_max_flush;
}

size_t Adaptive_batcher::pending_size() const
{
  return m_pending_fragment.size();
}

size_t Adaptive_batcher::bytes_flushed() const
{
  return m_bytes_flushed;
}

Adaptive_batcher::Phase Adaptive_batcher::phase() const
{
  return m_phase;
}

const std::string& Adaptive_batcher::nickname() const
{
  return m_nickname;
}

std::ostream& operator<<(std::ostream& os, const Adaptive_batcher& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val) << " phase[" << val.phase() << ']';
}

std::ostream& operator<<(std::ostream& os, Adaptive_batcher::Phase val)
{
  using Phase = Adaptive_batcher::Phase;

  switch (val)
  {
  case Phase::S_ACCUMULATING:
    return os << "ACCUMULATING";
  case Phase::S_FLUSHING:
    return os << "FLUSHING";
  case Phase::S_CLOSING:
    return os << "CLOSING";
  }
  assert(false);
  return os;
}

} // namespace xfer::transport
