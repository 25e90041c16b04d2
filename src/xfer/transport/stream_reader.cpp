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
#include "xfer/transport/stream_reader.hpp"
#include "xfer/transport/byte_channel.hpp"
#include "xfer/transport/error.hpp"
#include <flow/error/error.hpp>
#include <flow/util/blob.hpp>

namespace xfer::transport
{

Stream_reader::Stream_reader(Byte_channel* channel, Progress_func&& on_progress_func) :
  m_channel(channel),
  m_on_progress_func(std::move(on_progress_func))
{
  assert(m_channel && "Reader needs a channel.");
}

size_t Stream_reader::read(const util::Blob_mutable& target, Error_code* err_code)
{
  using util::Blob_mutable;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(size_t, Stream_reader::read, flow::util::bind_ns::cref(target), _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  err_code->clear(); // In case target is empty.

  const auto target_start = util::blob_data(target);
  size_t n_read = 0;
  while (n_read != target.size())
  {
    const size_t n = read_some(Blob_mutable(target_start + n_read, target.size() - n_read), err_code);
    if (*err_code)
    {
      return 0;
    }
    // else
    if (n == 0)
    {
      break; // End-of-stream.
    }
    // else
    n_read += n;
  }

  return n_read;
} // Stream_reader::read()

size_t Stream_reader::read_some(const util::Blob_mutable& target, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(size_t, Stream_reader::read_some, flow::util::bind_ns::cref(target), _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const size_t n = m_channel->take(target, err_code);
  if ((n != 0) && m_on_progress_func)
  {
    m_on_progress_func(tell());
  }
  return n;
}

size_t Stream_reader::for_each_chunk(size_t chunk_size, const Chunk_func& on_chunk_func, Error_code* err_code)
{
  using util::Blob_const;
  using util::Blob_mutable;
  using flow::util::Blob;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(size_t, Stream_reader::for_each_chunk,
                                     chunk_size, flow::util::bind_ns::cref(on_chunk_func), _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  assert((chunk_size != 0) && "Chunks must be non-empty.");

  Blob chunk(m_channel->get_logger(), chunk_size);
  size_t n_total = 0;
  while (true)
  {
    const size_t n = read(Blob_mutable(chunk.begin(), chunk_size), err_code);
    if (*err_code || (n == 0))
    {
      break;
    }
    // else

    on_chunk_func(Blob_const(chunk.begin(), n));
    n_total += n;

    if (n != chunk_size)
    {
      break; // Short read <=> end-of-stream.  Skip the extra read() that would just return 0.
    }
  }

  return n_total;
} // Stream_reader::for_each_chunk()

bool Stream_reader::abort()
{
  return m_channel->fail(error::Code::S_CONSUMER_FAILURE);
}

size_t Stream_reader::size() const
{
  return m_channel->expected_size();
}

size_t Stream_reader::tell() const
{
  return m_channel->total_read();
}

Error_code Stream_reader::error() const
{
  return m_channel->error();
}

const Byte_channel& Stream_reader::channel() const
{
  return *m_channel;
}

std::ostream& operator<<(std::ostream& os, const Stream_reader& val)
{
  return os << "reader->" << val.channel();
}

} // namespace xfer::transport
