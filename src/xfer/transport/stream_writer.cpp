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
#include "xfer/transport/stream_writer.hpp"
#include "xfer/transport/byte_channel.hpp"
#include "xfer/transport/error.hpp"
#include <flow/error/error.hpp>

namespace xfer::transport
{

Stream_writer::Stream_writer(Byte_channel* channel) :
  m_channel(channel)
{
  assert(m_channel && "Writer needs a channel.");
}

size_t Stream_writer::write(const util::Blob_const& data, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(size_t, Stream_writer::write, flow::util::bind_ns::cref(data), _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  m_channel->append(data, err_code);
  return (*err_code) ? 0 : data.size();
}

bool Stream_writer::close()
{
  return m_channel->close();
}

bool Stream_writer::abort()
{
  return m_channel->fail(error::Code::S_PRODUCER_FAILURE);
}

Error_code Stream_writer::error() const
{
  return m_channel->error();
}

size_t Stream_writer::bytes_written() const
{
  return m_channel->total_written();
}

size_t Stream_writer::expected_size() const
{
  return m_channel->expected_size();
}

const Byte_channel& Stream_writer::channel() const
{
  return *m_channel;
}

std::ostream& operator<<(std::ostream& os, const Stream_writer& val)
{
  return os << "writer->" << val.channel();
}

} // namespace xfer::transport
