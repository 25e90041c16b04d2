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

#include "xfer/util/util_fwd.hpp"

/**
 * Flow-Xfer module providing the synchronized streaming adapter between one push-style producer thread and one
 * pull-style consumer thread.  See namespace ::xfer doc header for an overview of Flow-Xfer modules including
 * how xfer::transport relates to the others.  Then return here.  A synopsis follows:
 *
 * Byte_channel is the heart of it: a thread-safe FIFO of pending bytes, with the size declared up-front, monotonic
 * written/read counters, a closed flag (end-of-input from the producer) and a failure slot settable by either side.
 * It is file-like to the consumer: Byte_channel::take() blocks until bytes (or end-of-stream, or failure) are
 * available.  It is bounded for the producer: Byte_channel::append() blocks while too many bytes are buffered but
 * unread (backpressure).
 *
 * Nobody is expected to use Byte_channel directly, however.  The producer speaks to a Stream_writer; the consumer
 * (typically an external upload routine) to a Stream_reader.  Each facade exposes exactly the operations that side
 * needs.  In front of the Stream_writer one would usually place an Adaptive_batcher, which accumulates the
 * producer's (often tiny) fragments and forwards them in batches whose size grows over the life of the transfer,
 * per a Batching_config.
 *
 * To actually run a transfer -- consumer in its own thread, producer in the caller's -- see xfer::transfer.
 */
namespace xfer::transport
{

// Types.

// Find doc headers near the bodies of these compound types.

class Byte_channel;
class Stream_writer;
class Stream_reader;
class Adaptive_batcher;
struct Batching_config;

// Free functions.

/**
 * Prints string representation of the given `Byte_channel` to the given `ostream`.
 *
 * @relatesalso Byte_channel
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Byte_channel& val);

/**
 * Prints string representation of the given `Stream_writer` to the given `ostream`.
 *
 * @relatesalso Stream_writer
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Stream_writer& val);

/**
 * Prints string representation of the given `Stream_reader` to the given `ostream`.
 *
 * @relatesalso Stream_reader
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Stream_reader& val);

/**
 * Prints string representation of the given `Adaptive_batcher` to the given `ostream`.
 *
 * @relatesalso Adaptive_batcher
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Adaptive_batcher& val);

/**
 * Prints string representation of the given `Batching_config` to the given `ostream`.
 *
 * @relatesalso Batching_config
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Batching_config& val);

} // namespace xfer::transport
