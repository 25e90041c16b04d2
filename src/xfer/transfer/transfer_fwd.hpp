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

/**
 * Flow-Xfer module that runs a complete producer-to-consumer transfer on top of xfer::transport: the consumer (an
 * external upload routine reading from a transport::Stream_reader) in a dedicated thread; the producer in the
 * caller's thread, writing via a transport::Adaptive_batcher (or directly via the transport::Stream_writer).
 * See namespace ::xfer doc header for an overview of Flow-Xfer modules.
 *
 * The one class here is Transfer_coordinator.
 */
namespace xfer::transfer
{

// Types.

// Find doc headers near the bodies of these compound types.

class Transfer_coordinator;

// Free functions.

/**
 * Prints string representation of the given `Transfer_coordinator` to the given `ostream`.
 *
 * @relatesalso Transfer_coordinator
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Transfer_coordinator& val);

} // namespace xfer::transfer
