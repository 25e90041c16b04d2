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

#include "xfer/common.hpp"
#include <flow/log/log.hpp>
#include <boost/asio/buffer.hpp>

/**
 * Flow-Xfer module containing miscellaneous general-use facilities that are ubiquitously used by ~all Flow-Xfer
 * modules and/or do not fit into any other Flow-Xfer module.
 *
 * Most notably util::Blob_const and util::Blob_mutable are how any contiguous range of bytes is passed into and out
 * of the xfer::transport APIs: producer fragments going in, consumer read windows coming out.
 */
namespace xfer::util
{

// Types.

// Find doc headers near the bodies of these compound types.

template <typename T, typename Allocator = std::allocator<T>>
class Default_init_allocator;

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;
/// Short-hand for Flow's `Fine_duration`.
using Fine_duration = flow::Fine_duration;

/**
 * Short-hand for an immutable blob somewhere in memory, stored as exactly a `void const *` and a `size_t`.
 *
 * ### How to use ###
 * We provide this alias as a stylistic short-hand, as it better suits various interfaces especially in
 * xfer::transport.  Nevertheless it's not meant to more than that; it's an attempt to abstract it away.
 *
 * That is to say, to work with these (create them, access them, etc.), do use the highly convenient
 * boost.asio buffer APIs which are well documented in boost.asio's docs.
 */
using Blob_const = boost::asio::const_buffer;

/**
 * Short-hand for an mutable blob somewhere in memory, stored as exactly a `void*` and a `size_t`.
 * @see xfer::util::Blob_const; usability notes in that doc header apply similarly here.
 */
using Blob_mutable = boost::asio::mutable_buffer;

// Free functions.

/**
 * Syntactic-sugary helper that returns pointer to first byte in an immutable buffer, as `const uint8_t*`.
 *
 * @param blob
 *        The buffer.
 * @return See above.
 */
const uint8_t* blob_data(const Blob_const& blob);

/**
 * Syntactic-sugary helper that returns pointer to first byte in a mutable buffer, as `uint8_t*`.
 *
 * @param blob
 *        The buffer.
 * @return See above.
 */
uint8_t* blob_data(const Blob_mutable& blob);

} // namespace xfer::util
