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

namespace xfer::transport
{

// Types.

/**
 * Tuning knobs for the producer side of a transfer: the Adaptive_batcher flush-threshold schedule, and the
 * Byte_channel backpressure bound.  A plain aggregate; default-cted values are sensible for uploads.
 *
 * The Adaptive_batcher threshold starts at #m_base_unit, and after each flush grows by another #m_base_unit, until
 * it reaches max_flush() `== m_base_unit * m_max_multiplier`, where it stays.  So with the defaults: 4096, 8192,
 * 12288, ..., 81920, 81920, ....
 *
 * #m_outstanding_cap bounds how many bytes may sit in the Byte_channel written but not yet read, before the
 * producer's next write blocks.  It is a bound on *when a write may begin*, not on the resulting buffer size: a write
 * begins once the buffered amount is below the cap, and then the entire write is accepted.  Hence memory use is
 * bounded by `m_outstanding_cap` plus the largest single write (which, behind an Adaptive_batcher, is about
 * max_flush() plus the largest producer fragment).
 */
struct Batching_config
{
  // Constants.

  /// Default for #m_base_unit.
  static constexpr size_t S_DEFAULT_BASE_UNIT = 4 * 1024;

  /// Default for #m_max_multiplier.
  static constexpr unsigned int S_DEFAULT_MAX_MULTIPLIER = 20;

  /// Default for #m_outstanding_cap: 8 MiB.
  static constexpr size_t S_DEFAULT_OUTSTANDING_CAP = 8 * 1024 * 1024;

  // Data.

  /// Initial flush threshold; and the amount by which it grows after each flush.  Must be positive.
  size_t m_base_unit = S_DEFAULT_BASE_UNIT;

  /// Ceiling of flush threshold, as a multiple of #m_base_unit.  Must be positive; max_flush() must fit in `size_t`.
  unsigned int m_max_multiplier = S_DEFAULT_MAX_MULTIPLIER;

  /// Backpressure bound on buffered-but-unread bytes; 0 means unbounded.  If not 0, must be at least max_flush().
  size_t m_outstanding_cap = S_DEFAULT_OUTSTANDING_CAP;

  // Methods.

  /**
   * Flush-threshold ceiling: `m_base_unit * m_max_multiplier`.
   * @return See above.
   */
  size_t max_flush() const;

  /**
   * Checks the values for sanity, as described on the individual members.  Logs WARNING on failure.
   *
   * @param logger_ptr
   *        Logger to use for logging (WARNING, on error only).
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_ARGUMENT.
   * @return `true` if and only if valid (unless exception thrown).
   */
  bool validate(flow::log::Logger* logger_ptr, Error_code* err_code = 0) const;
}; // struct Batching_config

} // namespace xfer::transport
