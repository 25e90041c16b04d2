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
#include <memory>

namespace xfer::util
{

/**
 * Allocator adaptor whose no-argument `construct()` default-initializes instead of value-initializing; so, e.g.,
 * `vector<uint8_t, Default_init_allocator<uint8_t>>::resize()` leaves the new tail uninitialized instead of
 * zero-filling it.
 *
 * transport::Adaptive_batcher grows its accumulation buffer by each fragment's size and immediately copies the
 * fragment into the new tail; zeroing that tail first would be wasted work on every fragment.  (`flow::util::Blob`
 * skips zeroing too but does not keep its contents when it has to grow, which an accumulating buffer needs.)
 *
 * Construction with 1+ args is not declared here, so `std::allocator_traits` performs it the usual way
 * (placement-`new`).
 *
 * @tparam T
 *         Element type.
 * @tparam Allocator
 *         The adaptee; `std::allocator<T>` by default.
 */
template <typename T, typename Allocator>
class Default_init_allocator : public Allocator
{
public:
  /// Rebinding keeps the adaptor around the rebound adaptee.
  template<typename U>
  struct rebind
  {
    /// See above.
    using other = Default_init_allocator<U, typename std::allocator_traits<Allocator>::template rebind_alloc<U>>;
  };

  using Allocator::Allocator;

  /**
   * Default-initializes a `U` at `ptr`; for a trivial `U` that is a no-op.
   *
   * @tparam U
   *         Type being constructed.
   * @param ptr
   *        Where.
   */
  template<typename U>
  void construct(U* ptr)
  {
    ::new(static_cast<void*>(ptr)) U;
  }
}; // class Default_init_allocator

} // namespace xfer::util
