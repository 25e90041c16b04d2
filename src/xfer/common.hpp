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

/* @todo More consistent to move this below `#include "xfer/..."`; but flow/common.hpp needs to #undef a couple things
 * before `#define`ing them (FLOW_LOG_CFG_COMPONENT_ENUM_*) for that to work.  It really should anyway. */
#include <flow/util/util.hpp>

#include "xfer/detail/common.hpp"

/* We build in C++17 mode ourselves, but linking user shouldn't care about that so much.
 * The APIs and header-inlined stuff (templates, constexprs), however, also require C++17 or newer; and that applies
 * to the linking user's `#include`ing .cpp file(s)!  Therefore enforce it by failing compile unless compiler's
 * C++17 or newer mode is in use. */
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any xfer/ API headers, use C++17 compile mode or later."
#endif

/**
 * Catch-all namespace for the Flow-Xfer project: A library/API in modern C++17 bridging a push-style producer of
 * bytes (network or file source; rate unknown, possibly bursty) with a pull-style sequential consumer (typically an
 * upload routine reading fixed-size windows synchronously), such that the full payload never has to reside on disk
 * or be fully buffered in memory.
 *
 * From the user's perspective, one should view this namespace as the "root," meaning it consists of two parts:
 *   - Symbols directly in Flow-Xfer: The absolute most basic, commonly used symbols (such as the alias
 *     xfer::Error_code).  There should be only a handful of these, and they are likely to be small.
 *     - In particular this includes `enum class` xfer::Log_component which defines the set of possible
 *       `flow::log::Component` values logged from within all modules of Flow-Xfer.  See end of common.hpp.
 *   - Sub-namespaces (like xfer::transport, xfer::util), each of which represents a Flow-Xfer *module* providing
 *     certain grouped functionality.  The modules are discussed just below.
 *
 * Flow-Xfer modules overview
 * --------------------------
 * Bottom-up:
 *
 *   -# xfer::util: Basic, simple building blocks: buffer aliases (util::Blob_const, util::Blob_mutable), time
 *      aliases, an allocator adaptor.
 *      - Dependents: Essentially all other code routinely depends on xfer::util.
 *   -# xfer::transport: The synchronized streaming adapter itself.  transport::Byte_channel is the thread-safe
 *      rendezvous buffer between exactly one producer thread and one consumer thread; transport::Stream_writer and
 *      transport::Stream_reader are the producer-facing and consumer-facing facades over it; and
 *      transport::Adaptive_batcher coalesces small producer fragments into progressively larger writes.
 *      - Dependents: xfer::transfer.
 *   -# xfer::transfer: transfer::Transfer_coordinator runs the (external, user-supplied) upload routine in its own
 *      thread against a transport::Stream_reader, while handing the caller the producer side; then reconciles the
 *      outcome of both sides.
 *
 * Relationship with Flow and Boost
 * --------------------------------
 * Flow-Xfer requires Flow and Boost, not only for internal implementation purposes but also in some of its APIs.
 * For example, `flow::log` is the assumed logging system, and `flow::Error_code` and related conventions are used
 * for error reporting; boost.asio buffer types are used for blobs; and `boost::thread` synchronization primitives
 * are used internally.
 *
 * Moreover, Flow-Xfer shares Flow "DNA" in terms of coding style, error, logging, documentation, etc., conventions.
 *
 * Using Flow-Xfer modules
 * -----------------------
 * ### Error reporting ###
 * The standards and mechanics w/r/t error reporting are entirely
 * inherited from Flow.  Therefore, see the `namespace flow` doc header's "Error reporting" section.  It applies
 * verbatim (within reason) here.
 *
 * ### Logging ###
 * We use the Flow log module, in `flow::log` namespace, for logging.  We are just a consumer, but this does mean
 * the Flow-Xfer user must supply a `flow::log::Logger` into various APIs in order to enable logging.  (Worst-case,
 * passing `Logger == null` will make it log nowhere.)  See `flow::log` docs.
 */
namespace xfer
{

// Types.  They're outside of `namespace ::xfer::util` for brevity due to their frequent use.

/// Short-hand for `flow::Error_code` which is very common.
using Error_code = flow::Error_code;

/// Short-hand for polymorphic functor holder which is very common.  This is essentially `std::function`.
template<typename Signature>
using Function = flow::Function<Signature>;

#ifdef XFER_DOXYGEN_ONLY // Actual compilation will ignore the below; but Doxygen will scan it and generate docs.

/**
 * The `flow::log::Component` payload enumeration containing various log components used by Flow-Xfer internal
 * logging.  Internal Flow-Xfer code specifies members thereof when indicating the log component for each particular
 * piece of logging code.  Flow-Xfer user specifies it, albeit very rarely, when configuring their program's logging
 * such as via `flow::log::Config::init_component_to_union_idx_mapping()` and
 * `flow::log::Config::init_component_names()`.
 *
 * The individual `enum` values are generated via `flow::log` macro magic; find them in the source file
 * `log_component_enum_declare.macros.hpp`.
 */
enum class Log_component
{
  /// Placeholder for Doxygen purposes only.
  S_END_SENTINEL
};

// Constants.

/**
 * The map generated by `flow::log` macro magic that maps each enumerated value in xfer::Log_component to its
 * string representation as used in log output and verbosity config.
 *
 * @see xfer::Log_component first.
 */
extern const boost::unordered_multimap<Log_component, std::string> S_XFER_LOG_COMPONENT_NAME_MAP;

#endif // XFER_DOXYGEN_ONLY

} // namespace xfer
