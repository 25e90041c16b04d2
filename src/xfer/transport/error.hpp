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

/**
 * Namespace containing the xfer::transport module's extension of boost.system error conventions, so that that API
 * can return codes/messages from within its own new set of error codes/messages.  Note that an upload routine
 * driven by transfer::Transfer_coordinator may well report errors from other categories entirely (system errors,
 * its own codes); those are passed through untouched, and mixing is normal in boost.system.
 *
 * See flow's `flow::net_flow::error` doc header which was used as the model for this and similar.
 * As of this writing there is discussion there useful for someone new to boost.system error reporting.
 */
namespace xfer::transport::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by xfer::transport and xfer::transfer functions/methods
 * *outside of* errors reported by the user's own upload routine.
 * These values are convertible to #Error_code (a/k/a `boost::system::error_code`) and thus
 * extend the set of errors that #Error_code can represent.
 *
 * @internal
 *
 * When you add a value to this `enum`, also add its description to
 * error.cpp's Category::message().  This description must be identical to the
 * description in the /// comment below, or at least as close as possible.  This mirrors Flow's convention.
 *
 * When you add a value to this `enum`, also add its symbolic representation to
 * error.cpp's Category::code_symbol().  This string must be identical to the symbol, minus the `S_`;
 * e.g., Code::S_INVALID_ARGUMENT => `"INVALID_ARGUMENT".  This enables the consistent and human-friendly
 * serialization `<<` and deserialization `>>` of a Code w/r/t standard streams.
 *
 * If, when adding a new revision of the code, you add a value to this `enum`, add it to the end, but ahead of
 * Code::S_END_SENTINEL.
 */
enum class Code
{
  /// Will not write: the producer already closed the stream via API marking end-of-input.
  S_WRITES_FINISHED_CANNOT_WRITE = S_CODE_LOWEST_INT_VALUE,

  /**
   * Producer side aborted the transfer before closing the stream; any data not yet written into the channel
   * was discarded.
   */
  S_PRODUCER_FAILURE,

  /// Consumer side (upload routine) failed or went away; no further data can be written into the channel.
  S_CONSUMER_FAILURE,

  /// Consumer side (upload routine) reported success without reading through end-of-stream; transfer is truncated.
  S_CONSUMER_FINISHED_EARLY,

  /// User called an API with 1 or more arguments against the API spec.
  S_INVALID_ARGUMENT,

  /// A (usually user-specified) timeout period has elapsed before a blocking operation completed.
  S_TIMEOUT,

  /// Transfer object is shutting down before the transfer completed, as user desires; the transfer is aborted.
  S_OBJECT_SHUTDOWN_ABORTED,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight #Error_code (a/k/a boost.system `error_code`)
 * representing that error.  This is needed to make the
 * `boost::system::error_code::error_code<Code>()` template implementation work.  Or, slightly more in English,
 * it glues the (completely general) #Error_code to the (`xfer::transport`-specific) error code set
 * xfer::transport::error::Code, so that one can implicitly covert from the latter to the former.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding #Error_code.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes a transport::error::Code from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character; the resulting string is then mapped to a Code.  If none is
 * recognized, Code::S_END_SENTINEL is the result.  The recognized values are:
 *   - "1", "2", ...: Corresponds to the `int` conversion of that Code.
 *   - Case-insensitive encoding of the non-S_-prefix part of the actual Code member; e.g.,
 *     "CONSUMER_FAILURE" (or "consumer_failure" or "Consumer_failure" or...) for Code::S_CONSUMER_FAILURE.
 * This enables a few I/O things to work, including parsing from config file/command line via and conversion from
 * `string` via `boost::lexical_cast`.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a transport::error::Code to a standard output stream.  The output string is compatible with the reverse
 * `istream>>` operator.
 *
 * ### Rationale ###
 * This shall print a representation that looks like the identifier in C++ code; e.g.,
 * Code::S_CONSUMER_FAILURE => `"CONSUMER_FAILURE"`.  Nevertheless, when printing an #Error_code storing
 * a Code, continue to do the standard thing: output the #Error_code (which will print the category name, in our
 * case `"xfer/transport"`; and the numeric `enum` value) itself plus its `.message()`.
 *
 * The symbolic form exists primarily for testing scenarios: it's nicer to say "expect CONSUMER_FAILURE" rather than
 * "expect 3."
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace xfer::transport::error

/**
 * Small group of miscellaneous utilities to ease work with boost.system, joining its `boost::system` namespace.
 * As of this writing it contains only `is_error_code_enum<>` specializations to properly
 * extend the `boost::system` error-code system.
 */
namespace boost::system
{

// Types.

/**
 * Specializes this `struct` so that boost.system uses it as authorization to make `enum` `Code` convertible to
 * `Error_code`.  The non-specialized version of this sets `value` to `false`, so that random arbitary `enum`s can't
 * just be used as `Error_code`s.  Note that this is the offical way to accomplish that, as (confusingly but
 * formally) documented in boost.system docs.
 */
template<>
struct is_error_code_enum<::xfer::transport::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
