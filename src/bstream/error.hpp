/* Bstream: Core
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

#include "bstream/common.hpp"

/**
 * Namespace containing Bstream's extension of boost.system error conventions, so that its APIs
 * can return codes/messages from within its own new set of error codes/messages.  Note that many errors
 * Bstream might report are system errors (e.g., failing to open a file) and would not draw from this set of
 * codes/messages but rather from `boost::system::errc` or `boost::asio::error`.
 *
 * The codes fall into three groups:
 *   - *Stream faults*: the terminal, asynchronously reported failures of a stream::Bounded_stream:
 *     Code::S_TOO_LARGE, Code::S_TIMED_OUT, Code::S_UNEXPECTED, Code::S_MULTIPLE_SOURCES.  is_stream_fault()
 *     identifies them.  Each one is accompanied, in practice, by a stream::Fault carrying its metadata.
 *   - *Construction faults*: synchronous rejections of the arguments to a stream or timer constructor.
 *   - Lifecycle misuse and shutdown codes.
 *
 * @see bstream::codec::error which covers errors from the payload codecs.
 *
 * See flow's `flow::net_flow::error` doc header which was used as the model for this and similar.
 */
namespace bstream::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by Bstream functions/methods *outside of*
 * system-triggered errors and outside of codec errors (bstream::codec::error::Code).
 * These values are convertible to #Error_code (a/k/a `boost::system::error_code`) and thus
 * extend the set of errors that #Error_code can represent.
 *
 * @internal
 *
 * When you add a value to this `enum`, also add its description to
 * error.cpp's Category::message().  This description must be identical to the
 * description in the /// comment below, or at least as close as possible.
 *
 * When you add a value to this `enum`, also add its symbolic representation to error.cpp's
 * Category::code_symbol().  This string must be identical to the symbol, minus the `S_`;
 * e.g., Code::S_TOO_LARGE => `"TOO_LARGE"`.  This enables the consistent and human-friendly
 * serialization `<<` and deserialization `>>` of a Code w/r/t standard streams.
 *
 * Add new values at the end, but ahead of Code::S_END_SENTINEL.
 */
enum class Code
{
  /// Stream fault: observed byte count, or declared content length, exceeds the stream's byte limit.
  S_TOO_LARGE = S_CODE_LOWEST_INT_VALUE,

  /// Stream fault: no data arrived for longer than the stream's inactivity timeout.
  S_TIMED_OUT,

  /// Stream fault: an underlying, non-stream-specific failure occurred; the original error is kept as its cause.
  S_UNEXPECTED,

  /// Stream fault: a second producer attempted to feed a stream that already has one.
  S_MULTIPLE_SOURCES,

  /// Construction fault: content type is not of the form `<application|audio|image|multipart|text|video>/<subtype>`.
  S_INVALID_CONTENT_TYPE,

  /// Construction fault: content encoding is not one of `identity`, `gzip`, `deflate`.
  S_INVALID_CONTENT_ENCODING,

  /// Construction fault: declared content length must be positive if specified.
  S_INVALID_CONTENT_LENGTH,

  /// Construction fault: byte limit must be positive.
  S_INVALID_LIMIT,

  /// Construction fault: timer periods must be non-negative, and check interval must not exceed timeout.
  S_INVALID_TIMER_PERIODS,

  /// Inactivity timer has already been destroyed or has already fired; it cannot record further activity.
  S_TIMER_DESTROYED,

  /**
   * Async completion handler is being called prematurely, because underlying object is shutting down,
   * as user desires.
   */
  S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight #Error_code (a/k/a boost.system `error_code`)
 * representing that error.  This is needed to make the
 * `boost::system::error_code::error_code<Code>()` template implementation work.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding #Error_code.
 */
Error_code make_error_code(Code err_code);

/**
 * Returns `true` if and only if `err_code` is one of the 4 terminal stream-fault codes: Code::S_TOO_LARGE,
 * Code::S_TIMED_OUT, Code::S_UNEXPECTED, Code::S_MULTIPLE_SOURCES.  Any other #Error_code -- including
 * other Code values and every code of any other category -- yields `false`; such errors, when they terminate a
 * stream, get wrapped into an Code::S_UNEXPECTED fault.
 *
 * @param err_code
 *        Any code, including success.
 * @return See above.
 */
bool is_stream_fault(const Error_code& err_code);

/**
 * Deserializes an error::Code from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character; the resulting string is then mapped to a Code.  If none is
 * recognized, Code::S_END_SENTINEL is the result.  The recognized values are:
 *   - "1", "2", ...: Corresponds to the `int` conversion of that Code.
 *   - Case-insensitive encoding of the non-S_-prefix part of the actual Code member; e.g.,
 *     "TOO_LARGE" (or "too_large" or "Too_large" or...) for Code::S_TOO_LARGE.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes an error::Code to a standard output stream.  The output string is compatible with the reverse
 * `istream>>` operator.  E.g., Code::S_TIMED_OUT => `"TIMED_OUT"`.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace bstream::error

namespace boost::system
{

// Types.

/**
 * Specialization that authorizes boost.system to make `enum` bstream::error::Code convertible to `Error_code`.
 * This is the official way to accomplish that, as documented in boost.system docs.
 */
template<>
struct is_error_code_enum<::bstream::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
