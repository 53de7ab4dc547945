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

#include "bstream/stream/content.hpp"
#include <optional>

namespace bstream::stream
{

// Types.

/**
 * The terminal failure of a stream: an immutable value carrying an error code plus whatever metadata was known when
 * the failure occurred.  A default-constructed Fault means "no fault"; `bool(fault)` tells the two apart.
 *
 * The typed stream faults, and the factories that make them, are:
 *   - error::Code::S_TOO_LARGE (too_large()): the byte limit was exceeded by the observed size or by the declared
 *     content length.  Metadata: descriptor snapshot, observed (or declared) size, limit.
 *   - error::Code::S_TIMED_OUT (timed_out()): no data arrived for the inactivity timeout.  Metadata: descriptor
 *     snapshot, elapsed idle time.
 *   - error::Code::S_UNEXPECTED (unexpected()): some other failure, for example a file read error or corrupt
 *     compressed data.  The original #Error_code is kept as cause().
 *   - error::Code::S_MULTIPLE_SOURCES (multiple_sources()): a second producer tried to feed the stream.
 *
 * wrap() is the general entry point for turning an arbitrary #Error_code into one of the above.
 *
 * A Fault has a structured representation (to_json()) and a one-line form (`ostream<<`): `<category>[<CODE>]: <message>`.
 */
class Fault
{
public:
  // Constructors/destructor.

  /// Constructs the "no fault" value.
  Fault();

  // Methods.

  /**
   * Makes a size-violation fault.
   *
   * @param descriptor
   *        Metadata of the stream at the time of failure.
   * @param size
   *        Observed byte count (or the declared content length, if that is what exceeded the limit).
   * @param limit
   *        The stream's byte limit.
   * @return See above.
   */
  static Fault too_large(const Content_descriptor& descriptor, uint64_t size, uint64_t limit);

  /**
   * Makes a stall fault.
   *
   * @param descriptor
   *        Metadata of the stream at the time of failure.
   * @param elapsed
   *        Time since the last observed activity; at least the stream's timeout.
   * @return See above.
   */
  static Fault timed_out(const Content_descriptor& descriptor, util::Fine_duration elapsed);

  /**
   * Makes a catch-all fault around an underlying failure.
   *
   * @param cause
   *        The underlying failure.  Must be truthy.
   * @param descriptor
   *        Metadata of the stream at the time of failure.
   * @return See above.
   */
  static Fault unexpected(const Error_code& cause, const Content_descriptor& descriptor);

  /**
   * Makes a multiple-producers fault.
   *
   * @param descriptor
   *        Metadata of the stream at the time of failure.
   * @return See above.
   */
  static Fault multiple_sources(const Content_descriptor& descriptor);

  /**
   * Turns an arbitrary code into a fault: a typed stream fault code (see error::is_stream_fault()) keeps its code
   * (with no further metadata beyond `descriptor`); any other truthy code becomes an unexpected() fault with it as
   * the cause; a falsy code yields "no fault."
   *
   * @param err_code
   *        Code to convert.
   * @param descriptor
   *        Metadata of the stream at the time of failure.
   * @return See above.
   */
  static Fault wrap(const Error_code& err_code, const Content_descriptor& descriptor);

  /**
   * Returns `true` if and only if this is an actual fault.
   * @return See above.
   */
  explicit operator bool() const;

  /**
   * The fault's code: an error::Code for all faults made by the factories.  Falsy if "no fault."
   * @return See above.
   */
  const Error_code& code() const;

  /**
   * Metadata snapshot of the failed stream; empty if "no fault."
   * @return See above.
   */
  const std::optional<Content_descriptor>& descriptor() const;

  /**
   * The offending byte count (too_large() only).
   * @return See above.
   */
  const std::optional<uint64_t>& observed_size() const;

  /**
   * The limit that was exceeded (too_large() only).
   * @return See above.
   */
  const std::optional<uint64_t>& limit() const;

  /**
   * Idle time (timed_out() only).
   * @return See above.
   */
  const std::optional<util::Fine_duration>& elapsed() const;

  /**
   * Underlying failure (unexpected() only); falsy otherwise.
   * @return See above.
   */
  const Error_code& cause() const;

  /**
   * Short symbolic name of the fault: `TooLarge`, `TimedOut`, `Unexpected`, `MultipleSources`; empty if "no fault."
   * @return See above.
   */
  std::string name() const;

  /**
   * Human-readable message: the code's message, followed by the cause's message if there is a cause.
   * @return See above.
   */
  std::string message() const;

  /**
   * Structured representation:
   * `{"name", "code", "message", "metadata": {"contentType", "contentEncoding", "contentLength"?, "size"?,
   * "limit"?, "duration"?}, "cause"?: {"category", "code", "message"}}`.  `duration` is in milliseconds.
   * "No fault" is JSON `null`.
   *
   * @return See above.
   */
  codec::Value to_json() const;

private:
  // Constructors.

  /**
   * Constructs a fault with the given code and descriptor; other members empty.
   *
   * @param err_code
   *        Code.
   * @param descriptor
   *        Descriptor.
   */
  explicit Fault(const Error_code& err_code, const Content_descriptor& descriptor);

  // Data.

  /// See code().
  Error_code m_err_code;

  /// See descriptor().
  std::optional<Content_descriptor> m_descriptor;

  /// See observed_size().
  std::optional<uint64_t> m_observed_size;

  /// See limit().
  std::optional<uint64_t> m_limit;

  /// See elapsed().
  std::optional<util::Fine_duration> m_elapsed;

  /// See cause().
  Error_code m_cause;
}; // class Fault

// Free functions.

/**
 * Prints string representation of the given Fault to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Fault& val);

} // namespace bstream::stream
