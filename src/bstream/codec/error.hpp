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
 * Namespace containing the bstream::codec module's extension of boost.system error conventions.
 * These are the failures of the payload codecs themselves (compression, decompression, serialization),
 * as opposed to the stream-level failures of bstream::error.  When one of these terminates a
 * stream::Bounded_stream, the stream reports an error::Code::S_UNEXPECTED fault whose cause is the codec code.
 */
namespace bstream::codec::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by bstream::codec functions/methods.
 *
 * @internal
 *
 * Same maintenance rules as bstream::error::Code: keep Category::message() and Category::code_symbol()
 * in error.cpp in sync; add new values at the end, ahead of Code::S_END_SENTINEL.
 */
enum class Code
{
  /**
   * Content type is not one of the serializable ones: `application/json`, `application/msgpack`,
   * `application/x-www-form-urlencoded`.
   */
  S_UNSUPPORTED_CONTENT_TYPE = S_CODE_LOWEST_INT_VALUE,

  /// Decompressor input is not valid data of the declared content encoding (or is truncated).
  S_DECOMPRESS_DATA_CORRUPT,

  /// Compressor failed to process its input.
  S_COMPRESS_FAILED,

  /// Input bytes are not a well-formed document of the declared content type.
  S_DESERIALIZE_MALFORMED,

  /// Value cannot be represented in the requested content type (e.g., a string is not valid UTF-8 for JSON).
  S_SERIALIZE_FAILED,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight #Error_code (a/k/a boost.system `error_code`)
 * representing that error.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding #Error_code.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes a codec::error::Code from a standard input stream; the symbolic, case-insensitive counterpart of
 * `operator<<`, also accepting the numeric value.  No match yields Code::S_END_SENTINEL.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a codec::error::Code to a standard output stream; e.g., Code::S_SERIALIZE_FAILED =>
 * `"SERIALIZE_FAILED"`.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace bstream::codec::error

namespace boost::system
{

// Types.

/// Specialization authorizing boost.system to make `enum` bstream::codec::error::Code convertible to `Error_code`.
template<>
struct is_error_code_enum<::bstream::codec::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
