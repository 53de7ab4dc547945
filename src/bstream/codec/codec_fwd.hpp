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

#include "bstream/util/util_fwd.hpp"
#include <nlohmann/json.hpp>
#include <boost/move/unique_ptr.hpp>

/**
 * bstream::codec contains the payload codecs: compression/decompression between the supported content
 * encodings, and (de)serialization of structured documents against the supported content types.  Nothing here
 * implements a codec from scratch: zlib (through boost.iostreams) compresses; nlohmann::json parses and emits JSON
 * and MessagePack.  URL-encoded form text, having no such library in our stack, is the one exception; see
 * serializer.hpp.
 *
 * Nothing in bstream::codec knows about streams, limits or timers; that is bstream::stream's business.
 */
namespace bstream::codec
{

// Types.

// Find doc headers near the bodies of these compound types.

class Chunk_transform;

/**
 * A transfer encoding of a byte stream, as in HTTP `Content-Encoding`.  `ostream<<` prints (and `istream>>` reads,
 * case-insensitively) the wire token: `identity`, `gzip`, `deflate`.
 */
enum class Content_encoding
{
  /// No encoding: bytes as-is.
  S_IDENTITY,

  /// gzip container (RFC 1952) around deflate data.
  S_GZIP,

  /// zlib container (RFC 1950) around deflate data; this is what HTTP `Content-Encoding: deflate` means.
  S_DEFLATE,

  /// Sentinel: not a valid value.
  S_END_SENTINEL
}; // enum class Content_encoding

/**
 * A structured document: what codec::serialize() consumes and codec::deserialize() produces.
 * It is nlohmann's JSON value type: null, boolean, number, string, array, object (and binary, for MessagePack).
 */
using Value = nlohmann::json;

/// Short-hand for a uniquely-owned Chunk_transform.  Null stands for "no transform needed" (identity encoding).
using Chunk_transform_ptr = boost::movelib::unique_ptr<Chunk_transform>;

// Free functions.

/**
 * Maps the exact (case-sensitive) wire token `identity`, `gzip` or `deflate` to a Content_encoding.
 *
 * @param token
 *        Candidate token.
 * @param encoding
 *        Set to the result on success; untouched otherwise.
 * @return `true` on success; `false` if `token` is not one of the 3 tokens.
 */
bool content_encoding_from_token(util::String_view token, Content_encoding* encoding);

/**
 * The wire token for the given encoding: `identity`, `gzip` or `deflate`.
 *
 * @param encoding
 *        Encoding other than the sentinel.
 * @return See above.
 */
util::String_view content_encoding_token(Content_encoding encoding);

/**
 * Prints the wire token of the given Content_encoding (e.g., `gzip`).
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Content_encoding val);

/**
 * Reads a Content_encoding written by `operator<<`; case-insensitive; numeric value also accepted.
 * No match yields Content_encoding::S_END_SENTINEL.  Useful with config parsing and `boost::lexical_cast`.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Content_encoding& val);

/**
 * Creates an incremental compressor for the given encoding.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param encoding
 *        Target encoding.
 * @return Null if `encoding` is Content_encoding::S_IDENTITY; else the new compressor.
 */
Chunk_transform_ptr make_compressor(flow::log::Logger* logger_ptr, Content_encoding encoding);

/**
 * Creates an incremental decompressor for the given encoding.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param encoding
 *        Source encoding.
 * @return Null if `encoding` is Content_encoding::S_IDENTITY; else the new decompressor.
 */
Chunk_transform_ptr make_decompressor(flow::log::Logger* logger_ptr, Content_encoding encoding);

/**
 * One-shot compression of a whole buffer.  Identity encoding yields a plain copy.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param encoding
 *        Target encoding.
 * @param bytes
 *        Input.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        codec::error::Code::S_COMPRESS_FAILED.
 * @return Compressed bytes.
 */
util::Chunk compress_buffer(flow::log::Logger* logger_ptr, Content_encoding encoding,
                            const util::Blob_const& bytes, Error_code* err_code = 0);

/**
 * One-shot decompression of a whole buffer.  Identity encoding yields a plain copy.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param encoding
 *        Source encoding.
 * @param bytes
 *        Input.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        codec::error::Code::S_DECOMPRESS_DATA_CORRUPT.
 * @return Decompressed bytes.
 */
util::Chunk decompress_buffer(flow::log::Logger* logger_ptr, Content_encoding encoding,
                              const util::Blob_const& bytes, Error_code* err_code = 0);

} // namespace bstream::codec
