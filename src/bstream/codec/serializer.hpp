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

#pragma once

#include "bstream/codec/codec_fwd.hpp"

/**
 * @file
 *
 * Conversion between a structured document (codec::Value) and its byte form under a given content type.
 * Exactly 3 content types (MIME essences, no parameters) are supported:
 *   - `application/json`: JSON text, via nlohmann::json.
 *   - `application/msgpack`: MessagePack, via nlohmann::json.
 *   - `application/x-www-form-urlencoded`: query-string text (`a=1&b=x%20y`).  Decoding: pairs are split on `&`,
 *     then on the first `=`; `+` means space; `%XX` escapes are decoded (malformed ones kept literally); every value
 *     is a string; a repeated key collects its values into an array; a pair without `=` has an empty value.
 *     Encoding (of an object; anything else encodes to empty text): strings, numbers and booleans are emitted as
 *     `key=value`; an array emits one pair per element; any other member value (null, object) emits `key=`.
 *     Everything but `A-Z a-z 0-9 - _ . ! ~ * ' ( )` is percent-escaped.
 */

namespace bstream::codec
{

// Free functions.

/**
 * Returns `true` if and only if serialize() and deserialize() support `content_type`.
 *
 * @param content_type
 *        MIME essence (`type/subtype`, no parameters).
 * @return See above.
 */
bool serializable_content_type(util::String_view content_type);

/**
 * Converts `value` to bytes of the given content type.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param content_type
 *        MIME essence.
 * @param value
 *        Document.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        codec::error::Code::S_UNSUPPORTED_CONTENT_TYPE, codec::error::Code::S_SERIALIZE_FAILED.
 * @return The bytes; empty on error.
 */
util::Chunk serialize(flow::log::Logger* logger_ptr, util::String_view content_type, const Value& value,
                      Error_code* err_code = 0);

/**
 * Parses bytes of the given content type into a document.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param content_type
 *        MIME essence.
 * @param bytes
 *        Input.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        codec::error::Code::S_UNSUPPORTED_CONTENT_TYPE, codec::error::Code::S_DESERIALIZE_MALFORMED.
 * @return The document; null on error.
 */
Value deserialize(flow::log::Logger* logger_ptr, util::String_view content_type, const util::Blob_const& bytes,
                  Error_code* err_code = 0);

} // namespace bstream::codec
