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

#include "bstream/stream/chunk_source.hpp"

/* Transcoder: composes chunk sources with compression/decompression.  These never fail synchronously; codec failures
 * surface as the terminal code of the returned source (codec::error::Code::S_DECOMPRESS_DATA_CORRUPT and friends). */

namespace bstream::stream
{

// Free functions.

/**
 * Returns a source yielding the bytes of `source` compressed with `encoding`: `source` itself for identity, else a
 * Transform_source around it.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param encoding
 *        Target encoding.
 * @param source
 *        Plain bytes.  Must not be null.
 * @return See above.
 */
Chunk_source::Ptr compress(flow::log::Logger* logger_ptr, codec::Content_encoding encoding,
                           Chunk_source::Ptr source);

/**
 * Returns a source yielding the bytes of `source` decompressed from `encoding`: `source` itself for identity, else a
 * Transform_source around it.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param encoding
 *        Encoding of `source`.
 * @param source
 *        Encoded bytes.  Must not be null.
 * @return See above.
 */
Chunk_source::Ptr decompress(flow::log::Logger* logger_ptr, codec::Content_encoding encoding,
                             Chunk_source::Ptr source);

/**
 * Like the other overload, but over an in-memory buffer, which is first wrapped in a Buffer_source (so even identity
 * yields a new source).
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param task_engine
 *        See Chunk_source.
 * @param encoding
 *        Target encoding.
 * @param bytes
 *        Plain bytes.
 * @return See above.
 */
Chunk_source::Ptr compress(flow::log::Logger* logger_ptr, util::Task_engine* task_engine,
                           codec::Content_encoding encoding, util::Chunk&& bytes);

/**
 * Like the other overload, but over an in-memory buffer, which is first wrapped in a Buffer_source.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param task_engine
 *        See Chunk_source.
 * @param encoding
 *        Encoding of `bytes`.
 * @param bytes
 *        Encoded bytes.
 * @return See above.
 */
Chunk_source::Ptr decompress(flow::log::Logger* logger_ptr, util::Task_engine* task_engine,
                             codec::Content_encoding encoding, util::Chunk&& bytes);

/**
 * Re-encodes `source` from encoding `from` to encoding `to`.  There is no shortcut between two non-identity
 * encodings: the result is always `compress(to, decompress(from, source))`, either step being a no-op for identity.
 * Hence `from == to` (identity or not) still decodes and re-encodes; callers wanting "same encoding means same
 * source" check that first, as Bounded_stream::transcode() does.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param from
 *        Encoding of `source`.
 * @param to
 *        Target encoding.
 * @param source
 *        Source.  Must not be null.
 * @return See above.
 */
Chunk_source::Ptr transcode(flow::log::Logger* logger_ptr, codec::Content_encoding from, codec::Content_encoding to,
                            Chunk_source::Ptr source);

} // namespace bstream::stream
