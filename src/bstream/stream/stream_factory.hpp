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

#include "bstream/stream/bounded_stream.hpp"

/* Stream factory: the ways to make a Bounded_stream from something, besides plain Bounded_stream::create().
 * Each takes Stream_options; what a function sets itself (e.g., the declared length from a buffer size) overrides the
 * options, while what it merely infers (e.g., the content type from a file name) is overridden by them. */

namespace bstream::stream
{

// Free functions.

/**
 * Creates a flushed stream over a copy of `bytes`: declared length and limit are both set to the buffer size, so
 * the stream holds exactly that (an empty buffer leaves both at their defaults).
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param nickname
 *        Human-readable nickname, for logging.
 * @param task_engine
 *        See Bounded_stream::create().
 * @param bytes
 *        Content.
 * @param options
 *        Options; content length and limit are ignored unless `bytes` is empty.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        see Bounded_stream::create().
 * @return The stream; null on error.
 */
Bounded_stream::Ptr from_buffer(flow::log::Logger* logger_ptr, util::String_view nickname,
                                util::Task_engine* task_engine, const util::Blob_const& bytes,
                                const Stream_options& options = Stream_options(), Error_code* err_code = 0);

/**
 * Serializes `value` into a flushed stream, via from_buffer().  Content type defaults to `application/json` and
 * must be deserializable (see deserializable_content_type()).  If the content encoding is not identity, the
 * serialized bytes are compressed accordingly, so that the stream's content is what its metadata says.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param nickname
 *        Human-readable nickname, for logging.
 * @param task_engine
 *        See Bounded_stream::create().
 * @param value
 *        Document.
 * @param options
 *        Options; see from_buffer().
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        error::Code::S_INVALID_CONTENT_TYPE, error::Code::S_INVALID_CONTENT_ENCODING,
 *        codec::error::Code::S_UNSUPPORTED_CONTENT_TYPE, codec::error::Code::S_SERIALIZE_FAILED,
 *        codec::error::Code::S_COMPRESS_FAILED; or see Bounded_stream::create().
 * @return The stream; null on error.
 */
Bounded_stream::Ptr from_object(flow::log::Logger* logger_ptr, util::String_view nickname,
                                util::Task_engine* task_engine, const codec::Value& value,
                                const Stream_options& options = Stream_options(), Error_code* err_code = 0);

/**
 * Creates a stream piped from a File_source over `path`.  Content type and encoding default to what
 * content_type_for_path() infers.  Failure to open or read the file is not reported here but as the stream's
 * Unexpected fault (cause: the system error).
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param nickname
 *        Human-readable nickname, for logging.
 * @param task_engine
 *        See Bounded_stream::create().
 * @param path
 *        File.
 * @param options
 *        Options.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        see Bounded_stream::create().
 * @return The stream; null on error.
 */
Bounded_stream::Ptr from_file(flow::log::Logger* logger_ptr, util::String_view nickname,
                              util::Task_engine* task_engine, const fs::path& path,
                              const Stream_options& options = Stream_options(), Error_code* err_code = 0);

/**
 * Like from_file(), but the file size is determined first, and both the declared length and the limit are set to
 * exactly that: the stream fails with TooLarge if the file grows meanwhile.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param nickname
 *        Human-readable nickname, for logging.
 * @param task_engine
 *        See Bounded_stream::create().
 * @param path
 *        File.
 * @param options
 *        Options; content length and limit are ignored.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        see util::regular_file_size() (an empty file yields error::Code::S_INVALID_CONTENT_LENGTH);
 *        or see Bounded_stream::create().
 * @return The stream; null on error.
 */
Bounded_stream::Ptr from_file_with_length(flow::log::Logger* logger_ptr, util::String_view nickname,
                                          util::Task_engine* task_engine, const fs::path& path,
                                          const Stream_options& options = Stream_options(),
                                          Error_code* err_code = 0);

/**
 * Creates a stream piped from `source`, on the source's Task_engine.  If `source` is itself a Bounded_stream, it
 * already enforces the bounds: then the new stream's limit is unlimited and its timeout and interval are zero,
 * whatever `options` say.  Faults propagate both ways (see Bounded_stream).
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param nickname
 *        Human-readable nickname, for logging.
 * @param source
 *        Producer.  Must not be null.
 * @param options
 *        Options.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        see Bounded_stream::create().  On error `source` is destroyed with that code.
 * @return The stream; null on error.
 */
Bounded_stream::Ptr from_source(flow::log::Logger* logger_ptr, util::String_view nickname,
                                Chunk_source::Ptr source,
                                const Stream_options& options = Stream_options(), Error_code* err_code = 0);

} // namespace bstream::stream
