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
#include "bstream/stream/stream_factory.hpp"
#include "bstream/stream/file_source.hpp"
#include "bstream/codec/serializer.hpp"
#include "bstream/codec/error.hpp"
#include "bstream/error.hpp"
#include <flow/error/error.hpp>
#include <boost/make_shared.hpp>

namespace bstream::stream
{

Bounded_stream::Ptr from_buffer(flow::log::Logger* logger_ptr, util::String_view nickname,
                                util::Task_engine* task_engine, const util::Blob_const& bytes,
                                const Stream_options& options, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Bounded_stream::Ptr, from_buffer, logger_ptr, nickname, task_engine, bytes,
                                     flow::util::bind_ns::cref(options), _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  auto buffer_options = options;
  if (bytes.size() != 0)
  {
    // Exactly this many bytes: no more (limit), no fewer (declared length).
    buffer_options.m_content_length = bytes.size();
    buffer_options.m_limit = bytes.size();
  }

  auto stream = Bounded_stream::create(logger_ptr, nickname, task_engine, buffer_options, err_code);
  if (*err_code)
  {
    return stream;
  }
  // else

  if (bytes.size() != 0)
  {
    stream->write(bytes);
  }
  stream->end();
  return stream;
} // from_buffer()

Bounded_stream::Ptr from_object(flow::log::Logger* logger_ptr, util::String_view nickname,
                                util::Task_engine* task_engine, const codec::Value& value,
                                const Stream_options& options, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Bounded_stream::Ptr, from_object, logger_ptr, nickname, task_engine,
                                     flow::util::bind_ns::cref(value), flow::util::bind_ns::cref(options), _1);

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_STREAM);

  auto object_options = options;
  if (!object_options.m_content_type)
  {
    object_options.m_content_type = "application/json";
  }

  std::string content_type;
  if (!parse_content_type(*object_options.m_content_type, &content_type))
  {
    FLOW_LOG_WARNING("Stream [" << nickname << "]: Cannot make from document: content type "
                     "[" << *object_options.m_content_type << "] is invalid.");
    *err_code = error::Code::S_INVALID_CONTENT_TYPE;
    return Bounded_stream::Ptr();
  }
  // else

  if (!deserializable_content_type(content_type))
  {
    FLOW_LOG_WARNING("Stream [" << nickname << "]: Cannot make from document: content type "
                     "[" << content_type << "] is not deserializable.");
    *err_code = codec::error::Code::S_UNSUPPORTED_CONTENT_TYPE;
    return Bounded_stream::Ptr();
  }
  // else

  auto encoding = codec::Content_encoding::S_IDENTITY;
  if (object_options.m_content_encoding
      && (!codec::content_encoding_from_token(*object_options.m_content_encoding, &encoding)))
  {
    FLOW_LOG_WARNING("Stream [" << nickname << "]: Cannot make from document: content encoding "
                     "[" << *object_options.m_content_encoding << "] is invalid.");
    *err_code = error::Code::S_INVALID_CONTENT_ENCODING;
    return Bounded_stream::Ptr();
  }
  // else

  auto bytes = codec::serialize(logger_ptr, content_type, value, err_code);
  if (*err_code)
  {
    return Bounded_stream::Ptr();
  }
  // else

  if (encoding != codec::Content_encoding::S_IDENTITY)
  {
    bytes = codec::compress_buffer(logger_ptr, encoding, util::Blob_const(bytes.data(), bytes.size()), err_code);
    if (*err_code)
    {
      return Bounded_stream::Ptr();
    }
  }

  return from_buffer(logger_ptr, nickname, task_engine, util::Blob_const(bytes.data(), bytes.size()),
                     object_options, err_code);
} // from_object()

Bounded_stream::Ptr from_file(flow::log::Logger* logger_ptr, util::String_view nickname,
                              util::Task_engine* task_engine, const fs::path& path,
                              const Stream_options& options, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Bounded_stream::Ptr, from_file, logger_ptr, nickname, task_engine,
                                     flow::util::bind_ns::cref(path), flow::util::bind_ns::cref(options), _1);

  auto file_options = options;
  codec::Content_encoding inferred_encoding;
  const auto inferred_content_type = content_type_for_path(path, &inferred_encoding);
  if (!file_options.m_content_type)
  {
    file_options.m_content_type = inferred_content_type;
  }
  if (!file_options.m_content_encoding)
  {
    file_options.m_content_encoding = std::string(codec::content_encoding_token(inferred_encoding));
  }

  std::string source_nickname(nickname);
  source_nickname += "/file";
  return from_source(logger_ptr, nickname,
                     boost::make_shared<File_source>(logger_ptr, source_nickname, task_engine, path),
                     file_options, err_code);
}

Bounded_stream::Ptr from_file_with_length(flow::log::Logger* logger_ptr, util::String_view nickname,
                                          util::Task_engine* task_engine, const fs::path& path,
                                          const Stream_options& options, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Bounded_stream::Ptr, from_file_with_length, logger_ptr, nickname, task_engine,
                                     flow::util::bind_ns::cref(path), flow::util::bind_ns::cref(options), _1);

  const auto size = util::regular_file_size(logger_ptr, path, err_code);
  if (*err_code)
  {
    return Bounded_stream::Ptr();
  }
  // else

  auto file_options = options;
  file_options.m_content_length = size; // Zero => S_INVALID_CONTENT_LENGTH from create().
  file_options.m_limit = size;
  return from_file(logger_ptr, nickname, task_engine, path, file_options, err_code);
}

Bounded_stream::Ptr from_source(flow::log::Logger* logger_ptr, util::String_view nickname,
                                Chunk_source::Ptr source,
                                const Stream_options& options, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Bounded_stream::Ptr, from_source, logger_ptr, nickname, source,
                                     flow::util::bind_ns::cref(options), _1);

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_STREAM);

  assert(source);

  auto source_options = options;
  if (boost::dynamic_pointer_cast<Bounded_stream>(source))
  {
    FLOW_LOG_TRACE("Stream [" << nickname << "]: Source [" << *source << "] is bounded already; "
                   "new stream will not re-enforce bounds.");
    source_options.m_limit = S_UNLIMITED;
    source_options.m_timeout = util::Fine_duration::zero();
    source_options.m_interval = util::Fine_duration::zero();
  }

  auto stream = Bounded_stream::create(logger_ptr, nickname, source->task_engine(), source_options, err_code);
  if (*err_code)
  {
    // Nobody will ever consume it; do not leave it (and its own producer and timer, if any) running.
    FLOW_LOG_WARNING("Stream [" << nickname << "]: Could not create stream over source [" << *source << "]: "
                     "[" << *err_code << "] [" << err_code->message() << "]; destroying the source.");
    source->destroy(*err_code);
    return stream;
  }
  // else

  stream->pipe_from(std::move(source));
  return stream;
} // from_source()

} // namespace bstream::stream
