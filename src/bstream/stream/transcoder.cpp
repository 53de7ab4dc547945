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
#include "bstream/stream/transcoder.hpp"
#include "bstream/stream/transform_source.hpp"
#include "bstream/stream/buffer_source.hpp"
#include <boost/make_shared.hpp>

namespace bstream::stream
{

namespace
{

/**
 * Wraps `source` in a Transform_source around `transform`, or returns `source` if `transform` is null.
 *
 * @param logger_ptr
 *        Logger.
 * @param source
 *        Source.
 * @param transform
 *        Transform or null.
 * @param suffix
 *        Appended to the source nickname to make the new one.
 * @return See above.
 */
Chunk_source::Ptr wrap(flow::log::Logger* logger_ptr, Chunk_source::Ptr source, codec::Chunk_transform_ptr&& transform,
                       util::String_view suffix)
{
  assert(source);

  if (!transform)
  {
    return source;
  }
  // else

  std::string nickname(source->nickname());
  nickname += suffix;
  auto task_engine = source->task_engine();
  return boost::make_shared<Transform_source>(logger_ptr, nickname, task_engine,
                                              std::move(source), std::move(transform));
}

} // namespace (anon)

Chunk_source::Ptr compress(flow::log::Logger* logger_ptr, codec::Content_encoding encoding, Chunk_source::Ptr source)
{
  std::string suffix("/+");
  suffix += codec::content_encoding_token(encoding);
  return wrap(logger_ptr, std::move(source), codec::make_compressor(logger_ptr, encoding), suffix);
}

Chunk_source::Ptr decompress(flow::log::Logger* logger_ptr, codec::Content_encoding encoding,
                             Chunk_source::Ptr source)
{
  std::string suffix("/-");
  suffix += codec::content_encoding_token(encoding);
  return wrap(logger_ptr, std::move(source), codec::make_decompressor(logger_ptr, encoding), suffix);
}

Chunk_source::Ptr compress(flow::log::Logger* logger_ptr, util::Task_engine* task_engine,
                           codec::Content_encoding encoding, util::Chunk&& bytes)
{
  return compress(logger_ptr, encoding,
                  boost::make_shared<Buffer_source>(logger_ptr, "buf", task_engine, std::move(bytes)));
}

Chunk_source::Ptr decompress(flow::log::Logger* logger_ptr, util::Task_engine* task_engine,
                             codec::Content_encoding encoding, util::Chunk&& bytes)
{
  return decompress(logger_ptr, encoding,
                    boost::make_shared<Buffer_source>(logger_ptr, "buf", task_engine, std::move(bytes)));
}

Chunk_source::Ptr transcode(flow::log::Logger* logger_ptr, codec::Content_encoding from, codec::Content_encoding to,
                            Chunk_source::Ptr source)
{
  return compress(logger_ptr, to, decompress(logger_ptr, from, std::move(source)));
}

} // namespace bstream::stream
