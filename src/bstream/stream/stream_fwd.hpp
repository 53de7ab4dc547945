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

#include "bstream/codec/codec_fwd.hpp"

/**
 * bstream::stream contains the streams proper.  The centerpiece is Bounded_stream: an asynchronous source of
 * util::Chunk objects that carries content metadata (Content_descriptor) and that fails with a typed Fault, rather
 * than growing without bound or waiting forever, when its input is too large or stalls.
 *
 * Data moves *pull-style*: whoever wants the bytes calls Chunk_source::async_read_chunk(); a source that is fed
 * by another source pulls from that one in turn.  Chains are built by the free functions of stream_factory.hpp
 * (from buffers, documents, files, arbitrary sources) and of transcoder.hpp (compression, decompression);
 * and by Bounded_stream::transcode().
 *
 * Ownership: all sources are held via `boost::shared_ptr` (their `Ptr` alias).  A downstream source owns its
 * upstream source.  Handlers a source posts or registers hold only weak references to it.
 */
namespace bstream::stream
{

// Types.

// Find doc headers near the bodies of these compound types.

class Chunk_source;
class Buffer_source;
class File_source;
class Transform_source;
class Bounded_stream;
class Fault;
struct Content_descriptor;
struct Stream_options;
struct Stream_config;

} // namespace bstream::stream
