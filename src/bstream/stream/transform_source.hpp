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
#include "bstream/codec/chunk_transform.hpp"

namespace bstream::stream
{

// Types.

/**
 * Chunk_source that pulls chunks from an upstream Chunk_source and emits them passed through a
 * codec::Chunk_transform (a compressor or decompressor).  Usually obtained via compress() or decompress()
 * (transcoder.hpp) rather than constructed directly.
 *
 * Reads are pulled through one at a time: a read on `*this` issues one read upstream, and more only if the transform
 * produced no output yet (typical of a compressor fed small chunks).  Upstream `eof` flushes the transform's tail
 * and then ends `*this`.
 *
 * Errors travel both ways: an upstream failure (or a transform failure) destroys `*this` with that code; destroying
 * `*this` destroys the upstream source with the same code.  fault() forwards the upstream's.
 */
class Transform_source :
  public Chunk_source
{
public:
  // Constructors/destructor.

  /**
   * Constructs the source.  Nothing is read until the first async_read_chunk().
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname
   *        Human-readable nickname, for logging.
   * @param task_engine
   *        See Chunk_source.
   * @param upstream
   *        The source to transform; `*this` becomes its sole consumer.  Must not be null.
   * @param transform
   *        The transform.  Must not be null.
   */
  explicit Transform_source(flow::log::Logger* logger_ptr, util::String_view nickname, util::Task_engine* task_engine,
                            Chunk_source::Ptr upstream, codec::Chunk_transform_ptr&& transform);

  // Methods.

  /**
   * Forwards to upstream.
   * @return See above.
   */
  Fault fault() const override;

  /**
   * The upstream source.
   * @return See above.
   */
  const Chunk_source::Ptr& upstream() const;

protected:
  // Methods.

  /// Implements Chunk_source API.
  void do_read() override;

  /**
   * Implements Chunk_source API: destroys upstream with the same reason.
   * @param err_code
   *        See Chunk_source.
   */
  void on_destroy(const Error_code& err_code) override;

private:
  // Methods.

  /**
   * Handles completion of the upstream read issued by do_read().
   *
   * @param err_code
   *        Upstream result.
   * @param chunk
   *        Upstream chunk.
   */
  void on_upstream_chunk(const Error_code& err_code, util::Chunk&& chunk);

  // Data.

  /// See upstream().
  const Chunk_source::Ptr m_upstream;

  /// See ctor.
  codec::Chunk_transform_ptr m_transform;

  /// Whether upstream hit `eof` and the tail was already emitted; the next read then ends `*this`.
  bool m_tail_emitted;
}; // class Transform_source

} // namespace bstream::stream
