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

namespace bstream::stream
{

// Types.

/// Chunk_source over an in-memory buffer: emits it as one chunk (none if empty), then ends.
class Buffer_source :
  public Chunk_source
{
public:
  // Constructors/destructor.

  /**
   * Constructs the source, taking ownership of the bytes.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname
   *        Human-readable nickname, for logging.
   * @param task_engine
   *        See Chunk_source.
   * @param bytes
   *        The content.
   */
  explicit Buffer_source(flow::log::Logger* logger_ptr, util::String_view nickname, util::Task_engine* task_engine,
                         util::Chunk&& bytes);

protected:
  // Methods.

  /// Implements Chunk_source API.
  void do_read() override;

  /**
   * Implements Chunk_source API: releases the buffer.
   * @param err_code
   *        Ignored.
   */
  void on_destroy(const Error_code& err_code) override;

private:
  // Data.

  /// The content not yet emitted.
  util::Chunk m_bytes;
}; // class Buffer_source

} // namespace bstream::stream
