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
#include "bstream/stream/buffer_source.hpp"

namespace bstream::stream
{

Buffer_source::Buffer_source(flow::log::Logger* logger_ptr, util::String_view nickname,
                             util::Task_engine* task_engine, util::Chunk&& bytes) :
  Chunk_source(logger_ptr, nickname, task_engine),
  m_bytes(std::move(bytes))
{
  FLOW_LOG_TRACE("Buffer_source [" << *this << "]: Created over [" << m_bytes.size() << "] bytes.");
}

void Buffer_source::do_read() // Virtual.
{
  if (m_bytes.empty())
  {
    emit_end();
    return;
  }
  // else

  util::Chunk bytes;
  bytes.swap(m_bytes);
  emit_chunk(std::move(bytes));
}

void Buffer_source::on_destroy(const Error_code&) // Virtual.
{
  util::Chunk().swap(m_bytes);
}

} // namespace bstream::stream
