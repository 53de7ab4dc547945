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
#include "bstream/stream/transform_source.hpp"

namespace bstream::stream
{

Transform_source::Transform_source(flow::log::Logger* logger_ptr, util::String_view nickname,
                                   util::Task_engine* task_engine,
                                   Chunk_source::Ptr upstream, codec::Chunk_transform_ptr&& transform) :
  Chunk_source(logger_ptr, nickname, task_engine),
  m_upstream(std::move(upstream)),
  m_transform(std::move(transform)),
  m_tail_emitted(false)
{
  assert(m_upstream && m_transform);

  FLOW_LOG_TRACE("Transform_source [" << *this << "]: Created over upstream [" << *m_upstream << "]; "
                 "[" << m_transform->encoding() << "] "
                 "[" << ((m_transform->direction() == codec::Chunk_transform::Direction::S_COMPRESS)
                           ? "compress" : "decompress") << "].");
}

Fault Transform_source::fault() const // Virtual.
{
  return m_upstream->fault();
}

const Chunk_source::Ptr& Transform_source::upstream() const
{
  return m_upstream;
}

void Transform_source::do_read() // Virtual.
{
  if (m_tail_emitted)
  {
    emit_end();
    return;
  }
  // else

  m_upstream->async_read_chunk([this_weak = weak_self<Transform_source>()]
                                 (const Error_code& err_code, util::Chunk&& chunk)
  {
    const auto self = this_weak.lock();
    if (!self)
    {
      return; // We are gone; and with us any interest in the result.
    }
    // else
    self->on_upstream_chunk(err_code, std::move(chunk));
  });
}

void Transform_source::on_upstream_chunk(const Error_code& err_code, util::Chunk&& chunk)
{
  if (!read_pending())
  {
    return; // Destroyed while the upstream read was in flight.
  }
  // else

  util::Chunk out;
  Error_code transform_err_code;

  if (err_code == boost::asio::error::eof)
  {
    m_transform->finish(&out, &transform_err_code);
    if (transform_err_code)
    {
      destroy(transform_err_code);
      return;
    }
    // else

    if (out.empty())
    {
      emit_end();
    }
    else
    {
      m_tail_emitted = true;
      emit_chunk(std::move(out));
    }
    return;
  }
  // else

  if (err_code)
  {
    FLOW_LOG_TRACE("Transform_source [" << *this << "]: Upstream failed with [" << err_code << "] "
                   "[" << err_code.message() << "]; failing likewise.");
    destroy(err_code);
    return;
  }
  // else

  m_transform->transform(util::Blob_const(chunk.data(), chunk.size()), &out, &transform_err_code);
  if (transform_err_code)
  {
    destroy(transform_err_code);
    return;
  }
  // else

  if (out.empty())
  {
    do_read(); // Nothing out yet: the transform is buffering.  Pull more.
    return;
  }
  // else
  emit_chunk(std::move(out));
} // Transform_source::on_upstream_chunk()

void Transform_source::on_destroy(const Error_code& err_code) // Virtual.
{
  m_upstream->destroy(err_code);
}

} // namespace bstream::stream
