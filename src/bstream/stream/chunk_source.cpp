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
#include "bstream/stream/chunk_source.hpp"
#include "bstream/error.hpp"
#include <boost/asio/post.hpp>

namespace bstream::stream
{

Chunk_source::Chunk_source(flow::log::Logger* logger_ptr, util::String_view nickname,
                           util::Task_engine* task_engine) :
  flow::log::Log_context(logger_ptr, Log_component::S_STREAM),
  m_nickname(nickname),
  m_task_engine(task_engine),
  m_destroyed(false)
{
  assert(m_task_engine);
}

Chunk_source::~Chunk_source()
{
  if (m_on_chunk_func)
  {
    FLOW_LOG_TRACE("Chunk_source [" << *this << "]: Going away with a read outstanding; aborting it.");
    complete_read(error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER, util::Chunk());
  }
}

void Chunk_source::async_read_chunk(On_chunk_func&& on_chunk_func)
{
  assert((!m_on_chunk_func) && "At most one read may be outstanding.");
  assert(on_chunk_func);

  m_on_chunk_func = std::move(on_chunk_func);

  if (m_terminal_err_code)
  {
    complete_read(m_terminal_err_code, util::Chunk());
    return;
  }
  // else

  do_read();
}

void Chunk_source::destroy(const Error_code& err_code) // Virtual.
{
  if (m_destroyed)
  {
    return;
  }
  // else

  m_destroyed = true;
  if (!m_terminal_err_code)
  {
    m_terminal_err_code = err_code ? err_code : Error_code(error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER);
  }

  FLOW_LOG_TRACE("Chunk_source [" << *this << "]: Destroying; reason [" << err_code << "] "
                 "[" << err_code.message() << "]; terminal code [" << m_terminal_err_code << "].");

  on_destroy(err_code);

  if (m_on_chunk_func)
  {
    complete_read(m_terminal_err_code, util::Chunk());
  }
} // Chunk_source::destroy()

void Chunk_source::on_destroy(const Error_code&) // Virtual.
{
  // Nothing to release by default.
}

Fault Chunk_source::fault() const // Virtual.
{
  return Fault();
}

bool Chunk_source::terminal() const
{
  return bool(m_terminal_err_code);
}

bool Chunk_source::destroyed() const
{
  return m_destroyed;
}

const Error_code& Chunk_source::terminal_code() const
{
  return m_terminal_err_code;
}

const std::string& Chunk_source::nickname() const
{
  return m_nickname;
}

util::Task_engine* Chunk_source::task_engine() const
{
  return m_task_engine;
}

void Chunk_source::emit_chunk(util::Chunk&& chunk)
{
  assert(m_on_chunk_func && "emit_chunk() requires an outstanding read.");
  assert((!chunk.empty()) && "Empty chunks are not emitted.");

  FLOW_LOG_DATA("Chunk_source [" << *this << "]: Emitting chunk of [" << chunk.size() << "] bytes.");
  complete_read(Error_code(), std::move(chunk));
}

void Chunk_source::emit_end()
{
  assert(!m_terminal_err_code);

  FLOW_LOG_TRACE("Chunk_source [" << *this << "]: Ending.");
  m_terminal_err_code = boost::asio::error::eof;

  if (m_on_chunk_func)
  {
    complete_read(m_terminal_err_code, util::Chunk());
  }
}

bool Chunk_source::read_pending() const
{
  return bool(m_on_chunk_func);
}

void Chunk_source::complete_read(const Error_code& err_code, util::Chunk&& chunk)
{
  using boost::asio::post;

  // Always post: the consumer may well issue the next read from inside the handler; and it may be inside our API now.
  post(*m_task_engine,
       [on_chunk_func = std::move(m_on_chunk_func), err_code, chunk = std::move(chunk)]() mutable
  {
    on_chunk_func(err_code, std::move(chunk));
  });
  m_on_chunk_func = nullptr;
}

std::ostream& operator<<(std::ostream& os, const Chunk_source& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val);
}

} // namespace bstream::stream
