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
#include "bstream/stream/file_source.hpp"
#include <flow/error/error.hpp>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>

namespace bstream::stream
{

File_source::File_source(flow::log::Logger* logger_ptr, util::String_view nickname, util::Task_engine* task_engine,
                         const fs::path& path) :
  Chunk_source(logger_ptr, nickname, task_engine),
  m_path(path),
  m_fd(-1),
  m_opened(false)
{
  // Lazy: see do_read().
}

File_source::~File_source()
{
  close_file();
}

const fs::path& File_source::path() const
{
  return m_path;
}

void File_source::do_read() // Virtual.
{
  using boost::system::system_category;

  if (!m_opened)
  {
    m_opened = true;
    m_fd = ::open(m_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (m_fd == -1)
    {
      const Error_code sys_err_code(errno, system_category());
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
      FLOW_LOG_WARNING("File_source [" << *this << "]: Could not open [" << m_path << "].");
      destroy(sys_err_code);
      return;
    }
    // else
    FLOW_LOG_TRACE("File_source [" << *this << "]: Opened [" << m_path << "] as fd [" << m_fd << "].");
  }
  // else

  util::Chunk chunk(S_READ_SIZE); // Default_init_allocator: no zeroing.
  ssize_t n_read;
  do
  {
    n_read = ::read(m_fd, chunk.data(), chunk.size());
  }
  while ((n_read == -1) && (errno == EINTR));

  if (n_read == -1)
  {
    const Error_code sys_err_code(errno, system_category());
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    FLOW_LOG_WARNING("File_source [" << *this << "]: Could not read [" << m_path << "].");
    destroy(sys_err_code);
    return;
  }
  // else

  if (n_read == 0)
  {
    close_file();
    emit_end();
    return;
  }
  // else

  chunk.resize(size_t(n_read));
  emit_chunk(std::move(chunk));
} // File_source::do_read()

void File_source::on_destroy(const Error_code&) // Virtual.
{
  close_file();
}

void File_source::close_file()
{
  if (m_fd == -1)
  {
    return;
  }
  // else

  FLOW_LOG_TRACE("File_source [" << *this << "]: Closing fd [" << m_fd << "].");
  ::close(m_fd); // Read-only fd: nothing useful to do about an error here.
  m_fd = -1;
}

} // namespace bstream::stream
