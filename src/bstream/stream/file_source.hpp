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

/**
 * Chunk_source reading a file front to back in chunks of at most #S_READ_SIZE bytes.  The file is opened on the first
 * read, not at construction, so an unreadable path surfaces as the source's terminal code (a system-category
 * #Error_code), which a Bounded_stream reports as an Unexpected fault.  The descriptor is closed as soon as the file
 * ends, or on destroy(), or at destruction, whichever comes first.
 *
 * Reads are ordinary blocking reads of a regular file; the result is still delivered via the Task_engine.
 */
class File_source :
  public Chunk_source
{
public:
  // Constants.

  /// Max bytes per chunk.
  static constexpr size_t S_READ_SIZE = 64 * 1024;

  // Constructors/destructor.

  /**
   * Constructs the source; does not touch the file system.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname
   *        Human-readable nickname, for logging.
   * @param task_engine
   *        See Chunk_source.
   * @param path
   *        File to read.
   */
  explicit File_source(flow::log::Logger* logger_ptr, util::String_view nickname, util::Task_engine* task_engine,
                       const fs::path& path);

  /// Closes the file if open.
  ~File_source() override;

  // Methods.

  /**
   * The file path.
   * @return See above.
   */
  const fs::path& path() const;

protected:
  // Methods.

  /// Implements Chunk_source API.
  void do_read() override;

  /**
   * Implements Chunk_source API: closes the file.
   * @param err_code
   *        Ignored.
   */
  void on_destroy(const Error_code& err_code) override;

private:
  // Methods.

  /// Closes #m_fd if open.
  void close_file();

  // Data.

  /// See path().
  const fs::path m_path;

  /// File descriptor; -1 if not open (yet, or anymore).
  int m_fd;

  /// Whether the file was opened at some point (so -1 in #m_fd means "closed," not "not yet opened").
  bool m_opened;
}; // class File_source

} // namespace bstream::stream
