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

#include "bstream/util/util_fwd.hpp"
#include <flow/log/log.hpp>
#include <boost/noncopyable.hpp>
#include <type_traits>

namespace bstream::test
{

/**
 * Returns the test suite name of the currently running test.
 *
 * @return See above.
 */
std::string get_test_suite_name();

/**
 * Default verbosity of test logging: the severity named by environment variable `BSTREAM_TEST_LOG_SEV` (as accepted
 * by `flow::log::Sev` `istream>>`, e.g., `INFO` or `TRACE`), or flow::log::Sev::S_WARNING if it is unset or
 * unparseable.
 *
 * @return See above.
 */
flow::log::Sev test_log_severity();

/**
 * Runs `*task_engine` until it runs out of work or `max_duration` passes, whichever is first; restarts it first if it
 * had stopped.
 *
 * @param task_engine
 *        Engine.
 * @param max_duration
 *        Safety cap, so that a bug leaving work pending fails the test instead of hanging it.
 * @return `true` if it ran out of work; `false` if the cap was hit.
 */
bool run_task_engine(util::Task_engine* task_engine,
                     util::Fine_duration max_duration = boost::chrono::seconds(10));

/**
 * Makes a chunk of `size` bytes with a repeating, easily eyeballed pattern.
 *
 * @param size
 *        Size.
 * @return See above.
 */
util::Chunk make_pattern_chunk(size_t size);

/**
 * Makes a chunk holding the characters of `text`.
 *
 * @param text
 *        Text.
 * @return See above.
 */
util::Chunk to_chunk(util::String_view text);

/**
 * Returns the characters of `bytes` as a string.
 *
 * @param bytes
 *        Bytes.
 * @return See above.
 */
std::string to_string(const util::Chunk& bytes);

/// A file with given contents in the temporary directory, removed at destruction.
class Temp_file :
  private boost::noncopyable
{
public:
  /**
   * Creates the file.  Throws on failure.
   *
   * @param file_name_suffix
   *        Appended to a unique name; typically an extension such as `.json.gz`.
   * @param contents
   *        Contents.
   */
  explicit Temp_file(util::String_view file_name_suffix, const util::Chunk& contents);

  /// Removes the file.
  ~Temp_file();

  /**
   * Path of the file.
   * @return See above.
   */
  const fs::path& path() const;

private:
  /// See path().
  fs::path m_path;
}; // class Temp_file

/**
 * Returns the value of the specified enum as its underlying type.
 *
 * @tparam Enum The enum type.
 * @param e The enum value.
 *
 * @return See above.
 */
template <class Enum>
constexpr std::underlying_type_t<Enum> to_underlying(Enum e) noexcept
{
  return static_cast<std::underlying_type_t<Enum>>(e);
}

} // namespace bstream::test
