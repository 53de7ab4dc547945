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
#include "bstream/test/test_common_util.hpp"
#include <gtest/gtest.h>
#include <boost/filesystem/fstream.hpp>
#include <cstdlib>
#include <sstream>
#include <string>

using std::string;

namespace bstream::test
{

string get_test_suite_name()
{
  const auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
  return test_info ? string(test_info->test_suite_name()) : string("no-test");
}

flow::log::Sev test_log_severity()
{
  using flow::log::Sev;

  const char* const sev_str = std::getenv("BSTREAM_TEST_LOG_SEV");
  if (!sev_str)
  {
    return Sev::S_WARNING;
  }
  // else

  std::istringstream is(sev_str);
  Sev sev = Sev::S_WARNING;
  is >> sev;
  return is.fail() ? Sev::S_WARNING : sev;
}

bool run_task_engine(util::Task_engine* task_engine, util::Fine_duration max_duration)
{
  task_engine->restart();
  task_engine->run_for(max_duration);
  const bool out_of_work = task_engine->stopped();
  if (!out_of_work)
  {
    task_engine->stop(); // Leave it in a consistent state for the next run_task_engine().
  }
  return out_of_work;
}

util::Chunk make_pattern_chunk(size_t size)
{
  util::Chunk bytes(size);
  for (size_t idx = 0; idx != size; ++idx)
  {
    bytes[idx] = uint8_t('a' + (idx % 26));
  }
  return bytes;
}

util::Chunk to_chunk(util::String_view text)
{
  return util::Chunk(text.begin(), text.end());
}

string to_string(const util::Chunk& bytes)
{
  return string(bytes.begin(), bytes.end());
}

Temp_file::Temp_file(util::String_view file_name_suffix, const util::Chunk& contents)
{
  string name("bstream-test-%%%%-%%%%-%%%%");
  name += file_name_suffix;
  m_path = fs::temp_directory_path() / fs::unique_path(name);

  fs::ofstream file(m_path, std::ios::binary | std::ios::trunc);
  file.exceptions(std::ios::failbit | std::ios::badbit);
  file.write(reinterpret_cast<const char*>(contents.data()), std::streamsize(contents.size()));
}

Temp_file::~Temp_file()
{
  Error_code sys_err_code;
  fs::remove(m_path, sys_err_code); // Best effort; a leftover temp file is harmless.
}

const fs::path& Temp_file::path() const
{
  return m_path;
}

} // namespace bstream::test
