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
#include "bstream/util/util_fwd.hpp"
#include "bstream/util/default_init_allocator.hpp"
#include <flow/error/error.hpp>
#include <flow/common.hpp>

namespace bstream::util
{

// Initializations.

const std::string EMPTY_STRING;

// Implementations.

const uint8_t* blob_data(const Blob_const& blob)
{
  return static_cast<const uint8_t*>(blob.data());
}

uint8_t* blob_data(const Blob_mutable& blob)
{
  return static_cast<uint8_t*>(blob.data());
}

Chunk to_chunk(const Blob_const& blob)
{
  const auto data = blob_data(blob);
  return Chunk(data, data + blob.size());
}

uint64_t regular_file_size(flow::log::Logger* logger_ptr, const fs::path& path, Error_code* err_code)
{
  using boost::system::errc::make_error_code;
  using boost::system::errc::is_a_directory;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(uint64_t, regular_file_size, logger_ptr, path, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_UTIL);

  const auto status = fs::status(path, *err_code);
  if ((!*err_code) && (!fs::is_regular_file(status)))
  {
    *err_code = make_error_code(is_a_directory);
  }

  uint64_t size = 0;
  if (!*err_code)
  {
    size = fs::file_size(path, *err_code);
  }

  if (*err_code)
  {
    FLOW_LOG_WARNING("Could not obtain size of regular file [" << path << "]; "
                     "error [" << *err_code << "] [" << err_code->message() << "].");
    return 0;
  }
  // else

  FLOW_LOG_TRACE("Regular file [" << path << "] has size [" << size << "].");
  return size;
} // regular_file_size()

} // namespace bstream::util
