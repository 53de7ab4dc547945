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

#include "bstream/common.hpp"
#include <flow/log/log.hpp>
#include <flow/async/util.hpp>
#include <flow/util/util_fwd.hpp>
#include <boost/asio.hpp>
#include <vector>

/**
 * bstream::util contains basic building blocks used throughout Bstream: most importantly util::Inactivity_timer;
 * also the util::Chunk byte container in which stream data travels, and a few aliases and helpers.
 */
namespace bstream::util
{

// Types.

// Find doc headers near the bodies of these compound types.

template <typename T, typename Allocator = std::allocator<T>>
class Default_init_allocator;

class Inactivity_timer;

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;
/// Short-hand for Flow's `Fine_duration`.
using Fine_duration = flow::Fine_duration;
/// Short-hand for Flow's `Fine_time_pt`.
using Fine_time_pt = flow::Fine_time_pt;
/// Short-hand for Flow's `Fine_clock`: the monotonic high-res clock used for all Bstream time keeping.
using Fine_clock = flow::Fine_clock;

/// Short-hand for polymorphic function (a-la `std::function<>`) that takes no arguments and returns nothing.
using Task = flow::async::Task;

/// Short-hand for boost.asio `io_context`, the execution context of all asynchronous Bstream work.
using Task_engine = flow::util::Task_engine;

/// Short-hand for the boost.asio timer (over `Fine_clock`) used by util::Inactivity_timer.
using Timer = flow::util::Timer;

/**
 * Short-hand for an immutable blob somewhere in memory, stored as exactly a `void const *` and a `size_t`.
 * Producers hand data to a stream::Bounded_stream in this form; the stream copies it into a #Chunk.
 */
using Blob_const = boost::asio::const_buffer;

/// Short-hand for a mutable blob somewhere in memory, stored as exactly a `void*` and a `size_t`.
using Blob_mutable = boost::asio::mutable_buffer;

/**
 * A contiguous, owned, growable run of bytes: the unit in which data travels through stream::Chunk_source chains.
 * Its allocator skips the zero-fill on `resize()`, so a reader can size the buffer first and fill it via a
 * system call afterwards without paying for the zeroing.
 *
 * A #Chunk is always moved, never shared, once handed to a completion handler.
 */
using Chunk = std::vector<uint8_t, Default_init_allocator<uint8_t>>;

// Constants.

/// A (default-cted) string.  May be useful for functions returning `const std::string&`.
extern const std::string EMPTY_STRING;

// Free functions.

/**
 * Syntactic-sugary helper that returns pointer to first byte in an immutable buffer, as `const uint8_t*`.
 *
 * @param blob
 *        The buffer.
 * @return See above.
 */
const uint8_t* blob_data(const Blob_const& blob);

/**
 * Syntactic-sugary helper that returns pointer to first byte in a mutable buffer, as `uint8_t*`.
 *
 * @param blob
 *        The buffer.
 * @return See above.
 */
uint8_t* blob_data(const Blob_mutable& blob);

/**
 * Returns a new #Chunk holding a copy of the bytes in `blob`.
 *
 * @param blob
 *        The bytes.  May be empty.
 * @return See above.
 */
Chunk to_chunk(const Blob_const& blob);

/**
 * Returns the size of the regular file at `path` in bytes, following symlinks.  Logs a WARNING on failure.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param path
 *        Path to file.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        various system codes, e.g., `boost::system::errc::no_such_file_or_directory`;
 *        `boost::system::errc::is_a_directory` if `path` exists but is not a regular file.
 * @return Size in bytes; 0 on error.
 */
uint64_t regular_file_size(flow::log::Logger* logger_ptr, const fs::path& path, Error_code* err_code = 0);

} // namespace bstream::util

// #Chunk is used by value all over; so make its allocator complete for everyone.
#include "bstream/util/default_init_allocator.hpp"
