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

#include <flow/util/util.hpp>

#include "bstream/detail/common.hpp"
#include <boost/filesystem.hpp>

/* We build in C++17 mode ourselves, and the headers (templates, constexprs) require it of the `#include`ing
 * translation unit as well.  Enforce it. */
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any bstream/ API headers, use C++17 compile mode or later."
#endif

/**
 * Catch-all namespace for the Bstream project: a library/API in modern C++17 providing *bounded content streams*,
 * i.e., byte streams that carry a declared MIME type and transfer encoding, that refuse to grow past a byte
 * ceiling, and that give up when their producer stalls for longer than an inactivity timeout.  Around that core
 * it provides re-encoding between compression encodings and (de)serialization of structured payloads.
 *
 * From the user's perspective, one should view this namespace as the "root," meaning it consists of two parts:
 *   - Symbols directly in Bstream: the most basic, commonly used symbols (such as the alias bstream::Error_code).
 *     - In particular this includes `enum class` bstream::Log_component which defines the set of possible
 *       `flow::log::Component` values logged from within all modules of Bstream.
 *   - Sub-namespaces (like bstream::stream, bstream::util), each of which represents a Bstream *module*.
 *
 * Bstream modules overview
 * ------------------------
 * Bottom-up (each depends only on the ones above it):
 *
 *   -# bstream::util: basic building blocks.  Most notably util::Inactivity_timer, the stalled-producer detector
 *      that avoids reading the clock on every unit of activity; and the util::Chunk byte container.
 *   -# bstream::codec: the payload codecs.  codec::Chunk_transform is an incremental (chunk-at-a-time) zlib
 *      compressor or decompressor (gzip or deflate); codec::serialize() and codec::deserialize() convert between
 *      codec::Value (a JSON-like document) and the bytes of a given content type.
 *   -# bstream::stream: the streams proper.  stream::Chunk_source is the pull-style asynchronous source concept;
 *      stream::Bounded_stream is the bounded, time-limited, self-describing source; the free functions in
 *      stream_factory.hpp build Bounded_stream objects from buffers, documents, files, and other sources.
 *
 * Relationship with Flow and Boost
 * --------------------------------
 * Bstream requires Flow and Boost, not only for internal implementation purposes but also in its APIs.
 * `flow::log` is the assumed logging system; `flow::Error_code` and related conventions are used
 * for error reporting; boost.asio `io_context` (a/k/a `flow::util::Task_engine`) is the execution context on which
 * every asynchronous completion and timer in Bstream runs.
 *
 * ### Error reporting ###
 * The standards and mechanics w/r/t error reporting are entirely inherited from Flow.  Spoiler alert: a synchronous
 * API that can fail takes a trailing `Error_code* err_code = 0` arg; if that is null, and an error occurs,
 * `flow::error::Runtime_error` (containing the #Error_code) is thrown instead.  Asynchronous APIs report errors
 * through the #Error_code argument of the completion handler.
 *
 * ### Logging ###
 * We use `flow::log`.  The user must supply a `flow::log::Logger` into various APIs in order to enable logging.
 * (Worst-case, passing `Logger == null` will make it log nowhere.)
 *
 * ### Threads ###
 * Bstream starts no threads.  Every object is given a `Task_engine*` and must be used from the thread that runs it
 * (or before it runs).  Completion handlers are always posted onto that engine, never invoked synchronously from
 * within the API call that triggered them.
 */
namespace bstream
{

// Types.  They're outside of `namespace ::bstream::util` for brevity due to their frequent use.

/**
 * @namespace bstream::fs
 * @brief Short-hand for `filesystem` namespace.
 */
namespace fs = boost::filesystem;

/// Short-hand for `flow::Error_code` which is very common.
using Error_code = flow::Error_code;

/// Short-hand for polymorphic functor holder which is very common.  This is essentially `std::function`.
template<typename Signature>
using Function = flow::Function<Signature>;

#ifdef BSTREAM_DOXYGEN_ONLY // Actual compilation will ignore the below; but Doxygen will scan it and generate docs.

/**
 * The `flow::log::Component` payload enumeration containing various log components used by Bstream internal logging.
 * The user specifies it, rarely, when configuring their program's logging
 * such as via `flow::log::Config::init_component_to_union_idx_mapping()` and
 * `flow::log::Config::init_component_names()`.
 *
 * The individual `enum` values are not documented right here, because `flow::log` auto-generates those via
 * macro magic.  You will find the same information in the source file `log_component_enum_declare.macros.hpp`.
 */
enum class Log_component
{
  /// Placeholder for Doxygen purposes only.  See above.
  S_END_SENTINEL
};

// Constants.

/**
 * The map generated by `flow::log` macro magic that maps each enumerated value in bstream::Log_component to its
 * string representation as used in log output and verbosity config.
 *
 * @see bstream::Log_component first.
 */
extern const boost::unordered_multimap<Log_component, std::string> S_BSTREAM_LOG_COMPONENT_NAME_MAP;

#endif // BSTREAM_DOXYGEN_ONLY

} // namespace bstream
