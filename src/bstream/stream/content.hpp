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

#include "bstream/stream/stream_fwd.hpp"
#include <optional>
#include <limits>

namespace bstream::stream
{

// Constants.

/// Content type assumed when none is given.
extern const std::string S_DEFAULT_CONTENT_TYPE;

/// Content encoding assumed when none is given (`identity`).
extern const std::string S_DEFAULT_CONTENT_ENCODING;

/// Inactivity timeout assumed when none is given: 30 seconds.
extern const util::Fine_duration S_DEFAULT_TIMEOUT;

/// Inactivity check interval assumed when none is given (but at most the timeout): 1 second.
extern const util::Fine_duration S_DEFAULT_INTERVAL;

/// Byte limit assumed when none is given and the content type is not deserializable: 10 MiB.
constexpr uint64_t S_DEFAULT_LIMIT = 10 * 1024 * 1024;

/**
 * Byte limit assumed when none is given and the content type is deserializable: 64 KiB.  A structured document is
 * materialized whole in memory; hence the lower default.
 */
constexpr uint64_t S_DEFAULT_DESERIALIZABLE_LIMIT = 64 * 1024;

/// Byte limit meaning "no limit."
constexpr uint64_t S_UNLIMITED = std::numeric_limits<uint64_t>::max();

// Types.

/**
 * The metadata triple by which a stream describes its content: what a Bounded_stream reports at its boundary
 * (Bounded_stream::descriptor()), and a valid constructor input for an equivalent stream (via Stream_options).
 * Its JSON form is `{"contentType": ..., "contentEncoding": ..., "contentLength": ...}`; `contentLength` is
 * present only if known.
 */
struct Content_descriptor
{
  /// Content type as supplied, possibly with `;` parameters (e.g., `text/plain; charset=utf-8`).
  std::string m_content_type;

  /// Content encoding token: `identity`, `gzip` or `deflate`.
  std::string m_content_encoding;

  /// Declared content length; empty if not known.
  std::optional<uint64_t> m_content_length;
};

/**
 * Everything a user may specify when creating a Bounded_stream; every member is optional and defaults as documented.
 * Stream_config is its validated, defaults-applied counterpart.
 */
struct Stream_options
{
  // Constructors/destructor.

  /// All defaults.
  Stream_options();

  /**
   * Content metadata from `descriptor`; bounds at their defaults.
   * @param descriptor
   *        Typically the descriptor() of another stream.
   */
  explicit Stream_options(const Content_descriptor& descriptor);

  // Data.

  /// Content type; default #S_DEFAULT_CONTENT_TYPE.
  std::optional<std::string> m_content_type;

  /// Content encoding token; default #S_DEFAULT_CONTENT_ENCODING.
  std::optional<std::string> m_content_encoding;

  /// Declared content length; default: not known.  Must be positive if given.
  std::optional<uint64_t> m_content_length;

  /**
   * Byte limit; default depends on content type (#S_DEFAULT_DESERIALIZABLE_LIMIT or #S_DEFAULT_LIMIT).
   * Must be positive if given; #S_UNLIMITED disables the limit.
   */
  std::optional<uint64_t> m_limit;

  /// Inactivity timeout; default #S_DEFAULT_TIMEOUT.  Zero disables it.
  std::optional<util::Fine_duration> m_timeout;

  /// Inactivity check interval; default is the lesser of #S_DEFAULT_INTERVAL and the timeout.
  std::optional<util::Fine_duration> m_interval;
}; // struct Stream_options

/// Validated Stream_options with all defaults applied; see resolve_options().
struct Stream_config
{
  /// Content type as supplied.
  std::string m_raw_content_type;

  /// MIME essence of #m_raw_content_type: `type/subtype`, no parameters.
  std::string m_content_type;

  /// Content encoding.
  codec::Content_encoding m_content_encoding;

  /// Declared content length; empty if not known.
  std::optional<uint64_t> m_content_length;

  /// Byte limit.
  uint64_t m_limit;

  /// Inactivity timeout; zero if disabled.
  util::Fine_duration m_timeout;

  /// Inactivity check interval.
  util::Fine_duration m_interval;
}; // struct Stream_config

// Free functions.

/**
 * Validates `options` and applies defaults.
 *
 * @param options
 *        User options.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        error::Code::S_INVALID_CONTENT_TYPE, error::Code::S_INVALID_CONTENT_ENCODING,
 *        error::Code::S_INVALID_CONTENT_LENGTH, error::Code::S_INVALID_LIMIT, error::Code::S_INVALID_TIMER_PERIODS.
 * @return The config; unspecified on error.
 */
Stream_config resolve_options(const Stream_options& options, Error_code* err_code = 0);

/**
 * Checks `raw_content_type` against the pattern `^((application|audio|image|multipart|text|video)/([\w-]+));?.*$`
 * and extracts the MIME essence (the first group).
 *
 * @param raw_content_type
 *        Candidate content type, possibly with parameters.
 * @param essence
 *        On success set to the essence; untouched otherwise.  May be null.
 * @return `true` if and only if it matched.
 */
bool parse_content_type(util::String_view raw_content_type, std::string* essence);

/**
 * Whether `content_type` (an essence) can be turned into a document: `application/json`, `application/msgpack`,
 * `application/x-www-form-urlencoded`.
 *
 * @param content_type
 *        MIME essence.
 * @return See above.
 */
bool deserializable_content_type(util::String_view content_type);

/**
 * Whether `content_type` (an essence) is a stream of individual records: `application/ndjson`, `text/event-stream`.
 *
 * @param content_type
 *        MIME essence.
 * @return See above.
 */
bool object_stream_content_type(util::String_view content_type);

/**
 * Infers content type (an essence) and content encoding from a file name: a trailing `.gz` means gzip, a trailing
 * `.deflate` means deflate (and otherwise identity); the extension that remains then selects the content type from
 * a table of common types.  Unknown extension (or none): #S_DEFAULT_CONTENT_TYPE.
 *
 * @param path
 *        File path; only the file name matters.
 * @param encoding
 *        Set to the inferred encoding.  Must not be null.
 * @return The inferred content type.
 */
std::string content_type_for_path(const fs::path& path, codec::Content_encoding* encoding);

/**
 * Serializes to JSON (nlohmann ADL hook): `{"contentType", "contentEncoding", "contentLength"?}`.
 *
 * @param json
 *        Target.
 * @param descriptor
 *        Source.
 */
void to_json(codec::Value& json, const Content_descriptor& descriptor);

/**
 * Deserializes from JSON (nlohmann ADL hook).  Absent members stay empty strings (and the length stays unknown);
 * resolve_options() then applies defaults or reports errors.
 *
 * @param json
 *        Source; an object.  Throws `nlohmann::json::exception` on a member of the wrong type.
 * @param descriptor
 *        Target.
 */
void from_json(const codec::Value& json, Content_descriptor& descriptor);

/**
 * Member-wise equality.
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator==(const Content_descriptor& val1, const Content_descriptor& val2);

/**
 * Negation of the other operator.
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator!=(const Content_descriptor& val1, const Content_descriptor& val2);

/**
 * Prints string representation of the given Content_descriptor to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Content_descriptor& val);

} // namespace bstream::stream
