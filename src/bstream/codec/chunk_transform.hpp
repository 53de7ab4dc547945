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

#include "bstream/codec/codec_fwd.hpp"
#include <flow/log/log.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <boost/noncopyable.hpp>

namespace bstream::codec
{

/**
 * An incremental compressor or decompressor: feed it the input a chunk at a time via transform(), get
 * output bytes back as they become available, and finally call finish() to obtain the tail (e.g., the gzip trailer).
 * Obtain one via make_compressor() or make_decompressor().
 *
 * The coding proper is zlib's, reached through boost.iostreams filters: `gzip_compressor`/`gzip_decompressor` for
 * Content_encoding::S_GZIP; `zlib_compressor`/`zlib_decompressor` for Content_encoding::S_DEFLATE.
 *
 * Output is buffered by the filters, so a given transform() may well yield nothing; the concatenation of all
 * outputs of transform() calls plus finish() is the full result.
 *
 * ### Error handling ###
 * A failure (corrupt compressed input; or a compressor failure) is reported via #Error_code, and the object is then
 * *hosed*: all subsequent calls report the same error.  A hosed or finished object produces no more output.
 */
class Chunk_transform :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Which way the bytes are coded.
  enum class Direction
  {
    /// Plain bytes in, encoded bytes out.
    S_COMPRESS,
    /// Encoded bytes in, plain bytes out.
    S_DECOMPRESS
  };

  // Constructors/destructor.

  /**
   * Constructs the transform, ready for transform() calls.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param encoding
   *        Encoding to compress into, or decompress from.  Must not be Content_encoding::S_IDENTITY (undefined
   *        behavior; assertion may trip).
   * @param direction
   *        See Direction.
   */
  explicit Chunk_transform(flow::log::Logger* logger_ptr, Content_encoding encoding, Direction direction);

  /// Releases resources; any unfinished output is discarded.
  ~Chunk_transform();

  // Methods.

  /**
   * Feeds the next chunk of input; appends any output made available thereby to `*out`.
   *
   * @param in
   *        Input bytes.  May be empty.
   * @param out
   *        Output is appended here.  Must not be null.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        codec::error::Code::S_DECOMPRESS_DATA_CORRUPT (decompressor only),
   *        codec::error::Code::S_COMPRESS_FAILED (compressor only).
   */
  void transform(const util::Blob_const& in, util::Chunk* out, Error_code* err_code = 0);

  /**
   * Signals end of input; appends the remaining output to `*out`.  Subsequent calls to either method are no-ops
   * (or report the earlier error, if hosed).
   *
   * @param out
   *        Output is appended here.  Must not be null.
   * @param err_code
   *        See transform().  Additionally a decompressor reports codec::error::Code::S_DECOMPRESS_DATA_CORRUPT if the
   *        input ended before the encoded stream did (where zlib can tell).
   */
  void finish(util::Chunk* out, Error_code* err_code = 0);

  /**
   * Encoding given to ctor.
   * @return See above.
   */
  Content_encoding encoding() const;

  /**
   * Direction given to ctor.
   * @return See above.
   */
  Direction direction() const;

private:
  // Types.

  /// The boost.iostreams chain: the zlib filter in front of #m_sink.
  using Filter_chain = boost::iostreams::filtering_ostream;

  // Methods.

  /**
   * Runs `op` against #m_chain, translating a boost.iostreams/zlib exception into this object's codec error and
   * hosing the object.
   *
   * @param op
   *        The operation on #m_chain.
   * @param context
   *        For logging.
   * @return Success or the codec error.
   */
  Error_code run_on_chain(const Function<void ()>& op, util::String_view context);

  /**
   * Moves whatever the chain has emitted into #m_sink since the last call onto the end of `*out`.
   * @param out
   *        See transform().
   */
  void drain_sink(util::Chunk* out);

  /**
   * The code reported upon any failure: depends on #m_direction.
   * @return See above.
   */
  Error_code failure_code() const;

  // Data.

  /// See encoding().
  const Content_encoding m_encoding;

  /// See direction().
  const Direction m_direction;

  /**
   * The chain's output device writes into this.  It is a `std::string` (not a util::Chunk) because boost.iostreams
   * chains here are `char`-based.
   */
  std::string m_sink;

  /// Filter plus sink.  Null once finished or hosed.
  boost::movelib::unique_ptr<Filter_chain> m_chain;

  /// Non-success once hosed; the code every subsequent call reports.
  Error_code m_hosed_err_code;
}; // class Chunk_transform

// Free functions.

/**
 * Prints string representation of the given Chunk_transform to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Chunk_transform& val);

} // namespace bstream::codec
