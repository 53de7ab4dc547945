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
#include "bstream/codec/chunk_transform.hpp"
#include "bstream/codec/error.hpp"
#include "bstream/util/default_init_allocator.hpp"
#include <flow/error/error.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filter/zlib.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/move/make_unique.hpp>

namespace bstream::codec
{

// Chunk_transform implementations.

Chunk_transform::Chunk_transform(flow::log::Logger* logger_ptr, Content_encoding encoding, Direction direction) :
  flow::log::Log_context(logger_ptr, Log_component::S_CODEC),
  m_encoding(encoding),
  m_direction(direction),
  m_chain(boost::movelib::make_unique<Filter_chain>())
{
  namespace bio = boost::iostreams;

  assert((m_encoding == Content_encoding::S_GZIP) || (m_encoding == Content_encoding::S_DEFLATE));

  const bool gzip = m_encoding == Content_encoding::S_GZIP;
  if (m_direction == Direction::S_COMPRESS)
  {
    if (gzip)
    {
      m_chain->push(bio::gzip_compressor());
    }
    else
    {
      m_chain->push(bio::zlib_compressor());
    }
  }
  else
  {
    if (gzip)
    {
      m_chain->push(bio::gzip_decompressor());
    }
    else
    {
      m_chain->push(bio::zlib_decompressor());
    }
  }
  m_chain->push(bio::back_inserter(m_sink));

  /* With badbit in the mask, the ostream rethrows whatever the filter threw (zlib_error, gzip_error) as-is.  Only now:
   * an incomplete chain has no streambuf, so badbit is already set, and setting the mask earlier would throw here. */
  m_chain->exceptions(std::ios_base::badbit);

  FLOW_LOG_TRACE("Chunk_transform [" << *this << "]: Created.");
} // Chunk_transform::Chunk_transform()

Chunk_transform::~Chunk_transform() = default;

void Chunk_transform::transform(const util::Blob_const& in, util::Chunk* out, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { transform(in, out, actual_err_code); },
         err_code, "Chunk_transform::transform()"))
  {
    return;
  }
  // else

  assert(out);

  if (m_hosed_err_code)
  {
    *err_code = m_hosed_err_code;
    return;
  }
  // else
  if (!m_chain)
  {
    FLOW_LOG_WARNING("Chunk_transform [" << *this << "]: transform() after finish(); ignoring "
                     "[" << in.size() << "] bytes.");
    err_code->clear();
    return;
  }
  // else

  *err_code = run_on_chain([&]()
  {
    m_chain->write(static_cast<const char*>(in.data()), std::streamsize(in.size()));
    m_chain->flush();
  }, "transform()");

  if (!*err_code)
  {
    drain_sink(out);
  }
} // Chunk_transform::transform()

void Chunk_transform::finish(util::Chunk* out, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { finish(out, actual_err_code); },
         err_code, "Chunk_transform::finish()"))
  {
    return;
  }
  // else

  assert(out);

  if (m_hosed_err_code)
  {
    *err_code = m_hosed_err_code;
    return;
  }
  // else
  if (!m_chain)
  {
    err_code->clear();
    return; // Already finished.
  }
  // else

  // Closing the chain flushes the filter, which emits the tail (trailer, or remaining plain bytes) into m_sink.
  *err_code = run_on_chain([&]() { m_chain->reset(); }, "finish()");
  if (*err_code)
  {
    return;
  }
  // else

  drain_sink(out);
  m_chain.reset();
  FLOW_LOG_TRACE("Chunk_transform [" << *this << "]: Finished.");
} // Chunk_transform::finish()

Error_code Chunk_transform::run_on_chain(const Function<void ()>& op, util::String_view context)
{
  namespace bio = boost::iostreams;

  std::string what;
  try
  {
    op();
    return Error_code();
  }
  catch (const bio::gzip_error& exc)
  {
    what = flow::util::ostream_op_string("gzip error [", exc.error(), "] zlib error [", exc.zlib_error_code(), ']');
  }
  catch (const bio::zlib_error& exc)
  {
    what = flow::util::ostream_op_string("zlib error [", exc.error(), ']');
  }
  catch (const std::ios_base::failure& exc)
  {
    what = exc.what();
  }

  m_hosed_err_code = failure_code();
  FLOW_LOG_WARNING("Chunk_transform [" << *this << "]: In [" << context << "] the filter chain failed: "
                   "[" << what << "].  Reporting [" << m_hosed_err_code << "] [" << m_hosed_err_code.message() << "]; "
                   "the transform is now unusable.");
  m_sink.clear();
  m_chain.reset();
  return m_hosed_err_code;
} // Chunk_transform::run_on_chain()

void Chunk_transform::drain_sink(util::Chunk* out)
{
  out->insert(out->end(), m_sink.begin(), m_sink.end());
  m_sink.clear();
}

Error_code Chunk_transform::failure_code() const
{
  return (m_direction == Direction::S_COMPRESS) ? error::Code::S_COMPRESS_FAILED
                                                : error::Code::S_DECOMPRESS_DATA_CORRUPT;
}

Content_encoding Chunk_transform::encoding() const
{
  return m_encoding;
}

Chunk_transform::Direction Chunk_transform::direction() const
{
  return m_direction;
}

std::ostream& operator<<(std::ostream& os, const Chunk_transform& val)
{
  return os << ((val.direction() == Chunk_transform::Direction::S_COMPRESS) ? "compress:" : "decompress:")
            << val.encoding() << '@' << static_cast<const void*>(&val);
}

// Free function implementations.

Chunk_transform_ptr make_compressor(flow::log::Logger* logger_ptr, Content_encoding encoding)
{
  if (encoding == Content_encoding::S_IDENTITY)
  {
    return Chunk_transform_ptr();
  }
  // else
  return boost::movelib::make_unique<Chunk_transform>(logger_ptr, encoding, Chunk_transform::Direction::S_COMPRESS);
}

Chunk_transform_ptr make_decompressor(flow::log::Logger* logger_ptr, Content_encoding encoding)
{
  if (encoding == Content_encoding::S_IDENTITY)
  {
    return Chunk_transform_ptr();
  }
  // else
  return boost::movelib::make_unique<Chunk_transform>(logger_ptr, encoding, Chunk_transform::Direction::S_DECOMPRESS);
}

namespace
{

/**
 * Feeds a whole buffer through `transform` (if not null) in one go.
 *
 * @param transform
 *        The transform, or null for identity.
 * @param bytes
 *        Input.
 * @param err_code
 *        Not null.
 * @return Output.
 */
util::Chunk transform_whole(Chunk_transform* transform, const util::Blob_const& bytes, Error_code* err_code)
{
  if (!transform)
  {
    err_code->clear();
    return util::to_chunk(bytes);
  }
  // else

  util::Chunk out;
  transform->transform(bytes, &out, err_code);
  if (!*err_code)
  {
    transform->finish(&out, err_code);
  }
  if (*err_code)
  {
    return util::Chunk();
  }
  // else
  return out;
}

} // namespace (anon)

util::Chunk compress_buffer(flow::log::Logger* logger_ptr, Content_encoding encoding,
                            const util::Blob_const& bytes, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(util::Chunk, compress_buffer, logger_ptr, encoding, bytes, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const auto compressor = make_compressor(logger_ptr, encoding);
  return transform_whole(compressor.get(), bytes, err_code);
}

util::Chunk decompress_buffer(flow::log::Logger* logger_ptr, Content_encoding encoding,
                              const util::Blob_const& bytes, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(util::Chunk, decompress_buffer, logger_ptr, encoding, bytes, _1);

  const auto decompressor = make_decompressor(logger_ptr, encoding);
  return transform_whole(decompressor.get(), bytes, err_code);
}

} // namespace bstream::codec
