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
#include "bstream/stream/transcoder.hpp"
#include "bstream/stream/buffer_source.hpp"
#include "bstream/codec/codec_fwd.hpp"
#include "bstream/codec/error.hpp"
#include "bstream/test/test_common_util.hpp"
#include "bstream/test/test_logger.hpp"
#include <boost/make_shared.hpp>
#include <gtest/gtest.h>
#include <optional>

namespace bstream::stream::test
{

namespace
{
using bstream::test::Test_logger;
using bstream::test::run_task_engine;
using bstream::test::make_pattern_chunk;
using codec::Content_encoding;
using util::Blob_const;
using util::Chunk;
using std::optional;

/// Everything read from a source, and the code it ended with.
struct Drained
{
  Chunk m_bytes;
  optional<Error_code> m_end;
};

void drain(Chunk_source::Ptr source, boost::shared_ptr<Drained> drained)
{
  auto& source_ref = *source;
  source_ref.async_read_chunk([source = std::move(source), drained = std::move(drained)]
                                (const Error_code& err_code, Chunk&& chunk) mutable
  {
    if (err_code)
    {
      drained->m_end = err_code;
      return;
    }
    // else
    drained->m_bytes.insert(drained->m_bytes.end(), chunk.begin(), chunk.end());
    drain(std::move(source), std::move(drained));
  });
}

Blob_const blob(const Chunk& bytes)
{
  return Blob_const(bytes.data(), bytes.size());
}

} // Anonymous namespace

class Transcoder_test :
  public ::testing::Test
{
protected:
  Chunk_source::Ptr buffer_source(Chunk bytes)
  {
    return boost::make_shared<Buffer_source>(&m_logger, "test-buf", &m_task_engine, std::move(bytes));
  }

  /// Runs `source` to its end; returns what came out.
  Drained run(Chunk_source::Ptr source)
  {
    auto drained = boost::make_shared<Drained>();
    drain(std::move(source), drained);
    EXPECT_TRUE(run_task_engine(&m_task_engine));
    return *drained;
  }

  Test_logger m_logger;
  util::Task_engine m_task_engine;
};

TEST_F(Transcoder_test, Identity_passes_through)
{
  const auto source = buffer_source(make_pattern_chunk(100));
  EXPECT_EQ(compress(&m_logger, Content_encoding::S_IDENTITY, source), source);
  EXPECT_EQ(decompress(&m_logger, Content_encoding::S_IDENTITY, source), source);
  EXPECT_EQ(transcode(&m_logger, Content_encoding::S_IDENTITY, Content_encoding::S_IDENTITY, source), source);

  // The buffer overloads always make a fresh source, but the bytes are untouched.
  const auto plain = make_pattern_chunk(100);
  const auto drained = run(compress(&m_logger, &m_task_engine, Content_encoding::S_IDENTITY, Chunk(plain)));
  ASSERT_TRUE(drained.m_end);
  EXPECT_EQ(*drained.m_end, boost::asio::error::eof);
  EXPECT_EQ(drained.m_bytes, plain);
}

TEST_F(Transcoder_test, Buffer_overloads)
{
  const auto plain = make_pattern_chunk(150 * 1024);

  for (const auto encoding : { Content_encoding::S_GZIP, Content_encoding::S_DEFLATE })
  {
    const auto compressed = run(compress(&m_logger, &m_task_engine, encoding, Chunk(plain)));
    ASSERT_TRUE(compressed.m_end);
    EXPECT_EQ(*compressed.m_end, boost::asio::error::eof);
    EXPECT_LT(compressed.m_bytes.size(), plain.size()) << encoding;
    EXPECT_EQ(codec::decompress_buffer(&m_logger, encoding, blob(compressed.m_bytes)), plain) << encoding;

    auto encoded = codec::compress_buffer(&m_logger, encoding, blob(plain));
    const auto decompressed = run(decompress(&m_logger, &m_task_engine, encoding, std::move(encoded)));
    ASSERT_TRUE(decompressed.m_end);
    EXPECT_EQ(*decompressed.m_end, boost::asio::error::eof);
    EXPECT_EQ(decompressed.m_bytes, plain) << encoding;
  }
}

TEST_F(Transcoder_test, Gzip_to_deflate)
{
  const auto plain = make_pattern_chunk(70 * 1024);
  const auto gzipped = codec::compress_buffer(&m_logger, Content_encoding::S_GZIP, blob(plain));

  const auto drained = run(transcode(&m_logger, Content_encoding::S_GZIP, Content_encoding::S_DEFLATE,
                                     buffer_source(gzipped)));
  ASSERT_TRUE(drained.m_end);
  EXPECT_EQ(*drained.m_end, boost::asio::error::eof);
  ASSERT_GE(drained.m_bytes.size(), 2u);
  EXPECT_EQ(drained.m_bytes[0], 0x78); // zlib container, not gzip.
  EXPECT_EQ(codec::decompress_buffer(&m_logger, Content_encoding::S_DEFLATE, blob(drained.m_bytes)), plain);
}

TEST_F(Transcoder_test, Corrupt_input)
{
  Chunk garbage(64);
  for (size_t idx = 0; idx != garbage.size(); ++idx)
  {
    garbage[idx] = uint8_t(idx * 7);
  }

  const auto drained = run(decompress(&m_logger, &m_task_engine, Content_encoding::S_GZIP, std::move(garbage)));
  ASSERT_TRUE(drained.m_end);
  EXPECT_EQ(*drained.m_end, codec::error::Code::S_DECOMPRESS_DATA_CORRUPT);
}

} // namespace bstream::stream::test
