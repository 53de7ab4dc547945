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
#include "bstream/stream/content.hpp"
#include "bstream/error.hpp"
#include <flow/error/error.hpp>
#include <gtest/gtest.h>
#include <sstream>

namespace bstream::stream::test
{

namespace
{
using boost::chrono::milliseconds;
using boost::chrono::seconds;
using codec::Content_encoding;
using util::Fine_duration;

Error_code resolve_error(const Stream_options& options)
{
  Error_code err_code;
  resolve_options(options, &err_code);
  return err_code;
}
} // Anonymous namespace

TEST(Content_test, Resolve_defaults)
{
  const auto config = resolve_options(Stream_options());
  EXPECT_EQ(config.m_raw_content_type, "application/octet-stream");
  EXPECT_EQ(config.m_content_type, "application/octet-stream");
  EXPECT_EQ(config.m_content_encoding, Content_encoding::S_IDENTITY);
  EXPECT_FALSE(config.m_content_length);
  EXPECT_EQ(config.m_limit, S_DEFAULT_LIMIT);
  EXPECT_EQ(config.m_timeout, Fine_duration(seconds(30)));
  EXPECT_EQ(config.m_interval, Fine_duration(seconds(1)));

  // Deserializable types get the smaller default limit.
  Stream_options options;
  options.m_content_type = "application/json; charset=utf-8";
  const auto json_config = resolve_options(options);
  EXPECT_EQ(json_config.m_raw_content_type, "application/json; charset=utf-8");
  EXPECT_EQ(json_config.m_content_type, "application/json");
  EXPECT_EQ(json_config.m_limit, S_DEFAULT_DESERIALIZABLE_LIMIT);

  // The default interval never exceeds the timeout.
  options = Stream_options();
  options.m_timeout = milliseconds(200);
  EXPECT_EQ(resolve_options(options).m_interval, Fine_duration(milliseconds(200)));
  options.m_timeout = Fine_duration::zero();
  EXPECT_EQ(resolve_options(options).m_interval, Fine_duration::zero());

  options = Stream_options();
  options.m_content_encoding = "gzip";
  options.m_content_length = 7;
  options.m_limit = S_UNLIMITED;
  const auto explicit_config = resolve_options(options);
  EXPECT_EQ(explicit_config.m_content_encoding, Content_encoding::S_GZIP);
  EXPECT_EQ(explicit_config.m_content_length, 7u);
  EXPECT_EQ(explicit_config.m_limit, S_UNLIMITED);
} // TEST(Content_test, Resolve_defaults)

TEST(Content_test, Resolve_errors)
{
  Stream_options options;
  options.m_content_type = "font/woff";
  EXPECT_EQ(resolve_error(options), error::Code::S_INVALID_CONTENT_TYPE);
  options.m_content_type = "";
  EXPECT_EQ(resolve_error(options), error::Code::S_INVALID_CONTENT_TYPE);

  options = Stream_options();
  options.m_content_encoding = "br";
  EXPECT_EQ(resolve_error(options), error::Code::S_INVALID_CONTENT_ENCODING);

  options = Stream_options();
  options.m_content_length = 0;
  EXPECT_EQ(resolve_error(options), error::Code::S_INVALID_CONTENT_LENGTH);

  options = Stream_options();
  options.m_limit = 0;
  EXPECT_EQ(resolve_error(options), error::Code::S_INVALID_LIMIT);

  options = Stream_options();
  options.m_timeout = milliseconds(-1);
  EXPECT_EQ(resolve_error(options), error::Code::S_INVALID_TIMER_PERIODS);

  options = Stream_options();
  options.m_interval = milliseconds(-1);
  EXPECT_EQ(resolve_error(options), error::Code::S_INVALID_TIMER_PERIODS);

  options = Stream_options();
  options.m_timeout = milliseconds(100);
  options.m_interval = milliseconds(101);
  EXPECT_EQ(resolve_error(options), error::Code::S_INVALID_TIMER_PERIODS);

  // An explicit interval must fit even a disabled timeout; only the defaulted one is clamped to it.
  options.m_timeout = Fine_duration::zero();
  EXPECT_EQ(resolve_error(options), error::Code::S_INVALID_TIMER_PERIODS);
  options.m_interval = Fine_duration::zero();
  EXPECT_FALSE(resolve_error(options));
  options.m_interval.reset();
  EXPECT_FALSE(resolve_error(options));

  // The first problem found is the one reported; type before encoding.
  options = Stream_options();
  options.m_content_type = "bogus";
  options.m_content_encoding = "bogus";
  EXPECT_EQ(resolve_error(options), error::Code::S_INVALID_CONTENT_TYPE);

  EXPECT_THROW(resolve_options(options), flow::error::Runtime_error);
} // TEST(Content_test, Resolve_errors)

TEST(Content_test, Parse_content_type)
{
  std::string essence;
  EXPECT_TRUE(parse_content_type("text/plain", &essence));
  EXPECT_EQ(essence, "text/plain");
  EXPECT_TRUE(parse_content_type("text/plain; charset=utf-8", &essence));
  EXPECT_EQ(essence, "text/plain");
  EXPECT_TRUE(parse_content_type("application/vnd-custom_type", &essence));
  EXPECT_EQ(essence, "application/vnd-custom_type");
  EXPECT_TRUE(parse_content_type("multipart/form-data;boundary=xyz", &essence));
  EXPECT_EQ(essence, "multipart/form-data");
  EXPECT_TRUE(parse_content_type("video/mp4", nullptr));

  essence = "untouched";
  EXPECT_FALSE(parse_content_type("font/woff", &essence));
  EXPECT_FALSE(parse_content_type("text", &essence));
  EXPECT_FALSE(parse_content_type("text/", &essence));
  EXPECT_FALSE(parse_content_type(" text/plain", &essence));
  EXPECT_FALSE(parse_content_type("Text/plain", &essence));
  EXPECT_EQ(essence, "untouched");

  // The subtype is the leading run of word characters and dashes; whatever follows it is tolerated.
  EXPECT_TRUE(parse_content_type("application/vnd.api+json", &essence));
  EXPECT_EQ(essence, "application/vnd");

  EXPECT_TRUE(deserializable_content_type("application/msgpack"));
  EXPECT_FALSE(deserializable_content_type("application/ndjson"));
  EXPECT_TRUE(object_stream_content_type("application/ndjson"));
  EXPECT_TRUE(object_stream_content_type("text/event-stream"));
  EXPECT_FALSE(object_stream_content_type("application/json"));
} // TEST(Content_test, Parse_content_type)

TEST(Content_test, Content_type_for_path)
{
  auto encoding = Content_encoding::S_END_SENTINEL;

  EXPECT_EQ(content_type_for_path("/data/doc.json", &encoding), "application/json");
  EXPECT_EQ(encoding, Content_encoding::S_IDENTITY);
  EXPECT_EQ(content_type_for_path("/data/doc.json.gz", &encoding), "application/json");
  EXPECT_EQ(encoding, Content_encoding::S_GZIP);
  EXPECT_EQ(content_type_for_path("PHOTO.JPG", &encoding), "image/jpeg");
  EXPECT_EQ(encoding, Content_encoding::S_IDENTITY);
  EXPECT_EQ(content_type_for_path("notes.txt.deflate", &encoding), "text/plain");
  EXPECT_EQ(encoding, Content_encoding::S_DEFLATE);

  EXPECT_EQ(content_type_for_path("archive.gz", &encoding), "application/octet-stream");
  EXPECT_EQ(encoding, Content_encoding::S_GZIP);
  EXPECT_EQ(content_type_for_path("Makefile", &encoding), "application/octet-stream");
  EXPECT_EQ(encoding, Content_encoding::S_IDENTITY);
  EXPECT_EQ(content_type_for_path("/a.json/b.unknownext", &encoding), "application/octet-stream");

  // Every inferred type is itself acceptable as a content type.
  for (const auto name : { "a.msgpack", "a.ndjson", "a.tar", "a.md", "a.yml", "a.mp3", "a.webm", "a.csv" })
  {
    EXPECT_TRUE(parse_content_type(content_type_for_path(name, &encoding), nullptr)) << name;
  }
} // TEST(Content_test, Content_type_for_path)

TEST(Content_test, Descriptor)
{
  Content_descriptor descriptor;
  descriptor.m_content_type = "text/plain; charset=utf-8";
  descriptor.m_content_encoding = "gzip";

  codec::Value json = descriptor;
  EXPECT_EQ(json, codec::Value::parse(R"({"contentType": "text/plain; charset=utf-8", "contentEncoding": "gzip"})"));
  EXPECT_EQ(json.get<Content_descriptor>(), descriptor);

  descriptor.m_content_length = 123;
  json = descriptor;
  EXPECT_EQ(json.at("contentLength"), 123);
  const auto back = json.get<Content_descriptor>();
  EXPECT_EQ(back, descriptor);
  EXPECT_NE(back, Content_descriptor());

  std::ostringstream os;
  os << descriptor;
  EXPECT_EQ(os.str(), "type[text/plain; charset=utf-8] encoding[gzip] length[123]");

  // Options from a descriptor carry its metadata, and nothing else.
  const Stream_options options(descriptor);
  EXPECT_EQ(options.m_content_type, descriptor.m_content_type);
  EXPECT_EQ(options.m_content_encoding, descriptor.m_content_encoding);
  EXPECT_EQ(options.m_content_length, 123u);
  EXPECT_FALSE(options.m_limit);
  EXPECT_FALSE(options.m_timeout);
} // TEST(Content_test, Descriptor)

} // namespace bstream::stream::test
