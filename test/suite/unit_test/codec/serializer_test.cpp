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
#include "bstream/codec/serializer.hpp"
#include "bstream/codec/detail/form_urlencoded.hpp"
#include "bstream/codec/error.hpp"
#include "bstream/test/test_common_util.hpp"
#include "bstream/test/test_logger.hpp"
#include <flow/error/error.hpp>
#include <gtest/gtest.h>

namespace bstream::codec::test
{

namespace
{
using bstream::test::Test_logger;
using bstream::test::to_chunk;
using bstream::test::to_string;
using util::Blob_const;
using util::Chunk;

const std::string S_JSON = "application/json";
const std::string S_MSGPACK = "application/msgpack";
const std::string S_FORM = "application/x-www-form-urlencoded";

Blob_const blob(const Chunk& bytes)
{
  return Blob_const(bytes.data(), bytes.size());
}

Value sample_document()
{
  return Value::parse(R"({"name": "stream", "size": 42, "ratio": 0.5, "ok": true, "tags": ["a", "b"],
                          "nested": {"deep": [1, 2, {"x": null}]}})");
}
} // Anonymous namespace

TEST(Serializer_test, Supported_types)
{
  EXPECT_TRUE(serializable_content_type(S_JSON));
  EXPECT_TRUE(serializable_content_type(S_MSGPACK));
  EXPECT_TRUE(serializable_content_type(S_FORM));

  // Essences only: parameters and case variants are the caller's to strip.
  EXPECT_FALSE(serializable_content_type("application/json; charset=utf-8"));
  EXPECT_FALSE(serializable_content_type("Application/JSON"));
  EXPECT_FALSE(serializable_content_type("application/x-ndjson"));
  EXPECT_FALSE(serializable_content_type("text/plain"));
  EXPECT_FALSE(serializable_content_type(""));
}

TEST(Serializer_test, Json)
{
  Test_logger logger;
  const auto doc = sample_document();

  const auto bytes = serialize(&logger, S_JSON, doc);
  EXPECT_EQ(Value::parse(to_string(bytes)), doc);
  EXPECT_EQ(deserialize(&logger, S_JSON, blob(bytes)), doc);

  EXPECT_EQ(to_string(serialize(&logger, S_JSON, Value("text"))), "\"text\"");
  EXPECT_EQ(deserialize(&logger, S_JSON, blob(to_chunk("  [1, 2]  "))), Value::parse("[1,2]"));
}

TEST(Serializer_test, Msgpack)
{
  Test_logger logger;
  const auto doc = sample_document();

  const auto bytes = serialize(&logger, S_MSGPACK, doc);
  const auto packed = Value::to_msgpack(doc);
  EXPECT_EQ(bytes, Chunk(packed.begin(), packed.end()));
  EXPECT_EQ(deserialize(&logger, S_MSGPACK, blob(bytes)), doc);

  // fixmap of 1: {"a": 1}.
  const Chunk packed_map{ 0x81, 0xa1, 'a', 0x01 };
  EXPECT_EQ(deserialize(&logger, S_MSGPACK, blob(packed_map)), Value::parse(R"({"a": 1})"));
}

TEST(Serializer_test, Form_urlencoded)
{
  Test_logger logger;

  const auto doc = Value::parse(R"({"b": "x y&z", "a": 1, "flag": false, "list": ["1", 2], "none": null})");
  // Object members come out in key order.
  EXPECT_EQ(to_string(serialize(&logger, S_FORM, doc)), "a=1&b=x%20y%26z&flag=false&list=1&list=2&none=");

  const auto decoded = deserialize(&logger, S_FORM, blob(to_chunk("a=1&b=x+y%26z&list=1&list=2&empty&=v&&c=%zz")));
  const auto expected = Value::parse(R"({"a": "1", "b": "x y&z", "list": ["1", "2"], "empty": "", "": "v",
                                         "c": "%zz"})");
  EXPECT_EQ(decoded, expected);

  EXPECT_EQ(deserialize(&logger, S_FORM, Blob_const()), Value::object());
  EXPECT_EQ(form_urlencode(Value::array({ 1, 2 })), "");
  EXPECT_EQ(form_escape("a b/é"), "a%20b%2F%C3%A9");
  EXPECT_EQ(form_unescape("%41%4"), "A%4");
}

TEST(Serializer_test, Unsupported_type)
{
  Test_logger logger;
  Error_code err_code;

  const auto bytes = serialize(&logger, "text/plain", Value::object(), &err_code);
  EXPECT_EQ(err_code, error::Code::S_UNSUPPORTED_CONTENT_TYPE);
  EXPECT_TRUE(bytes.empty());

  const auto value = deserialize(&logger, "text/plain", blob(to_chunk("{}")), &err_code);
  EXPECT_EQ(err_code, error::Code::S_UNSUPPORTED_CONTENT_TYPE);
  EXPECT_TRUE(value.is_null());

  try
  {
    serialize(&logger, "image/png", Value::object());
    ADD_FAILURE() << "Should have thrown.";
  }
  catch (const flow::error::Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), error::Code::S_UNSUPPORTED_CONTENT_TYPE);
  }
}

TEST(Serializer_test, Malformed_input)
{
  Test_logger logger;
  Error_code err_code;

  for (const auto& bad : { "{\"a\": ", "[1, 2", "nope", "", "{} {}" })
  {
    SCOPED_TRACE(bad);
    const auto value = deserialize(&logger, S_JSON, blob(to_chunk(bad)), &err_code);
    EXPECT_EQ(err_code, error::Code::S_DESERIALIZE_MALFORMED);
    EXPECT_TRUE(value.is_null());
  }

  const Chunk truncated_map{ 0x82, 0xa1, 'a' };
  deserialize(&logger, S_MSGPACK, blob(truncated_map), &err_code);
  EXPECT_EQ(err_code, error::Code::S_DESERIALIZE_MALFORMED);

  // JSON text must be valid UTF-8.
  const auto invalid_utf8 = Value(std::string("\xff\xfe"));
  serialize(&logger, S_JSON, invalid_utf8, &err_code);
  EXPECT_EQ(err_code, error::Code::S_SERIALIZE_FAILED);
}

} // namespace bstream::codec::test
