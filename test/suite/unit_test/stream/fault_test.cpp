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
#include "bstream/stream/fault.hpp"
#include "bstream/codec/error.hpp"
#include "bstream/error.hpp"
#include <gtest/gtest.h>
#include <sstream>

namespace bstream::stream::test
{

namespace
{
using boost::chrono::milliseconds;

Content_descriptor json_descriptor()
{
  Content_descriptor descriptor;
  descriptor.m_content_type = "application/json";
  descriptor.m_content_encoding = "identity";
  descriptor.m_content_length = 100;
  return descriptor;
}
} // Anonymous namespace

TEST(Fault_test, No_fault)
{
  const Fault fault;
  EXPECT_FALSE(fault);
  EXPECT_FALSE(fault.code());
  EXPECT_FALSE(fault.descriptor());
  EXPECT_TRUE(fault.name().empty());
  EXPECT_TRUE(fault.to_json().is_null());

  std::ostringstream os;
  os << fault;
  EXPECT_EQ(os.str(), "no-fault");
}

TEST(Fault_test, Kinds)
{
  const auto descriptor = json_descriptor();

  const auto too_large = Fault::too_large(descriptor, 12, 10);
  EXPECT_TRUE(too_large);
  EXPECT_EQ(too_large.code(), error::Code::S_TOO_LARGE);
  EXPECT_EQ(too_large.name(), "TooLarge");
  EXPECT_EQ(too_large.observed_size(), 12u);
  EXPECT_EQ(too_large.limit(), 10u);
  EXPECT_FALSE(too_large.elapsed());
  EXPECT_FALSE(too_large.cause());
  ASSERT_TRUE(too_large.descriptor());
  EXPECT_EQ(*too_large.descriptor(), descriptor);

  const auto timed_out = Fault::timed_out(descriptor, milliseconds(1500));
  EXPECT_EQ(timed_out.code(), error::Code::S_TIMED_OUT);
  EXPECT_EQ(timed_out.name(), "TimedOut");
  ASSERT_TRUE(timed_out.elapsed());
  EXPECT_EQ(*timed_out.elapsed(), util::Fine_duration(milliseconds(1500)));
  EXPECT_FALSE(timed_out.observed_size());

  const auto multiple = Fault::multiple_sources(descriptor);
  EXPECT_EQ(multiple.code(), error::Code::S_MULTIPLE_SOURCES);
  EXPECT_EQ(multiple.name(), "MultipleSources");

  const Error_code cause = codec::error::Code::S_DECOMPRESS_DATA_CORRUPT;
  const auto unexpected = Fault::unexpected(cause, descriptor);
  EXPECT_EQ(unexpected.code(), error::Code::S_UNEXPECTED);
  EXPECT_EQ(unexpected.name(), "Unexpected");
  EXPECT_EQ(unexpected.cause(), cause);
  EXPECT_NE(unexpected.message().find(cause.message()), std::string::npos);
}

TEST(Fault_test, Wrap)
{
  const auto descriptor = json_descriptor();

  EXPECT_FALSE(Fault::wrap(Error_code(), descriptor));

  // Stream fault codes stay what they are.
  const auto too_large = Fault::wrap(error::Code::S_TOO_LARGE, descriptor);
  EXPECT_EQ(too_large.code(), error::Code::S_TOO_LARGE);
  EXPECT_FALSE(too_large.cause());

  // Anything else becomes the cause of an Unexpected fault.
  const Error_code sys_err_code(ENOENT, boost::system::system_category());
  const auto unexpected = Fault::wrap(sys_err_code, descriptor);
  EXPECT_EQ(unexpected.code(), error::Code::S_UNEXPECTED);
  EXPECT_EQ(unexpected.cause(), sys_err_code);

  // Including non-fault codes of our own category.
  const auto lifecycle = Fault::wrap(error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER, descriptor);
  EXPECT_EQ(lifecycle.code(), error::Code::S_UNEXPECTED);
  EXPECT_EQ(lifecycle.name(), "Unexpected");
}

TEST(Fault_test, To_json)
{
  auto descriptor = json_descriptor();

  const auto too_large = Fault::too_large(descriptor, 12, 10).to_json();
  EXPECT_EQ(too_large.at("name"), "TooLarge");
  EXPECT_EQ(too_large.at("code"), int(error::Code::S_TOO_LARGE));
  EXPECT_FALSE(too_large.at("message").get<std::string>().empty());
  EXPECT_EQ(too_large.at("metadata"),
            codec::Value::parse(R"({"contentType": "application/json", "contentEncoding": "identity",
                                    "contentLength": 100, "size": 12, "limit": 10})"));
  EXPECT_FALSE(too_large.contains("cause"));

  descriptor.m_content_length.reset();
  const auto timed_out = Fault::timed_out(descriptor, milliseconds(250)).to_json();
  EXPECT_EQ(timed_out.at("metadata").at("duration"), 250);
  EXPECT_FALSE(timed_out.at("metadata").contains("contentLength"));

  const Error_code cause = codec::error::Code::S_DESERIALIZE_MALFORMED;
  const auto unexpected = Fault::unexpected(cause, descriptor).to_json();
  EXPECT_EQ(unexpected.at("name"), "Unexpected");
  ASSERT_TRUE(unexpected.contains("cause"));
  EXPECT_EQ(unexpected.at("cause").at("category"), "bstream/codec");
  EXPECT_EQ(unexpected.at("cause").at("code"), int(codec::error::Code::S_DESERIALIZE_MALFORMED));
  EXPECT_EQ(unexpected.at("cause").at("message"), cause.message());
}

TEST(Fault_test, Print)
{
  std::ostringstream os;
  os << Fault::too_large(json_descriptor(), 12, 10);
  EXPECT_NE(os.str().find("TOO_LARGE"), std::string::npos) << os.str();

  os.str("");
  const Error_code cause = codec::error::Code::S_DECOMPRESS_DATA_CORRUPT;
  os << Fault::unexpected(cause, json_descriptor());
  EXPECT_NE(os.str().find("UNEXPECTED"), std::string::npos) << os.str();
  EXPECT_NE(os.str().find(" <- "), std::string::npos) << os.str();
}

} // namespace bstream::stream::test
