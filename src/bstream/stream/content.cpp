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
#include "bstream/codec/serializer.hpp"
#include "bstream/error.hpp"
#include <flow/error/error.hpp>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/unordered_map.hpp>
#include <regex>

namespace bstream::stream
{

// Initializations.

const std::string S_DEFAULT_CONTENT_TYPE = "application/octet-stream";
const std::string S_DEFAULT_CONTENT_ENCODING = "identity";
const util::Fine_duration S_DEFAULT_TIMEOUT = boost::chrono::milliseconds(30000);
const util::Fine_duration S_DEFAULT_INTERVAL = boost::chrono::milliseconds(1000);

namespace
{

/// Extension (lower-case, with dot) to content type.  Only types accepted by parse_content_type() belong here.
const boost::unordered_map<std::string, std::string> S_EXTENSION_CONTENT_TYPES
  = {
      { ".json", "application/json" },
      { ".msgpack", "application/msgpack" },
      { ".ndjson", "application/ndjson" },
      { ".js", "application/javascript" },
      { ".xml", "application/xml" },
      { ".pdf", "application/pdf" },
      { ".zip", "application/zip" },
      { ".tar", "application/x-tar" },
      { ".wasm", "application/wasm" },
      { ".bin", "application/octet-stream" },
      { ".txt", "text/plain" },
      { ".text", "text/plain" },
      { ".log", "text/plain" },
      { ".html", "text/html" },
      { ".htm", "text/html" },
      { ".css", "text/css" },
      { ".csv", "text/csv" },
      { ".md", "text/markdown" },
      { ".yaml", "text/yaml" },
      { ".yml", "text/yaml" },
      { ".png", "image/png" },
      { ".jpg", "image/jpeg" },
      { ".jpeg", "image/jpeg" },
      { ".gif", "image/gif" },
      { ".webp", "image/webp" },
      { ".bmp", "image/bmp" },
      { ".mp3", "audio/mpeg" },
      { ".wav", "audio/wav" },
      { ".ogg", "audio/ogg" },
      { ".mp4", "video/mp4" },
      { ".webm", "video/webm" },
      { ".mpeg", "video/mpeg" }
    };

} // namespace (anon)

// Stream_options implementations.

Stream_options::Stream_options() = default;

Stream_options::Stream_options(const Content_descriptor& descriptor) :
  m_content_type(descriptor.m_content_type),
  m_content_encoding(descriptor.m_content_encoding),
  m_content_length(descriptor.m_content_length)
{
  // That's it.
}

// Free function implementations.

Stream_config resolve_options(const Stream_options& options, Error_code* err_code)
{
  using boost::chrono::milliseconds;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Stream_config, resolve_options, flow::util::bind_ns::cref(options), _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  Stream_config config;

  config.m_raw_content_type = options.m_content_type ? *options.m_content_type : S_DEFAULT_CONTENT_TYPE;
  if (!parse_content_type(config.m_raw_content_type, &config.m_content_type))
  {
    *err_code = error::Code::S_INVALID_CONTENT_TYPE;
    return config;
  }
  // else

  const auto& encoding_token = options.m_content_encoding ? *options.m_content_encoding : S_DEFAULT_CONTENT_ENCODING;
  if (!codec::content_encoding_from_token(encoding_token, &config.m_content_encoding))
  {
    *err_code = error::Code::S_INVALID_CONTENT_ENCODING;
    return config;
  }
  // else

  if (options.m_content_length && (*options.m_content_length == 0))
  {
    *err_code = error::Code::S_INVALID_CONTENT_LENGTH;
    return config;
  }
  // else
  config.m_content_length = options.m_content_length;

  if (options.m_limit)
  {
    if (*options.m_limit == 0)
    {
      *err_code = error::Code::S_INVALID_LIMIT;
      return config;
    }
    // else
    config.m_limit = *options.m_limit;
  }
  else
  {
    config.m_limit = deserializable_content_type(config.m_content_type) ? S_DEFAULT_DESERIALIZABLE_LIMIT
                                                                         : S_DEFAULT_LIMIT;
  }

  config.m_timeout = options.m_timeout ? *options.m_timeout : S_DEFAULT_TIMEOUT;
  config.m_interval = options.m_interval ? *options.m_interval
                                         : std::min(S_DEFAULT_INTERVAL, config.m_timeout);
  if ((config.m_timeout < util::Fine_duration::zero()) || (config.m_interval < util::Fine_duration::zero())
      || (config.m_interval > config.m_timeout))
  {
    *err_code = error::Code::S_INVALID_TIMER_PERIODS;
    return config;
  }
  // else

  err_code->clear();
  return config;
} // resolve_options()

bool parse_content_type(util::String_view raw_content_type, std::string* essence)
{
  static const std::regex S_CONTENT_TYPE_REGEX("^((application|audio|image|multipart|text|video)/([\\w-]+));?.*$");

  std::cmatch match;
  if (!std::regex_match(raw_content_type.data(), raw_content_type.data() + raw_content_type.size(),
                        match, S_CONTENT_TYPE_REGEX))
  {
    return false;
  }
  // else

  if (essence)
  {
    *essence = match[1].str();
  }
  return true;
}

bool deserializable_content_type(util::String_view content_type)
{
  // The serializer is the authority on what it can (de)serialize.
  return codec::serializable_content_type(content_type);
}

bool object_stream_content_type(util::String_view content_type)
{
  return (content_type == "application/ndjson") || (content_type == "text/event-stream");
}

std::string content_type_for_path(const fs::path& path, codec::Content_encoding* encoding)
{
  using boost::algorithm::to_lower_copy;

  assert(encoding);

  auto name = path.filename();
  auto extension = to_lower_copy(name.extension().string());

  *encoding = codec::Content_encoding::S_IDENTITY;
  if (extension == ".gz")
  {
    *encoding = codec::Content_encoding::S_GZIP;
  }
  else if (extension == ".deflate")
  {
    *encoding = codec::Content_encoding::S_DEFLATE;
  }

  if (*encoding != codec::Content_encoding::S_IDENTITY)
  {
    // Type is that of the inner name: x.json.gz => x.json.
    name = name.stem();
    extension = to_lower_copy(name.extension().string());
  }

  const auto it = S_EXTENSION_CONTENT_TYPES.find(extension);
  return (it == S_EXTENSION_CONTENT_TYPES.end()) ? S_DEFAULT_CONTENT_TYPE : it->second;
} // content_type_for_path()

void to_json(codec::Value& json, const Content_descriptor& descriptor)
{
  json = codec::Value{ { "contentType", descriptor.m_content_type },
                       { "contentEncoding", descriptor.m_content_encoding } };
  if (descriptor.m_content_length)
  {
    json["contentLength"] = *descriptor.m_content_length;
  }
}

void from_json(const codec::Value& json, Content_descriptor& descriptor)
{
  descriptor = Content_descriptor();
  if (json.contains("contentType"))
  {
    json.at("contentType").get_to(descriptor.m_content_type);
  }
  if (json.contains("contentEncoding"))
  {
    json.at("contentEncoding").get_to(descriptor.m_content_encoding);
  }
  if (json.contains("contentLength") && (!json.at("contentLength").is_null()))
  {
    descriptor.m_content_length = json.at("contentLength").get<uint64_t>();
  }
}

bool operator==(const Content_descriptor& val1, const Content_descriptor& val2)
{
  return (val1.m_content_type == val2.m_content_type)
         && (val1.m_content_encoding == val2.m_content_encoding)
         && (val1.m_content_length == val2.m_content_length);
}

bool operator!=(const Content_descriptor& val1, const Content_descriptor& val2)
{
  return !operator==(val1, val2);
}

std::ostream& operator<<(std::ostream& os, const Content_descriptor& val)
{
  os << "type[" << val.m_content_type << "] encoding[" << val.m_content_encoding << "] length[";
  if (val.m_content_length)
  {
    os << *val.m_content_length;
  }
  else
  {
    os << "unknown";
  }
  return os << ']';
}

} // namespace bstream::stream
