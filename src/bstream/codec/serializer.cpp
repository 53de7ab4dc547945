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
#include <flow/error/error.hpp>

namespace bstream::codec
{

namespace
{

/// The supported document formats, in the order of the content types in serializer.hpp.
enum class Format
{
  S_JSON,
  S_MSGPACK,
  S_FORM_URLENCODED,
  S_END_SENTINEL
};

/**
 * Maps a MIME essence to its Format; Format::S_END_SENTINEL if unsupported.
 * @param content_type
 *        MIME essence.
 * @return See above.
 */
Format format_of(util::String_view content_type)
{
  if (content_type == "application/json")
  {
    return Format::S_JSON;
  }
  if (content_type == "application/msgpack")
  {
    return Format::S_MSGPACK;
  }
  if (content_type == "application/x-www-form-urlencoded")
  {
    return Format::S_FORM_URLENCODED;
  }
  return Format::S_END_SENTINEL;
}

} // namespace (anon)

bool serializable_content_type(util::String_view content_type)
{
  return format_of(content_type) != Format::S_END_SENTINEL;
}

util::Chunk serialize(flow::log::Logger* logger_ptr, util::String_view content_type, const Value& value,
                      Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(util::Chunk, serialize, logger_ptr, content_type,
                                     flow::util::bind_ns::cref(value), _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_CODEC);

  const auto format = format_of(content_type);
  if (format == Format::S_END_SENTINEL)
  {
    FLOW_LOG_WARNING("Cannot serialize to content type [" << content_type << "]: unsupported.");
    *err_code = error::Code::S_UNSUPPORTED_CONTENT_TYPE;
    return util::Chunk();
  }
  // else

  util::Chunk bytes;
  try
  {
    switch (format)
    {
    case Format::S_JSON:
    {
      const auto text = value.dump();
      bytes.assign(text.begin(), text.end());
      break;
    }
    case Format::S_MSGPACK:
    {
      const auto packed = Value::to_msgpack(value);
      bytes.assign(packed.begin(), packed.end());
      break;
    }
    case Format::S_FORM_URLENCODED:
    {
      const auto text = form_urlencode(value);
      bytes.assign(text.begin(), text.end());
      break;
    }
    case Format::S_END_SENTINEL:
      assert(false && "Handled above.");
    }
  }
  catch (const nlohmann::json::exception& exc)
  {
    FLOW_LOG_WARNING("Cannot serialize document to content type [" << content_type << "]: "
                     "[" << exc.what() << "].");
    *err_code = error::Code::S_SERIALIZE_FAILED;
    return util::Chunk();
  }

  FLOW_LOG_TRACE("Serialized document to [" << bytes.size() << "] bytes of content type [" << content_type << "].");
  err_code->clear();
  return bytes;
} // serialize()

Value deserialize(flow::log::Logger* logger_ptr, util::String_view content_type, const util::Blob_const& bytes,
                  Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Value, deserialize, logger_ptr, content_type, bytes, _1);

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_CODEC);

  const auto format = format_of(content_type);
  if (format == Format::S_END_SENTINEL)
  {
    FLOW_LOG_WARNING("Cannot deserialize content type [" << content_type << "]: unsupported.");
    *err_code = error::Code::S_UNSUPPORTED_CONTENT_TYPE;
    return Value();
  }
  // else

  const auto first = util::blob_data(bytes);
  const auto last = first + bytes.size();

  Value value;
  switch (format)
  {
  case Format::S_JSON:
    value = Value::parse(first, last, nullptr, false); // No exceptions: `discarded` on error.
    break;
  case Format::S_MSGPACK:
    value = Value::from_msgpack(first, last, true, false); // Ditto.
    break;
  case Format::S_FORM_URLENCODED:
    value = form_urldecode(util::String_view(reinterpret_cast<const char*>(first), bytes.size()));
    break;
  case Format::S_END_SENTINEL:
    assert(false && "Handled above.");
  }

  if (value.is_discarded())
  {
    FLOW_LOG_WARNING("Cannot deserialize [" << bytes.size() << "] bytes: not a well-formed document of content type "
                     "[" << content_type << "].");
    *err_code = error::Code::S_DESERIALIZE_MALFORMED;
    return Value();
  }
  // else

  FLOW_LOG_TRACE("Deserialized [" << bytes.size() << "] bytes of content type [" << content_type << "].");
  err_code->clear();
  return value;
} // deserialize()

} // namespace bstream::codec
