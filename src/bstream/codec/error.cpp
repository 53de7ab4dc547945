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
#include "bstream/codec/error.hpp"
#include "bstream/util/util_fwd.hpp"

namespace bstream::codec::error
{

// Types.

/**
 * The boost.system category for errors returned by the bstream::codec module.  Its logic is reached only
 * indirectly through boost.system machinery, e.g., `err_code.message()`.
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Implements super-class API: returns a `static` string representing this `error_category`.
   * @return See above.
   */
  const char* name() const noexcept override;

  /**
   * Implements super-class API: given the integer value of a Code, returns its description.
   *
   * @param val
   *        A #Code `enum` value cast to `int`.
   * @return String describing the error.
   */
  std::string message(int val) const override;

  /**
   * The guts of the `ostream << Code` operation.
   * @param code
   *        A Code.
   * @return What would/should be printed to an `ostream` given `code`.
   */
  static util::String_view code_symbol(Code code);

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "bstream/codec";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_UNSUPPORTED_CONTENT_TYPE:
    return "Content type is not one of the serializable ones: `application/json`, `application/msgpack`, "
           "`application/x-www-form-urlencoded`.";
  case Code::S_DECOMPRESS_DATA_CORRUPT:
    return "Decompressor input is not valid data of the declared content encoding (or is truncated).";
  case Code::S_COMPRESS_FAILED:
    return "Compressor failed to process its input.";
  case Code::S_DESERIALIZE_MALFORMED:
    return "Input bytes are not a well-formed document of the declared content type.";
  case Code::S_SERIALIZE_FAILED:
    return "Value cannot be represented in the requested content type (e.g., a string is not valid UTF-8 for JSON).";

  case Code::S_END_SENTINEL:
    assert(false && "SENTINEL: Not an error.  "
                    "This Code must never be issued by an error/success-emitting API; I/O use only.");
  }
  assert(false);
  return "";
} // Category::message()

util::String_view Category::code_symbol(Code code) // Static.
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (code)
  {
  case Code::S_UNSUPPORTED_CONTENT_TYPE:
    return "UNSUPPORTED_CONTENT_TYPE";
  case Code::S_DECOMPRESS_DATA_CORRUPT:
    return "DECOMPRESS_DATA_CORRUPT";
  case Code::S_COMPRESS_FAILED:
    return "COMPRESS_FAILED";
  case Code::S_DESERIALIZE_MALFORMED:
    return "DESERIALIZE_MALFORMED";
  case Code::S_SERIALIZE_FAILED:
    return "SERIALIZE_FAILED";

  case Code::S_END_SENTINEL:
    return "END_SENTINEL";
  }
  assert(false);
  return "";
}

std::ostream& operator<<(std::ostream& os, Code val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  return os << Category::code_symbol(val);
}

std::istream& operator>>(std::istream& is, Code& val)
{
  val = flow::util::istream_to_enum(&is, Code::S_END_SENTINEL, Code::S_END_SENTINEL, true, false,
                                    Code(S_CODE_LOWEST_INT_VALUE));
  return is;
}

} // namespace bstream::codec::error
