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
#include "bstream/error.hpp"
#include "bstream/util/util_fwd.hpp"

namespace bstream::error
{

// Types.

/**
 * The boost.system category for errors returned by Bstream outside the codec module.  Think of it as the polymorphic
 * counterpart of error::Code, and it kicks in when, for `Error_code ec`, something
 * like `ec.message()` is invoked.
 *
 * Note that this class's declaration is not available outside this translation unit (.cpp
 * file), and its logic is accessed indirectly through standard boost.system machinery.
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
   * @return A `static` string that's a brief description of this error category.
   */
  const char* name() const noexcept override;

  /**
   * Implements super-class API: given the integer error code of an error in this category, returns a description of
   * that error (similarly in spirit to `std::strerror()`).
   *
   * @param val
   *        Error code of a Category error (realistically, a #Code `enum` value cast to `int`).
   * @return String describing the error.
   */
  std::string message(int val) const override;

  /**
   * The guts of the `ostream << Code` operation: outputs, e.g., Code::S_TOO_LARGE => `"TOO_LARGE"`.
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

bool is_stream_fault(const Error_code& err_code)
{
  if (err_code.category() != Category::S_CATEGORY)
  {
    return false;
  }
  // else

  switch (static_cast<Code>(err_code.value()))
  {
  case Code::S_TOO_LARGE:
  case Code::S_TIMED_OUT:
  case Code::S_UNEXPECTED:
  case Code::S_MULTIPLE_SOURCES:
    return true;
  default:
    return false;
  }
} // is_stream_fault()

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "bstream";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_TOO_LARGE:
    return "Stream fault: observed byte count, or declared content length, exceeds the stream's byte limit.";
  case Code::S_TIMED_OUT:
    return "Stream fault: no data arrived for longer than the stream's inactivity timeout.";
  case Code::S_UNEXPECTED:
    return "Stream fault: an underlying, non-stream-specific failure occurred; the original error is kept as "
           "its cause.";
  case Code::S_MULTIPLE_SOURCES:
    return "Stream fault: a second producer attempted to feed a stream that already has one.";
  case Code::S_INVALID_CONTENT_TYPE:
    return "Construction fault: content type is not of the form "
           "`<application|audio|image|multipart|text|video>/<subtype>`.";
  case Code::S_INVALID_CONTENT_ENCODING:
    return "Construction fault: content encoding is not one of `identity`, `gzip`, `deflate`.";
  case Code::S_INVALID_CONTENT_LENGTH:
    return "Construction fault: declared content length must be positive if specified.";
  case Code::S_INVALID_LIMIT:
    return "Construction fault: byte limit must be positive.";
  case Code::S_INVALID_TIMER_PERIODS:
    return "Construction fault: timer periods must be non-negative, and check interval must not exceed timeout.";
  case Code::S_TIMER_DESTROYED:
    return "Inactivity timer has already been destroyed or has already fired; it cannot record further activity.";
  case Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER:
    return "Async completion handler is being called prematurely, because underlying object is shutting down, "
           "as user desires.";

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
  case Code::S_TOO_LARGE:
    return "TOO_LARGE";
  case Code::S_TIMED_OUT:
    return "TIMED_OUT";
  case Code::S_UNEXPECTED:
    return "UNEXPECTED";
  case Code::S_MULTIPLE_SOURCES:
    return "MULTIPLE_SOURCES";
  case Code::S_INVALID_CONTENT_TYPE:
    return "INVALID_CONTENT_TYPE";
  case Code::S_INVALID_CONTENT_ENCODING:
    return "INVALID_CONTENT_ENCODING";
  case Code::S_INVALID_CONTENT_LENGTH:
    return "INVALID_CONTENT_LENGTH";
  case Code::S_INVALID_LIMIT:
    return "INVALID_LIMIT";
  case Code::S_INVALID_TIMER_PERIODS:
    return "INVALID_TIMER_PERIODS";
  case Code::S_TIMER_DESTROYED:
    return "TIMER_DESTROYED";
  case Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER:
    return "OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER";

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
  /* Range [<1st Code>, END_SENTINEL); no match => END_SENTINEL;
   * allow for number instead of ostream<< string; case-insensitive. */
  val = flow::util::istream_to_enum(&is, Code::S_END_SENTINEL, Code::S_END_SENTINEL, true, false,
                                    Code(S_CODE_LOWEST_INT_VALUE));
  return is;
}

} // namespace bstream::error
