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
#include "bstream/codec/codec_fwd.hpp"

namespace bstream::codec
{

bool content_encoding_from_token(util::String_view token, Content_encoding* encoding)
{
  for (auto candidate = Content_encoding::S_IDENTITY; candidate != Content_encoding::S_END_SENTINEL;
       candidate = Content_encoding(int(candidate) + 1))
  {
    if (token == content_encoding_token(candidate))
    {
      *encoding = candidate;
      return true;
    }
  }
  return false;
}

util::String_view content_encoding_token(Content_encoding encoding)
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (encoding)
  {
  case Content_encoding::S_IDENTITY:
    return "identity";
  case Content_encoding::S_GZIP:
    return "gzip";
  case Content_encoding::S_DEFLATE:
    return "deflate";

  case Content_encoding::S_END_SENTINEL:
    return "END_SENTINEL";
  }
  assert(false);
  return "";
}

std::ostream& operator<<(std::ostream& os, Content_encoding val)
{
  return os << content_encoding_token(val);
}

std::istream& operator>>(std::istream& is, Content_encoding& val)
{
  val = flow::util::istream_to_enum(&is, Content_encoding::S_END_SENTINEL, Content_encoding::S_END_SENTINEL,
                                    true, false, Content_encoding::S_IDENTITY);
  return is;
}

} // namespace bstream::codec
