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
#pragma once

#include "bstream/codec/codec_fwd.hpp"

namespace bstream::codec
{

// Free functions.

/**
 * Encodes a document as `application/x-www-form-urlencoded` text.  See serializer.hpp for the exact rules.
 *
 * @param value
 *        Document; a non-object encodes to empty text.
 * @return See above.
 */
std::string form_urlencode(const Value& value);

/**
 * Decodes `application/x-www-form-urlencoded` text into an object of strings (and arrays of strings).  Never fails:
 * malformed escapes are kept literally.  See serializer.hpp for the exact rules.
 *
 * @param text
 *        Input.
 * @return An object (possibly empty).
 */
Value form_urldecode(util::String_view text);

/**
 * Percent-escapes `text`, keeping only `A-Z a-z 0-9 - _ . ! ~ * ' ( )` as-is.
 *
 * @param text
 *        Input (any bytes; UTF-8 is escaped byte by byte).
 * @return See above.
 */
std::string form_escape(util::String_view text);

/**
 * Reverse of form_escape(), additionally mapping `+` to space.
 *
 * @param text
 *        Input.
 * @return See above.
 */
std::string form_unescape(util::String_view text);

} // namespace bstream::codec
