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
#include "bstream/codec/detail/form_urlencoded.hpp"
#include <cmath>

namespace bstream::codec
{

namespace
{

/**
 * Returns value of hex digit, or -1 if not one.
 * @param ch
 *        Character.
 * @return See above.
 */
int hex_digit_value(char ch)
{
  if ((ch >= '0') && (ch <= '9'))
  {
    return ch - '0';
  }
  if ((ch >= 'a') && (ch <= 'f'))
  {
    return ch - 'a' + 10;
  }
  if ((ch >= 'A') && (ch <= 'F'))
  {
    return ch - 'A' + 10;
  }
  return -1;
}

/**
 * Whether `ch` is emitted unescaped.
 * @param ch
 *        Character.
 * @return See above.
 */
bool unreserved(char ch)
{
  return ((ch >= 'A') && (ch <= 'Z')) || ((ch >= 'a') && (ch <= 'z')) || ((ch >= '0') && (ch <= '9'))
         || (ch == '-') || (ch == '_') || (ch == '.') || (ch == '!') || (ch == '~') || (ch == '*')
         || (ch == '\'') || (ch == '(') || (ch == ')');
}

/**
 * Text of a scalar member value; empty for null and objects.
 * @param value
 *        Member value (not an array).
 * @return See above.
 */
std::string scalar_text(const Value& value)
{
  if (value.is_string())
  {
    return value.get<std::string>();
  }
  if (value.is_boolean())
  {
    return value.get<bool>() ? "true" : "false";
  }
  if (value.is_number())
  {
    if (value.is_number_float() && (!std::isfinite(value.get<double>())))
    {
      return std::string();
    }
    // else
    return value.dump();
  }
  return std::string();
}

} // namespace (anon)

std::string form_escape(util::String_view text)
{
  static const char S_HEX[] = "0123456789ABCDEF";

  std::string escaped;
  escaped.reserve(text.size());
  for (const char ch : text)
  {
    if (unreserved(ch))
    {
      escaped += ch;
    }
    else
    {
      const auto byte = static_cast<uint8_t>(ch);
      escaped += '%';
      escaped += S_HEX[byte >> 4];
      escaped += S_HEX[byte & 0x0F];
    }
  }
  return escaped;
}

std::string form_unescape(util::String_view text)
{
  std::string plain;
  plain.reserve(text.size());
  for (size_t idx = 0; idx != text.size(); ++idx)
  {
    const char ch = text[idx];
    if (ch == '+')
    {
      plain += ' ';
      continue;
    }
    // else
    if ((ch == '%') && ((idx + 2) < text.size()))
    {
      const int high = hex_digit_value(text[idx + 1]);
      const int low = hex_digit_value(text[idx + 2]);
      if ((high >= 0) && (low >= 0))
      {
        plain += static_cast<char>((high << 4) | low);
        idx += 2;
        continue;
      }
    }
    // else: not an escape, or a malformed one: keep literally.
    plain += ch;
  }
  return plain;
} // form_unescape()

std::string form_urlencode(const Value& value)
{
  std::string text;
  if (!value.is_object())
  {
    return text;
  }
  // else

  const auto append_pair = [&](const std::string& key, const std::string& val)
  {
    if (!text.empty())
    {
      text += '&';
    }
    text += key;
    text += '=';
    text += form_escape(val);
  };

  for (const auto& member : value.items())
  {
    const auto key = form_escape(member.key());
    const auto& member_val = member.value();
    if (member_val.is_array())
    {
      for (const auto& element : member_val)
      {
        append_pair(key, scalar_text(element));
      }
    }
    else
    {
      append_pair(key, scalar_text(member_val));
    }
  }
  return text;
} // form_urlencode()

Value form_urldecode(util::String_view text)
{
  auto result = Value::object();

  size_t pos = 0;
  while (pos <= text.size())
  {
    auto end = text.find('&', pos);
    if (end == util::String_view::npos)
    {
      end = text.size();
    }
    const auto pair = text.substr(pos, end - pos);
    pos = end + 1;

    if (pair.empty())
    {
      continue;
    }
    // else

    const auto eq = pair.find('=');
    const auto key = form_unescape(pair.substr(0, eq));
    const auto val = (eq == util::String_view::npos) ? std::string() : form_unescape(pair.substr(eq + 1));

    auto existing = result.find(key);
    if (existing == result.end())
    {
      result[key] = val;
    }
    else if (existing->is_array())
    {
      existing->push_back(val);
    }
    else
    {
      *existing = Value::array({ *existing, val });
    }
  }
  return result;
} // form_urldecode()

} // namespace bstream::codec
