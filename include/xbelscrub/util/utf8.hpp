// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xbelscrub, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace xbelscrub
{
namespace util
{
namespace utf8
{
/// \brief U+FFFD encoded as UTF-8.
inline constexpr std::string_view ReplacementCharacter{"\xEF\xBF\xBD"};

/// \brief Append a code point to out as UTF-8. Returns false for surrogates
/// and values above U+10FFFF.
inline bool append(std::uint32_t cp, std::string &out)
{
  if (cp <= 0x7Fu)
  {
    out.push_back(static_cast<char>(cp));
  }
  else if (cp <= 0x7FFu)
  {
    out.push_back(static_cast<char>(0xC0u | ((cp >> 6) & 0x1Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  }
  else if (cp <= 0xFFFFu)
  {
    if (cp >= 0xD800u && cp <= 0xDFFFu)
    {
      return false;
    }
    out.push_back(static_cast<char>(0xE0u | ((cp >> 12) & 0x0Fu)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  }
  else if (cp <= 0x10FFFFu)
  {
    out.push_back(static_cast<char>(0xF0u | ((cp >> 18) & 0x07u)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  }
  else
  {
    return false;
  }
  return true;
}

/// \brief Decode one code point starting at in[pos].
///
/// On success stores the code point, advances pos past the sequence and
/// returns true. On an ill-formed sequence advances pos past the maximal
/// invalid subpart (at least one byte) and returns false, so that a caller
/// substituting one replacement character per failure matches the WHATWG
/// decoder.
inline bool next(std::string_view in, std::size_t &pos, std::uint32_t &cp)
{
  const auto byteAt = [&in](std::size_t i) { return static_cast<unsigned char>(in[i]); };

  unsigned char lead = byteAt(pos);
  if (lead < 0x80u)
  {
    cp = lead;
    ++pos;
    return true;
  }

  std::size_t need = 0;
  unsigned char lower = 0x80u;
  unsigned char upper = 0xBFu;
  if (lead >= 0xC2u && lead <= 0xDFu)
  {
    need = 1;
    cp = lead & 0x1Fu;
  }
  else if (lead >= 0xE0u && lead <= 0xEFu)
  {
    need = 2;
    cp = lead & 0x0Fu;
    if (lead == 0xE0u)
    {
      lower = 0xA0u;
    }
    else if (lead == 0xEDu)
    {
      upper = 0x9Fu;
    }
  }
  else if (lead >= 0xF0u && lead <= 0xF4u)
  {
    need = 3;
    cp = lead & 0x07u;
    if (lead == 0xF0u)
    {
      lower = 0x90u;
    }
    else if (lead == 0xF4u)
    {
      upper = 0x8Fu;
    }
  }
  else
  {
    ++pos;
    return false;
  }

  ++pos;
  for (std::size_t i = 0; i < need; ++i)
  {
    if (pos >= in.size())
    {
      return false;
    }
    unsigned char b = byteAt(pos);
    if (b < lower || b > upper)
    {
      return false;
    }
    lower = 0x80u;
    upper = 0xBFu;
    cp = (cp << 6) | (b & 0x3Fu);
    ++pos;
  }
  return true;
}

/// \brief Convert arbitrary bytes to valid UTF-8, replacing each ill-formed
/// sequence with U+FFFD.
inline std::string decodeLossy(std::string_view in)
{
  std::string out;
  out.reserve(in.size());
  std::size_t pos = 0;
  while (pos < in.size())
  {
    std::size_t start = pos;
    std::uint32_t cp = 0;
    if (next(in, pos, cp))
    {
      out.append(in.substr(start, pos - start));
    }
    else
    {
      out.append(ReplacementCharacter);
    }
  }
  return out;
}

/// \brief Unicode White_Space property.
inline bool isWhitespace(std::uint32_t cp)
{
  switch (cp)
  {
  case 0x09:
  case 0x0A:
  case 0x0B:
  case 0x0C:
  case 0x0D:
  case 0x20:
  case 0x85:
  case 0xA0:
  case 0x1680:
  case 0x2028:
  case 0x2029:
  case 0x202F:
  case 0x205F:
  case 0x3000:
    return true;
  default:
    return cp >= 0x2000 && cp <= 0x200A;
  }
}

/// \brief True when every code point of a UTF-8 string is whitespace. Any
/// ill-formed sequence counts as non-whitespace.
inline bool isAllWhitespace(std::string_view in)
{
  std::size_t pos = 0;
  while (pos < in.size())
  {
    std::uint32_t cp = 0;
    if (!next(in, pos, cp) || !isWhitespace(cp))
    {
      return false;
    }
  }
  return true;
}

} // namespace utf8
} // namespace util
} // namespace xbelscrub
