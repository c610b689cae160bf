// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xbelscrub, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <xbelscrub/filter/filter_error.hpp>
#include <xbelscrub/parsers/xml.hpp>
#include <xbelscrub/util/utf8.hpp>

#include <algorithm>
#include <array>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace xbelscrub
{
namespace filter
{
/// \brief Ordered, immutable set of path prefixes. A path matches when it starts with any
/// prefix as a plain string, so "/home/a" also matches "/home/abc".
class PathPrefixSet
{
public:
  PathPrefixSet() = default;
  explicit PathPrefixSet(std::vector<std::string> prefixes) : _prefixes(std::move(prefixes)) {}

  bool matches(std::string_view path) const
  {
    return std::any_of(_prefixes.begin(), _prefixes.end(), [path](const std::string &prefix)
                       { return path.substr(0, prefix.size()) == prefix; });
  }

  bool empty() const { return _prefixes.empty(); }
  std::size_t size() const { return _prefixes.size(); }
  const std::vector<std::string> &prefixes() const { return _prefixes; }

private:
  std::vector<std::string> _prefixes;
};

/// \brief Where a bookmark href points.
enum class UriKind
{
  Local,   ///< file:// URI; path holds the decoded local path
  NonLocal ///< recognized remote or virtual scheme, never removed
};

struct UriClass
{
  UriKind kind{UriKind::NonLocal};
  std::string path;
};

/// \brief Decodes and classifies bookmark href values.
class UriClassifier
{
public:
  static constexpr std::string_view FileScheme{"file://"};

  /// Schemes that are recognized but never refer to a local path.
  static constexpr std::array<std::string_view, 4> NonLocalSchemes{"trash://", "mtp://",
                                                                   "ftp://", "sftp://"};

  /// \brief Decode %XY triplets. A '%' not followed by two hex digits is kept as is.
  /// The result is raw bytes and may not be valid UTF-8.
  static std::string percentDecode(std::string_view in)
  {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i)
    {
      if (in[i] == '%' && i + 2 < in.size() && hexValue(in[i + 1]) >= 0 &&
          hexValue(in[i + 2]) >= 0)
      {
        out.push_back(static_cast<char>((hexValue(in[i + 1]) << 4) | hexValue(in[i + 2])));
        i += 2;
      }
      else
      {
        out.push_back(in[i]);
      }
    }
    return out;
  }

  /// \brief Percent-decode then convert to UTF-8, replacing invalid sequences with U+FFFD.
  static std::string decodeHref(std::string_view rawHref)
  {
    return util::utf8::decodeLossy(percentDecode(rawHref));
  }

  /// \brief Returns the raw value of the single href attribute of a bookmark tag.
  /// \throws FilterError(MissingOrAmbiguousHref) when there are zero or several.
  static std::string_view hrefAttribute(const parsers::xml::Token &tok)
  {
    auto values = tok.attributeValues("href");
    if (values.size() != 1)
    {
      throw FilterError(FilterErrorCode::MissingOrAmbiguousHref,
                        "bookmark at line " + std::to_string(tok.line) + " has " +
                          std::to_string(values.size()) + " href attributes, expected 1");
    }
    return values.front();
  }

  /// \brief Classify a raw (still percent-encoded) href value.
  /// \throws FilterError(UnrecognizedScheme) for schemes outside the allow-list.
  static UriClass classify(std::string_view rawHref)
  {
    std::string href = decodeHref(rawHref);
    std::string_view view(href);

    if (startsWith(view, FileScheme))
    {
      return UriClass{UriKind::Local, std::string(view.substr(FileScheme.size()))};
    }
    for (auto scheme : NonLocalSchemes)
    {
      if (startsWith(view, scheme))
      {
        return UriClass{UriKind::NonLocal, {}};
      }
    }
    throw FilterError(FilterErrorCode::UnrecognizedScheme, "href not recognized: " + href, href);
  }

  /// \brief Classify the href of a bookmark start tag.
  static UriClass classify(const parsers::xml::Token &bookmark)
  {
    return classify(hrefAttribute(bookmark));
  }

private:
  static int hexValue(char c)
  {
    if (c >= '0' && c <= '9')
      return c - '0';
    if (c >= 'a' && c <= 'f')
      return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
      return c - 'A' + 10;
    return -1;
  }

  static bool startsWith(std::string_view s, std::string_view prefix)
  {
    return s.substr(0, prefix.size()) == prefix;
  }
};

} // namespace filter
} // namespace xbelscrub
