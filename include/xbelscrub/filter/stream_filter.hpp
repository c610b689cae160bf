// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xbelscrub, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <xbelscrub/core/logger.hpp>
#include <xbelscrub/filter/filter_error.hpp>
#include <xbelscrub/filter/uri_classifier.hpp>
#include <xbelscrub/parsers/xml.hpp>
#include <xbelscrub/util/utf8.hpp>

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace xbelscrub
{
namespace filter
{
/// \brief Mutable state of one filter pass.
///
/// skipping is true from the start tag of a removed bookmark until its end tag.
/// pendingWhitespaceSwallow is set by that end tag and cleared by the next Text event.
struct FilterState
{
  bool skipping{false};
  bool pendingWhitespaceSwallow{false};
};

/// \brief Counters reported by a completed pass.
struct FilterStats
{
  std::size_t bookmarks{0};           ///< bookmark start tags seen outside skip mode
  std::size_t removed{0};             ///< bookmark subtrees dropped
  std::size_t retained{0};            ///< bookmark start tags forwarded
  std::size_t whitespaceSwallowed{0}; ///< text nodes absorbed after a removal
  std::size_t bytesWritten{0};
};

/// \brief Single-pass filter that drops bookmark elements whose file:// href decodes to a path
/// under one of the configured prefixes. Everything else is copied byte for byte.
///
/// A StreamFilter holds only configuration; each run() creates its own FilterState, so one
/// instance may be reused for several inputs.
class StreamFilter
{
public:
  static constexpr std::string_view BookmarkElement{"bookmark"};

  explicit StreamFilter(PathPrefixSet prefixes,
                        const parsers::xml::Options &options = parsers::xml::Options{})
      : _prefixes(std::move(prefixes)), _options(options)
  {
  }

  const PathPrefixSet &prefixes() const { return _prefixes; }

  /// \brief Filter in into out. out is flushed once at the end.
  /// \throws FilterError on any failure; out then holds a partial document and must be
  /// discarded by the caller.
  FilterStats run(std::istream &in, std::ostream &out) const
  {
    parsers::xml::Parser parser(in, _options);
    FilterState state;
    FilterStats stats;

    while (parser.next())
    {
      route(parser.current(), state, stats, out);
    }
    if (const parsers::xml::Error *err = parser.error())
    {
      throw FilterError(FilterErrorCode::MalformedXml,
                        "line " + std::to_string(err->line) + " column " +
                          std::to_string(err->column) + ": " + err->message);
    }

    out.flush();
    if (!out)
    {
      throw FilterError(FilterErrorCode::OutputFailure, "flushing output failed");
    }
    XBELSCRUB_LOG_DEBUG("Filter pass done: " << stats.bookmarks << " bookmarks, "
                                             << stats.removed << " removed, "
                                             << stats.retained << " retained");
    return stats;
  }

  /// \brief True when a bookmark start tag must be dropped together with its subtree.
  /// \throws FilterError for a missing/duplicate href or an unrecognized scheme.
  bool shouldRemove(const parsers::xml::Token &bookmark) const
  {
    UriClass uri = UriClassifier::classify(bookmark);
    if (uri.kind != UriKind::Local)
    {
      return false;
    }
    if (_prefixes.matches(uri.path))
    {
      XBELSCRUB_LOG_DEBUG("Removing bookmark for " << uri.path);
      return true;
    }
    XBELSCRUB_LOG_TRACE("Keeping bookmark for " << uri.path);
    return false;
  }

private:
  void route(const parsers::xml::Token &tok, FilterState &state, FilterStats &stats,
             std::ostream &out) const
  {
    using parsers::xml::TokenKind;

    if (state.skipping)
    {
      if (tok.kind == TokenKind::EndElement && tok.name == BookmarkElement)
      {
        state.skipping = false;
        state.pendingWhitespaceSwallow = true;
      }
      return;
    }

    switch (tok.kind)
    {
    case TokenKind::StartElement:
      if (tok.name == BookmarkElement)
      {
        ++stats.bookmarks;
        if (shouldRemove(tok))
        {
          ++stats.removed;
          state.skipping = true;
          return;
        }
        ++stats.retained;
      }
      write(out, tok.raw, stats);
      break;
    case TokenKind::Text:
      if (state.pendingWhitespaceSwallow)
      {
        state.pendingWhitespaceSwallow = false;
        requireWhitespace(tok);
        ++stats.whitespaceSwallowed;
        return;
      }
      write(out, tok.raw, stats);
      break;
    case TokenKind::Eof:
      break;
    default:
      write(out, tok.raw, stats);
      break;
    }
  }

  /// Text following a removed bookmark must be formatting only.
  static void requireWhitespace(const parsers::xml::Token &tok)
  {
    std::string decoded;
    parsers::xml::Error err;
    if (!parsers::xml::Parser::decodeEntities(tok.text, decoded, &err))
    {
      throw FilterError(FilterErrorCode::MalformedXml,
                        "line " + std::to_string(tok.line) + ": " + err.message);
    }
    if (!util::utf8::isAllWhitespace(decoded))
    {
      throw FilterError(FilterErrorCode::StructuralAssumptionViolated,
                        "text after removed bookmark at line " + std::to_string(tok.line) +
                          " is not whitespace",
                        util::utf8::decodeLossy(tok.text));
    }
  }

  static void write(std::ostream &out, std::string_view bytes, FilterStats &stats)
  {
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out)
    {
      throw FilterError(FilterErrorCode::OutputFailure, "writing output failed");
    }
    stats.bytesWritten += bytes.size();
  }

  PathPrefixSet _prefixes;
  parsers::xml::Options _options;
};

/// \brief Convenience wrapper: filter in into out, removing bookmarks under any of prefixes.
inline FilterStats filterStream(std::istream &in, std::ostream &out,
                                const std::vector<std::string> &prefixes)
{
  return StreamFilter(PathPrefixSet(prefixes)).run(in, out);
}

} // namespace filter
} // namespace xbelscrub
