#pragma once
/// \file xml.hpp
/// \brief Non-validating, lossless XML 1.0 pull tokenizer for C++17.
///
/// Design goals:
///  - Header-only, zero external deps
///  - Streaming: reads a std::istream in chunks, memory bounded by the largest token
///  - Lossless: every token exposes the exact source bytes it was lexed from (Token::raw),
///    and whitespace between markup is reported as Text, so concatenating the raw bytes of
///    all tokens reproduces the input
///  - Byte-oriented: names and values are slices of the input, never transcoded
///  - Non-validating (no DTD/XSD); predefined entities + numeric char refs only
///
/// Example (pull API):
/// \code
/// std::ifstream in("recently-used.xbel", std::ios::binary);
/// xbelscrub::parsers::xml::Parser parser(in);
/// while (parser.next())
/// {
///   const auto &tok = parser.current();
///   out << tok.raw;
/// }
/// if (parser.error()) { /* handle */ }
/// \endcode
///
/// SPDX-License-Identifier: MPL-2.0

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <xbelscrub/util/utf8.hpp>

namespace xbelscrub
{
namespace parsers
{
namespace xml
{
/// \brief Token kinds produced by the pull parser.
enum class TokenKind
{
  Invalid,
  Eof,
  XmlDecl,
  Doctype,
  StartElement,
  EndElement,
  EmptyElement,
  Text,
  CData,
  Comment,
  ProcessingInstruction
};

/// \brief Error information for parse failures.
struct Error
{
  std::size_t offset{0};
  std::size_t line{1};
  std::size_t column{1};
  std::string message;
};

/// \brief Parser configuration options and safety limits.
struct Options
{
  std::size_t maxDepth{256};           ///< Max element nesting depth
  std::size_t maxAttrsPerElement{256}; ///< Max attributes per element
  std::size_t maxNameLength{1024};     ///< Max length of element or attribute names
  std::size_t maxTextSpan{1u << 20};   ///< Max contiguous text span in bytes (1 MiB)
  std::size_t readChunkSize{1u << 16}; ///< Bytes requested from the stream per read (64 KiB)
};

/// \brief Attribute view (name/value) for tokens. Values are raw source slices; use
/// Parser::decodeEntities() for entity-decoded strings.
struct Attribute
{
  std::string_view name;
  std::string_view value;
};

/// \brief Token produced by the pull parser. All views are invalidated by the next call to
/// Parser::next().
struct Token
{
  TokenKind kind{TokenKind::Invalid};
  std::string_view raw;              ///< Exact source bytes of the token
  std::string_view name;             ///< For elements/PI/decl: raw name or target
  std::string_view text;             ///< For Text/Comment/CData/PI/Doctype: raw content
  std::vector<Attribute> attributes; ///< For StartElement/EmptyElement and XmlDecl
  bool selfClosing{false};           ///< For EmptyElement convenience
  std::size_t depth{0};              ///< Element depth at this token (root element has depth 1)
  std::size_t offset{0};             ///< Byte offset of token start in the whole input
  std::size_t line{1};
  std::size_t column{1};

  /// \brief Returns the prefix and localName split from name (no URI resolution).
  std::pair<std::string_view, std::string_view> splitQName() const
  {
    std::size_t pos = name.find(':');
    if (pos == std::string_view::npos)
    {
      return {std::string_view{}, name};
    }
    return {name.substr(0, pos), name.substr(pos + 1)};
  }

  /// \brief Returns every attribute whose name equals attrName, in document order.
  std::vector<std::string_view> attributeValues(std::string_view attrName) const
  {
    std::vector<std::string_view> values;
    for (const auto &a : attributes)
    {
      if (a.name == attrName)
      {
        values.push_back(a.value);
      }
    }
    return values;
  }
};

/// \brief Parser: non-validating XML tokenizer with pull API over a buffer or a stream.
class Parser
{
public:
  /// \brief Construct a parser over an in-memory buffer. The bytes are copied.
  explicit Parser(std::string_view input, const Options &opt = Options{})
      : _opt(opt), _buf(input)
  {
  }

  /// \brief Construct a parser that pulls bytes from a stream on demand. The stream must
  /// outlive the parser.
  explicit Parser(std::istream &input, const Options &opt = Options{})
      : _opt(opt), _stream(&input)
  {
    if (_opt.readChunkSize == 0)
    {
      _opt.readChunkSize = 1;
    }
  }

  Parser(const Parser &) = delete;
  Parser &operator=(const Parser &) = delete;

  /// \brief Returns the current token after a successful next().
  const Token &current() const { return _token; }

  /// \brief Returns last error pointer if any (nullptr if none).
  const Error *error() const { return _hasError ? &_error : nullptr; }

  /// \brief Total bytes consumed so far.
  std::size_t position() const { return _base + _cur; }

  /// \brief Advance to the next token. Returns false on error or when EOF has been emitted.
  /// After a false return current().kind is Eof on a clean end of input.
  bool next()
  {
    if (_hasError || _emittedEof)
    {
      return false;
    }

    compact();

    if (eof())
    {
      emitEof();
      return false;
    }

    const std::size_t start = _cur;
    const std::size_t startLine = _line;
    const std::size_t startCol = _col;

    if (peek() != '<')
    {
      return readText(start, startLine, startCol);
    }

    advance();
    if (eof())
    {
      return fail("unexpected end after '<'");
    }
    char n = peek();
    if (n == '?')
    {
      advance();
      return readProcessingInstruction(start, startLine, startCol);
    }
    if (n == '!')
    {
      advance();
      if (matchString("--"))
      {
        return readComment(start, startLine, startCol);
      }
      if (matchString("[CDATA["))
      {
        return readCData(start, startLine, startCol);
      }
      if (matchWordCaseInsensitive("DOCTYPE"))
      {
        return readDoctype(start, startLine, startCol);
      }
      return fail("unsupported markup declaration");
    }
    if (n == '/')
    {
      advance();
      return readEndTag(start, startLine, startCol);
    }
    return readStartOrEmptyTag(start, startLine, startCol);
  }

  /// \brief Decode predefined entities and numeric char refs in a slice.
  static bool decodeEntities(std::string_view in, std::string &out, Error *err = nullptr)
  {
    out.clear();
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size();)
    {
      char ch = in[i];
      if (ch != '&')
      {
        out.push_back(ch);
        ++i;
        continue;
      }
      std::size_t semi = in.find(';', i + 1);
      if (semi == std::string_view::npos)
      {
        if (err)
        {
          *err = {i, 0, 0, "unterminated entity"};
        }
        return false;
      }
      std::string_view ent = in.substr(i + 1, semi - (i + 1));
      if (ent == "lt")
        out.push_back('<');
      else if (ent == "gt")
        out.push_back('>');
      else if (ent == "amp")
        out.push_back('&');
      else if (ent == "apos")
        out.push_back('\'');
      else if (ent == "quot")
        out.push_back('"');
      else if (!ent.empty() && ent[0] == '#')
      {
        if (!appendCharRef(ent, out))
        {
          if (err)
          {
            *err = {i, 0, 0, "invalid character reference"};
          }
          return false;
        }
      }
      else
      {
        if (err)
        {
          *err = {i, 0, 0, "unknown entity"};
        }
        return false; // external entities are not resolved
      }
      i = semi + 1;
    }
    return true;
  }

private:
  /// Index pair into _buf; converted to views once a token is complete because reading
  /// more input may reallocate the buffer.
  struct Span
  {
    std::size_t pos{0};
    std::size_t len{0};
  };

  // ===== Buffer management =====

  /// Drop consumed bytes once at least one chunk has been consumed. Only called between
  /// tokens, so the previous token's views die here.
  void compact()
  {
    if (_stream == nullptr || _cur < _opt.readChunkSize)
    {
      return;
    }
    _buf.erase(0, _cur);
    _base += _cur;
    _cur = 0;
  }

  /// Append the next chunk of the stream to the buffer. Returns false when nothing was read.
  bool fill()
  {
    if (_stream == nullptr || _streamDone)
    {
      return false;
    }
    std::size_t old = _buf.size();
    _buf.resize(old + _opt.readChunkSize);
    _stream->read(&_buf[old], static_cast<std::streamsize>(_opt.readChunkSize));
    std::size_t got = static_cast<std::size_t>(_stream->gcount());
    _buf.resize(old + got);
    if (got < _opt.readChunkSize)
    {
      _streamDone = true;
      if (_stream->bad())
      {
        _streamFailed = true;
      }
    }
    return got > 0;
  }

  /// Ensure _buf[pos] exists, reading more input as needed.
  bool available(std::size_t pos)
  {
    while (pos >= _buf.size())
    {
      if (!fill())
      {
        return false;
      }
    }
    return true;
  }

  /// Find seq at or after from, reading more input as needed.
  std::size_t find(std::string_view seq, std::size_t from)
  {
    while (true)
    {
      std::size_t pos = _buf.find(seq.data(), from, seq.size());
      if (pos != std::string::npos)
      {
        return pos;
      }
      if (_buf.size() >= seq.size())
      {
        from = std::max(from, _buf.size() - seq.size() + 1);
      }
      if (!fill())
      {
        return std::string::npos;
      }
    }
  }

  std::string_view view(Span s) const { return std::string_view(_buf).substr(s.pos, s.len); }

  // ===== Low-level cursor helpers =====
  bool eof() { return !available(_cur); }

  char peek() const { return _buf[_cur]; }

  char get()
  {
    char ch = _buf[_cur++];
    if (ch == '\n')
    {
      ++_line;
      _col = 1;
    }
    else
    {
      ++_col;
    }
    return ch;
  }

  void advance() { (void)get(); }

  void advanceTo(std::size_t pos)
  {
    while (_cur < pos)
    {
      advance();
    }
  }

  static bool isNameStart(char ch)
  {
    unsigned char u = static_cast<unsigned char>(ch);
    return (ch == ':' || ch == '_' || (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') ||
            u >= 0x80u);
  }

  static bool isNameChar(char ch)
  {
    return isNameStart(ch) || (ch == '-' || ch == '.' || (ch >= '0' && ch <= '9'));
  }

  static bool isSpace(char ch) { return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n'; }

  void skipSpaces()
  {
    while (!eof() && isSpace(peek()))
    {
      advance();
    }
  }

  bool matchString(std::string_view s)
  {
    for (std::size_t i = 0; i < s.size(); ++i)
    {
      if (!available(_cur + i) || _buf[_cur + i] != s[i])
      {
        return false;
      }
    }
    advanceTo(_cur + s.size());
    return true;
  }

  bool matchWordCaseInsensitive(std::string_view s)
  {
    // Matches a word ignoring ASCII case, requires a following whitespace or '>' or '['
    const auto lower = [](char c) -> char
    { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c; };
    for (std::size_t i = 0; i < s.size(); ++i)
    {
      if (!available(_cur + i) || lower(_buf[_cur + i]) != lower(s[i]))
      {
        return false;
      }
    }
    if (!available(_cur + s.size()))
    {
      return false;
    }
    char next = _buf[_cur + s.size()];
    if (!(isSpace(next) || next == '>' || next == '['))
    {
      return false;
    }
    advanceTo(_cur + s.size());
    return true;
  }

  Span readName()
  {
    Span span{_cur, 0};
    if (eof() || !isNameStart(peek()))
    {
      return span;
    }
    advance();
    while (!eof() && isNameChar(peek()))
    {
      advance();
    }
    span.len = _cur - span.pos;
    if (span.len > _opt.maxNameLength)
    {
      fail("name too long");
      span.len = 0;
    }
    return span;
  }

  bool readQuotedValue(Span &out)
  {
    if (eof())
    {
      return fail("expected quote");
    }
    char quote = peek();
    if (quote != '"' && quote != '\'')
    {
      return fail("expected '\"' or '\'' for attribute value");
    }
    advance();
    std::size_t start = _cur;
    while (!eof() && peek() != quote)
    {
      if (_cur - start >= _opt.maxTextSpan)
      {
        return fail("attribute value too long");
      }
      advance();
    }
    if (eof())
    {
      return fail("unterminated attribute value");
    }
    out = Span{start, _cur - start};
    advance(); // closing quote
    return true;
  }

  /// Reads name="value" pairs until one of the terminator characters is next.
  bool readAttributes(std::string_view terminators)
  {
    _attrSpans.clear();
    while (true)
    {
      skipSpaces();
      if (eof())
      {
        return fail("unexpected end in attributes");
      }
      if (terminators.find(peek()) != std::string_view::npos)
      {
        return true;
      }
      Span name = readName();
      if (name.len == 0)
      {
        return _hasError ? false : fail("invalid attribute name");
      }
      skipSpaces();
      if (eof() || peek() != '=')
      {
        return fail("expected '=' after attribute name");
      }
      advance();
      skipSpaces();
      Span value;
      if (!readQuotedValue(value))
      {
        return false;
      }
      _attrSpans.emplace_back(name, value);
      if (_attrSpans.size() > _opt.maxAttrsPerElement)
      {
        return fail("too many attributes");
      }
    }
  }

  bool emit(TokenKind kind, std::size_t start, std::size_t line, std::size_t col, Span name,
            Span text)
  {
    _token = Token{};
    _token.kind = kind;
    _token.raw = view(Span{start, _cur - start});
    _token.name = view(name);
    _token.text = view(text);
    _token.depth = _depth;
    _token.offset = _base + start;
    _token.line = line;
    _token.column = col;
    if (kind == TokenKind::StartElement || kind == TokenKind::EmptyElement ||
        kind == TokenKind::XmlDecl)
    {
      _token.attributes.reserve(_attrSpans.size());
      for (const auto &[n, v] : _attrSpans)
      {
        _token.attributes.push_back(Attribute{view(n), view(v)});
      }
    }
    return true;
  }

  bool readProcessingInstruction(std::size_t start, std::size_t line, std::size_t col)
  {
    Span target = readName();
    if (target.len == 0)
    {
      return _hasError ? false : fail("invalid PI target");
    }

    if (view(target) == "xml")
    {
      if (_seenMarkup)
      {
        return fail("XML declaration not at start of document");
      }
      if (!readAttributes("?"))
      {
        return false;
      }
      if (!matchString("?>"))
      {
        return fail("expected '?>' to end XML declaration");
      }
      _seenMarkup = true;
      return emit(TokenKind::XmlDecl, start, line, col, target, Span{});
    }

    std::size_t contentStart = _cur;
    std::size_t pos = find("?>", _cur);
    if (pos == std::string::npos)
    {
      return fail("unterminated processing instruction");
    }
    advanceTo(pos + 2);
    _seenMarkup = true;
    return emit(TokenKind::ProcessingInstruction, start, line, col, target,
                Span{contentStart, pos - contentStart});
  }

  bool readDelimited(TokenKind kind, std::string_view endSeq, const char *unterminated,
                     std::size_t start, std::size_t line, std::size_t col)
  {
    std::size_t contentStart = _cur;
    std::size_t pos = find(endSeq, _cur);
    if (pos == std::string::npos)
    {
      return fail(unterminated);
    }
    advanceTo(pos + endSeq.size());
    _seenMarkup = true;
    return emit(kind, start, line, col, Span{}, Span{contentStart, pos - contentStart});
  }

  bool readComment(std::size_t start, std::size_t line, std::size_t col)
  {
    return readDelimited(TokenKind::Comment, "-->", "unterminated comment", start, line, col);
  }

  bool readCData(std::size_t start, std::size_t line, std::size_t col)
  {
    if (_depth == 0)
    {
      return fail("CDATA outside of root element");
    }
    return readDelimited(TokenKind::CData, "]]>", "unterminated CDATA", start, line, col);
  }

  bool readDoctype(std::size_t start, std::size_t line, std::size_t col)
  {
    // Up to the next '>' outside an internal subset
    std::size_t pos = _cur;
    int bracket = 0;
    while (available(pos))
    {
      char ch = _buf[pos];
      if (ch == '[')
      {
        ++bracket;
      }
      else if (ch == ']')
      {
        if (bracket > 0)
        {
          --bracket;
        }
      }
      else if (ch == '>' && bracket == 0)
      {
        break;
      }
      ++pos;
    }
    if (!available(pos))
    {
      return fail("unterminated doctype");
    }
    Span body{_cur, pos - _cur};
    advanceTo(pos + 1);
    _seenMarkup = true;
    return emit(TokenKind::Doctype, start, line, col, Span{}, body);
  }

  bool readEndTag(std::size_t start, std::size_t line, std::size_t col)
  {
    Span name = readName();
    if (name.len == 0)
    {
      return _hasError ? false : fail("invalid end tag name");
    }
    skipSpaces();
    if (eof() || peek() != '>')
    {
      return fail("expected '>' after end tag name");
    }
    advance();

    if (_elementStack.empty())
    {
      return fail("end tag without matching start tag");
    }
    if (_elementStack.back() != view(name))
    {
      std::string msg = "mismatched end tag - expected </" + _elementStack.back() + "> but got </" +
                        std::string(view(name)) + ">";
      return fail(msg);
    }
    _elementStack.pop_back();

    // depth at this token corresponds to the element being closed
    emit(TokenKind::EndElement, start, line, col, name, Span{});
    --_depth;
    return true;
  }

  bool readStartOrEmptyTag(std::size_t start, std::size_t line, std::size_t col)
  {
    Span name = readName();
    if (name.len == 0)
    {
      return _hasError ? false : fail("invalid start tag name");
    }
    if (!readAttributes("/>"))
    {
      return false;
    }

    bool empty = false;
    if (peek() == '/')
    {
      empty = true;
      advance();
    }
    if (eof() || peek() != '>')
    {
      return fail("expected '>' to end start tag");
    }
    advance();

    if (_depth == 0 && _seenRoot)
    {
      return fail("multiple root elements");
    }
    if (_depth + 1 > _opt.maxDepth)
    {
      return fail("maximum element depth exceeded");
    }
    _seenRoot = true;
    _seenMarkup = true;

    ++_depth;
    if (empty)
    {
      emit(TokenKind::EmptyElement, start, line, col, name, Span{});
      _token.selfClosing = true;
      --_depth;
      return true;
    }
    _elementStack.push_back(std::string(view(name)));
    return emit(TokenKind::StartElement, start, line, col, name, Span{});
  }

  bool readText(std::size_t start, std::size_t line, std::size_t col)
  {
    while (!eof() && peek() != '<')
    {
      if ((_cur - start) >= _opt.maxTextSpan)
      {
        return fail("text span too large");
      }
      advance();
    }
    Span text{start, _cur - start};
    if (_depth == 0)
    {
      std::string_view sv = view(text);
      // a UTF-8 byte order mark may open the document
      if (_base + start == 0 && sv.substr(0, 3) == "\xEF\xBB\xBF")
      {
        sv.remove_prefix(3);
      }
      if (std::any_of(sv.begin(), sv.end(), [](char c) { return !isSpace(c); }))
      {
        return fail("character data outside of root element");
      }
    }
    return emit(TokenKind::Text, start, line, col, Span{}, text);
  }

  void emitEof()
  {
    if (_streamFailed)
    {
      fail("read error on input stream");
      return;
    }
    if (!_elementStack.empty())
    {
      std::string unclosed = "unclosed elements at end of document: ";
      for (const auto &elem : _elementStack)
      {
        unclosed += "<" + elem + "> ";
      }
      fail(unclosed);
      return;
    }
    if (!_seenRoot)
    {
      fail("no root element");
      return;
    }
    _token = Token{};
    _token.kind = TokenKind::Eof;
    _token.depth = _depth;
    _token.offset = _base + _cur;
    _token.line = _line;
    _token.column = _col;
    _emittedEof = true;
  }

  bool fail(const std::string &msg)
  {
    _hasError = true;
    _error.offset = _base + _cur;
    _error.line = _line;
    _error.column = _col;
    _error.message = msg;
    _token = Token{};
    return false;
  }

  // Append a numeric char ref (e.g. "#10" or "#x1F4A9") to out as UTF-8.
  static bool appendCharRef(std::string_view entBody, std::string &out)
  {
    // entBody starts with '#'
    if (entBody.size() < 2)
    {
      return false;
    }
    std::uint32_t code = 0;
    const bool hex = entBody[1] == 'x' || entBody[1] == 'X';
    std::size_t i = hex ? 2 : 1;
    if (i >= entBody.size())
    {
      return false;
    }
    for (; i < entBody.size(); ++i)
    {
      char c = entBody[i];
      std::uint32_t v = 0;
      if (c >= '0' && c <= '9')
      {
        v = static_cast<std::uint32_t>(c - '0');
      }
      else if (hex && c >= 'a' && c <= 'f')
      {
        v = static_cast<std::uint32_t>(c - 'a' + 10);
      }
      else if (hex && c >= 'A' && c <= 'F')
      {
        v = static_cast<std::uint32_t>(c - 'A' + 10);
      }
      else
      {
        return false;
      }
      code = hex ? ((code << 4) | v) : (code * 10u + v);
      if (code > 0x10FFFFu)
      {
        return false;
      }
    }
    return util::utf8::append(code, out);
  }

private:
  Options _opt{};
  std::istream *_stream{nullptr};
  bool _streamDone{false};
  bool _streamFailed{false};

  std::string _buf;
  std::size_t _base{0}; ///< Absolute offset of _buf[0]
  std::size_t _cur{0};
  std::size_t _line{1};
  std::size_t _col{1};
  std::size_t _depth{0};

  Token _token{};
  std::vector<std::pair<Span, Span>> _attrSpans;

  bool _hasError{false};
  Error _error{};
  bool _emittedEof{false};
  bool _seenRoot{false};
  bool _seenMarkup{false};
  std::vector<std::string> _elementStack{}; // Track open element names for validation
};

} // namespace xml
} // namespace parsers
} // namespace xbelscrub
