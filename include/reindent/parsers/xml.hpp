// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Reindent, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file xml.hpp
/// \brief Non-validating XML 1.0 pull parser and DOM builder for the
/// re-serializer.
///
///  - Input is UTF-8 with line ends already normalized to LF
///  - Predefined entities and numeric character references only; no DTD
///    processing and no external entities
///  - Whitespace between markup inside elements is reported as Text so the
///    builder can decide which runs are ignorable
///
/// Example (pull API):
/// \code
/// reindent::parsers::xml::Parser parser("<root a=\"1\">hi &amp; bye</root>");
/// while (parser.next())
/// {
///   const auto &tok = parser.current();
///   if (tok.kind == reindent::parsers::xml::TokenKind::StartElement)
///   {
///     // ...
///   }
/// }
/// if (parser.error()) { /* handle */ }
/// \endcode

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace reindent
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

/// \brief Parser safety limits.
struct Options
{
  std::size_t maxDepth{256};           ///< Max element nesting depth
  std::size_t maxAttrsPerElement{256}; ///< Max attributes per element
  std::size_t maxNameLength{1024};     ///< Max length of element or attribute names
  std::size_t maxTextSpan{1u << 24};   ///< Max contiguous text span in bytes (16 MiB)
};

/// \brief Attribute view (name/value) for tokens. Values are source slices; use
/// Parser::decodeAttributeValue() for the normalized, entity-decoded string.
struct Attribute
{
  std::string_view name;
  std::string_view value;
};

/// \brief Token produced by the pull parser.
struct Token
{
  TokenKind kind{TokenKind::Invalid};
  std::string_view name;             ///< Element name or PI target
  std::string_view text;             ///< Raw slice for Text/Comment/CData/PI/Doctype
  std::vector<Attribute> attributes; ///< StartElement/EmptyElement, or XmlDecl pseudo-attributes
  bool selfClosing{false};
  std::size_t depth{0}; ///< Element depth at this token (root element has depth 1)
  std::size_t offset{0};
  std::size_t line{1};
  std::size_t column{1};
};

/// \brief True for characters allowed by the XML 1.0 Char production.
inline bool isXmlChar(std::uint32_t cp)
{
  return cp == 0x9 || cp == 0xA || cp == 0xD || (cp >= 0x20 && cp <= 0xD7FF) ||
         (cp >= 0xE000 && cp <= 0xFFFD) || (cp >= 0x10000 && cp <= 0x10FFFF);
}

inline bool isXmlSpace(char ch) { return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n'; }

/// \brief True if \p s is empty or consists of XML whitespace only.
inline bool isBlank(std::string_view s)
{
  for (char ch : s)
  {
    if (!isXmlSpace(ch))
    {
      return false;
    }
  }
  return true;
}

/// \brief Pull tokenizer over a contiguous UTF-8 buffer.
///
/// Enforces well-formedness at the document level: a single root element,
/// no character data outside it, an XML declaration only at offset 0 and a
/// DOCTYPE only before the root.
class Parser
{
public:
  explicit Parser(std::string_view input, const Options &opt = Options{})
    : _input(input), _opt(opt)
  {
  }

  /// \brief Returns the current token after a successful next().
  const Token &current() const { return _token; }

  /// \brief Returns last error pointer if any (nullptr if none).
  const Error *error() const { return _hasError ? &_error : nullptr; }

  /// \brief Advance to the next token. Returns false on error or when EOF has been emitted.
  bool next()
  {
    if (_hasError || _emittedEof)
    {
      return false;
    }
    if (!_charsChecked)
    {
      _charsChecked = true;
      if (!checkCharacters())
      {
        return false;
      }
    }

    if (_depth == 0)
    {
      skipSpaces();
    }
    if (eof())
    {
      emitEof();
      return false;
    }

    std::size_t startOffset = _cur;
    std::size_t startLine = _line;
    std::size_t startCol = _col;

    if (peek() != '<')
    {
      if (_depth == 0)
      {
        return fail(_rootClosed ? "extra content at the end of the document"
                                : "text outside the root element");
      }
      return readText(startOffset, startLine, startCol);
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
      return readProcessingInstruction(startOffset, startLine, startCol);
    }
    if (n == '!')
    {
      advance();
      if (matchString("--"))
      {
        return readComment(startOffset, startLine, startCol);
      }
      if (matchString("[CDATA["))
      {
        if (_depth == 0)
        {
          return fail("CDATA section outside the root element");
        }
        return readCData(startOffset, startLine, startCol);
      }
      if (matchString("DOCTYPE"))
      {
        return readDoctype(startOffset, startLine, startCol);
      }
      return fail("unsupported markup declaration");
    }
    if (n == '/')
    {
      advance();
      return readEndTag(startOffset, startLine, startCol);
    }
    if (_depth == 0 && _rootClosed)
    {
      return fail("extra content at the end of the document");
    }
    return readStartOrEmptyTag(startOffset, startLine, startCol);
  }

  /// \brief Decode predefined entities and numeric char refs in a slice.
  /// Error offsets are relative to \p in.
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
          *err = {i, 0, 0, "unterminated entity reference"};
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
            *err = {i, 0, 0, "invalid character reference '&" + std::string(ent) + ";'"};
          }
          return false;
        }
      }
      else
      {
        if (err)
        {
          *err = {i, 0, 0, "undefined entity '&" + std::string(ent) + ";'"};
        }
        return false;
      }
      i = semi + 1;
    }
    return true;
  }

  /// \brief Attribute-value normalization: literal TAB, CR and LF become
  /// spaces, then references are decoded (so "&#10;" survives as LF).
  static bool decodeAttributeValue(std::string_view in, std::string &out, Error *err = nullptr)
  {
    std::string normalized(in);
    for (auto &ch : normalized)
    {
      if (ch == '\t' || ch == '\n' || ch == '\r')
      {
        ch = ' ';
      }
    }
    return decodeEntities(normalized, out, err);
  }

private:
  // ===== Low-level cursor helpers =====
  bool eof() const { return _cur >= _input.size(); }

  char peek() const { return _input[_cur]; }

  char get()
  {
    char ch = _input[_cur++];
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
    return ch == ':' || ch == '_' || (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') ||
           static_cast<unsigned char>(ch) >= 0x80;
  }

  static bool isNameChar(char ch)
  {
    return isNameStart(ch) || ch == '-' || ch == '.' || (ch >= '0' && ch <= '9');
  }

  /// Returns true if at least one whitespace character was consumed.
  bool skipSpaces()
  {
    bool skipped = false;
    while (!eof() && isXmlSpace(peek()))
    {
      advance();
      skipped = true;
    }
    return skipped;
  }

  bool matchString(const char *s)
  {
    std::string_view word(s);
    if (_input.compare(_cur, word.size(), word) != 0)
    {
      return false;
    }
    advanceTo(_cur + word.size());
    return true;
  }

  /// Reject control characters and the non-characters U+FFFE/U+FFFF.
  bool checkCharacters()
  {
    std::size_t line = 1;
    std::size_t col = 1;
    for (std::size_t i = 0; i < _input.size(); ++i)
    {
      unsigned char c = static_cast<unsigned char>(_input[i]);
      bool bad = (c < 0x20 && c != '\t' && c != '\n' && c != '\r');
      if (!bad && c == 0xEF && i + 2 < _input.size() &&
          static_cast<unsigned char>(_input[i + 1]) == 0xBF)
      {
        unsigned char c3 = static_cast<unsigned char>(_input[i + 2]);
        bad = (c3 == 0xBE || c3 == 0xBF);
      }
      if (bad)
      {
        return failAt(i, line, col, "invalid character in document");
      }
      if (c == '\n')
      {
        ++line;
        col = 1;
      }
      else
      {
        ++col;
      }
    }
    return true;
  }

  std::string_view readName()
  {
    std::size_t start = _cur;
    if (eof() || !isNameStart(peek()))
    {
      return std::string_view{};
    }
    advance();
    while (!eof() && isNameChar(peek()))
    {
      advance();
    }
    std::size_t len = _cur - start;
    if (len > _opt.maxNameLength)
    {
      fail("name too long");
      return std::string_view{};
    }
    return _input.substr(start, len);
  }

  /// Slice up to \p endSeq and move the cursor past it.
  bool readUntil(std::string_view endSeq, std::size_t &startOut, std::size_t &lenOut)
  {
    std::size_t pos = _input.find(endSeq, _cur);
    if (pos == std::string_view::npos)
    {
      return false;
    }
    startOut = _cur;
    lenOut = pos - _cur;
    advanceTo(pos + endSeq.size());
    return true;
  }

  bool readQuotedValue(std::string_view &out)
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
      if (peek() == '<')
      {
        return fail("'<' not allowed in attribute value");
      }
      advance();
    }
    if (eof())
    {
      return fail("unterminated attribute value");
    }
    std::size_t end = _cur;
    advance();
    out = _input.substr(start, end - start);
    if (out.size() > _opt.maxTextSpan)
    {
      return fail("attribute value too long");
    }
    return true;
  }

  bool readAttributes(std::vector<Attribute> &attrs)
  {
    attrs.clear();
    while (true)
    {
      bool spaced = skipSpaces();
      if (eof())
      {
        return fail("unexpected end in attributes");
      }
      char ch = peek();
      if (ch == '/' || ch == '>')
      {
        return true;
      }
      if (!spaced)
      {
        return fail("attributes must be separated by whitespace");
      }
      std::string_view name = readName();
      if (name.empty())
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
      std::string_view value;
      if (!readQuotedValue(value))
      {
        return false;
      }
      attrs.push_back(Attribute{name, value});
      if (attrs.size() > _opt.maxAttrsPerElement)
      {
        return fail("too many attributes");
      }
    }
  }

  bool readXmlDecl(std::size_t startOffset, std::size_t startLine, std::size_t startCol,
                   std::string_view target)
  {
    Token tok;
    tok.kind = TokenKind::XmlDecl;
    tok.name = target;
    tok.offset = startOffset;
    tok.line = startLine;
    tok.column = startCol;
    while (true)
    {
      bool spaced = skipSpaces();
      if (matchString("?>"))
      {
        break;
      }
      if (eof())
      {
        return fail("unterminated XML declaration");
      }
      if (!spaced)
      {
        return fail("malformed XML declaration");
      }
      std::string_view name = readName();
      if (name.empty())
      {
        return _hasError ? false : fail("malformed XML declaration");
      }
      skipSpaces();
      if (eof() || peek() != '=')
      {
        return fail("expected '=' in XML declaration");
      }
      advance();
      skipSpaces();
      std::string_view value;
      if (!readQuotedValue(value))
      {
        return false;
      }
      tok.attributes.push_back(Attribute{name, value});
    }
    if (tok.attributes.empty() || tok.attributes.front().name != "version")
    {
      return fail("XML declaration must start with version");
    }
    _token = std::move(tok);
    return true;
  }

  bool readProcessingInstruction(std::size_t startOffset, std::size_t startLine,
                                 std::size_t startCol)
  {
    std::string_view target = readName();
    if (target.empty())
    {
      return _hasError ? false : fail("invalid PI target");
    }
    if (target.size() == 3 && (target[0] | 0x20) == 'x' && (target[1] | 0x20) == 'm' &&
        (target[2] | 0x20) == 'l')
    {
      if (startOffset != 0 || target != "xml")
      {
        return fail("XML declaration allowed only at the start of the document");
      }
      return readXmlDecl(startOffset, startLine, startCol, target);
    }
    if (!eof() && peek() != '?' && !isXmlSpace(peek()))
    {
      return fail("invalid PI target");
    }
    skipSpaces();
    std::size_t start, len;
    if (!readUntil("?>", start, len))
    {
      return fail("unterminated processing instruction");
    }

    _token = Token{};
    _token.kind = TokenKind::ProcessingInstruction;
    _token.name = target;
    _token.text = _input.substr(start, len);
    _token.depth = _depth;
    _token.offset = startOffset;
    _token.line = startLine;
    _token.column = startCol;
    return true;
  }

  bool readComment(std::size_t startOffset, std::size_t startLine, std::size_t startCol)
  {
    std::size_t start, len;
    if (!readUntil("--", start, len))
    {
      return fail("unterminated comment");
    }
    if (eof() || peek() != '>')
    {
      return fail("'--' not allowed in comment");
    }
    advance();
    _token = Token{};
    _token.kind = TokenKind::Comment;
    _token.text = _input.substr(start, len);
    _token.depth = _depth;
    _token.offset = startOffset;
    _token.line = startLine;
    _token.column = startCol;
    return true;
  }

  bool readCData(std::size_t startOffset, std::size_t startLine, std::size_t startCol)
  {
    std::size_t start, len;
    if (!readUntil("]]>", start, len))
    {
      return fail("unterminated CDATA section");
    }
    _token = Token{};
    _token.kind = TokenKind::CData;
    _token.text = _input.substr(start, len);
    _token.depth = _depth;
    _token.offset = startOffset;
    _token.line = startLine;
    _token.column = startCol;
    return true;
  }

  bool readDoctype(std::size_t startOffset, std::size_t startLine, std::size_t startCol)
  {
    if (_depth > 0 || _rootSeen || _doctypeSeen)
    {
      return fail("DOCTYPE must appear once, before the root element");
    }
    if (eof() || !isXmlSpace(peek()))
    {
      return fail("expected whitespace after DOCTYPE");
    }
    // Up to the '>' outside the internal subset and outside quoted literals.
    std::size_t pos = _cur;
    int bracket = 0;
    char quote = '\0';
    while (pos < _input.size())
    {
      char ch = _input[pos];
      if (quote != '\0')
      {
        if (ch == quote)
        {
          quote = '\0';
        }
      }
      else if (ch == '"' || ch == '\'')
      {
        quote = ch;
      }
      else if (ch == '[')
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
    if (pos >= _input.size())
    {
      return fail("unterminated DOCTYPE");
    }
    std::string_view body = _input.substr(_cur, pos - _cur);
    advanceTo(pos + 1);
    _doctypeSeen = true;

    _token = Token{};
    _token.kind = TokenKind::Doctype;
    _token.text = body;
    _token.depth = _depth;
    _token.offset = startOffset;
    _token.line = startLine;
    _token.column = startCol;
    return true;
  }

  bool readEndTag(std::size_t startOffset, std::size_t startLine, std::size_t startCol)
  {
    std::string_view name = readName();
    if (name.empty())
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
    if (_elementStack.back() != name)
    {
      return fail("mismatched end tag - expected </" + _elementStack.back() + "> but got </" +
                  std::string(name) + ">");
    }

    _elementStack.pop_back();
    --_depth;
    if (_depth == 0)
    {
      _rootClosed = true;
    }

    _token = Token{};
    _token.kind = TokenKind::EndElement;
    _token.name = name;
    _token.depth = _depth + 1;
    _token.offset = startOffset;
    _token.line = startLine;
    _token.column = startCol;
    return true;
  }

  bool readStartOrEmptyTag(std::size_t startOffset, std::size_t startLine, std::size_t startCol)
  {
    std::string_view name = readName();
    if (name.empty())
    {
      return _hasError ? false : fail("invalid start tag name");
    }
    Token tok;
    tok.kind = TokenKind::StartElement;
    tok.name = name;
    tok.offset = startOffset;
    tok.line = startLine;
    tok.column = startCol;

    if (!readAttributes(tok.attributes))
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

    if (_depth + 1 > _opt.maxDepth)
    {
      return fail("maximum element depth exceeded");
    }

    _rootSeen = true;
    tok.depth = _depth + 1;
    if (empty)
    {
      tok.kind = TokenKind::EmptyElement;
      tok.selfClosing = true;
      if (_depth == 0)
      {
        _rootClosed = true;
      }
    }
    else
    {
      ++_depth;
      _elementStack.push_back(std::string(name));
    }
    _token = std::move(tok);
    return true;
  }

  bool readText(std::size_t startOffset, std::size_t startLine, std::size_t startCol)
  {
    std::size_t start = _cur;
    while (!eof() && peek() != '<')
    {
      if ((_cur - start) >= _opt.maxTextSpan)
      {
        return fail("text span too large");
      }
      if (peek() == ']' && _input.compare(_cur, 3, "]]>") == 0)
      {
        return fail("']]>' not allowed in character data");
      }
      advance();
    }
    _token = Token{};
    _token.kind = TokenKind::Text;
    _token.text = _input.substr(start, _cur - start);
    _token.depth = _depth;
    _token.offset = startOffset;
    _token.line = startLine;
    _token.column = startCol;
    return true;
  }

  void emitEof()
  {
    if (!_elementStack.empty())
    {
      std::string unclosed = "unclosed elements at end of document:";
      for (const auto &elem : _elementStack)
      {
        unclosed += " <" + elem + ">";
      }
      fail(unclosed);
      return;
    }
    if (!_rootSeen)
    {
      fail("no root element");
      return;
    }
    _token = Token{};
    _token.kind = TokenKind::Eof;
    _token.offset = _cur;
    _token.line = _line;
    _token.column = _col;
    _emittedEof = true;
  }

  bool failAt(std::size_t offset, std::size_t line, std::size_t column, std::string msg)
  {
    _hasError = true;
    _error.offset = offset;
    _error.line = line;
    _error.column = column;
    _error.message = std::move(msg);
    return false;
  }

  bool fail(std::string msg) { return failAt(_cur, _line, _col, std::move(msg)); }

  // Append a numeric char ref (e.g. "#10" or "#x1F4A9") to out as UTF-8.
  static bool appendCharRef(std::string_view entBody, std::string &out)
  {
    if (entBody.size() < 2)
    {
      return false;
    }
    bool hex = (entBody[1] == 'x');
    std::size_t first = hex ? 2 : 1;
    if (first >= entBody.size() || entBody.size() - first > 8)
    {
      return false;
    }
    std::uint32_t code = 0;
    for (std::size_t i = first; i < entBody.size(); ++i)
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
    }
    if (!isXmlChar(code))
    {
      return false;
    }
    encodeUtf8(code, out);
    return true;
  }

  static void encodeUtf8(std::uint32_t cp, std::string &out)
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
      out.push_back(static_cast<char>(0xE0u | ((cp >> 12) & 0x0Fu)));
      out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
      out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    }
    else
    {
      out.push_back(static_cast<char>(0xF0u | ((cp >> 18) & 0x07u)));
      out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
      out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
      out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    }
  }

private:
  std::string_view _input;
  Options _opt{};

  std::size_t _cur{0};
  std::size_t _line{1};
  std::size_t _col{1};
  std::size_t _depth{0};

  Token _token{};

  bool _hasError{false};
  Error _error{};
  bool _emittedEof{false};
  bool _charsChecked{false};
  bool _rootSeen{false};
  bool _rootClosed{false};
  bool _doctypeSeen{false};
  std::vector<std::string> _elementStack{};
};

/// \brief DOM node kinds built by DomBuilder.
enum class NodeType
{
  Document,
  Element,
  Text,
  CData,
  Comment,
  ProcessingInstruction,
  Doctype
};

/// \brief DOM node.
class Node
{
public:
  NodeType type{NodeType::Element};
  std::string name;  ///< Element name or PI target
  std::string value; ///< Text (decoded), CDATA/comment/PI payload, or raw DOCTYPE body

  struct Attr
  {
    std::string name;
    std::string value;
  };

  /// Element attributes in source order. On the Document node: the XML
  /// declaration's pseudo-attributes.
  std::vector<Attr> attributes;
  std::vector<std::unique_ptr<Node>> children;

  /// \brief Find first direct child element by name; returns nullptr if none.
  const Node *childByName(std::string_view n) const
  {
    for (const auto &c : children)
    {
      if (c->type == NodeType::Element && std::string_view(c->name) == n)
      {
        return c.get();
      }
    }
    return nullptr;
  }

  /// \brief Find attribute by name; returns empty string_view if not found.
  std::string_view getAttribute(std::string_view attrName) const
  {
    for (const auto &attr : attributes)
    {
      if (std::string_view(attr.name) == attrName)
      {
        return attr.value;
      }
    }
    return std::string_view{};
  }

  /// \brief Set an attribute; an existing one keeps its position.
  void setAttribute(std::string attrName, std::string attrValue)
  {
    for (auto &attr : attributes)
    {
      if (attr.name == attrName)
      {
        attr.value = std::move(attrValue);
        return;
      }
    }
    attributes.push_back(Attr{std::move(attrName), std::move(attrValue)});
  }

  /// \brief First element child (the root element of a Document).
  const Node *firstElement() const
  {
    for (const auto &c : children)
    {
      if (c->type == NodeType::Element)
      {
        return c.get();
      }
    }
    return nullptr;
  }

  /// \brief True if any direct child carries character data.
  bool hasTextChild() const
  {
    for (const auto &c : children)
    {
      if (c->type == NodeType::Text || c->type == NodeType::CData)
      {
        return true;
      }
    }
    return false;
  }

  /// \brief Concatenated Text and CDATA children.
  std::string getTextContent() const
  {
    std::string result;
    for (const auto &child : children)
    {
      if (child->type == NodeType::Text || child->type == NodeType::CData)
      {
        result += child->value;
      }
    }
    return result;
  }
};

/// \brief Build a DOM tree from a pull parser, dropping ignorable whitespace.
///
/// A whitespace-only text run is kept when it is the whole content of its
/// element, when the previous sibling is text, when the element's first
/// child is text, or inside xml:space="preserve". Otherwise it is dropped.
class DomBuilder
{
public:
  /// \brief Build and return the Document node, or nullptr with \p errOut set.
  static std::unique_ptr<Node> build(Parser &parser, Error *errOut = nullptr)
  {
    auto doc = std::make_unique<Node>();
    doc->type = NodeType::Document;

    std::vector<Node *> stack;
    stack.push_back(doc.get());
    std::vector<bool> preserve;
    preserve.push_back(false);

    std::unique_ptr<Node> pendingBlank;

    while (parser.next())
    {
      const Token &t = parser.current();

      if (pendingBlank)
      {
        Node *parent = stack.back();
        if (keepBlank(*parent, t.kind == TokenKind::EndElement))
        {
          parent->children.push_back(std::move(pendingBlank));
        }
        pendingBlank.reset();
      }

      switch (t.kind)
      {
      case TokenKind::XmlDecl:
        for (const auto &a : t.attributes)
        {
          doc->attributes.push_back(Node::Attr{std::string(a.name), std::string(a.value)});
        }
        break;
      case TokenKind::StartElement:
      case TokenKind::EmptyElement:
      {
        auto elem = std::make_unique<Node>();
        elem->type = NodeType::Element;
        elem->name = std::string(t.name);
        elem->attributes.reserve(t.attributes.size());
        for (const auto &a : t.attributes)
        {
          std::string v;
          if (!Parser::decodeAttributeValue(a.value, v, nullptr))
          {
            return failAt(t, "bad reference in attribute '" + std::string(a.name) + "'", errOut);
          }
          elem->setAttribute(std::string(a.name), std::move(v));
        }
        Node *raw = elem.get();
        stack.back()->children.push_back(std::move(elem));
        if (t.kind == TokenKind::StartElement)
        {
          stack.push_back(raw);
          std::string_view space = raw->getAttribute("xml:space");
          preserve.push_back(space == "preserve" ? true
                                                 : (space == "default" ? false : preserve.back()));
        }
        break;
      }
      case TokenKind::EndElement:
        if (stack.size() <= 1)
        {
          return failAt(t, "unbalanced end element", errOut);
        }
        stack.pop_back();
        preserve.pop_back();
        break;
      case TokenKind::Text:
      {
        std::string v;
        Error tmp{};
        if (!Parser::decodeEntities(t.text, v, &tmp))
        {
          if (errOut)
          {
            *errOut = Error{t.offset + tmp.offset, t.line, t.column, tmp.message};
          }
          return nullptr;
        }
        auto n = std::make_unique<Node>();
        n->type = NodeType::Text;
        n->value = std::move(v);
        if (isBlank(t.text) && !preserve.back())
        {
          pendingBlank = std::move(n);
        }
        else
        {
          stack.back()->children.push_back(std::move(n));
        }
        break;
      }
      case TokenKind::CData:
        append(stack.back(), NodeType::CData, std::string(), std::string(t.text));
        break;
      case TokenKind::Comment:
        append(stack.back(), NodeType::Comment, std::string(), std::string(t.text));
        break;
      case TokenKind::ProcessingInstruction:
        append(stack.back(), NodeType::ProcessingInstruction, std::string(t.name),
               std::string(t.text));
        break;
      case TokenKind::Doctype:
        append(stack.back(), NodeType::Doctype, std::string(), std::string(t.text));
        break;
      case TokenKind::Invalid:
      case TokenKind::Eof:
      default:
        break;
      }
    }

    if (const Error *e = parser.error())
    {
      if (errOut)
      {
        *errOut = *e;
      }
      return nullptr;
    }
    if (stack.size() != 1)
    {
      if (errOut)
      {
        *errOut = Error{0, 0, 0, "unclosed elements at end of document"};
      }
      return nullptr;
    }
    return doc;
  }

private:
  static bool keepBlank(const Node &parent, bool beforeEndTag)
  {
    if (parent.children.empty())
    {
      return beforeEndTag;
    }
    return parent.children.back()->type == NodeType::Text ||
           parent.children.front()->type == NodeType::Text;
  }

  static void append(Node *parent, NodeType type, std::string name, std::string value)
  {
    auto n = std::make_unique<Node>();
    n->type = type;
    n->name = std::move(name);
    n->value = std::move(value);
    parent->children.push_back(std::move(n));
  }

  static std::unique_ptr<Node> failAt(const Token &t, std::string msg, Error *errOut)
  {
    if (errOut)
    {
      *errOut = Error{t.offset, t.line, t.column, std::move(msg)};
    }
    return nullptr;
  }
};

} // namespace xml
} // namespace parsers
} // namespace reindent
