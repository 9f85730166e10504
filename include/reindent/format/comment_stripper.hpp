// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Reindent, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace reindent
{
namespace format
{
/// \brief Options for stripComments().
struct StripOptions
{
  /// Remove runs of space, tab, CR and LF outside string literals.
  bool stripWhitespace{false};
};

namespace detail
{
  /// \brief True if the quote at \p quotePos is preceded by an odd-length run
  /// of backslashes, i.e. escaped.
  inline bool isEscapedQuote(std::string_view text, std::size_t quotePos)
  {
    std::size_t backslashes = 0;
    while (backslashes < quotePos && text[quotePos - 1 - backslashes] == '\\')
    {
      ++backslashes;
    }
    return (backslashes % 2) == 1;
  }

  inline bool isJsonSpace(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }
} // namespace detail

/// \brief Turn JSON-with-comments into strict JSON text.
///
/// Single left-to-right scan with three states: inString, inBlockComment and
/// inLineComment. Block comments ("/* ... */") and line comments ("// ..."
/// up to the next CR or LF) are dropped together with their delimiters;
/// the line break ending a line comment is kept unless whitespace is being
/// stripped. String literals are copied verbatim, so comment markers inside
/// them survive. A quote closes a string only when the backslash run before
/// it has even length. An unterminated comment swallows the rest of the
/// input; a malformed result is left for the JSON parser to reject.
inline std::string stripComments(std::string_view raw, const StripOptions &options = {})
{
  std::string out;
  out.reserve(raw.size());

  bool inString = false;
  bool inBlockComment = false;
  bool inLineComment = false;

  std::size_t i = 0;
  while (i < raw.size())
  {
    char c = raw[i];
    char next = (i + 1 < raw.size()) ? raw[i + 1] : '\0';

    if (inBlockComment)
    {
      if (c == '*' && next == '/')
      {
        inBlockComment = false;
        i += 2;
      }
      else
      {
        ++i;
      }
      continue;
    }

    if (inLineComment)
    {
      if (c == '\n' || c == '\r')
      {
        inLineComment = false;
        if (!options.stripWhitespace)
        {
          out.push_back(c);
        }
      }
      ++i;
      continue;
    }

    if (inString)
    {
      if (c == '"' && !detail::isEscapedQuote(raw, i))
      {
        inString = false;
      }
      out.push_back(c);
      ++i;
      continue;
    }

    if (c == '"')
    {
      inString = true;
      out.push_back(c);
      ++i;
    }
    else if (c == '/' && next == '*')
    {
      inBlockComment = true;
      i += 2;
    }
    else if (c == '/' && next == '/')
    {
      inLineComment = true;
      i += 2;
    }
    else if (options.stripWhitespace && detail::isJsonSpace(c))
    {
      ++i;
    }
    else
    {
      out.push_back(c);
      ++i;
    }
  }

  return out;
}

} // namespace format
} // namespace reindent
