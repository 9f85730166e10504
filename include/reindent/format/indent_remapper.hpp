// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Reindent, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <reindent/format/indent_config.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace reindent
{
namespace format
{
namespace detail
{
  /// \brief Rewrite a structural line: each leading pair of spaces becomes one
  /// \p unit. Lines whose leading spaces are not followed by '<' are returned
  /// unchanged.
  inline void remapLine(std::string_view line, std::string_view unit, std::string &out)
  {
    std::size_t spaces = 0;
    while (spaces < line.size() && line[spaces] == ' ')
    {
      ++spaces;
    }
    if (spaces == line.size() || line[spaces] != '<')
    {
      out.append(line);
      return;
    }
    for (std::size_t i = 0; i < spaces / 2; ++i)
    {
      out.append(unit);
    }
    if (spaces % 2 == 1)
    {
      out.push_back(' ');
    }
    out.append(line.substr(spaces));
  }

  /// \brief Walk \p line updating the CDATA and comment flags.
  inline void scanSections(std::string_view line, bool &inCdata, bool &inComment)
  {
    static constexpr std::string_view cdataOpen = "<![CDATA[";
    static constexpr std::string_view cdataClose = "]]>";
    static constexpr std::string_view commentOpen = "<!--";
    static constexpr std::string_view commentClose = "-->";

    std::size_t pos = 0;
    while (pos < line.size())
    {
      if (inCdata || inComment)
      {
        std::string_view close = inCdata ? cdataClose : commentClose;
        std::size_t end = line.find(close, pos);
        if (end == std::string_view::npos)
        {
          return;
        }
        inCdata = false;
        inComment = false;
        pos = end + close.size();
        continue;
      }
      std::size_t cdata = line.find(cdataOpen, pos);
      std::size_t comment = line.find(commentOpen, pos);
      if (cdata == std::string_view::npos && comment == std::string_view::npos)
      {
        return;
      }
      if (cdata < comment)
      {
        inCdata = true;
        pos = cdata + cdataOpen.size();
      }
      else
      {
        inComment = true;
        pos = comment + commentOpen.size();
      }
    }
  }
} // namespace detail

/// \brief Re-indent writer output from the two-space baseline to \p unit.
///
/// Lines that begin inside a CDATA section or a comment are copied verbatim;
/// every other line only has its leading spaces rewritten, and only when they
/// precede '<'. When \p unit is the baseline the text is returned unchanged.
inline std::string remapIndent(std::string_view text, std::string_view unit)
{
  if (unit == xmlBaselineIndent())
  {
    return std::string(text);
  }

  std::string out;
  out.reserve(text.size() + text.size() / 4);
  bool inCdata = false;
  bool inComment = false;

  std::size_t pos = 0;
  while (true)
  {
    std::size_t nl = text.find('\n', pos);
    std::string_view line =
      text.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
    if (inCdata || inComment)
    {
      out.append(line);
    }
    else
    {
      detail::remapLine(line, unit, out);
    }
    detail::scanSections(line, inCdata, inComment);
    if (nl == std::string_view::npos)
    {
      break;
    }
    out.push_back('\n');
    pos = nl + 1;
  }
  return out;
}

} // namespace format
} // namespace reindent
