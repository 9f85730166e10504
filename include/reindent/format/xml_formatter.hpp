// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Reindent, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <reindent/core/logger.hpp>
#include <reindent/format/indent_config.hpp>
#include <reindent/format/indent_remapper.hpp>
#include <reindent/format/xml_writer.hpp>
#include <reindent/parsers/xml.hpp>
#include <reindent/text/encoding.hpp>

#include <string>
#include <string_view>
#include <utility>

namespace reindent
{
namespace format
{
/// \brief Outcome of parseXml().
struct XmlParseResult
{
  XmlDocument document;
  bool ok{false};
  parsers::xml::Error error;
};

/// \brief Outcome of formatXml(). \c text is UTF-8; \c encoding names the
/// charset the document declared (see encodeText()). On failure \c text is
/// empty.
struct XmlFormatResult
{
  std::string text;
  std::string encoding;
  bool ok{false};
  parsers::xml::Error error;
};

/// \brief Replace CRLF and lone CR with LF.
inline std::string normalizeLineEnds(std::string_view in)
{
  std::string out;
  out.reserve(in.size());
  for (std::size_t i = 0; i < in.size(); ++i)
  {
    if (in[i] == '\r')
    {
      out.push_back('\n');
      if (i + 1 < in.size() && in[i + 1] == '\n')
      {
        ++i;
      }
    }
    else
    {
      out.push_back(in[i]);
    }
  }
  return out;
}

/// \brief Decode \p raw and build the document tree.
///
/// The encoding named in the prolog wins; without one \p declaredEncoding
/// (the caller's idea of the file's charset) is used, and UTF-8 when that is
/// empty too.
inline XmlParseResult parseXml(std::string_view raw, std::string_view declaredEncoding = {})
{
  XmlParseResult result;
  if (text::declaresEncoding(raw) || declaredEncoding.empty())
  {
    result.document.encoding = text::detectDeclaredEncoding(raw);
  }
  else
  {
    result.document.encoding = text::toLowerAscii(declaredEncoding);
  }
  result.document.hasDeclaration = text::hasXmlDeclaration(raw);
  REINDENT_LOG_DEBUG("XML input encoding: " << result.document.encoding);

  std::string decoded;
  try
  {
    decoded = normalizeLineEnds(text::toUtf8(raw, result.document.encoding));
  }
  catch (const text::EncodingError &e)
  {
    result.error = parsers::xml::Error{0, 1, 1, e.what()};
    REINDENT_LOG_DEBUG("Cannot decode XML input: " << e.what());
    return result;
  }

  parsers::xml::Parser parser(decoded);
  parsers::xml::Error err;
  auto tree = parsers::xml::DomBuilder::build(parser, &err);
  if (!tree)
  {
    result.error = std::move(err);
    REINDENT_LOG_DEBUG("Invalid XML at line " << result.error.line << ", column "
                                              << result.error.column << ": "
                                              << result.error.message);
    return result;
  }

  std::string_view version = tree->getAttribute("version");
  if (!version.empty())
  {
    result.document.version = std::string(version);
  }
  result.document.standalone = std::string(tree->getAttribute("standalone"));
  result.document.tree = std::move(tree);
  result.ok = true;
  return result;
}

/// \brief Serialize a parsed document and re-indent it to the configured unit.
inline XmlFormatResult formatXml(const XmlDocument &doc, const IndentConfig &cfg)
{
  XmlFormatResult result;
  result.encoding = doc.encoding;
  try
  {
    result.text = remapIndent(writeXml(doc), cfg.xmlIndent);
  }
  catch (const text::EncodingError &e)
  {
    result.text.clear();
    result.error = parsers::xml::Error{0, 1, 1, e.what()};
    REINDENT_LOG_DEBUG("Cannot serialize XML: " << e.what());
    return result;
  }
  result.ok = true;
  return result;
}

/// \brief parseXml() followed by formatXml(). All or nothing: on failure no
/// text is produced.
inline XmlFormatResult formatXml(std::string_view raw, const IndentConfig &cfg,
                                 std::string_view declaredEncoding = {})
{
  auto parsed = parseXml(raw, declaredEncoding);
  if (!parsed.ok)
  {
    XmlFormatResult result;
    result.encoding = parsed.document.encoding;
    result.error = std::move(parsed.error);
    return result;
  }
  return formatXml(parsed.document, cfg);
}

/// \brief Convert formatted UTF-8 text back to the document's encoding.
/// \throws text::EncodingError for unknown labels.
inline std::string encodeText(std::string_view utf8, const std::string &encoding)
{
  return text::fromUtf8(utf8, encoding);
}

} // namespace format
} // namespace reindent
