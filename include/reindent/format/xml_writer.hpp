// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Reindent, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <reindent/format/indent_config.hpp>
#include <reindent/parsers/xml.hpp>
#include <reindent/text/encoding.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace reindent
{
namespace format
{
/// \brief A parsed XML document plus what the serializer needs to know about
/// the source: its encoding label and declaration.
struct XmlDocument
{
  std::string encoding{text::defaultEncoding()};
  bool hasDeclaration{false};
  std::string version{"1.0"};
  std::string standalone;                    ///< Empty when not declared
  std::unique_ptr<parsers::xml::Node> tree;  ///< Document node
};

namespace detail
{
  inline void escapeText(std::string_view s, std::string &out)
  {
    for (char ch : s)
    {
      switch (ch)
      {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '\r':
        out += "&#13;";
        break;
      default:
        out.push_back(ch);
      }
    }
  }

  inline void escapeAttribute(std::string_view s, std::string &out)
  {
    for (char ch : s)
    {
      switch (ch)
      {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      case '\t':
        out += "&#9;";
        break;
      case '\n':
        out += "&#10;";
        break;
      case '\r':
        out += "&#13;";
        break;
      default:
        out.push_back(ch);
      }
    }
  }

  inline void writeIndent(std::size_t level, std::string &out)
  {
    for (std::size_t i = 0; i < level; ++i)
    {
      out += xmlBaselineIndent();
    }
  }

  /// Formatting stays on while no element on the path holds character data;
  /// once it is off, the whole subtree is written as-is.
  inline void writeNode(const parsers::xml::Node &node, std::size_t level, bool format,
                        std::string &out)
  {
    using parsers::xml::NodeType;
    switch (node.type)
    {
    case NodeType::Element:
    {
      out.push_back('<');
      out += node.name;
      for (const auto &attr : node.attributes)
      {
        out.push_back(' ');
        out += attr.name;
        out += "=\"";
        escapeAttribute(attr.value, out);
        out.push_back('"');
      }
      if (node.children.empty())
      {
        out += "/>";
        break;
      }
      out.push_back('>');
      bool childFormat = format && !node.hasTextChild();
      if (childFormat)
      {
        out.push_back('\n');
      }
      for (const auto &child : node.children)
      {
        if (childFormat)
        {
          writeIndent(level + 1, out);
        }
        writeNode(*child, level + 1, childFormat, out);
        if (childFormat)
        {
          out.push_back('\n');
        }
      }
      if (childFormat)
      {
        writeIndent(level, out);
      }
      out += "</";
      out += node.name;
      out.push_back('>');
      break;
    }
    case NodeType::Text:
      escapeText(node.value, out);
      break;
    case NodeType::CData:
      out += "<![CDATA[";
      out += node.value;
      out += "]]>";
      break;
    case NodeType::Comment:
      out += "<!--";
      out += node.value;
      out += "-->";
      break;
    case NodeType::ProcessingInstruction:
      out += "<?";
      out += node.name;
      if (!node.value.empty())
      {
        out.push_back(' ');
        out += node.value;
      }
      out += "?>";
      break;
    case NodeType::Doctype:
      out += "<!DOCTYPE";
      out += node.value;
      out.push_back('>');
      break;
    case NodeType::Document:
      for (const auto &child : node.children)
      {
        writeNode(*child, level, format, out);
      }
      break;
    }
  }
} // namespace detail

/// \brief First-pass serialization with the two-space baseline indent.
///
/// The declaration is written only when the source had one. Each top-level
/// node goes on its own line and there is no trailing newline. The result is
/// UTF-8 in which characters the document encoding cannot represent have been
/// replaced by numeric character references.
/// \throws text::EncodingError if the document encoding is unknown to iconv.
inline std::string writeXml(const XmlDocument &doc)
{
  std::string out;
  bool first = true;
  if (doc.hasDeclaration)
  {
    out += "<?xml version='";
    out += doc.version;
    out += "' encoding='";
    out += doc.encoding;
    out.push_back('\'');
    if (!doc.standalone.empty())
    {
      out += " standalone='";
      out += doc.standalone;
      out.push_back('\'');
    }
    out += "?>";
    first = false;
  }
  if (doc.tree)
  {
    for (const auto &child : doc.tree->children)
    {
      if (!first)
      {
        out.push_back('\n');
      }
      detail::writeNode(*child, 0, true, out);
      first = false;
    }
  }
  return text::restrictToCharset(out, doc.encoding);
}

} // namespace format
} // namespace reindent
