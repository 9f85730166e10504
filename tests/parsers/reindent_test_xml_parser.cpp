// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Reindent, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "reindent/parsers/xml.hpp"
#include <memory>
#include <string>

using namespace reindent::parsers::xml;

namespace
{

std::unique_ptr<Node> buildDom(const std::string &xml, Error *err = nullptr)
{
  Parser parser(xml);
  return DomBuilder::build(parser, err);
}

std::string parseError(const std::string &xml)
{
  Error err;
  auto doc = buildDom(xml, &err);
  REQUIRE(doc == nullptr);
  return err.message;
}

} // anonymous namespace

TEST_CASE("XML Parser - Basic Parsing", "[xml][parser][basic]")
{
  SECTION("Simple element parsing")
  {
    std::string xml = "<root>hello</root>";
    Parser parser(xml);

    REQUIRE(parser.next());
    const auto &tok1 = parser.current();
    REQUIRE(tok1.kind == TokenKind::StartElement);
    REQUIRE(tok1.name == "root");
    REQUIRE(tok1.depth == 1);

    REQUIRE(parser.next());
    const auto &tok2 = parser.current();
    REQUIRE(tok2.kind == TokenKind::Text);
    REQUIRE(tok2.text == "hello");
    REQUIRE(tok2.depth == 1);

    REQUIRE(parser.next());
    const auto &tok3 = parser.current();
    REQUIRE(tok3.kind == TokenKind::EndElement);
    REQUIRE(tok3.name == "root");
    REQUIRE(tok3.depth == 1);

    REQUIRE_FALSE(parser.next());
    REQUIRE(parser.error() == nullptr);
  }

  SECTION("Empty element parsing")
  {
    std::string xml = "<empty/>";
    Parser parser(xml);

    REQUIRE(parser.next());
    const auto &tok = parser.current();
    REQUIRE(tok.kind == TokenKind::EmptyElement);
    REQUIRE(tok.name == "empty");
    REQUIRE(tok.selfClosing);
    REQUIRE(tok.depth == 1);

    REQUIRE_FALSE(parser.next());
    REQUIRE(parser.error() == nullptr);
  }

  SECTION("Element with attributes keeps source order")
  {
    std::string xml = "<elem zeta=\"1\" alpha='2'>content</elem>";
    Parser parser(xml);

    REQUIRE(parser.next());
    const auto &tok = parser.current();
    REQUIRE(tok.kind == TokenKind::StartElement);
    REQUIRE(tok.attributes.size() == 2);
    REQUIRE(tok.attributes[0].name == "zeta");
    REQUIRE(tok.attributes[0].value == "1");
    REQUIRE(tok.attributes[1].name == "alpha");
    REQUIRE(tok.attributes[1].value == "2");
  }

  SECTION("Whitespace between elements is reported as text")
  {
    std::string xml = "<a>\n  <b/>\n</a>";
    Parser parser(xml);

    REQUIRE(parser.next());
    REQUIRE(parser.current().kind == TokenKind::StartElement);
    REQUIRE(parser.next());
    REQUIRE(parser.current().kind == TokenKind::Text);
    REQUIRE(parser.current().text == "\n  ");
    REQUIRE(parser.next());
    REQUIRE(parser.current().kind == TokenKind::EmptyElement);
    REQUIRE(parser.current().depth == 2);
    REQUIRE(parser.next());
    REQUIRE(parser.current().text == "\n");
    REQUIRE(parser.next());
    REQUIRE(parser.current().kind == TokenKind::EndElement);
    REQUIRE_FALSE(parser.next());
    REQUIRE(parser.error() == nullptr);
  }

  SECTION("Non-ASCII element names")
  {
    std::string xml = "<caf\xC3\xA9>x</caf\xC3\xA9>";
    Parser parser(xml);
    REQUIRE(parser.next());
    REQUIRE(parser.current().name == "caf\xC3\xA9");
  }
}

TEST_CASE("XML Parser - Markup Tokens", "[xml][parser][markup]")
{
  SECTION("XML declaration pseudo-attributes")
  {
    std::string xml = "<?xml version=\"1.0\" encoding='ISO-8859-1' standalone=\"yes\"?><r/>";
    Parser parser(xml);

    REQUIRE(parser.next());
    const auto &tok = parser.current();
    REQUIRE(tok.kind == TokenKind::XmlDecl);
    REQUIRE(tok.attributes.size() == 3);
    REQUIRE(tok.attributes[0].name == "version");
    REQUIRE(tok.attributes[1].value == "ISO-8859-1");
    REQUIRE(tok.attributes[2].value == "yes");
  }

  SECTION("Comment, CDATA and processing instruction")
  {
    std::string xml = "<r><!-- note --><![CDATA[a < b]]><?target data here?></r>";
    Parser parser(xml);

    REQUIRE(parser.next());
    REQUIRE(parser.next());
    REQUIRE(parser.current().kind == TokenKind::Comment);
    REQUIRE(parser.current().text == " note ");
    REQUIRE(parser.next());
    REQUIRE(parser.current().kind == TokenKind::CData);
    REQUIRE(parser.current().text == "a < b");
    REQUIRE(parser.next());
    REQUIRE(parser.current().kind == TokenKind::ProcessingInstruction);
    REQUIRE(parser.current().name == "target");
    REQUIRE(parser.current().text == "data here");
  }

  SECTION("DOCTYPE with internal subset")
  {
    std::string xml = "<!DOCTYPE r [<!ELEMENT r (#PCDATA)>]><r/>";
    Parser parser(xml);

    REQUIRE(parser.next());
    REQUIRE(parser.current().kind == TokenKind::Doctype);
    REQUIRE(parser.current().text == " r [<!ELEMENT r (#PCDATA)>]");
    REQUIRE(parser.next());
    REQUIRE(parser.current().kind == TokenKind::EmptyElement);
  }

  SECTION("Comments and PIs around the root element")
  {
    std::string xml = "<!-- head -->\n<r/>\n<?after?>\n";
    Parser parser(xml);

    REQUIRE(parser.next());
    REQUIRE(parser.current().kind == TokenKind::Comment);
    REQUIRE(parser.next());
    REQUIRE(parser.current().kind == TokenKind::EmptyElement);
    REQUIRE(parser.next());
    REQUIRE(parser.current().kind == TokenKind::ProcessingInstruction);
    REQUIRE_FALSE(parser.next());
    REQUIRE(parser.error() == nullptr);
  }
}

TEST_CASE("XML Parser - Entity Decoding", "[xml][parser][entities]")
{
  std::string out;

  SECTION("Predefined entities")
  {
    REQUIRE(Parser::decodeEntities("&lt;a&gt; &amp; &apos;&quot;", out));
    REQUIRE(out == "<a> & '\"");
  }

  SECTION("Numeric character references")
  {
    REQUIRE(Parser::decodeEntities("&#65;&#x42;&#x20AC;", out));
    REQUIRE(out == "AB\xE2\x82\xAC");
  }

  SECTION("Undefined entity")
  {
    Error err;
    REQUIRE_FALSE(Parser::decodeEntities("a &nbsp; b", out, &err));
    REQUIRE(err.message.find("undefined entity") != std::string::npos);
    REQUIRE(err.offset == 2);
  }

  SECTION("References to characters outside the XML range")
  {
    REQUIRE_FALSE(Parser::decodeEntities("&#0;", out));
    REQUIRE_FALSE(Parser::decodeEntities("&#xD800;", out));
    REQUIRE_FALSE(Parser::decodeEntities("&#x;", out));
  }

  SECTION("Attribute values normalize literal whitespace only")
  {
    REQUIRE(Parser::decodeAttributeValue("a\tb\nc&#10;d", out));
    REQUIRE(out == "a b c\nd");
  }
}

TEST_CASE("XML Parser - Well-formedness Errors", "[xml][parser][errors]")
{
  SECTION("Mismatched end tag")
  {
    REQUIRE(parseError("<a><b></a>").find("mismatched end tag") != std::string::npos);
  }

  SECTION("Unclosed element")
  {
    REQUIRE(parseError("<a><b/>").find("unclosed") != std::string::npos);
  }

  SECTION("Empty document")
  {
    REQUIRE(parseError("").find("no root element") != std::string::npos);
    REQUIRE(parseError("<!-- only a comment -->").find("no root element") != std::string::npos);
  }

  SECTION("Content after the root element")
  {
    REQUIRE(parseError("<a/><b/>").find("extra content") != std::string::npos);
    REQUIRE(parseError("<a/>tail").find("extra content") != std::string::npos);
  }

  SECTION("Text before the root element")
  {
    REQUIRE(parseError("lead<a/>").find("text outside") != std::string::npos);
  }

  SECTION("Double hyphen inside a comment")
  {
    REQUIRE(parseError("<a><!-- x -- y --></a>").find("'--'") != std::string::npos);
  }

  SECTION("CDATA terminator in character data")
  {
    REQUIRE(parseError("<a>]]></a>").find("']]>'") != std::string::npos);
  }

  SECTION("Less-than sign in an attribute value")
  {
    REQUIRE(parseError("<a x=\"<\"/>").find("'<'") != std::string::npos);
  }

  SECTION("Attributes without separating whitespace")
  {
    REQUIRE(parseError("<a x=\"1\"y=\"2\"/>").find("whitespace") != std::string::npos);
  }

  SECTION("Control characters")
  {
    REQUIRE(parseError(std::string("<a>\x01</a>")).find("invalid character") != std::string::npos);
  }

  SECTION("Unterminated constructs")
  {
    REQUIRE(parseError("<a><![CDATA[x</a>").find("unterminated CDATA") != std::string::npos);
    REQUIRE(parseError("<a><!-- x</a>").find("unterminated comment") != std::string::npos);
    REQUIRE(parseError("<a><?pi x</a>").find("unterminated processing") != std::string::npos);
    REQUIRE(parseError("<a x=\"1/>").find("unterminated attribute") != std::string::npos);
  }

  SECTION("Misplaced XML declaration")
  {
    REQUIRE(parseError("<a><?xml version=\"1.0\"?></a>").find("XML declaration") !=
            std::string::npos);
  }

  SECTION("Undefined entity in text reports the text position")
  {
    Error err;
    REQUIRE(buildDom("<a>\n  &bogus;</a>", &err) == nullptr);
    REQUIRE(err.message.find("undefined entity") != std::string::npos);
    REQUIRE(err.offset == 6);
  }

  SECTION("Error line is tracked")
  {
    Error err;
    REQUIRE(buildDom("<a>\n<b>\n</a>", &err) == nullptr);
    REQUIRE(err.line == 3);
  }
}

TEST_CASE("XML DOM Builder - Tree Shape", "[xml][dom]")
{
  SECTION("Ignorable whitespace is dropped")
  {
    auto doc = buildDom("<a>\n  <b>x</b>\n  <c/>\n</a>");
    REQUIRE(doc != nullptr);
    const Node *root = doc->firstElement();
    REQUIRE(root != nullptr);
    REQUIRE(root->children.size() == 2);
    REQUIRE(root->childByName("b") != nullptr);
    REQUIRE(root->childByName("b")->getTextContent() == "x");
    REQUIRE(root->childByName("c") != nullptr);
  }

  SECTION("Whitespace that is the whole element content is kept")
  {
    auto doc = buildDom("<a>  </a>");
    REQUIRE(doc != nullptr);
    const Node *root = doc->firstElement();
    REQUIRE(root->children.size() == 1);
    REQUIRE(root->children[0]->type == NodeType::Text);
    REQUIRE(root->children[0]->value == "  ");
  }

  SECTION("Whitespace in mixed content is kept")
  {
    auto doc = buildDom("<p>Hi\n  <b>x</b>\n</p>");
    REQUIRE(doc != nullptr);
    const Node *root = doc->firstElement();
    REQUIRE(root->children.size() == 3);
    REQUIRE(root->children[2]->type == NodeType::Text);
    REQUIRE(root->children[2]->value == "\n");
  }

  SECTION("xml:space preserve keeps whitespace")
  {
    auto doc = buildDom("<a xml:space=\"preserve\">\n  <b/>\n</a>");
    REQUIRE(doc != nullptr);
    REQUIRE(doc->firstElement()->children.size() == 3);
  }

  SECTION("Duplicate attribute: last value at the first position")
  {
    auto doc = buildDom("<a x=\"1\" y=\"2\" x=\"3\"/>");
    REQUIRE(doc != nullptr);
    const Node *root = doc->firstElement();
    REQUIRE(root->attributes.size() == 2);
    REQUIRE(root->attributes[0].name == "x");
    REQUIRE(root->attributes[0].value == "3");
    REQUIRE(root->getAttribute("y") == "2");
  }

  SECTION("Declaration pseudo-attributes land on the document node")
  {
    auto doc = buildDom("<?xml version=\"1.1\" standalone='no'?><r/>");
    REQUIRE(doc != nullptr);
    REQUIRE(doc->getAttribute("version") == "1.1");
    REQUIRE(doc->getAttribute("standalone") == "no");
  }

  SECTION("Prolog and epilog nodes are children of the document")
  {
    auto doc = buildDom("<!DOCTYPE r><!-- c --><r/><?done?>");
    REQUIRE(doc != nullptr);
    REQUIRE(doc->children.size() == 4);
    REQUIRE(doc->children[0]->type == NodeType::Doctype);
    REQUIRE(doc->children[1]->type == NodeType::Comment);
    REQUIRE(doc->children[2]->type == NodeType::Element);
    REQUIRE(doc->children[3]->type == NodeType::ProcessingInstruction);
  }

  SECTION("CDATA payload is stored raw")
  {
    auto doc = buildDom("<r><![CDATA[  &amp; <x>\n  y]]></r>");
    REQUIRE(doc != nullptr);
    const Node *root = doc->firstElement();
    REQUIRE(root->hasTextChild());
    REQUIRE(root->children[0]->type == NodeType::CData);
    REQUIRE(root->children[0]->value == "  &amp; <x>\n  y");
  }
}

TEST_CASE("XML Parser - Limits", "[xml][parser][limits]")
{
  Options opt;
  opt.maxDepth = 3;

  SECTION("Depth within limit")
  {
    Parser parser("<a><b><c/></b></a>", opt);
    REQUIRE(DomBuilder::build(parser) != nullptr);
  }

  SECTION("Depth over limit")
  {
    Parser parser("<a><b><c><d/></c></b></a>", opt);
    Error err;
    REQUIRE(DomBuilder::build(parser, &err) == nullptr);
    REQUIRE(err.message.find("depth") != std::string::npos);
  }
}
