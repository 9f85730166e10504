// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Reindent, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "reindent/format/indent_remapper.hpp"
#include <catch2/catch.hpp>
#include <string>

using reindent::format::remapIndent;

TEST_CASE("Indent remapper structural lines", "[xml][remap]")
{
  SECTION("Baseline unit leaves the text alone")
  {
    const std::string text = "<a>\n  <b/>\n   odd\n</a>";
    REQUIRE(remapIndent(text, "  ") == text);
  }

  SECTION("Each leading pair becomes one unit")
  {
    REQUIRE(remapIndent("<a>\n  <b>\n    <c/>\n  </b>\n</a>", "\t") ==
            "<a>\n\t<b>\n\t\t<c/>\n\t</b>\n</a>");
    REQUIRE(remapIndent("<a>\n  <b/>\n</a>", "----") == "<a>\n----<b/>\n</a>");
  }

  SECTION("An odd leftover space is kept")
  {
    REQUIRE(remapIndent("   <b/>", "\t") == "\t <b/>");
  }

  SECTION("Empty unit removes structural indentation")
  {
    REQUIRE(remapIndent("<a>\n    <b/>\n</a>", "") == "<a>\n<b/>\n</a>");
  }

  SECTION("Text lines are untouched")
  {
    REQUIRE(remapIndent("<t>one\n  two\n    three</t>", "\t") == "<t>one\n  two\n    three</t>");
    REQUIRE(remapIndent("  \n  ", "\t") == "  \n  ");
  }

  SECTION("Line structure is preserved")
  {
    REQUIRE(remapIndent("", "\t").empty());
    REQUIRE(remapIndent("<a/>\n", "\t") == "<a/>\n");
    REQUIRE(remapIndent("\n\n  <a/>", "\t") == "\n\n\t<a/>");
  }
}

TEST_CASE("Indent remapper protected sections", "[xml][remap][cdata]")
{
  SECTION("Lines inside CDATA are copied verbatim")
  {
    REQUIRE(remapIndent("<r>\n  <c><![CDATA[\n    <x/>\n  ]]></c>\n  <d/>\n</r>", "\t") ==
            "<r>\n\t<c><![CDATA[\n    <x/>\n  ]]></c>\n\t<d/>\n</r>");
  }

  SECTION("CDATA closed on its opening line does not protect later lines")
  {
    REQUIRE(remapIndent("<a><![CDATA[x]]></a>\n  <b/>", "\t") == "<a><![CDATA[x]]></a>\n\t<b/>");
  }

  SECTION("A second CDATA opened on the same line stays open")
  {
    REQUIRE(remapIndent("<a><![CDATA[x]]><![CDATA[\n  <y/>\n]]></a>\n  <b/>", "\t") ==
            "<a><![CDATA[x]]><![CDATA[\n  <y/>\n]]></a>\n\t<b/>");
  }

  SECTION("Lines inside comments are copied verbatim")
  {
    REQUIRE(remapIndent("<r>\n  <!--\n  <old/>\n  -->\n  <new/>\n</r>", "\t") ==
            "<r>\n\t<!--\n  <old/>\n  -->\n\t<new/>\n</r>");
  }

  SECTION("Comment markers inside CDATA do not open a comment")
  {
    REQUIRE(remapIndent("  <c><![CDATA[<!--]]></c>\n  <d/>", "\t") ==
            "\t<c><![CDATA[<!--]]></c>\n\t<d/>");
  }
}
