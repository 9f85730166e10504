// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Reindent, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "reindent/format/comment_stripper.hpp"
#include <catch2/catch.hpp>
#include <string>

using reindent::format::StripOptions;
using reindent::format::stripComments;

TEST_CASE("Comment stripper removes comments", "[json][comments]")
{
  SECTION("Line comment keeps its line break")
  {
    REQUIRE(stripComments("{\"a\": 1, // note\n\"b\": 2}") == "{\"a\": 1, \n\"b\": 2}");
  }

  SECTION("Block comment is dropped with its delimiters")
  {
    REQUIRE(stripComments("[1, /* two\nlines */ 2]") == "[1,  2]");
  }

  SECTION("Line comment ended by CR")
  {
    REQUIRE(stripComments("1 // x\r\n") == "1 \r\n");
  }

  SECTION("Comment at end of input")
  {
    REQUIRE(stripComments("true // done") == "true ");
  }

  SECTION("Unterminated block comment swallows the rest")
  {
    REQUIRE(stripComments("[1] /* open") == "[1] ");
  }
}

TEST_CASE("Comment stripper leaves strings alone", "[json][comments][strings]")
{
  SECTION("String contents survive while real comments go")
  {
    REQUIRE(stripComments(R"({"a": "// not a comment", "b": 1 /* drop */})") ==
            R"({"a": "// not a comment", "b": 1 })");
  }

  SECTION("Comment markers inside strings survive")
  {
    const std::string text = R"({"url": "http://x/*y*/", "c": "// not a comment"})";
    REQUIRE(stripComments(text) == text);
  }

  SECTION("Escaped quote does not end the string")
  {
    REQUIRE(stripComments(R"(["a\"// b", 1])") == R"(["a\"// b", 1])");
  }

  SECTION("Escaped backslash before the closing quote")
  {
    REQUIRE(stripComments(R"(["\\", /* c */ 1])") == R"(["\\",  1])");
  }

  SECTION("Three backslashes still escape the quote")
  {
    REQUIRE(stripComments(R"(["\\\"/*x*/"])") == R"(["\\\"/*x*/"])");
  }
}

TEST_CASE("Comment stripper whitespace option", "[json][comments][whitespace]")
{
  StripOptions options;
  options.stripWhitespace = true;

  REQUIRE(stripComments("{\n  \"a b\": [1, 2] // c\n}\r\n", options) == "{\"a b\":[1,2]}");
  REQUIRE(stripComments("{\"a\": 1}") == "{\"a\": 1}");
}
