// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Reindent, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "reindent/parsers/json.hpp"
#include <catch2/catch.hpp>
#include <string>
#include <vector>

using namespace reindent::parsers;

TEST_CASE("JSON Parser - Basic Type Construction", "[json][basic]")
{
  SECTION("Null construction")
  {
    Json j;
    REQUIRE(j.isNull());
    REQUIRE_FALSE(j.isBool());
    REQUIRE_FALSE(j.isNumber());
    REQUIRE(j.type() == JsonType::Null);
  }

  SECTION("Scalar construction")
  {
    REQUIRE(Json(true).getBool());
    REQUIRE(Json(42).getInt() == 42);
    REQUIRE(Json(2.5).getDouble() == 2.5);
    REQUIRE(Json("text").getString() == "text");
    REQUIRE(Json(RawNumber{"1e400"}).isNumber());
  }

  SECTION("Containers")
  {
    Json obj = Json::object();
    obj["b"] = 1;
    obj["a"] = 2;
    REQUIRE(obj.isObject());
    REQUIRE(obj.size() == 2);
    REQUIRE(obj.contains("a"));
    REQUIRE(obj.dump() == R"({"b":1,"a":2})");

    Json arr = Json::array();
    arr.push_back(Json(1));
    arr.push_back(Json("x"));
    REQUIRE(arr.size() == 2);
    REQUIRE(arr[1].getString() == "x");
  }
}

TEST_CASE("JSON Parser - Parsing Values", "[json][parse]")
{
  SECTION("Literals and numbers")
  {
    auto r = Json::parse(R"([null, true, false, 0, -12, 3.25, 1e2])");
    REQUIRE(r.ok);
    const auto &arr = r.value.getArray();
    REQUIRE(arr.size() == 7);
    REQUIRE(arr[0].isNull());
    REQUIRE(arr[1].getBool());
    REQUIRE_FALSE(arr[2].getBool());
    REQUIRE(arr[3].getInt() == 0);
    REQUIRE(arr[4].getInt() == -12);
    REQUIRE(arr[5].getDouble() == 3.25);
    REQUIRE(arr[6].getDouble() == 100.0);
  }

  SECTION("Integers beyond int64 keep their digits")
  {
    auto r = Json::parse("[12345678901234567890, -98765432109876543210]");
    REQUIRE(r.ok);
    REQUIRE(r.value[0].isRawNumber());
    REQUIRE(r.value[0].getRawNumber().text == "12345678901234567890");
    REQUIRE(r.value[1].getRawNumber().text == "-98765432109876543210");
  }

  SECTION("Doubles that overflow keep their literal text")
  {
    auto r = Json::parse("1e400");
    REQUIRE(r.ok);
    REQUIRE(r.value.isRawNumber());
    REQUIRE(r.value.serialize() == "1e400");
  }

  SECTION("String escapes and surrogate pairs")
  {
    auto r = Json::parse(R"("a\"b\\c\/d\n\u00e9\ud83d\ude00")");
    REQUIRE(r.ok);
    REQUIRE(r.value.getString() == "a\"b\\c/d\n\xC3\xA9\xF0\x9F\x98\x80");
  }

  SECTION("Object keeps insertion order")
  {
    auto r = Json::parse(R"({"z": 1, "a": 2, "m": 3})");
    REQUIRE(r.ok);
    std::vector<std::string> keys;
    for (const auto &member : r.value.getObject())
    {
      keys.push_back(member.first);
    }
    REQUIRE(keys == std::vector<std::string>{"z", "a", "m"});
  }

  SECTION("Duplicate keys keep the first position and the last value")
  {
    auto r = Json::parse(R"({"a": 1, "b": 2, "a": 3})");
    REQUIRE(r.ok);
    REQUIRE(r.value.size() == 2);
    REQUIRE(r.value.dump() == R"({"a":3,"b":2})");
  }
}

TEST_CASE("JSON Parser - Rejected Input", "[json][errors]")
{
  const std::vector<std::string> bad = {
    "",
    "{",
    R"({"a":})",
    R"([1, 2,])",
    R"({"a": 1,})",
    "NaN",
    "Infinity",
    "-Infinity",
    "01",
    "1.",
    ".5",
    R"({key: 1})",
    R"(['single'])",
    R"("\ud800")",
    R"("\udc00x")",
    "\"tab\there\"",
    R"("\x41")",
    "[1] [2]",
    "/* comment */ 1",
  };

  for (const auto &text : bad)
  {
    INFO("input: " << text);
    auto r = Json::parse(text);
    REQUIRE_FALSE(r.ok);
    REQUIRE_FALSE(r.error.message.empty());
  }
}

TEST_CASE("JSON Parser - Error Location", "[json][errors][location]")
{
  auto r = Json::parse("{\n  \"a\": 1,\n  \"b\": }");
  REQUIRE_FALSE(r.ok);
  REQUIRE(r.error.where.line == 3);
  REQUIRE(r.error.where.column > 1);

  REQUIRE_THROWS_AS(Json::parseOrThrow("[1,"), Json::parse_error);
  REQUIRE_NOTHROW(Json::parseOrThrow("[1]"));
}

TEST_CASE("JSON Parser - Depth Limit", "[json][limits]")
{
  ParseLimits limits;
  limits.depthMax = 3;

  REQUIRE(Json::parse("[[[[]]]]", limits).ok);
  REQUIRE_FALSE(Json::parse("[[[[[]]]]]", limits).ok);
}

TEST_CASE("JSON Serializer - Layout", "[json][serialize]")
{
  auto r = Json::parse(R"({"b": [1, {"y": null, "x": true}], "a": {}, "c": []})");
  REQUIRE(r.ok);

  SECTION("Compact")
  {
    REQUIRE(r.value.dump() == R"({"b":[1,{"y":null,"x":true}],"a":{},"c":[]})");
  }

  SECTION("Pretty with a two-space unit")
  {
    std::string expected = "{\n"
                           "  \"b\": [\n"
                           "    1,\n"
                           "    {\n"
                           "      \"y\": null,\n"
                           "      \"x\": true\n"
                           "    }\n"
                           "  ],\n"
                           "  \"a\": {},\n"
                           "  \"c\": []\n"
                           "}";
    REQUIRE(r.value.dump(2) == expected);
  }

  SECTION("Sorted keys at every level")
  {
    REQUIRE(r.value.dump(-1, ' ', true) == R"({"a":{},"b":[1,{"x":true,"y":null}],"c":[]})");
  }

  SECTION("Literal indent unit")
  {
    SerializeOptions opts;
    opts.pretty = true;
    opts.indent = "\t";
    REQUIRE(Json::parse("[1]").value.serialize(opts) == "[\n\t1\n]");
  }
}

TEST_CASE("JSON Serializer - Scalars", "[json][serialize][scalars]")
{
  SECTION("Doubles use the shortest round-trip form")
  {
    REQUIRE(Json::formatDouble(1.0) == "1.0");
    REQUIRE(Json::formatDouble(100.0) == "100.0");
    REQUIRE(Json::formatDouble(0.1) == "0.1");
    REQUIRE(Json::formatDouble(-0.5) == "-0.5");
    REQUIRE(Json::formatDouble(3.25) == "3.25");
    REQUIRE(Json::formatDouble(0.0001) == "0.0001");
    REQUIRE(Json::formatDouble(0.00001) == "1e-05");
    REQUIRE(Json::formatDouble(1e16) == "1e+16");
    REQUIRE(Json::formatDouble(123456789012345.0) == "123456789012345.0");
  }

  SECTION("Only quotes, backslashes and control characters are escaped")
  {
    std::string out;
    Json::escapeString("q\"b\\\n\t\x01/\xC3\xA9", out);
    REQUIRE(out == "\"q\\\"b\\\\\\n\\t\\u0001/\xC3\xA9\"");
  }
}
