// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Reindent, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <reindent/core/logger.hpp>
#include <reindent/format/comment_stripper.hpp>
#include <reindent/format/indent_config.hpp>
#include <reindent/parsers/json.hpp>

#include <string>
#include <string_view>

namespace reindent
{
namespace format
{
/// \brief Outcome of formatJson(). On failure \c text is empty.
struct JsonFormatResult
{
  std::string text;
  bool ok{false};
  parsers::JsonError error;
};

/// \brief Re-serialize JSON (comments allowed) with the configured indent
/// unit and key order.
///
/// Comments are stripped first; line breaks outside comments are kept so
/// that error positions stay close to the original text.
inline JsonFormatResult formatJson(std::string_view raw, const IndentConfig &cfg)
{
  JsonFormatResult result;

  std::string strict = stripComments(raw);
  auto parsed = parsers::Json::parse(strict);
  if (!parsed.ok)
  {
    result.error = parsed.error;
    REINDENT_LOG_DEBUG("Invalid JSON at line " << parsed.error.where.line << ", column "
                                               << parsed.error.where.column << ": "
                                               << parsed.error.message);
    return result;
  }

  parsers::SerializeOptions options;
  options.pretty = true;
  options.indent = cfg.jsonIndent;
  options.sortKeys = cfg.jsonSortKeys;
  result.text = parsed.value.serialize(options);
  result.ok = true;
  return result;
}

} // namespace format
} // namespace reindent
