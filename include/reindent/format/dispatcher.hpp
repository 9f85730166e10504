// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Reindent, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <reindent/core/logger.hpp>
#include <reindent/format/indent_config.hpp>
#include <reindent/format/json_formatter.hpp>
#include <reindent/format/xml_formatter.hpp>
#include <reindent/text/encoding.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace reindent
{
namespace format
{
/// \brief Language the caller believes the text is in.
enum class Language
{
  XML,
  JSON,
  PlainText,
  Other
};

/// \brief Pipeline chosen for a sample.
enum class ContentType
{
  XML,
  JSON,
  Unsupported
};

enum class FormatStatus
{
  Formatted,
  Unsupported, ///< Not XML or JSON; \c text holds the input unchanged
  JsonFailed,
  XmlFailed
};

/// \brief Result of formatText(). Failures carry the message and position
/// and leave \c text empty.
struct FormatOutcome
{
  FormatStatus status{FormatStatus::Unsupported};
  ContentType type{ContentType::Unsupported};
  std::string text;
  std::string encoding{text::defaultEncoding()}; ///< Charset of an XML document
  std::string message;
  std::size_t line{0};
  std::size_t column{0};

  bool ok() const { return status == FormatStatus::Formatted || status == FormatStatus::Unsupported; }
};

inline const char *toString(ContentType type)
{
  switch (type)
  {
  case ContentType::XML:
    return "xml";
  case ContentType::JSON:
    return "json";
  case ContentType::Unsupported:
    return "unsupported";
  }
  return "unsupported";
}

/// \brief Map an editor syntax name to a Language, ignoring ASCII case.
inline Language languageFromName(std::string_view name)
{
  std::string lower = text::toLowerAscii(name);
  if (lower == "xml")
  {
    return Language::XML;
  }
  if (lower == "json")
  {
    return Language::JSON;
  }
  if (lower == "plain text" || lower == "plaintext" || lower == "plain" || lower == "text")
  {
    return Language::PlainText;
  }
  return Language::Other;
}

/// \brief \p s without leading and trailing ASCII whitespace.
inline std::string_view trim(std::string_view s)
{
  static constexpr std::string_view spaces = " \t\r\n\f\v";
  std::size_t first = s.find_first_not_of(spaces);
  if (first == std::string_view::npos)
  {
    return std::string_view{};
  }
  std::size_t last = s.find_last_not_of(spaces);
  return s.substr(first, last - first + 1);
}

/// \brief Pick the pipeline for \p sample.
///
/// XML and JSON hints are trusted. For plain text the first non-whitespace
/// character decides: '<' is XML, '{' or '[' is JSON. Anything else,
/// including other languages, is Unsupported.
inline ContentType classify(std::string_view sample, Language declaredLanguage)
{
  switch (declaredLanguage)
  {
  case Language::XML:
    return ContentType::XML;
  case Language::JSON:
    return ContentType::JSON;
  case Language::PlainText:
  {
    std::string_view trimmed = trim(sample);
    if (trimmed.empty())
    {
      return ContentType::Unsupported;
    }
    switch (trimmed.front())
    {
    case '<':
      return ContentType::XML;
    case '{':
    case '[':
      return ContentType::JSON;
    default:
      return ContentType::Unsupported;
    }
  }
  case Language::Other:
    return ContentType::Unsupported;
  }
  return ContentType::Unsupported;
}

/// \brief Single formatting entry point: trim, classify, run the pipeline.
inline FormatOutcome formatText(std::string_view input, Language declaredLanguage,
                                const IndentConfig &cfg)
{
  FormatOutcome outcome;
  std::string_view trimmed = trim(input);
  outcome.type = classify(trimmed, declaredLanguage);
  REINDENT_LOG_DEBUG("Classified input as " << toString(outcome.type));

  switch (outcome.type)
  {
  case ContentType::JSON:
  {
    auto result = formatJson(trimmed, cfg);
    if (!result.ok)
    {
      outcome.status = FormatStatus::JsonFailed;
      outcome.message = result.error.message;
      outcome.line = result.error.where.line;
      outcome.column = result.error.where.column;
      REINDENT_LOG_WARN("JSON formatting failed: " << outcome.message);
      return outcome;
    }
    outcome.status = FormatStatus::Formatted;
    outcome.text = std::move(result.text);
    return outcome;
  }
  case ContentType::XML:
  {
    auto result = formatXml(trimmed, cfg);
    outcome.encoding = result.encoding;
    if (!result.ok)
    {
      outcome.status = FormatStatus::XmlFailed;
      outcome.message = result.error.message;
      outcome.line = result.error.line;
      outcome.column = result.error.column;
      REINDENT_LOG_WARN("XML formatting failed: " << outcome.message);
      return outcome;
    }
    outcome.status = FormatStatus::Formatted;
    outcome.text = std::move(result.text);
    return outcome;
  }
  case ContentType::Unsupported:
    break;
  }

  outcome.status = FormatStatus::Unsupported;
  outcome.text = std::string(input);
  return outcome;
}

} // namespace format
} // namespace reindent
