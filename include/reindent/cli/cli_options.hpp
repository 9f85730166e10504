// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Reindent, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <reindent/core/config_loader.hpp>
#include <reindent/core/logger.hpp>
#include <reindent/format/dispatcher.hpp>
#include <reindent/format/indent_config.hpp>
#include <reindent/util/filesystem.hpp>

#include <cstddef>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

namespace reindent
{
namespace cli
{
/// \brief Command-line settings. Unset optionals fall back to the config
/// file, then to the built-in defaults.
struct CliOptions
{
  std::optional<std::string> configFile;
  std::optional<std::string> inputFile;
  std::optional<std::string> outputFile;
  std::optional<std::string> type;
  bool inPlace{false};
  bool showHelp{false};

  struct FormatConfig
  {
    std::optional<std::string> jsonIndent;
    std::optional<bool> jsonSortKeys;
    std::optional<std::string> xmlIndent;
  } format;

  struct LogConfig
  {
    std::optional<std::string> level;
    std::optional<std::string> file;
  } log;
};

/// \brief Print help message
inline void printHelp(std::ostream &out)
{
  out << "Usage: reindent [options] [file]\n"
      << "Re-indent an XML or JSON document. Reads stdin when no file is given.\n\n"
      << "  -h, --help                       Show this help message\n"
      << "  -c, --config <file>              Configuration file path (TOML)\n"
      << "  -t, --type <xml|json|plain|auto> Input type (default: from the file "
         "extension, else auto)\n"
      << "      --json-indent <n|string>     JSON indent width or literal unit "
         "(default: 4)\n"
      << "      --json-sortkeys              Sort JSON object keys\n"
      << "      --xml-indent <n|string>      XML indent width or literal unit "
         "(default: 4)\n"
      << "  -o, --output <file>              Write the result to a file\n"
      << "  -i, --in-place                   Rewrite the input file\n"
      << "  -l, --log-level <level>          Log level (trace, debug, info, "
         "warning, error, fatal)\n"
      << "  -f, --log-file <file>            Log file path (default: stderr)\n";
}

/// \brief Turn an indent argument into an indent unit: a run of digits is a
/// width in spaces, anything else is used literally with "\t" read as TAB.
inline std::string parseIndentArg(const std::string &arg)
{
  if (!arg.empty() && arg.find_first_not_of("0123456789") == std::string::npos)
  {
    try
    {
      return format::indentWidth(static_cast<std::size_t>(std::stoul(arg)));
    }
    catch (const std::exception &)
    {
      throw std::runtime_error("Invalid indent width: " + arg);
    }
  }
  std::string unit;
  for (std::size_t i = 0; i < arg.size(); ++i)
  {
    if (arg[i] == '\\' && i + 1 < arg.size() && arg[i + 1] == 't')
    {
      unit.push_back('\t');
      ++i;
    }
    else
    {
      unit.push_back(arg[i]);
    }
  }
  return unit;
}

/// \brief Parse command-line arguments.
/// \throws std::runtime_error for unknown options, missing values or a second
/// input file.
inline CliOptions parseCliArgs(int argc, const char *const *argv)
{
  CliOptions options;
  auto value = [&](int &i, const std::string &arg) -> std::string
  {
    if (i + 1 >= argc)
    {
      throw std::runtime_error("Missing value for option: " + arg);
    }
    return argv[++i];
  };

  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help")
    {
      options.showHelp = true;
    }
    else if (arg == "-c" || arg == "--config")
    {
      options.configFile = value(i, arg);
    }
    else if (arg == "-t" || arg == "--type")
    {
      options.type = value(i, arg);
    }
    else if (arg == "--json-indent")
    {
      options.format.jsonIndent = parseIndentArg(value(i, arg));
    }
    else if (arg == "--json-sortkeys")
    {
      options.format.jsonSortKeys = true;
    }
    else if (arg == "--xml-indent")
    {
      options.format.xmlIndent = parseIndentArg(value(i, arg));
    }
    else if (arg == "-o" || arg == "--output")
    {
      options.outputFile = value(i, arg);
    }
    else if (arg == "-i" || arg == "--in-place")
    {
      options.inPlace = true;
    }
    else if (arg == "-l" || arg == "--log-level")
    {
      options.log.level = value(i, arg);
    }
    else if (arg == "-f" || arg == "--log-file")
    {
      options.log.file = value(i, arg);
    }
    else if (arg.length() > 1 && arg[0] == '-')
    {
      throw std::runtime_error("Unknown option: " + arg);
    }
    else if (!options.inputFile.has_value())
    {
      options.inputFile = arg;
    }
    else
    {
      throw std::runtime_error("Only one input file may be given: " + arg);
    }
  }

  if (options.inPlace && !options.inputFile.has_value())
  {
    throw std::runtime_error("--in-place requires an input file");
  }
  if (options.inPlace && options.outputFile.has_value())
  {
    throw std::runtime_error("--in-place and --output are mutually exclusive");
  }
  return options;
}

/// \brief Fill the options the command line left unset from the TOML file.
/// \throws std::runtime_error if a value has the wrong type.
inline void applyTomlConfig(CliOptions &options, const core::ConfigLoader &loader)
{
  if (!options.format.jsonIndent.has_value())
  {
    options.format.jsonIndent = loader.getIndent("format.json_indent");
  }
  if (!options.format.jsonSortKeys.has_value())
  {
    options.format.jsonSortKeys = loader.getBool("format.json_sortkeys");
  }
  if (!options.format.xmlIndent.has_value())
  {
    options.format.xmlIndent = loader.getIndent("format.xml_indent");
  }
  if (!options.log.level.has_value())
  {
    options.log.level = loader.getString("log.level");
  }
  if (!options.log.file.has_value())
  {
    options.log.file = loader.getString("log.file");
  }
}

/// \brief Indent settings after command line and config file are merged.
inline format::IndentConfig resolveIndentConfig(const CliOptions &options)
{
  format::IndentConfig cfg;
  if (options.format.jsonIndent)
  {
    cfg.jsonIndent = *options.format.jsonIndent;
  }
  if (options.format.jsonSortKeys)
  {
    cfg.jsonSortKeys = *options.format.jsonSortKeys;
  }
  if (options.format.xmlIndent)
  {
    cfg.xmlIndent = *options.format.xmlIndent;
  }
  return cfg;
}

/// \brief Language hint: --type, else the input file extension, else plain
/// text (sniffed from the content).
inline format::Language resolveLanguage(const CliOptions &options)
{
  if (options.type.has_value())
  {
    const std::string &type = *options.type;
    if (type == "xml")
    {
      return format::Language::XML;
    }
    if (type == "json")
    {
      return format::Language::JSON;
    }
    if (type == "plain" || type == "auto")
    {
      return format::Language::PlainText;
    }
    throw std::runtime_error("Invalid type: " + type + " (expected xml, json, plain or auto)");
  }
  if (options.inputFile.has_value())
  {
    std::string ext = util::extensionOf(*options.inputFile);
    if (ext == ".xml")
    {
      return format::Language::XML;
    }
    if (ext == ".json")
    {
      return format::Language::JSON;
    }
  }
  return format::Language::PlainText;
}

/// \brief Configure the logger from the merged options.
inline void initLogging(const CliOptions &options)
{
  core::Logger::Level level = core::Logger::Level::Warning;
  if (options.log.level.has_value())
  {
    auto parsed = core::Logger::levelFromString(*options.log.level);
    if (!parsed)
    {
      throw std::runtime_error("Invalid log level: " + *options.log.level);
    }
    level = *parsed;
  }
  core::Logger::init(level, options.log.file.value_or(""));
}

} // namespace cli
} // namespace reindent
