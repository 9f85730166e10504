// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Reindent, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#include <reindent/cli/cli_options.hpp>
#include <reindent/reindent.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>

namespace
{
/// \brief Human-readable failure line for stderr.
std::string describeFailure(const reindent::format::FormatOutcome &outcome)
{
  std::string what =
    outcome.status == reindent::format::FormatStatus::JsonFailed ? "Invalid JSON" : "Invalid XML";
  return what + " at line " + std::to_string(outcome.line) + ", column " +
         std::to_string(outcome.column) + ": " + outcome.message;
}
} // namespace

int main(int argc, char **argv)
{
  using namespace reindent;
  try
  {
    cli::CliOptions options = cli::parseCliArgs(argc, argv);
    if (options.showHelp)
    {
      cli::printHelp(std::cout);
      return EXIT_SUCCESS;
    }

    std::unique_ptr<core::ConfigLoader> configLoader;
    if (options.configFile)
    {
      configLoader = std::make_unique<core::ConfigLoader>(*options.configFile);
      cli::applyTomlConfig(options, *configLoader);
    }
    cli::initLogging(options);
    if (configLoader)
    {
      REINDENT_LOG_INFO("Using config file: " << configLoader->filename());
    }

    std::string input = options.inputFile ? util::readFile(*options.inputFile)
                                          : util::readStream(std::cin);
    format::Language language = cli::resolveLanguage(options);
    format::IndentConfig cfg = cli::resolveIndentConfig(options);

    format::FormatOutcome outcome = format::formatText(input, language, cfg);
    if (!outcome.ok())
    {
      std::cerr << "reindent: " << describeFailure(outcome) << std::endl;
      core::Logger::shutdown();
      return EXIT_FAILURE;
    }

    std::string bytes = std::move(outcome.text);
    if (outcome.status == format::FormatStatus::Formatted &&
        outcome.type == format::ContentType::XML)
    {
      bytes = format::encodeText(bytes, outcome.encoding);
    }
    else if (outcome.status == format::FormatStatus::Unsupported)
    {
      REINDENT_LOG_INFO("Input is neither XML nor JSON; leaving it unchanged");
    }

    if (options.inPlace)
    {
      util::writeFileAtomic(*options.inputFile, bytes);
    }
    else if (options.outputFile)
    {
      util::writeFileAtomic(*options.outputFile, bytes);
    }
    else
    {
      std::cout.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
      std::cout.flush();
    }
  }
  catch (const std::exception &ex)
  {
    std::cerr << "reindent: " << ex.what() << std::endl;
    core::Logger::shutdown();
    return EXIT_FAILURE;
  }

  core::Logger::shutdown();
  return EXIT_SUCCESS;
}
