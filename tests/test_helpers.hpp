// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Shared test helpers for the Reindent test suite

#pragma once

#include "reindent/reindent.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

namespace reindent::test
{

/// \brief Automatic logger initialization for tests
struct LoggerInit
{
  LoggerInit() { reindent::core::Logger::setLevel(reindent::core::Logger::Level::Error); }
};

/// \brief Static logger initializer - call once per test executable
inline void initializeTestLogging()
{
  static LoggerInit init;
  (void)init;
}

/// \brief File written on construction and removed when the scope ends.
class TempFile
{
public:
  TempFile(const std::string &name, const std::string &contents) : _path(name)
  {
    std::ofstream out(_path, std::ios::binary | std::ios::trunc);
    out << contents;
  }

  ~TempFile()
  {
    std::error_code ec;
    std::filesystem::remove(_path, ec);
  }

  TempFile(const TempFile &) = delete;
  TempFile &operator=(const TempFile &) = delete;

  const std::string &path() const { return _path; }

private:
  std::string _path;
};

/// \brief Contents of \p path, or "" if it cannot be read.
inline std::string slurp(const std::string &path)
{
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/// \brief Indent config with the given units.
inline reindent::format::IndentConfig makeConfig(const std::string &xmlIndent,
                                                 const std::string &jsonIndent = "    ",
                                                 bool sortKeys = false)
{
  reindent::format::IndentConfig cfg;
  cfg.xmlIndent = xmlIndent;
  cfg.jsonIndent = jsonIndent;
  cfg.jsonSortKeys = sortKeys;
  return cfg;
}

} // namespace reindent::test
