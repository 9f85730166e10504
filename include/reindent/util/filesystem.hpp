// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Reindent, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace reindent
{
namespace util
{
/// \brief Read a whole file as bytes.
/// \throws std::runtime_error if the file cannot be opened or read.
inline std::string readFile(const std::string &path)
{
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open())
  {
    throw std::runtime_error("Cannot open input file: " + path);
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  if (in.bad())
  {
    throw std::runtime_error("Failed to read input file: " + path);
  }
  return buf.str();
}

/// \brief Read all of \p in as bytes.
inline std::string readStream(std::istream &in)
{
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/// \brief Write \p bytes to \p path through a sibling temporary file that is
/// renamed over the target, so readers never see a half-written file.
/// \throws std::runtime_error on any I/O failure.
inline void writeFileAtomic(const std::string &path, const std::string &bytes)
{
  std::filesystem::path target(path);
  std::filesystem::path tmp = target;
  tmp += ".reindent.tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.is_open())
    {
      throw std::runtime_error("Cannot open output file: " + tmp.string());
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out)
    {
      throw std::runtime_error("Failed to write output file: " + tmp.string());
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp, target, ec);
  if (ec)
  {
    std::string reason = ec.message();
    std::filesystem::remove(tmp, ec);
    throw std::runtime_error("Cannot replace " + path + ": " + reason);
  }
}

/// \brief Lower-cased extension of \p path including the dot, or "".
inline std::string extensionOf(const std::string &path)
{
  std::string ext = std::filesystem::path(path).extension().string();
  for (auto &ch : ext)
  {
    if (ch >= 'A' && ch <= 'Z')
    {
      ch = static_cast<char>(ch - 'A' + 'a');
    }
  }
  return ext;
}

} // namespace util
} // namespace reindent
