// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Reindent, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstddef>
#include <string>

namespace reindent
{
namespace format
{
/// \brief Indentation unit of \p width spaces.
inline std::string indentWidth(std::size_t width) { return std::string(width, ' '); }

/// \brief Caller-supplied formatting options. Passed by value or const
/// reference into every formatting call; never looked up globally.
struct IndentConfig
{
  std::string jsonIndent{indentWidth(4)}; ///< Unit per JSON nesting level
  bool jsonSortKeys{false};               ///< Order JSON object members by key
  std::string xmlIndent{indentWidth(4)};  ///< Unit per XML nesting level
};

/// \brief Indent unit the XML writer produces before remapping.
inline const std::string &xmlBaselineIndent()
{
  static const std::string baseline = indentWidth(2);
  return baseline;
}

} // namespace format
} // namespace reindent
