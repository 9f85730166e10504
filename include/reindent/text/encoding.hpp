// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Reindent, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file encoding.hpp
/// \brief Charset helpers for the XML pipeline: encoding-label detection
/// from the XML prolog and conversion to/from UTF-8 through iconv.

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <iconv.h>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace reindent
{
namespace text
{
/// \brief Raised for unknown encoding labels and undecodable input.
class EncodingError : public std::runtime_error
{
public:
  explicit EncodingError(const std::string &msg) : std::runtime_error(msg) {}
};

inline const char *defaultEncoding() { return "utf-8"; }

inline std::string toLowerAscii(std::string_view s)
{
  std::string out(s);
  for (auto &ch : out)
  {
    if (ch >= 'A' && ch <= 'Z')
    {
      ch = static_cast<char>(ch - 'A' + 'a');
    }
  }
  return out;
}

/// \brief True for the labels that name UTF-8 itself.
inline bool isUtf8Label(std::string_view label)
{
  std::string lower = toLowerAscii(label);
  return lower == "utf-8" || lower == "utf8";
}

/// \brief First line of \p raw: everything before the first CR or LF.
inline std::string_view firstLine(std::string_view raw)
{
  std::size_t end = raw.find_first_of("\r\n");
  return end == std::string_view::npos ? raw : raw.substr(0, end);
}

/// \brief True if \p raw starts with a processing instruction that closes on
/// its first line ("<?" ... "?>").
inline bool hasXmlDeclaration(std::string_view raw)
{
  std::string_view line = firstLine(raw);
  return line.size() >= 4 && line.compare(0, 2, "<?") == 0 &&
         line.find("?>", 2) != std::string_view::npos;
}

/// \brief Encoding label declared on the first line of \p raw, lower-cased.
///
/// The first line must start with "<?" and contain `encoding=` followed by a
/// quoted label and, later, "?>". The keyword is matched ignoring ASCII case;
/// either quote character may open or close the label. When the line holds
/// several candidates the last one that satisfies the pattern wins.
inline std::optional<std::string> findDeclaredEncoding(std::string_view raw)
{
  std::string_view line = firstLine(raw);
  if (line.size() < 2 || line.compare(0, 2, "<?") != 0)
  {
    return std::nullopt;
  }

  std::string lower = toLowerAscii(line);
  static constexpr std::string_view keyword = "encoding=";
  std::size_t searchEnd = lower.size();
  while (searchEnd > 2)
  {
    std::size_t pos = lower.rfind(keyword, searchEnd - 1);
    if (pos == std::string::npos || pos < 2)
    {
      break;
    }
    searchEnd = pos;

    std::size_t open = pos + keyword.size();
    if (open >= line.size() || (line[open] != '"' && line[open] != '\''))
    {
      continue;
    }
    std::size_t close = line.find_first_of("\"'", open + 1);
    if (close == std::string_view::npos)
    {
      continue;
    }
    if (line.find("?>", close + 1) == std::string_view::npos)
    {
      continue;
    }
    std::string_view label = line.substr(open + 1, close - open - 1);
    if (label.empty())
    {
      continue;
    }
    return toLowerAscii(label);
  }
  return std::nullopt;
}

/// \brief True if the first line of \p raw declares an encoding.
inline bool declaresEncoding(std::string_view raw) { return findDeclaredEncoding(raw).has_value(); }

/// \brief findDeclaredEncoding() or "utf-8" when there is no declaration.
inline std::string detectDeclaredEncoding(std::string_view raw)
{
  return findDeclaredEncoding(raw).value_or(defaultEncoding());
}

/// \brief Validate UTF-8 (shortest forms only, no surrogates, <= U+10FFFF).
/// On failure \p badOffset receives the offset of the first bad byte.
inline bool isValidUtf8(std::string_view s, std::size_t *badOffset = nullptr)
{
  std::size_t i = 0;
  while (i < s.size())
  {
    unsigned char c = static_cast<unsigned char>(s[i]);
    std::size_t len = 0;
    std::uint32_t cp = 0;
    if (c < 0x80)
    {
      ++i;
      continue;
    }
    else if ((c & 0xE0) == 0xC0)
    {
      len = 2;
      cp = c & 0x1Fu;
    }
    else if ((c & 0xF0) == 0xE0)
    {
      len = 3;
      cp = c & 0x0Fu;
    }
    else if ((c & 0xF8) == 0xF0)
    {
      len = 4;
      cp = c & 0x07u;
    }
    else
    {
      if (badOffset)
        *badOffset = i;
      return false;
    }
    if (i + len > s.size())
    {
      if (badOffset)
        *badOffset = i;
      return false;
    }
    for (std::size_t k = 1; k < len; ++k)
    {
      unsigned char cc = static_cast<unsigned char>(s[i + k]);
      if ((cc & 0xC0) != 0x80)
      {
        if (badOffset)
          *badOffset = i;
        return false;
      }
      cp = (cp << 6) | (cc & 0x3Fu);
    }
    bool overlong = (len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
                    (len == 4 && cp < 0x10000);
    if (overlong || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
    {
      if (badOffset)
        *badOffset = i;
      return false;
    }
    i += len;
  }
  return true;
}

namespace detail
{
  /// \brief Map common label spellings that iconv does not know.
  inline std::string iconvName(std::string_view label)
  {
    std::string lower = toLowerAscii(label);
    if (lower == "latin-1" || lower == "latin1" || lower == "l1" || lower == "iso8859-1" ||
        lower == "iso_8859_1")
    {
      return "ISO-8859-1";
    }
    if (lower == "utf8")
    {
      return "UTF-8";
    }
    return std::string(label);
  }

  /// \brief Owning wrapper for an iconv conversion descriptor.
  class IconvHandle
  {
  public:
    IconvHandle(const std::string &to, const std::string &from)
    {
      _cd = ::iconv_open(iconvName(to).c_str(), iconvName(from).c_str());
      if (_cd == reinterpret_cast<iconv_t>(-1))
      {
        const std::string &unknown = isUtf8Label(to) ? from : to;
        throw EncodingError("unsupported encoding: " + unknown);
      }
    }

    ~IconvHandle() { ::iconv_close(_cd); }

    IconvHandle(const IconvHandle &) = delete;
    IconvHandle &operator=(const IconvHandle &) = delete;

    iconv_t get() const { return _cd; }

  private:
    iconv_t _cd;
  };

  /// \brief Decode the UTF-8 sequence at \p p (validated input) and return
  /// its code point; \p len receives the sequence length.
  inline std::uint32_t decodeUtf8At(const char *p, std::size_t avail, std::size_t &len)
  {
    unsigned char c = static_cast<unsigned char>(p[0]);
    std::uint32_t cp = c;
    len = 1;
    if ((c & 0xE0) == 0xC0)
    {
      len = 2;
      cp = c & 0x1Fu;
    }
    else if ((c & 0xF0) == 0xE0)
    {
      len = 3;
      cp = c & 0x0Fu;
    }
    else if ((c & 0xF8) == 0xF0)
    {
      len = 4;
      cp = c & 0x07u;
    }
    if (len > avail)
    {
      len = 1;
      return c;
    }
    for (std::size_t k = 1; k < len; ++k)
    {
      cp = (cp << 6) | (static_cast<unsigned char>(p[k]) & 0x3Fu);
    }
    return cp;
  }

  /// \brief Run \p input through \p cd, appending to \p out. With
  /// \p charRefFallback, characters the target cannot represent are written
  /// as XML numeric character references instead of failing.
  inline void convert(iconv_t cd, std::string_view input, std::string &out,
                      bool charRefFallback)
  {
    char buf[4096];
    char *inPtr = const_cast<char *>(input.data());
    std::size_t inLeft = input.size();

    while (inLeft > 0)
    {
      char *outPtr = buf;
      std::size_t outLeft = sizeof(buf);
      errno = 0;
      std::size_t rc = ::iconv(cd, &inPtr, &inLeft, &outPtr, &outLeft);
      out.append(buf, static_cast<std::size_t>(outPtr - buf));
      if (rc != static_cast<std::size_t>(-1))
      {
        continue;
      }
      int err = errno;
      std::size_t offset = input.size() - inLeft;
      if (err == E2BIG)
      {
        continue;
      }
      if (err == EILSEQ && charRefFallback)
      {
        std::size_t len = 0;
        std::uint32_t cp = decodeUtf8At(inPtr, inLeft, len);
        std::string ref = "&#" + std::to_string(cp) + ";";
        convert(cd, ref, out, false);
        inPtr += len;
        inLeft -= len;
        continue;
      }
      if (err == EINVAL)
      {
        throw EncodingError("incomplete multibyte sequence at offset " +
                            std::to_string(offset));
      }
      throw EncodingError("invalid byte sequence at offset " + std::to_string(offset) + ": " +
                          std::strerror(err));
    }

    char *outPtr = buf;
    std::size_t outLeft = sizeof(buf);
    ::iconv(cd, nullptr, nullptr, &outPtr, &outLeft);
    out.append(buf, static_cast<std::size_t>(outPtr - buf));
  }
} // namespace detail

/// \brief Decode \p bytes from \p encoding into UTF-8. A UTF-8 byte order
/// mark is dropped.
/// \throws EncodingError for unknown labels or bytes invalid in the encoding.
inline std::string toUtf8(std::string_view bytes, const std::string &encoding)
{
  if (isUtf8Label(encoding))
  {
    if (bytes.size() >= 3 && bytes.compare(0, 3, "\xEF\xBB\xBF") == 0)
    {
      bytes.remove_prefix(3);
    }
    std::size_t bad = 0;
    if (!isValidUtf8(bytes, &bad))
    {
      throw EncodingError("input is not valid UTF-8 (offset " + std::to_string(bad) + ")");
    }
    return std::string(bytes);
  }

  detail::IconvHandle cd("UTF-8", encoding);
  std::string out;
  out.reserve(bytes.size() + bytes.size() / 2);
  detail::convert(cd.get(), bytes, out, false);
  return out;
}

/// \brief Encode UTF-8 \p utf8 into \p encoding. Characters the encoding
/// cannot represent become numeric character references (&#NNN;).
/// \throws EncodingError for unknown labels.
inline std::string fromUtf8(std::string_view utf8, const std::string &encoding)
{
  if (isUtf8Label(encoding))
  {
    return std::string(utf8);
  }

  detail::IconvHandle cd(encoding, "UTF-8");
  std::string out;
  out.reserve(utf8.size());
  detail::convert(cd.get(), utf8, out, true);
  return out;
}

/// \brief Round-trip \p utf8 through \p encoding: the result is UTF-8 that
/// only contains characters the encoding can represent.
inline std::string restrictToCharset(std::string_view utf8, const std::string &encoding)
{
  if (isUtf8Label(encoding))
  {
    return std::string(utf8);
  }
  return toUtf8(fromUtf8(utf8, encoding), encoding);
}

} // namespace text
} // namespace reindent
