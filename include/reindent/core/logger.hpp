// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Reindent, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <ctime>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <sstream>
#include <string>

namespace reindent
{
namespace core
{

namespace detail
{
  /// \brief Extract filename from full path at compile-time
  constexpr const char *basename(const char *path)
  {
    const char *file = path;
    while (*path)
    {
      if (*path == '/' || *path == '\\')
      {
        file = path + 1;
      }
      ++path;
    }
    return file;
  }
} // namespace detail

class LoggerStream;

/// \brief Thread-safe synchronous logger with levels, a configurable line
/// format and a file or stderr sink.
///
/// Formatted documents go to stdout, so the default sink is stderr. Pass a
/// file path to init() to log to a file instead.
class Logger
{
public:
  enum class Level
  {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Fatal
  };

  /// \brief External log handler: level, formatted line, raw message.
  using ExternalHandler = std::function<void(Level level, const std::string &formattedMessage,
                                             const std::string &rawMessage)>;

  struct Endl
  {
  };
  static inline constexpr Endl endl{};

  static void init(Level level = Level::Warning, const std::string &filePath = "",
                   const std::string &timeFormat = "%Y-%m-%d %H:%M:%S")
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);

    data.minLevel = level;
    data.timestampFormat = timeFormat;
    if (data.fileStream)
    {
      data.fileStream->flush();
      data.fileStream.reset();
    }
    if (!filePath.empty())
    {
      auto stream = std::make_unique<std::ofstream>(filePath, std::ios::app);
      if (!stream->is_open())
      {
        throw std::runtime_error("Failed to open log file: " + filePath);
      }
      data.fileStream = std::move(stream);
    }
  }

  static void flush()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    if (data.fileStream)
    {
      data.fileStream->flush();
    }
    else
    {
      std::clog.flush();
    }
  }

  static void shutdown()
  {
    flush();
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.fileStream.reset();
  }

  static void setLevel(Level level)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.minLevel = level;
  }

  static Level getLevel()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.minLevel;
  }

  /// \brief Register an external log handler. While set, nothing is written
  /// to the file or stderr sink.
  static void setExternalHandler(ExternalHandler handler)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = std::move(handler);
  }

  static void clearExternalHandler()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = nullptr;
  }

  /// \brief Set the line format.
  /// Supported placeholders:
  ///   %T - timestamp (strftime format given to init())
  ///   %L - log level (e.g. INFO, WARN)
  ///   %m - message content
  ///   %F - source file name, without directories
  ///   %l - source line number
  ///   %f - function name
  ///   %% - literal percent sign
  /// Source placeholders expand to nothing unless the REINDENT_LOG_* macros
  /// are used. Empty formats are ignored.
  static void setLogFormat(const std::string &format)
  {
    if (format.empty())
    {
      return;
    }
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.logFormat = format;
  }

  static std::string getLogFormat()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.logFormat;
  }

  /// \brief Parse a level name (trace, debug, info, warning/warn, error,
  /// fatal), ignoring case.
  static std::optional<Level> levelFromString(std::string name)
  {
    for (auto &ch : name)
    {
      if (ch >= 'A' && ch <= 'Z')
      {
        ch = static_cast<char>(ch - 'A' + 'a');
      }
    }
    if (name == "trace")
      return Level::Trace;
    if (name == "debug")
      return Level::Debug;
    if (name == "info")
      return Level::Info;
    if (name == "warning" || name == "warn")
      return Level::Warning;
    if (name == "error")
      return Level::Error;
    if (name == "fatal")
      return Level::Fatal;
    return std::nullopt;
  }

  static void trace(const std::string &message) { log(Level::Trace, message); }
  static void debug(const std::string &message) { log(Level::Debug, message); }
  static void info(const std::string &message) { log(Level::Info, message); }
  static void warning(const std::string &message) { log(Level::Warning, message); }
  static void error(const std::string &message) { log(Level::Error, message); }
  static void fatal(const std::string &message) { log(Level::Fatal, message); }

  static LoggerStream stream(Level level);

  static void log(Level level, const std::string &message)
  {
    log(level, message, nullptr, 0, nullptr);
  }

  /// \brief Log a message with source location information
  static void log(Level level, const std::string &message, const char *file, int line,
                  const char *function)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    if (level < data.minLevel)
    {
      return;
    }

    std::string output = formatLogMessage(data, level, message, file, line, function);
    if (data.externalHandler)
    {
      data.externalHandler(level, output, message);
    }
    else if (data.fileStream)
    {
      (*data.fileStream) << output;
      data.fileStream->flush();
    }
    else
    {
      std::clog << output;
    }
  }

  static const char *levelToString(Level level)
  {
    switch (level)
    {
    case Level::Trace:
      return "TRACE";
    case Level::Debug:
      return "DEBUG";
    case Level::Info:
      return "INFO";
    case Level::Warning:
      return "WARN";
    case Level::Error:
      return "ERROR";
    case Level::Fatal:
      return "FATAL";
    default:
      return "UNKNOWN";
    }
  }

private:
  struct LoggerData
  {
    std::mutex mutex;
    Level minLevel{Level::Warning};
    std::string timestampFormat{"%Y-%m-%d %H:%M:%S"};
    std::string logFormat{"[%T] [%L] %m"};
    std::unique_ptr<std::ofstream> fileStream;
    ExternalHandler externalHandler;
  };

  static LoggerData &getData()
  {
    static LoggerData data;
    return data;
  }

  static std::string timestamp(const std::string &format)
  {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, format.c_str());
    return oss.str();
  }

  // Caller holds data.mutex.
  static std::string formatLogMessage(const LoggerData &data, Level level,
                                      const std::string &message, const char *file, int line,
                                      const char *function)
  {
    std::string out;
    const std::string &format = data.logFormat;
    out.reserve(format.size() + message.size() + 32);
    for (std::size_t i = 0; i < format.size(); ++i)
    {
      if (format[i] != '%' || i + 1 >= format.size())
      {
        out.push_back(format[i]);
        continue;
      }
      char spec = format[++i];
      switch (spec)
      {
      case 'T':
        out += timestamp(data.timestampFormat);
        break;
      case 'L':
        out += levelToString(level);
        break;
      case 'm':
        out += message;
        break;
      case 'F':
        if (file)
        {
          out += detail::basename(file);
        }
        break;
      case 'l':
        if (file)
        {
          out += std::to_string(line);
        }
        break;
      case 'f':
        if (function)
        {
          out += function;
        }
        break;
      case '%':
        out.push_back('%');
        break;
      default:
        out.push_back('%');
        out.push_back(spec);
        break;
      }
    }
    out.push_back('\n');
    return out;
  }
};

/// \brief Stream interface for composing and emitting log messages with
/// levels.
class LoggerStream
{
public:
  explicit LoggerStream(Logger::Level level) : _level(level), _flushed(false) {}

  template <typename T> LoggerStream &operator<<(const T &value)
  {
    _stream << value;
    return *this;
  }

  LoggerStream &operator<<(Logger::Endl)
  {
    flush();
    return *this;
  }

  ~LoggerStream()
  {
    if (!_flushed && !_stream.str().empty())
    {
      flush();
    }
  }

private:
  Logger::Level _level;
  std::ostringstream _stream;
  bool _flushed;

  void flush()
  {
    Logger::log(_level, _stream.str());
    _flushed = true;
  }
};

/// \brief Proxy for streaming log messages at specific log levels.
class LoggerProxy
{
public:
  LoggerStream operator<<(Logger::Level level) { return Logger::stream(level); }
};

inline LoggerProxy Logger;

#define REINDENT_LOG_WITH_LEVEL(level, msg)                                                        \
  do                                                                                               \
  {                                                                                                \
    std::ostringstream _oss;                                                                       \
    _oss << msg;                                                                                   \
    reindent::core::Logger::log(reindent::core::Logger::Level::level, _oss.str(), __FILE__,        \
                                __LINE__, __func__);                                               \
  } while (0)

#define REINDENT_LOG_TRACE(msg) REINDENT_LOG_WITH_LEVEL(Trace, msg)
#define REINDENT_LOG_DEBUG(msg) REINDENT_LOG_WITH_LEVEL(Debug, msg)
#define REINDENT_LOG_INFO(msg) REINDENT_LOG_WITH_LEVEL(Info, msg)
#define REINDENT_LOG_WARN(msg) REINDENT_LOG_WITH_LEVEL(Warning, msg)
#define REINDENT_LOG_ERROR(msg) REINDENT_LOG_WITH_LEVEL(Error, msg)
#define REINDENT_LOG_FATAL(msg) REINDENT_LOG_WITH_LEVEL(Fatal, msg)

inline LoggerStream Logger::stream(Logger::Level level) { return LoggerStream(level); }

} // namespace core
} // namespace reindent
