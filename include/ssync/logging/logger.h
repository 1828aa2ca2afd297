#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ssync/redact/value.h"

namespace ssync::logging {

enum class LogLevel { kError = 0, kWarn = 1, kInfo = 2, kDebug = 3 };

struct LoggerOptions {
  bool verbose{false};  // forces kDebug
  LogLevel min_level{LogLevel::kInfo};
};

struct LogRecord {
  LogLevel level{LogLevel::kInfo};
  std::chrono::system_clock::time_point timestamp{};
  std::vector<redact::Value> args;  // positional arguments, message first
};

// Applied to every positional argument before any sink sees the record.
using ArgumentFilter = std::function<redact::Value(const redact::Value&)>;

// Process-wide structured logger. Every emitting method, present or added
// later, funnels through Emit(), which is where the argument filter runs.
class Logger {
 public:
  using Sink = std::function<void(const LogRecord&)>;

  static Logger& Instance();

  void Configure(const LoggerOptions& options);
  LogLevel MinLevel() const;
  bool Enabled(LogLevel level) const;

  template <typename... Args>
  void Log(LogLevel level, Args&&... args) {
    std::vector<redact::Value> values;
    values.reserve(sizeof...(Args));
    (values.emplace_back(std::forward<Args>(args)), ...);
    Emit(level, std::move(values));
  }

  void Error(std::string_view message, redact::Value context = {});
  void Warn(std::string_view message, redact::Value context = {});
  void Info(std::string_view message, redact::Value context = {});
  void Debug(std::string_view message, redact::Value context = {});

  // Logs "Error occurred" with the exception message, its type and
  // `additional` fields as context.
  void LogError(const std::exception& error, std::shared_ptr<redact::Record> additional = nullptr);

  void Emit(LogLevel level, std::vector<redact::Value> args);

  void SetArgumentFilter(ArgumentFilter filter);
  bool HasArgumentFilter() const;

  void Subscribe(Sink sink);
  void ReplaceSinksForTesting(std::vector<Sink> sinks);

 private:
  Logger();

  using SinkList = std::vector<Sink>;

  mutable std::mutex mutex_;
  LogLevel min_level_{LogLevel::kInfo};
  std::shared_ptr<const ArgumentFilter> filter_;
  std::shared_ptr<const SinkList> sinks_;
};

std::string_view LevelName(LogLevel level);

// "[ts] [LEVEL] message" followed by an indented "Context:" block for each
// record or sequence argument.
std::string FormatConsoleRecord(const LogRecord& record, bool color);

// Default sink: errors to std::cerr, everything else to std::cout.
void ConsoleSink(const LogRecord& record);

}  // namespace ssync::logging
