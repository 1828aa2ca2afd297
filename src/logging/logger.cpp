#include "ssync/logging/logger.h"

#include <iostream>
#include <sstream>
#include <typeinfo>

#if defined(__GNUG__)
#include <cxxabi.h>
#include <cstdlib>
#endif

#if !defined(_WIN32)
#include <unistd.h>
#endif

#include "ssync/error.h"

namespace ssync::logging {

namespace {

constexpr std::string_view kGray{"\x1b[90m"};
constexpr std::string_view kRed{"\x1b[31m"};
constexpr std::string_view kYellow{"\x1b[33m"};
constexpr std::string_view kCyan{"\x1b[36m"};
constexpr std::string_view kReset{"\x1b[0m"};
constexpr int kContextIndent = 2;
constexpr std::string_view kContextMargin{"   "};

struct EmitReentrancyGuard {
  explicit EmitReentrancyGuard(bool& flag) : flag_(flag) { flag_ = true; }
  ~EmitReentrancyGuard() { flag_ = false; }
  EmitReentrancyGuard(const EmitReentrancyGuard&) = delete;
  EmitReentrancyGuard& operator=(const EmitReentrancyGuard&) = delete;

 private:
  bool& flag_;
};

std::string_view LevelColor(LogLevel level) {
  switch (level) {
  case LogLevel::kError:
    return kRed;
  case LogLevel::kWarn:
    return kYellow;
  case LogLevel::kInfo:
    return kCyan;
  case LogLevel::kDebug:
    return kGray;
  }
  return kReset;
}

std::string DemangledTypeName(const std::exception& error) {
  const char* raw = typeid(error).name();
#if defined(__GNUG__)
  int status = 0;
  char* demangled = abi::__cxa_demangle(raw, nullptr, nullptr, &status);
  if (status == 0 && demangled) {
    std::string name(demangled);
    std::free(demangled);
    return name;
  }
  std::free(demangled);
#endif
  return raw;
}

bool StreamIsTerminal(LogLevel level) {
#if defined(_WIN32)
  (void)level;
  return false;
#else
  return ::isatty(level == LogLevel::kError ? STDERR_FILENO : STDOUT_FILENO) == 1;
#endif
}

std::vector<redact::Value> MessageWithContext(std::string_view message, redact::Value context) {
  std::vector<redact::Value> args;
  args.emplace_back(message);
  if (!context.is_null()) {
    args.push_back(std::move(context));
  }
  return args;
}

}  // namespace

std::string_view LevelName(LogLevel level) {
  switch (level) {
  case LogLevel::kError:
    return "ERROR";
  case LogLevel::kWarn:
    return "WARN";
  case LogLevel::kInfo:
    return "INFO";
  case LogLevel::kDebug:
    return "DEBUG";
  }
  return "INFO";
}

Logger::Logger() : sinks_(std::make_shared<const SinkList>(SinkList{&ConsoleSink})) {}

Logger& Logger::Instance() {
  // Never destroyed; code running during exit may still log.
  static auto* instance = new Logger();
  return *instance;
}

void Logger::Configure(const LoggerOptions& options) {
  std::lock_guard<std::mutex> lock(mutex_);
  min_level_ = options.verbose ? LogLevel::kDebug : options.min_level;
}

LogLevel Logger::MinLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return min_level_;
}

bool Logger::Enabled(LogLevel level) const {
  return static_cast<int>(level) <= static_cast<int>(MinLevel());
}

void Logger::Error(std::string_view message, redact::Value context) {
  Emit(LogLevel::kError, MessageWithContext(message, std::move(context)));
}

void Logger::Warn(std::string_view message, redact::Value context) {
  Emit(LogLevel::kWarn, MessageWithContext(message, std::move(context)));
}

void Logger::Info(std::string_view message, redact::Value context) {
  Emit(LogLevel::kInfo, MessageWithContext(message, std::move(context)));
}

void Logger::Debug(std::string_view message, redact::Value context) {
  Emit(LogLevel::kDebug, MessageWithContext(message, std::move(context)));
}

void Logger::LogError(const std::exception& error, std::shared_ptr<redact::Record> additional) {
  auto context = redact::MakeRecord();
  context->Set("message", redact::Value(error.what()));
  context->Set("name", redact::Value(DemangledTypeName(error)));
  if (const auto* framework = dynamic_cast<const ssync::Error*>(&error)) {
    context->Set("code", redact::Value(framework->code));
    if (!framework->context.empty()) {
      auto details = redact::MakeSequence();
      for (const auto& entry : framework->context) {
        details->items.emplace_back(entry);
      }
      context->Set("details", redact::Value(std::move(details)));
    }
  }
  if (additional) {
    for (const auto& [key, value] : additional->fields) {
      context->Set(key, value);
    }
  }
  Error("Error occurred", redact::Value(std::move(context)));
}

void Logger::Emit(LogLevel level, std::vector<redact::Value> args) {
  static thread_local bool in_emit = false;
  if (in_emit) {
    std::clog << "[logger] recursive log call suppressed" << std::endl;
    return;
  }
  EmitReentrancyGuard guard(in_emit);

  std::shared_ptr<const ArgumentFilter> filter;
  std::shared_ptr<const SinkList> sinks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) > static_cast<int>(min_level_)) {
      return;
    }
    filter = filter_;
    sinks = sinks_;
  }

  LogRecord record;
  record.level = level;
  record.timestamp = std::chrono::system_clock::now();
  record.args.reserve(args.size());
  for (auto& arg : args) {
    record.args.push_back(filter && *filter ? (*filter)(arg) : std::move(arg));
  }
  if (sinks) {
    for (const auto& sink : *sinks) {
      if (sink) {
        sink(record);
      }
    }
  }
}

void Logger::SetArgumentFilter(ArgumentFilter filter) {
  auto updated = std::make_shared<const ArgumentFilter>(std::move(filter));
  std::lock_guard<std::mutex> lock(mutex_);
  filter_ = std::move(updated);
}

bool Logger::HasArgumentFilter() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return filter_ && *filter_;
}

void Logger::Subscribe(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto updated = sinks_ ? std::make_shared<SinkList>(*sinks_) : std::make_shared<SinkList>();
  updated->push_back(std::move(sink));
  sinks_ = std::move(updated);
}

void Logger::ReplaceSinksForTesting(std::vector<Sink> sinks) {
  auto updated = std::make_shared<const SinkList>(std::move(sinks));
  std::lock_guard<std::mutex> lock(mutex_);
  sinks_ = std::move(updated);
}

std::string FormatConsoleRecord(const LogRecord& record, bool color) {
  const auto paint = [color](std::string_view code) { return color ? code : std::string_view{}; };

  std::string line;
  line.append(paint(kGray)).append("[").append(redact::FormatIsoTimestamp(record.timestamp)).append("]");
  line.append(paint(kReset)).append(" ");
  line.append(paint(LevelColor(record.level))).append("[").append(LevelName(record.level)).append("]");
  line.append(paint(kReset));

  std::string context_blocks;
  for (const auto& arg : record.args) {
    if (arg.is_record() || arg.is_sequence()) {
      std::istringstream rendered(redact::RenderJson(arg, kContextIndent));
      context_blocks.append("\n").append(paint(kGray)).append("Context:").append(paint(kReset));
      std::string json_line;
      while (std::getline(rendered, json_line)) {
        context_blocks.append("\n").append(kContextMargin).append(json_line);
      }
    } else {
      line.append(" ").append(redact::RenderDisplay(arg));
    }
  }
  line.append(context_blocks);
  return line;
}

void ConsoleSink(const LogRecord& record) {
  auto& stream = record.level == LogLevel::kError ? std::cerr : std::cout;
  stream << FormatConsoleRecord(record, StreamIsTerminal(record.level)) << std::endl;
}

}  // namespace ssync::logging
