#include "ssync/error.h"
#include "ssync/logging/logger.h"
#include "ssync/redact/redactor.h"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using ssync::logging::LogLevel;
using ssync::logging::Logger;
using ssync::logging::LogRecord;
using ssync::redact::Value;

namespace {

std::vector<LogRecord>& Recorded() {
  static std::vector<LogRecord> records;
  return records;
}

void RecordingSink(const LogRecord& record) {
  Recorded().push_back(record);
}

void ResetLogger() {
  auto& logger = Logger::Instance();
  logger.ReplaceSinksForTesting({&RecordingSink});
  logger.SetArgumentFilter(nullptr);
  logger.Configure({});
  Recorded().clear();
}

void TestLevels() {
  ResetLogger();
  auto& logger = Logger::Instance();
  logger.Debug("hidden");
  logger.Info("shown");
  logger.Warn("warned");
  logger.Error("failed");
  assert(Recorded().size() == 3);
  assert(Recorded()[0].level == LogLevel::kInfo);
  assert(Recorded()[0].args.size() == 1);
  assert(Recorded()[0].args[0].as_string() == "shown");
  assert(Recorded()[2].level == LogLevel::kError);

  logger.Configure({true, LogLevel::kError});
  assert(logger.Enabled(LogLevel::kDebug));
  logger.Debug("visible now");
  assert(Recorded().size() == 4);

  logger.Configure({false, LogLevel::kError});
  logger.Warn("dropped");
  assert(Recorded().size() == 4);
}

void TestFilterRunsOnEveryArgument() {
  ResetLogger();
  auto& logger = Logger::Instance();
  logger.SetArgumentFilter([](const Value& argument) {
    return ssync::redact::GetRedactorShared()->RedactArgument(argument);
  });
  assert(logger.HasArgumentFilter());

  auto context = ssync::redact::MakeRecord();
  context->Set("password", Value("hunter2"));
  context->Set("user", Value("alice"));
  logger.Info("API_KEY=abc", Value(context));
  logger.Log(LogLevel::kWarn, "first", "TOKEN=xyz", 7);

  assert(Recorded().size() == 2);
  const auto& info = Recorded()[0];
  assert(info.args[0].as_string() == "API_KEY=[REDACTED]");
  const auto redacted = info.args[1].as_record();
  assert(redacted->Find("password")->as_string() == "[REDACTED]");
  assert(redacted->Find("user")->as_string() == "alice");
  // The caller's record is untouched.
  assert(context->Find("password")->as_string() == "hunter2");

  const auto& warn = Recorded()[1];
  assert(warn.args.size() == 3);
  assert(warn.args[1].as_string() == "TOKEN=[REDACTED]");
  assert(warn.args[2].as_integer() == 7);
}

void TestLogError() {
  ResetLogger();
  auto& logger = Logger::Instance();
  const ssync::Error err(ssync::ErrorDomain::IO, ssync::errors::io::kWriteFailed, "write failed",
                         std::nullopt, {"stdout"});
  auto extra = ssync::redact::MakeRecord();
  extra->Set("attempt", Value(2));
  logger.LogError(err, extra);

  assert(Recorded().size() == 1);
  const auto& record = Recorded()[0];
  assert(record.level == LogLevel::kError);
  assert(record.args[0].as_string() == "Error occurred");
  const auto context = record.args[1].as_record();
  assert(context->Find("message")->as_string() == "write failed");
  assert(context->Find("name")->as_string() == "ssync::Error");
  assert(context->Find("code")->as_integer() == ssync::errors::io::kWriteFailed);
  assert(context->Find("details")->as_sequence()->items[0].as_string() == "stdout");
  assert(context->Find("attempt")->as_integer() == 2);

  logger.LogError(std::runtime_error("plain"));
  assert(Recorded()[1].args[1].as_record()->Find("code") == nullptr);
}

void TestReentrantEmitSuppressed() {
  ResetLogger();
  auto& logger = Logger::Instance();
  int calls = 0;
  logger.ReplaceSinksForTesting({[&calls](const LogRecord&) {
    ++calls;
    Logger::Instance().Info("from inside a sink");
  }});
  logger.Info("outer");
  assert(calls == 1);
}

void TestConsoleFormat() {
  LogRecord record;
  record.level = LogLevel::kWarn;
  record.args.emplace_back("disk nearly full");
  auto context = ssync::redact::MakeRecord();
  context->Set("free", Value(5));
  record.args.emplace_back(context);

  const std::string line = ssync::logging::FormatConsoleRecord(record, false);
  assert(line.rfind("[", 0) == 0);
  assert(line.find("] [WARN] disk nearly full") != std::string::npos);
  assert(line.find("\nContext:\n   {\n     \"free\": 5\n   }") != std::string::npos);
  assert(line.find("\x1b[") == std::string::npos);

  const std::string colored = ssync::logging::FormatConsoleRecord(record, true);
  assert(colored.find("\x1b[33m[WARN]") != std::string::npos);
  assert(ssync::logging::LevelName(LogLevel::kDebug) == "DEBUG");
}

} // namespace

int main() {
  TestLevels();
  TestFilterRunsOnEveryArgument();
  TestLogError();
  TestReentrantEmitSuppressed();
  TestConsoleFormat();
  ResetLogger();
  std::cout << "logger tests ok\n";
  return 0;
}
