#include <cerrno>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "ssync/diagnostics/error_messages.h"
#include "ssync/error.h"
#include "ssync/errors.h"
#include "ssync/guard/output_guard.h"
#include "ssync/logging/logger.h"
#include "ssync/redact/redaction_cache.h"
#include "ssync/security/zeroizer.h"

#ifndef SSYNC_VERSION
#define SSYNC_VERSION "0.0.0"
#endif

namespace {

constexpr int kExitOk = 0;
constexpr int kExitInput = 1;
constexpr int kExitUsage = 2;

constexpr std::string_view kStdinMarker{"-"};

struct Options {
  bool verbose{false};
  bool help{false};
  bool version{false};
  std::vector<std::string> inputs;
};

void PrintUsage(std::ostream& out) {
  out << "ssync-scrub " << SSYNC_VERSION << "\n";
  out << "Usage:\n";
  out << "  ssync-scrub [--verbose] [file ...]\n";
  out << "\nCopies each file (or standard input when none is given, or for '-') to\n";
  out << "standard output with secret values redacted.\n";
  out << "\nFlags:\n";
  out << "  --verbose   Log debug details to the console\n";
  out << "  --help      Show this help\n";
  out << "  --version   Print the version\n";
}

std::optional<Options> ParseArguments(int argc, char** argv) {
  Options options;
  bool only_inputs = false;
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (!only_inputs && arg == "--") {
      only_inputs = true;
      continue;
    }
    if (!only_inputs && arg.size() > 1 && arg.front() == '-') {
      if (arg == "--verbose" || arg == "-v") {
        options.verbose = true;
      } else if (arg == "--help" || arg == "-h") {
        options.help = true;
      } else if (arg == "--version") {
        options.version = true;
      } else {
        std::cerr << "Unknown option: " << arg << "\n";
        return std::nullopt;
      }
      continue;
    }
    options.inputs.emplace_back(arg);
  }
  if (options.inputs.empty()) {
    options.inputs.emplace_back(kStdinMarker);
  }
  return options;
}

std::string ReadInput(const std::string& name) {
  if (name == kStdinMarker) {
    std::ostringstream buffer;
    buffer << std::cin.rdbuf();
    if (std::cin.bad()) {
      throw ssync::Error(ssync::ErrorDomain::IO,
                         ssync::errors::io::kInputUnreadable,
                         std::string(ssync::errors::msg::kInputUnreadable),
                         std::nullopt,
                         {"<stdin>"});
    }
    return buffer.str();
  }
  std::ifstream in(name, std::ios::binary);
  if (!in) {
    const int saved_errno = errno;
    if (saved_errno == EACCES) {
      throw ssync::diagnostics::PermissionError(name, ssync::diagnostics::FileOperation::kRead,
                                                "chmod u+r " + name);
    }
    throw ssync::Error(ssync::ErrorDomain::IO,
                       ssync::errors::io::kInputUnreadable,
                       std::string(ssync::errors::msg::kInputUnreadable),
                       saved_errno,
                       {name, std::generic_category().message(saved_errno)});
  }
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void CopyRedacted(const std::string& name) {
  auto& logger = ssync::logging::Logger::Instance();
  auto context = ssync::redact::MakeRecord();
  context->Set("input", ssync::redact::Value(name == kStdinMarker ? std::string("<stdin>") : name));
  logger.Debug("Scrubbing input", ssync::redact::Value(context));

  std::string content = ReadInput(name);
  ssync::security::Zeroizer::ScopeWiper wiper(content);
  std::cout << content;
  std::cout.flush();
  if (!std::cout) {
    throw ssync::Error(ssync::ErrorDomain::IO,
                       ssync::errors::io::kWriteFailed,
                       std::string(ssync::errors::msg::kWriteFailed));
  }
  context->Set("bytes", ssync::redact::Value(content.size()));
  logger.Debug("Input scrubbed", ssync::redact::Value(context));
}

}  // namespace

int main(int argc, char** argv) {
  ssync::guard::InstallOutputGuard();
  ssync::redact::ScopedCacheClear cache_scope;

  auto options = ParseArguments(argc, argv);
  if (!options) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  if (options->help) {
    PrintUsage(std::cout);
    return kExitOk;
  }
  if (options->version) {
    std::cout << "ssync-scrub " << SSYNC_VERSION << std::endl;
    return kExitOk;
  }

  auto& logger = ssync::logging::Logger::Instance();
  logger.Configure({options->verbose, ssync::logging::LogLevel::kInfo});

  int status = kExitOk;
  for (const auto& input : options->inputs) {
    try {
      CopyRedacted(input);
    } catch (const ssync::diagnostics::PermissionError& err) {
      std::cerr << ssync::diagnostics::FormatPermissionError(err) << std::endl;
      status = kExitInput;
    } catch (const std::exception& err) {
      logger.LogError(err);
      status = kExitInput;
    }
  }
  return status;
}
