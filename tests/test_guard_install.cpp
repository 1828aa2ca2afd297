#include "ssync/guard/output_guard.h"
#include "ssync/redact/key_classifier.h"

#include <cassert>
#include <iostream>
#include <streambuf>
#include <string>

#include <stdlib.h>
#include <unistd.h>

// Built without the startup installer, so installation order is under test
// control.

namespace {

class CapturedFd {
public:
  explicit CapturedFd(int fd) : fd_(fd) {
    char path[] = "/tmp/ssync_install_XXXXXX";
    file_ = ::mkstemp(path);
    assert(file_ >= 0);
    ::unlink(path);
    saved_ = ::dup(fd_);
    assert(saved_ >= 0);
    const int rc = ::dup2(file_, fd_);
    assert(rc == fd_);
    (void)rc;
  }

  CapturedFd(const CapturedFd&) = delete;
  CapturedFd& operator=(const CapturedFd&) = delete;

  ~CapturedFd() {
    if (saved_ >= 0) {
      (void)Finish();
    }
  }

  std::string Finish() {
    ::dup2(saved_, fd_);
    ::close(saved_);
    saved_ = -1;
    std::string captured;
    ::lseek(file_, 0, SEEK_SET);
    char buf[512];
    for (;;) {
      const ssize_t n = ::read(file_, buf, sizeof(buf));
      if (n <= 0) {
        break;
      }
      captured.append(buf, static_cast<size_t>(n));
    }
    ::close(file_);
    return captured;
  }

private:
  int fd_;
  int file_{-1};
  int saved_{-1};
};

void TestFailedInstallLeavesStreamsAlone() {
  assert(!ssync::guard::IsOutputGuardInstalled());
  std::streambuf* before = std::cout.rdbuf();

  ssync::guard::FailNextInstallForTesting();
  CapturedFd err(STDERR_FILENO);
  ssync::guard::InstallOutputGuard();
  assert(err.Finish() == "ssync: output guard installation failed\n");

  assert(!ssync::guard::IsOutputGuardInstalled());
  assert(std::cout.rdbuf() == before);
}

void TestInstallRetriesAfterFailure() {
  ssync::guard::InstallOutputGuard();
  assert(ssync::guard::IsOutputGuardInstalled());

  CapturedFd out(STDOUT_FILENO);
  std::cout << "API_KEY=" << "sk_live_123" << std::endl;
  assert(out.Finish() == "API_KEY=[REDACTED]\n");
}

} // namespace

int main() {
  ssync::redact::KeyClassifier::Instance().ResetForTesting();
  TestFailedInstallLeavesStreamsAlone();
  TestInstallRetriesAfterFailure();
  std::cout << "guard install tests ok" << std::endl;
  return 0;
}
