#include "ssync/guard/output_guard.h"

// Linked into every executable as an object file so the guard is in place
// before any other static initialiser can write output.
#if defined(__GNUC__) || defined(__clang__)
namespace {

__attribute__((constructor(101))) void InstallOutputGuardAtStartup() {
  ssync::guard::InstallOutputGuard();
}

}  // namespace
#endif
