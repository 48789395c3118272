#include "util/Diag.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace dockhand::util {

static std::atomic<bool> g_quiet{false};

void set_quiet(bool q) { g_quiet.store(q); }

bool quiet() { return g_quiet.load(); }

static void vline(const char* component, const char* fmt, va_list ap) {
  char msg[512];
  std::vsnprintf(msg, sizeof(msg), fmt, ap);
  std::fprintf(stderr, "dockhand: %s: %s\n", component, msg);
}

void diag(const char* component, const char* fmt, ...) {
  if (g_quiet.load()) return;
  va_list ap;
  va_start(ap, fmt);
  vline(component, fmt, ap);
  va_end(ap);
}

void diag_fatal(const char* component, const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  vline(component, fmt, ap);
  va_end(ap);
}

} // namespace dockhand::util
