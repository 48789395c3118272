#include "app/Exec.hpp"
#include "util/Diag.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>

namespace dockhand::app {

std::vector<std::string> runtime_argv(const std::string& runtime, const std::vector<std::string>& args) {
  std::vector<std::string> out;
  out.reserve(args.size() + 1);
  out.push_back(runtime);
  for (size_t i = 1; i < args.size(); ++i) out.push_back(args[i]);
  return out;
}

int exec_runtime(const std::string& runtime, const std::vector<std::string>& args) {
  auto argv_s = runtime_argv(runtime, args);
  std::vector<char*> argv;
  argv.reserve(argv_s.size() + 1);
  for (auto& a : argv_s) argv.push_back(a.data());
  argv.push_back(nullptr);

  std::fflush(stdout);
  std::fflush(stderr);
  ::execvp(argv[0], argv.data());

  int err = errno;
  util::diag_fatal("Exec", "cannot exec %s: %s", runtime.c_str(), std::strerror(err));
  return (err == ENOENT || err == ENOTDIR) ? kExitNotFound : kExitNotExecutable;
}

} // namespace dockhand::app
