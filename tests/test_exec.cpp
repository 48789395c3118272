#include "minitest.hpp"
#include "app/Exec.hpp"
#include <string>
#include <vector>

using dockhand::app::exec_runtime;
using dockhand::app::runtime_argv;

TEST(exec_argv_replaces_program_name) {
  std::vector<std::string> args{"/usr/local/bin/dockhand", "run", "--hostname=a", "image"};
  auto argv = runtime_argv("docker", args);
  ASSERT_EQ(argv, (std::vector<std::string>{"docker", "run", "--hostname=a", "image"}));
}

TEST(exec_argv_empty_input) {
  auto argv = runtime_argv("docker", {});
  ASSERT_EQ(argv, (std::vector<std::string>{"docker"}));
}

TEST(exec_missing_runtime_reports_not_found) {
  int rc = exec_runtime("dockhand-test-no-such-runtime", {"dockhand", "run", "image"});
  ASSERT_EQ(rc, dockhand::app::kExitNotFound);
}

TEST(exec_non_executable_runtime) {
  // A directory exists but cannot be executed
  int rc = exec_runtime("/tmp", {"dockhand", "version"});
  ASSERT_EQ(rc, dockhand::app::kExitNotExecutable);
}
