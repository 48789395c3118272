#pragma once
#include <string>
#include <vector>

namespace dockhand::app {

// Exit statuses when the runtime cannot be started (shell conventions)
inline constexpr int kExitNotExecutable = 126;
inline constexpr int kExitNotFound = 127;

// argv for the runtime: 'runtime' followed by args[1..].
[[nodiscard]] std::vector<std::string> runtime_argv(const std::string& runtime,
                                                    const std::vector<std::string>& args);

// Replace this process with the runtime. Only returns on failure, with a
// diagnostic already printed and the exit status to use.
[[nodiscard]] int exec_runtime(const std::string& runtime, const std::vector<std::string>& args);

} // namespace dockhand::app
