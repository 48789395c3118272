// C++23 helpers for reading /proc with optional root remap
#pragma once
#include <string>
#include <optional>

namespace dockhand::util {

// Map an absolute /proc path to an alternate root if DOCKHAND_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// True if the (remapped) path exists. Errors count as absent.
[[nodiscard]] bool path_exists(const std::string& abs);

} // namespace dockhand::util
