#pragma once
#include <filesystem>
#include <vector>

namespace bc {

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Directory containing the running executable (falls back to argv0's parent).
std::filesystem::path executable_dir(const char* argv0);

// Places the firmware source is looked for when --source-c is not given.
std::vector<std::filesystem::path> fault_source_candidates(const std::filesystem::path& exe_dir,
                                                           const std::filesystem::path& cwd);

// First existing candidate, or the second one (a representative path for
// messages) when none exists.
std::filesystem::path discover_fault_source(const std::filesystem::path& exe_dir,
                                            const std::filesystem::path& cwd);

}
