#include "bms_capture/path_utils.hpp"
#include <system_error>

namespace bc {

static const std::filesystem::path kProjectDir =
    "SPC58EC - AEK_POW_BMS63EN_SOC_Est_SingleAccess_CHAIN_GUI_application for discovery";
static const std::filesystem::path kSourceRel =
    std::filesystem::path("source") / "AEK_POW_BMS63CHAIN_app_mng.c";

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::is_directory(parent, ec)) return true;
  std::filesystem::create_directories(parent, ec);
  return !ec && std::filesystem::is_directory(parent, ec);
}

std::filesystem::path executable_dir(const char* argv0) {
  std::error_code ec;
  auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (!ec && !self.empty()) return self.parent_path();
  if (!argv0 || !*argv0) return std::filesystem::current_path(ec);
  auto p = std::filesystem::weakly_canonical(std::filesystem::path(argv0), ec);
  return ec ? std::filesystem::path(argv0).parent_path() : p.parent_path();
}

std::vector<std::filesystem::path> fault_source_candidates(const std::filesystem::path& exe_dir,
                                                           const std::filesystem::path& cwd) {
  return {
    exe_dir / kProjectDir / kSourceRel,
    exe_dir.parent_path() / kProjectDir / kSourceRel,
    exe_dir.parent_path() / kSourceRel,
    cwd / kProjectDir / kSourceRel,
    cwd / kSourceRel,
  };
}

std::filesystem::path discover_fault_source(const std::filesystem::path& exe_dir,
                                            const std::filesystem::path& cwd) {
  const auto candidates = fault_source_candidates(exe_dir, cwd);
  std::error_code ec;
  for (const auto& c : candidates)
    if (std::filesystem::exists(c, ec)) return c;
  return candidates[1];
}

}
