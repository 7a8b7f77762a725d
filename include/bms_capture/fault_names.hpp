#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bc {

constexpr std::string_view kFaultNamePrefix   = "AEK_POW_BMS63CHAIN_";
constexpr std::string_view kFaultSourceFunc   = "AEK_POW_BMS63CHAIN_app_serialStep_GUI";
constexpr std::string_view kFaultSourceMember = "AEK_POW_BMS63CHAIN_fastDiag[";

// Ordered column labels of the fault section; always kFaultCount entries.
struct FaultNameTable {
  std::vector<std::string> names;
  bool from_source = false;
  std::string note; // why the fallback was used, or where names came from
};

// fault_001 .. fault_187
FaultNameTable fallback_fault_names(std::string note = {});

// Member names referenced as AEK_POW_BMS63CHAIN_fastDiag[...].<name>
// inside the GUI serial step function, in emission order.
std::vector<std::string> extract_fault_names(std::string_view source_text);

// fault_<NNN>_<name> with kFaultNamePrefix stripped from <name>.
std::string fault_column_name(std::size_t index, std::string_view raw_name);

// Resolves the table at most once; later calls return the cached result.
class FaultNameResolver {
public:
  FaultNameResolver() = default;
  explicit FaultNameResolver(std::filesystem::path source) : source_(std::move(source)) {}

  const FaultNameTable& resolve();
  bool resolved() const noexcept { return table_.has_value(); }
  const std::filesystem::path& source() const noexcept { return source_; }

private:
  std::filesystem::path source_;
  std::optional<FaultNameTable> table_;
};

}
