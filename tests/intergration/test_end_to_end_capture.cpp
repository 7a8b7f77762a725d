#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <sys/wait.h>
#include <simdjson.h>

namespace fs = std::filesystem;

static std::string env_or(const char* k, const char* defv) {
  const char* v = std::getenv(k);
  return (v && *v) ? std::string(v) : std::string(defv);
}

static std::string slurp(const fs::path& p) {
  std::ifstream in(p, std::ios::binary); std::ostringstream ss; ss << in.rdbuf(); return ss.str();
}

static int run_capture(const std::string& bin, const std::string& args, const fs::path& log) {
  const std::string cmd = "\"" + bin + "\" " + args + " >\"" + log.string() + "\" 2>&1";
  const int rc = std::system(cmd.c_str());
  return (rc != -1 && WIFEXITED(rc)) ? WEXITSTATUS(rc) : -1;
}

struct Summary {
  std::string status;
  std::uint64_t accepted = 0, skipped = 0, columns = 0;
  bool fault_names_from_source = false;
};

static bool load_summary(const fs::path& p, Summary& s) {
  simdjson::ondemand::parser parser;
  simdjson::padded_string json;
  if (simdjson::padded_string::load(p.string()).get(json)) return false;
  simdjson::ondemand::document doc;
  if (parser.iterate(json).get(doc)) return false;

  std::string_view status;
  if (doc["status"].get_string().get(status)) return false;
  s.status = std::string(status);
  if (doc["frames_accepted"].get_uint64().get(s.accepted)) return false;
  if (doc["frames_skipped"].get_uint64().get(s.skipped)) return false;
  if (doc["columns"].get_uint64().get(s.columns)) return false;
  if (doc["fault_names_from_source"].get_bool().get(s.fault_names_from_source)) return false;
  return true;
}

int main() {
  const std::string bin = env_or("BC_CAPTURE_BIN", "./bms-chain-capture");
  const fs::path mixed = "tests/data/mixed_frames.log";
  const fs::path firmware = "tests/data/firmware/source/AEK_POW_BMS63CHAIN_app_mng.c";
  if (!fs::exists(mixed) || !fs::exists(firmware)) {
    std::cerr << "[ERR] fixtures not found under tests/data\n"; return 2;
  }

  const fs::path art = fs::temp_directory_path() / ("bc-it-" + std::to_string(std::time(nullptr)));
  fs::create_directories(art);
  bool ok = true;

  // lenient: frame 2 skipped, names from the firmware source
  {
    const fs::path csv = art / "lenient" / "out.csv";
    const fs::path sum = art / "lenient" / "run.json";
    const int rc = run_capture(bin, "--input=\"" + mixed.string() + "\" --output=\"" + csv.string() +
                                    "\" --source-c=\"" + firmware.string() + "\" --summary-json=\"" +
                                    sum.string() + "\"", art / "lenient.log");
    if (rc != 0) { std::cerr << "[FAIL] lenient run returned " << rc << "\n"; ok = false; }

    Summary s;
    if (!load_summary(sum, s)) {
      std::cerr << "[FAIL] run.json missing or unreadable: " << sum << "\n"; ok = false;
    } else {
      if (s.status != "completed") { std::cerr << "[FAIL] status=" << s.status << "\n"; ok = false; }
      if (s.accepted != 2 || s.skipped != 1) {
        std::cerr << "[FAIL] accepted=" << s.accepted << " skipped=" << s.skipped << "\n"; ok = false;
      }
      if (s.columns != 255) { std::cerr << "[FAIL] columns=" << s.columns << "\n"; ok = false; }
      if (!s.fault_names_from_source) { std::cerr << "[FAIL] fault names not taken from source\n"; ok = false; }
    }

    const std::string text = slurp(csv);
    if (text.rfind("\xEF\xBB\xBF" "frame_index,", 0) != 0) { std::cerr << "[FAIL] BOM/header\n"; ok = false; }
    if (text.find(",fault_001_CELL_OV_1,") == std::string::npos) {
      std::cerr << "[FAIL] resolved fault column missing\n"; ok = false;
    }
    std::size_t rows = 0;
    for (std::size_t p = text.find("\r\n"); p != std::string::npos; p = text.find("\r\n", p + 2)) ++rows;
    if (rows != 3) { std::cerr << "[FAIL] expected header + 2 rows, got " << rows << " lines\n"; ok = false; }

    const std::string log = slurp(art / "lenient.log");
    if (log.find("[WARN] Skipped frame #2") == std::string::npos) {
      std::cerr << "[FAIL] skip diagnostic not logged\n"; ok = false;
    }
  }

  // strict: non-zero exit, one row
  {
    const fs::path csv = art / "strict.csv";
    const fs::path sum = art / "strict.json";
    const int rc = run_capture(bin, "--strict --input \"" + mixed.string() + "\" --output \"" + csv.string() +
                                    "\" --summary-json \"" + sum.string() + "\"", art / "strict.log");
    if (rc != 3) { std::cerr << "[FAIL] strict run returned " << rc << ", expected 3\n"; ok = false; }
    Summary s;
    if (!load_summary(sum, s) || s.status != "strict-abort" || s.accepted != 1 || s.skipped != 0) {
      std::cerr << "[FAIL] strict summary\n"; ok = false;
    }
    if (s.fault_names_from_source) { std::cerr << "[FAIL] strict run should fall back\n"; ok = false; }
  }

  // usage and input errors
  {
    if (run_capture(bin, "--output=\"" + (art / "x.csv").string() + "\"", art / "usage.log") != 1) {
      std::cerr << "[FAIL] missing input not rejected\n"; ok = false;
    }
    if (run_capture(bin, "--input=tests/data/nope.log --output=\"" + (art / "y.csv").string() + "\"",
                    art / "missing.log") != 1) {
      std::cerr << "[FAIL] missing input file not rejected\n"; ok = false;
    }
  }

  // a baud rate outside int range is rejected, not wrapped to 9600
  {
    const fs::path log = art / "baud.log";
    const int rc = run_capture(bin, "--input=\"" + mixed.string() + "\" --output=\"" + (art / "baud.csv").string() +
                                    "\" --baudrate=4294976896", log);
    if (rc != 1) { std::cerr << "[FAIL] oversized baud rate returned " << rc << "\n"; ok = false; }
    if (slurp(log).find("invalid value for --baudrate") == std::string::npos) {
      std::cerr << "[FAIL] oversized baud rate not reported\n"; ok = false;
    }
    if (fs::exists(art / "baud.csv")) { std::cerr << "[FAIL] output written despite bad baud rate\n"; ok = false; }
  }

  if (!ok) { std::cerr << "[FAIL] logs under " << art << "\n"; return 1; }
  fs::remove_all(art);
  std::cout << "[PASS] end-to-end capture\n";
  return 0;
}
