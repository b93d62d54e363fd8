#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/temp_dir.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

namespace {

void WriteText(const fs::path& path, const std::string& text) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  ranops::tests::common::Expect(static_cast<bool>(out), "failed to write " + path.string());
  out << text;
}

std::string PathsConfig(const fs::path& root) {
  return R"({"paths": {"base_dir": ")" + (root / "experiments").string() +
         R"(", "client_table": ")" + (root / "ue_data.csv").string() +
         R"(", "radio_node_config": ")" + (root / "gnb.yaml").string() +
         R"(", "client_config": ")" + (root / "ue.conf").string() +
         R"(", "state_file": ")" + (root / "state.json").string() + R"("}})";
}

} // namespace

// Exit codes for problems found before any trial starts; none of these runs
// reach the host.
int main() {
  using namespace ranops::tests::common;

  ScopedTempDir temp("ranops-cli-preflight");
  const fs::path root = temp.path();

  ExpectEqual(DispatchArgs({"ranops", "--config", (root / "absent.json").string()}), 11,
              "unreadable config");

  const fs::path bad = root / "bad.json";
  WriteText(bad, R"({"grid": {"total_trial_sets": "all"}})");
  ExpectEqual(DispatchArgs({"ranops", "--config", bad.string()}), 11, "invalid config");

  const fs::path config = root / "config.json";
  WriteText(config, PathsConfig(root));
  ExpectEqual(DispatchArgs({"ranops", "--config", config.string(), "--log-level", "error"}), 10,
              "missing client table");

  WriteText(root / "ue_data.csv", "ue01,001010123456780,00112233445566778899aabbccddeeff,1\n");
  WriteText(root / "gnb.yaml", "cu_cp: {}\n");
  WriteText(root / "ue.conf", "[rf]\n");
  ExpectEqual(DispatchArgs({"ranops", "--config", config.string(), "--log-level", "error"}), 10,
              "missing experiment base directory");
  Expect(!fs::exists(root / "state.json"), "preflight failure must not write run state");

  std::cout << "cli_preflight_smoke: ok\n";
  return 0;
}
