#include "../common/temp_dir.hpp"
#include "host/linux_host_control.hpp"

#include <catch2/catch.hpp>

#include <chrono>
#include <csignal>
#include <string>
#include <thread>

using ranops::host::CommandResult;
using ranops::host::LinuxHostControl;
using ranops::host::LinuxHostOptions;
using ranops::tests::common::ScopedTempDir;

namespace {

LinuxHostControl UnprivilegedHost() {
  LinuxHostOptions options;
  options.privilege_prefix.clear();
  return LinuxHostControl(options);
}

bool WaitForExit(LinuxHostControl& host, int pid) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (std::chrono::steady_clock::now() < deadline) {
    if (!host.IsProcessAlive(pid)) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  return false;
}

} // namespace

TEST_CASE("Commands report exit code and combined output", "[host][linux]") {
  LinuxHostControl host = UnprivilegedHost();
  CommandResult result;
  std::string error;
  REQUIRE(host.RunCommand("echo out; echo err 1>&2; exit 3", std::chrono::seconds(5), result,
                          error));
  REQUIRE(result.exit_code == 3);
  REQUIRE_FALSE(result.timed_out);
  REQUIRE(result.output.find("out") != std::string::npos);
  REQUIRE(result.output.find("err") != std::string::npos);
}

TEST_CASE("A command past its timeout is killed", "[host][linux]") {
  LinuxHostControl host = UnprivilegedHost();
  CommandResult result;
  std::string error;
  const auto started = std::chrono::steady_clock::now();
  REQUIRE(host.RunCommand("sleep 10", std::chrono::milliseconds(200), result, error));
  REQUIRE(result.timed_out);
  REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
}

TEST_CASE("Background processes are tracked and signalled as a group", "[host][linux]") {
  ScopedTempDir temp("ranops-linux-host");
  LinuxHostControl host = UnprivilegedHost();
  int pid = -1;
  std::string error;
  REQUIRE(host.SpawnBackground("echo started; exec sleep 30", temp.path() / "bg.log", pid, error));
  REQUIRE(pid > 0);
  REQUIRE(host.IsProcessAlive(pid));

  REQUIRE(host.SignalProcess(pid, SIGTERM, error));
  REQUIRE(WaitForExit(host, pid));
  REQUIRE_FALSE(host.IsProcessAlive(pid));
}

TEST_CASE("Queries treat unknown things as absent", "[host][linux]") {
  LinuxHostControl host = UnprivilegedHost();
  REQUIRE_FALSE(host.IsProcessAlive(-1));
  REQUIRE_FALSE(host.SessionExists("ranops-test-no-such-session"));
  std::string error;
  REQUIRE_FALSE(host.SignalProcess(0, SIGTERM, error));
  REQUIRE_FALSE(error.empty());
}
