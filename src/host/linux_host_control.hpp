#pragma once

#include "host/host_control.hpp"

#include <chrono>
#include <mutex>
#include <set>
#include <string>

namespace ranops::host {

struct LinuxHostOptions {
  // Prepended to commands that need root (namespaces, routes, port holders,
  // pattern kills). Empty when the orchestrator already runs as root.
  std::string privilege_prefix = "sudo";
  // Budget for the short query/mutation commands issued internally.
  std::chrono::milliseconds query_timeout{15'000};
};

// Production host control: fork/exec for background processes, and `lsof`,
// `pkill`, `tmux` and `ip` for everything the kernel does not expose directly.
class LinuxHostControl final : public IHostControl {
public:
  explicit LinuxHostControl(LinuxHostOptions options = {});

  bool RunCommand(const std::string& command, std::chrono::milliseconds timeout,
                  CommandResult& result, std::string& error) override;
  bool SpawnBackground(const std::string& command, const std::filesystem::path& log_path,
                       int& pid, std::string& error) override;
  bool IsProcessAlive(int pid) override;
  bool SignalProcess(int pid, int signal_number, std::string& error) override;
  std::vector<int> FindPortHolders(std::uint16_t port) override;
  bool KillByPattern(const std::string& pattern, std::string& error) override;

  bool SessionExists(const std::string& name) override;
  std::vector<std::string> ListSessions() override;
  bool StartSession(const std::string& name, const std::string& command,
                    std::string& error) override;
  bool KillSession(const std::string& name, std::string& error) override;

  bool NamespaceExists(const std::string& name) override;
  bool AddNamespace(const std::string& name, std::string& error) override;
  bool DeleteNamespace(const std::string& name, std::string& error) override;

  bool RouteExists(const std::string& route) override;
  bool AddRoute(const std::string& route, std::string& error) override;
  bool DeleteRoute(const std::string& route, std::string& error) override;

  bool FindInterfaceWithAddress(const std::string& address,
                                std::string& interface_name) override;

private:
  std::string Privileged(const std::string& command) const;
  // Runs a short internal command and requires exit code 0.
  bool RunChecked(const std::string& command, std::string& output, std::string& error);

  LinuxHostOptions options_;
  std::mutex spawned_mutex_;
  // Group leaders started by SpawnBackground; signals go to the whole group.
  std::set<int> spawned_;
};

} // namespace ranops::host
