#pragma once

#include "host/host_control.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace ranops::host::testing {

// In-memory host used by orchestration tests. Sessions, namespaces, routes,
// processes and port holders are plain containers; hooks let a test script
// what a started session or spawned process "does" (typically: write the log
// markers a readiness predicate waits for).
class FakeHostControl final : public IHostControl {
public:
  using CommandHandler = std::function<void(const std::string& command, CommandResult& result)>;
  using SessionHook = std::function<bool(const std::string& name, const std::string& command,
                                         std::string& error)>;
  using SpawnHook = std::function<bool(const std::string& command,
                                       const std::filesystem::path& log_path, int pid,
                                       std::string& error)>;

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

  // Scripting.
  void SetCommandHandler(CommandHandler handler);
  void SetSessionHook(SessionHook hook);
  void SetSpawnHook(SpawnHook hook);
  // Registers a live process (e.g. one started by a scenario script) and
  // returns its pid.
  int AddProcess(const std::string& command_line);
  void AddPortHolder(std::uint16_t port, int pid);
  // Holders of this port ignore every signal.
  void MakePortUnkillable(std::uint16_t port);
  void AddInterface(const std::string& name, const std::string& address);
  void AddSession(const std::string& name);
  void AddNamespaceDirect(const std::string& name);
  void AddRouteDirect(const std::string& route);

  // Inspection.
  std::vector<std::string> Commands() const;
  std::vector<std::string> StartedSessions() const;
  std::vector<std::string> KilledPatterns() const;
  std::vector<std::string> SpawnedCommands() const;
  // Pids passed to SignalProcess, in call order.
  std::vector<int> SignalledPids() const;
  std::size_t LiveProcessCount() const;
  std::size_t LiveSpawnedCount() const;
  std::size_t OccupiedPortCount() const;
  std::size_t NamespaceCount() const;
  std::size_t SessionCount() const;
  std::size_t RouteCount() const;

private:
  struct Process {
    std::string command_line;
    bool alive = true;
    bool spawned = false;
  };

  void KillLocked(int pid);

  mutable std::mutex mutex_;
  int next_pid_ = 40000;
  std::map<int, Process> processes_;
  std::map<std::uint16_t, std::vector<int>> port_holders_;
  std::set<std::uint16_t> unkillable_ports_;
  std::set<std::string> sessions_;
  std::set<std::string> namespaces_;
  std::set<std::string> routes_;
  std::map<std::string, std::string> interfaces_;

  std::vector<std::string> commands_;
  std::vector<std::string> started_sessions_;
  std::vector<std::string> killed_patterns_;
  std::vector<std::string> spawned_commands_;
  std::vector<int> signalled_pids_;

  CommandHandler command_handler_;
  SessionHook session_hook_;
  SpawnHook spawn_hook_;
};

} // namespace ranops::host::testing
