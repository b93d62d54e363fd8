#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ranops::host {

struct CommandResult {
  int exit_code = -1;
  bool timed_out = false;
  // Combined stdout/stderr.
  std::string output;
};

// The one seam through which orchestration touches the host: processes,
// ports, terminal sessions, network namespaces and routes.
//
// Contract goals:
// - every host mutation the engine performs is visible in this interface
// - "absent" is never an error for queries (an unknown session simply does
//   not exist)
// - implementations never throw; failures come back as `false` + `error`
class IHostControl {
public:
  virtual ~IHostControl() = default;

  // Runs `command` through /bin/sh to completion or until `timeout` elapses
  // (a non-positive timeout waits indefinitely). Returns false only when the
  // command could not be executed at all; a non-zero exit is reported via
  // `result.exit_code`.
  virtual bool RunCommand(const std::string& command, std::chrono::milliseconds timeout,
                          CommandResult& result, std::string& error) = 0;

  // Starts `command` detached in its own process group with stdout/stderr
  // appended to `log_path`.
  virtual bool SpawnBackground(const std::string& command, const std::filesystem::path& log_path,
                               int& pid, std::string& error) = 0;

  virtual bool IsProcessAlive(int pid) = 0;
  virtual bool SignalProcess(int pid, int signal_number, std::string& error) = 0;

  // PIDs of processes with a socket bound to `port` (TCP or UDP).
  virtual std::vector<int> FindPortHolders(std::uint16_t port) = 0;

  // Kills every process whose full command line matches `pattern`. No match
  // is success.
  virtual bool KillByPattern(const std::string& pattern, std::string& error) = 0;

  virtual bool SessionExists(const std::string& name) = 0;
  virtual std::vector<std::string> ListSessions() = 0;
  virtual bool StartSession(const std::string& name, const std::string& command,
                            std::string& error) = 0;
  virtual bool KillSession(const std::string& name, std::string& error) = 0;

  virtual bool NamespaceExists(const std::string& name) = 0;
  virtual bool AddNamespace(const std::string& name, std::string& error) = 0;
  virtual bool DeleteNamespace(const std::string& name, std::string& error) = 0;

  // `route` uses `ip route` syntax, e.g. "10.45.0.0/16 via 10.53.1.2".
  virtual bool RouteExists(const std::string& route) = 0;
  virtual bool AddRoute(const std::string& route, std::string& error) = 0;
  virtual bool DeleteRoute(const std::string& route, std::string& error) = 0;

  virtual bool FindInterfaceWithAddress(const std::string& address,
                                        std::string& interface_name) = 0;
};

} // namespace ranops::host
