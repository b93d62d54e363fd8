#include "host/testing/fake_host_control.hpp"

#include <algorithm>
#include <regex>

namespace ranops::host::testing {

bool FakeHostControl::RunCommand(const std::string& command, std::chrono::milliseconds,
                                 CommandResult& result, std::string& error) {
  error.clear();
  result = CommandResult{};
  result.exit_code = 0;
  CommandHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    commands_.push_back(command);
    handler = command_handler_;
  }
  if (handler) {
    handler(command, result);
  }
  return true;
}

bool FakeHostControl::SpawnBackground(const std::string& command,
                                      const std::filesystem::path& log_path, int& pid,
                                      std::string& error) {
  SpawnHook hook;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pid = next_pid_++;
    Process process;
    process.command_line = command;
    process.spawned = true;
    processes_[pid] = process;
    spawned_commands_.push_back(command);
    hook = spawn_hook_;
  }
  if (hook && !hook(command, log_path, pid, error)) {
    std::lock_guard<std::mutex> lock(mutex_);
    processes_.erase(pid);
    pid = -1;
    return false;
  }
  return true;
}

bool FakeHostControl::IsProcessAlive(const int pid) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = processes_.find(pid);
  return it != processes_.end() && it->second.alive;
}

void FakeHostControl::KillLocked(const int pid) {
  for (const auto& [port, holders] : port_holders_) {
    if (unkillable_ports_.count(port) > 0U &&
        std::find(holders.begin(), holders.end(), pid) != holders.end()) {
      return;
    }
  }
  const auto it = processes_.find(pid);
  if (it != processes_.end()) {
    it->second.alive = false;
  }
  for (auto& [port, holders] : port_holders_) {
    holders.erase(std::remove(holders.begin(), holders.end(), pid), holders.end());
  }
}

bool FakeHostControl::SignalProcess(const int pid, int, std::string& error) {
  if (pid <= 0) {
    error = "invalid pid " + std::to_string(pid);
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  signalled_pids_.push_back(pid);
  KillLocked(pid);
  return true;
}

std::vector<int> FakeHostControl::FindPortHolders(const std::uint16_t port) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = port_holders_.find(port);
  if (it == port_holders_.end()) {
    return {};
  }
  return it->second;
}

bool FakeHostControl::KillByPattern(const std::string& pattern, std::string&) {
  std::lock_guard<std::mutex> lock(mutex_);
  killed_patterns_.push_back(pattern);
  const std::regex matcher(pattern);
  std::vector<int> matched;
  for (const auto& [pid, process] : processes_) {
    if (process.alive && std::regex_search(process.command_line, matcher)) {
      matched.push_back(pid);
    }
  }
  for (const int pid : matched) {
    KillLocked(pid);
  }
  return true;
}

bool FakeHostControl::SessionExists(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.count(name) > 0U;
}

std::vector<std::string> FakeHostControl::ListSessions() {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<std::string>(sessions_.begin(), sessions_.end());
}

bool FakeHostControl::StartSession(const std::string& name, const std::string& command,
                                   std::string& error) {
  SessionHook hook;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.count(name) > 0U) {
      error = "duplicate session: " + name;
      return false;
    }
    started_sessions_.push_back(name);
    hook = session_hook_;
  }
  if (hook && !hook(name, command, error)) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  sessions_.insert(name);
  return true;
}

bool FakeHostControl::KillSession(const std::string& name, std::string&) {
  std::lock_guard<std::mutex> lock(mutex_);
  sessions_.erase(name);
  return true;
}

bool FakeHostControl::NamespaceExists(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  return namespaces_.count(name) > 0U;
}

bool FakeHostControl::AddNamespace(const std::string& name, std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!namespaces_.insert(name).second) {
    error = "Cannot create namespace file \"/run/netns/" + name + "\": File exists";
    return false;
  }
  return true;
}

bool FakeHostControl::DeleteNamespace(const std::string& name, std::string&) {
  std::lock_guard<std::mutex> lock(mutex_);
  namespaces_.erase(name);
  return true;
}

bool FakeHostControl::RouteExists(const std::string& route) {
  std::lock_guard<std::mutex> lock(mutex_);
  return routes_.count(route) > 0U;
}

bool FakeHostControl::AddRoute(const std::string& route, std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!routes_.insert(route).second) {
    error = "RTNETLINK answers: File exists";
    return false;
  }
  return true;
}

bool FakeHostControl::DeleteRoute(const std::string& route, std::string&) {
  std::lock_guard<std::mutex> lock(mutex_);
  routes_.erase(route);
  return true;
}

bool FakeHostControl::FindInterfaceWithAddress(const std::string& address,
                                               std::string& interface_name) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = interfaces_.find(address);
  if (it == interfaces_.end()) {
    return false;
  }
  interface_name = it->second;
  return true;
}

void FakeHostControl::SetCommandHandler(CommandHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  command_handler_ = std::move(handler);
}

void FakeHostControl::SetSessionHook(SessionHook hook) {
  std::lock_guard<std::mutex> lock(mutex_);
  session_hook_ = std::move(hook);
}

void FakeHostControl::SetSpawnHook(SpawnHook hook) {
  std::lock_guard<std::mutex> lock(mutex_);
  spawn_hook_ = std::move(hook);
}

int FakeHostControl::AddProcess(const std::string& command_line) {
  std::lock_guard<std::mutex> lock(mutex_);
  const int pid = next_pid_++;
  Process process;
  process.command_line = command_line;
  processes_[pid] = process;
  return pid;
}

void FakeHostControl::AddPortHolder(const std::uint16_t port, const int pid) {
  std::lock_guard<std::mutex> lock(mutex_);
  port_holders_[port].push_back(pid);
}

void FakeHostControl::MakePortUnkillable(const std::uint16_t port) {
  std::lock_guard<std::mutex> lock(mutex_);
  unkillable_ports_.insert(port);
}

void FakeHostControl::AddInterface(const std::string& name, const std::string& address) {
  std::lock_guard<std::mutex> lock(mutex_);
  interfaces_[address] = name;
}

void FakeHostControl::AddSession(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  sessions_.insert(name);
}

void FakeHostControl::AddNamespaceDirect(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  namespaces_.insert(name);
}

void FakeHostControl::AddRouteDirect(const std::string& route) {
  std::lock_guard<std::mutex> lock(mutex_);
  routes_.insert(route);
}

std::vector<std::string> FakeHostControl::Commands() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return commands_;
}

std::vector<std::string> FakeHostControl::StartedSessions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return started_sessions_;
}

std::vector<std::string> FakeHostControl::KilledPatterns() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return killed_patterns_;
}

std::vector<std::string> FakeHostControl::SpawnedCommands() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return spawned_commands_;
}

std::vector<int> FakeHostControl::SignalledPids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return signalled_pids_;
}

std::size_t FakeHostControl::LiveProcessCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<std::size_t>(
      std::count_if(processes_.begin(), processes_.end(),
                    [](const auto& entry) { return entry.second.alive; }));
}

std::size_t FakeHostControl::LiveSpawnedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<std::size_t>(
      std::count_if(processes_.begin(), processes_.end(), [](const auto& entry) {
        return entry.second.alive && entry.second.spawned;
      }));
}

std::size_t FakeHostControl::OccupiedPortCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<std::size_t>(
      std::count_if(port_holders_.begin(), port_holders_.end(),
                    [](const auto& entry) { return !entry.second.empty(); }));
}

std::size_t FakeHostControl::NamespaceCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return namespaces_.size();
}

std::size_t FakeHostControl::SessionCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

std::size_t FakeHostControl::RouteCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return routes_.size();
}

} // namespace ranops::host::testing
