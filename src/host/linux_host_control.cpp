#include "host/linux_host_control.hpp"

#include "core/string_utils.hpp"

#include <cerrno>
#include <charconv>
#include <cstdio>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace ranops::host {

namespace {

constexpr int kTimeoutExitCode = 124;

std::string WrapWithTimeout(const std::string& command, const std::chrono::milliseconds timeout) {
  if (timeout.count() <= 0) {
    return "sh -c " + core::ShellQuote(command);
  }
  const auto seconds = (timeout.count() + 999) / 1000;
  return "timeout --kill-after=5s " + std::to_string(seconds) + "s sh -c " +
         core::ShellQuote(command);
}

std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    line = core::Trim(line);
    if (!line.empty()) {
      lines.push_back(line);
    }
  }
  return lines;
}

bool ParsePid(const std::string& text, int& pid) {
  const char* begin = text.data();
  const char* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, pid);
  return ec == std::errc() && ptr == end && pid > 0;
}

} // namespace

LinuxHostControl::LinuxHostControl(LinuxHostOptions options) : options_(std::move(options)) {}

std::string LinuxHostControl::Privileged(const std::string& command) const {
  if (options_.privilege_prefix.empty()) {
    return command;
  }
  return options_.privilege_prefix + " " + command;
}

bool LinuxHostControl::RunCommand(const std::string& command,
                                  const std::chrono::milliseconds timeout, CommandResult& result,
                                  std::string& error) {
  result = CommandResult{};
  error.clear();

  const std::string wrapped = WrapWithTimeout(command, timeout) + " 2>&1";
  FILE* pipe = popen(wrapped.c_str(), "r");
  if (pipe == nullptr) {
    error = std::string("failed to execute shell command: ") + std::strerror(errno);
    return false;
  }

  char buffer[512];
  while (std::fgets(buffer, sizeof(buffer), pipe) != nullptr) {
    result.output += buffer;
  }

  const int raw_status = pclose(pipe);
  if (raw_status == -1) {
    error = std::string("failed to collect shell command status: ") + std::strerror(errno);
    return false;
  }
  if (WIFEXITED(raw_status)) {
    result.exit_code = WEXITSTATUS(raw_status);
  } else {
    result.exit_code = raw_status;
  }
  result.timed_out = timeout.count() > 0 && result.exit_code == kTimeoutExitCode;
  return true;
}

bool LinuxHostControl::RunChecked(const std::string& command, std::string& output,
                                  std::string& error) {
  CommandResult result;
  if (!RunCommand(command, options_.query_timeout, result, error)) {
    return false;
  }
  output = result.output;
  if (result.exit_code != 0) {
    error = "command '" + command + "' exited with code " + std::to_string(result.exit_code);
    const std::string detail = core::Trim(result.output);
    if (!detail.empty()) {
      error += " (" + detail + ")";
    }
    return false;
  }
  return true;
}

bool LinuxHostControl::SpawnBackground(const std::string& command, const fs::path& log_path,
                                       int& pid, std::string& error) {
  pid = -1;
  error.clear();

  const pid_t child = fork();
  if (child < 0) {
    error = std::string("fork failed: ") + std::strerror(errno);
    return false;
  }

  if (child == 0) {
    // Own session and process group so the whole tree can be signalled.
    (void)setsid();
    const int log_fd = open(log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (log_fd >= 0) {
      (void)dup2(log_fd, STDOUT_FILENO);
      (void)dup2(log_fd, STDERR_FILENO);
      (void)close(log_fd);
    }
    const int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
      (void)dup2(null_fd, STDIN_FILENO);
      (void)close(null_fd);
    }
    execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
    _exit(127);
  }

  {
    std::lock_guard<std::mutex> lock(spawned_mutex_);
    spawned_.insert(child);
  }
  pid = child;
  return true;
}

bool LinuxHostControl::IsProcessAlive(const int pid) {
  if (pid <= 0) {
    return false;
  }

  bool own_child = false;
  {
    std::lock_guard<std::mutex> lock(spawned_mutex_);
    own_child = spawned_.count(pid) > 0U;
  }
  if (own_child) {
    int status = 0;
    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      std::lock_guard<std::mutex> lock(spawned_mutex_);
      spawned_.erase(pid);
      return false;
    }
    if (waited == 0) {
      return true;
    }
  }

  if (::kill(pid, 0) == 0) {
    return true;
  }
  return errno == EPERM;
}

bool LinuxHostControl::SignalProcess(const int pid, const int signal_number,
                                     std::string& error) {
  if (pid <= 0) {
    error = "invalid pid " + std::to_string(pid);
    return false;
  }

  bool group_leader = false;
  {
    std::lock_guard<std::mutex> lock(spawned_mutex_);
    group_leader = spawned_.count(pid) > 0U;
  }
  const pid_t target = group_leader ? -pid : pid;
  if (::kill(target, signal_number) == 0) {
    return true;
  }
  if (errno == ESRCH) {
    return true;
  }
  if (errno == EPERM) {
    // Root-owned processes (started through sudo) need a privileged kill.
    std::string output;
    return RunChecked(Privileged("kill -" + std::to_string(signal_number) + " " +
                                 std::to_string(pid)),
                      output, error);
  }
  error = "kill(" + std::to_string(pid) + ", " + std::to_string(signal_number) +
          ") failed: " + std::strerror(errno);
  return false;
}

std::vector<int> LinuxHostControl::FindPortHolders(const std::uint16_t port) {
  std::vector<int> pids;
  CommandResult result;
  std::string error;
  // lsof exits 1 when nothing holds the port.
  if (!RunCommand(Privileged("lsof -ti :" + std::to_string(port)), options_.query_timeout, result,
                  error)) {
    return pids;
  }
  for (const auto& line : SplitLines(result.output)) {
    int pid = 0;
    if (ParsePid(line, pid)) {
      pids.push_back(pid);
    }
  }
  return pids;
}

bool LinuxHostControl::KillByPattern(const std::string& pattern, std::string& error) {
  CommandResult result;
  if (!RunCommand(Privileged("pkill -f " + core::ShellQuote(pattern)), options_.query_timeout,
                  result, error)) {
    return false;
  }
  // pkill: 0 matched, 1 nothing matched.
  if (result.exit_code == 0 || result.exit_code == 1) {
    return true;
  }
  error = "pkill for pattern '" + pattern + "' exited with code " +
          std::to_string(result.exit_code);
  return false;
}

bool LinuxHostControl::SessionExists(const std::string& name) {
  CommandResult result;
  std::string error;
  if (!RunCommand("tmux has-session -t " + core::ShellQuote(name), options_.query_timeout, result,
                  error)) {
    return false;
  }
  return result.exit_code == 0;
}

std::vector<std::string> LinuxHostControl::ListSessions() {
  CommandResult result;
  std::string error;
  if (!RunCommand("tmux list-sessions -F '#{session_name}'", options_.query_timeout, result,
                  error) ||
      result.exit_code != 0) {
    return {};
  }
  return SplitLines(result.output);
}

bool LinuxHostControl::StartSession(const std::string& name, const std::string& command,
                                    std::string& error) {
  std::string output;
  return RunChecked("tmux new-session -d -s " + core::ShellQuote(name) + " " +
                        core::ShellQuote(command),
                    output, error);
}

bool LinuxHostControl::KillSession(const std::string& name, std::string& error) {
  if (!SessionExists(name)) {
    return true;
  }
  std::string output;
  return RunChecked("tmux kill-session -t " + core::ShellQuote(name), output, error);
}

bool LinuxHostControl::NamespaceExists(const std::string& name) {
  CommandResult result;
  std::string error;
  if (!RunCommand("ip netns list", options_.query_timeout, result, error) ||
      result.exit_code != 0) {
    return false;
  }
  for (const auto& line : SplitLines(result.output)) {
    // Lines look like "ue1" or "ue1 (id: 0)".
    const std::string first = line.substr(0, line.find(' '));
    if (first == name) {
      return true;
    }
  }
  return false;
}

bool LinuxHostControl::AddNamespace(const std::string& name, std::string& error) {
  std::string output;
  return RunChecked(Privileged("ip netns add " + core::ShellQuote(name)), output, error);
}

bool LinuxHostControl::DeleteNamespace(const std::string& name, std::string& error) {
  std::string output;
  return RunChecked(Privileged("ip netns delete " + core::ShellQuote(name)), output, error);
}

bool LinuxHostControl::RouteExists(const std::string& route) {
  CommandResult result;
  std::string error;
  if (!RunCommand("ip route show", options_.query_timeout, result, error) ||
      result.exit_code != 0) {
    return false;
  }
  return result.output.find(route) != std::string::npos;
}

bool LinuxHostControl::AddRoute(const std::string& route, std::string& error) {
  std::string output;
  return RunChecked(Privileged("ip route add " + route), output, error);
}

bool LinuxHostControl::DeleteRoute(const std::string& route, std::string& error) {
  std::string output;
  return RunChecked(Privileged("ip route del " + route), output, error);
}

bool LinuxHostControl::FindInterfaceWithAddress(const std::string& address,
                                                std::string& interface_name) {
  interface_name.clear();
  CommandResult result;
  std::string error;
  if (!RunCommand("ip -o addr show", options_.query_timeout, result, error) ||
      result.exit_code != 0) {
    return false;
  }
  const std::string needle = " " + address + "/";
  for (const auto& line : SplitLines(result.output)) {
    if (line.find(needle) == std::string::npos) {
      continue;
    }
    // "<index>: <name>    inet <address>/<prefix> ..."
    std::istringstream fields(line);
    std::string index;
    std::string name;
    fields >> index >> name;
    if (!name.empty() && name.back() == ':') {
      name.pop_back();
    }
    interface_name = name;
    return !interface_name.empty();
  }
  return false;
}

} // namespace ranops::host
