#include "services/compose_service.hpp"

#include "core/string_utils.hpp"

#include <utility>
#include <vector>

namespace ranops::services {

namespace {

std::string LastLines(const std::string& text, const std::size_t max_lines) {
  std::vector<std::string> lines;
  std::size_t pos = 0;
  while (pos < text.size()) {
    std::size_t newline = text.find('\n', pos);
    if (newline == std::string::npos) {
      newline = text.size();
    }
    lines.push_back(text.substr(pos, newline - pos));
    pos = newline + 1U;
  }
  const std::size_t first = lines.size() > max_lines ? lines.size() - max_lines : 0U;
  std::string out;
  for (std::size_t i = first; i < lines.size(); ++i) {
    if (!out.empty()) {
      out.push_back('\n');
    }
    out += lines[i];
  }
  return out;
}

} // namespace

const char* ToString(const HealthProbe probe) {
  switch (probe) {
  case HealthProbe::kLogMarker:
    return "log_marker";
  case HealthProbe::kContainerHealth:
    return "container_health";
  }
  return "container_health";
}

bool ParseHealthProbe(const std::string& raw, HealthProbe& probe) {
  const std::string normalized = core::ToLowerAscii(core::Trim(raw));
  if (normalized == "log_marker") {
    probe = HealthProbe::kLogMarker;
    return true;
  }
  if (normalized == "container_health") {
    probe = HealthProbe::kContainerHealth;
    return true;
  }
  return false;
}

ComposeService::ComposeService(host::IHostControl& host, ComposeServiceOptions options)
    : host_(host), options_(std::move(options)) {}

std::string ComposeService::Name() const {
  return options_.name;
}

std::string ComposeService::Docker() const {
  if (options_.privilege_prefix.empty()) {
    return "docker";
  }
  return options_.privilege_prefix + " docker";
}

bool ComposeService::Start(const core::TemplateVars& vars, std::string& error) {
  last_vars_ = vars;
  const std::string command = core::ExpandTemplate(options_.start_command, vars);
  host::CommandResult result;
  if (!host_.RunCommand(command, options_.start_timeout, result, error)) {
    return false;
  }
  if (result.timed_out) {
    error = options_.name + " start timed out";
    return false;
  }
  if (result.exit_code != 0) {
    error = options_.name + " start exited with code " + std::to_string(result.exit_code) +
            ": " + LastLines(result.output, 5U);
    return false;
  }
  return true;
}

bool ComposeService::IsReady() {
  host::CommandResult result;
  std::string error;
  if (options_.probe == HealthProbe::kLogMarker) {
    const std::string command = Docker() + " logs " + core::ShellQuote(options_.container) +
                                " 2>&1";
    if (!host_.RunCommand(command, options_.probe_timeout, result, error) ||
        result.exit_code != 0) {
      return false;
    }
    return result.output.find(options_.ready_marker) != std::string::npos;
  }

  const std::string command = Docker() + " inspect --format='{{.State.Health.Status}}' " +
                              core::ShellQuote(options_.container) + " 2>/dev/null";
  if (!host_.RunCommand(command, options_.probe_timeout, result, error) ||
      result.exit_code != 0) {
    return false;
  }
  return core::Trim(result.output) == "healthy";
}

bool ComposeService::Stop(const std::chrono::milliseconds timeout, std::string& error) {
  const std::string command = core::ExpandTemplate(options_.stop_command, last_vars_);
  host::CommandResult result;
  if (!host_.RunCommand(command, timeout, result, error)) {
    return false;
  }
  if (result.timed_out) {
    error = options_.name + " stop timed out after " + std::to_string(timeout.count()) + "ms";
    return false;
  }
  if (result.exit_code != 0) {
    error = options_.name + " stop exited with code " + std::to_string(result.exit_code);
    return false;
  }
  return true;
}

bool ComposeService::ForceStop(std::string& error) {
  const std::string docker = Docker();
  const std::string command = "ids=$(" + docker + " ps -q --filter " +
                              core::ShellQuote("name=" + options_.force_stop_filter) +
                              "); [ -z \"$ids\" ] || " + docker + " stop $ids";
  host::CommandResult result;
  if (!host_.RunCommand(command, options_.start_timeout, result, error)) {
    return false;
  }
  if (result.timed_out || result.exit_code != 0) {
    error = options_.name + " force stop failed (exit " + std::to_string(result.exit_code) +
            ")";
    return false;
  }
  return true;
}

std::string ComposeService::DiagnosticTail(const std::size_t max_lines) {
  const std::string command = Docker() + " logs --tail " + std::to_string(max_lines) + " " +
                              core::ShellQuote(options_.container) + " 2>&1";
  host::CommandResult result;
  std::string error;
  if (!host_.RunCommand(command, options_.probe_timeout, result, error)) {
    return "(no diagnostics: " + error + ")";
  }
  return result.output;
}

} // namespace ranops::services
