#include "trial/trial_layout.hpp"

#include "core/fs_utils.hpp"
#include "core/string_utils.hpp"

#include <fstream>
#include <initializer_list>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace ranops::trial {

std::string TrialId::Label() const {
  return "tr" + std::to_string(trial_set) + "/exp" + std::to_string(experiment);
}

std::string TrialId::RetryKey() const {
  return "tr" + std::to_string(trial_set) + "_exp" + std::to_string(experiment);
}

TrialLayout::TrialLayout(const config::OrchestratorConfig& config, TrialId id)
    : config_(config), id_(id),
      directory_(config.base_dir / (config.trial_set_prefix + std::to_string(id.trial_set)) /
                 (config.experiment_prefix + std::to_string(id.experiment))) {}

fs::path TrialLayout::ConditionsFile() const {
  return directory_ / "conditions.csv";
}

fs::path TrialLayout::ScenarioScript() const {
  return directory_ / "run_scenario.sh";
}

fs::path TrialLayout::RadioLogDir() const {
  return directory_ / "gnb_logs";
}

fs::path TrialLayout::ClientLogDir() const {
  return directory_ / "ue_logs";
}

fs::path TrialLayout::MetricsDir() const {
  return directory_ / "metrics";
}

fs::path TrialLayout::MetricsArtifact() const {
  return directory_ / config_.metrics_artifact;
}

fs::path TrialLayout::RadioNodeLog() const {
  return RadioLogDir() / (config_.radio_node_name + ".log");
}

fs::path TrialLayout::ClientStdoutLog(const std::uint32_t index) const {
  return ClientLogDir() / (NamespaceName(index) + "_stdout.log");
}

fs::path TrialLayout::TrafficLog(const std::string& client) const {
  return directory_ / (client + "_iperf.log");
}

fs::path TrialLayout::TrafficPidFile(const std::string& client) const {
  return config_.temp_dir / ("iperf_" + client + ".pid");
}

std::string TrialLayout::NamespaceName(const std::uint32_t index) const {
  return config_.namespace_prefix + std::to_string(index);
}

std::string TrialLayout::ClientSession(const std::uint32_t index) const {
  return config_.namespace_prefix + std::to_string(index);
}

bool TrialLayout::CheckInputs(std::string& error) const {
  std::error_code ec;
  if (!fs::is_regular_file(ConditionsFile(), ec)) {
    error = "conditions file not found: " + ConditionsFile().string();
    return false;
  }
  if (!fs::is_regular_file(ScenarioScript(), ec)) {
    error = "scenario script not found: " + ScenarioScript().string();
    return false;
  }
  return true;
}

bool TrialLayout::PrepareDirectories(std::string& error) const {
  for (const fs::path& dir : {RadioLogDir(), ClientLogDir(), MetricsDir()}) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
      error = "failed to create directory '" + dir.string() + "': " + ec.message();
      return false;
    }
  }
  return true;
}

void ClientRadioPorts(const std::uint32_t index, std::uint16_t& tx_port, std::uint16_t& rx_port) {
  const std::uint32_t slot = index == 0U ? 0U : index - 1U;
  const std::uint32_t group = slot / 3U;
  const std::uint32_t offset = (slot % 3U) * 100U;
  rx_port = static_cast<std::uint16_t>(2100U + group * 1000U + offset);
  tx_port = static_cast<std::uint16_t>(rx_port + 1U);
}

bool ParseConditions(const fs::path& conditions_file, const fs::path& trial_directory,
                     std::vector<ConditionRow>& rows, std::string& error) {
  rows.clear();
  std::ifstream in(conditions_file);
  if (!in) {
    error = "unable to read conditions file: " + conditions_file.string();
    return false;
  }

  std::string line;
  std::size_t line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    const std::string trimmed = core::Trim(line);
    if (trimmed.empty()) {
      continue;
    }
    const std::size_t comma = trimmed.find(',');
    if (comma == std::string::npos) {
      error = conditions_file.string() + ":" + std::to_string(line_number) +
              ": expected '<client>,<profile script>'";
      return false;
    }
    ConditionRow row;
    row.client = core::Trim(std::string_view(trimmed).substr(0, comma));
    if (row.client == "UE") {
      continue;
    }
    const std::string script = core::Trim(std::string_view(trimmed).substr(comma + 1));
    if (row.client.empty() || script.empty()) {
      error = conditions_file.string() + ":" + std::to_string(line_number) +
              ": empty client or profile field";
      return false;
    }
    row.profile_script = fs::path(script);
    if (row.profile_script.is_relative()) {
      row.profile_script = trial_directory / row.profile_script;
    }
    rows.push_back(std::move(row));
  }
  return true;
}

bool LoadClientIdentities(const fs::path& table, std::vector<ClientIdentity>& identities,
                          std::string& error) {
  identities.clear();
  std::ifstream in(table);
  if (!in) {
    error = "unable to read client identity table: " + table.string();
    return false;
  }

  std::string line;
  std::size_t line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    const std::string trimmed = core::Trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    const std::vector<std::string> fields = core::SplitCsvLine(trimmed);
    if (fields.size() < 4U) {
      error = table.string() + ":" + std::to_string(line_number) +
              ": expected name,imsi,key,imei";
      return false;
    }
    identities.push_back(ClientIdentity{fields[0], fields[1], fields[2], fields[3]});
  }
  return true;
}

} // namespace ranops::trial
