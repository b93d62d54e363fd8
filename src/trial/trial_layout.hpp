#pragma once

#include "config/orchestrator_config.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ranops::trial {

// One cell of the (trial set x experiment) grid.
struct TrialId {
  std::uint32_t trial_set = 0;
  std::uint32_t experiment = 1;

  // "tr3/exp1": log scope and resource owner.
  std::string Label() const;
  // "tr3_exp1": key of the per-trial retry counters.
  std::string RetryKey() const;

  bool operator==(const TrialId& other) const {
    return trial_set == other.trial_set && experiment == other.experiment;
  }
  bool operator!=(const TrialId& other) const {
    return !(*this == other);
  }
};

// One conditions.csv row: which client runs which traffic profile.
struct ConditionRow {
  std::string client;
  std::filesystem::path profile_script;
};

// One row of the client identity table (name, IMSI, key, IMEI).
struct ClientIdentity {
  std::string name;
  std::string imsi;
  std::string key;
  std::string imei;
};

// Resolves every path belonging to one trial. The trial directory itself is
// produced by the experiment generator and read-only here, except for the
// log and metrics directories created under it.
class TrialLayout {
public:
  TrialLayout(const config::OrchestratorConfig& config, TrialId id);

  const TrialId& id() const {
    return id_;
  }

  const std::filesystem::path& Directory() const {
    return directory_;
  }

  std::filesystem::path ConditionsFile() const;
  std::filesystem::path ScenarioScript() const;
  std::filesystem::path RadioLogDir() const;
  std::filesystem::path ClientLogDir() const;
  std::filesystem::path MetricsDir() const;
  std::filesystem::path MetricsArtifact() const;

  std::filesystem::path RadioNodeLog() const;
  // 1-based client index.
  std::filesystem::path ClientStdoutLog(std::uint32_t index) const;
  std::filesystem::path TrafficLog(const std::string& client) const;
  std::filesystem::path TrafficPidFile(const std::string& client) const;

  std::string NamespaceName(std::uint32_t index) const;
  std::string ClientSession(std::uint32_t index) const;

  // Missing conditions.csv or run_scenario.sh fails the attempt.
  bool CheckInputs(std::string& error) const;
  bool PrepareDirectories(std::string& error) const;

private:
  const config::OrchestratorConfig& config_;
  TrialId id_;
  std::filesystem::path directory_;
};

// ZMQ radio port pair for client `index`: three clients per thousand block,
// a hundred apart.
void ClientRadioPorts(std::uint32_t index, std::uint16_t& tx_port, std::uint16_t& rx_port);

// Parses conditions.csv. Relative profile paths resolve against the trial
// directory.
bool ParseConditions(const std::filesystem::path& conditions_file,
                     const std::filesystem::path& trial_directory,
                     std::vector<ConditionRow>& rows, std::string& error);

// Parses the client identity table; comment ('#') and blank lines are
// skipped.
bool LoadClientIdentities(const std::filesystem::path& table,
                          std::vector<ClientIdentity>& identities, std::string& error);

} // namespace ranops::trial
