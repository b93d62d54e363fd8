#pragma once

#include "orchestration/retry_executor.hpp"
#include "services/compose_service.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace ranops::config {

// One docker-compose managed subsystem. Command templates may use
// `{compose_dir}` and `{metrics_path}`.
struct ServiceConfig {
  std::string name;
  std::string compose_dir;
  std::string container;
  services::HealthProbe probe = services::HealthProbe::kContainerHealth;
  std::string ready_marker;
  std::string start_command;
  std::string stop_command;
  std::string force_stop_filter;
  std::chrono::milliseconds ready_timeout{10'000};
};

inline constexpr std::uint32_t kMaxTrialRetries = 1000U;

// Every tunable of a run. Defaults reproduce the lab deployment the tool was
// built for; a JSON file passed with --config overrides any subset.
struct OrchestratorConfig {
  // Inputs and outputs.
  std::filesystem::path base_dir = "experiments";
  std::string trial_set_prefix = "tr";
  std::string experiment_prefix = "exp";
  std::filesystem::path client_table = "ue_data.csv";
  std::filesystem::path radio_node_config = "gnb_zmq.yaml";
  std::filesystem::path client_config = "ue_zmq.conf";
  std::filesystem::path state_file = "/tmp/experiment_state.json";
  std::filesystem::path temp_dir = "/tmp";
  std::filesystem::path scenario_pid_file = "/tmp/python_scenario.pid";
  std::string metrics_artifact = "metrics/kpm_style5_metrics.csv";
  std::string privilege_prefix = "sudo";

  // Grid and trial-level retry. max_trial_retries is capped at
  // kMaxTrialRetries when loaded from a file.
  std::uint32_t total_trial_sets = 100U;
  std::uint32_t total_experiments = 1U;
  std::uint32_t max_trial_retries = 3U;
  std::chrono::milliseconds trial_retry_delay{10'000};
  std::chrono::milliseconds inter_trial_pause{10'000};

  // Managed services.
  ServiceConfig control_plane;
  ServiceConfig core;
  orchestration::RetryPolicy service_start_retry{3U, std::chrono::milliseconds(10'000),
                                                 orchestration::BackoffMode::kExponential};
  std::chrono::milliseconds health_interval{5'000};
  std::chrono::milliseconds service_stop_timeout{30'000};
  // Traffic sinks started inside the core after it is healthy; `{port}`.
  std::string sink_command;
  std::vector<std::uint16_t> sink_ports = {5201, 5202, 5203};

  // Radio node.
  std::string radio_node_name = "cu_cp_01";
  std::string radio_session = "gnb_cu_cp_01";
  std::string radio_bind_address = "10.53.1.1";
  std::uint16_t radio_tx_port = 2000;
  std::uint16_t radio_rx_port = 2001;
  std::string radio_command;
  std::vector<std::uint16_t> radio_ports = {2000, 2001, 2100, 2101, 2200, 2201};
  std::uint16_t metrics_port = 55555;
  // Empty disables the metrics sink process.
  std::string metrics_sink_command;
  std::filesystem::path metrics_sink_pid_file = "/tmp/metrics_server.pid";
  std::chrono::milliseconds metrics_sink_timeout{30'000};
  std::vector<std::string> radio_ready_markers;
  std::chrono::milliseconds radio_ready_timeout{180'000};
  std::chrono::milliseconds radio_poll_interval{2'000};
  std::size_t radio_tail_lines = 20U;
  orchestration::RetryPolicy radio_start_retry{2U, std::chrono::milliseconds(15'000),
                                               orchestration::BackoffMode::kExponential};

  // Client namespaces and endpoints.
  std::uint32_t client_count = 3U;
  std::string namespace_prefix = "ue";
  std::string bridge_address = "10.53.1.1";
  std::chrono::milliseconds bridge_timeout{60'000};
  std::chrono::milliseconds bridge_poll_interval{2'000};
  std::string client_route = "10.45.0.0/16 via 10.53.1.2";
  std::string client_command;
  std::vector<std::string> client_ready_markers;
  std::chrono::milliseconds client_log_timeout{30'000};
  std::chrono::milliseconds client_ready_timeout{120'000};
  std::chrono::milliseconds client_poll_interval{2'000};
  std::size_t client_tail_lines = 15U;
  orchestration::RetryPolicy client_start_retry{2U, std::chrono::milliseconds(10'000),
                                                orchestration::BackoffMode::kExponential};
  // Run inside each client namespace once attached; `{namespace}`.
  std::string client_default_route_command;

  // Scenario and traffic.
  std::chrono::milliseconds scenario_timeout{120'000};
  std::chrono::milliseconds scenario_pid_timeout{10'000};
  std::string traffic_command;
  std::uint16_t traffic_base_port = 5200;
  // Last-resort kill for generators whose PID files are gone.
  std::string traffic_kill_pattern = "iperf3 -c";
  std::chrono::milliseconds traffic_duration{480'000};

  // Output validation: the artifact must span traffic_duration +- tolerance.
  std::chrono::milliseconds validation_tolerance{10'000};

  // Cleanup.
  std::vector<std::string> kill_patterns = {"sudo gnb", "sudo srsue", "python.*scenario"};
  std::vector<std::uint16_t> cleanup_ports = {2000, 2001, 2100, 2101, 2200,
                                              2201, 2300, 2301, 55555};
  std::vector<std::string> temp_file_patterns = {"ue*", "cu_cp*", "python_scenario.pid",
                                                 "iperf_*.pid", "metrics_server.pid"};
};

OrchestratorConfig DefaultOrchestratorConfig();

// Overlays the JSON document at `path` onto `config`. Unknown keys are
// ignored; a known key with the wrong type is an error.
bool LoadOrchestratorConfig(const std::filesystem::path& path, OrchestratorConfig& config,
                            std::string& error);

bool ParseOrchestratorConfig(std::string_view json_text, OrchestratorConfig& config,
                             std::string& error);

// Checks the run's fixed inputs before any trial starts. A failure here is a
// PreflightFailure: nothing can succeed without these.
bool ValidatePreflight(const OrchestratorConfig& config, std::string& error);

} // namespace ranops::config
