#include "config/orchestrator_config.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <cmath>
#include <limits>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace ranops::config {

namespace {

using JsonValue = core::json::Value;

bool TryGetNonNegativeInteger(const JsonValue& value, std::uint64_t& out) {
  if (value.type != JsonValue::Type::kNumber) {
    return false;
  }
  if (!std::isfinite(value.number_value) || value.number_value < 0.0) {
    return false;
  }
  const double floored = std::floor(value.number_value);
  if (floored != value.number_value ||
      floored > static_cast<double>(std::numeric_limits<std::uint32_t>::max())) {
    return false;
  }
  out = static_cast<std::uint64_t>(floored);
  return true;
}

// Reads typed members of one config section. An absent section leaves every
// target untouched. The first type error is kept in `error` and turns every
// later read into a no-op.
class SectionReader {
public:
  SectionReader(const JsonValue& root, std::string_view name, std::string& error)
      : prefix_(std::string(name) + "."), error_(error) {
    section_ = core::json::FindMember(root, name);
    if (section_ != nullptr && section_->type != JsonValue::Type::kObject) {
      Fail(std::string(name), "object", *section_);
      section_ = nullptr;
    }
  }

  SectionReader(const JsonValue* section, std::string prefix, std::string& error)
      : section_(section), prefix_(std::move(prefix)), error_(error) {}

  bool ok() const {
    return error_.empty();
  }

  SectionReader Child(std::string_view name) {
    const JsonValue* child = Find(name);
    if (child != nullptr && child->type != JsonValue::Type::kObject) {
      Fail(prefix_ + std::string(name), "object", *child);
      child = nullptr;
    }
    return SectionReader(child, prefix_ + std::string(name) + ".", error_);
  }

  void String(std::string_view key, std::string& target) {
    const JsonValue* value = Find(key);
    if (value == nullptr) {
      return;
    }
    if (value->type != JsonValue::Type::kString) {
      Fail(prefix_ + std::string(key), "string", *value);
      return;
    }
    target = value->string_value;
  }

  void Path(std::string_view key, fs::path& target) {
    std::string raw = target.string();
    String(key, raw);
    target = raw;
  }

  void Count(std::string_view key, std::uint32_t& target) {
    std::uint64_t parsed = 0;
    if (ReadInteger(key, parsed)) {
      target = static_cast<std::uint32_t>(parsed);
    }
  }

  void Size(std::string_view key, std::size_t& target) {
    std::uint64_t parsed = 0;
    if (ReadInteger(key, parsed)) {
      target = static_cast<std::size_t>(parsed);
    }
  }

  void Port(std::string_view key, std::uint16_t& target) {
    const JsonValue* value = Find(key);
    if (value == nullptr) {
      return;
    }
    std::uint16_t port = 0;
    if (!ToPort(*value, port)) {
      Fail(prefix_ + std::string(key), "port number (1-65535)", *value);
      return;
    }
    target = port;
  }

  // Durations are configured in (possibly fractional) seconds.
  void Seconds(std::string_view key, std::chrono::milliseconds& target) {
    const JsonValue* value = Find(key);
    if (value == nullptr) {
      return;
    }
    if (value->type != JsonValue::Type::kNumber || !std::isfinite(value->number_value) ||
        value->number_value < 0.0) {
      Fail(prefix_ + std::string(key), "non-negative number of seconds", *value);
      return;
    }
    target = std::chrono::milliseconds(std::llround(value->number_value * 1000.0));
  }

  void StringList(std::string_view key, std::vector<std::string>& target) {
    const JsonValue* value = Find(key);
    if (value == nullptr) {
      return;
    }
    if (value->type != JsonValue::Type::kArray) {
      Fail(prefix_ + std::string(key), "array of strings", *value);
      return;
    }
    std::vector<std::string> parsed;
    for (const auto& item : value->array_value) {
      if (item.type != JsonValue::Type::kString) {
        Fail(prefix_ + std::string(key) + "[]", "string", item);
        return;
      }
      parsed.push_back(item.string_value);
    }
    target = std::move(parsed);
  }

  void PortList(std::string_view key, std::vector<std::uint16_t>& target) {
    const JsonValue* value = Find(key);
    if (value == nullptr) {
      return;
    }
    if (value->type != JsonValue::Type::kArray) {
      Fail(prefix_ + std::string(key), "array of ports", *value);
      return;
    }
    std::vector<std::uint16_t> parsed;
    for (const auto& item : value->array_value) {
      std::uint16_t port = 0;
      if (!ToPort(item, port)) {
        Fail(prefix_ + std::string(key) + "[]", "port number (1-65535)", item);
        return;
      }
      parsed.push_back(port);
    }
    target = std::move(parsed);
  }

  void Retry(std::string_view key, orchestration::RetryPolicy& target) {
    SectionReader retry = Child(key);
    retry.Count("max_attempts", target.max_attempts);
    retry.Seconds("initial_delay_sec", target.initial_delay);
    std::string backoff;
    retry.String("backoff", backoff);
    if (backoff == "exponential") {
      target.backoff = orchestration::BackoffMode::kExponential;
    } else if (backoff == "fixed") {
      target.backoff = orchestration::BackoffMode::kFixed;
    } else if (!backoff.empty() && ok()) {
      error_ = prefix_ + std::string(key) + ".backoff must be 'exponential' or 'fixed' (got '" +
               backoff + "')";
    }
  }

  void Probe(std::string_view key, services::HealthProbe& target) {
    std::string raw;
    String(key, raw);
    if (raw.empty()) {
      return;
    }
    if (!services::ParseHealthProbe(raw, target) && ok()) {
      error_ = prefix_ + std::string(key) + " must be 'log_marker' or 'container_health' (got '" +
               raw + "')";
    }
  }

private:
  const JsonValue* Find(std::string_view key) const {
    if (section_ == nullptr || !error_.empty()) {
      return nullptr;
    }
    return core::json::FindMember(*section_, key);
  }

  bool ReadInteger(std::string_view key, std::uint64_t& out) {
    const JsonValue* value = Find(key);
    if (value == nullptr) {
      return false;
    }
    if (!TryGetNonNegativeInteger(*value, out)) {
      Fail(prefix_ + std::string(key), "non-negative integer", *value);
      return false;
    }
    return true;
  }

  static bool ToPort(const JsonValue& value, std::uint16_t& port) {
    std::uint64_t parsed = 0;
    if (!TryGetNonNegativeInteger(value, parsed) || parsed == 0U || parsed > 65535U) {
      return false;
    }
    port = static_cast<std::uint16_t>(parsed);
    return true;
  }

  void Fail(const std::string& key, std::string_view expected, const JsonValue& got) {
    if (!error_.empty()) {
      return;
    }
    error_ = "config key '" + key + "' must be " + std::string(expected) + " (got " +
             core::json::TypeName(got.type) + ")";
  }

  const JsonValue* section_ = nullptr;
  std::string prefix_;
  std::string& error_;
};

void ReadService(SectionReader section, ServiceConfig& service) {
  section.String("compose_dir", service.compose_dir);
  section.String("container", service.container);
  section.Probe("probe", service.probe);
  section.String("ready_marker", service.ready_marker);
  section.String("start_command", service.start_command);
  section.String("stop_command", service.stop_command);
  section.String("force_stop_filter", service.force_stop_filter);
  section.Seconds("ready_timeout_sec", service.ready_timeout);
}

bool RequireFile(const fs::path& path, std::string_view what, std::string& error) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    error = std::string(what) + " not found: " + path.string();
    return false;
  }
  return true;
}

} // namespace

OrchestratorConfig DefaultOrchestratorConfig() {
  OrchestratorConfig config;

  config.control_plane.name = "control_plane";
  config.control_plane.compose_dir = "~/openran/oran-sc-ric";
  config.control_plane.container = "ric_submgr";
  config.control_plane.probe = services::HealthProbe::kLogMarker;
  config.control_plane.ready_marker = "RMR is ready now ...";
  config.control_plane.start_command =
      "cd {compose_dir} && sudo env METRICS_PATH={metrics_path} docker compose up -d";
  config.control_plane.stop_command =
      "cd {compose_dir} && sudo docker compose down -v --remove-orphans";
  config.control_plane.force_stop_filter = "ric";
  config.control_plane.ready_timeout = std::chrono::milliseconds(10'000);

  config.core.name = "core";
  config.core.compose_dir = "~/openran/srsRAN_Project/docker";
  config.core.container = "open5gs_5gc";
  config.core.probe = services::HealthProbe::kContainerHealth;
  config.core.start_command = "cd {compose_dir} && sudo docker compose up -d";
  config.core.stop_command = "cd {compose_dir} && sudo docker compose down -v --remove-orphans";
  config.core.force_stop_filter = "open5gs";
  config.core.ready_timeout = std::chrono::milliseconds(180'000);

  config.sink_command = "sudo docker exec -d open5gs_5gc iperf3 -s -p {port}";

  config.radio_command =
      "sudo gnb -c {config} --ran_node_name {name} --gnb_id 411 --gnb_cu_up_id 0 --gnb_du_id 0 "
      "cu_cp amf --bind_addr {bind_address} "
      "ru_sdr --device_args "
      "tx_port=tcp://127.0.0.1:{tx_port},rx_port=tcp://127.0.0.1:{rx_port},base_srate=11.52e6 "
      "log --filename {log_dir}/{name}.log --tracing_filename {log_dir}/{name}_tracing.log "
      "--radio_level warning "
      "pcap --mac_enable true --mac_filename {log_dir}/{name}_mac.pcap --mac_type udp "
      "--ngap_enable true --ngap_filename {log_dir}/{name}_ngap.pcap "
      "metrics --addr 127.0.0.1 --port {metrics_port} "
      "< /dev/null > {log_dir}/{name}_stdout.log 2>&1";
  config.radio_ready_markers = {
      "N2: Connection to AMF on 10.53.1.2:38412 was established",
      "E2AP: E2 connection to Near-RT-RIC on 127.0.0.1:36421 accepted",
  };

  config.client_command =
      "sudo srsue {config} --gw.netns {namespace} "
      "--rf.device_args "
      "tx_port=tcp://127.0.0.1:{tx_port},rx_port=tcp://127.0.0.1:{rx_port},base_srate=11.52e6 "
      "--usim.imsi {imsi} --usim.k {key} --usim.imei {imei} "
      "--log.all_level warning --log.filename {log_dir}/{namespace}.log "
      "--pcap.enable mac,mac_nr,nas "
      "--pcap.mac_filename {log_dir}/{namespace}_mac.pcap "
      "--pcap.nas_filename {log_dir}/{namespace}_nas.pcap "
      "--general.metrics_csv_enable 1 "
      "--general.metrics_csv_filename {log_dir}/{namespace}_metrics.csv "
      "> {log_dir}/{namespace}_stdout.log 2>&1";
  config.client_ready_markers = {
      "PDU Session Establishment successful. IP:",
      "RRC NR reconfiguration successful",
  };
  config.client_default_route_command =
      "sudo ip netns exec {namespace} sh -c "
      "'ip link show tun_srsue >/dev/null 2>&1 && "
      "ip route add default via 10.45.1.1 dev tun_srsue'";

  config.traffic_command = "sudo ip netns exec {namespace} bash {script} {port}";

  return config;
}

bool ParseOrchestratorConfig(const std::string_view json_text, OrchestratorConfig& config,
                             std::string& error) {
  error.clear();
  JsonValue root;
  if (!core::json::Parse(json_text, root, error)) {
    error = "invalid config JSON: " + error;
    return false;
  }
  if (root.type != JsonValue::Type::kObject) {
    error = "config root must be a JSON object";
    return false;
  }

  if (const JsonValue* privilege = core::json::FindMember(root, "privilege_prefix");
      privilege != nullptr) {
    if (privilege->type != JsonValue::Type::kString) {
      error = "config key 'privilege_prefix' must be string (got " +
              std::string(core::json::TypeName(privilege->type)) + ")";
      return false;
    }
    config.privilege_prefix = privilege->string_value;
  }

  SectionReader paths(root, "paths", error);
  paths.Path("base_dir", config.base_dir);
  paths.String("trial_set_prefix", config.trial_set_prefix);
  paths.String("experiment_prefix", config.experiment_prefix);
  paths.Path("client_table", config.client_table);
  paths.Path("radio_node_config", config.radio_node_config);
  paths.Path("client_config", config.client_config);
  paths.Path("state_file", config.state_file);
  paths.Path("temp_dir", config.temp_dir);
  paths.Path("scenario_pid_file", config.scenario_pid_file);
  paths.String("metrics_artifact", config.metrics_artifact);

  SectionReader grid(root, "grid", error);
  grid.Count("total_trial_sets", config.total_trial_sets);
  grid.Count("total_experiments", config.total_experiments);
  grid.Count("max_trial_retries", config.max_trial_retries);
  grid.Seconds("trial_retry_delay_sec", config.trial_retry_delay);
  grid.Seconds("inter_trial_pause_sec", config.inter_trial_pause);

  SectionReader service_section(root, "services", error);
  service_section.Seconds("health_interval_sec", config.health_interval);
  service_section.Seconds("stop_timeout_sec", config.service_stop_timeout);
  service_section.Retry("start_retry", config.service_start_retry);
  service_section.String("sink_command", config.sink_command);
  service_section.PortList("sink_ports", config.sink_ports);
  ReadService(service_section.Child("control_plane"), config.control_plane);
  ReadService(service_section.Child("core"), config.core);

  SectionReader radio(root, "radio", error);
  radio.String("name", config.radio_node_name);
  radio.String("session", config.radio_session);
  radio.String("bind_address", config.radio_bind_address);
  radio.Port("tx_port", config.radio_tx_port);
  radio.Port("rx_port", config.radio_rx_port);
  radio.String("command", config.radio_command);
  radio.PortList("ports", config.radio_ports);
  radio.Port("metrics_port", config.metrics_port);
  radio.String("metrics_sink_command", config.metrics_sink_command);
  radio.Path("metrics_sink_pid_file", config.metrics_sink_pid_file);
  radio.Seconds("metrics_sink_timeout_sec", config.metrics_sink_timeout);
  radio.StringList("ready_markers", config.radio_ready_markers);
  radio.Seconds("ready_timeout_sec", config.radio_ready_timeout);
  radio.Seconds("poll_interval_sec", config.radio_poll_interval);
  radio.Size("tail_lines", config.radio_tail_lines);
  radio.Retry("start_retry", config.radio_start_retry);

  SectionReader clients(root, "clients", error);
  clients.Count("count", config.client_count);
  clients.String("namespace_prefix", config.namespace_prefix);
  clients.String("bridge_address", config.bridge_address);
  clients.Seconds("bridge_timeout_sec", config.bridge_timeout);
  clients.Seconds("bridge_poll_interval_sec", config.bridge_poll_interval);
  clients.String("route", config.client_route);
  clients.String("command", config.client_command);
  clients.StringList("ready_markers", config.client_ready_markers);
  clients.Seconds("log_timeout_sec", config.client_log_timeout);
  clients.Seconds("ready_timeout_sec", config.client_ready_timeout);
  clients.Seconds("poll_interval_sec", config.client_poll_interval);
  clients.Size("tail_lines", config.client_tail_lines);
  clients.Retry("start_retry", config.client_start_retry);
  clients.String("default_route_command", config.client_default_route_command);

  SectionReader scenario(root, "scenario", error);
  scenario.Seconds("timeout_sec", config.scenario_timeout);
  scenario.Seconds("pid_timeout_sec", config.scenario_pid_timeout);

  SectionReader traffic(root, "traffic", error);
  traffic.String("command", config.traffic_command);
  traffic.Port("base_port", config.traffic_base_port);
  traffic.String("kill_pattern", config.traffic_kill_pattern);
  traffic.Seconds("duration_sec", config.traffic_duration);

  SectionReader validation(root, "validation", error);
  validation.Seconds("tolerance_sec", config.validation_tolerance);

  SectionReader cleanup(root, "cleanup", error);
  cleanup.StringList("kill_patterns", config.kill_patterns);
  cleanup.PortList("ports", config.cleanup_ports);
  cleanup.StringList("temp_file_patterns", config.temp_file_patterns);

  if (!error.empty()) {
    return false;
  }
  if (config.client_count == 0U) {
    error = "config key 'clients.count' must be at least 1";
    return false;
  }
  if (config.total_experiments == 0U) {
    error = "config key 'grid.total_experiments' must be at least 1";
    return false;
  }
  if (config.max_trial_retries > kMaxTrialRetries) {
    error = "config key 'grid.max_trial_retries' must be at most " +
            std::to_string(kMaxTrialRetries);
    return false;
  }
  return true;
}

bool LoadOrchestratorConfig(const fs::path& path, OrchestratorConfig& config,
                            std::string& error) {
  std::string contents;
  if (!core::ReadTextFile(path, contents, error)) {
    error = "unable to read config file: " + path.string();
    return false;
  }
  if (!ParseOrchestratorConfig(contents, config, error)) {
    error = path.string() + ": " + error;
    return false;
  }
  return true;
}

bool ValidatePreflight(const OrchestratorConfig& config, std::string& error) {
  if (!RequireFile(config.client_table, "client identity table", error) ||
      !RequireFile(config.radio_node_config, "radio node configuration", error) ||
      !RequireFile(config.client_config, "client configuration", error)) {
    return false;
  }
  std::error_code ec;
  if (!fs::is_directory(config.base_dir, ec)) {
    error = "experiment base directory not found: " + config.base_dir.string();
    return false;
  }
  return true;
}

} // namespace ranops::config
