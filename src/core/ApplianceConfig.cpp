/* @file ApplianceConfig.cpp
 * @brief JSON mapping and template expansion for ApplianceConfig.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>

// nlohmann headers
#include <nlohmann/json.hpp>

// fieldkit headers
#include "core/ApplianceConfig.hpp"

namespace fieldkit::core {

  namespace {

    using nlohmann::json;

    template <typename T> void readKey(const json& j, const char* key, T& out) {
      if (auto it = j.find(key); it != j.end())
        it->get_to(out);
    }

    template <typename Duration> void readDuration(const json& j, const char* key, Duration& out) {
      if (auto it = j.find(key); it != j.end())
        out = Duration{ it->get<long long>() };
    }

    void replaceAll(std::string& text, const std::string& token, const std::string& value) {
      std::size_t pos = 0;
      while ((pos = text.find(token, pos)) != std::string::npos) {
        text.replace(pos, token.size(), value);
        pos += value.size();
      }
    }

  } // namespace

  void from_json(const json& j, ExternalRepository& r) {
    readKey(j, "name", r.name);
    readKey(j, "package", r.package);
    readKey(j, "keyring_url", r.keyringUrl);
    readKey(j, "keyring_path", r.keyringPath);
    readKey(j, "source_list_url", r.sourceListUrl);
    readKey(j, "source_list_path", r.sourceListPath);
  }

  void from_json(const json& j, InterfaceToggle& t) {
    readKey(j, "label", t.label);
    readKey(j, "raspi_function", t.raspiFunction);
    readKey(j, "marker", t.marker);
  }

  void from_json(const json& j, ServiceConfig& s) {
    readKey(j, "name", s.name);
    readKey(j, "description", s.description);
    readKey(j, "exec_start", s.execStart);
    readKey(j, "working_directory", s.workingDirectory);
    readKey(j, "unit_directory", s.unitDirectory);
    readDuration(j, "restart_delay_s", s.restartDelay);
    readDuration(j, "stop_timeout_s", s.stopTimeout);
    readDuration(j, "smoke_grace_ms", s.smokeGrace);
    if (auto it = j.find("environment"); it != j.end()) {
      s.environment.clear();
      for (const auto& [key, value] : it->items())
        s.environment.emplace_back(key, value.get<std::string>());
    }
  }

  void from_json(const json& j, HardwareConfig& h) {
    readKey(j, "chip", h.chip);
    readKey(j, "led_pin", h.ledPin);
    readKey(j, "button_pin", h.buttonPin);
    readKey(j, "blink_cycles", h.blinkCycles);
    readDuration(j, "blink_on_ms", h.blinkOn);
    readDuration(j, "sensor_timeout_ms", h.sensorTimeout);
    readDuration(j, "poll_interval_ms", h.pollInterval);
  }

  void from_json(const json& j, ApplianceConfig& c) {
    readKey(j, "account", c.account);
    readKey(j, "home_directory", c.homeDirectory);
    readKey(j, "host_signature", c.hostSignature);
    readKey(j, "cpuinfo_path", c.cpuInfoPath);
    readKey(j, "audit_log", c.auditLog);

    readKey(j, "packages", c.packages);
    readKey(j, "upgrade_system", c.upgradeSystem);
    readKey(j, "repositories", c.repositories);
    readKey(j, "staged_directories", c.stagedDirectories);
    readKey(j, "staged_files", c.stagedFiles);
    readKey(j, "venv_directory", c.venvDirectory);
    readKey(j, "requirements_file", c.requirementsFile);
    readKey(j, "fallback_python_packages", c.fallbackPythonPackages);
    readKey(j, "app_script_source", c.appScriptSource);
    readKey(j, "app_script", c.appScript);
    readKey(j, "camera_tool", c.cameraTool);
    readKey(j, "data_directory", c.dataDirectory);

    readKey(j, "boot_config_paths", c.bootConfigPaths);
    readKey(j, "interface_gate_marker", c.interfaceGateMarker);
    readKey(j, "interfaces", c.interfaces);

    if (auto it = j.find("service"); it != j.end())
      from_json(*it, c.service);

    readKey(j, "sudoers_path", c.sudoersPath);
    readKey(j, "sudoers_backup_path", c.sudoersBackupPath);
    readKey(j, "grant_comment", c.grantComment);
    readKey(j, "grant_template", c.grantTemplate);
    readKey(j, "grant_commands", c.grantCommands);
    readKey(j, "groups", c.groups);

    readKey(j, "key_folder", c.keyFolder);
    readKey(j, "collaborator_key_file", c.collaboratorKeyFile);
    readKey(j, "collaborator_key_target", c.collaboratorKeyTarget);
    readKey(j, "collaborator_identity", c.collaboratorIdentity);
    readKey(j, "access_key_file", c.accessKeyFile);
    readKey(j, "authorized_keys", c.authorizedKeys);

    if (auto it = j.find("hardware"); it != j.end())
      from_json(*it, c.hardware);
  }

  std::string ApplianceConfig::expand(const std::string& text, const std::string& home) const {
    std::string out = text;
    replaceAll(out, "{home}", home.empty() ? homeDirectory : home);
    replaceAll(out, "{account}", account);
    return out;
  }

  std::vector<std::string> ApplianceConfig::grantedCommands() const {
    std::vector<std::string> out;
    out.reserve(grantCommands.size());
    for (const auto& cmd : grantCommands)
      out.push_back(expand(cmd));
    return out;
  }

  std::vector<std::string> ApplianceConfig::grantLines() const {
    std::vector<std::string> out;
    for (const auto& cmd : grantedCommands()) {
      std::string line = expand(grantTemplate);
      replaceAll(line, "{command}", cmd);
      out.push_back(std::move(line));
    }
    return out;
  }

  std::vector<GroupGrant> ApplianceConfig::groupGrants() const {
    std::vector<GroupGrant> out;
    for (const auto& g : groups)
      out.push_back({ account, g });
    return out;
  }

} // namespace fieldkit::core
