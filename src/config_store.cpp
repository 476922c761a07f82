#include "config_store.h"
#include <algorithm>
#include <utility>
#include <spdlog/spdlog.h>

ConfigStore::ConfigStore(std::string path) : configPath(std::move(path)) {}

void ConfigStore::applyDocument(JsonObjectConst doc)
{
  const Config defaults;

  config.discovery_range = trim(doc["discovery_range"] | "");
  config.dhcp_conf_file = doc["dhcp_conf_file"] | defaults.dhcp_conf_file.c_str();
  config.dhcp_hosts_file = doc["dhcp_hosts_file"] | defaults.dhcp_hosts_file.c_str();
  config.inventory_file = doc["inventory_file"] | defaults.inventory_file.c_str();
  config.devices_file = doc["devices_file"] | defaults.devices_file.c_str();
  config.cache_file = doc["cache_file"] | defaults.cache_file.c_str();
  config.lock_file = doc["lock_file"] | defaults.lock_file.c_str();
  config.base_config_dir = doc["base_config_dir"] | defaults.base_config_dir.c_str();
  config.stale_after_s = doc["stale_after_s"] | DEFAULT_STALE_AFTER_S;
  config.log_level = doc["log_level"] | defaults.log_level.c_str();

  JsonObjectConst ssh = doc["ssh"].as<JsonObjectConst>();
  config.ssh.user = ssh["user"] | DEFAULT_SSH_USER;
  config.ssh.run_as = ssh["run_as"] | "";
  config.ssh.identity_file = ssh["identity_file"] | "";
  config.ssh.marker = ssh["marker"] | DEFAULT_MARKER_PATH;

  JsonObjectConst post = doc["post_provision"].as<JsonObjectConst>();
  config.post_provision.base_config = post["base_config"] | true;
  config.post_provision.ztp_disable = post["ztp_disable"] | true;
  config.post_provision.set_hostname = post["set_hostname"] | true;

  JsonObjectConst limits = doc["limits"].as<JsonObjectConst>();
  config.limits.max_targets = limits["max_targets"] | DEFAULT_MAX_TARGETS;
  config.limits.probe_workers = limits["probe_workers"] | DEFAULT_PROBE_WORKERS;
  config.limits.classify_workers = limits["classify_workers"] | DEFAULT_CLASSIFY_WORKERS;
  config.limits.post_workers = limits["post_workers"] | DEFAULT_POST_WORKERS;
  config.limits.probe_pacing_ms = limits["probe_pacing_ms"] | DEFAULT_PROBE_PACING_MS;
  config.limits.max_targets = std::min(config.limits.max_targets, DEFAULT_MAX_TARGETS);
  if (!config.limits.probe_workers) config.limits.probe_workers = 1;
  if (!config.limits.classify_workers) config.limits.classify_workers = 1;
  if (!config.limits.post_workers) config.limits.post_workers = 1;
}

bool ConfigStore::load()
{
  if (!fileExists(configPath)) {
    spdlog::info("Config file {} missing, using defaults", configPath);
    return false;
  }
  std::string text;
  if (!readTextFile(configPath, text)) {
    spdlog::error("Config file {} unreadable, using defaults", configPath);
    return false;
  }
  JsonDocument doc;
  DeserializationError err = deserializeJson(doc, text);
  if (err) {
    spdlog::error("Config parse failed: {}", err.c_str());
    return false;
  }
  applyDocument(doc.as<JsonObjectConst>());
  return true;
}

void ConfigStore::toJson(JsonObject out) const
{
  out["discovery_range"] = config.discovery_range;
  out["dhcp_conf_file"] = config.dhcp_conf_file;
  out["dhcp_hosts_file"] = config.dhcp_hosts_file;
  out["inventory_file"] = config.inventory_file;
  out["devices_file"] = config.devices_file;
  out["cache_file"] = config.cache_file;
  out["lock_file"] = config.lock_file;
  out["base_config_dir"] = config.base_config_dir;
  out["stale_after_s"] = config.stale_after_s;
  out["log_level"] = config.log_level;

  JsonObject ssh = out["ssh"].to<JsonObject>();
  ssh["user"] = config.ssh.user;
  ssh["run_as"] = config.ssh.run_as;
  ssh["identity_file"] = config.ssh.identity_file;
  ssh["marker"] = config.ssh.marker;

  JsonObject post = out["post_provision"].to<JsonObject>();
  post["base_config"] = config.post_provision.base_config;
  post["ztp_disable"] = config.post_provision.ztp_disable;
  post["set_hostname"] = config.post_provision.set_hostname;

  JsonObject limits = out["limits"].to<JsonObject>();
  limits["max_targets"] = config.limits.max_targets;
  limits["probe_workers"] = config.limits.probe_workers;
  limits["classify_workers"] = config.limits.classify_workers;
  limits["post_workers"] = config.limits.post_workers;
  limits["probe_pacing_ms"] = config.limits.probe_pacing_ms;
}

bool ConfigStore::save(FileStore& files, std::string& error)
{
  JsonDocument doc;
  toJson(doc.to<JsonObject>());
  std::string out;
  serializeJsonPretty(doc, out);
  if (!files.write(configPath, out, error)) {
    spdlog::error("Config save failed: {}", error);
    return false;
  }
  spdlog::info("Config saved");
  return true;
}

bool ConfigStore::setDiscoveryRange(const std::string& range, FileStore& files, std::string& error)
{
  if (trim(range).length() && expandRange(range, 0).empty()) {
    error = "Invalid discovery range: " + range;
    return false;
  }
  config.discovery_range = trim(range);
  return save(files, error);
}

bool ConfigStore::setToggles(const PostProvisionToggles& toggles, FileStore& files, std::string& error)
{
  config.post_provision = toggles;
  return save(files, error);
}

Config& ConfigStore::data() { return config; }
const Config& ConfigStore::data() const { return config; }
