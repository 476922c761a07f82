#pragma once
#include <ArduinoJson.h>
#include <string>
#include "address_range.h"
#include "device_classifier.h"
#include "discovery_cache.h"
#include "discovery_types.h"
#include "file_store.h"
#include "post_provision.h"
#include "reachability_prober.h"
#include "remote_shell.h"

static const char* const DEFAULT_CONFIG_PATH = "/etc/switchwatch/config.json";
static const char* const DEFAULT_DATA_DIR = "/var/lib/switchwatch";

struct Limits {
  size_t max_targets = DEFAULT_MAX_TARGETS;
  size_t probe_workers = DEFAULT_PROBE_WORKERS;
  size_t classify_workers = DEFAULT_CLASSIFY_WORKERS;
  size_t post_workers = DEFAULT_POST_WORKERS;
  unsigned probe_pacing_ms = DEFAULT_PROBE_PACING_MS;
};

struct Config {
  std::string discovery_range;
  std::string dhcp_conf_file = "/etc/dhcp/dhcpd.conf";
  std::string dhcp_hosts_file = "/etc/dhcp/dhcpd.hosts";
  std::string inventory_file = std::string(DEFAULT_DATA_DIR) + "/inventory.json";
  std::string devices_file = std::string(DEFAULT_DATA_DIR) + "/devices.json";
  std::string cache_file = std::string(DEFAULT_DATA_DIR) + "/discovery-cache.json";
  std::string lock_file = std::string(DEFAULT_DATA_DIR) + "/discovery.lock";
  std::string base_config_dir = std::string(DEFAULT_DATA_DIR) + "/sw-base";
  double stale_after_s = DEFAULT_STALE_AFTER_S;
  std::string log_level = "info";
  SshSettings ssh;
  PostProvisionToggles post_provision;
  Limits limits;
};

class ConfigStore {
public:
  explicit ConfigStore(std::string path = DEFAULT_CONFIG_PATH);
  // false when the file is missing or broken; data() then holds defaults.
  bool load();
  bool save(FileStore& files, std::string& error);
  Config& data();
  const Config& data() const;
  void toJson(JsonObject out) const;

  bool setDiscoveryRange(const std::string& range, FileStore& files, std::string& error);
  bool setToggles(const PostProvisionToggles& toggles, FileStore& files, std::string& error);

private:
  void applyDocument(JsonObjectConst doc);

  std::string configPath;
  Config config;
};
