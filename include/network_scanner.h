#pragma once
#include <ArduinoJson.h>
#include <map>
#include <string>
#include "command_runner.h"
#include "config_store.h"
#include "discovery_cache.h"
#include "discovery_types.h"
#include "file_store.h"

struct DiscoveryReport {
  bool success = false;
  std::string error;
  DiscoveryCache cache;
  size_t totalTargets = 0;
  size_t reachable = 0;
  std::string warning;
  std::map<std::string, PostProvision> postResults;
  bool cacheWritten = false;
};

void reportToJson(const DiscoveryReport& report, JsonObject out);
void snapshotToJson(const CacheSnapshot& snap, JsonObject out);

// One reconciliation pass: expand, ping, read neighbors, classify over ssh,
// reconcile against the binding store, post-provision, write the cache. Each
// stage finishes for the whole batch before the next one starts. Callers must
// not run two passes at once; a lock file rejects a second process.
class NetworkScanner {
public:
  NetworkScanner(const Config& cfg, CommandRunner& runner);

  // false with report.error set on a configuration error (nothing probed, no
  // cache written) or when the cache could not be saved (entries still filled).
  bool run(const std::string& rangeSpec, const PostProvisionToggles& toggles, DiscoveryReport& report);
  CacheSnapshot readCache() const;

  // Requested range, else the configured one, else one derived from dhcpd.conf.
  bool resolveRange(const std::string& requested, std::string& range, std::string& error) const;
  bool active() const;

private:
  void finishScan();

  const Config& config;
  CommandRunner& runner;
  mutable FileStore files;
  bool scanning = false;
};
