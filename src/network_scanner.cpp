#include "network_scanner.h"
#include "address_range.h"
#include "binding_store.h"
#include "device_classifier.h"
#include "neighbor_table.h"
#include "post_provision.h"
#include "reachability_prober.h"
#include "state_reconciler.h"
#include <algorithm>
#include <spdlog/spdlog.h>

void reportToJson(const DiscoveryReport& report, JsonObject out)
{
  out["success"] = report.success;
  if (report.error.length()) out["error"] = report.error;
  entriesToJson(report.cache.entries, out["entries"].to<JsonArray>());
  out["scan_type"] = "subnet";
  out["discovery_range"] = report.cache.range;
  out["timestamp"] = report.cache.timestamp;
  out["total_ips"] = report.totalTargets;
  out["reachable"] = report.reachable;
  JsonObject post = out["post_provision_results"].to<JsonObject>();
  for (const auto& kv : report.postResults) {
    if (kv.second == PostProvision::None) post[kv.first] = nullptr;
    else post[kv.first] = toString(kv.second);
  }
  out["warning"] = report.warning;
  out["cache_written"] = report.cacheWritten;
}

void snapshotToJson(const CacheSnapshot& snap, JsonObject out)
{
  out["success"] = true;
  out["timestamp"] = snap.cache.timestamp;
  out["range"] = snap.cache.range;
  entriesToJson(snap.cache.entries, out["entries"].to<JsonArray>());
  out["stale"] = snap.stale;
  if (snap.cache.timestamp > 0) out["age_seconds"] = static_cast<long>(snap.ageSeconds);
  if (snap.error.length()) out["error"] = snap.error;
}

NetworkScanner::NetworkScanner(const Config& cfg, CommandRunner& r)
  : config(cfg), runner(r), files(r, cfg.ssh.run_as) {}

bool NetworkScanner::resolveRange(const std::string& requested, std::string& range, std::string& error) const
{
  range = trim(requested);
  if (range.empty()) range = config.discovery_range;
  if (range.empty()) {
    std::string conf;
    if (readTextFile(config.dhcp_conf_file, conf)) range = rangeFromDhcpConf(conf);
    if (range.length()) spdlog::info("Using discovery range {} from {}", range, config.dhcp_conf_file);
  }
  if (range.empty()) {
    error = "No discovery range configured. Set it in the DHCP server configuration.";
    return false;
  }
  return true;
}

bool NetworkScanner::run(const std::string& rangeSpec, const PostProvisionToggles& toggles,
                         DiscoveryReport& report)
{
  report = DiscoveryReport();
  if (scanning) {
    report.error = "Discovery already running";
    return false;
  }
  std::string range;
  if (!resolveRange(rangeSpec, range, report.error)) return false;

  std::vector<std::string> targets;
  size_t maxTargets = std::min(config.limits.max_targets, DEFAULT_MAX_TARGETS);
  if (!expandTargets(range, maxTargets, targets, report.error)) {
    spdlog::error("{}", report.error);
    return false;
  }

  PassLock lock(config.lock_file);
  if (!lock.acquire(report.error)) {
    spdlog::error("{}", report.error);
    return false;
  }

  BindingStore bindings(config.inventory_file, config.devices_file);
  if (!bindings.load(report.error)) {
    spdlog::error("Binding store: {}", report.error);
    return false;
  }

  DiscoveryCacheFile cacheFile(config.cache_file, files, config.stale_after_s);
  CacheSnapshot prior = cacheFile.read();

  scanning = true;
  report.totalTargets = targets.size();
  report.warning = nonPrivateWarning(targets);
  if (report.warning.length()) spdlog::warn("{}", report.warning);
  spdlog::info("Scan started: {} ({} addresses)", range, targets.size());

  ProbeOptions probe;
  probe.workers = config.limits.probe_workers;
  probe.pacingMs = config.limits.probe_pacing_ms;
  probe.shortWait = report.warning.length() > 0;

  StageResults stages;
  stages.reachable = ReachabilityProber(runner).probe(targets, probe);
  stages.neighbors = NeighborResolver(runner).resolve();

  std::vector<std::string> alive;
  for (const auto& ip : targets) {
    if (stages.reachable[ip]) alive.push_back(ip);
  }
  report.reachable = alive.size();
  stages.classified = DeviceClassifier(runner, config.ssh).classifyAll(alive, config.limits.classify_workers);

  StateReconciler reconciler(bindings, prior.cache);
  report.cache.entries = reconciler.reconcile(targets, stages);
  report.cache.range = range;

  PostProvisioner provisioner(runner, config.ssh, config.base_config_dir, toggles);
  report.postResults = provisioner.run(report.cache.entries, config.limits.post_workers);

  report.cache.timestamp = nowSeconds();
  std::string writeError;
  report.cacheWritten = cacheFile.write(report.cache, writeError);
  if (!report.cacheWritten) report.error = "Failed to write discovery cache: " + writeError;
  report.success = report.cacheWritten;

  finishScan();
  return report.success;
}

void NetworkScanner::finishScan()
{
  scanning = false;
  spdlog::info("Scan complete");
}

CacheSnapshot NetworkScanner::readCache() const
{
  return DiscoveryCacheFile(config.cache_file, files, config.stale_after_s).read();
}

bool NetworkScanner::active() const { return scanning; }
