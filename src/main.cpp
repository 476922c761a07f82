#include <ArduinoJson.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <getopt.h>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "binding_store.h"
#include "command_runner.h"
#include "config_store.h"
#include "discovery_cache.h"
#include "network_scanner.h"
#include "post_provision.h"

namespace {
  const char* USAGE =
    "usage: switchwatch [-c config.json] [-v] <command> [options]\n"
    "\n"
    "commands:\n"
    "  discover [--range R] [--no-base-config] [--no-ztp-disable] [--no-hostname]\n"
    "  cache\n"
    "  bindings\n"
    "  migrate\n"
    "  deploy [--files a,b,...] [--no-ztp-disable] IP...\n"
    "  settings [--range R] [--base-config on|off] [--ztp-disable on|off] [--set-hostname on|off]\n";

  int usage()
  {
    std::cerr << USAGE;
    return 2;
  }

  void printJson(JsonDocument& doc)
  {
    serializeJsonPretty(doc, std::cout);
    std::cout << std::endl;
  }

  int printError(const std::string& msg)
  {
    JsonDocument doc;
    doc["success"] = false;
    doc["error"] = msg;
    printJson(doc);
    return 1;
  }

  bool parseSwitch(const std::string& value, bool& out)
  {
    if (value == "on" || value == "true" || value == "1") out = true;
    else if (value == "off" || value == "false" || value == "0") out = false;
    else return false;
    return true;
  }

  std::vector<std::string> splitList(const std::string& value)
  {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
      item = trim(item);
      if (item.length()) items.push_back(item);
    }
    return items;
  }

  int cmdDiscover(ConfigStore& store, CommandRunner& runner, const std::vector<std::string>& args)
  {
    std::string range;
    PostProvisionToggles toggles = store.data().post_provision;
    for (size_t i = 0; i < args.size(); i++) {
      if (args[i] == "--range" && i + 1 < args.size()) range = args[++i];
      else if (args[i] == "--no-base-config") toggles.base_config = false;
      else if (args[i] == "--no-ztp-disable") toggles.ztp_disable = false;
      else if (args[i] == "--no-hostname") toggles.set_hostname = false;
      else return usage();
    }

    NetworkScanner scanner(store.data(), runner);
    DiscoveryReport report;
    bool ok = scanner.run(range, toggles, report);
    JsonDocument doc;
    reportToJson(report, doc.to<JsonObject>());
    printJson(doc);
    return ok ? 0 : 1;
  }

  int cmdCache(ConfigStore& store, CommandRunner& runner)
  {
    NetworkScanner scanner(store.data(), runner);
    JsonDocument doc;
    snapshotToJson(scanner.readCache(), doc.to<JsonObject>());
    printJson(doc);
    return 0;
  }

  int cmdBindings(ConfigStore& store, CommandRunner& runner)
  {
    const Config& cfg = store.data();
    BindingStore bindings(cfg.inventory_file, cfg.devices_file);
    std::string error;
    if (!bindings.load(error)) return printError(error);
    NetworkScanner scanner(cfg, runner);
    CacheSnapshot snap = scanner.readCache();

    JsonDocument doc;
    doc["success"] = true;
    doc["source"] = "inventory";
    JsonArray arr = doc["bindings"].to<JsonArray>();
    for (const auto& l : bindings.list(snap.cache)) {
      JsonObject o = arr.add<JsonObject>();
      o["hostname"] = l.binding.hostname;
      o["ip"] = l.binding.ip;
      o["mac"] = l.binding.mac;
      o["role"] = l.binding.role;
      o["serial"] = l.binding.serial;
      o["dhcp"] = l.binding.dhcp;
      o["inv_status"] = l.binding.inv_status;
      o["base_config"] = l.baseConfig;
    }
    printJson(doc);
    return 0;
  }

  int cmdMigrate(ConfigStore& store, CommandRunner& runner)
  {
    const Config& cfg = store.data();
    BindingStore bindings(cfg.inventory_file, cfg.devices_file);
    FileStore files(runner, cfg.ssh.run_as);
    std::string error;
    size_t imported = 0;
    if (!bindings.load(error) || !bindings.migrateLegacy(cfg.dhcp_hosts_file, files, imported, error)) {
      return printError(error);
    }
    JsonDocument doc;
    doc["success"] = true;
    doc["imported"] = imported;
    doc["total"] = bindings.bindings().size();
    printJson(doc);
    return 0;
  }

  int cmdDeploy(ConfigStore& store, CommandRunner& runner, const std::vector<std::string>& args)
  {
    const Config& cfg = store.data();
    std::vector<std::string> files;
    for (const auto& f : defaultDeployMap()) files.push_back(f.name);
    bool disableZtp = cfg.post_provision.ztp_disable;
    std::vector<std::string> ips;
    for (size_t i = 0; i < args.size(); i++) {
      if (args[i] == "--files" && i + 1 < args.size()) files = splitList(args[++i]);
      else if (args[i] == "--no-ztp-disable") disableZtp = false;
      else if (args[i].compare(0, 2, "--") == 0) return usage();
      else ips.push_back(args[i]);
    }
    if (ips.empty()) return usage();

    BindingStore bindings(cfg.inventory_file, cfg.devices_file);
    std::string error;
    if (!bindings.load(error)) return printError(error);

    PostProvisioner provisioner(runner, cfg.ssh, cfg.base_config_dir, cfg.post_provision);
    JsonDocument doc;
    JsonArray results = doc["results"].to<JsonArray>();
    size_t succeeded = 0;
    for (const auto& ip : ips) {
      const Binding* b = bindings.findByIp(ip);
      DeployResult r = provisioner.deployBaseConfig(ip, b ? b->hostname : "", files, disableZtp);
      if (r.success) succeeded++;
      JsonObject o = results.add<JsonObject>();
      o["ip"] = r.ip;
      o["hostname"] = r.hostname;
      o["success"] = r.success;
      o["message"] = r.message;
      o["error"] = r.error;
    }
    doc["success"] = succeeded == ips.size();
    doc["deployed"] = succeeded;
    printJson(doc);
    return succeeded == ips.size() ? 0 : 1;
  }

  int cmdSettings(ConfigStore& store, CommandRunner& runner, const std::vector<std::string>& args)
  {
    FileStore files(runner, store.data().ssh.run_as);
    PostProvisionToggles toggles = store.data().post_provision;
    bool haveRange = false;
    std::string range;
    for (size_t i = 0; i + 1 < args.size(); i += 2) {
      const std::string& key = args[i];
      const std::string& value = args[i + 1];
      bool ok = true;
      if (key == "--range") {
        range = value;
        haveRange = true;
      } else if (key == "--base-config") ok = parseSwitch(value, toggles.base_config);
      else if (key == "--ztp-disable") ok = parseSwitch(value, toggles.ztp_disable);
      else if (key == "--set-hostname") ok = parseSwitch(value, toggles.set_hostname);
      else ok = false;
      if (!ok) return usage();
    }
    if (args.size() % 2) return usage();

    std::string error;
    if (haveRange && !store.setDiscoveryRange(range, files, error)) return printError(error);
    if (!store.setToggles(toggles, files, error)) return printError(error);

    JsonDocument doc;
    doc["success"] = true;
    store.toJson(doc["config"].to<JsonObject>());
    printJson(doc);
    return 0;
  }
}

int main(int argc, char** argv)
{
  auto logger = spdlog::stderr_color_mt("switchwatch");
  spdlog::set_default_logger(logger);

  std::string configPath = DEFAULT_CONFIG_PATH;
  bool verbose = false;
  static const option longOptions[] = {
    {"config", required_argument, nullptr, 'c'},
    {"verbose", no_argument, nullptr, 'v'},
    {"help", no_argument, nullptr, 'h'},
    {nullptr, 0, nullptr, 0},
  };
  int opt;
  while ((opt = getopt_long(argc, argv, "+c:vh", longOptions, nullptr)) != -1) {
    switch (opt) {
      case 'c': configPath = optarg; break;
      case 'v': verbose = true; break;
      default: return usage();
    }
  }
  if (optind >= argc) return usage();
  std::string command = argv[optind];
  std::vector<std::string> args(argv + optind + 1, argv + argc);

  ConfigStore store(configPath);
  store.load();
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::from_str(store.data().log_level));

  ProcessRunner runner;
  if (command == "discover") return cmdDiscover(store, runner, args);
  if (command == "cache") return cmdCache(store, runner);
  if (command == "bindings") return cmdBindings(store, runner);
  if (command == "migrate") return cmdMigrate(store, runner);
  if (command == "deploy") return cmdDeploy(store, runner, args);
  if (command == "settings") return cmdSettings(store, runner, args);
  return usage();
}
