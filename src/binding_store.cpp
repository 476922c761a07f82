#include "binding_store.h"
#include "address_range.h"
#include "discovery_cache.h"
#include <ArduinoJson.h>
#include <regex>
#include <utility>
#include <spdlog/spdlog.h>

namespace {
  const char* SKIPPED_DEVICE_KEYS[] = {"defaults", "endpoint_hosts"};

  bool skippedDeviceKey(const char* key)
  {
    for (const char* skipped : SKIPPED_DEVICE_KEYS) {
      if (std::string(key) == skipped) return true;
    }
    return false;
  }

  // "spine-01 @spine" -> hostname and lower-case role.
  DeviceIdentity parseIdentityLine(const std::string& raw)
  {
    static const std::regex roleRe(R"(^(.+?)\s+@(\w+)$)");
    DeviceIdentity id;
    std::string line = trim(raw);
    std::smatch m;
    if (std::regex_match(line, m, roleRe)) {
      id.hostname = trim(m[1].str());
      id.role = toLower(m[2].str());
    } else {
      id.hostname = line;
    }
    return id;
  }
}

std::vector<LegacyHost> parseLegacyHosts(const std::string& content)
{
  static const std::regex hostRe(
      R"((?:^|\n)[ \t]*(#?)[ \t]*host\s+(\S+)\s*\{[^}]*hardware\s+ethernet\s+([\w:]+)\s*;[^}]*fixed-address\s+([\d.]+)\s*;[^}]*\})");
  std::vector<LegacyHost> hosts;
  for (std::sregex_iterator it(content.begin(), content.end(), hostRe), end; it != end; ++it) {
    const std::smatch& m = *it;
    LegacyHost h;
    h.commented = m[1].length() > 0;
    h.binding.hostname = m[2].str();
    h.binding.mac = toLower(m[3].str());
    h.binding.ip = m[4].str();
    h.binding.dhcp = true;
    hosts.push_back(h);
  }
  return hosts;
}

bool parseInventory(const std::string& json, std::vector<Binding>& out, std::string& error)
{
  JsonDocument doc;
  DeserializationError err = deserializeJson(doc, json);
  if (err) {
    error = std::string("inventory parse failed: ") + err.c_str();
    return false;
  }
  out.clear();
  for (JsonObjectConst obj : doc["bindings"].as<JsonArrayConst>()) {
    Binding b;
    b.hostname = trim(obj["hostname"] | "");
    b.ip = trim(obj["ip"] | "");
    b.mac = trim(obj["mac"] | "");
    b.role = obj["role"] | "";
    b.serial = obj["serial"] | "";
    b.inv_status = obj["inv_status"] | "";
    b.dhcp = obj["dhcp"] | true;
    if (b.ip.length()) out.push_back(b);
  }
  return true;
}

std::string serializeInventory(const std::vector<Binding>& bindings, double timestamp)
{
  JsonDocument doc;
  JsonArray arr = doc["bindings"].to<JsonArray>();
  for (const auto& b : bindings) {
    JsonObject obj = arr.add<JsonObject>();
    obj["hostname"] = b.hostname;
    obj["mac"] = b.mac;
    obj["ip"] = b.ip;
    obj["serial"] = b.serial;
    obj["role"] = b.role;
    obj["inv_status"] = b.inv_status;
    obj["dhcp"] = b.dhcp;
  }
  doc["timestamp"] = timestamp;
  std::string out;
  serializeJsonPretty(doc, out);
  return out;
}

bool parseDeviceIdentities(const std::string& json, std::map<std::string, DeviceIdentity>& byIp,
                           std::string& error)
{
  JsonDocument doc;
  DeserializationError err = deserializeJson(doc, json);
  if (err) {
    error = std::string("devices parse failed: ") + err.c_str();
    return false;
  }
  JsonObjectConst devices = doc["devices"].as<JsonObjectConst>();
  if (devices.isNull()) devices = doc.as<JsonObjectConst>();

  byIp.clear();
  uint32_t ignored;
  for (JsonPairConst kv : devices) {
    const char* key = kv.key().c_str();
    if (skippedDeviceKey(key)) continue;

    std::string ip;
    DeviceIdentity id;
    if (kv.value().is<JsonObjectConst>()) {
      JsonObjectConst info = kv.value().as<JsonObjectConst>();
      id.hostname = info["hostname"] | key;
      id.role = toLower(info["role"] | "");
      ip = info["ip"] | "";
      if (ip.empty() && parseIpv4(key, ignored)) ip = key;
    } else if (kv.value().is<const char*>()) {
      id = parseIdentityLine(kv.value().as<const char*>());
      ip = key;
    }
    if (ip.empty() || id.hostname.empty()) continue;
    byIp[ip] = id;
  }
  return true;
}

std::string deriveInventoryStatus(const Binding& b, const DiscoveryEntry* seen)
{
  bool placeholder = isPlaceholderMac(b.mac);
  bool provisioned = seen && seen->device_type == DeviceType::Provisioned;

  if (placeholder && b.dhcp) return "planned";
  if (placeholder) {
    if (provisioned) return "active";
    if (seen && seen->device_type != DeviceType::Unreachable) return "discovered";
    return "planned";
  }
  if (provisioned) return "active";
  if (seen && seen->device_type == DeviceType::NotProvisioned) return "discovered";
  return "active";
}

BindingStore::BindingStore(std::string inventory, std::string devices)
  : inventoryPath(std::move(inventory)), devicesPath(std::move(devices)) {}

bool BindingStore::load(std::string& error)
{
  items.clear();
  byIp.clear();
  identities.clear();
  rolesByHostname.clear();

  std::string text;
  if (fileExists(inventoryPath)) {
    if (!readTextFile(inventoryPath, text)) {
      error = "cannot read " + inventoryPath;
      return false;
    }
    if (!parseInventory(text, items, error)) return false;
  } else {
    spdlog::warn("Inventory {} missing, no bindings", inventoryPath);
  }
  for (size_t i = 0; i < items.size(); i++) {
    // First binding for an address wins.
    byIp.emplace(items[i].ip, i);
  }

  if (fileExists(devicesPath)) {
    if (!readTextFile(devicesPath, text)) {
      error = "cannot read " + devicesPath;
      return false;
    }
    if (!parseDeviceIdentities(text, identities, error)) return false;
    for (const auto& kv : identities) {
      if (kv.second.role.length()) rolesByHostname[kv.second.hostname] = kv.second.role;
    }
  }

  spdlog::info("Loaded {} bindings, {} device identities", items.size(), identities.size());
  return true;
}

const Binding* BindingStore::findByIp(const std::string& ip) const
{
  auto it = byIp.find(ip);
  return it == byIp.end() ? nullptr : &items[it->second];
}

const DeviceIdentity* BindingStore::identityByIp(const std::string& ip) const
{
  auto it = identities.find(ip);
  return it == identities.end() ? nullptr : &it->second;
}

std::string BindingStore::roleForHostname(const std::string& hostname) const
{
  auto it = rolesByHostname.find(hostname);
  return it == rolesByHostname.end() ? "" : it->second;
}

std::vector<BindingStore::Listed> BindingStore::list(const DiscoveryCache& cache) const
{
  std::map<std::string, const DiscoveryEntry*> seenByIp;
  for (const auto& e : cache.entries) seenByIp[e.ip] = &e;

  std::vector<Listed> listed;
  for (const auto& b : items) {
    Listed l;
    l.binding = b;
    auto it = seenByIp.find(b.ip);
    const DiscoveryEntry* seen = it == seenByIp.end() ? nullptr : it->second;

    if (b.mac.find_first_of("xX") != std::string::npos) l.binding.mac = "-";
    l.binding.inv_status = deriveInventoryStatus(b, seen);
    if (l.binding.role.empty()) l.binding.role = roleForHostname(b.hostname);
    if (l.binding.serial.empty() && seen) l.binding.serial = seen->serial;
    l.baseConfig = seen && (seen->post_provision == PostProvision::Already ||
                            seen->post_provision == PostProvision::Deployed);
    listed.push_back(l);
  }
  return listed;
}

bool BindingStore::migrateLegacy(const std::string& legacyHostsPath, FileStore& files, size_t& imported,
                                 std::string& error)
{
  imported = 0;
  if (!items.empty()) {
    spdlog::info("Inventory already holds {} bindings, nothing to migrate", items.size());
    return true;
  }
  std::string content;
  if (!readTextFile(legacyHostsPath, content)) {
    error = "cannot read " + legacyHostsPath;
    return false;
  }

  std::vector<Binding> migrated;
  for (const auto& h : parseLegacyHosts(content)) {
    if (!h.commented) migrated.push_back(h.binding);
  }
  if (migrated.empty()) return true;

  if (!files.write(inventoryPath, serializeInventory(migrated, nowSeconds()), error)) return false;
  items = migrated;
  byIp.clear();
  for (size_t i = 0; i < items.size(); i++) byIp.emplace(items[i].ip, i);
  imported = migrated.size();
  spdlog::info("Migrated {} bindings from {}", imported, legacyHostsPath);
  return true;
}
