#include "discovery_cache.h"
#include <chrono>
#include <utility>
#include <spdlog/spdlog.h>

double nowSeconds()
{
  auto since = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::duration<double>>(since).count();
}

void entryToJson(const DiscoveryEntry& e, JsonObject o)
{
  o["ip"] = e.ip;
  o["hostname"] = e.hostname;
  o["binding_mac"] = e.binding_mac;
  o["discovered_mac"] = e.discovered_mac;
  o["device_type"] = toString(e.device_type);
  o["mac_status"] = toString(e.mac_status);
  o["serial"] = e.serial;
  o["role"] = e.role;
  o["source"] = e.source;
  o["has_binding"] = e.has_binding;
  if (e.post_provision == PostProvision::None) o["post_provision"] = nullptr;
  else o["post_provision"] = toString(e.post_provision);
}

bool entryFromJson(JsonObjectConst o, DiscoveryEntry& e)
{
  e.ip = o["ip"] | "";
  if (e.ip.empty()) return false;
  e.hostname = o["hostname"] | "";
  e.binding_mac = o["binding_mac"] | "";
  e.discovered_mac = o["discovered_mac"] | "";
  if (!parseDeviceType(o["device_type"] | "", e.device_type)) e.device_type = DeviceType::Unreachable;
  if (!parseMacStatus(o["mac_status"] | "", e.mac_status)) e.mac_status = MacStatus::NoBinding;
  e.serial = o["serial"] | "";
  e.role = o["role"] | "";
  e.source = o["source"] | "";
  e.has_binding = o["has_binding"] | false;
  if (!parsePostProvision(o["post_provision"] | "", e.post_provision)) e.post_provision = PostProvision::None;
  return true;
}

void entriesToJson(const std::vector<DiscoveryEntry>& entries, JsonArray out)
{
  for (const auto& e : entries) entryToJson(e, out.add<JsonObject>());
}

std::string serializeCache(const DiscoveryCache& cache)
{
  JsonDocument doc;
  doc["timestamp"] = cache.timestamp;
  doc["range"] = cache.range;
  entriesToJson(cache.entries, doc["entries"].to<JsonArray>());
  std::string out;
  serializeJson(doc, out);
  return out;
}

bool parseCache(const std::string& text, DiscoveryCache& cache, std::string& error)
{
  JsonDocument doc;
  DeserializationError err = deserializeJson(doc, text);
  if (err) {
    error = std::string("cache parse failed: ") + err.c_str();
    return false;
  }
  cache.timestamp = doc["timestamp"] | 0.0;
  cache.range = doc["range"] | "";
  cache.entries.clear();
  for (JsonObjectConst o : doc["entries"].as<JsonArrayConst>()) {
    DiscoveryEntry e;
    if (entryFromJson(o, e)) cache.entries.push_back(e);
  }
  return true;
}

DiscoveryCacheFile::DiscoveryCacheFile(std::string p, FileStore& f, double stale)
  : cachePath(std::move(p)), files(f), staleAfterS(stale) {}

bool DiscoveryCacheFile::write(const DiscoveryCache& cache, std::string& error)
{
  if (!files.write(cachePath, serializeCache(cache), error)) {
    spdlog::error("Discovery cache write failed: {}", error);
    return false;
  }
  spdlog::info("Discovery cache saved ({} entries)", cache.entries.size());
  return true;
}

CacheSnapshot DiscoveryCacheFile::read(double now) const
{
  CacheSnapshot snap;
  if (!fileExists(cachePath)) return snap;

  std::string text;
  if (!readTextFile(cachePath, text)) {
    snap.error = "cannot read " + cachePath;
    return snap;
  }
  DiscoveryCache cache;
  if (!parseCache(text, cache, snap.error)) return snap;

  snap.cache = cache;
  snap.ageSeconds = now - cache.timestamp;
  snap.stale = snap.ageSeconds > staleAfterS;
  return snap;
}
