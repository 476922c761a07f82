#pragma once
#include <ArduinoJson.h>
#include <string>
#include "discovery_types.h"
#include "file_store.h"

static const double DEFAULT_STALE_AFTER_S = 300;

struct CacheSnapshot {
  DiscoveryCache cache;
  bool stale = true;
  double ageSeconds = 0;
  std::string error;
};

void entryToJson(const DiscoveryEntry& entry, JsonObject out);
bool entryFromJson(JsonObjectConst in, DiscoveryEntry& entry);
void entriesToJson(const std::vector<DiscoveryEntry>& entries, JsonArray out);

std::string serializeCache(const DiscoveryCache& cache);
bool parseCache(const std::string& text, DiscoveryCache& cache, std::string& error);

double nowSeconds();

class DiscoveryCacheFile {
public:
  DiscoveryCacheFile(std::string path, FileStore& files, double staleAfterS = DEFAULT_STALE_AFTER_S);
  bool write(const DiscoveryCache& cache, std::string& error);
  CacheSnapshot read() const { return read(nowSeconds()); }
  CacheSnapshot read(double now) const;

private:
  std::string cachePath;
  FileStore& files;
  double staleAfterS;
};
