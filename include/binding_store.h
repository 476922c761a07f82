#pragma once
#include <map>
#include <string>
#include <vector>
#include "discovery_types.h"
#include "file_store.h"

struct DeviceIdentity {
  std::string hostname;
  std::string role;
};

struct LegacyHost {
  Binding binding;
  bool commented = false;
};

// ISC dhcpd "host NAME {hardware ethernet MAC; fixed-address IP; ...}" blocks,
// including ones disabled with a leading '#'.
std::vector<LegacyHost> parseLegacyHosts(const std::string& content);

bool parseInventory(const std::string& json, std::vector<Binding>& out, std::string& error);
std::string serializeInventory(const std::vector<Binding>& bindings, double timestamp);

// devices.json: {"devices": {"<ip>": {"hostname": .., "role": ..} | "<hostname> @<role>"}}
bool parseDeviceIdentities(const std::string& json, std::map<std::string, DeviceIdentity>& byIp,
                           std::string& error);

// planned / active / discovered, from the binding and what the last pass saw
// at its address (nullptr: never seen).
std::string deriveInventoryStatus(const Binding& binding, const DiscoveryEntry* seen);

// Bindings (inventory.json) are the source of intent; the device-identity file
// only names addresses that have no binding. Both are read once per pass.
class BindingStore {
public:
  BindingStore(std::string inventoryPath, std::string devicesPath);

  // Missing files are empty stores; unreadable or malformed ones are errors.
  bool load(std::string& error);

  const std::vector<Binding>& bindings() const { return items; }
  const Binding* findByIp(const std::string& ip) const;
  const DeviceIdentity* identityByIp(const std::string& ip) const;
  std::string roleForHostname(const std::string& hostname) const;

  // Bindings enriched for display: role, serial, inv_status, base config state.
  struct Listed {
    Binding binding;
    bool baseConfig = false;
  };
  std::vector<Listed> list(const DiscoveryCache& cache) const;

  // Imports uncommented entries of a legacy DHCP hosts file when the inventory
  // holds no bindings yet.
  bool migrateLegacy(const std::string& legacyHostsPath, FileStore& files, size_t& imported,
                     std::string& error);

private:
  std::string inventoryPath;
  std::string devicesPath;
  std::vector<Binding> items;
  std::map<std::string, size_t> byIp;
  std::map<std::string, DeviceIdentity> identities;
  std::map<std::string, std::string> rolesByHostname;
};
