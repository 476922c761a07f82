#pragma once
#include <string>
#include <vector>

enum class DeviceType { Unreachable, Provisioned, NotProvisioned, Other };
enum class MacStatus { Match, Mismatch, Unreachable, NoBinding };
enum class PostProvision { None, Already, Deployed, Failed };

const char* toString(DeviceType type);
const char* toString(MacStatus status);
// PostProvision::None has no string form; it is written as JSON null.
const char* toString(PostProvision outcome);
bool parseDeviceType(const std::string& text, DeviceType& out);
bool parseMacStatus(const std::string& text, MacStatus& out);
bool parsePostProvision(const std::string& text, PostProvision& out);

struct Binding {
  std::string hostname;
  std::string ip;
  std::string mac;
  std::string role;
  std::string serial;
  std::string inv_status;
  bool dhcp = true;
};

// "-", empty, or an xx:xx:.. template: the device's MAC is not known yet.
bool isPlaceholderMac(const std::string& mac);

struct DiscoveryEntry {
  std::string ip;
  std::string hostname;
  std::string binding_mac;
  std::string discovered_mac;
  DeviceType device_type = DeviceType::Unreachable;
  MacStatus mac_status = MacStatus::NoBinding;
  std::string serial;
  std::string role;
  std::string source;
  bool has_binding = false;
  PostProvision post_provision = PostProvision::None;
};

struct DiscoveryCache {
  double timestamp = 0;
  std::string range;
  std::vector<DiscoveryEntry> entries;
};

struct PostProvisionToggles {
  bool base_config = true;
  bool ztp_disable = true;
  bool set_hostname = true;

  bool any() const { return base_config || ztp_disable || set_hostname; }
};

struct Classification {
  DeviceType type = DeviceType::Other;
  std::string serial;
};

std::string toLower(std::string value);
std::string trim(const std::string& value);
