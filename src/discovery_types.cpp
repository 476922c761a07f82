#include "discovery_types.h"
#include <algorithm>
#include <cctype>

const char* toString(DeviceType type)
{
  switch (type) {
    case DeviceType::Unreachable: return "unreachable";
    case DeviceType::Provisioned: return "provisioned";
    case DeviceType::NotProvisioned: return "not_provisioned";
    case DeviceType::Other: return "other";
  }
  return "other";
}

const char* toString(MacStatus status)
{
  switch (status) {
    case MacStatus::Match: return "match";
    case MacStatus::Mismatch: return "mismatch";
    case MacStatus::Unreachable: return "unreachable";
    case MacStatus::NoBinding: return "no_binding";
  }
  return "no_binding";
}

const char* toString(PostProvision outcome)
{
  switch (outcome) {
    case PostProvision::None: return nullptr;
    case PostProvision::Already: return "already";
    case PostProvision::Deployed: return "deployed";
    case PostProvision::Failed: return "failed";
  }
  return nullptr;
}

bool parseDeviceType(const std::string& text, DeviceType& out)
{
  if (text == "unreachable") out = DeviceType::Unreachable;
  else if (text == "provisioned") out = DeviceType::Provisioned;
  else if (text == "not_provisioned") out = DeviceType::NotProvisioned;
  else if (text == "other") out = DeviceType::Other;
  else return false;
  return true;
}

bool parseMacStatus(const std::string& text, MacStatus& out)
{
  if (text == "match") out = MacStatus::Match;
  else if (text == "mismatch") out = MacStatus::Mismatch;
  else if (text == "unreachable") out = MacStatus::Unreachable;
  else if (text == "no_binding") out = MacStatus::NoBinding;
  else return false;
  return true;
}

bool parsePostProvision(const std::string& text, PostProvision& out)
{
  if (text == "already") out = PostProvision::Already;
  else if (text == "deployed") out = PostProvision::Deployed;
  else if (text == "failed") out = PostProvision::Failed;
  else return false;
  return true;
}

bool isPlaceholderMac(const std::string& mac)
{
  if (mac.empty() || mac == "-") return true;
  return mac.find('x') != std::string::npos || mac.find('X') != std::string::npos;
}

std::string toLower(std::string value)
{
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string trim(const std::string& value)
{
  size_t first = 0;
  while (first < value.size() && std::isspace(static_cast<unsigned char>(value[first]))) first++;
  size_t last = value.size();
  while (last > first && std::isspace(static_cast<unsigned char>(value[last - 1]))) last--;
  return value.substr(first, last - first);
}
