#include "address_range.h"
#include "discovery_types.h"
#include <algorithm>
#include <limits>
#include <regex>
#include <set>
#include <sstream>

namespace {
  const size_t WARNING_SAMPLE = 5;
}

bool parseIpv4(const std::string& text, uint32_t& out)
{
  std::string token = trim(text);
  uint32_t value = 0;
  int octets = 0;
  size_t pos = 0;
  while (octets < 4) {
    size_t start = pos;
    uint32_t octet = 0;
    while (pos < token.size() && token[pos] >= '0' && token[pos] <= '9' && pos - start < 3) {
      octet = octet * 10 + static_cast<uint32_t>(token[pos] - '0');
      pos++;
    }
    if (pos == start || octet > 255) return false;
    value = (value << 8) | octet;
    octets++;
    if (octets < 4) {
      if (pos >= token.size() || token[pos] != '.') return false;
      pos++;
    }
  }
  if (pos != token.size()) return false;
  out = value;
  return true;
}

std::string intToIp(uint32_t value)
{
  std::ostringstream ss;
  ss << ((value >> 24) & 0xFF) << '.' << ((value >> 16) & 0xFF) << '.'
     << ((value >> 8) & 0xFF) << '.' << (value & 0xFF);
  return ss.str();
}

std::vector<std::string> expandRange(const std::string& spec, size_t limit)
{
  std::vector<std::string> result;
  std::set<uint32_t> seen;
  auto add = [&](uint32_t ip) {
    if (seen.insert(ip).second) result.push_back(intToIp(ip));
  };
  auto full = [&]() { return result.size() > limit; };

  std::stringstream ss(spec);
  std::string segment;
  while (!full() && std::getline(ss, segment, ',')) {
    segment = trim(segment);
    if (segment.empty()) continue;

    size_t dash = segment.find('-');
    if (dash == std::string::npos) {
      uint32_t ip;
      if (parseIpv4(segment, ip)) add(ip);
      continue;
    }

    uint32_t first, last;
    if (!parseIpv4(segment.substr(0, dash), first) || !parseIpv4(segment.substr(dash + 1), last)) continue;
    if (first > last) continue;

    if ((first & 0xFFFFFF00) == (last & 0xFFFFFF00)) {
      uint32_t prefix = first & 0xFFFFFF00;
      for (uint32_t octet = first & 0xFF; octet <= (last & 0xFF) && !full(); octet++) add(prefix | octet);
    } else {
      for (uint64_t ip = first; ip <= last && !full(); ip++) add(static_cast<uint32_t>(ip));
    }
  }
  return result;
}

bool expandTargets(const std::string& spec, size_t maxTargets,
                   std::vector<std::string>& out, std::string& error)
{
  out = expandRange(spec, maxTargets);
  if (out.empty()) {
    error = "Invalid discovery range: " + spec;
    return false;
  }
  if (out.size() > maxTargets) {
    error = "Discovery range too large: more than " + std::to_string(maxTargets) +
            " IPs. Narrow the range.";
    out.clear();
    return false;
  }
  return true;
}

bool isPrivateIpv4(const std::string& ip)
{
  uint32_t value;
  if (!parseIpv4(ip, value)) return false;
  uint32_t a = value >> 24;
  uint32_t b = (value >> 16) & 0xFF;
  return a == 10 || (a == 172 && b >= 16 && b <= 31) || (a == 192 && b == 168);
}

std::string nonPrivateWarning(const std::vector<std::string>& targets)
{
  size_t sample = std::min(targets.size(), WARNING_SAMPLE);
  for (size_t i = 0; i < sample; i++) {
    if (!isPrivateIpv4(targets[i])) {
      return "Warning: range contains non-private IPs (" + targets[i] +
             "...). Typo? Scan continues with short timeout.";
    }
  }
  return "";
}

std::string rangeFromDhcpConf(const std::string& content)
{
  static const std::regex subnetRe(R"(subnet\s+(\d{1,3})\.(\d{1,3})\.(\d{1,3})\.\d{1,3})");
  std::smatch m;
  if (!std::regex_search(content, m, subnetRe)) return "";
  std::string prefix = m[1].str() + "." + m[2].str() + "." + m[3].str();
  return prefix + ".10-" + prefix + ".249";
}
