#pragma once
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

static const size_t DEFAULT_MAX_TARGETS = 1500;

bool parseIpv4(const std::string& text, uint32_t& out);
std::string intToIp(uint32_t value);

// Expands "a.b.c.d", "a.b.c.d-e.f.g.h" and comma-separated mixes of both.
// Malformed segments are skipped. The result keeps first-seen order and holds
// each address once. Expansion stops as soon as more than `limit` addresses
// were produced.
std::vector<std::string> expandRange(const std::string& spec,
                                     size_t limit = std::numeric_limits<size_t>::max());

// expandRange plus the pass preconditions: non-empty and at most maxTargets.
bool expandTargets(const std::string& spec, size_t maxTargets,
                   std::vector<std::string>& out, std::string& error);

bool isPrivateIpv4(const std::string& ip);

// Looks at the first few targets and describes the first non-RFC1918 one,
// which is usually a typo in the range. Empty when the sample is clean.
std::string nonPrivateWarning(const std::vector<std::string>& targets);

// "subnet 192.168.100.0 netmask ..." in a dhcpd.conf -> "192.168.100.10-192.168.100.249".
std::string rangeFromDhcpConf(const std::string& content);
