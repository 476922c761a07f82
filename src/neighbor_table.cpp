#include "neighbor_table.h"
#include "discovery_types.h"
#include <sstream>
#include <vector>
#include <spdlog/spdlog.h>

namespace {
  const unsigned NEIGH_TIMEOUT_MS = 5000;
}

std::map<std::string, std::string> parseNeighborTable(const std::string& text)
{
  std::map<std::string, std::string> table;
  std::istringstream lines(text);
  std::string line;
  while (std::getline(lines, line)) {
    std::istringstream fields(line);
    std::vector<std::string> parts;
    std::string part;
    while (fields >> part) parts.push_back(part);
    for (size_t i = 1; i + 1 < parts.size(); i++) {
      if (parts[i] == "lladdr") {
        table[parts[0]] = toLower(parts[i + 1]);
        break;
      }
    }
  }
  return table;
}

NeighborResolver::NeighborResolver(CommandRunner& r) : runner(r) {}

std::map<std::string, std::string> NeighborResolver::resolve()
{
  CommandResult r = runner.run({"ip", "neigh", "show"}, NEIGH_TIMEOUT_MS);
  if (!r.ok()) {
    spdlog::warn("Neighbor table read failed (exit {}): {}", r.exitCode, trim(r.err));
    return {};
  }
  auto table = parseNeighborTable(r.out);
  spdlog::info("Neighbor table: {} entries", table.size());
  return table;
}
