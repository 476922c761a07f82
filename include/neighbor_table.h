#pragma once
#include <map>
#include <string>
#include "command_runner.h"

// `ip neigh show` output -> ip -> lower-case MAC, for lines carrying an lladdr.
std::map<std::string, std::string> parseNeighborTable(const std::string& text);

class NeighborResolver {
public:
  explicit NeighborResolver(CommandRunner& runner);
  // Empty map when the table cannot be read.
  std::map<std::string, std::string> resolve();

private:
  CommandRunner& runner;
};
