#pragma once
#include <map>
#include <string>
#include <vector>
#include "command_runner.h"

static const size_t DEFAULT_PROBE_WORKERS = 250;
static const unsigned DEFAULT_PROBE_PACING_MS = 2;
static const unsigned PING_PROCESS_TIMEOUT_MS = 2000;

struct ProbeOptions {
  size_t workers = DEFAULT_PROBE_WORKERS;
  unsigned pacingMs = DEFAULT_PROBE_PACING_MS;
  // Half-second reply wait instead of one second, for suspicious ranges.
  bool shortWait = false;
};

class ReachabilityProber {
public:
  explicit ReachabilityProber(CommandRunner& runner);
  // Returns only after every target was probed or timed out.
  std::map<std::string, bool> probe(const std::vector<std::string>& targets, const ProbeOptions& options);
  bool pingHost(const std::string& ip, bool shortWait);

private:
  CommandRunner& runner;
};
