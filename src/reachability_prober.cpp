#include "reachability_prober.h"
#include "fan_out.h"
#include <spdlog/spdlog.h>

ReachabilityProber::ReachabilityProber(CommandRunner& r) : runner(r) {}

bool ReachabilityProber::pingHost(const std::string& ip, bool shortWait)
{
  CommandResult r = runner.run({"ping", "-c", "1", "-W", shortWait ? "0.5" : "1", "-i", "0.2", ip},
                               PING_PROCESS_TIMEOUT_MS);
  return r.ok();
}

std::map<std::string, bool> ReachabilityProber::probe(const std::vector<std::string>& targets,
                                                      const ProbeOptions& options)
{
  std::vector<char> alive(targets.size(), 0);
  fanOut(targets.size(), options.workers, [&](size_t i) {
    alive[i] = pingHost(targets[i], options.shortWait) ? 1 : 0;
    spdlog::debug("ping {} {}", targets[i], alive[i] ? "online" : "offline");
  }, options.pacingMs);

  std::map<std::string, bool> results;
  size_t online = 0;
  for (size_t i = 0; i < targets.size(); i++) {
    results[targets[i]] = alive[i] != 0;
    if (alive[i]) online++;
  }
  spdlog::info("Ping sweep complete: {}/{} online", online, targets.size());
  return results;
}
