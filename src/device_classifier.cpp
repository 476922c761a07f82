#include "device_classifier.h"
#include "fan_out.h"
#include <sstream>
#include <spdlog/spdlog.h>

namespace {
  const char* PROBE_COMMAND = "echo OK; sudo dmidecode -s system-serial-number 2>/dev/null | head -1";
  const char* NO_SERIAL[] = {"na", "n/a", "not specified", "none"};
}

std::string normalizeSerial(const std::string& raw)
{
  std::string serial = trim(raw);
  std::string lower = toLower(serial);
  for (const char* placeholder : NO_SERIAL) {
    if (lower == placeholder) return "";
  }
  return serial;
}

Classification classifySshResult(const CommandResult& result)
{
  Classification c;
  if (result.ok() && result.out.find("OK") != std::string::npos) {
    c.type = DeviceType::Provisioned;
    std::istringstream lines(result.out);
    std::string line;
    std::getline(lines, line);
    if (std::getline(lines, line)) c.serial = normalizeSerial(line);
    return c;
  }
  if (result.timedOut || !result.started) {
    c.type = DeviceType::Other;
    return c;
  }
  std::string err = toLower(result.err);
  if (err.find("permission denied") != std::string::npos) c.type = DeviceType::NotProvisioned;
  else c.type = DeviceType::Other;
  return c;
}

DeviceClassifier::DeviceClassifier(CommandRunner& r, const SshSettings& s) : runner(r), ssh(s) {}

Classification DeviceClassifier::classify(const std::string& ip)
{
  CommandResult r = runner.run(sshCommand(ssh, ip, PROBE_COMMAND, SSH_CONNECT_TIMEOUT_S), SSH_PROBE_TIMEOUT_MS);
  Classification c = classifySshResult(r);
  spdlog::debug("ssh {} -> {}{}", ip, toString(c.type), c.serial.empty() ? "" : " serial " + c.serial);
  return c;
}

std::map<std::string, Classification> DeviceClassifier::classifyAll(const std::vector<std::string>& targets,
                                                                   size_t workers)
{
  std::vector<Classification> slots(targets.size());
  fanOut(targets.size(), workers, [&](size_t i) { slots[i] = classify(targets[i]); });

  std::map<std::string, Classification> results;
  for (size_t i = 0; i < targets.size(); i++) results[targets[i]] = slots[i];
  return results;
}
