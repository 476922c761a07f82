#pragma once
#include <map>
#include <string>
#include <vector>
#include "command_runner.h"
#include "discovery_types.h"
#include "remote_shell.h"

static const size_t DEFAULT_CLASSIFY_WORKERS = 20;
static const unsigned SSH_PROBE_TIMEOUT_MS = 10000;

// Serial strings that vendors put in DMI when they have none.
std::string normalizeSerial(const std::string& raw);

// Maps one ssh probe outcome to a device type (and serial when it worked).
Classification classifySshResult(const CommandResult& result);

class DeviceClassifier {
public:
  DeviceClassifier(CommandRunner& runner, const SshSettings& ssh);
  Classification classify(const std::string& ip);
  std::map<std::string, Classification> classifyAll(const std::vector<std::string>& targets, size_t workers);

private:
  CommandRunner& runner;
  SshSettings ssh;
};
