#pragma once
#include <map>
#include <string>
#include <vector>
#include "command_runner.h"
#include "discovery_types.h"
#include "remote_shell.h"

static const size_t DEFAULT_POST_WORKERS = 10;

struct DeployTarget {
  std::string dest;
  std::string mode;
};

struct DeployFile {
  std::string name;
  std::vector<DeployTarget> targets;
};

// Base configuration files the staging directory may hold and where each one
// is installed on a switch.
const std::vector<DeployFile>& defaultDeployMap();
const DeployFile* findDeployFile(const std::string& name);

struct ActionPlan {
  std::vector<std::string> names;
  std::vector<std::string> localFiles;
  bool disableZtp = false;
  std::string hostname;
  // Replaces the leading "~" of per-user install targets.
  std::string homeDir;

  bool empty() const { return localFiles.empty() && !disableZtp && hostname.empty(); }
};

// One remote command line joined with "&&". The marker is appended only when
// no files were staged or the staged files reached the device; the ZTP and
// hostname steps never break the chain.
std::string buildRemoteCommand(const ActionPlan& plan, bool filesTransferred, const std::string& marker);

std::string remoteHomeDir(const std::string& user);
bool isSafeHostname(const std::string& hostname);

struct DeployResult {
  std::string ip;
  std::string hostname;
  bool success = false;
  std::string message;
  std::string error;
};

class PostProvisioner {
public:
  PostProvisioner(CommandRunner& runner, const SshSettings& ssh, std::string stagingDir,
                  const PostProvisionToggles& toggles);

  ActionPlan plan(const DiscoveryEntry& entry) const;
  PostProvision provision(const DiscoveryEntry& entry);

  // Provisioned entries with a binding only. Sets post_provision on them and
  // returns the outcome per address.
  std::map<std::string, PostProvision> run(std::vector<DiscoveryEntry>& entries, size_t workers);

  // Operator-driven install of selected base files on one device.
  DeployResult deployBaseConfig(const std::string& ip, const std::string& hostname,
                                const std::vector<std::string>& files, bool disableZtp);

private:
  std::vector<std::string> stagedFiles(const std::vector<std::string>& names,
                                       std::vector<std::string>& present) const;

  CommandRunner& runner;
  SshSettings ssh;
  std::string stagingDir;
  PostProvisionToggles toggles;
};
