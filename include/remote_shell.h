#pragma once
#include <string>
#include <vector>

static const char* const DEFAULT_SSH_USER = "cumulus";
static const char* const DEFAULT_MARKER_PATH = "/etc/switchwatch-base-deployed";
static const unsigned SSH_CONNECT_TIMEOUT_S = 3;

struct SshSettings {
  std::string user = DEFAULT_SSH_USER;
  // Local account whose keys are used (via sudo -u). Empty: the current user.
  std::string run_as;
  std::string identity_file;
  std::string marker = DEFAULT_MARKER_PATH;
};

std::vector<std::string> sshCommand(const SshSettings& ssh, const std::string& ip,
                                    const std::string& remoteCommand, unsigned connectTimeoutS);
std::vector<std::string> scpCommand(const SshSettings& ssh, const std::vector<std::string>& localFiles,
                                    const std::string& ip, const std::string& remoteDir,
                                    unsigned connectTimeoutS);
