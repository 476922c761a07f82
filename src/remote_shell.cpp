#include "remote_shell.h"

static std::vector<std::string> baseCommand(const SshSettings& ssh, const char* tool, unsigned connectTimeoutS)
{
  std::vector<std::string> argv;
  if (!ssh.run_as.empty()) {
    argv.push_back("sudo");
    argv.push_back("-u");
    argv.push_back(ssh.run_as);
  }
  argv.push_back(tool);
  const std::string options[] = {
    "BatchMode=yes",
    "ConnectTimeout=" + std::to_string(connectTimeoutS),
    "StrictHostKeyChecking=no",
    "UserKnownHostsFile=/dev/null",
    "LogLevel=ERROR",
  };
  for (const auto& o : options) {
    argv.push_back("-o");
    argv.push_back(o);
  }
  if (!ssh.identity_file.empty()) {
    argv.push_back("-i");
    argv.push_back(ssh.identity_file);
  }
  return argv;
}

std::vector<std::string> sshCommand(const SshSettings& ssh, const std::string& ip,
                                    const std::string& remoteCommand, unsigned connectTimeoutS)
{
  std::vector<std::string> argv = baseCommand(ssh, "ssh", connectTimeoutS);
  argv.push_back(ssh.user + "@" + ip);
  argv.push_back(remoteCommand);
  return argv;
}

std::vector<std::string> scpCommand(const SshSettings& ssh, const std::vector<std::string>& localFiles,
                                    const std::string& ip, const std::string& remoteDir,
                                    unsigned connectTimeoutS)
{
  std::vector<std::string> argv = baseCommand(ssh, "scp", connectTimeoutS);
  argv.insert(argv.end(), localFiles.begin(), localFiles.end());
  argv.push_back(ssh.user + "@" + ip + ":" + remoteDir);
  return argv;
}
