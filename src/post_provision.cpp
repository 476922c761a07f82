#include "post_provision.h"
#include "fan_out.h"
#include "file_store.h"
#include <utility>
#include <spdlog/spdlog.h>

namespace {
  const unsigned MARKER_CHECK_TIMEOUT_MS = 8000;
  const unsigned SCP_TIMEOUT_MS = 15000;
  const unsigned ACTIONS_TIMEOUT_MS = 30000;
  const unsigned ACTIONS_CONNECT_TIMEOUT_S = 5;
  const unsigned DEPLOY_CONNECT_TIMEOUT_S = 10;
  const unsigned DEPLOY_CHECK_TIMEOUT_MS = 15000;
  const unsigned DEPLOY_SCP_TIMEOUT_MS = 60000;
  const size_t ERROR_EXCERPT = 200;
  const char* REMOTE_TMP = "/tmp/";

  std::string joinCommands(const std::vector<std::string>& cmds)
  {
    std::string out;
    for (const auto& c : cmds) {
      if (out.length()) out += " && ";
      out += c;
    }
    return out;
  }

  // "~/" targets land in the remote account's home directory.
  std::string resolveDest(const std::string& dest, const std::string& homeDir)
  {
    if (homeDir.empty() || dest.compare(0, 2, "~/") != 0) return dest;
    return homeDir + dest.substr(1);
  }

  void appendInstallCommands(const std::vector<std::string>& names, const std::string& homeDir,
                             std::vector<std::string>& cmds)
  {
    for (const auto& name : names) {
      const DeployFile* file = findDeployFile(name);
      if (!file) continue;
      for (const auto& t : file->targets) {
        std::string dest = resolveDest(t.dest, homeDir);
        cmds.push_back("sudo cp " + std::string(REMOTE_TMP) + name + " " + dest +
                       " && sudo chmod " + t.mode + " " + dest);
      }
    }
  }

  std::string cleanupCommand(const std::vector<std::string>& names)
  {
    std::string cmd = "(rm -f";
    for (const auto& name : names) cmd += " " + std::string(REMOTE_TMP) + name;
    return cmd + " || true)";
  }

  std::string excerpt(const std::string& text)
  {
    std::string t = trim(text);
    return t.size() > ERROR_EXCERPT ? t.substr(0, ERROR_EXCERPT) : t;
  }
}

const std::vector<DeployFile>& defaultDeployMap()
{
  static const std::vector<DeployFile> files = {
    {"bash.bashrc", {{"/etc/bash.bashrc", "644"}, {"~/.bashrc", "644"}}},
    {"motd.sh", {{"/etc/profile.d/motd.sh", "755"}}},
    {"tmux.conf", {{"/etc/tmux.conf", "644"}}},
    {"nanorc", {{"/etc/nanorc", "644"}}},
    {"cmd", {{"/usr/local/bin/cmd", "755"}}},
    {"nvc", {{"/usr/local/bin/nvc", "755"}}},
    {"nvt", {{"/usr/local/bin/nvt", "755"}}},
    {"exa", {{"/usr/bin/exa", "755"}}},
  };
  return files;
}

const DeployFile* findDeployFile(const std::string& name)
{
  for (const auto& f : defaultDeployMap()) {
    if (f.name == name) return &f;
  }
  return nullptr;
}

std::string remoteHomeDir(const std::string& user)
{
  return user == "root" ? "/root" : "/home/" + user;
}

bool isSafeHostname(const std::string& hostname)
{
  if (hostname.empty() || hostname.size() > 253) return false;
  for (char c : hostname) {
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
              c == '-' || c == '.' || c == '_';
    if (!ok) return false;
  }
  return true;
}

std::string buildRemoteCommand(const ActionPlan& plan, bool filesTransferred, const std::string& marker)
{
  if (plan.empty()) return "";
  std::vector<std::string> cmds;
  bool staged = !plan.localFiles.empty();

  if (staged && filesTransferred) appendInstallCommands(plan.names, plan.homeDir, cmds);
  if (plan.disableZtp) cmds.push_back("(sudo ztp -d 2>/dev/null || true)");
  if (plan.hostname.length()) {
    cmds.push_back("(sudo nv set system hostname " + plan.hostname +
                   " 2>/dev/null && sudo nv config apply -y 2>/dev/null || true)");
  }
  if (!staged || filesTransferred) cmds.push_back("sudo touch " + marker);
  if (staged && filesTransferred) cmds.push_back(cleanupCommand(plan.names));
  return joinCommands(cmds);
}

PostProvisioner::PostProvisioner(CommandRunner& r, const SshSettings& s, std::string dir,
                                 const PostProvisionToggles& t)
  : runner(r), ssh(s), stagingDir(std::move(dir)), toggles(t) {}

std::vector<std::string> PostProvisioner::stagedFiles(const std::vector<std::string>& names,
                                                      std::vector<std::string>& present) const
{
  std::vector<std::string> paths;
  present.clear();
  for (const auto& name : names) {
    std::string path = stagingDir + "/" + name;
    if (!fileExists(path)) continue;
    paths.push_back(path);
    present.push_back(name);
  }
  return paths;
}

ActionPlan PostProvisioner::plan(const DiscoveryEntry& entry) const
{
  ActionPlan p;
  p.homeDir = remoteHomeDir(ssh.user);
  if (toggles.base_config) {
    std::vector<std::string> names;
    for (const auto& f : defaultDeployMap()) names.push_back(f.name);
    p.localFiles = stagedFiles(names, p.names);
  }
  p.disableZtp = toggles.ztp_disable;
  if (toggles.set_hostname && entry.hostname.length()) {
    if (isSafeHostname(entry.hostname)) p.hostname = entry.hostname;
    else spdlog::warn("{}: not setting unsafe hostname '{}'", entry.ip, entry.hostname);
  }
  return p;
}

PostProvision PostProvisioner::provision(const DiscoveryEntry& entry)
{
  const std::string& ip = entry.ip;
  CommandResult check = runner.run(
      sshCommand(ssh, ip, "test -f " + ssh.marker + " && echo DONE || echo NEW", SSH_CONNECT_TIMEOUT_S),
      MARKER_CHECK_TIMEOUT_MS);
  if (!check.started || check.timedOut) {
    spdlog::warn("{}: marker check did not complete", ip);
    return PostProvision::None;
  }
  if (check.out.find("DONE") != std::string::npos) return PostProvision::Already;

  ActionPlan p = plan(entry);
  if (p.empty()) return PostProvision::None;

  bool transferred = false;
  if (!p.localFiles.empty()) {
    CommandResult scp = runner.run(scpCommand(ssh, p.localFiles, ip, REMOTE_TMP, SSH_CONNECT_TIMEOUT_S),
                                   SCP_TIMEOUT_MS);
    transferred = scp.ok();
    if (!transferred) spdlog::warn("{}: base config copy failed: {}", ip, excerpt(scp.err));
  }

  std::string cmd = buildRemoteCommand(p, transferred, ssh.marker);
  if (cmd.empty()) {
    spdlog::info("{} ({}): post-provision failed", ip, entry.hostname);
    return PostProvision::Failed;
  }
  CommandResult r = runner.run(sshCommand(ssh, ip, cmd, ACTIONS_CONNECT_TIMEOUT_S), ACTIONS_TIMEOUT_MS);
  bool ok = r.ok() && (p.localFiles.empty() || transferred);
  spdlog::info("{} ({}): post-provision {}", ip, entry.hostname, ok ? "deployed" : "failed");
  return ok ? PostProvision::Deployed : PostProvision::Failed;
}

std::map<std::string, PostProvision> PostProvisioner::run(std::vector<DiscoveryEntry>& entries, size_t workers)
{
  std::map<std::string, PostProvision> results;
  if (!toggles.any()) return results;

  std::vector<size_t> candidates;
  for (size_t i = 0; i < entries.size(); i++) {
    if (entries[i].device_type == DeviceType::Provisioned && entries[i].has_binding) candidates.push_back(i);
  }
  if (candidates.empty()) return results;

  std::vector<PostProvision> outcomes(candidates.size(), PostProvision::None);
  fanOut(candidates.size(), workers, [&](size_t i) { outcomes[i] = provision(entries[candidates[i]]); });

  for (size_t i = 0; i < candidates.size(); i++) {
    DiscoveryEntry& e = entries[candidates[i]];
    e.post_provision = outcomes[i];
    results[e.ip] = outcomes[i];
  }
  return results;
}

DeployResult PostProvisioner::deployBaseConfig(const std::string& ip, const std::string& hostname,
                                               const std::vector<std::string>& files, bool disableZtp)
{
  DeployResult result;
  result.ip = ip;
  result.hostname = hostname;

  CommandResult check = runner.run(sshCommand(ssh, ip, "echo ok", DEPLOY_CONNECT_TIMEOUT_S), DEPLOY_CHECK_TIMEOUT_MS);
  if (check.timedOut) {
    result.error = "SSH connection timeout";
    return result;
  }
  if (!check.ok()) {
    result.error = "SSH connection failed (key not configured?)";
    return result;
  }

  std::vector<std::string> known;
  for (const auto& name : files) {
    if (findDeployFile(name)) known.push_back(name);
    else spdlog::warn("{}: no install target for '{}'", ip, name);
  }
  std::vector<std::string> names;
  std::vector<std::string> local = stagedFiles(known, names);
  if (local.empty()) {
    result.error = "No source files found";
    return result;
  }

  CommandResult scp = runner.run(scpCommand(ssh, local, ip, REMOTE_TMP, DEPLOY_CONNECT_TIMEOUT_S),
                                 DEPLOY_SCP_TIMEOUT_MS);
  if (!scp.ok()) {
    result.error = scp.timedOut ? "SCP timeout" : "SCP failed: " + excerpt(scp.err);
    return result;
  }

  ActionPlan p;
  p.homeDir = remoteHomeDir(ssh.user);
  p.names = names;
  p.localFiles = local;
  p.disableZtp = disableZtp;
  CommandResult install = runner.run(
      sshCommand(ssh, ip, buildRemoteCommand(p, true, ssh.marker), DEPLOY_CONNECT_TIMEOUT_S), ACTIONS_TIMEOUT_MS);
  if (!install.ok()) {
    result.error = install.timedOut ? "SSH command timeout" : "Remote install failed: " + excerpt(install.err);
    return result;
  }

  result.success = true;
  result.message = std::to_string(names.size()) + " files deployed";
  spdlog::info("{} ({}): {}", ip, hostname, result.message);
  return result;
}
