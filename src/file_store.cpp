#include "file_store.h"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <utility>
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {
  const unsigned SUDO_TIMEOUT_MS = 5000;
  const unsigned TEE_TIMEOUT_MS = 10000;
}

bool readTextFile(const std::string& path, std::string& content)
{
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream ss;
  ss << in.rdbuf();
  content = ss.str();
  return !in.bad();
}

bool fileExists(const std::string& path)
{
  struct stat st;
  return stat(path.c_str(), &st) == 0;
}

FileStore::FileStore(CommandRunner& r, std::string o) : runner(r), owner(std::move(o)) {}

bool FileStore::write(const std::string& path, const std::string& content, std::string& error)
{
  std::string directError;
  if (writeDirect(path, content, directError)) return true;
  spdlog::warn("Write {} failed ({}), retrying with sudo", path, directError);
  if (writeElevated(path, content, error)) return true;
  error = directError + "; " + error;
  return false;
}

bool FileStore::writeDirect(const std::string& path, const std::string& content, std::string& error)
{
  const std::string tmp = path + ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      error = "cannot open " + tmp + ": " + std::strerror(errno);
      return false;
    }
    out << content;
    out.flush();
    if (!out) {
      error = "cannot write " + tmp;
      std::remove(tmp.c_str());
      return false;
    }
  }
  if (std::rename(tmp.c_str(), path.c_str()) != 0) {
    error = "cannot rename " + tmp + ": " + std::strerror(errno);
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

bool FileStore::writeElevated(const std::string& path, const std::string& content, std::string& error)
{
  CommandResult tee = runner.execute({"sudo", "-n", "tee", path}, TEE_TIMEOUT_MS, content);
  if (!tee.ok()) {
    error = "sudo tee " + path + " failed: " + (tee.timedOut ? std::string("timeout") : tee.err);
    return false;
  }
  if (!owner.empty()) {
    CommandResult chown = runner.run({"sudo", "-n", "chown", owner + ":www-data", path}, SUDO_TIMEOUT_MS);
    if (!chown.ok()) spdlog::warn("chown {} failed: {}", path, chown.err);
  }
  CommandResult chmod = runner.run({"sudo", "-n", "chmod", "664", path}, SUDO_TIMEOUT_MS);
  if (!chmod.ok()) spdlog::warn("chmod {} failed: {}", path, chmod.err);
  return true;
}

PassLock::PassLock(std::string p) : path(std::move(p)) {}

PassLock::~PassLock() { release(); }

bool PassLock::acquire(std::string& error)
{
  if (fd >= 0) return true;
  fd = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0664);
  if (fd < 0) {
    error = "cannot open lock " + path + ": " + std::strerror(errno);
    return false;
  }
  if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
    error = errno == EWOULDBLOCK ? "Discovery already running"
                                 : "cannot lock " + path + ": " + std::strerror(errno);
    close(fd);
    fd = -1;
    return false;
  }
  return true;
}

void PassLock::release()
{
  if (fd < 0) return;
  flock(fd, LOCK_UN);
  close(fd);
  fd = -1;
}
