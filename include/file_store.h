#pragma once
#include <string>
#include "command_runner.h"

bool readTextFile(const std::string& path, std::string& content);
bool fileExists(const std::string& path);

// Whole-file replacement for the store and cache documents. A direct write
// goes to "<path>.tmp" and is renamed into place; when that is not permitted
// the content is piped through `sudo tee` once and ownership is handed back
// to `owner`.
class FileStore {
public:
  FileStore(CommandRunner& runner, std::string owner);
  bool write(const std::string& path, const std::string& content, std::string& error);

private:
  bool writeDirect(const std::string& path, const std::string& content, std::string& error);
  bool writeElevated(const std::string& path, const std::string& content, std::string& error);

  CommandRunner& runner;
  std::string owner;
};

// Non-blocking flock on a lock file for the duration of a pass. Two passes
// against the same devices would race on the marker check.
class PassLock {
public:
  explicit PassLock(std::string path);
  ~PassLock();
  PassLock(const PassLock&) = delete;
  PassLock& operator=(const PassLock&) = delete;

  bool acquire(std::string& error);
  void release();

private:
  std::string path;
  int fd = -1;
};
