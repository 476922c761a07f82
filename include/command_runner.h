#pragma once
#include <string>
#include <vector>

struct CommandResult {
  bool started = false;
  bool timedOut = false;
  int exitCode = -1;
  std::string out;
  std::string err;

  bool ok() const { return started && !timedOut && exitCode == 0; }
};

// Every external tool (ping, ip, ssh, scp, sudo) goes through this seam so a
// pass can be driven against a scripted network in tests.
class CommandRunner {
public:
  virtual ~CommandRunner() = default;
  virtual CommandResult execute(const std::vector<std::string>& argv, unsigned timeoutMs,
                                const std::string& input) = 0;

  CommandResult run(const std::vector<std::string>& argv, unsigned timeoutMs)
  {
    return execute(argv, timeoutMs, std::string());
  }
};

// fork/exec with piped stdio. The child runs in its own process group and the
// whole group is killed once timeoutMs elapses.
class ProcessRunner : public CommandRunner {
public:
  ProcessRunner();
  CommandResult execute(const std::vector<std::string>& argv, unsigned timeoutMs,
                        const std::string& input) override;
};
