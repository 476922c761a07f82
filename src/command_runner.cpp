#include "command_runner.h"
#include <spdlog/spdlog.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {
  const size_t READ_CHUNK = 4096;

  void closeFd(int& fd)
  {
    if (fd >= 0) {
      close(fd);
      fd = -1;
    }
  }

  void setNonBlocking(int fd)
  {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }

  // Returns false once the descriptor reached EOF or failed.
  bool drain(int fd, std::string& sink)
  {
    char buffer[READ_CHUNK];
    for (;;) {
      ssize_t n = read(fd, buffer, sizeof(buffer));
      if (n > 0) {
        sink.append(buffer, static_cast<size_t>(n));
        continue;
      }
      if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
      if (n < 0 && errno == EINTR) continue;
      return false;
    }
  }

  int decodeStatus(int status)
  {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return status;
  }
}

ProcessRunner::ProcessRunner()
{
  // A child that exits before reading its stdin must not take us down.
  std::signal(SIGPIPE, SIG_IGN);
}

CommandResult ProcessRunner::execute(const std::vector<std::string>& argv, unsigned timeoutMs,
                                     const std::string& input)
{
  CommandResult result;
  if (argv.empty()) return result;

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
  args.push_back(nullptr);

  int inPipe[2] = {-1, -1};
  int outPipe[2] = {-1, -1};
  int errPipe[2] = {-1, -1};
  if (pipe2(inPipe, O_CLOEXEC) != 0 || pipe2(outPipe, O_CLOEXEC) != 0 || pipe2(errPipe, O_CLOEXEC) != 0) {
    result.err = std::string("pipe failed: ") + std::strerror(errno);
    for (int* p : {inPipe, outPipe, errPipe}) {
      closeFd(p[0]);
      closeFd(p[1]);
    }
    return result;
  }

  pid_t pid = fork();
  if (pid < 0) {
    result.err = std::string("fork failed: ") + std::strerror(errno);
    for (int* p : {inPipe, outPipe, errPipe}) {
      closeFd(p[0]);
      closeFd(p[1]);
    }
    return result;
  }

  if (pid == 0) {
    setpgid(0, 0);
    dup2(inPipe[0], STDIN_FILENO);
    dup2(outPipe[1], STDOUT_FILENO);
    dup2(errPipe[1], STDERR_FILENO);
    execvp(args[0], args.data());
    const char msg[] = "exec failed\n";
    ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
    (void)ignored;
    _exit(127);
  }

  result.started = true;
  closeFd(inPipe[0]);
  closeFd(outPipe[1]);
  closeFd(errPipe[1]);
  int inFd = inPipe[1];
  int outFd = outPipe[0];
  int errFd = errPipe[0];
  setNonBlocking(inFd);
  setNonBlocking(outFd);
  setNonBlocking(errFd);
  if (input.empty()) closeFd(inFd);

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
  size_t written = 0;

  while (outFd >= 0 || errFd >= 0 || inFd >= 0) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    if (remaining <= 0) {
      result.timedOut = true;
      break;
    }

    pollfd fds[3];
    nfds_t count = 0;
    if (inFd >= 0) fds[count++] = {inFd, POLLOUT, 0};
    if (outFd >= 0) fds[count++] = {outFd, POLLIN, 0};
    if (errFd >= 0) fds[count++] = {errFd, POLLIN, 0};

    int rc = poll(fds, count, static_cast<int>(remaining));
    if (rc < 0) {
      if (errno == EINTR) continue;
      result.err += std::string("poll failed: ") + std::strerror(errno);
      result.timedOut = true;
      break;
    }
    if (rc == 0) continue;

    for (nfds_t i = 0; i < count; i++) {
      if (!fds[i].revents) continue;
      if (fds[i].fd == inFd) {
        ssize_t n = write(inFd, input.data() + written, input.size() - written);
        if (n > 0) written += static_cast<size_t>(n);
        if ((n < 0 && errno != EAGAIN && errno != EINTR) || written >= input.size()) closeFd(inFd);
      } else if (fds[i].fd == outFd) {
        if (!drain(outFd, result.out)) closeFd(outFd);
      } else if (fds[i].fd == errFd) {
        if (!drain(errFd, result.err)) closeFd(errFd);
      }
    }
  }

  closeFd(inFd);
  closeFd(outFd);
  closeFd(errFd);

  int status = 0;
  if (!result.timedOut) {
    // Output is closed; give the child the rest of its budget to exit.
    for (;;) {
      pid_t done = waitpid(pid, &status, WNOHANG);
      if (done == pid) {
        result.exitCode = decodeStatus(status);
        return result;
      }
      if (done < 0 && errno != EINTR) {
        result.err += std::string("waitpid failed: ") + std::strerror(errno);
        return result;
      }
      if (std::chrono::steady_clock::now() >= deadline) {
        result.timedOut = true;
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  }

  kill(-pid, SIGKILL);
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
  result.exitCode = -1;
  spdlog::debug("command timed out after {}ms: {}", timeoutMs, argv[0]);
  return result;
}
