#include "exec/ProcessRunner.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>

namespace dnsc::exec {

namespace {

constexpr int kExecFailedStatus = 127;

std::string joinArgs(const std::vector<std::string>& vArgs) {
  std::string sJoined;
  for (const auto& sArg : vArgs) {
    if (!sJoined.empty()) sJoined += ' ';
    sJoined += sArg.empty() ? std::string("''") : sArg;
  }
  return sJoined;
}

/// NULL-terminated argv view over vArgs. Built before fork(); vArgs must outlive it.
std::vector<char*> toArgv(const std::vector<std::string>& vArgs) {
  std::vector<char*> vArgv;
  vArgv.reserve(vArgs.size() + 1);
  for (const auto& sArg : vArgs) {
    vArgv.push_back(const_cast<char*>(sArg.c_str()));
  }
  vArgv.push_back(nullptr);
  return vArgv;
}

/// Replace the current (child) process image. Never returns.
/// Only async-signal-safe calls after fork().
[[noreturn]] void execChild(char* const* ppArgv) {
  execvp(ppArgv[0], ppArgv);

  const char* pMsg = "failed to execute ";
  (void)!write(STDERR_FILENO, pMsg, std::strlen(pMsg));
  (void)!write(STDERR_FILENO, ppArgv[0], std::strlen(ppArgv[0]));
  (void)!write(STDERR_FILENO, "\n", 1);
  _exit(kExecFailedStatus);
}

void closeFd(int& iFd) {
  if (iFd >= 0) {
    close(iFd);
    iFd = -1;
  }
}

}  // namespace

ProcessRunner::ProcessRunner() = default;
ProcessRunner::~ProcessRunner() = default;

int ProcessRunner::waitForChild(int iPid) {
  int iStatus = 0;
  while (waitpid(iPid, &iStatus, 0) < 0) {
    if (errno != EINTR) {
      throw common::CommandError("wait_failed",
                                 std::string("waitpid() failed: ") + std::strerror(errno));
    }
  }
  if (WIFEXITED(iStatus)) {
    return WEXITSTATUS(iStatus);
  }
  if (WIFSIGNALED(iStatus)) {
    return 128 + WTERMSIG(iStatus);
  }
  return -1;
}

common::CommandResult ProcessRunner::capture(const std::vector<std::string>& vArgs) {
  if (vArgs.empty()) {
    throw common::CommandError("empty_command", "No command given");
  }
  auto spLog = common::Logger::get();
  spLog->debug("Running: {}", joinArgs(vArgs));

  int aOut[2] = {-1, -1};
  int aErr[2] = {-1, -1};
  if (pipe(aOut) < 0) {
    throw common::CommandError("pipe_failed",
                               std::string("pipe() failed: ") + std::strerror(errno));
  }
  if (pipe(aErr) < 0) {
    int iErrno = errno;
    closeFd(aOut[0]);
    closeFd(aOut[1]);
    throw common::CommandError("pipe_failed",
                               std::string("pipe() failed: ") + std::strerror(iErrno));
  }

  auto vArgv = toArgv(vArgs);
  pid_t iPid = fork();
  if (iPid < 0) {
    int iErrno = errno;
    closeFd(aOut[0]);
    closeFd(aOut[1]);
    closeFd(aErr[0]);
    closeFd(aErr[1]);
    throw common::CommandError("fork_failed",
                               std::string("fork() failed: ") + std::strerror(iErrno));
  }

  if (iPid == 0) {
    // Child process
    dup2(aOut[1], STDOUT_FILENO);
    dup2(aErr[1], STDERR_FILENO);
    close(aOut[0]);
    close(aOut[1]);
    close(aErr[0]);
    close(aErr[1]);
    execChild(vArgv.data());
  }

  closeFd(aOut[1]);
  closeFd(aErr[1]);

  common::CommandResult crResult;
  pollfd aFds[2] = {{aOut[0], POLLIN, 0}, {aErr[0], POLLIN, 0}};
  std::string* aSinks[2] = {&crResult.sStdout, &crResult.sStderr};
  int iOpen = 2;
  char aBuf[4096];

  while (iOpen > 0) {
    if (poll(aFds, 2, -1) < 0) {
      if (errno == EINTR) continue;
      spLog->error("poll() failed while reading from {}: {}", vArgs[0], std::strerror(errno));
      break;
    }
    for (int i = 0; i < 2; ++i) {
      if (aFds[i].fd < 0 || aFds[i].revents == 0) continue;
      ssize_t nRead = read(aFds[i].fd, aBuf, sizeof(aBuf));
      if (nRead > 0) {
        aSinks[i]->append(aBuf, static_cast<size_t>(nRead));
      } else if (nRead == 0 || errno != EINTR) {
        close(aFds[i].fd);
        aFds[i].fd = -1;  // poll() ignores negative descriptors
        --iOpen;
      }
    }
  }
  for (auto& pfd : aFds) {
    closeFd(pfd.fd);
  }

  crResult.iExitCode = waitForChild(iPid);
  spLog->debug("{} exited with status {}", vArgs[0], crResult.iExitCode);
  return crResult;
}

int ProcessRunner::passthrough(const std::vector<std::string>& vArgs) {
  if (vArgs.empty()) {
    throw common::CommandError("empty_command", "No command given");
  }
  auto spLog = common::Logger::get();
  spLog->debug("Running (attached): {}", joinArgs(vArgs));

  auto vArgv = toArgv(vArgs);
  pid_t iPid = fork();
  if (iPid < 0) {
    throw common::CommandError("fork_failed",
                               std::string("fork() failed: ") + std::strerror(errno));
  }
  if (iPid == 0) {
    execChild(vArgv.data());
  }

  int iExitCode = waitForChild(iPid);
  spLog->debug("{} exited with status {}", vArgs[0], iExitCode);
  return iExitCode;
}

}  // namespace dnsc::exec
