/* @file CommandRunner.cpp
 * @brief fork/execvp runner with merged stdout+stderr capture - POSIX compliant
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstdlib>
#include <cstring> // for strerror
#include <mutex>
#include <stdexcept>
#include <system_error>

// Linux headers
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

// fieldkit headers
#include "core/Errors.hpp"
#include "io/CommandRunner.hpp"

using namespace fieldkit::io;

namespace {

  struct Pipe {
    int fd[2]{ -1, -1 };

    Pipe() {
      if (::pipe2(fd, O_CLOEXEC) != 0)
        throw std::system_error(errno, std::generic_category(), "pipe2");
    }
    ~Pipe() {
      closeRead();
      closeWrite();
    }
    void closeRead() {
      if (fd[0] >= 0)
        ::close(fd[0]);
      fd[0] = -1;
    }
    void closeWrite() {
      if (fd[1] >= 0)
        ::close(fd[1]);
      fd[1] = -1;
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;
  };

  // A child that never reads its stdin must not kill us with SIGPIPE.
  void ignoreSigpipeOnce() {
    static std::once_flag once;
    std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
  }

  int decodeStatus(int status) {
    if (WIFEXITED(status))
      return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
      return 128 + WTERMSIG(status);
    return -1;
  }

} // namespace

std::string CommandRunner::runChecked(const std::vector<std::string>& argv,
                                      const std::string& input) {
  auto result = run(argv, input);
  if (!result.ok())
    throw core::CommandError(argv, result.exitCode, std::move(result.output));
  return std::move(result.output);
}

CommandResult PosixCommandRunner::run(const std::vector<std::string>& argv,
                                      const std::string& input) {
  if (argv.empty())
    throw std::invalid_argument("[CommandRunner] empty argv");

  ignoreSigpipeOnce();

  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& a : argv)
    cargv.push_back(const_cast<char*>(a.c_str()));
  cargv.push_back(nullptr);

  Pipe in;
  Pipe out;

  pid_t child = ::fork();
  if (child < 0)
    throw std::system_error(errno, std::generic_category(), "fork");

  if (child == 0) {
    // child: stdin <- in, stdout/stderr -> out
    ::dup2(in.fd[0], STDIN_FILENO);
    ::dup2(out.fd[1], STDOUT_FILENO);
    ::dup2(out.fd[1], STDERR_FILENO);
    ::execvp(cargv[0], cargv.data());
    _exit(127); // exec failed
  }

  in.closeRead();
  out.closeWrite();

  // feed stdin; EPIPE just means the child stopped reading
  std::size_t total = 0;
  while (total < input.size()) {
    ssize_t written = ::write(in.fd[1], input.data() + total, input.size() - total);
    if (written > 0) {
      total += static_cast<std::size_t>(written);
    } else if (written == -1 && errno == EINTR) {
      continue;
    } else {
      break;
    }
  }
  in.closeWrite();

  CommandResult result;
  char buf[4096];
  while (true) {
    ssize_t n = ::read(out.fd[0], buf, sizeof(buf));
    if (n > 0) {
      result.output.append(buf, static_cast<std::size_t>(n));
    } else if (n == 0) {
      break;
    } else if (errno == EINTR) {
      continue;
    } else {
      result.output += std::string("\n[fieldkit] output truncated: ") + std::strerror(errno);
      break; // exit status still decides
    }
  }

  int status = 0;
  while (::waitpid(child, &status, 0) < 0) {
    if (errno != EINTR)
      throw std::system_error(errno, std::generic_category(), "waitpid");
  }
  result.exitCode = decodeStatus(status);
  return result;
}

bool PosixCommandRunner::hasProgram(const std::string& program) {
  if (program.empty())
    return false;
  if (program.find('/') != std::string::npos)
    return ::access(program.c_str(), X_OK) == 0;

  const char* path = std::getenv("PATH");
  std::string dirs = path != nullptr ? path : "/usr/local/bin:/usr/bin:/bin";
  std::size_t start = 0;
  while (start <= dirs.size()) {
    auto colon = dirs.find(':', start);
    if (colon == std::string::npos)
      colon = dirs.size();
    std::string dir = dirs.substr(start, colon - start);
    if (dir.empty())
      dir = ".";
    if (::access((dir + "/" + program).c_str(), X_OK) == 0)
      return true;
    start = colon + 1;
  }
  return false;
}
