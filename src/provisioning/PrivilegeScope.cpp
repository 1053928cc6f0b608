/* @file PrivilegeScope.cpp
 * @brief Fork + privilege drop for the account retry of a hardware test.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>

// POSIX headers
#include <fcntl.h>
#include <grp.h>
#include <pwd.h>
#include <sys/wait.h>
#include <unistd.h>

// nlohmann headers
#include <nlohmann/json.hpp>

// fieldkit headers
#include "provisioning/PrivilegeScope.hpp"

using namespace fieldkit::provisioning;

namespace {

  std::string errnoText(const std::string& what) {
    return what + ": " + std::strerror(errno);
  }

  void writeAll(int fd, const std::string& data) {
    std::size_t off = 0;
    while (off < data.size()) {
      const auto n = ::write(fd, data.data() + off, data.size() - off);
      if (n < 0) {
        if (errno == EINTR)
          continue;
        return; // parent gone; nothing left to report to
      }
      off += static_cast<std::size_t>(n);
    }
  }

  /// Become \p account. No-op when we already are that user.
  void dropTo(const std::string& account) {
    errno = 0;
    const passwd* pw = ::getpwnam(account.c_str());
    if (pw == nullptr)
      throw std::runtime_error(errno ? errnoText("getpwnam " + account)
                                     : "account " + account + " does not exist");
    if (::geteuid() == pw->pw_uid)
      return;

    if (::initgroups(pw->pw_name, pw->pw_gid) < 0)
      throw std::runtime_error(errnoText("initgroups " + account));
    if (::setgid(pw->pw_gid) < 0)
      throw std::runtime_error(errnoText("setgid " + std::to_string(pw->pw_gid)));
    if (::setuid(pw->pw_uid) < 0)
      throw std::runtime_error(errnoText("setuid " + std::to_string(pw->pw_uid)));
  }

  [[noreturn]] void childMain(int fd, const std::string& account, const HardwareTest& test) {
    nlohmann::json reply;
    int code = 0;
    try {
      dropTo(account);
      reply = test();
    } catch (const std::exception& e) {
      reply = nlohmann::json{ { "fault", e.what() } };
      code = 1;
    }
    writeAll(fd, reply.dump());
    ::close(fd);
    std::fflush(stdout);
    ::_exit(code);
  }

} // namespace

HardwareTestResult AccountPrivilege::run(const HardwareTest& test) {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) < 0)
    throw std::runtime_error(errnoText("[AccountPrivilege] pipe"));

  std::fflush(stdout); // don't let the child replay buffered output
  const pid_t pid = ::fork();
  if (pid < 0) {
    const auto err = errnoText("[AccountPrivilege] fork");
    ::close(fds[0]);
    ::close(fds[1]);
    throw std::runtime_error(err);
  }
  if (pid == 0) {
    ::close(fds[0]);
    childMain(fds[1], account_, test);
  }

  ::close(fds[1]);
  std::string payload;
  char buf[4096];
  for (;;) {
    const auto n = ::read(fds[0], buf, sizeof(buf));
    if (n > 0) {
      payload.append(buf, static_cast<std::size_t>(n));
      continue;
    }
    if (n < 0 && errno == EINTR)
      continue;
    break;
  }
  ::close(fds[0]);

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR)
      throw std::runtime_error(errnoText("[AccountPrivilege] waitpid"));
  }

  if (payload.empty()) {
    if (WIFSIGNALED(status))
      throw std::runtime_error("[AccountPrivilege] test under " + account_ + " killed by signal " +
                               std::to_string(WTERMSIG(status)));
    throw std::runtime_error("[AccountPrivilege] test under " + account_ +
                             " exited without a result");
  }

  const auto reply = nlohmann::json::parse(payload, nullptr, false);
  if (reply.is_discarded())
    throw std::runtime_error("[AccountPrivilege] malformed result from " + account_);
  if (auto fault = reply.find("fault"); fault != reply.end())
    throw std::runtime_error(fault->get<std::string>());
  return reply.get<HardwareTestResult>();
}
