/* @file FileOps.cpp
 * @brief POSIX whole-file I/O with EINTR-safe loops and atomic replace.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstdlib>
#include <system_error>
#include <vector>

// Linux headers
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

// fieldkit headers
#include "io/FileOps.hpp"

namespace fieldkit::io {

  namespace {

    [[noreturn]] void fail(const std::string& what, const std::string& path) {
      throw std::system_error(errno, std::generic_category(), what + " " + path);
    }

    /// Closes the fd on scope exit; release() hands ownership back.
    class FdGuard {
    public:
      explicit FdGuard(int fd) : fd_{ fd } {}
      ~FdGuard() {
        if (fd_ >= 0)
          ::close(fd_);
      }
      int get() const { return fd_; }
      int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
      }

      FdGuard(const FdGuard&) = delete;
      FdGuard& operator=(const FdGuard&) = delete;

    private:
      int fd_;
    };

    std::string readAll(int fd, const std::string& path) {
      std::string out;
      char buf[4096];
      while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
          out.append(buf, static_cast<std::size_t>(n));
        } else if (n == 0) {
          return out;
        } else if (errno == EINTR) {
          continue;
        } else {
          fail("read", path);
        }
      }
    }

    void writeAll(int fd, const std::string& data, const std::string& path) {
      std::size_t total = 0;
      while (total < data.size()) {
        ssize_t written = ::write(fd, data.data() + total, data.size() - total);
        if (written > 0) {
          total += static_cast<std::size_t>(written);
        } else if (written == -1 && errno == EINTR) {
          continue;
        } else {
          fail("write", path);
        }
      }
    }

    std::string directoryOf(const std::string& path) {
      const auto slash = path.rfind('/');
      if (slash == std::string::npos)
        return ".";
      if (slash == 0)
        return "/";
      return path.substr(0, slash);
    }

  } // namespace

  std::optional<std::string> readFile(const std::string& path) {
    FdGuard fd{ ::open(path.c_str(), O_RDONLY | O_CLOEXEC) };
    if (fd.get() < 0) {
      if (errno == ENOENT)
        return std::nullopt;
      fail("open", path);
    }
    return readAll(fd.get(), path);
  }

  bool fileExists(const std::string& path) {
    struct stat st {};
    return ::stat(path.c_str(), &st) == 0;
  }

  void writeFileAtomic(const std::string& path, const std::string& content, mode_t modeIfNew,
                       const PreCommitHook& beforeCommit) {
    struct stat target {};
    const bool exists = ::stat(path.c_str(), &target) == 0;
    if (!exists && errno != ENOENT)
      fail("stat", path);

    std::string tmpl = path + ".fieldkit.XXXXXX";
    std::vector<char> name(tmpl.begin(), tmpl.end());
    name.push_back('\0');

    FdGuard fd{ ::mkstemp(name.data()) };
    if (fd.get() < 0)
      fail("mkstemp in", directoryOf(path));
    const std::string tmpPath{ name.data() };

    try {
      writeAll(fd.get(), content, tmpPath);

      const mode_t mode = exists ? (target.st_mode & 07777) : modeIfNew;
      if (::fchmod(fd.get(), mode) != 0)
        fail("fchmod", tmpPath);

      if (exists) {
        struct stat mine {};
        if (::fstat(fd.get(), &mine) != 0)
          fail("fstat", tmpPath);
        if ((mine.st_uid != target.st_uid || mine.st_gid != target.st_gid) &&
            ::fchown(fd.get(), target.st_uid, target.st_gid) != 0)
          fail("fchown", tmpPath);
      }

      if (::fsync(fd.get()) != 0)
        fail("fsync", tmpPath);
      if (::close(fd.release()) != 0)
        fail("close", tmpPath);

      if (beforeCommit)
        beforeCommit(tmpPath);

      if (::rename(tmpPath.c_str(), path.c_str()) != 0)
        fail("rename onto", path);
    } catch (...) {
      ::unlink(tmpPath.c_str());
      throw;
    }
  }

  bool createBackupOnce(const std::string& source, const std::string& backup) {
    FdGuard in{ ::open(source.c_str(), O_RDONLY | O_CLOEXEC) };
    if (in.get() < 0)
      fail("open", source);

    struct stat st {};
    if (::fstat(in.get(), &st) != 0)
      fail("fstat", source);

    FdGuard out{ ::open(backup.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                        st.st_mode & 07777) };
    if (out.get() < 0) {
      if (errno == EEXIST)
        return false;
      fail("create", backup);
    }

    try {
      writeAll(out.get(), readAll(in.get(), source), backup);
      if (::fsync(out.get()) != 0)
        fail("fsync", backup);
    } catch (...) {
      ::unlink(backup.c_str());
      throw;
    }
    return true;
  }

  bool sameContent(const std::string& a, const std::string& b) {
    const auto lhs = readFile(a);
    const auto rhs = readFile(b);
    return lhs && rhs && *lhs == *rhs;
  }

} // namespace fieldkit::io
