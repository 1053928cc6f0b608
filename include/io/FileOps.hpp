#pragma once
/** @file  FileOps.hpp
 *  @brief POSIX file helpers: whole-file read, atomic replace, exclusive backup.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <optional>
#include <string>

#include <sys/types.h> // mode_t

namespace fieldkit {
  namespace io {

    /// @returns file content, or std::nullopt if the file does not exist.
    /// @throws std::system_error on any other failure (EACCES, EIO, ...).
    std::optional<std::string> readFile(const std::string& path);

    bool fileExists(const std::string& path);

    /// Called with the temp path before it replaces the target; throw to abort.
    using PreCommitHook = std::function<void(const std::string& candidatePath)>;

    /**
     * Write \p content next to \p path, fsync, then rename over it.
     * Keeps the mode of an existing target; otherwise uses \p modeIfNew.
     * @throws std::system_error; the target is untouched on failure.
     */
    void writeFileAtomic(const std::string& path, const std::string& content,
                         mode_t modeIfNew = 0644, const PreCommitHook& beforeCommit = {});

    /**
     * Copy \p source to \p backup only if \p backup does not exist (O_EXCL).
     * @returns true if the backup was created by this call.
     * @throws std::system_error on read/write failure.
     */
    bool createBackupOnce(const std::string& source, const std::string& backup);

    /// Byte comparison; false if either side is missing.
    bool sameContent(const std::string& a, const std::string& b);

  } // namespace io
} // namespace fieldkit
