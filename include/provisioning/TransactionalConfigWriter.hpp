#pragma once
/** @file  TransactionalConfigWriter.hpp
 *  @brief One-time-backup, append-only mutation of the privilege-grant resource.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>
#include <vector>

#include "io/FileOps.hpp"

namespace fieldkit {
  namespace core {
    class Logger;
  } // namespace core
  namespace io {
    class CommandRunner;
  } // namespace io

  namespace provisioning {

    enum class GrantOutcome { Applied, AlreadyApplied };

    struct ConfigTransaction {
      std::string resource;
      std::string backupPath;
      std::vector<std::string> asserted; ///< every entry ever passed to grant()
      bool applied{ false };             ///< at least one line was appended
    };

    /**
 * @class TransactionalConfigWriter
 * @brief The only component allowed to touch the privilege-grant resource.
 *
 *  * Backup is created on the first grant() and never overwritten afterwards,
 *    even across runs (O_EXCL).
 *  * grant() only appends missing literal lines; existing lines are not edited.
 *  * restore() puts the backup back byte-for-byte.
 *  * Any read/write failure is a core::TransactionError.
 */
    class TransactionalConfigWriter {
    public:
      TransactionalConfigWriter(std::string resourcePath, std::string backupPath,
                                std::string sectionComment, core::Logger& log,
                                io::PreCommitHook validator = {});

      GrantOutcome grant(const std::vector<std::string>& entries);

      /// @throws core::NoBackupError if no backup exists.
      void restore();

      bool hasBackup() const;

      // --- read-only queries (throw core::TransactionError if unreadable) ---
      std::vector<std::string> missing(const std::vector<std::string>& entries) const;
      std::vector<std::string> present(const std::vector<std::string>& entries) const;

      const ConfigTransaction& transaction() const noexcept { return tx_; }
      const std::string& resourcePath() const noexcept { return tx_.resource; }
      const std::string& backupPath() const noexcept { return tx_.backupPath; }

    private:
      std::string readResource() const;

      ConfigTransaction tx_;
      std::string sectionComment_;
      core::Logger& log_;
      io::PreCommitHook validator_;
    };

    /// `visudo -cf <candidate>` as a pre-commit check; empty hook if visudo is absent.
    io::PreCommitHook visudoValidator(io::CommandRunner& runner);

  } // namespace provisioning
} // namespace fieldkit
