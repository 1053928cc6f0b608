/* @file TransactionalConfigWriter.cpp
 * @brief Backup-once + idempotent merge + verbatim restore for the grant resource.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>
#include <optional>
#include <system_error>

// fieldkit headers
#include "core/Errors.hpp"
#include "core/LineSet.hpp"
#include "core/Logger.hpp"
#include "io/CommandRunner.hpp"
#include "provisioning/TransactionalConfigWriter.hpp"

using namespace fieldkit::provisioning;
using fieldkit::core::LineSet;

TransactionalConfigWriter::TransactionalConfigWriter(std::string resourcePath,
                                                     std::string backupPath,
                                                     std::string sectionComment,
                                                     core::Logger& log,
                                                     io::PreCommitHook validator)
    : sectionComment_{ std::move(sectionComment) }, log_{ log },
      validator_{ std::move(validator) } {
  tx_.resource = std::move(resourcePath);
  tx_.backupPath = std::move(backupPath);
}

std::string TransactionalConfigWriter::readResource() const {
  try {
    auto content = io::readFile(tx_.resource);
    if (!content)
      throw core::TransactionError("[ConfigWriter] " + tx_.resource + " does not exist");
    return std::move(*content);
  } catch (const std::system_error& e) {
    throw core::TransactionError("[ConfigWriter] cannot read " + tx_.resource + ": " + e.what());
  }
}

bool TransactionalConfigWriter::hasBackup() const { return io::fileExists(tx_.backupPath); }

std::vector<std::string>
TransactionalConfigWriter::missing(const std::vector<std::string>& entries) const {
  return LineSet::parse(readResource()).missing(entries);
}

std::vector<std::string>
TransactionalConfigWriter::present(const std::vector<std::string>& entries) const {
  return LineSet::parse(readResource()).present(entries);
}

GrantOutcome TransactionalConfigWriter::grant(const std::vector<std::string>& entries) {
  auto lines = LineSet::parse(readResource());

  try {
    if (io::createBackupOnce(tx_.resource, tx_.backupPath))
      log_.success("Backup of " + tx_.resource + " created at " + tx_.backupPath);
  } catch (const std::system_error& e) {
    throw core::TransactionError("[ConfigWriter] cannot back up " + tx_.resource + ": " +
                                 e.what());
  }

  tx_.asserted.insert(tx_.asserted.end(), entries.begin(), entries.end());

  const auto added = lines.merge(entries, sectionComment_);
  if (added.empty())
    return GrantOutcome::AlreadyApplied;

  try {
    io::writeFileAtomic(tx_.resource, lines.render(), 0440, validator_);
  } catch (const std::exception& e) {
    throw core::TransactionError("[ConfigWriter] cannot write " + tx_.resource + ": " +
                                 e.what());
  }

  for (const auto& line : added)
    log_.info("Granted: " + line);
  tx_.applied = true;
  return GrantOutcome::Applied;
}

void TransactionalConfigWriter::restore() {
  std::optional<std::string> pristine;
  try {
    pristine = io::readFile(tx_.backupPath);
  } catch (const std::system_error& e) {
    throw core::TransactionError("[ConfigWriter] cannot read " + tx_.backupPath + ": " + e.what());
  }
  if (!pristine)
    throw core::NoBackupError("No backup file found at " + tx_.backupPath);

  try {
    io::writeFileAtomic(tx_.resource, *pristine, 0440);
  } catch (const std::system_error& e) {
    throw core::TransactionError("[ConfigWriter] cannot restore " + tx_.resource + ": " +
                                 e.what());
  }
  log_.success(tx_.resource + " restored from " + tx_.backupPath);
}

fieldkit::io::PreCommitHook fieldkit::provisioning::visudoValidator(io::CommandRunner& runner) {
  if (!runner.hasProgram("visudo"))
    return {};
  return [&runner](const std::string& candidate) {
    const auto result = runner.run({ "visudo", "-cf", candidate });
    if (!result.ok())
      throw core::TransactionError("[ConfigWriter] visudo rejected the candidate: " + result.output);
  };
}
