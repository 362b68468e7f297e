#ifndef SYNC_ENGINE_HPP
#define SYNC_ENGINE_HPP
#include <cstddef>
#include <filesystem>

#include "backup_sinks.hpp"
#include "command_runner.hpp"
#include "repo_directory.hpp"
#include "transfer.hpp"

namespace ghbackup {

/**
 * @brief Counters describing a finished run.
 */
struct BackupSummary {
    size_t listed = 0;  ///< Repositories returned by the directory service
    size_t cloned = 0;  ///< New working trees created
    size_t updated = 0; ///< Existing working trees pulled
    size_t failed = 0;  ///< Clone/update commands that reported failure
    size_t skipped = 0; ///< Entries with an unusable or colliding local name
    bool listing_failed = false;
    bool destination_failed = false;
    bool aborted = false; ///< The run stopped on an unexpected exception

    /** @return `true` when the listing worked and every transfer succeeded. */
    bool success() const {
        return !listing_failed && !destination_failed && !aborted && failed == 0;
    }
};

/**
 * @brief Mirrors the remote repository set into a destination directory.
 *
 * One call to @ref run lists the remote repositories once, then clones every
 * repository missing locally and updates every one already present, strictly
 * one after another. Failures are reported through the log sink and never
 * stop the loop.
 */
class SyncEngine {
  public:
    SyncEngine(CommandRunner& runner, TransferBackend& transfer, DirectoryOptions directory,
               BackupSinks sinks);

    /**
     * @brief Synchronize all listed repositories into @p destination.
     *
     * Creates @p destination if needed. Progress ends at 100 on every path.
     */
    BackupSummary run(const std::filesystem::path& destination);

  private:
    void emit(const std::string& line);

    CommandRunner& runner_;
    TransferBackend& transfer_;
    DirectoryOptions directory_;
    BackupSinks sinks_;
};

} // namespace ghbackup

#endif // SYNC_ENGINE_HPP
