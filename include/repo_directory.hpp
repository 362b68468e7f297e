#ifndef REPO_DIRECTORY_HPP
#define REPO_DIRECTORY_HPP
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "command_runner.hpp"
#include "progress.hpp"
#include "repo.hpp"

namespace ghbackup {

/// Upper bound on entries requested from the listing service.
constexpr size_t MAX_LISTING_LIMIT = 1000;

/**
 * @brief How to invoke the repository listing command.
 */
struct DirectoryOptions {
    std::string program = "gh"; ///< Listing executable
    std::string owner;          ///< Account or organisation; empty for the signed-in user
    size_t limit = MAX_LISTING_LIMIT;
};

enum class ListingStatus {
    Ok,               ///< Listing decoded, possibly empty
    TransportFailure, ///< Command exited non-zero or could not be started
    DecodeFailure     ///< Output was not the expected JSON array of objects
};

/**
 * @brief Build the argv for the listing command, e.g.
 * `gh repo list --json url --limit 1000`.
 */
std::vector<std::string> listing_command(const DirectoryOptions& opts);

/**
 * @brief Decode `[{"url": "..."}, ...]` into descriptors.
 *
 * @param text  Raw command output.
 * @param error Receives the decoder message on failure.
 * @return Descriptors in input order or `std::nullopt` when @p text is not a
 *         JSON array of objects each carrying a string `url`.
 */
std::optional<std::vector<RepositoryDescriptor>> parse_listing(const std::string& text,
                                                               std::string& error);

/**
 * @brief Client for the account-scoped repository directory.
 */
class RepositoryDirectory {
  public:
    RepositoryDirectory(CommandRunner& runner, DirectoryOptions opts)
        : runner_(runner), opts_(std::move(opts)) {}

    /**
     * @brief Query the directory service.
     *
     * Reports 0 before the call, then 10 on success or 100 on failure. Failures
     * are logged and yield an empty list; nothing is thrown.
     *
     * @param log      Receives human readable log lines.
     * @param progress Receives progress values.
     * @param status   Optional output describing how the listing ended.
     */
    std::vector<RepositoryDescriptor> list(const std::function<void(const std::string&)>& log,
                                           ProgressReporter& progress,
                                           ListingStatus* status = nullptr);

  private:
    CommandRunner& runner_;
    DirectoryOptions opts_;
};

} // namespace ghbackup

#endif // REPO_DIRECTORY_HPP
