#ifndef REPO_RESOLVER_HPP
#define REPO_RESOLVER_HPP
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "repo.hpp"

namespace ghbackup {

/**
 * @brief Derive the local directory name for a remote URL.
 *
 * Takes everything after the last `/` and removes a trailing `.git`
 * (exact, case-sensitive suffix match). A URL ending in `/` yields an empty
 * name.
 */
std::string local_name_for(const std::string& url);

/**
 * @brief Pair a descriptor with its local name and path under @p destination.
 */
ResolvedRepository resolve(const RepositoryDescriptor& descriptor,
                           const std::filesystem::path& destination);

enum class RejectReason {
    InvalidName, ///< Empty name, `.` or `..`
    Collision    ///< Another repository already claimed the same local name
};

/**
 * @brief Check every resolved repository for a usable local name.
 *
 * The first repository claiming a local name keeps it; later ones are
 * rejected as collisions.
 *
 * @return One entry per input, in the same order: `std::nullopt` when the
 *         repository can be transferred, otherwise why it cannot.
 */
std::vector<std::optional<RejectReason>>
check_names(const std::vector<ResolvedRepository>& repos);

/** @return Human readable explanation for @p reason. */
const char* reject_reason_text(RejectReason reason);

} // namespace ghbackup

#endif // REPO_RESOLVER_HPP
