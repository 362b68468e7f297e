#ifndef REPO_HPP
#define REPO_HPP
#include <filesystem>
#include <string>

namespace ghbackup {

/**
 * @brief A remote repository as reported by the directory service.
 */
struct RepositoryDescriptor {
    std::string url; ///< Clone URL of the remote repository
};

/**
 * @brief A remote repository paired with its local working tree location.
 */
struct ResolvedRepository {
    std::string url;                  ///< Clone URL of the remote repository
    std::string local_name;           ///< Final URL segment without a trailing `.git`
    std::filesystem::path local_path; ///< Destination directory joined with @ref local_name
};

/**
 * @brief Per-repository action chosen by the engine.
 */
enum class RepoAction {
    Clone,  ///< Local path missing, a new working tree is created
    Update  ///< Local path present, the working tree is pulled
};

} // namespace ghbackup

#endif // REPO_HPP
