#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <filesystem>
#include <optional>
#include <string>

namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * libgit2 reference-counts init/shutdown, so guards may be nested freely.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
    GitInitGuard(const GitInitGuard&) = delete;
    GitInitGuard& operator=(const GitInitGuard&) = delete;
};

// RAII wrappers for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    ~GitHandle() {
        if (h)
            Free(h);
    }
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    T* get() const { return h; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;
using remote_ptr = GitHandle<git_remote, git_remote_free>;
using object_ptr = GitHandle<git_object, git_object_free>;
using reference_ptr = GitHandle<git_reference, git_reference_free>;
using status_list_ptr = GitHandle<git_status_list, git_status_list_free>;

// The functions below assume a GitInitGuard is alive.

/**
 * @brief Determine whether the given path is a Git working tree.
 *
 * @return `true` if a `.git` directory exists inside @a p.
 */
bool is_git_repo(const fs::path& p);

/**
 * @brief Get the commit hash pointed to by `HEAD`.
 *
 * @param repo  Path to a Git repository.
 * @param error Optional output string receiving a libgit2 error message.
 * @return 40 character hexadecimal commit hash or `std::nullopt` on error.
 */
std::optional<std::string> get_local_hash(const fs::path& repo, std::string* error = nullptr);

/**
 * @brief Retrieve the currently checked out branch name.
 */
std::optional<std::string> get_current_branch(const fs::path& repo, std::string* error = nullptr);

/**
 * @brief Check if there are uncommitted or untracked changes in the working tree.
 */
bool has_uncommitted_changes(const fs::path& repo);

/**
 * @brief Clone a repository from a remote URL.
 *
 * @param dest  Destination path for the new working tree.
 * @param url   Remote repository URL.
 * @param error Optional output string receiving the libgit2 error message.
 * @return `true` on success.
 */
bool clone_repo(const fs::path& dest, const std::string& url, std::string* error = nullptr);

/** Outcome of @ref fast_forward_pull. */
enum class PullResult {
    UpToDate,      ///< Remote branch matches HEAD
    FastForwarded, ///< HEAD moved to the remote commit
    Diverged,      ///< Local history is not an ancestor of the remote
    LocalChanges,  ///< Working tree has modifications, nothing touched
    Failed         ///< Open, fetch or checkout failed
};

/**
 * @brief Fetch @p remote and fast-forward the checked out branch.
 *
 * Only fast-forwards are performed; diverged histories and dirty working
 * trees are reported and left alone.
 *
 * @param repo    Path to a Git working tree.
 * @param remote  Name of the remote to fetch, usually `origin`.
 * @param out_log Receives a short description of what happened.
 */
PullResult fast_forward_pull(const fs::path& repo, const std::string& remote,
                             std::string& out_log);

} // namespace git

#endif // GIT_UTILS_HPP
