#ifndef TRANSFER_HPP
#define TRANSFER_HPP
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "command_runner.hpp"

namespace ghbackup {

/**
 * @brief Outcome of a clone or update of a single repository.
 */
struct TransferResult {
    bool ok = false;
    int exit_code = 0;  ///< Exit status of the transfer command, 0 for in-process backends
    std::string detail; ///< Error text on failure, optional summary on success
};

/**
 * @brief Performs the clone/update of one working tree.
 */
class TransferBackend {
  public:
    virtual ~TransferBackend() = default;

    /** Create a new working tree for @p url at @p path. */
    virtual TransferResult clone(const std::string& url, const std::filesystem::path& path) = 0;

    /** Bring the existing working tree at @p path up to date. */
    virtual TransferResult update(const std::filesystem::path& path) = 0;
};

/**
 * @brief Transfers through the `git` command line tool.
 *
 * Runs `git clone <url> <path>` and `git -C <path> pull`.
 */
class CommandTransfer : public TransferBackend {
  public:
    explicit CommandTransfer(CommandRunner& runner, std::string git_program = "git")
        : runner_(runner), git_(std::move(git_program)) {}

    TransferResult clone(const std::string& url, const std::filesystem::path& path) override;
    TransferResult update(const std::filesystem::path& path) override;

  private:
    TransferResult run(const std::vector<std::string>& argv);

    CommandRunner& runner_;
    std::string git_;
};

/**
 * @brief Transfers in-process through libgit2.
 *
 * Updates only fast-forward the checked out branch from `origin`.
 */
class LibgitTransfer : public TransferBackend {
  public:
    TransferResult clone(const std::string& url, const std::filesystem::path& path) override;
    TransferResult update(const std::filesystem::path& path) override;
};

} // namespace ghbackup

#endif // TRANSFER_HPP
