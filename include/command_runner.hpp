#ifndef COMMAND_RUNNER_HPP
#define COMMAND_RUNNER_HPP
#include <string>
#include <vector>

#include "system_utils.hpp"

namespace ghbackup {

/**
 * @brief Seam through which the backup core launches external tools.
 *
 * The production implementation spawns real processes; tests substitute a
 * recorder that returns canned results.
 */
class CommandRunner {
  public:
    virtual ~CommandRunner() = default;

    /**
     * @brief Run @p argv to completion.
     *
     * @param argv    Program followed by its arguments.
     * @param capture Whether stdout/stderr should be captured into the result.
     */
    virtual procutil::CommandResult run(const std::vector<std::string>& argv,
                                        bool capture) = 0;
};

/**
 * @brief CommandRunner backed by @ref procutil::run_command.
 */
class ProcessRunner : public CommandRunner {
  public:
    procutil::CommandResult run(const std::vector<std::string>& argv, bool capture) override;
};

} // namespace ghbackup

#endif // COMMAND_RUNNER_HPP
