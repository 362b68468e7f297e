#ifndef CLI_COMMANDS_HPP
#define CLI_COMMANDS_HPP
#include <iosfwd>

#include "command_runner.hpp"
#include "options.hpp"

namespace cli {

/// Exit code when the listing or at least one transfer failed.
constexpr int EXIT_BACKUP_INCOMPLETE = 2;

/**
 * @brief Configure the file logger and syslog mirroring from @p opts.
 */
void setup_logging(const Options& opts);

/**
 * @brief Run one backup on a worker thread and print its events to @p out.
 *
 * Log lines are printed as they arrive; progress is printed as `[ NN%]`
 * unless `opts.quiet` is set.
 *
 * @return 0 on full success, @ref EXIT_BACKUP_INCOMPLETE otherwise.
 */
int run_backup(const Options& opts, ghbackup::CommandRunner& runner, std::ostream& out);

} // namespace cli

#endif // CLI_COMMANDS_HPP
