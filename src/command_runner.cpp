#include "command_runner.hpp"

#include "logger.hpp"

namespace ghbackup {

procutil::CommandResult ProcessRunner::run(const std::vector<std::string>& argv, bool capture) {
    if (logger_initialized())
        log_debug("Running " + procutil::format_command(argv));
    procutil::CommandResult res = procutil::run_command(argv, capture);
    if (logger_initialized())
        log_debug("Command finished", {{"exit", std::to_string(res.exit_code)}});
    return res;
}

} // namespace ghbackup
