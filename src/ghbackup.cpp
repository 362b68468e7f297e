/**
 * @file ghbackup.cpp
 * @brief CLI entry point mirroring a GitHub account into a local directory.
 */

#include <iostream>

#include "cli_commands.hpp"
#include "command_runner.hpp"
#include "git_utils.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "version.hpp"

/**
 * @brief Application entry point.
 *
 * @return 0 when every repository was backed up or when printing
 *         help/version, 2 when the run was incomplete, 1 on invalid options.
 */
int main(int argc, char* argv[]) {
    git::GitInitGuard git_guard;
    try {
        Options opts = parse_options(argc, argv);
        if (opts.show_help) {
            print_help(argv[0]);
            return 0;
        }
        if (opts.print_version) {
            std::cout << GHBACKUP_VERSION << "\n";
            return 0;
        }
        cli::setup_logging(opts);
        ghbackup::ProcessRunner runner;
        int rc = cli::run_backup(opts, runner, std::cout);
        shutdown_logger();
        return rc;
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        shutdown_logger();
        return 1;
    }
}
