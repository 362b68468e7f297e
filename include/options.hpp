#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <cstddef>
#include <filesystem>
#include <string>
#include "logger.hpp"
#include "repo_directory.hpp"

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    size_t max_log_size = 0;
    size_t max_log_files = 3;
    bool json_log = false;
    bool compress_logs = false;
    bool use_syslog = false;
};

enum class TransferKind {
    Command, ///< `git clone` / `git pull` subprocesses
    Libgit2  ///< In-process clone and fast-forward through libgit2
};

struct Options {
    std::filesystem::path destination = "GitHub_Backups";
    ghbackup::DirectoryOptions directory;
    std::string git_program = "git";
    TransferKind transfer = TransferKind::Command;
    LoggingOptions logging;
    std::filesystem::path config_file;
    bool quiet = false;
    bool show_help = false;
    bool print_version = false;
};

/**
 * @brief Build the run configuration from the command line.
 *
 * Values from `--config-yaml` / `--config-json` are applied first; flags on
 * the command line override them.
 *
 * @throws std::runtime_error naming the offending option on invalid input.
 */
Options parse_options(int argc, char* argv[]);

#endif // OPTIONS_HPP
