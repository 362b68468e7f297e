#include "help_text.hpp"

#include <iomanip>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

void print_help(const char* prog) {
    const std::vector<std::pair<std::string, std::string>> opts = {
        {"-d, --destination <dir>", "Backup directory (default GitHub_Backups)"},
        {"-y, --config-yaml <file>", "Load options from a YAML file"},
        {"-j, --config-json <file>", "Load options from a JSON file"},
        {"--gh <path>", "Repository listing tool (default gh)"},
        {"--owner <name>", "List repositories of this user or organisation"},
        {"--limit <n>", "Maximum repositories to list, 1-1000 (default 1000)"},
        {"--git <path>", "git executable used for clone/pull (default git)"},
        {"--backend <cli|libgit2>", "Transfer through git subprocesses or libgit2"},
        {"-l, --log-file <file>", "Write a log file"},
        {"--log-level <level>", "DEBUG, INFO, WARNING or ERROR"},
        {"--max-log-size <bytes>", "Rotate the log file after this size (e.g. 5MB)"},
        {"--max-log-files <n>", "Rotated log files to keep (default 3)"},
        {"--json-log", "Write log entries as JSON"},
        {"--compress-logs", "Gzip rotated log files"},
        {"--syslog", "Mirror log entries to syslog"},
        {"-q, --quiet", "Do not print progress"},
        {"-h, --help", "Show this help"},
        {"-v, --version", "Show version"},
    };
    std::cout << "Usage: " << prog << " [options] [destination]\n\n"
              << "Clone every repository of the signed-in GitHub account into the\n"
              << "destination directory, or pull the ones already there.\n\n"
              << "Options:\n";
    for (const auto& [flag, desc] : opts)
        std::cout << "  " << std::left << std::setw(28) << flag << desc << "\n";
}
