#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

namespace {

const std::set<std::string> kValueFlags{"--destination", "--config-yaml", "--config-json",
                                        "--gh",          "--git",         "--owner",
                                        "--limit",       "--backend",     "--log-file",
                                        "--log-level",   "--max-log-size", "--max-log-files"};

const std::set<std::string> kBoolFlags{"--json-log", "--compress-logs", "--syslog",
                                       "--quiet",    "--help",          "--version"};

const std::map<char, std::string> kShortFlags{{'d', "--destination"}, {'y', "--config-yaml"},
                                              {'j', "--config-json"}, {'l', "--log-file"},
                                              {'q', "--quiet"},       {'h', "--help"},
                                              {'v', "--version"}};

std::set<std::string> known_flags() {
    std::set<std::string> all = kValueFlags;
    all.insert(kBoolFlags.begin(), kBoolFlags.end());
    return all;
}

// Command line value when given, otherwise the config file value.
struct Lookup {
    const ArgParser& parser;
    const std::map<std::string, std::string>& cfg;

    bool has(const std::string& key) const { return parser.has_flag(key) || cfg.count(key); }

    std::string value(const std::string& key) const {
        if (parser.has_flag(key))
            return parser.get_option(key);
        auto it = cfg.find(key);
        return it == cfg.end() ? "" : it->second;
    }

    bool flag(const std::string& key) const {
        if (parser.has_flag(key))
            return true;
        auto it = cfg.find(key);
        if (it == cfg.end())
            return false;
        bool ok = false;
        bool v = parse_bool(it->second, ok);
        if (!ok)
            throw std::runtime_error(key + " expects a boolean, got '" + it->second + "'");
        return v;
    }
};

std::string require_value(const Lookup& lk, const std::string& key) {
    std::string v = lk.value(key);
    if (v.empty())
        throw std::runtime_error(key + " requires a value");
    return v;
}

} // namespace

Options parse_options(int argc, char* argv[]) {
    ArgParser parser(argc, argv, known_flags(), kValueFlags, kShortFlags);
    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());
    if (!parser.missing_values().empty())
        throw std::runtime_error(parser.missing_values().front() + " requires a value");
    if (parser.positional().size() > 1)
        throw std::runtime_error("Only one destination directory may be given");

    Options opts;
    std::map<std::string, std::string> cfg;
    std::string err;
    if (parser.has_flag("--config-yaml")) {
        opts.config_file = parser.get_option("--config-yaml");
        if (!load_yaml_config(opts.config_file.string(), cfg, err))
            throw std::runtime_error("Failed to load config: " + err);
    } else if (parser.has_flag("--config-json")) {
        opts.config_file = parser.get_option("--config-json");
        if (!load_json_config(opts.config_file.string(), cfg, err))
            throw std::runtime_error("Failed to load config: " + err);
    }
    Lookup lk{parser, cfg};

    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");
    opts.quiet = lk.flag("--quiet");

    if (!parser.positional().empty())
        opts.destination = parser.positional().front();
    else if (lk.has("--destination"))
        opts.destination = require_value(lk, "--destination");

    if (lk.has("--gh"))
        opts.directory.program = require_value(lk, "--gh");
    if (lk.has("--owner"))
        opts.directory.owner = lk.value("--owner");
    if (lk.has("--limit")) {
        bool ok = false;
        opts.directory.limit =
            parse_size_t(lk.value("--limit"), 1, ghbackup::MAX_LISTING_LIMIT, ok);
        if (!ok)
            throw std::runtime_error("--limit must be between 1 and " +
                                     std::to_string(ghbackup::MAX_LISTING_LIMIT));
    }
    if (lk.has("--git"))
        opts.git_program = require_value(lk, "--git");
    if (lk.has("--backend")) {
        std::string b = lk.value("--backend");
        if (b == "cli" || b == "git")
            opts.transfer = TransferKind::Command;
        else if (b == "libgit2")
            opts.transfer = TransferKind::Libgit2;
        else
            throw std::runtime_error("--backend must be 'cli' or 'libgit2'");
    }

    if (lk.has("--log-file"))
        opts.logging.log_file = require_value(lk, "--log-file");
    if (lk.has("--log-level")) {
        auto lvl = parse_log_level(lk.value("--log-level"));
        if (!lvl)
            throw std::runtime_error("Invalid value for --log-level");
        opts.logging.log_level = *lvl;
    }
    if (lk.has("--max-log-size")) {
        bool ok = false;
        opts.logging.max_log_size = parse_bytes(lk.value("--max-log-size"), ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-size");
    }
    if (lk.has("--max-log-files")) {
        bool ok = false;
        opts.logging.max_log_files = parse_size_t(lk.value("--max-log-files"), 0, 100, ok);
        if (!ok)
            throw std::runtime_error("--max-log-files must be between 0 and 100");
    }
    opts.logging.json_log = lk.flag("--json-log");
    opts.logging.compress_logs = lk.flag("--compress-logs");
    opts.logging.use_syslog = lk.flag("--syslog");
    return opts;
}
