#pragma once
#include <catch2/catch_test_macros.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <system_error>
#include <vector>

#include "command_runner.hpp"
#include "progress.hpp"
#include "repo.hpp"

#define REDIR " > /dev/null 2>&1"

static inline bool have_git() { return std::system("git --version " REDIR) == 0; }

namespace fs = std::filesystem;

namespace ghbackup::test_support {

inline void remove_all(const fs::path& target) {
    std::error_code ec;
    fs::remove_all(target, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        INFO("Failed to remove '" << target.string() << "': " << ec.message());
        REQUIRE(false);
    }
}

/**
 * Fresh directory under the system temp dir, removed again on destruction.
 */
struct TempDir {
    fs::path path;
    explicit TempDir(const std::string& name) : path(fs::temp_directory_path() / name) {
        remove_all(path);
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
};

/**
 * CommandRunner double that records every invocation.
 *
 * `gh ... repo list` returns @ref listing; `git clone` returns success and
 * creates the target directory unless the repository name is in
 * @ref failing; `git -C <path> pull` succeeds unless the directory name is
 * in @ref failing.
 */
class FakeRunner : public CommandRunner {
  public:
    procutil::CommandResult listing{0, "[]", ""};
    std::set<std::string> failing;
    std::vector<std::vector<std::string>> calls;

    procutil::CommandResult run(const std::vector<std::string>& argv, bool) override {
        calls.push_back(argv);
        if (argv.size() >= 3 && argv[1] == "repo" && argv[2] == "list")
            return listing;
        if (argv.size() == 4 && argv[1] == "clone") {
            fs::path target = argv[3];
            if (failing.count(target.filename().string()))
                return {128, "",
                        "Cloning into '" + argv[3] + "'...\nfatal: repository not found\n"};
            fs::create_directories(target);
            return {0, "", ""};
        }
        if (argv.size() == 4 && argv[1] == "-C" && argv[3] == "pull") {
            if (failing.count(fs::path(argv[2]).filename().string()))
                return {1, "", "fatal: Not possible to fast-forward, aborting.\n"};
            return {0, "Already up to date.\n", ""};
        }
        return {127, "", "unexpected command"};
    }

    size_t count(const std::string& verb) const {
        size_t n = 0;
        for (const auto& c : calls) {
            if (c.size() >= 2 && (c[1] == verb || (verb == "pull" && c.back() == "pull")))
                ++n;
        }
        return n;
    }

    void set_urls(const std::vector<std::string>& urls) {
        std::string json = "[";
        for (size_t i = 0; i < urls.size(); ++i) {
            if (i)
                json += ",";
            json += "{\"url\":\"" + urls[i] + "\"}";
        }
        json += "]";
        listing = {0, json, ""};
    }
};

/**
 * Collects log lines and progress values emitted by a run.
 */
struct Recorder {
    std::vector<std::string> logs;
    std::vector<int> progress;

    std::function<void(const std::string&)> log_fn() {
        return [this](const std::string& l) { logs.push_back(l); };
    }
    std::function<void(int)> progress_fn() {
        return [this](int p) { progress.push_back(p); };
    }

    bool logged(const std::string& needle) const {
        for (const auto& l : logs) {
            if (l.find(needle) != std::string::npos)
                return true;
        }
        return false;
    }
};

} // namespace ghbackup::test_support
