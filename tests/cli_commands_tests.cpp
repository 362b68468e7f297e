#include "test_common.hpp"
#include "cli_commands.hpp"

#include <sstream>

using ghbackup::test_support::FakeRunner;
using ghbackup::test_support::TempDir;

static Options backup_options(const fs::path& dest) {
    Options opts;
    opts.destination = dest;
    return opts;
}

TEST_CASE("run_backup prints log lines and progress") {
    TempDir tmp("ghbackup_cli_ok");
    FakeRunner runner;
    runner.set_urls({"https://github.com/user/one.git", "https://github.com/user/two.git"});
    std::ostringstream out;

    int rc = cli::run_backup(backup_options(tmp.path / "mirror"), runner, out);
    REQUIRE(rc == 0);
    const std::string text = out.str();
    REQUIRE(text.find("Fetching repositories...\n") != std::string::npos);
    REQUIRE(text.find("Cloning one...\n") != std::string::npos);
    REQUIRE(text.find("Cloning two...\n") != std::string::npos);
    REQUIRE(text.find("[  0%]\n") != std::string::npos);
    REQUIRE(text.find("[ 55%]\n") != std::string::npos);
    REQUIRE(text.find("[100%]\n") != std::string::npos);
    REQUIRE(text.find("Backup completed.\n") != std::string::npos);
    REQUIRE(fs::is_directory(tmp.path / "mirror" / "one"));
}

TEST_CASE("run_backup quiet mode hides progress") {
    TempDir tmp("ghbackup_cli_quiet");
    FakeRunner runner;
    runner.set_urls({"https://github.com/user/one.git"});
    Options opts = backup_options(tmp.path);
    opts.quiet = true;
    std::ostringstream out;

    REQUIRE(cli::run_backup(opts, runner, out) == 0);
    REQUIRE(out.str().find('%') == std::string::npos);
    REQUIRE(out.str().find("Cloning one...") != std::string::npos);
}

TEST_CASE("run_backup reports incomplete runs") {
    TempDir tmp("ghbackup_cli_fail");
    FakeRunner runner;
    SECTION("listing failure") {
        runner.listing = {1, "", "gh: not logged in"};
        std::ostringstream out;
        REQUIRE(cli::run_backup(backup_options(tmp.path), runner, out) ==
                cli::EXIT_BACKUP_INCOMPLETE);
        REQUIRE(out.str().find("Error fetching repositories: gh: not logged in") !=
                std::string::npos);
    }
    SECTION("transfer failure") {
        runner.set_urls({"https://github.com/user/gone.git"});
        runner.failing.insert("gone");
        std::ostringstream out;
        REQUIRE(cli::run_backup(backup_options(tmp.path), runner, out) ==
                cli::EXIT_BACKUP_INCOMPLETE);
        REQUIRE(out.str().find("Failed to clone gone") != std::string::npos);
    }
}

TEST_CASE("run_backup uses the configured programs") {
    TempDir tmp("ghbackup_cli_programs");
    FakeRunner runner;
    runner.set_urls({"https://github.com/user/one.git"});
    Options opts = backup_options(tmp.path);
    opts.directory.program = "/opt/gh";
    opts.directory.owner = "octo";
    opts.git_program = "/opt/git";
    std::ostringstream out;

    REQUIRE(cli::run_backup(opts, runner, out) == 0);
    REQUIRE(runner.calls.size() == 2);
    REQUIRE(runner.calls[0][0] == "/opt/gh");
    REQUIRE(runner.calls[0][3] == "octo");
    REQUIRE(runner.calls[1][0] == "/opt/git");
}
