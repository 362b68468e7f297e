#include "test_common.hpp"
#include "system_utils.hpp"

TEST_CASE("run_command captures stdout, stderr and exit code") {
    auto res = procutil::run_command({"/bin/sh", "-c", "echo out; echo err >&2; exit 3"});
    REQUIRE(res.exit_code == 3);
    REQUIRE_FALSE(res.ok());
    REQUIRE(res.out == "out\n");
    REQUIRE(res.err == "err\n");
}

TEST_CASE("run_command reports a missing executable") {
    auto res = procutil::run_command({"ghbackup-definitely-not-installed", "--version"});
    REQUIRE(res.exit_code == procutil::COMMAND_NOT_STARTED);
    REQUIRE(res.err.find("failed to launch ghbackup-definitely-not-installed") !=
            std::string::npos);
}

TEST_CASE("run_command drains large output on both streams") {
    auto res = procutil::run_command(
        {"/bin/sh", "-c", "i=0; while [ $i -lt 20000 ]; do echo line$i; echo eline$i >&2; "
                          "i=$((i+1)); done"});
    REQUIRE(res.ok());
    REQUIRE(res.out.size() > 64 * 1024);
    REQUIRE(res.err.size() > 64 * 1024);
    REQUIRE(res.out.rfind("line19999\n") == res.out.size() - 10);
}

TEST_CASE("run_command without capture only reports status") {
    auto res = procutil::run_command({"/bin/sh", "-c", "exit 0"}, false);
    REQUIRE(res.ok());
    REQUIRE(res.out.empty());
    REQUIRE(res.err.empty());
}

TEST_CASE("run_command maps signals above 128") {
    auto res = procutil::run_command({"/bin/sh", "-c", "kill -TERM $$"});
    REQUIRE(res.exit_code == 128 + 15);
}

TEST_CASE("run_command rejects an empty argv") {
    auto res = procutil::run_command({});
    REQUIRE(res.exit_code == procutil::COMMAND_NOT_STARTED);
}

TEST_CASE("format_command quotes arguments with spaces") {
    REQUIRE(procutil::format_command({"git", "clone", "https://x/y", "/tmp/my dir"}) ==
            "git clone https://x/y '/tmp/my dir'");
}

TEST_CASE("UniqueFd closes and releases") {
    int fds[2];
    REQUIRE(pipe(fds) == 0);
    procutil::UniqueFd a(fds[0]);
    procutil::UniqueFd b(fds[1]);
    procutil::UniqueFd moved(std::move(a));
    REQUIRE_FALSE(a);
    REQUIRE(moved.get() == fds[0]);
    int raw = b.release();
    REQUIRE_FALSE(b);
    REQUIRE(close(raw) == 0);
}
