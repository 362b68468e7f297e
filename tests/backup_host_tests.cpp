#include "test_common.hpp"
#include "backup_host.hpp"

#include <future>
#include <stdexcept>
#include <thread>

using namespace ghbackup;
using ghbackup::test_support::FakeRunner;
using ghbackup::test_support::TempDir;

namespace {

std::vector<BackupEvent> drain(BackupHost& host) {
    std::vector<BackupEvent> events;
    BackupEvent ev;
    do {
        host.wait_event(ev);
        events.push_back(ev);
    } while (ev.kind != BackupEvent::Kind::Finished);
    return events;
}

} // namespace

TEST_CASE("host relays engine events in emission order") {
    TempDir tmp("ghbackup_host_order");
    fs::create_directories(tmp.path / "b");
    FakeRunner runner;
    runner.set_urls({"https://github.com/u/a.git", "https://github.com/u/b.git",
                     "https://github.com/u/c.git"});
    CommandTransfer transfer(runner);
    BackupHost host(runner, transfer, DirectoryOptions{});
    const auto caller = std::this_thread::get_id();

    REQUIRE(host.start(tmp.path));
    auto events = drain(host);
    host.wait();

    std::vector<std::string> logs;
    std::vector<int> progress;
    for (const auto& ev : events) {
        if (ev.kind == BackupEvent::Kind::Log)
            logs.push_back(ev.message);
        else if (ev.kind == BackupEvent::Kind::Progress)
            progress.push_back(ev.percent);
    }
    REQUIRE(std::this_thread::get_id() == caller);
    REQUIRE(progress == std::vector<int>{0, 10, 40, 70, 100, 100});
    REQUIRE(logs[0] == "Fetching repositories...");
    REQUIRE(logs[2] == "Cloning a...");
    REQUIRE(logs[3] == "Updating b...");
    REQUIRE(logs[4] == "Cloning c...");
    REQUIRE(logs[5] == "Backup completed.");
    REQUIRE(events.back().kind == BackupEvent::Kind::Finished);
    REQUIRE(events.back().summary.cloned == 2);
    REQUIRE(events.back().summary.updated == 1);
    REQUIRE_FALSE(host.running());
}

TEST_CASE("host delivers Finished exactly once per run") {
    BackupHost host([](const fs::path&, BackupSinks sinks) {
        sinks.log("working");
        sinks.progress(100);
        return BackupSummary{};
    });
    REQUIRE(host.start("unused"));
    auto events = drain(host);
    host.wait();
    REQUIRE(events.size() == 3);
    BackupEvent extra;
    REQUIRE_FALSE(host.poll_event(extra));
    REQUIRE_FALSE(host.wait_event_for(extra, std::chrono::milliseconds(50)));

    REQUIRE(host.start("unused"));
    events = drain(host);
    REQUIRE(events.size() == 3);
    REQUIRE(events.front().message == "working");
}

TEST_CASE("host refuses a second start while running") {
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    BackupHost host([gate](const fs::path&, BackupSinks sinks) {
        sinks.log("started");
        gate.wait();
        return BackupSummary{};
    });

    REQUIRE(host.start("first"));
    BackupEvent ev;
    host.wait_event(ev);
    REQUIRE(ev.message == "started");
    REQUIRE(host.running());
    REQUIRE_FALSE(host.start("second"));

    release.set_value();
    host.wait_event(ev);
    REQUIRE(ev.kind == BackupEvent::Kind::Finished);
    host.wait();
    REQUIRE_FALSE(host.running());
}

TEST_CASE("host reports an exception from the run and still finishes") {
    BackupHost host([](const fs::path&, BackupSinks sinks) -> BackupSummary {
        sinks.progress(10);
        throw std::runtime_error("disk on fire");
    });
    REQUIRE(host.start("x"));
    auto events = drain(host);
    REQUIRE(events.size() == 4);
    REQUIRE(events[1].kind == BackupEvent::Kind::Log);
    REQUIRE(events[1].message == "Backup aborted: disk on fire");
    REQUIRE(events[2].percent == 100);
    REQUIRE(events[3].summary.aborted);
    REQUIRE_FALSE(events[3].summary.success());
}

TEST_CASE("poll_event drains without blocking") {
    BackupHost host([](const fs::path&, BackupSinks sinks) {
        for (int i = 0; i <= 100; i += 25)
            sinks.progress(i);
        return BackupSummary{};
    });
    REQUIRE(host.start("x"));
    host.wait();
    std::vector<int> seen;
    bool finished = false;
    BackupEvent ev;
    while (host.poll_event(ev)) {
        if (ev.kind == BackupEvent::Kind::Progress)
            seen.push_back(ev.percent);
        else if (ev.kind == BackupEvent::Kind::Finished)
            finished = true;
    }
    REQUIRE(finished);
    REQUIRE(seen == std::vector<int>{0, 25, 50, 75, 100});
}

TEST_CASE("host reports a non-standard exception and still finishes") {
    BackupHost host([](const fs::path&, BackupSinks) -> BackupSummary { throw 42; });
    REQUIRE(host.start("x"));
    auto events = drain(host);
    REQUIRE(events.size() == 3);
    REQUIRE(events[0].message == "Backup aborted: unknown error");
    REQUIRE(events[1].percent == 100);
    REQUIRE(events[2].kind == BackupEvent::Kind::Finished);
    REQUIRE(events[2].summary.aborted);
}

TEST_CASE("Finished is queued by the time running() turns false") {
    BackupHost host([](const fs::path&, BackupSinks sinks) {
        sinks.progress(100);
        return BackupSummary{};
    });
    for (int round = 0; round < 200; ++round) {
        REQUIRE(host.start("x"));
        int finished = 0;
        BackupEvent ev;
        bool alive = true;
        do {
            alive = host.running();
            while (host.poll_event(ev)) {
                if (ev.kind == BackupEvent::Kind::Finished)
                    ++finished;
            }
        } while (alive);
        REQUIRE(finished == 1);
    }
    host.wait();
}
