#include "backup_host.hpp"

#include <exception>
#include <utility>

#include "logger.hpp"

namespace ghbackup {

void EventChannel::push(BackupEvent ev) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        queue_.push_back(std::move(ev));
    }
    cv_.notify_one();
}

void EventChannel::wait(BackupEvent& out) {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait(lk, [this] { return !queue_.empty(); });
    out = std::move(queue_.front());
    queue_.pop_front();
}

bool EventChannel::wait_for(BackupEvent& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mtx_);
    if (!cv_.wait_for(lk, timeout, [this] { return !queue_.empty(); }))
        return false;
    out = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

void EventChannel::push_final(BackupEvent ev, std::atomic<bool>& running) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        queue_.push_back(std::move(ev));
        running.store(false);
    }
    cv_.notify_one();
}

bool EventChannel::try_pop(BackupEvent& out) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (queue_.empty())
        return false;
    out = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

BackupHost::BackupHost(RunFn run) : run_(std::move(run)) {}

BackupHost::BackupHost(CommandRunner& runner, TransferBackend& transfer,
                       DirectoryOptions directory)
    : run_([&runner, &transfer, directory](const std::filesystem::path& dest, BackupSinks sinks) {
          SyncEngine engine(runner, transfer, directory, std::move(sinks));
          return engine.run(dest);
      }) {}

BackupHost::~BackupHost() { wait(); }

bool BackupHost::start(const std::filesystem::path& destination) {
    if (running_.exchange(true))
        return false;
    // The previous worker has already sent Finished; reap it before reuse.
    if (thread_.joinable())
        thread_.join();
    thread_ = std::thread(&BackupHost::worker, this, destination);
    return true;
}

void BackupHost::wait() {
    if (thread_.joinable())
        thread_.join();
}

void BackupHost::worker(std::filesystem::path destination) {
    BackupSinks sinks;
    sinks.log = [this](const std::string& line) {
        BackupEvent ev;
        ev.kind = BackupEvent::Kind::Log;
        ev.message = line;
        channel_.push(std::move(ev));
    };
    sinks.progress = [this](int pct) {
        BackupEvent ev;
        ev.kind = BackupEvent::Kind::Progress;
        ev.percent = pct;
        channel_.push(std::move(ev));
    };

    BackupEvent done;
    done.kind = BackupEvent::Kind::Finished;
    try {
        done.summary = run_(destination, sinks);
    } catch (const std::exception& e) {
        abort_run(sinks, e.what(), done.summary);
    } catch (...) {
        abort_run(sinks, "unknown error", done.summary);
    }
    channel_.push_final(std::move(done), running_);
}

void BackupHost::abort_run(const BackupSinks& sinks, const std::string& reason,
                           BackupSummary& summary) {
    sinks.log("Backup aborted: " + reason);
    if (logger_initialized())
        log_error("Backup aborted", {{"error", reason}});
    sinks.progress(COMPLETE_PERCENT);
    summary.aborted = true;
}

} // namespace ghbackup
