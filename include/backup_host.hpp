#ifndef BACKUP_HOST_HPP
#define BACKUP_HOST_HPP
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "backup_sinks.hpp"
#include "sync_engine.hpp"

namespace ghbackup {

/**
 * @brief One message relayed from the worker to the caller.
 */
struct BackupEvent {
    enum class Kind { Log, Progress, Finished };
    Kind kind = Kind::Log;
    std::string message;   ///< Set for Kind::Log
    int percent = 0;       ///< Set for Kind::Progress
    BackupSummary summary; ///< Set for Kind::Finished
};

/**
 * @brief FIFO handing events from one producer thread to one consumer.
 */
class EventChannel {
  public:
    void push(BackupEvent ev);

    /** Block until an event is available and pop it into @p out. */
    void wait(BackupEvent& out);

    /**
     * @brief Wait at most @p timeout for an event.
     * @return `false` when nothing arrived in time.
     */
    bool wait_for(BackupEvent& out, std::chrono::milliseconds timeout);

    /**
     * @brief Queue the last event of a run and clear @p running in one step.
     *
     * A consumer that reads `running == false` and then pops finds @p ev
     * already queued.
     */
    void push_final(BackupEvent ev, std::atomic<bool>& running);

    /** Pop an event if one is queued; never blocks. */
    bool try_pop(BackupEvent& out);

  private:
    std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<BackupEvent> queue_;
};

/**
 * @brief Runs a backup on a worker thread and relays its events.
 *
 * The caller drains events from its own thread with @ref wait_event or
 * @ref poll_event; they arrive in the order the run emitted them and every
 * run ends with exactly one Kind::Finished event.
 */
class BackupHost {
  public:
    using RunFn = std::function<BackupSummary(const std::filesystem::path&, BackupSinks)>;

    /** Host a custom run function. */
    explicit BackupHost(RunFn run);

    /** Host a @ref SyncEngine built from the given collaborators. */
    BackupHost(CommandRunner& runner, TransferBackend& transfer, DirectoryOptions directory);

    ~BackupHost();
    BackupHost(const BackupHost&) = delete;
    BackupHost& operator=(const BackupHost&) = delete;

    /**
     * @brief Start a run on a new worker thread.
     *
     * @return `false` if a run is already in progress.
     */
    bool start(const std::filesystem::path& destination);

    /**
     * @return `true` until the Finished event is queued. Once it reads
     *         `false`, @ref poll_event is guaranteed to deliver Finished.
     */
    bool running() const { return running_.load(); }

    void wait_event(BackupEvent& out) { channel_.wait(out); }
    bool wait_event_for(BackupEvent& out, std::chrono::milliseconds timeout) {
        return channel_.wait_for(out, timeout);
    }
    bool poll_event(BackupEvent& out) { return channel_.try_pop(out); }

    /** Join the worker thread of the last run. */
    void wait();

  private:
    void worker(std::filesystem::path destination);
    static void abort_run(const BackupSinks& sinks, const std::string& reason,
                          BackupSummary& summary);

    RunFn run_;
    EventChannel channel_;
    std::atomic<bool> running_{false};
    std::thread thread_;
};

} // namespace ghbackup

#endif // BACKUP_HOST_HPP
