#include "sync_engine.hpp"

#include <chrono>
#include <system_error>
#include <utility>
#include <vector>

#include "logger.hpp"
#include "repo_resolver.hpp"
#include "time_utils.hpp"

namespace fs = std::filesystem;

namespace ghbackup {

SyncEngine::SyncEngine(CommandRunner& runner, TransferBackend& transfer,
                       DirectoryOptions directory, BackupSinks sinks)
    : runner_(runner), transfer_(transfer), directory_(std::move(directory)),
      sinks_(std::move(sinks)) {}

void SyncEngine::emit(const std::string& line) {
    if (sinks_.log)
        sinks_.log(line);
}

BackupSummary SyncEngine::run(const fs::path& destination) {
    auto started = std::chrono::steady_clock::now();
    BackupSummary summary;
    ProgressReporter progress(sinks_.progress);

    std::error_code ec;
    fs::create_directories(destination, ec);
    if (ec || !fs::is_directory(destination)) {
        std::string reason = ec ? ec.message() : "not a directory";
        emit("Failed to create destination " + destination.string() + ": " + reason);
        if (logger_initialized())
            log_error("Destination unavailable",
                      {{"path", destination.string()}, {"error", reason}});
        summary.destination_failed = true;
        progress.report(COMPLETE_PERCENT);
        return summary;
    }

    RepositoryDirectory directory(runner_, directory_);
    ListingStatus status = ListingStatus::Ok;
    std::vector<RepositoryDescriptor> listed = directory.list(sinks_.log, progress, &status);
    summary.listed = listed.size();
    summary.listing_failed = status != ListingStatus::Ok;
    if (listed.empty()) {
        emit("No repositories found.");
        // A failed listing has already reported completion.
        if (progress.last() < COMPLETE_PERCENT)
            progress.report(COMPLETE_PERCENT);
        return summary;
    }

    std::vector<ResolvedRepository> resolved;
    resolved.reserve(listed.size());
    for (const auto& d : listed)
        resolved.push_back(resolve(d, destination));
    const auto verdicts = check_names(resolved);

    const size_t total = resolved.size();
    for (size_t i = 0; i < total; ++i) {
        const ResolvedRepository& repo = resolved[i];
        if (verdicts[i]) {
            // Skipped entries still count as finished steps so the bar reaches 100.
            const char* why = reject_reason_text(*verdicts[i]);
            emit("Skipping " + repo.url + ": " + why);
            if (logger_initialized())
                log_warning("Repository skipped", {{"url", repo.url}, {"reason", why}});
            ++summary.skipped;
            progress.report(percent_for(i + 1, total));
            continue;
        }

        const RepoAction action = fs::exists(repo.local_path, ec) ? RepoAction::Update
                                                                  : RepoAction::Clone;
        TransferResult res;
        if (action == RepoAction::Update) {
            emit("Updating " + repo.local_name + "...");
            res = transfer_.update(repo.local_path);
        } else {
            emit("Cloning " + repo.local_name + "...");
            res = transfer_.clone(repo.url, repo.local_path);
        }

        const char* verb = action == RepoAction::Update ? "update" : "clone";
        if (res.ok) {
            if (action == RepoAction::Update)
                ++summary.updated;
            else
                ++summary.cloned;
            if (logger_initialized())
                log_info(repo.local_name + " " + verb + " ok",
                         {{"path", repo.local_path.string()}});
        } else {
            ++summary.failed;
            emit(std::string("Failed to ") + verb + " " + repo.local_name + ": " + res.detail);
            if (logger_initialized())
                log_error(repo.local_name + " " + verb + " failed",
                          {{"exit", std::to_string(res.exit_code)}, {"detail", res.detail}});
        }
        progress.report(percent_for(i + 1, total));
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started);
    emit("Backup completed.");
    emit(std::to_string(summary.cloned) + " cloned, " + std::to_string(summary.updated) +
         " updated, " + std::to_string(summary.failed) + " failed, " +
         std::to_string(summary.skipped) + " skipped in " + format_duration_short(elapsed));
    if (logger_initialized())
        log_info("Backup completed", {{"cloned", std::to_string(summary.cloned)},
                                      {"updated", std::to_string(summary.updated)},
                                      {"failed", std::to_string(summary.failed)},
                                      {"skipped", std::to_string(summary.skipped)}});
    progress.report(COMPLETE_PERCENT);
    return summary;
}

} // namespace ghbackup
