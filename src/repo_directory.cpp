#include "repo_directory.hpp"

#include <nlohmann/json.hpp>

#include "logger.hpp"

namespace ghbackup {

std::vector<std::string> listing_command(const DirectoryOptions& opts) {
    std::vector<std::string> argv{opts.program, "repo", "list"};
    if (!opts.owner.empty())
        argv.push_back(opts.owner);
    argv.insert(argv.end(), {"--json", "url", "--limit", std::to_string(opts.limit)});
    return argv;
}

std::optional<std::vector<RepositoryDescriptor>> parse_listing(const std::string& text,
                                                               std::string& error) {
    try {
        nlohmann::json root = nlohmann::json::parse(text);
        if (!root.is_array()) {
            error = "expected a JSON array of repositories";
            return std::nullopt;
        }
        std::vector<RepositoryDescriptor> repos;
        repos.reserve(root.size());
        for (const auto& entry : root)
            repos.push_back({entry.at("url").get<std::string>()});
        return repos;
    } catch (const nlohmann::json::exception& e) {
        error = e.what();
        return std::nullopt;
    }
}

std::vector<RepositoryDescriptor>
RepositoryDirectory::list(const std::function<void(const std::string&)>& log,
                          ProgressReporter& progress, ListingStatus* status) {
    auto emit = [&](const std::string& line) {
        if (log)
            log(line);
    };
    emit("Fetching repositories...");
    progress.report(LISTING_START_PERCENT);

    procutil::CommandResult res = runner_.run(listing_command(opts_), true);
    if (!res.ok()) {
        emit("Error fetching repositories: " + res.err);
        if (logger_initialized())
            log_error("Repository listing failed",
                      {{"exit", std::to_string(res.exit_code)}, {"stderr", res.err}});
        progress.report(COMPLETE_PERCENT);
        if (status)
            *status = ListingStatus::TransportFailure;
        return {};
    }

    std::string error;
    auto repos = parse_listing(res.out, error);
    if (!repos) {
        emit("Failed to parse JSON: " + error);
        if (logger_initialized())
            log_error("Repository listing could not be decoded", {{"error", error}});
        progress.report(COMPLETE_PERCENT);
        if (status)
            *status = ListingStatus::DecodeFailure;
        return {};
    }

    emit("Found " + std::to_string(repos->size()) + " repositories.");
    if (logger_initialized())
        log_info("Repository listing complete", {{"count", std::to_string(repos->size())}});
    progress.report(LISTING_DONE_PERCENT);
    if (status)
        *status = ListingStatus::Ok;
    return std::move(*repos);
}

} // namespace ghbackup
