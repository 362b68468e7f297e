#include "transfer.hpp"

#include "git_utils.hpp"

namespace ghbackup {

namespace {

// Last non-empty line of a command's stderr; git prints the reason there.
std::string last_line(const std::string& text) {
    size_t end = text.find_last_not_of(" \t\r\n");
    if (end == std::string::npos)
        return "";
    size_t start = text.rfind('\n', end);
    start = start == std::string::npos ? 0 : start + 1;
    return text.substr(start, end - start + 1);
}

} // namespace

TransferResult CommandTransfer::run(const std::vector<std::string>& argv) {
    procutil::CommandResult res = runner_.run(argv, true);
    TransferResult out;
    out.ok = res.ok();
    out.exit_code = res.exit_code;
    if (!out.ok) {
        out.detail = last_line(res.err);
        if (out.detail.empty())
            out.detail = "exit code " + std::to_string(res.exit_code);
    }
    return out;
}

TransferResult CommandTransfer::clone(const std::string& url, const std::filesystem::path& path) {
    return run({git_, "clone", url, path.string()});
}

TransferResult CommandTransfer::update(const std::filesystem::path& path) {
    return run({git_, "-C", path.string(), "pull"});
}

TransferResult LibgitTransfer::clone(const std::string& url, const std::filesystem::path& path) {
    git::GitInitGuard guard;
    TransferResult out;
    out.ok = git::clone_repo(path, url, &out.detail);
    return out;
}

TransferResult LibgitTransfer::update(const std::filesystem::path& path) {
    git::GitInitGuard guard;
    TransferResult out;
    git::PullResult res = git::fast_forward_pull(path, "origin", out.detail);
    out.ok = res == git::PullResult::UpToDate || res == git::PullResult::FastForwarded;
    return out;
}

} // namespace ghbackup
