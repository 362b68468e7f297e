#include "repo_resolver.hpp"

#include <set>

namespace ghbackup {

namespace {
constexpr const char kGitSuffix[] = ".git";
constexpr size_t kGitSuffixLen = sizeof(kGitSuffix) - 1;
} // namespace

std::string local_name_for(const std::string& url) {
    size_t slash = url.rfind('/');
    std::string name = slash == std::string::npos ? url : url.substr(slash + 1);
    if (name.size() >= kGitSuffixLen &&
        name.compare(name.size() - kGitSuffixLen, kGitSuffixLen, kGitSuffix) == 0)
        name.erase(name.size() - kGitSuffixLen);
    return name;
}

ResolvedRepository resolve(const RepositoryDescriptor& descriptor,
                           const std::filesystem::path& destination) {
    ResolvedRepository r;
    r.url = descriptor.url;
    r.local_name = local_name_for(descriptor.url);
    r.local_path = destination / r.local_name;
    return r;
}

std::vector<std::optional<RejectReason>>
check_names(const std::vector<ResolvedRepository>& repos) {
    std::vector<std::optional<RejectReason>> verdicts;
    verdicts.reserve(repos.size());
    std::set<std::string> claimed;
    for (const auto& r : repos) {
        if (r.local_name.empty() || r.local_name == "." || r.local_name == "..")
            verdicts.emplace_back(RejectReason::InvalidName);
        else if (!claimed.insert(r.local_name).second)
            verdicts.emplace_back(RejectReason::Collision);
        else
            verdicts.emplace_back(std::nullopt);
    }
    return verdicts;
}

const char* reject_reason_text(RejectReason reason) {
    switch (reason) {
    case RejectReason::InvalidName:
        return "no usable repository name in URL";
    case RejectReason::Collision:
        return "local name already used by another repository";
    }
    return "rejected";
}

} // namespace ghbackup
