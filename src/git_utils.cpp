#include "git_utils.hpp"
#include <cstdlib>
#include <string>

using namespace std;

namespace git {

/**
 * @brief libgit2 credential callback.
 *
 * Tries the SSH agent first, then `GIT_USERNAME`/`GIT_PASSWORD` from the
 * environment, then the default credential helper.
 */
static int credential_cb(git_credential** out, const char* /*url*/,
                         const char* username_from_url, unsigned int allowed_types,
                         void* /*payload*/) {
    const char* env_user = std::getenv("GIT_USERNAME");
    const char* env_pass = std::getenv("GIT_PASSWORD");
    const char* user = username_from_url ? username_from_url : env_user;
    if ((allowed_types & GIT_CREDENTIAL_SSH_KEY) && user) {
        if (git_credential_ssh_key_from_agent(out, user) == 0)
            return 0;
    }
    if ((allowed_types & GIT_CREDENTIAL_USERPASS_PLAINTEXT) && env_user && env_pass)
        return git_credential_userpass_plaintext_new(out, env_user, env_pass);
    if ((allowed_types & GIT_CREDENTIAL_USERNAME) && user)
        return git_credential_username_new(out, user);
    return git_credential_default_new(out);
}

GitInitGuard::GitInitGuard() { git_libgit2_init(); }

GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

bool is_git_repo(const fs::path& p) {
    std::error_code ec;
    return fs::is_directory(p / ".git", ec);
}

static string oid_to_hex(const git_oid& oid) {
    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), &oid);
    return string(buf);
}

static string last_error(const char* fallback) {
    const git_error* e = git_error_last();
    if (e && e->message)
        return e->message;
    return fallback;
}

static void set_error(std::string* error) {
    if (error)
        *error = last_error("Unknown libgit2 error");
}

optional<string> get_local_hash(const fs::path& repo, string* error) {
    git_repository* raw = nullptr;
    if (git_repository_open(&raw, repo.string().c_str()) != 0) {
        set_error(error);
        return nullopt;
    }
    repo_ptr r(raw);
    git_oid oid;
    if (git_reference_name_to_id(&oid, r.get(), "HEAD") != 0) {
        set_error(error);
        return nullopt;
    }
    return oid_to_hex(oid);
}

optional<string> get_current_branch(const fs::path& repo, string* error) {
    git_repository* raw = nullptr;
    if (git_repository_open(&raw, repo.string().c_str()) != 0) {
        set_error(error);
        return nullopt;
    }
    repo_ptr r(raw);
    git_reference* head = nullptr;
    if (git_repository_head(&head, r.get()) != 0) {
        set_error(error);
        return nullopt;
    }
    reference_ptr ref(head);
    const char* name = git_reference_shorthand(ref.get());
    string branch = name ? name : "";
    if (branch.empty()) {
        set_error(error);
        return nullopt;
    }
    return branch;
}

bool has_uncommitted_changes(const fs::path& repo) {
    git_repository* raw_repo = nullptr;
    if (git_repository_open(&raw_repo, repo.string().c_str()) != 0)
        return false;
    repo_ptr r(raw_repo);
    git_status_options opts = GIT_STATUS_OPTIONS_INIT;
    opts.show = GIT_STATUS_SHOW_INDEX_AND_WORKDIR;
    opts.flags = GIT_STATUS_OPT_INCLUDE_UNTRACKED | GIT_STATUS_OPT_RENAMES_HEAD_TO_INDEX;
    git_status_list* raw_list = nullptr;
    if (git_status_list_new(&raw_list, r.get(), &opts) != 0)
        return false;
    status_list_ptr list(raw_list);
    return git_status_list_entrycount(list.get()) > 0;
}

bool clone_repo(const fs::path& dest, const std::string& url, std::string* error) {
    git_clone_options opts = GIT_CLONE_OPTIONS_INIT;
    opts.fetch_opts.callbacks.credentials = credential_cb;
    git_repository* raw_repo = nullptr;
    if (git_clone(&raw_repo, url.c_str(), dest.string().c_str(), &opts) != 0) {
        set_error(error);
        return false;
    }
    repo_ptr repo(raw_repo);
    return true;
}

PullResult fast_forward_pull(const fs::path& repo, const string& remote_name, string& out_log) {
    git_repository* raw_repo = nullptr;
    if (git_repository_open(&raw_repo, repo.string().c_str()) != 0) {
        out_log = last_error("Failed to open repository");
        return PullResult::Failed;
    }
    repo_ptr r(raw_repo);

    git_reference* raw_head = nullptr;
    if (git_repository_head(&raw_head, r.get()) != 0) {
        out_log = last_error("Local HEAD not found");
        return PullResult::Failed;
    }
    reference_ptr head(raw_head);
    if (!git_reference_is_branch(head.get())) {
        out_log = "HEAD is detached";
        return PullResult::Failed;
    }
    const string branch = git_reference_shorthand(head.get());

    git_remote* raw_remote = nullptr;
    if (git_remote_lookup(&raw_remote, r.get(), remote_name.c_str()) != 0) {
        out_log = "No " + remote_name + " remote";
        return PullResult::Failed;
    }
    remote_ptr remote(raw_remote);
    git_fetch_options fetch_opts = GIT_FETCH_OPTIONS_INIT;
    fetch_opts.callbacks.credentials = credential_cb;
    if (git_remote_fetch(remote.get(), nullptr, &fetch_opts, nullptr) != 0) {
        out_log = last_error("Fetch failed");
        return PullResult::Failed;
    }

    git_oid remote_oid;
    string refname = "refs/remotes/" + remote_name + "/" + branch;
    if (git_reference_name_to_id(&remote_oid, r.get(), refname.c_str()) != 0) {
        out_log = "Remote branch " + remote_name + "/" + branch + " not found";
        return PullResult::Failed;
    }
    const git_oid* local_oid = git_reference_target(head.get());
    if (!local_oid) {
        out_log = "Local HEAD not found";
        return PullResult::Failed;
    }
    if (git_oid_equal(local_oid, &remote_oid)) {
        out_log = "Already up to date";
        return PullResult::UpToDate;
    }
    if (git_graph_descendant_of(r.get(), &remote_oid, local_oid) != 1) {
        out_log = "Local branch " + branch + " has diverged from " + remote_name;
        return PullResult::Diverged;
    }
    if (has_uncommitted_changes(repo)) {
        out_log = "Local changes present";
        return PullResult::LocalChanges;
    }

    git_object* raw_target = nullptr;
    if (git_object_lookup(&raw_target, r.get(), &remote_oid, GIT_OBJECT_COMMIT) != 0) {
        out_log = last_error("Lookup failed");
        return PullResult::Failed;
    }
    object_ptr target(raw_target);
    git_checkout_options checkout_opts = GIT_CHECKOUT_OPTIONS_INIT;
    checkout_opts.checkout_strategy = GIT_CHECKOUT_SAFE;
    if (git_checkout_tree(r.get(), target.get(), &checkout_opts) != 0) {
        out_log = last_error("Checkout failed");
        return PullResult::Failed;
    }
    git_reference* raw_moved = nullptr;
    if (git_reference_set_target(&raw_moved, head.get(), &remote_oid, "ghbackup: fast-forward") !=
        0) {
        out_log = last_error("Failed to move branch");
        return PullResult::Failed;
    }
    reference_ptr moved(raw_moved);
    out_log = "Fast-forwarded to " + oid_to_hex(remote_oid).substr(0, 7);
    return PullResult::FastForwarded;
}

} // namespace git
