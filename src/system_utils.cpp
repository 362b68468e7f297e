#include "system_utils.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>

namespace procutil {

namespace {

bool make_pipe(UniqueFd& read_end, UniqueFd& write_end) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0)
        return false;
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
    return true;
}

// Drain both pipes until the child closes them. Reading them one after the
// other could block forever once the unread pipe fills up.
void drain_pipes(UniqueFd& out_fd, UniqueFd& err_fd, std::string& out, std::string& err) {
    char buf[4096];
    while (out_fd || err_fd) {
        pollfd fds[2];
        nfds_t n = 0;
        std::string* targets[2];
        UniqueFd* owners[2];
        if (out_fd) {
            fds[n] = {out_fd.get(), POLLIN, 0};
            targets[n] = &out;
            owners[n++] = &out_fd;
        }
        if (err_fd) {
            fds[n] = {err_fd.get(), POLLIN, 0};
            targets[n] = &err;
            owners[n++] = &err_fd;
        }
        if (poll(fds, n, -1) < 0) {
            if (errno == EINTR)
                continue;
            break;
        }
        for (nfds_t i = 0; i < n; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR)))
                continue;
            ssize_t got = read(fds[i].fd, buf, sizeof(buf));
            if (got > 0)
                targets[i]->append(buf, static_cast<size_t>(got));
            else if (got == 0 || errno != EINTR)
                owners[i]->reset();
        }
    }
}

int wait_child(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            return -1;
    }
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

CommandResult run_command(const std::vector<std::string>& argv, bool capture) {
    CommandResult result;
    if (argv.empty()) {
        result.exit_code = COMMAND_NOT_STARTED;
        result.err = "empty command";
        return result;
    }

    UniqueFd out_read, out_write, err_read, err_write;
    // Reports execvp failure from the child; closed by exec on success.
    UniqueFd status_read, status_write;
    if ((capture && (!make_pipe(out_read, out_write) || !make_pipe(err_read, err_write))) ||
        !make_pipe(status_read, status_write)) {
        result.exit_code = COMMAND_NOT_STARTED;
        result.err = std::string("failed to create pipe: ") + std::strerror(errno);
        return result;
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv)
        args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.exit_code = COMMAND_NOT_STARTED;
        result.err = std::string("fork failed: ") + std::strerror(errno);
        return result;
    }
    if (pid == 0) {
        if (capture) {
            dup2(out_write.get(), STDOUT_FILENO);
            dup2(err_write.get(), STDERR_FILENO);
        }
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0)
            dup2(devnull, STDIN_FILENO);
        signal(SIGPIPE, SIG_DFL);
        execvp(args[0], args.data());
        int code = errno;
        ssize_t ignored = write(status_write.get(), &code, sizeof(code));
        (void)ignored;
        _exit(COMMAND_NOT_STARTED);
    }

    out_write.reset();
    err_write.reset();
    status_write.reset();

    if (capture)
        drain_pipes(out_read, err_read, result.out, result.err);

    int exec_errno = 0;
    ssize_t got;
    do {
        got = read(status_read.get(), &exec_errno, sizeof(exec_errno));
    } while (got < 0 && errno == EINTR);

    result.exit_code = wait_child(pid);
    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        result.exit_code = COMMAND_NOT_STARTED;
        result.err = "failed to launch " + argv.front() + ": " + std::strerror(exec_errno);
    }
    return result;
}

std::string format_command(const std::vector<std::string>& argv) {
    std::string line;
    for (const auto& a : argv) {
        if (!line.empty())
            line += ' ';
        if (a.find_first_of(" \t\"'") != std::string::npos)
            line += "'" + a + "'";
        else
            line += a;
    }
    return line;
}

} // namespace procutil
