#ifndef SYSTEM_UTILS_HPP
#define SYSTEM_UTILS_HPP
#include <string>
#include <vector>
#include <unistd.h>

namespace procutil {

/**
 * @brief RAII wrapper for POSIX file descriptors.
 *
 * Closes the descriptor when the object goes out of scope. Used for the pipe
 * ends handed to and read from child processes.
 */
class UniqueFd {
  public:
    UniqueFd() noexcept : fd(-1) {}
    explicit UniqueFd(int f) noexcept : fd(f) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd(other.fd) { other.fd = -1; }

    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd = other.fd;
            other.fd = -1;
        }
        return *this;
    }

    int get() const noexcept { return fd; }
    explicit operator bool() const noexcept { return fd >= 0; }

    int release() noexcept {
        int tmp = fd;
        fd = -1;
        return tmp;
    }

    void reset(int f = -1) noexcept {
        if (fd >= 0)
            close(fd);
        fd = f;
    }

  private:
    int fd;
};

/**
 * @brief Outcome of an external command.
 */
struct CommandResult {
    int exit_code = -1; ///< Exit status, 127 when launch failed, 128+N on signal N
    std::string out;    ///< Captured standard output (empty when not captured)
    std::string err;    ///< Captured standard error (empty when not captured)

    bool ok() const { return exit_code == 0; }
};

/** Exit code reported when the executable could not be started. */
constexpr int COMMAND_NOT_STARTED = 127;

/**
 * @brief Run an external command and wait for it to exit.
 *
 * The executable in @p argv[0] is resolved through `PATH`. When @p capture is
 * set, stdout and stderr are collected into the result; otherwise the child
 * inherits the parent's streams.
 *
 * @param argv    Program name followed by its arguments. Must not be empty.
 * @param capture Whether to capture both output streams.
 * @return Exit status and captured output.
 */
CommandResult run_command(const std::vector<std::string>& argv, bool capture = true);

/**
 * @brief Join arguments into a single printable command line.
 */
std::string format_command(const std::vector<std::string>& argv);

} // namespace procutil

#endif // SYSTEM_UTILS_HPP
