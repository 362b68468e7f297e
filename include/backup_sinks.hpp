#ifndef BACKUP_SINKS_HPP
#define BACKUP_SINKS_HPP
#include <functional>
#include <string>

namespace ghbackup {

/**
 * @brief Front-end callbacks receiving the events of a backup run.
 *
 * Both callbacks are invoked on the thread executing the run, in emission
 * order. Either may be empty.
 */
struct BackupSinks {
    std::function<void(const std::string&)> log; ///< Human readable log line
    std::function<void(int)> progress;           ///< Percentage in [0,100]
};

} // namespace ghbackup

#endif // BACKUP_SINKS_HPP
