#include "cli_commands.hpp"

#include <iomanip>
#include <memory>
#include <ostream>

#include "backup_host.hpp"
#include "logger.hpp"
#include "transfer.hpp"

namespace cli {

void setup_logging(const Options& opts) {
    const LoggingOptions& lo = opts.logging;
    set_json_logging(lo.json_log);
    set_log_compression(lo.compress_logs);
    if (!lo.log_file.empty())
        init_logger(lo.log_file, lo.log_level, lo.max_log_size, lo.max_log_files);
    if (lo.use_syslog)
        init_syslog();
}

int run_backup(const Options& opts, ghbackup::CommandRunner& runner, std::ostream& out) {
    std::unique_ptr<ghbackup::TransferBackend> transfer;
    if (opts.transfer == TransferKind::Libgit2)
        transfer = std::make_unique<ghbackup::LibgitTransfer>();
    else
        transfer = std::make_unique<ghbackup::CommandTransfer>(runner, opts.git_program);

    if (logger_initialized())
        log_info("Starting backup", {{"destination", opts.destination.string()}});

    ghbackup::BackupHost host(runner, *transfer, opts.directory);
    if (!host.start(opts.destination))
        return EXIT_BACKUP_INCOMPLETE;

    ghbackup::BackupEvent ev;
    while (true) {
        host.wait_event(ev);
        if (ev.kind == ghbackup::BackupEvent::Kind::Log) {
            out << ev.message << "\n";
        } else if (ev.kind == ghbackup::BackupEvent::Kind::Progress) {
            if (!opts.quiet)
                out << "[" << std::setw(3) << ev.percent << "%]\n";
        } else {
            break;
        }
        out.flush();
    }
    host.wait();
    return ev.summary.success() ? 0 : EXIT_BACKUP_INCOMPLETE;
}

} // namespace cli
