#pragma once

#include <ctime>
#include <ostream>

#include "options.hpp"
#include "vcs_backend.hpp"

namespace cli {

/// Process exit codes.
enum ExitCode : int {
    EXIT_LIVE_RUN = 0,      ///< Live run finished (even with nothing to delete)
    EXIT_DRY_RUN = 1,       ///< Dry run finished
    EXIT_SETUP_ERROR = 2,   ///< Bad arguments, config or repository
    EXIT_WRITE_FAILED = 3   ///< Live run finished but a requested file was not written
};

/**
 * @brief Apply the logging options: file sink, level, format, rotation and
 *        syslog mirroring.
 */
void configure_logging(const LoggingOptions& logging);

/**
 * @brief Run one scan, classification and cleanup pass against @p backend.
 *
 * Progress lines go to @p out unless `opts.silent` is set; the rendered
 * report is always written to @p out. Warnings and file write errors go to
 * @p err.
 *
 * @param now Scan time used for branch ages and the report timestamp.
 * @throws vcs::SetupError when `--require-clean` is set and the worktree is
 *         dirty or its status cannot be read.
 * @return One of the ExitCode values.
 */
int run_cleanup_command(const Options& opts, vcs::VcsBackend& backend, std::time_t now,
                        std::ostream& out, std::ostream& err);

/**
 * @brief Open the repository named in @p opts and run the cleanup.
 *
 * @throws vcs::SetupError if the repository cannot be opened.
 */
int handle_cleanup_run(const Options& opts);

} // namespace cli
