/**
 * @file stalebranch.cpp
 * @brief CLI entry point for the stale branch cleanup.
 *
 * Parses options, sets up logging and hands the repository to the cleanup
 * pipeline in cli_commands.cpp.
 */

#include <iostream>
#include <stdexcept>

#include "cli_commands.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "vcs_backend.hpp"
#include "version.hpp"

/**
 * @brief Application entry point.
 *
 * @return 0 after a live run or when printing help/version, 1 after a dry
 *         run, 2 on setup errors and 3 when a requested output file could not
 *         be written.
 */
#ifndef STALEBRANCH_NO_MAIN
int main(int argc, char* argv[]) {
    try {
        Options opts = parse_options(argc, argv);
        if (opts.show_help) {
            print_help(argv[0]);
            return cli::EXIT_LIVE_RUN;
        }
        if (opts.print_version) {
            std::cout << STALEBRANCH_VERSION << "\n";
            return cli::EXIT_LIVE_RUN;
        }
        cli::configure_logging(opts.logging);
        int rc = cli::handle_cleanup_run(opts);
        shutdown_logger();
        return rc;
    } catch (const vcs::SetupError& e) {
        log_error("Setup failed", {{"error", e.what()}});
        shutdown_logger();
        std::cerr << "Error: " << e.what() << "\n";
        return cli::EXIT_SETUP_ERROR;
    } catch (const std::exception& e) {
        shutdown_logger();
        std::cerr << "Error: " << e.what() << "\n";
        return cli::EXIT_SETUP_ERROR;
    }
}
#endif // STALEBRANCH_NO_MAIN
