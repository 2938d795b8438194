#ifndef PROCESS_UTILS_HPP
#define PROCESS_UTILS_HPP
#include <filesystem>
#include <string>
#include <vector>

namespace procutil {

/**
 * @brief Captured result of a child process.
 */
struct CommandResult {
    int exit_code = -1;     ///< Exit status, or -1 if the process could not run
    std::string stdout_text;
    std::string stderr_text;

    bool succeeded() const { return exit_code == 0; }
};

/**
 * @brief Run @p args[0] with the remaining arguments, without a shell.
 *
 * Standard output and standard error are captured separately. The call blocks
 * until the child exits; there is no timeout.
 *
 * @param args        Program followed by its arguments. Must not be empty.
 * @param working_dir Directory the child starts in; empty keeps the current one.
 */
CommandResult run_command(const std::vector<std::string>& args,
                          const std::filesystem::path& working_dir = {});

} // namespace procutil

#endif // PROCESS_UTILS_HPP
