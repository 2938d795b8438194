#include "process_utils.hpp"

#ifndef _WIN32
#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace procutil {

#ifndef _WIN32
namespace {

struct Pipe {
    int fds[2] = {-1, -1};
    ~Pipe() { close_all(); }
    bool open() { return pipe(fds) == 0; }
    void close_end(int i) {
        if (fds[i] >= 0) {
            ::close(fds[i]);
            fds[i] = -1;
        }
    }
    void close_all() {
        close_end(0);
        close_end(1);
    }
};

} // namespace

CommandResult run_command(const std::vector<std::string>& args,
                          const std::filesystem::path& working_dir) {
    CommandResult result;
    if (args.empty()) {
        result.stderr_text = "empty command";
        return result;
    }
    Pipe out;
    Pipe err;
    if (!out.open() || !err.open()) {
        result.stderr_text = "pipe() failed";
        return result;
    }
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args)
        argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    const std::string dir = working_dir.string();

    pid_t pid = fork();
    if (pid < 0) {
        result.stderr_text = "fork() failed";
        return result;
    }
    if (pid == 0) {
        dup2(out.fds[1], STDOUT_FILENO);
        dup2(err.fds[1], STDERR_FILENO);
        out.close_all();
        err.close_all();
        if (!dir.empty() && chdir(dir.c_str()) != 0)
            _exit(126);
        execvp(argv[0], argv.data());
        _exit(127);
    }
    out.close_end(1);
    err.close_end(1);

    pollfd fds[2] = {{out.fds[0], POLLIN, 0}, {err.fds[0], POLLIN, 0}};
    std::string* sinks[2] = {&result.stdout_text, &result.stderr_text};
    int open_streams = 2;
    char buf[4096];
    while (open_streams > 0) {
        if (poll(fds, 2, -1) < 0) {
            if (errno == EINTR)
                continue;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR)))
                continue;
            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open_streams;
            }
        }
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            return result;
    }
    if (WIFEXITED(status))
        result.exit_code = WEXITSTATUS(status);
    if (result.exit_code == 127 && result.stderr_text.empty())
        result.stderr_text = args[0] + ": command not found";
    return result;
}
#else
CommandResult run_command(const std::vector<std::string>& args, const std::filesystem::path&) {
    CommandResult result;
    result.stderr_text = args.empty() ? "empty command" : args[0] + ": not supported on Windows";
    return result;
}
#endif

} // namespace procutil
