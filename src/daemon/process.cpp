#include "process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

std::string errno_message(const char* what) {
    return std::string(what) + " failed: " + std::strerror(errno);
}

// Runs in the forked child: undo the daemon's signal setup so the tool
// behaves as if started from a shell.
void reset_child_signals() {
    sigset_t empty;
    sigemptyset(&empty);
    sigprocmask(SIG_SETMASK, &empty, nullptr);
    signal(SIGPIPE, SIG_DFL);
}

} // namespace

std::expected<void, ProcessError> run_process(const std::vector<std::string>& argv,
                                              std::optional<std::string_view> input) {
    if (argv.empty()) {
        return std::unexpected(ProcessError{"empty command line"});
    }

    // Built before fork(): only async-signal-safe calls are allowed in the child.
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    int pipefd[2] = {-1, -1};
    if (input && ::pipe2(pipefd, O_CLOEXEC) < 0) {
        return std::unexpected(ProcessError{errno_message("pipe2()")});
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        auto msg = errno_message("fork()");
        if (input) {
            ::close(pipefd[0]);
            ::close(pipefd[1]);
        }
        return std::unexpected(ProcessError{msg});
    }

    if (pid == 0) {
        reset_child_signals();
        if (input) {
            ::dup2(pipefd[0], STDIN_FILENO);
        }
        ::execvp(args[0], args.data());
        ::_exit(kExecFailedStatus);
    }

    std::string write_error;
    if (input) {
        ::close(pipefd[0]);
        size_t total = 0;
        while (total < input->size()) {
            ssize_t n = ::write(pipefd[1], input->data() + total, input->size() - total);
            if (n < 0) {
                if (errno == EINTR) continue;
                write_error = errno_message("write()");
                break;
            }
            total += static_cast<size_t>(n);
        }
        ::close(pipefd[1]);
    }

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(ProcessError{errno_message("waitpid()")});
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) == kExecFailedStatus) {
        return std::unexpected(ProcessError{argv[0] + ": not found", true});
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        return std::unexpected(ProcessError{
            argv[0] + " exited with code " + std::to_string(WEXITSTATUS(status))});
    }
    if (WIFSIGNALED(status)) {
        return std::unexpected(ProcessError{
            argv[0] + " killed by signal " + std::to_string(WTERMSIG(status))});
    }
    if (!write_error.empty()) {
        return std::unexpected(ProcessError{argv[0] + ": " + write_error});
    }

    return {};
}
