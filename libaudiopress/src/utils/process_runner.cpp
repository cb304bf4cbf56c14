//
// Created by Giuseppe Francione on 22/10/25.
//

#include "../../include/process_runner.hpp"
#include <array>
#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace audiopress {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

int wait_child(const pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return 127;
        }
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 127;
}

} // namespace

ProcessResult run_process(const std::vector<std::string>& argv, const std::size_t max_diagnostics) {
    if (argv.empty()) {
        throw std::invalid_argument("run_process: empty argument list");
    }

    // everything the child touches is prepared before fork
    std::vector<std::string> args = argv;
    std::vector<char*> c_argv;
    c_argv.reserve(args.size() + 1);
    for (auto& s : args) {
        c_argv.push_back(s.data());
    }
    c_argv.push_back(nullptr);

    const std::string exec_error = "failed to execute " + argv.front() + "\n";

    // O_CLOEXEC keeps pipes of concurrent workers from leaking into each other's children
    int err_pipe[2] = {-1, -1};
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        throw std::runtime_error(std::string("pipe2 failed: ") + std::strerror(errno));
    }
    int dev_null = ::open("/dev/null", O_RDWR | O_CLOEXEC);
    if (dev_null < 0) {
        const std::string reason = std::strerror(errno);
        close_fd(err_pipe[0]);
        close_fd(err_pipe[1]);
        throw std::runtime_error("cannot open /dev/null: " + reason);
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        const std::string reason = std::strerror(errno);
        close_fd(err_pipe[0]);
        close_fd(err_pipe[1]);
        close_fd(dev_null);
        throw std::runtime_error("fork failed: " + reason);
    }

    if (pid == 0) {
        ::dup2(dev_null, STDIN_FILENO);
        ::dup2(dev_null, STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvp(c_argv[0], c_argv.data());
        [[maybe_unused]] auto written = ::write(STDERR_FILENO, exec_error.data(), exec_error.size());
        ::_exit(127);
    }

    close_fd(err_pipe[1]);
    close_fd(dev_null);

    ProcessResult result;
    std::array<char, 4096> buffer{};
    for (;;) {
        const ssize_t n = ::read(err_pipe[0], buffer.data(), buffer.size());
        if (n > 0) {
            result.diagnostics.append(buffer.data(), static_cast<std::size_t>(n));
            if (result.diagnostics.size() > max_diagnostics) {
                result.diagnostics.erase(0, result.diagnostics.size() - max_diagnostics);
            }
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        break;
    }
    close_fd(err_pipe[0]);

    result.exit_code = wait_child(pid);
    return result;
}

} // namespace audiopress
