#ifndef _WIN32

#include "process.hpp"

#include <array>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace buckle {

namespace {

constexpr int CHILD_ERROR_EXIT = 127;
constexpr int SIGNAL_EXIT_BASE = 128;

// Closes the descriptor on scope exit
class FdGuard {
public:
    explicit FdGuard(int fd = -1) : fd_(fd) {}
    ~FdGuard() { reset(); }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }

    void reset(int fd = -1) {
        if (fd_ != -1) {
            while (::close(fd_) == -1 && errno == EINTR) {}
        }
        fd_ = fd;
    }

private:
    int fd_;
};

std::string errno_message(const char* what) {
    return std::string(what) + ": " + strerror(errno);
}

bool make_pipe(FdGuard& read_end, FdGuard& write_end) {
    int fds[2];
    if (::pipe(fds) != 0) return false;
    // Keep the parent's ends out of unrelated children
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
    return true;
}

// Drain both pipes until the child closes them
bool drain(FdGuard& out_fd, FdGuard& err_fd, ScriptResult& result, std::string& error) {
    std::array<pollfd, 2> fds{};
    fds[0].fd = out_fd.get();
    fds[0].events = POLLIN;
    fds[1].fd = err_fd.get();
    fds[1].events = POLLIN;

    std::array<std::string*, 2> sinks = {&result.stdout_text, &result.stderr_text};
    std::array<char, 4096> chunk{};
    int open_count = 2;

    while (open_count > 0) {
        int ready = ::poll(fds.data(), fds.size(), -1);
        if (ready == -1) {
            if (errno == EINTR) continue;
            error = errno_message("poll failed");
            return false;
        }

        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd == -1 || fds[i].revents == 0) continue;

            ssize_t n = ::read(fds[i].fd, chunk.data(), chunk.size());
            if (n == -1) {
                if (errno == EINTR) continue;
                error = errno_message("read failed");
                return false;
            }
            if (n == 0) {
                fds[i].fd = -1;
                --open_count;
                continue;
            }
            sinks[i]->append(chunk.data(), static_cast<size_t>(n));
        }
    }

    return true;
}

} // namespace

Result<ScriptResult> spawn_and_capture(const std::vector<std::string>& argv,
                                       const std::unordered_map<std::string, std::string>& env,
                                       const std::string& cwd) {
    ScriptResult result;

    if (argv.empty()) {
        return Result<ScriptResult>::err(Error(ErrorCode::EXECUTION_ERROR, "empty command line"));
    }

    std::vector<std::string> env_strings;
    env_strings.reserve(env.size());
    for (const auto& [key, value] : env) {
        env_strings.push_back(key + "=" + value);
    }

    std::vector<char*> c_argv;
    for (const auto& s : argv) {
        c_argv.push_back(const_cast<char*>(s.c_str()));
    }
    c_argv.push_back(nullptr);

    std::vector<char*> c_envp;
    for (const auto& s : env_strings) {
        c_envp.push_back(const_cast<char*>(s.c_str()));
    }
    c_envp.push_back(nullptr);

    FdGuard out_read, out_write, err_read, err_write;
    if (!make_pipe(out_read, out_write) || !make_pipe(err_read, err_write)) {
        return Result<ScriptResult>::err(
            Error(ErrorCode::EXECUTION_ERROR, errno_message("pipe failed")));
    }

    pid_t pid = ::fork();
    if (pid == -1) {
        return Result<ScriptResult>::err(
            Error(ErrorCode::EXECUTION_ERROR, errno_message("fork failed")));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        ::signal(SIGPIPE, SIG_DFL);
        if (::dup2(out_write.get(), STDOUT_FILENO) == -1 ||
            ::dup2(err_write.get(), STDERR_FILENO) == -1) {
            _exit(CHILD_ERROR_EXIT);
        }

        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull != -1) {
            ::dup2(devnull, STDIN_FILENO);
        }

        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            _exit(CHILD_ERROR_EXIT);
        }

        ::execve(c_argv[0], c_argv.data(), c_envp.data());
        _exit(CHILD_ERROR_EXIT);
    }

    // Parent: close the write ends so EOF arrives when the child exits
    out_write.reset();
    err_write.reset();

    std::string drain_error;
    bool drained = drain(out_read, err_read, result, drain_error);

    int status = 0;
    while (::waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            return Result<ScriptResult>::err(
                Error(ErrorCode::EXECUTION_ERROR, errno_message("waitpid failed")));
        }
    }

    if (!drained) {
        return Result<ScriptResult>::err(Error(ErrorCode::EXECUTION_ERROR, drain_error));
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = SIGNAL_EXIT_BASE + WTERMSIG(status);
    } else {
        return Result<ScriptResult>::err(
            Error(ErrorCode::EXECUTION_ERROR, "process terminated abnormally"));
    }

    return Result<ScriptResult>::ok(std::move(result));
}

} // namespace buckle

#endif // !_WIN32
