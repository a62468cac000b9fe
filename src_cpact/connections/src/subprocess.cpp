#include "cpact/subprocess.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <thread>

extern char** environ;

namespace {

using Clock = std::chrono::steady_clock;

void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        struct sigaction action {};
        action.sa_handler = SIG_IGN;
        sigemptyset(&action.sa_mask);
        sigaction(SIGPIPE, &action, nullptr);
    });
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void append_limited(std::string& dst, const char* src, ssize_t n, std::size_t limit, bool& truncated) {
    if (n <= 0) {
        return;
    }
    const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
    const std::size_t take = std::min<std::size_t>(static_cast<std::size_t>(n), avail);
    dst.append(src, take);
    if (take < static_cast<std::size_t>(n)) {
        truncated = true;
    }
}

std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string item{*entry};
        const auto eq = item.find('=');
        const auto name = item.substr(0, eq);
        if (overrides.find(name) == overrides.end()) {
            env.push_back(item);
        }
    }
    for (const auto& [name, value] : overrides) {
        env.push_back(name + "=" + value);
    }
    return env;
}

std::vector<char*> to_pointers(std::vector<std::string>& items) {
    std::vector<char*> ptrs;
    ptrs.reserve(items.size() + 1);
    for (auto& item : items) {
        ptrs.push_back(item.data());
    }
    ptrs.push_back(nullptr);
    return ptrs;
}

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

void kill_group(pid_t pid) {
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
}

}  // namespace

namespace cpact {

ProcessResult run_process(const ProcessSpec& spec) {
    ProcessResult result;
    if (spec.argv.empty()) {
        result.error_message = "empty argv";
        return result;
    }
    ignore_sigpipe_once();

    // Everything the child needs is prepared before fork.
    auto args = spec.argv;
    auto argv = to_pointers(args);
    auto env_items = build_environment(spec.env);
    auto envp = to_pointers(env_items);

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    // Close-on-exec so children forked concurrently by other threads never hold these ends.
    if (::pipe2(in_pipe, O_CLOEXEC) != 0 || ::pipe2(out_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(err_pipe, O_CLOEXEC) != 0) {
        result.error_message = std::string{"pipe failed: "} + std::strerror(errno);
        for (int* fd : {&in_pipe[0], &in_pipe[1], &out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1]}) {
            close_fd(*fd);
        }
        return result;
    }

    const auto started = Clock::now();
    const pid_t pid = ::fork();
    if (pid < 0) {
        result.error_message = std::string{"fork failed: "} + std::strerror(errno);
        for (int* fd : {&in_pipe[0], &in_pipe[1], &out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1]}) {
            close_fd(*fd);
        }
        return result;
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::close(in_pipe[0]);
        ::close(in_pipe[1]);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        ::execvpe(argv[0], argv.data(), envp.data());
        _exit(127);
    }

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    if (!spec.stdin_text.empty()) {
        const char* data = spec.stdin_text.data();
        std::size_t left = spec.stdin_text.size();
        while (left > 0) {
            const ssize_t n = ::write(in_pipe[1], data, left);
            if (n <= 0) {
                break;
            }
            data += n;
            left -= static_cast<std::size_t>(n);
        }
    }
    close_fd(in_pipe[1]);

    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    const bool has_deadline = spec.timeout.count() > 0;
    const auto deadline = started + spec.timeout;
    bool stderr_truncated = false;
    char buf[4096];

    auto should_stop = [&]() {
        if (spec.cancel != nullptr && spec.cancel->cancelled()) {
            result.cancelled = true;
            return true;
        }
        if (has_deadline && Clock::now() >= deadline) {
            result.timed_out = true;
            return true;
        }
        return false;
    };

    bool stopped = false;
    while (out_fd >= 0 || err_fd >= 0) {
        if (should_stop()) {
            stopped = true;
            break;
        }
        pollfd fds[2];
        nfds_t count = 0;
        if (out_fd >= 0) {
            fds[count++] = pollfd{out_fd, POLLIN, 0};
        }
        if (err_fd >= 0) {
            fds[count++] = pollfd{err_fd, POLLIN, 0};
        }
        const int ready = ::poll(fds, count, 50);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        for (nfds_t i = 0; i < count; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            const ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (fds[i].fd == out_fd) {
                if (n <= 0) {
                    close_fd(out_fd);
                } else {
                    append_limited(result.stdout_text, buf, n, spec.max_output_bytes, result.stdout_truncated);
                }
            } else {
                if (n <= 0) {
                    close_fd(err_fd);
                } else {
                    append_limited(result.stderr_text, buf, n, spec.max_output_bytes, stderr_truncated);
                }
            }
        }
    }

    int status = 0;
    while (!stopped) {
        const pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid || (w < 0 && errno != EINTR)) {
            break;
        }
        if (should_stop()) {
            stopped = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    if (stopped) {
        kill_group(pid);
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
    }
    close_fd(out_fd);
    close_fd(err_fd);

    result.elapsed_s = std::chrono::duration<double>(Clock::now() - started).count();
    if (result.timed_out) {
        result.exit_code = 124;
    } else {
        result.exit_code = decode_status(status);
    }
    return result;
}

BackgroundProcess::~BackgroundProcess() {
    stop();
}

BackgroundProcess::BackgroundProcess(BackgroundProcess&& other) noexcept
    : pid_(other.pid_), stderr_fd_(other.stderr_fd_) {
    other.pid_ = -1;
    other.stderr_fd_ = -1;
}

BackgroundProcess& BackgroundProcess::operator=(BackgroundProcess&& other) noexcept {
    if (this != &other) {
        stop();
        pid_ = other.pid_;
        stderr_fd_ = other.stderr_fd_;
        other.pid_ = -1;
        other.stderr_fd_ = -1;
    }
    return *this;
}

bool BackgroundProcess::start(const std::vector<std::string>& argv_in,
                              const std::map<std::string, std::string>& env,
                              std::string& diag) {
    if (argv_in.empty()) {
        diag += "background process requires a command\n";
        return false;
    }
    stop();
    ignore_sigpipe_once();

    auto args = argv_in;
    auto argv = to_pointers(args);
    auto env_items = build_environment(env);
    auto envp = to_pointers(env_items);

    int err_pipe[2] = {-1, -1};
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        diag += std::string{"pipe failed: "} + std::strerror(errno) + "\n";
        return false;
    }
    const pid_t pid = ::fork();
    if (pid < 0) {
        diag += std::string{"fork failed: "} + std::strerror(errno) + "\n";
        close_fd(err_pipe[0]);
        close_fd(err_pipe[1]);
        return false;
    }
    if (pid == 0) {
        ::setpgid(0, 0);
        const int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            ::close(devnull);
        }
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        ::execvpe(argv[0], argv.data(), envp.data());
        _exit(127);
    }
    close_fd(err_pipe[1]);
    ::fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);
    pid_ = pid;
    stderr_fd_ = err_pipe[0];
    return true;
}

bool BackgroundProcess::running() {
    if (pid_ <= 0) {
        return false;
    }
    int status = 0;
    const pid_t w = ::waitpid(pid_, &status, WNOHANG);
    if (w == pid_ || (w < 0 && errno == ECHILD)) {
        pid_ = -1;
        return false;
    }
    return true;
}

void BackgroundProcess::stop() {
    if (pid_ > 0) {
        kill_group(pid_);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
        pid_ = -1;
    }
    close_fd(stderr_fd_);
}

std::string BackgroundProcess::drain_stderr() {
    std::string text;
    if (stderr_fd_ < 0) {
        return text;
    }
    char buf[1024];
    while (true) {
        const ssize_t n = ::read(stderr_fd_, buf, sizeof(buf));
        if (n <= 0) {
            break;
        }
        text.append(buf, static_cast<std::size_t>(n));
    }
    return text;
}

}  // namespace cpact
