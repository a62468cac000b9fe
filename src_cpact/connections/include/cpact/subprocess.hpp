#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include <sys/types.h>

#include "cpact/cancellation.hpp"

namespace cpact {

struct ProcessSpec {
    std::vector<std::string> argv;                 ///< argv[0] is resolved through PATH
    std::map<std::string, std::string> env;        ///< added to the inherited environment
    std::string stdin_text;                        ///< written to the child then closed
    std::chrono::milliseconds timeout{0};          ///< 0 disables the deadline
    std::size_t max_output_bytes{8 * 1024 * 1024};
    const CancellationToken* cancel{nullptr};
};

struct ProcessResult {
    int exit_code{-1};
    bool timed_out{false};
    bool cancelled{false};
    bool stdout_truncated{false};
    std::string stdout_text;
    std::string stderr_text;
    std::string error_message;  ///< set when the child could not be spawned
    double elapsed_s{0.0};
};

/**
 * \brief Runs a child process to completion, capturing stdout and stderr.
 *
 * The child gets its own process group. When the deadline passes or the cancellation
 * token fires, the whole group is killed with SIGKILL and the partial output is kept.
 * Exit codes follow shell conventions: 124 for a timeout, 128+N for signal N, 127 when
 * exec failed.
 */
[[nodiscard]] ProcessResult run_process(const ProcessSpec& spec);

/**
 * \brief Long-running child (port forwards). Stopped on destruction.
 */
class BackgroundProcess {
public:
    BackgroundProcess() = default;
    ~BackgroundProcess();

    BackgroundProcess(const BackgroundProcess&) = delete;
    BackgroundProcess& operator=(const BackgroundProcess&) = delete;
    BackgroundProcess(BackgroundProcess&& other) noexcept;
    BackgroundProcess& operator=(BackgroundProcess&& other) noexcept;

    bool start(const std::vector<std::string>& argv,
               const std::map<std::string, std::string>& env,
               std::string& diag);

    /// Reaps the child if it exited. Returns false once it is gone.
    [[nodiscard]] bool running();

    void stop();

    /// Whatever the child wrote to stderr so far.
    [[nodiscard]] std::string drain_stderr();

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

private:
    pid_t pid_{-1};
    int stderr_fd_{-1};
};

}  // namespace cpact
