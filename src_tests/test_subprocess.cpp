/**
 * @file test_subprocess.cpp
 * @brief Unit Tests for child process execution and the local connection
 *
 * @author cpact contributors
 * @date 2025
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 cpact contributors

#include <catch2/catch_test_macros.hpp>
// cpact
#include "cpact/cancellation.hpp"
#include "cpact/connection.hpp"
#include "cpact/errors.hpp"
#include "cpact/subprocess.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using cpact::CancellationToken;
using cpact::ProcessSpec;
using cpact::run_process;

/* ========================================================================== */
/* RUN PROCESS                                                                */
/* ========================================================================== */

TEST_CASE("run_process captures stdout, stderr and exit code", "[subprocess]") {
    ProcessSpec spec;
    spec.argv = {"/bin/sh", "-c", "echo out; echo err 1>&2; exit 3"};
    const auto result = run_process(spec);

    REQUIRE(result.error_message.empty());
    REQUIRE(result.exit_code == 3);
    REQUIRE(result.stdout_text == "out\n");
    REQUIRE(result.stderr_text == "err\n");
    REQUIRE_FALSE(result.timed_out);
}

TEST_CASE("run_process feeds stdin and extra environment", "[subprocess]") {
    ProcessSpec spec;
    spec.argv = {"/bin/sh", "-c", "read line; echo \"$line-$CPACT_TEST_VAR\""};
    spec.stdin_text = "hello\n";
    spec.env["CPACT_TEST_VAR"] = "42";
    const auto result = run_process(spec);

    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stdout_text == "hello-42\n");
}

TEST_CASE("run_process kills the process group at the deadline", "[subprocess][timeout]") {
    ProcessSpec spec;
    spec.argv = {"/bin/sh", "-c", "sleep 5; echo late"};
    spec.timeout = 200ms;
    const auto started = std::chrono::steady_clock::now();
    const auto result = run_process(spec);
    const auto waited = std::chrono::steady_clock::now() - started;

    REQUIRE(result.timed_out);
    REQUIRE(result.exit_code == 124);
    REQUIRE(result.stdout_text.empty());
    REQUIRE(waited < 3s);
}

TEST_CASE("run_process stops when cancelled", "[subprocess][cancel]") {
    CancellationToken token;
    ProcessSpec spec;
    spec.argv = {"/bin/sh", "-c", "sleep 5"};
    spec.cancel = &token;

    std::thread canceller([&token]() {
        std::this_thread::sleep_for(100ms);
        token.cancel();
    });
    const auto result = run_process(spec);
    canceller.join();

    REQUIRE(result.cancelled);
    REQUIRE_FALSE(result.timed_out);
}

TEST_CASE("run_process reports a missing executable", "[subprocess]") {
    ProcessSpec spec;
    spec.argv = {"cpact-no-such-binary-xyz"};
    const auto result = run_process(spec);
    REQUIRE(result.exit_code == 127);

    ProcessSpec empty;
    REQUIRE_FALSE(run_process(empty).error_message.empty());
}

TEST_CASE("run_process truncates oversized output", "[subprocess]") {
    ProcessSpec spec;
    spec.argv = {"/bin/sh", "-c", "i=0; while [ $i -lt 200 ]; do echo 0123456789; i=$((i+1)); done"};
    spec.max_output_bytes = 100;
    const auto result = run_process(spec);

    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stdout_truncated);
    REQUIRE(result.stdout_text.size() <= 100);
}

TEST_CASE("run_process stdin reaches EOF while other threads spawn", "[subprocess][threads]") {
    std::atomic<bool> stop{false};
    std::vector<std::thread> spawners;
    for (int i = 0; i < 4; ++i) {
        spawners.emplace_back([&stop]() {
            ProcessSpec busy;
            busy.argv = {"/bin/sh", "-c", "sleep 2"};
            busy.timeout = 5s;
            while (!stop.load()) {
                (void)run_process(busy);
            }
        });
    }

    ProcessSpec spec;
    spec.argv = {"cat"};
    spec.stdin_text = "ping\n";
    spec.timeout = 10s;
    for (int i = 0; i < 40; ++i) {
        const auto started = std::chrono::steady_clock::now();
        const auto result = run_process(spec);
        const auto elapsed = std::chrono::steady_clock::now() - started;
        CHECK(result.stdout_text == "ping\n");
        CHECK(elapsed < 1s);
    }

    stop = true;
    for (auto& spawner : spawners) {
        spawner.join();
    }
}

/* ========================================================================== */
/* LOCAL CONNECTION                                                           */
/* ========================================================================== */

TEST_CASE("local connection runs shell commands", "[subprocess][local]") {
    cpact::LocalConnection local;
    local.connect();
    REQUIRE(local.alive());

    cpact::CommandRequest request;
    request.command = "printf 'OK\\n'";
    const auto out = local.execute(request);
    REQUIRE(out.text == "OK\n");
    REQUIRE(out.exit_code == 0);

    request.command = "exit 7";
    REQUIRE(local.execute(request).exit_code == 7);

    local.disconnect();
    REQUIRE_FALSE(local.alive());
}

TEST_CASE("local connection maps deadline and cancellation to exceptions", "[subprocess][local]") {
    cpact::LocalConnection local;
    local.connect();

    cpact::CommandRequest request;
    request.command = "sleep 5";
    request.timeout = 100ms;
    REQUIRE_THROWS_AS(local.execute(request), cpact::TimeoutError);

    CancellationToken token;
    token.cancel();
    request.timeout = 0ms;
    request.cancel = &token;
    REQUIRE_THROWS_AS(local.execute(request), cpact::CancelledError);
}
