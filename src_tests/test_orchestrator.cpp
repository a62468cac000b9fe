/**
 * @file test_orchestrator.cpp
 * @brief Unit Tests for step execution and scenario orchestration on the local target
 *
 * @author cpact contributors
 * @date 2025
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 cpact contributors

#include <catch2/catch_test_macros.hpp>
// cpact
#include "cpact/connection_registry.hpp"
#include "cpact/errors.hpp"
#include "cpact/orchestrator.hpp"
#include "cpact/result_builder.hpp"
#include "cpact/step_executor.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using cpact::ConnectionRegistry;
using cpact::Orchestrator;
using cpact::ScenarioDefinition;
using cpact::StepDefinition;
using cpact::StepStatus;
using cpact::StepType;
using cpact::Value;

namespace {

StepDefinition command_step(const std::string& id, const std::string& command) {
    StepDefinition step;
    step.step_id = id;
    step.step_name = "step " + id;
    step.step_type = StepType::command_execution;
    step.connection = "local";
    step.command = command;
    return step;
}

StepDefinition invoke_step(const std::string& id, const std::string& scenario_path) {
    StepDefinition step;
    step.step_id = id;
    step.step_name = "invoke " + scenario_path;
    step.step_type = StepType::invoke_scenario;
    step.connection = "local";
    step.scenario_path = scenario_path;
    return step;
}

ScenarioDefinition scenario_of(const std::string& id, std::vector<StepDefinition> steps) {
    ScenarioDefinition scenario;
    scenario.test_id = id;
    scenario.test_name = id + " scenario";
    scenario.steps = std::move(steps);
    return scenario;
}

/// Orchestrator on the built-in local target, writing into a scratch log directory.
class Harness {
public:
    Harness() {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        log_dir_ = fs::temp_directory_path() / ("cpact_run_" + std::to_string(stamp));
        fs::create_directories(log_dir_);
    }
    ~Harness() {
        std::error_code ec;
        fs::remove_all(log_dir_, ec);
    }
    Harness(const Harness&) = delete;
    Harness& operator=(const Harness&) = delete;

    void add(const std::string& path, ScenarioDefinition scenario) {
        library_[path] = std::make_shared<const ScenarioDefinition>(std::move(scenario));
    }

    Orchestrator::Config config(cpact::StepExecutor::LogReader read_log = {}) {
        Orchestrator::Config config;
        config.registry = &registry_;
        config.log_dir = log_dir_;
        config.manage_containers = false;
        config.read_log = std::move(read_log);
        config.load_scenario = [this](const fs::path& file) -> std::shared_ptr<const ScenarioDefinition> {
            const auto it = library_.find(file.string());
            if (it == library_.end()) {
                throw cpact::ConfigError("File does not exist: " + file.string());
            }
            return it->second;
        };
        return config;
    }

    [[nodiscard]] const fs::path& log_dir() const noexcept { return log_dir_; }
    [[nodiscard]] ConnectionRegistry& registry() noexcept { return registry_; }

private:
    fs::path log_dir_;
    ConnectionRegistry registry_;
    std::map<std::string, std::shared_ptr<const ScenarioDefinition>> library_;
};

std::string read_file(const fs::path& file) {
    std::ifstream input(file, std::ios::binary);
    return {std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
}

}  // namespace

/* ========================================================================== */
/* SEQUENCING AND GATING                                                      */
/* ========================================================================== */

TEST_CASE("Steps run in order and feed later gates", "[orchestrator]") {
    Harness harness;
    Orchestrator orchestrator(harness.config());

    auto read = command_step("1", "printf 'temp=85\\n'");
    read.step_name = "read temp";
    read.output_analysis = {{R"(temp=(\d+))", "temp"}};

    auto hot = command_step("2", "printf 'OK\\n'");
    hot.entry_criteria = {"temp > 80"};
    hot.validator_type = "exact";
    hot.expected_output = "OK\n";

    auto very_hot = command_step("3", "printf 'never'");
    very_hot.entry_criteria = {"temp > 90"};

    const auto scenario = scenario_of("T-1", {read, hot, very_hot});
    const auto result = orchestrator.run(scenario);

    REQUIRE(result.status == StepStatus::passed);
    REQUIRE(result.steps.size() == 3);
    REQUIRE(result.steps[0].status == StepStatus::passed);
    REQUIRE(result.steps[0].parameters.at("temp") == Value{85});
    REQUIRE(result.steps[0].connection == "local/local");
    REQUIRE(result.steps[1].status == StepStatus::passed);
    REQUIRE(result.steps[1].output == "OK\n");
    REQUIRE(result.steps[2].status == StepStatus::skipped);
    REQUIRE(result.steps[2].error_kind == "entry_criteria");
    REQUIRE_FALSE(result.steps[2].aborted);
    REQUIRE(result.parameters.at("temp") == Value{85});

    cpact::StepExecutor::Config step_config;
    step_config.log_dir = harness.log_dir();
    const cpact::StepExecutor executor(step_config);
    const auto saved = executor.output_file(scenario, read);
    REQUIRE(saved == harness.log_dir() / "command_outputs" / "T-1_1_read_temp.txt");
    REQUIRE(read_file(saved) == "temp=85\n");
}

TEST_CASE("Malformed entry criteria skip the step", "[orchestrator][gate]") {
    Harness harness;
    Orchestrator orchestrator(harness.config());

    auto step = command_step("1", "printf x");
    step.entry_criteria = {"temp >"};
    const auto result = orchestrator.run(scenario_of("T-2", {step, command_step("2", "true")}));

    REQUIRE(result.status == StepStatus::passed);
    REQUIRE(result.steps[0].status == StepStatus::skipped);
    REQUIRE(result.steps[0].error_kind == "expression");
    REQUIRE(result.steps[1].status == StepStatus::passed);
}

TEST_CASE("Gated-out step never opens a connection", "[orchestrator][gate]") {
    Harness harness;
    Orchestrator orchestrator(harness.config());

    auto closed = command_step("1", "printf never");
    closed.entry_criteria = {"temp > 80"};
    auto malformed = command_step("2", "printf never");
    malformed.entry_criteria = {"temp >"};
    const auto skipped = orchestrator.run(scenario_of("T-2B", {closed, malformed}));

    REQUIRE(skipped.steps[0].status == StepStatus::skipped);
    REQUIRE(skipped.steps[1].status == StepStatus::skipped);
    REQUIRE(skipped.steps[0].connection.empty());
    REQUIRE(harness.registry().connects() == 0);
    REQUIRE(harness.registry().cached_handles() == 0);

    const auto ran = orchestrator.run(scenario_of("T-2C", {command_step("1", "true")}));
    REQUIRE(ran.status == StepStatus::passed);
    REQUIRE(harness.registry().connects() == 1);
}

TEST_CASE("Failure without continue aborts the rest", "[orchestrator][continue]") {
    Harness harness;
    Orchestrator orchestrator(harness.config());

    auto broken = command_step("1", "echo boom 1>&2; exit 3");
    const auto after = command_step("2", "printf 'OK'");

    SECTION("continue false") {
        const auto result = orchestrator.run(scenario_of("T-3", {broken, after}));
        REQUIRE(result.status == StepStatus::failed);
        REQUIRE(result.steps[0].status == StepStatus::failed);
        REQUIRE(result.steps[0].error_kind == "exit_status");
        REQUIRE(result.steps[0].message.find("exit code 3") != std::string::npos);
        REQUIRE_FALSE(result.steps[0].tolerated);
        REQUIRE(result.steps[1].status == StepStatus::skipped);
        REQUIRE(result.steps[1].aborted);
        REQUIRE(result.steps[1].error_kind == "aborted");
        REQUIRE(result.message.find("step 1 failed") != std::string::npos);
    }

    SECTION("continue true") {
        broken.continue_on_failure = true;
        const auto result = orchestrator.run(scenario_of("T-3", {broken, after}));
        REQUIRE(result.status == StepStatus::failed);
        REQUIRE(result.steps[0].tolerated);
        REQUIRE(result.steps[1].status == StepStatus::passed);
        REQUIRE(result.steps[1].output == "OK");
    }
}

/* ========================================================================== */
/* VALIDATION                                                                 */
/* ========================================================================== */

TEST_CASE("Expected output is validated", "[orchestrator][validate]") {
    Harness harness;
    Orchestrator orchestrator(harness.config());

    SECTION("json ignores key order") {
        auto step = command_step("1", R"(printf '{"b":2,"a":1}')");
        step.validator_type = "json";
        step.expected_output = R"({"a":1,"b":2})";
        REQUIRE(orchestrator.run(scenario_of("T-4", {step})).status == StepStatus::passed);
    }

    SECTION("mismatch records expected and actual") {
        auto step = command_step("1", "printf 'NO\\n'");
        step.validator_type = "exact";
        step.expected_output = "OK";
        const auto result = orchestrator.run(scenario_of("T-4", {step}));

        REQUIRE(result.status == StepStatus::failed);
        REQUIRE(result.steps[0].error_kind == "validation_mismatch");
        REQUIRE(result.steps[0].expected == "OK");
        REQUIRE(result.steps[0].actual == "NO\n");
    }

    SECTION("expected output from a file") {
        const auto expected = harness.log_dir() / "expected.txt";
        std::ofstream(expected) << "ready";
        auto step = command_step("1", "printf 'ready'");
        step.validator_type = "exact";
        step.expected_output_path = expected.string();
        REQUIRE(orchestrator.run(scenario_of("T-4", {step})).status == StepStatus::passed);
    }
}

TEST_CASE("Loop repeats the command and keeps the last output", "[orchestrator][loop]") {
    Harness harness;
    Orchestrator orchestrator(harness.config());

    const auto counter = harness.log_dir() / "count.txt";
    auto step = command_step("1", "echo x >> '" + counter.string() + "'; wc -l < '" + counter.string() + "'");
    step.loop = 3;
    step.output_analysis = {{R"((\d+))", "runs"}};
    const auto result = orchestrator.run(scenario_of("T-5", {step}));

    REQUIRE(result.status == StepStatus::passed);
    REQUIRE(result.steps[0].iterations == 3);
    REQUIRE(result.parameters.at("runs") == Value{3});
}

TEST_CASE("Step duration is enforced", "[orchestrator][timeout]") {
    Harness harness;
    Orchestrator orchestrator(harness.config());

    auto step = command_step("1", "sleep 5");
    step.duration = 0.3;
    const auto result = orchestrator.run(scenario_of("T-6", {step, command_step("2", "true")}));

    REQUIRE(result.status == StepStatus::failed);
    REQUIRE(result.steps[0].status == StepStatus::error);
    REQUIRE(result.steps[0].error_kind == "timeout");
    REQUIRE(result.steps[0].elapsed_s < 3.0);
    REQUIRE(result.steps[1].aborted);
}

TEST_CASE("Unknown target is a configuration error of the step", "[orchestrator]") {
    Harness harness;
    Orchestrator orchestrator(harness.config());

    auto step = command_step("1", "true");
    step.connection = "Ghost";
    const auto result = orchestrator.run(scenario_of("T-7", {step}));

    REQUIRE(result.status == StepStatus::failed);
    REQUIRE(result.steps[0].status == StepStatus::error);
    REQUIRE(result.steps[0].error_kind == "config");
}

TEST_CASE("Exceptions from outside the engine become internal errors", "[orchestrator][errors]") {
    Harness harness;
    auto reader = [](const StepDefinition& step, const cpact::CommandRequest&) -> std::string {
        if (step.log_path == "unreadable") {
            throw fs::filesystem_error("cannot stat", fs::path{"/var/log/bmc"},
                                       std::make_error_code(std::errc::permission_denied));
        }
        if (step.log_path == "garbled") {
            throw std::runtime_error("decoder gave up");
        }
        return "ok";
    };
    Orchestrator orchestrator(harness.config(reader));

    auto scan = [](const std::string& id, const std::string& source) {
        StepDefinition step;
        step.step_id = id;
        step.step_name = "scan " + source;
        step.step_type = StepType::log_analysis;
        step.connection = "local";
        step.log_path = source;
        step.continue_on_failure = true;
        return step;
    };

    const auto result =
        orchestrator.run(scenario_of("T-7B", {scan("1", "unreadable"), scan("2", "garbled"), command_step("3", "true")}));
    REQUIRE(result.status == StepStatus::failed);
    REQUIRE(result.steps[0].status == StepStatus::error);
    REQUIRE(result.steps[0].error_kind == "internal");
    REQUIRE(result.steps[1].status == StepStatus::error);
    REQUIRE(result.steps[1].error_kind == "internal");
    REQUIRE(result.steps[1].message.find("decoder gave up") != std::string::npos);
    REQUIRE(result.steps[2].status == StepStatus::passed);

    std::vector<std::shared_ptr<const ScenarioDefinition>> scenarios = {
        std::make_shared<const ScenarioDefinition>(scenario_of("T-7C", {scan("1", "garbled")})),
        std::make_shared<const ScenarioDefinition>(scenario_of("T-7D", {command_step("1", "true")})),
    };
    const auto outcomes = orchestrator.run_all(scenarios, 2);
    REQUIRE(outcomes.size() == 2);
    REQUIRE(outcomes[0].steps[0].error_kind == "internal");
    REQUIRE(outcomes[1].status == StepStatus::passed);
}

/* ========================================================================== */
/* LOG ANALYSIS                                                               */
/* ========================================================================== */

TEST_CASE("Log analysis applies diagnostic rules", "[orchestrator][diagnostic]") {
    Harness harness;
    std::vector<std::string> requested;
    Orchestrator orchestrator(harness.config([&requested](const StepDefinition& step, const cpact::CommandRequest&) {
        requested.push_back(step.log_path);
        return std::string{"boot ok\nTHERMAL throttled\nerrors=4\n"};
    }));

    StepDefinition step;
    step.step_id = "1";
    step.step_name = "scan";
    step.step_type = StepType::log_analysis;
    step.connection = "local";
    step.log_path = "current_log_dir/T-8_0_boot.txt";

    cpact::DiagnosticRule count;
    count.diagnostic_search_string = R"(errors=(\d+))";
    count.parameter = "error_count";

    SECTION("matching failure code fails the step") {
        cpact::DiagnosticRule thermal;
        thermal.search_string = "throttled";
        thermal.result_code = "THERMAL-01";
        step.diagnostic_analysis = {count, thermal};

        const auto result = orchestrator.run(scenario_of("T-8", {step}));
        REQUIRE(requested == std::vector<std::string>{"current_log_dir/T-8_0_boot.txt"});
        REQUIRE(result.status == StepStatus::failed);
        REQUIRE(result.steps[0].error_kind == "diagnostic");
        REQUIRE(result.steps[0].diagnostic_codes == std::vector<std::string>{"THERMAL-01"});
        REQUIRE(result.steps[0].result_code.value() == "THERMAL-01");
        REQUIRE(result.parameters.at("error_count") == Value{4});
    }

    SECTION("info code passes") {
        cpact::DiagnosticRule note;
        note.search_string = "boot ok";
        note.result_code = "BOOT-OK";
        note.severity = "info";
        step.diagnostic_analysis = {note};

        const auto result = orchestrator.run(scenario_of("T-8", {step}));
        REQUIRE(result.status == StepStatus::passed);
        REQUIRE(result.steps[0].diagnostic_codes == std::vector<std::string>{"BOOT-OK"});
    }
}

TEST_CASE("Log analysis reads a previous step's output", "[orchestrator][diagnostic]") {
    Harness harness;
    Orchestrator orchestrator(harness.config());

    auto dump = command_step("1", "printf 'link down\\n'");
    dump.step_name = "dump";

    StepDefinition scan;
    scan.step_id = "2";
    scan.step_name = "scan";
    scan.step_type = StepType::log_analysis;
    scan.connection = "local";
    scan.log_path = "current_log_dir/T-9_1_dump.txt";
    cpact::DiagnosticRule link;
    link.search_string = "link down";
    link.result_code = "NET-01";
    scan.diagnostic_analysis = {link};

    const auto result = orchestrator.run(scenario_of("T-9", {dump, scan}));
    REQUIRE(result.steps[1].status == StepStatus::failed);
    REQUIRE(result.steps[1].diagnostic_codes == std::vector<std::string>{"NET-01"});
}

/* ========================================================================== */
/* SCENARIO INVOCATION                                                        */
/* ========================================================================== */

TEST_CASE("Invoked scenario exports parameters on request", "[orchestrator][invoke]") {
    Harness harness;
    auto sensors = command_step("1", "printf 'temp=85 fan=high'");
    sensors.output_analysis = {{R"(temp=(\d+))", "temp"}, {R"(fan=(\w+))", "fan"}};
    auto inherited = command_step("2", "printf ok");
    inherited.entry_criteria = {"mode == 'auto'"};
    harness.add("child.yaml", scenario_of("CHILD", {sensors, inherited}));
    Orchestrator orchestrator(harness.config());

    auto seed = command_step("0", "printf 'mode=auto'");
    seed.output_analysis = {{R"(mode=(\w+))", "mode"}};
    auto call = invoke_step("1", "child.yaml");
    auto gated = command_step("2", "printf ok");
    gated.entry_criteria = {"temp > 80"};

    SECTION("listed parameters only") {
        call.export_parameters = std::vector<std::string>{"temp"};
        const auto result = orchestrator.run(scenario_of("PARENT", {seed, call, gated}));

        REQUIRE(result.status == StepStatus::passed);
        REQUIRE(result.steps[1].nested != nullptr);
        REQUIRE(result.steps[1].nested->test_id == "CHILD");
        REQUIRE(result.steps[1].nested->steps[1].status == StepStatus::passed);  // read the caller's mode
        REQUIRE(result.steps[2].status == StepStatus::passed);
        REQUIRE(result.parameters.count("temp") == 1);
        REQUIRE(result.parameters.count("fan") == 0);
    }

    SECTION("no export keeps the caller's context unchanged") {
        const auto result = orchestrator.run(scenario_of("PARENT", {seed, call, gated}));

        REQUIRE(result.steps[1].status == StepStatus::passed);
        REQUIRE(result.steps[2].status == StepStatus::skipped);
        REQUIRE(result.parameters.count("temp") == 0);
    }

    SECTION("empty export list exports everything") {
        call.export_parameters = std::vector<std::string>{};
        const auto result = orchestrator.run(scenario_of("PARENT", {seed, call, gated}));
        REQUIRE(result.parameters.count("temp") == 1);
        REQUIRE(result.parameters.count("fan") == 1);
    }
}

TEST_CASE("Nested failure fails the invoking step", "[orchestrator][invoke]") {
    Harness harness;
    harness.add("bad.yaml", scenario_of("BAD", {command_step("1", "exit 1")}));
    Orchestrator orchestrator(harness.config());

    const auto result = orchestrator.run(scenario_of("TOP", {invoke_step("1", "bad.yaml")}));
    REQUIRE(result.status == StepStatus::failed);
    REQUIRE(result.steps[0].error_kind == "nested_failure");
    REQUIRE(result.steps[0].nested->status == StepStatus::failed);
    REQUIRE(result.nested().size() == 1);
}

TEST_CASE("Invoking step's duration bounds the invoked scenario", "[orchestrator][invoke][timeout]") {
    Harness harness;
    harness.add("slow.yaml", scenario_of("SLOW", {command_step("1", "sleep 5"), command_step("2", "true")}));
    harness.add("outer.yaml", scenario_of("OUTER", {invoke_step("1", "slow.yaml")}));
    Orchestrator orchestrator(harness.config());

    SECTION("direct child") {
        auto call = invoke_step("1", "slow.yaml");
        call.duration = 0.3;
        const auto result = orchestrator.run(scenario_of("TOP", {call}));

        REQUIRE(result.steps[0].status == StepStatus::error);
        REQUIRE(result.steps[0].error_kind == "timeout");
        REQUIRE(result.steps[0].elapsed_s < 3.0);
        REQUIRE(result.steps[0].nested != nullptr);
        REQUIRE(result.steps[0].nested->steps[0].error_kind == "timeout");
        REQUIRE(result.steps[0].nested->steps[1].aborted);
    }

    SECTION("grandchild") {
        auto call = invoke_step("1", "outer.yaml");
        call.duration = 0.3;
        const auto result = orchestrator.run(scenario_of("TOP", {call}));

        REQUIRE(result.steps[0].error_kind == "timeout");
        REQUIRE(result.steps[0].elapsed_s < 3.0);
    }

    SECTION("child finishing in time passes") {
        auto call = invoke_step("1", "quick.yaml");
        harness.add("quick.yaml", scenario_of("QUICK", {command_step("1", "true")}));
        call.duration = 5.0;
        const auto result = orchestrator.run(scenario_of("TOP", {call}));
        REQUIRE(result.steps[0].status == StepStatus::passed);
    }
}

TEST_CASE("Invocation cycles are detected", "[orchestrator][invoke][cycle]") {
    Harness harness;
    harness.add("a.yaml", scenario_of("A", {invoke_step("1", "b.yaml")}));
    harness.add("b.yaml", scenario_of("B", {invoke_step("1", "a.yaml")}));
    harness.add("self.yaml", scenario_of("SELF", {invoke_step("1", "self.yaml")}));
    Orchestrator orchestrator(harness.config());

    SECTION("two scenarios") {
        const auto result = orchestrator.run(scenario_of("A", {invoke_step("1", "b.yaml")}));
        REQUIRE(result.status == StepStatus::failed);
        const auto& nested = *result.steps[0].nested;
        REQUIRE(nested.test_id == "B");
        REQUIRE(nested.steps[0].status == StepStatus::failed);
        REQUIRE(nested.steps[0].error_kind == "cycle");
        REQUIRE(nested.steps[0].message.find("A -> B -> A") != std::string::npos);
    }

    SECTION("self invocation") {
        const auto result = orchestrator.run(scenario_of("SELF", {invoke_step("1", "self.yaml")}));
        REQUIRE(result.steps[0].error_kind == "cycle");
        REQUIRE(result.steps[0].nested == nullptr);
    }

    SECTION("missing scenario file") {
        const auto result = orchestrator.run(scenario_of("X", {invoke_step("1", "nowhere.yaml")}));
        REQUIRE(result.steps[0].status == StepStatus::error);
        REQUIRE(result.steps[0].error_kind == "config");
    }
}

/* ========================================================================== */
/* RUNS                                                                       */
/* ========================================================================== */

TEST_CASE("run_all keeps input order across workers", "[orchestrator][jobs]") {
    Harness harness;
    Orchestrator orchestrator(harness.config());

    std::vector<std::shared_ptr<const ScenarioDefinition>> scenarios;
    for (int i = 0; i < 6; ++i) {
        auto step = command_step("1", "sleep 0.05; printf " + std::to_string(i));
        if (i == 4) {
            step.command = "exit 2";
        }
        scenarios.push_back(std::make_shared<const ScenarioDefinition>(
            scenario_of("S-" + std::to_string(i), {step, command_step("2", "true")})));
    }

    cpact::ResultBuilder results;
    const auto outcomes = orchestrator.run_all(scenarios, 3, &results);

    REQUIRE(outcomes.size() == 6);
    for (std::size_t i = 0; i < outcomes.size(); ++i) {
        REQUIRE(outcomes[i].test_id == "S-" + std::to_string(i));
    }
    REQUIRE(outcomes[2].steps[0].output == "2");
    REQUIRE(outcomes[4].status == StepStatus::failed);

    const auto summary = results.summary();
    REQUIRE(summary.total == 12);
    REQUIRE(summary.passed == 10);
    REQUIRE(summary.failed == 1);
    REQUIRE(summary.skipped == 1);
    REQUIRE(results.scenarios().size() == 6);
}

TEST_CASE("Cancelled run aborts remaining steps", "[orchestrator][cancel]") {
    Harness harness;
    Orchestrator orchestrator(harness.config());
    orchestrator.cancel();

    const auto result = orchestrator.run(scenario_of("T-10", {command_step("1", "true"), command_step("2", "true")}));
    REQUIRE(result.steps.size() == 2);
    REQUIRE(result.steps[0].aborted);
    REQUIRE(result.steps[0].message == "run cancelled");
    REQUIRE(result.steps[1].aborted);
}

TEST_CASE("Connections referenced by a scenario", "[orchestrator]") {
    auto remote = command_step("1", "uptime");
    remote.connection = "Inband";
    remote.connection_type = "ssh";
    auto bmc = command_step("2", "/redfish/v1/Systems");
    bmc.connection = "Bmc";
    bmc.connection_type = "redfish";
    auto again = remote;
    again.step_id = "3";

    auto scenario = scenario_of("T-11", {remote, bmc, again, command_step("4", "true"), invoke_step("5", "x.yaml")});
    cpact::ContainerSpec db;
    db.name = "db";
    db.image = "postgres:16";
    scenario.containers = {db};

    const auto pairs = Orchestrator::connections_of(scenario);
    REQUIRE(pairs.size() == 4);
    REQUIRE(pairs[0] == cpact::ConnectionRef{"local", "local"});
    REQUIRE(pairs[1] == cpact::ConnectionRef{"Inband", "ssh"});
    REQUIRE(pairs[2] == cpact::ConnectionRef{"Bmc", "redfish"});
    REQUIRE(pairs[3] == cpact::ConnectionRef{"local", ""});
}

TEST_CASE("Connections of invoked scenarios are collected", "[orchestrator][invoke]") {
    Harness harness;
    auto bmc = command_step("1", "/redfish/v1/Systems");
    bmc.connection = "Bmc";
    bmc.connection_type = "redfish";
    harness.add("child.yaml",
                scenario_of("CHILD", {bmc, invoke_step("2", "top.yaml"), invoke_step("3", "missing.yaml")}));

    auto remote = command_step("1", "uptime");
    remote.connection = "Inband";
    remote.connection_type = "ssh";
    const auto top = scenario_of("TOP", {remote, invoke_step("2", "child.yaml"), command_step("3", "true")});
    harness.add("top.yaml", top);

    REQUIRE(Orchestrator::connections_of(top).size() == 2);

    const auto pairs = Orchestrator::connections_of(top, harness.config().load_scenario);
    REQUIRE(pairs.size() == 3);
    REQUIRE(pairs[0] == cpact::ConnectionRef{"Inband", "ssh"});
    REQUIRE(pairs[1] == cpact::ConnectionRef{"Bmc", "redfish"});
    REQUIRE(pairs[2] == cpact::ConnectionRef{"local", ""});
}
