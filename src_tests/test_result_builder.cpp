/**
 * @file test_result_builder.cpp
 * @brief Unit Tests for result aggregation and report files
 *
 * @author cpact contributors
 * @date 2025
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 cpact contributors

#include <catch2/catch_test_macros.hpp>
// cpact
#include "cpact/context.hpp"
#include "cpact/report_writer.hpp"
#include "cpact/result_builder.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using cpact::ResultBuilder;
using cpact::ScenarioResult;
using cpact::StepResult;
using cpact::StepStatus;
using cpact::Value;

namespace {

StepResult step_result(const std::string& scenario_id, const std::string& step_id, StepStatus status,
                       const std::string& error_kind = {}) {
    StepResult result;
    result.scenario_id = scenario_id;
    result.step_id = step_id;
    result.step_name = "step " + step_id;
    result.status = status;
    result.error_kind = error_kind;
    return result;
}

/// TOP: passed step, invoke step failing because CHILD failed, aborted step.
ScenarioResult nested_run() {
    auto child = std::make_shared<ScenarioResult>();
    child->test_id = "CHILD";
    child->status = StepStatus::failed;
    auto mismatch = step_result("CHILD", "1", StepStatus::failed, "validation_mismatch");
    mismatch.expected = "OK";
    mismatch.actual = "NO";
    mismatch.connection = "Inband/ssh";
    child->steps = {mismatch};
    child->parameters["temp"] = Value{85};

    ScenarioResult top;
    top.test_id = "TOP";
    top.status = StepStatus::failed;
    auto first = step_result("TOP", "1", StepStatus::passed);
    first.diagnostic_codes = {"FW-INFO"};
    first.parameters["fw"] = Value{"1.2"};
    auto invoke = step_result("TOP", "2", StepStatus::failed, "nested_failure");
    invoke.step_type = cpact::StepType::invoke_scenario;
    invoke.nested = child;
    auto aborted = step_result("TOP", "3", StepStatus::skipped, "aborted");
    aborted.aborted = true;
    top.steps = {first, invoke, aborted};
    return top;
}

nlohmann::json read_json(const fs::path& file) {
    std::ifstream input(file);
    return nlohmann::json::parse(input);
}

}  // namespace

/* ========================================================================== */
/* AGGREGATION                                                                */
/* ========================================================================== */

TEST_CASE("Step results are tallied by status", "[results]") {
    ResultBuilder results;
    results.record(step_result("T", "1", StepStatus::passed));
    results.record(step_result("T", "2", StepStatus::failed, "exit_status"));
    results.record(step_result("T", "3", StepStatus::skipped, "entry_criteria"));
    results.record(step_result("T", "4", StepStatus::error, "timeout"));
    results.record(step_result("T", "5", StepStatus::passed));

    const auto summary = results.summary();
    REQUIRE(summary.total == 5);
    REQUIRE(summary.passed == 2);
    REQUIRE(summary.failed == 1);
    REQUIRE(summary.skipped == 1);
    REQUIRE(summary.errors == 1);
    REQUIRE(summary.failure_details.size() == 2);
    REQUIRE(summary.failure_details[0].step_id == "2");
    REQUIRE(summary.failure_details[1].error_kind == "timeout");
}

TEST_CASE("Nested failures are detailed but not counted twice", "[results][nested]") {
    ResultBuilder results;
    results.record_scenario(nested_run());

    const auto summary = results.summary();
    REQUIRE(summary.total == 3);
    REQUIRE(summary.passed == 1);
    REQUIRE(summary.failed == 1);
    REQUIRE(summary.skipped == 1);
    REQUIRE(summary.failure_details.size() == 2);

    const auto& nested = summary.failure_details[1];
    REQUIRE(nested.scenario_id == "CHILD");
    REQUIRE(nested.error_kind == "validation_mismatch");
    REQUIRE(nested.expected == "OK");
    REQUIRE(nested.actual == "NO");
    REQUIRE(nested.connection == "Inband/ssh");
}

TEST_CASE("Scenario that never ran a step is reported", "[results]") {
    ScenarioResult broken;
    broken.test_id = "DOCKER";
    broken.status = StepStatus::error;
    broken.message = "docker pre-step failed: image missing";

    ResultBuilder results;
    results.record_scenario(broken);
    const auto summary = results.summary();
    REQUIRE(summary.total == 0);
    REQUIRE(summary.failure_details.size() == 1);
    REQUIRE(summary.failure_details[0].scenario_id == "DOCKER");
    REQUIRE(summary.failure_details[0].error_kind == "scenario");
}

TEST_CASE("Scenario status ignores skipped steps", "[results]") {
    std::vector<StepResult> steps = {step_result("T", "1", StepStatus::passed),
                                     step_result("T", "2", StepStatus::skipped)};
    REQUIRE(ResultBuilder::scenario_status(steps) == StepStatus::passed);

    steps.push_back(step_result("T", "3", StepStatus::error));
    REQUIRE(ResultBuilder::scenario_status(steps) == StepStatus::failed);
}

TEST_CASE("Parameters are exported into the caller", "[results][export]") {
    ScenarioResult child;
    child.parameters = {{"temp", Value{85}}, {"fan", Value{"high"}}};

    cpact::ExecutionContext parent;
    REQUIRE(ResultBuilder::export_parameters(child, parent, {"temp", "absent"}) == 1);
    REQUIRE(parent.get("temp") == Value{85});
    REQUIRE_FALSE(parent.contains("fan"));

    REQUIRE(ResultBuilder::export_parameters(child, parent) == 2);
    REQUIRE(parent.get("fan") == Value{"high"});
}

TEST_CASE("Concurrent recording keeps every step", "[results][threads]") {
    ResultBuilder results;
    std::vector<std::thread> workers;
    for (int w = 0; w < 4; ++w) {
        workers.emplace_back([&results, w]() {
            for (int i = 0; i < 100; ++i) {
                results.record(step_result("W" + std::to_string(w), std::to_string(i),
                                           i % 10 == 0 ? StepStatus::failed : StepStatus::passed));
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    const auto summary = results.summary();
    REQUIRE(summary.total == 400);
    REQUIRE(summary.failed == 40);
    REQUIRE(summary.failure_details.size() == 40);
}

/* ========================================================================== */
/* REPORTS                                                                    */
/* ========================================================================== */

TEST_CASE("Diagnostics document groups codes by scenario and step", "[results][report]") {
    ResultBuilder results;
    results.record_scenario(nested_run());
    const auto diagnostics = results.diagnostics_json();

    REQUIRE(diagnostics.contains("TOP"));
    REQUIRE(diagnostics["TOP"].size() == 1);
    REQUIRE(diagnostics["TOP"]["1"]["codes"] == nlohmann::json::array({"FW-INFO"}));
    REQUIRE(diagnostics["TOP"]["1"]["parameters"]["fw"] == "1.2");
    REQUIRE_FALSE(diagnostics.contains("CHILD"));
}

TEST_CASE("Report writer emits result files and a console tally", "[results][report]") {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto log_dir = fs::temp_directory_path() / ("cpact_report_" + std::to_string(stamp)) / "logs";

    ResultBuilder results;
    results.record_scenario(nested_run());
    const cpact::ReportWriter writer;
    writer.write_all(log_dir, results);

    const auto document = read_json(log_dir / "test_results.json");
    REQUIRE(document["summary"]["total"] == 3);
    REQUIRE(document["summary"]["failure_details"].size() == 2);
    REQUIRE(document["scenarios"].size() == 1);
    REQUIRE(document["scenarios"][0]["test_id"] == "TOP");
    REQUIRE(document["scenarios"][0]["status"] == "failed");
    REQUIRE(document["scenarios"][0]["steps"][1]["nested"]["test_id"] == "CHILD");
    REQUIRE(document["scenarios"][0]["steps"][1]["nested"]["parameters"]["temp"] == 85);
    REQUIRE(document["scenarios"][0]["steps"][2]["aborted"] == true);

    REQUIRE(fs::exists(log_dir / "diagnostics_codes.json"));
    REQUIRE(read_json(log_dir / "diagnostics_codes.json").contains("TOP"));

    writer.write_json(log_dir / "extra" / "report.json", nlohmann::json{{"status", "SUCCESS"}});
    REQUIRE(read_json(log_dir / "extra" / "report.json")["status"] == "SUCCESS");

    REQUIRE(cpact::ReportWriter::console_line(results.summary()) == "PASS: 1 FAIL: 1 SKIP: 1 ERROR: 0");

    std::error_code ec;
    fs::remove_all(log_dir.parent_path(), ec);
}
