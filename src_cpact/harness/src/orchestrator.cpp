#include "cpact/orchestrator.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <set>
#include <thread>

#include "cpact/docker_executor.hpp"
#include "cpact/errors.hpp"
#include "cpact/logging.hpp"

namespace {

using Clock = std::chrono::steady_clock;

cpact::StepResult aborted_step(const cpact::StepDefinition& step, const std::string& scenario_id,
                               const std::string& reason) {
    cpact::StepResult result;
    result.scenario_id = scenario_id;
    result.step_id = step.step_id;
    result.step_name = step.step_name;
    result.step_type = step.step_type;
    result.status = cpact::StepStatus::skipped;
    result.error_kind = "aborted";
    result.message = reason;
    result.aborted = true;
    return result;
}

std::string summarize(const cpact::ScenarioResult& result) {
    std::size_t passed = 0;
    std::size_t skipped = 0;
    for (const auto& step : result.steps) {
        passed += step.status == cpact::StepStatus::passed ? 1 : 0;
        skipped += step.status == cpact::StepStatus::skipped ? 1 : 0;
    }
    for (const auto& step : result.steps) {
        if (step.failed() && !step.tolerated) {
            return "step " + step.step_id + " " + cpact::to_string(step.status) + ": " + step.message;
        }
    }
    for (const auto& step : result.steps) {
        if (step.failed()) {
            return "step " + step.step_id + " " + cpact::to_string(step.status) + " (continue): " + step.message;
        }
    }
    return std::to_string(passed) + "/" + std::to_string(result.steps.size()) + " step(s) passed, " +
           std::to_string(skipped) + " skipped";
}

}  // namespace

namespace cpact {

Orchestrator::Orchestrator(Config config) : config_(std::move(config)) {
    if (!config_.cancel) {
        config_.cancel = std::make_shared<CancellationToken>();
    }
    if (!config_.load_scenario) {
        gate_ = std::make_shared<SchemaGate>();
        config_.load_scenario = [gate = gate_](const std::filesystem::path& file) { return gate->admit(file); };
    }

    StepExecutor::Config step_config;
    step_config.registry = config_.registry;
    step_config.log_dir = config_.log_dir;
    step_config.persist_outputs = config_.persist_outputs;
    step_config.command_timeout = config_.command_timeout;
    step_config.cancel = config_.cancel;
    step_config.read_log = config_.read_log;
    step_config.resolve_scenario = [this](const std::string& scenario_path, const ScenarioDefinition& caller) {
        return resolve(scenario_path, caller);
    };
    step_config.run_scenario = [this](const ScenarioDefinition& scenario, const ExecutionContext& parent,
                                      InvocationStack& stack) { return run(scenario, &parent, stack); };
    executor_ = std::make_unique<StepExecutor>(std::move(step_config));
}

ScenarioResult Orchestrator::run(const ScenarioDefinition& scenario,
                                 const ExecutionContext* parent,
                                 InvocationStack& stack) const {
    InvocationStack::Guard guard(stack, scenario.test_id);

    ScenarioResult result;
    result.test_id = scenario.test_id;
    result.test_name = scenario.test_name;
    result.test_group = scenario.test_group;
    result.source_file = scenario.source_file.string();

    const auto started = Clock::now();
    ExecutionContext context = parent != nullptr ? parent->child() : ExecutionContext{};
    CPACT_LOG_INFO("[{}] scenario '{}' started ({} step(s), depth {})", scenario.test_id, scenario.test_name,
                   scenario.steps.size(), stack.depth());

    std::unique_ptr<DockerExecutor> docker;
    if (config_.manage_containers && !scenario.containers.empty()) {
        try {
            if (config_.registry == nullptr) {
                throw ConfigError("Scenario declares containers but no connection registry is configured");
            }
            docker = std::make_unique<DockerExecutor>(*config_.registry);
            docker->start_all(scenario.containers, config_.cancel.get());
        } catch (const Error& e) {
            result.status = StepStatus::error;
            result.message = std::string{"docker pre-step failed: "} + e.what();
            result.elapsed_s = std::chrono::duration<double>(Clock::now() - started).count();
            CPACT_LOG_ERROR("[{}] {}", scenario.test_id, result.message);
            return result;
        }
    }

    std::string abort_reason;
    for (const auto& step : scenario.steps) {
        if (abort_reason.empty() && config_.cancel->cancelled()) {
            abort_reason = "run cancelled";
        }
        if (!abort_reason.empty()) {
            result.steps.push_back(aborted_step(step, scenario.test_id, abort_reason));
            continue;
        }

        auto step_result = executor_->execute(step, scenario, context, stack);
        if (step_result.failed() && !step.continue_on_failure) {
            abort_reason = "aborted after step " + step.step_id + " " + to_string(step_result.status);
        }
        result.steps.push_back(std::move(step_result));
    }
    docker.reset();

    result.parameters = context.local();
    result.status = ResultBuilder::scenario_status(result.steps);
    result.message = summarize(result);
    result.elapsed_s = std::chrono::duration<double>(Clock::now() - started).count();

    if (result.status == StepStatus::passed) {
        CPACT_LOG_INFO("[{}] scenario passed in {:.3f}s: {}", scenario.test_id, result.elapsed_s, result.message);
    } else {
        CPACT_LOG_ERROR("[{}] scenario {} in {:.3f}s: {}", scenario.test_id, to_string(result.status),
                        result.elapsed_s, result.message);
    }
    return result;
}

ScenarioResult Orchestrator::run(const ScenarioDefinition& scenario) const {
    InvocationStack stack;
    return run(scenario, nullptr, stack);
}

std::vector<ScenarioResult> Orchestrator::run_all(const std::vector<std::shared_ptr<const ScenarioDefinition>>& scenarios,
                                                  std::size_t jobs,
                                                  ResultBuilder* results) const {
    std::vector<ScenarioResult> outcomes(scenarios.size());
    std::atomic<std::size_t> next{0};
    std::mutex failure_mutex;
    std::exception_ptr failure;

    auto worker = [&]() {
        for (auto index = next++; index < scenarios.size(); index = next++) {
            const auto& scenario = *scenarios[index];
            try {
                outcomes[index] = run(scenario);
            } catch (const Error& e) {
                outcomes[index].test_id = scenario.test_id;
                outcomes[index].test_name = scenario.test_name;
                outcomes[index].test_group = scenario.test_group;
                outcomes[index].source_file = scenario.source_file.string();
                outcomes[index].status = StepStatus::error;
                outcomes[index].message = e.what();
                CPACT_LOG_ERROR("[{}] scenario could not run: {}", scenario.test_id, e.what());
            } catch (...) {
                std::lock_guard<std::mutex> lock(failure_mutex);
                if (!failure) {
                    failure = std::current_exception();
                }
                config_.cancel->cancel();
                return;
            }
            if (results != nullptr) {
                results->record_scenario(outcomes[index]);
            }
        }
    };

    const auto workers = std::max<std::size_t>(1, std::min(jobs, scenarios.size()));
    if (workers == 1) {
        worker();
    } else {
        std::vector<std::thread> pool;
        pool.reserve(workers);
        for (std::size_t i = 0; i < workers; ++i) {
            pool.emplace_back(worker);
        }
        for (auto& thread : pool) {
            thread.join();
        }
    }

    if (failure) {
        std::rethrow_exception(failure);
    }
    return outcomes;
}

std::vector<ConnectionRef> Orchestrator::connections_of(const ScenarioDefinition& scenario) {
    return connections_of(scenario, ScenarioSource{});
}

std::vector<ConnectionRef> Orchestrator::connections_of(const ScenarioDefinition& scenario,
                                                        const ScenarioSource& load) {
    std::vector<ConnectionRef> pairs;
    std::set<std::string> visited;
    collect_connections(scenario, load, visited, pairs);
    return pairs;
}

void Orchestrator::collect_connections(const ScenarioDefinition& scenario,
                                       const ScenarioSource& load,
                                       std::set<std::string>& visited,
                                       std::vector<ConnectionRef>& pairs) {
    visited.insert(scenario.test_id);
    auto add = [&pairs](const std::string& target, const std::string& protocol) {
        ConnectionRef ref{target.empty() ? std::string{kLocalTarget} : target, protocol};
        if (std::find(pairs.begin(), pairs.end(), ref) == pairs.end()) {
            pairs.push_back(std::move(ref));
        }
    };
    for (const auto& container : scenario.containers) {
        add(container.connection, container.connection_type);
    }
    for (const auto& step : scenario.steps) {
        if (step.step_type != StepType::invoke_scenario) {
            add(step.connection, step.connection_type);
            continue;
        }
        if (!load) {
            continue;
        }
        std::shared_ptr<const ScenarioDefinition> child;
        try {
            child = load(resolve_path(step.scenario_path, scenario));
        } catch (const ConfigError& e) {
            // The invoking step reports this again as a config error when it runs.
            CPACT_LOG_WARN("[{}] step {}: connections of '{}' not collected: {}", scenario.test_id, step.step_id,
                           step.scenario_path, e.what());
            continue;
        }
        if (child && visited.count(child->test_id) == 0) {
            collect_connections(*child, load, visited, pairs);
        }
    }
}

std::filesystem::path Orchestrator::resolve_path(const std::string& scenario_path, const ScenarioDefinition& caller) {
    const std::filesystem::path requested{scenario_path};
    if (requested.is_absolute() || caller.source_file.empty()) {
        return requested;
    }
    const auto beside = caller.source_file.parent_path() / requested;
    if (std::filesystem::exists(beside)) {
        return beside;
    }
    return requested;
}

std::shared_ptr<const ScenarioDefinition> Orchestrator::resolve(const std::string& scenario_path,
                                                                const ScenarioDefinition& caller) const {
    return config_.load_scenario(resolve_path(scenario_path, caller));
}

}  // namespace cpact
