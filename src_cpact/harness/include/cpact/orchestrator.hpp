#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "cpact/cancellation.hpp"
#include "cpact/connection_registry.hpp"
#include "context.hpp"
#include "result.hpp"
#include "result_builder.hpp"
#include "scenario.hpp"
#include "schema_gate.hpp"
#include "step_executor.hpp"

namespace cpact {

/**
 * \brief Runs scenarios: sequencing, context lifetime and aggregation.
 *
 * Steps run strictly in declaration order. The first failed or errored step without
 * `continue: true` ends the scenario; the steps after it are recorded as skipped with
 * the aborted flag. Containers declared under `docker` are started before the first
 * step and always removed afterwards.
 */
class Orchestrator {
public:
    using ScenarioSource = std::function<std::shared_ptr<const ScenarioDefinition>(const std::filesystem::path&)>;

    struct Config {
        ConnectionRegistry* registry{nullptr};
        std::filesystem::path log_dir{};
        bool persist_outputs{true};
        std::chrono::milliseconds command_timeout{0};
        std::shared_ptr<CancellationToken> cancel{};
        ScenarioSource load_scenario{};          ///< defaults to an internal SchemaGate
        StepExecutor::LogReader read_log{};     ///< defaults to LogAccess
        bool manage_containers{true};
    };

    explicit Orchestrator(Config config);

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /// Runs \p scenario on top of \p parent. Throws CycleError when it is already on \p stack.
    [[nodiscard]] ScenarioResult run(const ScenarioDefinition& scenario,
                                     const ExecutionContext* parent,
                                     InvocationStack& stack) const;

    /// Top-level run with a fresh context and call chain.
    [[nodiscard]] ScenarioResult run(const ScenarioDefinition& scenario) const;

    /**
     * \brief Runs independent scenarios over \p jobs worker threads.
     *
     * Results come back in input order. When \p results is given each scenario is recorded
     * as soon as it finishes.
     */
    [[nodiscard]] std::vector<ScenarioResult> run_all(
        const std::vector<std::shared_ptr<const ScenarioDefinition>>& scenarios,
        std::size_t jobs = 1,
        ResultBuilder* results = nullptr) const;

    void cancel() noexcept { config_.cancel->cancel(); }
    [[nodiscard]] const std::shared_ptr<CancellationToken>& cancellation() const noexcept { return config_.cancel; }

    /// Distinct (connection, connection_type) pairs named by the steps and containers of \p scenario.
    [[nodiscard]] static std::vector<ConnectionRef> connections_of(const ScenarioDefinition& scenario);

    /**
     * \brief Same, including every scenario reachable through invoke_scenario steps.
     *
     * Invoked scenarios are read through \p load and visited once per test_id, so call
     * cycles terminate. A scenario that cannot be loaded is skipped with a warning.
     */
    [[nodiscard]] static std::vector<ConnectionRef> connections_of(const ScenarioDefinition& scenario,
                                                                   const ScenarioSource& load);

    /// Path of an invoke_scenario target: relative to the caller's file, else to the working directory.
    [[nodiscard]] static std::filesystem::path resolve_path(const std::string& scenario_path,
                                                            const ScenarioDefinition& caller);

private:
    static void collect_connections(const ScenarioDefinition& scenario, const ScenarioSource& load,
                                    std::set<std::string>& visited, std::vector<ConnectionRef>& pairs);

    [[nodiscard]] std::shared_ptr<const ScenarioDefinition> resolve(const std::string& scenario_path,
                                                                    const ScenarioDefinition& caller) const;

    Config config_;
    std::shared_ptr<SchemaGate> gate_;
    std::unique_ptr<StepExecutor> executor_;
};

}  // namespace cpact
