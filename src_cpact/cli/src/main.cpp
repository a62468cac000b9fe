#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "cpact/cancellation.hpp"
#include "cpact/connection_registry.hpp"
#include "cpact/discovery.hpp"
#include "cpact/errors.hpp"
#include "cpact/logging.hpp"
#include "cpact/orchestrator.hpp"
#include "cpact/report_writer.hpp"
#include "cpact/result_builder.hpp"
#include "cpact/scenario_loader.hpp"
#include "cpact/schema_gate.hpp"
#include "cpact/text.hpp"

using cpact::ConnectionConfig;
using cpact::ConnectionRef;
using cpact::ConnectionRegistry;
using cpact::Orchestrator;
using cpact::ReportWriter;
using cpact::ResultBuilder;
using cpact::ScenarioDefinition;
using cpact::ScenarioFilter;
using cpact::SchemaGate;
using cpact::SchemaValidator;

namespace {

constexpr int kExitPassed = 0;
constexpr int kExitFailed = 1;
constexpr int kExitConfig = 2;
constexpr int kExitInternal = 3;

struct Args {
    ScenarioFilter filter;
    std::filesystem::path test_dir{"tests"};
    std::filesystem::path workspace{"workspace"};
    std::filesystem::path log_path{};
    std::optional<std::filesystem::path> conn_config;
    std::vector<std::string> schema_check;
    std::size_t jobs{1};
    bool list{false};
    bool list_with_connections{false};
    bool discover{false};
    bool run_with_discover{false};
    bool run_with_schema_check{false};
    bool verbose{false};
    bool help{false};
};

// Set once in main() before the handler is installed.
cpact::CancellationToken* g_cancel = nullptr;

extern "C" void on_interrupt(int) {
    if (g_cancel != nullptr) {
        g_cancel->cancel();
    }
}

void print_usage(const char* argv0) {
    std::cerr
        << "Compliance test scenario runner\n"
        << "Usage:\n"
        << "  " << argv0 << " [--test_dir <dir>] [--workspace <dir>] [--conn_config <file>]\n"
        << "                 [--test_id <id>] [--test_name <text>] [--test_group <group>] [--tags <t1,t2>]\n"
        << "                 [--jobs <n>] [--log-path <dir>] [--verbose]\n"
        << "  " << argv0 << " --schema_check <config|scenario> <file-or-dir> [<schema.json>]\n"
        << "\n"
        << "Options:\n"
        << "  --test_dir                             Root of the scenario documents (default: tests).\n"
        << "  --workspace                            Directory for logs and results (default: workspace).\n"
        << "  --log-path                             Log directory (default: <workspace>/logs).\n"
        << "  -cc, --conn_config                     Connection config JSON (default: $CPACT_CONN_CONFIG).\n"
        << "  --test_id, --test_name, --test_group   Scenario selection.\n"
        << "  --tags                                 Select scenarios sharing at least one tag.\n"
        << "  -l, --list / -ls, --list_scenarios     List scenarios without running them.\n"
        << "  -lsc, --list_scenarios_with_connections\n"
        << "                                         List scenarios with the connections they use.\n"
        << "  -dc, --discover_connections            Probe every configured connection and stop.\n"
        << "  -rdc, --run_with_discover_connections  Probe every configured connection, then run.\n"
        << "  --schema_check                         Validate documents against a schema and stop.\n"
        << "  -rsc, --run_with_schema_check          Validate the connection config before running.\n"
        << "  --jobs                                 Scenarios run in parallel (default: 1).\n"
        << "  --verbose                              Debug logging.\n"
        << "  -h, --help                             Show this help message.\n"
        << "\n"
        << "Exit codes: 0 all selected scenarios passed, 1 a scenario failed, 2 configuration or\n"
        << "schema error, 3 internal error.\n"
        << std::endl;
}

bool arg_eq(std::string_view a, std::string_view b) {
    return a == b;
}

bool is_flag(std::string_view token) {
    return token.size() > 1 && token.front() == '-';
}

std::string take_value(int argc, char** argv, int& i, std::string_view flag) {
    if (i + 1 >= argc) {
        throw cpact::ConfigError(std::string(flag) + " expects a value");
    }
    return argv[++i];
}

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string_view tok = argv[i];
        if (arg_eq(tok, "-h") || arg_eq(tok, "--help")) {
            args.help = true;
            break;
        } else if (arg_eq(tok, "--test_id")) {
            args.filter.test_id = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--test_name")) {
            args.filter.test_name = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--test_group")) {
            args.filter.test_group = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--tags")) {
            // Accepts both "--tags a,b" and "--tags a b".
            if (i + 1 >= argc || is_flag(argv[i + 1])) {
                throw cpact::ConfigError("--tags expects a value");
            }
            while (i + 1 < argc && !is_flag(argv[i + 1])) {
                for (auto& tag : cpact::text::split_list(argv[++i], ',')) {
                    args.filter.tags.push_back(std::move(tag));
                }
            }
        } else if (arg_eq(tok, "--test_dir")) {
            args.test_dir = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--workspace")) {
            args.workspace = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--log-path")) {
            args.log_path = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--conn_config") || arg_eq(tok, "-cc")) {
            args.conn_config = std::filesystem::path(take_value(argc, argv, i, tok));
        } else if (arg_eq(tok, "--list") || arg_eq(tok, "-l") || arg_eq(tok, "--list_scenarios") ||
                   arg_eq(tok, "-ls")) {
            args.list = true;
        } else if (arg_eq(tok, "--list_scenarios_with_connections") || arg_eq(tok, "-lsc")) {
            args.list_with_connections = true;
        } else if (arg_eq(tok, "--discover_connections") || arg_eq(tok, "-dc")) {
            args.discover = true;
        } else if (arg_eq(tok, "--run_with_discover_connections") || arg_eq(tok, "-rdc")) {
            args.run_with_discover = true;
        } else if (arg_eq(tok, "--run_with_schema_check") || arg_eq(tok, "-rsc")) {
            args.run_with_schema_check = true;
        } else if (arg_eq(tok, "--schema_check")) {
            while (i + 1 < argc && !is_flag(argv[i + 1]) && args.schema_check.size() < 3) {
                args.schema_check.emplace_back(argv[++i]);
            }
            if (args.schema_check.size() < 2) {
                throw cpact::ConfigError("--schema_check expects TYPE FILE_OR_DIR [SCHEMA_FILE]");
            }
        } else if (arg_eq(tok, "--jobs")) {
            const auto value = cpact::text::parse_number(take_value(argc, argv, i, tok));
            if (!value || *value < 1) {
                throw cpact::ConfigError("--jobs expects a positive integer");
            }
            args.jobs = static_cast<std::size_t>(*value);
        } else if (arg_eq(tok, "--verbose") || arg_eq(tok, "-v")) {
            args.verbose = true;
        } else {
            throw cpact::ConfigError("Unknown argument: " + std::string(tok));
        }
    }

    if (!args.conn_config) {
        if (const char* env = std::getenv("CPACT_CONN_CONFIG"); env != nullptr && *env != '\0') {
            args.conn_config = std::filesystem::path(env);
        }
    }
    if (args.log_path.empty()) {
        args.log_path = args.workspace / "logs";
    }
    return args;
}

/// --schema_check TYPE FILE_OR_DIR [SCHEMA]. Also accepts TYPE SCHEMA FILE_OR_DIR.
int run_schema_check(const Args& args) {
    const auto type = cpact::text::to_lower_copy(args.schema_check[0]);
    if (type != "scenario" && type != "config") {
        throw cpact::ConfigError("SCHEMA_TYPE must be 'config' or 'scenario', got '" + args.schema_check[0] + "'");
    }

    std::filesystem::path target{args.schema_check[1]};
    std::optional<std::filesystem::path> schema_file;
    if (args.schema_check.size() == 3) {
        schema_file = std::filesystem::path(args.schema_check[2]);
        const auto looks_like_schema = [](const std::filesystem::path& path) {
            return path.extension() == ".json" && path.filename().string().find("schema") != std::string::npos;
        };
        if (looks_like_schema(target) && !looks_like_schema(*schema_file)) {
            std::swap(target, *schema_file);
        }
    }
    if (!std::filesystem::exists(target)) {
        throw cpact::ConfigError("File or directory not found: " + target.string());
    }

    std::vector<std::filesystem::path> files;
    if (type == "scenario") {
        files = cpact::ScenarioLoader{}.discover(target);
    } else {
        files.push_back(target);
    }
    if (files.empty()) {
        throw cpact::ConfigError("No scenario documents found under " + target.string());
    }

    std::size_t invalid = 0;
    if (type == "scenario") {
        SchemaGate gate(SchemaGate::Options{.schema_file = schema_file, .validate_schema = true});
        for (const auto& file : files) {
            const auto problems = gate.check(file);
            invalid += problems.empty() ? 0 : 1;
            for (const auto& problem : problems) {
                CPACT_LOG_ERROR("{}: {}", file.string(), problem);
            }
            std::cout << (problems.empty() ? "VALID   " : "INVALID ") << file.string() << "\n";
        }
    } else {
        const auto validator =
            schema_file ? SchemaValidator::from_file(*schema_file) : SchemaValidator::connection_config();
        for (const auto& file : files) {
            const auto problems = cpact::check_connection_config(file, validator);
            invalid += problems.empty() ? 0 : 1;
            for (const auto& problem : problems) {
                CPACT_LOG_ERROR("{}: {}", file.string(), problem);
            }
            std::cout << (problems.empty() ? "VALID   " : "INVALID ") << file.string() << "\n";
        }
    }
    std::cout << files.size() - invalid << "/" << files.size() << " document(s) valid\n";
    return invalid == 0 ? kExitPassed : kExitConfig;
}

ConnectionConfig load_connection_config(const Args& args) {
    if (!args.conn_config) {
        CPACT_LOG_INFO("No connection config given; only the local target is available");
        return ConnectionConfig::parse(nlohmann::json::object());
    }
    if (!std::filesystem::exists(*args.conn_config)) {
        throw cpact::ConfigError("Connection config file not found: " + args.conn_config->string());
    }
    if (args.run_with_schema_check) {
        const auto problems = cpact::check_connection_config(*args.conn_config, SchemaValidator::connection_config());
        if (!problems.empty()) {
            throw cpact::SchemaError(args.conn_config->string(), problems);
        }
    }
    return ConnectionConfig::load(*args.conn_config);
}

void print_scenarios(const std::vector<std::shared_ptr<const ScenarioDefinition>>& scenarios, bool with_connections) {
    std::cout << "Scenarios: " << scenarios.size() << "\n";
    for (const auto& scenario : scenarios) {
        std::cout << "  " << scenario->test_id << "  " << scenario->test_name;
        if (!scenario->test_group.empty()) {
            std::cout << "  [" << scenario->test_group << "]";
        }
        if (!scenario->tags.empty()) {
            std::cout << "  tags:";
            for (const auto& tag : scenario->tags) {
                std::cout << " " << tag;
            }
        }
        std::cout << "  (" << scenario->source_file.string() << ")\n";
        if (with_connections) {
            for (const auto& [target, protocol] : Orchestrator::connections_of(*scenario)) {
                std::cout << "      " << target << " / " << (protocol.empty() ? "default" : protocol) << "\n";
            }
        }
    }
}

int run_discovery(ConnectionRegistry& registry, const std::filesystem::path& log_dir) {
    const auto pairs = cpact::configured_pairs(registry.config());
    const auto report = cpact::discover_connections(registry, pairs);
    registry.release_all();

    const auto document = report.to_json();
    std::cout << "Connection discovery: " << report.status << "\n";
    for (const auto& record : report.records) {
        std::cout << "  " << (record.ok ? "OK   " : "FAIL ") << record.name << " / " << record.type;
        if (!record.ok) {
            std::cout << ": " << record.detail;
        }
        std::cout << "\n";
    }
    CPACT_LOG_DEBUG("Discovery report: {}", document.dump());
    ReportWriter{}.write_json(log_dir / "connection_discovery.json", document);
    return report.status == "SUCCESS" ? kExitPassed : kExitFailed;
}

int aggregate_exit_code(const cpact::Summary& summary, bool cancelled) {
    if (cancelled || summary.failed > 0 || summary.errors > 0) {
        return kExitFailed;
    }
    return kExitPassed;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);
        if (args.help) {
            print_usage(argv[0]);
            return kExitPassed;
        }

        std::filesystem::create_directories(args.log_path);
        cpact::logging::init(args.verbose ? "debug" : "info", args.log_path);
        CPACT_LOG_INFO("Log directory: {}", args.log_path.string());

        if (!args.schema_check.empty()) {
            return run_schema_check(args);
        }

        auto cancel = std::make_shared<cpact::CancellationToken>();
        g_cancel = cancel.get();
        std::signal(SIGINT, on_interrupt);
        std::signal(SIGTERM, on_interrupt);

        ConnectionRegistry registry;
        auto config = load_connection_config(args);

        const bool list_only = args.list || args.list_with_connections;
        if ((args.discover || args.run_with_discover) && !list_only) {
            registry.initialize(config);
            const int discovered = run_discovery(registry, args.log_path);
            if (!args.run_with_discover) {
                return discovered;
            }
        }

        if (!std::filesystem::exists(args.test_dir)) {
            throw cpact::ConfigError("Test directory does not exist: " + args.test_dir.string());
        }
        auto gate = std::make_shared<SchemaGate>();
        const auto files = gate->loader().discover(args.test_dir);
        CPACT_LOG_INFO("Found {} scenario document(s) under {}", files.size(), args.test_dir.string());
        const auto admitted = gate->admit_all(files);

        std::vector<std::shared_ptr<const ScenarioDefinition>> selected;
        for (const auto& scenario : admitted) {
            if (args.filter.matches(*scenario)) {
                selected.push_back(scenario);
            }
        }

        if (list_only) {
            print_scenarios(selected, args.list_with_connections);
            return kExitPassed;
        }
        if (selected.empty()) {
            CPACT_LOG_WARN("No matching test scenarios found");
            return kExitPassed;
        }

        const Orchestrator::ScenarioSource load_scenario = [gate](const std::filesystem::path& file) {
            return gate->admit(file);
        };
        std::vector<ConnectionRef> referenced;
        for (const auto& scenario : selected) {
            for (auto& ref : Orchestrator::connections_of(*scenario, load_scenario)) {
                if (std::find(referenced.begin(), referenced.end(), ref) == referenced.end()) {
                    referenced.push_back(std::move(ref));
                }
            }
        }
        registry.initialize(std::move(config), referenced);

        Orchestrator::Config run_config;
        run_config.registry = &registry;
        run_config.log_dir = args.log_path;
        run_config.cancel = cancel;
        run_config.load_scenario = load_scenario;
        Orchestrator orchestrator(std::move(run_config));

        ResultBuilder results;
        CPACT_LOG_INFO("Running {} scenario(s) with {} job(s)", selected.size(), args.jobs);
        const auto outcomes = orchestrator.run_all(selected, args.jobs, &results);
        registry.release_all();
        g_cancel = nullptr;

        ReportWriter writer;
        writer.write_all(args.log_path, results);

        const auto summary = results.summary();
        std::cout << "Scenario results\n";
        for (const auto& outcome : outcomes) {
            std::cout << "  " << cpact::to_string(outcome.status) << "  " << outcome.test_id << "  "
                      << outcome.message << "\n";
        }
        std::cout << ReportWriter::console_line(summary) << "\n"
                  << "Artifacts:\n"
                  << "  JSON: " << (args.log_path / "test_results.json").string() << "\n"
                  << "  Diagnostics: " << (args.log_path / "diagnostics_codes.json").string() << "\n";

        return aggregate_exit_code(summary, cancel->cancelled());
    } catch (const cpact::SchemaError& ex) {
        std::cerr << "SCHEMA ERROR: " << ex.what() << "\n";
        return kExitConfig;
    } catch (const cpact::ConfigError& ex) {
        std::cerr << "CONFIG ERROR: " << ex.what() << "\n";
        print_usage(argv[0]);
        return kExitConfig;
    } catch (const std::exception& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        return kExitInternal;
    } catch (...) {
        std::cerr << "ERROR: Unknown exception\n";
        return kExitInternal;
    }
}
