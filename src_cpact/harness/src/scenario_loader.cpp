#include "cpact/scenario_loader.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <utility>

#include <yaml-cpp/yaml.h>

#include "cpact/errors.hpp"
#include "cpact/logging.hpp"
#include "cpact/text.hpp"
#include "cpact/value.hpp"

namespace {

using nlohmann::json;

const std::set<std::string> kValidatorTypes = {"", "json", "text", "regex", "text_regex", "exact"};

std::optional<bool> yaml_boolean(const std::string& raw) {
    static const std::set<std::string> kTrue = {"true", "True", "TRUE", "yes", "Yes", "YES", "on", "On", "ON"};
    static const std::set<std::string> kFalse = {"false", "False", "FALSE", "no", "No", "NO", "off", "Off", "OFF"};
    if (kTrue.count(raw) != 0) {
        return true;
    }
    if (kFalse.count(raw) != 0) {
        return false;
    }
    return std::nullopt;
}

bool looks_numeric(const std::string& raw) {
    return !raw.empty() && std::all_of(raw.begin(), raw.end(), [](char ch) {
        return (ch >= '0' && ch <= '9') || ch == '-' || ch == '+' || ch == '.' || ch == 'e' || ch == 'E';
    });
}

json scalar_to_json(const YAML::Node& node) {
    const auto& raw = node.Scalar();
    // quoted and block scalars carry the non-specific "!" tag and always stay strings
    if (node.Tag() == "!") {
        return raw;
    }
    if (raw == "~" || raw == "null" || raw == "Null" || raw == "NULL") {
        return nullptr;
    }
    if (const auto flag = yaml_boolean(raw)) {
        return *flag;
    }
    if (looks_numeric(raw)) {
        long long integer = 0;
        const auto* first = raw.data();
        const auto* last = raw.data() + raw.size();
        const auto [ptr, ec] = std::from_chars(first + (raw.front() == '+' ? 1 : 0), last, integer);
        if (ec == std::errc{} && ptr == last) {
            return integer;
        }
        if (const auto number = cpact::text::parse_number(raw)) {
            return *number;
        }
    }
    return raw;
}

json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
        return nullptr;
    case YAML::NodeType::Scalar:
        return scalar_to_json(node);
    case YAML::NodeType::Sequence: {
        json array = json::array();
        for (const auto& item : node) {
            array.push_back(yaml_to_json(item));
        }
        return array;
    }
    case YAML::NodeType::Map: {
        json object = json::object();
        for (const auto& item : node) {
            object[item.first.as<std::string>()] = yaml_to_json(item.second);
        }
        return object;
    }
    }
    return nullptr;
}

const json* find(const json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

/// Scalar as text; integral numbers without a fraction, containers as compact JSON.
std::string scalar_string(const json& node) {
    if (node.is_string()) {
        return node.get<std::string>();
    }
    if (node.is_boolean()) {
        return node.get<bool>() ? "true" : "false";
    }
    if (node.is_number_integer()) {
        return node.dump();
    }
    if (node.is_number()) {
        return cpact::Value{node.get<double>()}.to_string();
    }
    if (node.is_null()) {
        return {};
    }
    return node.dump();
}

std::string string_field(const json& object, const char* key) {
    const auto* node = find(object, key);
    return node ? scalar_string(*node) : std::string{};
}

class Problems {
public:
    void add(std::string message) { list_.push_back(std::move(message)); }
    [[nodiscard]] bool empty() const noexcept { return list_.empty(); }
    [[nodiscard]] std::vector<std::string> take() { return std::move(list_); }

private:
    std::vector<std::string> list_;
};

bool bool_field(const json& object, const char* key, const std::string& where, Problems& problems) {
    const auto* node = find(object, key);
    if (node == nullptr) {
        return false;
    }
    if (node->is_boolean()) {
        return node->get<bool>();
    }
    if (node->is_string()) {
        if (const auto parsed = cpact::text::parse_boolean(node->get<std::string>())) {
            return *parsed;
        }
    }
    problems.add(where + "." + key + ": expected a boolean");
    return false;
}

std::vector<std::string> string_list(const json& object, const char* key, const std::string& where,
                                     Problems& problems) {
    std::vector<std::string> values;
    const auto* node = find(object, key);
    if (node == nullptr) {
        return values;
    }
    if (node->is_array()) {
        for (const auto& item : *node) {
            if (item.is_object() || item.is_array()) {
                problems.add(where + "." + key + ": entries must be scalars");
                continue;
            }
            auto entry = cpact::text::trim_copy(scalar_string(item));
            if (!entry.empty()) {
                values.push_back(std::move(entry));
            }
        }
    } else if (node->is_object()) {
        problems.add(where + "." + key + ": expected a list");
    } else {
        auto entry = cpact::text::trim_copy(scalar_string(*node));
        if (!entry.empty()) {
            values.push_back(std::move(entry));
        }
    }
    return values;
}

std::vector<cpact::OutputRule> parse_output_rules(const json& step, const std::string& where, Problems& problems) {
    std::vector<cpact::OutputRule> rules;
    const auto* node = find(step, "output_analysis");
    if (node == nullptr) {
        return rules;
    }
    if (!node->is_array()) {
        problems.add(where + ".output_analysis: expected a list");
        return rules;
    }
    for (std::size_t index = 0; index < node->size(); ++index) {
        const auto& item = (*node)[index];
        const auto rule_where = where + ".output_analysis[" + std::to_string(index) + "]";
        if (!item.is_object()) {
            problems.add(rule_where + ": must be a mapping");
            continue;
        }
        cpact::OutputRule rule{string_field(item, "regex"), string_field(item, "parameter_to_set")};
        if (rule.regex.empty()) {
            problems.add(rule_where + ": regex is required");
            continue;
        }
        rules.push_back(std::move(rule));
    }
    return rules;
}

std::vector<cpact::DiagnosticRule> parse_diagnostic_rules(const json& step, const std::string& where,
                                                          Problems& problems) {
    std::vector<cpact::DiagnosticRule> rules;
    const auto* node = find(step, "diagnostic_analysis");
    if (node == nullptr) {
        return rules;
    }
    if (!node->is_array()) {
        problems.add(where + ".diagnostic_analysis: expected a list");
        return rules;
    }
    for (std::size_t index = 0; index < node->size(); ++index) {
        const auto& item = (*node)[index];
        const auto rule_where = where + ".diagnostic_analysis[" + std::to_string(index) + "]";
        if (!item.is_object()) {
            problems.add(rule_where + ": must be a mapping");
            continue;
        }
        cpact::DiagnosticRule rule;
        rule.search_string = string_field(item, "search_string");
        rule.diagnostic_search_string = string_field(item, "diagnostic_search_string");
        rule.result_code = string_field(item, "diagnostic_result_code");
        rule.parameter = string_field(item, "parameter_to_set");
        rule.terminal = bool_field(item, "terminal", rule_where, problems);
        if (const auto severity = string_field(item, "severity"); !severity.empty()) {
            rule.severity = cpact::text::to_lower_copy(severity);
            if (rule.severity != "failure" && rule.severity != "info") {
                problems.add(rule_where + ".severity: expected 'failure' or 'info'");
            }
        }
        rules.push_back(std::move(rule));
    }
    return rules;
}

std::vector<cpact::ContainerSpec> parse_containers(const json& root, Problems& problems) {
    std::vector<cpact::ContainerSpec> containers;
    const auto* node = find(root, "docker");
    if (node == nullptr) {
        return containers;
    }
    if (!node->is_array()) {
        problems.add("docker: expected a list");
        return containers;
    }
    std::set<std::string> names;
    for (std::size_t index = 0; index < node->size(); ++index) {
        const auto& item = (*node)[index];
        const auto where = "docker[" + std::to_string(index) + "]";
        if (!item.is_object()) {
            problems.add(where + ": must be a mapping");
            continue;
        }
        cpact::ContainerSpec spec;
        spec.name = string_field(item, "container_name");
        spec.image = string_field(item, "container_image");
        if (spec.image.empty()) {
            spec.image = string_field(item, "image");
        }
        if (auto connection = string_field(item, "connection"); !connection.empty()) {
            spec.connection = std::move(connection);
            spec.connection_type.clear();
        }
        if (auto type = string_field(item, "connection_type"); !type.empty()) {
            spec.connection_type = cpact::text::to_lower_copy(type);
        }
        spec.use_sudo = bool_field(item, "use_sudo", where, problems);
        if (spec.name.empty()) {
            problems.add(where + ": container_name is required");
        } else if (!names.insert(spec.name).second) {
            problems.add(where + ": duplicate container_name '" + spec.name + "'");
        }
        if (spec.image.empty()) {
            problems.add(where + ": container_image is required");
        }
        containers.push_back(std::move(spec));
    }
    return containers;
}

void check_payload(const cpact::StepDefinition& step, const std::string& where, Problems& problems) {
    switch (step.step_type) {
    case cpact::StepType::command_execution:
        if (step.command.empty()) {
            problems.add(where + ": command_execution requires step_command");
        }
        break;
    case cpact::StepType::log_analysis:
        if (step.log_path.empty()) {
            problems.add(where + ": log_analysis requires log_analysis_path");
        }
        if (step.diagnostic_analysis.empty()) {
            problems.add(where + ": log_analysis requires diagnostic_analysis");
        }
        break;
    case cpact::StepType::invoke_scenario:
        if (step.scenario_path.empty()) {
            problems.add(where + ": invoke_scenario requires scenario_path");
        }
        break;
    }
}

cpact::StepDefinition parse_step(const json& item, const std::string& where, Problems& problems) {
    cpact::StepDefinition step;
    step.step_id = cpact::text::trim_copy(string_field(item, "step_id"));
    step.step_name = string_field(item, "step_name");
    if (step.step_name.empty()) {
        step.step_name = step.step_id;
    }

    const auto raw_type = string_field(item, "step_type");
    if (const auto type = cpact::parse_step_type(raw_type)) {
        step.step_type = *type;
    } else {
        problems.add(where + ": unknown step_type '" + raw_type + "'");
    }

    step.connection = string_field(item, "connection");
    step.connection_type = cpact::text::to_lower_copy(string_field(item, "connection_type"));
    if (step.connection.empty()) {
        step.connection = "local";
    }

    step.command = string_field(item, "step_command");
    step.method = cpact::text::trim_copy(string_field(item, "method"));
    step.body = string_field(item, "body");
    step.log_path = string_field(item, "log_analysis_path");
    step.scenario_path = string_field(item, "scenario_path");

    step.validator_type = cpact::text::to_lower_copy(cpact::text::trim_copy(string_field(item, "validator_type")));
    if (kValidatorTypes.count(step.validator_type) == 0) {
        problems.add(where + ": unknown validator_type '" + step.validator_type + "'");
    }
    if (const auto* expected = find(item, "expected_output")) {
        step.expected_output = scalar_string(*expected);
    }
    step.expected_output_path = string_field(item, "expected_output_path");
    if (step.expected_output && !step.expected_output_path.empty()) {
        problems.add(where + ": expected_output and expected_output_path are mutually exclusive");
    }

    step.entry_criteria = string_list(item, "entry_criteria", where, problems);
    step.output_analysis = parse_output_rules(item, where, problems);
    step.diagnostic_analysis = parse_diagnostic_rules(item, where, problems);

    if (const auto* loop = find(item, "loop")) {
        const auto count = loop->is_number() ? std::optional<double>(loop->get<double>())
                                             : cpact::text::parse_number(scalar_string(*loop));
        if (!count || *count < 1 || *count != static_cast<double>(static_cast<int>(*count))) {
            problems.add(where + ".loop: expected a positive integer");
        } else {
            step.loop = static_cast<int>(*count);
        }
    }
    if (const auto* duration = find(item, "duration")) {
        const auto seconds = duration->is_number() ? std::optional<double>(duration->get<double>())
                                                   : cpact::text::parse_number(scalar_string(*duration));
        if (!seconds || *seconds <= 0) {
            problems.add(where + ".duration: expected a positive number of seconds");
        } else {
            step.duration = seconds;
        }
    }

    step.continue_on_failure = bool_field(item, "continue", where, problems);
    step.use_sudo = bool_field(item, "use_sudo", where, problems);
    step.container_name = string_field(item, "container_name");
    if (const auto* exported = find(item, "export_parameters")) {
        if (exported->is_boolean()) {
            if (exported->get<bool>()) {
                step.export_parameters.emplace();
            }
        } else {
            step.export_parameters = string_list(item, "export_parameters", where, problems);
        }
    }

    check_payload(step, where, problems);
    return step;
}

std::string compose_key(const std::string& line) {
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
        return {};
    }
    auto key = cpact::text::trim_copy(std::string_view{line}.substr(0, colon));
    if (key.size() >= 2 && (key.front() == '"' || key.front() == '\'') && key.back() == key.front()) {
        key = key.substr(1, key.size() - 2);
    }
    return key;
}

}  // namespace

namespace cpact {

const char* to_string(StepType type) noexcept {
    switch (type) {
    case StepType::command_execution:
        return "command_execution";
    case StepType::log_analysis:
        return "log_analysis";
    case StepType::invoke_scenario:
        return "invoke_scenario";
    }
    return "unknown";
}

std::optional<StepType> parse_step_type(const std::string& raw) {
    const auto lowered = text::to_lower_copy(text::trim_copy(raw));
    if (lowered == "command_execution") {
        return StepType::command_execution;
    }
    if (lowered == "log_analysis") {
        return StepType::log_analysis;
    }
    if (lowered == "invoke_scenario") {
        return StepType::invoke_scenario;
    }
    return std::nullopt;
}

bool ScenarioFilter::empty() const noexcept {
    return test_id.empty() && test_name.empty() && test_group.empty() && tags.empty();
}

bool ScenarioFilter::matches(const ScenarioDefinition& scenario) const {
    if (!test_id.empty() && scenario.test_id != test_id) {
        return false;
    }
    if (!test_name.empty() && !text::icontains(scenario.test_name, test_name)) {
        return false;
    }
    if (!test_group.empty() && scenario.test_group != test_group) {
        return false;
    }
    if (!tags.empty()) {
        const bool shared = std::any_of(tags.begin(), tags.end(), [&](const std::string& tag) {
            return std::find(scenario.tags.begin(), scenario.tags.end(), tag) != scenario.tags.end();
        });
        if (!shared) {
            return false;
        }
    }
    return true;
}

std::string read_text_file(const std::filesystem::path& file) {
    if (!std::filesystem::exists(file)) {
        throw ConfigError("File does not exist: " + file.string());
    }
    if (!std::filesystem::is_regular_file(file)) {
        throw ConfigError("Path is not a regular file: " + file.string());
    }
    std::ifstream input(file, std::ios::binary);
    if (!input.is_open()) {
        throw ConfigError("Unable to open file: " + file.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

nlohmann::json ScenarioLoader::read_document(const std::filesystem::path& file) const {
    return parse_text(read_text_file(file), file);
}

nlohmann::json ScenarioLoader::parse_text(const std::string& content, const std::filesystem::path& file) const {
    const auto extension = text::to_lower_copy(file.extension().string());
    if (extension == ".json") {
        try {
            return json::parse(content);
        } catch (const json::parse_error& e) {
            throw ConfigError("Invalid JSON in " + file.string() + ": " + e.what());
        }
    }
    if (extension != ".yaml" && extension != ".yml") {
        throw ConfigError("Unsupported scenario file type '" + extension + "': " + file.string());
    }

    for (const auto& warning : scan_duplicate_keys(content)) {
        CPACT_LOG_WARN("{}: {}", file.string(), warning);
    }
    try {
        return yaml_to_json(YAML::Load(content));
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid YAML in " + file.string() + ": " + e.what());
    }
}

ScenarioDefinition ScenarioLoader::parse(const nlohmann::json& document, const std::filesystem::path& source) const {
    const auto* root = document.is_object() ? find(document, "test_scenario") : nullptr;
    if (root == nullptr || !root->is_object()) {
        throw SchemaError(source.string(), {"missing 'test_scenario' mapping at the document root"});
    }

    Problems problems;
    ScenarioDefinition scenario;
    scenario.source_file = source;
    scenario.test_id = text::trim_copy(string_field(*root, "test_id"));
    scenario.test_name = string_field(*root, "test_name");
    scenario.test_group = string_field(*root, "test_group");
    scenario.description = string_field(*root, "description");
    scenario.tags = string_list(*root, "tags", "test_scenario", problems);
    scenario.containers = parse_containers(*root, problems);

    if (scenario.test_id.empty()) {
        problems.add("test_scenario.test_id is required");
    }
    if (scenario.test_name.empty()) {
        scenario.test_name = scenario.test_id;
    }

    const auto* steps = find(*root, "test_steps");
    if (steps == nullptr || !steps->is_array()) {
        problems.add("test_scenario.test_steps must be a list");
    } else {
        std::set<std::string> seen;
        for (std::size_t index = 0; index < steps->size(); ++index) {
            const auto& item = (*steps)[index];
            const auto where = "test_steps[" + std::to_string(index) + "]";
            if (!item.is_object()) {
                problems.add(where + ": must be a mapping");
                continue;
            }
            auto step = parse_step(item, where, problems);
            if (step.step_id.empty()) {
                problems.add(where + ": step_id is required");
            } else if (!seen.insert(step.step_id).second) {
                problems.add(where + ": duplicate step_id '" + step.step_id + "'");
            }
            if (!step.container_name.empty()) {
                const bool declared = std::any_of(
                    scenario.containers.begin(), scenario.containers.end(),
                    [&](const ContainerSpec& spec) { return spec.name == step.container_name; });
                if (!declared) {
                    problems.add(where + ": container '" + step.container_name + "' is not declared under docker");
                }
            }
            scenario.steps.push_back(std::move(step));
        }
    }

    if (!problems.empty()) {
        throw SchemaError(source.string(), problems.take());
    }
    return scenario;
}

ScenarioDefinition ScenarioLoader::load(const std::filesystem::path& file) const {
    const auto content = read_text_file(file);
    auto scenario = parse(parse_text(content, file), file);
    scenario.fingerprint = fingerprint(content);
    return scenario;
}

std::vector<std::filesystem::path> ScenarioLoader::discover(const std::filesystem::path& root) const {
    if (!std::filesystem::exists(root)) {
        throw ConfigError("Scenario root does not exist: " + root.string());
    }
    if (!std::filesystem::is_directory(root)) {
        return {root};
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
        if (entry.is_regular_file() && is_scenario_file(entry.path())) {
            files.emplace_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::vector<std::string> ScenarioLoader::scan_duplicate_keys(const std::string& yaml_text) {
    struct Level {
        std::size_t indent;
        std::map<std::string, std::size_t> keys;  ///< key -> first line
    };

    std::vector<std::string> duplicates;
    std::vector<Level> levels{{0, {}}};
    std::istringstream input(yaml_text);
    std::string line;
    std::size_t line_no = 0;
    std::optional<std::size_t> block_indent;  // inside a `|` or `>` block scalar

    while (std::getline(input, line)) {
        ++line_no;
        const auto first = line.find_first_not_of(" \t");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }
        if (block_indent && first > *block_indent) {
            continue;
        }
        block_indent.reset();
        const std::string_view trimmed_view = std::string_view{line}.substr(first);
        if (trimmed_view.rfind("---", 0) == 0 || trimmed_view.rfind("...", 0) == 0) {
            levels.assign(1, Level{0, {}});
            continue;
        }

        std::size_t indent = first;
        while (levels.size() > 1 && indent < levels.back().indent) {
            levels.pop_back();
        }

        std::string content{trimmed_view};
        if (content.rfind("- ", 0) == 0 || content == "-") {
            // each sequence item opens a fresh mapping
            indent += 2;
            while (levels.size() > 1 && indent <= levels.back().indent) {
                levels.pop_back();
            }
            levels.push_back(Level{indent, {}});
            content = text::trim_copy(std::string_view{content}.substr(1));
        }

        const auto key = compose_key(content);
        if (key.empty() || key.front() == '{' || key.front() == '[' || key.front() == '"' || key.front() == '\'') {
            continue;
        }
        auto& keys = levels.back().keys;
        if (const auto it = keys.find(key); it != keys.end()) {
            duplicates.push_back("duplicate key '" + key + "' at line " + std::to_string(line_no) +
                                 " (first defined at line " + std::to_string(it->second) + ")");
        } else {
            keys.emplace(key, line_no);
        }

        const auto tail = text::trim_right_copy(content);
        if (tail.back() == ':') {
            levels.push_back(Level{indent + 1, {}});
            continue;
        }
        const auto value = text::trim_copy(std::string_view{tail}.substr(tail.find(':') + 1));
        if (!value.empty() && (value.front() == '|' || value.front() == '>')) {
            block_indent = indent;
        }
    }
    return duplicates;
}

std::uint64_t ScenarioLoader::fingerprint(std::string_view bytes) noexcept {
    std::uint64_t hash = 14695981039346656037ULL;
    for (const unsigned char byte : bytes) {
        hash ^= byte;
        hash *= 1099511628211ULL;
    }
    return hash;
}

bool ScenarioLoader::is_scenario_file(const std::filesystem::path& file) {
    const auto extension = text::to_lower_copy(file.extension().string());
    return extension == ".yaml" || extension == ".yml" || extension == ".json";
}

}  // namespace cpact
