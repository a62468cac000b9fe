#include "cpact/schema_gate.hpp"

#include <algorithm>
#include <cmath>
#include <set>

#include "cpact/connection_config.hpp"
#include "cpact/errors.hpp"
#include "cpact/logging.hpp"

namespace {

using nlohmann::json;

constexpr const char* kScenarioSchema = R"json({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "$id": "scenario_recipe_schema_0.7",
  "type": "object",
  "required": ["test_scenario"],
  "properties": {
    "test_scenario": {
      "type": "object",
      "required": ["test_id", "test_name", "test_steps"],
      "additionalProperties": false,
      "properties": {
        "test_id": {"type": ["string", "integer"], "minLength": 1},
        "test_name": {"type": "string", "minLength": 1},
        "test_group": {"type": "string"},
        "description": {"type": "string"},
        "tags": {"type": "array", "items": {"type": "string"}},
        "docker": {
          "type": "array",
          "items": {
            "type": "object",
            "required": ["container_name"],
            "additionalProperties": false,
            "properties": {
              "container_name": {"type": "string", "minLength": 1},
              "container_image": {"type": "string", "minLength": 1},
              "image": {"type": "string", "minLength": 1},
              "connection": {"type": "string"},
              "connection_type": {"type": "string"},
              "container_location": {"type": "string"},
              "use_sudo": {"type": "boolean"}
            }
          }
        },
        "test_steps": {
          "type": "array",
          "minItems": 1,
          "items": {
            "type": "object",
            "required": ["step_id", "step_type"],
            "additionalProperties": false,
            "properties": {
              "step_id": {"type": ["string", "integer"], "minLength": 1},
              "step_name": {"type": "string"},
              "step_type": {"enum": ["command_execution", "log_analysis", "invoke_scenario"]},
              "connection": {"type": "string"},
              "connection_type": {"type": "string"},
              "step_command": {"type": "string", "minLength": 1},
              "method": {"enum": ["GET", "POST", "PUT", "PATCH", "DELETE"]},
              "body": {"type": ["string", "object", "array"]},
              "log_analysis_path": {"type": "string", "minLength": 1},
              "scenario_path": {"type": "string", "minLength": 1},
              "validator_type": {"enum": ["json", "text", "regex", "text_regex", "exact"]},
              "expected_output": {},
              "expected_output_path": {"type": "string"},
              "entry_criteria": {"type": ["string", "array"], "items": {"type": "string"}},
              "output_analysis": {
                "type": "array",
                "items": {
                  "type": "object",
                  "required": ["regex", "parameter_to_set"],
                  "additionalProperties": false,
                  "properties": {
                    "regex": {"type": "string", "minLength": 1},
                    "parameter_to_set": {"type": "string", "minLength": 1}
                  }
                }
              },
              "diagnostic_analysis": {
                "type": "array",
                "items": {
                  "type": "object",
                  "additionalProperties": false,
                  "properties": {
                    "search_string": {"type": "string", "minLength": 1},
                    "diagnostic_search_string": {"type": "string", "minLength": 1},
                    "diagnostic_result_code": {"type": ["string", "integer"]},
                    "parameter_to_set": {"type": "string", "minLength": 1},
                    "terminal": {"type": "boolean"},
                    "severity": {"enum": ["failure", "info"]}
                  }
                }
              },
              "loop": {"type": "integer", "minimum": 1},
              "duration": {"type": "number", "minimum": 0},
              "continue": {"type": "boolean"},
              "use_sudo": {"type": "boolean"},
              "container_name": {"type": "string"},
              "export_parameters": {"type": ["boolean", "array"], "items": {"type": "string"}}
            }
          }
        }
      }
    }
  }
})json";

constexpr const char* kConnectionConfigSchema = R"json({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "$id": "connection_config_schema",
  "type": "object",
  "properties": {
    "Connection": {
      "type": "object",
      "properties": {
        "use_ssl": {"type": "boolean"},
        "connections": {"type": "array", "items": {"type": "string", "minLength": 1}},
        "connection_types": {"type": "array", "items": {"enum": ["local", "ssh", "redfish"]}}
      }
    }
  },
  "additionalProperties": {"type": "object"}
})json";

std::string type_of(const json& node) {
    switch (node.type()) {
    case json::value_t::null:
        return "null";
    case json::value_t::object:
        return "object";
    case json::value_t::array:
        return "array";
    case json::value_t::string:
        return "string";
    case json::value_t::boolean:
        return "boolean";
    case json::value_t::number_integer:
    case json::value_t::number_unsigned:
        return "integer";
    case json::value_t::number_float:
        return "number";
    default:
        return "unknown";
    }
}

bool has_type(const json& node, const std::string& type) {
    if (type == "number") {
        return node.is_number();
    }
    if (type == "integer") {
        if (node.is_number_integer()) {
            return true;
        }
        return node.is_number_float() && std::floor(node.get<double>()) == node.get<double>();
    }
    return type_of(node) == type;
}

std::string join_path(const std::string& path, const std::string& key) {
    return path.empty() ? key : path + "." + key;
}

void check(const json& schema, const json& node, const std::string& path, std::vector<std::string>& problems) {
    if (!schema.is_object()) {
        return;
    }
    const auto where = path.empty() ? std::string{"<root>"} : path;

    if (const auto it = schema.find("type"); it != schema.end()) {
        std::vector<std::string> allowed;
        if (it->is_array()) {
            for (const auto& entry : *it) {
                allowed.push_back(entry.get<std::string>());
            }
        } else {
            allowed.push_back(it->get<std::string>());
        }
        const bool ok = std::any_of(allowed.begin(), allowed.end(),
                                    [&](const std::string& type) { return has_type(node, type); });
        if (!ok) {
            std::string expected;
            for (const auto& type : allowed) {
                expected += expected.empty() ? type : " or " + type;
            }
            problems.push_back(where + ": expected " + expected + ", got " + type_of(node));
            return;
        }
    }

    if (const auto it = schema.find("enum"); it != schema.end() && it->is_array()) {
        if (std::find(it->begin(), it->end(), node) == it->end()) {
            problems.push_back(where + ": " + node.dump() + " is not one of " + it->dump());
        }
    }

    if (node.is_string()) {
        if (const auto it = schema.find("minLength"); it != schema.end()) {
            if (node.get<std::string>().size() < it->get<std::size_t>()) {
                problems.push_back(where + ": shorter than " + it->dump() + " character(s)");
            }
        }
    }

    if (node.is_number()) {
        if (const auto it = schema.find("minimum"); it != schema.end()) {
            if (node.get<double>() < it->get<double>()) {
                problems.push_back(where + ": " + node.dump() + " is less than the minimum of " + it->dump());
            }
        }
    }

    if (node.is_array()) {
        if (const auto it = schema.find("minItems"); it != schema.end()) {
            if (node.size() < it->get<std::size_t>()) {
                problems.push_back(where + ": expected at least " + it->dump() + " item(s)");
            }
        }
        if (const auto it = schema.find("items"); it != schema.end()) {
            for (std::size_t index = 0; index < node.size(); ++index) {
                check(*it, node[index], path + "[" + std::to_string(index) + "]", problems);
            }
        }
    }

    if (node.is_object()) {
        if (const auto it = schema.find("required"); it != schema.end()) {
            for (const auto& key : *it) {
                if (!node.contains(key.get<std::string>())) {
                    problems.push_back(where + ": '" + key.get<std::string>() + "' is a required property");
                }
            }
        }
        const auto properties = schema.find("properties");
        const auto additional = schema.find("additionalProperties");
        for (const auto& [key, value] : node.items()) {
            if (properties != schema.end() && properties->contains(key)) {
                check((*properties)[key], value, join_path(path, key), problems);
                continue;
            }
            if (additional == schema.end()) {
                continue;
            }
            if (additional->is_boolean()) {
                if (!additional->get<bool>()) {
                    problems.push_back(where + ": additional property '" + key + "' is not allowed");
                }
            } else {
                check(*additional, value, join_path(path, key), problems);
            }
        }
    }
}

}  // namespace

namespace cpact {

SchemaValidator::SchemaValidator(nlohmann::json schema) : schema_(std::move(schema)) {
    if (!schema_.is_object()) {
        throw ConfigError("A JSON schema must be an object");
    }
}

std::vector<std::string> SchemaValidator::validate(const nlohmann::json& document) const {
    std::vector<std::string> problems;
    ::check(schema_, document, {}, problems);
    return problems;
}

SchemaValidator SchemaValidator::scenario() {
    return SchemaValidator(json::parse(kScenarioSchema));
}

SchemaValidator SchemaValidator::connection_config() {
    return SchemaValidator(json::parse(kConnectionConfigSchema));
}

SchemaValidator SchemaValidator::from_file(const std::filesystem::path& file) {
    const auto content = read_text_file(file);
    try {
        return SchemaValidator(json::parse(content));
    } catch (const json::parse_error& e) {
        throw ConfigError("Schema file is not valid JSON: " + file.string() + ": " + e.what());
    }
}

std::shared_ptr<const ScenarioDefinition> ScenarioCache::lookup(const std::filesystem::path& file,
                                                                std::uint64_t fingerprint) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(file.lexically_normal().string());
    if (it == entries_.end()) {
        ++misses_;
        return nullptr;
    }
    if (it->second->fingerprint != fingerprint) {
        CPACT_LOG_DEBUG("Scenario {} changed on disk, cached definition dropped", file.string());
        entries_.erase(it);
        ++misses_;
        return nullptr;
    }
    ++hits_;
    return it->second;
}

void ScenarioCache::store(const std::filesystem::path& file, std::shared_ptr<const ScenarioDefinition> scenario) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[file.lexically_normal().string()] = std::move(scenario);
}

void ScenarioCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

std::size_t ScenarioCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::size_t ScenarioCache::hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

std::size_t ScenarioCache::misses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

SchemaGate::SchemaGate() : SchemaGate(Options{}) {}

SchemaGate::SchemaGate(Options options)
    : options_(std::move(options)),
      validator_(options_.schema_file ? SchemaValidator::from_file(*options_.schema_file)
                                      : SchemaValidator::scenario()) {}

std::shared_ptr<const ScenarioDefinition> SchemaGate::admit(const std::filesystem::path& file) {
    const auto content = read_text_file(file);
    const auto fingerprint = ScenarioLoader::fingerprint(content);
    if (auto cached = cache_.lookup(file, fingerprint)) {
        return cached;
    }

    const auto document = loader_.parse_text(content, file);
    if (options_.validate_schema) {
        auto problems = validator_.validate(document);
        if (!problems.empty()) {
            throw SchemaError(file.string(), std::move(problems));
        }
    }
    auto scenario = std::make_shared<ScenarioDefinition>(loader_.parse(document, file));
    scenario->fingerprint = fingerprint;
    CPACT_LOG_DEBUG("Admitted scenario {} from {}", scenario->test_id, file.string());

    std::shared_ptr<const ScenarioDefinition> admitted = std::move(scenario);
    cache_.store(file, admitted);
    return admitted;
}

std::vector<std::shared_ptr<const ScenarioDefinition>> SchemaGate::admit_all(
    const std::vector<std::filesystem::path>& files) {
    std::vector<std::shared_ptr<const ScenarioDefinition>> scenarios;
    std::map<std::string, std::filesystem::path> owners;
    std::vector<std::string> problems;
    for (const auto& file : files) {
        auto scenario = admit(file);
        const auto [it, inserted] = owners.emplace(scenario->test_id, file);
        if (!inserted) {
            problems.push_back("test_id '" + scenario->test_id + "' is defined in both " + it->second.string() +
                               " and " + file.string());
            continue;
        }
        scenarios.push_back(std::move(scenario));
    }
    if (!problems.empty()) {
        throw SchemaError("scenario set", std::move(problems));
    }
    return scenarios;
}

std::vector<std::string> SchemaGate::check(const std::filesystem::path& file) const {
    const auto document = loader_.read_document(file);
    auto problems = validator_.validate(document);
    try {
        (void)loader_.parse(document, file);
    } catch (const SchemaError& e) {
        for (const auto& problem : e.problems()) {
            if (std::find(problems.begin(), problems.end(), problem) == problems.end()) {
                problems.push_back(problem);
            }
        }
    }
    return problems;
}

std::vector<std::string> check_connection_config(const std::filesystem::path& file, const SchemaValidator& validator) {
    const auto content = read_text_file(file);
    const auto document = json::parse(content, nullptr, /*allow_exceptions*/ false);
    if (document.is_discarded()) {
        return {file.string() + ": not valid JSON"};
    }
    auto problems = validator.validate(document);
    try {
        const auto config = ConnectionConfig::parse(document);
        for (const auto& name : config.connections) {
            if (config.find(name) == nullptr) {
                problems.push_back("Connection.connections: target '" + name + "' has no section");
            }
        }
    } catch (const ConfigError& e) {
        problems.emplace_back(e.what());
    }
    return problems;
}

}  // namespace cpact
