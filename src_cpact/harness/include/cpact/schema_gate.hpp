#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "scenario_loader.hpp"

namespace cpact {

inline constexpr const char* kScenarioSchemaId = "scenario_recipe_schema_0.7";

/**
 * \brief Validates documents against a JSON Schema (draft-7 subset).
 *
 * Supported keywords: `type` (name or list), `required`, `properties`,
 * `additionalProperties` (boolean or schema), `items`, `enum`, `minItems`, `minLength`,
 * `minimum`. Unknown keywords are ignored.
 */
class SchemaValidator {
public:
    explicit SchemaValidator(nlohmann::json schema);

    /// One "<path>: <message>" entry per violation; empty when the document is valid.
    [[nodiscard]] std::vector<std::string> validate(const nlohmann::json& document) const;

    [[nodiscard]] const nlohmann::json& schema() const noexcept { return schema_; }

    /// Built-in scenario_recipe_schema_0.7.
    [[nodiscard]] static SchemaValidator scenario();

    /// Built-in schema for the connection configuration file.
    [[nodiscard]] static SchemaValidator connection_config();

    /// Throws ConfigError when \p file is unreadable or not JSON.
    [[nodiscard]] static SchemaValidator from_file(const std::filesystem::path& file);

private:
    nlohmann::json schema_;
};

/**
 * \brief Parsed scenarios keyed by file, each tagged with the fingerprint of its bytes.
 *
 * A lookup with a different fingerprint invalidates the entry. Nothing is evicted
 * otherwise, so repeated loads within a run return the same definition object.
 */
class ScenarioCache {
public:
    [[nodiscard]] std::shared_ptr<const ScenarioDefinition> lookup(const std::filesystem::path& file,
                                                                   std::uint64_t fingerprint);
    void store(const std::filesystem::path& file, std::shared_ptr<const ScenarioDefinition> scenario);
    void clear();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t hits() const;
    [[nodiscard]] std::size_t misses() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<const ScenarioDefinition>> entries_;
    std::size_t hits_{0};
    std::size_t misses_{0};
};

/**
 * \brief Single entry point from scenario files to executable definitions.
 *
 * admit() reads a file, consults the cache, validates against the schema, runs the
 * loader's semantic checks and caches the result. Any problem raises SchemaError or
 * ConfigError before a step can run.
 */
class SchemaGate {
public:
    struct Options {
        std::optional<std::filesystem::path> schema_file{};  ///< overrides the built-in schema
        bool validate_schema{true};
    };

    SchemaGate();
    explicit SchemaGate(Options options);

    [[nodiscard]] std::shared_ptr<const ScenarioDefinition> admit(const std::filesystem::path& file);

    /// admit() for every file; throws SchemaError when two files share a test_id.
    [[nodiscard]] std::vector<std::shared_ptr<const ScenarioDefinition>> admit_all(
        const std::vector<std::filesystem::path>& files);

    /// Schema and semantic problems of \p file without caching it. Empty means valid.
    [[nodiscard]] std::vector<std::string> check(const std::filesystem::path& file) const;

    [[nodiscard]] const ScenarioLoader& loader() const noexcept { return loader_; }
    [[nodiscard]] ScenarioCache& cache() noexcept { return cache_; }

private:
    Options options_;
    ScenarioLoader loader_;
    SchemaValidator validator_;
    ScenarioCache cache_;
};

/// Schema and semantic problems of a connection configuration file. Empty means valid.
[[nodiscard]] std::vector<std::string> check_connection_config(const std::filesystem::path& file,
                                                               const SchemaValidator& validator);

}  // namespace cpact
