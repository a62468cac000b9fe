#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "result_builder.hpp"

namespace cpact {

/**
 * \brief Emits machine-readable reports for a run.
 *
 * - write_results(): summary and per-scenario results (`test_results.json`).
 * - write_diagnostics(): diagnostic codes and parameters per step (`diagnostics_codes.json`).
 * - console_line(): one-line tally for the terminal.
 */
class ReportWriter {
public:
    ReportWriter() = default;

    void write_results(const std::filesystem::path& destination, const ResultBuilder& results) const;

    void write_diagnostics(const std::filesystem::path& destination, const ResultBuilder& results) const;

    /// Any other report document, e.g. the connection discovery report.
    void write_json(const std::filesystem::path& destination, const nlohmann::json& document) const;

    /// Writes both files into \p log_dir under their default names.
    void write_all(const std::filesystem::path& log_dir, const ResultBuilder& results) const;

    [[nodiscard]] static std::string console_line(const Summary& summary);
};

}  // namespace cpact
