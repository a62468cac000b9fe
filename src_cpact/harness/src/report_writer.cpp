#include "cpact/report_writer.hpp"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "cpact/errors.hpp"
#include "cpact/logging.hpp"

namespace {

void ensure_parent(const std::filesystem::path& destination) {
    const auto parent = destination.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::filesystem::create_directories(parent);
    }
}

void write_file(const std::filesystem::path& destination, const std::string& content) {
    ensure_parent(destination);
    std::ofstream output(destination, std::ios::binary);
    if (!output.is_open()) {
        throw cpact::Error("Unable to open output file: " + destination.string());
    }
    output << content;
}

}  // namespace

namespace cpact {

void ReportWriter::write_results(const std::filesystem::path& destination, const ResultBuilder& results) const {
    write_file(destination, results.to_json().dump(2));
    CPACT_LOG_INFO("Results written to {}", destination.string());
}

void ReportWriter::write_diagnostics(const std::filesystem::path& destination,
                                     const ResultBuilder& results) const {
    write_file(destination, results.diagnostics_json().dump(2));
    CPACT_LOG_DEBUG("Diagnostic codes written to {}", destination.string());
}

void ReportWriter::write_json(const std::filesystem::path& destination, const nlohmann::json& document) const {
    write_file(destination, document.dump(2));
    CPACT_LOG_INFO("Report written to {}", destination.string());
}

void ReportWriter::write_all(const std::filesystem::path& log_dir, const ResultBuilder& results) const {
    write_results(log_dir / "test_results.json", results);
    write_diagnostics(log_dir / "diagnostics_codes.json", results);
}

std::string ReportWriter::console_line(const Summary& summary) {
    std::ostringstream oss;
    oss << "PASS: " << summary.passed << " FAIL: " << summary.failed << " SKIP: " << summary.skipped
        << " ERROR: " << summary.errors;
    return oss.str();
}

}  // namespace cpact
