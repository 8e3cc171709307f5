#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace lspbridge {

// One diagnostic per line as "severity[line:col]: message", 1-based positions.
// A diagnostic without a severity is printed as "info".
std::string formatDiagnostic(const Diagnostic &diagnostic);
std::string formatDiagnostics(const DiagnosticList &diagnostics);

DiagnosticList filterBySeverity(const DiagnosticList &diagnostics,
                                DiagnosticSeverity severity);

nlohmann::json diagnosticsToJson(const DiagnosticList &diagnostics);

} // namespace lspbridge
