#include "client/diagnostic_format.hpp"

#include <algorithm>
#include <iterator>

#include "common/json_utils.hpp"

namespace lspbridge {

std::string formatDiagnostic(const Diagnostic &diagnostic)
{
    const DiagnosticSeverity severity =
        diagnostic.severity.value_or(DiagnosticSeverity::Information);
    return toSeverityString(severity)
        + "[" + std::to_string(diagnostic.range.start.line + 1)
        + ":" + std::to_string(diagnostic.range.start.character + 1)
        + "]: " + diagnostic.message;
}

std::string formatDiagnostics(const DiagnosticList &diagnostics)
{
    std::string out;
    for (const auto &diagnostic : diagnostics) {
        out += formatDiagnostic(diagnostic);
        out += '\n';
    }
    return out;
}

DiagnosticList filterBySeverity(const DiagnosticList &diagnostics,
                                DiagnosticSeverity severity)
{
    DiagnosticList filtered;
    std::copy_if(diagnostics.begin(), diagnostics.end(), std::back_inserter(filtered),
                 [severity](const Diagnostic &diagnostic) {
                     return diagnostic.severity == severity;
                 });
    return filtered;
}

nlohmann::json diagnosticsToJson(const DiagnosticList &diagnostics)
{
    nlohmann::json array = nlohmann::json::array();
    for (const auto &diagnostic : diagnostics) {
        array.push_back(diagnostic);
    }
    return array;
}

} // namespace lspbridge
