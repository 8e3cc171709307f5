#pragma once

namespace lspbridge {

// Wire values follow the protocol's DiagnosticSeverity numbering.
enum class DiagnosticSeverity {
    Error = 1,
    Warning = 2,
    Information = 3,
    Hint = 4
};

} // namespace lspbridge
