#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace lspbridge {

/**
 * DaemonRecord describes one running worker. It is persisted as a small JSON
 * file per project so independent invocations can find the same worker.
 */
struct DaemonRecord {
    std::int64_t pid = 0;
    int port = 0;
    std::string projectPath;
    std::chrono::system_clock::time_point startedAt;
    bool initialized = false;
};

struct Position {
    int line = 0;
    int character = 0;
};

struct Range {
    Position start;
    Position end;
};

struct Diagnostic {
    Range range;
    std::optional<DiagnosticSeverity> severity;
    std::optional<std::string> code;
    std::optional<std::string> source;
    std::string message;
};

using DiagnosticList = std::vector<Diagnostic>;

} // namespace lspbridge
