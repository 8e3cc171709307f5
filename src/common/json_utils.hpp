#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace lspbridge {

inline std::int64_t toEpochMillis(std::chrono::system_clock::time_point timestamp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               timestamp.time_since_epoch())
        .count();
}

inline std::chrono::system_clock::time_point fromEpochMillis(std::int64_t millis)
{
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(millis));
}

inline std::string toSeverityString(DiagnosticSeverity severity)
{
    switch (severity) {
    case DiagnosticSeverity::Error:
        return "error";
    case DiagnosticSeverity::Warning:
        return "warning";
    case DiagnosticSeverity::Information:
        return "info";
    case DiagnosticSeverity::Hint:
        return "hint";
    }
    return "info";
}

inline void to_json(nlohmann::json &j, const DaemonRecord &record)
{
    j = nlohmann::json{
        {"pid", record.pid},
        {"port", record.port},
        {"projectPath", record.projectPath},
        {"startedAt", toEpochMillis(record.startedAt)},
        {"initialized", record.initialized}
    };
}

// Throws nlohmann::json::exception when a required field is missing or mistyped.
inline void from_json(const nlohmann::json &j, DaemonRecord &record)
{
    record.pid = j.at("pid").get<std::int64_t>();
    record.port = j.at("port").get<int>();
    record.projectPath = j.value("projectPath", "");
    record.startedAt = fromEpochMillis(j.value("startedAt", std::int64_t{0}));
    record.initialized = j.value("initialized", false);
}

inline void to_json(nlohmann::json &j, const Position &position)
{
    j = nlohmann::json{{"line", position.line}, {"character", position.character}};
}

inline void from_json(const nlohmann::json &j, Position &position)
{
    position.line = j.value("line", 0);
    position.character = j.value("character", 0);
}

inline void to_json(nlohmann::json &j, const Range &range)
{
    j = nlohmann::json{{"start", range.start}, {"end", range.end}};
}

inline void from_json(const nlohmann::json &j, Range &range)
{
    if (j.contains("start") && j.at("start").is_object()) {
        range.start = j.at("start").get<Position>();
    }
    if (j.contains("end") && j.at("end").is_object()) {
        range.end = j.at("end").get<Position>();
    }
}

inline void to_json(nlohmann::json &j, const Diagnostic &diagnostic)
{
    j = nlohmann::json{
        {"range", diagnostic.range},
        {"message", diagnostic.message}
    };
    if (diagnostic.severity) {
        j["severity"] = static_cast<int>(*diagnostic.severity);
    }
    if (diagnostic.code) {
        j["code"] = *diagnostic.code;
    }
    if (diagnostic.source) {
        j["source"] = *diagnostic.source;
    }
}

inline void from_json(const nlohmann::json &j, Diagnostic &diagnostic)
{
    if (j.contains("range") && j.at("range").is_object()) {
        diagnostic.range = j.at("range").get<Range>();
    }
    diagnostic.severity.reset();
    if (j.contains("severity") && j.at("severity").is_number_integer()) {
        const int value = j.at("severity").get<int>();
        if (value >= 1 && value <= 4) {
            diagnostic.severity = static_cast<DiagnosticSeverity>(value);
        }
    }
    diagnostic.code.reset();
    if (j.contains("code")) {
        const auto &code = j.at("code");
        if (code.is_string()) {
            diagnostic.code = code.get<std::string>();
        } else if (code.is_number()) {
            diagnostic.code = code.dump();
        }
    }
    diagnostic.source.reset();
    if (j.contains("source") && j.at("source").is_string()) {
        diagnostic.source = j.at("source").get<std::string>();
    }
    diagnostic.message = j.value("message", "");
}

} // namespace lspbridge
