#pragma once

#include <vector>

#include <QByteArray>

#include <nlohmann/json.hpp>

namespace lspbridge {

// Largest payload a header may announce before it is treated as corrupt.
constexpr qsizetype kMaxMessageBytes = 64 * 1024 * 1024;

struct DecodeResult {
    std::vector<QByteArray> messages;
    QByteArray remaining;
};

// Prefix |payload| with a Content-Length header and the blank-line separator.
QByteArray encodeMessage(const QByteArray &payload);
QByteArray encodeJson(const nlohmann::json &message);

// Extract every complete message from |buffer|. A partial trailing message is
// returned untouched in |remaining|; unparseable headers are skipped.
DecodeResult decodeMessages(const QByteArray &buffer);

} // namespace lspbridge
