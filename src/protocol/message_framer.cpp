#include "protocol/message_framer.hpp"

#include <optional>

namespace lspbridge {

namespace {

constexpr char kHeaderSeparator[] = "\r\n\r\n";
constexpr qsizetype kHeaderSeparatorLength = 4;
constexpr char kContentLength[] = "content-length:";

std::optional<qsizetype> parseContentLength(const QByteArray &header)
{
    const QByteArray lowered = header.toLower();
    const qsizetype keyPos = lowered.indexOf(kContentLength);
    if (keyPos < 0) {
        return std::nullopt;
    }

    qsizetype pos = keyPos + static_cast<qsizetype>(sizeof(kContentLength) - 1);
    while (pos < lowered.size() && (lowered.at(pos) == ' ' || lowered.at(pos) == '\t')) {
        ++pos;
    }

    const qsizetype digitsStart = pos;
    while (pos < lowered.size() && lowered.at(pos) >= '0' && lowered.at(pos) <= '9') {
        ++pos;
    }
    if (pos == digitsStart) {
        return std::nullopt;
    }

    bool ok = false;
    const qlonglong length = lowered.mid(digitsStart, pos - digitsStart).toLongLong(&ok);
    if (!ok || length < 0 || length > kMaxMessageBytes) {
        return std::nullopt;
    }
    return static_cast<qsizetype>(length);
}

} // namespace

QByteArray encodeMessage(const QByteArray &payload)
{
    QByteArray out;
    out.reserve(payload.size() + 32);
    out.append("Content-Length: ");
    out.append(QByteArray::number(payload.size()));
    out.append(kHeaderSeparator);
    out.append(payload);
    return out;
}

QByteArray encodeJson(const nlohmann::json &message)
{
    return encodeMessage(QByteArray::fromStdString(
        message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)));
}

DecodeResult decodeMessages(const QByteArray &buffer)
{
    DecodeResult result;
    qsizetype offset = 0;

    while (true) {
        const qsizetype headerEnd = buffer.indexOf(kHeaderSeparator, offset);
        if (headerEnd < 0) {
            break;
        }

        const qsizetype bodyStart = headerEnd + kHeaderSeparatorLength;
        const auto length = parseContentLength(buffer.mid(offset, headerEnd - offset));
        if (!length) {
            // Drop the malformed header and resynchronise on the next one.
            offset = bodyStart;
            continue;
        }

        if (buffer.size() - bodyStart < *length) {
            break;
        }

        result.messages.push_back(buffer.mid(bodyStart, *length));
        offset = bodyStart + *length;
    }

    result.remaining = buffer.mid(offset);
    return result;
}

} // namespace lspbridge
