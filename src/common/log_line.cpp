#include "common/log_line.hpp"

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"

namespace apptrail {

namespace {

constexpr const char *kSeparator = " | ";
constexpr size_t kTimestampLength = 19;

std::optional<std::string> jsonValueToField(const nlohmann::json &value)
{
    if (value.is_null()) {
        return std::nullopt;
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

bool parseStructuredMessage(const std::string &message, ParsedLogLine &parsed)
{
    if (message.empty() || message.front() != '{') {
        return false;
    }
    const auto json = nlohmann::json::parse(message, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return false;
    }

    const auto type = json.find("event_type");
    if (type == json.end() || !type->is_string()) {
        return false;
    }

    parsed.eventType = type->get<std::string>();
    for (auto it = json.begin(); it != json.end(); ++it) {
        if (it.key() == "event_type") {
            continue;
        }
        parsed.fields[fromStructuredKey(it.key())] = jsonValueToField(it.value());
    }
    parsed.structured = true;
    return true;
}

bool parseKeyValueMessage(const std::string &message, ParsedLogLine &parsed)
{
    size_t pos = 0;
    bool first = true;
    while (pos < message.size()) {
        const size_t end = message.find(' ', pos);
        const std::string token = message.substr(pos, end == std::string::npos ? std::string::npos
                                                                                : end - pos);
        pos = end == std::string::npos ? message.size() : end + 1;
        if (token.empty()) {
            continue;
        }
        if (first) {
            parsed.eventType = token;
            first = false;
            continue;
        }
        const size_t eq = token.find('=');
        if (eq == std::string::npos || eq == 0) {
            // Free text in legacy lines.
            continue;
        }
        parsed.fields[token.substr(0, eq)] = unescapeFieldValue(token.substr(eq + 1));
    }
    return !first;
}

} // namespace

std::string escapeFieldValue(const std::optional<std::string> &value)
{
    if (!value.has_value()) {
        return "?";
    }
    if (*value == "?") {
        return "\\?";
    }

    std::string out;
    out.reserve(value->size());
    for (char c : *value) {
        switch (c) {
        case '\\':
            out += "\\\\";
            break;
        case ' ':
            out += "\\s";
            break;
        case '\t':
            out += "\\t";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        default:
            out += c;
        }
    }
    return out;
}

std::optional<std::string> unescapeFieldValue(const std::string &encoded)
{
    if (encoded == "?") {
        return std::nullopt;
    }

    std::string out;
    out.reserve(encoded.size());
    for (size_t i = 0; i < encoded.size(); ++i) {
        const char c = encoded[i];
        if (c != '\\' || i + 1 == encoded.size()) {
            out += c;
            continue;
        }
        const char next = encoded[++i];
        switch (next) {
        case 's':
            out += ' ';
            break;
        case 't':
            out += '\t';
            break;
        case 'n':
            out += '\n';
            break;
        case 'r':
            out += '\r';
            break;
        case '\\':
        case '?':
            out += next;
            break;
        default:
            // Unknown escape: keep it verbatim.
            out += '\\';
            out += next;
        }
    }
    return out;
}

std::string formatEventMessage(const MonitorEvent &event, LineFormat format)
{
    if (format == LineFormat::Json) {
        return toJsonMessage(event).dump();
    }

    std::string message = toEventTypeString(event.type);
    for (const auto &field : event.fields) {
        message += ' ';
        message += field.key;
        message += '=';
        message += escapeFieldValue(field.value);
    }
    return message;
}

std::string formatEventLine(const MonitorEvent &event, LineFormat format)
{
    return toLocalTimestamp(event.timestamp) + kSeparator + toLevelString(event.level)
        + kSeparator + formatEventMessage(event, format);
}

std::optional<ParsedLogLine> parseLogLine(const std::string &line)
{
    std::string trimmed = line;
    while (!trimmed.empty() && (trimmed.back() == '\n' || trimmed.back() == '\r')) {
        trimmed.pop_back();
    }
    if (trimmed.size() < kTimestampLength) {
        return std::nullopt;
    }

    const auto timestamp = fromLocalTimestamp(trimmed.substr(0, kTimestampLength));
    if (!timestamp) {
        return std::nullopt;
    }

    const std::string separator(kSeparator);
    if (trimmed.compare(kTimestampLength, separator.size(), separator) != 0) {
        return std::nullopt;
    }
    const size_t levelStart = kTimestampLength + separator.size();
    const size_t levelEnd = trimmed.find(separator, levelStart);
    if (levelEnd == std::string::npos) {
        return std::nullopt;
    }

    ParsedLogLine parsed;
    parsed.timestamp = *timestamp;
    parsed.level = trimmed.substr(levelStart, levelEnd - levelStart);

    const std::string message = trimmed.substr(levelEnd + separator.size());
    if (parseStructuredMessage(message, parsed)) {
        return parsed;
    }
    parsed.fields.clear();
    if (!parseKeyValueMessage(message, parsed)) {
        return std::nullopt;
    }
    return parsed;
}

} // namespace apptrail
