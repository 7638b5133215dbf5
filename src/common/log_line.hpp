#pragma once

#include <optional>
#include <string>

#include "common/enums.hpp"
#include "common/models.hpp"

namespace apptrail {

// key=value value encoding. Absent values are a bare "?", a literal "?" is
// "\?"; backslash, space, tab, newline and carriage return are escaped so a
// value never contains a raw separator.
std::string escapeFieldValue(const std::optional<std::string> &value);
std::optional<std::string> unescapeFieldValue(const std::string &encoded);

// The message part of a line, without timestamp and level.
std::string formatEventMessage(const MonitorEvent &event, LineFormat format);

// "<yyyy-MM-dd HH:mm:ss> | <LEVEL> | <message>"
std::string formatEventLine(const MonitorEvent &event, LineFormat format);

// Reads either message form. Returns nullopt for lines that are not event
// lines (blank, boundary markers, hour headers, truncated writes).
std::optional<ParsedLogLine> parseLogLine(const std::string &line);

} // namespace apptrail
