#pragma once

#include <string>

namespace apptrail {

std::string toLowerAscii(std::string value);

// Browsers whose window titles carry a page title ("<page> - Google Chrome").
bool isKnownBrowser(const std::string &processName);

// Chromium-family browsers that spawn helper processes tagged with --type=.
bool isMultiProcessBrowser(const std::string &processName);

// Strip the browser suffixes from a window title. Suffixes are removed
// repeatedly until none matches, so applying this twice changes nothing.
std::string stripBrowserSuffix(const std::string &title);

} // namespace apptrail
