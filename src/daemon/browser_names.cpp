#include "daemon/browser_names.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace apptrail {

namespace {

// Process names come from /proc comm, which the kernel cuts to 15 bytes.
constexpr std::array<std::string_view, 14> kKnownBrowsers = {
    "chrome.exe",
    "msedge.exe",
    "brave.exe",
    "firefox.exe",
    "chrome",
    "google-chrome",
    "chromium",
    "chromium-browse",
    "msedge",
    "microsoft-edge",
    "brave",
    "brave-browser",
    "firefox",
    "firefox-esr",
};

constexpr std::array<std::string_view, 9> kMultiProcessBrowsers = {
    "chrome.exe",
    "msedge.exe",
    "brave.exe",
    "msedgewebview2.exe",
    "chrome",
    "chromium",
    "chromium-browse",
    "msedge",
    "brave",
};

// Firefox on Linux separates with an em dash, the others with a hyphen.
constexpr std::array<std::string_view, 7> kBrowserSuffixes = {
    " - Google Chrome",
    " - Chromium",
    " - Microsoft Edge",
    " - Brave",
    " - Mozilla Firefox",
    " — Mozilla Firefox",
    " — Firefox",
};

bool endsWith(const std::string &value, std::string_view suffix)
{
    return value.size() >= suffix.size()
        && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

template <size_t N>
bool containsName(const std::array<std::string_view, N> &names, const std::string &name)
{
    const std::string lowered = toLowerAscii(name);
    return std::find(names.begin(), names.end(), lowered) != names.end();
}

} // namespace

std::string toLowerAscii(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

bool isKnownBrowser(const std::string &processName)
{
    return containsName(kKnownBrowsers, processName);
}

bool isMultiProcessBrowser(const std::string &processName)
{
    return containsName(kMultiProcessBrowsers, processName);
}

std::string stripBrowserSuffix(const std::string &title)
{
    std::string page = title;
    bool stripped = true;
    while (stripped) {
        stripped = false;
        for (const auto suffix : kBrowserSuffixes) {
            if (page.size() > suffix.size() && endsWith(page, suffix)) {
                page.resize(page.size() - suffix.size());
                stripped = true;
                break;
            }
        }
    }
    return page;
}

} // namespace apptrail
