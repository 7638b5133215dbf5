#include "daemon/process_classifier.hpp"

#include <utility>

#include "daemon/browser_names.hpp"

namespace apptrail {

namespace {

const std::set<ProcessId> kReservedIds = {0, 2, 4};

const std::set<std::string> kSystemNames = {
    "system",
    "system idle process",
    "kthreadd",
};

const std::set<std::string> kServiceAccounts = {
    "system",
    "local service",
    "network service",
    "root",
    "daemon",
    "messagebus",
    "nobody",
};

std::string accountName(const std::string &owner)
{
    // "NT AUTHORITY\SYSTEM" style owners compare by their last component.
    const auto slash = owner.rfind('\\');
    const std::string account = slash == std::string::npos ? owner : owner.substr(slash + 1);
    return toLowerAscii(account);
}

} // namespace

std::set<std::string> defaultIgnoreNames()
{
    return {
        "conhost.exe",
        "netsh.exe",
        "wslhost.exe",
        "wslrelay.exe",
        "vmmemwsl",
        "vmwp.exe",
        "git.exe",
        "git-remote-https.exe",
        "git-credential-manager.exe",
        "sh.exe",
        "sh",
        "bash",
        "dash",
        "git",
        "git-remote-http",
        "git-credential-manager",
        "ssh",
        "sleep",
        "cat",
        "grep",
        "sed",
        "ps",
        "kworker",
        "dbus-daemon",
        "xdg-desktop-portal",
    };
}

ProcessClassifier::ProcessClassifier(ProcessTable &table, ClassifierOptions options)
    : m_table(table)
    , m_options(std::move(options))
{
    std::set<std::string> ignore;
    for (const auto &name : m_options.ignoreNames) {
        ignore.insert(toLowerAscii(name));
    }
    m_options.ignoreNames = std::move(ignore);

    std::set<std::string> whitelist;
    for (const auto &name : m_options.whitelist) {
        whitelist.insert(toLowerAscii(name));
    }
    m_options.whitelist = std::move(whitelist);
}

bool ProcessClassifier::isSystem(ProcessId id, const std::string &name,
                                 const std::optional<std::string> &owner)
{
    if (kReservedIds.contains(id)) {
        return true;
    }
    if (kSystemNames.contains(toLowerAscii(name))) {
        return true;
    }
    if (owner.has_value() && !owner->empty()) {
        const std::string account = accountName(*owner);
        if (kServiceAccounts.contains(account) || account.rfind("systemd-", 0) == 0) {
            return true;
        }
    }
    return false;
}

bool ProcessClassifier::isSuppressedChild(ProcessId id, const std::string &name) const
{
    if (!isMultiProcessBrowser(name)) {
        return false;
    }

    const auto arguments = m_table.launchArguments(id);
    if (!arguments.isOk()) {
        // Exited or protected: keep the launch rather than lose it.
        return false;
    }

    for (const auto &argument : arguments.value) {
        if (argument.rfind("--type=", 0) != 0) {
            continue;
        }
        return argument != "--type=browser";
    }
    return false;
}

bool ProcessClassifier::isGui(ProcessId id, const std::string &name,
                              const TopLevelWindowSet &windows) const
{
    return windows.contains(id) || isWhitelisted(name);
}

bool ProcessClassifier::isWhitelisted(const std::string &name) const
{
    return m_options.whitelist.contains(toLowerAscii(name));
}

bool ProcessClassifier::isIgnored(const std::string &name) const
{
    if (m_options.guiOnly) {
        return false;
    }
    const std::string lowered = toLowerAscii(name);
    return m_options.ignoreNames.contains(lowered) && !m_options.whitelist.contains(lowered);
}

ClassifierVerdict ProcessClassifier::classifyExited(const ProcessRecord &record,
                                                    const TopLevelWindowSet &windows) const
{
    if (!m_options.includeSystem && isSystem(record.id, record.name, record.owner)) {
        return ClassifierVerdict::System;
    }
    if (isIgnored(record.name)) {
        return ClassifierVerdict::Ignored;
    }
    if (m_options.guiOnly && !isGui(record.id, record.name, windows)) {
        return ClassifierVerdict::NotGui;
    }
    return ClassifierVerdict::Accept;
}

ClassifierVerdict ProcessClassifier::classify(const ProcessRecord &record,
                                              const TopLevelWindowSet &windows) const
{
    const ClassifierVerdict verdict = classifyExited(record, windows);
    if (verdict != ClassifierVerdict::Accept) {
        return verdict;
    }
    if (isSuppressedChild(record.id, record.name)) {
        return ClassifierVerdict::SuppressedChild;
    }
    return ClassifierVerdict::Accept;
}

const ClassifierOptions &ProcessClassifier::options() const
{
    return m_options;
}

std::string toVerdictString(ClassifierVerdict verdict)
{
    switch (verdict) {
    case ClassifierVerdict::Accept:
        return "accept";
    case ClassifierVerdict::System:
        return "system";
    case ClassifierVerdict::Ignored:
        return "ignored";
    case ClassifierVerdict::NotGui:
        return "not_gui";
    case ClassifierVerdict::SuppressedChild:
        return "suppressed_child";
    }
    return "accept";
}

} // namespace apptrail
