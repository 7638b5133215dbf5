#pragma once

#include <optional>
#include <set>
#include <string>

#include "common/models.hpp"
#include "daemon/process_table.hpp"

namespace apptrail {

struct ClassifierOptions {
    bool includeSystem = false;
    bool guiOnly = false;
    // Lower-case process names.
    std::set<std::string> ignoreNames;
    std::set<std::string> whitelist;
};

enum class ClassifierVerdict {
    Accept,
    System,
    Ignored,
    NotGui,
    SuppressedChild
};

std::set<std::string> defaultIgnoreNames();

class ProcessClassifier
{
public:
    ProcessClassifier(ProcessTable &table, ClassifierOptions options);

    static bool isSystem(ProcessId id, const std::string &name,
                         const std::optional<std::string> &owner);

    // Inspects launch arguments of Chromium-family processes. Failing to read
    // them never suppresses.
    bool isSuppressedChild(ProcessId id, const std::string &name) const;

    bool isGui(ProcessId id, const std::string &name, const TopLevelWindowSet &windows) const;

    bool isWhitelisted(const std::string &name) const;

    // Ignore-list rule: skipped entirely under gui_only, overridden by the whitelist.
    bool isIgnored(const std::string &name) const;

    // Full composition for a live process.
    ClassifierVerdict classify(const ProcessRecord &record, const TopLevelWindowSet &windows) const;

    // Composition for a process that has already exited: launch arguments can
    // no longer be read, so the child check is left to the caller.
    ClassifierVerdict classifyExited(const ProcessRecord &record,
                                     const TopLevelWindowSet &windows) const;

    const ClassifierOptions &options() const;

private:
    ProcessTable &m_table;
    ClassifierOptions m_options;
};

std::string toVerdictString(ClassifierVerdict verdict);

} // namespace apptrail
