#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <QString>
#include <QStringList>

#include "common/models.hpp"
#include "common/query_result.hpp"
#include "daemon/event_log.hpp"
#include "daemon/process_table.hpp"
#include "daemon/segment_sink.hpp"
#include "daemon/window_system.hpp"

namespace apptrail::testing {

inline ProcessRecord makeRecord(ProcessId id, const std::string &name,
                                std::optional<std::string> owner = std::string("alice"),
                                std::optional<std::string> exe = std::nullopt)
{
    ProcessRecord record;
    record.id = id;
    record.name = name;
    record.owner = std::move(owner);
    record.executablePath = std::move(exe);
    record.createdAt = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000 + id));
    return record;
}

class FakeProcessTable : public ProcessTable
{
public:
    Snapshot current;
    std::map<ProcessId, std::string> exePaths;
    std::map<ProcessId, std::vector<std::string>> arguments;
    std::map<ProcessId, QueryStatus> argumentFailures;
    int exeQueries = 0;

    void add(const ProcessRecord &record)
    {
        current[record.id] = record;
    }

    void remove(ProcessId id)
    {
        current.erase(id);
    }

    Snapshot snapshot() override
    {
        return current;
    }

    QueryResult<std::string> processName(ProcessId id) override
    {
        const auto it = current.find(id);
        if (it == current.end()) {
            return QueryResult<std::string>::failure(QueryStatus::NotFound);
        }
        return QueryResult<std::string>::ok(it->second.name);
    }

    QueryResult<std::string> executablePath(ProcessId id) override
    {
        ++exeQueries;
        const auto it = exePaths.find(id);
        if (it == exePaths.end() || !current.contains(id)) {
            return QueryResult<std::string>::failure(QueryStatus::NotFound);
        }
        return QueryResult<std::string>::ok(it->second);
    }

    QueryResult<std::vector<std::string>> launchArguments(ProcessId id) override
    {
        const auto failure = argumentFailures.find(id);
        if (failure != argumentFailures.end()) {
            return QueryResult<std::vector<std::string>>::failure(failure->second);
        }
        const auto it = arguments.find(id);
        if (it == arguments.end()) {
            return QueryResult<std::vector<std::string>>::ok({});
        }
        return QueryResult<std::vector<std::string>>::ok(it->second);
    }
};

class FakeWindowSystem : public WindowSystem
{
public:
    WindowObservation foreground;
    std::vector<TopLevelWindow> windows;
    int enumerations = 0;

    void addWindow(ProcessId pid, const std::string &title, bool visible = true)
    {
        TopLevelWindow window;
        window.handle = static_cast<unsigned long>(windows.size() + 1);
        window.owningProcessId = pid;
        window.title = title;
        window.visible = visible;
        windows.push_back(window);
    }

    WindowObservation foregroundWindow() override
    {
        return foreground;
    }

    std::vector<TopLevelWindow> topLevelWindows() override
    {
        ++enumerations;
        return windows;
    }
};

class RecordingWriter : public EventWriter
{
public:
    void append(const MonitorEvent &event) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        events.push_back(event);
    }

    std::vector<MonitorEvent> ofType(EventType type) const
    {
        std::vector<MonitorEvent> matching;
        for (const auto &event : events) {
            if (event.type == type) {
                matching.push_back(event);
            }
        }
        return matching;
    }

    std::vector<MonitorEvent> events;

private:
    std::mutex m_mutex;
};

class RecordingSink : public SegmentSink
{
public:
    bool accept = true;
    QStringList offered;

    bool store(const QString &localPath) override
    {
        offered << localPath;
        return accept;
    }
};

} // namespace apptrail::testing
