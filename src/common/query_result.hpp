#pragma once

#include <utility>

namespace apptrail {

// Outcome of a best-effort OS query. Callers branch on the status instead of
// catching exceptions; only Ok carries a meaningful value.
enum class QueryStatus {
    Ok,
    NotFound,
    AccessDenied,
    Unavailable
};

template <typename T>
struct QueryResult {
    QueryStatus status = QueryStatus::Unavailable;
    T value{};

    static QueryResult ok(T v)
    {
        return QueryResult{QueryStatus::Ok, std::move(v)};
    }

    static QueryResult failure(QueryStatus s)
    {
        return QueryResult{s, T{}};
    }

    bool isOk() const
    {
        return status == QueryStatus::Ok;
    }

    const T &valueOr(const T &fallback) const
    {
        return isOk() ? value : fallback;
    }
};

inline const char *toStatusString(QueryStatus status)
{
    switch (status) {
    case QueryStatus::Ok:
        return "ok";
    case QueryStatus::NotFound:
        return "not_found";
    case QueryStatus::AccessDenied:
        return "access_denied";
    case QueryStatus::Unavailable:
        return "unavailable";
    }
    return "unavailable";
}

} // namespace apptrail
