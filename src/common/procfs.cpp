#include "common/procfs.hpp"

#include <cerrno>
#include <cctype>

#include <dirent.h>
#include <fcntl.h>
#include <limits.h>
#include <unistd.h>

namespace apptrail::procfs {

QueryStatus statusFromErrno(int error)
{
    switch (error) {
    case ENOENT:
    case ESRCH:
    case ENOTDIR:
        return QueryStatus::NotFound;
    case EACCES:
    case EPERM:
        return QueryStatus::AccessDenied;
    default:
        return QueryStatus::Unavailable;
    }
}

QueryResult<std::string> readFile(const std::string &path)
{
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return QueryResult<std::string>::failure(statusFromErrno(errno));
    }

    std::string content;
    char buffer[4096];
    while (true) {
        const ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            content.append(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            break;
        }
        if (errno == EINTR) {
            continue;
        }
        const int error = errno;
        ::close(fd);
        return QueryResult<std::string>::failure(statusFromErrno(error));
    }

    ::close(fd);
    return QueryResult<std::string>::ok(std::move(content));
}

QueryResult<std::string> readLink(const std::string &path)
{
    char buffer[PATH_MAX];
    const ssize_t n = ::readlink(path.c_str(), buffer, sizeof(buffer) - 1);
    if (n < 0) {
        return QueryResult<std::string>::failure(statusFromErrno(errno));
    }
    std::string target(buffer, static_cast<size_t>(n));
    // A deleted binary still resolves, with a marker the kernel appends.
    const std::string deletedSuffix = " (deleted)";
    if (target.size() > deletedSuffix.size()
        && target.compare(target.size() - deletedSuffix.size(),
                          deletedSuffix.size(), deletedSuffix) == 0) {
        target.resize(target.size() - deletedSuffix.size());
    }
    if (target.empty()) {
        return QueryResult<std::string>::failure(QueryStatus::NotFound);
    }
    return QueryResult<std::string>::ok(std::move(target));
}

std::vector<std::string> splitNulSeparated(const std::string &raw)
{
    std::vector<std::string> parts;
    std::string current;
    for (char ch : raw) {
        if (ch == '\0') {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(ch);
        }
    }
    if (!current.empty()) {
        parts.push_back(current);
    }
    return parts;
}

std::vector<std::string> listNumericEntries(const std::string &dir)
{
    std::vector<std::string> names;
    DIR *handle = ::opendir(dir.c_str());
    if (!handle) {
        return names;
    }
    while (dirent *entry = ::readdir(handle)) {
        const std::string name = entry->d_name;
        if (name.empty()) {
            continue;
        }
        bool numeric = true;
        for (char ch : name) {
            if (!std::isdigit(static_cast<unsigned char>(ch))) {
                numeric = false;
                break;
            }
        }
        if (numeric) {
            names.push_back(name);
        }
    }
    ::closedir(handle);
    return names;
}

} // namespace apptrail::procfs
