#include "daemon/segment_sink.hpp"

#include <optional>

#include <QCryptographicHash>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include "common/logging.hpp"

namespace apptrail {

namespace {

std::optional<QByteArray> fileDigest(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return std::nullopt;
    }
    QCryptographicHash hash(QCryptographicHash::Sha256);
    if (!hash.addData(&file)) {
        return std::nullopt;
    }
    return hash.result();
}

void logStoreFailure(const QString &localPath, const QString &why)
{
    ATLOG_WARN(QStringLiteral("DirectorySink"),
               QStringLiteral("DirectorySink::store"),
               QStringLiteral("sink_store_failed"),
               why,
               QStringLiteral("copy_rename"),
               apptrail::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"path", localPath.toStdString()}}));
}

} // namespace

DirectorySink::DirectorySink(QString directory)
    : m_directory(std::move(directory))
{
}

QString DirectorySink::directory() const
{
    return m_directory;
}

bool DirectorySink::store(const QString &localPath)
{
    const QFileInfo source(localPath);
    if (!source.exists()) {
        logStoreFailure(localPath, QStringLiteral("source_missing"));
        return false;
    }
    if (!QDir().mkpath(m_directory)) {
        logStoreFailure(localPath, QStringLiteral("mkpath_failed"));
        return false;
    }

    const auto sourceDigest = fileDigest(localPath);
    if (!sourceDigest) {
        logStoreFailure(localPath, QStringLiteral("source_unreadable"));
        return false;
    }

    // Pick the first name that is free or already holds this exact archive.
    QString destination = QDir(m_directory).filePath(source.fileName());
    for (int suffix = 1; QFileInfo::exists(destination); ++suffix) {
        if (fileDigest(destination) == sourceDigest) {
            return true;
        }
        destination = QDir(m_directory).filePath(
            QStringLiteral("%1.%2").arg(source.fileName()).arg(suffix));
    }

    const QString partial = destination + QStringLiteral(".part");
    QFile::remove(partial);
    if (!QFile::copy(localPath, partial)) {
        logStoreFailure(localPath, QStringLiteral("copy_failed"));
        return false;
    }
    if (!QFile::rename(partial, destination)) {
        QFile::remove(partial);
        logStoreFailure(localPath, QStringLiteral("rename_failed"));
        return false;
    }

    ATLOG_DEBUG(QStringLiteral("DirectorySink"),
                QStringLiteral("DirectorySink::store"),
                QStringLiteral("segment_stored"),
                QStringLiteral("rotation"),
                QStringLiteral("copy_rename"),
                apptrail::logging::defaultWho(),
                QString(),
                (nlohmann::json{{"path", localPath.toStdString()},
                                {"destination", destination.toStdString()}}));
    return true;
}

} // namespace apptrail
