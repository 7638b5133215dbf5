#pragma once

#include <optional>

#include <QByteArray>
#include <QString>

namespace apptrail {

// gzip helpers for closed log segments.
class SegmentCompressor
{
public:
    // Writes source as a gzip stream to destination. On failure the partial
    // destination is removed and error (if given) describes the cause.
    static bool compressFile(const QString &source, const QString &destination,
                             QString *error = nullptr);

    static std::optional<QByteArray> readCompressedFile(const QString &path);
};

} // namespace apptrail
