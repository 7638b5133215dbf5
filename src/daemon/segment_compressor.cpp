#include "daemon/segment_compressor.hpp"

#include <QFile>

#include <zlib.h>

namespace apptrail {

namespace {

constexpr qint64 kChunkSize = 64 * 1024;

void setError(QString *error, const QString &message)
{
    if (error) {
        *error = message;
    }
}

} // namespace

bool SegmentCompressor::compressFile(const QString &source, const QString &destination,
                                     QString *error)
{
    QFile input(source);
    if (!input.open(QIODevice::ReadOnly)) {
        setError(error, QStringLiteral("cannot open %1: %2").arg(source, input.errorString()));
        return false;
    }

    gzFile output = gzopen(QFile::encodeName(destination).constData(), "wb");
    if (!output) {
        setError(error, QStringLiteral("cannot create %1").arg(destination));
        return false;
    }

    bool ok = true;
    while (!input.atEnd()) {
        const QByteArray chunk = input.read(kChunkSize);
        if (chunk.isEmpty() && input.error() != QFileDevice::NoError) {
            setError(error, QStringLiteral("read failed on %1: %2").arg(source, input.errorString()));
            ok = false;
            break;
        }
        if (chunk.isEmpty()) {
            break;
        }
        const int written = gzwrite(output, chunk.constData(), static_cast<unsigned>(chunk.size()));
        if (written != chunk.size()) {
            int code = Z_OK;
            const char *message = gzerror(output, &code);
            setError(error, QStringLiteral("gzwrite failed on %1: %2")
                                .arg(destination, QString::fromUtf8(message ? message : "")));
            ok = false;
            break;
        }
    }

    if (gzclose(output) != Z_OK && ok) {
        setError(error, QStringLiteral("gzclose failed on %1").arg(destination));
        ok = false;
    }

    if (!ok) {
        QFile::remove(destination);
    }
    return ok;
}

std::optional<QByteArray> SegmentCompressor::readCompressedFile(const QString &path)
{
    gzFile input = gzopen(QFile::encodeName(path).constData(), "rb");
    if (!input) {
        return std::nullopt;
    }

    QByteArray content;
    char buffer[kChunkSize];
    int read = 0;
    while ((read = gzread(input, buffer, sizeof(buffer))) > 0) {
        content.append(buffer, read);
    }
    const bool failed = read < 0;
    gzclose(input);
    if (failed) {
        return std::nullopt;
    }
    return content;
}

} // namespace apptrail
