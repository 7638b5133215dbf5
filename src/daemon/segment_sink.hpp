#pragma once

#include <QString>

namespace apptrail {

// Durable destination for finished, compressed segments. store() must be safe
// to call again for the same file after a failure or a crash.
class SegmentSink
{
public:
    virtual ~SegmentSink() = default;

    virtual bool store(const QString &localPath) = 0;
};

// Copies archives into a directory. The copy lands under a temporary name and
// is renamed into place, so a reader never sees a partial archive.
class DirectorySink : public SegmentSink
{
public:
    explicit DirectorySink(QString directory);

    bool store(const QString &localPath) override;

    QString directory() const;

private:
    QString m_directory;
};

} // namespace apptrail
