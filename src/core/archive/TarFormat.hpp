#pragma once

#include "ArchiveTypes.hpp"
#include "core/common/Expected.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QList>

namespace NoxJail {

// Builds an uncompressed ustar stream. Names that do not fit the header are
// split into prefix/name, or carried in a GNU long-name record.
class TarWriter {
public:
    void addEntry(const TarEntry& entry);
    void addFile(const QString& name, const QByteArray& data, int mode = 0644, qint64 modifiedTime = 0);

    // End-of-archive marker plus record padding; the writer is reset.
    QByteArray finish();

    int entryCount() const { return entryCount_; }

private:
    void writeHeader(const QByteArray& name, const QByteArray& linkName,
                     char typeFlag, qint64 size, int mode, qint64 modifiedTime);
    void writeLongNameRecord(char typeFlag, const QByteArray& value);
    void writePadded(const QByteArray& payload);

    QByteArray buffer_;
    int entryCount_ = 0;
};

struct TarParseResult {
    QList<TarEntry> entries;
    bool limitExceeded = false;
    QString firstSkippedName;     // first member past the limit
};

// Reads a ustar/GNU/pax stream. A bad first header is MalformedArchive; later
// corruption ends the archive at the last good member.
class TarReader {
public:
    static Expected<TarParseResult, ArchiveError> parse(const QByteArray& data, int maxMembers);
};

} // namespace NoxJail
