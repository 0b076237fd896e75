#pragma once

#include "ArchiveTypes.hpp"
#include "core/common/Expected.hpp"

#include <QtCore/QByteArray>

namespace NoxJail {

// gzip framing over zlib's deflate.
class GzipCodec {
public:
    static Expected<QByteArray, ArchiveError> compress(const QByteArray& data, int level = -1);

    // Inflates one or more concatenated gzip members. Output larger than
    // maxOutputBytes is reported as ArchiveTooLarge.
    static Expected<QByteArray, ArchiveError> decompress(const QByteArray& data, qint64 maxOutputBytes);

    static bool isGzip(const QByteArray& data);
};

} // namespace NoxJail
