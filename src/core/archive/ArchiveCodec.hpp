#pragma once

#include "ArchiveTypes.hpp"
#include "core/common/Expected.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QMap>
#include <QtCore/QString>

namespace NoxJail {

// gzip-compressed tar transfer format.
//
// Extraction applies, per member and in order: directory skip, absolute-name
// check, parent-reference check, resolved containment in the destination,
// link-target checks, and the optional outer boundary. A member that fails a
// check is recorded in the report and skipped; the rest are still extracted.
class ArchiveCodec {
public:
    // One regular-file member per entry, named by its key.
    static Expected<QByteArray, ArchiveError> pack(const QMap<QString, QByteArray>& entries);

    // A file is stored under its file name. A directory is walked (symlinks
    // are neither followed nor stored) and each file is named relative to
    // sourceRoot, which defaults to the directory itself.
    static Expected<QByteArray, ArchiveError> packTree(const QString& path,
                                                       const QString& sourceRoot = QString());

    static Expected<ExtractionReport, ArchiveError> unpack(const QByteArray& blob,
                                                           const QString& destRoot,
                                                           const ExtractOptions& options = ExtractOptions());
};

} // namespace NoxJail
