#include "ArchiveCodec.hpp"
#include "GzipCodec.hpp"
#include "TarFormat.hpp"
#include "core/common/Logger.hpp"
#include "core/security/PathSanitizer.hpp"

#include <QtCore/QDateTime>
#include <QtCore/QDir>
#include <QtCore/QDirIterator>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QHash>
#include <algorithm>
#include <unistd.h>

namespace NoxJail {

namespace {

bool isAbsoluteName(const QString& name) {
    return name.startsWith('/') || name.startsWith('\\')
        || (name.size() >= 2 && name.at(1) == ':' && name.at(0).isLetter());
}

QString normalizeSeparators(const QString& name) {
    QString normalized = name;
    normalized.replace('\\', '/');
    return normalized;
}

bool hasParentReference(const QString& name) {
    return normalizeSeparators(name).split('/').contains("..");
}

QString memberKey(const QString& name) {
    QString key = QDir::cleanPath(normalizeSeparators(name));
    while (key.startsWith("./")) {
        key.remove(0, 2);
    }
    return key;
}

// Strictly below root: a file member may not land on the root itself.
bool strictlyContained(const QString& path, const QString& resolvedRoot) {
    const QString resolved = PathSanitizer::resolve(path);
    return resolved != resolvedRoot && PathSanitizer::isDescendant(resolved, resolvedRoot);
}

Expected<QByteArray, ArchiveError> readFile(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        NOXJAIL_ERROR("Cannot read {}: {}", path.toStdString(), file.errorString().toStdString());
        return makeUnexpected(ArchiveError::ReadFailed);
    }
    return file.readAll();
}

Expected<void, ArchiveError> addFileFromDisk(TarWriter& writer, const QString& filePath, const QString& memberName) {
    auto content = readFile(filePath);
    if (content.hasError()) {
        return makeUnexpected(content.error());
    }
    const QFileInfo info(filePath);
    writer.addFile(memberName, content.value(),
                   info.isExecutable() ? 0755 : 0644,
                   info.lastModified().toSecsSinceEpoch());
    return Expected<void, ArchiveError>();
}

class MemberExtractor {
public:
    MemberExtractor(const QString& destRoot, const QString& boundaryRoot, const ExtractOptions& options)
        : destRoot_(destRoot), boundaryRoot_(boundaryRoot), options_(options) {}

    MemberOutcome extract(const TarEntry& entry) {
        if (entry.type == TarEntryType::Directory) {
            return MemberOutcome::SkippedDirectory;
        }

        const QString name = normalizeSeparators(entry.name);
        const bool absolute = isAbsoluteName(entry.name);
        if (absolute && !options_.allowAbsolute) {
            return MemberOutcome::RejectedAbsolutePath;
        }
        if (hasParentReference(name)) {
            return MemberOutcome::RejectedTraversal;
        }

        const QString literal = QDir::cleanPath(absolute ? name : destRoot_ + '/' + name);
        const QFileInfo literalInfo(literal);
        const QString parent = literalInfo.path();
        const QString fileName = literalInfo.fileName();
        if (fileName.isEmpty()
            || !strictlyContained(literal, destRoot_)
            || !PathSanitizer::ensureContained(parent, destRoot_)) {
            return MemberOutcome::RejectedOutsideDestination;
        }

        if (entry.type == TarEntryType::SymbolicLink || entry.type == TarEntryType::HardLink) {
            if (entry.linkTarget.isEmpty()
                || isAbsoluteName(entry.linkTarget)
                || hasParentReference(entry.linkTarget)) {
                return MemberOutcome::RejectedUnsafeLinkTarget;
            }
        }

        if (!boundaryRoot_.isEmpty()
            && (!PathSanitizer::ensureContained(literal, boundaryRoot_)
                || !PathSanitizer::ensureContained(parent, boundaryRoot_))) {
            return MemberOutcome::RejectedOutsideBoundary;
        }

        if (entry.type == TarEntryType::Unsupported) {
            return MemberOutcome::RejectedUnsupportedType;
        }

        return write(entry, parent, fileName);
    }

private:
    MemberOutcome write(const TarEntry& entry, const QString& parent, const QString& fileName) {
        if (!QDir().mkpath(parent)) {
            return MemberOutcome::WriteFailed;
        }
        const QString resolvedParent = PathSanitizer::resolve(parent);
        if (!PathSanitizer::isDescendant(resolvedParent, destRoot_)) {
            return MemberOutcome::RejectedOutsideDestination;
        }

        // Replace whatever sits at the final component without following it.
        const QString target = resolvedParent + '/' + fileName;
        const QFileInfo existing(target);
        if (existing.isSymLink() || existing.isFile()) {
            if (!QFile::remove(target)) {
                return MemberOutcome::WriteFailed;
            }
        } else if (existing.exists()) {
            return MemberOutcome::WriteFailed;
        }

        bool written = false;
        switch (entry.type) {
        case TarEntryType::Regular:
            written = writeRegular(entry, target);
            break;
        case TarEntryType::SymbolicLink:
            written = ::symlink(QFile::encodeName(entry.linkTarget).constData(),
                                QFile::encodeName(target).constData()) == 0;
            break;
        case TarEntryType::HardLink:
            written = copyLinkedMember(entry, target);
            break;
        default:
            break;
        }

        if (!written) {
            return MemberOutcome::WriteFailed;
        }
        extracted_.insert(memberKey(entry.name), target);
        return MemberOutcome::Extracted;
    }

    bool writeRegular(const TarEntry& entry, const QString& target) {
        QFile file(target);
        if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            NOXJAIL_WARN("Cannot write {}: {}", target.toStdString(), file.errorString().toStdString());
            return false;
        }
        if (file.write(entry.data) != entry.data.size()) {
            return false;
        }
        file.close();

        if (entry.mode & 0111) {
            QFileDevice::Permissions permissions = file.permissions();
            if (entry.mode & 0100) permissions |= QFileDevice::ExeOwner;
            if (entry.mode & 0010) permissions |= QFileDevice::ExeGroup;
            if (entry.mode & 0001) permissions |= QFileDevice::ExeOther;
            if (!file.setPermissions(permissions)) {
                NOXJAIL_WARN("Cannot mark {} executable", target.toStdString());
            }
        }
        return true;
    }

    // Hard links are materialised as copies of an already contained file.
    bool copyLinkedMember(const TarEntry& entry, const QString& target) {
        QString source = extracted_.value(memberKey(entry.linkTarget));
        if (source.isEmpty()) {
            const QString candidate = destRoot_ + '/' + memberKey(entry.linkTarget);
            if (strictlyContained(candidate, destRoot_) && QFileInfo(candidate).isFile()) {
                source = PathSanitizer::resolve(candidate);
            }
        }
        if (source.isEmpty() || !QFileInfo(source).isFile()) {
            NOXJAIL_WARN("Hard link target '{}' is not an extracted file", entry.linkTarget.toStdString());
            return false;
        }
        return QFile::copy(source, target);
    }

    QString destRoot_;
    QString boundaryRoot_;
    const ExtractOptions& options_;
    QHash<QString, QString> extracted_;
};

} // namespace

Expected<QByteArray, ArchiveError> ArchiveCodec::pack(const QMap<QString, QByteArray>& entries) {
    TarWriter writer;
    for (auto it = entries.cbegin(); it != entries.cend(); ++it) {
        writer.addFile(it.key(), it.value());
    }
    NOXJAIL_DEBUG("Packing {} archive members", writer.entryCount());
    return GzipCodec::compress(writer.finish());
}

Expected<QByteArray, ArchiveError> ArchiveCodec::packTree(const QString& path, const QString& sourceRoot) {
    const QFileInfo info(path);
    if (!info.exists()) {
        NOXJAIL_WARN("Cannot archive missing path {}", path.toStdString());
        return makeUnexpected(ArchiveError::SourceNotFound);
    }

    TarWriter writer;
    if (info.isDir()) {
        const QDir root(sourceRoot.isEmpty() ? info.absoluteFilePath() : sourceRoot);

        QStringList files;
        QDirIterator it(info.absoluteFilePath(),
                        QDir::Files | QDir::Hidden | QDir::NoSymLinks,
                        QDirIterator::Subdirectories);
        while (it.hasNext()) {
            files.append(it.next());
        }
        std::sort(files.begin(), files.end());

        for (const QString& file : files) {
            const QString memberName = root.relativeFilePath(file);
            if (memberName.startsWith("../") || QDir::isAbsolutePath(memberName)) {
                NOXJAIL_WARN("{} is outside the archive root {}", file.toStdString(), root.path().toStdString());
                return makeUnexpected(ArchiveError::SourceNotFound);
            }
            auto added = addFileFromDisk(writer, file, memberName);
            if (added.hasError()) {
                return makeUnexpected(added.error());
            }
        }
    } else {
        const QDir root(sourceRoot.isEmpty() ? info.absolutePath() : sourceRoot);
        const QString memberName = root.relativeFilePath(info.absoluteFilePath());
        if (memberName.startsWith("../") || QDir::isAbsolutePath(memberName)) {
            return makeUnexpected(ArchiveError::SourceNotFound);
        }
        auto added = addFileFromDisk(writer, info.absoluteFilePath(), memberName);
        if (added.hasError()) {
            return makeUnexpected(added.error());
        }
    }

    NOXJAIL_DEBUG("Packed {} files from {}", writer.entryCount(), path.toStdString());
    return GzipCodec::compress(writer.finish());
}

Expected<ExtractionReport, ArchiveError> ArchiveCodec::unpack(const QByteArray& blob,
                                                              const QString& destRoot,
                                                              const ExtractOptions& options) {
    ExtractionReport report;
    if (blob.isEmpty()) {
        return report;
    }

    QByteArray tarData;
    if (GzipCodec::isGzip(blob)) {
        auto inflated = GzipCodec::decompress(blob, options.maxTotalBytes);
        if (inflated.hasError()) {
            return makeUnexpected(inflated.error());
        }
        tarData = std::move(inflated).value();
    } else if (blob.size() > options.maxTotalBytes) {
        return makeUnexpected(ArchiveError::ArchiveTooLarge);
    } else {
        tarData = blob;
    }

    auto parsed = TarReader::parse(tarData, options.maxMembers);
    if (parsed.hasError()) {
        return makeUnexpected(parsed.error());
    }

    if (destRoot.isEmpty() || !QDir().mkpath(destRoot)) {
        NOXJAIL_ERROR("Cannot create extraction directory '{}'", destRoot.toStdString());
        return makeUnexpected(ArchiveError::DestinationUnavailable);
    }
    const QString resolvedDest = PathSanitizer::resolve(destRoot);
    if (resolvedDest.isEmpty()) {
        return makeUnexpected(ArchiveError::DestinationUnavailable);
    }
    const QString resolvedBoundary = options.boundaryRoot.isEmpty()
        ? QString()
        : PathSanitizer::resolve(options.boundaryRoot);
    if (!options.boundaryRoot.isEmpty() && resolvedBoundary.isEmpty()) {
        return makeUnexpected(ArchiveError::DestinationUnavailable);
    }

    MemberExtractor extractor(resolvedDest, resolvedBoundary, options);
    const TarParseResult& contents = parsed.value();
    for (const TarEntry& entry : contents.entries) {
        const MemberOutcome outcome = extractor.extract(entry);
        if (outcome == MemberOutcome::Extracted) {
            ++report.filesWritten;
        } else if (outcome != MemberOutcome::SkippedDirectory) {
            NOXJAIL_WARN("Skipped archive member '{}': {}", entry.name.toStdString(), toString(outcome));
        }
        report.members.append(MemberReport{entry.name, outcome});
    }

    if (contents.limitExceeded) {
        report.limitExceeded = true;
        report.members.append(MemberReport{contents.firstSkippedName, MemberOutcome::RejectedLimitExceeded});
    }

    NOXJAIL_INFO("Extracted {} of {} archive members into {}",
                 report.filesWritten, contents.entries.size(), resolvedDest.toStdString());
    return report;
}

} // namespace NoxJail
