#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QList>
#include <QtCore/QString>

namespace NoxJail {

enum class ArchiveError {
    CompressionFailed,
    DecompressionFailed,
    MalformedArchive,
    ArchiveTooLarge,
    SourceNotFound,
    ReadFailed,
    DestinationUnavailable
};

inline const char* toString(ArchiveError error) {
    switch (error) {
    case ArchiveError::CompressionFailed: return "compression failed";
    case ArchiveError::DecompressionFailed: return "decompression failed";
    case ArchiveError::MalformedArchive: return "malformed archive";
    case ArchiveError::ArchiveTooLarge: return "archive too large";
    case ArchiveError::SourceNotFound: return "source not found";
    case ArchiveError::ReadFailed: return "read failed";
    case ArchiveError::DestinationUnavailable: return "destination unavailable";
    }
    return "unknown archive error";
}

enum class TarEntryType {
    Regular,
    HardLink,
    SymbolicLink,
    Directory,
    Unsupported
};

struct TarEntry {
    QString name;
    TarEntryType type = TarEntryType::Regular;
    char typeFlag = '0';          // raw header flag, kept for unsupported types
    QString linkTarget;
    QByteArray data;
    int mode = 0644;
    qint64 modifiedTime = 0;      // seconds since epoch
};

// What happened to one archive member during extraction.
enum class MemberOutcome {
    Extracted,
    SkippedDirectory,
    RejectedAbsolutePath,
    RejectedTraversal,
    RejectedOutsideDestination,
    RejectedUnsafeLinkTarget,
    RejectedOutsideBoundary,
    RejectedUnsupportedType,
    RejectedLimitExceeded,
    WriteFailed
};

inline const char* toString(MemberOutcome outcome) {
    switch (outcome) {
    case MemberOutcome::Extracted: return "extracted";
    case MemberOutcome::SkippedDirectory: return "directory skipped";
    case MemberOutcome::RejectedAbsolutePath: return "absolute path";
    case MemberOutcome::RejectedTraversal: return "parent reference";
    case MemberOutcome::RejectedOutsideDestination: return "outside destination";
    case MemberOutcome::RejectedUnsafeLinkTarget: return "unsafe link target";
    case MemberOutcome::RejectedOutsideBoundary: return "outside sandbox boundary";
    case MemberOutcome::RejectedUnsupportedType: return "unsupported member type";
    case MemberOutcome::RejectedLimitExceeded: return "member limit exceeded";
    case MemberOutcome::WriteFailed: return "write failed";
    }
    return "unknown";
}

struct MemberReport {
    QString name;
    MemberOutcome outcome = MemberOutcome::Extracted;
};

struct ExtractionReport {
    int filesWritten = 0;
    QList<MemberReport> members;
    bool limitExceeded = false;

    int rejectedCount() const {
        int count = 0;
        for (const MemberReport& member : members) {
            if (member.outcome != MemberOutcome::Extracted
                && member.outcome != MemberOutcome::SkippedDirectory) {
                ++count;
            }
        }
        return count;
    }
};

struct ExtractOptions {
    bool allowAbsolute = false;                   // taken literally; must still land under dest
    QString boundaryRoot;                         // optional outer containment root
    int maxMembers = 10000;
    qint64 maxTotalBytes = 1024LL * 1024 * 1024;  // uncompressed
};

} // namespace NoxJail
