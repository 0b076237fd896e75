#pragma once

#include <QtCore/QDateTime>
#include <QtCore/QString>

namespace NoxJail {

enum class SandboxError {
    InvalidSessionId,
    SessionNotFound,
    SourceNotFound,
    StorageFailure,
    ArchiveFailure
};

inline const char* toString(SandboxError error) {
    switch (error) {
    case SandboxError::InvalidSessionId: return "invalid session id";
    case SandboxError::SessionNotFound: return "session not found";
    case SandboxError::SourceNotFound: return "source not found";
    case SandboxError::StorageFailure: return "storage failure";
    case SandboxError::ArchiveFailure: return "archive failure";
    }
    return "unknown sandbox error";
}

// Metadata bound to one session. rootPath is always produced by
// SandboxRegistry and is never shared between sessions.
struct SandboxRecord {
    QString sessionId;
    QString rootPath;
    QString workspaceName = "workspace";
    QDateTime createdAt;
    QDateTime expiresAt;
    int ttlSeconds = 0;

    QString workspacePath() const { return rootPath + '/' + workspaceName; }
    bool isExpired(const QDateTime& now) const { return now > expiresAt; }
};

} // namespace NoxJail
