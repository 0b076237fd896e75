#pragma once

#include "SandboxRecord.hpp"
#include "core/common/Config.hpp"
#include "core/common/Expected.hpp"

#include <QtCore/QDateTime>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <functional>
#include <memory>
#include <optional>

namespace NoxJail {

enum class SessionAccess {
    ExistingOnly,
    CreateIfMissing
};

// Owns session id -> SandboxRecord and the directory tree behind each record.
//
// Locking: a registry-wide mutex guards the map only; each record has its own
// mutex that serializes every effectful step on that session. The map mutex is
// never held while waiting for a record mutex, so distinct sessions proceed in
// parallel and deletion cannot race a running operation on the same session.
class SandboxRegistry {
public:
    explicit SandboxRegistry(Config::SandboxSettings settings);
    ~SandboxRegistry();

    SandboxRegistry(const SandboxRegistry&) = delete;
    SandboxRegistry& operator=(const SandboxRegistry&) = delete;

    // Idempotent: an existing record gets a new TTL and expiry but keeps its
    // storage and creation time. ttlSeconds <= 0 uses the configured default.
    Expected<SandboxRecord, SandboxError> create(const QString& sessionId, int ttlSeconds = 0);

    // Extends expiresAt by the record's TTL; always strictly increases it.
    Expected<SandboxRecord, SandboxError> touch(const QString& sessionId);

    // Drops the record and its whole directory tree.
    Expected<void, SandboxError> remove(const QString& sessionId);

    // Removes the session only if it is still expired at now, checked under
    // the same lock as the removal. Returns false when a renewal got there first.
    Expected<bool, SandboxError> removeIfExpired(const QString& sessionId, const QDateTime& now);

    std::optional<SandboxRecord> lookup(const QString& sessionId) const;
    QStringList sessionIds() const;
    QStringList expiredSessions(const QDateTime& now) const;

    // Runs operation while holding the session's exclusive lock.
    Expected<void, SandboxError> withSession(const QString& sessionId,
                                             SessionAccess access,
                                             const std::function<void(const SandboxRecord&)>& operation);

    const Config::SandboxSettings& settings() const;

    // Deterministic, collision-free root directory for a session id.
    QString rootPathFor(const QString& sessionId) const;

    static bool isValidSessionId(const QString& sessionId);

private:
    class SandboxRegistryPrivate;
    std::unique_ptr<SandboxRegistryPrivate> d;
};

} // namespace NoxJail
