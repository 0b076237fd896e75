#include "SandboxRegistry.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QCryptographicHash>
#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QUuid>
#include <algorithm>
#include <unordered_map>
#include <utility>
#include <vector>

namespace NoxJail {

namespace {

constexpr int kMaxSessionIdLength = 256;
constexpr int kMaxReadableIdLength = 64;

struct SessionEntry {
    QMutex mutex;
    SandboxRecord record;
    bool removed = false;
};

} // namespace

class SandboxRegistry::SandboxRegistryPrivate {
public:
    explicit SandboxRegistryPrivate(Config::SandboxSettings sandboxSettings)
        : settings(std::move(sandboxSettings)) {}

    Config::SandboxSettings settings;
    mutable QMutex mapMutex;
    std::unordered_map<QString, std::shared_ptr<SessionEntry>> sessions;

    std::shared_ptr<SessionEntry> find(const QString& sessionId) const {
        QMutexLocker locker(&mapMutex);
        const auto it = sessions.find(sessionId);
        return it == sessions.end() ? nullptr : it->second;
    }

    // Callers hold entry->mutex; map after entry is the only allowed order.
    void erase(const QString& sessionId, const std::shared_ptr<SessionEntry>& entry) {
        QMutexLocker locker(&mapMutex);
        const auto it = sessions.find(sessionId);
        if (it != sessions.end() && it->second == entry) {
            sessions.erase(it);
        }
    }

    // Callers hold entry->mutex and have checked entry->removed.
    Expected<void, SandboxError> removeLocked(const QString& sessionId, const std::shared_ptr<SessionEntry>& entry) {
        // Move the tree aside in one rename so no half-deleted sandbox is
        // ever visible under the session's root path.
        const QString root = entry->record.rootPath;
        QString doomed;
        if (QFileInfo::exists(root)) {
            const QString tombstone = QFileInfo(root).path() + "/.noxjail_deleted_"
                                      + QUuid::createUuid().toString(QUuid::Id128);
            if (QDir().rename(root, tombstone)) {
                doomed = tombstone;
            } else if (!QDir(root).removeRecursively()) {
                NOXJAIL_ERROR("Cannot delete sandbox directory {}", root.toStdString());
                return makeUnexpected(SandboxError::StorageFailure);
            }
        }

        entry->removed = true;
        erase(sessionId, entry);

        if (!doomed.isEmpty() && !QDir(doomed).removeRecursively()) {
            NOXJAIL_ERROR("Sandbox {} unregistered but {} could not be fully removed",
                          sessionId.toStdString(), doomed.toStdString());
        }
        NOXJAIL_INFO("Sandbox {} deleted", sessionId.toStdString());
        return Expected<void, SandboxError>();
    }

    int effectiveTtl(int ttlSeconds) const {
        return ttlSeconds > 0 ? ttlSeconds : settings.defaultTtlSeconds;
    }

    bool prepareDirectories(const SandboxRecord& record) const {
        if (!QDir().mkpath(record.workspacePath())) {
            NOXJAIL_ERROR("Cannot create sandbox directory {}", record.workspacePath().toStdString());
            return false;
        }
        const auto ownerOnly = QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner;
        if (!QFile::setPermissions(record.rootPath, ownerOnly)) {
            NOXJAIL_WARN("Cannot restrict permissions on {}", record.rootPath.toStdString());
        }
        return true;
    }
};

SandboxRegistry::SandboxRegistry(Config::SandboxSettings settings)
    : d(std::make_unique<SandboxRegistryPrivate>(std::move(settings)))
{
    if (d->settings.baseDirectory.isEmpty()) {
        d->settings.baseDirectory = Config::defaultBaseDirectory();
    }
    d->settings.baseDirectory = QDir(d->settings.baseDirectory).absolutePath();
    if (!Config::isValidWorkspaceName(d->settings.workspaceName)) {
        NOXJAIL_WARN("Invalid workspace name '{}', using 'workspace'", d->settings.workspaceName.toStdString());
        d->settings.workspaceName = "workspace";
    }
    NOXJAIL_INFO("Sandbox registry rooted at {}", d->settings.baseDirectory.toStdString());
}

SandboxRegistry::~SandboxRegistry() = default;

bool SandboxRegistry::isValidSessionId(const QString& sessionId) {
    return !sessionId.isEmpty()
        && sessionId.size() <= kMaxSessionIdLength
        && !sessionId.contains(QChar(u'\0'));
}

QString SandboxRegistry::rootPathFor(const QString& sessionId) const {
    QString readable;
    for (const QChar c : sessionId) {
        if (c.unicode() < 0x80 && (c.isLetterOrNumber() || c == '-' || c == '_')) {
            readable.append(c);
            if (readable.size() >= kMaxReadableIdLength) {
                break;
            }
        }
    }
    if (readable.isEmpty()) {
        readable = "default";
    }

    // The digest keeps ids that collapse to the same readable part apart.
    const QByteArray digest = QCryptographicHash::hash(sessionId.toUtf8(), QCryptographicHash::Sha256)
                                  .toHex()
                                  .left(12);
    return QDir(d->settings.baseDirectory)
        .absoluteFilePath(QString("noxjail_sandbox_%1_%2").arg(readable, QString::fromLatin1(digest)));
}

const Config::SandboxSettings& SandboxRegistry::settings() const {
    return d->settings;
}

Expected<SandboxRecord, SandboxError> SandboxRegistry::create(const QString& sessionId, int ttlSeconds) {
    if (!isValidSessionId(sessionId)) {
        NOXJAIL_WARN("Rejected invalid session id");
        return makeUnexpected(SandboxError::InvalidSessionId);
    }
    const int ttl = d->effectiveTtl(ttlSeconds);

    for (;;) {
        if (auto entry = d->find(sessionId)) {
            QMutexLocker locker(&entry->mutex);
            if (entry->removed) {
                continue;
            }
            entry->record.ttlSeconds = ttl;
            entry->record.expiresAt = QDateTime::currentDateTimeUtc().addSecs(ttl);
            if (!d->prepareDirectories(entry->record)) {
                return makeUnexpected(SandboxError::StorageFailure);
            }
            NOXJAIL_DEBUG("Sandbox {} refreshed, expires at {}", sessionId.toStdString(),
                          entry->record.expiresAt.toString(Qt::ISODateWithMs).toStdString());
            return entry->record;
        }

        // Nobody else can see the entry yet, so this lock never waits; it is
        // held until the directories exist.
        auto fresh = std::make_shared<SessionEntry>();
        QMutexLocker locker(&fresh->mutex);
        {
            QMutexLocker mapLocker(&d->mapMutex);
            if (!d->sessions.emplace(sessionId, fresh).second) {
                continue;
            }
        }

        SandboxRecord& record = fresh->record;
        record.sessionId = sessionId;
        record.rootPath = rootPathFor(sessionId);
        record.workspaceName = d->settings.workspaceName;
        record.createdAt = QDateTime::currentDateTimeUtc();
        record.expiresAt = record.createdAt.addSecs(ttl);
        record.ttlSeconds = ttl;

        if (!d->prepareDirectories(record)) {
            fresh->removed = true;
            d->erase(sessionId, fresh);
            return makeUnexpected(SandboxError::StorageFailure);
        }

        NOXJAIL_INFO("Sandbox {} created at {}", sessionId.toStdString(), record.rootPath.toStdString());
        return record;
    }
}

Expected<SandboxRecord, SandboxError> SandboxRegistry::touch(const QString& sessionId) {
    if (!isValidSessionId(sessionId)) {
        return makeUnexpected(SandboxError::InvalidSessionId);
    }

    for (;;) {
        auto entry = d->find(sessionId);
        if (!entry) {
            return makeUnexpected(SandboxError::SessionNotFound);
        }
        QMutexLocker locker(&entry->mutex);
        if (entry->removed) {
            continue;
        }

        SandboxRecord& record = entry->record;
        const QDateTime renewed = QDateTime::currentDateTimeUtc().addSecs(record.ttlSeconds);
        record.expiresAt = std::max(renewed, record.expiresAt.addMSecs(1));
        return record;
    }
}

Expected<void, SandboxError> SandboxRegistry::remove(const QString& sessionId) {
    if (!isValidSessionId(sessionId)) {
        return makeUnexpected(SandboxError::InvalidSessionId);
    }

    for (;;) {
        auto entry = d->find(sessionId);
        if (!entry) {
            return makeUnexpected(SandboxError::SessionNotFound);
        }
        QMutexLocker locker(&entry->mutex);
        if (entry->removed) {
            continue;
        }
        return d->removeLocked(sessionId, entry);
    }
}

Expected<bool, SandboxError> SandboxRegistry::removeIfExpired(const QString& sessionId, const QDateTime& now) {
    if (!isValidSessionId(sessionId)) {
        return makeUnexpected(SandboxError::InvalidSessionId);
    }

    for (;;) {
        auto entry = d->find(sessionId);
        if (!entry) {
            return makeUnexpected(SandboxError::SessionNotFound);
        }
        QMutexLocker locker(&entry->mutex);
        if (entry->removed) {
            continue;
        }
        if (!entry->record.isExpired(now)) {
            return false;
        }
        auto removed = d->removeLocked(sessionId, entry);
        if (removed.hasError()) {
            return makeUnexpected(removed.error());
        }
        return true;
    }
}

std::optional<SandboxRecord> SandboxRegistry::lookup(const QString& sessionId) const {
    auto entry = d->find(sessionId);
    if (!entry) {
        return std::nullopt;
    }
    QMutexLocker locker(&entry->mutex);
    if (entry->removed) {
        return std::nullopt;
    }
    return entry->record;
}

QStringList SandboxRegistry::sessionIds() const {
    QStringList ids;
    {
        QMutexLocker locker(&d->mapMutex);
        for (const auto& session : d->sessions) {
            ids.append(session.first);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

QStringList SandboxRegistry::expiredSessions(const QDateTime& now) const {
    std::vector<std::pair<QString, std::shared_ptr<SessionEntry>>> snapshot;
    {
        QMutexLocker locker(&d->mapMutex);
        snapshot.assign(d->sessions.begin(), d->sessions.end());
    }

    QStringList expired;
    for (const auto& [id, entry] : snapshot) {
        QMutexLocker locker(&entry->mutex);
        if (!entry->removed && entry->record.isExpired(now)) {
            expired.append(id);
        }
    }
    std::sort(expired.begin(), expired.end());
    return expired;
}

Expected<void, SandboxError> SandboxRegistry::withSession(const QString& sessionId,
                                                          SessionAccess access,
                                                          const std::function<void(const SandboxRecord&)>& operation) {
    if (!isValidSessionId(sessionId)) {
        return makeUnexpected(SandboxError::InvalidSessionId);
    }

    for (;;) {
        auto entry = d->find(sessionId);
        if (!entry) {
            if (access == SessionAccess::ExistingOnly) {
                return makeUnexpected(SandboxError::SessionNotFound);
            }
            auto created = create(sessionId);
            if (created.hasError()) {
                return makeUnexpected(created.error());
            }
            continue;
        }

        QMutexLocker locker(&entry->mutex);
        if (entry->removed) {
            continue;
        }
        operation(entry->record);
        return Expected<void, SandboxError>();
    }
}

} // namespace NoxJail
