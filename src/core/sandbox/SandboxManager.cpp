#include "SandboxManager.hpp"
#include "core/archive/ArchiveCodec.hpp"
#include "core/common/Logger.hpp"
#include "core/security/PathSanitizer.hpp"

#include <QtCore/QDir>
#include <QtCore/QElapsedTimer>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QThread>
#include <algorithm>

namespace NoxJail {

namespace {

constexpr int kReadyProbeTimeoutSeconds = 5;

ExecutionPolicy policyFrom(const Config::SandboxSettings& settings) {
    ExecutionPolicy policy;
    policy.environment = settings.inheritEnvironment
        ? EnvironmentPolicy::InheritHost
        : EnvironmentPolicy::AllowListOnly;
    policy.environmentAllowList = settings.environmentAllowList;
    policy.defaultTimeoutSeconds = settings.defaultExecTimeoutSeconds;
    return policy;
}

bool writeUpload(const QString& path, const QByteArray& data) {
    // Never write through a link planted by an earlier command.
    const QFileInfo existing(path);
    if (existing.isSymLink() && !QFile::remove(path)) {
        NOXJAIL_WARN("Cannot replace symlink {}", path.toStdString());
        return false;
    }
    if (existing.isDir() && !existing.isSymLink()) {
        NOXJAIL_WARN("Upload target {} is a directory", path.toStdString());
        return false;
    }

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        NOXJAIL_WARN("Cannot write {}: {}", path.toStdString(), file.errorString().toStdString());
        return false;
    }
    return file.write(data) == data.size();
}

} // namespace

class SandboxManager::SandboxManagerPrivate {
public:
    explicit SandboxManagerPrivate(SandboxRegistry& sandboxRegistry)
        : registry(sandboxRegistry)
        , executor(policyFrom(sandboxRegistry.settings())) {}

    SandboxRegistry& registry;
    CommandExecutor executor;

    ExtractOptions extractOptions(const SandboxRecord& record) const {
        const Config::SandboxSettings& settings = registry.settings();
        ExtractOptions options;
        options.boundaryRoot = record.rootPath;
        options.maxMembers = settings.maxArchiveMembers;
        options.maxTotalBytes = settings.maxArchiveBytes;
        return options;
    }
};

SandboxManager::SandboxManager(SandboxRegistry& registry, QObject* parent)
    : QObject(parent)
    , d(std::make_unique<SandboxManagerPrivate>(registry))
{
    NOXJAIL_CRITICAL("Local sandbox backend in use: commands run on this host without "
                     "container isolation. Use only with trusted callers.");
}

SandboxManager::~SandboxManager() = default;

bool SandboxManager::healthCheck() const {
    const QString base = d->registry.settings().baseDirectory;
    if (!QDir().mkpath(base)) {
        NOXJAIL_ERROR("Sandbox base directory {} cannot be created", base.toStdString());
        return false;
    }
    const QFileInfo info(base);
    return info.isDir() && info.isWritable();
}

Expected<SandboxInfo, SandboxError> SandboxManager::createSandbox(const QString& sessionId,
                                                                  const CreateOptions& options) {
    if (!options.image.isEmpty() || !options.cpuLimit.isEmpty()
        || !options.memoryLimit.isEmpty() || !options.ephemeralStorageLimit.isEmpty()) {
        NOXJAIL_DEBUG("Ignoring container hints for {} (image '{}', cpu '{}', memory '{}', storage '{}')",
                      sessionId.toStdString(), options.image.toStdString(), options.cpuLimit.toStdString(),
                      options.memoryLimit.toStdString(), options.ephemeralStorageLimit.toStdString());
    }

    const bool existed = d->registry.lookup(sessionId).has_value();
    auto record = d->registry.create(sessionId, options.ttlSeconds);
    if (record.hasError()) {
        return makeUnexpected(record.error());
    }
    if (!existed) {
        emit sandboxCreated(sessionId);
    }

    return record.transform([](const SandboxRecord& created) {
        return SandboxInfo{QString("local-%1").arg(created.sessionId), created.expiresAt};
    });
}

Expected<void, SandboxError> SandboxManager::ensureSandbox(const QString& sessionId) {
    if (d->registry.lookup(sessionId)) {
        return Expected<void, SandboxError>();
    }
    auto created = createSandbox(sessionId);
    if (created.hasError()) {
        return makeUnexpected(created.error());
    }
    return Expected<void, SandboxError>();
}

Expected<QDateTime, SandboxError> SandboxManager::touch(const QString& sessionId) {
    auto touched = d->registry.touch(sessionId);
    if (touched.hasError() && touched.error() == SandboxError::SessionNotFound) {
        auto created = createSandbox(sessionId);
        if (created.hasError()) {
            return makeUnexpected(created.error());
        }
        return created.value().expiresAt;
    }
    if (touched.hasError()) {
        return makeUnexpected(touched.error());
    }
    return touched.value().expiresAt;
}

Expected<ExecResult, SandboxError> SandboxManager::exec(const QString& sessionId,
                                                        const QStringList& command,
                                                        const ExecOptions& options) {
    auto ensured = ensureSandbox(sessionId);
    if (ensured.hasError()) {
        return makeUnexpected(ensured.error());
    }

    ExecResult result;
    auto ran = d->registry.withSession(sessionId, SessionAccess::CreateIfMissing,
                                       [&](const SandboxRecord& record) {
        result = d->executor.run(command, options.workdir, options.env, options.timeoutSeconds, record);
    });
    if (ran.hasError()) {
        return makeUnexpected(ran.error());
    }

    if (result.rejected) {
        emit commandRejected(sessionId, command.value(0));
    }
    return result;
}

Expected<int, SandboxError> SandboxManager::uploadFiles(const QString& sessionId,
                                                        const QMap<QString, QByteArray>& files,
                                                        const QString& destPath) {
    auto ensured = ensureSandbox(sessionId);
    if (ensured.hasError()) {
        return makeUnexpected(ensured.error());
    }

    int written = 0;
    bool storageFailed = false;
    auto ran = d->registry.withSession(sessionId, SessionAccess::CreateIfMissing,
                                       [&](const SandboxRecord& record) {
        const QString target = PathSanitizer::sanitize(destPath, record);
        if (!QDir().mkpath(target)) {
            NOXJAIL_ERROR("Cannot create upload directory {}", target.toStdString());
            storageFailed = true;
            return;
        }

        for (auto it = files.cbegin(); it != files.cend(); ++it) {
            const QString fileName = PathSanitizer::sanitizeFilename(it.key());
            if (fileName.isEmpty()) {
                NOXJAIL_WARN("Skipping upload with unusable name '{}'", it.key().toStdString());
                continue;
            }
            if (!writeUpload(target + '/' + fileName, it.value())) {
                storageFailed = true;
                return;
            }
            ++written;
        }
    });
    if (ran.hasError()) {
        return makeUnexpected(ran.error());
    }
    if (storageFailed) {
        return makeUnexpected(SandboxError::StorageFailure);
    }

    NOXJAIL_INFO("Uploaded {} files into sandbox {}", written, sessionId.toStdString());
    return written;
}

Expected<ExtractionReport, SandboxError> SandboxManager::uploadArchive(const QString& sessionId,
                                                                       const QByteArray& archive,
                                                                       const QString& destPath) {
    auto ensured = ensureSandbox(sessionId);
    if (ensured.hasError()) {
        return makeUnexpected(ensured.error());
    }

    Expected<ExtractionReport, ArchiveError> unpacked = ExtractionReport();
    auto ran = d->registry.withSession(sessionId, SessionAccess::CreateIfMissing,
                                       [&](const SandboxRecord& record) {
        const QString target = PathSanitizer::sanitize(destPath, record);
        unpacked = ArchiveCodec::unpack(archive, target, d->extractOptions(record));
    });
    if (ran.hasError()) {
        return makeUnexpected(ran.error());
    }
    if (unpacked.hasError()) {
        NOXJAIL_WARN("Archive upload to sandbox {} failed: {}", sessionId.toStdString(),
                     toString(unpacked.error()));
        return makeUnexpected(SandboxError::ArchiveFailure);
    }
    return unpacked.value();
}

Expected<QByteArray, SandboxError> SandboxManager::downloadFiles(const QString& sessionId,
                                                                 const QString& srcPath) {
    bool missing = false;
    Expected<QByteArray, ArchiveError> packed = QByteArray();
    auto ran = d->registry.withSession(sessionId, SessionAccess::ExistingOnly,
                                       [&](const SandboxRecord& record) {
        const QString source = PathSanitizer::sanitize(srcPath, record);
        if (!QFileInfo::exists(source)) {
            missing = true;
            return;
        }
        packed = ArchiveCodec::packTree(source);
    });
    if (ran.hasError()) {
        return makeUnexpected(ran.error());
    }
    if (missing) {
        return makeUnexpected(SandboxError::SourceNotFound);
    }
    if (packed.hasError()) {
        NOXJAIL_WARN("Download from sandbox {} failed: {}", sessionId.toStdString(), toString(packed.error()));
        return makeUnexpected(packed.error() == ArchiveError::SourceNotFound
                                  ? SandboxError::SourceNotFound
                                  : SandboxError::ArchiveFailure);
    }
    return packed.value();
}

Expected<void, SandboxError> SandboxManager::deleteSandbox(const QString& sessionId) {
    auto removed = d->registry.remove(sessionId);
    if (removed.hasError()) {
        NOXJAIL_DEBUG("Delete of sandbox {} failed: {}", sessionId.toStdString(), toString(removed.error()));
        return removed;
    }
    emit sandboxDeleted(sessionId);
    return removed;
}

bool SandboxManager::waitForReady(const QString& sessionId,
                                  std::chrono::milliseconds timeout,
                                  std::chrono::milliseconds interval) {
    ExecOptions probe;
    probe.timeoutSeconds = kReadyProbeTimeoutSeconds;

    QElapsedTimer timer;
    timer.start();
    for (;;) {
        auto result = exec(sessionId, {"echo", "ready"}, probe);
        if (result.hasValue() && result.value().standardOutput.trimmed() == "ready") {
            return true;
        }
        if (result.hasError() && result.error() == SandboxError::InvalidSessionId) {
            return false;
        }

        const qint64 remaining = static_cast<qint64>(timeout.count()) - timer.elapsed();
        if (remaining <= 0) {
            NOXJAIL_WARN("Sandbox {} not ready after {} ms", sessionId.toStdString(),
                         static_cast<qint64>(timeout.count()));
            return false;
        }
        const qint64 pause = std::min<qint64>(std::max<qint64>(interval.count(), 1), remaining);
        QThread::msleep(static_cast<unsigned long>(pause));
    }
}

bool SandboxManager::waitForReady(const QString& sessionId) {
    const Config::SandboxSettings& settings = d->registry.settings();
    return waitForReady(sessionId,
                        std::chrono::seconds(settings.readyTimeoutSeconds),
                        std::chrono::milliseconds(settings.readyIntervalMs));
}

std::optional<SandboxRecord> SandboxManager::sandboxRecord(const QString& sessionId) const {
    return d->registry.lookup(sessionId);
}

QStringList SandboxManager::reapExpired(const QDateTime& now) {
    QStringList reaped;
    for (const QString& sessionId : d->registry.expiredSessions(now)) {
        // A touch may have landed after the snapshot.
        auto removed = d->registry.removeIfExpired(sessionId, now);
        if (removed.hasError()) {
            NOXJAIL_DEBUG("Reap of sandbox {} skipped: {}", sessionId.toStdString(), toString(removed.error()));
            continue;
        }
        if (removed.value()) {
            emit sandboxDeleted(sessionId);
            reaped.append(sessionId);
        }
    }
    if (!reaped.isEmpty()) {
        NOXJAIL_INFO("Reaped {} expired sandboxes", reaped.size());
    }
    return reaped;
}

} // namespace NoxJail
