#pragma once

#include "SandboxRecord.hpp"
#include "SandboxRegistry.hpp"
#include "core/archive/ArchiveTypes.hpp"
#include "core/common/Expected.hpp"
#include "core/exec/CommandExecutor.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QDateTime>
#include <QtCore/QMap>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <chrono>
#include <memory>
#include <optional>

namespace NoxJail {

struct CreateOptions {
    int ttlSeconds = 0;              // <= 0 uses the configured default
    // Container hints; accepted for interface compatibility and ignored.
    QString image;
    QString cpuLimit;
    QString memoryLimit;
    QString ephemeralStorageLimit;
};

struct SandboxInfo {
    QString podName;
    QDateTime expiresAt;
};

struct ExecOptions {
    QString workdir = "/workspace";
    QMap<QString, QString> env;
    int timeoutSeconds = 0;          // <= 0 uses the configured default
};

/**
 * @brief Session-level operations on local sandboxes
 *
 * Every operation that touches a sandbox runs under that session's lock in
 * the registry, so commands, uploads, downloads and deletion of one session
 * never interleave. exec and the upload operations create a missing session
 * on first use; download and delete never do.
 *
 * Commands run directly on the host. Path sanitization and the command
 * allow-list are the only barriers; there is no OS-level isolation.
 */
class SandboxManager : public QObject {
    Q_OBJECT

public:
    explicit SandboxManager(SandboxRegistry& registry, QObject* parent = nullptr);
    ~SandboxManager() override;

    // True when the base directory exists (or can be created) and is writable.
    bool healthCheck() const;

    Expected<SandboxInfo, SandboxError> createSandbox(const QString& sessionId,
                                                      const CreateOptions& options = CreateOptions());

    // Extends the session's expiry, creating the session when it is unknown.
    Expected<QDateTime, SandboxError> touch(const QString& sessionId);

    Expected<ExecResult, SandboxError> exec(const QString& sessionId,
                                            const QStringList& command,
                                            const ExecOptions& options = ExecOptions());

    // Writes each entry under its base name into the sanitized destination.
    // Returns the number of files written.
    Expected<int, SandboxError> uploadFiles(const QString& sessionId,
                                            const QMap<QString, QByteArray>& files,
                                            const QString& destPath = "/workspace");

    Expected<ExtractionReport, SandboxError> uploadArchive(const QString& sessionId,
                                                           const QByteArray& archive,
                                                           const QString& destPath = "/workspace");

    // gzip'd tar of a file or directory inside the workspace.
    Expected<QByteArray, SandboxError> downloadFiles(const QString& sessionId,
                                                     const QString& srcPath = "/workspace");

    Expected<void, SandboxError> deleteSandbox(const QString& sessionId);

    // Polls `echo ready` until it answers or the timeout passes.
    bool waitForReady(const QString& sessionId,
                      std::chrono::milliseconds timeout,
                      std::chrono::milliseconds interval);
    bool waitForReady(const QString& sessionId);

    std::optional<SandboxRecord> sandboxRecord(const QString& sessionId) const;

    // Deletes every session that expired before now; returns their ids.
    QStringList reapExpired(const QDateTime& now = QDateTime::currentDateTimeUtc());

signals:
    void sandboxCreated(const QString& sessionId);
    void sandboxDeleted(const QString& sessionId);
    void commandRejected(const QString& sessionId, const QString& command);

private:
    class SandboxManagerPrivate;
    std::unique_ptr<SandboxManagerPrivate> d;

    Expected<void, SandboxError> ensureSandbox(const QString& sessionId);
};

} // namespace NoxJail
