#pragma once

#include <QtCore/QMap>
#include <QtCore/QProcessEnvironment>
#include <QtCore/QString>
#include <QtCore/QStringList>

namespace NoxJail {

struct SandboxRecord;

struct ExecResult {
    int exitCode = 0;
    QString standardOutput;
    QString standardError;
    qint64 durationMs = 0;
    bool timedOut = false;
    bool rejected = false;     // refused by CommandValidator, nothing spawned
};

enum class EnvironmentPolicy {
    InheritHost,     // host environment overlaid with caller overrides
    AllowListOnly    // empty environment + allow-listed host variables + overrides
};

struct ExecutionPolicy {
    EnvironmentPolicy environment = EnvironmentPolicy::InheritHost;
    QStringList environmentAllowList;
    int defaultTimeoutSeconds = 30;
};

// Runs one validated command as a child process inside a sandbox workspace.
// Every failure class is folded into ExecResult; nothing here throws for
// untrusted input.
class CommandExecutor {
public:
    static constexpr int kExitFailure = 1;
    static constexpr int kExitTimeout = 124;
    static constexpr int kExitNotFound = 127;

    explicit CommandExecutor(ExecutionPolicy policy = ExecutionPolicy());

    ExecResult run(const QStringList& argv,
                   const QString& workdirRaw,
                   const QMap<QString, QString>& envOverrides,
                   int timeoutSeconds,
                   const SandboxRecord& record) const;

    QProcessEnvironment buildEnvironment(const QMap<QString, QString>& overrides) const;

    const ExecutionPolicy& policy() const { return policy_; }

private:
    ExecutionPolicy policy_;
};

} // namespace NoxJail
