#include "CommandExecutor.hpp"
#include "core/common/Logger.hpp"
#include "core/sandbox/SandboxRecord.hpp"
#include "core/security/CommandValidator.hpp"
#include "core/security/PathSanitizer.hpp"

#include <QtCore/QDir>
#include <QtCore/QElapsedTimer>
#include <QtCore/QFileInfo>
#include <QtCore/QProcess>
#include <QtCore/QStandardPaths>
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>

#include <signal.h>
#include <unistd.h>

namespace NoxJail {

namespace {

constexpr int kStartTimeoutMs = 5000;
constexpr int kKillGraceMs = 2000;

QString resolveProgram(const QString& command, const QProcessEnvironment& environment) {
    const QStringList searchPath = environment.value("PATH").split(':', Qt::SkipEmptyParts);
    return QStandardPaths::findExecutable(command, searchPath);
}

int toMilliseconds(int seconds) {
    return static_cast<int>(std::min<qint64>(static_cast<qint64>(seconds) * 1000, INT_MAX));
}

// The child leads its own process group, so the whole group goes on timeout.
void killProcessGroup(QProcess& process, qint64 pid) {
    if (pid > 0 && ::kill(-static_cast<pid_t>(pid), SIGKILL) != 0 && errno != ESRCH) {
        NOXJAIL_WARN("Cannot signal process group {}: {}", pid, std::strerror(errno));
    }
    process.kill();
    if (!process.waitForFinished(kKillGraceMs)) {
        NOXJAIL_ERROR("Process {} did not exit after SIGKILL", pid);
    }
}

} // namespace

CommandExecutor::CommandExecutor(ExecutionPolicy policy)
    : policy_(std::move(policy)) {
}

QProcessEnvironment CommandExecutor::buildEnvironment(const QMap<QString, QString>& overrides) const {
    const QProcessEnvironment host = QProcessEnvironment::systemEnvironment();

    QProcessEnvironment environment;
    if (policy_.environment == EnvironmentPolicy::InheritHost) {
        environment = host;
    } else {
        for (const QString& name : policy_.environmentAllowList) {
            if (host.contains(name)) {
                environment.insert(name, host.value(name));
            }
        }
    }

    for (auto it = overrides.cbegin(); it != overrides.cend(); ++it) {
        environment.insert(it.key(), it.value());
    }
    return environment;
}

ExecResult CommandExecutor::run(const QStringList& argv,
                                const QString& workdirRaw,
                                const QMap<QString, QString>& envOverrides,
                                int timeoutSeconds,
                                const SandboxRecord& record) const {
    NOXJAIL_WARN("!!! Executing '{}' for session {} directly on the host. "
                 "There is no OS-level isolation: this can cause data loss or security issues !!!",
                 argv.join(' ').toStdString(), record.sessionId.toStdString());

    ExecResult result;
    const QString command = argv.isEmpty() ? QString() : argv.first();

    const CommandDecision decision = CommandValidator::check(argv);
    if (decision != CommandDecision::Allowed) {
        result.rejected = true;
        // Nothing is spawned either way; a name that exists nowhere is reported as missing.
        if (decision == CommandDecision::NotAllowListed
            && resolveProgram(command, buildEnvironment(envOverrides)).isEmpty()) {
            result.exitCode = kExitNotFound;
            result.standardError = QString("Command not found: %1").arg(command);
            return result;
        }
        result.exitCode = kExitFailure;
        result.standardError = QString("Command not allowed: %1")
                                   .arg(command.isEmpty() ? QStringLiteral("empty") : command);
        return result;
    }

    const QString workdir = PathSanitizer::sanitize(workdirRaw, record);
    if (!QDir().mkpath(workdir)) {
        result.exitCode = kExitFailure;
        result.standardError = QString("Execution error: cannot create working directory %1").arg(workdir);
        return result;
    }

    const QProcessEnvironment environment = buildEnvironment(envOverrides);
    const QString program = resolveProgram(command, environment);
    if (program.isEmpty()) {
        result.exitCode = kExitNotFound;
        result.standardError = QString("Command not found: %1").arg(command);
        return result;
    }

    const int effectiveTimeout = timeoutSeconds > 0 ? timeoutSeconds : policy_.defaultTimeoutSeconds;

    QProcess process;
    process.setProgram(program);
    process.setArguments(argv.mid(1));
    process.setWorkingDirectory(workdir);
    process.setProcessEnvironment(environment);
    process.setStandardInputFile(QProcess::nullDevice());
    process.setChildProcessModifier([]() { ::setpgid(0, 0); });

    QElapsedTimer timer;
    timer.start();
    process.start();

    if (!process.waitForStarted(kStartTimeoutMs)) {
        result.durationMs = timer.elapsed();
        const bool missing = process.error() == QProcess::FailedToStart && !QFileInfo::exists(program);
        result.exitCode = missing ? kExitNotFound : kExitFailure;
        result.standardError = missing
            ? QString("Command not found: %1").arg(command)
            : QString("Execution error: %1").arg(process.errorString());
        NOXJAIL_ERROR("Failed to start {}: {}", program.toStdString(), process.errorString().toStdString());
        return result;
    }

    const qint64 pid = process.processId();
    if (!process.waitForFinished(toMilliseconds(effectiveTimeout))
        && process.state() != QProcess::NotRunning) {
        killProcessGroup(process, pid);
        result.durationMs = timer.elapsed();
        result.exitCode = kExitTimeout;
        result.timedOut = true;
        result.standardError = QString("Command timed out after %1 seconds").arg(effectiveTimeout);
        NOXJAIL_WARN("Command '{}' in session {} timed out after {}s",
                     command.toStdString(), record.sessionId.toStdString(), effectiveTimeout);
        return result;
    }

    result.durationMs = timer.elapsed();
    result.standardOutput = QString::fromUtf8(process.readAllStandardOutput());
    result.standardError = QString::fromUtf8(process.readAllStandardError());

    if (process.exitStatus() == QProcess::CrashExit) {
        // exitCode() carries the terminating signal for crashed children
        const int signalNumber = process.exitCode();
        result.exitCode = 128 + signalNumber;
        if (!result.standardError.isEmpty() && !result.standardError.endsWith('\n')) {
            result.standardError += '\n';
        }
        result.standardError += QString("Terminated by signal %1").arg(signalNumber);
    } else {
        result.exitCode = process.exitCode();
    }

    NOXJAIL_DEBUG("Command '{}' in session {} exited with {} after {} ms",
                  command.toStdString(), record.sessionId.toStdString(),
                  result.exitCode, result.durationMs);
    return result;
}

} // namespace NoxJail
