#include "TestUtils.hpp"
#include <QtCore/QAtomicInt>
#include <QtCore/QDir>
#include <QtCore/QElapsedTimer>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QThreadPool>
#include <QtConcurrent/QtConcurrent>

namespace NoxJail {
namespace Test {

std::unique_ptr<QTemporaryDir> TestUtils::root_;

namespace {

void failWith(const QString& message, const QString& where) {
    const QString full = where.isEmpty() ? message : QString("%1 (%2)").arg(message, where);
    QFAIL(qPrintable(full));
}

} // namespace

void TestUtils::initializeTestEnvironment() {
    if (root_) {
        return;
    }
    root_ = std::make_unique<QTemporaryDir>(QDir::tempPath() + "/noxjail_tests_XXXXXX");
    if (!root_->isValid()) {
        qFatal("Cannot create the test root directory: %s", qPrintable(root_->errorString()));
    }
}

void TestUtils::cleanupTestEnvironment() {
    root_.reset();
}

QString TestUtils::createTempDirectory(const QString& prefix) {
    initializeTestEnvironment();

    static QAtomicInt counter(0);
    const QString path = QDir(root_->path()).filePath(
        QString("%1_%2").arg(prefix).arg(counter.fetchAndAddRelaxed(1)));
    // Leftovers from an earlier run of the same suite must not leak in.
    QDir(path).removeRecursively();
    return QDir().mkpath(path) ? path : QString();
}

void TestUtils::cleanupTempDirectory(const QString& path) {
    if (!path.isEmpty() && !QDir(path).removeRecursively()) {
        qWarning("Could not fully remove %s", qPrintable(path));
    }
}

Config::SandboxSettings TestUtils::createSandboxSettings(const QString& baseDirectory) {
    Config::SandboxSettings settings;
    settings.baseDirectory = baseDirectory;
    settings.defaultTtlSeconds = 60;
    settings.defaultExecTimeoutSeconds = 10;
    settings.readyTimeoutSeconds = 5;
    settings.readyIntervalMs = 50;
    return settings;
}

QString TestUtils::createTestFile(const QString& directory, const QString& relativePath, const QByteArray& content) {
    const QString filePath = QDir(directory).filePath(relativePath);
    if (!QDir().mkpath(QFileInfo(filePath).path())) {
        return QString();
    }
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate) || file.write(content) != content.size()) {
        return QString();
    }
    return filePath;
}

QByteArray TestUtils::readFile(const QString& filePath) {
    QFile file(filePath);
    return file.open(QIODevice::ReadOnly) ? file.readAll() : QByteArray();
}

bool TestUtils::waitForCondition(std::function<bool()> condition, int timeoutMs, int checkIntervalMs) {
    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < timeoutMs) {
        if (condition()) {
            return true;
        }
        QTest::qWait(checkIntervalMs);
    }
    return condition();
}

void TestUtils::testThreadSafety(std::function<void()> operation, int threadCount, int iterationsPerThread) {
    QThreadPool pool;
    pool.setMaxThreadCount(threadCount);

    QList<QFuture<void>> futures;
    for (int i = 0; i < threadCount; ++i) {
        futures.append(QtConcurrent::run(&pool, [operation, iterationsPerThread]() {
            for (int j = 0; j < iterationsPerThread; ++j) {
                operation();
            }
        }));
    }
    for (auto& future : futures) {
        future.waitForFinished();
    }
}

void TestUtils::assertFileExists(const QString& filePath, const QString& where) {
    if (!QFileInfo(filePath).isFile()) {
        failWith(QString("Missing file: %1").arg(filePath), where);
    }
}

void TestUtils::assertDirectoryExists(const QString& dirPath, const QString& where) {
    if (!QFileInfo(dirPath).isDir()) {
        failWith(QString("Missing directory: %1").arg(dirPath), where);
    }
}

void TestUtils::assertFileNotExists(const QString& filePath, const QString& where) {
    const QFileInfo info(filePath);
    if (info.exists() || info.isSymLink()) {
        failWith(QString("Unexpected entry: %1").arg(filePath), where);
    }
}

} // namespace Test
} // namespace NoxJail
