#include <QtTest/QtTest>
#include "utils/TestUtils.hpp"
#include "../src/core/sandbox/SandboxRegistry.hpp"

#include <QtCore/QAtomicInt>
#include <QtCore/QThread>
#include <memory>

using namespace NoxJail;
using namespace NoxJail::Test;

class TestSandboxRegistry : public QObject {
    Q_OBJECT

private slots:
    void init() {
        base_ = TestUtils::createTempDirectory("registry");
        QVERIFY(!base_.isEmpty());
        registry_ = std::make_unique<SandboxRegistry>(TestUtils::createSandboxSettings(base_));
    }

    void cleanup() {
        registry_.reset();
        TestUtils::cleanupTempDirectory(base_);
    }

    void testCreateBuildsDirectories() {
        auto created = registry_->create("alpha");
        ASSERT_EXPECTED_VALUE(created);

        const SandboxRecord& record = created.value();
        QCOMPARE(record.sessionId, QString("alpha"));
        QVERIFY(record.rootPath.startsWith(QDir(base_).absolutePath() + "/noxjail_sandbox_alpha_"));
        QCOMPARE(record.workspacePath(), record.rootPath + "/workspace");
        TestUtils::assertDirectoryExists(record.workspacePath());
        QCOMPARE(record.ttlSeconds, 60);
        QCOMPARE(record.createdAt.secsTo(record.expiresAt), qint64(60));
        QCOMPARE(record.createdAt.timeSpec(), Qt::UTC);

        const QFile::Permissions permissions = QFileInfo(record.rootPath).permissions();
        QVERIFY(!(permissions & QFileDevice::ReadOther));
        QVERIFY(!(permissions & QFileDevice::WriteGroup));
    }

    void testCreateIsIdempotent() {
        auto first = registry_->create("alpha", 30);
        ASSERT_EXPECTED_VALUE(first);
        TestUtils::createTestFile(first.value().workspacePath(), "keep.txt", "kept");

        QTest::qWait(20);
        auto second = registry_->create("alpha", 120);
        ASSERT_EXPECTED_VALUE(second);

        QCOMPARE(second.value().rootPath, first.value().rootPath);
        QCOMPARE(second.value().createdAt, first.value().createdAt);
        QCOMPARE(second.value().ttlSeconds, 120);
        QVERIFY(second.value().expiresAt > first.value().expiresAt);
        QCOMPARE(registry_->sessionIds(), QStringList({"alpha"}));
        ASSERT_FILE_EXISTS(first.value().workspacePath() + "/keep.txt");
    }

    void testCreateRestoresMissingDirectories() {
        auto first = registry_->create("alpha");
        ASSERT_EXPECTED_VALUE(first);
        QVERIFY(QDir(first.value().rootPath).removeRecursively());

        auto again = registry_->create("alpha");
        ASSERT_EXPECTED_VALUE(again);
        TestUtils::assertDirectoryExists(again.value().workspacePath());
    }

    void testInvalidSessionIds() {
        ASSERT_EXPECTED_ERROR(registry_->create(""), SandboxError::InvalidSessionId);
        ASSERT_EXPECTED_ERROR(registry_->create(QString(300, QChar('x'))), SandboxError::InvalidSessionId);

        QString withNul = "bad";
        withNul.append(QChar(u'\0'));
        ASSERT_EXPECTED_ERROR(registry_->create(withNul), SandboxError::InvalidSessionId);

        ASSERT_EXPECTED_ERROR(registry_->touch(""), SandboxError::InvalidSessionId);
        ASSERT_EXPECTED_ERROR(registry_->remove(""), SandboxError::InvalidSessionId);
        QVERIFY(registry_->sessionIds().isEmpty());
    }

    void testHostileIdsStayUnderBase() {
        const QStringList hostile = {"../../etc", "/etc/passwd", "a/b/c", "..", ".", "weird id with spaces"};
        QStringList roots;
        for (const QString& id : hostile) {
            auto created = registry_->create(id);
            ASSERT_EXPECTED_VALUE(created);
            const QString root = created.value().rootPath;
            QCOMPARE(QFileInfo(root).absolutePath(), QDir(base_).absolutePath());
            QVERIFY(!roots.contains(root));
            roots.append(root);
        }
    }

    void testDistinctIdsNeverShareRoots() {
        auto dashed = registry_->create("a-b");
        auto slashed = registry_->create("a/b");
        auto plain = registry_->create("ab");
        ASSERT_EXPECTED_VALUE(dashed);
        ASSERT_EXPECTED_VALUE(slashed);
        ASSERT_EXPECTED_VALUE(plain);

        QVERIFY(dashed.value().rootPath != slashed.value().rootPath);
        QVERIFY(slashed.value().rootPath != plain.value().rootPath);
        QCOMPARE(registry_->rootPathFor("a/b"), slashed.value().rootPath);
    }

    void testTouchStrictlyIncreasesExpiry() {
        auto created = registry_->create("alpha");
        ASSERT_EXPECTED_VALUE(created);

        QDateTime previous = created.value().expiresAt;
        for (int i = 0; i < 5; ++i) {
            auto touched = registry_->touch("alpha");
            ASSERT_EXPECTED_VALUE(touched);
            QVERIFY(touched.value().expiresAt > previous);
            previous = touched.value().expiresAt;
        }
        QCOMPARE(registry_->lookup("alpha")->expiresAt, previous);
    }

    void testTouchUnknownSession() {
        ASSERT_EXPECTED_ERROR(registry_->touch("ghost"), SandboxError::SessionNotFound);
        QVERIFY(!registry_->lookup("ghost").has_value());
    }

    void testRemoveDeletesTree() {
        auto created = registry_->create("alpha");
        ASSERT_EXPECTED_VALUE(created);
        const QString root = created.value().rootPath;
        TestUtils::createTestFile(created.value().workspacePath(), "deep/nested/file.txt", "x");

        ASSERT_EXPECTED_VALUE(registry_->remove("alpha"));
        QVERIFY(!QFileInfo::exists(root));
        QVERIFY(!registry_->lookup("alpha").has_value());
        QVERIFY(QDir(base_).entryList(QDir::AllEntries | QDir::Hidden | QDir::NoDotAndDotDot).isEmpty());

        ASSERT_EXPECTED_ERROR(registry_->remove("alpha"), SandboxError::SessionNotFound);
    }

    void testRecreateAfterRemoveStartsEmpty() {
        auto created = registry_->create("alpha");
        ASSERT_EXPECTED_VALUE(created);
        TestUtils::createTestFile(created.value().workspacePath(), "old.txt", "old");
        ASSERT_EXPECTED_VALUE(registry_->remove("alpha"));

        auto recreated = registry_->create("alpha");
        ASSERT_EXPECTED_VALUE(recreated);
        ASSERT_FILE_NOT_EXISTS(recreated.value().workspacePath() + "/old.txt");
    }

    void testExpiredSessions() {
        ASSERT_EXPECTED_VALUE(registry_->create("short", 1));
        ASSERT_EXPECTED_VALUE(registry_->create("long", 3600));

        const QDateTime now = QDateTime::currentDateTimeUtc();
        QVERIFY(registry_->expiredSessions(now).isEmpty());
        QCOMPARE(registry_->expiredSessions(now.addSecs(10)), QStringList({"short"}));
        QCOMPARE(registry_->expiredSessions(now.addSecs(7200)), QStringList({"long", "short"}));
    }

    void testRemoveIfExpiredSparesRenewedSession() {
        auto created = registry_->create("renewed", 1);
        ASSERT_EXPECTED_VALUE(created);
        const QDateTime cutoff = created.value().expiresAt.addSecs(5);
        QCOMPARE(registry_->expiredSessions(cutoff), QStringList({"renewed"}));

        // Renewed after the sweep listed it.
        ASSERT_EXPECTED_VALUE(registry_->create("renewed", 3600));

        auto spared = registry_->removeIfExpired("renewed", cutoff);
        ASSERT_EXPECTED_VALUE(spared);
        QVERIFY(!spared.value());
        QVERIFY(registry_->lookup("renewed").has_value());
        TestUtils::assertDirectoryExists(created.value().workspacePath());

        auto reaped = registry_->removeIfExpired("renewed", cutoff.addSecs(7200));
        ASSERT_EXPECTED_VALUE(reaped);
        QVERIFY(reaped.value());
        QVERIFY(!registry_->lookup("renewed").has_value());
        QVERIFY(!QFileInfo::exists(created.value().rootPath));

        ASSERT_EXPECTED_ERROR(registry_->removeIfExpired("renewed", cutoff), SandboxError::SessionNotFound);
        ASSERT_EXPECTED_ERROR(registry_->removeIfExpired("", cutoff), SandboxError::InvalidSessionId);
    }

    void testInvalidWorkspaceNameFallsBack() {
        const QStringList bad = {"../x", "", "..", "a/b"};
        for (const QString& name : bad) {
            Config::SandboxSettings settings = TestUtils::createSandboxSettings(base_);
            settings.workspaceName = name;
            SandboxRegistry registry(settings);
            QCOMPARE(registry.settings().workspaceName, QString("workspace"));

            auto created = registry.create("ws");
            ASSERT_EXPECTED_VALUE(created);
            QCOMPARE(created.value().workspacePath(), created.value().rootPath + "/workspace");
            ASSERT_EXPECTED_VALUE(registry.remove("ws"));
        }
        ASSERT_FILE_NOT_EXISTS(base_ + "/x");
    }

    void testWithSessionAccessModes() {
        bool ran = false;
        ASSERT_EXPECTED_ERROR(registry_->withSession("lazy", SessionAccess::ExistingOnly,
                                                     [&](const SandboxRecord&) { ran = true; }),
                              SandboxError::SessionNotFound);
        QVERIFY(!ran);

        QString seenRoot;
        ASSERT_EXPECTED_VALUE(registry_->withSession("lazy", SessionAccess::CreateIfMissing,
                                                     [&](const SandboxRecord& record) { seenRoot = record.rootPath; }));
        QCOMPARE(seenRoot, registry_->rootPathFor("lazy"));
        QVERIFY(registry_->lookup("lazy").has_value());
    }

    void testSameSessionOperationsAreSerialized() {
        ASSERT_EXPECTED_VALUE(registry_->create("serial"));

        QAtomicInt inside(0);
        QAtomicInt overlaps(0);
        TestUtils::testThreadSafety([&]() {
            auto result = registry_->withSession("serial", SessionAccess::ExistingOnly, [&](const SandboxRecord&) {
                if (inside.fetchAndAddOrdered(1) != 0) {
                    overlaps.ref();
                }
                QThread::usleep(200);
                inside.fetchAndAddOrdered(-1);
            });
            if (result.hasError()) {
                overlaps.ref();
            }
        }, 8, 20);

        QCOMPARE(overlaps.loadRelaxed(), 0);
    }

    void testDeleteWaitsForRunningOperation() {
        ASSERT_EXPECTED_VALUE(registry_->create("busy"));
        const QString root = registry_->rootPathFor("busy");

        QAtomicInt started(0);
        bool sawWorkspace = false;
        std::unique_ptr<QThread> worker(QThread::create([&]() {
            auto result = registry_->withSession("busy", SessionAccess::ExistingOnly, [&](const SandboxRecord& record) {
                started.storeRelease(1);
                QThread::msleep(300);
                sawWorkspace = QFileInfo(record.workspacePath()).isDir();
            });
            Q_UNUSED(result);
        }));
        worker->start();
        QVERIFY(TestUtils::waitForCondition([&]() { return started.loadAcquire() == 1; }, 5000, 5));

        ASSERT_EXPECTED_VALUE(registry_->remove("busy"));
        QVERIFY(worker->wait(5000));
        QVERIFY(sawWorkspace);
        QVERIFY(!QFileInfo::exists(root));
    }

    void testDistinctSessionsRunInParallel() {
        ASSERT_EXPECTED_VALUE(registry_->create("one"));
        ASSERT_EXPECTED_VALUE(registry_->create("two"));

        QAtomicInt oneInside(0);
        QAtomicInt twoEntered(0);
        std::unique_ptr<QThread> holder(QThread::create([&]() {
            auto result = registry_->withSession("one", SessionAccess::ExistingOnly, [&](const SandboxRecord&) {
                oneInside.storeRelease(1);
                // Released only once the other session got in.
                for (int i = 0; i < 500 && twoEntered.loadAcquire() == 0; ++i) {
                    QThread::msleep(10);
                }
            });
            Q_UNUSED(result);
        }));
        holder->start();
        QVERIFY(TestUtils::waitForCondition([&]() { return oneInside.loadAcquire() == 1; }, 5000, 5));

        ASSERT_EXPECTED_VALUE(registry_->withSession("two", SessionAccess::ExistingOnly,
                                                     [&](const SandboxRecord&) { twoEntered.storeRelease(1); }));
        QVERIFY(holder->wait(5000));
        QCOMPARE(twoEntered.loadAcquire(), 1);
    }

private:
    QString base_;
    std::unique_ptr<SandboxRegistry> registry_;
};

int runTestSandboxRegistry(int argc, char** argv) {
    TestSandboxRegistry test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_sandbox_registry.moc"
