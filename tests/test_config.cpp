#include <QtTest/QtTest>
#include "utils/TestUtils.hpp"
#include "../src/core/common/Config.hpp"
#include "../src/core/common/Logger.hpp"

using namespace NoxJail;
using namespace NoxJail::Test;

class TestConfig : public QObject {
    Q_OBJECT

private slots:
    void initTestCase() {
        tempDir_ = TestUtils::createTempDirectory("config");
        QVERIFY(!tempDir_.isEmpty());
    }

    void cleanupTestCase() {
        TestUtils::cleanupTempDirectory(tempDir_);
    }

    void testDefaultsWithoutStore() {
        const Config::SandboxSettings defaults;
        QCOMPARE(defaults.workspaceName, QString("workspace"));
        QCOMPARE(defaults.defaultTtlSeconds, 900);
        QCOMPARE(defaults.defaultExecTimeoutSeconds, 30);
        QVERIFY(defaults.inheritEnvironment);
        QVERIFY(defaults.environmentAllowList.contains("PATH"));
        QCOMPARE(defaults.maxArchiveMembers, 10000);
        QCOMPARE(defaults.maxArchiveBytes, 1024LL * 1024 * 1024);

        QCOMPARE(Config::defaultEnvironmentAllowList(), defaults.environmentAllowList);
        QVERIFY(Config::defaultBaseDirectory().endsWith("/noxjail"));
    }

    void testReadsIniFile() {
        const QString iniPath = TestUtils::createTestFile(tempDir_, "noxjail.ini",
            "[sandbox]\n"
            "baseDirectory=/srv/noxjail\n"
            "defaultTtlSeconds=120\n"
            "defaultExecTimeoutSeconds=5\n"
            "inheritEnvironment=false\n"
            "environmentAllowList=PATH,LANG\n"
            "[archive]\n"
            "maxMembers=50\n"
            "maxBytes=4096\n"
            "[readiness]\n"
            "timeoutSeconds=3\n"
            "intervalMs=100\n"
            "[logging]\n"
            "level=debug\n");
        QVERIFY(!iniPath.isEmpty());

        Config& config = Config::instance();
        config.initializeFromFile(iniPath);
        QVERIFY(config.isInitialized());

        const Config::SandboxSettings settings = config.getSandboxSettings();
        QCOMPARE(settings.baseDirectory, QString("/srv/noxjail"));
        QCOMPARE(settings.defaultTtlSeconds, 120);
        QCOMPARE(settings.defaultExecTimeoutSeconds, 5);
        QVERIFY(!settings.inheritEnvironment);
        QCOMPARE(settings.environmentAllowList, QStringList({"PATH", "LANG"}));
        QCOMPARE(settings.maxArchiveMembers, 50);
        QCOMPARE(settings.maxArchiveBytes, qint64(4096));
        QCOMPARE(settings.readyTimeoutSeconds, 3);
        QCOMPARE(settings.readyIntervalMs, 100);

        const Config::LoggingSettings logging = config.getLoggingSettings();
        QCOMPARE(logging.level, QString("debug"));
        QVERIFY(logging.logFilePath.isEmpty());
        QCOMPARE(Logger::levelFromString(logging.level.toStdString()), Logger::Level::Debug);
    }

    void testMalformedNumbersFallBack() {
        const QString iniPath = TestUtils::createTestFile(tempDir_, "broken.ini",
            "[sandbox]\n"
            "defaultTtlSeconds=soon\n"
            "workspaceName=../escape\n");
        QVERIFY(!iniPath.isEmpty());

        Config& config = Config::instance();
        config.initializeFromFile(iniPath);

        const Config::SandboxSettings settings = config.getSandboxSettings();
        QCOMPARE(settings.defaultTtlSeconds, 900);
        QCOMPARE(settings.workspaceName, QString("workspace"));
    }

    void testRoundTripThroughStore() {
        const QString iniPath = QDir(tempDir_).filePath("written.ini");

        Config& config = Config::instance();
        config.initializeFromFile(iniPath);

        Config::SandboxSettings settings;
        settings.baseDirectory = tempDir_ + "/sandboxes";
        settings.workspaceName = "work";
        settings.defaultTtlSeconds = 42;
        settings.environmentAllowList = QStringList({"PATH"});
        config.setSandboxSettings(settings);

        Config::LoggingSettings logging;
        logging.logFilePath = tempDir_ + "/noxjail.log";
        logging.level = "warning";
        config.setLoggingSettings(logging);
        config.sync();

        config.initializeFromFile(iniPath);
        const Config::SandboxSettings reread = config.getSandboxSettings();
        QCOMPARE(reread.baseDirectory, settings.baseDirectory);
        QCOMPARE(reread.workspaceName, QString("work"));
        QCOMPARE(reread.defaultTtlSeconds, 42);
        QCOMPARE(reread.environmentAllowList, QStringList({"PATH"}));
        QCOMPARE(config.getLoggingSettings().logFilePath, logging.logFilePath);
        QCOMPARE(Logger::levelFromString(config.getLoggingSettings().level.toStdString()),
                 Logger::Level::Warn);
    }

private:
    QString tempDir_;
};

int runTestConfig(int argc, char** argv) {
    TestConfig test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_config.moc"
