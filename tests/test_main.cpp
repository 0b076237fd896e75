#include <QtTest/QtTest>
#include <QtCore/QCoreApplication>
#include <QtCore/QDebug>

#include "utils/TestUtils.hpp"
#include "../src/core/common/Logger.hpp"

// Forward declarations of test classes that are defined in separate compilation units
extern int runTestExpected(int argc, char** argv);
extern int runTestConfig(int argc, char** argv);
extern int runTestLogger(int argc, char** argv);
extern int runTestPathSanitizer(int argc, char** argv);
extern int runTestCommandValidator(int argc, char** argv);
extern int runTestArchiveCodec(int argc, char** argv);
extern int runTestCommandExecutor(int argc, char** argv);
extern int runTestSandboxRegistry(int argc, char** argv);
extern int runTestSandboxManager(int argc, char** argv);

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    NoxJail::Logger::instance().initialize("noxjail-tests.log", NoxJail::Logger::Level::Debug);
    NoxJail::Test::TestUtils::initializeTestEnvironment();

    int totalResult = 0;
    int testCount = 0;
    int passedTests = 0;

    struct TestInfo {
        const char* name;
        int (*function)(int, char**);
    };

    TestInfo tests[] = {
        {"Expected", runTestExpected},
        {"Config", runTestConfig},
        {"Logger", runTestLogger},
        {"PathSanitizer", runTestPathSanitizer},
        {"CommandValidator", runTestCommandValidator},
        {"ArchiveCodec", runTestArchiveCodec},
        {"CommandExecutor", runTestCommandExecutor},
        {"SandboxRegistry", runTestSandboxRegistry},
        {"SandboxManager", runTestSandboxManager}
    };

    for (const auto& test : tests) {
        qDebug() << "\n========================================";
        qDebug() << "Running test suite:" << test.name;
        qDebug() << "========================================";

        testCount++;
        int result = test.function(argc, argv);

        if (result == 0) {
            qDebug() << "✓ Test suite" << test.name << "PASSED";
            passedTests++;
        } else {
            qDebug() << "✗ Test suite" << test.name << "FAILED with code" << result;
            totalResult |= result;
        }
    }

    NoxJail::Test::TestUtils::cleanupTestEnvironment();

    // Summary
    qDebug() << "\n========================================";
    qDebug() << "TEST SUMMARY";
    qDebug() << "========================================";
    qDebug() << "Total test suites:" << testCount;
    qDebug() << "Passed:" << passedTests;
    qDebug() << "Failed:" << (testCount - passedTests);
    qDebug() << "Overall result:" << (totalResult == 0 ? "PASS" : "FAIL");

    return totalResult;
}
