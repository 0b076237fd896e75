#pragma once

#include <QtCore/QSettings>
#include <QtCore/QStandardPaths>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVariant>
#include <memory>

namespace NoxJail {

class Config {
public:
    static Config& instance();

    // Native settings store for the given organization/application.
    void initialize(const QString& organizationName = "NoxJail",
                    const QString& applicationName = "noxjail");

    // INI file store, used by deployments that ship a config file.
    void initializeFromFile(const QString& iniPath);

    bool isInitialized() const;

    QVariant getValue(const QString& key, const QVariant& defaultValue = QVariant()) const;
    void setValue(const QString& key, const QVariant& value);

    QString getString(const QString& key, const QString& defaultValue = QString()) const;
    int getInt(const QString& key, int defaultValue = 0) const;
    qint64 getLongLong(const QString& key, qint64 defaultValue = 0) const;
    bool getBool(const QString& key, bool defaultValue = false) const;
    QStringList getStringList(const QString& key, const QStringList& defaultValue = QStringList()) const;

    struct SandboxSettings {
        QString baseDirectory;                 // empty = defaultBaseDirectory()
        QString workspaceName = "workspace";
        int defaultTtlSeconds = 900;
        int defaultExecTimeoutSeconds = 30;
        bool inheritEnvironment = true;
        QStringList environmentAllowList{"PATH", "HOME", "LANG", "LC_ALL", "TERM", "TMPDIR", "USER"};
        int maxArchiveMembers = 10000;
        qint64 maxArchiveBytes = 1024LL * 1024 * 1024;
        int readyTimeoutSeconds = 30;
        int readyIntervalMs = 2000;
    };

    struct LoggingSettings {
        QString logFilePath;                   // empty = stderr only
        QString level = "info";
    };

    SandboxSettings getSandboxSettings() const;
    LoggingSettings getLoggingSettings() const;

    void setSandboxSettings(const SandboxSettings& settings);
    void setLoggingSettings(const LoggingSettings& settings);

    static QString defaultBaseDirectory();
    static QStringList defaultEnvironmentAllowList();
    // A single path component other than "." or "..".
    static bool isValidWorkspaceName(const QString& name);

    void sync();

private:
    Config() = default;
    std::unique_ptr<QSettings> settings_;
};

} // namespace NoxJail
