#include "Config.hpp"
#include "Logger.hpp"

namespace NoxJail {

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::initialize(const QString& organizationName, const QString& applicationName) {
    settings_ = std::make_unique<QSettings>(organizationName, applicationName);
    NOXJAIL_INFO("Config initialized for {}/{}",
                 organizationName.toStdString(), applicationName.toStdString());
}

void Config::initializeFromFile(const QString& iniPath) {
    settings_ = std::make_unique<QSettings>(iniPath, QSettings::IniFormat);
    if (settings_->status() != QSettings::NoError) {
        NOXJAIL_WARN("Config file {} could not be read, using defaults", iniPath.toStdString());
    } else {
        NOXJAIL_INFO("Config initialized from {}", iniPath.toStdString());
    }
}

bool Config::isInitialized() const {
    return settings_ != nullptr;
}

QVariant Config::getValue(const QString& key, const QVariant& defaultValue) const {
    if (!settings_) return defaultValue;
    return settings_->value(key, defaultValue);
}

void Config::setValue(const QString& key, const QVariant& value) {
    if (settings_) {
        settings_->setValue(key, value);
    }
}

QString Config::getString(const QString& key, const QString& defaultValue) const {
    return getValue(key, defaultValue).toString();
}

int Config::getInt(const QString& key, int defaultValue) const {
    bool ok = false;
    const int value = getValue(key, defaultValue).toInt(&ok);
    return ok ? value : defaultValue;
}

qint64 Config::getLongLong(const QString& key, qint64 defaultValue) const {
    bool ok = false;
    const qint64 value = getValue(key, defaultValue).toLongLong(&ok);
    return ok ? value : defaultValue;
}

bool Config::getBool(const QString& key, bool defaultValue) const {
    return getValue(key, defaultValue).toBool();
}

QStringList Config::getStringList(const QString& key, const QStringList& defaultValue) const {
    return getValue(key, defaultValue).toStringList();
}

Config::SandboxSettings Config::getSandboxSettings() const {
    SandboxSettings settings;
    settings.baseDirectory = getString("sandbox/baseDirectory", defaultBaseDirectory());
    settings.workspaceName = getString("sandbox/workspaceName", "workspace");
    settings.defaultTtlSeconds = getInt("sandbox/defaultTtlSeconds", 900);
    settings.defaultExecTimeoutSeconds = getInt("sandbox/defaultExecTimeoutSeconds", 30);
    settings.inheritEnvironment = getBool("sandbox/inheritEnvironment", true);
    settings.environmentAllowList = getStringList("sandbox/environmentAllowList",
                                                  defaultEnvironmentAllowList());
    settings.maxArchiveMembers = getInt("archive/maxMembers", 10000);
    settings.maxArchiveBytes = getLongLong("archive/maxBytes", 1024LL * 1024 * 1024);
    settings.readyTimeoutSeconds = getInt("readiness/timeoutSeconds", 30);
    settings.readyIntervalMs = getInt("readiness/intervalMs", 2000);

    if (!isValidWorkspaceName(settings.workspaceName)) {
        NOXJAIL_WARN("Invalid sandbox/workspaceName '{}', using 'workspace'",
                     settings.workspaceName.toStdString());
        settings.workspaceName = "workspace";
    }
    return settings;
}

Config::LoggingSettings Config::getLoggingSettings() const {
    LoggingSettings settings;
    settings.logFilePath = getString("logging/filePath");
    settings.level = getString("logging/level", "info");
    return settings;
}

void Config::setSandboxSettings(const SandboxSettings& settings) {
    setValue("sandbox/baseDirectory", settings.baseDirectory);
    setValue("sandbox/workspaceName", settings.workspaceName);
    setValue("sandbox/defaultTtlSeconds", settings.defaultTtlSeconds);
    setValue("sandbox/defaultExecTimeoutSeconds", settings.defaultExecTimeoutSeconds);
    setValue("sandbox/inheritEnvironment", settings.inheritEnvironment);
    setValue("sandbox/environmentAllowList", settings.environmentAllowList);
    setValue("archive/maxMembers", settings.maxArchiveMembers);
    setValue("archive/maxBytes", settings.maxArchiveBytes);
    setValue("readiness/timeoutSeconds", settings.readyTimeoutSeconds);
    setValue("readiness/intervalMs", settings.readyIntervalMs);
}

void Config::setLoggingSettings(const LoggingSettings& settings) {
    setValue("logging/filePath", settings.logFilePath);
    setValue("logging/level", settings.level);
}

bool Config::isValidWorkspaceName(const QString& name) {
    return !name.isEmpty() && !name.contains('/') && !name.contains(QChar(u'\0'))
        && name != "." && name != "..";
}

QString Config::defaultBaseDirectory() {
    return QStandardPaths::writableLocation(QStandardPaths::TempLocation) + "/noxjail";
}

QStringList Config::defaultEnvironmentAllowList() {
    return SandboxSettings().environmentAllowList;
}

void Config::sync() {
    if (settings_) {
        settings_->sync();
    }
}

} // namespace NoxJail
