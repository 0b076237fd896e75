#include "CommandValidator.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QSet>
#include <algorithm>

namespace NoxJail {

namespace {

const QSet<QString>& allowSet() {
    static const QSet<QString> commands = {
        "echo", "cat", "ls", "pwd", "head", "tail", "grep", "wc", "sort",
        "python", "python3", "python2", "node",
        "bash", "sh", "zsh",
        "test", "[", "true", "false", "sleep", "which", "type", "env", "printenv",
        "mkdir", "touch", "cp", "mv", "ln", "readlink", "stat", "file", "find", "xargs",
        "sed", "awk", "cut", "tr", "uniq", "diff", "cmp",
        "tar", "gzip", "gunzip", "zip", "unzip"
    };
    return commands;
}

const QSet<QString>& denySet() {
    static const QSet<QString> commands = {
        "rm", "rmdir", "unlink", "del", "format", "mkfs", "dd", "fdisk",
        "shutdown", "reboot", "halt", "poweroff", "init", "killall",
        "sudo", "su", "chmod", "chown", "chgrp", "mount", "umount"
    };
    return commands;
}

QStringList sorted(const QSet<QString>& set) {
    QStringList list(set.cbegin(), set.cend());
    std::sort(list.begin(), list.end());
    return list;
}

} // namespace

bool CommandValidator::validate(const QStringList& argv) {
    return check(argv) == CommandDecision::Allowed;
}

CommandDecision CommandValidator::check(const QStringList& argv) {
    if (argv.isEmpty() || argv.first().isEmpty()) {
        return CommandDecision::EmptyCommand;
    }

    const QString& name = argv.first();
    if (isBlocked(name)) {
        NOXJAIL_WARN("Blocked command: {}", name.toStdString());
        return CommandDecision::Blocked;
    }
    if (!isAllowed(name)) {
        NOXJAIL_WARN("Command not in allow-list: {}", name.toStdString());
        return CommandDecision::NotAllowListed;
    }
    return CommandDecision::Allowed;
}

bool CommandValidator::isAllowed(const QString& name) {
    return allowSet().contains(name.toLower());
}

bool CommandValidator::isBlocked(const QString& name) {
    return denySet().contains(name.toLower());
}

QStringList CommandValidator::allowedCommands() {
    return sorted(allowSet());
}

QStringList CommandValidator::blockedCommands() {
    return sorted(denySet());
}

const char* CommandValidator::toString(CommandDecision decision) {
    switch (decision) {
    case CommandDecision::Allowed: return "allowed";
    case CommandDecision::EmptyCommand: return "empty command";
    case CommandDecision::Blocked: return "blocked";
    case CommandDecision::NotAllowListed: return "not allow-listed";
    }
    return "unknown";
}

} // namespace NoxJail
