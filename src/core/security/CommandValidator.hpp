#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>

namespace NoxJail {

enum class CommandDecision {
    Allowed,
    EmptyCommand,
    Blocked,
    NotAllowListed
};

// Default-deny command policy over the first argv element (case-insensitive).
// The deny-set is consulted first so destructive commands are refused
// explicitly even if the allow-set grows.
class CommandValidator {
public:
    static bool validate(const QStringList& argv);
    static CommandDecision check(const QStringList& argv);

    static bool isAllowed(const QString& name);
    static bool isBlocked(const QString& name);

    static QStringList allowedCommands();
    static QStringList blockedCommands();

    static const char* toString(CommandDecision decision);
};

} // namespace NoxJail
