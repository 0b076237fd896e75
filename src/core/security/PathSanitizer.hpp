#pragma once

#include <QtCore/QString>

namespace NoxJail {

struct SandboxRecord;

// Maps caller-supplied paths into a sandbox. sanitize() never fails for
// untrusted input: anything unsafe or unresolvable becomes the workspace root.
class PathSanitizer {
public:
    // Throws std::invalid_argument when sandboxRoot is empty.
    static QString sanitize(const QString& rawPath,
                            const QString& sandboxRoot,
                            const QString& workspaceName = "workspace");
    static QString sanitize(const QString& rawPath, const SandboxRecord& record);

    // Final path component only; empty for "." / ".." / empty input.
    static QString sanitizeFilename(const QString& name);

    // True when path, once resolved, is root or lies below it.
    static bool ensureContained(const QString& path, const QString& root);

    // Absolute path with symlinks, "." and ".." resolved against the real
    // filesystem. Components that do not exist yet are kept lexically.
    // Returns an empty string for dangling symlinks, loops or NUL bytes.
    static QString resolve(const QString& path);

    // A non-empty segment made only of dots, at least two long.
    static bool isTraversalSegment(const QString& segment);

    static bool isDescendant(const QString& resolvedPath, const QString& resolvedRoot);
};

} // namespace NoxJail
