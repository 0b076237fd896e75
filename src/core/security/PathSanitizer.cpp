#include "PathSanitizer.hpp"
#include "core/common/Logger.hpp"
#include "core/sandbox/SandboxRecord.hpp"

#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QRegularExpression>
#include <QtCore/QStringList>
#include <stdexcept>

namespace NoxJail {

namespace {

QString joinPath(const QString& base, const QString& component) {
    return base == "/" ? base + component : base + '/' + component;
}

QString parentOf(const QString& path) {
    const int slash = path.lastIndexOf('/');
    return slash <= 0 ? QStringLiteral("/") : path.left(slash);
}

bool hasNulByte(const QString& value) {
    return value.contains(QChar(u'\0'));
}

} // namespace

QString PathSanitizer::resolve(const QString& path) {
    if (path.isEmpty() || hasNulByte(path)) {
        return QString();
    }

    const QString absolute = QDir::isAbsolutePath(path) ? path : QDir::current().absoluteFilePath(path);
    const QStringList components = absolute.split('/', Qt::SkipEmptyParts);

    QString current = QStringLiteral("/");
    bool onDisk = true;
    for (const QString& component : components) {
        if (component == ".") {
            continue;
        }
        if (component == "..") {
            current = parentOf(current);
            onDisk = QFileInfo::exists(current);
            continue;
        }

        const QString candidate = joinPath(current, component);
        if (onDisk) {
            const QFileInfo info(candidate);
            if (info.isSymLink() || info.exists()) {
                const QString canonical = info.canonicalFilePath();
                if (canonical.isEmpty()) {
                    return QString(); // dangling link or loop
                }
                current = canonical;
                continue;
            }
            onDisk = false;
        }
        current = candidate;
    }
    return current;
}

bool PathSanitizer::isDescendant(const QString& resolvedPath, const QString& resolvedRoot) {
    if (resolvedPath.isEmpty() || resolvedRoot.isEmpty()) {
        return false;
    }
    if (resolvedPath == resolvedRoot || resolvedRoot == "/") {
        return true;
    }
    return resolvedPath.startsWith(resolvedRoot + '/');
}

bool PathSanitizer::ensureContained(const QString& path, const QString& root) {
    return isDescendant(resolve(path), resolve(root));
}

bool PathSanitizer::isTraversalSegment(const QString& segment) {
    if (segment.size() < 2) {
        return false;
    }
    for (const QChar c : segment) {
        if (c != '.') {
            return false;
        }
    }
    return true;
}

QString PathSanitizer::sanitize(const QString& rawPath,
                                const QString& sandboxRoot,
                                const QString& workspaceName) {
    if (sandboxRoot.isEmpty()) {
        throw std::invalid_argument("PathSanitizer::sanitize called without a sandbox root");
    }

    QString root = resolve(sandboxRoot);
    if (root.isEmpty()) {
        root = QDir::cleanPath(sandboxRoot);
    }
    const QString workspace = joinPath(root, workspaceName);

    if (rawPath.isEmpty() || hasNulByte(rawPath)) {
        return workspace;
    }

    QString candidate;
    if (QDir::isAbsolutePath(rawPath)) {
        candidate = rawPath;
    } else {
        static const QRegularExpression separators(QStringLiteral("[/\\\\]"));
        QStringList kept;
        for (const QString& segment : rawPath.split(separators, Qt::SkipEmptyParts)) {
            if (segment == ".") {
                continue;
            }
            if (isTraversalSegment(segment)) {
                NOXJAIL_WARN("Rejected traversal segment '{}' in path '{}'",
                             segment.toStdString(), rawPath.toStdString());
                return workspace;
            }
            kept.append(segment);
        }
        candidate = kept.isEmpty() ? workspace : workspace + '/' + kept.join('/');
    }

    const QString resolved = resolve(candidate);
    if (!isDescendant(resolved, root)) {
        NOXJAIL_WARN("Path '{}' resolves outside the sandbox, using workspace root",
                     rawPath.toStdString());
        return workspace;
    }
    return resolved;
}

QString PathSanitizer::sanitize(const QString& rawPath, const SandboxRecord& record) {
    return sanitize(rawPath, record.rootPath, record.workspaceName);
}

QString PathSanitizer::sanitizeFilename(const QString& name) {
    if (hasNulByte(name)) {
        return QString();
    }

    static const QRegularExpression separators(QStringLiteral("[/\\\\]"));
    const QStringList segments = name.split(separators, Qt::SkipEmptyParts);
    if (segments.isEmpty()) {
        return QString();
    }

    const QString last = segments.last();
    if (last == "." || last == "..") {
        return QString();
    }
    return last;
}

} // namespace NoxJail
