#include "core/fs/path_rules.h"
#include "core/shared/logging.h"

#include <QFileInfo>

namespace gt {

PathRules::PathRules()
{
    for (const QString& pattern : defaultExclusions()) {
        m_patterns.addPattern(pattern);
    }
}

const QStringList& PathRules::defaultExclusions()
{
    // Dependency, build output and cache directories never hold projects
    // worth navigating to.
    static const QStringList kDefaults = {
        QStringLiteral("node_modules"),
        QStringLiteral("target"),
        QStringLiteral("build"),
        QStringLiteral("dist"),
        QStringLiteral("vendor"),
        QStringLiteral("__pycache__"),
        QStringLiteral(".venv"),
        QStringLiteral("venv"),
        QStringLiteral(".cache"),
        QStringLiteral("Library"),
        QStringLiteral(".Trash"),
    };
    return kDefaults;
}

void PathRules::addPatterns(const QStringList& patterns)
{
    for (const QString& pattern : patterns) {
        m_patterns.addPattern(pattern);
    }
}

bool PathRules::loadIgnoreFile(const QString& path)
{
    if (!QFileInfo::exists(path)) {
        return true;
    }
    return m_patterns.loadFromFile(path);
}

bool PathRules::isExcluded(const QString& relativePath) const
{
    if (relativePath.isEmpty()) {
        return false;
    }
    return hasHiddenComponent(relativePath) || m_patterns.matches(relativePath);
}

bool PathRules::hasHiddenComponent(const QString& relativePath)
{
    if (relativePath.startsWith(QLatin1Char('.'))) {
        return true;
    }
    return relativePath.contains(QLatin1String("/."));
}

} // namespace gt
