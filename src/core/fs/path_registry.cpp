#include "core/fs/path_registry.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFileInfo>

#include <algorithm>

namespace gt {

PathRegistry::PathRegistry(const Settings& settings)
    : m_globalExcludes(settings.excludePatterns)
{
    for (const ScanPath& scanPath : settings.scanPaths) {
        ResolvedRoot root;
        root.path = canonicalProjectPath(scanPath.path);
        root.recursive = scanPath.recursive;
        root.maxDepth = scanPath.maxDepth > 0 ? scanPath.maxDepth : settings.maxDepth;
        root.excludePatterns = scanPath.excludePatterns;

        const bool duplicate = std::any_of(m_roots.begin(), m_roots.end(),
            [&root](const ResolvedRoot& existing) { return existing.path == root.path; });
        if (duplicate) {
            LOG_DEBUG(gotoFs, "Skipping duplicate scan root %s", qUtf8Printable(root.path));
            continue;
        }
        m_roots.push_back(std::move(root));
    }

    if (settings.discoveryAssist) {
        const QStringList configured = settings.discoveryPaths.isEmpty()
            ? QStringList{QDir::homePath()}
            : settings.discoveryPaths;
        for (const QString& path : configured) {
            const QString canonical = canonicalProjectPath(path);
            if (!m_discoveryRoots.contains(canonical)) {
                m_discoveryRoots.append(canonical);
            }
        }
    }
}

QString PathRegistry::owningRoot(const QString& projectPath) const
{
    QString best;
    auto consider = [&](const QString& root) {
        if (isPathUnder(projectPath, root) && root.size() > best.size()) {
            best = root;
        }
    };
    for (const ResolvedRoot& root : m_roots) {
        consider(root.path);
    }
    for (const QString& root : m_discoveryRoots) {
        consider(root);
    }
    return best;
}

bool PathRegistry::addRoot(Settings& settings, const QString& path,
                           QString* canonicalOut, QString* errorOut)
{
    const QString canonical = canonicalProjectPath(path);
    const QFileInfo info(canonical);
    if (!info.exists() || !info.isDir()) {
        if (errorOut) {
            *errorOut = QStringLiteral("not a directory: %1").arg(path);
        }
        return false;
    }

    if (canonicalOut) {
        *canonicalOut = canonical;
    }

    for (const ScanPath& existing : settings.scanPaths) {
        if (canonicalProjectPath(existing.path) == canonical) {
            return true;
        }
    }

    ScanPath scanPath;
    scanPath.path = canonical;
    settings.scanPaths.push_back(scanPath);
    return true;
}

bool PathRegistry::removeRoot(Settings& settings, const QString& path,
                              QString* canonicalOut)
{
    const QString canonical = canonicalProjectPath(path);
    if (canonicalOut) {
        *canonicalOut = canonical;
    }

    const auto before = settings.scanPaths.size();
    settings.scanPaths.erase(
        std::remove_if(settings.scanPaths.begin(), settings.scanPaths.end(),
                       [&](const ScanPath& existing) {
                           return existing.path == path
                               || canonicalProjectPath(existing.path) == canonical;
                       }),
        settings.scanPaths.end());
    return settings.scanPaths.size() != before;
}

} // namespace gt
