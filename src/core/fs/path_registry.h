#pragma once

#include "core/shared/settings.h"
#include "core/shared/types.h"

#include <QString>
#include <QStringList>

#include <vector>

namespace gt {

// One scan root with everything resolved for a walk.
struct ResolvedRoot {
    QString path;                 // canonical
    bool recursive = true;
    int maxDepth = 5;             // effective, already defaulted from Settings
    QStringList excludePatterns;  // per-root globs
};

// PathRegistry — the ordered set of scan roots (plus discovery roots) for
// one invocation. Built from Settings and immutable afterwards; add/remove
// edit a Settings value that the caller persists.
class PathRegistry {
public:
    explicit PathRegistry(const Settings& settings);

    const std::vector<ResolvedRoot>& roots() const { return m_roots; }

    // Canonical discovery roots; empty when discovery assist is off.
    const QStringList& discoveryRoots() const { return m_discoveryRoots; }

    const QStringList& globalExcludePatterns() const { return m_globalExcludes; }

    // The registered root (scan or discovery) that owns a project path, or
    // an empty string when none does. Longest match wins.
    QString owningRoot(const QString& projectPath) const;

    bool covers(const QString& projectPath) const { return !owningRoot(projectPath).isEmpty(); }

    // Registers a root. Fails when the path is not an existing directory.
    // Returns true and leaves settings unchanged when already registered.
    static bool addRoot(Settings& settings, const QString& path,
                        QString* canonicalOut = nullptr, QString* errorOut = nullptr);

    // Unregisters a root. Matches both the canonical and the literal form so
    // roots that no longer exist can still be removed. Returns false when
    // nothing was registered under that path.
    static bool removeRoot(Settings& settings, const QString& path,
                           QString* canonicalOut = nullptr);

private:
    std::vector<ResolvedRoot> m_roots;
    QStringList m_discoveryRoots;
    QStringList m_globalExcludes;
};

} // namespace gt
