#pragma once

#include "core/fs/path_registry.h"
#include "core/fs/path_rules.h"
#include "core/shared/types.h"

#include <QSet>
#include <QString>
#include <QStringList>

#include <cstdint>
#include <vector>

namespace gt {

struct DiscoveredProject {
    QString path;                 // canonical
    ProjectSource source = ProjectSource::Scan;
};

struct ScanReport {
    std::vector<DiscoveredProject> projects;   // sorted by path, unique
    QStringList invalidRoots;                  // ScanPathInvalid
    uint64_t directoriesVisited = 0;
    uint64_t directoriesExcluded = 0;
};

// ProjectScanner — walks registry roots and reports project boundaries.
//
// A directory is a boundary when it contains a version-control marker or a
// recognized manifest. The walk never descends below a boundary, skips
// hidden entries and symlinked directories, and prunes excluded directories
// before entering them. Roots are walked concurrently. Pure: never touches
// the store.
class ProjectScanner {
public:
    explicit ProjectScanner(const PathRegistry& registry, int workers = 0);

    // Walks every root (and runs discovery when the registry has discovery
    // roots) and merges the results.
    ScanReport scan() const;

    // Walks a single root. Returns false when the root is missing or
    // unreadable.
    bool scanRoot(const ResolvedRoot& root, QStringList& projectsOut,
                  uint64_t& visited, uint64_t& excluded) const;

    // Marker test over a directory's entry names.
    static bool isProjectBoundary(const QSet<QString>& entryNames);
    static bool isProjectBoundary(const QString& dirPath);

    static const QStringList& vcsMarkers();
    static const QStringList& manifestMarkers();

    // Per-root rules: built-ins, global, per-root globs and <root>/.gotoignore.
    PathRules rulesForRoot(const ResolvedRoot& root) const;

private:
    void walk(const QString& rootPath, const QString& dirPath, int depth, int maxDepth,
              const PathRules& rules, QStringList& projectsOut,
              uint64_t& visited, uint64_t& excluded) const;

    const PathRegistry& m_registry;
    int m_workers;
};

} // namespace gt
