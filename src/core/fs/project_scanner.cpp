#include "core/fs/project_scanner.h"
#include "core/fs/discovery_source.h"
#include "core/shared/logging.h"
#include "core/shared/worker_pool.h"

#include <QDir>
#include <QFileInfo>

#include <algorithm>
#include <cinttypes>
#include <map>

namespace gt {

namespace {

constexpr int kHardMaxDepth = 64;

QSet<QString> entryNames(const QDir& dir)
{
    const QStringList names = dir.entryList(
        QDir::Files | QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System);
    return QSet<QString>(names.begin(), names.end());
}

} // anonymous namespace

ProjectScanner::ProjectScanner(const PathRegistry& registry, int workers)
    : m_registry(registry)
    , m_workers(workers)
{
}

const QStringList& ProjectScanner::vcsMarkers()
{
    static const QStringList kMarkers = {
        QStringLiteral(".git"),
        QStringLiteral(".hg"),
        QStringLiteral(".svn"),
        QStringLiteral(".jj"),
    };
    return kMarkers;
}

const QStringList& ProjectScanner::manifestMarkers()
{
    static const QStringList kMarkers = {
        QStringLiteral("package.json"),
        QStringLiteral("Cargo.toml"),
        QStringLiteral("pyproject.toml"),
        QStringLiteral("setup.py"),
        QStringLiteral("go.mod"),
        QStringLiteral("pom.xml"),
        QStringLiteral("build.gradle"),
        QStringLiteral("build.gradle.kts"),
        QStringLiteral("build.sbt"),
        QStringLiteral("CMakeLists.txt"),
        QStringLiteral("meson.build"),
        QStringLiteral("Makefile"),
        QStringLiteral("Gemfile"),
        QStringLiteral("composer.json"),
        QStringLiteral("mix.exs"),
        QStringLiteral("Package.swift"),
        QStringLiteral("deno.json"),
        QStringLiteral("build.zig"),
        QStringLiteral("stack.yaml"),
        QStringLiteral("dune-project"),
    };
    return kMarkers;
}

bool ProjectScanner::isProjectBoundary(const QSet<QString>& names)
{
    for (const QString& marker : vcsMarkers()) {
        if (names.contains(marker)) {
            return true;
        }
    }
    for (const QString& marker : manifestMarkers()) {
        if (names.contains(marker)) {
            return true;
        }
    }
    // .NET solutions and projects are matched by extension.
    for (const QString& name : names) {
        if (name.endsWith(QLatin1String(".sln")) || name.endsWith(QLatin1String(".csproj"))) {
            return true;
        }
    }
    return false;
}

bool ProjectScanner::isProjectBoundary(const QString& dirPath)
{
    const QDir dir(dirPath);
    if (!dir.exists()) {
        return false;
    }
    return isProjectBoundary(entryNames(dir));
}

PathRules ProjectScanner::rulesForRoot(const ResolvedRoot& root) const
{
    PathRules rules;
    rules.addPatterns(m_registry.globalExcludePatterns());
    rules.addPatterns(root.excludePatterns);
    rules.loadIgnoreFile(QDir(root.path).filePath(QStringLiteral(".gotoignore")));
    return rules;
}

ScanReport ProjectScanner::scan() const
{
    const auto& roots = m_registry.roots();

    struct RootOutcome {
        bool valid = true;
        QStringList projects;
        uint64_t visited = 0;
        uint64_t excluded = 0;
    };
    std::vector<RootOutcome> outcomes(roots.size());

    const size_t workers = boundedWorkerCount(roots.size(), m_workers);
    LOG_DEBUG(gotoFs, "Scanning %zu roots with %zu workers", roots.size(), workers);

    runParallel(roots.size(), workers, [&](size_t i) {
        RootOutcome& outcome = outcomes[i];
        outcome.valid = scanRoot(roots[i], outcome.projects, outcome.visited, outcome.excluded);
    });

    // Merge; the first root listing a path owns it.
    std::map<QString, ProjectSource> merged;
    ScanReport report;
    for (size_t i = 0; i < roots.size(); ++i) {
        const RootOutcome& outcome = outcomes[i];
        if (!outcome.valid) {
            report.invalidRoots.append(roots[i].path);
            continue;
        }
        report.directoriesVisited += outcome.visited;
        report.directoriesExcluded += outcome.excluded;
        for (const QString& path : outcome.projects) {
            merged.emplace(path, ProjectSource::Scan);
        }
    }

    if (!m_registry.discoveryRoots().isEmpty()) {
        PathRules discoveryRules;
        discoveryRules.addPatterns(m_registry.globalExcludePatterns());
        const DiscoverySource discovery;
        for (const QString& path : discovery.discover(m_registry.discoveryRoots(), discoveryRules)) {
            merged.emplace(path, ProjectSource::Discovery);
        }
    }

    report.projects.reserve(merged.size());
    for (const auto& [path, source] : merged) {
        report.projects.push_back({path, source});
    }

    LOG_INFO(gotoFs, "Scan complete: %zu projects, %" PRIu64 " dirs visited, "
                     "%" PRIu64 " excluded, %d invalid roots",
             report.projects.size(), report.directoriesVisited,
             report.directoriesExcluded, static_cast<int>(report.invalidRoots.size()));
    return report;
}

bool ProjectScanner::scanRoot(const ResolvedRoot& root, QStringList& projectsOut,
                              uint64_t& visited, uint64_t& excluded) const
{
    const QFileInfo rootInfo(root.path);
    if (!rootInfo.exists() || !rootInfo.isDir() || !rootInfo.isReadable()) {
        LOG_WARN(gotoFs, "Skipping scan root (missing or unreadable): %s",
                 qUtf8Printable(root.path));
        return false;
    }

    const PathRules rules = rulesForRoot(root);
    const int maxDepth = root.recursive
        ? std::min(std::max(root.maxDepth, 1), kHardMaxDepth)
        : 1;

    walk(root.path, root.path, 0, maxDepth, rules, projectsOut, visited, excluded);
    return true;
}

void ProjectScanner::walk(const QString& rootPath, const QString& dirPath, int depth, int maxDepth,
                          const PathRules& rules, QStringList& projectsOut,
                          uint64_t& visited, uint64_t& excluded) const
{
    const QDir dir(dirPath);
    ++visited;

    if (isProjectBoundary(entryNames(dir))) {
        projectsOut.append(canonicalProjectPath(dirPath));
        return;
    }

    if (depth >= maxDepth) {
        return;
    }

    const QFileInfoList entries = dir.entryInfoList(
        QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
    const QDir root(rootPath);

    for (const QFileInfo& fi : entries) {
        // Symlinked directories can form cycles and duplicate real trees.
        if (fi.isSymLink()) {
            ++excluded;
            continue;
        }

        const QString relative = root.relativeFilePath(fi.absoluteFilePath());
        if (rules.isExcluded(relative)) {
            ++excluded;
            continue;
        }

        if (!fi.isReadable()) {
            LOG_DEBUG(gotoFs, "Unreadable directory skipped: %s", qUtf8Printable(fi.absoluteFilePath()));
            continue;
        }

        walk(rootPath, fi.absoluteFilePath(), depth + 1, maxDepth, rules,
             projectsOut, visited, excluded);
    }
}

} // namespace gt
