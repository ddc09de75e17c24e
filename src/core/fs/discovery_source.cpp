#include "core/fs/discovery_source.h"
#include "core/shared/logging.h"
#include "core/shared/process_runner.h"
#include "core/shared/types.h"

#include <QDir>
#include <QFileInfo>
#include <QSet>

namespace gt {

DiscoverySource::DiscoverySource(int timeoutMs)
    : m_timeoutMs(timeoutMs)
{
}

const QStringList& DiscoverySource::markerFiles()
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
        QStringLiteral("docs.json"),
        QStringLiteral("mkdocs.yml"),
        QStringLiteral("docusaurus.config.js"),
    };
    return kMarkers;
}

QString DiscoverySource::buildQuery()
{
    QStringList clauses;
    clauses.reserve(markerFiles().size());
    for (const QString& marker : markerFiles()) {
        clauses.append(QStringLiteral("kMDItemFSName == '%1'").arg(marker));
    }
    return clauses.join(QStringLiteral(" || "));
}

QStringList DiscoverySource::parseOutput(const QByteArray& output)
{
    QStringList hits;
    for (const QByteArray& part : output.split('\0')) {
        const QString path = QString::fromUtf8(part).trimmed();
        if (!path.isEmpty()) {
            hits.append(path);
        }
    }
    return hits;
}

QStringList DiscoverySource::discover(const QStringList& roots, const PathRules& rules) const
{
    QSet<QString> projects;
    const QString query = buildQuery();

    for (const QString& root : roots) {
        if (!QFileInfo(root).isDir()) {
            LOG_WARN(gotoFs, "Discovery root is not a directory: %s", qUtf8Printable(root));
            continue;
        }

        const ProcessOutcome mdfind = runProcess(
            QStringLiteral("mdfind"),
            {QStringLiteral("-0"), QStringLiteral("-onlyin"), root, query},
            m_timeoutMs);
        if (!mdfind.ok) {
            LOG_INFO(gotoFs, "Discovery unavailable for %s: %s",
                     qUtf8Printable(root), qUtf8Printable(mdfind.error));
            continue;
        }

        int kept = 0;
        for (const QString& hit : parseOutput(mdfind.stdoutData)) {
            const QString parent = QFileInfo(hit).absolutePath();
            if (!QFileInfo(QDir(parent).filePath(QStringLiteral(".git"))).isDir()) {
                continue;
            }
            const QString canonical = canonicalProjectPath(parent);
            if (!isPathUnder(canonical, root)
                || rules.isExcluded(QDir(root).relativeFilePath(canonical))) {
                continue;
            }
            if (!projects.contains(canonical)) {
                projects.insert(canonical);
                ++kept;
            }
        }
        LOG_DEBUG(gotoFs, "Discovery under %s kept %d projects (%lld ms)",
                  qUtf8Printable(root), kept, static_cast<long long>(mdfind.elapsedMs));
    }

    QStringList sorted(projects.begin(), projects.end());
    sorted.sort();
    return sorted;
}

} // namespace gt
