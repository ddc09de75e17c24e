#include "core/indexing/project_indexer.h"

#include "core/embedding/embedding_handle.h"
#include "core/extraction/metadata_extractor.h"
#include "core/fs/path_registry.h"
#include "core/fs/project_scanner.h"
#include "core/index/project_store.h"
#include "core/shared/logging.h"
#include "core/shared/worker_pool.h"

#include <QElapsedTimer>
#include <QHash>
#include <QFileInfo>

#include <algorithm>

namespace gt {

ProjectIndexer::ProjectIndexer(ProjectStore& store, const PathRegistry& registry,
                               const MetadataExtractor& extractor, EmbeddingHandle& embeddings,
                               int workers)
    : m_store(store)
    , m_registry(registry)
    , m_extractor(extractor)
    , m_embeddings(embeddings)
    , m_workers(workers)
{
}

std::optional<IndexReport> ProjectIndexer::run(bool force, QString* errorOut)
{
    QElapsedTimer timer;
    timer.start();
    IndexReport report;

    if (force && !m_store.clearEmbeddings()) {
        if (errorOut) {
            *errorOut = QStringLiteral("failed to clear stored embeddings");
        }
        return std::nullopt;
    }

    // ── Scan ──
    const ProjectScanner scanner(m_registry, m_workers);
    const ScanReport scan = scanner.scan();
    report.invalidRoots = scan.invalidRoots;
    report.discovered = static_cast<int>(scan.projects.size());

    // ── Prune ──
    std::optional<std::vector<Project>> existing = m_store.allCandidates();
    if (!existing) {
        if (errorOut) {
            *errorOut = QStringLiteral("project cache is unreadable");
        }
        return std::nullopt;
    }
    report.pruned = prune(*existing);
    if (report.pruned < 0) {
        if (errorOut) {
            *errorOut = QStringLiteral("failed to prune stale projects");
        }
        return std::nullopt;
    }

    // ── Extract ──
    std::vector<QString> paths;
    std::vector<ProjectSource> sources;
    paths.reserve(scan.projects.size());
    sources.reserve(scan.projects.size());
    for (const DiscoveredProject& discovered : scan.projects) {
        paths.push_back(discovered.path);
        sources.push_back(discovered.source);
    }
    std::vector<Project> projects = extractAll(paths, sources);

    // ── Embed ──
    embedPending(projects, *existing, report);

    // ── Store ──
    if (!m_store.upsertAll(projects)) {
        if (errorOut) {
            *errorOut = QStringLiteral("failed to write indexed projects");
        }
        return std::nullopt;
    }
    if (!m_store.setSetting(QStringLiteral("last_index_at"),
                            QString::number(currentEpochSeconds(), 'f', 0))) {
        LOG_WARN(gotoIndex, "Failed to record index time");
    }

    report.indexed = static_cast<int>(projects.size());
    report.durationMs = timer.elapsed();
    LOG_INFO(gotoIndex, "Indexed %d projects (%d embedded, %d reused, %d pruned) in %lld ms",
             report.indexed, report.embedded, report.reusedEmbeddings, report.pruned,
             static_cast<long long>(report.durationMs));
    return report;
}

int ProjectIndexer::prune(const std::vector<Project>& existing)
{
    int removed = 0;
    for (const Project& project : existing) {
        const QFileInfo info(project.path);
        const bool gone = !info.exists() || !info.isDir();
        const bool orphaned = !m_registry.covers(project.path);
        if (!gone && !orphaned) {
            continue;
        }
        if (!m_store.removePath(project.path)) {
            LOG_ERROR(gotoIndex, "Failed to prune %s", qPrintable(project.path));
            return -1;
        }
        LOG_DEBUG(gotoIndex, "Pruned %s (%s)", qPrintable(project.path),
                  gone ? "missing" : "no owning root");
        ++removed;
    }
    return removed;
}

std::vector<Project> ProjectIndexer::extractAll(const std::vector<QString>& paths,
                                                const std::vector<ProjectSource>& sources) const
{
    std::vector<Project> projects(paths.size());
    const size_t workers = boundedWorkerCount(paths.size(), m_workers);

    runParallel(paths.size(), workers, [&](size_t i) {
        Project& project = projects[i];
        project.path = paths[i];
        project.name = projectNameForPath(paths[i]);
        project.source = sources[i];
        const ProjectMetadata metadata = m_extractor.extract(paths[i]);
        project.descriptionText = metadata.toDescriptionText(project.name);
        project.techTags = metadata.techTags;
    });

    LOG_DEBUG(gotoExtraction, "Extracted metadata for %zu projects on %zu workers",
              projects.size(), workers);
    return projects;
}

void ProjectIndexer::embedPending(std::vector<Project>& projects,
                                  const std::vector<Project>& existing, IndexReport& report)
{
    QHash<QString, const Project*> previous;
    previous.reserve(qsizetype(existing.size()));
    for (const Project& project : existing) {
        previous.insert(project.path, &project);
    }

    // Reuse stored vectors for unchanged descriptions; collect the rest.
    std::vector<size_t> pending;
    for (size_t i = 0; i < projects.size(); ++i) {
        const Project* stored = previous.value(projects[i].path, nullptr);
        if (stored && stored->hasEmbedding()
            && stored->descriptionText == projects[i].descriptionText) {
            projects[i].embedding = stored->embedding;
            projects[i].modelId = stored->modelId;
        } else {
            pending.push_back(i);
        }
    }

    // Fetched even when every vector is reusable, so a model change is seen.
    EmbeddingProvider* provider = nullptr;
    if (!projects.empty() && !m_embeddings.disabled()) {
        provider = m_embeddings.get();
    }

    if (provider) {
        // A model change invalidates every reused vector.
        const QString modelId = provider->modelId();
        for (size_t i = 0; i < projects.size(); ++i) {
            if (projects[i].hasEmbedding() && projects[i].modelId != modelId) {
                projects[i].embedding.clear();
                projects[i].modelId.clear();
                pending.push_back(i);
            }
        }
        std::sort(pending.begin(), pending.end());
        pending.erase(std::unique(pending.begin(), pending.end()), pending.end());

        for (size_t start = 0; start < pending.size(); start += kEmbeddingBatchSize) {
            const size_t end = std::min(pending.size(), start + kEmbeddingBatchSize);
            std::vector<QString> texts;
            texts.reserve(end - start);
            for (size_t j = start; j < end; ++j) {
                texts.push_back(projects[pending[j]].descriptionText);
            }

            const std::vector<std::vector<float>> vectors = provider->embedBatch(texts);
            if (vectors.size() != texts.size()) {
                report.embeddingDegraded = true;
                report.degradeReason = QStringLiteral("embedding inference failed");
                LOG_WARN(gotoEmbedding, "Embedding batch %zu-%zu failed", start, end);
                continue;
            }
            for (size_t j = start; j < end; ++j) {
                const std::vector<float>& vector = vectors[j - start];
                if (static_cast<int>(vector.size()) != provider->dimensions()) {
                    continue;
                }
                projects[pending[j]].embedding = vector;
                projects[pending[j]].modelId = modelId;
                ++report.embedded;
            }
        }
    } else if (!pending.empty() && !m_embeddings.disabled()) {
        report.embeddingDegraded = true;
        report.degradeReason = m_embeddings.failureReason();
    }

    for (const Project& project : projects) {
        if (!project.hasEmbedding()) {
            ++report.withoutEmbedding;
        }
    }
    report.reusedEmbeddings = static_cast<int>(projects.size()) - report.withoutEmbedding
                              - report.embedded;
}

} // namespace gt
