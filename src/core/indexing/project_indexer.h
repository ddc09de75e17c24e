#pragma once

#include "core/shared/types.h"

#include <QString>
#include <QStringList>

#include <cstddef>
#include <optional>
#include <vector>

namespace gt {

class EmbeddingHandle;
class MetadataExtractor;
class PathRegistry;
class ProjectStore;

struct IndexReport {
    int discovered = 0;
    int indexed = 0;
    int embedded = 0;              // freshly computed
    int reusedEmbeddings = 0;      // unchanged text, same model
    int withoutEmbedding = 0;
    int pruned = 0;
    QStringList invalidRoots;      // ScanPathInvalid
    bool embeddingDegraded = false;
    QString degradeReason;
    qint64 durationMs = 0;
};

// ProjectIndexer — one `update` pass:
//   scan roots → prune stale rows → extract metadata (parallel) →
//   embed changed descriptions (batched) → upsert everything in one
//   transaction.
// Access statistics are never written here.
class ProjectIndexer {
public:
    ProjectIndexer(ProjectStore& store, const PathRegistry& registry,
                   const MetadataExtractor& extractor, EmbeddingHandle& embeddings,
                   int workers = 0);

    // nullopt when the store could not be read or written.
    // force drops every stored embedding first.
    std::optional<IndexReport> run(bool force, QString* errorOut = nullptr);

    // Deletes rows whose directory is gone or that no registered root owns.
    // Returns the number removed, or -1 on a store error.
    int prune(const std::vector<Project>& existing);

    static constexpr size_t kEmbeddingBatchSize = 16;

private:
    std::vector<Project> extractAll(const std::vector<QString>& paths,
                                    const std::vector<ProjectSource>& sources) const;
    void embedPending(std::vector<Project>& projects, const std::vector<Project>& existing,
                      IndexReport& report);

    ProjectStore& m_store;
    const PathRegistry& m_registry;
    const MetadataExtractor& m_extractor;
    EmbeddingHandle& m_embeddings;
    int m_workers;
};

} // namespace gt
