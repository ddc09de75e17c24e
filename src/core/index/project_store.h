#pragma once

#include "core/shared/types.h"

#include <QString>

#include <cstdint>
#include <optional>
#include <vector>

#include <sqlite3.h>

namespace gt {

// ProjectStore — owner of the SQLite registry of indexed projects.
//
// Writers take the database write lock through explicit transactions, so
// an index run and a navigation query in another process never observe a
// partially written project row. Read methods return std::nullopt when
// the database is unreadable; callers report that as a corrupt store.
class ProjectStore {
public:
    ~ProjectStore();

    // Move-only (owns sqlite3* handle)
    ProjectStore(ProjectStore&& other) noexcept : m_db(other.m_db) { other.m_db = nullptr; }
    ProjectStore& operator=(ProjectStore&& other) noexcept {
        if (this != &other) {
            if (m_db) sqlite3_close(m_db);
            m_db = other.m_db;
            other.m_db = nullptr;
        }
        return *this;
    }
    ProjectStore(const ProjectStore&) = delete;
    ProjectStore& operator=(const ProjectStore&) = delete;

    // Open or create the database at the given path.
    // Creates schema and sets pragmas on first open. Fails on a file that
    // is not a database or carries a newer schema version.
    static std::optional<ProjectStore> open(const QString& dbPath, QString* errorOut = nullptr);

    // Removes the database file and its WAL/SHM companions.
    static bool destroy(const QString& dbPath, QString* errorOut = nullptr);

    // ── Projects ────────────────────────────────────────────

    // Insert or replace metadata by path. Access statistics of an existing
    // row are never touched. indexed_at is set to now when zero.
    bool upsert(const Project& project);

    // Upserts every project inside one transaction; all or nothing.
    bool upsertAll(const std::vector<Project>& projects);

    // Deletes the project at path and every project below it.
    // Returns the number of rows removed, or -1 on error.
    int removeByPrefix(const QString& path);

    bool removePath(const QString& path);

    std::optional<Project> findByPath(const QString& path);

    // All projects ordered by the requested key. limit < 0 means no limit.
    //   Name      name ascending, then path
    //   Recent    last_accessed descending, never-accessed last, then path
    //   Frecency  frecency descending, then access_count, then path
    std::optional<std::vector<Project>> list(SortOrder order, int limit = -1);

    // Full snapshot for ranking, in path order.
    std::optional<std::vector<Project>> allCandidates();

    std::optional<int> count();

    // Atomically increments access_count and sets last_accessed.
    // Returns false when no project is stored at path.
    bool recordAccess(const QString& path, double accessedAt = currentEpochSeconds());

    // Drops every stored embedding so the next index run recomputes them.
    bool clearEmbeddings();

    // ── Settings ────────────────────────────────────────────

    std::optional<QString> getSetting(const QString& key);
    bool setSetting(const QString& key, const QString& value);

    // ── Transactions ────────────────────────────────────────

    bool beginImmediateTransaction();
    bool commitTransaction();
    bool rollbackTransaction();

    // Returns true if database passes PRAGMA integrity_check
    bool integrityCheck() const;

    // Raw handle for tests
    sqlite3* rawDb() const { return m_db; }

private:
    ProjectStore() = default;
    bool init(const QString& dbPath, QString* errorOut);
    bool execSql(const char* sql);
    void abortTransaction();
    bool upsertRow(const Project& project, double now);
    std::optional<std::vector<Project>> queryProjects(const char* sql, int limit);
    int schemaVersion();

    sqlite3* m_db = nullptr;
};

} // namespace gt
