#include "core/index/project_store.h"
#include "core/index/schema.h"
#include "core/shared/logging.h"

#include <QFile>

#include <algorithm>
#include <cstring>

namespace gt {

namespace {

constexpr const char* kProjectColumns =
    "id, path, name, description_text, tech_tags, embedding, model_id, source, "
    "access_count, last_accessed, indexed_at";

QString columnText(sqlite3_stmt* stmt, int column)
{
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? QString::fromUtf8(text) : QString();
}

Project projectFromRow(sqlite3_stmt* stmt)
{
    Project project;
    project.id = sqlite3_column_int64(stmt, 0);
    project.path = columnText(stmt, 1);
    project.name = columnText(stmt, 2);
    project.descriptionText = columnText(stmt, 3);
    const QString tags = columnText(stmt, 4);
    if (!tags.isEmpty()) {
        project.techTags = tags.split(QLatin1Char(','), Qt::SkipEmptyParts);
    }

    const int blobBytes = sqlite3_column_bytes(stmt, 5);
    const void* blob = sqlite3_column_blob(stmt, 5);
    if (blob && blobBytes > 0 && blobBytes % static_cast<int>(sizeof(float)) == 0) {
        project.embedding.resize(static_cast<size_t>(blobBytes) / sizeof(float));
        std::memcpy(project.embedding.data(), blob, static_cast<size_t>(blobBytes));
    } else if (blobBytes > 0) {
        LOG_WARN(gotoIndex, "Ignoring malformed embedding for %s (%d bytes)",
                 qPrintable(project.path), blobBytes);
    }

    project.modelId = columnText(stmt, 6);
    project.source = projectSourceFromString(columnText(stmt, 7));
    project.accessCount = sqlite3_column_int(stmt, 8);
    if (sqlite3_column_type(stmt, 9) != SQLITE_NULL) {
        project.lastAccessed = sqlite3_column_double(stmt, 9);
    }
    project.indexedAt = sqlite3_column_double(stmt, 10);
    return project;
}

// "<path>/", compared with substr() so '%' and '_' in paths stay literal.
QByteArray childPrefix(const QString& path)
{
    QString prefix = path;
    if (!prefix.endsWith(QLatin1Char('/'))) {
        prefix += QLatin1Char('/');
    }
    return prefix.toUtf8();
}

} // anonymous namespace

ProjectStore::~ProjectStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::optional<ProjectStore> ProjectStore::open(const QString& dbPath, QString* errorOut)
{
    ProjectStore store;
    if (!store.init(dbPath, errorOut)) {
        return std::nullopt;
    }
    return store;
}

bool ProjectStore::destroy(const QString& dbPath, QString* errorOut)
{
    const QStringList files = {
        dbPath,
        dbPath + QStringLiteral("-wal"),
        dbPath + QStringLiteral("-shm"),
    };
    for (const QString& file : files) {
        if (QFile::exists(file) && !QFile::remove(file)) {
            if (errorOut) {
                *errorOut = QStringLiteral("cannot remove %1").arg(file);
            }
            LOG_ERROR(gotoIndex, "Failed to remove %s", qPrintable(file));
            return false;
        }
    }
    LOG_INFO(gotoIndex, "Removed project cache %s", qPrintable(dbPath));
    return true;
}

bool ProjectStore::init(const QString& dbPath, QString* errorOut)
{
    const auto fail = [this, errorOut](const QString& message) {
        if (errorOut) {
            *errorOut = message;
        }
        LOG_ERROR(gotoIndex, "%s", qPrintable(message));
        return false;
    };

    int rc = sqlite3_open(dbPath.toUtf8().constData(), &m_db);
    if (rc != SQLITE_OK) {
        return fail(QStringLiteral("cannot open %1: %2")
                        .arg(dbPath, QString::fromUtf8(sqlite3_errmsg(m_db))));
    }

    // Set busy_timeout FIRST via C API, before running any SQL.
    sqlite3_busy_timeout(m_db, 10000);

    if (!execSql(kConnectionPragmas)) {
        return fail(QStringLiteral("%1 is not a readable project cache").arg(dbPath));
    }

    // The first real read is where a non-database file is detected.
    bool schemaExists = false;
    {
        sqlite3_stmt* stmt = nullptr;
        rc = sqlite3_prepare_v2(m_db,
            "SELECT count(*) FROM sqlite_master WHERE type='table' AND name='projects'",
            -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            sqlite3_finalize(stmt);
            return fail(QStringLiteral("%1 is not a readable project cache: %2")
                            .arg(dbPath, QString::fromUtf8(sqlite3_errmsg(m_db))));
        }
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            schemaExists = (sqlite3_column_int(stmt, 0) > 0);
        }
        sqlite3_finalize(stmt);
    }

    if (!schemaExists) {
        if (!execSql(kDatabasePragmas)) {
            return fail(QStringLiteral("failed to set database pragmas"));
        }
        if (!execSql(kSchemaV1) || !execSql(kDefaultSettings)) {
            return fail(QStringLiteral("failed to create schema in %1").arg(dbPath));
        }
    }

    const int version = schemaVersion();
    if (version != kCurrentSchemaVersion) {
        return fail(QStringLiteral("%1 has schema version %2, expected %3")
                        .arg(dbPath)
                        .arg(version)
                        .arg(kCurrentSchemaVersion));
    }

    // Restrict database file permissions to owner-only (0600)
    QFile dbFile(dbPath);
    dbFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);

    LOG_DEBUG(gotoIndex, "Database opened: %s", qPrintable(dbPath));
    return true;
}

int ProjectStore::schemaVersion()
{
    const std::optional<QString> value = getSetting(QStringLiteral("schema_version"));
    if (!value) {
        return 0;
    }
    bool ok = false;
    const int version = value->toInt(&ok);
    return ok ? version : 0;
}

bool ProjectStore::execSql(const char* sql)
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(gotoIndex, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

// ── Projects ────────────────────────────────────────────────

bool ProjectStore::upsertRow(const Project& project, double now)
{
    const char* sql = R"(
        INSERT INTO projects (path, name, description_text, tech_tags, embedding,
                              model_id, source, indexed_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)
        ON CONFLICT(path) DO UPDATE SET
            name = excluded.name,
            description_text = excluded.description_text,
            tech_tags = excluded.tech_tags,
            embedding = excluded.embedding,
            model_id = excluded.model_id,
            source = excluded.source,
            indexed_at = excluded.indexed_at
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(gotoIndex, "upsert prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }

    const QByteArray pathUtf8 = project.path.toUtf8();
    const QByteArray nameUtf8 = project.name.toUtf8();
    const QByteArray descriptionUtf8 = project.descriptionText.toUtf8();
    const QByteArray tagsUtf8 = project.techTags.join(QLatin1Char(',')).toUtf8();
    const QByteArray modelUtf8 = project.modelId.toUtf8();
    const QByteArray sourceUtf8 = projectSourceToString(project.source).toUtf8();

    sqlite3_bind_text(stmt, 1, pathUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, nameUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, descriptionUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 4, tagsUtf8.constData(), -1, SQLITE_STATIC);
    if (project.hasEmbedding()) {
        sqlite3_bind_blob(stmt, 5, project.embedding.data(),
                          static_cast<int>(project.embedding.size() * sizeof(float)),
                          SQLITE_STATIC);
        sqlite3_bind_text(stmt, 6, modelUtf8.constData(), -1, SQLITE_STATIC);
    } else {
        sqlite3_bind_null(stmt, 5);
        sqlite3_bind_null(stmt, 6);
    }
    sqlite3_bind_text(stmt, 7, sourceUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_double(stmt, 8, project.indexedAt > 0.0 ? project.indexedAt : now);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(gotoIndex, "upsert failed for %s: %s", pathUtf8.constData(), sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

bool ProjectStore::upsert(const Project& project)
{
    return upsertRow(project, currentEpochSeconds());
}

bool ProjectStore::upsertAll(const std::vector<Project>& projects)
{
    if (projects.empty()) {
        return true;
    }
    if (!beginImmediateTransaction()) {
        return false;
    }
    const double now = currentEpochSeconds();
    for (const Project& project : projects) {
        if (!upsertRow(project, now)) {
            abortTransaction();
            return false;
        }
    }
    return commitTransaction();
}

int ProjectStore::removeByPrefix(const QString& path)
{
    const char* sql =
        "DELETE FROM projects WHERE path = ?1 OR substr(path, 1, length(?2)) = ?2";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(gotoIndex, "removeByPrefix prepare failed: %s", sqlite3_errmsg(m_db));
        return -1;
    }
    const QByteArray pathUtf8 = path.toUtf8();
    const QByteArray prefixUtf8 = childPrefix(path);
    sqlite3_bind_text(stmt, 1, pathUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, prefixUtf8.constData(), -1, SQLITE_STATIC);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(gotoIndex, "removeByPrefix failed: %s", sqlite3_errmsg(m_db));
        return -1;
    }
    return sqlite3_changes(m_db);
}

bool ProjectStore::removePath(const QString& path)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "DELETE FROM projects WHERE path = ?1", -1, &stmt, nullptr)
        != SQLITE_OK) {
        return false;
    }
    const QByteArray pathUtf8 = path.toUtf8();
    sqlite3_bind_text(stmt, 1, pathUtf8.constData(), -1, SQLITE_STATIC);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

std::optional<Project> ProjectStore::findByPath(const QString& path)
{
    const QByteArray sql = QByteArray("SELECT ") + kProjectColumns
                           + " FROM projects WHERE path = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    const QByteArray pathUtf8 = path.toUtf8();
    sqlite3_bind_text(stmt, 1, pathUtf8.constData(), -1, SQLITE_STATIC);

    std::optional<Project> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = projectFromRow(stmt);
    }
    sqlite3_finalize(stmt);
    return result;
}

std::optional<std::vector<Project>> ProjectStore::queryProjects(const char* orderBy, int limit)
{
    QByteArray sql = QByteArray("SELECT ") + kProjectColumns + " FROM projects " + orderBy;
    if (limit >= 0) {
        sql += " LIMIT " + QByteArray::number(limit);
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(gotoIndex, "Project query failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }

    std::vector<Project> projects;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        projects.push_back(projectFromRow(stmt));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(gotoIndex, "Project scan aborted: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return projects;
}

std::optional<std::vector<Project>> ProjectStore::list(SortOrder order, int limit)
{
    switch (order) {
    case SortOrder::Name:
        return queryProjects("ORDER BY name COLLATE NOCASE ASC, path ASC", limit);
    case SortOrder::Recent:
        return queryProjects(
            "ORDER BY last_accessed IS NULL, last_accessed DESC, path ASC", limit);
    case SortOrder::Frecency:
        break;
    }

    // Frecency decays with wall-clock time, so it is ranked here rather than in SQL.
    std::optional<std::vector<Project>> projects = queryProjects("ORDER BY path ASC", -1);
    if (!projects) {
        return std::nullopt;
    }
    const double now = currentEpochSeconds();
    std::stable_sort(projects->begin(), projects->end(),
                     [now](const Project& a, const Project& b) {
                         const double fa = frecencyScore(a, now);
                         const double fb = frecencyScore(b, now);
                         if (fa != fb) {
                             return fa > fb;
                         }
                         return a.accessCount > b.accessCount;
                     });
    if (limit >= 0 && static_cast<size_t>(limit) < projects->size()) {
        projects->resize(static_cast<size_t>(limit));
    }
    return projects;
}

std::optional<std::vector<Project>> ProjectStore::allCandidates()
{
    return queryProjects("ORDER BY path ASC", -1);
}

std::optional<int> ProjectStore::count()
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT COUNT(*) FROM projects", -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    std::optional<int> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return result;
}

bool ProjectStore::recordAccess(const QString& path, double accessedAt)
{
    if (!beginImmediateTransaction()) {
        return false;
    }

    sqlite3_stmt* stmt = nullptr;
    const char* sql =
        "UPDATE projects SET access_count = access_count + 1, last_accessed = ?2 WHERE path = ?1";
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(gotoIndex, "recordAccess prepare failed: %s", sqlite3_errmsg(m_db));
        abortTransaction();
        return false;
    }
    const QByteArray pathUtf8 = path.toUtf8();
    sqlite3_bind_text(stmt, 1, pathUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_double(stmt, 2, accessedAt);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE || sqlite3_changes(m_db) != 1) {
        if (rc != SQLITE_DONE) {
            LOG_ERROR(gotoIndex, "recordAccess failed: %s", sqlite3_errmsg(m_db));
        }
        abortTransaction();
        return false;
    }
    return commitTransaction();
}

bool ProjectStore::clearEmbeddings()
{
    return execSql("UPDATE projects SET embedding = NULL, model_id = NULL");
}

// ── Settings ────────────────────────────────────────────────

std::optional<QString> ProjectStore::getSetting(const QString& key)
{
    const char* sql = "SELECT value FROM settings WHERE key = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    const QByteArray keyUtf8 = key.toUtf8();
    sqlite3_bind_text(stmt, 1, keyUtf8.constData(), -1, SQLITE_STATIC);

    std::optional<QString> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = columnText(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return result;
}

bool ProjectStore::setSetting(const QString& key, const QString& value)
{
    const char* sql = R"(
        INSERT INTO settings (key, value) VALUES (?1, ?2)
        ON CONFLICT(key) DO UPDATE SET value = excluded.value
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    const QByteArray keyUtf8 = key.toUtf8();
    const QByteArray valUtf8 = value.toUtf8();
    sqlite3_bind_text(stmt, 1, keyUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, valUtf8.constData(), -1, SQLITE_STATIC);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

// ── Transactions ────────────────────────────────────────────

bool ProjectStore::beginImmediateTransaction()
{
    return execSql("BEGIN IMMEDIATE");
}

bool ProjectStore::commitTransaction()
{
    return execSql("COMMIT");
}

bool ProjectStore::rollbackTransaction()
{
    return execSql("ROLLBACK");
}

void ProjectStore::abortTransaction()
{
    if (!rollbackTransaction()) {
        LOG_ERROR(gotoIndex, "Rollback failed: %s", sqlite3_errmsg(m_db));
    }
}

bool ProjectStore::integrityCheck() const
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "PRAGMA integrity_check", -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    bool ok = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* result = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        ok = result && std::strcmp(result, "ok") == 0;
    }
    sqlite3_finalize(stmt);
    return ok;
}

} // namespace gt
