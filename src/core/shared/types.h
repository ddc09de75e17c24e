#pragma once

#include <QString>
#include <QStringList>
#include <cstdint>
#include <optional>
#include <vector>

namespace gt {

// Ordering keys accepted by `goto list`.
enum class SortOrder {
    Name,
    Recent,
    Frecency,
};

QString sortOrderToString(SortOrder order);
std::optional<SortOrder> sortOrderFromString(const QString& str);

// How a project entered the registry.
enum class ProjectSource {
    Scan,
    Discovery,
};

QString projectSourceToString(ProjectSource source);
ProjectSource projectSourceFromString(const QString& str);

// One registered scan root.
struct ScanPath {
    QString path;
    bool recursive = true;
    int maxDepth = 0;               // 0 = use Settings::maxDepth
    QStringList excludePatterns;
};

// One indexed project directory. Timestamps are seconds since the epoch.
struct Project {
    int64_t id = 0;
    QString path;
    QString name;
    QString descriptionText;
    QStringList techTags;
    std::vector<float> embedding;
    QString modelId;
    ProjectSource source = ProjectSource::Scan;

    int accessCount = 0;
    std::optional<double> lastAccessed;
    double indexedAt = 0.0;

    bool hasEmbedding() const { return !embedding.empty(); }
};

// 0.5^(hours since access / 72) * ln(access_count + 1) * 100.
// Projects that were never opened score 0.
double frecencyScore(const Project& project, double nowEpoch);

// Absolute, symlink-resolved when the path exists, never with a trailing
// separator (except for the filesystem root itself).
QString canonicalProjectPath(const QString& path);

// Last path segment of a canonical project path.
QString projectNameForPath(const QString& path);

// True when path equals root or lies below it.
bool isPathUnder(const QString& path, const QString& root);

double currentEpochSeconds();

} // namespace gt
