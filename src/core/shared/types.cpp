#include "core/shared/types.h"

#include <QDateTime>
#include <QDir>
#include <QFileInfo>

#include <algorithm>
#include <cmath>

namespace gt {

QString sortOrderToString(SortOrder order)
{
    switch (order) {
    case SortOrder::Name:     return QStringLiteral("name");
    case SortOrder::Recent:   return QStringLiteral("recent");
    case SortOrder::Frecency: return QStringLiteral("frecency");
    }
    return QStringLiteral("frecency");
}

std::optional<SortOrder> sortOrderFromString(const QString& str)
{
    const QString s = str.trimmed().toLower();
    if (s == QLatin1String("name") || s == QLatin1String("n"))         return SortOrder::Name;
    if (s == QLatin1String("recent") || s == QLatin1String("r"))       return SortOrder::Recent;
    if (s == QLatin1String("frecency") || s == QLatin1String("f"))     return SortOrder::Frecency;
    return std::nullopt;
}

QString projectSourceToString(ProjectSource source)
{
    switch (source) {
    case ProjectSource::Scan:      return QStringLiteral("scan");
    case ProjectSource::Discovery: return QStringLiteral("discovery");
    }
    return QStringLiteral("scan");
}

ProjectSource projectSourceFromString(const QString& str)
{
    if (str == QLatin1String("discovery")) return ProjectSource::Discovery;
    return ProjectSource::Scan;
}

double frecencyScore(const Project& project, double nowEpoch)
{
    if (!project.lastAccessed.has_value() || project.accessCount <= 0) {
        return 0.0;
    }

    const double hoursSinceAccess = std::max(0.0, (nowEpoch - *project.lastAccessed) / 3600.0);
    const double recencyFactor = std::pow(0.5, hoursSinceAccess / 72.0);
    const double frequencyFactor = std::log(static_cast<double>(project.accessCount) + 1.0);
    return recencyFactor * frequencyFactor * 100.0;
}

QString canonicalProjectPath(const QString& path)
{
    if (path.isEmpty()) {
        return QString();
    }

    QString expanded = path;
    if (expanded == QLatin1String("~")) {
        expanded = QDir::homePath();
    } else if (expanded.startsWith(QLatin1String("~/"))) {
        expanded = QDir::homePath() + expanded.mid(1);
    }

    const QFileInfo info(expanded);
    QString result = info.exists() ? info.canonicalFilePath() : QString();
    if (result.isEmpty()) {
        result = QDir::cleanPath(info.absoluteFilePath());
    }

    while (result.size() > 1 && result.endsWith(QLatin1Char('/'))) {
        result.chop(1);
    }
    return result;
}

QString projectNameForPath(const QString& path)
{
    const QString name = QFileInfo(path).fileName();
    return name.isEmpty() ? path : name;
}

bool isPathUnder(const QString& path, const QString& root)
{
    if (root.isEmpty()) {
        return false;
    }
    if (path == root) {
        return true;
    }
    const QString prefix = root.endsWith(QLatin1Char('/')) ? root : root + QLatin1Char('/');
    return path.startsWith(prefix);
}

double currentEpochSeconds()
{
    return static_cast<double>(QDateTime::currentMSecsSinceEpoch()) / 1000.0;
}

} // namespace gt
