#include "commands.h"
#include "console.h"

#include "core/embedding/embedding_handle.h"
#include "core/extraction/metadata_extractor.h"
#include "core/fs/path_registry.h"
#include "core/indexing/project_indexer.h"
#include "core/models/model_cache.h"
#include "core/navigation/navigation_resolver.h"
#include "core/shared/app_paths.h"
#include "core/shared/logging.h"
#include "core/shared/process_runner.h"
#include "core/shared/run_context.h"
#include "core/shared/settings_manager.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QHash>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include <algorithm>

namespace gt {

namespace {

constexpr int kGitTimeoutMs = 2000;
constexpr int kDefaultFindLimit = 10;
constexpr int kDefaultRecentLimit = 5;
constexpr int kDefaultListLimit = 20;

struct GitStatus {
    QString branch;
    bool dirty = false;
};

// One `git status --porcelain --branch` call: "## main...origin/main" then
// one line per change.
std::optional<GitStatus> gitStatus(const QString& projectPath)
{
    if (!QFileInfo::exists(projectPath + QStringLiteral("/.git"))) {
        return std::nullopt;
    }
    const ProcessOutcome git = runProcess(
        QStringLiteral("git"),
        {QStringLiteral("status"), QStringLiteral("--porcelain=v1"), QStringLiteral("--branch")},
        kGitTimeoutMs, projectPath);
    if (!git.ok) {
        return std::nullopt;
    }

    const QStringList lines = QString::fromUtf8(git.stdoutData).split(QLatin1Char('\n'),
                                                                     Qt::SkipEmptyParts);
    if (lines.isEmpty() || !lines.first().startsWith(QLatin1String("## "))) {
        return std::nullopt;
    }
    GitStatus status;
    const QString header = lines.first().mid(3);
    if (header.startsWith(QLatin1String("No commits yet on "))) {
        status.branch = header.section(QLatin1Char(' '), -1);
    } else {
        status.branch = header.section(QLatin1String("..."), 0, 0).section(QLatin1Char(' '), 0, 0);
    }
    status.dirty = lines.size() > 1;
    return status;
}

QString homeRelative(const QString& path)
{
    const QString home = QDir::homePath();
    if (isPathUnder(path, home) && path != home) {
        return QStringLiteral("~") + path.mid(home.size());
    }
    return path;
}

} // anonymous namespace

CommandRunner::CommandRunner(RunContext& context, Console& console)
    : m_context(context)
    , m_console(console)
{
}

int CommandRunner::run(const CommandLine& line)
{
    switch (line.command) {
    case Command::Find:    return find(line);
    case Command::Recent:  return recent(line);
    case Command::Update:  return update(line.force);
    case Command::Refresh: return refresh();
    case Command::List:    return list(line);
    case Command::Add:     return add(line.path);
    case Command::Remove:  return remove(line.path);
    case Command::Config:  return config();
    case Command::Stats:   return stats();
    case Command::Test:    return test(line.path);
    case Command::Version:
        m_console.line(QCoreApplication::applicationName() + QLatin1Char(' ')
                       + QCoreApplication::applicationVersion());
        return kExitOk;
    case Command::Help:
        m_console.line(line.helpText);
        return kExitOk;
    }
    return kExitUsage;
}

std::optional<ProjectStore> CommandRunner::openStore(int* exitCode)
{
    const QString dbPath = m_context.databasePath;
    if (!QDir().mkpath(QFileInfo(dbPath).absolutePath())) {
        m_console.failure(QStringLiteral("cannot create %1").arg(QFileInfo(dbPath).absolutePath()));
        *exitCode = kExitConfig;
        return std::nullopt;
    }

    QString error;
    std::optional<ProjectStore> store = ProjectStore::open(dbPath, &error);
    if (!store) {
        m_console.failure(QStringLiteral("project cache is corrupt: %1").arg(error));
        m_console.line(QStringLiteral("  run %1 to rebuild it").arg(m_console.bold(QStringLiteral("goto refresh"))));
        *exitCode = kExitStoreCorrupt;
    }
    return store;
}

void CommandRunner::printBreakdown(const RankedProject& ranked)
{
    const ScoreBreakdown& s = ranked.score;
    m_console.line(m_console.dim(QStringLiteral("    fuzzy=%1%2 semantic=%3 boost=%4 total=%5")
                                     .arg(s.fuzzyScore, 0, 'f', 1)
                                     .arg(s.fuzzyFromPath ? QStringLiteral("(path)") : QString())
                                     .arg(s.semanticScore, 0, 'f', 1)
                                     .arg(s.boost, 0, 'f', 0)
                                     .arg(s.total, 0, 'f', 2)));
}

void CommandRunner::reportDegraded(const QString& reason)
{
    m_console.warning(QStringLiteral("semantic matching unavailable (%1); using name matching only")
                          .arg(reason));
}

// ── find ──

int CommandRunner::find(const CommandLine& line)
{
    int exitCode = kExitOk;
    std::optional<ProjectStore> store = openStore(&exitCode);
    if (!store) {
        return exitCode;
    }

    const Ranker ranker(m_context.weights);
    NavigationResolver resolver(*store, ranker, *m_context.embeddings);

    NavigationRequest request;
    request.query = line.query;
    request.all = line.all;
    request.limit = line.limit.value_or(kDefaultFindLimit);

    const NavigationOutcome outcome = resolver.resolve(request);
    if (outcome.degraded) {
        reportDegraded(outcome.degradeReason);
    }

    switch (outcome.error) {
    case NavigationError::None:
        break;
    case NavigationError::NoMatchFound:
        m_console.failure(outcome.diagnostic);
        return kExitNoMatch;
    case NavigationError::StoreCorrupt:
        m_console.failure(outcome.diagnostic);
        return kExitStoreCorrupt;
    case NavigationError::InternalError:
        m_console.failure(QStringLiteral("internal error: %1").arg(outcome.diagnostic));
        return kExitInternal;
    }

    if (line.all) {
        m_console.line(QStringLiteral("Matches for %1:").arg(m_console.bold(line.query)));
        int position = 1;
        for (const RankedProject& ranked : outcome.matches) {
            m_console.line(QStringLiteral("  %1. %2 %3 %4")
                               .arg(position++, 2)
                               .arg(m_console.bold(ranked.project.name))
                               .arg(m_console.cyan(QStringLiteral("%1").arg(ranked.score.total, 0, 'f', 1)))
                               .arg(m_console.dim(homeRelative(ranked.project.path))));
            if (m_context.debug) {
                printBreakdown(ranked);
            }
        }
        return kExitOk;
    }

    const RankedProject& best = outcome.matches.front();
    if (best.score.fuzzyScore <= 0.0 && best.score.semanticScore > 0.0) {
        m_console.semantic(QStringLiteral("%1 %2")
                               .arg(m_console.bold(best.project.name))
                               .arg(m_console.dim(QStringLiteral("(semantic: %1%)")
                                                      .arg(best.score.semanticScore, 0, 'f', 0))));
    } else {
        m_console.success(m_console.bold(best.project.name));
    }
    if (m_context.debug) {
        printBreakdown(best);
    }

    if (!line.cdOnly && !m_context.cdOnly && m_context.settings.postCommand) {
        m_console.emitDirective(*m_context.settings.postCommand);
    }
    m_console.emitPath(outcome.path);
    return kExitOk;
}

int CommandRunner::recent(const CommandLine& line)
{
    int exitCode = kExitOk;
    std::optional<ProjectStore> store = openStore(&exitCode);
    if (!store) {
        return exitCode;
    }

    const Ranker ranker(m_context.weights);
    NavigationResolver resolver(*store, ranker, *m_context.embeddings);
    NavigationRequest request;
    request.recent = true;
    request.limit = line.limit.value_or(kDefaultRecentLimit);

    const NavigationOutcome outcome = resolver.resolve(request);
    if (outcome.error == NavigationError::StoreCorrupt) {
        m_console.failure(outcome.diagnostic);
        return kExitStoreCorrupt;
    }
    if (!outcome.ok()) {
        m_console.failure(outcome.diagnostic);
        return kExitNoMatch;
    }

    const double now = currentEpochSeconds();
    m_console.line(m_console.bold(QStringLiteral("Recent projects:")));
    int position = 1;
    for (const Project& project : outcome.recent) {
        m_console.line(QStringLiteral("  %1. %2 %3 %4")
                           .arg(position++, 2)
                           .arg(m_console.bold(project.name))
                           .arg(m_console.dim(relativeAge(project.lastAccessed.value_or(now), now)))
                           .arg(m_console.dim(homeRelative(project.path))));
    }
    return kExitOk;
}

// ── update / refresh ──

int CommandRunner::update(bool force)
{
    int exitCode = kExitOk;
    std::optional<ProjectStore> store = openStore(&exitCode);
    if (!store) {
        return exitCode;
    }

    const PathRegistry registry(m_context.settings);
    if (registry.roots().empty() && registry.discoveryRoots().isEmpty()) {
        m_console.warning(QStringLiteral("no scan paths registered; add one with %1")
                              .arg(m_console.bold(QStringLiteral("goto add <path>"))));
    }

    const MetadataExtractor extractor(m_context.techSignatures);
    ProjectIndexer indexer(*store, registry, extractor, *m_context.embeddings,
                           m_context.settings.scanWorkers);

    m_console.line(m_console.dim(QStringLiteral("Scanning %1 root(s)...").arg(registry.roots().size())));
    QString error;
    const std::optional<IndexReport> report = indexer.run(force, &error);
    if (!report) {
        m_console.failure(QStringLiteral("update failed: %1").arg(error));
        return kExitStoreCorrupt;
    }

    for (const QString& root : report->invalidRoots) {
        m_console.warning(QStringLiteral("skipped %1: missing or unreadable").arg(root));
    }
    if (report->embeddingDegraded) {
        reportDegraded(report->degradeReason);
    }

    m_console.success(QStringLiteral("Indexed %1 projects").arg(m_console.bold(QString::number(report->indexed))));
    m_console.line(m_console.dim(QStringLiteral("  %1 embedded, %2 unchanged, %3 without embedding, %4 pruned")
                                     .arg(report->embedded)
                                     .arg(report->reusedEmbeddings)
                                     .arg(report->withoutEmbedding)
                                     .arg(report->pruned)));
    return kExitOk;
}

int CommandRunner::refresh()
{
    QString error;
    if (!ProjectStore::destroy(m_context.databasePath, &error)) {
        m_console.failure(error);
        return kExitStoreCorrupt;
    }
    m_console.success(QStringLiteral("Cleared project cache"));
    return update(false);
}

// ── list ──

int CommandRunner::list(const CommandLine& line)
{
    int exitCode = kExitOk;
    std::optional<ProjectStore> store = openStore(&exitCode);
    if (!store) {
        return exitCode;
    }

    const int limit = line.all ? -1 : line.limit.value_or(kDefaultListLimit);
    const std::optional<std::vector<Project>> projects = store->list(line.sort, limit);
    if (!projects) {
        m_console.failure(QStringLiteral("project cache is unreadable; run `goto refresh`"));
        return kExitStoreCorrupt;
    }
    if (projects->empty()) {
        m_console.line(QStringLiteral("No projects indexed. Run %1 first.")
                           .arg(m_console.bold(QStringLiteral("goto update"))));
        return kExitOk;
    }

    QHash<QString, int> nameCounts;
    for (const Project& project : *projects) {
        ++nameCounts[project.name];
    }

    const double now = currentEpochSeconds();
    m_console.line(m_console.bold(QStringLiteral("Projects (%1):").arg(sortOrderToString(line.sort))));
    for (const Project& project : *projects) {
        QString label = m_console.bold(project.name);
        if (nameCounts.value(project.name) > 1) {
            label += QLatin1Char(' ') + m_console.dim(homeRelative(project.path));
        }
        if (line.showGit) {
            if (const std::optional<GitStatus> git = gitStatus(project.path)) {
                label += QLatin1Char(' ') + m_console.cyan(git->branch);
                if (git->dirty) {
                    label += m_console.yellow(QStringLiteral("*"));
                }
            }
        }
        if (project.lastAccessed) {
            label += QLatin1Char(' ')
                     + m_console.dim(QStringLiteral("(%1, %2x)")
                                         .arg(relativeAge(*project.lastAccessed, now))
                                         .arg(project.accessCount));
        }
        m_console.line(QStringLiteral("  ") + label);
    }
    return kExitOk;
}

// ── add / remove / config ──

int CommandRunner::add(const QString& path)
{
    Settings settings = m_context.settings;
    QString canonical;
    QString error;
    const size_t before = settings.scanPaths.size();
    if (!PathRegistry::addRoot(settings, path, &canonical, &error)) {
        m_console.failure(error);
        return kExitUsage;
    }
    if (settings.scanPaths.size() == before) {
        m_console.line(QStringLiteral("%1 is already registered").arg(m_console.bold(canonical)));
        return kExitOk;
    }
    if (!SettingsManager::save(settings)) {
        m_console.failure(QStringLiteral("failed to write %1").arg(SettingsManager::settingsFilePath()));
        return kExitConfig;
    }
    m_console.success(QStringLiteral("Added %1").arg(m_console.bold(canonical)));
    m_console.line(QStringLiteral("  run %1 to index it").arg(m_console.bold(QStringLiteral("goto update"))));
    return kExitOk;
}

int CommandRunner::remove(const QString& path)
{
    Settings settings = m_context.settings;
    QString canonical;
    if (!PathRegistry::removeRoot(settings, path, &canonical)) {
        m_console.failure(QStringLiteral("%1 is not a registered scan path").arg(path));
        return kExitUsage;
    }
    if (!SettingsManager::save(settings)) {
        m_console.failure(QStringLiteral("failed to write %1").arg(SettingsManager::settingsFilePath()));
        return kExitConfig;
    }

    int exitCode = kExitOk;
    std::optional<ProjectStore> store = openStore(&exitCode);
    if (!store) {
        return exitCode;
    }
    const int removed = store->removeByPrefix(canonical);
    if (removed < 0) {
        m_console.failure(QStringLiteral("failed to drop projects under %1").arg(canonical));
        return kExitStoreCorrupt;
    }
    m_console.success(QStringLiteral("Removed %1 (%2 projects dropped)")
                          .arg(m_console.bold(canonical))
                          .arg(removed));
    return kExitOk;
}

int CommandRunner::config()
{
    const Settings& settings = m_context.settings;
    m_console.line(m_console.bold(QStringLiteral("Configuration")));
    m_console.line(QStringLiteral("  file:       %1").arg(SettingsManager::settingsFilePath()));
    m_console.line(QStringLiteral("  cache:      %1").arg(m_context.databasePath));
    m_console.line(QStringLiteral("  models:     %1").arg(writableModelsDir()));
    m_console.line(QStringLiteral("  max depth:  %1").arg(settings.maxDepth));
    m_console.line(QStringLiteral("  discovery:  %1").arg(settings.discoveryAssist ? QStringLiteral("on")
                                                                                   : QStringLiteral("off")));
    m_console.line(QStringLiteral("  post cmd:   %1")
                       .arg(settings.postCommand ? postCommandToString(*settings.postCommand)
                                                 : QStringLiteral("(none)")));
    m_console.line(QStringLiteral("  embeddings: %1")
                       .arg(settings.embeddingEnabled ? QStringLiteral("on") : QStringLiteral("off")));
    m_console.line(m_console.bold(QStringLiteral("Scan paths")));
    if (settings.scanPaths.empty()) {
        m_console.line(m_console.dim(QStringLiteral("  (none)")));
    }
    for (const ScanPath& scanPath : settings.scanPaths) {
        const bool exists = QFileInfo(scanPath.path).isDir();
        QString entry = QStringLiteral("  %1").arg(scanPath.path);
        if (!scanPath.recursive) {
            entry += m_console.dim(QStringLiteral(" (non-recursive)"));
        } else if (scanPath.maxDepth > 0) {
            entry += m_console.dim(QStringLiteral(" (depth %1)").arg(scanPath.maxDepth));
        }
        if (!exists) {
            entry += m_console.yellow(QStringLiteral(" [missing]"));
        }
        m_console.line(entry);
    }
    if (!settings.excludePatterns.isEmpty()) {
        m_console.line(m_console.bold(QStringLiteral("Exclude")));
        m_console.line(QStringLiteral("  ") + settings.excludePatterns.join(QStringLiteral(", ")));
    }
    return kExitOk;
}

// ── stats ──

int CommandRunner::stats()
{
    int exitCode = kExitOk;
    std::optional<ProjectStore> store = openStore(&exitCode);
    if (!store) {
        return exitCode;
    }
    std::optional<std::vector<Project>> projects = store->list(SortOrder::Name);
    if (!projects) {
        m_console.failure(QStringLiteral("project cache is unreadable; run `goto refresh`"));
        return kExitStoreCorrupt;
    }

    const double now = currentEpochSeconds();
    const double weekAgo = now - 7 * 24 * 3600.0;
    int accessed = 0;
    int activeThisWeek = 0;
    long long navigations = 0;
    std::vector<const Project*> byCount;
    std::vector<const Project*> thisWeek;
    for (const Project& project : *projects) {
        navigations += project.accessCount;
        if (project.accessCount > 0) {
            ++accessed;
            byCount.push_back(&project);
        }
        if (project.lastAccessed && *project.lastAccessed >= weekAgo) {
            ++activeThisWeek;
            thisWeek.push_back(&project);
        }
    }

    const auto byAccessCount = [](const Project* a, const Project* b) {
        if (a->accessCount != b->accessCount) {
            return a->accessCount > b->accessCount;
        }
        return a->path < b->path;
    };
    std::sort(byCount.begin(), byCount.end(), byAccessCount);
    std::sort(thisWeek.begin(), thisWeek.end(), byAccessCount);

    m_console.line(m_console.bold(QStringLiteral("Statistics")));
    m_console.line(QStringLiteral("  indexed:          %1").arg(projects->size()));
    m_console.line(QStringLiteral("  ever accessed:    %1").arg(accessed));
    m_console.line(QStringLiteral("  active this week: %1").arg(activeThisWeek));
    m_console.line(QStringLiteral("  navigations:      %1").arg(navigations));

    const auto printTop = [this](const QString& title, const std::vector<const Project*>& entries) {
        if (entries.empty()) {
            return;
        }
        m_console.line(m_console.bold(title));
        for (size_t i = 0; i < entries.size() && i < 5; ++i) {
            m_console.line(QStringLiteral("  %1. %2 %3")
                               .arg(i + 1)
                               .arg(m_console.bold(entries[i]->name))
                               .arg(m_console.dim(QStringLiteral("(%1x)").arg(entries[i]->accessCount))));
        }
    };
    printTop(QStringLiteral("Most visited"), byCount);
    printTop(QStringLiteral("Active this week"), thisWeek);
    return kExitOk;
}

// ── test ──

std::optional<std::vector<RankingExpectation>> CommandRunner::parseExpectations(
    const QByteArray& json, QString* errorOut)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (errorOut) {
            *errorOut = parseError.errorString();
        }
        return std::nullopt;
    }

    QJsonArray entries;
    if (doc.isArray()) {
        entries = doc.array();
    } else if (doc.isObject() && doc.object().value(QStringLiteral("tests")).isArray()) {
        entries = doc.object().value(QStringLiteral("tests")).toArray();
    } else {
        if (errorOut) {
            *errorOut = QStringLiteral("expected an array of tests");
        }
        return std::nullopt;
    }

    std::vector<RankingExpectation> expectations;
    for (const QJsonValue& value : entries) {
        const QJsonObject obj = value.toObject();
        RankingExpectation expectation;
        expectation.query = obj.value(QStringLiteral("query")).toString().trimmed();
        for (const QJsonValue& name : obj.value(QStringLiteral("expected")).toArray()) {
            if (name.isString()) {
                expectation.expected.append(name.toString());
            }
        }
        expectation.topN = std::max(1, obj.value(QStringLiteral("topN")).toInt(3));
        if (expectation.query.isEmpty() || expectation.expected.isEmpty()) {
            if (errorOut) {
                *errorOut = QStringLiteral("each test needs a query and expected names");
            }
            return std::nullopt;
        }
        expectations.push_back(std::move(expectation));
    }
    return expectations;
}

int CommandRunner::test(const QString& file)
{
    const QString path = file.isEmpty()
        ? QDir(m_context.configDir).filePath(QStringLiteral("tests.json"))
        : file;
    QFile testFile(path);
    if (!testFile.open(QIODevice::ReadOnly)) {
        m_console.failure(QStringLiteral("cannot read %1").arg(path));
        return kExitConfig;
    }
    QString error;
    const std::optional<std::vector<RankingExpectation>> expectations =
        parseExpectations(testFile.readAll(), &error);
    if (!expectations) {
        m_console.failure(QStringLiteral("%1: %2").arg(path, error));
        return kExitConfig;
    }

    int exitCode = kExitOk;
    std::optional<ProjectStore> store = openStore(&exitCode);
    if (!store) {
        return exitCode;
    }
    const std::optional<std::vector<Project>> candidates = store->allCandidates();
    if (!candidates) {
        m_console.failure(QStringLiteral("project cache is unreadable; run `goto refresh`"));
        return kExitStoreCorrupt;
    }

    const Ranker ranker(m_context.weights);
    EmbeddingProvider* provider = m_context.embeddings->get();
    if (!provider && !m_context.embeddings->disabled()) {
        reportDegraded(m_context.embeddings->failureReason());
    }

    int passed = 0;
    for (const RankingExpectation& expectation : *expectations) {
        const std::vector<float> queryEmbedding =
            provider ? provider->embedQuery(expectation.query) : std::vector<float>();
        const std::vector<RankedProject> ranked =
            ranker.rank(expectation.query, *candidates, queryEmbedding);

        QStringList top;
        for (size_t i = 0; i < ranked.size() && static_cast<int>(i) < expectation.topN; ++i) {
            top.append(ranked[i].project.name);
        }
        const bool ok = std::any_of(expectation.expected.begin(), expectation.expected.end(),
                                    [&top](const QString& name) { return top.contains(name); });
        if (ok) {
            ++passed;
            m_console.success(QStringLiteral("%1 → %2").arg(expectation.query, top.value(0)));
        } else {
            m_console.failure(QStringLiteral("%1: expected %2, got [%3]")
                                  .arg(expectation.query,
                                       expectation.expected.join(QStringLiteral(" | ")),
                                       top.join(QStringLiteral(", "))));
            if (m_context.debug) {
                for (size_t i = 0; i < ranked.size() && static_cast<int>(i) < expectation.topN; ++i) {
                    m_console.line(QStringLiteral("    %1").arg(ranked[i].project.name));
                    printBreakdown(ranked[i]);
                }
            }
        }
    }

    const int total = static_cast<int>(expectations->size());
    m_console.line(QStringLiteral("%1/%2 passed").arg(passed).arg(total));
    return passed == total ? kExitOk : kExitNoMatch;
}

QString CommandRunner::relativeAge(double epochSeconds, double nowEpoch)
{
    const double seconds = std::max(0.0, nowEpoch - epochSeconds);
    if (seconds < 60.0) {
        return QStringLiteral("just now");
    }
    if (seconds < 3600.0) {
        return QStringLiteral("%1m ago").arg(static_cast<int>(seconds / 60.0));
    }
    if (seconds < 86400.0) {
        return QStringLiteral("%1h ago").arg(static_cast<int>(seconds / 3600.0));
    }
    return QStringLiteral("%1d ago").arg(static_cast<int>(seconds / 86400.0));
}

} // namespace gt
