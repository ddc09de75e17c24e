#include "core/navigation/navigation_resolver.h"

#include "core/embedding/embedding_handle.h"
#include "core/index/project_store.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFileInfo>

#include <algorithm>
#include <utility>

namespace gt {

namespace {

bool isLiveDirectory(const QString& path)
{
    const QFileInfo info(path);
    return info.exists() && info.isDir();
}

} // anonymous namespace

QString resolverStateToString(ResolverState state)
{
    switch (state) {
    case ResolverState::Idle:             return QStringLiteral("idle");
    case ResolverState::Resolving:        return QStringLiteral("resolving");
    case ResolverState::ProviderDegraded: return QStringLiteral("provider-degraded");
    case ResolverState::Resolved:         return QStringLiteral("resolved");
    case ResolverState::NoMatch:          return QStringLiteral("no-match");
    case ResolverState::Error:            return QStringLiteral("error");
    }
    return QStringLiteral("idle");
}

NavigationResolver::NavigationResolver(ProjectStore& store, const Ranker& ranker,
                                       EmbeddingHandle& embeddings)
    : m_store(store)
    , m_ranker(ranker)
    , m_embeddings(embeddings)
{
}

bool NavigationResolver::isEmittablePath(const QString& path)
{
    if (path.isEmpty() || path.contains(QLatin1Char('\n')) || path.contains(QLatin1Char('\r'))
        || path.contains(QChar(0))) {
        return false;
    }
    if (!QDir::isAbsolutePath(path)) {
        return false;
    }
    return isLiveDirectory(path);
}

NavigationOutcome NavigationResolver::finish(NavigationOutcome outcome, ResolverState state,
                                             NavigationError error)
{
    LOG_DEBUG(gotoNav, "Resolver %s -> %s", qPrintable(resolverStateToString(m_state)),
              qPrintable(resolverStateToString(state)));
    m_state = state;
    outcome.state = state;
    outcome.error = error;
    return outcome;
}

NavigationOutcome NavigationResolver::resolve(const NavigationRequest& request)
{
    m_state = ResolverState::Resolving;
    NavigationOutcome outcome;

    if (request.recent) {
        return resolveRecent(request);
    }

    std::optional<std::vector<Project>> candidates = m_store.allCandidates();
    if (!candidates) {
        outcome.diagnostic = QStringLiteral("project cache is unreadable; run `goto refresh`");
        return finish(std::move(outcome), ResolverState::Error, NavigationError::StoreCorrupt);
    }
    if (candidates->empty()) {
        outcome.diagnostic = QStringLiteral("no projects indexed; run `goto update`");
        return finish(std::move(outcome), ResolverState::NoMatch, NavigationError::NoMatchFound);
    }

    const std::vector<float> queryEmbedding = embedQuery(request.query, *candidates, outcome);
    if (outcome.degraded) {
        m_state = ResolverState::ProviderDegraded;
    }

    std::vector<RankedProject> ranked = m_ranker.rank(request.query, std::move(*candidates),
                                                      queryEmbedding);

    // Stale rows are dropped transparently.
    const auto stale = std::remove_if(ranked.begin(), ranked.end(), [](const RankedProject& r) {
        if (isLiveDirectory(r.project.path)) {
            return false;
        }
        LOG_DEBUG(gotoNav, "Skipping stale path %s", qPrintable(r.project.path));
        return true;
    });
    ranked.erase(stale, ranked.end());

    if (ranked.empty()) {
        outcome.diagnostic = QStringLiteral("no project matches '%1'").arg(request.query);
        return finish(std::move(outcome), ResolverState::NoMatch, NavigationError::NoMatchFound);
    }

    if (request.all) {
        if (request.limit > 0 && static_cast<size_t>(request.limit) < ranked.size()) {
            ranked.resize(static_cast<size_t>(request.limit));
        }
        outcome.matches = std::move(ranked);
        return finish(std::move(outcome), ResolverState::Resolved);
    }

    const QString chosen = ranked.front().project.path;
    if (!isEmittablePath(chosen)) {
        outcome.diagnostic = QStringLiteral("refusing to emit invalid path");
        LOG_ERROR(gotoNav, "Output guard rejected %s", qPrintable(chosen));
        return finish(std::move(outcome), ResolverState::Error, NavigationError::InternalError);
    }

    if (!m_store.recordAccess(chosen)) {
        LOG_WARN(gotoNav, "Failed to record access for %s", qPrintable(chosen));
    }

    outcome.path = chosen;
    outcome.matches.push_back(std::move(ranked.front()));
    return finish(std::move(outcome), ResolverState::Resolved);
}

NavigationOutcome NavigationResolver::resolveRecent(const NavigationRequest& request)
{
    NavigationOutcome outcome;
    std::optional<std::vector<Project>> projects = m_store.list(SortOrder::Recent);
    if (!projects) {
        outcome.diagnostic = QStringLiteral("project cache is unreadable; run `goto refresh`");
        return finish(std::move(outcome), ResolverState::Error, NavigationError::StoreCorrupt);
    }

    for (Project& project : *projects) {
        if (!project.lastAccessed || !isLiveDirectory(project.path)) {
            continue;
        }
        outcome.recent.push_back(std::move(project));
        if (request.limit > 0 && static_cast<int>(outcome.recent.size()) >= request.limit) {
            break;
        }
    }

    if (outcome.recent.empty()) {
        outcome.diagnostic = QStringLiteral("no recently visited projects");
        return finish(std::move(outcome), ResolverState::NoMatch, NavigationError::NoMatchFound);
    }
    return finish(std::move(outcome), ResolverState::Resolved);
}

std::vector<float> NavigationResolver::embedQuery(const QString& query,
                                                  const std::vector<Project>& candidates,
                                                  NavigationOutcome& outcome)
{
    const bool anyEmbedded = std::any_of(candidates.begin(), candidates.end(),
                                         [](const Project& p) { return p.hasEmbedding(); });
    // Without stored vectors there is nothing to degrade from.
    if (!anyEmbedded || m_embeddings.disabled()) {
        return {};
    }

    EmbeddingProvider* provider = m_embeddings.get();
    if (!provider) {
        outcome.degraded = true;
        outcome.degradeReason = m_embeddings.failureReason();
        return {};
    }

    std::vector<float> embedding = provider->embedQuery(query);
    if (embedding.empty()) {
        outcome.degraded = true;
        outcome.degradeReason = QStringLiteral("query embedding failed");
    }
    return embedding;
}

} // namespace gt
