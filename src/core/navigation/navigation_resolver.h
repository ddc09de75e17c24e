#pragma once

#include "core/ranking/ranker.h"
#include "core/shared/types.h"

#include <QString>

#include <vector>

namespace gt {

class EmbeddingHandle;
class ProjectStore;

enum class NavigationError {
    None,
    NoMatchFound,
    StoreCorrupt,
    InternalError,     // output guard rejected the chosen path
};

// Idle → Resolving → {Resolved, NoMatch, Error}; ProviderDegraded is passed
// through on the way to Resolved when the query could not be embedded.
enum class ResolverState {
    Idle,
    Resolving,
    ProviderDegraded,
    Resolved,
    NoMatch,
    Error,
};

QString resolverStateToString(ResolverState state);

struct NavigationRequest {
    QString query;
    bool all = false;          // every match, capped to limit
    bool recent = false;       // "-": recently accessed, no scoring
    int limit = 10;
};

struct NavigationOutcome {
    ResolverState state = ResolverState::Idle;
    NavigationError error = NavigationError::None;

    QString path;                          // single-match result
    std::vector<RankedProject> matches;    // all-matches result, best first
    std::vector<Project> recent;           // recent-mode result

    bool degraded = false;
    QString degradeReason;
    QString diagnostic;

    bool ok() const { return state == ResolverState::Resolved; }
};

// NavigationResolver — query → ranked candidates → chosen path.
//
// Stale candidates (directory gone since indexing) are skipped. Only a
// single-match resolution records an access, and only after the chosen
// path passes the output guard.
class NavigationResolver {
public:
    NavigationResolver(ProjectStore& store, const Ranker& ranker, EmbeddingHandle& embeddings);

    NavigationOutcome resolve(const NavigationRequest& request);

    ResolverState state() const { return m_state; }

    // A single line naming an existing absolute directory.
    static bool isEmittablePath(const QString& path);

private:
    NavigationOutcome resolveRecent(const NavigationRequest& request);
    std::vector<float> embedQuery(const QString& query, const std::vector<Project>& candidates,
                                  NavigationOutcome& outcome);
    NavigationOutcome finish(NavigationOutcome outcome, ResolverState state,
                             NavigationError error = NavigationError::None);

    ProjectStore& m_store;
    const Ranker& m_ranker;
    EmbeddingHandle& m_embeddings;
    ResolverState m_state = ResolverState::Idle;
};

} // namespace gt
