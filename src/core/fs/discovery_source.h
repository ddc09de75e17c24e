#pragma once

#include "core/fs/path_rules.h"

#include <QString>
#include <QStringList>

namespace gt {

// DiscoverySource — asks the desktop search index (Spotlight's mdfind) for
// manifest files below the discovery roots and turns hits into project
// directories. Contributes nothing when mdfind is absent or fails.
class DiscoverySource {
public:
    explicit DiscoverySource(int timeoutMs = kDefaultTimeoutMs);

    // Canonical project directories below `roots`, deduplicated and sorted.
    // A hit's parent directory is kept only when it holds a .git directory
    // and `rules` does not exclude it.
    QStringList discover(const QStringList& roots, const PathRules& rules) const;

    // The compound Spotlight query ORing kMDItemFSName over the markers.
    static QString buildQuery();

    // Splits mdfind -0 output into hit paths.
    static QStringList parseOutput(const QByteArray& output);

    static const QStringList& markerFiles();

    static constexpr int kDefaultTimeoutMs = 10000;

private:
    int m_timeoutMs;
};

} // namespace gt
