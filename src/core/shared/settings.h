#pragma once

#include "core/shared/post_command.h"
#include "core/shared/types.h"

#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

namespace gt {

struct Settings {
    // Scan roots, in registration order
    std::vector<ScanPath> scanPaths;

    // Discovery assist (desktop search index)
    bool discoveryAssist = false;
    QStringList discoveryPaths;              // empty = home directory

    int maxDepth = 5;

    // nullopt disables the post-navigation directive
    std::optional<PostCommand> postCommand = PostCommand::Claude;

    // Global exclusion globs, added to the built-in defaults
    QStringList excludePatterns;

    // Embedding
    bool embeddingEnabled = true;
    int embeddingTimeoutMs = 60000;

    // Scan worker threads, 0 = auto
    int scanWorkers = 0;
};

} // namespace gt
