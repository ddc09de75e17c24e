#pragma once

#include "core/shared/types.h"

#include <QString>
#include <QStringList>

#include <optional>

namespace gt {

enum ExitCode {
    kExitOk = 0,
    kExitNoMatch = 1,
    kExitUsage = 2,
    kExitStoreCorrupt = 3,
    kExitConfig = 4,
    kExitInternal = 70,
};

enum class Command {
    Find,
    Recent,
    Update,
    Refresh,
    List,
    Add,
    Remove,
    Config,
    Stats,
    Test,
    Help,
    Version,
};

struct CommandLine {
    Command command = Command::Help;
    QString query;             // find: joined positional terms; "-" for recent
    QString path;              // add / remove / test
    bool all = false;          // find: every match; list: no limit
    std::optional<int> limit;  // -n / --limit
    SortOrder sort = SortOrder::Frecency;
    bool force = false;
    bool showGit = true;
    bool cdOnly = false;
    bool debug = false;
    QString helpText;
};

// Parses argv (including the program name). Returns nullopt and sets
// errorOut on a usage error.
std::optional<CommandLine> parseCommandLine(const QStringList& arguments,
                                            QString* errorOut = nullptr);

} // namespace gt
