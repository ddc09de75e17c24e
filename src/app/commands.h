#pragma once

#include "command_line.h"

#include "core/index/project_store.h"
#include "core/ranking/ranker.h"

#include <QString>

#include <optional>

namespace gt {

class Console;
struct RunContext;

// Expected outcome of one ranking check in tests.json.
struct RankingExpectation {
    QString query;
    QStringList expected;      // project names, any one within topN passes
    int topN = 3;
};

// CommandRunner — executes one parsed command against the run context and
// returns the process exit code.
class CommandRunner {
public:
    CommandRunner(RunContext& context, Console& console);

    int run(const CommandLine& line);

    // Parses a tests.json document: an array of expectations, or an object
    // with a "tests" array.
    static std::optional<std::vector<RankingExpectation>> parseExpectations(
        const QByteArray& json, QString* errorOut = nullptr);

    // "just now", "12m ago", "3h ago", "4d ago".
    static QString relativeAge(double epochSeconds, double nowEpoch);

private:
    int find(const CommandLine& line);
    int recent(const CommandLine& line);
    int update(bool force);
    int refresh();
    int list(const CommandLine& line);
    int add(const QString& path);
    int remove(const QString& path);
    int config();
    int stats();
    int test(const QString& file);

    std::optional<ProjectStore> openStore(int* exitCode);
    void printBreakdown(const RankedProject& ranked);
    void reportDegraded(const QString& reason);

    RunContext& m_context;
    Console& m_console;
};

} // namespace gt
