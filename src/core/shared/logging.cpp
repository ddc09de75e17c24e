#include "core/shared/logging.h"

#include <cstdio>

Q_LOGGING_CATEGORY(gotoCore, "goto.core", QtWarningMsg)
Q_LOGGING_CATEGORY(gotoIndex, "goto.index", QtWarningMsg)
Q_LOGGING_CATEGORY(gotoFs, "goto.fs", QtWarningMsg)
Q_LOGGING_CATEGORY(gotoExtraction, "goto.extraction", QtWarningMsg)
Q_LOGGING_CATEGORY(gotoEmbedding, "goto.embedding", QtWarningMsg)
Q_LOGGING_CATEGORY(gotoRanking, "goto.ranking", QtWarningMsg)
Q_LOGGING_CATEGORY(gotoNav, "goto.nav", QtWarningMsg)

namespace gt {

namespace {

void stderrMessageHandler(QtMsgType type, const QMessageLogContext& context,
                          const QString& message)
{
    const char* level = "debug";
    switch (type) {
    case QtDebugMsg:    level = "debug"; break;
    case QtInfoMsg:     level = "info"; break;
    case QtWarningMsg:  level = "warn"; break;
    case QtCriticalMsg: level = "error"; break;
    case QtFatalMsg:    level = "fatal"; break;
    }

    const char* category = context.category ? context.category : "default";
    std::fprintf(stderr, "[%s] %s: %s\n", level, category, qUtf8Printable(message));
    std::fflush(stderr);
}

} // anonymous namespace

void installLogging(bool verbose)
{
    // stdout carries the resolved path only; nothing else may be written there.
    qInstallMessageHandler(stderrMessageHandler);
    if (verbose) {
        QLoggingCategory::setFilterRules(QStringLiteral("goto.*.debug=true\n"
                                                        "goto.*.info=true"));
    }
}

} // namespace gt
