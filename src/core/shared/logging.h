#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(gotoCore)
Q_DECLARE_LOGGING_CATEGORY(gotoIndex)
Q_DECLARE_LOGGING_CATEGORY(gotoFs)
Q_DECLARE_LOGGING_CATEGORY(gotoExtraction)
Q_DECLARE_LOGGING_CATEGORY(gotoEmbedding)
Q_DECLARE_LOGGING_CATEGORY(gotoRanking)
Q_DECLARE_LOGGING_CATEGORY(gotoNav)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)

namespace gt {

// Routes every category to stderr with a short prefix and enables debug
// output for all goto.* categories when verbose is set.
void installLogging(bool verbose);

} // namespace gt
