#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>

namespace gt {

struct ProcessOutcome {
    bool ok = false;
    QByteArray stdoutData;
    QString error;          // set when !ok
    qint64 elapsedMs = 0;
};

// Runs program with args (no shell) and waits at most timeoutMs for it to
// exit, killing it otherwise. Only a zero exit status counts as ok; on
// failure error carries the first line of its stderr when there is one.
ProcessOutcome runProcess(const QString& program, const QStringList& args, int timeoutMs,
                          const QString& workingDirectory = QString());

} // namespace gt
