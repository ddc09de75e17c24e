#include "core/shared/process_runner.h"
#include "core/shared/logging.h"

#include <QDeadlineTimer>
#include <QElapsedTimer>
#include <QProcess>

#include <algorithm>

namespace gt {

namespace {

QString firstStderrLine(QProcess& process)
{
    const QString text = QString::fromUtf8(process.readAllStandardError()).trimmed();
    return text.section(QLatin1Char('\n'), 0, 0).left(200);
}

} // namespace

ProcessOutcome runProcess(const QString& program, const QStringList& args, int timeoutMs,
                          const QString& workingDirectory)
{
    ProcessOutcome outcome;
    QElapsedTimer clock;
    clock.start();
    const QDeadlineTimer deadline(timeoutMs);

    QProcess process;
    if (!workingDirectory.isEmpty()) {
        process.setWorkingDirectory(workingDirectory);
    }
    process.start(program, args, QIODevice::ReadOnly);

    if (!process.waitForStarted(int(deadline.remainingTime()))) {
        outcome.error = QStringLiteral("cannot run %1: %2").arg(program, process.errorString());
    } else if (!process.waitForFinished(int(std::max<qint64>(1, deadline.remainingTime())))) {
        process.kill();
        process.waitForFinished();
        outcome.error = QStringLiteral("%1 gave no answer within %2 ms").arg(program).arg(timeoutMs);
    } else if (process.exitStatus() == QProcess::CrashExit) {
        outcome.error = QStringLiteral("%1 crashed").arg(program);
    } else if (process.exitCode() != 0) {
        const QString detail = firstStderrLine(process);
        outcome.error = detail.isEmpty()
            ? QStringLiteral("%1 exited with %2").arg(program).arg(process.exitCode())
            : QStringLiteral("%1: %2").arg(program, detail);
    } else {
        outcome.ok = true;
        outcome.stdoutData = process.readAllStandardOutput();
    }

    outcome.elapsedMs = clock.elapsed();
    if (!outcome.ok) {
        LOG_DEBUG(gotoCore, "%s", qUtf8Printable(outcome.error));
    }
    return outcome;
}

} // namespace gt
