#pragma once

#include "core/shared/post_command.h"

#include <QFile>
#include <QString>

class QIODevice;

namespace gt {

// Console — user-facing output.
//
// The primary channel (stdout) carries nothing but a resolved path; every
// status line, listing and the post-navigation directive goes to the
// secondary channel (stderr).
class Console {
public:
    // Writes to the process stdout/stderr.
    Console();
    // Writes to caller-owned devices (tests).
    Console(QIODevice* primary, QIODevice* secondary, bool colors = false);

    Console(const Console&) = delete;
    Console& operator=(const Console&) = delete;

    void success(const QString& message);
    void failure(const QString& message);
    void warning(const QString& message);
    void semantic(const QString& message);
    void line(const QString& text = QString());

    // The single primary-channel line.
    void emitPath(const QString& path);
    void emitDirective(PostCommand command);

    QString bold(const QString& text) const;
    QString dim(const QString& text) const;
    QString cyan(const QString& text) const;
    QString yellow(const QString& text) const;

private:
    void writeSecondary(const QString& text);
    QString paint(const char* code, const QString& text) const;

    QFile m_stdout;
    QFile m_stderr;
    QIODevice* m_primary = nullptr;
    QIODevice* m_secondary = nullptr;
    bool m_colors = false;
};

} // namespace gt
