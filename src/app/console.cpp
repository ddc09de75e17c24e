#include "console.h"

#include <QIODevice>

#include <cstdio>

#include <unistd.h>

namespace gt {

Console::Console()
{
    if (m_stdout.open(stdout, QIODevice::WriteOnly | QIODevice::Unbuffered)) {
        m_primary = &m_stdout;
    }
    if (m_stderr.open(stderr, QIODevice::WriteOnly | QIODevice::Unbuffered)) {
        m_secondary = &m_stderr;
    }
    m_colors = ::isatty(STDERR_FILENO) && qEnvironmentVariableIsEmpty("NO_COLOR");
}

Console::Console(QIODevice* primary, QIODevice* secondary, bool colors)
    : m_primary(primary)
    , m_secondary(secondary)
    , m_colors(colors)
{
}

QString Console::paint(const char* code, const QString& text) const
{
    if (!m_colors) {
        return text;
    }
    return QStringLiteral("\x1b[%1m%2\x1b[0m").arg(QLatin1String(code), text);
}

QString Console::bold(const QString& text) const { return paint("1", text); }
QString Console::dim(const QString& text) const { return paint("90", text); }
QString Console::cyan(const QString& text) const { return paint("36", text); }
QString Console::yellow(const QString& text) const { return paint("33", text); }

void Console::writeSecondary(const QString& text)
{
    if (m_secondary) {
        m_secondary->write(text.toUtf8());
        m_secondary->write("\n");
    }
}

void Console::success(const QString& message)
{
    writeSecondary(paint("32", QStringLiteral("✓")) + QLatin1Char(' ') + message);
}

void Console::failure(const QString& message)
{
    writeSecondary(paint("31", QStringLiteral("✗")) + QLatin1Char(' ') + message);
}

void Console::warning(const QString& message)
{
    writeSecondary(paint("33", QStringLiteral("!")) + QLatin1Char(' ') + message);
}

void Console::semantic(const QString& message)
{
    writeSecondary(paint("35", QStringLiteral("◆")) + QLatin1Char(' ') + message);
}

void Console::line(const QString& text)
{
    writeSecondary(text);
}

void Console::emitPath(const QString& path)
{
    if (m_primary) {
        m_primary->write(path.toUtf8());
        m_primary->write("\n");
    }
}

void Console::emitDirective(PostCommand command)
{
    writeSecondary(postCommandDirective(command));
}

} // namespace gt
