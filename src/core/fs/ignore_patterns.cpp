#include "core/fs/ignore_patterns.h"
#include "core/shared/logging.h"

#include <QFile>

namespace gt {

QRegularExpression IgnorePatterns::globToRegex(const QString& glob)
{
    QString regex;
    for (qsizetype i = 0; i < glob.size(); ++i) {
        const QChar ch = glob.at(i);
        if (ch == QLatin1Char('*')) {
            if (i + 1 < glob.size() && glob.at(i + 1) == QLatin1Char('*')) {
                ++i;
                if (i + 1 < glob.size() && glob.at(i + 1) == QLatin1Char('/')) {
                    // "**/" may also match nothing.
                    ++i;
                    regex += QStringLiteral("(?:.*/)?");
                } else {
                    regex += QStringLiteral(".*");
                }
            } else {
                regex += QStringLiteral("[^/]*");
            }
        } else if (ch == QLatin1Char('?')) {
            regex += QStringLiteral("[^/]");
        } else if (ch == QLatin1Char('/') && glob.mid(i) == QLatin1String("/**")) {
            // "dir/**" covers "dir" itself.
            regex += QStringLiteral("(?:/.*)?");
            break;
        } else {
            regex += QRegularExpression::escape(QString(ch));
        }
    }
    return QRegularExpression(QRegularExpression::anchoredPattern(regex));
}

bool IgnorePatterns::loadFromFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(gotoFs, "Cannot read ignore file %s", qPrintable(path));
        return false;
    }

    const int before = size();
    loadFromString(QString::fromUtf8(file.readAll()));
    LOG_DEBUG(gotoFs, "%d pattern(s) from %s", size() - before, qPrintable(path));
    return true;
}

void IgnorePatterns::loadFromString(const QString& content)
{
    for (const QString& line : content.split(QLatin1Char('\n'))) {
        addPattern(line);
    }
}

void IgnorePatterns::addPattern(const QString& pattern)
{
    QString glob = pattern.trimmed();
    if (glob.isEmpty() || glob.startsWith(QLatin1Char('#'))) {
        return;
    }
    if (glob.startsWith(QLatin1Char('!'))) {
        LOG_DEBUG(gotoFs, "Negation pattern %s not supported, skipped", qPrintable(glob));
        return;
    }

    // Directories are matched by name, and every path is root-relative.
    while (glob.size() > 1 && glob.endsWith(QLatin1Char('/'))) {
        glob.chop(1);
    }
    if (glob.size() > 1 && glob.startsWith(QLatin1Char('/'))) {
        glob.remove(0, 1);
    }

    Rule rule;
    rule.regex = globToRegex(glob);
    rule.perComponent = !glob.contains(QLatin1Char('/'));
    rule.glob = std::move(glob);
    m_rules.push_back(std::move(rule));
}

bool IgnorePatterns::matches(const QString& relativePath) const
{
    if (relativePath.isEmpty() || m_rules.empty()) {
        return false;
    }

    const QStringList components = relativePath.split(QLatin1Char('/'), Qt::SkipEmptyParts);
    for (const Rule& rule : m_rules) {
        if (rule.perComponent) {
            for (const QString& component : components) {
                if (rule.regex.match(component).hasMatch()) {
                    return true;
                }
            }
            continue;
        }

        // Whole path first, then each sub-path after a '/'.
        for (qsizetype from = 0; from >= 0 && from < relativePath.size();) {
            if (rule.regex.match(relativePath.mid(from)).hasMatch()) {
                return true;
            }
            const qsizetype slash = relativePath.indexOf(QLatin1Char('/'), from);
            from = slash < 0 ? -1 : slash + 1;
        }
    }
    return false;
}

QStringList IgnorePatterns::patterns() const
{
    QStringList globs;
    globs.reserve(size());
    for (const Rule& rule : m_rules) {
        globs.append(rule.glob);
    }
    return globs;
}

} // namespace gt
