#include "core/extraction/text_cleaner.h"

#include <QStringList>

namespace gt {

namespace {

bool isProseLine(const QString& line)
{
    if (line.size() < 10) {
        return false;
    }
    if (line.startsWith(QLatin1Char('#'))          // headers
        || line.startsWith(QLatin1Char('['))       // badges, links
        || line.startsWith(QLatin1Char('!'))       // images
        || line.startsWith(QLatin1String("```"))
        || line.startsWith(QLatin1String("~~~"))
        || line.startsWith(QLatin1String("<!--"))
        || line.startsWith(QLatin1String("* "))
        || line.startsWith(QLatin1String("- "))
        || line.startsWith(QLatin1String("+ "))
        || line.startsWith(QLatin1Char('|'))       // tables
        || line.startsWith(QLatin1String(".. "))   // rst directives
        || line.contains(QLatin1String("shields.io"))) {
        return false;
    }
    // Setext underlines and rules.
    const QString stripped = QString(line).remove(QLatin1Char('=')).remove(QLatin1Char('-'));
    return !stripped.trimmed().isEmpty();
}

} // anonymous namespace

QString TextCleaner::clean(const QString& raw)
{
    if (raw.isEmpty()) {
        return raw;
    }

    QString result;
    result.reserve(raw.size());

    for (int i = 0; i < raw.size(); ++i) {
        const QChar ch = raw[i];
        const ushort code = ch.unicode();

        if (code == '\r') {
            if (i + 1 < raw.size() && raw[i + 1] == QLatin1Char('\n')) {
                ++i;
            }
            result.append(QLatin1Char('\n'));
            continue;
        }
        if ((code < 0x20 && code != 0x09 && code != 0x0A) || code == 0x7F) {
            continue;
        }
        result.append(ch);
    }

    QString collapsed;
    collapsed.reserve(result.size());

    int i = 0;
    while (i < result.size()) {
        const QChar ch = result[i];
        if (ch == QLatin1Char('\n')) {
            int count = 0;
            while (i < result.size() && result[i] == QLatin1Char('\n')) {
                ++count;
                ++i;
            }
            collapsed.append(QString(qMin(count, 2), QLatin1Char('\n')));
        } else if (ch == QLatin1Char(' ') || ch == QLatin1Char('\t')) {
            while (i < result.size() &&
                   (result[i] == QLatin1Char(' ') || result[i] == QLatin1Char('\t'))) {
                ++i;
            }
            collapsed.append(QLatin1Char(' '));
        } else {
            collapsed.append(ch);
            ++i;
        }
    }

    return collapsed.trimmed();
}

QString TextCleaner::stripHtmlTags(const QString& raw)
{
    QString out;
    out.reserve(raw.size());
    bool inTag = false;
    for (const QChar ch : raw) {
        if (ch == QLatin1Char('<')) {
            inTag = true;
        } else if (ch == QLatin1Char('>')) {
            inTag = false;
        } else if (!inTag) {
            out.append(ch);
        }
    }
    return out;
}

QString TextCleaner::readmeExcerpt(const QString& content, int maxChars)
{
    const QString text = clean(stripHtmlTags(content));

    QString result;
    const QStringList lines = text.split(QLatin1Char('\n'));
    bool inFence = false;
    for (const QString& rawLine : lines) {
        const QString line = rawLine.trimmed();
        if (line.startsWith(QLatin1String("```")) || line.startsWith(QLatin1String("~~~"))) {
            inFence = !inFence;
            continue;
        }
        if (inFence || !isProseLine(line)) {
            continue;
        }

        if (!result.isEmpty()) {
            result.append(QLatin1Char(' '));
        }
        result.append(line);
        if (result.size() >= maxChars) {
            break;
        }
    }

    if (result.size() > maxChars) {
        result.truncate(maxChars);
        const int lastSpace = result.lastIndexOf(QLatin1Char(' '));
        if (lastSpace > 0) {
            result.truncate(lastSpace);
        }
        result.append(QStringLiteral("..."));
    }

    return result;
}

} // namespace gt
