#include "core/extraction/manifest_reader.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QRegularExpression>

#include <vector>

namespace gt {

namespace {

constexpr qint64 kMaxManifestBytes = 1024 * 1024;

std::optional<QString> readSmallFile(const QString& path)
{
    QFile file(path);
    if (!file.exists()) {
        return std::nullopt;
    }
    if (file.size() > kMaxManifestBytes || !file.open(QIODevice::ReadOnly)) {
        LOG_DEBUG(gotoExtraction, "Manifest skipped: %s", qUtf8Printable(path));
        return std::nullopt;
    }
    return QString::fromUtf8(file.readAll());
}

// Strips a trailing "# comment" outside of quotes.
QString stripTomlComment(const QString& line)
{
    QChar quote;
    for (int i = 0; i < line.size(); ++i) {
        const QChar ch = line[i];
        if (!quote.isNull()) {
            if (ch == QLatin1Char('\\') && quote == QLatin1Char('"')) {
                ++i;
            } else if (ch == quote) {
                quote = QChar();
            }
            continue;
        }
        if (ch == QLatin1Char('"') || ch == QLatin1Char('\'')) {
            quote = ch;
        } else if (ch == QLatin1Char('#')) {
            return line.left(i);
        }
    }
    return line;
}

QStringList quotedStrings(const QString& text)
{
    static const QRegularExpression kQuoted(
        QStringLiteral("\"((?:\\\\.|[^\"\\\\])*)\"|'([^']*)'"));
    QStringList out;
    QRegularExpressionMatchIterator it = kQuoted.globalMatch(text);
    while (it.hasNext()) {
        const QRegularExpressionMatch m = it.next();
        QString value = m.captured(1).isNull() ? m.captured(2) : m.captured(1);
        value.replace(QLatin1String("\\\""), QLatin1String("\""));
        value.replace(QLatin1String("\\\\"), QLatin1String("\\"));
        out.append(value);
    }
    return out;
}

// Raw right-hand side of `key` inside one of `sections`, joined across
// lines for arrays. Section order in the file does not matter; the first
// section in `sections` that defines the key wins.
std::optional<QString> tomlRawValue(const QString& content,
                                    const QStringList& sections,
                                    const QString& key)
{
    static const QRegularExpression kHeader(QStringLiteral("^\\[\\s*([^\\[\\]]+?)\\s*\\]$"));
    const QRegularExpression kKey(
        QStringLiteral("^%1\\s*=\\s*(.*)$").arg(QRegularExpression::escape(key)));

    std::vector<std::optional<QString>> found(static_cast<size_t>(sections.size()));
    QString currentSection;
    const QStringList lines = content.split(QLatin1Char('\n'));

    for (int i = 0; i < lines.size(); ++i) {
        const QString line = stripTomlComment(lines[i]).trimmed();
        if (line.isEmpty()) {
            continue;
        }

        const QRegularExpressionMatch header = kHeader.match(line);
        if (header.hasMatch()) {
            currentSection = header.captured(1).remove(QLatin1Char(' '));
            continue;
        }

        const int sectionIndex = sections.indexOf(currentSection);
        if (sectionIndex < 0 || found[static_cast<size_t>(sectionIndex)].has_value()) {
            continue;
        }

        const QRegularExpressionMatch kv = kKey.match(line);
        if (!kv.hasMatch()) {
            continue;
        }

        QString value = kv.captured(1).trimmed();
        if (value.startsWith(QLatin1Char('[')) && !value.contains(QLatin1Char(']'))) {
            while (++i < lines.size()) {
                const QString next = stripTomlComment(lines[i]).trimmed();
                value.append(QLatin1Char(' ')).append(next);
                if (next.contains(QLatin1Char(']'))) {
                    break;
                }
            }
        }
        found[static_cast<size_t>(sectionIndex)] = value;
    }

    for (const auto& value : found) {
        if (value.has_value()) {
            return value;
        }
    }
    return std::nullopt;
}

} // anonymous namespace

std::optional<QString> ManifestReader::tomlString(const QString& content,
                                                  const QStringList& sections,
                                                  const QString& key)
{
    const auto raw = tomlRawValue(content, sections, key);
    if (!raw.has_value() || raw->startsWith(QLatin1Char('['))) {
        return std::nullopt;
    }
    const QStringList strings = quotedStrings(*raw);
    if (strings.isEmpty()) {
        return std::nullopt;
    }
    return strings.first().trimmed();
}

std::optional<QStringList> ManifestReader::tomlStringArray(const QString& content,
                                                           const QStringList& sections,
                                                           const QString& key)
{
    const auto raw = tomlRawValue(content, sections, key);
    if (!raw.has_value() || !raw->startsWith(QLatin1Char('['))) {
        return std::nullopt;
    }
    return quotedStrings(*raw);
}

std::optional<ManifestInfo> ManifestReader::readPackageJson(const QString& projectDir)
{
    const auto content = readSmallFile(QDir(projectDir).filePath(QStringLiteral("package.json")));
    if (!content.has_value()) {
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(content->toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_DEBUG(gotoExtraction, "Unparsable package.json in %s: %s",
                  qUtf8Printable(projectDir), qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    const QJsonObject obj = doc.object();
    ManifestInfo info;
    info.description = obj.value(QStringLiteral("description")).toString().trimmed();
    for (const QJsonValue& keyword : obj.value(QStringLiteral("keywords")).toArray()) {
        const QString str = keyword.toString().trimmed();
        if (!str.isEmpty()) {
            info.keywords.append(str);
        }
    }
    return info;
}

std::optional<ManifestInfo> ManifestReader::readCargoToml(const QString& projectDir)
{
    const auto content = readSmallFile(QDir(projectDir).filePath(QStringLiteral("Cargo.toml")));
    if (!content.has_value()) {
        return std::nullopt;
    }

    const QStringList sections = {QStringLiteral("package"), QStringLiteral("workspace.package")};
    ManifestInfo info;
    info.description = tomlString(*content, sections, QStringLiteral("description")).value_or(QString());
    info.keywords = tomlStringArray(*content, sections, QStringLiteral("keywords")).value_or(QStringList());
    return info;
}

std::optional<ManifestInfo> ManifestReader::readPyprojectToml(const QString& projectDir)
{
    const auto content = readSmallFile(QDir(projectDir).filePath(QStringLiteral("pyproject.toml")));
    if (!content.has_value()) {
        return std::nullopt;
    }

    const QStringList sections = {QStringLiteral("project"), QStringLiteral("tool.poetry")};
    ManifestInfo info;
    info.description = tomlString(*content, sections, QStringLiteral("description")).value_or(QString());
    info.keywords = tomlStringArray(*content, sections, QStringLiteral("keywords")).value_or(QStringList());
    return info;
}

ManifestInfo ManifestReader::read(const QString& projectDir)
{
    const auto packageJson = readPackageJson(projectDir);
    const auto cargo = readCargoToml(projectDir);
    const auto pyproject = readPyprojectToml(projectDir);

    ManifestInfo merged;
    for (const auto* source : {&packageJson, &cargo, &pyproject}) {
        if (source->has_value() && merged.description.isEmpty()) {
            merged.description = (*source)->description;
        }
    }
    for (const auto* source : {&cargo, &packageJson, &pyproject}) {
        if (source->has_value() && merged.keywords.isEmpty()) {
            merged.keywords = (*source)->keywords;
        }
    }
    return merged;
}

} // namespace gt
