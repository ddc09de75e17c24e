#include "command_line.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QHash>

namespace gt {

namespace {

const QHash<QString, Command>& commandNames()
{
    static const QHash<QString, Command> names = {
        {QStringLiteral("find"), Command::Find},
        {QStringLiteral("recent"), Command::Recent},
        {QStringLiteral("scan"), Command::Update},
        {QStringLiteral("update"), Command::Update},
        {QStringLiteral("refresh"), Command::Refresh},
        {QStringLiteral("list"), Command::List},
        {QStringLiteral("add"), Command::Add},
        {QStringLiteral("remove"), Command::Remove},
        {QStringLiteral("config"), Command::Config},
        {QStringLiteral("stats"), Command::Stats},
        {QStringLiteral("test"), Command::Test},
        {QStringLiteral("help"), Command::Help},
    };
    return names;
}

bool fail(QString* errorOut, const QString& message)
{
    if (errorOut) {
        *errorOut = message;
    }
    return false;
}

} // anonymous namespace

std::optional<CommandLine> parseCommandLine(const QStringList& arguments, QString* errorOut)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Jump to a project directory by name or description.\n\n"
        "Commands:\n"
        "  <query>                 shorthand for find <query>\n"
        "  find <query> | -        resolve a query, or list recent projects\n"
        "  recent                  recently visited projects\n"
        "  scan | update           re-index registered roots\n"
        "  refresh                 clear the cache and re-index\n"
        "  list                    list indexed projects\n"
        "  add <path>              register a scan root\n"
        "  remove <path>           unregister a scan root\n"
        "  config                  print the effective configuration\n"
        "  stats                   navigation statistics\n"
        "  test [file]             run ranking expectations"));

    const QCommandLineOption helpOption({QStringLiteral("h"), QStringLiteral("help")},
                                        QStringLiteral("Show this help."));
    const QCommandLineOption versionOption({QStringLiteral("V"), QStringLiteral("version")},
                                           QStringLiteral("Show the version."));
    const QCommandLineOption allOption({QStringLiteral("a"), QStringLiteral("all")},
                                       QStringLiteral("find: show every match; list: no limit."));
    const QCommandLineOption limitOption({QStringLiteral("n"), QStringLiteral("limit")},
                                         QStringLiteral("Maximum number of entries."),
                                         QStringLiteral("N"));
    const QCommandLineOption sortOption({QStringLiteral("s"), QStringLiteral("sort")},
                                        QStringLiteral("list order: name, recent or frecency."),
                                        QStringLiteral("order"),
                                        QStringLiteral("frecency"));
    const QCommandLineOption forceOption({QStringLiteral("f"), QStringLiteral("force")},
                                         QStringLiteral("update: recompute every embedding."));
    const QCommandLineOption noGitOption(QStringLiteral("no-git"),
                                         QStringLiteral("list: skip git status."));
    const QCommandLineOption cdOnlyOption({QStringLiteral("c"), QStringLiteral("cd-only")},
                                          QStringLiteral("Do not propose a post-navigation command."));
    const QCommandLineOption debugOption(QStringLiteral("debug"),
                                         QStringLiteral("Print score breakdowns and debug logs."));

    parser.addOptions({helpOption, versionOption, allOption, limitOption, sortOption,
                       forceOption, noGitOption, cdOnlyOption, debugOption});
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("Command or query."),
                                 QStringLiteral("[command|query...]"));

    if (!parser.parse(arguments)) {
        fail(errorOut, parser.errorText());
        return std::nullopt;
    }

    CommandLine line;
    line.helpText = parser.helpText();
    line.all = parser.isSet(allOption);
    line.force = parser.isSet(forceOption);
    line.showGit = !parser.isSet(noGitOption);
    line.cdOnly = parser.isSet(cdOnlyOption);
    line.debug = parser.isSet(debugOption);

    if (parser.isSet(limitOption)) {
        bool ok = false;
        const int limit = parser.value(limitOption).toInt(&ok);
        if (!ok || limit <= 0) {
            fail(errorOut, QStringLiteral("--limit expects a positive number"));
            return std::nullopt;
        }
        line.limit = limit;
    }

    const std::optional<SortOrder> sort = sortOrderFromString(parser.value(sortOption));
    if (!sort) {
        fail(errorOut, QStringLiteral("unknown sort order '%1'").arg(parser.value(sortOption)));
        return std::nullopt;
    }
    line.sort = *sort;

    if (parser.isSet(helpOption)) {
        line.command = Command::Help;
        return line;
    }
    if (parser.isSet(versionOption)) {
        line.command = Command::Version;
        return line;
    }

    QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        line.command = Command::Help;
        return line;
    }

    const auto named = commandNames().constFind(positional.first());
    if (named == commandNames().constEnd()) {
        // Bare query.
        line.command = Command::Find;
        line.query = positional.join(QLatin1Char(' ')).trimmed();
        if (line.query.isEmpty()) {
            fail(errorOut, QStringLiteral("empty query"));
            return std::nullopt;
        }
        if (line.query == QLatin1String("-")) {
            line.command = Command::Recent;
        }
        return line;
    }

    line.command = named.value();
    positional.removeFirst();

    switch (line.command) {
    case Command::Find:
        line.query = positional.join(QLatin1Char(' ')).trimmed();
        if (line.query.isEmpty()) {
            fail(errorOut, QStringLiteral("find expects a query or '-'"));
            return std::nullopt;
        }
        break;
    case Command::Add:
    case Command::Remove:
        if (positional.size() != 1) {
            fail(errorOut, QStringLiteral("%1 expects exactly one path")
                               .arg(line.command == Command::Add ? QStringLiteral("add")
                                                                 : QStringLiteral("remove")));
            return std::nullopt;
        }
        line.path = positional.first();
        break;
    case Command::Test:
        if (positional.size() > 1) {
            fail(errorOut, QStringLiteral("test expects at most one file"));
            return std::nullopt;
        }
        line.path = positional.value(0);
        break;
    default:
        if (!positional.isEmpty()) {
            fail(errorOut, QStringLiteral("unexpected argument '%1'").arg(positional.first()));
            return std::nullopt;
        }
        break;
    }

    // "find -" is the recent list.
    if (line.command == Command::Find && line.query == QLatin1String("-")) {
        line.command = Command::Recent;
    }
    return line;
}

} // namespace gt
