#include "core/shared/post_command.h"

namespace gt {

namespace {

struct PostCommandName {
    PostCommand command;
    const char* name;
};

constexpr PostCommandName kPostCommandNames[] = {
    {PostCommand::Claude, "claude"},
    {PostCommand::Code,   "code"},
    {PostCommand::Cursor, "cursor"},
    {PostCommand::Vim,    "vim"},
    {PostCommand::Nvim,   "nvim"},
    {PostCommand::Emacs,  "emacs"},
    {PostCommand::Helix,  "hx"},
    {PostCommand::Zed,    "zed"},
};

} // anonymous namespace

std::optional<PostCommand> postCommandFromString(const QString& name)
{
    const QString trimmed = name.trimmed();
    for (const auto& entry : kPostCommandNames) {
        if (trimmed == QLatin1String(entry.name)) {
            return entry.command;
        }
    }
    return std::nullopt;
}

QString postCommandToString(PostCommand command)
{
    for (const auto& entry : kPostCommandNames) {
        if (entry.command == command) {
            return QString::fromLatin1(entry.name);
        }
    }
    return QString();
}

QString postCommandDirective(PostCommand command)
{
    return QStringLiteral("__GOTO_POST_CMD__:") + postCommandToString(command);
}

QStringList allowedPostCommandNames()
{
    QStringList names;
    for (const auto& entry : kPostCommandNames) {
        names.append(QString::fromLatin1(entry.name));
    }
    return names;
}

} // namespace gt
