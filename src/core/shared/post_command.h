#pragma once

#include <QString>
#include <QStringList>

#include <optional>

namespace gt {

// Closed set of tools a shell wrapper may launch after changing directory.
// The core only proposes one of these by name; it never runs anything.
enum class PostCommand {
    Claude,
    Code,
    Cursor,
    Vim,
    Nvim,
    Emacs,
    Helix,
    Zed,
};

std::optional<PostCommand> postCommandFromString(const QString& name);
QString postCommandToString(PostCommand command);

// "__GOTO_POST_CMD__:<name>"
QString postCommandDirective(PostCommand command);

QStringList allowedPostCommandNames();

} // namespace gt
