#include "command_line.h"
#include "commands.h"
#include "console.h"

#include "core/shared/logging.h"
#include "core/shared/run_context.h"
#include "core/shared/settings_manager.h"

#include <QCoreApplication>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("goto"));
    app.setApplicationVersion(QStringLiteral("0.3.0"));

    gt::Console console;

    QString error;
    const std::optional<gt::CommandLine> line = gt::parseCommandLine(app.arguments(), &error);
    if (!line) {
        console.failure(error);
        console.line(QStringLiteral("  see `goto --help`"));
        return gt::kExitUsage;
    }

    gt::installLogging(line->debug);

    std::optional<gt::Settings> settings = gt::SettingsManager::load(&error);
    if (!settings) {
        console.failure(QStringLiteral("invalid configuration: %1").arg(error));
        return gt::kExitConfig;
    }

    std::unique_ptr<gt::RunContext> context = gt::RunContext::create(std::move(*settings), &error);
    if (!context) {
        console.failure(QStringLiteral("invalid configuration: %1").arg(error));
        return gt::kExitConfig;
    }
    context->debug = line->debug;
    context->cdOnly = line->cdOnly;

    gt::CommandRunner runner(*context, console);
    return runner.run(*line);
}
