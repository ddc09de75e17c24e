#include "core/extraction/tech_signatures.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

#include <algorithm>

namespace gt {

TechSignatureTable TechSignatureTable::builtin()
{
    TechSignatureTable table;

    static const char* const kMarkers[][2] = {
        // Systems
        {"Cargo.toml", "Rust"},
        {"CMakeLists.txt", "C++"},
        {"meson.build", "C"},
        {"build.zig", "Zig"},
        // JVM
        {"pom.xml", "Java"},
        {"build.gradle", "Java"},
        {"build.gradle.kts", "Kotlin"},
        {"build.sbt", "Scala"},
        {"project.clj", "Clojure"},
        // Web
        {"package.json", "JavaScript"},
        {"tsconfig.json", "TypeScript"},
        {"deno.json", "Deno"},
        {"bun.lockb", "Bun"},
        // Python
        {"pyproject.toml", "Python"},
        {"requirements.txt", "Python"},
        {"setup.py", "Python"},
        {"Pipfile", "Python"},
        {"go.mod", "Go"},
        {"Gemfile", "Ruby"},
        {"composer.json", "PHP"},
        {"mix.exs", "Elixir"},
        {"rebar.config", "Erlang"},
        {"stack.yaml", "Haskell"},
        {"dune-project", "OCaml"},
        // Mobile
        {"Package.swift", "Swift"},
        {"Podfile", "iOS"},
        // Infra
        {"Dockerfile", "Docker"},
        {"docker-compose.yml", "Docker"},
        {"docker-compose.yaml", "Docker"},
        {"terraform.tf", "Terraform"},
        {"main.tf", "Terraform"},
        {"serverless.yml", "Serverless"},
        {"pulumi.yaml", "Pulumi"},
        {"Pulumi.yaml", "Pulumi"},
        {"kubernetes.yaml", "Kubernetes"},
        // Frameworks
        {"next.config.js", "Next.js"},
        {"next.config.mjs", "Next.js"},
        {"nuxt.config.ts", "Nuxt"},
        {"vite.config.ts", "Vite"},
        {"vite.config.js", "Vite"},
        {"astro.config.mjs", "Astro"},
        {"svelte.config.js", "Svelte"},
        {"angular.json", "Angular"},
        {"tailwind.config.js", "Tailwind"},
        {"tailwind.config.ts", "Tailwind"},
        {"dbt_project.yml", "dbt"},
        // Task runners
        {"Makefile", "Make"},
        {"justfile", "Just"},
        {"Taskfile.yml", "Task"},
    };
    for (const auto& marker : kMarkers) {
        table.addMarker(QString::fromLatin1(marker[0]), QString::fromLatin1(marker[1]));
    }

    static const char* const kExtensions[][2] = {
        {".rs", "Rust"},
        {".ts", "TypeScript"},
        {".tsx", "TypeScript"},
        {".js", "JavaScript"},
        {".jsx", "JavaScript"},
        {".py", "Python"},
        {".go", "Go"},
        {".java", "Java"},
        {".kt", "Kotlin"},
        {".scala", "Scala"},
        {".rb", "Ruby"},
        {".php", "PHP"},
        {".ex", "Elixir"},
        {".exs", "Elixir"},
        {".hs", "Haskell"},
        {".ml", "OCaml"},
        {".swift", "Swift"},
        {".cs", "C#"},
        {".fs", "F#"},
        {".c", "C"},
        {".cpp", "C++"},
        {".cc", "C++"},
        {".hpp", "C++"},
        {".zig", "Zig"},
        {".lua", "Lua"},
        {".clj", "Clojure"},
        {".erl", "Erlang"},
        {".tf", "Terraform"},
        {".vue", "Vue"},
        {".svelte", "Svelte"},
    };
    for (const auto& extension : kExtensions) {
        table.addExtension(QString::fromLatin1(extension[0]), QString::fromLatin1(extension[1]));
    }

    return table;
}

void TechSignatureTable::addMarker(const QString& fileName, const QString& tag)
{
    for (Entry& entry : m_markers) {
        if (entry.first == fileName && entry.second == tag) {
            return;
        }
    }
    m_markers.emplace_back(fileName, tag);
}

void TechSignatureTable::addExtension(const QString& extension, const QString& tag)
{
    QString normalized = extension.trimmed().toLower();
    if (!normalized.startsWith(QLatin1Char('.'))) {
        normalized.prepend(QLatin1Char('.'));
    }
    for (Entry& entry : m_extensions) {
        if (entry.first == normalized) {
            entry.second = tag;
            return;
        }
    }
    m_extensions.emplace_back(normalized, tag);
}

bool TechSignatureTable::loadOverrides(const QString& path, QString* errorOut)
{
    QFile file(path);
    if (!file.exists()) {
        return true;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorOut) {
            *errorOut = QStringLiteral("cannot read %1").arg(path);
        }
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (errorOut) {
            *errorOut = QStringLiteral("invalid JSON in %1: %2").arg(path, parseError.errorString());
        }
        return false;
    }

    const QJsonObject root = doc.object();
    const QJsonObject markers = root.value(QStringLiteral("markers")).toObject();
    for (auto it = markers.begin(); it != markers.end(); ++it) {
        if (it.value().isString()) {
            addMarker(it.key(), it.value().toString());
        }
    }
    const QJsonObject extensions = root.value(QStringLiteral("extensions")).toObject();
    for (auto it = extensions.begin(); it != extensions.end(); ++it) {
        if (it.value().isString()) {
            addExtension(it.key(), it.value().toString());
        }
    }

    LOG_DEBUG(gotoExtraction, "Tech signatures extended from %s (%d markers, %d extensions)",
              qUtf8Printable(path), static_cast<int>(markers.size()),
              static_cast<int>(extensions.size()));
    return true;
}

QStringList TechSignatureTable::detect(const QString& projectDir) const
{
    QStringList tags;
    const QDir root(projectDir);

    for (const Entry& marker : m_markers) {
        if (!tags.contains(marker.second) && QFileInfo::exists(root.filePath(marker.first))) {
            tags.append(marker.second);
        }
    }

    const QStringList scanDirs = {
        projectDir,
        root.filePath(QStringLiteral("src")),
        root.filePath(QStringLiteral("lib")),
        root.filePath(QStringLiteral("app")),
    };
    for (const QString& dirPath : scanDirs) {
        const QDir dir(dirPath);
        if (!dir.exists()) {
            continue;
        }
        const QStringList entries = dir.entryList(QDir::Files | QDir::Dirs | QDir::NoDotAndDotDot,
                                                  QDir::Name);
        const int limit = std::min(static_cast<int>(entries.size()), kEntriesPerDirectory);
        for (int i = 0; i < limit; ++i) {
            const QString name = entries[i].toLower();
            for (const Entry& extension : m_extensions) {
                if (name.endsWith(extension.first)) {
                    if (!tags.contains(extension.second)) {
                        tags.append(extension.second);
                    }
                    break;
                }
            }
        }
    }

    return tags;
}

QStringList TechSignatureTable::semanticHints(const QStringList& tags)
{
    static const QStringList kBackend = {
        QStringLiteral("Scala"), QStringLiteral("Java"), QStringLiteral("Kotlin"),
        QStringLiteral("Go"), QStringLiteral("Rust"), QStringLiteral("Python"),
        QStringLiteral("Ruby"), QStringLiteral("PHP"), QStringLiteral("Elixir"),
        QStringLiteral("C#"), QStringLiteral("F#"),
    };
    static const QStringList kFrontend = {
        QStringLiteral("Next.js"), QStringLiteral("Nuxt"), QStringLiteral("Vite"),
        QStringLiteral("Astro"), QStringLiteral("Svelte"), QStringLiteral("Angular"),
        QStringLiteral("Vue"), QStringLiteral("Tailwind"),
    };
    static const QStringList kInfra = {
        QStringLiteral("Docker"), QStringLiteral("Kubernetes"),
        QStringLiteral("Terraform"), QStringLiteral("Pulumi"),
    };

    auto any = [&tags](const QStringList& set) {
        for (const QString& tag : tags) {
            if (set.contains(tag)) {
                return true;
            }
        }
        return false;
    };

    const bool backend = any(kBackend);
    const bool frontend = any(kFrontend);
    const bool scripted = tags.contains(QStringLiteral("JavaScript"))
        || tags.contains(QStringLiteral("TypeScript"));

    QStringList hints;
    if (frontend || (scripted && !backend)) {
        hints << QStringLiteral("frontend") << QStringLiteral("web") << QStringLiteral("UI");
    }
    if (backend) {
        hints << QStringLiteral("backend") << QStringLiteral("server") << QStringLiteral("API");
    }
    if (any(kInfra)) {
        hints << QStringLiteral("infrastructure") << QStringLiteral("devops");
    }
    return hints;
}

} // namespace gt
