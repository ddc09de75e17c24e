#include "core/extraction/metadata_extractor.h"
#include "core/extraction/manifest_reader.h"
#include "core/extraction/text_cleaner.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QHash>
#include <QRegularExpression>
#include <QSet>

#include <algorithm>
#include <utility>
#include <vector>

namespace gt {

namespace {

const QSet<QString>& genericDirectoryNames()
{
    static const QSet<QString> kNames = {
        // Build and layout
        QStringLiteral("src"), QStringLiteral("lib"), QStringLiteral("bin"), QStringLiteral("cmd"),
        QStringLiteral("pkg"), QStringLiteral("app"), QStringLiteral("apps"), QStringLiteral("main"),
        QStringLiteral("java"), QStringLiteral("kotlin"), QStringLiteral("scala"),
        QStringLiteral("resources"), QStringLiteral("test"), QStringLiteral("tests"),
        QStringLiteral("spec"), QStringLiteral("specs"), QStringLiteral("integration"),
        // Package prefixes
        QStringLiteral("com"), QStringLiteral("org"), QStringLiteral("io"), QStringLiteral("net"),
        QStringLiteral("dev"), QStringLiteral("github"),
        // Code organization
        QStringLiteral("impl"), QStringLiteral("internal"), QStringLiteral("api"),
        QStringLiteral("core"), QStringLiteral("base"), QStringLiteral("util"),
        QStringLiteral("utils"), QStringLiteral("helper"), QStringLiteral("helpers"),
        QStringLiteral("common"), QStringLiteral("shared"), QStringLiteral("model"),
        QStringLiteral("models"), QStringLiteral("entity"), QStringLiteral("entities"),
        QStringLiteral("dto"), QStringLiteral("dtos"), QStringLiteral("service"),
        QStringLiteral("services"), QStringLiteral("controller"), QStringLiteral("controllers"),
        QStringLiteral("repository"), QStringLiteral("repositories"), QStringLiteral("dao"),
        QStringLiteral("daos"),
        // Output and dependencies
        QStringLiteral("build"), QStringLiteral("dist"), QStringLiteral("target"),
        QStringLiteral("out"), QStringLiteral("output"), QStringLiteral("gen"),
        QStringLiteral("generated"), QStringLiteral("vendor"), QStringLiteral("node_modules"),
        QStringLiteral("deps"), QStringLiteral("dependencies"), QStringLiteral("third_party"),
        // Assets and config
        QStringLiteral("assets"), QStringLiteral("public"), QStringLiteral("static"),
        QStringLiteral("config"), QStringLiteral("configs"), QStringLiteral("scripts"),
        QStringLiteral("tools"), QStringLiteral("templates"), QStringLiteral("fixtures"),
        // Docs
        QStringLiteral("docs"), QStringLiteral("doc"), QStringLiteral("documentation"),
        QStringLiteral("examples"), QStringLiteral("samples"), QStringLiteral("demo"),
        QStringLiteral("meta-inf"), QStringLiteral("web-inf"),
    };
    return kNames;
}

const QSet<QString>& genericTypeNames()
{
    static const QSet<QString> kNames = {
        QStringLiteral("App"), QStringLiteral("Main"), QStringLiteral("Application"),
        QStringLiteral("Program"), QStringLiteral("Config"), QStringLiteral("Configuration"),
        QStringLiteral("Options"), QStringLiteral("Settings"), QStringLiteral("Properties"),
        QStringLiteral("Utils"), QStringLiteral("Util"), QStringLiteral("Helper"),
        QStringLiteral("Helpers"), QStringLiteral("Common"), QStringLiteral("Handler"),
        QStringLiteral("Manager"), QStringLiteral("Service"), QStringLiteral("Factory"),
        QStringLiteral("Builder"), QStringLiteral("Provider"), QStringLiteral("Context"),
        QStringLiteral("State"), QStringLiteral("Store"), QStringLiteral("Cache"),
        QStringLiteral("Error"), QStringLiteral("Exception"), QStringLiteral("Result"),
        QStringLiteral("Test"), QStringLiteral("Tests"), QStringLiteral("Spec"),
        QStringLiteral("Mock"), QStringLiteral("Base"), QStringLiteral("Abstract"),
        QStringLiteral("Default"), QStringLiteral("Simple"), QStringLiteral("Basic"),
        QStringLiteral("Impl"), QStringLiteral("Implementation"),
    };
    return kNames;
}

const QSet<QString>& sourceExtensions()
{
    static const QSet<QString> kExts = {
        QStringLiteral("rs"), QStringLiteral("java"), QStringLiteral("kt"),
        QStringLiteral("scala"), QStringLiteral("ts"), QStringLiteral("js"),
        QStringLiteral("go"), QStringLiteral("py"), QStringLiteral("cs"),
        QStringLiteral("cpp"), QStringLiteral("hpp"), QStringLiteral("h"),
        QStringLiteral("swift"),
    };
    return kExts;
}

// Directory names never entered by the structure and type walks.
const QSet<QString>& skippedTreeNames()
{
    static const QSet<QString> kNames = {
        QStringLiteral("node_modules"), QStringLiteral("target"), QStringLiteral("build"),
        QStringLiteral("dist"), QStringLiteral("vendor"), QStringLiteral("generated"),
        QStringLiteral("__pycache__"), QStringLiteral("venv"),
    };
    return kNames;
}

const QSet<QString>& testTreeNames()
{
    static const QSet<QString> kNames = {
        QStringLiteral("test"), QStringLiteral("tests"), QStringLiteral("spec"),
    };
    return kNames;
}

bool isTestFile(const QString& lowerName)
{
    return lowerName.contains(QLatin1String("_test.")) || lowerName.contains(QLatin1String(".test."));
}

const std::vector<QRegularExpression>& patternsFor(const QString& extension)
{
    static const QHash<QString, std::vector<QRegularExpression>> kPatterns = [] {
        auto re = [](const char* pattern) { return QRegularExpression(QString::fromLatin1(pattern)); };
        QHash<QString, std::vector<QRegularExpression>> table;
        const std::vector<QRegularExpression> jvm = {
            re("public\\s+(?:class|interface|enum|record)\\s+(\\w+)"),
            re("class\\s+(\\w+)"),
        };
        table.insert(QStringLiteral("java"), jvm);
        table.insert(QStringLiteral("kt"), jvm);
        table.insert(QStringLiteral("scala"), jvm);
        table.insert(QStringLiteral("rs"), {
            re("pub\\s+struct\\s+(\\w+)"),
            re("pub\\s+enum\\s+(\\w+)"),
            re("pub\\s+trait\\s+(\\w+)"),
        });
        const std::vector<QRegularExpression> script = {
            re("export\\s+(?:default\\s+)?(?:abstract\\s+)?(?:class|interface|type|enum)\\s+(\\w+)"),
            re("class\\s+(\\w+)"),
        };
        table.insert(QStringLiteral("ts"), script);
        table.insert(QStringLiteral("js"), script);
        table.insert(QStringLiteral("go"), {
            re("type\\s+([A-Z]\\w+)\\s+struct"),
            re("type\\s+([A-Z]\\w+)\\s+interface"),
        });
        table.insert(QStringLiteral("py"), {re("class\\s+(\\w+)")});
        table.insert(QStringLiteral("cs"), {
            re("public\\s+(?:(?:static|sealed|abstract|partial)\\s+)*(?:class|interface|enum|struct|record)\\s+(\\w+)"),
        });
        const std::vector<QRegularExpression> cpp = {
            re("(?:class|struct)\\s+(?:\\w+_EXPORT\\s+)?([A-Z]\\w+)\\s*(?:final\\s*)?[:{]"),
            re("enum\\s+class\\s+([A-Z]\\w+)"),
        };
        table.insert(QStringLiteral("cpp"), cpp);
        table.insert(QStringLiteral("hpp"), cpp);
        table.insert(QStringLiteral("h"), cpp);
        table.insert(QStringLiteral("swift"), {
            re("(?:class|struct|protocol|enum|actor)\\s+([A-Z]\\w+)"),
        });
        return table;
    }();

    static const std::vector<QRegularExpression> kNone;
    const auto it = kPatterns.constFind(extension);
    return it == kPatterns.constEnd() ? kNone : it.value();
}

void collectStructure(const QDir& dir, int depth, QSet<QString>& names)
{
    if (depth > MetadataExtractor::kStructureDepth) {
        return;
    }
    const QFileInfoList entries = dir.entryInfoList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
    for (const QFileInfo& fi : entries) {
        if (fi.isSymLink()) {
            continue;
        }
        const QString lower = fi.fileName().toLower();
        if (skippedTreeNames().contains(lower)) {
            continue;
        }
        if (lower.size() >= 4 && !genericDirectoryNames().contains(lower)) {
            names.insert(lower);
        }
        collectStructure(QDir(fi.absoluteFilePath()), depth + 1, names);
    }
}

void collectSources(const QDir& dir, int depth, std::vector<std::pair<QString, qint64>>& files)
{
    if (depth > MetadataExtractor::kTypeScanDepth) {
        return;
    }
    const QFileInfoList entries = dir.entryInfoList(QDir::Dirs | QDir::Files | QDir::NoDotAndDotDot,
                                                    QDir::Name);
    for (const QFileInfo& fi : entries) {
        if (fi.isSymLink()) {
            continue;
        }
        const QString lower = fi.fileName().toLower();
        if (fi.isDir()) {
            if (!skippedTreeNames().contains(lower) && !testTreeNames().contains(lower)) {
                collectSources(QDir(fi.absoluteFilePath()), depth + 1, files);
            }
            continue;
        }
        if (!sourceExtensions().contains(fi.suffix().toLower()) || isTestFile(lower)) {
            continue;
        }
        files.emplace_back(fi.absoluteFilePath(), fi.size());
    }
}

QStringList sortedLimited(const QSet<QString>& values, int limit)
{
    QStringList out(values.begin(), values.end());
    out.sort();
    if (out.size() > limit) {
        out.erase(out.begin() + limit, out.end());
    }
    return out;
}

} // anonymous namespace

QString ProjectMetadata::toDescriptionText(const QString& projectName) const
{
    QStringList parts;
    parts.append(projectName);
    if (!description.isEmpty()) {
        parts.append(description);
    }
    if (!keywords.isEmpty()) {
        parts.append(keywords.join(QStringLiteral(", ")));
    }
    if (!readmeExcerpt.isEmpty()) {
        parts.append(readmeExcerpt);
    }
    if (!techTags.isEmpty()) {
        parts.append(QStringLiteral("Technologies: ") + techTags.join(QStringLiteral(", ")));
        const QStringList hints = TechSignatureTable::semanticHints(techTags);
        if (!hints.isEmpty()) {
            parts.append(QStringLiteral("Type: ") + hints.join(QStringLiteral(", ")));
        }
    }
    if (!structureHints.isEmpty()) {
        parts.append(QStringLiteral("Structure: ") + structureHints.join(QStringLiteral(", ")));
    }
    if (!typeNames.isEmpty()) {
        parts.append(QStringLiteral("Types: ") + typeNames.join(QStringLiteral(", ")));
    }
    return parts.join(QStringLiteral(" | "));
}

MetadataExtractor::MetadataExtractor(const TechSignatureTable& signatures)
    : m_signatures(signatures)
{
}

ProjectMetadata MetadataExtractor::extract(const QString& projectDir) const
{
    ProjectMetadata meta;

    const ManifestInfo manifest = ManifestReader::read(projectDir);
    meta.description = manifest.description;
    meta.keywords = manifest.keywords;
    meta.readmeExcerpt = readReadme(projectDir);
    meta.techTags = m_signatures.detect(projectDir);
    meta.structureHints = structureHints(projectDir);
    meta.typeNames = typeNames(projectDir);

    LOG_DEBUG(gotoExtraction, "Extracted %s: %d tags, %d hints, %d types",
              qUtf8Printable(projectDir), static_cast<int>(meta.techTags.size()),
              static_cast<int>(meta.structureHints.size()), static_cast<int>(meta.typeNames.size()));
    return meta;
}

QString MetadataExtractor::readReadme(const QString& projectDir)
{
    static const QStringList kReadmeNames = {
        QStringLiteral("README.md"),
        QStringLiteral("README"),
        QStringLiteral("readme.md"),
        QStringLiteral("Readme.md"),
        QStringLiteral("README.rst"),
        QStringLiteral("README.txt"),
    };

    const QDir dir(projectDir);
    for (const QString& name : kReadmeNames) {
        QFile file(dir.filePath(name));
        if (!file.exists()) {
            continue;
        }
        if (!file.open(QIODevice::ReadOnly)) {
            LOG_DEBUG(gotoExtraction, "Unreadable README: %s", qUtf8Printable(file.fileName()));
            continue;
        }
        // Prose is near the top; 64 KB is plenty for a 1500-char excerpt.
        return TextCleaner::readmeExcerpt(QString::fromUtf8(file.read(64 * 1024)));
    }
    return QString();
}

QStringList MetadataExtractor::structureHints(const QString& projectDir)
{
    QSet<QString> names;
    collectStructure(QDir(projectDir), 1, names);
    return sortedLimited(names, kMaxHints);
}

QStringList MetadataExtractor::typeNames(const QString& projectDir)
{
    std::vector<std::pair<QString, qint64>> files;
    collectSources(QDir(projectDir), 1, files);

    std::stable_sort(files.begin(), files.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (files.size() > static_cast<size_t>(kLargestFiles)) {
        files.resize(static_cast<size_t>(kLargestFiles));
    }

    QSet<QString> names;
    for (const auto& [path, size] : files) {
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly)) {
            continue;
        }
        const QString content = QString::fromUtf8(file.read(kTypeScanBytes));
        for (const QString& name : typesFromContent(content, QFileInfo(path).suffix().toLower())) {
            if (name.size() >= 4 && !genericTypeNames().contains(name)) {
                names.insert(name);
            }
        }
    }
    return sortedLimited(names, kMaxHints);
}

QStringList MetadataExtractor::typesFromContent(const QString& content, const QString& extension)
{
    QStringList types;
    for (const QRegularExpression& pattern : patternsFor(extension)) {
        QRegularExpressionMatchIterator it = pattern.globalMatch(content);
        while (it.hasNext()) {
            const QString name = it.next().captured(1);
            if (!name.isEmpty() && name.at(0).isUpper()) {
                types.append(name);
            }
        }
    }
    return types;
}

} // namespace gt
