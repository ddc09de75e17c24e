#pragma once

#include <QString>
#include <QStringList>

#include <optional>

namespace gt {

struct ManifestInfo {
    QString description;
    QStringList keywords;

    bool empty() const { return description.isEmpty() && keywords.isEmpty(); }
};

// ManifestReader — description and keywords from package manifests.
// Every reader returns nullopt when the file is missing or unparsable.
class ManifestReader {
public:
    // package.json: "description", "keywords"
    static std::optional<ManifestInfo> readPackageJson(const QString& projectDir);

    // Cargo.toml: [package] or [workspace.package]
    static std::optional<ManifestInfo> readCargoToml(const QString& projectDir);

    // pyproject.toml: [project] or [tool.poetry]
    static std::optional<ManifestInfo> readPyprojectToml(const QString& projectDir);

    // First description found (package.json, Cargo.toml, pyproject.toml in
    // that order); keywords from Cargo.toml, then package.json, then pyproject.
    static ManifestInfo read(const QString& projectDir);

    // Minimal TOML lookup: string or string-array value of `key` in any of
    // `sections` (first section wins). Multi-line arrays are supported;
    // other value types are ignored.
    static std::optional<QString> tomlString(const QString& content,
                                             const QStringList& sections,
                                             const QString& key);
    static std::optional<QStringList> tomlStringArray(const QString& content,
                                                      const QStringList& sections,
                                                      const QString& key);
};

} // namespace gt
