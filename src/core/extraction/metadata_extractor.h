#pragma once

#include "core/extraction/tech_signatures.h"

#include <QString>
#include <QStringList>

namespace gt {

// Everything extracted from one project directory.
struct ProjectMetadata {
    QString description;
    QStringList keywords;
    QString readmeExcerpt;
    QStringList techTags;
    QStringList structureHints;
    QStringList typeNames;

    // "name | description | keywords | readme | Technologies: ... |
    //  Type: ... | Structure: ... | Types: ...", empty parts omitted.
    QString toDescriptionText(const QString& projectName) const;
};

// MetadataExtractor — best-effort description of a project for embedding
// and metadata matching. Missing or unreadable inputs contribute nothing.
// Thread-safe; holds only the immutable signature table.
class MetadataExtractor {
public:
    explicit MetadataExtractor(const TechSignatureTable& signatures);

    ProjectMetadata extract(const QString& projectDir) const;

    static QString readReadme(const QString& projectDir);

    // Meaningful directory names up to depth 6, sorted, at most 15.
    static QStringList structureHints(const QString& projectDir);

    // Capitalized type names declared in the largest source files.
    static QStringList typeNames(const QString& projectDir);

    // Declarations found in one source text, by file extension.
    static QStringList typesFromContent(const QString& content, const QString& extension);

    static constexpr int kStructureDepth = 6;
    static constexpr int kTypeScanDepth = 8;
    static constexpr int kLargestFiles = 10;
    static constexpr qint64 kTypeScanBytes = 50000;
    static constexpr int kMaxHints = 15;

private:
    const TechSignatureTable& m_signatures;
};

} // namespace gt
