#pragma once

#include <QString>
#include <QStringList>

#include <utility>
#include <vector>

namespace gt {

// TechSignatureTable — declarative (signature -> tag) table for language
// and framework detection.
//
// Marker signatures fire when a file of that name exists at the project
// root. Extension signatures fire when one of the first 30 entries of the
// root, src/, lib/ or app/ ends with the extension. The result is the union
// of all matches in table order.
class TechSignatureTable {
public:
    using Entry = std::pair<QString, QString>;  // signature, tag

    TechSignatureTable() = default;

    static TechSignatureTable builtin();

    // Merges {"markers":{file:tag}, "extensions":{".ext":tag}} from a JSON
    // file. Missing file is not an error; malformed JSON is.
    bool loadOverrides(const QString& path, QString* errorOut = nullptr);

    void addMarker(const QString& fileName, const QString& tag);
    void addExtension(const QString& extension, const QString& tag);

    QStringList detect(const QString& projectDir) const;

    const std::vector<Entry>& markers() const { return m_markers; }
    const std::vector<Entry>& extensions() const { return m_extensions; }

    // backend / frontend / infrastructure hints derived from tags.
    static QStringList semanticHints(const QStringList& tags);

    static constexpr int kEntriesPerDirectory = 30;

private:
    std::vector<Entry> m_markers;
    std::vector<Entry> m_extensions;
};

} // namespace gt
