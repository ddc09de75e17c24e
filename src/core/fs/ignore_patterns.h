#pragma once

#include <QRegularExpression>
#include <QString>
#include <QStringList>

#include <vector>

namespace gt {

// IgnorePatterns — gitignore-style globs from .gotoignore files and the
// configured exclusion lists, matched against '/'-separated paths relative
// to a scan root.
//
//   *    any run of characters except '/'
//   **   any run of characters including '/'
//   ?    one character except '/'
//
// A pattern without '/' is tried against every path component, one with
// '/' against the whole path and each of its trailing sub-paths. Comment
// (#) and negation (!) lines are dropped, as are leading and trailing '/'.
class IgnorePatterns {
public:
    // Appends the patterns of a file. Returns false if it cannot be read.
    bool loadFromFile(const QString& path);

    // One pattern per line.
    void loadFromString(const QString& content);
    void addPattern(const QString& pattern);
    void clear() { m_rules.clear(); }

    bool matches(const QString& relativePath) const;

    QStringList patterns() const;
    bool empty() const { return m_rules.empty(); }
    int size() const { return int(m_rules.size()); }

    static QRegularExpression globToRegex(const QString& glob);

private:
    struct Rule {
        QString glob;
        QRegularExpression regex;
        bool perComponent = false;
    };

    std::vector<Rule> m_rules;
};

} // namespace gt
