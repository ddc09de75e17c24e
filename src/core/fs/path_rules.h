#pragma once

#include "core/fs/ignore_patterns.h"

#include <QString>
#include <QStringList>

namespace gt {

// PathRules — decides which directories a project walk may enter.
//
// Evaluated in order against the path relative to the scan root:
//   1. Hidden component (dot-prefixed)      -> Exclude
//   2. Built-in dependency/cache exclusion  -> Exclude
//   3. Global excludePatterns               -> Exclude
//   4. Per-root exclude globs / .gotoignore -> Exclude
//   5. Otherwise                            -> Include
class PathRules {
public:
    PathRules();

    // Adds configured globs on top of the built-in set.
    void addPatterns(const QStringList& patterns);

    // Appends patterns from a .gotoignore file. Missing file is not an error.
    bool loadIgnoreFile(const QString& path);

    // relativePath is relative to the scan root, '/'-separated.
    bool isExcluded(const QString& relativePath) const;

    static const QStringList& defaultExclusions();

    int patternCount() const { return m_patterns.size(); }

private:
    static bool hasHiddenComponent(const QString& relativePath);

    IgnorePatterns m_patterns;
};

} // namespace gt
