#pragma once

#include <QString>

namespace gt {

// TextCleaner — normalizes README text before it is excerpted into a
// project description.
class TextCleaner {
public:
    // 1. Strip ASCII control characters except tab and newline
    // 2. Normalize line endings: \r\n and \r to \n
    // 3. Collapse runs of 3+ newlines to 2
    // 4. Collapse runs of spaces/tabs to one space
    // 5. Trim
    static QString clean(const QString& raw);

    // Removes everything between '<' and '>'.
    static QString stripHtmlTags(const QString& raw);

    // Joins the meaningful prose lines of a README (no headers, badges,
    // links, images, code fences, comments, bullets or short lines) until
    // maxChars, then cuts at a word boundary and appends "...".
    static QString readmeExcerpt(const QString& content, int maxChars = kReadmeMaxChars);

    static constexpr int kReadmeMaxChars = 1500;
};

} // namespace gt
