#pragma once

#include <QHash>
#include <QString>
#include <QStringList>

#include <cstdint>
#include <memory>
#include <vector>

namespace gt {

// Row-major [rows x columns] model input. Short rows are padded with the
// pad id and a zero mask.
struct TokenBatch {
    int rows = 0;
    int columns = 0;
    std::vector<int64_t> ids;
    std::vector<int64_t> mask;
    std::vector<int64_t> typeIds;

    bool empty() const { return rows == 0 || columns == 0; }
    bool attends(int row, int column) const { return mask[size_t(row) * size_t(columns) + size_t(column)] != 0; }
};

// BERT-style uncased WordPiece. Text is lower-cased and stripped of
// accents, split on whitespace and punctuation, and each word is broken
// into the longest vocabulary pieces ("##" marks a continuation). A word
// with no full decomposition becomes [UNK].
class WordPieceTokenizer {
public:
    static std::unique_ptr<WordPieceTokenizer> load(const QString& vocabPath, int maxSequenceLength,
                                                    QString* errorOut = nullptr);

    int maxSequenceLength() const { return m_maxSequenceLength; }
    int vocabSize() const { return int(m_vocab.size()); }

    QStringList splitWords(const QString& text) const;

    // [CLS] pieces... [SEP], truncated to maxSequenceLength.
    std::vector<int64_t> encode(const QString& text) const;
    TokenBatch encodeBatch(const std::vector<QString>& texts) const;

private:
    WordPieceTokenizer(QHash<QString, int64_t> vocab, int maxSequenceLength);

    int64_t idOf(const QString& token, int64_t fallback) const;
    void appendPieces(const QString& word, std::vector<int64_t>& out, size_t limit) const;

    QHash<QString, int64_t> m_vocab;
    int m_maxSequenceLength;
    int64_t m_pad;
    int64_t m_unknown;
    int64_t m_cls;
    int64_t m_sep;
};

} // namespace gt
