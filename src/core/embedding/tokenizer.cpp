#include "core/embedding/tokenizer.h"

#include <QFile>

#include <algorithm>

namespace gt {

namespace {

constexpr int kMaxWordLength = 100;

bool splitsWords(QChar ch)
{
    const char16_t c = ch.unicode();
    // BERT treats every non-alphanumeric ASCII symbol as punctuation.
    if (c < 128) {
        return (c >= '!' && c <= '/') || (c >= ':' && c <= '@') || (c >= '[' && c <= '`')
            || (c >= '{' && c <= '~');
    }
    return ch.isPunct() || ch.isSymbol();
}

bool droppedFromInput(QChar ch)
{
    switch (ch.category()) {
    case QChar::Mark_NonSpacing:
    case QChar::Mark_SpacingCombining:
    case QChar::Mark_Enclosing:
        return true;
    case QChar::Other_Control:
        return !ch.isSpace();
    default:
        return ch.unicode() == 0 || ch.unicode() == 0xFFFD;
    }
}

} // namespace

std::unique_ptr<WordPieceTokenizer> WordPieceTokenizer::load(const QString& vocabPath,
                                                             int maxSequenceLength,
                                                             QString* errorOut)
{
    QFile file(vocabPath);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorOut) {
            *errorOut = QStringLiteral("cannot read vocab %1").arg(vocabPath);
        }
        return nullptr;
    }

    // A token's id is its line number.
    QHash<QString, int64_t> vocab;
    int64_t line = 0;
    while (!file.atEnd()) {
        const QString token = QString::fromUtf8(file.readLine()).trimmed();
        if (!token.isEmpty() && !vocab.contains(token)) {
            vocab.insert(token, line);
        }
        ++line;
    }
    if (vocab.isEmpty()) {
        if (errorOut) {
            *errorOut = QStringLiteral("vocab %1 is empty").arg(vocabPath);
        }
        return nullptr;
    }

    return std::unique_ptr<WordPieceTokenizer>(
        new WordPieceTokenizer(std::move(vocab), std::clamp(maxSequenceLength, 8, 512)));
}

WordPieceTokenizer::WordPieceTokenizer(QHash<QString, int64_t> vocab, int maxSequenceLength)
    : m_vocab(std::move(vocab))
    , m_maxSequenceLength(maxSequenceLength)
{
    m_pad = idOf(QStringLiteral("[PAD]"), 0);
    m_unknown = idOf(QStringLiteral("[UNK]"), 100);
    m_cls = idOf(QStringLiteral("[CLS]"), 101);
    m_sep = idOf(QStringLiteral("[SEP]"), 102);
}

int64_t WordPieceTokenizer::idOf(const QString& token, int64_t fallback) const
{
    return m_vocab.value(token, fallback);
}

QStringList WordPieceTokenizer::splitWords(const QString& text) const
{
    QStringList words;
    QString word;
    const auto flush = [&] {
        if (!word.isEmpty()) {
            words.append(word);
            word.clear();
        }
    };

    for (const QChar ch : text.toLower().normalized(QString::NormalizationForm_D)) {
        if (droppedFromInput(ch)) {
            continue;
        }
        if (ch.isSpace()) {
            flush();
        } else if (splitsWords(ch)) {
            flush();
            words.append(QString(ch));
        } else {
            word.append(ch);
        }
    }
    flush();
    return words;
}

void WordPieceTokenizer::appendPieces(const QString& word, std::vector<int64_t>& out,
                                      size_t limit) const
{
    if (word.size() > kMaxWordLength) {
        out.push_back(m_unknown);
        return;
    }

    std::vector<int64_t> pieces;
    qsizetype start = 0;
    while (start < word.size()) {
        const QString prefix = start == 0 ? QString() : QStringLiteral("##");
        qsizetype length = word.size() - start;
        auto found = m_vocab.constEnd();
        for (; length > 0; --length) {
            found = m_vocab.constFind(prefix + word.mid(start, length));
            if (found != m_vocab.constEnd()) {
                break;
            }
        }
        if (length == 0) {
            pieces.assign(1, m_unknown);
            break;
        }
        pieces.push_back(found.value());
        start += length;
    }

    for (const int64_t id : pieces) {
        if (out.size() >= limit) {
            return;
        }
        out.push_back(id);
    }
}

std::vector<int64_t> WordPieceTokenizer::encode(const QString& text) const
{
    const size_t limit = size_t(m_maxSequenceLength) - 1;
    std::vector<int64_t> ids{m_cls};
    for (const QString& word : splitWords(text)) {
        if (ids.size() >= limit) {
            break;
        }
        appendPieces(word, ids, limit);
    }
    ids.push_back(m_sep);
    return ids;
}

TokenBatch WordPieceTokenizer::encodeBatch(const std::vector<QString>& texts) const
{
    std::vector<std::vector<int64_t>> rows;
    rows.reserve(texts.size());
    size_t width = 0;
    for (const QString& text : texts) {
        rows.push_back(encode(text));
        width = std::max(width, rows.back().size());
    }

    TokenBatch batch;
    batch.rows = int(rows.size());
    batch.columns = int(width);
    batch.ids.assign(rows.size() * width, m_pad);
    batch.mask.assign(rows.size() * width, 0);
    batch.typeIds.assign(rows.size() * width, 0);
    for (size_t r = 0; r < rows.size(); ++r) {
        std::copy(rows[r].begin(), rows[r].end(), batch.ids.begin() + r * width);
        std::fill_n(batch.mask.begin() + r * width, rows[r].size(), 1);
    }
    return batch;
}

} // namespace gt
