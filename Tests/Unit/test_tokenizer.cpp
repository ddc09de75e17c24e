#include <QtTest/QtTest>
#include <QTemporaryDir>
#include "core/embedding/tokenizer.h"
#include "project_fixture.h"

class TestTokenizer : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();

    // ── Loading ──
    void testLoadsVocab();
    void testMissingVocabFails();
    void testEmptyVocabFails();
    void testSequenceLengthClamped();

    // ── Encoding ──
    void testSplitWordsOnPunctuationAndAccents();
    void testWrapsWithClsAndSep();
    void testWordPieceDecomposition();
    void testUndecomposableWordIsUnknown();
    void testTruncationKeepsSep();
    void testEmptyTextIsClsSep();

    // ── Batches ──
    void testBatchPadsToLongestRow();

private:
    std::unique_ptr<gt::WordPieceTokenizer> load(int maxSequenceLength = 512);

    QTemporaryDir m_dir;
    QString m_vocabPath;
};

// Ids are line numbers: [PAD]=0 [UNK]=1 [CLS]=2 [SEP]=3 pay=4 ##ments=5 api=6 -=7 cafe=8 docs=9
void TestTokenizer::initTestCase()
{
    QVERIFY(m_dir.isValid());
    m_vocabPath = m_dir.path() + "/vocab.txt";
    QVERIFY(gt::test::writeFile(m_vocabPath,
                                "[PAD]\n[UNK]\n[CLS]\n[SEP]\n"
                                "pay\n##ments\napi\n-\ncafe\ndocs\n"));
}

std::unique_ptr<gt::WordPieceTokenizer> TestTokenizer::load(int maxSequenceLength)
{
    QString error;
    auto tokenizer = gt::WordPieceTokenizer::load(m_vocabPath, maxSequenceLength, &error);
    if (!tokenizer) {
        qWarning("vocab load failed: %s", qPrintable(error));
    }
    return tokenizer;
}

// ── Loading ──

void TestTokenizer::testLoadsVocab()
{
    const auto tokenizer = load();
    QVERIFY(tokenizer);
    QCOMPARE(tokenizer->vocabSize(), 10);
    QCOMPARE(tokenizer->maxSequenceLength(), 512);
}

void TestTokenizer::testMissingVocabFails()
{
    QString error;
    QVERIFY(!gt::WordPieceTokenizer::load("/nonexistent/vocab.txt", 512, &error));
    QVERIFY(error.contains("/nonexistent/vocab.txt"));
}

void TestTokenizer::testEmptyVocabFails()
{
    const QString path = m_dir.path() + "/empty.txt";
    QVERIFY(gt::test::writeFile(path, "\n\n"));
    QString error;
    QVERIFY(!gt::WordPieceTokenizer::load(path, 512, &error));
    QVERIFY(error.contains("empty"));
}

void TestTokenizer::testSequenceLengthClamped()
{
    QCOMPARE(load(2)->maxSequenceLength(), 8);
    QCOMPARE(load(4096)->maxSequenceLength(), 512);
}

// ── Encoding ──

void TestTokenizer::testSplitWordsOnPunctuationAndAccents()
{
    QCOMPARE(load()->splitWords(QStringLiteral("Payments-API  Café!")),
             (QStringList{"payments", "-", "api", "cafe", "!"}));
}

void TestTokenizer::testWrapsWithClsAndSep()
{
    QCOMPARE(load()->encode("docs"), (std::vector<int64_t>{2, 9, 3}));
}

void TestTokenizer::testWordPieceDecomposition()
{
    QCOMPARE(load()->encode("payments-api"), (std::vector<int64_t>{2, 4, 5, 7, 6, 3}));
}

void TestTokenizer::testUndecomposableWordIsUnknown()
{
    QCOMPARE(load()->encode("payroll docs"), (std::vector<int64_t>{2, 1, 9, 3}));
}

void TestTokenizer::testTruncationKeepsSep()
{
    QString text;
    for (int i = 0; i < 20; ++i) {
        text += QStringLiteral("docs ");
    }
    const std::vector<int64_t> ids = load(8)->encode(text);
    QCOMPARE(ids.size(), size_t(8));
    QCOMPARE(ids.front(), int64_t(2));
    QCOMPARE(ids[6], int64_t(9));
    QCOMPARE(ids.back(), int64_t(3));
}

void TestTokenizer::testEmptyTextIsClsSep()
{
    QCOMPARE(load()->encode(QString()), (std::vector<int64_t>{2, 3}));
}

// ── Batches ──

void TestTokenizer::testBatchPadsToLongestRow()
{
    const gt::TokenBatch batch = load()->encodeBatch({"docs", "payments api"});
    QCOMPARE(batch.rows, 2);
    QCOMPARE(batch.columns, 5);
    QCOMPARE(batch.ids, (std::vector<int64_t>{2, 9, 3, 0, 0, 2, 4, 5, 6, 3}));
    QCOMPARE(batch.mask, (std::vector<int64_t>{1, 1, 1, 0, 0, 1, 1, 1, 1, 1}));
    QCOMPARE(batch.typeIds, std::vector<int64_t>(10, 0));
    QVERIFY(batch.attends(0, 2));
    QVERIFY(!batch.attends(0, 3));
}

QTEST_MAIN(TestTokenizer)
#include "test_tokenizer.moc"
