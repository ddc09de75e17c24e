#include <QtTest/QtTest>
#include "core/ranking/fuzzy_matcher.h"

class TestFuzzyMatcher : public QObject {
    Q_OBJECT

private slots:
    // ── Raw scoring ──────────────────────────────────────────────
    void testNotASubsequence();
    void testExactPrefixScoresFull();
    void testConsecutiveBeatsScattered();
    void testWordBoundaryBonus();
    void testCamelCaseBoundary();
    void testCaseInsensitive();
    void testScoreClampedToHundred();

    // ── match() fallbacks ────────────────────────────────────────
    void testMultiTermAveraged();
    void testAllTermsMustMatch();
    void testSingularFallback();
    void testPathFallbackScaled();
    void testNoMatchAnywhere();

    // ── Helpers ──────────────────────────────────────────────────
    void testTerms();
    void testSingular();
    void testContainsTerm();
    void testNormalizeSeparators();
};

void TestFuzzyMatcher::testNotASubsequence()
{
    QVERIFY(!gt::FuzzyMatcher::rawScore("xyz", "payments").has_value());
    QVERIFY(!gt::FuzzyMatcher::rawScore("", "payments").has_value());
    QVERIFY(!gt::FuzzyMatcher::rawScore("paymentsapi", "payments").has_value());
}

void TestFuzzyMatcher::testExactPrefixScoresFull()
{
    // 'd' at a boundary (3), then two consecutive chars (2.5 each).
    QCOMPARE(gt::FuzzyMatcher::rawScore("doc", "documentation").value(), 8.0);
    QCOMPARE(gt::FuzzyMatcher::score("doc", "documentation").value(), 100.0);
}

void TestFuzzyMatcher::testConsecutiveBeatsScattered()
{
    const double tight = gt::FuzzyMatcher::score("api", "payments-api").value();
    const double loose = gt::FuzzyMatcher::score("api", "a-p-i").value();
    const double scattered = gt::FuzzyMatcher::score("api", "amplify").value();
    QVERIFY(tight > scattered);
    QVERIFY(loose > scattered);
}

void TestFuzzyMatcher::testWordBoundaryBonus()
{
    const double boundary = gt::FuzzyMatcher::rawScore("a", "x-a").value();
    const double inner = gt::FuzzyMatcher::rawScore("a", "xya").value();
    QVERIFY(boundary > inner);
}

void TestFuzzyMatcher::testCamelCaseBoundary()
{
    const double hump = gt::FuzzyMatcher::rawScore("s", "goSomething").value();
    const double plain = gt::FuzzyMatcher::rawScore("s", "gosomething").value();
    QCOMPARE(hump - plain, 2.0);
}

void TestFuzzyMatcher::testCaseInsensitive()
{
    QCOMPARE(gt::FuzzyMatcher::score("API", "payments-api").value(),
             gt::FuzzyMatcher::score("api", "Payments-API").value());
}

void TestFuzzyMatcher::testScoreClampedToHundred()
{
    const double s = gt::FuzzyMatcher::score("payments", "payments").value();
    QCOMPARE(s, 100.0);
    QVERIFY(gt::FuzzyMatcher::score("ps", "payments").value() <= 100.0);
    QVERIFY(gt::FuzzyMatcher::score("ps", "payments").value() >= 0.0);
}

void TestFuzzyMatcher::testMultiTermAveraged()
{
    const auto m = gt::FuzzyMatcher::match("pay api", "payments-api", "/w/payments-api", 0.5);
    QVERIFY(m.has_value());
    const double pay = gt::FuzzyMatcher::score("pay", "payments-api").value();
    const double api = gt::FuzzyMatcher::score("api", "payments-api").value();
    QCOMPARE(m->score, (pay + api) / 2.0);
    QVERIFY(!m->fromPath);
}

void TestFuzzyMatcher::testAllTermsMustMatch()
{
    const auto m = gt::FuzzyMatcher::match("pay xyz", "payments-api", "/w/payments-api", 0.5);
    QVERIFY(!m.has_value());
}

void TestFuzzyMatcher::testSingularFallback()
{
    const auto m = gt::FuzzyMatcher::match("docs", "documentation", "/w/documentation", 0.5);
    QVERIFY(m.has_value());
    QVERIFY(m->usedSingular);
    QVERIFY(!m->fromPath);
    QCOMPARE(m->score, 100.0);
}

void TestFuzzyMatcher::testPathFallbackScaled()
{
    const auto m = gt::FuzzyMatcher::match("acme", "web", "/clients/acme/web", 0.5);
    QVERIFY(m.has_value());
    QVERIFY(m->fromPath);
    const double full = gt::FuzzyMatcher::score("acme", "/clients/acme/web").value();
    QCOMPARE(m->score, full * 0.5);
    QVERIFY(m->score <= 50.0);
}

void TestFuzzyMatcher::testNoMatchAnywhere()
{
    QVERIFY(!gt::FuzzyMatcher::match("qqq", "web", "/clients/acme/web", 0.5).has_value());
    QVERIFY(!gt::FuzzyMatcher::match("   ", "web", "/web", 0.5).has_value());
}

void TestFuzzyMatcher::testTerms()
{
    QCOMPARE(gt::FuzzyMatcher::terms("  Payment   Processing "),
             (QStringList{"payment", "processing"}));
    QVERIFY(gt::FuzzyMatcher::terms("").isEmpty());
}

void TestFuzzyMatcher::testSingular()
{
    QCOMPARE(gt::FuzzyMatcher::singular("docs"), QStringLiteral("doc"));
    QCOMPARE(gt::FuzzyMatcher::singular("services"), QStringLiteral("servic"));
    QCOMPARE(gt::FuzzyMatcher::singular("apis"), QStringLiteral("api"));
    QCOMPARE(gt::FuzzyMatcher::singular("ops"), QStringLiteral("ops"));
    QCOMPARE(gt::FuzzyMatcher::singular("web"), QStringLiteral("web"));
}

void TestFuzzyMatcher::testContainsTerm()
{
    QVERIFY(gt::FuzzyMatcher::containsTerm("payments-api", "payment"));
    QVERIFY(gt::FuzzyMatcher::containsTerm("payment gateway", "payments"));
    QVERIFY(!gt::FuzzyMatcher::containsTerm("billing", "payments"));
    QVERIFY(!gt::FuzzyMatcher::containsTerm("billing", ""));
    QVERIFY(gt::FuzzyMatcher::containsAllTerms("react dashboard", {"react", "dashboards"}));
    QVERIFY(!gt::FuzzyMatcher::containsAllTerms("react dashboard", {}));
}

void TestFuzzyMatcher::testNormalizeSeparators()
{
    QCOMPARE(gt::FuzzyMatcher::normalizeSeparators("Payments_API--v2"), QStringLiteral("payments api v2"));
    QCOMPARE(gt::FuzzyMatcher::normalizeSeparators("  my  app "), QStringLiteral("my app"));
}

QTEST_MAIN(TestFuzzyMatcher)
#include "test_fuzzy_matcher.moc"
