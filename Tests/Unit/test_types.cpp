#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <QDir>
#include <QFile>
#include "core/shared/types.h"

#include <cmath>

class TestTypes : public QObject {
    Q_OBJECT

private slots:
    // ── Frecency ─────────────────────────────────────────────────
    void testFrecencyNeverAccessedIsZero();
    void testFrecencyJustAccessed();
    void testFrecencyHalvesEveryThreeDays();
    void testFrecencyGrowsWithCount();

    // ── Paths ────────────────────────────────────────────────────
    void testCanonicalStripsTrailingSlash();
    void testCanonicalResolvesSymlinks();
    void testCanonicalExpandsTilde();
    void testCanonicalKeepsMissingPathsAbsolute();
    void testIsPathUnder();
    void testProjectNameForPath();

    // ── Enums ────────────────────────────────────────────────────
    void testSortOrderParsing();
    void testProjectSourceStrings();
};

void TestTypes::testFrecencyNeverAccessedIsZero()
{
    gt::Project project;
    QCOMPARE(gt::frecencyScore(project, 1000.0), 0.0);
    project.accessCount = 3;
    QCOMPARE(gt::frecencyScore(project, 1000.0), 0.0);
}

void TestTypes::testFrecencyJustAccessed()
{
    gt::Project project;
    project.accessCount = 1;
    project.lastAccessed = 5000.0;
    QVERIFY(std::abs(gt::frecencyScore(project, 5000.0) - std::log(2.0) * 100.0) < 1e-9);
}

void TestTypes::testFrecencyHalvesEveryThreeDays()
{
    gt::Project project;
    project.accessCount = 4;
    project.lastAccessed = 0.0;
    const double fresh = gt::frecencyScore(project, 0.0);
    const double aged = gt::frecencyScore(project, 72.0 * 3600.0);
    QVERIFY(std::abs(aged - fresh / 2.0) < 1e-9);
}

void TestTypes::testFrecencyGrowsWithCount()
{
    gt::Project rare;
    rare.accessCount = 1;
    rare.lastAccessed = 0.0;
    gt::Project frequent = rare;
    frequent.accessCount = 20;
    QVERIFY(gt::frecencyScore(frequent, 3600.0) > gt::frecencyScore(rare, 3600.0));
}

void TestTypes::testCanonicalStripsTrailingSlash()
{
    QTemporaryDir dir;
    const QString canonical = gt::canonicalProjectPath(dir.path() + "//");
    QVERIFY(!canonical.endsWith('/'));
    QCOMPARE(canonical, QFileInfo(dir.path()).canonicalFilePath());
    QCOMPARE(gt::canonicalProjectPath("/"), QStringLiteral("/"));
    QVERIFY(gt::canonicalProjectPath(QString()).isEmpty());
}

void TestTypes::testCanonicalResolvesSymlinks()
{
    QTemporaryDir dir;
    QDir().mkpath(dir.path() + "/real");
    QVERIFY(QFile::link(dir.path() + "/real", dir.path() + "/alias"));
    QCOMPARE(gt::canonicalProjectPath(dir.path() + "/alias"),
             gt::canonicalProjectPath(dir.path() + "/real"));
}

void TestTypes::testCanonicalExpandsTilde()
{
    QCOMPARE(gt::canonicalProjectPath("~"), gt::canonicalProjectPath(QDir::homePath()));
}

void TestTypes::testCanonicalKeepsMissingPathsAbsolute()
{
    QCOMPARE(gt::canonicalProjectPath("/nonexistent/a/../b/"), QStringLiteral("/nonexistent/b"));
}

void TestTypes::testIsPathUnder()
{
    QVERIFY(gt::isPathUnder("/code/api", "/code"));
    QVERIFY(gt::isPathUnder("/code", "/code"));
    QVERIFY(!gt::isPathUnder("/code-old/api", "/code"));
    QVERIFY(gt::isPathUnder("/code/api", "/"));
    QVERIFY(!gt::isPathUnder("/code", QString()));
}

void TestTypes::testProjectNameForPath()
{
    QCOMPARE(gt::projectNameForPath("/home/me/work/payments-api"), QStringLiteral("payments-api"));
}

void TestTypes::testSortOrderParsing()
{
    QCOMPARE(gt::sortOrderFromString("Name").value(), gt::SortOrder::Name);
    QCOMPARE(gt::sortOrderFromString("r").value(), gt::SortOrder::Recent);
    QCOMPARE(gt::sortOrderFromString("frecency").value(), gt::SortOrder::Frecency);
    QVERIFY(!gt::sortOrderFromString("size").has_value());
    QCOMPARE(gt::sortOrderToString(gt::SortOrder::Recent), QStringLiteral("recent"));
}

void TestTypes::testProjectSourceStrings()
{
    QCOMPARE(gt::projectSourceFromString("discovery"), gt::ProjectSource::Discovery);
    QCOMPARE(gt::projectSourceFromString("manual"), gt::ProjectSource::Scan);
    QCOMPARE(gt::projectSourceFromString("bogus"), gt::ProjectSource::Scan);
    QCOMPARE(gt::projectSourceToString(gt::ProjectSource::Discovery), QStringLiteral("discovery"));
}

QTEST_MAIN(TestTypes)
#include "test_types.moc"
