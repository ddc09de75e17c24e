#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <QDir>
#include "core/fs/path_registry.h"

class TestPathRegistry : public QObject {
    Q_OBJECT

private slots:
    void testRootsResolvedFromSettings();
    void testDuplicateRootsCollapsed();
    void testOwningRootLongestMatch();
    void testOwningRootRejectsSiblingPrefix();
    void testDiscoveryRootsOnlyWhenEnabled();
    void testAddRootCanonicalizes();
    void testAddRootRejectsMissingDirectory();
    void testAddRootIsIdempotent();
    void testRemoveRoot();
    void testRemoveMissingRootByLiteralPath();
    void testRemoveUnknownRoot();
};

void TestPathRegistry::testRootsResolvedFromSettings()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    gt::Settings settings;
    settings.maxDepth = 4;
    gt::ScanPath withDepth;
    withDepth.path = dir.path() + "/";
    withDepth.maxDepth = 2;
    withDepth.excludePatterns = {"archive"};
    settings.scanPaths.push_back(withDepth);

    gt::PathRegistry registry(settings);
    QCOMPARE(static_cast<int>(registry.roots().size()), 1);
    const gt::ResolvedRoot& root = registry.roots().front();
    QCOMPARE(root.path, gt::canonicalProjectPath(dir.path()));
    QCOMPARE(root.maxDepth, 2);
    QCOMPARE(root.excludePatterns, QStringList{"archive"});

    settings.scanPaths.front().maxDepth = 0;
    gt::PathRegistry defaulted(settings);
    QCOMPARE(defaulted.roots().front().maxDepth, 4);
}

void TestPathRegistry::testDuplicateRootsCollapsed()
{
    QTemporaryDir dir;
    gt::Settings settings;
    settings.scanPaths.push_back({dir.path(), true, 0, {}});
    settings.scanPaths.push_back({dir.path() + "/", true, 0, {}});

    gt::PathRegistry registry(settings);
    QCOMPARE(static_cast<int>(registry.roots().size()), 1);
}

void TestPathRegistry::testOwningRootLongestMatch()
{
    QTemporaryDir dir;
    QDir().mkpath(dir.path() + "/work/clients");
    const QString outer = gt::canonicalProjectPath(dir.path() + "/work");
    const QString inner = gt::canonicalProjectPath(dir.path() + "/work/clients");

    gt::Settings settings;
    settings.scanPaths.push_back({outer, true, 0, {}});
    settings.scanPaths.push_back({inner, true, 0, {}});
    gt::PathRegistry registry(settings);

    QCOMPARE(registry.owningRoot(inner + "/acme"), inner);
    QCOMPARE(registry.owningRoot(outer + "/api"), outer);
    QVERIFY(registry.covers(outer));
    QVERIFY(!registry.covers("/somewhere/else"));
}

void TestPathRegistry::testOwningRootRejectsSiblingPrefix()
{
    QTemporaryDir dir;
    QDir().mkpath(dir.path() + "/work");
    const QString work = gt::canonicalProjectPath(dir.path() + "/work");

    gt::Settings settings;
    settings.scanPaths.push_back({work, true, 0, {}});
    gt::PathRegistry registry(settings);

    QVERIFY(!registry.covers(work + "-archive/api"));
}

void TestPathRegistry::testDiscoveryRootsOnlyWhenEnabled()
{
    QTemporaryDir dir;
    gt::Settings settings;
    settings.discoveryPaths = {dir.path()};

    gt::PathRegistry off(settings);
    QVERIFY(off.discoveryRoots().isEmpty());

    settings.discoveryAssist = true;
    gt::PathRegistry on(settings);
    QCOMPARE(on.discoveryRoots(), QStringList{gt::canonicalProjectPath(dir.path())});
    QVERIFY(on.covers(gt::canonicalProjectPath(dir.path()) + "/found"));
}

void TestPathRegistry::testAddRootCanonicalizes()
{
    QTemporaryDir dir;
    QDir().mkpath(dir.path() + "/code");

    gt::Settings settings;
    QString canonical;
    QVERIFY(gt::PathRegistry::addRoot(settings, dir.path() + "/code/../code/", &canonical));
    QCOMPARE(canonical, gt::canonicalProjectPath(dir.path() + "/code"));
    QCOMPARE(static_cast<int>(settings.scanPaths.size()), 1);
    QCOMPARE(settings.scanPaths.front().path, canonical);
}

void TestPathRegistry::testAddRootRejectsMissingDirectory()
{
    gt::Settings settings;
    QString error;
    QVERIFY(!gt::PathRegistry::addRoot(settings, "/nonexistent/goto-root", nullptr, &error));
    QVERIFY(!error.isEmpty());
    QVERIFY(settings.scanPaths.empty());
}

void TestPathRegistry::testAddRootIsIdempotent()
{
    QTemporaryDir dir;
    gt::Settings settings;
    QVERIFY(gt::PathRegistry::addRoot(settings, dir.path()));
    QVERIFY(gt::PathRegistry::addRoot(settings, dir.path() + "/"));
    QCOMPARE(static_cast<int>(settings.scanPaths.size()), 1);
}

void TestPathRegistry::testRemoveRoot()
{
    QTemporaryDir dir;
    gt::Settings settings;
    QVERIFY(gt::PathRegistry::addRoot(settings, dir.path()));
    QVERIFY(gt::PathRegistry::removeRoot(settings, dir.path() + "/"));
    QVERIFY(settings.scanPaths.empty());
}

void TestPathRegistry::testRemoveMissingRootByLiteralPath()
{
    gt::Settings settings;
    settings.scanPaths.push_back({"/nonexistent/old-root", true, 0, {}});
    QVERIFY(gt::PathRegistry::removeRoot(settings, "/nonexistent/old-root"));
    QVERIFY(settings.scanPaths.empty());
}

void TestPathRegistry::testRemoveUnknownRoot()
{
    gt::Settings settings;
    settings.scanPaths.push_back({"/nonexistent/a", true, 0, {}});
    QVERIFY(!gt::PathRegistry::removeRoot(settings, "/nonexistent/b"));
    QCOMPARE(static_cast<int>(settings.scanPaths.size()), 1);
}

QTEST_MAIN(TestPathRegistry)
#include "test_path_registry.moc"
