#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <QDir>

#include "core/index/project_store.h"
#include "core/navigation/navigation_resolver.h"
#include "core/ranking/ranker.h"
#include "project_fixture.h"

#include <memory>
#include <optional>

using gt::test::FakeEmbeddingProvider;
using gt::test::makeGitProject;
using gt::test::makeProject;

class TestNavigationResolver : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // ── Single match ─────────────────────────────────────────────
    void testEmptyStoreIsNoMatch();
    void testExactNameResolvesAndRecordsAccess();
    void testUnmatchedQueryIsNoMatch();
    void testStalePathSkipped();
    void testAllStaleIsNoMatch();
    void testUnreadableStoreIsCorrupt();

    // ── All matches ──────────────────────────────────────────────
    void testAllModeCapsAndRecordsNothing();

    // ── Embeddings ───────────────────────────────────────────────
    void testSemanticMatchWithoutLexicalOverlap();
    void testProviderNotBuiltWithoutStoredEmbeddings();
    void testDisabledHandleIsNotDegraded();
    void testProviderFailureDegradesToLexical();
    void testQueryEmbeddingFailureDegrades();

    // ── Recent ───────────────────────────────────────────────────
    void testRecentListsAccessedLiveProjects();
    void testRecentWithNoHistoryIsNoMatch();

    // ── Output guard ─────────────────────────────────────────────
    void testEmittablePath();

private:
    QString addProject(const QString& name, const QString& description = QString(),
                       const std::vector<float>& embedding = {});

    std::unique_ptr<QTemporaryDir> m_dir;
    std::optional<gt::ProjectStore> m_store;
    gt::Ranker m_ranker;
};

void TestNavigationResolver::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_store = gt::ProjectStore::open(m_dir->path() + "/cache.db");
    QVERIFY(m_store.has_value());
}

void TestNavigationResolver::cleanup()
{
    m_store.reset();
    m_dir.reset();
}

QString TestNavigationResolver::addProject(const QString& name, const QString& description,
                                           const std::vector<float>& embedding)
{
    const QString path = makeGitProject(m_dir->path() + "/work", name);
    gt::Project project = makeProject(path, description);
    if (!embedding.empty()) {
        project.embedding = embedding;
        project.modelId = QStringLiteral("fake-buckets-v1");
    }
    if (!m_store->upsert(project)) {
        return QString();
    }
    return path;
}

// ── Single match ─────────────────────────────────────────────────

void TestNavigationResolver::testEmptyStoreIsNoMatch()
{
    auto handle = gt::test::fakeHandle();
    gt::NavigationResolver resolver(*m_store, m_ranker, *handle);

    const gt::NavigationOutcome outcome = resolver.resolve({"anything"});
    QCOMPARE(outcome.state, gt::ResolverState::NoMatch);
    QCOMPARE(outcome.error, gt::NavigationError::NoMatchFound);
    QVERIFY(outcome.diagnostic.contains("goto update"));
    QVERIFY(outcome.path.isEmpty());
}

void TestNavigationResolver::testExactNameResolvesAndRecordsAccess()
{
    const QString api = addProject("payments-api");
    addProject("payments-web");
    addProject("docs-site");

    auto handle = gt::test::disabledHandle();
    gt::NavigationResolver resolver(*m_store, m_ranker, *handle);

    const gt::NavigationOutcome outcome = resolver.resolve({"payments-api"});
    QVERIFY(outcome.ok());
    QCOMPARE(resolver.state(), gt::ResolverState::Resolved);
    QCOMPARE(outcome.path, api);
    QCOMPARE(outcome.matches.size(), size_t(1));
    QCOMPARE(outcome.matches.front().score.boost, m_ranker.weights().exactNameBoost);

    const auto stored = m_store->findByPath(api);
    QCOMPARE(stored->accessCount, 1);
    QVERIFY(stored->lastAccessed.has_value());
}

void TestNavigationResolver::testUnmatchedQueryIsNoMatch()
{
    addProject("payments-api");

    auto handle = gt::test::disabledHandle();
    gt::NavigationResolver resolver(*m_store, m_ranker, *handle);

    const gt::NavigationOutcome outcome = resolver.resolve({"zzzzqqq"});
    QCOMPARE(outcome.state, gt::ResolverState::NoMatch);
    QVERIFY(outcome.diagnostic.contains("zzzzqqq"));
}

void TestNavigationResolver::testStalePathSkipped()
{
    const QString gone = addProject("billing");
    const QString live = addProject("billing-legacy");
    QVERIFY(QDir(gone).removeRecursively());

    auto handle = gt::test::disabledHandle();
    gt::NavigationResolver resolver(*m_store, m_ranker, *handle);

    const gt::NavigationOutcome outcome = resolver.resolve({"billing"});
    QVERIFY(outcome.ok());
    QCOMPARE(outcome.path, live);
    // The stale row is left for the next index run to prune.
    QVERIFY(m_store->findByPath(gone).has_value());
}

void TestNavigationResolver::testAllStaleIsNoMatch()
{
    const QString gone = addProject("billing");
    QVERIFY(QDir(gone).removeRecursively());

    auto handle = gt::test::disabledHandle();
    gt::NavigationResolver resolver(*m_store, m_ranker, *handle);

    const gt::NavigationOutcome outcome = resolver.resolve({"billing"});
    QCOMPARE(outcome.state, gt::ResolverState::NoMatch);
    QVERIFY(outcome.path.isEmpty());
}

void TestNavigationResolver::testUnreadableStoreIsCorrupt()
{
    addProject("payments-api");
    QCOMPARE(sqlite3_exec(m_store->rawDb(), "DROP TABLE projects", nullptr, nullptr, nullptr),
             SQLITE_OK);

    auto handle = gt::test::disabledHandle();
    gt::NavigationResolver resolver(*m_store, m_ranker, *handle);

    const gt::NavigationOutcome outcome = resolver.resolve({"payments"});
    QCOMPARE(outcome.state, gt::ResolverState::Error);
    QCOMPARE(outcome.error, gt::NavigationError::StoreCorrupt);
}

// ── All matches ──────────────────────────────────────────────────

void TestNavigationResolver::testAllModeCapsAndRecordsNothing()
{
    addProject("api-gateway");
    addProject("api-server");
    addProject("api-client");

    auto handle = gt::test::disabledHandle();
    gt::NavigationResolver resolver(*m_store, m_ranker, *handle);

    gt::NavigationRequest request{"api"};
    request.all = true;
    request.limit = 2;
    const gt::NavigationOutcome outcome = resolver.resolve(request);
    QVERIFY(outcome.ok());
    QVERIFY(outcome.path.isEmpty());
    QCOMPARE(outcome.matches.size(), size_t(2));
    QVERIFY(outcome.matches[0].score.total >= outcome.matches[1].score.total);

    const auto listed = m_store->list(gt::SortOrder::Name);
    for (const gt::Project& project : *listed) {
        QCOMPARE(project.accessCount, 0);
    }
}

// ── Embeddings ───────────────────────────────────────────────────

void TestNavigationResolver::testSemanticMatchWithoutLexicalOverlap()
{
    FakeEmbeddingProvider buckets;
    const QString billing = addProject("ledger", "Stripe checkout",
                                       buckets.vectorFor("stripe checkout"));
    addProject("handbook", "Team guide", buckets.vectorFor("guide"));

    FakeEmbeddingProvider* fake = nullptr;
    auto handle = gt::test::fakeHandle(&fake);
    gt::NavigationResolver resolver(*m_store, m_ranker, *handle);

    const gt::NavigationOutcome outcome = resolver.resolve({"invoices"});
    QVERIFY(outcome.ok());
    QVERIFY(!outcome.degraded);
    QCOMPARE(outcome.path, billing);
    QVERIFY(outcome.matches.front().score.semanticScore > 0.0);
    QVERIFY(fake != nullptr);
    QCOMPARE(fake->queryCalls, 1);
}

void TestNavigationResolver::testProviderNotBuiltWithoutStoredEmbeddings()
{
    addProject("payments-api");

    FakeEmbeddingProvider* fake = nullptr;
    auto handle = gt::test::fakeHandle(&fake);
    gt::NavigationResolver resolver(*m_store, m_ranker, *handle);

    const gt::NavigationOutcome outcome = resolver.resolve({"payments"});
    QVERIFY(outcome.ok());
    QVERIFY(!outcome.degraded);
    QVERIFY(outcome.degradeReason.isEmpty());
    QVERIFY(fake == nullptr);
}

void TestNavigationResolver::testDisabledHandleIsNotDegraded()
{
    FakeEmbeddingProvider buckets;
    addProject("payments-api", "billing", buckets.vectorFor("billing"));

    auto handle = gt::test::disabledHandle();
    gt::NavigationResolver resolver(*m_store, m_ranker, *handle);

    const gt::NavigationOutcome outcome = resolver.resolve({"payments"});
    QVERIFY(outcome.ok());
    QVERIFY(!outcome.degraded);
}

void TestNavigationResolver::testProviderFailureDegradesToLexical()
{
    FakeEmbeddingProvider buckets;
    const QString api = addProject("payments-api", "billing", buckets.vectorFor("billing"));

    auto handle = gt::test::failingHandle("model files missing");
    gt::NavigationResolver resolver(*m_store, m_ranker, *handle);

    const gt::NavigationOutcome outcome = resolver.resolve({"payments"});
    QVERIFY(outcome.ok());
    QCOMPARE(outcome.path, api);
    QVERIFY(outcome.degraded);
    QCOMPARE(outcome.degradeReason, QStringLiteral("model files missing"));
    QCOMPARE(outcome.matches.front().score.semanticScore, 0.0);
}

void TestNavigationResolver::testQueryEmbeddingFailureDegrades()
{
    FakeEmbeddingProvider buckets;
    addProject("payments-api", "billing", buckets.vectorFor("billing"));

    FakeEmbeddingProvider* fake = nullptr;
    auto handle = gt::test::fakeHandle(&fake);
    QVERIFY(handle->get() != nullptr);
    fake->failQueries = true;

    gt::NavigationResolver resolver(*m_store, m_ranker, *handle);
    const gt::NavigationOutcome outcome = resolver.resolve({"payments"});
    QVERIFY(outcome.ok());
    QVERIFY(outcome.degraded);
    QCOMPARE(outcome.degradeReason, QStringLiteral("query embedding failed"));
}

// ── Recent ───────────────────────────────────────────────────────

void TestNavigationResolver::testRecentListsAccessedLiveProjects()
{
    const QString older = addProject("older");
    const QString newer = addProject("newer");
    const QString gone = addProject("gone");
    addProject("untouched");
    QVERIFY(m_store->recordAccess(older, 100.0));
    QVERIFY(m_store->recordAccess(newer, 200.0));
    QVERIFY(m_store->recordAccess(gone, 300.0));
    QVERIFY(QDir(gone).removeRecursively());

    auto handle = gt::test::disabledHandle();
    gt::NavigationResolver resolver(*m_store, m_ranker, *handle);

    gt::NavigationRequest request;
    request.recent = true;
    const gt::NavigationOutcome outcome = resolver.resolve(request);
    QVERIFY(outcome.ok());
    QCOMPARE(outcome.recent.size(), size_t(2));
    QCOMPARE(outcome.recent[0].path, newer);
    QCOMPARE(outcome.recent[1].path, older);

    request.limit = 1;
    QCOMPARE(resolver.resolve(request).recent.size(), size_t(1));
}

void TestNavigationResolver::testRecentWithNoHistoryIsNoMatch()
{
    addProject("untouched");

    auto handle = gt::test::disabledHandle();
    gt::NavigationResolver resolver(*m_store, m_ranker, *handle);

    gt::NavigationRequest request;
    request.recent = true;
    const gt::NavigationOutcome outcome = resolver.resolve(request);
    QCOMPARE(outcome.state, gt::ResolverState::NoMatch);
}

// ── Output guard ─────────────────────────────────────────────────

void TestNavigationResolver::testEmittablePath()
{
    QVERIFY(gt::NavigationResolver::isEmittablePath(m_dir->path()));
    QVERIFY(!gt::NavigationResolver::isEmittablePath(QString()));
    QVERIFY(!gt::NavigationResolver::isEmittablePath("relative/dir"));
    QVERIFY(!gt::NavigationResolver::isEmittablePath(m_dir->path() + "/missing"));
    QVERIFY(!gt::NavigationResolver::isEmittablePath(m_dir->path() + "/cache.db"));

    const QString newline = m_dir->path() + "/two\nlines";
    QVERIFY(QDir().mkpath(newline));
    QVERIFY(!gt::NavigationResolver::isEmittablePath(newline));
}

QTEST_MAIN(TestNavigationResolver)
#include "test_navigation_resolver.moc"
