#include <QtTest/QtTest>
#include <QTemporaryDir>

#include "cli_harness.h"
#include "core/index/project_store.h"
#include "core/navigation/navigation_resolver.h"
#include "core/ranking/ranker.h"
#include "project_fixture.h"

#include <memory>

using gt::test::CliHarness;
using gt::test::CliResult;
using gt::test::FakeEmbeddingProvider;
using gt::test::makeGitProject;
using gt::test::makeProject;

namespace {

// Topic buckets with a systems bucket so "cache rust" has a semantic home.
std::unique_ptr<gt::EmbeddingHandle> bucketHandle()
{
    return std::make_unique<gt::EmbeddingHandle>(
        [](QString*) -> std::unique_ptr<gt::EmbeddingProvider> {
            return std::make_unique<FakeEmbeddingProvider>(std::vector<FakeEmbeddingProvider::Bucket>{
                {"payment", "billing", "invoice"},
                {"documentation", "docs", "guide"},
                {"rust", "cache", "cargo"},
            });
        });
}

std::vector<float> bucketVector(const QString& text)
{
    const FakeEmbeddingProvider provider(std::vector<FakeEmbeddingProvider::Bucket>{
        {"payment", "billing", "invoice"},
        {"documentation", "docs", "guide"},
        {"rust", "cache", "cargo"},
    });
    return provider.vectorFor(text);
}

} // anonymous namespace

class TestNavigationScenarios : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void cleanup();

    void testDocsFindsDocumentation();
    void testSemanticOnlyMatch();
    void testTieBrokenByRecency();
    void testRecentOnEmptyStore();
    void testAllMatchesDescending();
    void testProviderUnavailableDegrades();

private:
    QString seed(const QString& relativePath, const QString& description = QString(),
                 bool embed = false);
    QString dbPath() const { return m_dir->path() + "/data/cache.db"; }

    std::unique_ptr<QTemporaryDir> m_dir;
};

void TestNavigationScenarios::initTestCase()
{
    QVERIFY(qputenv("GOTO_CONFIG_DIR", QByteArray("/nonexistent/goto-config")));
}

void TestNavigationScenarios::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    QVERIFY(QDir().mkpath(m_dir->path() + "/data"));
}

void TestNavigationScenarios::cleanup()
{
    m_dir.reset();
}

QString TestNavigationScenarios::seed(const QString& relativePath, const QString& description,
                                      bool embed)
{
    const QString path = makeGitProject(m_dir->path() + "/code", relativePath);
    gt::Project project = makeProject(path, description);
    if (embed) {
        project.embedding = bucketVector(project.descriptionText);
        project.modelId = QStringLiteral("fake-buckets-v1");
    }
    auto store = gt::ProjectStore::open(dbPath());
    if (!store || !store->upsert(project)) {
        return QString();
    }
    return path;
}

void TestNavigationScenarios::testDocsFindsDocumentation()
{
    const QString docs = seed("documentation");
    seed("payments-api");
    seed("website");

    CliHarness cli(m_dir->path(), dbPath(), gt::test::disabledHandle());
    const CliResult result = cli.run({"docs"});
    QCOMPARE(result.exitCode, int(gt::kExitOk));
    QCOMPARE(result.primary, (docs + "\n").toUtf8());
    QVERIFY(result.secondary.contains("__GOTO_POST_CMD__:claude"));
}

void TestNavigationScenarios::testSemanticOnlyMatch()
{
    const QString foyer = seed("foyer", "foyer | Hybrid cache in Rust | Technologies: Rust", true);
    seed("payments-api", "payments-api | Stripe billing", true);
    seed("handbook", "handbook | Team guide", true);

    CliHarness cli(m_dir->path(), dbPath(), bucketHandle());
    const CliResult result = cli.run({"cache", "rust"});
    QCOMPARE(result.exitCode, int(gt::kExitOk));
    QCOMPARE(result.primary, (foyer + "\n").toUtf8());
    QVERIFY(!result.secondary.contains("semantic matching unavailable"));
}

void TestNavigationScenarios::testTieBrokenByRecency()
{
    const QString older = seed("a/api-core");
    const QString newer = seed("z/api-core");
    {
        auto store = gt::ProjectStore::open(dbPath());
        QVERIFY(store.has_value());
        const double now = gt::currentEpochSeconds();
        QVERIFY(store->recordAccess(older, now - 30 * 86400.0));
        QVERIFY(store->recordAccess(newer, now - 3600.0));
    }

    CliHarness cli(m_dir->path(), dbPath(), gt::test::disabledHandle());
    const CliResult result = cli.run({"api-core"});
    QCOMPARE(result.exitCode, int(gt::kExitOk));
    QCOMPARE(result.primary, (newer + "\n").toUtf8());
}

void TestNavigationScenarios::testRecentOnEmptyStore()
{
    CliHarness cli(m_dir->path(), dbPath(), gt::test::disabledHandle());
    const CliResult result = cli.run({"find", "-"});
    QCOMPARE(result.exitCode, int(gt::kExitNoMatch));
    QVERIFY(result.primary.isEmpty());
    QVERIFY(!result.secondary.isEmpty());
}

void TestNavigationScenarios::testAllMatchesDescending()
{
    seed("api");
    seed("api-server");
    seed("rapid-importer");
    seed("website");

    {
        auto store = gt::ProjectStore::open(dbPath());
        QVERIFY(store.has_value());
        const gt::Ranker ranker;
        auto handle = gt::test::disabledHandle();
        gt::NavigationResolver resolver(*store, ranker, *handle);

        gt::NavigationRequest request{"api"};
        request.all = true;
        const gt::NavigationOutcome outcome = resolver.resolve(request);
        QVERIFY(outcome.ok());
        QCOMPARE(outcome.matches.size(), size_t(3));
        for (size_t i = 1; i < outcome.matches.size(); ++i) {
            QVERIFY(outcome.matches[i - 1].score.total > outcome.matches[i].score.total);
        }
    }

    CliHarness cli(m_dir->path(), dbPath(), gt::test::disabledHandle());
    const CliResult result = cli.run({"find", "api", "--all"});
    QCOMPARE(result.exitCode, int(gt::kExitOk));
    QVERIFY(result.primary.isEmpty());
    QVERIFY(result.secondary.contains("api-server"));
    QVERIFY(result.secondary.contains("rapid-importer"));
    QVERIFY(!result.secondary.contains("website"));
}

void TestNavigationScenarios::testProviderUnavailableDegrades()
{
    const QString api = seed("payments-api", "payments-api | Stripe billing", true);
    seed("handbook", "handbook | Team guide", true);

    CliHarness cli(m_dir->path(), dbPath(), gt::test::failingHandle("model download timed out"));
    const CliResult result = cli.run({"payments"});
    QCOMPARE(result.exitCode, int(gt::kExitOk));
    QCOMPARE(result.primary, (api + "\n").toUtf8());
    QVERIFY(result.secondary.contains("semantic matching unavailable"));
    QVERIFY(result.secondary.contains("model download timed out"));
}

QTEST_MAIN(TestNavigationScenarios)
#include "test_navigation_scenarios.moc"
