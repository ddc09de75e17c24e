#include <QtTest/QtTest>
#include "command_line.h"

namespace {

std::optional<gt::CommandLine> parse(const QStringList& args, QString* error = nullptr)
{
    return gt::parseCommandLine(QStringList{QStringLiteral("goto")} + args, error);
}

} // anonymous namespace

class TestCommandLine : public QObject {
    Q_OBJECT

private slots:
    // ── Queries ──────────────────────────────────────────────────
    void testNoArgumentsShowsHelp();
    void testBareQuery();
    void testMultiWordQueryJoined();
    void testFindSubcommand();
    void testDashIsRecent();
    void testFindDashIsRecent();
    void testFindWithoutQueryFails();
    void testDashDashKeepsQueryLiteral();

    // ── Options ──────────────────────────────────────────────────
    void testAllAndLimit();
    void testLimitMustBePositive();
    void testSortOrder();
    void testUnknownSortFails();
    void testFlags();
    void testUnknownOptionFails();
    void testHelpAndVersion();

    // ── Subcommands ──────────────────────────────────────────────
    void testScanIsUpdate();
    void testAddRequiresOnePath();
    void testTestTakesOptionalFile();
    void testUnexpectedArgumentFails();
};

void TestCommandLine::testNoArgumentsShowsHelp()
{
    const auto line = parse({});
    QVERIFY(line.has_value());
    QCOMPARE(line->command, gt::Command::Help);
    QVERIFY(line->helpText.contains("find <query>"));
}

void TestCommandLine::testBareQuery()
{
    const auto line = parse({"payments"});
    QCOMPARE(line->command, gt::Command::Find);
    QCOMPARE(line->query, QStringLiteral("payments"));
    QVERIFY(!line->all);
    QVERIFY(!line->limit.has_value());
}

void TestCommandLine::testMultiWordQueryJoined()
{
    const auto line = parse({"react", "dashboard"});
    QCOMPARE(line->command, gt::Command::Find);
    QCOMPARE(line->query, QStringLiteral("react dashboard"));
}

void TestCommandLine::testFindSubcommand()
{
    const auto line = parse({"find", "billing", "service"});
    QCOMPARE(line->command, gt::Command::Find);
    QCOMPARE(line->query, QStringLiteral("billing service"));
}

void TestCommandLine::testDashIsRecent()
{
    const auto line = parse({"-"});
    QVERIFY(line.has_value());
    QCOMPARE(line->command, gt::Command::Recent);
}

void TestCommandLine::testFindDashIsRecent()
{
    const auto line = parse({"find", "-"});
    QCOMPARE(line->command, gt::Command::Recent);
}

void TestCommandLine::testFindWithoutQueryFails()
{
    QString error;
    QVERIFY(!parse({"find"}, &error).has_value());
    QVERIFY(error.contains("query"));
}

void TestCommandLine::testDashDashKeepsQueryLiteral()
{
    // Everything after "--" is query text.
    const auto line = parse({"--", "--debug"});
    QCOMPARE(line->command, gt::Command::Find);
    QCOMPARE(line->query, QStringLiteral("--debug"));
    QVERIFY(!line->debug);
}

void TestCommandLine::testAllAndLimit()
{
    const auto line = parse({"api", "--all", "-n", "3"});
    QCOMPARE(line->command, gt::Command::Find);
    QVERIFY(line->all);
    QCOMPARE(line->limit.value_or(0), 3);
}

void TestCommandLine::testLimitMustBePositive()
{
    QString error;
    QVERIFY(!parse({"api", "--limit", "0"}, &error).has_value());
    QVERIFY(error.contains("--limit"));
    QVERIFY(!parse({"api", "--limit", "many"}).has_value());
}

void TestCommandLine::testSortOrder()
{
    QCOMPARE(parse({"list"})->sort, gt::SortOrder::Frecency);
    QCOMPARE(parse({"list", "--sort", "name"})->sort, gt::SortOrder::Name);
    QCOMPARE(parse({"list", "-s", "recent"})->sort, gt::SortOrder::Recent);
}

void TestCommandLine::testUnknownSortFails()
{
    QString error;
    QVERIFY(!parse({"list", "--sort", "size"}, &error).has_value());
    QVERIFY(error.contains("size"));
}

void TestCommandLine::testFlags()
{
    const auto line = parse({"update", "--force", "--debug"});
    QCOMPARE(line->command, gt::Command::Update);
    QVERIFY(line->force);
    QVERIFY(line->debug);

    const auto list = parse({"list", "--no-git"});
    QVERIFY(!list->showGit);

    const auto find = parse({"docs", "-c"});
    QVERIFY(find->cdOnly);
}

void TestCommandLine::testUnknownOptionFails()
{
    QString error;
    QVERIFY(!parse({"api", "--bogus"}, &error).has_value());
    QVERIFY(!error.isEmpty());
}

void TestCommandLine::testHelpAndVersion()
{
    QCOMPARE(parse({"--help"})->command, gt::Command::Help);
    QCOMPARE(parse({"help"})->command, gt::Command::Help);
    QCOMPARE(parse({"-V"})->command, gt::Command::Version);
}

void TestCommandLine::testScanIsUpdate()
{
    QCOMPARE(parse({"scan"})->command, gt::Command::Update);
    QCOMPARE(parse({"update"})->command, gt::Command::Update);
    QCOMPARE(parse({"refresh"})->command, gt::Command::Refresh);
}

void TestCommandLine::testAddRequiresOnePath()
{
    const auto line = parse({"add", "~/work"});
    QCOMPARE(line->command, gt::Command::Add);
    QCOMPARE(line->path, QStringLiteral("~/work"));

    QString error;
    QVERIFY(!parse({"add"}, &error).has_value());
    QVERIFY(error.contains("add"));
    QVERIFY(!parse({"remove", "a", "b"}, &error).has_value());
    QVERIFY(error.contains("remove"));
}

void TestCommandLine::testTestTakesOptionalFile()
{
    QVERIFY(parse({"test"})->path.isEmpty());
    QCOMPARE(parse({"test", "cases.txt"})->path, QStringLiteral("cases.txt"));
    QVERIFY(!parse({"test", "a", "b"}).has_value());
}

void TestCommandLine::testUnexpectedArgumentFails()
{
    QString error;
    QVERIFY(!parse({"stats", "extra"}, &error).has_value());
    QVERIFY(error.contains("extra"));
}

QTEST_MAIN(TestCommandLine)
#include "test_command_line.moc"
