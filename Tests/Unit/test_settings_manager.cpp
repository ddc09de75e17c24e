#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <QJsonArray>
#include <QJsonDocument>
#include "core/shared/settings_manager.h"
#include "project_fixture.h"

using gt::test::writeFile;

class TestSettingsManager : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();

    void testDefaults();
    void testSaveAndLoadPreservesFields();
    void testLegacyStringScanPaths();
    void testInvalidPostCommandRejected();
    void testNullPostCommandDisables();
    void testNonPositiveMaxDepthIgnored();
    void testEmbeddingTimeoutFloor();
    void testMalformedFileFails();
    void testLoadWritesDefaultsWhenMissing();

private:
    QTemporaryDir m_configDir;
};

void TestSettingsManager::initTestCase()
{
    QVERIFY(m_configDir.isValid());
    qputenv("GOTO_CONFIG_DIR", m_configDir.path().toUtf8());
}

void TestSettingsManager::testDefaults()
{
    const gt::Settings settings;
    QVERIFY(settings.scanPaths.empty());
    QCOMPARE(settings.maxDepth, 5);
    QVERIFY(settings.postCommand.has_value());
    QCOMPARE(*settings.postCommand, gt::PostCommand::Claude);
    QVERIFY(settings.embeddingEnabled);
    QVERIFY(!settings.discoveryAssist);
}

void TestSettingsManager::testSaveAndLoadPreservesFields()
{
    gt::Settings settings;
    settings.scanPaths.push_back({"/home/me/work", true, 3, {"archive"}});
    settings.scanPaths.push_back({"/home/me/oss", false, 0, {}});
    settings.discoveryAssist = true;
    settings.maxDepth = 7;
    settings.postCommand = gt::PostCommand::Nvim;
    settings.excludePatterns = {"sandbox"};
    settings.embeddingEnabled = false;

    QTemporaryDir dir;
    const QString path = dir.path() + "/config.json";
    QVERIFY(gt::SettingsManager::saveToFile(settings, path));

    const auto loaded = gt::SettingsManager::loadFromFile(path);
    QVERIFY(loaded.has_value());
    QCOMPARE(static_cast<int>(loaded->scanPaths.size()), 2);
    QCOMPARE(loaded->scanPaths[0].path, QStringLiteral("/home/me/work"));
    QCOMPARE(loaded->scanPaths[0].maxDepth, 3);
    QCOMPARE(loaded->scanPaths[0].excludePatterns, QStringList{"archive"});
    QVERIFY(!loaded->scanPaths[1].recursive);
    QVERIFY(loaded->discoveryAssist);
    QCOMPARE(loaded->maxDepth, 7);
    QCOMPARE(*loaded->postCommand, gt::PostCommand::Nvim);
    QCOMPARE(loaded->excludePatterns, QStringList{"sandbox"});
    QVERIFY(!loaded->embeddingEnabled);
}

void TestSettingsManager::testLegacyStringScanPaths()
{
    QJsonObject json;
    json.insert("scanPaths", QJsonArray{"/srv/code", ""});
    const gt::Settings settings = gt::SettingsManager::fromJson(json);
    QCOMPARE(static_cast<int>(settings.scanPaths.size()), 1);
    QCOMPARE(settings.scanPaths[0].path, QStringLiteral("/srv/code"));
    QVERIFY(settings.scanPaths[0].recursive);
}

void TestSettingsManager::testInvalidPostCommandRejected()
{
    QJsonObject json;
    json.insert("postCommand", "rm -rf /");
    QVERIFY(!gt::SettingsManager::fromJson(json).postCommand.has_value());

    json.insert("postCommand", "hx");
    QCOMPARE(*gt::SettingsManager::fromJson(json).postCommand, gt::PostCommand::Helix);
}

void TestSettingsManager::testNullPostCommandDisables()
{
    QJsonObject json;
    json.insert("postCommand", QJsonValue(QJsonValue::Null));
    QVERIFY(!gt::SettingsManager::fromJson(json).postCommand.has_value());

    // Absent key keeps the default.
    QVERIFY(gt::SettingsManager::fromJson(QJsonObject()).postCommand.has_value());
}

void TestSettingsManager::testNonPositiveMaxDepthIgnored()
{
    QJsonObject json;
    json.insert("maxDepth", 0);
    QCOMPARE(gt::SettingsManager::fromJson(json).maxDepth, 5);
}

void TestSettingsManager::testEmbeddingTimeoutFloor()
{
    QJsonObject json;
    json.insert("embeddingTimeoutMs", 10);
    QCOMPARE(gt::SettingsManager::fromJson(json).embeddingTimeoutMs, 1000);
}

void TestSettingsManager::testMalformedFileFails()
{
    QTemporaryDir dir;
    const QString path = dir.path() + "/config.json";
    QVERIFY(writeFile(path, "{ \"scanPaths\": ["));

    QString error;
    QVERIFY(!gt::SettingsManager::loadFromFile(path, &error).has_value());
    QVERIFY(error.contains("invalid JSON"));
}

void TestSettingsManager::testLoadWritesDefaultsWhenMissing()
{
    const QString path = gt::SettingsManager::settingsFilePath();
    QCOMPARE(path, m_configDir.path() + "/config.json");
    QFile::remove(path);

    const auto settings = gt::SettingsManager::load();
    QVERIFY(settings.has_value());
    QVERIFY(QFile::exists(path));
}

QTEST_MAIN(TestSettingsManager)
#include "test_settings_manager.moc"
