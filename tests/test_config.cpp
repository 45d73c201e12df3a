#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include <filesystem>

#include "common/config.hpp"

class ConfigTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testDefaultsWithoutFile();
    void testSaveAndLoad();
    void testMalformedFileYieldsDefaults();
    void testEnvironmentOverrides();
    void testServerSnapshot();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    std::filesystem::path configPath() const;
};

void ConfigTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void ConfigTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void ConfigTests::init()
{
    qunsetenv("FLUXSYNC_SERVER");
    qunsetenv("FLUXSYNC_TOKEN");
    qunsetenv("FLUXSYNC_DATA_DIR");
    std::error_code error;
    std::filesystem::remove(configPath(), error);
}

std::filesystem::path ConfigTests::configPath() const
{
    return std::filesystem::path(m_tempDir.path().toStdString()) / ".config/fluxsync/config.json";
}

void ConfigTests::testDefaultsWithoutFile()
{
    QVERIFY(fluxsync::defaultConfigPath() == configPath());

    const fluxsync::Settings settings = fluxsync::loadSettings();
    QVERIFY(settings.serverAddress.empty());
    QVERIFY(!settings.hasServerCredentials());
    QCOMPARE(settings.connectTimeoutMs, 15000);
    QCOMPARE(settings.totalTimeoutMs, 30000);
    QCOMPARE(settings.maxWorkers, 4);
    QCOMPARE(settings.batchSize, 0);
    QCOMPARE(QString::fromStdString(settings.order), QStringLiteral("published_at"));
    QCOMPARE(QString::fromStdString(settings.direction), QStringLiteral("desc"));
    QVERIFY(settings.autoSyncOnReconnect);
    QVERIFY(settings.cacheEnabled);
    QCOMPARE(settings.feedCountersTtlSeconds, 60);

    const auto dataDir = std::filesystem::path(m_tempDir.path().toStdString()) / ".local/share/fluxsync";
    QVERIFY(settings.dataDir == dataDir);
    QVERIFY(settings.statusQueuePath() == dataDir / "status_queue.json");
    QVERIFY(settings.feedQueuePath() == dataDir / "feed_queue.json");
    QVERIFY(settings.categoryQueuePath() == dataDir / "category_queue.json");
    QVERIFY(settings.databasePath() == dataDir / "entries.db");
}

void ConfigTests::testSaveAndLoad()
{
    fluxsync::Settings settings;
    settings.serverAddress = "https://reader.example.org/";
    settings.apiToken = "secret";
    settings.dataDir = m_tempDir.path().toStdString() + "/data";
    settings.batchSize = 25;
    settings.autoSyncOnReconnect = false;
    settings.unreadCountTtlSeconds = 120;

    QVERIFY(fluxsync::saveSettings(settings));
    QVERIFY(std::filesystem::exists(configPath()));

    const fluxsync::Settings loaded = fluxsync::loadSettings();
    QCOMPARE(QString::fromStdString(loaded.serverAddress), QStringLiteral("https://reader.example.org/"));
    QCOMPARE(QString::fromStdString(loaded.apiToken), QStringLiteral("secret"));
    QVERIFY(loaded.dataDir == settings.dataDir);
    QCOMPARE(loaded.batchSize, 25);
    QVERIFY(!loaded.autoSyncOnReconnect);
    QCOMPARE(loaded.unreadCountTtlSeconds, 120);
    QVERIFY(loaded.hasServerCredentials());
}

void ConfigTests::testMalformedFileYieldsDefaults()
{
    std::filesystem::create_directories(configPath().parent_path());
    QFile file(QString::fromStdString(configPath().string()));
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write("{\"serverAddress\": ");
    file.close();

    const fluxsync::Settings settings = fluxsync::loadSettings();
    QVERIFY(settings.serverAddress.empty());
    QCOMPARE(settings.maxWorkers, 4);
}

void ConfigTests::testEnvironmentOverrides()
{
    fluxsync::Settings settings;
    settings.serverAddress = "https://from-file.example.org";
    settings.apiToken = "file-token";
    QVERIFY(fluxsync::saveSettings(settings));

    qputenv("FLUXSYNC_SERVER", "https://from-env.example.org");
    qputenv("FLUXSYNC_DATA_DIR", QByteArray(m_tempDir.path().toUtf8() + "/envdata"));

    const fluxsync::Settings loaded = fluxsync::loadSettings();
    QCOMPARE(QString::fromStdString(loaded.serverAddress), QStringLiteral("https://from-env.example.org"));
    QCOMPARE(QString::fromStdString(loaded.apiToken), QStringLiteral("file-token"));
    QCOMPARE(QString::fromStdString(loaded.dataDir.string()), m_tempDir.path() + "/envdata");

    qunsetenv("FLUXSYNC_SERVER");
    qunsetenv("FLUXSYNC_DATA_DIR");
}

void ConfigTests::testServerSnapshot()
{
    fluxsync::Settings settings;
    settings.serverAddress = "https://reader.example.org";
    settings.apiToken = "token";
    settings.connectTimeoutMs = 1000;
    settings.totalTimeoutMs = 2000;

    const fluxsync::ServerSettings server = settings.serverSnapshot();
    QCOMPARE(QString::fromStdString(server.serverAddress), QStringLiteral("https://reader.example.org"));
    QCOMPARE(QString::fromStdString(server.apiToken), QStringLiteral("token"));
    QCOMPARE(server.connectTimeoutMs, 1000);
    QCOMPARE(server.totalTimeoutMs, 2000);
}

QTEST_MAIN(ConfigTests)
#include "test_config.moc"
