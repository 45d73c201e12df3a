#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>

#include <nlohmann/json.hpp>

#include "cli/SyncCli.hpp"
#include "common/config.hpp"
#include "store/entry_status_store.hpp"

#include "fake_remote_api.hpp"

using fluxsync::EntryStatus;

class SyncCliTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testUsageErrors();
    void testMarkOfflineQueues();
    void testMarkOnlineSyncs();
    void testStatusShowsQueuedChange();
    void testSyncYesDrainsQueue();
    void testSyncPromptLater();
    void testSyncPromptDelete();
    void testSyncNothingPending();
    void testClearQueueConfirmation();
    void testMarkFeedOffline();
    void testFetchRejectedOffline();
    void testPurge();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    fluxsync::testing::FakeRemoteStatePtr m_state;

    std::filesystem::path dataDir() const;
    void seedEntry(int64_t entryId, EntryStatus status);
    int runCli(const QStringList &args, std::string &out, std::istream *input = nullptr);
};

void SyncCliTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    qputenv("FLUXSYNC_SERVER", "http://miniflux.test");
    qputenv("FLUXSYNC_TOKEN", "test-token");
    qputenv("FLUXSYNC_DATA_DIR", QString::fromStdString(dataDir().string()).toUtf8());
}

void SyncCliTests::cleanupTestCase()
{
    qunsetenv("FLUXSYNC_SERVER");
    qunsetenv("FLUXSYNC_TOKEN");
    qunsetenv("FLUXSYNC_DATA_DIR");
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void SyncCliTests::init()
{
    std::error_code error;
    std::filesystem::remove_all(dataDir(), error);
    m_state = std::make_shared<fluxsync::testing::FakeRemoteState>();
}

std::filesystem::path SyncCliTests::dataDir() const
{
    return std::filesystem::path(m_tempDir.path().toStdString()) / "data";
}

void SyncCliTests::seedEntry(int64_t entryId, EntryStatus status)
{
    fluxsync::Settings settings;
    settings.dataDir = dataDir();
    fluxsync::EntryStatusStore store(settings.databasePath());
    fluxsync::testing::materializeEntry(store, entryId, status);
}

int SyncCliTests::runCli(const QStringList &args, std::string &out, std::istream *input)
{
    std::stringstream buffer;
    auto *oldBuf = std::cout.rdbuf(buffer.rdbuf());
    auto *oldErr = std::cerr.rdbuf(buffer.rdbuf());

    fluxsync::SyncCli cli(fluxsync::testing::fakeApiFactory(m_state));
    cli.setInput(input);
    std::vector<QByteArray> utf8Args;
    std::vector<char *> rawArgs;
    for (const QString &arg : args) {
        utf8Args.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : utf8Args) {
        rawArgs.push_back(arg.data());
    }

    const int result = cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());

    std::cout.rdbuf(oldBuf);
    std::cerr.rdbuf(oldErr);
    out = buffer.str();
    return result;
}

namespace {

// The summary is the last line the sync command prints.
nlohmann::json lastJsonLine(const std::string &output)
{
    std::istringstream lines(output);
    std::string line;
    std::string last;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.front() == '{') {
            last = line;
        }
    }
    return nlohmann::json::parse(last);
}

bool containsText(const std::string &output, const std::string &needle)
{
    return output.find(needle) != std::string::npos;
}

} // namespace

void SyncCliTests::testUsageErrors()
{
    std::string output;
    QCOMPARE(runCli({"fluxsync-cli"}, output), 1);
    QVERIFY(containsText(output, "Usage:"));

    QCOMPARE(runCli({"fluxsync-cli", "--offline", "bogus"}, output), 1);
    QVERIFY(containsText(output, "Usage:"));

    QCOMPARE(runCli({"fluxsync-cli", "--offline", "mark", "abc", "read"}, output), 1);
    QCOMPARE(runCli({"fluxsync-cli", "--offline", "mark", "5", "removed"}, output), 1);
    QCOMPARE(runCli({"fluxsync-cli", "--offline", "mark", "0", "read"}, output), 1);
    QCOMPARE(runCli({"fluxsync-cli", "--offline", "status"}, output), 1);
}

void SyncCliTests::testMarkOfflineQueues()
{
    seedEntry(42, EntryStatus::Unread);

    std::string output;
    QCOMPARE(runCli({"fluxsync-cli", "--offline", "mark", "42", "read"}, output), 0);
    QVERIFY(containsText(output, "entry 42: queued"));
    QVERIFY(containsText(output, "[info] Marked as read (will sync when online)"));

    QCOMPARE(runCli({"fluxsync-cli", "--offline", "queue", "--format", "json"}, output), 0);
    const auto parsed = nlohmann::json::parse(output);
    QCOMPARE(parsed.at("counts").at("total").get<int>(), 1);
    QCOMPARE(parsed.at("entryStatus").at("42").at("targetStatus").get<std::string>(), std::string("read"));
    QCOMPARE(parsed.at("entryStatus").at("42").at("originalStatus").get<std::string>(), std::string("unread"));

    // Same classification again: nothing to do.
    QCOMPARE(runCli({"fluxsync-cli", "--offline", "mark", "42", "read"}, output), 0);
    QVERIFY(containsText(output, "entry 42: unchanged"));

    QCOMPARE(runCli({"fluxsync-cli", "--offline", "queue"}, output), 0);
    QVERIFY(containsText(output, "Pending changes: 1"));
    QVERIFY(containsText(output, "entry 42: unread -> read"));
    QCOMPARE(m_state->updateCallCount(), static_cast<std::size_t>(0));
}

void SyncCliTests::testMarkOnlineSyncs()
{
    seedEntry(8, EntryStatus::Read);

    // Connectivity here comes from the host; only a settled outcome is
    // asserted when the host reports itself online.
    std::string output;
    QCOMPARE(runCli({"fluxsync-cli", "mark", "8", "unread"}, output), 0);
    if (containsText(output, "entry 8: dispatched")) {
        QVERIFY(containsText(output, "entry 8: synced"));
        QCOMPARE(m_state->updateCallCount(), static_cast<std::size_t>(1));
    } else {
        QVERIFY(containsText(output, "entry 8: queued"));
    }
}

void SyncCliTests::testStatusShowsQueuedChange()
{
    seedEntry(5, EntryStatus::Read);

    std::string output;
    QCOMPARE(runCli({"fluxsync-cli", "--offline", "mark", "5", "unread"}, output), 0);
    QCOMPARE(runCli({"fluxsync-cli", "--offline", "status", "5"}, output), 0);

    const auto parsed = nlohmann::json::parse(output);
    QCOMPARE(parsed.at("id").get<int64_t>(), static_cast<int64_t>(5));
    QCOMPARE(parsed.at("status").get<std::string>(), std::string("unread"));
    QCOMPARE(parsed.at("queued").at("targetStatus").get<std::string>(), std::string("unread"));

    QCOMPARE(runCli({"fluxsync-cli", "--offline", "status", "77"}, output), 1);
    QVERIFY(containsText(output, "Entry 77 not found"));
}

void SyncCliTests::testSyncYesDrainsQueue()
{
    seedEntry(1, EntryStatus::Unread);
    seedEntry(2, EntryStatus::Unread);

    std::string output;
    QCOMPARE(runCli({"fluxsync-cli", "--offline", "mark-entries", "read", "1", "2"}, output), 0);
    QVERIFY(containsText(output, "Marked as read (will sync when online)"));

    QCOMPARE(runCli({"fluxsync-cli", "--offline", "sync", "--yes"}, output), 0);
    const auto summary = lastJsonLine(output);
    QCOMPARE(summary.at("processed").get<int>(), 2);
    QCOMPARE(summary.at("remoteCalls").get<int>(), 1);
    QVERIFY(containsText(output, "[ok] 2 changes synced"));

    QCOMPARE(m_state->updateCallCount(), static_cast<std::size_t>(1));
    fluxsync::Settings settings;
    settings.dataDir = dataDir();
    QVERIFY(!std::filesystem::exists(settings.statusQueuePath()));
}

void SyncCliTests::testSyncPromptLater()
{
    seedEntry(3, EntryStatus::Unread);
    std::string output;
    QCOMPARE(runCli({"fluxsync-cli", "--offline", "mark", "3", "read"}, output), 0);

    std::istringstream answer("l\n");
    QCOMPARE(runCli({"fluxsync-cli", "--offline", "sync"}, output, &answer), 0);
    QVERIFY(containsText(output, "Sync 1 pending change?"));
    QVERIFY(lastJsonLine(output).at("deferred").get<bool>());

    QCOMPARE(runCli({"fluxsync-cli", "--offline", "queue"}, output), 0);
    QVERIFY(containsText(output, "Pending changes: 1"));
    QCOMPARE(m_state->updateCallCount(), static_cast<std::size_t>(0));
}

void SyncCliTests::testSyncPromptDelete()
{
    seedEntry(3, EntryStatus::Unread);
    std::string output;
    QCOMPARE(runCli({"fluxsync-cli", "--offline", "mark", "3", "read"}, output), 0);
    QCOMPARE(runCli({"fluxsync-cli", "--offline", "mark-category", "6"}, output), 0);

    std::istringstream answer("d\n");
    QCOMPARE(runCli({"fluxsync-cli", "--offline", "sync"}, output, &answer), 0);
    QVERIFY(containsText(output, "Sync 2 pending changes?"));
    QVERIFY(containsText(output, "[ok] All sync queues cleared"));
    QVERIFY(lastJsonLine(output).at("cleared").get<bool>());

    QCOMPARE(runCli({"fluxsync-cli", "--offline", "queue"}, output), 0);
    QVERIFY(containsText(output, "Pending changes: 0"));
}

void SyncCliTests::testSyncNothingPending()
{
    std::string output;
    QCOMPARE(runCli({"fluxsync-cli", "--offline", "sync", "--yes"}, output), 0);
    QVERIFY(containsText(output, "[info] All changes are already synced"));
    QVERIFY(lastJsonLine(output).at("nothingToSync").get<bool>());
}

void SyncCliTests::testClearQueueConfirmation()
{
    seedEntry(4, EntryStatus::Read);
    std::string output;
    QCOMPARE(runCli({"fluxsync-cli", "--offline", "mark", "4", "unread"}, output), 0);

    std::istringstream decline("n\n");
    QCOMPARE(runCli({"fluxsync-cli", "--offline", "clear-queue"}, output, &decline), 1);
    QVERIFY(containsText(output, "Discard 1 unsynced changes?"));
    QCOMPARE(runCli({"fluxsync-cli", "--offline", "queue"}, output), 0);
    QVERIFY(containsText(output, "Pending changes: 1"));

    QCOMPARE(runCli({"fluxsync-cli", "--offline", "clear-queue", "--yes"}, output), 0);
    QCOMPARE(runCli({"fluxsync-cli", "--offline", "queue"}, output), 0);
    QVERIFY(containsText(output, "Pending changes: 0"));
}

void SyncCliTests::testMarkFeedOffline()
{
    std::string output;
    QCOMPARE(runCli({"fluxsync-cli", "--offline", "mark-feed", "12"}, output), 0);
    QVERIFY(containsText(output, "[info] Feed marked as read (will sync when online)"));

    QCOMPARE(runCli({"fluxsync-cli", "--offline", "queue", "--format", "json"}, output), 0);
    const auto parsed = nlohmann::json::parse(output);
    QCOMPARE(parsed.at("counts").at("feeds").get<int>(), 1);
    QCOMPARE(parsed.at("feeds").at("12").at("operation").get<std::string>(), std::string("mark_all_read"));

    QCOMPARE(runCli({"fluxsync-cli", "--offline", "mark-feed", "-2"}, output), 1);
}

void SyncCliTests::testFetchRejectedOffline()
{
    std::string output;
    QCOMPARE(runCli({"fluxsync-cli", "--offline", "fetch", "--limit", "5"}, output), 1);
    QVERIFY(containsText(output, "Cannot fetch entries while offline"));
    QCOMPARE(runCli({"fluxsync-cli", "--offline", "fetch", "--limit", "zero"}, output), 1);
    QCOMPARE(m_state->fetchEntriesCalls, 0);
}

void SyncCliTests::testPurge()
{
    seedEntry(7, EntryStatus::Unread);

    std::string output;
    QCOMPARE(runCli({"fluxsync-cli", "--offline", "purge", "7"}, output), 0);
    QVERIFY(containsText(output, "Purged entry 7"));

    QCOMPARE(runCli({"fluxsync-cli", "--offline", "purge", "7"}, output), 1);
    QVERIFY(containsText(output, "Entry 7 not found"));
}

QTEST_MAIN(SyncCliTests)
#include "test_sync_cli.moc"
