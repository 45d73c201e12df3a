#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include <filesystem>

#include <nlohmann/json.hpp>

#include "queue/durable_queue.hpp"

using fluxsync::EntryStatus;

namespace {

fluxsync::StatusQueueEntry statusEntry(EntryStatus target)
{
    fluxsync::StatusQueueEntry entry;
    entry.targetStatus = target;
    entry.originalStatus = fluxsync::oppositeStatus(target);
    entry.timestamp = std::chrono::system_clock::now();
    return entry;
}

} // namespace

class DurableQueueTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testEnqueueCoalesces();
    void testRemoveMissingIsNoOp();
    void testFileDeletedWhenEmpty();
    void testPersistedFormat();
    void testInvalidIdsRejected();
    void testRemoveAllHonoursPredicate();
    void testCorruptFileReadsEmpty();
    void testSchemaMismatchReadsEmpty();
    void testQueueKindMismatchReadsEmpty();
    void testUnknownStatusReadsEmpty();
    void testCollectionQueue();
    void testClear();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    std::filesystem::path queuePath(const char *name) const;
    void writeRaw(const std::filesystem::path &path, const QByteArray &data);
};

void DurableQueueTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void DurableQueueTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void DurableQueueTests::init()
{
    std::error_code error;
    std::filesystem::remove_all(queuePath("x").parent_path(), error);
}

std::filesystem::path DurableQueueTests::queuePath(const char *name) const
{
    return std::filesystem::path(m_tempDir.path().toStdString()) / "queues" / name;
}

void DurableQueueTests::writeRaw(const std::filesystem::path &path, const QByteArray &data)
{
    std::filesystem::create_directories(path.parent_path());
    QFile file(QString::fromStdString(path.string()));
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write(data);
    file.close();
}

void DurableQueueTests::testEnqueueCoalesces()
{
    fluxsync::EntryStatusQueue queue(fluxsync::QueueKind::EntryStatus, queuePath("status_queue.json"));

    QVERIFY(queue.enqueue(42, statusEntry(EntryStatus::Read)));
    QVERIFY(queue.enqueue(42, statusEntry(EntryStatus::Unread)));

    const auto entries = queue.load();
    QCOMPARE(entries.size(), static_cast<std::size_t>(1));
    QCOMPARE(entries.at(42).targetStatus, EntryStatus::Unread);
    QCOMPARE(entries.at(42).originalStatus, EntryStatus::Read);
}

void DurableQueueTests::testRemoveMissingIsNoOp()
{
    fluxsync::EntryStatusQueue queue(fluxsync::QueueKind::EntryStatus, queuePath("status_queue.json"));

    QVERIFY(queue.remove(12345));
    QVERIFY(!queue.exists());

    QVERIFY(queue.enqueue(1, statusEntry(EntryStatus::Read)));
    QVERIFY(queue.remove(2));
    QCOMPARE(queue.count(), static_cast<std::size_t>(1));
    QVERIFY(queue.contains(1));
}

void DurableQueueTests::testFileDeletedWhenEmpty()
{
    fluxsync::EntryStatusQueue queue(fluxsync::QueueKind::EntryStatus, queuePath("status_queue.json"));

    QVERIFY(!queue.exists());
    QVERIFY(queue.enqueue(3, statusEntry(EntryStatus::Read)));
    QVERIFY(queue.enqueue(4, statusEntry(EntryStatus::Read)));
    QVERIFY(queue.exists());

    QVERIFY(queue.remove(3));
    QVERIFY(queue.exists());
    QVERIFY(queue.remove(4));
    QVERIFY(!queue.exists());
    QVERIFY(!std::filesystem::exists(queuePath("status_queue.json")));
    QCOMPARE(queue.count(), static_cast<std::size_t>(0));
}

void DurableQueueTests::testPersistedFormat()
{
    fluxsync::EntryStatusQueue queue(fluxsync::QueueKind::EntryStatus, queuePath("status_queue.json"));
    QVERIFY(queue.enqueue(42, statusEntry(EntryStatus::Read)));

    QFile file(QString::fromStdString(queuePath("status_queue.json").string()));
    QVERIFY(file.open(QIODevice::ReadOnly));
    const auto root = nlohmann::json::parse(file.readAll().toStdString());
    QCOMPARE(root.value("schemaVersion", 0), fluxsync::kQueueSchemaVersion);
    QCOMPARE(QString::fromStdString(root.value("queue", "")), QStringLiteral("entry-status"));
    QVERIFY(root["entries"].contains("42"));
    QCOMPARE(QString::fromStdString(root["entries"]["42"].value("targetStatus", "")), QStringLiteral("read"));
    QCOMPARE(QString::fromStdString(root["entries"]["42"].value("originalStatus", "")), QStringLiteral("unread"));

    fluxsync::EntryStatusQueue reopened(fluxsync::QueueKind::EntryStatus, queuePath("status_queue.json"));
    QVERIFY(reopened.contains(42));
}

void DurableQueueTests::testInvalidIdsRejected()
{
    fluxsync::EntryStatusQueue queue(fluxsync::QueueKind::EntryStatus, queuePath("status_queue.json"));

    QVERIFY(!queue.enqueue(0, statusEntry(EntryStatus::Read)));
    QVERIFY(!queue.enqueue(-7, statusEntry(EntryStatus::Read)));
    QVERIFY(!queue.remove(0));
    QVERIFY(!queue.exists());

    fluxsync::EntryStatusQueue::Map additions;
    additions[-1] = statusEntry(EntryStatus::Read);
    additions[5] = statusEntry(EntryStatus::Read);
    QVERIFY(queue.enqueueAll(additions));
    QCOMPARE(queue.count(), static_cast<std::size_t>(1));
    QVERIFY(queue.contains(5));
}

void DurableQueueTests::testRemoveAllHonoursPredicate()
{
    fluxsync::EntryStatusQueue queue(fluxsync::QueueKind::EntryStatus, queuePath("status_queue.json"));

    fluxsync::EntryStatusQueue::Map additions;
    additions[1] = statusEntry(EntryStatus::Read);
    additions[2] = statusEntry(EntryStatus::Read);
    additions[3] = statusEntry(EntryStatus::Unread);
    QVERIFY(queue.enqueueAll(additions));

    QVERIFY(queue.removeAll({1, 2, 3, 4}, [](int64_t, const fluxsync::StatusQueueEntry &entry) {
        return entry.targetStatus == EntryStatus::Read;
    }));
    const auto remaining = queue.load();
    QCOMPARE(remaining.size(), static_cast<std::size_t>(1));
    QVERIFY(remaining.count(3) == 1);

    QVERIFY(queue.removeAll({3}));
    QVERIFY(!queue.exists());
}

void DurableQueueTests::testCorruptFileReadsEmpty()
{
    const auto path = queuePath("status_queue.json");
    writeRaw(path, "{\"schemaVersion\": 1, \"queue\": \"entry-st");

    fluxsync::EntryStatusQueue queue(fluxsync::QueueKind::EntryStatus, path);
    QCOMPARE(queue.count(), static_cast<std::size_t>(0));

    // The next write replaces the corrupt file with a valid one.
    QVERIFY(queue.enqueue(9, statusEntry(EntryStatus::Read)));
    QCOMPARE(queue.count(), static_cast<std::size_t>(1));

    writeRaw(path, "[1, 2, 3]");
    QCOMPARE(queue.count(), static_cast<std::size_t>(0));
}

void DurableQueueTests::testSchemaMismatchReadsEmpty()
{
    const auto path = queuePath("status_queue.json");
    writeRaw(path, R"({"schemaVersion": 2, "queue": "entry-status",
                      "entries": {"1": {"targetStatus": "read", "originalStatus": "unread"}}})");

    fluxsync::EntryStatusQueue queue(fluxsync::QueueKind::EntryStatus, path);
    QVERIFY(queue.load().empty());
}

void DurableQueueTests::testQueueKindMismatchReadsEmpty()
{
    const auto path = queuePath("feed_queue.json");
    writeRaw(path, R"({"schemaVersion": 1, "queue": "category",
                      "entries": {"1": {"operation": "mark_all_read"}}})");

    fluxsync::CollectionQueue queue(fluxsync::QueueKind::Feed, path);
    QVERIFY(queue.load().empty());
}

void DurableQueueTests::testUnknownStatusReadsEmpty()
{
    const auto path = queuePath("status_queue.json");
    writeRaw(path, R"({"schemaVersion": 1, "queue": "entry-status",
                      "entries": {"1": {"targetStatus": "starred", "originalStatus": "unread"},
                                  "2": {"targetStatus": "read", "originalStatus": "unread"}}})");

    fluxsync::EntryStatusQueue queue(fluxsync::QueueKind::EntryStatus, path);
    QVERIFY(queue.load().empty());

    writeRaw(path, R"({"schemaVersion": 1, "queue": "entry-status",
                      "entries": {"abc": {"targetStatus": "read", "originalStatus": "unread"}}})");
    QVERIFY(queue.load().empty());

    writeRaw(path, R"({"schemaVersion": 1, "queue": "entry-status",
                      "entries": {"12abc": {"targetStatus": "read", "originalStatus": "unread"},
                                  "13": {"targetStatus": "read", "originalStatus": "unread"}}})");
    QVERIFY(queue.load().empty());
}

void DurableQueueTests::testCollectionQueue()
{
    fluxsync::CollectionQueue feeds(fluxsync::QueueKind::Feed, queuePath("feed_queue.json"));

    fluxsync::CollectionQueueEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    QVERIFY(feeds.enqueue(17, entry));
    QVERIFY(feeds.enqueue(17, entry));
    QCOMPARE(feeds.count(), static_cast<std::size_t>(1));
    QCOMPARE(feeds.kind(), fluxsync::QueueKind::Feed);

    QFile file(QString::fromStdString(feeds.path().string()));
    QVERIFY(file.open(QIODevice::ReadOnly));
    const auto root = nlohmann::json::parse(file.readAll().toStdString());
    QCOMPARE(QString::fromStdString(root.value("queue", "")), QStringLiteral("feed"));
    QCOMPARE(QString::fromStdString(root["entries"]["17"].value("operation", "")),
             QStringLiteral("mark_all_read"));
    file.close();

    QVERIFY(feeds.remove(17));
    QVERIFY(!feeds.exists());
}

void DurableQueueTests::testClear()
{
    fluxsync::EntryStatusQueue queue(fluxsync::QueueKind::EntryStatus, queuePath("status_queue.json"));
    QVERIFY(queue.clear());

    QVERIFY(queue.enqueue(1, statusEntry(EntryStatus::Read)));
    QVERIFY(queue.enqueue(2, statusEntry(EntryStatus::Unread)));
    QVERIFY(queue.clear());
    QVERIFY(!queue.exists());
    QVERIFY(queue.load().empty());
}

QTEST_MAIN(DurableQueueTests)
#include "test_durable_queue.moc"
