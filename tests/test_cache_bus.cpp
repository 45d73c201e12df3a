#include <QtTest/QtTest>

#include <QSignalSpy>
#include <QTemporaryDir>

#include "engine/cache_invalidation_bus.hpp"

using fluxsync::EntryStatus;

class CacheBusTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testInvalidationCounted();
    void testEntryStatusCarriesPayload();
    void testServerChangedIsSeparate();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void CacheBusTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void CacheBusTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void CacheBusTests::testInvalidationCounted()
{
    fluxsync::CacheInvalidationBus bus;
    QSignalSpy spy(&bus, &fluxsync::CacheInvalidationBus::cacheInvalidated);

    QCOMPARE(bus.invalidationCount(), 0);
    bus.publishInvalidation(QStringLiteral("entry_status_synced"));
    bus.publishInvalidation(QStringLiteral("queue_drained"));

    QCOMPARE(spy.count(), 2);
    QCOMPARE(bus.invalidationCount(), 2);
}

void CacheBusTests::testEntryStatusCarriesPayload()
{
    fluxsync::CacheInvalidationBus bus;
    QSignalSpy statusSpy(&bus, &fluxsync::CacheInvalidationBus::entryStatusChanged);
    QSignalSpy invalidationSpy(&bus, &fluxsync::CacheInvalidationBus::cacheInvalidated);

    bus.publishEntryStatus(42, EntryStatus::Read);

    QCOMPARE(statusSpy.count(), 1);
    const QList<QVariant> args = statusSpy.takeFirst();
    QCOMPARE(args.at(0).toLongLong(), 42LL);
    QCOMPARE(args.at(1).value<fluxsync::EntryStatus>(), EntryStatus::Read);

    // Local writes are not confirmed changes.
    QCOMPARE(invalidationSpy.count(), 0);
    QCOMPARE(bus.invalidationCount(), 0);
}

void CacheBusTests::testServerChangedIsSeparate()
{
    fluxsync::CacheInvalidationBus bus;
    QSignalSpy serverSpy(&bus, &fluxsync::CacheInvalidationBus::serverChanged);
    QSignalSpy invalidationSpy(&bus, &fluxsync::CacheInvalidationBus::cacheInvalidated);

    bus.publishServerChanged();

    QCOMPARE(serverSpy.count(), 1);
    QCOMPARE(invalidationSpy.count(), 0);
}

QTEST_MAIN(CacheBusTests)
#include "test_cache_bus.moc"
