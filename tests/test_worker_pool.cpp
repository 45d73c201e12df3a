#include <QtTest/QtTest>

#include <QThread>

#include <atomic>
#include <memory>

#include "common/cancellation_token.hpp"
#include "common/logging.hpp"
#include "engine/worker_pool.hpp"

class WorkerPoolTests : public QObject
{
    Q_OBJECT
private slots:
    void testResultDeliveredOnOwnerThread();
    void testCancelledResultDropped();
    void testRefusesWhenNotAccepting();
    void testCorrelationIdPropagates();
    void testCancelAll();
    void testTokenCallbacks();
};

void WorkerPoolTests::testResultDeliveredOnOwnerThread()
{
    fluxsync::WorkerPool pool(2);
    QObject context;

    QThread *workerThread = nullptr;
    QThread *deliveryThread = nullptr;
    int value = 0;

    const auto token = pool.submit(
        &context,
        [&workerThread](const fluxsync::CancellationTokenPtr &) {
            workerThread = QThread::currentThread();
            return 41 + 1;
        },
        [&deliveryThread, &value](int result) {
            deliveryThread = QThread::currentThread();
            value = result;
        });

    QVERIFY(token);
    QTRY_COMPARE(value, 42);
    QVERIFY(workerThread != nullptr);
    QVERIFY(workerThread != QThread::currentThread());
    QCOMPARE(deliveryThread, QThread::currentThread());
    QVERIFY(pool.waitForDone(5000));
}

void WorkerPoolTests::testCancelledResultDropped()
{
    fluxsync::WorkerPool pool(1);
    QObject context;

    std::atomic<bool> started{false};
    std::atomic<bool> proceed{false};
    bool delivered = false;

    const auto token = pool.submit(
        &context,
        [&started, &proceed](const fluxsync::CancellationTokenPtr &) {
            started = true;
            while (!proceed) {
                QThread::msleep(2);
            }
            return 1;
        },
        [&delivered](int) {
            delivered = true;
        });
    QVERIFY(token);
    QTRY_VERIFY(started.load());

    token->cancel();
    proceed = true;
    QVERIFY(pool.waitForDone(5000));
    QTest::qWait(50);
    QVERIFY(!delivered);
}

void WorkerPoolTests::testRefusesWhenNotAccepting()
{
    fluxsync::WorkerPool pool(1);
    QObject context;

    pool.setAccepting(false);
    QVERIFY(!pool.isAccepting());
    const auto token = pool.submit(
        &context,
        [](const fluxsync::CancellationTokenPtr &) { return 0; },
        [](int) {});
    QVERIFY(!token);

    pool.setAccepting(true);
    QVERIFY(pool.isAccepting());
}

void WorkerPoolTests::testCorrelationIdPropagates()
{
    fluxsync::WorkerPool pool(1);
    QObject context;

    QString seenOnWorker;
    QString seenOnDelivery;
    bool done = false;
    {
        fluxsync::logging::CorrelationScope scope(QStringLiteral("corr-worker"));
        pool.submit(
            &context,
            [&seenOnWorker](const fluxsync::CancellationTokenPtr &) {
                seenOnWorker = fluxsync::logging::currentCorrelationId();
                return true;
            },
            [&seenOnDelivery, &done](bool) {
                seenOnDelivery = fluxsync::logging::currentCorrelationId();
                done = true;
            });
    }

    QTRY_VERIFY(done);
    QCOMPARE(seenOnWorker, QStringLiteral("corr-worker"));
    QCOMPARE(seenOnDelivery, QStringLiteral("corr-worker"));
    QVERIFY(fluxsync::logging::currentCorrelationId().isEmpty());
}

void WorkerPoolTests::testCancelAll()
{
    fluxsync::WorkerPool pool(2);
    QObject context;

    std::atomic<int> cancelledSeen{0};
    auto blockUntilCancelled = [&cancelledSeen](const fluxsync::CancellationTokenPtr &token) {
        while (!token->isCancelled()) {
            QThread::msleep(2);
        }
        ++cancelledSeen;
        return 0;
    };

    const auto first = pool.submit(&context, blockUntilCancelled, [](int) {});
    const auto second = pool.submit(&context, blockUntilCancelled, [](int) {});
    QVERIFY(first);
    QVERIFY(second);

    pool.cancelAll();
    QVERIFY(first->isCancelled());
    QVERIFY(second->isCancelled());
    QVERIFY(pool.waitForDone(5000));
    QCOMPARE(cancelledSeen.load(), 2);
}

void WorkerPoolTests::testTokenCallbacks()
{
    fluxsync::CancellationToken token;
    int calls = 0;
    token.onCancel([&calls]() { ++calls; });
    QCOMPARE(calls, 0);

    token.cancel();
    token.cancel();
    QCOMPARE(calls, 1);

    token.onCancel([&calls]() { ++calls; });
    QCOMPARE(calls, 2);
    QVERIFY(token.isCancelled());
}

QTEST_MAIN(WorkerPoolTests)
#include "test_worker_pool.moc"
