#pragma once

#include <chrono>
#include <cstdint>
#include <map>

#include <QObject>
#include <QString>

#include "common/cancellation_token.hpp"
#include "common/config.hpp"
#include "common/models.hpp"
#include "queue/durable_queue.hpp"
#include "remote/remote_api.hpp"

class QTimer;

namespace fluxsync {

class CacheInvalidationBus;
class ConnectivityProbe;
class EntryStatusStore;
class NotificationSink;
class WorkerPool;

enum class DispatchResult {
    InvalidRequest,
    // Local status already had the requested read/unread classification.
    NoOp,
    // Local write done, a worker is carrying the change to the server.
    Dispatched,
    // Local write done, the change went straight to the status queue.
    Queued,
    // The optimistic write failed; nothing changed.
    LocalWriteFailed
};

/**
 * StatusDispatcher applies a single-entry status change locally and carries
 * it to the server on the worker pool.
 *
 * - At most one live worker per entry; a new dispatch cancels the old one
 *   before starting its own.
 * - A worker that fails reverts the optimistic write (flagged as
 *   worker-originated and skipped when the record changed since dispatch)
 *   and the change is queued for the next drain.
 * - Offline, suspended or unconfigured dispatches skip the worker and queue.
 * - A reaper timer drops finished handles.
 *
 * Must be used from the thread that owns it (the event loop thread).
 */
class StatusDispatcher : public QObject
{
    Q_OBJECT
public:
    StatusDispatcher(EntryStatusStore &store,
                     EntryStatusQueue &queue,
                     CacheInvalidationBus &bus,
                     ConnectivityProbe &probe,
                     NotificationSink &notifications,
                     WorkerPool &pool,
                     RemoteApiFactory apiFactory,
                     ServerSettings server,
                     int reaperIntervalMs,
                     QObject *parent = nullptr);
    ~StatusDispatcher() override;

    DispatchResult dispatch(int64_t entryId, EntryStatus newStatus);

    // Cancels the live worker for the entry, if any. Its result is dropped.
    bool cancel(int64_t entryId);
    void cancelAll();

    // Cancels live workers and queues their changes; later dispatches queue
    // directly until resume().
    void suspend();
    void resume();
    bool isSuspended() const
    {
        return m_suspended;
    }

    void setServerSettings(const ServerSettings &server);

    std::size_t liveWorkerCount() const;
    bool hasLiveWorker(int64_t entryId) const;
    std::size_t trackedHandleCount() const
    {
        return m_handles.size();
    }

    void reapFinishedHandles();

signals:
    // Emitted on the loop thread once a worker's outcome has been applied.
    void dispatchSettled(qint64 entryId, bool syncedRemotely);

private:
    enum class WorkerOutcome {
        Synced,
        Offline,
        Failed
    };

    struct WorkerReport {
        WorkerOutcome outcome = WorkerOutcome::Failed;
        ApiResult result;
    };

    struct DispatchHandle {
        quint64 generation = 0;
        CancellationTokenPtr token;
        EntryStatus targetStatus = EntryStatus::Read;
        EntryStatus originalStatus = EntryStatus::Unread;
        std::chrono::system_clock::time_point dispatchedAt;
        QString correlationId;
        bool finished = false;
    };

    bool isLive(const DispatchHandle &handle) const;
    bool startWorker(int64_t entryId, EntryStatus target, EntryStatus original);
    void onWorkerFinished(int64_t entryId, quint64 generation, const WorkerReport &report);
    void revertLocal(int64_t entryId, const DispatchHandle &handle);
    void queueFallback(int64_t entryId, EntryStatus target, EntryStatus original);
    void ensureReaperRunning();

    EntryStatusStore &m_store;
    EntryStatusQueue &m_queue;
    CacheInvalidationBus &m_bus;
    ConnectivityProbe &m_probe;
    NotificationSink &m_notifications;
    WorkerPool &m_pool;
    RemoteApiFactory m_apiFactory;
    ServerSettings m_server;

    std::map<int64_t, DispatchHandle> m_handles;
    quint64 m_nextGeneration = 1;
    bool m_suspended = false;
    QTimer *m_reaper;
};

} // namespace fluxsync
