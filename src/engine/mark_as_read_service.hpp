#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include <QObject>

#include "common/cancellation_token.hpp"
#include "common/config.hpp"
#include "common/models.hpp"
#include "queue/durable_queue.hpp"
#include "remote/remote_api.hpp"

namespace fluxsync {

class CacheInvalidationBus;
class ConnectivityProbe;
class EntryStatusStore;
class NotificationSink;
class StatusDispatcher;
class WorkerPool;

/**
 * MarkAsReadService handles the bulk mutations: mark a whole feed or
 * category as read, and set the status of a list of entries in one call.
 *
 * Both run on the worker pool. Success clears the matching queue entries
 * and invalidates caches; failure, offline or suspension queues the work
 * for the next drain. The user is told the change "will sync when online"
 * rather than shown an error.
 *
 * markEntries() supersedes any single-entry dispatch still in flight for
 * the same ids, so at most one remote write per entry is outstanding.
 */
class MarkAsReadService : public QObject
{
    Q_OBJECT
public:
    MarkAsReadService(EntryStatusStore &store,
                      EntryStatusQueue &statusQueue,
                      CollectionQueue &feedQueue,
                      CollectionQueue &categoryQueue,
                      CacheInvalidationBus &bus,
                      ConnectivityProbe &probe,
                      NotificationSink &notifications,
                      WorkerPool &pool,
                      StatusDispatcher &dispatcher,
                      RemoteApiFactory apiFactory,
                      ServerSettings server,
                      QObject *parent = nullptr);
    ~MarkAsReadService() override;

    // Return false for invalid input or a failed local write; remote
    // trouble is absorbed by the queues.
    bool markFeedAsRead(int64_t feedId);
    bool markCategoryAsRead(int64_t categoryId);
    bool markEntries(const std::vector<int64_t> &entryIds, EntryStatus status);

    // Cancels in-flight operations and queues them.
    void suspend();
    void resume();

    void setServerSettings(const ServerSettings &server);

    std::size_t inFlightCount() const
    {
        return m_inFlight.size();
    }

signals:
    void operationSettled(fluxsync::QueueKind kind, bool syncedRemotely);

private:
    struct Operation {
        QueueKind kind = QueueKind::EntryStatus;
        int64_t collectionId = 0;
        std::vector<int64_t> entryIds;
        EntryStatus status = EntryStatus::Read;
        CancellationTokenPtr token;
    };

    bool markCollection(QueueKind kind, int64_t collectionId);
    bool canReachServer() const;
    bool submit(Operation operation);
    void onOperationFinished(quint64 operationId, const ApiResult &result);
    bool applyLocalStatus(const std::vector<int64_t> &entryIds, EntryStatus status);
    void queueOperation(const Operation &operation);
    void notifyQueued(const Operation &operation);
    void notifySynced(const Operation &operation);
    CollectionQueue &collectionQueue(QueueKind kind);

    EntryStatusStore &m_store;
    EntryStatusQueue &m_statusQueue;
    CollectionQueue &m_feedQueue;
    CollectionQueue &m_categoryQueue;
    CacheInvalidationBus &m_bus;
    ConnectivityProbe &m_probe;
    NotificationSink &m_notifications;
    WorkerPool &m_pool;
    StatusDispatcher &m_dispatcher;
    RemoteApiFactory m_apiFactory;
    ServerSettings m_server;

    std::map<quint64, Operation> m_inFlight;
    quint64 m_nextOperationId = 1;
    bool m_suspended = false;
};

} // namespace fluxsync
