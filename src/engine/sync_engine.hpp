#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include <QObject>
#include <QString>

#include "common/config.hpp"
#include "common/models.hpp"
#include "queue/durable_queue.hpp"
#include "remote/remote_api.hpp"

namespace fluxsync {

class CacheInvalidationBus;
class ConfirmationPrompt;
class ConnectivityProbe;
class CountsCache;
class EntryInfoCache;
class EntryStatusStore;
class MarkAsReadService;
class NotificationSink;
class StatusDispatcher;
class SyncCoordinator;
class WorkerPool;

enum class LifecycleEvent {
    NetworkConnected,
    Suspend,
    Resume,
    Close
};

/**
 * SyncEngine owns every piece of the status sync subsystem and wires them
 * together on the Qt event loop:
 * - the SQLite entry status store and the three durable queues
 * - the cache invalidation bus and the read caches listening to it
 * - the worker pool, dispatcher, coordinator and bulk mark service
 *
 * It is designed to be owned from main() (or a test) and driven by the
 * event loop. Host lifecycle changes arrive through handleLifecycleEvent().
 */
class SyncEngine : public QObject
{
    Q_OBJECT
public:
    SyncEngine(Settings settings,
               std::unique_ptr<ConnectivityProbe> probe,
               NotificationSink &notifications,
               RemoteApiFactory apiFactory,
               QObject *parent = nullptr);
    ~SyncEngine() override;

    // Call once after construction; checks the database and warms caches.
    void start();

    void handleLifecycleEvent(LifecycleEvent event);

    // Used for reconnect-triggered drains when auto sync is off.
    void setConfirmationPrompt(ConfirmationPrompt *prompt);

    void updateSettings(const Settings &settings);
    const Settings &settings() const
    {
        return m_settings;
    }

    // Cancels any live worker for the entry before deleting its record.
    bool purgeEntry(int64_t entryId);

    // Downloads unread entries and materializes them as local records.
    // Completion is reported through entriesFetched().
    bool fetchUnreadEntries(int limit);

    // Completion is reported through countsReady().
    bool requestCounts();

    EntryStatusStore &store();
    EntryStatusQueue &statusQueue();
    CollectionQueue &feedQueue();
    CollectionQueue &categoryQueue();
    CacheInvalidationBus &bus();
    ConnectivityProbe &probe();
    WorkerPool &workerPool();
    StatusDispatcher &dispatcher();
    SyncCoordinator &coordinator();
    MarkAsReadService &markAsRead();
    EntryInfoCache &entryInfo();
    CountsCache &counts();

signals:
    void entriesFetched(int materialized, const QString &error);
    void countsReady(const QString &countsJson, const QString &error);

private:
    void suspendWorkers();
    void onEntriesFetched(const ApiResult &result);

    Settings m_settings;
    NotificationSink &m_notifications;
    RemoteApiFactory m_apiFactory;
    ConfirmationPrompt *m_prompt = nullptr;
    bool m_closed = false;

    std::unique_ptr<EntryStatusStore> m_store;
    std::unique_ptr<EntryStatusQueue> m_statusQueue;
    std::unique_ptr<CollectionQueue> m_feedQueue;
    std::unique_ptr<CollectionQueue> m_categoryQueue;
    std::unique_ptr<CacheInvalidationBus> m_bus;
    std::unique_ptr<ConnectivityProbe> m_probe;
    std::unique_ptr<WorkerPool> m_pool;
    std::unique_ptr<StatusDispatcher> m_dispatcher;
    std::unique_ptr<SyncCoordinator> m_coordinator;
    std::unique_ptr<MarkAsReadService> m_markAsRead;
    std::unique_ptr<EntryInfoCache> m_entryInfo;
    std::unique_ptr<CountsCache> m_counts;
};

} // namespace fluxsync
