#pragma once

#include <chrono>
#include <cstdint>
#include <vector>

#include <QMetaType>
#include <QObject>

#include "common/cancellation_token.hpp"
#include "common/config.hpp"
#include "common/models.hpp"
#include "queue/durable_queue.hpp"
#include "remote/remote_api.hpp"

namespace fluxsync {

class CacheInvalidationBus;
class ConfirmationPrompt;
class EntryStatusStore;
class NotificationSink;
class WorkerPool;

struct StatusBatch {
    EntryStatus targetStatus = EntryStatus::Read;
    std::vector<int64_t> entryIds;
};

/**
 * SyncCoordinator drains the three durable queues.
 *
 * Queued entry-status changes are grouped by target status so that any
 * number of pending entries costs at most one PUT /entries per status
 * (more only when a batch size is configured). Feed and category
 * operations cost one call each. A batch either clears all of its ids from
 * the queue or none of them.
 *
 * Remote calls run as a single task on the worker pool; queue and store
 * updates are applied back on the loop thread, followed by one
 * syncFinished() carrying the aggregate summary.
 */
class SyncCoordinator : public QObject
{
    Q_OBJECT
public:
    SyncCoordinator(EntryStatusStore &store,
                    EntryStatusQueue &statusQueue,
                    CollectionQueue &feedQueue,
                    CollectionQueue &categoryQueue,
                    CacheInvalidationBus &bus,
                    NotificationSink &notifications,
                    WorkerPool &pool,
                    RemoteApiFactory apiFactory,
                    ServerSettings server,
                    int batchSize,
                    QObject *parent = nullptr);
    ~SyncCoordinator() override;

    QueueCounts totalQueueCount() const;

    // A null prompt auto-confirms (reconnect trigger). Returns true when a
    // drain was started; every other outcome is reported synchronously
    // through syncFinished().
    bool processAll(ConfirmationPrompt *prompt = nullptr);

    // Discards every pending change after explicit confirmation.
    bool clearAll(ConfirmationPrompt &prompt);

    bool isDraining() const
    {
        return static_cast<bool>(m_drainToken);
    }

    // Abandons an in-flight drain; the queues keep whatever was not applied.
    void cancel();

    void setServerSettings(const ServerSettings &server);
    void setBatchSize(int batchSize);

    static std::vector<StatusBatch> planStatusBatches(const EntryStatusQueue::Map &entries,
                                                      int batchSize);

signals:
    void syncFinished(const fluxsync::SyncSummary &summary);

private:
    struct DrainPlan {
        std::vector<StatusBatch> statusBatches;
        std::vector<int64_t> feedIds;
        std::vector<int64_t> categoryIds;
        std::chrono::system_clock::time_point startedAt;
    };

    struct CallOutcome {
        int64_t id = 0;
        ApiResult result;
    };

    struct DrainReport {
        std::vector<ApiResult> batchResults;
        std::vector<CallOutcome> feedResults;
        std::vector<CallOutcome> categoryResults;
    };

    bool startDrain();
    void applyDrainReport(const DrainPlan &plan, const DrainReport &report);
    void confirmLocalStatus(const StatusBatch &batch, std::chrono::system_clock::time_point since);
    bool clearQueues();
    void notifyCompletion(const SyncSummary &summary);
    void finish(const SyncSummary &summary);

    EntryStatusStore &m_store;
    EntryStatusQueue &m_statusQueue;
    CollectionQueue &m_feedQueue;
    CollectionQueue &m_categoryQueue;
    CacheInvalidationBus &m_bus;
    NotificationSink &m_notifications;
    WorkerPool &m_pool;
    RemoteApiFactory m_apiFactory;
    ServerSettings m_server;
    int m_batchSize;

    CancellationTokenPtr m_drainToken;
};

} // namespace fluxsync

Q_DECLARE_METATYPE(fluxsync::SyncSummary)
