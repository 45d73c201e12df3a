#include "engine/sync_coordinator.hpp"

#include <algorithm>
#include <utility>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/cache_invalidation_bus.hpp"
#include "engine/notification_sink.hpp"
#include "engine/worker_pool.hpp"
#include "store/entry_status_store.hpp"

namespace fluxsync {

namespace {

template <typename Map>
std::vector<int64_t> keysOf(const Map &entries)
{
    std::vector<int64_t> ids;
    ids.reserve(entries.size());
    for (const auto &item : entries) {
        ids.push_back(item.first);
    }
    return ids;
}

void appendChunks(std::vector<StatusBatch> &batches,
                  EntryStatus target,
                  const std::vector<int64_t> &ids,
                  int batchSize)
{
    if (ids.empty()) {
        return;
    }
    const std::size_t chunk = batchSize > 0 ? static_cast<std::size_t>(batchSize) : ids.size();
    for (std::size_t offset = 0; offset < ids.size(); offset += chunk) {
        StatusBatch batch;
        batch.targetStatus = target;
        const auto first = ids.begin() + static_cast<std::ptrdiff_t>(offset);
        const auto last = ids.begin() + static_cast<std::ptrdiff_t>(std::min(ids.size(), offset + chunk));
        batch.entryIds.assign(first, last);
        batches.push_back(std::move(batch));
    }
}

std::string countPhrase(int count, const char *singular, const char *pluralFormat)
{
    if (count == 1) {
        return singular;
    }
    return std::to_string(count) + pluralFormat;
}

} // namespace

SyncCoordinator::SyncCoordinator(EntryStatusStore &store,
                                 EntryStatusQueue &statusQueue,
                                 CollectionQueue &feedQueue,
                                 CollectionQueue &categoryQueue,
                                 CacheInvalidationBus &bus,
                                 NotificationSink &notifications,
                                 WorkerPool &pool,
                                 RemoteApiFactory apiFactory,
                                 ServerSettings server,
                                 int batchSize,
                                 QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_statusQueue(statusQueue)
    , m_feedQueue(feedQueue)
    , m_categoryQueue(categoryQueue)
    , m_bus(bus)
    , m_notifications(notifications)
    , m_pool(pool)
    , m_apiFactory(std::move(apiFactory))
    , m_server(std::move(server))
    , m_batchSize(batchSize)
{
}

SyncCoordinator::~SyncCoordinator()
{
    cancel();
    m_pool.waitForDone();
}

QueueCounts SyncCoordinator::totalQueueCount() const
{
    QueueCounts counts;
    counts.entryStatus = m_statusQueue.count();
    counts.feeds = m_feedQueue.count();
    counts.categories = m_categoryQueue.count();
    return counts;
}

std::vector<StatusBatch> SyncCoordinator::planStatusBatches(const EntryStatusQueue::Map &entries,
                                                            int batchSize)
{
    std::vector<int64_t> readIds;
    std::vector<int64_t> unreadIds;
    for (const auto &[entryId, entry] : entries) {
        switch (entry.targetStatus) {
        case EntryStatus::Read:
            readIds.push_back(entryId);
            break;
        case EntryStatus::Unread:
            unreadIds.push_back(entryId);
            break;
        case EntryStatus::Removed:
            break;
        }
    }

    std::vector<StatusBatch> batches;
    appendChunks(batches, EntryStatus::Read, readIds, batchSize);
    appendChunks(batches, EntryStatus::Unread, unreadIds, batchSize);
    return batches;
}

bool SyncCoordinator::processAll(ConfirmationPrompt *prompt)
{
    if (isDraining()) {
        FSLOG_INFO(QStringLiteral("SyncCoordinator"),
                   QStringLiteral("processAll"),
                   QStringLiteral("drain_already_running"),
                   QStringLiteral("duplicate_trigger"),
                   QStringLiteral("ignore"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
        return false;
    }

    const QueueCounts counts = totalQueueCount();
    SyncSummary summary;

    if (counts.total() == 0) {
        m_notifications.info("All changes are already synced");
        summary.nothingToSync = true;
        finish(summary);
        return false;
    }

    FSLOG_INFO(QStringLiteral("SyncCoordinator"),
               QStringLiteral("processAll"),
               QStringLiteral("queues_pending"),
               prompt ? QStringLiteral("user_request") : QStringLiteral("auto_confirmed"),
               QStringLiteral("durable_queue"),
               logging::defaultWho(),
               QString(),
               nlohmann::json(counts));

    if (prompt) {
        switch (prompt->confirmSync(counts)) {
        case SyncDecision::Later:
            summary.deferred = true;
            finish(summary);
            return false;
        case SyncDecision::DeleteQueue:
            summary.cleared = clearQueues();
            finish(summary);
            return false;
        case SyncDecision::SyncNow:
            break;
        }
    }

    return startDrain();
}

bool SyncCoordinator::clearAll(ConfirmationPrompt &prompt)
{
    const QueueCounts counts = totalQueueCount();
    if (!prompt.confirmClear(counts.total())) {
        return false;
    }
    return clearQueues();
}

void SyncCoordinator::cancel()
{
    if (m_drainToken) {
        m_drainToken->cancel();
        m_drainToken.reset();
    }
}

void SyncCoordinator::setServerSettings(const ServerSettings &server)
{
    m_server = server;
}

void SyncCoordinator::setBatchSize(int batchSize)
{
    m_batchSize = batchSize;
}

bool SyncCoordinator::startDrain()
{
    DrainPlan plan;
    plan.statusBatches = planStatusBatches(m_statusQueue.load(), m_batchSize);
    plan.feedIds = keysOf(m_feedQueue.load());
    plan.categoryIds = keysOf(m_categoryQueue.load());
    plan.startedAt = std::chrono::system_clock::now();

    const QString corrId = logging::newCorrelationId();
    logging::CorrelationScope scope(corrId);

    const ServerSettings server = m_server;
    const RemoteApiFactory factory = m_apiFactory;

    m_drainToken = m_pool.submit(
        this,
        [plan, server, factory](const CancellationTokenPtr &token) {
            DrainReport report;
            std::unique_ptr<RemoteApi> api = factory(server, token);

            auto call = [&](auto &&fn) {
                if (!api) {
                    return ApiResult::failure("No remote API available");
                }
                return fn(*api);
            };

            for (const StatusBatch &batch : plan.statusBatches) {
                if (token->isCancelled()) {
                    return report;
                }
                report.batchResults.push_back(call([&](RemoteApi &remote) {
                    return remote.updateEntries(batch.entryIds, batch.targetStatus);
                }));
            }
            for (int64_t feedId : plan.feedIds) {
                if (token->isCancelled()) {
                    return report;
                }
                report.feedResults.push_back(CallOutcome{feedId, call([&](RemoteApi &remote) {
                    return remote.markFeedAsRead(feedId);
                })});
            }
            for (int64_t categoryId : plan.categoryIds) {
                if (token->isCancelled()) {
                    return report;
                }
                report.categoryResults.push_back(CallOutcome{categoryId, call([&](RemoteApi &remote) {
                    return remote.markCategoryAsRead(categoryId);
                })});
            }
            return report;
        },
        [this, plan](const DrainReport &report) {
            applyDrainReport(plan, report);
        });

    if (!m_drainToken) {
        FSLOG_WARN(QStringLiteral("SyncCoordinator"),
                   QStringLiteral("startDrain"),
                   QStringLiteral("drain_refused"),
                   QStringLiteral("workers_suspended"),
                   QStringLiteral("worker_pool"),
                   logging::defaultWho(),
                   corrId,
                   nlohmann::json::object());
        SyncSummary summary;
        summary.deferred = true;
        finish(summary);
        return false;
    }

    FSLOG_INFO(QStringLiteral("SyncCoordinator"),
               QStringLiteral("startDrain"),
               QStringLiteral("drain_started"),
               QStringLiteral("sync_requested"),
               QStringLiteral("worker_pool"),
               logging::defaultWho(),
               corrId,
               (nlohmann::json{{"statusBatches", plan.statusBatches.size()},
                               {"feeds", plan.feedIds.size()},
                               {"categories", plan.categoryIds.size()}}));
    return true;
}

void SyncCoordinator::applyDrainReport(const DrainPlan &plan, const DrainReport &report)
{
    m_drainToken.reset();

    SyncSummary summary;

    for (std::size_t i = 0; i < report.batchResults.size(); ++i) {
        const StatusBatch &batch = plan.statusBatches[i];
        const ApiResult &result = report.batchResults[i];
        const int size = static_cast<int>(batch.entryIds.size());
        ++summary.remoteCalls;

        if (!result.ok) {
            summary.failed += size;
            FSLOG_WARN(QStringLiteral("SyncCoordinator"),
                       QStringLiteral("applyDrainReport"),
                       QStringLiteral("status_batch_failed"),
                       QStringLiteral("remote_rejected"),
                       QStringLiteral("put_entries"),
                       logging::defaultWho(),
                       logging::currentCorrelationId(),
                       (nlohmann::json{{"targetStatus", toStatusString(batch.targetStatus)},
                                       {"entries", size},
                                       {"httpStatus", result.httpStatus},
                                       {"message", result.message}}));
            continue;
        }

        const EntryStatus target = batch.targetStatus;
        const bool removed = m_statusQueue.removeAll(batch.entryIds,
                                                     [target](int64_t, const StatusQueueEntry &entry) {
                                                         return entry.targetStatus == target;
                                                     });
        if (!removed) {
            FSLOG_ERROR(QStringLiteral("SyncCoordinator"),
                        QStringLiteral("applyDrainReport"),
                        QStringLiteral("queue_remove_failed"),
                        QStringLiteral("io_error"),
                        QStringLiteral("durable_queue"),
                        logging::defaultWho(),
                        logging::currentCorrelationId(),
                        (nlohmann::json{{"entries", size}}));
        }
        confirmLocalStatus(batch, plan.startedAt);
        summary.processed += size;
    }

    auto applyCollection = [&summary](CollectionQueue &queue, const std::vector<CallOutcome> &outcomes) {
        for (const CallOutcome &outcome : outcomes) {
            ++summary.remoteCalls;
            if (outcome.result.ok) {
                if (!queue.remove(outcome.id)) {
                    FSLOG_ERROR(QStringLiteral("SyncCoordinator"),
                                QStringLiteral("applyDrainReport"),
                                QStringLiteral("queue_remove_failed"),
                                QStringLiteral("io_error"),
                                QStringLiteral("durable_queue"),
                                logging::defaultWho(),
                                logging::currentCorrelationId(),
                                (nlohmann::json{{"id", outcome.id}}));
                }
                ++summary.processed;
                continue;
            }
            ++summary.failed;
            FSLOG_WARN(QStringLiteral("SyncCoordinator"),
                       QStringLiteral("applyDrainReport"),
                       QStringLiteral("collection_mark_failed"),
                       QStringLiteral("remote_rejected"),
                       QString::fromStdString(toQueueKindString(queue.kind())),
                       logging::defaultWho(),
                       logging::currentCorrelationId(),
                       (nlohmann::json{{"id", outcome.id},
                                       {"httpStatus", outcome.result.httpStatus},
                                       {"message", outcome.result.message}}));
        }
    };
    applyCollection(m_feedQueue, report.feedResults);
    applyCollection(m_categoryQueue, report.categoryResults);

    if (summary.processed > 0) {
        m_bus.publishInvalidation(QStringLiteral("queue_drained"));
    }

    FSLOG_INFO(QStringLiteral("SyncCoordinator"),
               QStringLiteral("applyDrainReport"),
               QStringLiteral("drain_finished"),
               QStringLiteral("sync_requested"),
               QStringLiteral("worker_pool"),
               logging::defaultWho(),
               logging::currentCorrelationId(),
               nlohmann::json(summary));

    notifyCompletion(summary);
    finish(summary);
}

void SyncCoordinator::confirmLocalStatus(const StatusBatch &batch,
                                         std::chrono::system_clock::time_point since)
{
    WriteOptions options;
    options.unchangedSince = since;

    for (int64_t entryId : batch.entryIds) {
        try {
            const auto record = m_store.load(entryId);
            if (!record || isEntryRead(record->status) == isEntryRead(batch.targetStatus)) {
                continue;
            }
            if (m_store.write(entryId, batch.targetStatus, options)) {
                m_bus.publishEntryStatus(entryId, batch.targetStatus);
            }
        } catch (const StoreError &ex) {
            FSLOG_WARN(QStringLiteral("SyncCoordinator"),
                       QStringLiteral("confirmLocalStatus"),
                       QStringLiteral("local_confirm_failed"),
                       QStringLiteral("store_error"),
                       QStringLiteral("sqlite"),
                       logging::defaultWho(),
                       logging::currentCorrelationId(),
                       (nlohmann::json{{"entryId", entryId}, {"error", ex.what()}}));
        }
    }
}

bool SyncCoordinator::clearQueues()
{
    cancel();

    std::vector<std::string> failedQueues;
    if (!m_statusQueue.clear()) {
        failedQueues.push_back("status");
    }
    if (!m_feedQueue.clear()) {
        failedQueues.push_back("feed");
    }
    if (!m_categoryQueue.clear()) {
        failedQueues.push_back("category");
    }

    if (failedQueues.empty()) {
        FSLOG_INFO(QStringLiteral("SyncCoordinator"),
                   QStringLiteral("clearQueues"),
                   QStringLiteral("queues_cleared"),
                   QStringLiteral("user_confirmed"),
                   QStringLiteral("durable_queue"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
        m_notifications.success("All sync queues cleared");
        return true;
    }

    std::string joined;
    for (const auto &name : failedQueues) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += name;
    }
    FSLOG_ERROR(QStringLiteral("SyncCoordinator"),
                QStringLiteral("clearQueues"),
                QStringLiteral("queue_clear_failed"),
                QStringLiteral("io_error"),
                QStringLiteral("durable_queue"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"queues", failedQueues}}));
    m_notifications.error("Failed to clear queues: " + joined);
    return false;
}

void SyncCoordinator::notifyCompletion(const SyncSummary &summary)
{
    if (summary.processed > 0) {
        std::string message = countPhrase(summary.processed, "1 change synced", " changes synced");
        if (summary.failed > 0) {
            message += ", " + std::to_string(summary.failed) + " failed";
        }
        m_notifications.success(message);
    } else if (summary.failed > 0) {
        m_notifications.error(countPhrase(summary.failed, "1 change failed to sync", " changes failed to sync"));
    }
}

void SyncCoordinator::finish(const SyncSummary &summary)
{
    emit syncFinished(summary);
}

} // namespace fluxsync
