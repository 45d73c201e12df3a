#include "engine/mark_as_read_service.hpp"

#include <utility>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/cache_invalidation_bus.hpp"
#include "engine/notification_sink.hpp"
#include "engine/status_dispatcher.hpp"
#include "engine/worker_pool.hpp"
#include "remote/connectivity.hpp"
#include "store/entry_status_store.hpp"

namespace fluxsync {

namespace {

const char *collectionLabel(QueueKind kind)
{
    return kind == QueueKind::Feed ? "Feed" : "Category";
}

} // namespace

MarkAsReadService::MarkAsReadService(EntryStatusStore &store,
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
                                     QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_statusQueue(statusQueue)
    , m_feedQueue(feedQueue)
    , m_categoryQueue(categoryQueue)
    , m_bus(bus)
    , m_probe(probe)
    , m_notifications(notifications)
    , m_pool(pool)
    , m_dispatcher(dispatcher)
    , m_apiFactory(std::move(apiFactory))
    , m_server(std::move(server))
{
}

MarkAsReadService::~MarkAsReadService()
{
    for (auto &[operationId, operation] : m_inFlight) {
        Q_UNUSED(operationId)
        operation.token->cancel();
    }
    m_inFlight.clear();
    m_pool.waitForDone();
}

bool MarkAsReadService::markFeedAsRead(int64_t feedId)
{
    return markCollection(QueueKind::Feed, feedId);
}

bool MarkAsReadService::markCategoryAsRead(int64_t categoryId)
{
    return markCollection(QueueKind::Category, categoryId);
}

bool MarkAsReadService::markEntries(const std::vector<int64_t> &entryIds, EntryStatus status)
{
    if (status == EntryStatus::Removed) {
        return false;
    }

    Operation operation;
    operation.kind = QueueKind::EntryStatus;
    operation.status = status;
    for (int64_t entryId : entryIds) {
        if (isValidEntityId(entryId)) {
            operation.entryIds.push_back(entryId);
        }
    }
    if (operation.entryIds.empty()) {
        m_notifications.error("Cannot change status: invalid entry ID");
        return false;
    }

    if (!applyLocalStatus(operation.entryIds, status)) {
        return false;
    }
    for (int64_t entryId : operation.entryIds) {
        m_dispatcher.cancel(entryId);
    }

    if (canReachServer() && submit(operation)) {
        return true;
    }
    queueOperation(operation);
    notifyQueued(operation);
    return true;
}

void MarkAsReadService::suspend()
{
    m_suspended = true;
    for (auto &[operationId, operation] : m_inFlight) {
        Q_UNUSED(operationId)
        operation.token->cancel();
        queueOperation(operation);
    }
    m_inFlight.clear();
}

void MarkAsReadService::resume()
{
    m_suspended = false;
}

void MarkAsReadService::setServerSettings(const ServerSettings &server)
{
    m_server = server;
}

bool MarkAsReadService::markCollection(QueueKind kind, int64_t collectionId)
{
    if (!isValidEntityId(collectionId)) {
        m_notifications.error(kind == QueueKind::Feed ? "Invalid feed ID" : "Invalid category ID");
        return false;
    }

    Operation operation;
    operation.kind = kind;
    operation.collectionId = collectionId;

    if (canReachServer() && submit(operation)) {
        return true;
    }
    queueOperation(operation);
    notifyQueued(operation);
    return true;
}

bool MarkAsReadService::canReachServer() const
{
    return !m_suspended
        && m_probe.isOnline()
        && !m_server.serverAddress.empty()
        && !m_server.apiToken.empty();
}

bool MarkAsReadService::submit(Operation operation)
{
    const quint64 operationId = m_nextOperationId++;
    const QString corrId = logging::newCorrelationId();
    logging::CorrelationScope scope(corrId);

    const ServerSettings server = m_server;
    const RemoteApiFactory factory = m_apiFactory;
    const QueueKind kind = operation.kind;
    const int64_t collectionId = operation.collectionId;
    const std::vector<int64_t> entryIds = operation.entryIds;
    const EntryStatus status = operation.status;

    operation.token = m_pool.submit(
        this,
        [server, factory, kind, collectionId, entryIds, status](const CancellationTokenPtr &token) {
            std::unique_ptr<RemoteApi> api = factory(server, token);
            if (!api) {
                return ApiResult::failure("No remote API available");
            }
            switch (kind) {
            case QueueKind::Feed:
                return api->markFeedAsRead(collectionId);
            case QueueKind::Category:
                return api->markCategoryAsRead(collectionId);
            case QueueKind::EntryStatus:
                break;
            }
            return api->updateEntries(entryIds, status);
        },
        [this, operationId](const ApiResult &result) {
            onOperationFinished(operationId, result);
        });

    if (!operation.token) {
        return false;
    }

    FSLOG_INFO(QStringLiteral("MarkAsReadService"),
               QStringLiteral("submit"),
               QStringLiteral("bulk_mark_started"),
               QStringLiteral("user_mutation"),
               QStringLiteral("worker_pool"),
               logging::defaultWho(),
               corrId,
               (nlohmann::json{{"kind", toQueueKindString(kind)},
                               {"collectionId", collectionId},
                               {"entries", entryIds.size()},
                               {"status", toStatusString(status)}}));

    m_inFlight.emplace(operationId, std::move(operation));
    return true;
}

void MarkAsReadService::onOperationFinished(quint64 operationId, const ApiResult &result)
{
    const auto it = m_inFlight.find(operationId);
    if (it == m_inFlight.end()) {
        return;
    }
    const Operation operation = std::move(it->second);
    m_inFlight.erase(it);

    if (result.ok) {
        bool removed = true;
        if (operation.kind == QueueKind::EntryStatus) {
            const EntryStatus status = operation.status;
            removed = m_statusQueue.removeAll(operation.entryIds,
                                              [status](int64_t, const StatusQueueEntry &entry) {
                                                  return entry.targetStatus == status;
                                              });
        } else {
            removed = collectionQueue(operation.kind).remove(operation.collectionId);
        }
        if (!removed) {
            FSLOG_WARN(QStringLiteral("MarkAsReadService"),
                       QStringLiteral("onOperationFinished"),
                       QStringLiteral("queue_remove_failed"),
                       QStringLiteral("io_error"),
                       QStringLiteral("durable_queue"),
                       logging::defaultWho(),
                       logging::currentCorrelationId(),
                       (nlohmann::json{{"kind", toQueueKindString(operation.kind)}}));
        }
        m_bus.publishInvalidation(QStringLiteral("bulk_mark_synced"));
        notifySynced(operation);
    } else {
        FSLOG_WARN(QStringLiteral("MarkAsReadService"),
                   QStringLiteral("onOperationFinished"),
                   QStringLiteral("bulk_mark_failed"),
                   QStringLiteral("remote_rejected"),
                   QStringLiteral("queue_fallback"),
                   logging::defaultWho(),
                   logging::currentCorrelationId(),
                   (nlohmann::json{{"kind", toQueueKindString(operation.kind)},
                                   {"httpStatus", result.httpStatus},
                                   {"message", result.message}}));
        queueOperation(operation);
        notifyQueued(operation);
    }

    emit operationSettled(operation.kind, result.ok);
}

bool MarkAsReadService::applyLocalStatus(const std::vector<int64_t> &entryIds, EntryStatus status)
{
    for (int64_t entryId : entryIds) {
        try {
            const auto record = m_store.load(entryId);
            if (!record || record->status == status) {
                continue;
            }
            m_store.write(entryId, status);
            m_bus.publishEntryStatus(entryId, status);
        } catch (const StoreError &ex) {
            FSLOG_ERROR(QStringLiteral("MarkAsReadService"),
                        QStringLiteral("applyLocalStatus"),
                        QStringLiteral("local_write_failed"),
                        QStringLiteral("store_error"),
                        QStringLiteral("sqlite"),
                        logging::defaultWho(),
                        logging::currentCorrelationId(),
                        (nlohmann::json{{"entryId", entryId}, {"error", ex.what()}}));
            m_notifications.error(std::string("Failed to update entry status: ") + ex.what());
            return false;
        }
    }
    return true;
}

void MarkAsReadService::queueOperation(const Operation &operation)
{
    const auto now = std::chrono::system_clock::now();
    bool queued = false;

    if (operation.kind == QueueKind::EntryStatus) {
        EntryStatusQueue::Map additions;
        for (int64_t entryId : operation.entryIds) {
            StatusQueueEntry entry;
            entry.targetStatus = operation.status;
            entry.originalStatus = oppositeStatus(operation.status);
            entry.timestamp = now;
            additions[entryId] = entry;
        }
        queued = m_statusQueue.enqueueAll(additions);
    } else {
        CollectionQueueEntry entry;
        entry.operation = CollectionOperation::MarkAllRead;
        entry.timestamp = now;
        queued = collectionQueue(operation.kind).enqueue(operation.collectionId, entry);
    }

    if (!queued) {
        FSLOG_ERROR(QStringLiteral("MarkAsReadService"),
                    QStringLiteral("queueOperation"),
                    QStringLiteral("enqueue_failed"),
                    QStringLiteral("io_error"),
                    QStringLiteral("durable_queue"),
                    logging::defaultWho(),
                    logging::currentCorrelationId(),
                    (nlohmann::json{{"kind", toQueueKindString(operation.kind)}}));
        m_notifications.error("Failed to save pending change for later sync");
    }
}

void MarkAsReadService::notifyQueued(const Operation &operation)
{
    if (operation.kind == QueueKind::EntryStatus) {
        m_notifications.info(isEntryRead(operation.status)
                                 ? "Marked as read (will sync when online)"
                                 : "Marked as unread (will sync when online)");
        return;
    }
    m_notifications.info(std::string(collectionLabel(operation.kind))
                         + " marked as read (will sync when online)");
}

void MarkAsReadService::notifySynced(const Operation &operation)
{
    if (operation.kind == QueueKind::EntryStatus) {
        m_notifications.success("Successfully marked " + std::to_string(operation.entryIds.size())
                                + " entries as " + toStatusString(operation.status));
        return;
    }
    m_notifications.success(std::string(collectionLabel(operation.kind)) + " marked as read");
}

CollectionQueue &MarkAsReadService::collectionQueue(QueueKind kind)
{
    return kind == QueueKind::Feed ? m_feedQueue : m_categoryQueue;
}

} // namespace fluxsync
