#include "engine/status_dispatcher.hpp"

#include <utility>

#include <QTimer>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/cache_invalidation_bus.hpp"
#include "engine/notification_sink.hpp"
#include "engine/worker_pool.hpp"
#include "remote/connectivity.hpp"
#include "store/entry_status_store.hpp"

namespace fluxsync {

namespace {

std::string offlineMessage(EntryStatus status)
{
    return isEntryRead(status) ? "Marked as read (will sync when online)"
                               : "Marked as unread (will sync when online)";
}

} // namespace

StatusDispatcher::StatusDispatcher(EntryStatusStore &store,
                                   EntryStatusQueue &queue,
                                   CacheInvalidationBus &bus,
                                   ConnectivityProbe &probe,
                                   NotificationSink &notifications,
                                   WorkerPool &pool,
                                   RemoteApiFactory apiFactory,
                                   ServerSettings server,
                                   int reaperIntervalMs,
                                   QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_queue(queue)
    , m_bus(bus)
    , m_probe(probe)
    , m_notifications(notifications)
    , m_pool(pool)
    , m_apiFactory(std::move(apiFactory))
    , m_server(std::move(server))
    , m_reaper(new QTimer(this))
{
    m_reaper->setInterval(reaperIntervalMs);
    connect(m_reaper, &QTimer::timeout, this, &StatusDispatcher::reapFinishedHandles);
}

StatusDispatcher::~StatusDispatcher()
{
    cancelAll();
    m_pool.waitForDone();
}

DispatchResult StatusDispatcher::dispatch(int64_t entryId, EntryStatus newStatus)
{
    if (!isValidEntityId(entryId) || newStatus == EntryStatus::Removed) {
        return DispatchResult::InvalidRequest;
    }

    std::optional<EntityStatusRecord> record;
    try {
        record = m_store.load(entryId);
    } catch (const StoreError &ex) {
        FSLOG_ERROR(QStringLiteral("StatusDispatcher"),
                    QStringLiteral("dispatch"),
                    QStringLiteral("load_failed"),
                    QStringLiteral("store_error"),
                    QStringLiteral("sqlite"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"entryId", entryId}, {"error", ex.what()}}));
        return DispatchResult::LocalWriteFailed;
    }

    if (!record) {
        FSLOG_WARN(QStringLiteral("StatusDispatcher"),
                   QStringLiteral("dispatch"),
                   QStringLiteral("entry_not_materialized"),
                   QStringLiteral("no_local_record"),
                   QStringLiteral("sqlite"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"entryId", entryId}}));
        return DispatchResult::LocalWriteFailed;
    }

    const EntryStatus original = record->status;
    if (isEntryRead(original) == isEntryRead(newStatus)) {
        cancel(entryId);
        return DispatchResult::NoOp;
    }

    try {
        m_store.write(entryId, newStatus);
    } catch (const StoreError &ex) {
        FSLOG_ERROR(QStringLiteral("StatusDispatcher"),
                    QStringLiteral("dispatch"),
                    QStringLiteral("optimistic_write_failed"),
                    QStringLiteral("store_error"),
                    QStringLiteral("sqlite"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"entryId", entryId}, {"error", ex.what()}}));
        return DispatchResult::LocalWriteFailed;
    }
    m_bus.publishEntryStatus(entryId, newStatus);

    cancel(entryId);

    const bool canReachServer = !m_suspended
        && m_probe.isOnline()
        && !m_server.serverAddress.empty()
        && !m_server.apiToken.empty();
    if (canReachServer && startWorker(entryId, newStatus, original)) {
        return DispatchResult::Dispatched;
    }

    queueFallback(entryId, newStatus, original);
    m_notifications.info(offlineMessage(newStatus));
    return DispatchResult::Queued;
}

bool StatusDispatcher::cancel(int64_t entryId)
{
    const auto it = m_handles.find(entryId);
    if (it == m_handles.end()) {
        return false;
    }
    const bool wasLive = isLive(it->second);
    if (it->second.token) {
        it->second.token->cancel();
    }
    m_handles.erase(it);

    if (wasLive) {
        FSLOG_DEBUG(QStringLiteral("StatusDispatcher"),
                    QStringLiteral("cancel"),
                    QStringLiteral("worker_cancelled"),
                    QStringLiteral("superseded"),
                    QStringLiteral("cancellation_token"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"entryId", entryId}}));
    }
    return wasLive;
}

void StatusDispatcher::cancelAll()
{
    for (auto &[entryId, handle] : m_handles) {
        Q_UNUSED(entryId)
        if (handle.token) {
            handle.token->cancel();
        }
    }
    m_handles.clear();
    m_reaper->stop();
}

void StatusDispatcher::suspend()
{
    m_suspended = true;

    int requeued = 0;
    for (auto &[entryId, handle] : m_handles) {
        if (!isLive(handle)) {
            continue;
        }
        handle.token->cancel();
        queueFallback(entryId, handle.targetStatus, handle.originalStatus);
        ++requeued;
    }
    m_handles.clear();
    m_reaper->stop();

    FSLOG_INFO(QStringLiteral("StatusDispatcher"),
               QStringLiteral("suspend"),
               QStringLiteral("dispatcher_suspended"),
               QStringLiteral("lifecycle"),
               QStringLiteral("cancel_and_queue"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"requeued", requeued}}));
}

void StatusDispatcher::resume()
{
    m_suspended = false;
}

void StatusDispatcher::setServerSettings(const ServerSettings &server)
{
    m_server = server;
}

std::size_t StatusDispatcher::liveWorkerCount() const
{
    std::size_t count = 0;
    for (const auto &[entryId, handle] : m_handles) {
        Q_UNUSED(entryId)
        if (isLive(handle)) {
            ++count;
        }
    }
    return count;
}

bool StatusDispatcher::hasLiveWorker(int64_t entryId) const
{
    const auto it = m_handles.find(entryId);
    return it != m_handles.end() && isLive(it->second);
}

void StatusDispatcher::reapFinishedHandles()
{
    std::size_t reaped = 0;
    for (auto it = m_handles.begin(); it != m_handles.end();) {
        if (isLive(it->second)) {
            ++it;
            continue;
        }
        it = m_handles.erase(it);
        ++reaped;
    }
    if (m_handles.empty()) {
        m_reaper->stop();
    }

    if (reaped > 0) {
        FSLOG_DEBUG(QStringLiteral("StatusDispatcher"),
                    QStringLiteral("reapFinishedHandles"),
                    QStringLiteral("handles_reaped"),
                    QStringLiteral("periodic_cleanup"),
                    QStringLiteral("qtimer"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"reaped", reaped}, {"remaining", m_handles.size()}}));
    }
}

bool StatusDispatcher::isLive(const DispatchHandle &handle) const
{
    return !handle.finished && handle.token && !handle.token->isCancelled();
}

bool StatusDispatcher::startWorker(int64_t entryId, EntryStatus target, EntryStatus original)
{
    DispatchHandle handle;
    handle.generation = m_nextGeneration++;
    handle.targetStatus = target;
    handle.originalStatus = original;
    handle.dispatchedAt = std::chrono::system_clock::now();
    handle.correlationId = logging::newCorrelationId();

    logging::CorrelationScope scope(handle.correlationId);

    // The worker only sees these copies.
    const ServerSettings server = m_server;
    const RemoteApiFactory factory = m_apiFactory;
    const ConnectivityProbe *probe = &m_probe;
    const quint64 generation = handle.generation;

    handle.token = m_pool.submit(
        this,
        [server, factory, probe, entryId, target](const CancellationTokenPtr &token) {
            WorkerReport report;
            if (!probe->isOnline()) {
                report.outcome = WorkerOutcome::Offline;
                return report;
            }
            std::unique_ptr<RemoteApi> api = factory(server, token);
            if (!api) {
                report.result = ApiResult::failure("No remote API available");
                return report;
            }
            report.result = api->updateEntries({entryId}, target);
            report.outcome = report.result.ok ? WorkerOutcome::Synced : WorkerOutcome::Failed;
            return report;
        },
        [this, entryId, generation](const WorkerReport &report) {
            onWorkerFinished(entryId, generation, report);
        });

    if (!handle.token) {
        return false;
    }

    m_handles[entryId] = handle;
    ensureReaperRunning();

    FSLOG_INFO(QStringLiteral("StatusDispatcher"),
               QStringLiteral("startWorker"),
               QStringLiteral("dispatch_started"),
               QStringLiteral("user_mutation"),
               QStringLiteral("worker_pool"),
               logging::defaultWho(),
               handle.correlationId,
               (nlohmann::json{{"entryId", entryId},
                               {"targetStatus", toStatusString(target)},
                               {"originalStatus", toStatusString(original)},
                               {"generation", generation}}));
    return true;
}

void StatusDispatcher::onWorkerFinished(int64_t entryId, quint64 generation, const WorkerReport &report)
{
    const auto it = m_handles.find(entryId);
    if (it == m_handles.end() || it->second.generation != generation || !isLive(it->second)) {
        FSLOG_DEBUG(QStringLiteral("StatusDispatcher"),
                    QStringLiteral("onWorkerFinished"),
                    QStringLiteral("stale_worker_result"),
                    QStringLiteral("superseded"),
                    QStringLiteral("generation_check"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"entryId", entryId}, {"generation", generation}}));
        return;
    }

    it->second.finished = true;
    const DispatchHandle handle = it->second;

    bool synced = false;
    switch (report.outcome) {
    case WorkerOutcome::Synced:
        if (!m_queue.remove(entryId)) {
            FSLOG_WARN(QStringLiteral("StatusDispatcher"),
                       QStringLiteral("onWorkerFinished"),
                       QStringLiteral("queue_remove_failed"),
                       QStringLiteral("io_error"),
                       QStringLiteral("durable_queue"),
                       logging::defaultWho(),
                       handle.correlationId,
                       (nlohmann::json{{"entryId", entryId}}));
        }
        m_bus.publishInvalidation(QStringLiteral("entry_status_synced"));
        synced = true;
        break;
    case WorkerOutcome::Offline:
        queueFallback(entryId, handle.targetStatus, handle.originalStatus);
        m_notifications.info(offlineMessage(handle.targetStatus));
        break;
    case WorkerOutcome::Failed:
        revertLocal(entryId, handle);
        queueFallback(entryId, handle.targetStatus, handle.originalStatus);
        m_notifications.error("Failed to update entry status: " + report.result.message);
        break;
    }

    FSLOG_INFO(QStringLiteral("StatusDispatcher"),
               QStringLiteral("onWorkerFinished"),
               synced ? QStringLiteral("dispatch_synced") : QStringLiteral("dispatch_queued"),
               report.outcome == WorkerOutcome::Offline ? QStringLiteral("offline")
                                                        : QStringLiteral("remote_result"),
               QStringLiteral("worker_pool"),
               logging::defaultWho(),
               handle.correlationId,
               (nlohmann::json{{"entryId", entryId},
                               {"httpStatus", report.result.httpStatus},
                               {"message", report.result.message},
                               {"timedOut", report.result.timedOut}}));

    emit dispatchSettled(entryId, synced);
}

void StatusDispatcher::revertLocal(int64_t entryId, const DispatchHandle &handle)
{
    WriteOptions options;
    options.viaWorker = true;
    options.unchangedSince = handle.dispatchedAt;

    try {
        if (m_store.write(entryId, handle.originalStatus, options)) {
            m_bus.publishEntryStatus(entryId, handle.originalStatus);
        }
    } catch (const StoreError &ex) {
        FSLOG_ERROR(QStringLiteral("StatusDispatcher"),
                    QStringLiteral("revertLocal"),
                    QStringLiteral("revert_failed"),
                    QStringLiteral("store_error"),
                    QStringLiteral("sqlite"),
                    logging::defaultWho(),
                    handle.correlationId,
                    (nlohmann::json{{"entryId", entryId}, {"error", ex.what()}}));
    }
}

void StatusDispatcher::queueFallback(int64_t entryId, EntryStatus target, EntryStatus original)
{
    StatusQueueEntry entry;
    entry.targetStatus = target;
    entry.originalStatus = original;
    entry.timestamp = std::chrono::system_clock::now();

    if (!m_queue.enqueue(entryId, entry)) {
        FSLOG_ERROR(QStringLiteral("StatusDispatcher"),
                    QStringLiteral("queueFallback"),
                    QStringLiteral("enqueue_failed"),
                    QStringLiteral("io_error"),
                    QStringLiteral("durable_queue"),
                    logging::defaultWho(),
                    logging::currentCorrelationId(),
                    (nlohmann::json{{"entryId", entryId}}));
        m_notifications.error("Failed to save pending change for later sync");
    }
}

void StatusDispatcher::ensureReaperRunning()
{
    if (!m_reaper->isActive()) {
        m_reaper->start();
    }
}

} // namespace fluxsync
