#include "engine/sync_engine.hpp"

#include <utility>

#include "common/fluxsync_version.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/cache_invalidation_bus.hpp"
#include "engine/counts_cache.hpp"
#include "engine/entry_info_cache.hpp"
#include "engine/mark_as_read_service.hpp"
#include "engine/notification_sink.hpp"
#include "engine/status_dispatcher.hpp"
#include "engine/sync_coordinator.hpp"
#include "engine/worker_pool.hpp"
#include "remote/connectivity.hpp"
#include "store/entry_status_store.hpp"

namespace fluxsync {

namespace {

CountsTtl ttlFromSettings(const Settings &settings)
{
    CountsTtl ttl;
    ttl.unreadCount = std::chrono::seconds(settings.unreadCountTtlSeconds);
    ttl.feedCounters = std::chrono::seconds(settings.feedCountersTtlSeconds);
    ttl.categoryCounts = std::chrono::seconds(settings.categoryCountsTtlSeconds);
    return ttl;
}

EntryQuery orderingFromSettings(const Settings &settings)
{
    EntryQuery query;
    query.order = settings.order;
    query.direction = settings.direction;
    return query;
}

} // namespace

SyncEngine::SyncEngine(Settings settings,
                       std::unique_ptr<ConnectivityProbe> probe,
                       NotificationSink &notifications,
                       RemoteApiFactory apiFactory,
                       QObject *parent)
    : QObject(parent)
    , m_settings(std::move(settings))
    , m_notifications(notifications)
    , m_apiFactory(std::move(apiFactory))
    , m_store(std::make_unique<EntryStatusStore>(m_settings.databasePath()))
    , m_statusQueue(std::make_unique<EntryStatusQueue>(QueueKind::EntryStatus, m_settings.statusQueuePath()))
    , m_feedQueue(std::make_unique<CollectionQueue>(QueueKind::Feed, m_settings.feedQueuePath()))
    , m_categoryQueue(std::make_unique<CollectionQueue>(QueueKind::Category, m_settings.categoryQueuePath()))
    , m_bus(std::make_unique<CacheInvalidationBus>())
    , m_probe(std::move(probe))
    , m_pool(std::make_unique<WorkerPool>(m_settings.maxWorkers))
{
    const ServerSettings server = m_settings.serverSnapshot();

    m_dispatcher = std::make_unique<StatusDispatcher>(*m_store,
                                                      *m_statusQueue,
                                                      *m_bus,
                                                      *m_probe,
                                                      m_notifications,
                                                      *m_pool,
                                                      m_apiFactory,
                                                      server,
                                                      m_settings.reaperIntervalMs);
    m_coordinator = std::make_unique<SyncCoordinator>(*m_store,
                                                      *m_statusQueue,
                                                      *m_feedQueue,
                                                      *m_categoryQueue,
                                                      *m_bus,
                                                      m_notifications,
                                                      *m_pool,
                                                      m_apiFactory,
                                                      server,
                                                      m_settings.batchSize);
    m_markAsRead = std::make_unique<MarkAsReadService>(*m_store,
                                                       *m_statusQueue,
                                                       *m_feedQueue,
                                                       *m_categoryQueue,
                                                       *m_bus,
                                                       *m_probe,
                                                       m_notifications,
                                                       *m_pool,
                                                       *m_dispatcher,
                                                       m_apiFactory,
                                                       server);
    m_entryInfo = std::make_unique<EntryInfoCache>(*m_store, *m_bus);
    m_counts = std::make_unique<CountsCache>(*m_bus, ttlFromSettings(m_settings), m_settings.cacheEnabled);

    connect(m_probe.get(), &ConnectivityProbe::connectivityRestored, this, [this]() {
        handleLifecycleEvent(LifecycleEvent::NetworkConnected);
    });
}

SyncEngine::~SyncEngine()
{
    suspendWorkers();
    m_pool->waitForDone();
}

void SyncEngine::start()
{
    FSLOG_INFO(QStringLiteral("SyncEngine"),
               QStringLiteral("start"),
               QStringLiteral("engine_start"),
               QStringLiteral("startup"),
               QStringLiteral("composition_root"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"version", FLUXSYNC_VERSION},
                               {"dataDir", m_settings.dataDir.string()},
                               {"online", m_probe->isOnline()}}));

    std::string integrityMessage;
    if (!m_store->integrityCheck(&integrityMessage)) {
        FSLOG_ERROR(QStringLiteral("SyncEngine"),
                    QStringLiteral("start"),
                    QStringLiteral("integrity_check_failed"),
                    QStringLiteral("database_corrupt"),
                    QStringLiteral("sqlite_pragma"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"message", integrityMessage}}));
        m_notifications.error("Local entry database failed its integrity check");
    }

    m_entryInfo->populate();
}

void SyncEngine::handleLifecycleEvent(LifecycleEvent event)
{
    switch (event) {
    case LifecycleEvent::NetworkConnected: {
        if (m_closed || m_dispatcher->isSuspended()) {
            return;
        }
        const QueueCounts counts = m_coordinator->totalQueueCount();
        if (counts.total() == 0) {
            return;
        }
        if (m_settings.autoSyncOnReconnect) {
            m_coordinator->processAll(nullptr);
        } else if (m_prompt) {
            m_coordinator->processAll(m_prompt);
        }
        break;
    }
    case LifecycleEvent::Suspend:
        suspendWorkers();
        break;
    case LifecycleEvent::Resume:
        if (m_closed) {
            return;
        }
        m_pool->setAccepting(true);
        m_dispatcher->resume();
        m_markAsRead->resume();
        break;
    case LifecycleEvent::Close:
        m_closed = true;
        suspendWorkers();
        break;
    }

    FSLOG_DEBUG(QStringLiteral("SyncEngine"),
                QStringLiteral("handleLifecycleEvent"),
                QStringLiteral("lifecycle_event"),
                QStringLiteral("host_lifecycle"),
                QStringLiteral("switch"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"event", static_cast<int>(event)}}));
}

void SyncEngine::setConfirmationPrompt(ConfirmationPrompt *prompt)
{
    m_prompt = prompt;
}

void SyncEngine::updateSettings(const Settings &settings)
{
    const bool serverChanged = settings.serverAddress != m_settings.serverAddress
        || settings.apiToken != m_settings.apiToken;

    m_settings.serverAddress = settings.serverAddress;
    m_settings.apiToken = settings.apiToken;
    m_settings.connectTimeoutMs = settings.connectTimeoutMs;
    m_settings.totalTimeoutMs = settings.totalTimeoutMs;
    m_settings.batchSize = settings.batchSize;
    m_settings.order = settings.order;
    m_settings.direction = settings.direction;
    m_settings.autoSyncOnReconnect = settings.autoSyncOnReconnect;

    const ServerSettings server = m_settings.serverSnapshot();
    m_dispatcher->setServerSettings(server);
    m_coordinator->setServerSettings(server);
    m_coordinator->setBatchSize(m_settings.batchSize);
    m_markAsRead->setServerSettings(server);

    if (serverChanged) {
        m_bus->publishServerChanged();
    }
}

bool SyncEngine::purgeEntry(int64_t entryId)
{
    m_dispatcher->cancel(entryId);
    m_entryInfo->forget(entryId);
    try {
        return m_store->purge(entryId);
    } catch (const StoreError &ex) {
        FSLOG_ERROR(QStringLiteral("SyncEngine"),
                    QStringLiteral("purgeEntry"),
                    QStringLiteral("purge_failed"),
                    QStringLiteral("store_error"),
                    QStringLiteral("sqlite"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"entryId", entryId}, {"error", ex.what()}}));
        return false;
    }
}

bool SyncEngine::fetchUnreadEntries(int limit)
{
    EntryQuery query = orderingFromSettings(m_settings);
    query.status = EntryStatus::Unread;
    query.limit = limit;

    const ServerSettings server = m_settings.serverSnapshot();
    const RemoteApiFactory factory = m_apiFactory;

    const auto token = m_pool->submit(
        this,
        [server, factory, query](const CancellationTokenPtr &cancel) {
            std::unique_ptr<RemoteApi> api = factory(server, cancel);
            if (!api) {
                return ApiResult::failure("No remote API available");
            }
            return api->fetchEntries(query);
        },
        [this](const ApiResult &result) {
            onEntriesFetched(result);
        });
    return static_cast<bool>(token);
}

bool SyncEngine::requestCounts()
{
    const ServerSettings server = m_settings.serverSnapshot();
    const RemoteApiFactory factory = m_apiFactory;
    const EntryQuery ordering = orderingFromSettings(m_settings);
    CountsCache *counts = m_counts.get();

    const auto token = m_pool->submit(
        this,
        [server, factory, ordering, counts](const CancellationTokenPtr &cancel) {
            std::pair<nlohmann::json, std::string> outcome{nlohmann::json::object(), std::string()};
            std::unique_ptr<RemoteApi> api = factory(server, cancel);
            if (!api) {
                outcome.second = "No remote API available";
                return outcome;
            }

            std::string error;
            if (const auto unread = counts->unreadCount(*api, ordering, &error)) {
                outcome.first["unread"] = *unread;
            }
            if (const auto feeds = counts->feedCounters(*api, &error)) {
                outcome.first["feeds"] = *feeds;
            }
            if (const auto categories = counts->categoryCounts(*api, &error)) {
                outcome.first["categories"] = *categories;
            }
            outcome.second = error;
            return outcome;
        },
        [this](const std::pair<nlohmann::json, std::string> &outcome) {
            emit countsReady(QString::fromStdString(outcome.first.dump()),
                             QString::fromStdString(outcome.second));
        });
    return static_cast<bool>(token);
}

void SyncEngine::suspendWorkers()
{
    m_pool->setAccepting(false);
    m_dispatcher->suspend();
    m_markAsRead->suspend();
    m_coordinator->cancel();
    m_pool->cancelAll();
}

void SyncEngine::onEntriesFetched(const ApiResult &result)
{
    if (!result.ok) {
        emit entriesFetched(0, QString::fromStdString(result.message));
        return;
    }

    const nlohmann::json entries = result.body.is_object()
        ? result.body.value("entries", nlohmann::json::array())
        : nlohmann::json::array();
    const EntryStatusQueue::Map pending = m_statusQueue->load();

    int materialized = 0;
    QString error;
    for (const auto &item : entries) {
        if (!item.is_object()) {
            continue;
        }
        EntityStatusRecord record;
        try {
            record = item.get<EntityStatusRecord>();
        } catch (const nlohmann::json::exception &ex) {
            FSLOG_WARN(QStringLiteral("SyncEngine"),
                       QStringLiteral("onEntriesFetched"),
                       QStringLiteral("entry_skipped"),
                       QStringLiteral("malformed_entry"),
                       QStringLiteral("nlohmann_json"),
                       logging::defaultWho(),
                       logging::currentCorrelationId(),
                       (nlohmann::json{{"error", ex.what()}}));
            continue;
        }
        if (!isValidEntityId(record.id)) {
            continue;
        }
        // A queued local change wins over the server's view until it syncs.
        const auto queued = pending.find(record.id);
        if (queued != pending.end()) {
            record.status = queued->second.targetStatus;
        }
        try {
            // So does the optimistic status of an entry with a dispatch in flight.
            if (queued == pending.end() && m_dispatcher->hasLiveWorker(record.id)) {
                if (const auto local = m_store->load(record.id)) {
                    record.status = local->status;
                }
            }
            m_store->materialize(record);
            ++materialized;
        } catch (const StoreError &ex) {
            error = QString::fromUtf8(ex.what());
            break;
        }
    }

    m_entryInfo->populate();

    FSLOG_INFO(QStringLiteral("SyncEngine"),
               QStringLiteral("onEntriesFetched"),
               QStringLiteral("entries_materialized"),
               QStringLiteral("fetch_requested"),
               QStringLiteral("sqlite"),
               logging::defaultWho(),
               logging::currentCorrelationId(),
               (nlohmann::json{{"materialized", materialized},
                               {"received", entries.size()},
                               {"error", error.toStdString()}}));

    emit entriesFetched(materialized, error);
}

EntryStatusStore &SyncEngine::store()
{
    return *m_store;
}

EntryStatusQueue &SyncEngine::statusQueue()
{
    return *m_statusQueue;
}

CollectionQueue &SyncEngine::feedQueue()
{
    return *m_feedQueue;
}

CollectionQueue &SyncEngine::categoryQueue()
{
    return *m_categoryQueue;
}

CacheInvalidationBus &SyncEngine::bus()
{
    return *m_bus;
}

ConnectivityProbe &SyncEngine::probe()
{
    return *m_probe;
}

WorkerPool &SyncEngine::workerPool()
{
    return *m_pool;
}

StatusDispatcher &SyncEngine::dispatcher()
{
    return *m_dispatcher;
}

SyncCoordinator &SyncEngine::coordinator()
{
    return *m_coordinator;
}

MarkAsReadService &SyncEngine::markAsRead()
{
    return *m_markAsRead;
}

EntryInfoCache &SyncEngine::entryInfo()
{
    return *m_entryInfo;
}

CountsCache &SyncEngine::counts()
{
    return *m_counts;
}

} // namespace fluxsync
