#include "engine/counts_cache.hpp"

#include "common/logging.hpp"
#include "engine/cache_invalidation_bus.hpp"

namespace fluxsync {

CountsCache::CountsCache(CacheInvalidationBus &bus, CountsTtl ttl, bool enabled, QObject *parent)
    : QObject(parent)
    , m_ttl(ttl)
    , m_enabled(enabled)
{
    connect(&bus, &CacheInvalidationBus::cacheInvalidated, this, &CountsCache::invalidateAll);
    connect(&bus, &CacheInvalidationBus::serverChanged, this, &CountsCache::invalidateAll);
}

std::optional<int> CountsCache::unreadCount(RemoteApi &api, const EntryQuery &ordering, std::string *error)
{
    EntryQuery query = ordering;
    query.status = EntryStatus::Unread;
    query.limit = 1;

    const std::string key = "unread_count:" + query.order + ":" + query.direction;
    const auto total = getOrFetch(key, m_ttl.unreadCount, [&api, &query]() {
        ApiResult result = api.fetchEntries(query);
        if (!result.ok) {
            return result;
        }
        const nlohmann::json total = result.body.is_object() ? result.body.value("total", nlohmann::json(0))
                                                             : nlohmann::json(0);
        if (!total.is_number_integer()) {
            return ApiResult::failure("Malformed unread count", result.httpStatus);
        }
        result.body = total;
        return result;
    }, error);

    if (!total) {
        return std::nullopt;
    }
    return total->get<int>();
}

std::optional<nlohmann::json> CountsCache::feedCounters(RemoteApi &api, std::string *error)
{
    return getOrFetch("feed_counters", m_ttl.feedCounters, [&api]() {
        return api.fetchFeedCounters();
    }, error);
}

std::optional<nlohmann::json> CountsCache::categoryCounts(RemoteApi &api, std::string *error)
{
    return getOrFetch("category_counts", m_ttl.categoryCounts, [&api]() {
        return api.fetchCategories(true);
    }, error);
}

void CountsCache::invalidateAll()
{
    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        dropped = m_values.size();
        m_values.clear();
        ++m_generation;
    }
    FSLOG_DEBUG(QStringLiteral("CountsCache"),
                QStringLiteral("invalidateAll"),
                QStringLiteral("counts_dropped"),
                QStringLiteral("cache_invalidated"),
                QStringLiteral("bus"),
                logging::defaultWho(),
                logging::currentCorrelationId(),
                (nlohmann::json{{"dropped", dropped}}));
}

std::size_t CountsCache::cachedValueCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_values.size();
}

std::optional<nlohmann::json> CountsCache::getOrFetch(const std::string &key,
                                                      std::chrono::seconds ttl,
                                                      const std::function<ApiResult()> &fetch,
                                                      std::string *error)
{
    const bool cacheable = m_enabled && ttl.count() > 0;

    uint64_t generation = 0;
    if (cacheable) {
        std::lock_guard<std::mutex> lock(m_mutex);
        generation = m_generation;
        const auto it = m_values.find(key);
        if (it != m_values.end()) {
            if (std::chrono::steady_clock::now() - it->second.storedAt < ttl) {
                return it->second.value;
            }
            m_values.erase(it);
        }
    }

    // The lock is not held across the remote call; two concurrent misses
    // both fetch and the later store wins. A value fetched across an
    // invalidation is returned but not stored.
    const ApiResult result = fetch();
    if (!result.ok) {
        if (error) {
            *error = result.message;
        }
        return std::nullopt;
    }

    if (cacheable) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (generation == m_generation) {
            m_values[key] = CachedValue{result.body, std::chrono::steady_clock::now()};
        }
    }
    return result.body;
}

} // namespace fluxsync
