#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include <QObject>

#include <nlohmann/json.hpp>

#include "remote/remote_api.hpp"

namespace fluxsync {

class CacheInvalidationBus;

struct CountsTtl {
    std::chrono::seconds unreadCount{300};
    std::chrono::seconds feedCounters{60};
    std::chrono::seconds categoryCounts{300};
};

/**
 * CountsCache keeps the server-side aggregates the UI shows next to feeds
 * and categories. Values expire after their TTL and are dropped as a whole
 * when the bus reports a confirmed change or a server switch.
 *
 * Lookups may run on worker threads; the bus slots run on the owner's
 * thread. Only successful responses are cached.
 */
class CountsCache : public QObject
{
    Q_OBJECT
public:
    CountsCache(CacheInvalidationBus &bus, CountsTtl ttl, bool enabled, QObject *parent = nullptr);

    // Total unread entries (GET /v1/entries?status=unread&limit=1 -> total).
    std::optional<int> unreadCount(RemoteApi &api, const EntryQuery &ordering, std::string *error);
    // {"reads": {feedId: n}, "unreads": {feedId: n}}
    std::optional<nlohmann::json> feedCounters(RemoteApi &api, std::string *error);
    // Category list including unread counts.
    std::optional<nlohmann::json> categoryCounts(RemoteApi &api, std::string *error);

    void invalidateAll();
    std::size_t cachedValueCount() const;
    bool isEnabled() const
    {
        return m_enabled;
    }

private:
    struct CachedValue {
        nlohmann::json value;
        std::chrono::steady_clock::time_point storedAt;
    };

    std::optional<nlohmann::json> getOrFetch(const std::string &key,
                                             std::chrono::seconds ttl,
                                             const std::function<ApiResult()> &fetch,
                                             std::string *error);

    CountsTtl m_ttl;
    bool m_enabled;
    mutable std::mutex m_mutex;
    std::map<std::string, CachedValue> m_values;
    uint64_t m_generation = 0;
};

} // namespace fluxsync
