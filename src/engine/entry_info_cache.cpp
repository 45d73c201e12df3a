#include "engine/entry_info_cache.hpp"

#include "common/logging.hpp"
#include "engine/cache_invalidation_bus.hpp"
#include "store/entry_status_store.hpp"

namespace fluxsync {

EntryInfoCache::EntryInfoCache(const EntryStatusStore &store, CacheInvalidationBus &bus, QObject *parent)
    : QObject(parent)
    , m_store(store)
{
    connect(&bus, &CacheInvalidationBus::entryStatusChanged,
            this, &EntryInfoCache::onEntryStatusChanged);
    connect(&bus, &CacheInvalidationBus::cacheInvalidated,
            this, &EntryInfoCache::onCacheInvalidated);
}

void EntryInfoCache::populate()
{
    std::map<int64_t, EntryInfo> entries;
    try {
        for (const auto &record : m_store.list()) {
            EntryInfo info;
            info.status = record.status;
            info.title = record.title;
            info.feedId = record.feedId;
            entries.emplace(record.id, std::move(info));
        }
    } catch (const StoreError &ex) {
        FSLOG_WARN(QStringLiteral("EntryInfoCache"),
                   QStringLiteral("populate"),
                   QStringLiteral("populate_failed"),
                   QStringLiteral("store_error"),
                   QStringLiteral("sqlite"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"error", ex.what()}}));
        return;
    }

    m_entries.swap(entries);
    m_stale = false;
}

std::optional<EntryInfo> EntryInfoCache::lookup(int64_t entryId)
{
    if (m_stale) {
        populate();
    }
    const auto it = m_entries.find(entryId);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

void EntryInfoCache::forget(int64_t entryId)
{
    m_entries.erase(entryId);
}

void EntryInfoCache::onEntryStatusChanged(qint64 entryId, EntryStatus status)
{
    const auto it = m_entries.find(entryId);
    if (it != m_entries.end()) {
        it->second.status = status;
    }
}

void EntryInfoCache::onCacheInvalidated()
{
    m_stale = true;
}

} // namespace fluxsync
