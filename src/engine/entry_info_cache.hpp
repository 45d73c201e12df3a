#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include <QObject>

#include "common/models.hpp"

namespace fluxsync {

class CacheInvalidationBus;
class EntryStatusStore;

struct EntryInfo {
    EntryStatus status = EntryStatus::Unread;
    std::string title;
    int64_t feedId = 0;
};

// In-memory view of locally materialized entries for fast lookups. Follows
// local status changes from the bus and reloads from the store after an
// invalidation. Loop thread only.
class EntryInfoCache : public QObject
{
    Q_OBJECT
public:
    EntryInfoCache(const EntryStatusStore &store, CacheInvalidationBus &bus, QObject *parent = nullptr);

    void populate();
    std::optional<EntryInfo> lookup(int64_t entryId);
    void forget(int64_t entryId);

    bool isStale() const
    {
        return m_stale;
    }

    std::size_t size() const
    {
        return m_entries.size();
    }

private slots:
    void onEntryStatusChanged(qint64 entryId, fluxsync::EntryStatus status);
    void onCacheInvalidated();

private:
    const EntryStatusStore &m_store;
    std::map<int64_t, EntryInfo> m_entries;
    bool m_stale = true;
};

} // namespace fluxsync
