#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "common/enums.hpp"

namespace fluxsync {

inline bool isEntryRead(EntryStatus status)
{
    return status == EntryStatus::Read;
}

inline bool isValidEntityId(int64_t id)
{
    return id > 0;
}

// Local view of a remote entry. The status fields are what the user
// currently sees; the descriptive fields are carried along for display.
struct EntityStatusRecord {
    int64_t id = 0;
    EntryStatus status = EntryStatus::Unread;
    std::chrono::system_clock::time_point lastUpdated;

    // Set when the last write was an automatic revert made on behalf of a
    // background worker rather than by the user.
    bool pendingFromWorker = false;
    std::chrono::system_clock::time_point pendingFromWorkerAt;

    std::string title;
    std::string url;
    std::string publishedAt;
    int64_t feedId = 0;
    std::string feedTitle;
    int64_t categoryId = 0;
    std::string categoryTitle;
};

struct StatusQueueEntry {
    EntryStatus targetStatus = EntryStatus::Read;
    EntryStatus originalStatus = EntryStatus::Unread;
    std::chrono::system_clock::time_point timestamp;
};

struct CollectionQueueEntry {
    CollectionOperation operation = CollectionOperation::MarkAllRead;
    std::chrono::system_clock::time_point timestamp;
};

struct QueueCounts {
    std::size_t entryStatus = 0;
    std::size_t feeds = 0;
    std::size_t categories = 0;

    std::size_t total() const
    {
        return entryStatus + feeds + categories;
    }
};

struct SyncSummary {
    int processed = 0;
    int failed = 0;
    int remoteCalls = 0;
    bool nothingToSync = false;
    bool deferred = false;
    bool cleared = false;
};

} // namespace fluxsync
