#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace fluxsync {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }
    std::time_t time = timegm(&tm);
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time);
}

inline int64_t toEpochMillis(std::chrono::system_clock::time_point timestamp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               timestamp.time_since_epoch())
        .count();
}

inline std::chrono::system_clock::time_point fromEpochMillis(int64_t value)
{
    return std::chrono::system_clock::time_point{
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds{value})};
}

inline std::string toStatusString(EntryStatus status)
{
    switch (status) {
    case EntryStatus::Unread:
        return "unread";
    case EntryStatus::Read:
        return "read";
    case EntryStatus::Removed:
        return "removed";
    }
    return "unread";
}

inline std::optional<EntryStatus> parseStatusString(const std::string &value)
{
    if (value == "unread") {
        return EntryStatus::Unread;
    }
    if (value == "read") {
        return EntryStatus::Read;
    }
    if (value == "removed") {
        return EntryStatus::Removed;
    }
    return std::nullopt;
}

inline EntryStatus oppositeStatus(EntryStatus status)
{
    return isEntryRead(status) ? EntryStatus::Unread : EntryStatus::Read;
}

inline std::string toQueueKindString(QueueKind kind)
{
    switch (kind) {
    case QueueKind::EntryStatus:
        return "entry-status";
    case QueueKind::Feed:
        return "feed";
    case QueueKind::Category:
        return "category";
    }
    return "entry-status";
}

inline std::string toOperationString(CollectionOperation operation)
{
    switch (operation) {
    case CollectionOperation::MarkAllRead:
        return "mark_all_read";
    }
    return "mark_all_read";
}

inline std::optional<CollectionOperation> parseOperationString(const std::string &value)
{
    if (value == "mark_all_read") {
        return CollectionOperation::MarkAllRead;
    }
    return std::nullopt;
}

inline void to_json(nlohmann::json &j, const EntryStatus &status)
{
    j = toStatusString(status);
}

// Strict: an unknown status marks the surrounding document as corrupt.
inline void from_json(const nlohmann::json &j, EntryStatus &status)
{
    const auto parsed = parseStatusString(j.get<std::string>());
    if (!parsed) {
        throw std::invalid_argument("unknown entry status: " + j.get<std::string>());
    }
    status = *parsed;
}

inline void to_json(nlohmann::json &j, const StatusQueueEntry &entry)
{
    j = nlohmann::json{
        {"targetStatus", entry.targetStatus},
        {"originalStatus", entry.originalStatus},
        {"timestamp", toIso8601Utc(entry.timestamp)}
    };
}

inline void from_json(const nlohmann::json &j, StatusQueueEntry &entry)
{
    entry.targetStatus = j.at("targetStatus").get<EntryStatus>();
    entry.originalStatus = j.at("originalStatus").get<EntryStatus>();
    entry.timestamp = fromIso8601Utc(j.value("timestamp", ""));
}

inline void to_json(nlohmann::json &j, const CollectionQueueEntry &entry)
{
    j = nlohmann::json{
        {"operation", toOperationString(entry.operation)},
        {"timestamp", toIso8601Utc(entry.timestamp)}
    };
}

inline void from_json(const nlohmann::json &j, CollectionQueueEntry &entry)
{
    const std::string operation = j.at("operation").get<std::string>();
    const auto parsed = parseOperationString(operation);
    if (!parsed) {
        throw std::invalid_argument("unknown collection operation: " + operation);
    }
    entry.operation = *parsed;
    entry.timestamp = fromIso8601Utc(j.value("timestamp", ""));
}

inline void to_json(nlohmann::json &j, const EntityStatusRecord &record)
{
    j = nlohmann::json{
        {"id", record.id},
        {"status", record.status},
        {"lastUpdated", toIso8601Utc(record.lastUpdated)},
        {"pendingFromWorker", record.pendingFromWorker},
        {"pendingFromWorkerTimestamp",
         record.pendingFromWorker ? toIso8601Utc(record.pendingFromWorkerAt) : std::string()},
        {"title", record.title},
        {"url", record.url},
        {"publishedAt", record.publishedAt},
        {"feed", nlohmann::json{{"id", record.feedId}, {"title", record.feedTitle}}},
        {"category", nlohmann::json{{"id", record.categoryId}, {"title", record.categoryTitle}}}
    };
}

// Lenient: accepts both local records and entries as returned by the server
// (GET /v1/entries), where category is nested under feed.
inline void from_json(const nlohmann::json &j, EntityStatusRecord &record)
{
    record.id = j.value("id", static_cast<int64_t>(0));
    record.status = parseStatusString(j.value("status", "unread")).value_or(EntryStatus::Unread);
    record.lastUpdated = fromIso8601Utc(j.value("lastUpdated", ""));
    record.pendingFromWorker = j.value("pendingFromWorker", false);
    record.pendingFromWorkerAt = fromIso8601Utc(j.value("pendingFromWorkerTimestamp", ""));
    record.title = j.value("title", "");
    record.url = j.value("url", "");
    record.publishedAt = j.value("published_at", j.value("publishedAt", ""));

    const nlohmann::json *category = nullptr;
    if (j.contains("feed") && j.at("feed").is_object()) {
        const auto &feed = j.at("feed");
        record.feedId = feed.value("id", static_cast<int64_t>(0));
        record.feedTitle = feed.value("title", "");
        if (feed.contains("category") && feed.at("category").is_object()) {
            category = &feed.at("category");
        }
    }
    if (j.contains("category") && j.at("category").is_object()) {
        category = &j.at("category");
    }
    if (category) {
        record.categoryId = category->value("id", static_cast<int64_t>(0));
        record.categoryTitle = category->value("title", "");
    }
}

inline void to_json(nlohmann::json &j, const QueueCounts &counts)
{
    j = nlohmann::json{
        {"total", counts.total()},
        {"entryStatus", counts.entryStatus},
        {"feeds", counts.feeds},
        {"categories", counts.categories}
    };
}

inline void to_json(nlohmann::json &j, const SyncSummary &summary)
{
    j = nlohmann::json{
        {"processed", summary.processed},
        {"failed", summary.failed},
        {"remoteCalls", summary.remoteCalls},
        {"nothingToSync", summary.nothingToSync},
        {"deferred", summary.deferred},
        {"cleared", summary.cleared}
    };
}

} // namespace fluxsync
