#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/cancellation_token.hpp"
#include "common/config.hpp"
#include "common/enums.hpp"

namespace fluxsync {

struct ApiResult {
    bool ok = false;
    int httpStatus = 0;
    std::string message;
    nlohmann::json body;
    bool timedOut = false;
    bool cancelled = false;

    static ApiResult success(int httpStatus, nlohmann::json body = nlohmann::json::object())
    {
        ApiResult result;
        result.ok = true;
        result.httpStatus = httpStatus;
        result.body = std::move(body);
        return result;
    }

    static ApiResult failure(std::string message, int httpStatus = 0)
    {
        ApiResult result;
        result.httpStatus = httpStatus;
        result.message = std::move(message);
        return result;
    }
};

// Query for GET /v1/entries. Zero ids and limit mean "not set".
struct EntryQuery {
    std::optional<EntryStatus> status;
    std::string order = "published_at";
    std::string direction = "desc";
    int limit = 0;
    int64_t feedId = 0;
    int64_t categoryId = 0;
};

/**
 * RemoteApi is the fixed server contract the engine reconciles against.
 *
 * Calls block the calling thread and are only made from worker tasks
 * (or from the coordinator's drain). They never throw; every transport or
 * HTTP problem is reported through ApiResult.
 */
class RemoteApi
{
public:
    virtual ~RemoteApi() = default;

    // PUT /v1/entries {entry_ids, status}
    virtual ApiResult updateEntries(const std::vector<int64_t> &entryIds, EntryStatus status) = 0;
    // PUT /v1/feeds/{id}/mark-all-as-read
    virtual ApiResult markFeedAsRead(int64_t feedId) = 0;
    // PUT /v1/categories/{id}/mark-all-as-read
    virtual ApiResult markCategoryAsRead(int64_t categoryId) = 0;

    virtual ApiResult fetchEntries(const EntryQuery &query) = 0;
    virtual ApiResult fetchFeedCounters() = 0;
    virtual ApiResult fetchCategories(bool withCounts) = 0;
};

// Builds a fresh client on the calling thread from a frozen settings copy.
// The token, when given, aborts in-flight requests.
using RemoteApiFactory = std::function<std::unique_ptr<RemoteApi>(const ServerSettings &settings,
                                                                  CancellationTokenPtr token)>;

} // namespace fluxsync
