#pragma once

#include <cstddef>
#include <string>

#include "common/models.hpp"

namespace fluxsync {

// User-facing messages. The engine never blocks on these.
class NotificationSink
{
public:
    virtual ~NotificationSink() = default;

    virtual void info(const std::string &message) = 0;
    virtual void success(const std::string &message) = 0;
    virtual void error(const std::string &message) = 0;
};

// Writes notifications to the structured log only.
class LoggingNotificationSink : public NotificationSink
{
public:
    void info(const std::string &message) override;
    void success(const std::string &message) override;
    void error(const std::string &message) override;
};

enum class SyncDecision {
    Later,
    SyncNow,
    DeleteQueue
};

// Asks the user before a drain or a destructive clear.
class ConfirmationPrompt
{
public:
    virtual ~ConfirmationPrompt() = default;

    virtual SyncDecision confirmSync(const QueueCounts &counts) = 0;
    virtual bool confirmClear(std::size_t pendingCount) = 0;
};

} // namespace fluxsync
