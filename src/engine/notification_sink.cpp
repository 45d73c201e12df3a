#include "engine/notification_sink.hpp"

#include "common/logging.hpp"

namespace fluxsync {

namespace {

void logNotification(logging::LogLevel level, const char *kind, const std::string &message)
{
    logging::logEvent(level,
                      logging::defaultProcessName(),
                      QStringLiteral("Notification"),
                      QString::fromLatin1(kind),
                      QStringLiteral("notify_user"),
                      QString(),
                      QStringLiteral("log"),
                      logging::defaultWho(),
                      logging::currentCorrelationId(),
                      nlohmann::json{{"message", message}});
}

} // namespace

void LoggingNotificationSink::info(const std::string &message)
{
    logNotification(logging::LogLevel::Info, "info", message);
}

void LoggingNotificationSink::success(const std::string &message)
{
    logNotification(logging::LogLevel::Info, "success", message);
}

void LoggingNotificationSink::error(const std::string &message)
{
    logNotification(logging::LogLevel::Warn, "error", message);
}

} // namespace fluxsync
