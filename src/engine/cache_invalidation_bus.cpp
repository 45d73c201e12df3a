#include "engine/cache_invalidation_bus.hpp"

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace fluxsync {

CacheInvalidationBus::CacheInvalidationBus(QObject *parent)
    : QObject(parent)
{
}

void CacheInvalidationBus::publishInvalidation(const QString &reason)
{
    ++m_invalidationCount;
    FSLOG_DEBUG(QStringLiteral("CacheInvalidationBus"),
                QStringLiteral("publishInvalidation"),
                QStringLiteral("cache_invalidated"),
                reason,
                QStringLiteral("signal"),
                logging::defaultWho(),
                logging::currentCorrelationId(),
                (nlohmann::json{{"count", m_invalidationCount}}));
    emit cacheInvalidated();
}

void CacheInvalidationBus::publishEntryStatus(qint64 entryId, EntryStatus status)
{
    emit entryStatusChanged(entryId, status);
}

void CacheInvalidationBus::publishServerChanged()
{
    FSLOG_INFO(QStringLiteral("CacheInvalidationBus"),
               QStringLiteral("publishServerChanged"),
               QStringLiteral("server_changed"),
               QStringLiteral("settings_update"),
               QStringLiteral("signal"),
               logging::defaultWho(),
               QString(),
               nlohmann::json::object());
    emit serverChanged();
}

} // namespace fluxsync
