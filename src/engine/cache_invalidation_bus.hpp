#pragma once

#include <QObject>
#include <QString>

#include "common/enums.hpp"

namespace fluxsync {

/**
 * CacheInvalidationBus decouples mutations from the read caches.
 *
 * cacheInvalidated() fires only once a change is confirmed by the server;
 * entryStatusChanged() reports local (optimistic or reverted) writes so
 * that in-memory views stay in step; serverChanged() fires when the
 * configured server or token changes and every remote-derived cache is void.
 */
class CacheInvalidationBus : public QObject
{
    Q_OBJECT
public:
    explicit CacheInvalidationBus(QObject *parent = nullptr);

    void publishInvalidation(const QString &reason);
    void publishEntryStatus(qint64 entryId, EntryStatus status);
    void publishServerChanged();

    int invalidationCount() const
    {
        return m_invalidationCount;
    }

signals:
    void cacheInvalidated();
    void entryStatusChanged(qint64 entryId, fluxsync::EntryStatus status);
    void serverChanged();

private:
    int m_invalidationCount = 0;
};

} // namespace fluxsync
