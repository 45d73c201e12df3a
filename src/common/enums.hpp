#pragma once

#include <QMetaType>

namespace fluxsync {

enum class EntryStatus {
    Unread,
    Read,
    // Reported by the server for deleted entries; never set locally.
    Removed
};

enum class QueueKind {
    EntryStatus,
    Feed,
    Category
};

enum class CollectionOperation {
    MarkAllRead
};

} // namespace fluxsync

Q_DECLARE_METATYPE(fluxsync::EntryStatus)
Q_DECLARE_METATYPE(fluxsync::QueueKind)
