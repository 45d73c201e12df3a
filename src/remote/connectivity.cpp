#include "remote/connectivity.hpp"

#include <QNetworkInformation>

#include "common/logging.hpp"

namespace fluxsync {

namespace {

bool reachabilityCountsAsOnline(QNetworkInformation::Reachability reachability)
{
    return reachability != QNetworkInformation::Reachability::Disconnected;
}

} // namespace

ConnectivityProbe::ConnectivityProbe(bool initiallyOnline, QObject *parent)
    : QObject(parent)
    , m_online(initiallyOnline)
{
}

ConnectivityProbe::~ConnectivityProbe() = default;

void ConnectivityProbe::updateOnline(bool online)
{
    const bool previous = m_online.exchange(online, std::memory_order_acq_rel);
    if (previous == online) {
        return;
    }

    FSLOG_INFO(QStringLiteral("ConnectivityProbe"),
               QStringLiteral("updateOnline"),
               online ? QStringLiteral("connectivity_restored") : QStringLiteral("connectivity_lost"),
               QStringLiteral("network_change"),
               QStringLiteral("probe"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"online", online}}));

    if (online) {
        emit connectivityRestored();
    } else {
        emit connectivityLost();
    }
}

SystemConnectivityProbe::SystemConnectivityProbe(QObject *parent)
    : ConnectivityProbe(true, parent)
{
    if (!QNetworkInformation::loadDefaultBackend()) {
        FSLOG_WARN(QStringLiteral("SystemConnectivityProbe"),
                   QStringLiteral("SystemConnectivityProbe"),
                   QStringLiteral("network_information_unavailable"),
                   QStringLiteral("no_backend"),
                   QStringLiteral("assume_online"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
        return;
    }

    QNetworkInformation *info = QNetworkInformation::instance();
    updateOnline(reachabilityCountsAsOnline(info->reachability()));
    connect(info, &QNetworkInformation::reachabilityChanged,
            this, [this](QNetworkInformation::Reachability reachability) {
                updateOnline(reachabilityCountsAsOnline(reachability));
            });
}

StaticConnectivityProbe::StaticConnectivityProbe(bool online, QObject *parent)
    : ConnectivityProbe(online, parent)
{
}

void StaticConnectivityProbe::setOnline(bool online)
{
    updateOnline(online);
}

} // namespace fluxsync
