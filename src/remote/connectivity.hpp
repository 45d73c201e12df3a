#pragma once

#include <atomic>

#include <QObject>

namespace fluxsync {

/**
 * ConnectivityProbe answers "are we online?" for the dispatcher and its
 * workers. isOnline() may be called from any thread; state changes and
 * signals happen on the thread that owns the probe.
 */
class ConnectivityProbe : public QObject
{
    Q_OBJECT
public:
    explicit ConnectivityProbe(bool initiallyOnline, QObject *parent = nullptr);
    ~ConnectivityProbe() override;

    bool isOnline() const
    {
        return m_online.load(std::memory_order_acquire);
    }

signals:
    void connectivityRestored();
    void connectivityLost();

protected:
    void updateOnline(bool online);

private:
    std::atomic<bool> m_online;
};

// Follows QNetworkInformation reachability. Unknown reachability, or no
// available backend, counts as online so that a dispatch is at least tried.
class SystemConnectivityProbe : public ConnectivityProbe
{
    Q_OBJECT
public:
    explicit SystemConnectivityProbe(QObject *parent = nullptr);
};

// Settable probe for the CLI --offline switch and tests.
class StaticConnectivityProbe : public ConnectivityProbe
{
    Q_OBJECT
public:
    explicit StaticConnectivityProbe(bool online = true, QObject *parent = nullptr);

    void setOnline(bool online);
};

} // namespace fluxsync
