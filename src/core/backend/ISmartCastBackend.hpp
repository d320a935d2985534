#pragma once

#include <QList>
#include <QString>
#include <QStringList>
#include <QtPlugin>
#include <memory>
#include "core/backend/ISmartCastClient.hpp"
#include "core/devices/DeviceRecord.hpp"

namespace scr {

enum class DiscoveryStrategy {
    Zeroconf,
    Ssdp
};

inline QString discoveryStrategyName(DiscoveryStrategy strategy)
{
    return strategy == DiscoveryStrategy::Zeroconf ? QStringLiteral("Zeroconf")
                                                   : QStringLiteral("SSDP");
}

struct ConnectParams {
    QString clientName;
    QString address;  // ip or ip:port
    QString deviceName;
    QString authToken;
    DeviceClass deviceClass = DeviceClass::Tv;
    int timeoutSeconds = 5;
};

/// Device-control library, loaded as a Qt plugin. The protocol lives there;
/// the application only calls these entry points.
class ISmartCastBackend {
public:
    virtual ~ISmartCastBackend() = default;

    virtual QString name() const = 0;

    /// Blocking scan using one transport. Called from the discovery worker
    /// thread, so it must not touch UI objects. May throw.
    virtual QList<DiscoveredDevice> discover(DiscoveryStrategy strategy, int timeoutSeconds) = 0;

    /// Build a handle for one device. Throws when the device cannot be reached.
    virtual std::unique_ptr<ISmartCastClient> connect(const ConnectParams& params) = 0;

    /// Public catalogue of launchable app names. May throw.
    virtual QStringList appsList() = 0;
};

} // namespace scr

#define SCR_BACKEND_IID "org.smartcast-remote.BackendInterface/1.0"
Q_DECLARE_INTERFACE(scr::ISmartCastBackend, SCR_BACKEND_IID)
