#pragma once

#include <QObject>
#include <QList>
#include <QStringList>
#include <QThread>
#include <memory>
#include "core/OpResult.hpp"
#include "core/devices/DeviceRecord.hpp"

namespace scr {

class ISmartCastBackend;

/// Outcome of one discovery run, handed to the UI thread in one piece.
struct DiscoveryReport {
    QList<DiscoveredDevice> devices;
    QStringList log;  // which strategy ran and what it found
    QString error;    // set when the run aborted

    bool failed() const { return !error.isEmpty(); }
};

/// Produces the list of currently visible devices.
///
/// A run tries zeroconf first and falls back to SSDP only when zeroconf finds
/// nothing. Runs happen on a worker thread; the report comes back through a
/// single queued call, and the visible list is replaced wholesale. A start()
/// while a run is in flight is refused.
class DiscoveryReconciler : public QObject {
    Q_OBJECT
public:
    explicit DiscoveryReconciler(ISmartCastBackend* backend, int timeoutSeconds,
                                 QObject* parent = nullptr);
    ~DiscoveryReconciler() override;

    /// Synchronous run of the fallback chain. Safe to call from any thread.
    static DiscoveryReport run(ISmartCastBackend* backend, int timeoutSeconds,
                               const QString& label);

    /// Starts a background run. Fails without side effects if one is in flight.
    OpResult start(const QString& label = QStringLiteral("Discovery"));

    /// Replaces the visible list with the report's devices, dropping duplicate endpoints.
    void apply(const DiscoveryReport& report);

    bool isRunning() const { return running_; }
    int timeoutSeconds() const { return timeoutSeconds_; }
    QList<DiscoveredDevice> visibleDevices() const { return visible_; }

    /// First occurrence of each (ip, port), in report order.
    static QList<DiscoveredDevice> uniqueDevices(const QList<DiscoveredDevice>& devices);

    /// Human-readable summary of a finished report; counts distinct endpoints.
    static QString summarize(const DiscoveryReport& report, const QString& label);

signals:
    void started();
    void finished(const scr::DiscoveryReport& report);
    void visibleDevicesChanged();

private:
    void onWorkerFinished(const DiscoveryReport& report);

    ISmartCastBackend* backend_;
    int timeoutSeconds_;
    bool running_ = false;
    std::unique_ptr<QThread> worker_;
    QList<DiscoveredDevice> visible_;
};

} // namespace scr

Q_DECLARE_METATYPE(scr::DiscoveryReport)
