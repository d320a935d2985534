#include "core/discovery/DiscoveryReconciler.hpp"
#include "core/backend/ISmartCastBackend.hpp"
#include <QMetaObject>
#include <boost/log/trivial.hpp>

namespace scr {

DiscoveryReconciler::DiscoveryReconciler(ISmartCastBackend* backend, int timeoutSeconds,
                                         QObject* parent)
    : QObject(parent)
    , backend_(backend)
    , timeoutSeconds_(timeoutSeconds)
{
    qRegisterMetaType<scr::DiscoveryReport>();
}

DiscoveryReconciler::~DiscoveryReconciler()
{
    // The worker is not cancellable; let it finish before the backend goes away
    if (worker_)
        worker_->wait();
}

DiscoveryReport DiscoveryReconciler::run(ISmartCastBackend* backend, int timeoutSeconds,
                                         const QString& label)
{
    DiscoveryReport report;
    report.log << QString("%1 starting...").arg(label);

    if (!backend) {
        report.error = QStringLiteral("No device-control backend loaded");
        report.log << report.error;
        return report;
    }

    try {
        auto devices = backend->discover(DiscoveryStrategy::Zeroconf, timeoutSeconds);
        report.log << QString("Zeroconf found %1").arg(devices.size());
        if (devices.isEmpty()) {
            report.log << QStringLiteral("Zeroconf found none, trying SSDP...");
            devices = backend->discover(DiscoveryStrategy::Ssdp, timeoutSeconds);
            report.log << QString("SSDP found %1").arg(devices.size());
        }
        report.devices = devices;
    } catch (const std::exception& e) {
        report.devices.clear();
        report.error = QString("Discovery exception: %1").arg(QString::fromUtf8(e.what()));
        report.log << report.error;
        BOOST_LOG_TRIVIAL(warning) << "[Discovery] " << report.error.toStdString();
    }

    return report;
}

OpResult DiscoveryReconciler::start(const QString& label)
{
    if (running_) {
        BOOST_LOG_TRIVIAL(debug) << "[Discovery] Ignoring trigger, a run is in flight";
        return OpResult::failure(ErrorKind::Validation, "Discovery already in progress");
    }

    if (worker_) {
        // Previous run already delivered its report; only thread teardown remains
        worker_->wait();
        worker_.reset();
    }

    running_ = true;
    visible_.clear();
    emit visibleDevicesChanged();
    emit started();

    ISmartCastBackend* backend = backend_;
    int timeout = timeoutSeconds_;
    worker_.reset(QThread::create([this, backend, timeout, label]() {
        DiscoveryReport report = run(backend, timeout, label);
        QMetaObject::invokeMethod(this, [this, report]() {
            onWorkerFinished(report);
        }, Qt::QueuedConnection);
    }));
    worker_->setObjectName(QStringLiteral("discovery"));
    worker_->start();

    BOOST_LOG_TRIVIAL(info) << "[Discovery] " << label.toStdString() << " started (timeout "
                            << timeoutSeconds_ << "s per strategy)";
    return OpResult::success(QString("%1: starting...").arg(label));
}

void DiscoveryReconciler::onWorkerFinished(const DiscoveryReport& report)
{
    running_ = false;
    apply(report);
    emit finished(report);
}

QList<DiscoveredDevice> DiscoveryReconciler::uniqueDevices(const QList<DiscoveredDevice>& devices)
{
    QList<DiscoveredDevice> unique;
    for (const auto& dev : devices) {
        bool seen = false;
        for (const auto& u : unique) {
            if (u.sameEndpoint(dev)) {
                seen = true;
                break;
            }
        }
        if (!seen)
            unique.append(dev);
    }
    return unique;
}

void DiscoveryReconciler::apply(const DiscoveryReport& report)
{
    visible_ = uniqueDevices(report.devices);
    BOOST_LOG_TRIVIAL(info) << "[Discovery] " << visible_.size() << " device(s) visible";
    emit visibleDevicesChanged();
}

QString DiscoveryReconciler::summarize(const DiscoveryReport& report, const QString& label)
{
    QString trace = report.log.join('\n');
    if (report.failed())
        return trace;
    if (report.devices.isEmpty())
        return QString("%1 found no devices\n%2").arg(label, trace);
    return QString("%1: found %2 device(s)\n%3").arg(label).arg(uniqueDevices(report.devices).size()).arg(trace);
}

} // namespace scr
