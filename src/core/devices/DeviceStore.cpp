#include "core/devices/DeviceStore.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <boost/log/trivial.hpp>

namespace scr {

DeviceStore::DeviceStore(const QString& filePath)
    : filePath_(filePath)
{
}

QList<DeviceRecord> DeviceStore::read() const
{
    QList<DeviceRecord> records;

    QFile file(filePath_);
    if (!file.exists())
        return records;

    if (!file.open(QIODevice::ReadOnly)) {
        BOOST_LOG_TRIVIAL(warning) << "[DeviceStore] Cannot open " << filePath_.toStdString()
                                   << ": " << file.errorString().toStdString();
        return records;
    }

    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &err);
    if (err.error != QJsonParseError::NoError) {
        BOOST_LOG_TRIVIAL(warning) << "[DeviceStore] Ignoring malformed " << filePath_.toStdString()
                                   << ": " << err.errorString().toStdString()
                                   << " at offset " << err.offset;
        return records;
    }

    // A file holding plain `null` is treated like an empty list
    if (doc.isNull())
        return records;

    if (!doc.isArray()) {
        BOOST_LOG_TRIVIAL(warning) << "[DeviceStore] Ignoring " << filePath_.toStdString()
                                   << ": top level is not an array";
        return records;
    }

    const QJsonArray array = doc.array();
    for (int i = 0; i < array.size(); ++i) {
        if (!array.at(i).isObject()) {
            BOOST_LOG_TRIVIAL(warning) << "[DeviceStore] Skipping entry " << i << " (not an object)";
            continue;
        }
        records.append(DeviceRecord::fromJson(array.at(i).toObject()));
    }

    BOOST_LOG_TRIVIAL(debug) << "[DeviceStore] Loaded " << records.size() << " device(s) from "
                             << filePath_.toStdString();
    return records;
}

OpResult DeviceStore::write(const QList<DeviceRecord>& records) const
{
    QJsonArray array;
    for (const auto& r : records)
        array.append(r.toJson());

    QDir().mkpath(QFileInfo(filePath_).absolutePath());

    QSaveFile file(filePath_);
    if (!file.open(QIODevice::WriteOnly)) {
        QString msg = QString("Failed to save devices: %1").arg(file.errorString());
        BOOST_LOG_TRIVIAL(error) << "[DeviceStore] " << msg.toStdString();
        return OpResult::failure(ErrorKind::Persistence, msg);
    }

    file.write(QJsonDocument(array).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        QString msg = QString("Failed to save devices: %1").arg(file.errorString());
        BOOST_LOG_TRIVIAL(error) << "[DeviceStore] " << msg.toStdString();
        return OpResult::failure(ErrorKind::Persistence, msg);
    }

    BOOST_LOG_TRIVIAL(debug) << "[DeviceStore] Wrote " << records.size() << " device(s) to "
                             << filePath_.toStdString();
    return OpResult::success();
}

} // namespace scr
