#include "ConfigService.hpp"
#include "core/YamlConfig.hpp"
#include <QDir>
#include <QFileInfo>

namespace scr {

ConfigService::ConfigService(YamlConfig* config, const QString& configPath, QObject* parent)
    : QObject(parent), config_(config), configPath_(configPath)
{
}

QVariant ConfigService::value(const QString& key) const
{
    return config_->valueByPath(key);
}

bool ConfigService::setValue(const QString& key, const QVariant& val)
{
    if (!config_->setValueByPath(key, val))
        return false;
    emit configChanged(key, val);
    return true;
}

bool ConfigService::save()
{
    QDir().mkpath(QFileInfo(configPath_).absolutePath());
    return config_->save(configPath_);
}

} // namespace scr
