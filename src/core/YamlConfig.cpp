#include "core/YamlConfig.hpp"
#include <QStringList>
#include <boost/log/trivial.hpp>
#include <fstream>

namespace scr {

// Overlay wins for scalars and sequences; maps merge key by key so that
// keys missing from the user's file keep their defaults.
static YAML::Node mergeYaml(const YAML::Node& base, const YAML::Node& overlay)
{
    if (!overlay.IsDefined() || overlay.IsNull())
        return YAML::Clone(base);
    if (!base.IsDefined() || base.IsNull() || !base.IsMap() || !overlay.IsMap())
        return YAML::Clone(overlay);

    YAML::Node result = YAML::Clone(base);
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        const auto key = it->first.as<std::string>();
        result[key] = result[key] ? mergeYaml(result[key], it->second) : YAML::Clone(it->second);
    }
    return result;
}

YamlConfig::YamlConfig()
{
    initDefaults();
}

void YamlConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["client"]["name"] = "smartcast-remote";

    root_["discovery"]["auto_start"] = true;
    root_["discovery"]["timeout_s"] = 5;

    root_["connection"]["timeout_s"] = 5;
    root_["connection"]["enrich_timeout_s"] = 3;
    root_["connection"]["default_device_type"] = "tv";

    root_["storage"]["devices_file"] = "";
    root_["backend"]["path"] = "";

    root_["logging"]["level"] = "info";
    root_["ui"]["dark_theme"] = true;
}

bool YamlConfig::load(const QString& filePath)
{
    initDefaults();
    YAML::Node defaults = YAML::Clone(root_);

    try {
        YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
        root_ = mergeYaml(defaults, loaded);
    } catch (const YAML::Exception& e) {
        BOOST_LOG_TRIVIAL(warning) << "[YamlConfig] Using defaults, cannot load "
                                   << filePath.toStdString() << ": " << e.what();
        root_ = defaults;
        return false;
    }
    return true;
}

bool YamlConfig::save(const QString& filePath) const
{
    std::ofstream fout(filePath.toStdString());
    if (!fout) {
        BOOST_LOG_TRIVIAL(error) << "[YamlConfig] Cannot write " << filePath.toStdString();
        return false;
    }
    fout << root_;
    return fout.good();
}

// --- Discovery ---

bool YamlConfig::discoveryAutoStart() const
{
    return root_["discovery"]["auto_start"].as<bool>(true);
}

int YamlConfig::discoveryTimeoutSeconds() const
{
    return root_["discovery"]["timeout_s"].as<int>(5);
}

// --- Connection ---

QString YamlConfig::defaultDeviceType() const
{
    return QString::fromStdString(root_["connection"]["default_device_type"].as<std::string>("tv"));
}

// --- Paths ---

QString YamlConfig::devicesFile() const
{
    return QString::fromStdString(root_["storage"]["devices_file"].as<std::string>(""));
}

QString YamlConfig::backendPath() const
{
    return QString::fromStdString(root_["backend"]["path"].as<std::string>(""));
}

// --- Logging / UI ---

QString YamlConfig::logLevel() const
{
    return QString::fromStdString(root_["logging"]["level"].as<std::string>("info"));
}

bool YamlConfig::darkTheme() const
{
    return root_["ui"]["dark_theme"].as<bool>(true);
}

// --- Generic dot-path access ---

static QVariant yamlScalarToVariant(const YAML::Node& node)
{
    if (!node.IsScalar()) return {};

    const QString s = QString::fromStdString(node.Scalar());

    if (s == "true") return QVariant(true);
    if (s == "false") return QVariant(false);

    bool intOk = false;
    int i = s.toInt(&intOk);
    if (intOk) return QVariant(i);

    return QVariant(s);
}

QVariant YamlConfig::valueByPath(const QString& dottedKey) const
{
    if (dottedKey.isEmpty()) return {};

    YAML::Node node = YAML::Clone(root_);
    for (const auto& part : dottedKey.split('.')) {
        if (!node.IsMap()) return {};
        node.reset(node[part.toStdString()]);
        if (!node.IsDefined() || node.IsNull()) return {};
    }

    return yamlScalarToVariant(node);
}

YAML::Node YamlConfig::buildDefaultsNode()
{
    YamlConfig tmp;
    return YAML::Clone(tmp.root_);
}

bool YamlConfig::setValueByPath(const QString& dottedKey, const QVariant& value)
{
    if (dottedKey.isEmpty()) return false;

    const QStringList parts = dottedKey.split('.');

    // Only existing scalar leaves of the defaults tree are writable
    YAML::Node schema = buildDefaultsNode();
    for (const auto& part : parts) {
        if (!schema.IsMap()) return false;
        schema.reset(schema[part.toStdString()]);
        if (!schema.IsDefined()) return false;
    }
    if (!schema.IsScalar()) return false;

    YAML::Node node = root_;
    for (int i = 0; i < parts.size() - 1; ++i)
        node.reset(node[parts[i].toStdString()]);

    const std::string leaf = parts.last().toStdString();
    switch (value.typeId()) {
    case QMetaType::Bool:
        node[leaf] = value.toBool();
        break;
    case QMetaType::Int:
        node[leaf] = value.toInt();
        break;
    default:
        node[leaf] = value.toString().toStdString();
        break;
    }
    return true;
}

} // namespace scr
