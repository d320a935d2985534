#pragma once

#include <QString>
#include <QVariant>
#include <yaml-cpp/yaml.h>

namespace scr {

/// Application settings (~/.smartcast-remote/config.yaml), deep-merged over
/// built-in defaults.
class YamlConfig {
public:
    YamlConfig();

    /// Returns false (keeping defaults) when the file can't be read or parsed.
    bool load(const QString& filePath);
    bool save(const QString& filePath) const;

    // Discovery
    bool discoveryAutoStart() const;
    int discoveryTimeoutSeconds() const;

    // Connection
    QString defaultDeviceType() const;

    // Paths; empty means "next to the executable"
    QString devicesFile() const;
    QString backendPath() const;

    QString logLevel() const;

    bool darkTheme() const;

    // Generic dot-path access (e.g. "discovery.timeout_s")
    QVariant valueByPath(const QString& dottedKey) const;
    bool setValueByPath(const QString& dottedKey, const QVariant& value);

private:
    YAML::Node root_;

    void initDefaults();
    static YAML::Node buildDefaultsNode();
};

} // namespace scr
