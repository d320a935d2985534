#include "core/backend/BackendLoader.hpp"
#include "core/backend/ISmartCastBackend.hpp"
#include <QFile>
#include <QPluginLoader>
#include <boost/log/trivial.hpp>

namespace scr {

ISmartCastBackend* BackendLoader::load(const QString& soPath)
{
    if (!QFile::exists(soPath)) {
        BOOST_LOG_TRIVIAL(warning) << "[BackendLoader] No backend at " << soPath.toStdString();
        return nullptr;
    }

    QPluginLoader loader(soPath);
    QObject* instance = loader.instance();
    if (!instance) {
        BOOST_LOG_TRIVIAL(error) << "[BackendLoader] Failed to load " << soPath.toStdString()
                                 << ": " << loader.errorString().toStdString();
        return nullptr;
    }

    auto* backend = qobject_cast<ISmartCastBackend*>(instance);
    if (!backend) {
        BOOST_LOG_TRIVIAL(error) << "[BackendLoader] " << soPath.toStdString()
                                 << " does not implement ISmartCastBackend";
        return nullptr;
    }

    BOOST_LOG_TRIVIAL(info) << "[BackendLoader] Loaded backend '" << backend->name().toStdString()
                            << "' from " << soPath.toStdString();
    return backend;
}

} // namespace scr
