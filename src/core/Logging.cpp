#include "core/Logging.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

namespace scr {

void initLogging(const QString& level)
{
    namespace logging = boost::log;
    using logging::trivial::severity_level;

    const std::string name = level.trimmed().toLower().toStdString();
    severity_level floor = severity_level::info;
    bool known = logging::trivial::from_string(name.c_str(), name.size(), floor);
    if (!known)
        floor = severity_level::info;

    logging::core::get()->set_filter(logging::trivial::severity >= floor);

    if (!known && !level.isEmpty()) {
        BOOST_LOG_TRIVIAL(warning) << "[Logging] Unknown level '" << level.toStdString()
                                   << "', using info";
    }
}

} // namespace scr
