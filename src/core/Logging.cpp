#include "core/Logging.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

namespace ww {

bool initLogging(const QString& level)
{
    namespace logging = boost::log;

    const QString name = level.trimmed().toLower();
    bool known = true;
    logging::trivial::severity_level severity = logging::trivial::info;

    if (name == QLatin1String("trace"))
        severity = logging::trivial::trace;
    else if (name == QLatin1String("debug"))
        severity = logging::trivial::debug;
    else if (name == QLatin1String("info"))
        severity = logging::trivial::info;
    else if (name == QLatin1String("warning") || name == QLatin1String("warn"))
        severity = logging::trivial::warning;
    else if (name == QLatin1String("error"))
        severity = logging::trivial::error;
    else
        known = false;

    logging::core::get()->set_filter(logging::trivial::severity >= severity);

    if (!known)
        BOOST_LOG_TRIVIAL(warning) << "[Logging] Unknown level '" << level.toStdString()
                                   << "', using info";
    return known;
}

} // namespace ww
