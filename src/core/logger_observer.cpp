#include "core/logger_observer.hpp"
#include "core/poco_config_adapter.hpp"
#include "logging/logger.hpp"

void LoggerObserver::onConfigUpdate(const ConfigUpdateEvent &event)
{
    if (!event.touches("log_level"))
    {
        return;
    }

    std::string level = PocoConfigAdapter::getInstance().getLogLevel();
    if (!Logger::isValidLevel(level))
    {
        Logger::warn("LoggerObserver: ignoring unknown log level '" + level + "'");
        return;
    }

    Logger::setLevel(level);
    Logger::info("LoggerObserver: log level now " + level + " (" + event.source + ")");
}
