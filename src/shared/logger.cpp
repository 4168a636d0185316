#include <chrono>
#include <ctime>
#include <iostream>

#include "logger.hpp"

////////////////////////////////////////////
// Logger methods
////////////////////////////////////////////

Logger& Logger::instance()
{
    static Logger inst;
    return inst;
}

void Logger::setLevel(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mtx);
    this->level = level;
}

LogLevel Logger::getLevel()
{
    std::lock_guard<std::mutex> lock(mtx);
    return level;
}

void Logger::log(LogLevel level, const std::string &component, const std::string &message)
{
    std::lock_guard<std::mutex> lock(mtx);
    if (level < this->level)
        return;

    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);

    char ts[32];
    std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm);

    // warnings and errors go to stderr
    std::ostream &out = (level >= LogLevel::WARN) ? std::cerr : std::cout;
    out << ts << " [" << levelName(level) << "] " << component << ": " << message << std::endl;
}

LogLevel Logger::parseLevel(const std::string &name)
{
    if (name == "DEBUG")
        return LogLevel::DEBUG;
    if (name == "WARN")
        return LogLevel::WARN;
    if (name == "ERROR")
        return LogLevel::ERROR;
    return LogLevel::INFO;
}

const char* Logger::levelName(LogLevel level)
{
    switch (level)
    {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARN:    return "WARN";
        default:                return "ERROR";
    }
}

////////////////////////////////////////////
// ComponentLogger methods
////////////////////////////////////////////

ComponentLogger::ComponentLogger(std::string component)
    : component(std::move(component))
{
}

void ComponentLogger::debug(const std::string &message) const
{
    Logger::instance().log(LogLevel::DEBUG, component, message);
}

void ComponentLogger::info(const std::string &message) const
{
    Logger::instance().log(LogLevel::INFO, component, message);
}

void ComponentLogger::warn(const std::string &message) const
{
    Logger::instance().log(LogLevel::WARN, component, message);
}

void ComponentLogger::error(const std::string &message) const
{
    Logger::instance().log(LogLevel::ERROR, component, message);
}
