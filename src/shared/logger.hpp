#pragma once

#include <mutex>
#include <sstream>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, WARN, ERROR };

/**
 * Process-wide console logger.
 * 
 * Each call writes exactly one line of the form:
 * 
 *      2025-11-02 14:03:11 [INFO] coordinator: PUT /files/archive.zip received
 * 
 * Lines are written under a mutex so output from concurrent request
 * handlers never interleaves.
 */
class Logger
{
public:
    static Logger& instance();

    void setLevel(LogLevel level);
    LogLevel getLevel();

    void log(LogLevel level, const std::string &component, const std::string &message);

    /**
     * Parses "DEBUG"/"INFO"/"WARN"/"ERROR" (case-sensitive); anything else
     * maps to INFO.
     */
    static LogLevel parseLevel(const std::string &name);

private:
    Logger() = default;

    std::mutex mtx;
    LogLevel level = LogLevel::INFO;

    static const char* levelName(LogLevel level);
};

/**
 * Per-component handle, e.g.
 * 
 *      ComponentLogger log("node-2");
 *      log.info("stored block " + std::to_string(id));
 */
class ComponentLogger
{
public:
    explicit ComponentLogger(std::string component);

    void debug(const std::string &message) const;
    void info(const std::string &message) const;
    void warn(const std::string &message) const;
    void error(const std::string &message) const;

private:
    std::string component;
};
