#pragma once
#include <memory>
#include <mutex>
#include <string>
#include "result.h"
#include "logging_def.hpp"
#include "logger_backend.hpp"
#include <yaml-cpp/yaml.h>

namespace logging {

class Logger {
public:
    static Logger& instance();

    // Loads the YAML file at `filename` and applies its `log:` section.
    Result<void> init(logging::Type logger, const std::string& filename);

    // Applies an already parsed document (must contain a `log:` map).
    Result<void> configure(logging::Type logger, const YAML::Node& config);

    Result<void> apply();
    void log(const std::string& tag, Level level, const std::string& msg);
    void flush();

    bool isInitialized() const;

    Result<void> setLevel(const std::string& tag, Level level);
    Result<void> enableTag(const std::string& tag);
    Result<void> disableTag(const std::string& tag);

    static logging::Level toLevel(const std::string& s);

private:
    Logger();
    ~Logger();

    // copying forbidden
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    Result<void> createBackend_(logging::Type logger_type);
    Result<void> configureSink_(const std::string& tag, const YAML::Node& sink);

    YAML::Node config_;
    std::shared_ptr<LoggerBackend> logger_;
    mutable std::mutex mutex_;
};

} // namespace logging
