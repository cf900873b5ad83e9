#include "logger_spdlog.hpp"
#include "logger_sinks.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/syslog_sink.h>
#include <fmt/core.h>


namespace logging {

// NOTE: spdlog's registry is a function-local static that may already be
//       destroyed when the Logger singleton goes away, so the destructor must
//       not call back into spdlog. Sinks flush when they are released.
SpdlogBackend::~SpdlogBackend() = default;

Result<void> SpdlogBackend::init() {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    initialized_ = true;
    return OK();
}

// Flushes and unregisters every logger created by this backend so that a
// new configuration can be applied from scratch.
Result<void> SpdlogBackend::shutdown() {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    for (const auto& tag : registered_) {
        if (auto logger = spdlog::get(tag)) {
            logger->flush();
            spdlog::drop(tag);
        }
    }
    registered_.clear();
    tag_sinks_.clear();
    tag_levels_.clear();
    disabled_tags_.clear();
    global_level_ = Level::Off;
    return OK();
}

std::shared_ptr<spdlog::logger> SpdlogBackend::registerLocked_(const std::string& tag) {
    if (registered_.count(tag)) {
        if (auto existing = spdlog::get(tag)) return existing;
    }

    std::vector<spdlog::sink_ptr> sinks;
    auto own = tag_sinks_.find(tag);
    if (own != tag_sinks_.end()) sinks = own->second;

    // attach global sinks
    auto global = tag_sinks_.find(std::string(GLOBAL_TAG));
    if (global != tag_sinks_.end()) {
        sinks.insert(sinks.end(), global->second.begin(), global->second.end());
    }
    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    // another library may already own the name in the spdlog registry
    spdlog::drop(tag);
    auto logger = std::make_shared<spdlog::logger>(tag, sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    auto level = tag_levels_.find(tag);
    logger->set_level(toSpd_(level != tag_levels_.end() ? level->second : global_level_));
    spdlog::register_logger(logger);
    registered_.insert(tag);
    return logger;
}

Result<void> SpdlogBackend::registerLogger(const std::string& tag) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (!initialized_) initialized_ = true;
    try {
        registerLocked_(tag);
    } catch (const spdlog::spdlog_ex& e) {
        return Error(ResultCode::Fail, fmt::format("register logger '{}': {}", tag, e.what()));
    }
    return OK();
}

Result<void> SpdlogBackend::setLevel(const std::string& tag, Level level) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (tag == GLOBAL_TAG) {
        global_level_ = level;
        return OK();
    }
    tag_levels_[tag] = level;
    if (auto logger = spdlog::get(tag)) {
        logger->set_level(toSpd_(level));
    }
    return OK();
}

Result<void> SpdlogBackend::setConsoleSink(const std::string& tag) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    tag_sinks_[tag].push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    return OK();
}

Result<void> SpdlogBackend::setFileSink(const std::string& tag, const std::string& filename) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    try {
        tag_sinks_[tag].push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, true));
    } catch (const spdlog::spdlog_ex& e) {
        return Error(ResultCode::InvalidArgument, fmt::format("file sink '{}': {}", filename, e.what()));
    }
    return OK();
}

Result<void> SpdlogBackend::setRotatingFileSink(const std::string& tag, const std::string& filename, size_t max_size, size_t max_files) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    try {
        tag_sinks_[tag].push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(filename, max_size, max_files));
    } catch (const spdlog::spdlog_ex& e) {
        return Error(ResultCode::InvalidArgument, fmt::format("rotating sink '{}': {}", filename, e.what()));
    }
    return OK();
}

Result<void> SpdlogBackend::setSyslogSink(const std::string& tag, const std::string& ident) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    tag_sinks_[tag].push_back(std::make_shared<spdlog::sinks::syslog_sink_mt>(ident, LOG_PID, LOG_USER, true));
    return OK();
}

Result<void> SpdlogBackend::setUdpSink(const std::string& tag, const std::string& host, int port) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    try {
        tag_sinks_[tag].push_back(std::make_shared<UdpSink>(host, port));
    } catch (const spdlog::spdlog_ex& e) {
        return Error(ResultCode::InvalidArgument, e.what());
    }
    return OK();
}

Result<void> SpdlogBackend::setLokiSink(const std::string& tag, const std::string& url, const std::string& job) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    tag_sinks_[tag].push_back(std::make_shared<LokiSink>(url, job, tag));
    return OK();
}

void SpdlogBackend::log(const std::string& tag, Level level, const std::string& msg) {
    std::shared_ptr<spdlog::logger> logger;
    {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        if (!initialized_ || disabled_tags_.count(tag)) return;
        logger = registerLocked_(tag);
    }

    logger->log(toSpd_(level), msg);
    if (level == Level::Fatal) {
        spdlog::apply_all([](std::shared_ptr<spdlog::logger> l){ l->flush(); });
    }
}

void SpdlogBackend::flush() {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    for (const auto& tag : registered_) {
        if (auto logger = spdlog::get(tag)) logger->flush();
    }
}

} // namespace logging
