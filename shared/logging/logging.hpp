#pragma once
#include "logging_def.hpp"
#include "logger.hpp"
#include <string>
#include <fmt/core.h>
#include <fmt/format.h>
#include <string_view>
#include <type_traits>
#include <utility>



namespace logging {


inline Result<void> init(logging::Type logger_type, const std::string& filename) {
    return Logger::instance().init(logger_type, filename);
}

inline Result<void> configure(const YAML::Node& config) {
    return Logger::instance().configure(logging::Type::SpdLog, config);
}

inline Result<void> apply() {
    return Logger::instance().apply();
}


template <typename... Args>
inline void log(const char* tag, logging::Level level,
                        std::string_view fmt_str, Args&&... args) {
    auto& logger = Logger::instance();
    if (!logger.isInitialized()) return;
    std::string msg;
    try {
        msg = fmt::vformat(fmt_str, fmt::make_format_args(args...));
    } catch (const fmt::format_error& e) {
        msg = fmt::format("<bad log format '{}': {}>", fmt_str, e.what());
    }
    logger.log(tag, level, msg);
}


} // namespace logging


template <typename... Args>
inline void LOG_TRACE(const char* tag, std::string_view fmt_str, Args&&... args) {
    logging::log(tag, logging::Level::Trace, fmt_str, std::forward<Args>(args)...);
}

template <typename... Args>
inline void LOG_DEBUG(const char* tag, std::string_view fmt_str, Args&&... args) {
    logging::log(tag, logging::Level::Debug, fmt_str, std::forward<Args>(args)...);
}

template <typename... Args>
inline void LOG_INFO(const char* tag, std::string_view fmt_str, Args&&... args) {
    logging::log(tag, logging::Level::Info, fmt_str, std::forward<Args>(args)...);
}

template <typename... Args>
inline void LOG_WARN(const char* tag, std::string_view fmt_str, Args&&... args) {
    logging::log(tag, logging::Level::Warn, fmt_str, std::forward<Args>(args)...);
}

template <typename... Args>
inline void LOG_ERROR(const char* tag, std::string_view fmt_str, Args&&... args) {
    logging::log(tag, logging::Level::Error, fmt_str, std::forward<Args>(args)...);
}

template <typename... Args>
inline void LOG_FATAL(const char* tag, std::string_view fmt_str, Args&&... args) {
    logging::log(tag, logging::Level::Fatal, fmt_str, std::forward<Args>(args)...);
}


// Class-scoped logging: the enclosing class declares LOG_TAG.
#define LOGT(...) logging::log(std::decay_t<decltype(*this)>::LOG_TAG, logging::Level::Trace, __VA_ARGS__)
#define LOGD(...) logging::log(std::decay_t<decltype(*this)>::LOG_TAG, logging::Level::Debug, __VA_ARGS__)
#define LOGI(...) logging::log(std::decay_t<decltype(*this)>::LOG_TAG, logging::Level::Info, __VA_ARGS__)
#define LOGW(...) logging::log(std::decay_t<decltype(*this)>::LOG_TAG, logging::Level::Warn, __VA_ARGS__)
#define LOGE(...) logging::log(std::decay_t<decltype(*this)>::LOG_TAG, logging::Level::Error, __VA_ARGS__)
#define LOGF(...) logging::log(std::decay_t<decltype(*this)>::LOG_TAG, logging::Level::Fatal, __VA_ARGS__)
