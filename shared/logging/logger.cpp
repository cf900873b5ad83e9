#include "logger.hpp"
#include "logger_spdlog.hpp"
#include "result_helper.hpp"
#include <iostream>

namespace logging {

Logger& Logger::instance() {
    static Logger instance;  // thread-safe since C++11
    return instance;
}

Logger::Logger() = default;

Logger::~Logger() = default;

Result<void> Logger::createBackend_(logging::Type logger_type) {
    std::shared_ptr<LoggerBackend> backend;
    switch (logger_type)
    {
    case logging::Type::SpdLog:
        backend = std::make_shared<SpdlogBackend>();
        break;
    default:
        return Error(ResultCode::InvalidArgument, "unknown logger type");
    }

    // a previous configuration is dropped as a whole
    std::shared_ptr<LoggerBackend> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = std::move(logger_);
    }
    if (previous) {
        auto res = previous->shutdown();
        RETURN_IF_ERR(res);
    }

    auto res = backend->init();
    RETURN_IF_ERR(res);

    std::lock_guard<std::mutex> lock(mutex_);
    logger_ = std::move(backend);
    return OK();
}

Result<void> Logger::init(logging::Type logger_type, const std::string& filename) {
    YAML::Node config;
    try {
        config = YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        std::cerr << "YAML load error: " << e.what() << std::endl;
        return Error(ResultCode::InvalidArgument, fmt::format("{}: {}", filename, e.what()));
    }
    return configure(logger_type, config);
}

Result<void> Logger::configure(logging::Type logger_type, const YAML::Node& config) {
    auto res = createBackend_(logger_type);
    RETURN_IF_ERR(res);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_ = YAML::Clone(config);
    }
    return apply();
}

bool Logger::isInitialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return logger_ != nullptr;
}

void Logger::log(const std::string& tag, Level level, const std::string& msg) {
    std::shared_ptr<LoggerBackend> backend;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        backend = logger_;
    }
    if (backend) backend->log(tag, level, msg);
}

void Logger::flush() {
    std::shared_ptr<LoggerBackend> backend;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        backend = logger_;
    }
    if (backend) backend->flush();
}

Result<void> Logger::setLevel(const std::string& tag, Level level) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_) return Error(ResultCode::InvalidState, "logger not initialized");
    return logger_->setLevel(tag, level);
}

Result<void> Logger::enableTag(const std::string& tag) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_) return Error(ResultCode::InvalidState, "logger not initialized");
    return logger_->enableTag(tag);
}

Result<void> Logger::disableTag(const std::string& tag) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_) return Error(ResultCode::InvalidState, "logger not initialized");
    return logger_->disableTag(tag);
}

logging::Level Logger::toLevel(const std::string& s) {
    if (s == "trace") return logging::Level::Trace;
    if (s == "debug") return logging::Level::Debug;
    if (s == "info")  return logging::Level::Info;
    if (s == "warn")  return logging::Level::Warn;
    if (s == "error") return logging::Level::Error;
    if (s == "fatal") return logging::Level::Fatal;
    return logging::Level::Off;
}

Result<void> Logger::apply() {
    std::shared_ptr<LoggerBackend> backend;
    YAML::Node log_node;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        backend = logger_;
        if (config_) log_node = config_["log"];
    }
    if (!backend) return Error(ResultCode::InvalidState, "logger not initialized");
    if (!log_node || !log_node.IsMap()) return OK();

    try {
        auto g_tag = std::string(GLOBAL_TAG);
        if (log_node[g_tag]) {
            auto node = log_node[g_tag];

            // global level
            if (node["level"]) {
                auto res = backend->setLevel(g_tag, toLevel(node["level"].as<std::string>()));
                RETURN_IF_ERR(res);
            }

            // global sinks
            if (node["sinks"]) {
                for (auto sink : node["sinks"]) {
                    auto res = configureSink_(g_tag, sink);
                    RETURN_IF_ERR(res);
                }
            }
        }

        for (auto it : log_node) {
            std::string tag = it.first.as<std::string>();
            if (tag == GLOBAL_TAG) continue;
            auto node = it.second;

            if (node["sinks"]) {
                for (auto sink : node["sinks"]) {
                    auto res = configureSink_(tag, sink);
                    RETURN_IF_ERR(res);
                }
            }
            if (node["level"]) {
                auto res = backend->setLevel(tag, toLevel(node["level"].as<std::string>()));
                RETURN_IF_ERR(res);
            }
            if (node["enabled"] && !node["enabled"].as<bool>()) {
                auto res = backend->disableTag(tag);
                RETURN_IF_ERR(res);
            }
            auto res = backend->registerLogger(tag);
            RETURN_IF_ERR(res);
        }
    } catch (const YAML::Exception& e) {
        return Error(ResultCode::InvalidArgument, fmt::format("log config: {}", e.what()));
    }
    return OK();
}

Result<void> Logger::configureSink_(const std::string& tag, const YAML::Node& sink) {
    std::shared_ptr<LoggerBackend> backend;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        backend = logger_;
    }
    if (!backend) return Error(ResultCode::InvalidState, "logger not initialized");

    std::string type = sink["type"].as<std::string>();

    if (type == "console") {
        return backend->setConsoleSink(tag);
    } else if (type == "file") {
        return backend->setFileSink(tag, sink["filename"].as<std::string>());
    } else if (type == "rotating_file") {
        return backend->setRotatingFileSink(tag,
            sink["filename"].as<std::string>(),
            sink["max_size"].as<size_t>(),
            sink["max_files"].as<size_t>());
    } else if (type == "syslog") {
        return backend->setSyslogSink(tag,
            sink["ident"] ? sink["ident"].as<std::string>() : tag);
    } else if (type == "udp") {
        return backend->setUdpSink(tag,
            sink["host"].as<std::string>(),
            sink["port"].as<int>());
    } else if (type == "loki") {
        return backend->setLokiSink(tag,
            sink["url"].as<std::string>(),
            sink["job"] ? sink["job"].as<std::string>() : std::string(DEFAULT_TAG));
    }
    return Error(ResultCode::InvalidArgument, fmt::format("unknown sink type: {}", type));
}

} // namespace logging
