#pragma once
#include <mutex>
#include <string>
#include <netinet/in.h>
#include <spdlog/sinks/base_sink.h>

namespace logging {

// Escapes `s` for use inside a JSON string literal.
std::string jsonEscape(const std::string& s);

// One formatted line per datagram.
class UdpSink : public spdlog::sinks::base_sink<std::mutex> {
public:
    // Throws spdlog::spdlog_ex when the socket cannot be opened or `host` is
    // not an IPv4 address.
    UdpSink(const std::string& host, int port);
    ~UdpSink() override;

    UdpSink(const UdpSink&) = delete;
    UdpSink& operator=(const UdpSink&) = delete;

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override;
    void flush_() override {}

private:
    int sock_ = -1;
    struct sockaddr_in server_{};
};

// Pushes every record to a Grafana Loki push endpoint.
// Failed pushes surface through the logger's error handler.
class LokiSink : public spdlog::sinks::base_sink<std::mutex> {
public:
    LokiSink(std::string url, std::string job, std::string tag);

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override;
    void flush_() override {}

private:
    std::string url_;
    std::string job_;
    std::string tag_;
};

} // namespace logging
