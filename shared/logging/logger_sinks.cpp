#include "logger_sinks.hpp"

#include <arpa/inet.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <memory>

#include <curl/curl.h>
#include <fmt/core.h>
#include <spdlog/common.h>

namespace logging {

namespace {

const char* levelName(spdlog::level::level_enum level)
{
    switch (level) {
        case spdlog::level::trace:    return "trace";
        case spdlog::level::debug:    return "debug";
        case spdlog::level::info:     return "info";
        case spdlog::level::warn:     return "warn";
        case spdlog::level::err:      return "error";
        case spdlog::level::critical: return "critical";
        default:                      return "off";
    }
}

std::once_flag curl_init_flag;

} // namespace

std::string jsonEscape(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) <= 0x1F) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

// ---------- UDP ----------

UdpSink::UdpSink(const std::string& host, int port)
{
    server_.sin_family = AF_INET;
    server_.sin_port = htons(static_cast<uint16_t>(port));
    if (inet_pton(AF_INET, host.c_str(), &server_.sin_addr) != 1)
        throw spdlog::spdlog_ex(fmt::format("udp sink: invalid IPv4 address '{}'", host));

    sock_ = socket(AF_INET, SOCK_DGRAM, 0);
    if (sock_ < 0) throw spdlog::spdlog_ex("udp sink: socket() failed", errno);
}

UdpSink::~UdpSink()
{
    if (sock_ >= 0) close(sock_);
}

void UdpSink::sink_it_(const spdlog::details::log_msg& msg)
{
    spdlog::memory_buf_t formatted;
    formatter_->format(msg, formatted);
    auto sent = sendto(sock_, formatted.data(), formatted.size(), 0,
                       reinterpret_cast<const struct sockaddr*>(&server_), sizeof(server_));
    if (sent < 0) throw spdlog::spdlog_ex("udp sink: sendto() failed", errno);
}

// ---------- Loki ----------

LokiSink::LokiSink(std::string url, std::string job, std::string tag)
    : url_(std::move(url)), job_(std::move(job)), tag_(std::move(tag))
{
    std::call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

void LokiSink::sink_it_(const spdlog::details::log_msg& msg)
{
    spdlog::memory_buf_t formatted;
    formatter_->format(msg, formatted);
    std::string line(formatted.data(), formatted.size());

    auto ns_since_epoch = std::chrono::duration_cast<std::chrono::nanoseconds>(
        msg.time.time_since_epoch()).count();
    auto payload = fmt::format(
        R"({{"streams":[{{"stream":{{"job":"{}","tag":"{}","level":"{}"}},"values":[["{}","{}"]]}}]}})",
        jsonEscape(job_), jsonEscape(tag_), levelName(msg.level), ns_since_epoch, jsonEscape(line));

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) throw spdlog::spdlog_ex("loki sink: curl_easy_init() failed");

    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(
        curl_slist_append(nullptr, "Content-Type: application/json"), &curl_slist_free_all);

    curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, 200L);

    auto result = curl_easy_perform(curl.get());
    if (result != CURLE_OK)
        throw spdlog::spdlog_ex(fmt::format("loki sink: push to {} failed: {}", url_, curl_easy_strerror(result)));
}

} // namespace logging
