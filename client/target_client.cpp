#include "target_client.hpp"

#include <stdexcept>

#include "TrafficHeaders.h"

std::string normalize_base_url(const std::string& url)
{
    std::string base = url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    if (base.find("://") == std::string::npos) {
        base = "http://" + base;
    }
    if (base.compare(0, 7, "http://") != 0 && base.compare(0, 8, "https://") != 0) {
        throw std::invalid_argument("Unsupported scheme in target url: " + url);
    }
    std::size_t host_start = base.find("://") + 3;
    if (host_start >= base.size() || base.find('/', host_start) != std::string::npos) {
        throw std::invalid_argument("Target url must be scheme://host[:port]: " + url);
    }
    return base;
}

HttplibTargetClient::HttplibTargetClient(const std::string& base_url, int timeout_sec)
    : cli_(normalize_base_url(base_url))
{
    if (!cli_.is_valid()) {
        throw std::invalid_argument("Cannot create client for " + base_url);
    }
    cli_.set_keep_alive(true);
    cli_.set_tcp_nodelay(true);
    cli_.set_connection_timeout(timeout_sec);
    cli_.set_read_timeout(timeout_sec);
    cli_.set_write_timeout(timeout_sec);
}

RequestOutcome HttplibTargetClient::Get(const std::string& path)
{
    RequestOutcome outcome;

    auto start_time = std::chrono::steady_clock::now();
    httplib::Result res = cli_.Get(path);
    auto end_time = std::chrono::steady_clock::now();

    outcome.latency = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time);

    if (!res) {
        outcome.error = httplib::to_string(res.error());
        return outcome;
    }

    outcome.status = res->status;
    outcome.ok = res->status >= 200 && res->status < 300;
    outcome.server_id = res->get_header_value(headers::kServerId);
    return outcome;
}

TargetClientFactory HttplibTargetClient::Factory(const std::string& base_url, int timeout_sec)
{
    // Fail on a bad url here rather than once per session.
    std::string base = normalize_base_url(base_url);
    return [base, timeout_sec]() -> std::unique_ptr<ITargetClient> {
        return std::make_unique<HttplibTargetClient>(base, timeout_sec);
    };
}
