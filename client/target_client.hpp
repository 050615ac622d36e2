#pragma once

#include <chrono>
#include <functional>
#include <httplib.h>
#include <memory>
#include <string>

/**
 * @brief Outcome of one GET issued by a simulated user.
 */
struct RequestOutcome {
    bool ok = false;          // transport succeeded and status is 2xx
    int status = 0;           // 0 on transport error
    std::chrono::microseconds latency{0};
    std::string server_id;    // X-Server-ID, empty when absent
    std::string error;        // transport error text, empty on success
};

/**
 * @brief Abstract interface for issuing requests against the target.
 *
 * Each session owns its own client, so implementations need no locking.
 */
class ITargetClient {
public:
    virtual ~ITargetClient() = default;

    /**
     * @brief Issues a GET for `path` (path plus query) against the target.
     */
    virtual RequestOutcome Get(const std::string& path) = 0;
};

using TargetClientFactory = std::function<std::unique_ptr<ITargetClient>()>;

/**
 * @brief ITargetClient backed by a persistent httplib::Client.
 */
class HttplibTargetClient : public ITargetClient {
public:
    /**
     * @param base_url e.g. "http://10.0.0.5:7777"; a trailing slash is ignored.
     * @param timeout_sec connection and read timeout for every request.
     * @throws std::invalid_argument when the url is not usable.
     */
    HttplibTargetClient(const std::string& base_url, int timeout_sec = 10);

    RequestOutcome Get(const std::string& path) override;

    static TargetClientFactory Factory(const std::string& base_url, int timeout_sec = 10);

private:
    httplib::Client cli_;
};

// Accepts "http://host[:port]" and bare "host[:port]"; returns the canonical form.
std::string normalize_base_url(const std::string& url);
