#pragma once

#include <httplib.h>
#include <string>
#include <vector>

#include "request_tally.hpp"

/**
 * @brief Attributes every tracked request to this server instance.
 *
 * The instance identifier is fixed when the recorder is constructed. Routes
 * registered through Track() count each request in the injected tally and
 * carry the tracking headers consumed by agents and log scrapers.
 */
class FairnessRecorder {
public:
    FairnessRecorder(RequestTally& tally, std::string instance_id);

    /**
     * @brief Picks the identifier for this process.
     *
     * Uses `explicit_id` when non-empty, then the SERVER_ID environment
     * variable, then the host name.
     */
    static std::string ResolveInstanceId(const std::string& explicit_id);

    const std::string& InstanceId() const { return instance_id_; }

    /**
     * @brief Wraps a route handler so each call is counted under `endpoint`.
     */
    httplib::Server::Handler Track(const std::string& endpoint, httplib::Server::Handler handler);

    // Adds the instance marker header only; used by untracked routes.
    void Stamp(httplib::Response& res) const;

    std::vector<RequestTally::Entry> Tally() const { return tally_.Snapshot(); }

private:
    RequestTally& tally_;
    const std::string instance_id_;
};
