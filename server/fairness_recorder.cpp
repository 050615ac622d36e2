#include "fairness_recorder.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <random>
#include <sstream>
#include <unistd.h>

#include "TrafficHeaders.h"

namespace {

std::string make_request_id()
{
    thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<unsigned long long> dist;
    unsigned long long hi = dist(gen);
    unsigned long long lo = dist(gen);

    // Version 4 / variant 1 bits so the value reads as a UUID.
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08llx-%04llx-%04llx-%04llx-%012llx",
                  hi >> 32, (hi >> 16) & 0xFFFFULL, hi & 0xFFFFULL,
                  lo >> 48, lo & 0xFFFFFFFFFFFFULL);
    return std::string(buf);
}

}

FairnessRecorder::FairnessRecorder(RequestTally& tally, std::string instance_id)
    : tally_(tally), instance_id_(std::move(instance_id))
{
}

std::string FairnessRecorder::ResolveInstanceId(const std::string& explicit_id)
{
    if (!explicit_id.empty()) {
        return explicit_id;
    }
    if (const char* env = std::getenv("SERVER_ID")) {
        if (*env != '\0') {
            return env;
        }
    }
    char host[256] = {0};
    if (gethostname(host, sizeof(host) - 1) == 0 && host[0] != '\0') {
        return host;
    }
    return "unknown-host";
}

httplib::Server::Handler FairnessRecorder::Track(const std::string& endpoint,
                                                 httplib::Server::Handler handler)
{
    return [this, endpoint, handler](const httplib::Request& req, httplib::Response& res) {
        auto start = std::chrono::steady_clock::now();
        tally_.Increment(instance_id_, endpoint);

        handler(req, res);

        double elapsed_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();
        std::ostringstream ms;
        ms << std::fixed << std::setprecision(2) << elapsed_ms;

        Stamp(res);
        res.set_header(headers::kRequestId, make_request_id());
        res.set_header(headers::kEndpoint, endpoint);
        res.set_header(headers::kResponseTimeMs, ms.str());
    };
}

void FairnessRecorder::Stamp(httplib::Response& res) const
{
    res.set_header(headers::kServerId, instance_id_);
}
