#pragma once

#include <chrono>
#include <cstddef>
#include <httplib.h>
#include <string>

#include "content_pages.hpp"
#include "fairness_recorder.hpp"
#include "request_tally.hpp"
#include "saturation_controller.hpp"

class StressServer
{
    httplib::Server server;
    RequestTally& tally;
    SaturationController& saturation;
    FairnessRecorder recorder;
    ContentPages pages;
    const std::chrono::steady_clock::time_point started;

public:
    StressServer(RequestTally& requestTally, SaturationController& saturationController,
                 const std::string& instance_id, int thread_count=32, double work_scale=1.0);

    // Monitoring (not counted in the tally)
    void Health(const httplib::Request &req, httplib::Response &res);
    void Metrics(const httplib::Request &req, httplib::Response &res);
    void RequestStats(const httplib::Request &req, httplib::Response &res);

    // Content pages
    void Media(const httplib::Request &req, httplib::Response &res);

    // Saturation
    void ExtremeCpu(const httplib::Request &req, httplib::Response &res);
    void ExtremeMemory(const httplib::Request &req, httplib::Response &res);
    void ExtremeNetwork(const httplib::Request &req, httplib::Response &res);
    void ExtremeCpuMem(const httplib::Request &req, httplib::Response &res);
    void ExtremeAll(const httplib::Request &req, httplib::Response &res);
    void StressProfile(const httplib::Request &req, httplib::Response &res);

    const std::string& InstanceId() const { return recorder.InstanceId(); }

    int Listen(int port);

    // Binds an ephemeral port on `host` and returns it (-1 on failure).
    int BindToAnyPort(const std::string& host);
    bool ListenAfterBind();

    bool IsRunning() const { return server.is_running(); }
    void Stop();

private:
    void StreamPayload(httplib::Response &res, std::size_t total_bytes,
                       std::size_t chunk_bytes, const std::string& trailer);
    std::string AckJson(const std::string& type, const JobTicket* ticket, int network_mb) const;
};
