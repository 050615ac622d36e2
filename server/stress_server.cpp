#include "stress_server.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "TrafficHeaders.h"
#include "process_stats.hpp"

namespace {

constexpr std::size_t kMegabyte = 1024 * 1024;

std::string error_json(const std::string& message)
{
    return "{\"error\": \"" + json_escape(message) + "\"}";
}

/**
 * @brief Runs `fn` and maps the exceptions it throws onto HTTP statuses.
 *
 * Bad parameters become 400, capacity rejections 503, anything else 500.
 */
template <typename Fn>
void respond_guarded(httplib::Response &res, Fn&& fn)
{
    try
    {
        fn();
    }
    catch (const std::invalid_argument &e)
    {
        res.status = 400; // Bad Request
        res.set_content(error_json(e.what()), "application/json");
    }
    catch (const std::out_of_range &e)
    {
        res.status = 400; // Bad Request
        res.set_content(error_json(e.what()), "application/json");
    }
    catch (const JobRejected &e)
    {
        res.status = 503; // Service Unavailable
        res.set_content(error_json(e.what()), "application/json");
    }
    catch (const std::exception &e)
    {
        std::cerr << "[Server] handler error: " << e.what() << std::endl;
        res.status = 500; // Internal Server Error
        res.set_content(error_json(e.what()), "application/json");
    }
}

int int_param(const httplib::Request &req, const char* name, int fallback)
{
    if (!req.has_param(name)) {
        return fallback;
    }
    const std::string raw = req.get_param_value(name);
    std::size_t pos = 0;
    int value = 0;
    try {
        value = std::stoi(raw, &pos);
    } catch (const std::exception &) {
        throw std::invalid_argument(std::string("Parameter '") + name + "' must be an integer, got '" + raw + "'");
    }
    if (pos != raw.size()) {
        throw std::invalid_argument(std::string("Parameter '") + name + "' must be an integer, got '" + raw + "'");
    }
    return value;
}

const std::string& payload_block()
{
    static const std::string block(static_cast<std::size_t>(kMaxNetworkChunkKb) * 1024, 'X');
    return block;
}

void append_entries(std::ostringstream& ss, const std::vector<RequestTally::Entry>& entries)
{
    ss << "{";
    for (std::size_t i = 0; i < entries.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << "\"" << json_escape(entries[i].first) << "\": " << entries[i].second;
    }
    ss << "}";
}

}

StressServer::StressServer(RequestTally& requestTally, SaturationController& saturationController,
                           const std::string& instance_id, int thread_count, double work_scale):
    tally(requestTally), saturation(saturationController),
    recorder(requestTally, instance_id), pages(work_scale),
    started(std::chrono::steady_clock::now())
{
    server.new_task_queue = [thread_count]{
        return new httplib::ThreadPool(static_cast<size_t>(thread_count));
    };

    server.set_tcp_nodelay(true);

    server.Get("/health", [this](const httplib::Request &req, httplib::Response &res) {
        Health(req, res);
    });
    server.Get("/ready", [this](const httplib::Request &req, httplib::Response &res) {
        Health(req, res);
    });
    server.Get("/metrics", [this](const httplib::Request &req, httplib::Response &res) {
        Metrics(req, res);
    });
    server.Get("/request-stats", [this](const httplib::Request &req, httplib::Response &res) {
        RequestStats(req, res);
    });

    server.Get("/", recorder.Track("homepage", [this](const httplib::Request &, httplib::Response &res) {
        res.set_content(pages.Homepage(InstanceId()), "application/json");
    }));
    server.Get("/api/data", recorder.Track("api_data", [this](const httplib::Request &, httplib::Response &res) {
        res.set_content(pages.ApiData(), "application/json");
    }));
    server.Get("/dashboard", recorder.Track("dashboard", [this](const httplib::Request &, httplib::Response &res) {
        res.set_content(pages.Dashboard(), "application/json");
    }));
    server.Get("/search", recorder.Track("search", [this](const httplib::Request &req, httplib::Response &res) {
        std::string q = req.has_param("q") ? req.get_param_value("q") : "default";
        res.set_content(pages.Search(q), "application/json");
    }));
    server.Get(R"(/product/([^/]+))", recorder.Track("product", [this](const httplib::Request &req, httplib::Response &res) {
        res.set_content(pages.Product(req.matches[1].str()), "application/json");
    }));

    auto checkout = recorder.Track("checkout", [this](const httplib::Request &, httplib::Response &res) {
        res.set_content(pages.Checkout(), "application/json");
    });
    server.Get("/checkout", checkout);
    server.Post("/checkout", checkout);

    server.Get(R"(/media/([^/]+))", recorder.Track("media", [this](const httplib::Request &req, httplib::Response &res) {
        Media(req, res);
    }));

    server.Get("/extreme/cpu", recorder.Track("extreme_cpu", [this](const httplib::Request &req, httplib::Response &res) {
        ExtremeCpu(req, res);
    }));
    server.Get("/extreme/memory", recorder.Track("extreme_memory", [this](const httplib::Request &req, httplib::Response &res) {
        ExtremeMemory(req, res);
    }));
    server.Get("/extreme/network", recorder.Track("extreme_network", [this](const httplib::Request &req, httplib::Response &res) {
        ExtremeNetwork(req, res);
    }));
    server.Get("/extreme/cpu-mem", recorder.Track("extreme_cpu_mem", [this](const httplib::Request &req, httplib::Response &res) {
        ExtremeCpuMem(req, res);
    }));
    server.Get("/extreme/all", recorder.Track("extreme_all", [this](const httplib::Request &req, httplib::Response &res) {
        ExtremeAll(req, res);
    }));
    server.Get(R"(/stress/profile/([a-z\-]+))", recorder.Track("stress_profile", [this](const httplib::Request &req, httplib::Response &res) {
        StressProfile(req, res);
    }));
}

void StressServer::Health(const httplib::Request &req, httplib::Response &res)
{
    const char* status = req.path == "/ready" ? "ready" : "healthy";
    recorder.Stamp(res);
    res.set_content(std::string("{\"status\": \"") + status + "\", \"server_id\": \"" +
                    json_escape(InstanceId()) + "\"}", "application/json");
}

void StressServer::Metrics(const httplib::Request &req, httplib::Response &res)
{
    recorder.Stamp(res);

    auto instances = tally.Snapshot();
    auto endpoints = tally.EndpointSnapshot();
    SaturationStats sat = saturation.Stats();
    ProcessStats proc = read_process_stats();
    double uptime = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(3);

    if (req.has_param("format") && req.get_param_value("format") == "text")
    {
        ss << "server_id:" << InstanceId() << "\n";
        ss << "total_requests:" << tally.Total() << "\n";
        for (const auto& entry : instances) ss << "instance." << entry.first << ":" << entry.second << "\n";
        for (const auto& entry : endpoints) ss << "endpoint." << entry.first << ":" << entry.second << "\n";
        ss << "saturation.active_jobs:" << sat.active_jobs << "\n"
           << "saturation.active_cpu_workers:" << sat.active_cpu_workers << "\n"
           << "saturation.bytes_held:" << sat.bytes_held << "\n"
           << "saturation.jobs_accepted:" << sat.jobs_accepted << "\n"
           << "saturation.jobs_completed:" << sat.jobs_completed << "\n"
           << "saturation.jobs_failed:" << sat.jobs_failed << "\n"
           << "saturation.jobs_rejected:" << sat.jobs_rejected << "\n"
           << "saturation.network_bytes_sent:" << sat.network_bytes_sent << "\n"
           << "process.rss_bytes:" << proc.rss_bytes << "\n"
           << "process.threads:" << proc.threads << "\n"
           << "process.cpu_user_seconds:" << proc.cpu_user_seconds << "\n"
           << "process.cpu_system_seconds:" << proc.cpu_system_seconds << "\n"
           << "uptime_seconds:" << uptime << "\n";
        res.set_content(ss.str(), "text/plain");
        return;
    }

    ss << "{\"server_id\": \"" << json_escape(InstanceId()) << "\", "
       << "\"total_requests\": " << tally.Total() << ", "
       << "\"instances\": [";
    for (std::size_t i = 0; i < instances.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << "{\"id\": \"" << json_escape(instances[i].first) << "\", \"requests\": " << instances[i].second << "}";
    }
    ss << "], \"requests_by_endpoint\": ";
    append_entries(ss, endpoints);
    ss << ", \"saturation\": {"
       << "\"active_jobs\": " << sat.active_jobs
       << ", \"active_cpu_workers\": " << sat.active_cpu_workers
       << ", \"bytes_held\": " << sat.bytes_held
       << ", \"jobs_accepted\": " << sat.jobs_accepted
       << ", \"jobs_completed\": " << sat.jobs_completed
       << ", \"jobs_failed\": " << sat.jobs_failed
       << ", \"jobs_rejected\": " << sat.jobs_rejected
       << ", \"cpu_iterations\": " << sat.cpu_iterations
       << ", \"network_bytes_sent\": " << sat.network_bytes_sent << "}"
       << ", \"process\": {"
       << "\"rss_bytes\": " << proc.rss_bytes
       << ", \"virtual_bytes\": " << proc.virtual_bytes
       << ", \"threads\": " << proc.threads
       << ", \"cpu_user_seconds\": " << proc.cpu_user_seconds
       << ", \"cpu_system_seconds\": " << proc.cpu_system_seconds << "}"
       << ", \"uptime_seconds\": " << uptime
       << ", \"timestamp\": \"" << iso_timestamp() << "\"}";
    res.set_content(ss.str(), "application/json");
}

void StressServer::RequestStats(const httplib::Request &, httplib::Response &res)
{
    recorder.Stamp(res);

    std::ostringstream ss;
    ss << "{\"server_id\": \"" << json_escape(InstanceId()) << "\", "
       << "\"total_requests\": " << tally.Total() << ", "
       << "\"by_endpoint\": ";
    append_entries(ss, tally.EndpointSnapshot());
    ss << ", \"timestamp\": \"" << iso_timestamp() << "\"}";
    res.set_content(ss.str(), "application/json");
}

void StressServer::Media(const httplib::Request &req, httplib::Response &res)
{
    respond_guarded(res, [&] {
        int size_mb = int_param(req, "size_mb", 2);
        saturation.ValidateNetwork(size_mb, 256);
        pages.SimulateQuery(QueryComplexity::Simple);

        res.set_header("Content-Disposition", "attachment; filename=media_" + req.matches[1].str() + ".bin");
        res.set_header(headers::kMediaSizeMb, std::to_string(size_mb));
        StreamPayload(res, static_cast<std::size_t>(size_mb) * kMegabyte, 256 * 1024, "");
    });
}

void StressServer::ExtremeCpu(const httplib::Request &req, httplib::Response &res)
{
    respond_guarded(res, [&] {
        int duration = int_param(req, "duration", 5);
        int workers = int_param(req, "workers", 4);
        JobTicket ticket = saturation.SubmitCpu(duration, workers);
        res.status = 202; // Accepted
        res.set_content(AckJson("extreme_cpu", &ticket, 0), "application/json");
    });
}

void StressServer::ExtremeMemory(const httplib::Request &req, httplib::Response &res)
{
    respond_guarded(res, [&] {
        int mb = int_param(req, "mb", 512);
        int hold = int_param(req, "hold", 5);
        JobTicket ticket = saturation.SubmitMemory(mb, hold);
        res.status = 202; // Accepted
        res.set_content(AckJson("extreme_memory", &ticket, 0), "application/json");
    });
}

void StressServer::ExtremeNetwork(const httplib::Request &req, httplib::Response &res)
{
    respond_guarded(res, [&] {
        int mb = int_param(req, "mb", 50);
        int chunk_kb = int_param(req, "chunk_kb", 1024);
        saturation.ValidateNetwork(mb, chunk_kb);
        StreamPayload(res, static_cast<std::size_t>(mb) * kMegabyte,
                      static_cast<std::size_t>(chunk_kb) * 1024, "");
    });
}

void StressServer::ExtremeCpuMem(const httplib::Request &req, httplib::Response &res)
{
    respond_guarded(res, [&] {
        int cpu_duration = int_param(req, "cpu_duration", 5);
        int memory_mb = int_param(req, "memory_mb", 256);
        int workers = int_param(req, "workers", 4);
        JobTicket ticket = saturation.SubmitCpuMemory(cpu_duration, memory_mb, workers);
        res.status = 202; // Accepted
        res.set_content(AckJson("extreme_cpu_mem", &ticket, 0), "application/json");
    });
}

void StressServer::ExtremeAll(const httplib::Request &req, httplib::Response &res)
{
    respond_guarded(res, [&] {
        int cpu_duration = int_param(req, "cpu_duration", 5);
        int memory_mb = int_param(req, "memory_mb", 256);
        int network_mb = int_param(req, "network_mb", 50);
        int workers = int_param(req, "workers", 4);
        int chunk_kb = int_param(req, "chunk_kb", 1024);

        // Network is checked first so a bad payload size starts no job.
        saturation.ValidateNetwork(network_mb, chunk_kb);
        JobTicket ticket = saturation.SubmitCpuMemory(cpu_duration, memory_mb, workers);

        std::string ack = AckJson("extreme_all", &ticket, network_mb);
        if (network_mb == 0) {
            res.status = 202; // Accepted
            res.set_content(ack, "application/json");
            return;
        }
        StreamPayload(res, static_cast<std::size_t>(network_mb) * kMegabyte,
                      static_cast<std::size_t>(chunk_kb) * 1024, "\n" + ack);
    });
}

void StressServer::StressProfile(const httplib::Request &req, httplib::Response &res)
{
    respond_guarded(res, [&] {
        const std::string profile = req.matches[1].str();
        bool cpu = false, memory = false, network = false;
        if (profile == "cpu") { cpu = true; }
        else if (profile == "memory") { memory = true; }
        else if (profile == "network") { network = true; }
        else if (profile == "cpu-memory") { cpu = memory = true; }
        else if (profile == "cpu-network") { cpu = network = true; }
        else if (profile == "memory-network") { memory = network = true; }
        else if (profile == "all") { cpu = memory = network = true; }
        else {
            res.status = 404; // Not Found
            res.set_content(error_json("Unknown stress profile '" + profile + "'"), "application/json");
            return;
        }

        SaturationRequest request;
        request.cpu = cpu;
        request.cpu_seconds = int_param(req, "cpu_duration", 1);
        request.cpu_workers = int_param(req, "cpu_workers", 1);
        request.memory = memory;
        request.memory_mb = int_param(req, "memory_mb", 128);
        request.memory_hold_seconds = int_param(req, "memory_hold", 1);
        int network_mb = network ? int_param(req, "network_mb", 5) : 0;
        int chunk_kb = int_param(req, "network_chunk_kb", 256);
        if (network) {
            saturation.ValidateNetwork(network_mb, chunk_kb);
        }

        JobTicket ticket;
        const JobTicket* accepted = nullptr;
        if (cpu || memory) {
            ticket = saturation.Submit(request);
            accepted = &ticket;
        }

        std::string ack = AckJson("stress_profile_" + profile, accepted, network_mb);
        if (network_mb > 0) {
            StreamPayload(res, static_cast<std::size_t>(network_mb) * kMegabyte,
                          static_cast<std::size_t>(chunk_kb) * 1024, "\n" + ack);
        } else {
            res.status = accepted ? 202 : 200;
            res.set_content(ack, "application/json");
        }
    });
}

void StressServer::StreamPayload(httplib::Response &res, std::size_t total_bytes,
                                 std::size_t chunk_bytes, const std::string& trailer)
{
    if (total_bytes + trailer.size() == 0) {
        res.set_content("", "application/octet-stream");
        return;
    }
    chunk_bytes = std::max<std::size_t>(1, std::min(chunk_bytes, payload_block().size()));
    res.set_content_provider(
        total_bytes + trailer.size(), "application/octet-stream",
        [this, total_bytes, chunk_bytes, trailer](size_t offset, size_t length, httplib::DataSink &sink) {
            if (offset < total_bytes) {
                std::size_t n = std::min(std::min(chunk_bytes, total_bytes - offset), length);
                if (!sink.write(payload_block().data(), n)) {
                    return false;
                }
                saturation.RecordNetworkBytes(n);
                return true;
            }
            std::size_t trailer_offset = offset - total_bytes;
            std::size_t n = std::min(length, trailer.size() - trailer_offset);
            return sink.write(trailer.data() + trailer_offset, n);
        });
}

std::string StressServer::AckJson(const std::string& type, const JobTicket* ticket, int network_mb) const
{
    std::ostringstream ss;
    ss << "{\"type\": \"" << type << "\", \"accepted\": true";
    if (ticket) {
        ss << ", \"job_id\": " << ticket->id
           << ", \"kind\": \"" << to_string(ticket->kind) << "\""
           << ", \"duration_seconds\": " << ticket->duration_seconds
           << ", \"cpu_workers\": " << ticket->cpu_workers
           << ", \"memory_mb\": " << ticket->memory_mb;
    }
    ss << ", \"network_mb\": " << network_mb
       << ", \"server_id\": \"" << json_escape(InstanceId()) << "\"}";
    return ss.str();
}

int StressServer::Listen(int port)
{
    std::cout << "[Server] " << InstanceId() << " starting on http://0.0.0.0:" << port << std::endl;
    if (!server.listen("0.0.0.0", port))
    {
        std::cerr << "[Server] Failed to start server!" << std::endl;
        return -1;
    }
    return 0;
}

int StressServer::BindToAnyPort(const std::string& host)
{
    return server.bind_to_any_port(host);
}

bool StressServer::ListenAfterBind()
{
    return server.listen_after_bind();
}

void StressServer::Stop()
{
    server.stop();
}
