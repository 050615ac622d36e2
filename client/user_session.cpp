#include "user_session.hpp"

#include <algorithm>
#include <thread>

#include "TrafficHeaders.h"

namespace {

using Clock = std::chrono::steady_clock;

Clock::time_point offset_by(Clock::time_point from, double seconds)
{
    return from + std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds));
}

}

SessionResult RunSession(const SessionProfile& profile, ITargetClient& client,
                         std::mt19937& gen, const SessionBounds& bounds)
{
    SessionResult result;
    result.profile_key = profile.key();

    const auto start_time = Clock::now();
    const double duration = profile.DrawSessionDuration(gen);
    const int pages = profile.DrawPageCount(gen);

    if (duration <= 0.0 || pages <= 0) {
        return result;
    }

    const auto session_deadline = std::min(offset_by(start_time, duration), bounds.run_deadline);

    auto stopped = [&bounds]() { return bounds.stop != nullptr && bounds.stop->Requested(); };

    while (result.requests < pages && Clock::now() < session_deadline && !stopped()) {
        const EndpointTemplate& endpoint = profile.endpoints()[profile.PickEndpoint(gen)];
        RequestOutcome outcome = client.Get(endpoint.Resolve(gen));

        result.requests++;
        result.endpoint_hits[endpoint.path]++;
        result.status_codes[outcome.status]++;
        if (outcome.ok) {
            result.successes++;
            result.latencies_us.push_back(outcome.latency.count());
        } else {
            result.failures++;
        }
        // Any response counts toward its server; transport errors reach none.
        if (outcome.status != 0) {
            result.server_hits[outcome.server_id.empty() ? kUnknownServer : outcome.server_id]++;
        }

        if (result.requests >= pages) {
            break;
        }

        auto now = Clock::now();
        auto wake = std::min(offset_by(now, profile.DrawThinkTime(gen)), session_deadline);
        if (wake <= now) {
            continue;
        }
        if (bounds.stop != nullptr) {
            if (bounds.stop->WaitUntil(wake)) {
                break;
            }
        } else {
            std::this_thread::sleep_until(wake);
        }
    }

    return result;
}
