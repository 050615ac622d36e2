#pragma once

#include <chrono>
#include <map>
#include <random>
#include <string>
#include <vector>

#include "session_profile.hpp"
#include "stop_signal.hpp"
#include "target_client.hpp"

/**
 * @brief Everything one simulated user observed.
 *
 * Endpoint hits are keyed by template (e.g. "/product/{}") so results from
 * different sessions can be summed.
 */
struct SessionResult {
    std::string profile_key;
    long long requests = 0;
    long long successes = 0;
    long long failures = 0;
    std::vector<long long> latencies_us;  // successful requests only
    std::map<std::string, long long> endpoint_hits;
    std::map<std::string, long long> server_hits;
    std::map<int, long long> status_codes;  // 0 is a transport error
};

/**
 * @brief Limits imposed on a session by whoever runs it.
 */
struct SessionBounds {
    // No request starts at or after this point.
    std::chrono::steady_clock::time_point run_deadline = std::chrono::steady_clock::time_point::max();
    // Interrupts think time; checked before every request. May be null.
    StopSignal* stop = nullptr;
};

/**
 * @brief Runs one user session to completion.
 *
 * Draws a duration and a page budget from the profile, then alternates
 * weighted requests and think-time sleeps until either budget runs out.
 * Think time never extends past the session or run deadline and ends early
 * when `bounds.stop` is requested. Transport errors and non-2xx statuses are
 * counted as failures; the session carries on.
 */
SessionResult RunSession(const SessionProfile& profile, ITargetClient& client,
                         std::mt19937& gen, const SessionBounds& bounds = SessionBounds{});
