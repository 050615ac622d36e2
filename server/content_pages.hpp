#pragma once

#include <string>

#include "JsonText.h"

enum class QueryComplexity { Simple, Medium, Complex, Heavy };
enum class CpuIntensity { Light, Medium, Heavy, Extreme };

// Local wall-clock time, e.g. 2024-05-01T12:30:00.
std::string iso_timestamp();

/**
 * @brief Builds the bodies of the ordinary content pages.
 *
 * Each page simulates the backend work a real page would do (database round
 * trips as sleeps, rendering as CPU loops, session data as short-lived
 * allocations). `work_scale` multiplies all of it; 0 turns the simulation
 * off.
 */
class ContentPages {
public:
    explicit ContentPages(double work_scale = 1.0);

    std::string Homepage(const std::string& server_id) const;
    std::string ApiData() const;
    std::string Dashboard() const;
    std::string Search(const std::string& query) const;
    std::string Product(const std::string& product_id) const;
    std::string Checkout() const;

    // Simulated database latency; returns milliseconds spent.
    double SimulateQuery(QueryComplexity complexity) const;

    // Simulated rendering work; returns milliseconds spent.
    double SimulateCpu(CpuIntensity intensity) const;

    // Short-lived allocation held for `hold_seconds`; returns milliseconds spent.
    double SimulateMemory(int megabytes, double hold_seconds) const;

    double work_scale() const { return work_scale_; }

private:
    double work_scale_;
};
