#include "content_pages.hpp"

#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <thread>
#include <vector>

namespace {

std::mt19937& rng()
{
    thread_local std::mt19937 gen(std::random_device{}());
    return gen;
}

int rand_int(int lo, int hi)
{
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(rng());
}

double rand_real(double lo, double hi)
{
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(rng());
}

double elapsed_ms(std::chrono::steady_clock::time_point start)
{
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

std::string fixed(double value, int precision)
{
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

std::string random_hex(int length)
{
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(static_cast<std::size_t>(length));
    for (int i = 0; i < length; ++i) {
        out += digits[rand_int(0, 15)];
    }
    return out;
}

}

std::string iso_timestamp()
{
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf;
    localtime_r(&t, &tm_buf);
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    return ss.str();
}

ContentPages::ContentPages(double work_scale)
    : work_scale_(work_scale < 0.0 ? 0.0 : work_scale)
{
}

double ContentPages::SimulateQuery(QueryComplexity complexity) const
{
    if (work_scale_ == 0.0) {
        return 0.0;
    }
    double lo = 0.01, hi = 0.05;
    switch (complexity) {
        case QueryComplexity::Simple: lo = 0.01; hi = 0.05; break;
        case QueryComplexity::Medium: lo = 0.05; hi = 0.15; break;
        case QueryComplexity::Complex: lo = 0.15; hi = 0.40; break;
        case QueryComplexity::Heavy: lo = 0.40; hi = 0.80; break;
    }
    double delay = rand_real(lo, hi) * work_scale_;
    std::this_thread::sleep_for(std::chrono::duration<double>(delay));
    return delay * 1000.0;
}

double ContentPages::SimulateCpu(CpuIntensity intensity) const
{
    if (work_scale_ == 0.0) {
        return 0.0;
    }
    long long iterations = 100000;
    switch (intensity) {
        case CpuIntensity::Light: iterations = 100000; break;
        case CpuIntensity::Medium: iterations = 500000; break;
        case CpuIntensity::Heavy: iterations = 2000000; break;
        case CpuIntensity::Extreme: iterations = 5000000; break;
    }
    iterations = static_cast<long long>(iterations * work_scale_);

    auto start = std::chrono::steady_clock::now();
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    double acc = 0.0;
    for (long long i = 0; i < iterations; ++i) {
        acc += std::sqrt(dist(rng()) * 999.0);
    }
    volatile double sink = acc;
    (void)sink;
    return elapsed_ms(start);
}

double ContentPages::SimulateMemory(int megabytes, double hold_seconds) const
{
    if (work_scale_ == 0.0 || megabytes <= 0) {
        return 0.0;
    }
    auto start = std::chrono::steady_clock::now();
    {
        std::vector<char> data(static_cast<std::size_t>(megabytes) * 1024 * 1024);
        data.front() = 1;
        data.back() = 1;
        std::this_thread::sleep_for(std::chrono::duration<double>(hold_seconds * work_scale_));
    }
    return elapsed_ms(start);
}

std::string ContentPages::Homepage(const std::string& server_id) const
{
    double db = SimulateQuery(QueryComplexity::Simple);
    double cpu = SimulateCpu(CpuIntensity::Light);

    std::ostringstream ss;
    ss << "{\"page\": \"homepage\", "
       << "\"message\": \"Welcome to Organic Load\", "
       << "\"server_id\": \"" << json_escape(server_id) << "\", "
       << "\"processing\": {\"db_query_ms\": " << fixed(db, 2)
       << ", \"cpu_work_ms\": " << fixed(cpu, 2) << "}}";
    return ss.str();
}

std::string ContentPages::ApiData() const
{
    double db = SimulateQuery(QueryComplexity::Medium);
    double cpu = SimulateCpu(CpuIntensity::Medium);

    std::ostringstream ss;
    ss << "{\"endpoint\": \"api_data\", \"items\": [";
    const int count = 50;
    for (int i = 0; i < count; ++i) {
        if (i > 0) ss << ", ";
        ss << "{\"id\": " << i << ", \"value\": " << rand_int(100, 999)
           << ", \"status\": \"" << (rand_int(0, 1) ? "active" : "pending") << "\"}";
    }
    ss << "], \"count\": " << count
       << ", \"processing\": {\"db_query_ms\": " << fixed(db, 2)
       << ", \"cpu_work_ms\": " << fixed(cpu, 2) << "}}";
    return ss.str();
}

std::string ContentPages::Dashboard() const
{
    double db = SimulateQuery(QueryComplexity::Complex)
              + SimulateQuery(QueryComplexity::Medium)
              + SimulateQuery(QueryComplexity::Simple);
    double cpu = SimulateCpu(CpuIntensity::Heavy);
    double mem = SimulateMemory(20, 0.1);

    std::ostringstream ss;
    ss << "{\"page\": \"dashboard\", \"metrics\": {"
       << "\"users_online\": " << rand_int(100, 500)
       << ", \"requests_per_sec\": " << rand_int(50, 200)
       << ", \"error_rate\": " << fixed(rand_real(0.1, 2.0), 2)
       << ", \"avg_response_ms\": " << rand_int(100, 500) << "}, \"charts\": [";

    ss << "{\"type\": \"line\", \"data\": [";
    for (int i = 0; i < 24; ++i) ss << (i ? ", " : "") << rand_int(10, 100);
    ss << "]}, {\"type\": \"bar\", \"data\": [";
    for (int i = 0; i < 12; ++i) ss << (i ? ", " : "") << rand_int(50, 200);
    ss << "]}, {\"type\": \"pie\", \"data\": {\"success\": 95, \"error\": 5}}]";

    ss << ", \"processing\": {\"db_queries_ms\": " << fixed(db, 2)
       << ", \"cpu_work_ms\": " << fixed(cpu, 2)
       << ", \"memory_work_ms\": " << fixed(mem, 2) << "}}";
    return ss.str();
}

std::string ContentPages::Search(const std::string& query) const
{
    QueryComplexity complexity = query.size() < 5 ? QueryComplexity::Simple
                               : query.size() < 15 ? QueryComplexity::Medium
                               : QueryComplexity::Complex;
    const char* complexity_name = complexity == QueryComplexity::Simple ? "simple"
                                : complexity == QueryComplexity::Medium ? "medium" : "complex";
    double db = SimulateQuery(complexity);
    double cpu = SimulateCpu(CpuIntensity::Medium);

    const std::string q = json_escape(query);
    int count = rand_int(5, 20);

    std::ostringstream ss;
    ss << "{\"query\": \"" << q << "\", \"results\": [";
    for (int i = 0; i < count; ++i) {
        if (i > 0) ss << ", ";
        ss << "{\"id\": " << i
           << ", \"title\": \"Result " << i << " for '" << q << "'\""
           << ", \"relevance\": " << fixed(rand_real(0.5, 1.0), 2)
           << ", \"snippet\": \"This is a search result snippet for query: " << q << "...\"}";
    }
    ss << "], \"count\": " << count
       << ", \"processing\": {\"db_query_ms\": " << fixed(db, 2)
       << ", \"cpu_work_ms\": " << fixed(cpu, 2)
       << ", \"complexity\": \"" << complexity_name << "\"}}";
    return ss.str();
}

std::string ContentPages::Product(const std::string& product_id) const
{
    double db = SimulateQuery(QueryComplexity::Medium);
    double cpu = SimulateCpu(CpuIntensity::Medium);

    const std::string id = json_escape(product_id);
    std::string description;
    for (int i = 0; i < 20; ++i) {
        description += "Lorem ipsum dolor sit amet ";
    }

    std::ostringstream ss;
    ss << "{\"product\": {\"id\": \"" << id << "\""
       << ", \"name\": \"Product " << id << "\""
       << ", \"price\": " << fixed(rand_real(10.0, 1000.0), 2)
       << ", \"description\": \"" << description << "\""
       << ", \"stock\": " << rand_int(0, 100)
       << ", \"rating\": " << fixed(rand_real(3.0, 5.0), 1)
       << ", \"reviews\": " << rand_int(0, 500) << "}, \"recommendations\": [";
    for (int i = 0; i < 6; ++i) {
        ss << (i ? ", " : "") << "\"prod_" << i << "\"";
    }
    ss << "], \"processing\": {\"db_query_ms\": " << fixed(db, 2)
       << ", \"cpu_work_ms\": " << fixed(cpu, 2) << "}}";
    return ss.str();
}

std::string ContentPages::Checkout() const
{
    double db = SimulateQuery(QueryComplexity::Medium);
    double cpu = SimulateCpu(CpuIntensity::Heavy);
    double mem = SimulateMemory(30, 0.15);
    db += SimulateQuery(QueryComplexity::Complex);
    cpu += SimulateCpu(CpuIntensity::Medium);

    std::ostringstream ss;
    ss << "{\"checkout\": \"success\", \"transaction\": {"
       << "\"transaction_id\": \"" << random_hex(8) << "-" << random_hex(4) << "-"
       << random_hex(4) << "-" << random_hex(4) << "-" << random_hex(12) << "\""
       << ", \"amount\": " << fixed(rand_real(10.0, 500.0), 2)
       << ", \"status\": \"completed\""
       << ", \"timestamp\": \"" << iso_timestamp() << "\"}"
       << ", \"processing\": {\"total_db_ms\": " << fixed(db, 2)
       << ", \"total_cpu_ms\": " << fixed(cpu, 2)
       << ", \"memory_work_ms\": " << fixed(mem, 2) << "}}";
    return ss.str();
}
