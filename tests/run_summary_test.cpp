#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

#include "JsonText.h"
#include "fairness.hpp"
#include "run_summary.hpp"
#include "utils.h"

namespace {

SessionResult MakeSession(const std::string& profile, long long ok, long long failed,
                          const std::string& server, long long latency_us) {
    SessionResult s;
    s.profile_key = profile;
    s.requests = ok + failed;
    s.successes = ok;
    s.failures = failed;
    for (long long i = 0; i < ok; ++i) s.latencies_us.push_back(latency_us);
    s.endpoint_hits["/product/{}"] = s.requests;
    s.server_hits[server] = s.requests;
    s.status_codes[200] = ok;
    if (failed > 0) s.status_codes[0] = failed;
    return s;
}

std::string ReadFile(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

}

TEST(LatencyStatsTest, NearestRankPercentiles) {
    std::vector<long long> samples;
    for (long long i = 1; i <= 100; ++i) samples.push_back(i * 1000);  // 1..100 ms

    LatencyStats stats = compute_latency_stats(samples);

    EXPECT_EQ(stats.count, 100);
    EXPECT_NEAR(stats.mean_ms, 50.5, 1e-9);
    EXPECT_DOUBLE_EQ(stats.min_ms, 1.0);
    EXPECT_DOUBLE_EQ(stats.p50_ms, 50.0);
    EXPECT_DOUBLE_EQ(stats.p95_ms, 95.0);
    EXPECT_DOUBLE_EQ(stats.p99_ms, 99.0);
    EXPECT_DOUBLE_EQ(stats.max_ms, 100.0);
}

TEST(LatencyStatsTest, EmptyInputIsAllZero) {
    LatencyStats stats = compute_latency_stats({});
    EXPECT_EQ(stats.count, 0);
    EXPECT_DOUBLE_EQ(stats.mean_ms, 0.0);
    EXPECT_DOUBLE_EQ(stats.p99_ms, 0.0);
}

TEST(RunSummaryTest, MergeSumsEverySession) {
    RunSummary summary;
    summary.Merge(MakeSession("shopper", 4, 1, "a", 100000));
    summary.Merge(MakeSession("shopper", 3, 0, "b", 300000));
    summary.Merge(MakeSession("bot", 0, 2, "a", 0));

    EXPECT_EQ(summary.sessions, 3);
    EXPECT_EQ(summary.requests, 10);
    EXPECT_EQ(summary.successes, 7);
    EXPECT_EQ(summary.errors, 3);
    EXPECT_EQ(summary.latencies_us.size(), 7u);
    EXPECT_EQ(summary.endpoint_hits.at("/product/{}"), 10);
    EXPECT_EQ(summary.server_hits.at("a"), 7);
    EXPECT_EQ(summary.server_hits.at("b"), 3);
    EXPECT_EQ(summary.profile_sessions.at("shopper"), 2);
    EXPECT_EQ(summary.profile_sessions.at("bot"), 1);
    EXPECT_EQ(summary.status_codes.at(0), 3);
    EXPECT_DOUBLE_EQ(summary.SuccessPercent(), 70.0);
    EXPECT_DOUBLE_EQ(summary.ErrorPercent(), 30.0);
}

TEST(RunSummaryTest, MergeOrderDoesNotMatter) {
    SessionResult x = MakeSession("shopper", 4, 1, "a", 1000);
    SessionResult y = MakeSession("bot", 2, 0, "b", 5000);

    RunSummary forward, backward;
    forward.Merge(x);
    forward.Merge(y);
    backward.Merge(y);
    backward.Merge(x);

    EXPECT_EQ(forward.Format(), backward.Format());
}

TEST(RunSummaryTest, FormatIsGreppable) {
    RunSummary summary;
    summary.label = "mix";
    summary.concurrency = 2;
    summary.Merge(MakeSession("shopper", 3, 1, "node-a", 123000));
    summary.Merge(MakeSession("shopper", 4, 0, "node-b", 123000));

    std::string text = summary.Format();

    EXPECT_NE(text.find("TRAFFIC GENERATION SUMMARY"), std::string::npos);
    EXPECT_NE(text.find("Total Sessions:      2\n"), std::string::npos);
    EXPECT_NE(text.find("Total Requests:      8\n"), std::string::npos);
    EXPECT_NE(text.find("Successful:          7 (87.5%)\n"), std::string::npos);
    EXPECT_NE(text.find("Errors:              1 (12.5%)\n"), std::string::npos);
    EXPECT_NE(text.find("Avg Response Time:   0.123s\n"), std::string::npos);
    EXPECT_NE(text.find("Endpoint Hits:       /product/{} = 8\n"), std::string::npos);
    EXPECT_NE(text.find("Servers Hit:         2 (node-a, node-b)\n"), std::string::npos);
    EXPECT_NE(text.find("Server Hits:         node-a = 4\n"), std::string::npos);
    EXPECT_NE(text.find("Max Share Deviation: 0.0%\n"), std::string::npos);
    EXPECT_EQ(text.find("Cancelled:"), std::string::npos);
}

TEST(RunSummaryTest, EmptyRunFormatsWithoutDividingByZero) {
    RunSummary summary;
    summary.cancelled = true;
    std::string text = summary.Format();

    EXPECT_NE(text.find("Successful:          0 (0.0%)\n"), std::string::npos);
    EXPECT_NE(text.find("Servers Hit:         0 ()\n"), std::string::npos);
    EXPECT_NE(text.find("Cancelled:           yes\n"), std::string::npos);
}

TEST(RunSummaryTest, ResultsFileGrowsAsJsonArray) {
    std::string path = ::testing::TempDir() + "organic_load_results.json";
    std::remove(path.c_str());

    RunSummary summary;
    summary.label = "shopper";
    summary.Merge(MakeSession("shopper", 2, 0, "a\"b", 1000));

    ASSERT_TRUE(append_result_to_file(summary, path));
    std::string once = ReadFile(path);
    EXPECT_EQ(once.front(), '[');
    EXPECT_NE(once.find("\"label\": \"shopper\""), std::string::npos);
    EXPECT_NE(once.find("\"a\\\"b\": 2"), std::string::npos);

    ASSERT_TRUE(append_result_to_file(summary, path));
    std::string twice = ReadFile(path);
    EXPECT_NE(twice.find("},\n{"), std::string::npos);
    EXPECT_EQ(twice.substr(twice.size() - 2), "]\n");

    std::remove(path.c_str());
}

TEST(RunSummaryTest, ResultsFileReplacesNonArrayContent) {
    std::string path = ::testing::TempDir() + "organic_load_garbage.json";
    {
        std::ofstream out(path, std::ios::trunc);
        out << "not json";
    }
    RunSummary summary;
    ASSERT_TRUE(append_result_to_file(summary, path));
    std::string content = ReadFile(path);
    EXPECT_EQ(content.front(), '[');
    EXPECT_EQ(content.find("not json"), std::string::npos);
    std::remove(path.c_str());
}

TEST(RunSummaryTest, LogAppendsSummaryBlocks) {
    std::string path = ::testing::TempDir() + "organic_load_agent.log";
    std::remove(path.c_str());

    RunSummary summary;
    ASSERT_TRUE(append_summary_to_log(summary, path));
    ASSERT_TRUE(append_summary_to_log(summary, path));

    std::string content = ReadFile(path);
    std::size_t first = content.find("TRAFFIC GENERATION SUMMARY");
    ASSERT_NE(first, std::string::npos);
    EXPECT_NE(content.find("TRAFFIC GENERATION SUMMARY", first + 1), std::string::npos);
    std::remove(path.c_str());
}

TEST(RunSummaryTest, JsonEscapesLabelsAndKeys) {
    RunSummary summary;
    summary.label = "say \"hi\"\n";
    SessionResult s = MakeSession("casual", 1, 0, "node\\1", 1000);
    summary.Merge(s);

    const std::string json = summary.ToJson();
    EXPECT_NE(json.find("\"label\": \"say \\\"hi\\\"\\n\""), std::string::npos) << json;
    EXPECT_NE(json.find("\"node\\\\1\": 1"), std::string::npos) << json;
    EXPECT_EQ(json_escape(std::string("a\tb\x01")), "a\\tb\\u0001");
}

TEST(FairnessTest, SharesAndDeviation) {
    FairnessReport report = ComputeFairness({{"a", 50}, {"b", 30}, {"c", 20}});

    EXPECT_EQ(report.total, 100);
    ASSERT_EQ(report.shares.size(), 3u);
    EXPECT_EQ(report.shares[0].instance, "a");
    EXPECT_DOUBLE_EQ(report.shares[0].share, 0.5);
    EXPECT_DOUBLE_EQ(report.shares[2].share, 0.2);
    EXPECT_NEAR(report.max_deviation, 0.3, 1e-12);
}

TEST(FairnessTest, EvenOrTrivialSpreadsHaveNoDeviation) {
    EXPECT_DOUBLE_EQ(ComputeFairness({{"a", 10}, {"b", 10}}).max_deviation, 0.0);
    EXPECT_DOUBLE_EQ(ComputeFairness({{"a", 10}}).max_deviation, 0.0);
    EXPECT_DOUBLE_EQ(ComputeFairness({}).max_deviation, 0.0);
    EXPECT_DOUBLE_EQ(ComputeFairness({{"a", 0}, {"b", 0}}).max_deviation, 0.0);
}

TEST(FairnessTest, ParsesInstanceLinesOnly) {
    std::string body =
        "server_id:node-a\n"
        "total_requests:42\n"
        "instance.node-a:40\n"
        "instance.node-b:2\r\n"
        "instance.broken:abc\n"
        "instance.:5\n"
        "endpoint.homepage:40\n"
        "saturation.bytes_held:0\n";

    auto counts = ParseInstanceCounts(body);

    ASSERT_EQ(counts.size(), 2u);
    EXPECT_EQ(counts.at("node-a"), 40);
    EXPECT_EQ(counts.at("node-b"), 2);
}

TEST(FairnessTest, FormatListsEveryInstance) {
    std::string text = FormatFairness(ComputeFairness({{"node-a", 3}, {"node-b", 1}}));
    EXPECT_NE(text.find("node-a"), std::string::npos);
    EXPECT_NE(text.find("75.0%"), std::string::npos);
    EXPECT_NE(text.find("Max Share Deviation: 50.0%"), std::string::npos);
}
