#include "session_profile.hpp"

#include <stdexcept>

namespace {

const std::vector<std::string>& search_terms()
{
    static const std::vector<std::string> terms = {
        "laptop", "phone", "book", "shoes", "watch", "camera"
    };
    return terms;
}

std::vector<double> weights_of(const std::vector<std::pair<std::string, double>>& endpoints)
{
    std::vector<double> weights;
    weights.reserve(endpoints.size());
    for (const auto& e : endpoints) {
        weights.push_back(e.second);
    }
    return weights;
}

template <typename T>
void check_range(const Range<T>& range, const std::string& what)
{
    if (range.min < 0 || range.max < 0) {
        throw std::invalid_argument(what + " bounds must be >= 0");
    }
    if (range.min > range.max) {
        throw std::invalid_argument(what + " min must not exceed max");
    }
}

}

EndpointTemplate::EndpointTemplate(std::string path_, double weight_)
    : path(std::move(path_)), weight(weight_)
{
    if (path.find("{}") != std::string::npos) {
        placeholder = path.find("q={}") != std::string::npos ? Placeholder::SearchTerm
                                                              : Placeholder::ItemId;
    }
}

std::string EndpointTemplate::Resolve(std::mt19937& gen) const
{
    if (placeholder == Placeholder::None) {
        return path;
    }

    std::string value;
    if (placeholder == Placeholder::SearchTerm) {
        std::uniform_int_distribution<std::size_t> dist(0, search_terms().size() - 1);
        value = search_terms()[dist(gen)];
    } else {
        std::uniform_int_distribution<int> dist(1, 1000);
        value = "item" + std::to_string(dist(gen));
    }

    std::string resolved = path;
    resolved.replace(resolved.find("{}"), 2, value);
    return resolved;
}

SessionProfile::SessionProfile(std::string key, std::string name,
                               Range<double> session_duration,
                               Range<int> pages_per_session,
                               Range<double> think_time,
                               std::vector<std::pair<std::string, double>> endpoints)
    : key_(std::move(key)),
      name_(std::move(name)),
      session_duration_(session_duration),
      pages_per_session_(pages_per_session),
      think_time_(think_time),
      sampler_(weights_of(endpoints))
{
    check_range(session_duration_, "Session duration");
    check_range(pages_per_session_, "Pages per session");
    check_range(think_time_, "Think time");

    endpoints_.reserve(endpoints.size());
    for (auto& e : endpoints) {
        endpoints_.emplace_back(std::move(e.first), e.second);
    }
}

double SessionProfile::DrawSessionDuration(std::mt19937& gen) const
{
    std::uniform_real_distribution<double> dist(session_duration_.min, session_duration_.max);
    return session_duration_.min == session_duration_.max ? session_duration_.min : dist(gen);
}

int SessionProfile::DrawPageCount(std::mt19937& gen) const
{
    std::uniform_int_distribution<int> dist(pages_per_session_.min, pages_per_session_.max);
    return dist(gen);
}

double SessionProfile::DrawThinkTime(std::mt19937& gen) const
{
    std::uniform_real_distribution<double> dist(think_time_.min, think_time_.max);
    return think_time_.min == think_time_.max ? think_time_.min : dist(gen);
}

ProfileRegistry::ProfileRegistry(std::vector<ProfilePtr> profiles, const std::vector<double>& mix)
    : profiles_(std::move(profiles)), mix_(mix)
{
    if (profiles_.size() != mix.size()) {
        throw std::invalid_argument("Profile mix needs one weight per profile");
    }
}

const ProfileRegistry& ProfileRegistry::Default()
{
    static const ProfileRegistry registry(
        {
            std::make_shared<const SessionProfile>(
                "casual_browser", "Casual Browser",
                Range<double>{60, 300}, Range<int>{3, 8}, Range<double>{5, 15},
                std::vector<std::pair<std::string, double>>{
                    {"/", 0.50}, {"/product/{}", 0.20}, {"/api/data", 0.15}, {"/search?q={}", 0.15}}),
            std::make_shared<const SessionProfile>(
                "power_user", "Power User",
                Range<double>{300, 900}, Range<int>{15, 30}, Range<double>{2, 8},
                std::vector<std::pair<std::string, double>>{
                    {"/dashboard", 0.30}, {"/api/data", 0.30}, {"/search?q={}", 0.20},
                    {"/product/{}", 0.10}, {"/", 0.10}}),
            std::make_shared<const SessionProfile>(
                "shopper", "Shopper",
                Range<double>{180, 600}, Range<int>{8, 15}, Range<double>{3, 12},
                std::vector<std::pair<std::string, double>>{
                    {"/product/{}", 0.40}, {"/search?q={}", 0.30}, {"/checkout", 0.20}, {"/", 0.10}}),
            std::make_shared<const SessionProfile>(
                "bot", "Bot/Crawler",
                Range<double>{600, 3600}, Range<int>{50, 200}, Range<double>{0.5, 2},
                std::vector<std::pair<std::string, double>>{
                    {"/", 0.20}, {"/product/{}", 0.25}, {"/api/data", 0.25},
                    {"/dashboard", 0.15}, {"/search?q={}", 0.15}}),
            std::make_shared<const SessionProfile>(
                "mobile_user", "Mobile User",
                Range<double>{60, 180}, Range<int>{2, 5}, Range<double>{8, 20},
                std::vector<std::pair<std::string, double>>{
                    {"/", 0.60}, {"/product/{}", 0.20}, {"/api/data", 0.15}, {"/search?q={}", 0.05}}),
        },
        {0.40, 0.25, 0.20, 0.10, 0.05});
    return registry;
}

ProfilePtr ProfileRegistry::Find(const std::string& key) const
{
    for (const auto& profile : profiles_) {
        if (profile->key() == key) {
            return profile;
        }
    }
    return nullptr;
}

ProfilePtr ProfileRegistry::PickMixed(std::mt19937& gen) const
{
    return profiles_[mix_.Sample(gen)];
}
