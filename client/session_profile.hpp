#pragma once

#include <memory>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "discrete_sampler.hpp"

template <typename T>
struct Range {
    T min;
    T max;
};

/**
 * @brief One endpoint a simulated user may visit.
 *
 * A `{}` in the template is filled per request: query templates (`?q={}`)
 * get a search term, path templates get an item id such as `item42`.
 */
struct EndpointTemplate {
    enum class Placeholder { None, ItemId, SearchTerm };

    std::string path;
    double weight = 0.0;
    Placeholder placeholder = Placeholder::None;

    EndpointTemplate(std::string path, double weight);

    std::string Resolve(std::mt19937& gen) const;
};

/**
 * @brief Immutable behavior template for one kind of user.
 *
 * Endpoints keep the order they were registered in; the weights are
 * normalized once into a cumulative table when the profile is built.
 */
class SessionProfile {
public:
    /**
     * @throws std::invalid_argument for negative bounds, min > max, or an
     * unusable weight table.
     */
    SessionProfile(std::string key, std::string name,
                   Range<double> session_duration,
                   Range<int> pages_per_session,
                   Range<double> think_time,
                   std::vector<std::pair<std::string, double>> endpoints);

    const std::string& key() const { return key_; }
    const std::string& name() const { return name_; }
    const Range<double>& session_duration() const { return session_duration_; }
    const Range<int>& pages_per_session() const { return pages_per_session_; }
    const Range<double>& think_time() const { return think_time_; }
    const std::vector<EndpointTemplate>& endpoints() const { return endpoints_; }

    // Index into endpoints() drawn by weight.
    std::size_t PickEndpoint(std::mt19937& gen) const { return sampler_.Sample(gen); }

    std::vector<double> NormalizedWeights() const { return sampler_.Probabilities(); }

    double DrawSessionDuration(std::mt19937& gen) const;
    int DrawPageCount(std::mt19937& gen) const;
    double DrawThinkTime(std::mt19937& gen) const;

private:
    std::string key_;
    std::string name_;
    Range<double> session_duration_;
    Range<int> pages_per_session_;
    Range<double> think_time_;
    std::vector<EndpointTemplate> endpoints_;
    DiscreteSampler sampler_;
};

using ProfilePtr = std::shared_ptr<const SessionProfile>;

/**
 * @brief The fixed catalog of user profiles and the default traffic mix.
 */
class ProfileRegistry {
public:
    // casual_browser, power_user, shopper, bot, mobile_user with the usual mix.
    static const ProfileRegistry& Default();

    ProfileRegistry(std::vector<ProfilePtr> profiles, const std::vector<double>& mix);

    // nullptr when no profile has that key.
    ProfilePtr Find(const std::string& key) const;

    // Draws a profile according to the mix weights.
    ProfilePtr PickMixed(std::mt19937& gen) const;

    const std::vector<ProfilePtr>& profiles() const { return profiles_; }
    std::vector<double> MixWeights() const { return mix_.Probabilities(); }

private:
    std::vector<ProfilePtr> profiles_;
    DiscreteSampler mix_;
};
