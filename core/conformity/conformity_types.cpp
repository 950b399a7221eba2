#include "conformity/conformity_types.hpp"
#include "common/errors.hpp"

#include <cmath>
#include <iomanip>
#include <set>
#include <sstream>

namespace dconf {

const std::vector<TrendPoint>& ConformityTrend::at(const std::string& alpha_key,
                                                   const std::string& profile_key,
                                                   NodeId node) const {
    static const std::vector<TrendPoint> empty;
    auto a = series.find(alpha_key);
    if (a == series.end()) return empty;
    auto p = a->second.find(profile_key);
    if (p == a->second.end()) return empty;
    auto n = p->second.find(node);
    return n != p->second.end() ? n->second : empty;
}

void validateConfig(const ConformityConfig& config) {
    if (config.alphas.empty() || config.labels.empty()) {
        throw InvalidArgument("At least one value must be specified for both alphas and labels");
    }
    if (config.profile_size < 1) {
        throw InvalidArgument("profile_size must be >= 1");
    }
    if (config.profile_size > config.labels.size()) {
        throw InvalidArgument("profile_size must be <= number of labels (" +
                              std::to_string(config.profile_size) + " > " +
                              std::to_string(config.labels.size()) + ")");
    }
    std::set<std::string> alpha_keys;
    for (double alpha : config.alphas) {
        if (!std::isfinite(alpha) || alpha <= 0.0) {
            throw InvalidArgument("Damping factors must be finite and positive, got " +
                                  alphaKey(alpha));
        }
        // Results are keyed by alphaKey; two alphas sharing a key would collide.
        if (!alpha_keys.insert(alphaKey(alpha)).second) {
            throw InvalidArgument("Duplicate damping factor " + alphaKey(alpha));
        }
    }
    for (const auto& [label, hierarchy] : config.hierarchies) {
        if (hierarchy.size() < 2) {
            throw InvalidArgument("Hierarchy for label '" + label + "' needs at least two ranks");
        }
    }
}

std::vector<Profile> buildProfiles(const std::vector<std::string>& labels, size_t profile_size) {
    std::vector<Profile> profiles;
    const size_t n = labels.size();

    for (size_t k = 1; k <= profile_size && k <= n; ++k) {
        // Index combinations of size k, lexicographic.
        std::vector<size_t> idx(k);
        for (size_t i = 0; i < k; ++i) idx[i] = i;

        while (true) {
            Profile p;
            p.reserve(k);
            for (size_t i : idx) p.push_back(labels[i]);
            profiles.push_back(std::move(p));

            // Rightmost index that can still move.
            size_t i = k;
            while (i > 0 && idx[i - 1] == n - k + (i - 1)) --i;
            if (i == 0) break;
            ++idx[i - 1];
            for (size_t j = i; j < k; ++j) idx[j] = idx[j - 1] + 1;
        }
    }
    return profiles;
}

std::string profileKey(const Profile& profile) {
    std::string key;
    for (size_t i = 0; i < profile.size(); ++i) {
        if (i > 0) key += '_';
        key += profile[i];
    }
    return key;
}

std::string alphaKey(double alpha) {
    std::ostringstream oss;
    oss << std::setprecision(15) << alpha;
    return oss.str();
}

} // namespace dconf
