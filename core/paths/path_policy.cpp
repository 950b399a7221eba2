#include "paths/path_oracle.hpp"
#include "common/errors.hpp"

namespace dconf {

PathPolicy pathPolicyFromString(const std::string& name) {
    if (name == "shortest") return PathPolicy::SHORTEST;
    if (name == "fastest") return PathPolicy::FASTEST;
    if (name == "foremost") return PathPolicy::FOREMOST;
    if (name == "fastest_shortest") return PathPolicy::FASTEST_SHORTEST;
    if (name == "shortest_fastest") return PathPolicy::SHORTEST_FASTEST;
    throw InvalidArgument("Unknown path policy: " + name);
}

std::string toString(PathPolicy policy) {
    switch (policy) {
        case PathPolicy::SHORTEST:         return "shortest";
        case PathPolicy::FASTEST:          return "fastest";
        case PathPolicy::FOREMOST:         return "foremost";
        case PathPolicy::FASTEST_SHORTEST: return "fastest_shortest";
        case PathPolicy::SHORTEST_FASTEST: return "shortest_fastest";
    }
    return "unknown";
}

int PolicyDistances::get(PathPolicy policy) const {
    switch (policy) {
        case PathPolicy::SHORTEST:         return shortest;
        case PathPolicy::FASTEST:          return fastest;
        case PathPolicy::FOREMOST:         return foremost;
        case PathPolicy::FASTEST_SHORTEST: return fastest_shortest;
        case PathPolicy::SHORTEST_FASTEST: return shortest_fastest;
    }
    return shortest;
}

} // namespace dconf
