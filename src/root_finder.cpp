#include "root_finder.hpp"
#include "ceres_root_finder.hpp"
#include "newton_root_finder.hpp"

#include <algorithm> // For std::transform
#include <cctype>    // For std::tolower
#include <stdexcept> // For std::invalid_argument

namespace par_trafo {

std::shared_ptr<RootFinder>
make_root_finder(RootFinderKind kind) {
    switch (kind) {
        case RootFinderKind::Newton:
            return std::make_shared<NewtonRootFinder>();
        case RootFinderKind::Ceres:
            return std::make_shared<CeresRootFinder>();
    }
    throw std::invalid_argument("Unknown root finder kind.");
}

RootFinderKind
root_finder_kind_from_string(const std::string &name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    if (lower == "newton") { return RootFinderKind::Newton; }
    if (lower == "ceres") { return RootFinderKind::Ceres; }
    throw std::invalid_argument("Unknown root finder '" + name + "' (expected \"newton\" or \"ceres\").");
}

} // namespace par_trafo
