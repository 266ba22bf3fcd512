#include "eopack/registry/grid_naming.hpp"
#include "eopack/core/errors.hpp"
#include "eopack/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace eopack::registry {

namespace {

constexpr const char* kAlphabet = "abcdefghijklmnopqrstuvwxyz";
constexpr size_t kAlphabetSize = 26;

// A strategy names the non-default groups (in frequency order) or gives up
using NamingStrategy = std::optional<std::vector<std::string>> (*)(
    const std::vector<const GridGroup*>& remaining, const std::set<std::string>& all_names);

bool claim(std::set<std::string>& taken, const std::string& name) {
    return taken.insert(name).second;
}

std::optional<std::vector<std::string>> semantic_names(
    const std::vector<const GridGroup*>& remaining, const std::set<std::string>& all_names) {
    std::set<std::string> taken{kDefaultGridName};
    std::vector<std::string> names;
    for (const GridGroup* group : remaining) {
        std::string name;
        if (group->names.size() == 1) {
            name = group->names.front();
        } else {
            auto common = find_common_name(group->names, all_names);
            if (!common) return std::nullopt;
            name = *common;
        }
        if (!claim(taken, name)) return std::nullopt;
        names.push_back(name);
    }
    return names;
}

std::optional<std::vector<std::string>> resolution_names(
    const std::vector<const GridGroup*>& remaining, const std::set<std::string>&) {
    std::set<std::string> taken{kDefaultGridName};
    std::vector<std::string> names;
    for (const GridGroup* group : remaining) {
        std::string name = resolution_name(group->grid);
        if (!claim(taken, name)) return std::nullopt;
        names.push_back(name);
    }
    return names;
}

std::optional<std::vector<std::string>> alphabetic_names(
    const std::vector<const GridGroup*>& remaining, const std::set<std::string>&) {
    if (remaining.size() > kAlphabetSize) {
        throw TooManyGridsError(std::to_string(remaining.size()) +
                                " grids cannot be named (at most " +
                                std::to_string(kAlphabetSize) + " letters available)");
    }
    std::vector<std::string> names;
    for (size_t i = 0; i < remaining.size(); ++i) {
        names.emplace_back(1, kAlphabet[i]);
    }
    return names;
}

struct StrategyEntry {
    const char* name;
    NamingStrategy apply;
};

const StrategyEntry kStrategies[] = {
    {"semantic", &semantic_names},
    {"resolution", &resolution_names},
    {"alphabetic", &alphabetic_names},
};

} // namespace

std::optional<std::string> find_common_name(const std::vector<std::string>& group,
                                            const std::set<std::string>& all_names) {
    std::vector<std::string> non_group;
    for (const auto& name : all_names) {
        if (std::find(group.begin(), group.end(), name) == group.end()) {
            non_group.push_back(name);
        }
    }

    std::vector<std::string> options;

    const std::string prefix = core::common_prefix(group);
    if (std::none_of(non_group.begin(), non_group.end(),
                     [&](const std::string& n) { return core::starts_with(n, prefix); })) {
        options.push_back(prefix);
    }

    const std::string suffix = core::common_suffix(group);
    if (std::none_of(non_group.begin(), non_group.end(),
                     [&](const std::string& n) { return core::ends_with(n, suffix); })) {
        options.push_back(suffix);
    }

    if (options.empty()) return std::nullopt;

    for (auto& option : options) {
        option = core::strip_chars(option, "_:");
    }
    // Longest first; the prefix wins a tie
    std::stable_sort(options.begin(), options.end(),
                     [](const std::string& a, const std::string& b) { return a.size() > b.size(); });

    if (options.front().empty()) return std::nullopt;
    return options.front();
}

std::string resolution_name(const geo::Grid& grid) {
    const double res_x = std::abs(grid.transform().a);
    if (res_x > 1.0) {
        return std::to_string(static_cast<long long>(res_x));
    }
    return core::format_decimal(res_x);
}

GridNaming name_grids(const std::vector<GridGroup>& groups) {
    GridNaming result;
    if (groups.empty()) return result;

    result.order.resize(groups.size());
    std::iota(result.order.begin(), result.order.end(), size_t{0});
    std::stable_sort(result.order.begin(), result.order.end(), [&](size_t a, size_t b) {
        return groups[a].names.size() > groups[b].names.size();
    });

    result.names.push_back(kDefaultGridName);
    if (groups.size() == 1) {
        result.strategy = "single";
        return result;
    }

    std::vector<const GridGroup*> remaining;
    std::set<std::string> all_names;
    for (size_t i = 0; i < result.order.size(); ++i) {
        const GridGroup& group = groups[result.order[i]];
        if (i > 0) remaining.push_back(&group);
        all_names.insert(group.names.begin(), group.names.end());
    }

    for (const auto& strategy : kStrategies) {
        if (auto names = strategy.apply(remaining, all_names)) {
            result.strategy = strategy.name;
            result.names.insert(result.names.end(), names->begin(), names->end());
            return result;
        }
    }

    // alphabetic_names never gives up without throwing
    throw TooManyGridsError("no naming strategy succeeded");
}

} // namespace eopack::registry
