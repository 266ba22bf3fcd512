#pragma once

#include "eopack/geo/grid.hpp"

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace eopack::registry {

inline constexpr const char* kDefaultGridName = "default";

// Measurement names recorded on one grid, in record order
struct GridGroup {
    geo::Grid grid;
    std::vector<std::string> names;
};

// A common prefix or suffix of `group` that no name outside the group
// shares, with '_' and ':' trimmed. The longer candidate wins; nullopt
// when nothing usable remains.
std::optional<std::string> find_common_name(const std::vector<std::string>& group,
                                            const std::set<std::string>& all_names = {});

// Name for a grid from its absolute x pixel size: truncated integer above 1,
// shortest decimal otherwise ("30", "0.5", "1.0")
std::string resolution_name(const geo::Grid& grid);

struct GridNaming {
    std::string strategy;          // semantic | resolution | alphabetic | single
    std::vector<size_t> order;     // group indices, most measurements first
    std::vector<std::string> names;  // names[i] belongs to groups[order[i]]
};

// Names every group: the largest (first recorded on ties) is "default",
// the rest are named by the first strategy that succeeds for all of them.
// Throws TooManyGridsError when even single letters run out.
GridNaming name_grids(const std::vector<GridGroup>& groups);

} // namespace eopack::registry
