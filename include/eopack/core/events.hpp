#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace eopack::core {

using json = nlohmann::json;

// JSON-lines event log for a packaging run. A null stream disables events.
class EventEmitter {
public:
    EventEmitter() = default;
    explicit EventEmitter(std::ostream* out);
    EventEmitter(std::ostream* out, std::string run_id);

    bool enabled() const { return out_ != nullptr; }
    const std::string& run_id() const { return run_id_; }

    void measurement_recorded(const std::string& name, const std::string& path,
                              bool expanded_valid_data) const;
    void grids_named(const std::string& strategy, const std::vector<std::string>& names) const;
    void valid_data_consumed(ValidDataMethod method, int grid_count, bool empty) const;
    void thumbnail_written(const std::string& target, int width, int height, size_t bytes) const;

    void warning(const std::string& message) const;
    // A failed operation, emitted just before its exception propagates
    void error(const std::string& operation, const std::string& message) const;

private:
    void emit(const json& event) const;
    json base_event(const std::string& type) const;

    std::ostream* out_ = nullptr;
    std::string run_id_;
};

} // namespace eopack::core
