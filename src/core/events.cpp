#include "eopack/core/events.hpp"
#include "eopack/core/utils.hpp"

namespace eopack::core {

EventEmitter::EventEmitter(std::ostream* out)
    : out_(out), run_id_(out ? get_run_id() : std::string()) {}

EventEmitter::EventEmitter(std::ostream* out, std::string run_id)
    : out_(out), run_id_(std::move(run_id)) {}

json EventEmitter::base_event(const std::string& type) const {
    return {
        {"type", type},
        {"run_id", run_id_},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event) const {
    if (!out_) return;
    *out_ << event.dump() << "\n";
    out_->flush();
}

void EventEmitter::measurement_recorded(const std::string& name, const std::string& path,
                                        bool expanded_valid_data) const {
    if (!out_) return;
    json event = base_event("measurement_recorded");
    event["name"] = name;
    event["path"] = path;
    event["expand_valid_data"] = expanded_valid_data;
    emit(event);
}

void EventEmitter::grids_named(const std::string& strategy,
                               const std::vector<std::string>& names) const {
    if (!out_) return;
    json event = base_event("grids_named");
    event["strategy"] = strategy;
    event["grids"] = names;
    emit(event);
}

void EventEmitter::valid_data_consumed(ValidDataMethod method, int grid_count, bool empty) const {
    if (!out_) return;
    json event = base_event("valid_data_consumed");
    event["method"] = valid_data_method_to_string(method);
    event["grid_count"] = grid_count;
    event["empty"] = empty;
    emit(event);
}

void EventEmitter::thumbnail_written(const std::string& target, int width, int height,
                                     size_t bytes) const {
    if (!out_) return;
    json event = base_event("thumbnail_written");
    event["target"] = target;
    event["width"] = width;
    event["height"] = height;
    event["bytes"] = bytes;
    emit(event);
}

void EventEmitter::warning(const std::string& message) const {
    if (!out_) return;
    json event = base_event("warning");
    event["message"] = message;
    emit(event);
}

void EventEmitter::error(const std::string& operation, const std::string& message) const {
    if (!out_) return;
    json event = base_event("error");
    event["operation"] = operation;
    event["error"] = message;
    emit(event);
}

} // namespace eopack::core
