#include "planform/core/events.hpp"
#include "planform/core/utils.hpp"

namespace planform::core {

json EventEmitter::base_event(const std::string& type, const std::string& run_id) {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event, std::ostream& out) {
    out << event.dump() << "\n";
    out.flush();
}

void EventEmitter::run_start(const std::string& run_id, const json& extra, std::ostream& out) {
    json event = base_event("run_start", run_id);
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::run_end(const std::string& run_id, bool success,
                           const std::string& status, std::ostream& out) {
    json event = base_event("run_end", run_id);
    event["success"] = success;
    event["status"] = status;
    emit(event, out);
}

void EventEmitter::resolve_end(const std::string& run_id, const json& params,
                               int defaults_assigned, std::ostream& out) {
    json event = base_event("resolve_end", run_id);
    event["params"] = params;
    event["defaults_assigned"] = defaults_assigned;
    emit(event, out);
}

void EventEmitter::generate_end(const std::string& run_id, Topology topology,
                                int image_count, std::ostream& out) {
    json event = base_event("generate_end", run_id);
    event["topology"] = topology_to_string(topology);
    event["images"] = image_count;
    emit(event, out);
}

void EventEmitter::image_written(const std::string& run_id, const std::string& name,
                                 const std::string& path, std::ostream& out) {
    json event = base_event("image_written", run_id);
    event["name"] = name;
    event["path"] = path;
    emit(event, out);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message,
                           std::ostream& out) {
    json event = base_event("warning", run_id);
    event["message"] = message;
    emit(event, out);
}

void EventEmitter::error(const std::string& run_id, const std::string& message,
                         std::ostream& out) {
    json event = base_event("error", run_id);
    event["message"] = message;
    emit(event, out);
}

} // namespace planform::core
