#pragma once

#include "planform/core/types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace planform::core {

using json = nlohmann::json;

// JSON-lines progress events: one object per line with type, run_id, ts.
class EventEmitter {
public:
    EventEmitter() = default;

    void run_start(const std::string& run_id, const json& extra, std::ostream& out);
    void run_end(const std::string& run_id, bool success, const std::string& status, std::ostream& out);

    void resolve_end(const std::string& run_id, const json& params, int defaults_assigned,
                     std::ostream& out);
    void generate_end(const std::string& run_id, Topology topology, int image_count,
                      std::ostream& out);
    void image_written(const std::string& run_id, const std::string& name,
                       const std::string& path, std::ostream& out);

    void warning(const std::string& run_id, const std::string& message, std::ostream& out);
    void error(const std::string& run_id, const std::string& message, std::ostream& out);

private:
    void emit(const json& event, std::ostream& out);
    json base_event(const std::string& type, const std::string& run_id);
};

} // namespace planform::core
