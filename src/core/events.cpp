#include "station_impute/core/events.hpp"
#include "station_impute/core/utils.hpp"

namespace station_impute::core {

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

static void merge_extra(json& event, const json& extra) {
    if (!extra.is_object()) {
        return;
    }
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
}

void EventEmitter::run_start(const std::string& run_id, const json& extra, std::ostream& out) {
    json event = base_event("run_start", run_id);
    merge_extra(event, extra);
    emit(event, out);
}

void EventEmitter::run_end(const std::string& run_id, bool success,
                           const std::string& status, const json& extra,
                           std::ostream& out) {
    json event = base_event("run_end", run_id);
    event["success"] = success;
    event["status"] = status;
    merge_extra(event, extra);
    emit(event, out);
}

void EventEmitter::phase_start(const std::string& run_id, Phase phase, std::ostream& out) {
    json event = base_event("phase_start", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    emit(event, out);
}

void EventEmitter::phase_progress(const std::string& run_id, Phase phase, size_t current,
                                  size_t total, const std::string& message,
                                  std::ostream& out) {
    json event = base_event("phase_progress", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["current"] = current;
    event["total"] = total;
    event["progress"] = total > 0 ? static_cast<double>(current) / static_cast<double>(total)
                                  : 1.0;
    event["substep"] = message;
    emit(event, out);
}

void EventEmitter::phase_end(const std::string& run_id, Phase phase,
                             const std::string& status, const json& extra, std::ostream& out) {
    json event = base_event("phase_end", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["status"] = status;
    merge_extra(event, extra);
    emit(event, out);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message,
                           const json& extra, std::ostream& out) {
    json event = base_event("warning", run_id);
    event["message"] = message;
    merge_extra(event, extra);
    emit(event, out);
}

void EventEmitter::error(const std::string& run_id, const std::string& message,
                         std::ostream& out) {
    json event = base_event("error", run_id);
    event["message"] = message;
    emit(event, out);
}

void emit_event(const std::string& type, const std::string& run_id,
                const json& data, std::ostream& out) {
    json event = {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
    for (auto& [key, value] : data.items()) {
        event[key] = value;
    }
    out << event.dump() << "\n";
    out.flush();
}

} // namespace station_impute::core
