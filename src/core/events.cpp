#include "gwskynet/core/events.hpp"
#include "gwskynet/core/utils.hpp"

namespace gwskynet::core {

namespace {

void merge_into(json& event, const json& extra) {
    if (!extra.is_object()) return;
    for (const auto& item : extra.items()) {
        event[item.key()] = item.value();
    }
}

} // namespace

json EventEmitter::base_event(const std::string& type, const std::string& run_id) {
    json event = json::object();
    event["type"] = type;
    event["run_id"] = run_id;
    event["ts"] = get_iso_timestamp();
    return event;
}

json EventEmitter::stage_event(const std::string& type, const std::string& run_id,
                               const std::string& event_id, Stage stage) {
    json event = base_event(type, run_id);
    event["event_id"] = event_id;
    event["stage"] = stage_to_int(stage);
    event["stage_name"] = stage_to_string(stage);
    return event;
}

// One line per event; the lock keeps lines from concurrent workers whole.
void EventEmitter::emit(const json& event, std::ostream& out) {
    const std::string line = event.dump();
    std::lock_guard<std::mutex> lock(mutex_);
    out << line << '\n';
    out.flush();
}

void EventEmitter::run_start(const std::string& run_id, const json& extra, std::ostream& out) {
    json event = base_event("run_start", run_id);
    merge_into(event, extra);
    emit(event, out);
}

void EventEmitter::run_end(const std::string& run_id, bool success,
                           const std::string& status, std::ostream& out) {
    json event = base_event("run_end", run_id);
    event["success"] = success;
    event["status"] = status;
    emit(event, out);
}

void EventEmitter::stage_start(const std::string& run_id, const std::string& event_id,
                               Stage stage, std::ostream& out) {
    emit(stage_event("stage_start", run_id, event_id, stage), out);
}

void EventEmitter::stage_end(const std::string& run_id, const std::string& event_id,
                             Stage stage, const std::string& status, const json& extra,
                             std::ostream& out) {
    json event = stage_event("stage_end", run_id, event_id, stage);
    event["status"] = status;
    merge_into(event, extra);
    emit(event, out);
}

void EventEmitter::event_classified(const std::string& run_id, const std::string& event_id,
                                    const json& result, std::ostream& out) {
    json event = base_event("event_classified", run_id);
    event["event_id"] = event_id;
    merge_into(event, result);
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

} // namespace gwskynet::core
