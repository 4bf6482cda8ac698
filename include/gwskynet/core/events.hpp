#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <ostream>
#include <string>

namespace gwskynet::core {

using json = nlohmann::json;

// Writes one JSON object per line. Safe to share between worker threads.
class EventEmitter {
public:
    EventEmitter() = default;

    void run_start(const std::string& run_id, const json& extra, std::ostream& out);
    void run_end(const std::string& run_id, bool success, const std::string& status, std::ostream& out);

    void stage_start(const std::string& run_id, const std::string& event_id, Stage stage,
                     std::ostream& out);
    void stage_end(const std::string& run_id, const std::string& event_id, Stage stage,
                   const std::string& status, const json& extra, std::ostream& out);

    void event_classified(const std::string& run_id, const std::string& event_id,
                          const json& result, std::ostream& out);

    void warning(const std::string& run_id, const std::string& message, std::ostream& out);
    void error(const std::string& run_id, const std::string& message, std::ostream& out);

private:
    void emit(const json& event, std::ostream& out);
    json base_event(const std::string& type, const std::string& run_id);
    json stage_event(const std::string& type, const std::string& run_id,
                     const std::string& event_id, Stage stage);

    std::mutex mutex_;
};

} // namespace gwskynet::core
