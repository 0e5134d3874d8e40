#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <ostream>
#include <string>

namespace outlier_detect::core {

using json = nlohmann::json;

/**
 * JSON-lines event stream. One object per line with "type", "run_id" and
 * "ts" plus event specific fields. Safe to call from worker threads.
 */
class EventEmitter {
public:
    EventEmitter(std::string run_id, std::ostream& out);

    const std::string& run_id() const { return run_id_; }

    void run_start(const json& extra);
    void run_end(bool success, const std::string& status, const json& extra = json::object());

    void phase_start(Phase phase);
    void phase_progress(Phase phase, int current, int total, const std::string& message);
    void phase_end(Phase phase, const std::string& status, const json& extra = json::object());

    void frame_processed(Phase phase, int frame_idx, int total_frames,
                         const std::string& frame_name, const json& extra = json::object());

    void warning(const std::string& message);
    void error(const std::string& message);

private:
    void emit(const json& event);
    json base_event(const std::string& type) const;

    std::string run_id_;
    std::ostream& out_;
    std::mutex mutex_;
};

} // namespace outlier_detect::core
