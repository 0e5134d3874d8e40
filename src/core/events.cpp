#include "outlier_detect/core/events.hpp"
#include "outlier_detect/core/utils.hpp"

#include <utility>

namespace outlier_detect::core {

namespace {

void merge_into(json& event, const json& extra) {
    if (!extra.is_object()) return;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
}

} // namespace

EventEmitter::EventEmitter(std::string run_id, std::ostream& out)
    : run_id_(std::move(run_id)), out_(out) {}

json EventEmitter::base_event(const std::string& type) const {
    return {
        {"type", type},
        {"run_id", run_id_},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << event.dump() << "\n";
    out_.flush();
}

void EventEmitter::run_start(const json& extra) {
    json event = base_event("run_start");
    merge_into(event, extra);
    emit(event);
}

void EventEmitter::run_end(bool success, const std::string& status, const json& extra) {
    json event = base_event("run_end");
    event["success"] = success;
    event["status"] = status;
    merge_into(event, extra);
    emit(event);
}

void EventEmitter::phase_start(Phase phase) {
    json event = base_event("phase_start");
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    emit(event);
}

void EventEmitter::phase_progress(Phase phase, int current, int total,
                                  const std::string& message) {
    json event = base_event("phase_progress");
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["current"] = current;
    event["total"] = total;
    event["progress"] = total > 0 ? static_cast<float>(current) / static_cast<float>(total) : 0.0f;
    event["substep"] = message;
    emit(event);
}

void EventEmitter::phase_end(Phase phase, const std::string& status, const json& extra) {
    json event = base_event("phase_end");
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["status"] = status;
    merge_into(event, extra);
    emit(event);
}

void EventEmitter::frame_processed(Phase phase, int frame_idx, int total_frames,
                                   const std::string& frame_name, const json& extra) {
    json event = base_event("frame_processed");
    event["phase"] = phase_to_int(phase);
    event["frame_idx"] = frame_idx;
    event["total_frames"] = total_frames;
    event["frame_name"] = frame_name;
    merge_into(event, extra);
    emit(event);
}

void EventEmitter::warning(const std::string& message) {
    json event = base_event("warning");
    event["message"] = message;
    emit(event);
}

void EventEmitter::error(const std::string& message) {
    json event = base_event("error");
    event["message"] = message;
    emit(event);
}

} // namespace outlier_detect::core
