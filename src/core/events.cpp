#include "aperture_view/core/events.hpp"
#include "aperture_view/core/utils.hpp"

#include <utility>

namespace aperture_view::core {

void DiagnosticsSink::cycle_start(const DisplayCycle& cycle) {
    info("Showing file " + std::to_string(cycle.index) + ": " + cycle.image_path.string());
}

void DiagnosticsSink::cycle_end(const DisplayCycle& cycle) {
    info("Finished file " + std::to_string(cycle.index));
}

void DiagnosticsSink::cycle_failed(const DisplayCycle& cycle, const std::string& message) {
    error("File " + std::to_string(cycle.index) + " (" + cycle.image_path.string() + "): " + message);
}

EventEmitter::EventEmitter(std::string run_id, std::ostream& out)
    : run_id_(std::move(run_id)), out_(out) {}

json EventEmitter::base_event(const std::string& type) const {
    return {
        {"type", type},
        {"run_id", run_id_},
        {"ts", get_iso_timestamp()}
    };
}

json EventEmitter::cycle_json(const DisplayCycle& cycle) {
    return {
        {"index", cycle.index},
        {"image", cycle.image_path.string()},
        {"catalog", cycle.catalog_path.string()}
    };
}

void EventEmitter::emit(const json& event) {
    out_ << event.dump() << "\n";
    out_.flush();
}

void EventEmitter::info(const std::string& message) {
    json event = base_event("info");
    event["message"] = message;
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

void EventEmitter::run_start(const json& extra) {
    json event = base_event("run_start");
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::run_end(const RunSummary& summary, const std::string& status) {
    json event = base_event("run_end");
    event["status"] = status;
    event["enumerated"] = summary.enumerated;
    event["selected"] = summary.selected;
    event["displayed"] = summary.displayed;
    event["failed"] = summary.failed;
    event["stopped"] = summary.stopped;
    emit(event);
}

void EventEmitter::cycle_start(const DisplayCycle& cycle) {
    json event = base_event("cycle_start");
    for (auto& [key, value] : cycle_json(cycle).items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::cycle_end(const DisplayCycle& cycle) {
    json event = base_event("cycle_end");
    for (auto& [key, value] : cycle_json(cycle).items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::cycle_failed(const DisplayCycle& cycle, const std::string& message) {
    json event = base_event("cycle_failed");
    for (auto& [key, value] : cycle_json(cycle).items()) {
        event[key] = value;
    }
    event["message"] = message;
    emit(event);
}

} // namespace aperture_view::core
