#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace aperture_view::core {

using json = nlohmann::json;

// Where components report progress and problems.
class DiagnosticsSink {
public:
    virtual ~DiagnosticsSink() = default;

    virtual void info(const std::string& message) = 0;
    virtual void warning(const std::string& message) = 0;
    virtual void error(const std::string& message) = 0;

    // Per-cycle hooks; the defaults forward to info()/error().
    virtual void cycle_start(const DisplayCycle& cycle);
    virtual void cycle_end(const DisplayCycle& cycle);
    virtual void cycle_failed(const DisplayCycle& cycle, const std::string& message);
};

// Writes one JSON object per line to `out`.
class EventEmitter : public DiagnosticsSink {
public:
    EventEmitter(std::string run_id, std::ostream& out);

    void info(const std::string& message) override;
    void warning(const std::string& message) override;
    void error(const std::string& message) override;

    void run_start(const json& extra);
    void run_end(const RunSummary& summary, const std::string& status);

    void cycle_start(const DisplayCycle& cycle) override;
    void cycle_end(const DisplayCycle& cycle) override;
    void cycle_failed(const DisplayCycle& cycle, const std::string& message) override;

    const std::string& run_id() const { return run_id_; }

private:
    void emit(const json& event);
    json base_event(const std::string& type) const;
    static json cycle_json(const DisplayCycle& cycle);

    std::string run_id_;
    std::ostream& out_;
};

} // namespace aperture_view::core
