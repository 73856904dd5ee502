#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace nineslice::core {

using json = nlohmann::json;

// Writes one JSON object per line so a front end can follow a run.
class EventEmitter {
public:
    EventEmitter() = default;

    void run_start(const std::string& run_id, const json& extra, std::ostream& out);
    void run_end(const std::string& run_id, bool success, const std::string& status, std::ostream& out);

    void export_start(const std::string& run_id, ExportKind kind,
                      const fs::path& destination, std::ostream& out);
    void export_end(const std::string& run_id, ExportKind kind, const std::string& status,
                    const json& extra, std::ostream& out);

    void warning(const std::string& run_id, const std::string& message, std::ostream& out);
    void error(const std::string& run_id, const std::string& message, std::ostream& out);

private:
    void emit(const json& event, std::ostream& out);
    json base_event(const std::string& type, const std::string& run_id);
};

} // namespace nineslice::core
