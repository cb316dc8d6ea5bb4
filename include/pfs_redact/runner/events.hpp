#pragma once

#include "pfs_redact/redaction/redaction.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <ostream>
#include <string>

namespace pfs_redact::runner {

/**
 * Event emission for the redaction runner.
 * Emits one JSON object per line to the given stream and an optional log file.
 */
class EventEmitter {
public:
    explicit EventEmitter(std::ostream& out, std::ofstream* log_file = nullptr);

    void emit(const nlohmann::json& event);

    void run_start(const std::string& run_id, const nlohmann::json& data);
    void proposal_redacted(const std::string& run_id, const redaction::RedactionSummary& summary);
    void output_written(const std::string& run_id, const std::string& proposal_id,
                        int64_t sequence_id, const std::string& path);
    void run_end(const std::string& run_id, bool success, const nlohmann::json& data = nlohmann::json::object());
    void run_error(const std::string& run_id, const std::string& error_type, const std::string& error);

private:
    std::ostream& out_;
    std::ofstream* log_file_;

    nlohmann::json base_event(const std::string& type, const std::string& run_id) const;
};

} // namespace pfs_redact::runner
