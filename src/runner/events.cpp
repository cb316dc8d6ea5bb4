#include "pfs_redact/runner/events.hpp"
#include "pfs_redact/core/utils.hpp"

#include <vector>

namespace pfs_redact::runner {

EventEmitter::EventEmitter(std::ostream& out, std::ofstream* log_file)
    : out_(out), log_file_(log_file) {}

nlohmann::json EventEmitter::base_event(const std::string& type, const std::string& run_id) const {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", core::get_iso_timestamp()}
    };
}

void EventEmitter::emit(const nlohmann::json& event) {
    std::string line = event.dump();

    out_ << line << std::endl;

    if (log_file_ && log_file_->is_open()) {
        (*log_file_) << line << std::endl;
    }
}

void EventEmitter::run_start(const std::string& run_id, const nlohmann::json& data) {
    nlohmann::json event = base_event("run_start", run_id);

    if (!data.empty() && data.is_object()) {
        for (auto& [key, value] : data.items()) {
            event[key] = value;
        }
    }

    emit(event);
}

void EventEmitter::proposal_redacted(const std::string& run_id,
                                     const redaction::RedactionSummary& summary) {
    nlohmann::json event = base_event("proposal_redacted", run_id);
    event["proposal_id"] = summary.proposal_id;
    event["sequence_id"] = summary.sequence_id;
    event["total_fibers"] = summary.total_fibers;
    event["masked_fibers"] = summary.masked_fibers;
    event["unmasked_fibers"] = summary.unmasked_fibers;
    event["science_fibers"] = summary.science_fibers;
    event["catalog_ids"] = std::vector<int>(summary.catalog_ids.begin(), summary.catalog_ids.end());
    emit(event);
}

void EventEmitter::output_written(const std::string& run_id, const std::string& proposal_id,
                                  int64_t sequence_id, const std::string& path) {
    nlohmann::json event = base_event("output_written", run_id);
    event["proposal_id"] = proposal_id;
    event["sequence_id"] = sequence_id;
    event["path"] = path;
    emit(event);
}

void EventEmitter::run_end(const std::string& run_id, bool success, const nlohmann::json& data) {
    nlohmann::json event = base_event("run_end", run_id);
    event["success"] = success;
    event["status"] = success ? "ok" : "error";

    if (!data.empty() && data.is_object()) {
        for (auto& [key, value] : data.items()) {
            event[key] = value;
        }
    }

    emit(event);
}

void EventEmitter::run_error(const std::string& run_id, const std::string& error_type,
                             const std::string& error) {
    nlohmann::json event = base_event("run_error", run_id);
    event["error_type"] = error_type;
    event["error"] = error;
    emit(event);
}

} // namespace pfs_redact::runner
