#pragma once

#include "pfs_redact/config/masking_policy.hpp"
#include "pfs_redact/core/configuration_set.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace pfs_redact::redaction {

// Per-proposal fiber counts, reported through RedactionObserver
struct RedactionSummary {
    std::string proposal_id;
    int64_t sequence_id = 0;
    size_t total_fibers = 0;
    size_t masked_fibers = 0;
    size_t unmasked_fibers = 0;
    size_t science_fibers = 0;   // SCIENCE fibers owned by the proposal
    std::set<int> catalog_ids;   // catalogs the proposal's fibers come from
};

using RedactionObserver = std::function<void(const RedactionSummary&)>;

/**
 * Redacted view of a configuration for one proposal. Owns its copy of the
 * fiber table; the copy is only reachable as const once built.
 */
class RedactionResult {
public:
    RedactionResult(std::string proposal_id, int64_t sequence_id,
                    ConfigurationSet config, RedactionSummary summary);

    const std::string& proposal_id() const { return proposal_id_; }
    int64_t sequence_id() const { return sequence_id_; }
    const ConfigurationSet& config() const { return config_; }
    const RedactionSummary& summary() const { return summary_; }

private:
    std::string proposal_id_;
    int64_t sequence_id_ = 0;
    ConfigurationSet config_;
    RedactionSummary summary_;
};

// True if fiber i is a SCIENCE fiber owned by a proposal other than proposal_id.
bool should_mask(const ConfigurationSet& set, size_t i, const std::string& proposal_id);

/**
 * Overwrite fiber i of target following the policy. The replacement objId
 * is derived from source row i, so target may already be partially masked.
 * Flux and filter sequences keep their length.
 */
void mask_fiber(ConfigurationSet& target, size_t i, const ConfigurationSet& source,
                const config::MaskingPolicy& policy,
                const config::FieldOverrideMap& overrides);

/**
 * Deep-copy source, mask every fiber of other proposals and check the
 * result. Returns nullopt for the "N/A" sentinel. The policy must already
 * be validated.
 */
std::optional<RedactionResult> redact_for_proposal(const ConfigurationSet& source,
                                                   const std::string& proposal_id,
                                                   const config::MaskingPolicy& policy,
                                                   int64_t sequence_id);

/**
 * Produce one redacted configuration per proposal found in source, ordered
 * by proposal ID. Validates the policy (ConfigError) and the source
 * (InputError) before any fiber is touched; any ConsistencyError aborts the
 * whole batch. The observer, if given, is called once per result in order.
 */
std::vector<RedactionResult> redact(const ConfigurationSet& source,
                                    const config::MaskingPolicy& policy,
                                    const RedactionObserver& observer = nullptr);

} // namespace pfs_redact::redaction
