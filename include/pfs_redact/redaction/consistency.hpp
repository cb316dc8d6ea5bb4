#pragma once

#include "pfs_redact/core/configuration_set.hpp"

#include <string>

namespace pfs_redact::redaction {

// Rows with targetType SCIENCE and the given proposal ID.
size_t count_science(const ConfigurationSet& set, const std::string& proposal_id);

/**
 * Verify a redacted copy against its source for one proposal: the row count
 * must match, and every SCIENCE fiber the proposal owns in the source must
 * still be SCIENCE and still carry the proposal ID in the copy.
 * Throws ConsistencyError otherwise.
 */
void check_consistency(const ConfigurationSet& source, const ConfigurationSet& redacted,
                       const std::string& proposal_id);

} // namespace pfs_redact::redaction
