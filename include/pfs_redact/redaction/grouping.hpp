#pragma once

#include "pfs_redact/core/configuration_set.hpp"

#include <set>
#include <string>
#include <vector>

namespace pfs_redact::redaction {

// Distinct proposal IDs in the set, sorted, without the "N/A" sentinel.
std::vector<std::string> unique_proposal_ids(const ConfigurationSet& set);

// Catalog IDs of the fibers a proposal owns. Reported in the redaction
// summary only; redaction groups by proposal ID alone.
std::set<int> catalog_ids(const ConfigurationSet& set, const std::string& proposal_id);

} // namespace pfs_redact::redaction
