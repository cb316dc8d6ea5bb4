#include "pfs_redact/redaction/grouping.hpp"

namespace pfs_redact::redaction {

std::vector<std::string> unique_proposal_ids(const ConfigurationSet& set) {
    std::set<std::string> ids;
    for (const auto& proposal : set.proposal_id) {
        if (proposal != kNoProposal) {
            ids.insert(proposal);
        }
    }
    return std::vector<std::string>(ids.begin(), ids.end());
}

std::set<int> catalog_ids(const ConfigurationSet& set, const std::string& proposal_id) {
    std::set<int> ids;
    for (size_t i = 0; i < set.size(); ++i) {
        if (set.proposal_id[i] == proposal_id) {
            ids.insert(set.cat_id[i]);
        }
    }
    return ids;
}

} // namespace pfs_redact::redaction
