#include "pfs_redact/redaction/consistency.hpp"
#include "pfs_redact/core/errors.hpp"

#include <sstream>

namespace pfs_redact::redaction {

size_t count_science(const ConfigurationSet& set, const std::string& proposal_id) {
    size_t n = 0;
    for (size_t i = 0; i < set.size(); ++i) {
        if (set.target_type[i] == TargetType::SCIENCE && set.proposal_id[i] == proposal_id) {
            ++n;
        }
    }
    return n;
}

void check_consistency(const ConfigurationSet& source, const ConfigurationSet& redacted,
                       const std::string& proposal_id) {
    if (source.size() != redacted.size()) {
        std::ostringstream oss;
        oss << "proposal " << proposal_id << ": redacted copy has " << redacted.size()
            << " fibers, source has " << source.size();
        throw ConsistencyError(oss.str());
    }

    const size_t want = count_science(source, proposal_id);
    const size_t got = count_science(redacted, proposal_id);
    if (want != got) {
        std::ostringstream oss;
        oss << "proposal " << proposal_id << ": number of SCIENCE fibers does not match"
            << " (source " << want << ", unmasked in copy " << got << ")";
        throw ConsistencyError(oss.str());
    }
}

} // namespace pfs_redact::redaction
