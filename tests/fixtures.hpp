#pragma once

#include "pfs_redact/config/masking_policy.hpp"
#include "pfs_redact/core/configuration_set.hpp"

#include <string>
#include <vector>

namespace pfs_redact::testing {

inline FiberRecord make_fiber(int fiber_id, const std::string& proposal, TargetType type,
                              int cat_id = 1000, int n_bands = 5) {
    FiberRecord rec;
    rec.fiber_id = fiber_id;
    rec.proposal_id = proposal;
    rec.cat_id = cat_id;
    rec.obj_id = 10 * fiber_id;
    rec.target_type = type;
    rec.tract = fiber_id;
    rec.patch = std::to_string(fiber_id) + "," + std::to_string(fiber_id);
    rec.ra = 10.0 * fiber_id;
    rec.dec = 1.0 * fiber_id;
    rec.pm_ra = 0.1 * fiber_id;
    rec.pm_dec = 0.01 * fiber_id;
    rec.parallax = 1e-6 * fiber_id;
    rec.ob_code = "code" + std::to_string(fiber_id);
    rec.pfi_nominal = {1.0 * fiber_id, 1.0 * fiber_id};
    rec.pfi_center = {1.0 * fiber_id + 0.1, 1.0 * fiber_id + 0.1};

    static const char* bands[] = {"g", "r", "i", "z", "y", "n"};
    for (size_t k = 0; k < kNumFluxFields; ++k) {
        rec.flux[k] = VectorXd(n_bands);
        for (int b = 0; b < n_bands; ++b) {
            rec.flux[k](b) = fiber_id + b + 0.1 * static_cast<double>(k);
        }
    }
    for (int b = 0; b < n_bands; ++b) {
        rec.filter_names.push_back(bands[b % 6]);
    }
    return rec;
}

inline ConfigurationHeader make_header() {
    ConfigurationHeader header;
    header.frame_id = "PFSF12361000";
    header.design_id = 0x12345678;
    header.design_name = "test_design";
    header.proposal_id = "S25A-001QF";
    return header;
}

// Ten fibers, three proposals, sky and flux standards; band count varies.
inline ConfigurationSet make_mixed_set() {
    std::vector<FiberRecord> records = {
        make_fiber(1, "S25A-001QF", TargetType::SCIENCE, 1000, 5),
        make_fiber(2, "S25A-002QF", TargetType::SCIENCE, 2000, 3),
        make_fiber(3, "S25A-001QF", TargetType::SCIENCE, 1000, 5),
        make_fiber(4, "N/A", TargetType::SKY, 3000, 0),
        make_fiber(5, "N/A", TargetType::FLUXSTD, 4000, 5),
        make_fiber(6, "S25A-003QF", TargetType::SCIENCE, 5000, 2),
        make_fiber(7, "S25A-002QF", TargetType::SCIENCE, 2000, 5),
        make_fiber(8, "N/A", TargetType::SKY, 6000, 0),
        make_fiber(9, "S25A-001QF", TargetType::SCIENCE, 1001, 4),
        make_fiber(10, "N/A", TargetType::FLUXSTD, 7000, 5),
    };
    return ConfigurationSet::from_records(make_header(), records);
}

inline config::MaskingPolicy salted_policy() {
    config::MaskingPolicy policy;
    policy.secret_salt = "test-salt";
    return policy;
}

} // namespace pfs_redact::testing
