#pragma once

#include "pfs_redact/core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pfs_redact {

// Header metadata shared by pfsDesign and pfsConfig
struct ConfigurationHeader {
    std::string frame_id;           // FRAMEID
    uint64_t design_id = 0;         // W_PFDSGN
    std::string design_name;        // DSGN_NAM
    std::string proposal_id;        // PROP-ID
    std::optional<int> visit;       // W_VISIT, pfsConfig only
};

/**
 * Column-oriented fiber table. Row i of every column describes the fiber at
 * position i; rows are not necessarily sorted by fiber_id.
 */
struct ConfigurationSet {
    ConfigurationHeader header;

    std::vector<int> fiber_id;
    std::vector<std::string> proposal_id;
    std::vector<int> cat_id;
    std::vector<int64_t> obj_id;
    std::vector<TargetType> target_type;
    std::vector<int> tract;
    std::vector<std::string> patch;
    VectorXd ra;
    VectorXd dec;
    VectorXd pm_ra;
    VectorXd pm_dec;
    VectorXd parallax;
    std::vector<std::string> ob_code;
    PfiMatrix pfi_nominal;
    PfiMatrix pfi_center;
    std::array<std::vector<VectorXd>, kNumFluxFields> flux;
    std::vector<std::vector<std::string>> filter_names;

    static ConfigurationSet from_records(const ConfigurationHeader& header,
                                         const std::vector<FiberRecord>& records);

    size_t size() const { return fiber_id.size(); }
    bool empty() const { return fiber_id.empty(); }

    // Allocates n rows with default values in every column.
    void resize(size_t n);

    FiberRecord row(size_t i) const;
    void set_row(size_t i, const FiberRecord& record);

    std::vector<VectorXd>& flux_of(FluxField field) { return flux[flux_index(field)]; }
    const std::vector<VectorXd>& flux_of(FluxField field) const { return flux[flux_index(field)]; }

    /**
     * Check structural consistency: equal column lengths, unique fiber IDs,
     * and per-row photometry sequences of equal length. Throws InputError.
     */
    void validate() const;
};

} // namespace pfs_redact
