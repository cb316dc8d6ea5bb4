#pragma once

#include <Eigen/Dense>
#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pfs_redact {

namespace fs = std::filesystem;

// Column types
using VectorXd = Eigen::VectorXd;
using PfiMatrix = Eigen::Matrix<double, Eigen::Dynamic, 2, Eigen::RowMajor>;
using PfiPoint = std::array<double, 2>;

// Proposal ID carried by fibers that belong to no proposal (sky, calibration)
inline const std::string kNoProposal = "N/A";

// Target type codes as used in the PFS datamodel
enum class TargetType : int {
    SCIENCE = 1,
    SKY = 2,
    FLUXSTD = 3,
    UNASSIGNED = 4,
    ENGINEERING = 5,
    SUNSS_IMAGING = 6,
    SUNSS_DIFFUSE = 7,
    DCB = 8,
    HOME = 9,
    BLACKSPOT = 10,
    AFL = 11,
    SCIENCE_MASKED = 12
};

inline std::string target_type_to_string(TargetType type) {
    switch (type) {
        case TargetType::SCIENCE: return "SCIENCE";
        case TargetType::SKY: return "SKY";
        case TargetType::FLUXSTD: return "FLUXSTD";
        case TargetType::UNASSIGNED: return "UNASSIGNED";
        case TargetType::ENGINEERING: return "ENGINEERING";
        case TargetType::SUNSS_IMAGING: return "SUNSS_IMAGING";
        case TargetType::SUNSS_DIFFUSE: return "SUNSS_DIFFUSE";
        case TargetType::DCB: return "DCB";
        case TargetType::HOME: return "HOME";
        case TargetType::BLACKSPOT: return "BLACKSPOT";
        case TargetType::AFL: return "AFL";
        case TargetType::SCIENCE_MASKED: return "SCIENCE_MASKED";
        default: return "UNKNOWN";
    }
}

std::optional<TargetType> string_to_target_type(const std::string& s);

std::optional<TargetType> int_to_target_type(int code);

inline int target_type_to_int(TargetType type) {
    return static_cast<int>(type);
}

// Per-band photometry columns
enum class FluxField {
    FIBER_FLUX = 0,
    PSF_FLUX = 1,
    TOTAL_FLUX = 2,
    FIBER_FLUX_ERR = 3,
    PSF_FLUX_ERR = 4,
    TOTAL_FLUX_ERR = 5
};

constexpr std::size_t kNumFluxFields = 6;

inline const std::array<FluxField, kNumFluxFields>& all_flux_fields() {
    static const std::array<FluxField, kNumFluxFields> fields = {
        FluxField::FIBER_FLUX, FluxField::PSF_FLUX, FluxField::TOTAL_FLUX,
        FluxField::FIBER_FLUX_ERR, FluxField::PSF_FLUX_ERR, FluxField::TOTAL_FLUX_ERR};
    return fields;
}

inline std::size_t flux_index(FluxField field) {
    return static_cast<std::size_t>(field);
}

// Column names as they appear in pfsConfig files
inline std::string flux_field_to_string(FluxField field) {
    switch (field) {
        case FluxField::FIBER_FLUX: return "fiberFlux";
        case FluxField::PSF_FLUX: return "psfFlux";
        case FluxField::TOTAL_FLUX: return "totalFlux";
        case FluxField::FIBER_FLUX_ERR: return "fiberFluxErr";
        case FluxField::PSF_FLUX_ERR: return "psfFluxErr";
        case FluxField::TOTAL_FLUX_ERR: return "totalFluxErr";
        default: return "unknown";
    }
}

std::optional<FluxField> string_to_flux_field(const std::string& s);

// One fiber of a configuration, materialized from the column store
struct FiberRecord {
    int fiber_id = 0;
    std::string proposal_id = kNoProposal;
    int cat_id = 0;
    int64_t obj_id = 0;
    TargetType target_type = TargetType::UNASSIGNED;
    int tract = 0;
    std::string patch;
    double ra = 0.0;
    double dec = 0.0;
    double pm_ra = 0.0;
    double pm_dec = 0.0;
    double parallax = 0.0;
    std::string ob_code;
    PfiPoint pfi_nominal{0.0, 0.0};
    PfiPoint pfi_center{0.0, 0.0};
    std::array<VectorXd, kNumFluxFields> flux;  // indexed by flux_index()
    std::vector<std::string> filter_names;

    VectorXd& flux_of(FluxField field) { return flux[flux_index(field)]; }
    const VectorXd& flux_of(FluxField field) const { return flux[flux_index(field)]; }
};

// Field-by-field equality; NaN compares equal to NaN.
bool same_record(const FiberRecord& a, const FiberRecord& b);

} // namespace pfs_redact
