#include "pfs_redact/core/types.hpp"
#include "pfs_redact/core/utils.hpp"

#include <cmath>

namespace pfs_redact {

std::optional<TargetType> string_to_target_type(const std::string& s) {
    std::string norm = core::to_upper(core::trim(s));
    for (int code = 1; code <= 12; ++code) {
        auto type = static_cast<TargetType>(code);
        if (norm == target_type_to_string(type)) {
            return type;
        }
    }
    return std::nullopt;
}

std::optional<TargetType> int_to_target_type(int code) {
    if (code >= 1 && code <= 12) {
        return static_cast<TargetType>(code);
    }
    return std::nullopt;
}

std::optional<FluxField> string_to_flux_field(const std::string& s) {
    std::string norm = core::trim(s);
    for (FluxField field : all_flux_fields()) {
        if (norm == flux_field_to_string(field)) {
            return field;
        }
    }
    return std::nullopt;
}

namespace {

bool same_value(double a, double b) {
    if (std::isnan(a) || std::isnan(b)) {
        return std::isnan(a) && std::isnan(b);
    }
    return a == b;
}

bool same_vector(const VectorXd& a, const VectorXd& b) {
    if (a.size() != b.size()) return false;
    for (Eigen::Index i = 0; i < a.size(); ++i) {
        if (!same_value(a(i), b(i))) return false;
    }
    return true;
}

} // namespace

bool same_record(const FiberRecord& a, const FiberRecord& b) {
    if (a.fiber_id != b.fiber_id || a.proposal_id != b.proposal_id ||
        a.cat_id != b.cat_id || a.obj_id != b.obj_id ||
        a.target_type != b.target_type || a.tract != b.tract ||
        a.patch != b.patch || a.ob_code != b.ob_code ||
        a.filter_names != b.filter_names) {
        return false;
    }
    if (!same_value(a.ra, b.ra) || !same_value(a.dec, b.dec) ||
        !same_value(a.pm_ra, b.pm_ra) || !same_value(a.pm_dec, b.pm_dec) ||
        !same_value(a.parallax, b.parallax)) {
        return false;
    }
    for (int k = 0; k < 2; ++k) {
        if (!same_value(a.pfi_nominal[k], b.pfi_nominal[k]) ||
            !same_value(a.pfi_center[k], b.pfi_center[k])) {
            return false;
        }
    }
    for (size_t k = 0; k < kNumFluxFields; ++k) {
        if (!same_vector(a.flux[k], b.flux[k])) return false;
    }
    return true;
}

} // namespace pfs_redact
