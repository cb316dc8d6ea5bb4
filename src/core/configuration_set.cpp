#include "pfs_redact/core/configuration_set.hpp"
#include "pfs_redact/core/errors.hpp"

#include <set>
#include <sstream>

namespace pfs_redact {

ConfigurationSet ConfigurationSet::from_records(const ConfigurationHeader& header,
                                                const std::vector<FiberRecord>& records) {
    ConfigurationSet set;
    set.header = header;
    set.resize(records.size());
    for (size_t i = 0; i < records.size(); ++i) {
        set.set_row(i, records[i]);
    }
    return set;
}

void ConfigurationSet::resize(size_t n) {
    fiber_id.assign(n, 0);
    proposal_id.assign(n, kNoProposal);
    cat_id.assign(n, 0);
    obj_id.assign(n, 0);
    target_type.assign(n, TargetType::UNASSIGNED);
    tract.assign(n, 0);
    patch.assign(n, std::string());
    ra = VectorXd::Zero(static_cast<Eigen::Index>(n));
    dec = VectorXd::Zero(static_cast<Eigen::Index>(n));
    pm_ra = VectorXd::Zero(static_cast<Eigen::Index>(n));
    pm_dec = VectorXd::Zero(static_cast<Eigen::Index>(n));
    parallax = VectorXd::Zero(static_cast<Eigen::Index>(n));
    ob_code.assign(n, std::string());
    pfi_nominal = PfiMatrix::Zero(static_cast<Eigen::Index>(n), 2);
    pfi_center = PfiMatrix::Zero(static_cast<Eigen::Index>(n), 2);
    for (auto& column : flux) {
        column.assign(n, VectorXd());
    }
    filter_names.assign(n, std::vector<std::string>());
}

FiberRecord ConfigurationSet::row(size_t i) const {
    const auto r = static_cast<Eigen::Index>(i);
    FiberRecord rec;
    rec.fiber_id = fiber_id.at(i);
    rec.proposal_id = proposal_id.at(i);
    rec.cat_id = cat_id.at(i);
    rec.obj_id = obj_id.at(i);
    rec.target_type = target_type.at(i);
    rec.tract = tract.at(i);
    rec.patch = patch.at(i);
    rec.ra = ra(r);
    rec.dec = dec(r);
    rec.pm_ra = pm_ra(r);
    rec.pm_dec = pm_dec(r);
    rec.parallax = parallax(r);
    rec.ob_code = ob_code.at(i);
    rec.pfi_nominal = {pfi_nominal(r, 0), pfi_nominal(r, 1)};
    rec.pfi_center = {pfi_center(r, 0), pfi_center(r, 1)};
    for (size_t k = 0; k < kNumFluxFields; ++k) {
        rec.flux[k] = flux[k].at(i);
    }
    rec.filter_names = filter_names.at(i);
    return rec;
}

void ConfigurationSet::set_row(size_t i, const FiberRecord& rec) {
    const auto r = static_cast<Eigen::Index>(i);
    fiber_id.at(i) = rec.fiber_id;
    proposal_id.at(i) = rec.proposal_id;
    cat_id.at(i) = rec.cat_id;
    obj_id.at(i) = rec.obj_id;
    target_type.at(i) = rec.target_type;
    tract.at(i) = rec.tract;
    patch.at(i) = rec.patch;
    ra(r) = rec.ra;
    dec(r) = rec.dec;
    pm_ra(r) = rec.pm_ra;
    pm_dec(r) = rec.pm_dec;
    parallax(r) = rec.parallax;
    ob_code.at(i) = rec.ob_code;
    pfi_nominal(r, 0) = rec.pfi_nominal[0];
    pfi_nominal(r, 1) = rec.pfi_nominal[1];
    pfi_center(r, 0) = rec.pfi_center[0];
    pfi_center(r, 1) = rec.pfi_center[1];
    for (size_t k = 0; k < kNumFluxFields; ++k) {
        flux[k].at(i) = rec.flux[k];
    }
    filter_names.at(i) = rec.filter_names;
}

void ConfigurationSet::validate() const {
    const size_t n = fiber_id.size();

    auto check_len = [n](size_t len, const char* name) {
        if (len != n) {
            std::ostringstream oss;
            oss << "column " << name << " has " << len << " rows, expected " << n;
            throw InputError(oss.str());
        }
    };

    check_len(proposal_id.size(), "proposalId");
    check_len(cat_id.size(), "catId");
    check_len(obj_id.size(), "objId");
    check_len(target_type.size(), "targetType");
    check_len(tract.size(), "tract");
    check_len(patch.size(), "patch");
    check_len(static_cast<size_t>(ra.size()), "ra");
    check_len(static_cast<size_t>(dec.size()), "dec");
    check_len(static_cast<size_t>(pm_ra.size()), "pmRa");
    check_len(static_cast<size_t>(pm_dec.size()), "pmDec");
    check_len(static_cast<size_t>(parallax.size()), "parallax");
    check_len(ob_code.size(), "obCode");
    check_len(static_cast<size_t>(pfi_nominal.rows()), "pfiNominal");
    check_len(static_cast<size_t>(pfi_center.rows()), "pfiCenter");
    for (FluxField field : all_flux_fields()) {
        check_len(flux_of(field).size(), flux_field_to_string(field).c_str());
    }
    check_len(filter_names.size(), "filterNames");

    std::set<int> seen;
    for (size_t i = 0; i < n; ++i) {
        if (!seen.insert(fiber_id[i]).second) {
            throw InputError("duplicate fiberId " + std::to_string(fiber_id[i]));
        }

        const size_t bands = filter_names[i].size();
        for (FluxField field : all_flux_fields()) {
            const size_t len = static_cast<size_t>(flux_of(field)[i].size());
            if (len != bands) {
                std::ostringstream oss;
                oss << "fiberId " << fiber_id[i] << ": " << flux_field_to_string(field)
                    << " has " << len << " entries but filterNames has " << bands;
                throw InputError(oss.str());
            }
        }
    }
}

} // namespace pfs_redact
