#include "pfs_redact/redaction/redaction.hpp"
#include "pfs_redact/core/errors.hpp"
#include "pfs_redact/redaction/consistency.hpp"
#include "pfs_redact/redaction/grouping.hpp"
#include "pfs_redact/redaction/object_id.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <system_error>
#include <thread>
#include <utility>

namespace pfs_redact::redaction {

using config::MaskField;
using config::MaskValue;
using config::MaskingPolicy;
using config::ObjIdStrategy;

namespace {

void apply_override(ConfigurationSet& set, size_t i, MaskField field, const MaskValue& value) {
    const auto r = static_cast<Eigen::Index>(i);
    switch (field) {
        case MaskField::CAT_ID:
            set.cat_id[i] = static_cast<int>(std::get<int64_t>(value));
            break;
        case MaskField::TRACT:
            set.tract[i] = static_cast<int>(std::get<int64_t>(value));
            break;
        case MaskField::PATCH:
            set.patch[i] = std::get<std::string>(value);
            break;
        case MaskField::RA:
            set.ra(r) = std::get<double>(value);
            break;
        case MaskField::DEC:
            set.dec(r) = std::get<double>(value);
            break;
        case MaskField::PM_RA:
            set.pm_ra(r) = std::get<double>(value);
            break;
        case MaskField::PM_DEC:
            set.pm_dec(r) = std::get<double>(value);
            break;
        case MaskField::PARALLAX:
            set.parallax(r) = std::get<double>(value);
            break;
        case MaskField::PROPOSAL_ID:
            set.proposal_id[i] = std::get<std::string>(value);
            break;
        case MaskField::OB_CODE:
            set.ob_code[i] = std::get<std::string>(value);
            break;
        case MaskField::PFI_NOMINAL: {
            const auto& p = std::get<PfiPoint>(value);
            set.pfi_nominal(r, 0) = p[0];
            set.pfi_nominal(r, 1) = p[1];
            break;
        }
        case MaskField::PFI_CENTER: {
            const auto& p = std::get<PfiPoint>(value);
            set.pfi_center(r, 0) = p[0];
            set.pfi_center(r, 1) = p[1];
            break;
        }
        case MaskField::TARGET_TYPE:
            set.target_type[i] = std::get<TargetType>(value);
            break;
    }
}

int64_t replacement_obj_id(const ConfigurationSet& source, size_t i, const MaskingPolicy& policy) {
    switch (policy.obj_id_strategy) {
        case ObjIdStrategy::SALTED_HASH:
            return hashed_obj_id(source.cat_id[i], source.obj_id[i], policy.secret_salt.value_or(""));
        case ObjIdStrategy::NEGATED_FIBER_ID:
            return negated_fiber_id(source.fiber_id[i]);
    }
    throw ConfigError("unknown object ID strategy");
}

int resolve_workers(int requested, size_t n_jobs) {
    int workers = requested;
    if (workers == 0) {
        workers = static_cast<int>(std::thread::hardware_concurrency());
    }
    workers = std::max(1, workers);
    return std::min<int>(workers, static_cast<int>(std::max<size_t>(n_jobs, 1)));
}

} // namespace

RedactionResult::RedactionResult(std::string proposal_id, int64_t sequence_id,
                                 ConfigurationSet config, RedactionSummary summary)
    : proposal_id_(std::move(proposal_id)),
      sequence_id_(sequence_id),
      config_(std::move(config)),
      summary_(std::move(summary)) {}

bool should_mask(const ConfigurationSet& set, size_t i, const std::string& proposal_id) {
    return set.proposal_id[i] != kNoProposal &&
           set.proposal_id[i] != proposal_id &&
           set.target_type[i] == TargetType::SCIENCE;
}

void mask_fiber(ConfigurationSet& target, size_t i, const ConfigurationSet& source,
                const MaskingPolicy& policy, const config::FieldOverrideMap& overrides) {
    target.obj_id[i] = replacement_obj_id(source, i, policy);

    for (const auto& [field, value] : overrides) {
        apply_override(target, i, field, value);
    }

    for (FluxField field : policy.flux_fields) {
        VectorXd& values = target.flux_of(field)[i];
        values.setConstant(policy.flux_fill);
    }

    for (auto& name : target.filter_names[i]) {
        name = policy.filter_fill;
    }
}

std::optional<RedactionResult> redact_for_proposal(const ConfigurationSet& source,
                                                   const std::string& proposal_id,
                                                   const MaskingPolicy& policy,
                                                   int64_t sequence_id) {
    if (proposal_id == kNoProposal) {
        return std::nullopt;
    }

    const auto overrides = policy.effective_overrides();
    ConfigurationSet copy = source;

    RedactionSummary summary;
    summary.proposal_id = proposal_id;
    summary.sequence_id = sequence_id;
    summary.total_fibers = source.size();

    for (size_t i = 0; i < source.size(); ++i) {
        if (should_mask(source, i, proposal_id)) {
            mask_fiber(copy, i, source, policy, overrides);
            ++summary.masked_fibers;
        }
    }
    summary.unmasked_fibers = summary.total_fibers - summary.masked_fibers;

    check_consistency(source, copy, proposal_id);
    summary.science_fibers = count_science(copy, proposal_id);
    summary.catalog_ids = catalog_ids(source, proposal_id);

    return RedactionResult(proposal_id, sequence_id, std::move(copy), std::move(summary));
}

std::vector<RedactionResult> redact(const ConfigurationSet& source, const MaskingPolicy& policy,
                                    const RedactionObserver& observer) {
    policy.validate();
    source.validate();

    const std::vector<std::string> proposals = unique_proposal_ids(source);
    if (proposals.empty()) {
        return {};
    }

    std::vector<std::optional<RedactionResult>> slots(proposals.size());
    std::vector<std::exception_ptr> failures(proposals.size());

    auto process = [&](size_t k) {
        try {
            const int64_t sequence_id = policy.sequence_start + static_cast<int64_t>(k) + 1;
            slots[k] = redact_for_proposal(source, proposals[k], policy, sequence_id);
        } catch (...) {
            failures[k] = std::current_exception();
        }
    };

    const int workers = resolve_workers(policy.workers, proposals.size());
    if (workers > 1) {
        std::vector<std::thread> pool;
        std::atomic<size_t> next{0};
        auto join_all = [&pool]() {
            for (auto& t : pool) {
                if (t.joinable()) t.join();
            }
        };
        try {
            for (int w = 0; w < workers; ++w) {
                pool.emplace_back([&]() {
                    while (true) {
                        size_t k = next.fetch_add(1);
                        if (k >= proposals.size())
                            break;
                        process(k);
                    }
                });
            }
        } catch (const std::system_error&) {
            // Workers already started drain the queue; none may outlive pool.
            join_all();
            throw;
        }
        join_all();
    } else {
        for (size_t k = 0; k < proposals.size(); ++k) {
            process(k);
            if (failures[k]) break;
        }
    }

    for (const auto& failure : failures) {
        if (failure) {
            std::rethrow_exception(failure);
        }
    }

    std::vector<RedactionResult> results;
    results.reserve(proposals.size());
    for (auto& slot : slots) {
        if (!slot) continue;
        if (observer) {
            observer(slot->summary());
        }
        results.push_back(std::move(*slot));
    }
    return results;
}

} // namespace pfs_redact::redaction
