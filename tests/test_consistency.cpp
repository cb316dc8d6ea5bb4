#include "fixtures.hpp"
#include "pfs_redact/core/errors.hpp"
#include "pfs_redact/redaction/consistency.hpp"
#include "pfs_redact/redaction/redaction.hpp"

#include <catch2/catch_test_macros.hpp>

using pfs_redact::ConfigurationSet;
using pfs_redact::TargetType;
using pfs_redact::testing::make_mixed_set;
using pfs_redact::testing::salted_policy;
namespace redaction = pfs_redact::redaction;

TEST_CASE("count_science_counts_only_own_science_fibers") {
    ConfigurationSet set = make_mixed_set();
    REQUIRE(redaction::count_science(set, "S25A-001QF") == 3);
    REQUIRE(redaction::count_science(set, "S25A-002QF") == 2);
    REQUIRE(redaction::count_science(set, pfs_redact::kNoProposal) == 0);
}

TEST_CASE("check_consistency_accepts_a_correct_redaction") {
    ConfigurationSet set = make_mixed_set();
    auto policy = salted_policy();
    auto result = redaction::redact_for_proposal(set, "S25A-002QF", policy, 1);
    REQUIRE(result.has_value());
    REQUIRE_NOTHROW(redaction::check_consistency(set, result->config(), "S25A-002QF"));
}

TEST_CASE("check_consistency_rejects_a_masked_own_fiber") {
    ConfigurationSet set = make_mixed_set();
    ConfigurationSet copy = set;
    copy.target_type[0] = TargetType::SCIENCE_MASKED;
    REQUIRE_THROWS_AS(redaction::check_consistency(set, copy, "S25A-001QF"), pfs_redact::ConsistencyError);
}

TEST_CASE("check_consistency_rejects_row_count_change") {
    ConfigurationSet set = make_mixed_set();
    ConfigurationSet copy = ConfigurationSet::from_records(set.header, {set.row(0), set.row(2), set.row(8)});
    REQUIRE_THROWS_AS(redaction::check_consistency(set, copy, "S25A-001QF"), pfs_redact::ConsistencyError);
}
