#include "fixtures.hpp"
#include "pfs_redact/redaction/grouping.hpp"

#include <catch2/catch_test_macros.hpp>

using pfs_redact::ConfigurationSet;
using pfs_redact::TargetType;
using pfs_redact::testing::make_fiber;
using pfs_redact::testing::make_header;
namespace redaction = pfs_redact::redaction;

TEST_CASE("unique_proposal_ids_are_sorted_and_exclude_sentinel") {
    auto ids = redaction::unique_proposal_ids(pfs_redact::testing::make_mixed_set());
    REQUIRE(ids == std::vector<std::string>{"S25A-001QF", "S25A-002QF", "S25A-003QF"});
}

TEST_CASE("unique_proposal_ids_of_empty_set_is_empty") {
    ConfigurationSet set = ConfigurationSet::from_records(make_header(), {});
    REQUIRE(redaction::unique_proposal_ids(set).empty());
}

TEST_CASE("proposal_with_two_catalogs_is_one_group") {
    ConfigurationSet set = ConfigurationSet::from_records(make_header(), {
        make_fiber(1, "P1", TargetType::SCIENCE, 10),
        make_fiber(2, "P1", TargetType::SCIENCE, 20),
        make_fiber(3, "P2", TargetType::SCIENCE, 10),
    });

    REQUIRE(redaction::unique_proposal_ids(set) == std::vector<std::string>{"P1", "P2"});
    REQUIRE(redaction::catalog_ids(set, "P1") == std::set<int>{10, 20});
    REQUIRE(redaction::catalog_ids(set, "P2") == std::set<int>{10});
    REQUIRE(redaction::catalog_ids(set, "P3").empty());
}
