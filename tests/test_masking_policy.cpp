#include "pfs_redact/config/masking_policy.hpp"
#include "pfs_redact/core/errors.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <variant>

using namespace pfs_redact::config;
using pfs_redact::ConfigError;
using pfs_redact::FluxField;
using pfs_redact::PfiPoint;
using pfs_redact::TargetType;

TEST_CASE("masking_policy_defaults_match_documented_overrides") {
    MaskingPolicy policy;
    auto overrides = policy.effective_overrides();

    REQUIRE(overrides.size() == 13);
    REQUIRE(std::get<int64_t>(overrides.at(MaskField::CAT_ID)) == 9000);
    REQUIRE(std::get<int64_t>(overrides.at(MaskField::TRACT)) == -1);
    REQUIRE(std::get<std::string>(overrides.at(MaskField::PATCH)) == "-1,-1");
    REQUIRE(std::get<double>(overrides.at(MaskField::RA)) == -99.0);
    REQUIRE(std::get<double>(overrides.at(MaskField::PARALLAX)) == 1.0e-7);
    REQUIRE(std::get<std::string>(overrides.at(MaskField::PROPOSAL_ID)) == "masked");
    REQUIRE(std::isnan(std::get<PfiPoint>(overrides.at(MaskField::PFI_NOMINAL))[0]));
    REQUIRE(std::get<TargetType>(overrides.at(MaskField::TARGET_TYPE)) == TargetType::SCIENCE_MASKED);
    REQUIRE(policy.flux_fields.size() == pfs_redact::kNumFluxFields);
    REQUIRE(std::isnan(policy.flux_fill));
    REQUIRE(policy.filter_fill == "none");
    REQUIRE(policy.obj_id_strategy == ObjIdStrategy::SALTED_HASH);
}

TEST_CASE("masking_policy_cat_id_override_feeds_default_map") {
    MaskingPolicy policy;
    policy.cat_id_override = 9100;
    REQUIRE(std::get<int64_t>(policy.effective_overrides().at(MaskField::CAT_ID)) == 9100);
}

TEST_CASE("masking_policy_parses_yaml") {
    YAML::Node node = YAML::Load(R"(
masking:
  overrides:
    catId: 8000
    ra: -1.5
    patch: "0,0"
    pfiCenter: [.nan, 0.0]
    targetType: 12
  flux_fields: [fiberFlux, psfFlux]
  flux_fill: -999
  filter_fill: masked
object_id:
  strategy: negated_fiber_id
runner:
  workers: 4
  sequence_start: 20
)");

    MaskingPolicy policy = MaskingPolicy::from_yaml(node);
    REQUIRE(policy.field_overrides.has_value());
    REQUIRE(policy.field_overrides->size() == 5);
    REQUIRE(std::get<int64_t>(policy.field_overrides->at(MaskField::CAT_ID)) == 8000);
    REQUIRE(std::get<double>(policy.field_overrides->at(MaskField::RA)) == -1.5);
    REQUIRE(std::isnan(std::get<PfiPoint>(policy.field_overrides->at(MaskField::PFI_CENTER))[0]));
    REQUIRE(std::get<TargetType>(policy.field_overrides->at(MaskField::TARGET_TYPE)) ==
            TargetType::SCIENCE_MASKED);
    REQUIRE(policy.flux_fields == std::vector<FluxField>{FluxField::FIBER_FLUX, FluxField::PSF_FLUX});
    REQUIRE(policy.flux_fill == -999.0);
    REQUIRE(policy.filter_fill == "masked");
    REQUIRE(policy.obj_id_strategy == ObjIdStrategy::NEGATED_FIBER_ID);
    REQUIRE(policy.workers == 4);
    REQUIRE(policy.sequence_start == 20);
    REQUIRE_NOTHROW(policy.validate());
}

TEST_CASE("masking_policy_rejects_unknown_fields_and_bad_values") {
    REQUIRE_THROWS_AS(MaskingPolicy::from_yaml(YAML::Load("masking: {overrides: {objId: 1}}")), ConfigError);
    REQUIRE_THROWS_AS(MaskingPolicy::from_yaml(YAML::Load("masking: {overrides: {ra: north}}")), ConfigError);
    REQUIRE_THROWS_AS(MaskingPolicy::from_yaml(YAML::Load("masking: {overrides: {pfiNominal: [1.0]}}")), ConfigError);
    REQUIRE_THROWS_AS(MaskingPolicy::from_yaml(YAML::Load("masking: {overrides: {targetType: BOGUS}}")), ConfigError);
    REQUIRE_THROWS_AS(MaskingPolicy::from_yaml(YAML::Load("masking: {flux_fields: [magnitude]}")), ConfigError);
    REQUIRE_THROWS_AS(MaskingPolicy::from_yaml(YAML::Load("object_id: {strategy: reversible}")), ConfigError);
}

TEST_CASE("masking_policy_validate_requires_salt_for_hash_strategy") {
    MaskingPolicy policy;
    REQUIRE_THROWS_AS(policy.validate(), ConfigError);
    policy.secret_salt = "";
    REQUIRE_THROWS_AS(policy.validate(), ConfigError);
    policy.secret_salt = "pepper";
    REQUIRE_NOTHROW(policy.validate());
}

TEST_CASE("masking_policy_validate_rejects_kind_mismatch") {
    MaskingPolicy policy;
    policy.secret_salt = "pepper";
    policy.field_overrides = FieldOverrideMap{{MaskField::RA, std::string("hidden")}};
    REQUIRE_THROWS_AS(policy.validate(), ConfigError);
}

TEST_CASE("masking_policy_validate_rejects_duplicate_flux_fields_and_negative_workers") {
    MaskingPolicy policy;
    policy.secret_salt = "pepper";
    policy.flux_fields = {FluxField::PSF_FLUX, FluxField::PSF_FLUX};
    REQUIRE_THROWS_AS(policy.validate(), ConfigError);

    policy.flux_fields = {FluxField::PSF_FLUX};
    policy.workers = -1;
    REQUIRE_THROWS_AS(policy.validate(), ConfigError);
}

TEST_CASE("masking_policy_to_yaml_omits_salt_and_reloads") {
    MaskingPolicy policy;
    policy.secret_salt = "pepper";
    policy.cat_id_override = 9001;
    policy.workers = 2;

    YAML::Node node = policy.to_yaml();
    REQUIRE_FALSE(node["object_id"]["salt"].IsDefined());

    MaskingPolicy reloaded = MaskingPolicy::from_yaml(node);
    REQUIRE_FALSE(reloaded.secret_salt.has_value());
    REQUIRE(reloaded.workers == 2);
    REQUIRE(std::get<int64_t>(reloaded.effective_overrides().at(MaskField::CAT_ID)) == 9001);
    REQUIRE(std::isnan(std::get<PfiPoint>(reloaded.effective_overrides().at(MaskField::PFI_NOMINAL))[1]));
    REQUIRE(std::isnan(reloaded.flux_fill));
}

TEST_CASE("masking_policy_load_missing_file_is_config_error") {
    REQUIRE_THROWS_AS(MaskingPolicy::load("/nonexistent/policy.yaml"), ConfigError);
}

TEST_CASE("masking_policy_rejects_integers_outside_32_bit_columns") {
    REQUIRE_THROWS_AS(MaskingPolicy::from_yaml(YAML::Load("masking: {overrides: {catId: 4294967297}}")),
                      ConfigError);
    REQUIRE_THROWS_AS(MaskingPolicy::from_yaml(YAML::Load("masking: {overrides: {tract: 2147483648}}")),
                      ConfigError);
    REQUIRE_THROWS_AS(MaskingPolicy::from_yaml(YAML::Load("masking: {cat_id_override: -2147483649}")),
                      ConfigError);
    REQUIRE_THROWS_AS(MaskingPolicy::from_yaml(YAML::Load("runner: {workers: 4294967296}")), ConfigError);

    MaskingPolicy edge = MaskingPolicy::from_yaml(YAML::Load("masking: {overrides: {tract: -2147483648}}"));
    REQUIRE(std::get<int64_t>(edge.field_overrides->at(MaskField::TRACT)) == -2147483648LL);
}

TEST_CASE("masking_policy_validate_rejects_out_of_range_override_built_in_code") {
    MaskingPolicy policy;
    policy.secret_salt = "pepper";
    policy.field_overrides = FieldOverrideMap{{MaskField::CAT_ID, int64_t{1} << 32}};
    REQUIRE_THROWS_AS(policy.validate(), ConfigError);

    policy.field_overrides = FieldOverrideMap{{MaskField::CAT_ID, int64_t{2147483647}}};
    REQUIRE_NOTHROW(policy.validate());
}

TEST_CASE("masking_policy_partial_map_merges_over_defaults") {
    MaskingPolicy policy = MaskingPolicy::from_yaml(YAML::Load("masking: {overrides: {ra: -50}}"));
    auto overrides = policy.effective_overrides();

    REQUIRE(overrides.size() == 13);
    REQUIRE(std::get<double>(overrides.at(MaskField::RA)) == -50.0);
    REQUIRE(std::get<double>(overrides.at(MaskField::DEC)) == -99.0);
    REQUIRE(std::get<std::string>(overrides.at(MaskField::PROPOSAL_ID)) == "masked");
    REQUIRE(std::get<TargetType>(overrides.at(MaskField::TARGET_TYPE)) == TargetType::SCIENCE_MASKED);
    REQUIRE(std::get<int64_t>(overrides.at(MaskField::CAT_ID)) == 9000);
}
