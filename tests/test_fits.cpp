#include "fixtures.hpp"
#include "pfs_redact/core/errors.hpp"
#include "pfs_redact/io/fits_io.hpp"
#include "pfs_redact/redaction/redaction.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <filesystem>

using Catch::Approx;
using pfs_redact::ConfigurationSet;
using pfs_redact::TargetType;
namespace fs = std::filesystem;

namespace {

fs::path temp_fits(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / "pfs_redact_tests";
    fs::create_directories(dir);
    return dir / name;
}

} // namespace

TEST_CASE("fits_round_trip_keeps_header_and_ragged_photometry") {
    ConfigurationSet set = pfs_redact::testing::make_mixed_set();
    set.header.visit = 123456;
    fs::path path = temp_fits("pfsConfig-0x0000000012345678-123456.fits");

    pfs_redact::io::write_configuration_set(path, set);
    ConfigurationSet back = pfs_redact::io::read_configuration_set(path);

    REQUIRE(back.header.design_id == set.header.design_id);
    REQUIRE(back.header.visit == set.header.visit);
    REQUIRE(back.header.frame_id == "PFSF12361000");
    REQUIRE(back.header.design_name == "test_design");
    REQUIRE(back.header.proposal_id == "S25A-001QF");

    REQUIRE(back.size() == set.size());
    REQUIRE_NOTHROW(back.validate());
    for (size_t i = 0; i < set.size(); ++i) {
        const auto r = static_cast<Eigen::Index>(i);
        REQUIRE(back.fiber_id[i] == set.fiber_id[i]);
        REQUIRE(back.proposal_id[i] == set.proposal_id[i]);
        REQUIRE(back.cat_id[i] == set.cat_id[i]);
        REQUIRE(back.obj_id[i] == set.obj_id[i]);
        REQUIRE(back.target_type[i] == set.target_type[i]);
        REQUIRE(back.patch[i] == set.patch[i]);
        REQUIRE(back.ob_code[i] == set.ob_code[i]);
        REQUIRE(back.ra(r) == set.ra(r));
        REQUIRE(back.parallax(r) == Approx(set.parallax(r)).epsilon(1e-6));
        REQUIRE(back.pfi_center(r, 1) == Approx(set.pfi_center(r, 1)).epsilon(1e-6));
        REQUIRE(back.filter_names[i] == set.filter_names[i]);
        for (size_t k = 0; k < pfs_redact::kNumFluxFields; ++k) {
            REQUIRE(back.flux[k][i].size() == set.flux[k][i].size());
        }
    }

    fs::remove(path);
}

TEST_CASE("fits_round_trip_keeps_masked_values") {
    ConfigurationSet set = pfs_redact::testing::make_mixed_set();
    auto results = pfs_redact::redaction::redact(set, pfs_redact::testing::salted_policy());
    const ConfigurationSet& redacted = results.front().config();
    fs::path path = temp_fits("pfsDesign-0x0000000012345678_S25A-001QF.fits");

    pfs_redact::io::write_configuration_set(path, redacted);
    ConfigurationSet back = pfs_redact::io::read_configuration_set(path);

    // fiber 2 belongs to S25A-002QF and is masked in this copy
    REQUIRE(back.proposal_id[1] == "masked");
    REQUIRE(back.target_type[1] == TargetType::SCIENCE_MASKED);
    REQUIRE(back.obj_id[1] == redacted.obj_id[1]);
    REQUIRE(std::isnan(back.pfi_nominal(1, 0)));
    REQUIRE(std::isnan(back.flux[0][1](0)));
    REQUIRE(back.filter_names[1] == std::vector<std::string>(3, "none"));
    REQUIRE(back.proposal_id[0] == "S25A-001QF");

    fs::remove(path);
}

TEST_CASE("fits_read_missing_file_is_fits_error") {
    REQUIRE_THROWS_AS(pfs_redact::io::read_configuration_set(temp_fits("does-not-exist.fits")),
                      pfs_redact::FitsError);
}
