/**
 * @file csa_vr_test.cpp
 * @brief Unit tests for CSA VR codes and the VR table
 */

#include <catch2/catch_test_macros.hpp>

#include <csa/encoding/csa_vr.hpp>

using namespace csa::encoding;

TEST_CASE("csa_vr code conversion", "[encoding][vr]") {
    SECTION("known codes round through the table") {
        CHECK(vr_from_string("DS") == csa_vr::DS);
        CHECK(vr_from_string("UL") == csa_vr::UL);
        CHECK(vr_from_string("OB") == csa_vr::OB);
        CHECK(to_string(csa_vr::FD) == "FD");
        CHECK(to_string(csa_vr::unknown) == "??");
    }

    SECTION("unknown codes map to csa_vr::unknown") {
        CHECK(vr_from_string("XX") == csa_vr::unknown);
        CHECK(vr_from_string("") == csa_vr::unknown);
        CHECK(vr_from_string("DSX") == csa_vr::unknown);
        CHECK(vr_from_string("??") == csa_vr::unknown);
    }

    SECTION("enum values pack the two characters") {
        CHECK(static_cast<uint16_t>(csa_vr::SH) == (('S' << 8) | 'H'));
    }
}

TEST_CASE("csa_vr classification", "[encoding][vr]") {
    CHECK(is_string_vr(csa_vr::LO));
    CHECK(is_string_vr(csa_vr::UT));
    CHECK_FALSE(is_string_vr(csa_vr::IS));

    CHECK(is_numeric_vr(csa_vr::IS));
    CHECK(is_numeric_vr(csa_vr::FL));
    CHECK_FALSE(is_numeric_vr(csa_vr::CS));

    CHECK(is_opaque_vr(csa_vr::OW));
    CHECK(is_opaque_vr(csa_vr::unknown));

    SECTION("fixed widths") {
        CHECK(get_vr_info(csa_vr::SS).width == 2);
        CHECK(get_vr_info(csa_vr::US).width == 2);
        CHECK(get_vr_info(csa_vr::SL).width == 4);
        CHECK(get_vr_info(csa_vr::UL).width == 4);
        CHECK(get_vr_info(csa_vr::FL).width == 4);
        CHECK(get_vr_info(csa_vr::FD).width == 8);
        CHECK_FALSE(is_fixed_width_vr(csa_vr::DS));
    }

    SECTION("table lookup is usable at compile time") {
        static_assert(get_vr_info(csa_vr::FD).kind == vr_kind::fixed_float);
        static_assert(vr_from_string("UI") == csa_vr::UI);
        CHECK(true);
    }
}
