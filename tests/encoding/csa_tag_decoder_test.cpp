/**
 * @file csa_tag_decoder_test.cpp
 * @brief Unit tests for the CSA tag stream decoder
 */

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <csa/encoding/csa_tag_decoder.hpp>

#include "../csa_buffer_builder.hpp"

#include <string>
#include <vector>

using namespace csa;
using namespace csa::encoding;
using Catch::Approx;
using csa::test::csa_buffer_builder;

namespace {

/// Three tags of different VRs, as in a small image header
std::vector<uint8_t> three_tag_buffer(csa_layout layout = csa_layout::type2) {
    csa_buffer_builder builder{layout};
    builder.tag("EchoLinePosition", "IS", 1, {csa_buffer_builder::text("128")})
        .tag("SliceMeasurementDuration", "DS", 1, {csa_buffer_builder::text("212500.0")})
        .tag("ImaCoilString", "LO", 1, {csa_buffer_builder::text("HEA;HEP")});
    return builder.build();
}

}  // namespace

// ============================================================================
// Layout Detection
// ============================================================================

TEST_CASE("csa_tag_decoder detects the layout", "[encoding][decoder]") {
    CHECK(csa_tag_decoder::detect_layout(three_tag_buffer(csa_layout::type2)) ==
          csa_layout::type2);
    CHECK(csa_tag_decoder::detect_layout(three_tag_buffer(csa_layout::type1)) ==
          csa_layout::type1);

    const std::vector<uint8_t> short_buffer = {'S', 'V'};
    CHECK(csa_tag_decoder::detect_layout(short_buffer) == csa_layout::type1);
}

// ============================================================================
// Successful Decoding
// ============================================================================

TEST_CASE("csa_tag_decoder preserves stream order", "[encoding][decoder]") {
    auto result = csa_tag_decoder::decode(three_tag_buffer());
    REQUIRE(result.is_ok());
    const auto& header = result.value();

    REQUIRE(header.size() == 3);
    CHECK(header.names() ==
          std::vector<std::string>{"EchoLinePosition", "SliceMeasurementDuration",
                                   "ImaCoilString"});

    const auto& first = header.at(0);
    CHECK(first.vr() == csa_vr::IS);
    CHECK(first.vm() == 1);
    CHECK(first.as_integer() == 128);

    const auto& second = header.at(1);
    CHECK(second.vr() == csa_vr::DS);
    CHECK(second.as_real().value() == Approx(212500.0));

    const auto& third = header.at(2);
    CHECK(third.vr() == csa_vr::LO);
    CHECK(third.as_string() == "HEA;HEP");
}

TEST_CASE("csa_tag_decoder is deterministic", "[encoding][decoder]") {
    for (auto layout : {csa_layout::type1, csa_layout::type2}) {
        const auto bytes = three_tag_buffer(layout);
        auto first = csa_tag_decoder::decode(bytes);
        auto second = csa_tag_decoder::decode(bytes);
        REQUIRE(first.is_ok());
        REQUIRE(second.is_ok());
        CHECK(first.value() == second.value());
    }
}

TEST_CASE("csa_tag_decoder Type 1 legacy framing", "[encoding][decoder]") {
    SECTION("lengths are offset by the item count of tag record 1") {
        csa_buffer_builder builder{csa_layout::type1};
        builder.tag("UsedChannelMask", "UL", 0, {})
            .tag("DataFileName", "LO", 2,
                 {csa_buffer_builder::text("a.ima"), csa_buffer_builder::text("b.ima"),
                  csa_buffer_builder::empty()})
            .tag("NumberOfImagesInMosaic", "US", 1, {csa_buffer_builder::le16(36)});

        auto result = csa_tag_decoder::decode(builder.build());
        REQUIRE(result.is_ok());
        const auto& header = result.value();
        REQUIRE(header.size() == 3);

        CHECK(header.at(0).empty());

        const auto* files = header.find("DataFileName");
        REQUIRE(files != nullptr);
        REQUIRE(files->size() == 2);
        CHECK(files->as_string(0) == "a.ima");
        CHECK(files->as_string(1) == "b.ima");

        CHECK(header.find("NumberOfImagesInMosaic")->as_integer() == 36);
    }

    SECTION("tag 0 stops after its first item header") {
        // Records 0 and 1 declare different item counts; only record 1 frames lengths
        csa_buffer_builder builder{csa_layout::type1};
        builder.tag("EchoLinePosition", "IS", 1, {csa_buffer_builder::text("128")})
            .tag("ImaCoilString", "LO", 1,
                 {csa_buffer_builder::text("HEA;HEP"), csa_buffer_builder::empty(),
                  csa_buffer_builder::empty(), csa_buffer_builder::empty(),
                  csa_buffer_builder::empty(), csa_buffer_builder::empty()})
            .tag("SliceMeasurementDuration", "DS", 1,
                 {csa_buffer_builder::text("212500.0")});

        const auto bytes = builder.build();
        // Record 1 follows the 16-byte item header of tag 0
        CHECK(builder.tag_offset(1) == builder.tag_offset(0) +
                                           csa_tag_decoder::tag_record_size +
                                           csa_tag_decoder::item_header_size);

        auto result = csa_tag_decoder::decode(bytes);
        REQUIRE(result.is_ok());
        const auto& header = result.value();
        REQUIRE(header.size() == 3);

        const auto& first = header.at(0);
        CHECK(first.name() == "EchoLinePosition");
        REQUIRE(first.size() == 1);
        CHECK(core::is_null(*first.value()));

        CHECK(header.find("ImaCoilString")->as_string() == "HEA;HEP");
        CHECK(header.find("SliceMeasurementDuration")->as_real().value() ==
              Approx(212500.0));
    }

    SECTION("a length below the record 1 offset is malformed") {
        csa_buffer_builder builder{csa_layout::type1};
        builder.tag("First", "IS", 0, {})
            .tag("Second", "IS", 1,
                 {csa_buffer_builder::text("1"), csa_buffer_builder::empty()});
        auto bytes = builder.build();
        // field0 of the first item of record 1: one less than the offset
        test::patch_i32(bytes, builder.tag_offset(1) + csa_tag_decoder::tag_record_size, 1);

        auto result = csa_tag_decoder::decode(bytes);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::malformed_header);
    }
}

TEST_CASE("csa_tag_decoder keeps only VM values", "[encoding][decoder]") {
    SECTION("VM 2 with 5 physical items") {
        csa_buffer_builder builder;
        builder.tag("ImagePositionPatient", "FD", 2,
                    {csa_buffer_builder::f64(1.0), csa_buffer_builder::f64(2.0),
                     csa_buffer_builder::f64(3.0), csa_buffer_builder::f64(4.0),
                     csa_buffer_builder::f64(5.0)})
            .tag("After", "SH", 1, {csa_buffer_builder::text("still aligned")});

        auto result = csa_tag_decoder::decode(builder.build());
        REQUIRE(result.is_ok());
        const auto* tag = result.value().find("ImagePositionPatient");
        REQUIRE(tag != nullptr);
        REQUIRE(tag->size() == 2);
        CHECK(tag->as_real(0).value() == Approx(1.0));
        CHECK(tag->as_real(1).value() == Approx(2.0));
        CHECK(result.value().find("After")->as_string() == "still aligned");
    }

    SECTION("VM 0 keeps all items and drops empty fillers") {
        csa_buffer_builder builder;
        builder.tag("MosaicRefAcqTimes", "FD", 0,
                    {csa_buffer_builder::f64(0.0), csa_buffer_builder::f64(52.5),
                     csa_buffer_builder::empty(), csa_buffer_builder::empty()});

        auto result = csa_tag_decoder::decode(builder.build());
        REQUIRE(result.is_ok());
        const auto* tag = result.value().find("MosaicRefAcqTimes");
        REQUIRE(tag != nullptr);
        CHECK(tag->vm() == 0);
        REQUIRE(tag->size() == 2);
        CHECK(tag->as_real(1).value() == Approx(52.5));
    }

    SECTION("VM 0 with only empty items is present but empty") {
        csa_buffer_builder builder;
        builder.tag("SliceNormalVector", "FD", 0,
                    {csa_buffer_builder::empty(), csa_buffer_builder::empty(),
                     csa_buffer_builder::empty(), csa_buffer_builder::empty()});

        auto result = csa_tag_decoder::decode(builder.build());
        REQUIRE(result.is_ok());
        const auto* tag = result.value().find("SliceNormalVector");
        REQUIRE(tag != nullptr);
        CHECK(tag->empty());
    }

    SECTION("zero-length item yields null") {
        csa_buffer_builder builder;
        builder.tag("B_value", "IS", 1, {csa_buffer_builder::empty()});

        auto result = csa_tag_decoder::decode(builder.build());
        REQUIRE(result.is_ok());
        const auto* tag = result.value().find("B_value");
        REQUIRE(tag->size() == 1);
        CHECK(core::is_null(*tag->value()));
    }
}

TEST_CASE("csa_tag_decoder handles every VR family", "[encoding][decoder]") {
    csa_buffer_builder builder;
    builder.tag("SS", "SS", 1, {csa_buffer_builder::le16(0xFFFF)})
        .tag("UL", "UL", 1, {csa_buffer_builder::le32(7)})
        .tag("FL", "FL", 1, {csa_buffer_builder::f32(0.5f)})
        .tag("Opaque", "OB", 1, {{0x01, 0x02, 0x03}})
        .tag("Odd", "ZZ", 1, {{0x09}});

    auto result = csa_tag_decoder::decode(builder.build());
    REQUIRE(result.is_ok());
    const auto& header = result.value();
    CHECK(header.find("SS")->as_integer() == -1);
    CHECK(header.find("UL")->as_integer() == 7);
    CHECK(header.find("FL")->as_real().value() == Approx(0.5));
    CHECK(std::get<std::vector<uint8_t>>(*header.find("Opaque")->value()) ==
          std::vector<uint8_t>{0x01, 0x02, 0x03});
    CHECK(header.find("Odd")->vr() == csa_vr::unknown);
    CHECK(std::get<std::vector<uint8_t>>(*header.find("Odd")->value()) ==
          std::vector<uint8_t>{0x09});
}

TEST_CASE("csa_tag_decoder numeric text option", "[encoding][decoder]") {
    csa_buffer_builder builder;
    builder.tag("RealDwellTime", "IS", 1, {csa_buffer_builder::text("2700")})
        .tag("SliceThickness", "FD", 1, {csa_buffer_builder::text("3.00000000")});
    const auto bytes = builder.build();

    SECTION("binary mode rejects text in FD") {
        auto result = csa_tag_decoder::decode(bytes);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::size_mismatch);
    }

    SECTION("text mode parses it") {
        decode_options options;
        options.numeric_payload = numeric_payload::text;
        auto result = csa_tag_decoder::decode(bytes, options);
        REQUIRE(result.is_ok());
        CHECK(result.value().find("SliceThickness")->as_real().value() == Approx(3.0));
    }
}

TEST_CASE("csa_tag_decoder duplicate names", "[encoding][decoder]") {
    csa_buffer_builder builder;
    builder.tag("A", "IS", 1, {csa_buffer_builder::text("1")})
        .tag("B", "IS", 1, {csa_buffer_builder::text("2")})
        .tag("A", "IS", 1, {csa_buffer_builder::text("3")});

    auto result = csa_tag_decoder::decode(builder.build());
    REQUIRE(result.is_ok());
    CHECK(result.value().names() == std::vector<std::string>{"A", "B"});
    CHECK(result.value().find("A")->as_integer() == 3);
}

TEST_CASE("csa_tag_decoder accepts an empty stream", "[encoding][decoder]") {
    csa_buffer_builder builder;
    auto result = csa_tag_decoder::decode(builder.build());
    REQUIRE(result.is_ok());
    CHECK(result.value().empty());
}

// ============================================================================
// Malformed Input
// ============================================================================

TEST_CASE("csa_tag_decoder rejects malformed input", "[encoding][decoder][error]") {
    SECTION("truncating the last byte gives truncated_stream") {
        for (auto layout : {csa_layout::type1, csa_layout::type2}) {
            auto bytes = three_tag_buffer(layout);
            bytes.pop_back();
            auto result = csa_tag_decoder::decode(bytes);
            REQUIRE(result.is_err());
            CHECK(result.error().code == error_codes::truncated_stream);
            REQUIRE(result.error().details.has_value());
            CHECK(result.error().details->find("tag_index=2") != std::string::npos);
            CHECK(result.error().details->find("tag=ImaCoilString") != std::string::npos);
        }
    }

    SECTION("declaring more tags than present gives truncated_stream") {
        csa_buffer_builder builder;
        builder.tag("Only", "LT", 1, {std::vector<uint8_t>(200, 'x')}).declared_count(2);
        auto result = csa_tag_decoder::decode(builder.build());
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::truncated_stream);
    }

    SECTION("corrupted tag check gives invalid_check_bit") {
        csa_buffer_builder builder;
        builder.tag("A", "IS", 1, {csa_buffer_builder::text("1")})
            .tag("B", "IS", 1, {csa_buffer_builder::text("2")});
        auto bytes = builder.build();
        test::patch_i32(bytes, builder.tag_offset(1) + 80, 12345);

        auto result = csa_tag_decoder::decode(bytes);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::invalid_check_bit);
        CHECK(result.error().details->find("tag_index=1") != std::string::npos);
    }

    SECTION("205 is an accepted check value") {
        csa_buffer_builder builder;
        builder.tag("A", "IS", 1, {csa_buffer_builder::text("1")}, 205).item_check(205);
        CHECK(csa_tag_decoder::decode(builder.build()).is_ok());
    }

    SECTION("item check validation follows the option") {
        csa_buffer_builder builder;
        builder.tag("A", "IS", 1, {csa_buffer_builder::text("1")}).item_check(0);
        const auto bytes = builder.build();

        auto strict = csa_tag_decoder::decode(bytes);
        REQUIRE(strict.is_err());
        CHECK(strict.error().code == error_codes::invalid_check_bit);

        decode_options options;
        options.validate_item_check = false;
        auto relaxed = csa_tag_decoder::decode(bytes, options);
        REQUIRE(relaxed.is_ok());
        CHECK(relaxed.value().find("A")->as_integer() == 1);
    }

    SECTION("buffer shorter than the prefix gives out_of_bounds") {
        const std::vector<uint8_t> type1 = {0x01, 0x00, 0x00};
        auto result = csa_tag_decoder::decode(type1);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::out_of_bounds);

        const std::vector<uint8_t> type2 = {'S', 'V', '1', '0', 0x04, 0x03};
        result = csa_tag_decoder::decode(type2);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::out_of_bounds);

        CHECK(csa_tag_decoder::decode(std::vector<uint8_t>{}).is_err());
    }

    SECTION("implausible tag count gives malformed_header") {
        csa_buffer_builder builder;
        builder.tag("A", "IS", 1, {csa_buffer_builder::text("1")}).declared_count(1000);
        auto result = csa_tag_decoder::decode(builder.build());
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::malformed_header);

        builder.declared_count(-1);
        result = csa_tag_decoder::decode(builder.build());
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::malformed_header);
    }

    SECTION("protocol text routed to the binary decoder is rejected") {
        const std::string text =
            "### ASCCONV BEGIN ###\nsSliceArray.lSize = 3\n### ASCCONV END ###\n";
        const std::vector<uint8_t> bytes(text.begin(), text.end());
        auto result = csa_tag_decoder::decode(bytes);
        REQUIRE(result.is_err());
        CHECK((result.error().code == error_codes::malformed_header ||
               result.error().code == error_codes::invalid_check_bit));
    }

    SECTION("wrong binary width aborts the whole decode") {
        csa_buffer_builder builder;
        builder.tag("Good", "IS", 1, {csa_buffer_builder::text("1")})
            .tag("Bad", "US", 1, {csa_buffer_builder::le32(1)});
        auto result = csa_tag_decoder::decode(builder.build());
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::size_mismatch);
        CHECK(result.error().details->find("tag=Bad") != std::string::npos);
    }
}
