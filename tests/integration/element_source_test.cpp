/**
 * @file element_source_test.cpp
 * @brief Tests for locating CSA headers through an element_source
 */

#include <catch2/catch_test_macros.hpp>

#include <csa/core/csa_header_reader.hpp>
#include <csa/integration/element_source.hpp>

#include "../csa_buffer_builder.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace csa;
using namespace csa::integration;
using csa::core::csa_header_reader;
using csa::test::csa_buffer_builder;

namespace {

/**
 * @brief In-memory element source keyed by (group, element)
 */
class map_element_source final : public element_source {
public:
    void set(element_id id, std::vector<uint8_t> bytes) {
        elements_[{id.group, id.element}] = std::move(bytes);
    }

    [[nodiscard]] auto find(element_id id) const
        -> std::optional<std::vector<uint8_t>> override {
        auto it = elements_.find({id.group, id.element});
        if (it == elements_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

private:
    std::map<std::pair<uint16_t, uint16_t>, std::vector<uint8_t>> elements_;
};

std::vector<uint8_t> single_tag_header(const std::string& name, const std::string& value) {
    csa_buffer_builder builder;
    builder.tag(name, "LO", 1, {csa_buffer_builder::text(value)});
    return builder.build();
}

std::vector<uint8_t> ascii_bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

}  // namespace

TEST_CASE("element ids", "[integration][element_source]") {
    CHECK(to_string(element_ids::csa_image_header) == "(0029,1010)");
    CHECK(to_string(element_ids::csa_series_header) == "(0029,1020)");
    CHECK(to_string(element_ids::xa_enhanced_protocol) == "(0021,1019)");
    CHECK(header_element(header_kind::image) == element_ids::csa_image_header);
    CHECK(header_element(header_kind::series) == element_ids::csa_series_header);
}

TEST_CASE("read_from selects the element for the header kind", "[integration][element_source]") {
    map_element_source source;
    source.set(element_ids::csa_image_header, single_tag_header("ImageTag", "image"));
    source.set(element_ids::csa_series_header, single_tag_header("SeriesTag", "series"));

    auto image = csa_header_reader::read_from(source, header_kind::image);
    REQUIRE(image.is_ok());
    CHECK(image.value().find("ImageTag")->as_string() == "image");
    CHECK_FALSE(image.value().contains("SeriesTag"));

    auto series = csa_header_reader::read_from(source, header_kind::series);
    REQUIRE(series.is_ok());
    CHECK(series.value().find("SeriesTag")->as_string() == "series");
}

TEST_CASE("read_from falls back to XA enhanced protocol text", "[integration][element_source]") {
    map_element_source source;
    source.set(element_ids::xa_enhanced_protocol,
               ascii_bytes("### ASCCONV BEGIN ###\n"
                           "sSliceArray.lSize = 48\n"
                           "### ASCCONV END ###\n"));

    SECTION("protocol is decoded") {
        auto result = csa_header_reader::read_from(source, header_kind::series);
        REQUIRE(result.is_ok());
        const auto& header = result.value();
        REQUIRE(header.size() == 1);

        const auto* tag = header.find(csa_header_reader::protocol_tag_name);
        REQUIRE(tag != nullptr);
        CHECK(tag->vr() == encoding::csa_vr::UT);
        REQUIRE(tag->has_protocol());
        CHECK(protocol::n_slices(tag->protocol()->root) == 48);
    }

    SECTION("protocol decoding disabled keeps the text") {
        encoding::decode_options options;
        options.decode_protocol = false;
        auto result = csa_header_reader::read_from(source, header_kind::image, options);
        REQUIRE(result.is_ok());

        const auto* tag = result.value().find(csa_header_reader::protocol_tag_name);
        REQUIRE(tag != nullptr);
        CHECK_FALSE(tag->has_protocol());
        CHECK(tag->as_string().value().find("lSize") != std::string::npos);
    }

    SECTION("a binary header takes precedence") {
        source.set(element_ids::csa_image_header, single_tag_header("ImageTag", "image"));
        auto result = csa_header_reader::read_from(source, header_kind::image);
        REQUIRE(result.is_ok());
        CHECK(result.value().contains("ImageTag"));
        CHECK_FALSE(result.value().contains("MrPhoenixProtocol"));
    }
}

TEST_CASE("read_from reports missing elements", "[integration][element_source][error]") {
    map_element_source source;

    auto result = csa_header_reader::read_from(source, header_kind::image);
    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::element_not_found);
    REQUIRE(result.error().details.has_value());
    CHECK(*result.error().details == "element=(0029,1010)");
}

TEST_CASE("read_from propagates decode errors", "[integration][element_source][error]") {
    map_element_source source;
    auto bytes = single_tag_header("ImageTag", "image");
    bytes.resize(bytes.size() - 8);
    source.set(element_ids::csa_image_header, bytes);

    auto result = csa_header_reader::read_from(source, header_kind::image);
    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::truncated_stream);
}
