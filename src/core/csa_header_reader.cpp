/**
 * @file csa_header_reader.cpp
 * @brief Implementation of the CSA header facade
 */

#include "csa/core/csa_header_reader.hpp"

#include <csa/encoding/csa_tag_decoder.hpp>
#include <csa/encoding/value_converter.hpp>
#include <csa/integration/logger_adapter.hpp>

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace csa::core {

using integration::logger_adapter;

namespace {

void attach_protocol(csa_header& header) {
    auto* tag = header.find(csa_header_reader::protocol_tag_name);
    if (tag == nullptr) {
        return;
    }
    const auto* value = tag->value();
    if (value == nullptr) {
        return;
    }

    // Real headers declare the protocol tag as UN, so the text may arrive as raw bytes
    std::string text;
    if (const auto* str = std::get_if<std::string>(value)) {
        text = *str;
    } else if (const auto* raw = std::get_if<std::vector<uint8_t>>(value)) {
        text = encoding::latin1_to_utf8(*raw);
    } else {
        return;
    }
    if (text.empty()) {
        return;
    }
    tag->set_protocol(csa_header_reader::read_protocol(text));
}

}  // namespace

auto csa_header_reader::read(std::span<const uint8_t> bytes,
                             const encoding::decode_options& options) -> Result<csa_header> {
    auto decoded = encoding::csa_tag_decoder::decode(bytes, options);
    if (decoded.is_err()) {
        logger_adapter::log_decode_failure("CSA header", decoded.error());
        return decoded;
    }

    auto header = std::move(decoded.value());
    if (options.decode_protocol) {
        attach_protocol(header);
    }
    return header;
}

auto csa_header_reader::read_protocol(std::string_view text) -> protocol::protocol_document {
    return protocol::ascconv_parser::parse(text);
}

auto csa_header_reader::read_from(const integration::element_source& source,
                                  integration::header_kind kind,
                                  const encoding::decode_options& options)
    -> Result<csa_header> {
    const auto id = integration::header_element(kind);
    if (auto bytes = source.find(id)) {
        logger_adapter::debug("Reading CSA header from element {}", integration::to_string(id));
        return read(*bytes, options);
    }

    const auto xa_id = integration::element_ids::xa_enhanced_protocol;
    auto xa_bytes = source.find(xa_id);
    if (!xa_bytes) {
        error_info error{error_codes::element_not_found,
                         "Neither " + integration::to_string(id) + " nor " +
                             integration::to_string(xa_id) + " is present",
                         "csa", "element=" + integration::to_string(id)};
        logger_adapter::log_decode_failure("CSA header", error);
        return Result<csa_header>(error);
    }

    logger_adapter::debug("No CSA element {}, reading XA enhanced protocol from {}",
                          integration::to_string(id), integration::to_string(xa_id));

    auto text = encoding::latin1_to_utf8(*xa_bytes);
    csa_tag tag{std::string(protocol_tag_name), encoding::csa_vr::UT, 1,
                {csa_value{text}}};
    if (options.decode_protocol) {
        tag.set_protocol(read_protocol(text));
    }

    csa_header header;
    header.insert(std::move(tag));
    return header;
}

}  // namespace csa::core
