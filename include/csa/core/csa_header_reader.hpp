/**
 * @file csa_header_reader.hpp
 * @brief Entry point for decoding Siemens CSA headers
 *
 * Runs the binary tag decoder and, when the header carries a
 * MrPhoenixProtocol tag, decodes its text into a protocol tree stored on
 * that tag.
 */

#pragma once

#include "csa_header.hpp"
#include "result.hpp"

#include <csa/encoding/decode_options.hpp>
#include <csa/integration/element_source.hpp>
#include <csa/protocol/ascconv_parser.hpp>

#include <cstdint>
#include <span>
#include <string_view>

namespace csa::core {

/**
 * @brief Stateless facade over the CSA decoding pipeline
 *
 * All functions are safe to call concurrently; each call owns its cursor
 * and its result.
 *
 * @example
 * @code
 * auto result = csa_header_reader::read(bytes);
 * if (result.is_ok()) {
 *     const auto& header = result.value();
 *     if (const auto* tag = header.find("MrPhoenixProtocol"); tag && tag->has_protocol()) {
 *         auto slices = protocol::n_slices(tag->protocol()->root);
 *     }
 * }
 * @endcode
 */
class csa_header_reader {
public:
    /// Name of the tag whose text value is a MrPhoenixProtocol
    static constexpr std::string_view protocol_tag_name = "MrPhoenixProtocol";

    /**
     * @brief Decode a CSA element value
     * @param bytes Value of (0029,1010) or (0029,1020)
     * @param options Decoder configuration
     * @return The decoded header, or the first fatal decode error
     */
    [[nodiscard]] static auto read(std::span<const uint8_t> bytes,
                                   const encoding::decode_options& options = {})
        -> Result<csa_header>;

    /**
     * @brief Decode protocol text directly
     *
     * For text that never went through a binary CSA stream, such as the
     * XProtocol element of XA enhanced files.
     */
    [[nodiscard]] static auto read_protocol(std::string_view text)
        -> protocol::protocol_document;

    /**
     * @brief Locate and decode a header through an element source
     *
     * Looks up the element for @p kind. Files without binary CSA headers
     * (XA enhanced) carry XProtocol text in (0021,1019) instead; that text is
     * returned as a header holding a single MrPhoenixProtocol tag.
     *
     * @return The header, or element_not_found when neither element exists
     */
    [[nodiscard]] static auto read_from(const integration::element_source& source,
                                        integration::header_kind kind,
                                        const encoding::decode_options& options = {})
        -> Result<csa_header>;
};

}  // namespace csa::core
