/**
 * @file value_converter.hpp
 * @brief Conversion of raw CSA item payloads to typed values
 *
 * The tag decoder extracts item payloads; this module interprets them
 * according to the tag's VR. Conversion is selected through a constant
 * table indexed by vr_kind, so a new VR only needs a table entry.
 */

#ifndef CSA_ENCODING_VALUE_CONVERTER_HPP
#define CSA_ENCODING_VALUE_CONVERTER_HPP

#include "csa_vr.hpp"
#include "decode_options.hpp"

#include <csa/core/csa_value.hpp>
#include <csa/core/result.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace csa::encoding {

/**
 * @brief Convert one item payload to a typed value
 *
 * - A zero-length payload yields null for every VR.
 * - String-like VRs: Latin-1 text cut at the first NUL, trailing whitespace
 *   removed, returned as UTF-8; empty text yields null.
 * - IS / DS: text as above parsed as a whole; empty or unparsable yields null.
 * - SS US SL UL FL FD: little-endian binary whose size must equal the VR
 *   width, or number text when @p mode is numeric_payload::text.
 * - Opaque VRs: the payload bytes unchanged.
 *
 * @param vr The tag's VR
 * @param payload The item payload without alignment padding
 * @param mode Interpretation of fixed-width numeric payloads
 * @return The value, or size_mismatch for a binary payload of the wrong width
 */
[[nodiscard]] auto convert_item(csa_vr vr, std::span<const uint8_t> payload,
                                numeric_payload mode = numeric_payload::binary)
    -> Result<core::csa_value>;

/**
 * @brief Decode Latin-1 bytes up to the first NUL as UTF-8
 */
[[nodiscard]] auto latin1_to_utf8(std::span<const uint8_t> bytes) -> std::string;

/**
 * @brief Parse integer-string text; surrounding whitespace is ignored
 * @return The value, or std::nullopt if the text is not a whole integer
 */
[[nodiscard]] auto parse_integer_string(std::string_view text) -> std::optional<int64_t>;

/**
 * @brief Parse decimal-string text; surrounding whitespace is ignored
 * @return The value, or std::nullopt if the text is not a whole number
 */
[[nodiscard]] auto parse_decimal_string(std::string_view text) -> std::optional<double>;

}  // namespace csa::encoding

#endif  // CSA_ENCODING_VALUE_CONVERTER_HPP
