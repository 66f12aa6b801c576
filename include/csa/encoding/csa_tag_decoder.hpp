/**
 * @file csa_tag_decoder.hpp
 * @brief Decoder for the binary CSA tag stream (Type 1 and Type 2 layouts)
 *
 * Layout (all integers little-endian):
 *
 * @code
 * Type 2 prefix: "SV10" | 4 unused bytes | n_tags u32 | unused u32
 * Type 1 prefix:                           n_tags u32 | unused u32
 * Tag record   : name[64] | vm i32 | vr[4] | syngodt i32 | n_items i32 | check i32
 * Item         : field0 i32 | length i32 | check i32 | field3 i32 | payload | pad to 4
 * @endcode
 *
 * @see nibabel/nicom/csareader.py for the reference description of the format
 */

#ifndef CSA_ENCODING_CSA_TAG_DECODER_HPP
#define CSA_ENCODING_CSA_TAG_DECODER_HPP

#include "decode_options.hpp"

#include <csa/core/csa_header.hpp>
#include <csa/core/result.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace csa::encoding {

/**
 * @brief Historical framing of a CSA tag stream
 */
enum class csa_layout : uint8_t {
    type1,  ///< No marker; legacy item length framing
    type2   ///< Starts with "SV10"
};

/**
 * @brief Stateless decoder turning a CSA buffer into a csa_header
 *
 * Decoding is all-or-nothing: any structural problem aborts the decode and
 * no partial header is returned. Errors carry the byte offset and, once the
 * walk has reached a tag, its index and name in error_info::details.
 *
 * @example
 * @code
 * auto result = csa_tag_decoder::decode(bytes);
 * if (result.is_err()) {
 *     std::cerr << result.error().message << "\n";
 * }
 * @endcode
 */
class csa_tag_decoder {
public:
    static constexpr std::array<uint8_t, 4> type2_marker = {'S', 'V', '1', '0'};

    /// name[64] + vm + vr[4] + syngodt + n_items + check
    static constexpr std::size_t tag_record_size = 84;
    static constexpr std::size_t tag_name_size = 64;
    static constexpr std::size_t item_header_size = 16;
    static constexpr std::size_t item_alignment = 4;

    /// The two check values written by Siemens software
    static constexpr std::array<int32_t, 2> check_values = {77, 205};

    /**
     * @brief Determine the layout from the first four bytes
     *
     * Buffers shorter than the marker are reported as Type 1; decoding them
     * then fails with out_of_bounds.
     */
    [[nodiscard]] static auto detect_layout(std::span<const uint8_t> buffer) noexcept
        -> csa_layout;

    /**
     * @brief Decode a complete tag stream
     * @param buffer The CSA element value
     * @param options Numeric payload mode and item check validation
     * @return The tags in stream order, or the first fatal error
     *
     * Error codes: out_of_bounds (prefix), malformed_header, invalid_check_bit,
     * truncated_stream, size_mismatch.
     */
    [[nodiscard]] static auto decode(std::span<const uint8_t> buffer,
                                     const decode_options& options = {})
        -> Result<core::csa_header>;

    [[nodiscard]] static constexpr auto is_valid_check(int32_t value) noexcept -> bool {
        return value == check_values[0] || value == check_values[1];
    }
};

}  // namespace csa::encoding

#endif  // CSA_ENCODING_CSA_TAG_DECODER_HPP
