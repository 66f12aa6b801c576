/**
 * @file decode_options.hpp
 * @brief Options controlling how a CSA buffer is decoded
 */

#ifndef CSA_ENCODING_DECODE_OPTIONS_HPP
#define CSA_ENCODING_DECODE_OPTIONS_HPP

#include <cstdint>

namespace csa::encoding {

/**
 * @brief How payloads of fixed-width numeric VRs (SS US SL UL FL FD) are read
 */
enum class numeric_payload : uint8_t {
    /// Little-endian binary of exactly the VR width
    binary,
    /// Latin-1 number text, as scanners actually write it
    text
};

/**
 * @brief Decoder configuration
 *
 * @example
 * @code
 * decode_options options;
 * options.numeric_payload = numeric_payload::text;
 * auto header = core::csa_header_reader::read(bytes, options);
 * @endcode
 */
struct decode_options {
    /// Interpretation of fixed-width numeric payloads
    encoding::numeric_payload numeric_payload{encoding::numeric_payload::binary};

    /// Require the third field of every item record to be 77 or 205
    bool validate_item_check{true};

    /// Decode the MrPhoenixProtocol tag into a protocol tree
    bool decode_protocol{true};
};

}  // namespace csa::encoding

#endif  // CSA_ENCODING_DECODE_OPTIONS_HPP
