#ifndef CSA_ENCODING_CSA_VR_HPP
#define CSA_ENCODING_CSA_VR_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace csa::encoding {

/**
 * @brief Value Representation codes that occur in CSA tag records.
 *
 * CSA reuses DICOM VR mnemonics, stored as a NUL-padded 4-byte field.
 * The enum values are the uint16_t packing of the two ASCII characters,
 * first character in the high byte. Codes outside this set decode as
 * csa_vr::unknown and are treated as opaque bytes.
 *
 * @see DICOM PS3.5 Section 6.2 - Value Representation (VR)
 */
enum class csa_vr : uint16_t {
    // String-like VRs
    AE = 0x4145,  ///< Application Entity
    AS = 0x4153,  ///< Age String
    CS = 0x4353,  ///< Code String
    DA = 0x4441,  ///< Date
    DT = 0x4454,  ///< Date Time
    LO = 0x4C4F,  ///< Long String
    LT = 0x4C54,  ///< Long Text
    PN = 0x504E,  ///< Person Name
    SH = 0x5348,  ///< Short String
    ST = 0x5354,  ///< Short Text
    TM = 0x544D,  ///< Time
    UI = 0x5549,  ///< Unique Identifier
    UT = 0x5554,  ///< Unlimited Text

    // Numeric text VRs
    IS = 0x4953,  ///< Integer String
    DS = 0x4453,  ///< Decimal String

    // Fixed-width numeric VRs
    SS = 0x5353,  ///< Signed Short (2 bytes)
    US = 0x5553,  ///< Unsigned Short (2 bytes)
    SL = 0x534C,  ///< Signed Long (4 bytes)
    UL = 0x554C,  ///< Unsigned Long (4 bytes)
    FL = 0x464C,  ///< Floating Point Single (4 bytes)
    FD = 0x4644,  ///< Floating Point Double (8 bytes)

    // Opaque VRs
    OB = 0x4F42,  ///< Other Byte
    OF = 0x4F46,  ///< Other Float
    OW = 0x4F57,  ///< Other Word
    UN = 0x554E,  ///< Unknown

    unknown = 0x3F3F,  ///< Any code not listed above ("??")
};

/**
 * @brief Conversion family of a VR; selects the converter in the lookup table.
 */
enum class vr_kind : uint8_t {
    string_like,
    integer_string,
    decimal_string,
    fixed_signed,
    fixed_unsigned,
    fixed_float,
    opaque,
};

/**
 * @brief Static properties of one VR.
 */
struct vr_info {
    csa_vr vr;
    std::string_view code;
    vr_kind kind;
    std::size_t width;  ///< Payload width for fixed-width VRs, 0 otherwise
};

namespace detail {

// clang-format off
inline constexpr std::array<vr_info, 26> vr_table = {{
    {csa_vr::AE, "AE", vr_kind::string_like,    0},
    {csa_vr::AS, "AS", vr_kind::string_like,    0},
    {csa_vr::CS, "CS", vr_kind::string_like,    0},
    {csa_vr::DA, "DA", vr_kind::string_like,    0},
    {csa_vr::DT, "DT", vr_kind::string_like,    0},
    {csa_vr::LO, "LO", vr_kind::string_like,    0},
    {csa_vr::LT, "LT", vr_kind::string_like,    0},
    {csa_vr::PN, "PN", vr_kind::string_like,    0},
    {csa_vr::SH, "SH", vr_kind::string_like,    0},
    {csa_vr::ST, "ST", vr_kind::string_like,    0},
    {csa_vr::TM, "TM", vr_kind::string_like,    0},
    {csa_vr::UI, "UI", vr_kind::string_like,    0},
    {csa_vr::UT, "UT", vr_kind::string_like,    0},
    {csa_vr::IS, "IS", vr_kind::integer_string, 0},
    {csa_vr::DS, "DS", vr_kind::decimal_string, 0},
    {csa_vr::SS, "SS", vr_kind::fixed_signed,   2},
    {csa_vr::US, "US", vr_kind::fixed_unsigned, 2},
    {csa_vr::SL, "SL", vr_kind::fixed_signed,   4},
    {csa_vr::UL, "UL", vr_kind::fixed_unsigned, 4},
    {csa_vr::FL, "FL", vr_kind::fixed_float,    4},
    {csa_vr::FD, "FD", vr_kind::fixed_float,    8},
    {csa_vr::OB, "OB", vr_kind::opaque,         0},
    {csa_vr::OF, "OF", vr_kind::opaque,         0},
    {csa_vr::OW, "OW", vr_kind::opaque,         0},
    {csa_vr::UN, "UN", vr_kind::opaque,         0},
    {csa_vr::unknown, "??", vr_kind::opaque,    0},
}};
// clang-format on

}  // namespace detail

/// @name VR Lookup
/// @{

/**
 * @brief Retrieves the static properties of a VR.
 * @param vr The VR to look up
 * @return Table entry; the csa_vr::unknown entry for values outside the table
 */
[[nodiscard]] constexpr const vr_info& get_vr_info(csa_vr vr) noexcept {
    for (const auto& info : detail::vr_table) {
        if (info.vr == vr) {
            return info;
        }
    }
    return detail::vr_table.back();
}

/**
 * @brief Converts a csa_vr to its two-character code ("??" for unknown).
 */
[[nodiscard]] constexpr std::string_view to_string(csa_vr vr) noexcept {
    return get_vr_info(vr).code;
}

/**
 * @brief Parses a VR code as stored in a tag record.
 * @param str The code, already stripped of NUL padding
 * @return The matching csa_vr, or csa_vr::unknown if not in the table
 */
[[nodiscard]] constexpr csa_vr vr_from_string(std::string_view str) noexcept {
    if (str.size() != 2) {
        return csa_vr::unknown;
    }
    for (const auto& info : detail::vr_table) {
        if (info.vr != csa_vr::unknown && info.code == str) {
            return info.vr;
        }
    }
    return csa_vr::unknown;
}

/// @}

/// @name VR Category Classification
/// @{

[[nodiscard]] constexpr bool is_string_vr(csa_vr vr) noexcept {
    return get_vr_info(vr).kind == vr_kind::string_like;
}

/**
 * @brief Checks if a VR carries a number (text or binary encoded).
 */
[[nodiscard]] constexpr bool is_numeric_vr(csa_vr vr) noexcept {
    switch (get_vr_info(vr).kind) {
        case vr_kind::integer_string:
        case vr_kind::decimal_string:
        case vr_kind::fixed_signed:
        case vr_kind::fixed_unsigned:
        case vr_kind::fixed_float:
            return true;
        default:
            return false;
    }
}

[[nodiscard]] constexpr bool is_fixed_width_vr(csa_vr vr) noexcept {
    return get_vr_info(vr).width != 0;
}

[[nodiscard]] constexpr bool is_opaque_vr(csa_vr vr) noexcept {
    return get_vr_info(vr).kind == vr_kind::opaque;
}

/// @}

}  // namespace csa::encoding

#endif  // CSA_ENCODING_CSA_VR_HPP
