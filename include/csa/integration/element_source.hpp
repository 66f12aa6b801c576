/**
 * @file element_source.hpp
 * @brief Boundary to the DICOM reader that supplies CSA element values
 *
 * This library does not parse DICOM files. Callers implement
 * element_source over whatever reader they use and hand it to
 * core::csa_header_reader::read_from().
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace csa::integration {

/**
 * @brief DICOM element identifier (group, element)
 */
struct element_id {
    uint16_t group{0};
    uint16_t element{0};

    constexpr bool operator==(const element_id&) const = default;
};

/**
 * @brief Format an element id as "(gggg,eeee)"
 */
[[nodiscard]] auto to_string(element_id id) -> std::string;

/**
 * @namespace element_ids
 * @brief Elements that carry Siemens CSA data
 */
namespace element_ids {
    /// CSA Image Header Info
    inline constexpr element_id csa_image_header{0x0029, 0x1010};

    /// CSA Series Header Info
    inline constexpr element_id csa_series_header{0x0029, 0x1020};

    /// XProtocol text in XA enhanced multi-frame files (no binary CSA)
    inline constexpr element_id xa_enhanced_protocol{0x0021, 0x1019};
}  // namespace element_ids

/**
 * @brief Which CSA header of a file to read
 */
enum class header_kind : uint8_t {
    image,
    series
};

[[nodiscard]] constexpr auto header_element(header_kind kind) noexcept -> element_id {
    return kind == header_kind::series ? element_ids::csa_series_header
                                       : element_ids::csa_image_header;
}

/**
 * @brief Abstract supplier of raw element values
 *
 * Implementations must be safe to call from the thread that runs the decode;
 * the decoder never retains the returned bytes.
 */
class element_source {
public:
    virtual ~element_source() = default;

    /**
     * @brief Look up the value of an element
     * @param id The element to look up
     * @return The value bytes, or std::nullopt if the element is absent
     */
    [[nodiscard]] virtual auto find(element_id id) const
        -> std::optional<std::vector<uint8_t>> = 0;
};

}  // namespace csa::integration
