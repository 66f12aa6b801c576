/**
 * @file csa_value.hpp
 * @brief Typed value of one CSA item
 */

#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace csa::core {

/**
 * @brief A single decoded CSA value
 *
 * - std::monostate: null (empty item, blank or unparsable numeric text)
 * - int64_t: IS, SS, US, SL, UL
 * - double: DS, FL, FD
 * - std::string: string-like VRs, UTF-8
 * - std::vector<uint8_t>: opaque VRs, raw bytes
 */
using csa_value =
    std::variant<std::monostate, int64_t, double, std::string, std::vector<uint8_t>>;

[[nodiscard]] inline auto is_null(const csa_value& value) noexcept -> bool {
    return std::holds_alternative<std::monostate>(value);
}

}  // namespace csa::core
