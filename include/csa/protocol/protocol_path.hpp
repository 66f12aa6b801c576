/**
 * @file protocol_path.hpp
 * @brief Left-hand side paths of ASCCONV assignments
 *
 * A path such as `sSliceArray.asSlice[0].sPosition.dTra` is a dot-separated
 * list of segments; every segment is an identifier followed by zero or more
 * `[index]` suffixes.
 */

#ifndef CSA_PROTOCOL_PROTOCOL_PATH_HPP
#define CSA_PROTOCOL_PROTOCOL_PATH_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace csa::protocol {

/// Largest array index accepted in a path; larger indices make the line invalid
inline constexpr std::size_t max_path_index = 65535;

/**
 * @brief One dot-separated component of a path.
 */
struct path_segment {
    std::string key;
    std::vector<std::size_t> indices;

    bool operator==(const path_segment&) const = default;
};

/**
 * @brief Splits a path into segments.
 * @param path Text such as `asSlice[0].dThickness`; surrounding blanks allowed
 * @return The segments, or std::nullopt if the text is not a valid path or an
 *         index exceeds max_path_index
 */
[[nodiscard]] std::optional<std::vector<path_segment>> parse_path(std::string_view path);

}  // namespace csa::protocol

#endif  // CSA_PROTOCOL_PROTOCOL_PATH_HPP
