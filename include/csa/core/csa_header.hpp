/**
 * @file csa_header.hpp
 * @brief Ordered collection of decoded CSA tags
 *
 * Iteration order is the order in which tags appear in the byte stream.
 * Callers may rely on it; it is part of the contract, not an artefact of
 * the container.
 */

#pragma once

#include "csa_tag.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace csa::core {

/**
 * @brief Insertion-ordered mapping from tag name to csa_tag
 *
 * Thread Safety: This class is NOT thread-safe for concurrent modification.
 * A header is built by one decode call; concurrent reads are safe.
 *
 * @example
 * @code
 * for (const auto& tag : header) {
 *     std::cout << tag.name() << " " << encoding::to_string(tag.vr()) << "\n";
 * }
 * @endcode
 */
class csa_header {
public:
    using const_iterator = std::vector<csa_tag>::const_iterator;

    csa_header() = default;

    // ========================================================================
    // Modification
    // ========================================================================

    /**
     * @brief Add a tag at the end
     *
     * A tag whose name is already present replaces the earlier tag's
     * content but keeps the earlier position.
     */
    void insert(csa_tag tag);

    void clear() noexcept;

    // ========================================================================
    // Lookup
    // ========================================================================

    [[nodiscard]] auto contains(std::string_view name) const -> bool;

    /**
     * @brief Find a tag by name
     * @return Pointer to the tag, or nullptr if absent
     */
    [[nodiscard]] auto find(std::string_view name) const -> const csa_tag*;

    [[nodiscard]] auto find(std::string_view name) -> csa_tag*;

    /**
     * @brief Tag at stream position @p index
     */
    [[nodiscard]] auto at(std::size_t index) const -> const csa_tag& { return tags_.at(index); }

    /**
     * @brief Tag names in stream order
     */
    [[nodiscard]] auto names() const -> std::vector<std::string>;

    // ========================================================================
    // Size and Iteration
    // ========================================================================

    [[nodiscard]] auto size() const noexcept -> std::size_t { return tags_.size(); }

    [[nodiscard]] auto empty() const noexcept -> bool { return tags_.empty(); }

    [[nodiscard]] auto begin() const noexcept -> const_iterator { return tags_.begin(); }

    [[nodiscard]] auto end() const noexcept -> const_iterator { return tags_.end(); }

    bool operator==(const csa_header& other) const { return tags_ == other.tags_; }

private:
    std::vector<csa_tag> tags_;
    std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace csa::core
