/**
 * @file protocol_node.hpp
 * @brief Nested value tree decoded from MrPhoenixProtocol text
 *
 * A protocol_node is one of:
 * - a block: ordered mapping from key to child node
 * - an array: ordered sequence of child nodes
 * - a leaf: integer, real or string
 *
 * Blocks keep keys in first-assignment order, which is the order the
 * assignments appear in the protocol text.
 */

#pragma once

#include "protocol_path.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace csa::protocol {

/**
 * @brief Node of a decoded protocol tree
 *
 * Thread Safety: This class is NOT thread-safe. A tree is built by one
 * decode call and handed to the caller.
 *
 * @example
 * @code
 * auto tree = ascconv_parser::parse(text).root;
 * if (auto* thickness = tree.find_path("sSliceArray.asSlice[0].dThickness")) {
 *     double mm = thickness->as_real().value_or(0.0);
 * }
 * @endcode
 */
class protocol_node {
public:
    enum class node_type : uint8_t { block, array, integer, real, string };

    // ========================================================================
    // Construction
    // ========================================================================

    /**
     * @brief Default constructor - creates an empty block
     */
    protocol_node() = default;

    explicit protocol_node(int64_t value);
    explicit protocol_node(double value);
    explicit protocol_node(std::string value);

    [[nodiscard]] static auto make_array() -> protocol_node;

    // ========================================================================
    // Type Queries
    // ========================================================================

    [[nodiscard]] auto type() const noexcept -> node_type { return type_; }
    [[nodiscard]] auto is_block() const noexcept -> bool { return type_ == node_type::block; }
    [[nodiscard]] auto is_array() const noexcept -> bool { return type_ == node_type::array; }
    [[nodiscard]] auto is_integer() const noexcept -> bool { return type_ == node_type::integer; }
    [[nodiscard]] auto is_real() const noexcept -> bool { return type_ == node_type::real; }
    [[nodiscard]] auto is_string() const noexcept -> bool { return type_ == node_type::string; }
    [[nodiscard]] auto is_leaf() const noexcept -> bool {
        return !is_block() && !is_array();
    }

    // ========================================================================
    // Leaf Access
    // ========================================================================

    [[nodiscard]] auto as_integer() const -> std::optional<int64_t>;

    /**
     * @brief Numeric value of an integer or real leaf
     */
    [[nodiscard]] auto as_real() const -> std::optional<double>;

    [[nodiscard]] auto as_string() const -> std::optional<std::string>;

    // ========================================================================
    // Container Access
    // ========================================================================

    /**
     * @brief Number of children of a block or array (0 for leaves)
     */
    [[nodiscard]] auto size() const noexcept -> std::size_t { return children_.size(); }

    [[nodiscard]] auto empty() const noexcept -> bool { return children_.empty(); }

    /**
     * @brief Keys of a block in insertion order (empty for other types)
     */
    [[nodiscard]] auto keys() const noexcept -> const std::vector<std::string>& {
        return keys_;
    }

    [[nodiscard]] auto children() const noexcept -> const std::vector<protocol_node>& {
        return children_;
    }

    [[nodiscard]] auto contains(std::string_view key) const -> bool;

    /**
     * @brief Child of a block by key
     * @return Pointer to the child, or nullptr if absent or not a block
     */
    [[nodiscard]] auto find(std::string_view key) const -> const protocol_node*;

    /**
     * @brief Element of an array by index
     * @return Pointer to the element, or nullptr if out of range or not an array
     */
    [[nodiscard]] auto at(std::size_t index) const -> const protocol_node*;

    /**
     * @brief Resolve a dotted/bracketed path below this node
     * @param path Path such as `sSliceArray.asSlice[0].dThickness`
     * @return Pointer to the node, or nullptr if any step is missing
     */
    [[nodiscard]] auto find_path(std::string_view path) const -> const protocol_node*;

    // ========================================================================
    // Modification
    // ========================================================================

    /**
     * @brief Child of a block by key, created as an empty block if absent
     *
     * A node that is not a block is first turned into an empty block.
     */
    auto child(std::string_view key) -> protocol_node&;

    /**
     * @brief Element of an array by index, extending the array as needed
     *
     * Missing elements up to and including @p index are filled with empty
     * blocks. A node that is not an array is first turned into an empty array.
     */
    auto element(std::size_t index) -> protocol_node&;

    /**
     * @brief Append an element to an array
     */
    void push_back(protocol_node node);

    /**
     * @brief Follow @p segments from this node, creating nodes on the way
     * @return The node addressed by the last segment
     */
    auto walk(const std::vector<path_segment>& segments) -> protocol_node&;

    bool operator==(const protocol_node& other) const;

private:
    void reset(node_type type);

    node_type type_{node_type::block};
    int64_t integer_{0};
    double real_{0.0};
    std::string text_;
    std::vector<std::string> keys_;        // block keys, parallel to children_
    std::vector<protocol_node> children_;  // block values or array elements
};

/**
 * @brief Number of slices declared by a protocol tree (`sSliceArray.lSize`)
 * @return The slice count, or std::nullopt if absent
 */
[[nodiscard]] std::optional<int64_t> n_slices(const protocol_node& root);

}  // namespace csa::protocol
