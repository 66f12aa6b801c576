/**
 * @file protocol_node.cpp
 * @brief Implementation of the protocol value tree
 */

#include "csa/protocol/protocol_node.hpp"

#include <algorithm>
#include <utility>

namespace csa::protocol {

// ============================================================================
// Construction
// ============================================================================

protocol_node::protocol_node(int64_t value)
    : type_(node_type::integer), integer_(value) {}

protocol_node::protocol_node(double value)
    : type_(node_type::real), real_(value) {}

protocol_node::protocol_node(std::string value)
    : type_(node_type::string), text_(std::move(value)) {}

auto protocol_node::make_array() -> protocol_node {
    protocol_node node;
    node.type_ = node_type::array;
    return node;
}

void protocol_node::reset(node_type type) {
    type_ = type;
    integer_ = 0;
    real_ = 0.0;
    text_.clear();
    keys_.clear();
    children_.clear();
}

// ============================================================================
// Leaf Access
// ============================================================================

auto protocol_node::as_integer() const -> std::optional<int64_t> {
    if (type_ != node_type::integer) {
        return std::nullopt;
    }
    return integer_;
}

auto protocol_node::as_real() const -> std::optional<double> {
    switch (type_) {
        case node_type::real:
            return real_;
        case node_type::integer:
            return static_cast<double>(integer_);
        default:
            return std::nullopt;
    }
}

auto protocol_node::as_string() const -> std::optional<std::string> {
    if (type_ != node_type::string) {
        return std::nullopt;
    }
    return text_;
}

// ============================================================================
// Container Access
// ============================================================================

auto protocol_node::contains(std::string_view key) const -> bool {
    return find(key) != nullptr;
}

auto protocol_node::find(std::string_view key) const -> const protocol_node* {
    if (type_ != node_type::block) {
        return nullptr;
    }
    auto it = std::find(keys_.begin(), keys_.end(), key);
    if (it == keys_.end()) {
        return nullptr;
    }
    return &children_[static_cast<std::size_t>(it - keys_.begin())];
}

auto protocol_node::at(std::size_t index) const -> const protocol_node* {
    if (type_ != node_type::array || index >= children_.size()) {
        return nullptr;
    }
    return &children_[index];
}

auto protocol_node::find_path(std::string_view path) const -> const protocol_node* {
    auto segments = parse_path(path);
    if (!segments) {
        return nullptr;
    }

    const protocol_node* node = this;
    for (const auto& segment : *segments) {
        node = node->find(segment.key);
        for (auto index : segment.indices) {
            if (node == nullptr) {
                return nullptr;
            }
            node = node->at(index);
        }
        if (node == nullptr) {
            return nullptr;
        }
    }
    return node;
}

// ============================================================================
// Modification
// ============================================================================

auto protocol_node::child(std::string_view key) -> protocol_node& {
    if (type_ != node_type::block) {
        reset(node_type::block);
    }
    auto it = std::find(keys_.begin(), keys_.end(), key);
    if (it != keys_.end()) {
        return children_[static_cast<std::size_t>(it - keys_.begin())];
    }
    keys_.emplace_back(key);
    children_.emplace_back();
    return children_.back();
}

auto protocol_node::element(std::size_t index) -> protocol_node& {
    if (type_ != node_type::array) {
        reset(node_type::array);
    }
    if (index >= children_.size()) {
        children_.resize(index + 1);
    }
    return children_[index];
}

void protocol_node::push_back(protocol_node node) {
    if (type_ != node_type::array) {
        reset(node_type::array);
    }
    children_.push_back(std::move(node));
}

auto protocol_node::walk(const std::vector<path_segment>& segments) -> protocol_node& {
    protocol_node* node = this;
    for (const auto& segment : segments) {
        node = &node->child(segment.key);
        for (auto index : segment.indices) {
            node = &node->element(index);
        }
    }
    return *node;
}

bool protocol_node::operator==(const protocol_node& other) const {
    if (type_ != other.type_) {
        return false;
    }
    switch (type_) {
        case node_type::integer:
            return integer_ == other.integer_;
        case node_type::real:
            return real_ == other.real_;
        case node_type::string:
            return text_ == other.text_;
        case node_type::block:
            return keys_ == other.keys_ && children_ == other.children_;
        case node_type::array:
            return children_ == other.children_;
    }
    return false;
}

std::optional<int64_t> n_slices(const protocol_node& root) {
    const auto* size = root.find_path("sSliceArray.lSize");
    if (size == nullptr) {
        return std::nullopt;
    }
    return size->as_integer();
}

}  // namespace csa::protocol
