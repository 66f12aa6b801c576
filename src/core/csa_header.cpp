/**
 * @file csa_header.cpp
 * @brief Implementation of csa_header
 */

#include "csa/core/csa_header.hpp"

#include <utility>

namespace csa::core {

void csa_header::insert(csa_tag tag) {
    auto it = index_.find(tag.name());
    if (it != index_.end()) {
        tags_[it->second] = std::move(tag);
        return;
    }
    index_.emplace(tag.name(), tags_.size());
    tags_.push_back(std::move(tag));
}

void csa_header::clear() noexcept {
    tags_.clear();
    index_.clear();
}

auto csa_header::contains(std::string_view name) const -> bool {
    return find(name) != nullptr;
}

auto csa_header::find(std::string_view name) const -> const csa_tag* {
    auto it = index_.find(std::string(name));
    if (it == index_.end()) {
        return nullptr;
    }
    return &tags_[it->second];
}

auto csa_header::find(std::string_view name) -> csa_tag* {
    auto it = index_.find(std::string(name));
    if (it == index_.end()) {
        return nullptr;
    }
    return &tags_[it->second];
}

auto csa_header::names() const -> std::vector<std::string> {
    std::vector<std::string> result;
    result.reserve(tags_.size());
    for (const auto& tag : tags_) {
        result.push_back(tag.name());
    }
    return result;
}

}  // namespace csa::core
