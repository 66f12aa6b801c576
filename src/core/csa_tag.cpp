/**
 * @file csa_tag.cpp
 * @brief Implementation of csa_tag
 */

#include "csa/core/csa_tag.hpp"

#include <utility>

namespace csa::core {

csa_tag::csa_tag(std::string name, encoding::csa_vr vr, uint32_t vm,
                 std::vector<csa_value> values)
    : name_(std::move(name)), vr_(vr), vm_(vm), values_(std::move(values)) {}

auto csa_tag::value(std::size_t index) const noexcept -> const csa_value* {
    if (index >= values_.size()) {
        return nullptr;
    }
    return &values_[index];
}

auto csa_tag::as_integer(std::size_t index) const -> std::optional<int64_t> {
    const auto* v = value(index);
    if (v == nullptr) {
        return std::nullopt;
    }
    if (const auto* i = std::get_if<int64_t>(v)) {
        return *i;
    }
    return std::nullopt;
}

auto csa_tag::as_real(std::size_t index) const -> std::optional<double> {
    const auto* v = value(index);
    if (v == nullptr) {
        return std::nullopt;
    }
    if (const auto* d = std::get_if<double>(v)) {
        return *d;
    }
    if (const auto* i = std::get_if<int64_t>(v)) {
        return static_cast<double>(*i);
    }
    return std::nullopt;
}

auto csa_tag::as_string(std::size_t index) const -> std::optional<std::string> {
    const auto* v = value(index);
    if (v == nullptr) {
        return std::nullopt;
    }
    if (const auto* s = std::get_if<std::string>(v)) {
        return *s;
    }
    return std::nullopt;
}

auto csa_tag::protocol() const noexcept -> const protocol::protocol_document* {
    return protocol_ ? &*protocol_ : nullptr;
}

void csa_tag::set_protocol(protocol::protocol_document document) {
    protocol_ = std::move(document);
    values_.clear();
}

bool csa_tag::operator==(const csa_tag& other) const {
    if (name_ != other.name_ || vr_ != other.vr_ || vm_ != other.vm_ ||
        values_ != other.values_ || protocol_.has_value() != other.protocol_.has_value()) {
        return false;
    }
    if (!protocol_) {
        return true;
    }
    return protocol_->root == other.protocol_->root &&
           protocol_->attributes == other.protocol_->attributes;
}

}  // namespace csa::core
