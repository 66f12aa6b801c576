/**
 * @file byte_cursor.cpp
 * @brief Implementation of the bounds-checked byte cursor
 */

#include "csa/encoding/byte_cursor.hpp"

#include <string>

namespace csa::encoding {

namespace {

constexpr uint32_t read_le32(const uint8_t* data) {
    return static_cast<uint32_t>(data[0]) |
           (static_cast<uint32_t>(data[1]) << 8) |
           (static_cast<uint32_t>(data[2]) << 16) |
           (static_cast<uint32_t>(data[3]) << 24);
}

}  // namespace

auto byte_cursor::out_of_bounds(std::size_t n) const -> error_info {
    return error_info{error_codes::out_of_bounds,
                      "Read of " + std::to_string(n) + " bytes at offset " +
                          std::to_string(pos_) + " exceeds buffer of " +
                          std::to_string(buffer_.size()) + " bytes",
                      "csa", "offset=" + std::to_string(pos_)};
}

auto byte_cursor::read(std::size_t n) -> result<std::span<const uint8_t>> {
    if (n > remaining()) {
        return result<std::span<const uint8_t>>(out_of_bounds(n));
    }
    auto view = buffer_.subspan(pos_, n);
    pos_ += n;
    return view;
}

auto byte_cursor::peek(std::size_t n) const -> result<std::span<const uint8_t>> {
    if (n > remaining()) {
        return result<std::span<const uint8_t>>(out_of_bounds(n));
    }
    return buffer_.subspan(pos_, n);
}

auto byte_cursor::skip(std::size_t n) -> VoidResult {
    if (n > remaining()) {
        return VoidResult(out_of_bounds(n));
    }
    pos_ += n;
    return kcenon::common::ok();
}

auto byte_cursor::seek(std::size_t offset) -> VoidResult {
    if (offset > buffer_.size()) {
        return csa_void_error(
            error_codes::out_of_bounds,
            "Seek to offset " + std::to_string(offset) + " outside buffer of " +
                std::to_string(buffer_.size()) + " bytes",
            "offset=" + std::to_string(offset));
    }
    pos_ = offset;
    return kcenon::common::ok();
}

auto byte_cursor::read_u32_le() -> result<uint32_t> {
    auto bytes = read(4);
    if (bytes.is_err()) {
        return forward_error<uint32_t>(bytes.error());
    }
    return read_le32(bytes.value().data());
}

auto byte_cursor::read_i32_le() -> result<int32_t> {
    auto raw = read_u32_le();
    if (raw.is_err()) {
        return forward_error<int32_t>(raw.error());
    }
    return static_cast<int32_t>(raw.value());
}

}  // namespace csa::encoding
