/**
 * @file value_converter.cpp
 * @brief Implementation of the CSA item value converter
 */

#include "csa/encoding/value_converter.hpp"

#include <array>
#include <bit>
#include <cctype>
#include <charconv>
#include <vector>

namespace csa::encoding {

namespace {

using convert_result = Result<core::csa_value>;
using converter_fn = convert_result (*)(const vr_info&, std::span<const uint8_t>,
                                        numeric_payload);

bool is_blank(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && is_blank(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_blank(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

std::string trimmed_text(std::span<const uint8_t> payload) {
    auto text = latin1_to_utf8(payload);
    while (!text.empty() && is_blank(text.back())) {
        text.pop_back();
    }
    return text;
}

/// Bytes are ASCII for the number text we accept, so no UTF-8 expansion here
std::string ascii_text(std::span<const uint8_t> payload) {
    const auto* begin = reinterpret_cast<const char*>(payload.data());
    std::string_view text(begin, payload.size());
    return std::string(text.substr(0, text.find('\0')));
}

uint64_t read_le(std::span<const uint8_t> bytes) {
    uint64_t value = 0;
    for (std::size_t i = bytes.size(); i-- > 0;) {
        value = (value << 8) | bytes[i];
    }
    return value;
}

int64_t sign_extend(uint64_t value, std::size_t width) {
    const unsigned bits = static_cast<unsigned>(width * 8);
    const uint64_t sign = uint64_t{1} << (bits - 1);
    if (bits < 64 && (value & sign) != 0) {
        value |= ~uint64_t{0} << bits;
    }
    return static_cast<int64_t>(value);
}

convert_result width_mismatch(const vr_info& info, std::size_t size) {
    return csa_error<core::csa_value>(
        error_codes::size_mismatch,
        "Payload of " + std::to_string(size) + " bytes does not match VR " +
            std::string(info.code) + " width of " + std::to_string(info.width) + " bytes",
        "vr=" + std::string(info.code) + " size=" + std::to_string(size));
}

core::csa_value from_optional(std::optional<int64_t> value) {
    if (value) {
        return *value;
    }
    return std::monostate{};
}

core::csa_value from_optional(std::optional<double> value) {
    if (value) {
        return *value;
    }
    return std::monostate{};
}

// ============================================================================
// Converters, one per vr_kind
// ============================================================================

convert_result convert_string(const vr_info&, std::span<const uint8_t> payload,
                              numeric_payload) {
    auto text = trimmed_text(payload);
    if (text.empty()) {
        return core::csa_value{};
    }
    return core::csa_value{std::move(text)};
}

convert_result convert_integer_string(const vr_info&, std::span<const uint8_t> payload,
                                      numeric_payload) {
    return from_optional(parse_integer_string(ascii_text(payload)));
}

convert_result convert_decimal_string(const vr_info&, std::span<const uint8_t> payload,
                                      numeric_payload) {
    return from_optional(parse_decimal_string(ascii_text(payload)));
}

convert_result convert_fixed_signed(const vr_info& info, std::span<const uint8_t> payload,
                                    numeric_payload mode) {
    if (mode == numeric_payload::text) {
        return convert_integer_string(info, payload, mode);
    }
    if (payload.size() != info.width) {
        return width_mismatch(info, payload.size());
    }
    return core::csa_value{sign_extend(read_le(payload), info.width)};
}

convert_result convert_fixed_unsigned(const vr_info& info, std::span<const uint8_t> payload,
                                      numeric_payload mode) {
    if (mode == numeric_payload::text) {
        return convert_integer_string(info, payload, mode);
    }
    if (payload.size() != info.width) {
        return width_mismatch(info, payload.size());
    }
    return core::csa_value{static_cast<int64_t>(read_le(payload))};
}

convert_result convert_fixed_float(const vr_info& info, std::span<const uint8_t> payload,
                                   numeric_payload mode) {
    if (mode == numeric_payload::text) {
        return convert_decimal_string(info, payload, mode);
    }
    if (payload.size() != info.width) {
        return width_mismatch(info, payload.size());
    }
    const auto raw = read_le(payload);
    if (info.width == 4) {
        return core::csa_value{
            static_cast<double>(std::bit_cast<float>(static_cast<uint32_t>(raw)))};
    }
    return core::csa_value{std::bit_cast<double>(raw)};
}

convert_result convert_opaque(const vr_info&, std::span<const uint8_t> payload,
                              numeric_payload) {
    return core::csa_value{std::vector<uint8_t>(payload.begin(), payload.end())};
}

// Indexed by vr_kind
constexpr std::array<converter_fn, 7> converters = {{
    convert_string,
    convert_integer_string,
    convert_decimal_string,
    convert_fixed_signed,
    convert_fixed_unsigned,
    convert_fixed_float,
    convert_opaque,
}};

}  // namespace

auto convert_item(csa_vr vr, std::span<const uint8_t> payload, numeric_payload mode)
    -> Result<core::csa_value> {
    if (payload.empty()) {
        return core::csa_value{};
    }
    const auto& info = get_vr_info(vr);
    return converters[static_cast<std::size_t>(info.kind)](info, payload, mode);
}

auto latin1_to_utf8(std::span<const uint8_t> bytes) -> std::string {
    std::string out;
    out.reserve(bytes.size());
    for (uint8_t byte : bytes) {
        if (byte == 0) {
            break;
        }
        if (byte < 0x80) {
            out.push_back(static_cast<char>(byte));
        } else {
            out.push_back(static_cast<char>(0xC0 | (byte >> 6)));
            out.push_back(static_cast<char>(0x80 | (byte & 0x3F)));
        }
    }
    return out;
}

auto parse_integer_string(std::string_view text) -> std::optional<int64_t> {
    text = trim(text);
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }
    if (text.empty()) {
        return std::nullopt;
    }
    int64_t value = 0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

auto parse_decimal_string(std::string_view text) -> std::optional<double> {
    text = trim(text);
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }
    if (text.empty()) {
        return std::nullopt;
    }
    double value = 0.0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

}  // namespace csa::encoding
