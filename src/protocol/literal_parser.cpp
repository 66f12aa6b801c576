/**
 * @file literal_parser.cpp
 * @brief Implementation of the ASCCONV literal parser
 */

#include "csa/protocol/literal_parser.hpp"

#include <cctype>
#include <charconv>
#include <limits>
#include <string>

namespace csa::protocol {

namespace {

bool is_blank(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool is_hex_digit(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
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

}  // namespace

protocol_node literal_parser::parse(std::string_view text) {
    auto trimmed = trim(text);
    if (auto node = try_parse(trimmed)) {
        return std::move(*node);
    }
    return protocol_node{std::string(trimmed)};
}

std::optional<protocol_node> literal_parser::try_parse(std::string_view text) {
    literal_parser parser{trim(text)};
    auto node = parser.parse_value();
    parser.skip_blanks();
    if (!node || !parser.at_end()) {
        return std::nullopt;
    }
    return node;
}

void literal_parser::skip_blanks() noexcept {
    while (!at_end() && is_blank(text_[pos_])) {
        ++pos_;
    }
}

std::optional<protocol_node> literal_parser::parse_value() {
    skip_blanks();
    switch (current()) {
        case '"':
            return parse_string();
        case '{':
            ++pos_;
            return parse_list('}');
        case '[':
            ++pos_;
            return parse_list(']');
        default:
            return parse_number();
    }
}

std::optional<protocol_node> literal_parser::parse_string() {
    // XProtocol doubles the quotes of embedded ASCCONV strings: ""text""
    if (text_.substr(pos_, 2) == "\"\"") {
        auto close = text_.find("\"\"", pos_ + 2);
        if (close != std::string_view::npos) {
            std::string value(text_.substr(pos_ + 2, close - pos_ - 2));
            pos_ = close + 2;
            return protocol_node{std::move(value)};
        }
    }

    auto close = text_.find('"', pos_ + 1);
    if (close == std::string_view::npos) {
        return std::nullopt;
    }
    std::string value(text_.substr(pos_ + 1, close - pos_ - 1));
    pos_ = close + 1;
    return protocol_node{std::move(value)};
}

std::optional<protocol_node> literal_parser::parse_list(char close) {
    auto list = protocol_node::make_array();
    for (;;) {
        skip_blanks();
        if (current() == ',') {
            ++pos_;
            continue;
        }
        if (current() == close) {
            ++pos_;
            return list;
        }
        if (at_end()) {
            return std::nullopt;
        }
        auto item = parse_value();
        if (!item) {
            return std::nullopt;
        }
        list.push_back(std::move(*item));
    }
}

std::optional<protocol_node> literal_parser::parse_number() {
    const std::size_t start = pos_;
    bool negative = false;
    if (current() == '+' || current() == '-') {
        negative = current() == '-';
        ++pos_;
    }

    // Hexadecimal integer
    if (current() == '0' && pos_ + 1 < text_.size() &&
        (text_[pos_ + 1] == 'x' || text_[pos_ + 1] == 'X')) {
        const std::size_t digits = pos_ + 2;
        std::size_t end = digits;
        while (end < text_.size() && is_hex_digit(text_[end])) {
            ++end;
        }
        if (end == digits) {
            return std::nullopt;
        }
        uint64_t magnitude = 0;
        auto [ptr, ec] = std::from_chars(text_.data() + digits, text_.data() + end,
                                         magnitude, 16);
        if (ec != std::errc{}) {
            return std::nullopt;
        }
        // -0x8000000000000000 is the only magnitude above INT64_MAX that fits
        constexpr auto max_magnitude =
            static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
        if (magnitude > max_magnitude + (negative ? 1 : 0)) {
            return std::nullopt;
        }
        pos_ = end;
        return protocol_node{static_cast<int64_t>(negative ? 0 - magnitude : magnitude)};
    }

    std::size_t int_digits = 0;
    while (is_digit(current())) {
        ++pos_;
        ++int_digits;
    }

    bool is_real = false;
    std::size_t frac_digits = 0;
    if (current() == '.') {
        is_real = true;
        ++pos_;
        while (is_digit(current())) {
            ++pos_;
            ++frac_digits;
        }
    }
    if (int_digits == 0 && frac_digits == 0) {
        pos_ = start;
        return std::nullopt;
    }

    if (current() == 'e' || current() == 'E') {
        std::size_t exp = pos_ + 1;
        if (exp < text_.size() && (text_[exp] == '+' || text_[exp] == '-')) {
            ++exp;
        }
        if (exp < text_.size() && is_digit(text_[exp])) {
            is_real = true;
            pos_ = exp;
            while (is_digit(current())) {
                ++pos_;
            }
        }
    }

    // from_chars rejects a leading '+'
    std::size_t first = start;
    if (text_[first] == '+') {
        ++first;
    }
    const char* begin = text_.data() + first;
    const char* end = text_.data() + pos_;

    if (!is_real) {
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec == std::errc{} && ptr == end) {
            return protocol_node{value};
        }
        // Out of int64 range: keep the magnitude as a real
    }

    double value = 0.0;
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end) {
        pos_ = start;
        return std::nullopt;
    }
    return protocol_node{value};
}

}  // namespace csa::protocol
