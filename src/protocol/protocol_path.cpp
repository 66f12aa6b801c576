/**
 * @file protocol_path.cpp
 * @brief Implementation of ASCCONV path parsing
 */

#include "csa/protocol/protocol_path.hpp"

#include <cctype>
#include <charconv>

namespace csa::protocol {

namespace {

bool is_identifier_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_identifier_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

std::optional<path_segment> parse_segment(std::string_view text) {
    if (text.empty() || !is_identifier_start(text.front())) {
        return std::nullopt;
    }

    std::size_t pos = 1;
    while (pos < text.size() && is_identifier_char(text[pos])) {
        ++pos;
    }

    path_segment segment;
    segment.key = std::string(text.substr(0, pos));

    while (pos < text.size()) {
        if (text[pos] != '[') {
            return std::nullopt;
        }
        auto close = text.find(']', pos + 1);
        if (close == std::string_view::npos) {
            return std::nullopt;
        }
        auto digits = trim(text.substr(pos + 1, close - pos - 1));
        std::size_t index = 0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
        if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size() ||
            index > max_path_index) {
            return std::nullopt;
        }
        segment.indices.push_back(index);
        pos = close + 1;
    }

    return segment;
}

}  // namespace

std::optional<std::vector<path_segment>> parse_path(std::string_view path) {
    path = trim(path);
    if (path.empty()) {
        return std::nullopt;
    }

    std::vector<path_segment> segments;
    std::size_t start = 0;
    while (start <= path.size()) {
        auto dot = path.find('.', start);
        auto piece = path.substr(start, dot == std::string_view::npos
                                            ? std::string_view::npos
                                            : dot - start);
        auto segment = parse_segment(piece);
        if (!segment) {
            return std::nullopt;
        }
        segments.push_back(std::move(*segment));
        if (dot == std::string_view::npos) {
            break;
        }
        start = dot + 1;
    }

    return segments;
}

}  // namespace csa::protocol
