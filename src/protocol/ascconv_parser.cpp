/**
 * @file ascconv_parser.cpp
 * @brief Implementation of the MrPhoenixProtocol text decoder
 */

#include "csa/protocol/ascconv_parser.hpp"

#include <csa/integration/logger_adapter.hpp>
#include <csa/protocol/literal_parser.hpp>

#include <cctype>

namespace csa::protocol {

namespace {

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

/// Cut an unquoted '#' comment off the end of a line
///
/// Quoting follows literal_parser: "" opens an XProtocol string closed by the
/// next "", or is an empty string when no closing "" follows.
std::string_view strip_comment(std::string_view line) {
    for (std::size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') {
            std::size_t close;
            if (line.substr(i, 2) == "\"\"") {
                close = line.find("\"\"", i + 2);
                close = close == std::string_view::npos ? i + 1 : close + 1;
            } else {
                close = line.find('"', i + 1);
                if (close == std::string_view::npos) {
                    return line;
                }
            }
            i = close;
        } else if (line[i] == '#') {
            return line.substr(0, i);
        }
    }
    return line;
}

/// Calls @p fn for every line of @p text, without the line terminator
template <typename Fn>
void for_each_line(std::string_view text, Fn&& fn) {
    std::size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        auto line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        fn(line);
        start = end + 1;
    }
}

}  // namespace

std::string_view ascconv_parser::assignment_region(std::string_view text) {
    auto begin = text.find(begin_marker);
    if (begin != std::string_view::npos) {
        auto line_end = text.find('\n', begin);
        text = line_end == std::string_view::npos ? std::string_view{}
                                                  : text.substr(line_end + 1);
    }

    auto end = text.find(end_marker);
    if (end != std::string_view::npos) {
        text = text.substr(0, end);
    }
    return text;
}

std::vector<std::pair<std::string, std::string>>
ascconv_parser::parse_attributes(std::string_view text) {
    std::vector<std::pair<std::string, std::string>> attributes;

    auto begin = text.find(begin_marker);
    if (begin == std::string_view::npos) {
        return attributes;
    }
    auto line = text.substr(begin + begin_marker.size());
    line = line.substr(0, line.find('\n'));
    auto closing = line.find("###");
    if (closing != std::string_view::npos) {
        line = line.substr(0, closing);
    }

    std::size_t pos = 0;
    while (pos < line.size()) {
        while (pos < line.size() && is_blank(line[pos])) {
            ++pos;
        }
        auto token_end = pos;
        while (token_end < line.size() && !is_blank(line[token_end])) {
            ++token_end;
        }
        auto token = line.substr(pos, token_end - pos);
        auto eq = token.find('=');
        if (eq != std::string_view::npos && eq > 0) {
            attributes.emplace_back(std::string(token.substr(0, eq)),
                                    std::string(token.substr(eq + 1)));
        }
        pos = token_end;
    }
    return attributes;
}

bool ascconv_parser::apply_line(protocol_node& root, std::string_view line) {
    line = trim(strip_comment(line));
    if (line.empty()) {
        return false;
    }

    auto eq = line.find('=');
    if (eq == std::string_view::npos) {
        return false;
    }

    auto segments = parse_path(line.substr(0, eq));
    if (!segments) {
        return false;
    }

    root.walk(*segments) = literal_parser::parse(line.substr(eq + 1));
    return true;
}

protocol_document ascconv_parser::parse(std::string_view text) {
    protocol_document document;
    document.attributes = parse_attributes(text);

    for_each_line(assignment_region(text), [&document](std::string_view line) {
        if (apply_line(document.root, line)) {
            ++document.assignments;
        } else if (!trim(strip_comment(line)).empty()) {
            ++document.skipped_lines;
        }
    });

    integration::logger_adapter::debug(
        "Protocol text decoded: {} assignments, {} skipped lines",
        document.assignments, document.skipped_lines);
    return document;
}

}  // namespace csa::protocol
