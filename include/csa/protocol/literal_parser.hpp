/**
 * @file literal_parser.hpp
 * @brief Right-hand side literals of ASCCONV assignments
 *
 * Grammar accepted (recursive descent, no expression evaluation):
 * @code
 * literal := string | list | number
 * string  := '"' chars '"' | '""' chars '""'
 * list    := '{' [literal {(',' | ws) literal}] '}'
 *          | '[' [literal {(',' | ws) literal}] ']'
 * number  := ['+' | '-'] ( '0x' hexdigits | digits ['.' digits] [exponent]
 *                        | '.' digits [exponent] )
 * @endcode
 * Text that does not match the grammar is kept as a raw string.
 */

#ifndef CSA_PROTOCOL_LITERAL_PARSER_HPP
#define CSA_PROTOCOL_LITERAL_PARSER_HPP

#include "protocol_node.hpp"

#include <optional>
#include <string_view>

namespace csa::protocol {

/**
 * @brief Parser for one assignment value
 */
class literal_parser {
public:
    /**
     * @brief Parse a value, falling back to the trimmed raw text
     * @param text Value text (right of '=')
     * @return Leaf or array node; never fails
     */
    [[nodiscard]] static protocol_node parse(std::string_view text);

    /**
     * @brief Parse a value strictly
     * @param text Value text
     * @return The node, or std::nullopt if the text is not a literal
     */
    [[nodiscard]] static std::optional<protocol_node> try_parse(std::string_view text);

private:
    explicit literal_parser(std::string_view text) noexcept : text_(text) {}

    [[nodiscard]] std::optional<protocol_node> parse_value();
    [[nodiscard]] std::optional<protocol_node> parse_string();
    [[nodiscard]] std::optional<protocol_node> parse_list(char close);
    [[nodiscard]] std::optional<protocol_node> parse_number();

    void skip_blanks() noexcept;
    [[nodiscard]] bool at_end() const noexcept { return pos_ >= text_.size(); }
    [[nodiscard]] char current() const noexcept { return at_end() ? '\0' : text_[pos_]; }

    std::string_view text_;
    std::size_t pos_{0};
};

}  // namespace csa::protocol

#endif  // CSA_PROTOCOL_LITERAL_PARSER_HPP
