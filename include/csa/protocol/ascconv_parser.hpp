/**
 * @file ascconv_parser.hpp
 * @brief Decoder for MrPhoenixProtocol text (ASCCONV and XProtocol)
 *
 * Both dialects carry the data as `path = value` lines. XProtocol wraps
 * them in `<Tag> { ... }` markup which is skipped line by line.
 *
 * @code
 * ### ASCCONV BEGIN object=MrProtDataImpl@MrProtocolData version=51130001 ###
 * ulVersion                                = 51130001
 * tProtocolName                            = ""ep2d_bold""
 * sSliceArray.asSlice[0].dThickness        = 3
 * sSliceArray.lSize                        = 64
 * ### ASCCONV END ###
 * @endcode
 */

#ifndef CSA_PROTOCOL_ASCCONV_PARSER_HPP
#define CSA_PROTOCOL_ASCCONV_PARSER_HPP

#include "protocol_node.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace csa::protocol {

/**
 * @brief Result of decoding one protocol text
 */
struct protocol_document {
    /// Root block of the decoded tree
    protocol_node root;

    /// `key=value` pairs from the `### ASCCONV BEGIN ... ###` line, in order
    std::vector<std::pair<std::string, std::string>> attributes;

    /// Number of assignment lines applied to the tree
    std::size_t assignments{0};

    /// Number of non-empty lines that were not assignments
    std::size_t skipped_lines{0};
};

/**
 * @brief Stateless decoder for ASCCONV / XProtocol text
 *
 * Decoding never fails: lines that do not match `path = value` are skipped
 * and missing begin/end markers fall back to scanning the whole text.
 */
class ascconv_parser {
public:
    static constexpr std::string_view begin_marker = "### ASCCONV BEGIN";
    static constexpr std::string_view end_marker = "### ASCCONV END";

    /**
     * @brief Decode protocol text into a tree
     * @param text The decoded string value of the protocol tag
     * @return Tree, marker attributes and line statistics
     */
    [[nodiscard]] static protocol_document parse(std::string_view text);

    /**
     * @brief Apply one line to a tree
     * @param root Tree being built
     * @param line One line of protocol text
     * @return true if the line was an assignment
     */
    static bool apply_line(protocol_node& root, std::string_view line);

    /**
     * @brief Locate the assignment-bearing region of @p text
     * @return The text between the begin and end markers, or @p text itself
     */
    [[nodiscard]] static std::string_view assignment_region(std::string_view text);

private:
    [[nodiscard]] static std::vector<std::pair<std::string, std::string>>
    parse_attributes(std::string_view text);
};

}  // namespace csa::protocol

#endif  // CSA_PROTOCOL_ASCCONV_PARSER_HPP
