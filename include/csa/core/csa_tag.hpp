/**
 * @file csa_tag.hpp
 * @brief One named entry of a decoded CSA header
 *
 * A csa_tag holds the declared VR and VM of a CSA tag record together with
 * the values decoded from its items. The MrPhoenixProtocol tag carries a
 * decoded protocol tree in place of its text value.
 */

#pragma once

#include "csa_value.hpp"

#include <csa/encoding/csa_vr.hpp>
#include <csa/protocol/ascconv_parser.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace csa::core {

/**
 * @brief Decoded CSA tag (name, VR, VM, values)
 *
 * @example
 * @code
 * if (const auto* tag = header.find("EchoTime")) {
 *     auto te = tag->as_real();
 * }
 * @endcode
 */
class csa_tag {
public:
    csa_tag(std::string name, encoding::csa_vr vr, uint32_t vm,
            std::vector<csa_value> values = {});

    // ========================================================================
    // Record Fields
    // ========================================================================

    [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }

    [[nodiscard]] auto vr() const noexcept -> encoding::csa_vr { return vr_; }

    /**
     * @brief Declared value multiplicity
     *
     * values().size() may be smaller: a tag declared with VM 0 whose items
     * are all empty has no values.
     */
    [[nodiscard]] auto vm() const noexcept -> uint32_t { return vm_; }

    [[nodiscard]] auto values() const noexcept -> const std::vector<csa_value>& {
        return values_;
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return values_.size(); }

    [[nodiscard]] auto empty() const noexcept -> bool { return values_.empty(); }

    // ========================================================================
    // Value Access
    // ========================================================================

    /**
     * @brief Value at @p index
     * @return Pointer to the value, or nullptr if out of range
     */
    [[nodiscard]] auto value(std::size_t index = 0) const noexcept -> const csa_value*;

    [[nodiscard]] auto as_integer(std::size_t index = 0) const -> std::optional<int64_t>;

    /**
     * @brief Value at @p index as a floating-point number
     *
     * Integer values are promoted.
     */
    [[nodiscard]] auto as_real(std::size_t index = 0) const -> std::optional<double>;

    [[nodiscard]] auto as_string(std::size_t index = 0) const -> std::optional<std::string>;

    // ========================================================================
    // Protocol Tree
    // ========================================================================

    [[nodiscard]] auto has_protocol() const noexcept -> bool { return protocol_.has_value(); }

    /**
     * @brief Decoded protocol of a MrPhoenixProtocol tag
     * @return Pointer to the document, or nullptr if none was attached
     */
    [[nodiscard]] auto protocol() const noexcept -> const protocol::protocol_document*;

    /**
     * @brief Attach a decoded protocol, replacing the text value
     */
    void set_protocol(protocol::protocol_document document);

    bool operator==(const csa_tag& other) const;

private:
    std::string name_;
    encoding::csa_vr vr_;
    uint32_t vm_;
    std::vector<csa_value> values_;
    std::optional<protocol::protocol_document> protocol_;
};

}  // namespace csa::core
