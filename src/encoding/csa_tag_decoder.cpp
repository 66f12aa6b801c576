/**
 * @file csa_tag_decoder.cpp
 * @brief Implementation of the CSA tag stream decoder
 */

#include "csa/encoding/csa_tag_decoder.hpp"

#include <csa/encoding/byte_cursor.hpp>
#include <csa/encoding/value_converter.hpp>
#include <csa/integration/logger_adapter.hpp>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace csa::encoding {

namespace {

std::string field_text(std::span<const uint8_t> field) {
    auto text = latin1_to_utf8(field);
    while (!text.empty() && text.back() == ' ') {
        text.pop_back();
    }
    return text;
}

std::string_view layout_name(csa_layout layout) {
    return layout == csa_layout::type2 ? "Type 2" : "Type 1";
}

/**
 * @brief Walks one buffer; owns the cursor and the per-tag error context
 */
class tag_walker {
public:
    tag_walker(std::span<const uint8_t> buffer, csa_layout layout,
               const decode_options& options)
        : cursor_(buffer), layout_(layout), options_(options) {}

    /**
     * @brief Read the layout prefix
     * @return The declared tag count
     */
    auto read_prefix() -> Result<std::size_t>;

    auto read_tag(std::size_t index) -> Result<core::csa_tag>;

    [[nodiscard]] auto discarded_items() const noexcept -> std::size_t { return discarded_; }

private:
    auto read_items(csa_vr vr, uint32_t vm, std::size_t n_items)
        -> Result<std::vector<core::csa_value>>;

    struct item_header {
        int32_t field0;
        int32_t length;
    };

    auto read_item_header() -> Result<item_header>;

    auto read_item_payload() -> Result<std::span<const uint8_t>>;

    [[nodiscard]] auto context() const -> std::string;
    [[nodiscard]] auto fail(int code, const std::string& message) const -> error_info;
    [[nodiscard]] auto truncated(const error_info& cause) const -> error_info;

    byte_cursor cursor_;
    csa_layout layout_;
    const decode_options& options_;
    std::optional<int32_t> type1_length_offset_;
    std::size_t tag_index_{0};
    std::string tag_name_;
    std::size_t discarded_{0};
};

auto tag_walker::context() const -> std::string {
    std::string details = "tag_index=" + std::to_string(tag_index_);
    if (!tag_name_.empty()) {
        details += " tag=" + tag_name_;
    }
    details += " offset=" + std::to_string(cursor_.position());
    return details;
}

auto tag_walker::fail(int code, const std::string& message) const -> error_info {
    return error_info{code, message, "csa", context()};
}

auto tag_walker::truncated(const error_info& cause) const -> error_info {
    return fail(error_codes::truncated_stream,
                "Stream ends inside tag " + std::to_string(tag_index_) + ": " +
                    cause.message);
}

auto tag_walker::read_prefix() -> Result<std::size_t> {
    if (layout_ == csa_layout::type2) {
        // Marker and the four unused bytes after it
        auto marker = cursor_.skip(8);
        if (marker.is_err()) {
            return forward_error<std::size_t>(marker.error());
        }
    }

    auto n_tags = cursor_.read_i32_le();
    if (n_tags.is_err()) {
        return forward_error<std::size_t>(n_tags.error());
    }
    auto unused = cursor_.read_u32_le();
    if (unused.is_err()) {
        return forward_error<std::size_t>(unused.error());
    }

    const auto offset = "offset=" + std::to_string(cursor_.position());
    if (n_tags.value() < 0) {
        return csa_error<std::size_t>(
            error_codes::malformed_header,
            "Negative tag count " + std::to_string(n_tags.value()), offset);
    }

    const auto count = static_cast<std::size_t>(n_tags.value());
    if (count * csa_tag_decoder::tag_record_size > cursor_.remaining()) {
        return csa_error<std::size_t>(
            error_codes::malformed_header,
            "Tag count " + std::to_string(count) + " needs at least " +
                std::to_string(count * csa_tag_decoder::tag_record_size) +
                " bytes but only " + std::to_string(cursor_.remaining()) + " remain",
            offset);
    }
    return count;
}

auto tag_walker::read_tag(std::size_t index) -> Result<core::csa_tag> {
    tag_index_ = index;
    tag_name_.clear();

    auto name = cursor_.read(csa_tag_decoder::tag_name_size);
    if (name.is_err()) {
        return Result<core::csa_tag>(truncated(name.error()));
    }
    tag_name_ = field_text(name.value());

    auto vm = cursor_.read_i32_le();
    if (vm.is_err()) {
        return Result<core::csa_tag>(truncated(vm.error()));
    }
    auto vr_code = cursor_.read(4);
    if (vr_code.is_err()) {
        return Result<core::csa_tag>(truncated(vr_code.error()));
    }
    // syngodt duplicates the VR as a number
    auto syngodt = cursor_.skip(4);
    if (syngodt.is_err()) {
        return Result<core::csa_tag>(truncated(syngodt.error()));
    }
    auto n_items = cursor_.read_i32_le();
    if (n_items.is_err()) {
        return Result<core::csa_tag>(truncated(n_items.error()));
    }
    auto check = cursor_.read_i32_le();
    if (check.is_err()) {
        return Result<core::csa_tag>(truncated(check.error()));
    }

    if (!csa_tag_decoder::is_valid_check(check.value())) {
        return Result<core::csa_tag>(
            fail(error_codes::invalid_check_bit,
                 "Tag " + std::to_string(index) + " has check value " +
                     std::to_string(check.value()) + ", expected 77 or 205"));
    }
    if (vm.value() < 0 || n_items.value() < 0) {
        return Result<core::csa_tag>(
            fail(error_codes::malformed_header,
                 "Tag " + std::to_string(index) + " declares vm " +
                     std::to_string(vm.value()) + " and " +
                     std::to_string(n_items.value()) + " items"));
    }

    // Type 1 item lengths are offset by the item count of tag record 1
    if (index == 1) {
        type1_length_offset_ = n_items.value();
    }

    const auto vr = vr_from_string(field_text(vr_code.value()));
    const auto declared_vm = static_cast<uint32_t>(vm.value());

    auto values = read_items(vr, declared_vm, static_cast<std::size_t>(n_items.value()));
    if (values.is_err()) {
        return forward_error<core::csa_tag>(values.error());
    }

    integration::logger_adapter::trace("CSA tag {} '{}' vr={} vm={} items={}", index,
                                       tag_name_, to_string(vr), declared_vm,
                                       n_items.value());

    return core::csa_tag{tag_name_, vr, declared_vm, std::move(values.value())};
}

auto tag_walker::read_items(csa_vr vr, uint32_t vm, std::size_t n_items)
    -> Result<std::vector<core::csa_value>> {
    const std::size_t kept = vm == 0 ? n_items : std::min<std::size_t>(vm, n_items);

    std::vector<core::csa_value> values;
    // Every item needs at least its header, which bounds an implausible n_items
    values.reserve(std::min(kept, cursor_.remaining() / csa_tag_decoder::item_header_size));

    // Before record 1 a Type 1 item length cannot be computed: only the first
    // item header of tag 0 is consumed and its value is left empty
    if (layout_ == csa_layout::type1 && !type1_length_offset_ && n_items > 0) {
        auto header = read_item_header();
        if (header.is_err()) {
            return forward_error<std::vector<core::csa_value>>(header.error());
        }
        if (vm > 0) {
            values.emplace_back();
        }
        discarded_ += n_items - 1;
        integration::logger_adapter::debug(
            "CSA Type 1 tag 0 '{}': {} items left unread before the length offset is known",
            tag_name_, n_items - 1);
        return values;
    }

    for (std::size_t i = 0; i < n_items; ++i) {
        auto payload = read_item_payload();
        if (payload.is_err()) {
            return forward_error<std::vector<core::csa_value>>(payload.error());
        }
        if (i >= kept) {
            ++discarded_;
            continue;
        }

        auto value = convert_item(vr, payload.value(), options_.numeric_payload);
        if (value.is_err()) {
            return Result<std::vector<core::csa_value>>(
                fail(value.error().code, value.error().message));
        }
        values.push_back(std::move(value.value()));
    }

    // VM 0 tags are followed by empty filler items
    if (vm == 0) {
        while (!values.empty() && core::is_null(values.back())) {
            values.pop_back();
        }
    }
    return values;
}

auto tag_walker::read_item_header() -> Result<item_header> {
    auto field0 = cursor_.read_i32_le();
    if (field0.is_err()) {
        return Result<item_header>(truncated(field0.error()));
    }
    auto length = cursor_.read_i32_le();
    if (length.is_err()) {
        return Result<item_header>(truncated(length.error()));
    }
    auto check = cursor_.read_i32_le();
    if (check.is_err()) {
        return Result<item_header>(truncated(check.error()));
    }
    auto field3 = cursor_.skip(4);
    if (field3.is_err()) {
        return Result<item_header>(truncated(field3.error()));
    }

    if (options_.validate_item_check && !csa_tag_decoder::is_valid_check(check.value())) {
        return Result<item_header>(fail(error_codes::invalid_check_bit,
                                        "Item of tag " + std::to_string(tag_index_) +
                                            " has check value " +
                                            std::to_string(check.value()) +
                                            ", expected 77 or 205"));
    }
    return item_header{field0.value(), length.value()};
}

auto tag_walker::read_item_payload() -> Result<std::span<const uint8_t>> {
    using payload_result = Result<std::span<const uint8_t>>;

    auto header = read_item_header();
    if (header.is_err()) {
        return payload_result(header.error());
    }

    const int64_t item_length =
        layout_ == csa_layout::type2
            ? static_cast<int64_t>(header.value().length)
            : static_cast<int64_t>(header.value().field0) - type1_length_offset_.value_or(0);
    if (item_length < 0) {
        return payload_result(fail(error_codes::malformed_header,
                                   "Negative item length " + std::to_string(item_length) +
                                       " in tag " + std::to_string(tag_index_)));
    }

    const auto size = static_cast<std::size_t>(item_length);
    auto payload = cursor_.read(size);
    if (payload.is_err()) {
        return payload_result(truncated(payload.error()));
    }

    const auto padding = (csa_tag_decoder::item_alignment -
                          size % csa_tag_decoder::item_alignment) %
                         csa_tag_decoder::item_alignment;
    auto aligned = cursor_.skip(padding);
    if (aligned.is_err()) {
        return payload_result(truncated(aligned.error()));
    }
    return payload.value();
}

}  // namespace

auto csa_tag_decoder::detect_layout(std::span<const uint8_t> buffer) noexcept -> csa_layout {
    if (buffer.size() >= type2_marker.size() &&
        std::equal(type2_marker.begin(), type2_marker.end(), buffer.begin())) {
        return csa_layout::type2;
    }
    return csa_layout::type1;
}

auto csa_tag_decoder::decode(std::span<const uint8_t> buffer, const decode_options& options)
    -> Result<core::csa_header> {
    const auto layout = detect_layout(buffer);
    tag_walker walker{buffer, layout, options};

    auto n_tags = walker.read_prefix();
    if (n_tags.is_err()) {
        return forward_error<core::csa_header>(n_tags.error());
    }

    core::csa_header header;
    for (std::size_t i = 0; i < n_tags.value(); ++i) {
        auto tag = walker.read_tag(i);
        if (tag.is_err()) {
            return forward_error<core::csa_header>(tag.error());
        }
        header.insert(std::move(tag.value()));
    }

    integration::logger_adapter::debug(
        "CSA {} stream decoded: {} tags, {} trailing items discarded", layout_name(layout),
        header.size(), walker.discarded_items());
    return header;
}

}  // namespace csa::encoding
