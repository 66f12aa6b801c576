/**
 * @file byte_cursor.hpp
 * @brief Bounds-checked sequential reader over an immutable byte buffer
 *
 * Every access to a CSA buffer goes through a byte_cursor. A read either
 * returns exactly the requested bytes or fails with
 * error_codes::out_of_bounds before anything is returned.
 */

#ifndef CSA_ENCODING_BYTE_CURSOR_HPP
#define CSA_ENCODING_BYTE_CURSOR_HPP

#include <csa/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

namespace csa::encoding {

/**
 * @brief Sequential little-endian reader over a borrowed byte span
 *
 * Invariant: 0 <= position() <= size().
 *
 * The cursor does not own the buffer; the caller keeps it alive for the
 * duration of the decode. A cursor is meant to live inside one decode call.
 *
 * @example
 * @code
 * byte_cursor cursor{bytes};
 * auto count = cursor.read_u32_le();
 * if (count.is_err()) {
 *     return forward_error<csa_header>(count.error());
 * }
 * @endcode
 */
class byte_cursor {
public:
    /**
     * @brief Result type for cursor operations
     */
    template <typename T>
    using result = csa::Result<T>;

    explicit byte_cursor(std::span<const uint8_t> buffer) noexcept
        : buffer_(buffer) {}

    // ========================================================================
    // Position Queries
    // ========================================================================

    [[nodiscard]] auto position() const noexcept -> std::size_t { return pos_; }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return buffer_.size(); }

    /**
     * @brief Number of bytes left between position() and the end
     */
    [[nodiscard]] auto remaining() const noexcept -> std::size_t {
        return buffer_.size() - pos_;
    }

    [[nodiscard]] auto at_end() const noexcept -> bool { return pos_ == buffer_.size(); }

    // ========================================================================
    // Raw Access
    // ========================================================================

    /**
     * @brief Return the next n bytes and advance past them
     * @param n Number of bytes to read
     * @return View into the buffer, or out_of_bounds if fewer than n remain
     */
    [[nodiscard]] auto read(std::size_t n) -> result<std::span<const uint8_t>>;

    /**
     * @brief Return the next n bytes without advancing
     * @param n Number of bytes to look at
     * @return View into the buffer, or out_of_bounds if fewer than n remain
     */
    [[nodiscard]] auto peek(std::size_t n) const -> result<std::span<const uint8_t>>;

    /**
     * @brief Advance by n bytes without returning them
     */
    [[nodiscard]] auto skip(std::size_t n) -> VoidResult;

    /**
     * @brief Move to an absolute offset in [0, size()]
     */
    [[nodiscard]] auto seek(std::size_t offset) -> VoidResult;

    // ========================================================================
    // Typed Little-Endian Reads
    // ========================================================================

    [[nodiscard]] auto read_u32_le() -> result<uint32_t>;

    [[nodiscard]] auto read_i32_le() -> result<int32_t>;

private:
    [[nodiscard]] auto out_of_bounds(std::size_t n) const -> error_info;

    std::span<const uint8_t> buffer_;
    std::size_t pos_{0};
};

}  // namespace csa::encoding

#endif  // CSA_ENCODING_BYTE_CURSOR_HPP
