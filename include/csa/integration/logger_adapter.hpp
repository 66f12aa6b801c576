/**
 * @file logger_adapter.hpp
 * @brief Decoder diagnostics routed to logger_system
 *
 * Nothing is logged until initialize() is called, so the decoder can be
 * used without any logging setup.
 */

#pragma once

#include <csa/compat/format.hpp>
#include <csa/core/result.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace csa::integration {

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

/**
 * @brief Writer setup applied by logger_adapter::initialize()
 */
struct logger_config {
    /// Directory holding csa.log when file output is enabled
    std::filesystem::path log_directory{"logs"};

    log_level min_level{log_level::info};

    bool enable_console{true};
    bool enable_file{false};

    /// csa.log rotates at this size
    std::size_t max_file_size_mb{10};
    std::size_t max_files{5};

    bool async_mode{false};
    std::size_t buffer_size{8192};
};

/**
 * @class logger_adapter
 * @brief Process-wide logging facade used by the decoder
 *
 * The decoder logs per-tag trace lines, per-stream debug summaries and one
 * warn line per fatal decode error. Level checks happen before formatting.
 *
 * @example
 * @code
 * logger_config config;
 * config.min_level = log_level::debug;
 * logger_adapter::initialize(config);
 * auto header = csa_header_reader::read(bytes);
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    /// No effect while already initialized
    static void initialize(const logger_config& config);

    /// Flushes and drops the writers; logging becomes a no-op again
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    template <typename... Args>
    static void trace(compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::trace)) {
            log(log_level::trace, compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void debug(compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::debug)) {
            log(log_level::debug, compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void info(compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::info)) {
            log(log_level::info, compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void warn(compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::warn)) {
            log(log_level::warn, compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void error(compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::error)) {
            log(log_level::error, compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    static void log(log_level level, const std::string& message);

    /// False before initialize()
    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    /**
     * @brief Report an error that aborted a decode
     *
     * Writes "<source> decode failed: [code] message (details)" at warn level.
     *
     * @param source What was being decoded (e.g. "CSA header")
     * @param error The error returned to the caller
     */
    static void log_decode_failure(std::string_view source, const error_info& error);

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> const logger_config&;

private:
    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace csa::integration
