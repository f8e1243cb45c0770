/**
 * @file    path_formatter.hpp
 * @brief   Custom fmt formatter for std::filesystem::path with UTF-8 support
 * @license MIT
 *
 * @details
 * Lets spdlog/fmt print filesystem paths directly:
 *
 *   spdlog::info("Compressing {} -> {}", input, output);
 *
 * Paths are rendered as UTF-8 through u8string(), which returns
 * std::u8string (char8_t) in C++20 and needs a reinterpret_cast.
 */

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <fmt/format.h>

namespace pdfshrink {

/**
 * Convert filesystem path to UTF-8 encoded std::string
 *
 * @param path  The filesystem path to convert
 * @return      UTF-8 encoded string
 */
inline std::string to_utf8(const std::filesystem::path& path) {
    auto u8str = path.u8string();
    return std::string(
        reinterpret_cast<const char*>(u8str.data()),
        u8str.size()
    );
}

}  // namespace pdfshrink

// =============================================================================
// fmt formatter specialization for std::filesystem::path
// =============================================================================

template <>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string_view> {
    auto format(const std::filesystem::path& p, format_context& ctx) const {
        auto u8 = p.u8string();
        std::string_view sv{
            reinterpret_cast<const char*>(u8.data()),
            u8.size()
        };
        return fmt::formatter<std::string_view>::format(sv, ctx);
    }
};
