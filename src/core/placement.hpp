/**
 * @file    placement.hpp
 * @brief   Output placement policies and path resolution
 * @license MIT
 *
 * @details
 * Decides where the shrunk version of an input file is written.
 *
 *   InPlace          scan.pdf -> scan.pdf (via temporary + atomic replace)
 *   Rename{shrunk}   scan.pdf -> scan.shrunk.pdf
 *   Subdir{out}      dir/scan.pdf -> out/scan.pdf
 *
 * Resolution is purely lexical: nothing here touches the filesystem.
 */

#pragma once

#include "core/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace pdfshrink {

inline constexpr const char* kDefaultSuffix = "shrunk";

struct InPlace {};

struct Rename {
    std::string suffix = kDefaultSuffix;
};

struct Subdir {
    std::filesystem::path dir;
};

/**
 * Placement policy, exactly one active per invocation
 */
using PlacementMode = std::variant<InPlace, Rename, Subdir>;

[[nodiscard]] const char* mode_name(const PlacementMode& mode) noexcept;

/**
 * Build the placement mode from the raw command line flags
 *
 * No flag selects Rename with the default suffix.
 *
 * @param inplace  --inplace given
 * @param rename   --rename given
 * @param subdir   --subdir value, if given
 * @param suffix   --suffix value, if given (rename only)
 * @throws ConfigError  MutuallyExclusiveOptions or InvalidSuffix
 */
PlacementMode placement_from_flags(
    bool inplace,
    bool rename,
    const std::optional<std::string>& subdir,
    const std::optional<std::string>& suffix = std::nullopt
);

/**
 * Result of resolving an output path
 */
struct Resolution {
    ResultCode code = ResultCode::Success;
    std::filesystem::path output;   // Final location of the shrunk file
    std::string message;            // Error detail (empty on success)

    bool ok() const noexcept { return code == ResultCode::Success; }
};

/**
 * Compute the output path of `input` under `mode`
 *
 * Fails with NamingCollision when a non in-place mode would write over the
 * input itself.
 */
Resolution resolve_output(const std::filesystem::path& input, const PlacementMode& mode);

/**
 * Rename helper: `dir/name.ext` -> `dir/name.<suffix>.ext`
 */
std::filesystem::path with_suffix(const std::filesystem::path& input, const std::string& suffix);

/**
 * Subdir helper: `any/dir/name.ext` -> `subdir/name.ext`
 */
std::filesystem::path into_subdir(const std::filesystem::path& input, const std::filesystem::path& subdir);

/**
 * Name pattern of the temporary written during an in-place run
 *
 * `dir/scan.pdf` -> `dir/.scan.pdf.XXXXXX.tmp` (the X's are replaced by mkstemps)
 */
std::filesystem::path inplace_temp_pattern(const std::filesystem::path& input);

/**
 * Lexical path identity, independent of "./" and ".." spelling
 */
bool same_location(const std::filesystem::path& a, const std::filesystem::path& b);

}  // namespace pdfshrink
