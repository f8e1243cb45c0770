/**
 * @file    placement.cpp
 * @brief   Output placement policies and path resolution
 * @license MIT
 */

#include "core/placement.hpp"
#include "utils/path_formatter.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <system_error>

namespace fs = std::filesystem;

namespace pdfshrink {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

Resolution collision(const fs::path& input, const fs::path& output) {
    return Resolution{
        .code = ResultCode::NamingCollision,
        .output = output,
        .message = fmt::format("output {} would overwrite the input {}", output, input)
    };
}

}  // anonymous namespace

const char* mode_name(const PlacementMode& mode) noexcept {
    return std::visit(Overloaded{
        [](const InPlace&) { return "inplace"; },
        [](const Rename&)  { return "rename"; },
        [](const Subdir&)  { return "subdir"; },
    }, mode);
}

PlacementMode placement_from_flags(
    bool inplace,
    bool rename,
    const std::optional<std::string>& subdir,
    const std::optional<std::string>& suffix) {

    const int selected = int(inplace) + int(rename) + int(subdir.has_value());
    if (selected > 1) {
        throw ConfigError(ResultCode::MutuallyExclusiveOptions,
                          "The options --inplace, --rename and --subdir are mutually exclusive");
    }

    if (suffix && (inplace || subdir)) {
        throw ConfigError(ResultCode::MutuallyExclusiveOptions,
                          "--suffix only applies to --rename");
    }

    if (inplace) {
        return InPlace{};
    }
    if (subdir) {
        if (subdir->empty()) {
            throw ConfigError(ResultCode::InvalidDirectory,
                              "--subdir requires a directory name");
        }
        return Subdir{fs::path(*subdir)};
    }

    Rename mode;
    if (suffix) {
        if (suffix->find('/') != std::string::npos ||
            suffix->find(fs::path::preferred_separator) != std::string::npos) {
            throw ConfigError(ResultCode::InvalidSuffix,
                              fmt::format("Suffix '{}' must not contain a path separator", *suffix));
        }
        mode.suffix = *suffix;
    }
    return mode;
}

fs::path with_suffix(const fs::path& input, const std::string& suffix) {
    if (suffix.empty()) {
        return input;
    }
    fs::path name = input.stem();
    name += ".";
    name += suffix;
    name += input.extension();
    return input.parent_path() / name;
}

fs::path into_subdir(const fs::path& input, const fs::path& subdir) {
    return subdir / input.filename();
}

fs::path inplace_temp_pattern(const fs::path& input) {
    fs::path name(".");
    name += input.filename();
    name += ".XXXXXX.tmp";
    return input.parent_path() / name;
}

bool same_location(const fs::path& a, const fs::path& b) {
    std::error_code ec_a;
    std::error_code ec_b;
    const fs::path abs_a = fs::absolute(a, ec_a);
    const fs::path abs_b = fs::absolute(b, ec_b);
    if (ec_a || ec_b) {
        return a.lexically_normal() == b.lexically_normal();
    }
    return abs_a.lexically_normal() == abs_b.lexically_normal();
}

Resolution resolve_output(const fs::path& input, const PlacementMode& mode) {
    if (input.filename().empty() || input.filename() == "." || input.filename() == "..") {
        return Resolution{
            .code = ResultCode::NotARegularFile,
            .output = {},
            .message = fmt::format("{} does not name a file", input)
        };
    }

    Resolution result = std::visit(Overloaded{
        [&](const InPlace&) {
            return Resolution{.output = input};
        },
        [&](const Rename& r) {
            fs::path out = with_suffix(input, r.suffix);
            if (same_location(out, input)) {
                return collision(input, out);
            }
            return Resolution{.output = out};
        },
        [&](const Subdir& s) {
            fs::path out = into_subdir(input, s.dir);
            if (same_location(out, input)) {
                return collision(input, out);
            }
            return Resolution{.output = out};
        },
    }, mode);

    spdlog::trace("resolve_output({}, {}) = {} [{}]",
                  input, mode_name(mode), result.output, to_string(result.code));
    return result;
}

}  // namespace pdfshrink
