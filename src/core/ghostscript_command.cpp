/**
 * @file    ghostscript_command.cpp
 * @brief   Ghostscript command line construction
 * @license MIT
 */

#include "core/ghostscript_command.hpp"
#include "utils/path_formatter.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace fs = std::filesystem;

namespace pdfshrink {

namespace {

// Ghostscript would read "-name.pdf" as a switch
std::string engine_path(const fs::path& path) {
    std::string s = to_utf8(path);
    if (!s.empty() && s.front() == '-') {
        return "./" + s;
    }
    return s;
}

void append_downsample(
    std::vector<std::string>& args,
    std::string_view image_class,
    const DownsampleSettings& ds) {

    args.push_back(fmt::format("-dDownsample{}Images=true", image_class));
    args.push_back(fmt::format("-d{}ImageDownsampleType={}", image_class, ds.type));
    args.push_back(fmt::format("-d{}ImageResolution={}", image_class, ds.resolution));
    args.push_back(fmt::format("-d{}ImageDownsampleThreshold={}", image_class, ds.threshold));
}

bool is_shell_safe(char c) {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
        return true;
    }
    switch (c) {
        case '_': case '@': case '%': case '+': case '=':
        case ':': case ',': case '.': case '/': case '-':
            return true;
        default:
            return false;
    }
}

}  // anonymous namespace

std::vector<std::string> build_command(
    const ShrinkSettings& settings,
    const fs::path& input,
    const fs::path& output) {

    std::vector<std::string> args{
        settings.engine,
        "-q",
        "-dBATCH",
        "-dSAFER",
        "-dNOPAUSE",
        fmt::format("-sDEVICE={}", settings.device),
        fmt::format("-dCompatibilityLevel={}", settings.compatibility_level),
        fmt::format("-dPDFSETTINGS={}", settings.pdf_settings),
        fmt::format("-dAutoRotatePages={}", settings.auto_rotate_pages),
    };

    append_downsample(args, "Color", settings.color);
    append_downsample(args, "Gray", settings.gray);
    append_downsample(args, "Mono", settings.mono);

    args.push_back(fmt::format("-sOutputFile={}", output_file_value(output)));
    args.push_back(engine_path(input));
    return args;
}

std::string output_file_value(const fs::path& output) {
    std::string s = to_utf8(output);
    if (!s.empty() && (s.front() == '|' || s.front() == '%')) {
        s.insert(0, "./");
    }

    std::string value;
    value.reserve(s.size());
    for (char c : s) {
        if (c == '%') {
            value += '%';
        }
        value += c;
    }
    return value;
}

std::string shell_quote(std::string_view arg) {
    if (arg.empty()) {
        return "''";
    }
    if (std::all_of(arg.begin(), arg.end(), is_shell_safe)) {
        return std::string(arg);
    }

    std::string quoted;
    quoted.reserve(arg.size() + 2);
    quoted += '\'';
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

std::string format_command_line(const std::vector<std::string>& argv) {
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) {
            line += ' ';
        }
        line += shell_quote(arg);
    }
    return line;
}

}  // namespace pdfshrink
