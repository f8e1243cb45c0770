/**
 * @file    ghostscript_command.hpp
 * @brief   Ghostscript command line construction
 * @license MIT
 *
 * @details
 * The shrinking itself is done by Ghostscript's pdfwrite device. We only
 * choose the parameters: an /ebook preset, PDF 1.4 output and bicubic
 * downsampling of every image class to 135 dpi.
 *
 *   gs -q -dBATCH -dSAFER -dNOPAUSE -sDEVICE=pdfwrite ...
 *      -sOutputFile=<output> <input>
 */

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace pdfshrink {

inline constexpr const char* kDefaultEngine = "gs";

/**
 * Downsampling parameters for one image class (color, gray or mono)
 */
struct DownsampleSettings {
    std::string type = "/Bicubic";  // Filter
    int resolution = 135;           // Target resolution (dpi)
    double threshold = 1.5;         // Downsample only above resolution * threshold
};

/**
 * Fixed engine parameter set
 */
struct ShrinkSettings {
    std::string engine = kDefaultEngine;
    std::string device = "pdfwrite";
    std::string compatibility_level = "1.4";
    std::string pdf_settings = "/ebook";
    std::string auto_rotate_pages = "/None";

    DownsampleSettings color;
    DownsampleSettings gray;
    DownsampleSettings mono;
};

/**
 * Assemble the engine argument vector (argv[0] is the engine binary)
 *
 * @param settings  Engine parameters
 * @param input     File read by the engine
 * @param output    File written by the engine
 */
std::vector<std::string> build_command(
    const ShrinkSettings& settings,
    const std::filesystem::path& input,
    const std::filesystem::path& output
);

/**
 * Value for -sOutputFile= that names `output` literally
 *
 * Ghostscript expands the value as a printf template ("%d" is the page
 * number) and treats a leading '|' as a pipe and a leading '%' as an
 * I/O device. Every '%' is doubled, and a relative path starting with
 * '|' or '%' gets a "./" prefix.
 */
std::string output_file_value(const std::filesystem::path& output);

/**
 * Quote one argument for a POSIX shell
 *
 * Arguments made only of [A-Za-z0-9_@%+=:,./-] are returned unchanged,
 * anything else is single-quoted with embedded quotes written as '\''.
 */
std::string shell_quote(std::string_view arg);

/**
 * Human readable command line (display only, never passed to a shell)
 */
std::string format_command_line(const std::vector<std::string>& argv);

}  // namespace pdfshrink
