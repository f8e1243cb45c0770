/**
 * @file    main.cpp
 * @brief   PDF Shrink Tool - CLI Entry Point
 * @license MIT
 *
 * @details
 * Shrinks PDF files, typically scans, by letting Ghostscript's pdfwrite
 * device recompress and downsample the embedded images.
 *
 * Ghostscript must be installed (`gs` on PATH, or --gs / PDFSHRINK_GS).
 *
 * Usage:
 *   pdfshrink scan.pdf                   (writes scan.shrunk.pdf)
 *   pdfshrink --inplace scan.pdf
 *   pdfshrink --subdir small *.pdf
 */

#include "cli/cli_app.hpp"

int main(int argc, char** argv) {
    return pdfshrink::cli::run(argc, argv);
}
