/**
 * @file    temp_file.hpp
 * @brief   Temporary file that either replaces its target or disappears
 * @license MIT
 */

#pragma once

#include <filesystem>
#include <optional>
#include <system_error>
#include <utility>

namespace pdfshrink {

/**
 * Uniquely named temporary file, removed on destruction unless committed
 *
 * Created in the target's directory so that commit() is a rename(2)
 * within one filesystem, i.e. atomic.
 */
class TempFile {
public:
    /**
     * Create an empty file from a mkstemps pattern
     *
     * The pattern must contain "XXXXXX" followed by `suffix_len` characters,
     * e.g. ".scan.pdf.XXXXXX.tmp" with suffix_len 4.
     */
    static std::optional<TempFile> create(
        const std::filesystem::path& pattern,
        int suffix_len,
        std::error_code& ec
    );

    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    ~TempFile();

    const std::filesystem::path& path() const noexcept { return path_; }

    /**
     * Atomically replace `target` with this file
     *
     * After a successful commit the temporary no longer exists and the
     * destructor does nothing.
     */
    bool commit(const std::filesystem::path& target, std::error_code& ec);

    // Remove the file now
    void discard() noexcept;

private:
    explicit TempFile(std::filesystem::path path) : path_(std::move(path)) {}

    std::filesystem::path path_;
    bool active_ = true;
};

}  // namespace pdfshrink
