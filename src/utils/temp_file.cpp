/**
 * @file    temp_file.cpp
 * @brief   Temporary file that either replaces its target or disappears
 * @license MIT
 */

#include "utils/temp_file.hpp"
#include "utils/path_formatter.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace pdfshrink {

std::optional<TempFile> TempFile::create(const fs::path& pattern, int suffix_len, std::error_code& ec) {
    ec.clear();

    std::string tmpl = pattern.string();
    std::vector<char> buffer(tmpl.begin(), tmpl.end());
    buffer.push_back('\0');

    int fd = mkstemps(buffer.data(), suffix_len);
    if (fd == -1) {
        ec = std::error_code(errno, std::generic_category());
        return std::nullopt;
    }

    // mkstemps creates the file 0600; the engine output should look like a
    // regular file created under the user's umask.
    mode_t mask = umask(0);
    umask(mask);
    if (fchmod(fd, 0666 & ~mask) == -1) {
        spdlog::debug("fchmod on {} failed: {}", buffer.data(), std::strerror(errno));
    }
    close(fd);

    fs::path created{std::string(buffer.data())};
    spdlog::trace("Created temporary {}", created);
    return TempFile(std::move(created));
}

TempFile::TempFile(TempFile&& other) noexcept
    : path_(std::move(other.path_)), active_(other.active_) {
    other.active_ = false;
}

TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        discard();
        path_ = std::move(other.path_);
        active_ = other.active_;
        other.active_ = false;
    }
    return *this;
}

TempFile::~TempFile() {
    discard();
}

bool TempFile::commit(const fs::path& target, std::error_code& ec) {
    ec.clear();
    if (!active_) {
        ec = std::make_error_code(std::errc::no_such_file_or_directory);
        return false;
    }

    // Keep the permissions of the file being replaced
    std::error_code perm_ec;
    auto perms = fs::status(target, perm_ec).permissions();
    if (!perm_ec && perms != fs::perms::unknown) {
        fs::permissions(path_, perms, perm_ec);
    }

    fs::rename(path_, target, ec);
    if (ec) {
        return false;
    }
    active_ = false;
    return true;
}

void TempFile::discard() noexcept {
    if (!active_) {
        return;
    }
    active_ = false;
    std::error_code ec;
    if (fs::remove(path_, ec)) {
        spdlog::trace("Removed temporary {}", path_);
    } else if (ec) {
        spdlog::warn("Cannot remove temporary {}: {}", path_, ec.message());
    }
}

}  // namespace pdfshrink
