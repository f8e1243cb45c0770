#include "utils/temp_file.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <utility>

namespace fs = std::filesystem;

namespace pdfshrink {
namespace {

using test::read_file;
using test::ScratchDir;
using test::write_file;

TEST(TempFile, CreatesUniqueFileFromPattern) {
    ScratchDir dir;
    std::error_code ec;

    auto a = TempFile::create(dir / ".doc.pdf.XXXXXX.tmp", 4, ec);
    ASSERT_TRUE(a) << ec.message();
    auto b = TempFile::create(dir / ".doc.pdf.XXXXXX.tmp", 4, ec);
    ASSERT_TRUE(b) << ec.message();

    EXPECT_NE(a->path(), b->path());
    EXPECT_TRUE(fs::exists(a->path()));
    EXPECT_EQ(a->path().parent_path(), dir.path());

    const std::string name = a->path().filename().string();
    EXPECT_EQ(name.rfind(".doc.pdf.", 0), 0u);
    EXPECT_EQ(name.substr(name.size() - 4), ".tmp");
}

TEST(TempFile, RemovedWhenNotCommitted) {
    ScratchDir dir;
    std::error_code ec;
    fs::path path;
    {
        auto temp = TempFile::create(dir / "t.XXXXXX.tmp", 4, ec);
        ASSERT_TRUE(temp);
        path = temp->path();
        EXPECT_TRUE(fs::exists(path));
    }
    EXPECT_FALSE(fs::exists(path));
}

TEST(TempFile, CommitReplacesTarget) {
    ScratchDir dir;
    const fs::path target = dir / "doc.pdf";
    write_file(target, "original");

    std::error_code ec;
    auto temp = TempFile::create(dir / ".doc.pdf.XXXXXX.tmp", 4, ec);
    ASSERT_TRUE(temp);
    write_file(temp->path(), "replacement");
    const fs::path temp_path = temp->path();

    ASSERT_TRUE(temp->commit(target, ec)) << ec.message();
    EXPECT_EQ(read_file(target), "replacement");
    EXPECT_FALSE(fs::exists(temp_path));

    temp.reset();
    EXPECT_TRUE(fs::exists(target));
}

TEST(TempFile, CommitKeepsTargetPermissions) {
    ScratchDir dir;
    const fs::path target = dir / "doc.pdf";
    write_file(target, "original");
    fs::permissions(target, fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read);

    std::error_code ec;
    auto temp = TempFile::create(dir / ".doc.pdf.XXXXXX.tmp", 4, ec);
    ASSERT_TRUE(temp);
    ASSERT_TRUE(temp->commit(target, ec));

    EXPECT_EQ(fs::status(target).permissions() & fs::perms::all,
              fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read);
}

TEST(TempFile, MoveTransfersOwnership) {
    ScratchDir dir;
    std::error_code ec;
    auto temp = TempFile::create(dir / "t.XXXXXX.tmp", 4, ec);
    ASSERT_TRUE(temp);
    const fs::path path = temp->path();

    TempFile moved = std::move(*temp);
    temp.reset();
    EXPECT_TRUE(fs::exists(path));

    moved.discard();
    EXPECT_FALSE(fs::exists(path));
}

TEST(TempFile, MissingDirectoryFails) {
    ScratchDir dir;
    std::error_code ec;
    auto temp = TempFile::create(dir / "missing" / "t.XXXXXX.tmp", 4, ec);
    EXPECT_FALSE(temp);
    EXPECT_TRUE(ec);
}

}  // namespace
}  // namespace pdfshrink
