// ============================================================
// file_io_test.cpp -- Output path containment and atomic writes
// ============================================================

#include "../common/file_io.hpp"
#include "../common/errors.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

class FileIoTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = file_io::prepare_output_root((dir_.path() / "out").string());
    }

    test_util::TempDir dir_{"file_io"};
    fs::path           root_;
};

TEST_F(FileIoTest, PrepareCreatesAbsoluteRoot) {
    EXPECT_TRUE(root_.is_absolute());
    EXPECT_TRUE(fs::is_directory(root_));
}

TEST_F(FileIoTest, PlainNameResolvesInsideRoot) {
    EXPECT_EQ(file_io::resolve_output_path(root_, "a.txt"), root_ / "a.txt");
}

TEST_F(FileIoTest, NestedContainedNameIsAccepted) {
    EXPECT_EQ(file_io::resolve_output_path(root_, "sub/dir/a.txt"), root_ / "sub" / "dir" / "a.txt");
    EXPECT_EQ(file_io::resolve_output_path(root_, "sub/../a.txt"), root_ / "a.txt");
    EXPECT_EQ(file_io::resolve_output_path(root_, "./a.txt"), root_ / "a.txt");
}

TEST_F(FileIoTest, ParentSegmentsAreRejected) {
    EXPECT_THROW(file_io::resolve_output_path(root_, "../evil.txt"), UnsafePathError);
    EXPECT_THROW(file_io::resolve_output_path(root_, "a/../../evil.txt"), UnsafePathError);
    EXPECT_THROW(file_io::resolve_output_path(root_, "../out_sibling/x"), UnsafePathError);
}

TEST_F(FileIoTest, AbsolutePathsAreRejected) {
    EXPECT_THROW(file_io::resolve_output_path(root_, "/etc/passwd"), UnsafePathError);
    EXPECT_THROW(file_io::resolve_output_path(root_, (root_ / "a.txt").string()), UnsafePathError);
}

TEST_F(FileIoTest, NamesThatAreNotFilesAreRejected) {
    EXPECT_THROW(file_io::resolve_output_path(root_, ""), UnsafePathError);
    EXPECT_THROW(file_io::resolve_output_path(root_, "."), UnsafePathError);
    EXPECT_THROW(file_io::resolve_output_path(root_, "sub/.."), UnsafePathError);
    EXPECT_THROW(file_io::resolve_output_path(root_, "sub/"), UnsafePathError);
    EXPECT_THROW(file_io::resolve_output_path(root_, std::string("a\0b", 3)), UnsafePathError);
}

TEST_F(FileIoTest, EnsureParentDirsCreatesTree) {
    auto target = file_io::resolve_output_path(root_, "x/y/z.bin");
    file_io::ensure_parent_dirs(root_, target);
    EXPECT_TRUE(fs::is_directory(root_ / "x" / "y"));
}

TEST_F(FileIoTest, SymlinkedParentOutsideRootIsRejected) {
    fs::path outside = dir_.path() / "elsewhere";
    fs::create_directories(outside);
    std::error_code ec;
    fs::create_directory_symlink(outside, root_ / "link", ec);
    if (ec) GTEST_SKIP() << "symlinks unavailable: " << ec.message();

    auto target = file_io::resolve_output_path(root_, "link/f.txt");
    EXPECT_THROW(file_io::ensure_parent_dirs(root_, target), UnsafePathError);
}

TEST_F(FileIoTest, AtomicWriteReplacesAndLeavesNoTemp) {
    auto target = root_ / "f.bin";
    file_io::write_file_atomic(target, test_util::to_bytes("first"));
    file_io::write_file_atomic(target, test_util::to_bytes("second"));
    EXPECT_EQ(test_util::read_file(target), test_util::to_bytes("second"));

    size_t entries = 0;
    for (auto& e : fs::directory_iterator(root_)) {
        (void)e;
        ++entries;
    }
    EXPECT_EQ(entries, 1u);
}

TEST_F(FileIoTest, AtomicWriteEmptyFile) {
    auto target = root_ / "empty.bin";
    file_io::write_file_atomic(target, {});
    EXPECT_TRUE(fs::exists(target));
    EXPECT_EQ(fs::file_size(target), 0u);
}

TEST_F(FileIoTest, AtomicWriteIntoMissingDirectoryThrows) {
    EXPECT_THROW(file_io::write_file_atomic(root_ / "missing" / "f.bin", test_util::to_bytes("x")),
                 std::runtime_error);
}

TEST(FileIoNameTest, WireNameIsBaseName) {
    EXPECT_EQ(file_io::wire_name("files2transfer/sub/report.pdf"), "report.pdf");
    EXPECT_EQ(file_io::wire_name("report.pdf"), "report.pdf");
    EXPECT_EQ(file_io::wire_name("dir/"), "");
}
