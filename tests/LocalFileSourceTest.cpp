#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>
#include <string>

#include "core/storage/LocalFileSource.hpp"

namespace fs = std::filesystem;

namespace {

class LocalFileSourceTest : public ::testing::Test {
protected:
  void SetUp() override {
    root_ = fs::temp_directory_path() /
            ("mtc-files-" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "-" +
             ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::create_directories(root_);
  }
  void TearDown() override {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  fs::path root_;
};

} // namespace

TEST_F(LocalFileSourceTest, WriteThenReadKeepsBinaryBytes) {
  mtc::LocalFileSource files(root_.string());
  const std::string bytes("\x00\xff\r\n\x1a", 5);

  const std::string written = files.write("nested/dir/blob.bin", bytes);
  EXPECT_TRUE(fs::exists(written));

  const mtc::FilePayload p = files.read("nested/dir/blob.bin");
  EXPECT_EQ(p.bytes, bytes);
  EXPECT_EQ(p.filename, "blob.bin");
}

TEST_F(LocalFileSourceTest, MissingFileThrows) {
  mtc::LocalFileSource files(root_.string());
  EXPECT_THROW(files.read("absent.png"), std::runtime_error);
  EXPECT_THROW(files.read("."), std::runtime_error);
}
