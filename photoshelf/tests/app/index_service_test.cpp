//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "app/index_service.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>
#include <string>

#include "app/album_test_fixation.hpp"
#include "config/scan_config.hpp"

namespace photoshelf {
class IndexServiceTest : public AlbumTestFixture {
 protected:
  std::ostringstream out_;
  std::ostringstream err_;

  auto               MakeOptions() -> IndexOptions {
    IndexOptions options;
    options.root_ = root_;
    return options;
  }

  auto ReadText(const std::filesystem::path& path) -> std::string {
    const auto bytes = test_util::ReadAll(path);
    return std::string(bytes.begin(), bytes.end());
  }
};

TEST_F(IndexServiceTest, WritesListingAndScriptFallback) {
  const auto album = root_ / "trip";
  test_util::WriteText(album / "photo.jpg", "x");
  test_util::WriteText(album / "photo.PNG", "x");
  test_util::WriteText(album / "notes.txt", "x");

  IndexService      service(ScanConfig::Default(), MakeOptions(), out_, err_);
  const IndexReport report = service.Run();

  EXPECT_EQ(report.albums_found_, 1u);
  EXPECT_EQ(report.albums_indexed_, 1u);
  EXPECT_EQ(report.files_listed_, 2u);
  EXPECT_EQ(report.errors_, 0u);
  EXPECT_EQ(ReadText(album / "index.json"), "[\n  \"photo.jpg\",\n  \"photo.PNG\"\n]\n");
  EXPECT_EQ(ReadText(album / "index.js"),
            "window.ALBUM_FILES = [\"photo.jpg\",\"photo.PNG\"];\n");

  const std::string out = out_.str();
  EXPECT_NE(out.find("(2 entries)"), std::string::npos);
  EXPECT_NE(out.find("(JS fallback)"), std::string::npos);
  EXPECT_NE(out.find("Indexed albums: 1, total images listed: 2"), std::string::npos);
  EXPECT_TRUE(err_.str().empty());
}

TEST_F(IndexServiceTest, ExistingListingIsExcludedAndRewritten) {
  const auto album = root_ / "trip";
  test_util::WriteText(album / "img2.jpg", "x");
  test_util::WriteText(album / "img10.jpg", "x");
  test_util::WriteText(album / "index.json", "stale");

  IndexService service(ScanConfig::Default(), MakeOptions(), out_, err_);
  service.Run();
  EXPECT_EQ(ReadText(album / "index.json"), "[\n  \"img2.jpg\",\n  \"img10.jpg\"\n]\n");
}

TEST_F(IndexServiceTest, NoOverwriteLeavesListingUntouched) {
  const auto album = root_ / "trip";
  test_util::WriteText(album / "a.jpg", "x");
  test_util::WriteText(album / "index.json", "[\"hand-edited.jpg\"]");
  const auto other = root_ / "walk";
  test_util::WriteText(other / "b.jpg", "x");

  IndexOptions options  = MakeOptions();
  options.no_overwrite_ = true;
  IndexService      service(ScanConfig::Default(), options, out_, err_);
  const IndexReport report = service.Run();

  EXPECT_EQ(ReadText(album / "index.json"), "[\"hand-edited.jpg\"]");
  EXPECT_FALSE(std::filesystem::exists(album / "index.js"));
  EXPECT_TRUE(std::filesystem::exists(other / "index.json"));
  EXPECT_EQ(report.skipped_, 1u);
  EXPECT_EQ(report.albums_indexed_, 1u);
  EXPECT_NE(out_.str().find("Skip (exists): "), std::string::npos);
  EXPECT_NE(out_.str().find("skipped: 1"), std::string::npos);
}

TEST_F(IndexServiceTest, DryRunWritesNothing) {
  test_util::WriteText(root_ / "trip" / "a.jpg", "x");
  test_util::WriteText(root_ / "trip" / "b.jpg", "x");
  test_util::WriteText(root_ / "walk" / "c.png", "x");
  const auto before = test_util::SnapshotTree(root_);

  IndexOptions options = MakeOptions();
  options.dry_run_     = true;
  IndexService      service(ScanConfig::Default(), options, out_, err_);
  const IndexReport report = service.Run();

  EXPECT_EQ(test_util::SnapshotTree(root_), before);
  EXPECT_EQ(report.albums_indexed_, 2u);
  EXPECT_EQ(report.files_listed_, 3u);
  const std::string out = out_.str();
  EXPECT_NE(out.find("[DRY] "), std::string::npos);
  EXPECT_NE(out.find(": 2 files"), std::string::npos);
  EXPECT_NE(out.find("Dry run only. No files were written."), std::string::npos);
}

TEST_F(IndexServiceTest, EmptyAlbumsGetNoListing) {
  test_util::WriteText(root_ / "docs" / "readme.txt", "x");
  std::filesystem::create_directories(root_ / "empty");

  IndexService      service(ScanConfig::Default(), MakeOptions(), out_, err_);
  const IndexReport report = service.Run();

  EXPECT_EQ(report.albums_found_, 2u);
  EXPECT_EQ(report.albums_indexed_, 0u);
  EXPECT_FALSE(std::filesystem::exists(root_ / "docs" / "index.json"));
  EXPECT_FALSE(std::filesystem::exists(root_ / "empty" / "index.json"));
}

TEST_F(IndexServiceTest, NestedAlbumsNeedRecursiveMode) {
  test_util::WriteText(root_ / "2024" / "summer" / "a.jpg", "x");

  IndexService flat(ScanConfig::Default(), MakeOptions(), out_, err_);
  flat.Run();
  EXPECT_FALSE(std::filesystem::exists(root_ / "2024" / "summer" / "index.json"));

  IndexOptions options = MakeOptions();
  options.recursive_   = true;
  IndexService      deep(ScanConfig::Default(), options, out_, err_);
  const IndexReport report = deep.Run();
  EXPECT_EQ(report.albums_found_, 2u);
  EXPECT_EQ(report.albums_indexed_, 1u);
  EXPECT_EQ(ReadText(root_ / "2024" / "summer" / "index.json"), "[\n  \"a.jpg\"\n]\n");
  EXPECT_FALSE(std::filesystem::exists(root_ / "2024" / "index.json"));
}

TEST_F(IndexServiceTest, RootWithoutAlbums) {
  test_util::WriteText(root_ / "loose.jpg", "x");

  IndexService      service(ScanConfig::Default(), MakeOptions(), out_, err_);
  const IndexReport report = service.Run();
  EXPECT_EQ(report.albums_found_, 0u);
  EXPECT_NE(out_.str().find("No album folders found."), std::string::npos);
}

TEST_F(IndexServiceTest, NonUtf8NameFailsTheAlbum) {
  const auto album = root_ / "trip";
  test_util::WriteText(album / "a.jpg", "x");
  test_util::WriteText(album / "latin1_\xE9t\xE9.jpg", "x");
  test_util::WriteText(root_ / "walk" / "b.jpg", "x");

  IndexService      service(ScanConfig::Default(), MakeOptions(), out_, err_);
  const IndexReport report = service.Run();

  EXPECT_EQ(report.errors_, 1u);
  EXPECT_EQ(report.albums_indexed_, 1u);
  EXPECT_FALSE(std::filesystem::exists(album / "index.json"));
  EXPECT_FALSE(std::filesystem::exists(album / "index.js"));
  EXPECT_TRUE(std::filesystem::exists(root_ / "walk" / "index.json"));
  EXPECT_NE(err_.str().find("ERROR indexing "), std::string::npos);
  EXPECT_NE(out_.str().find("errors: 1"), std::string::npos);
}

TEST_F(IndexServiceTest, IndexAlbumReportsStatus) {
  test_util::WriteText(root_ / "trip" / "a.jpg", "x");

  IndexService           service(ScanConfig::Default(), MakeOptions(), out_, err_);
  const AlbumIndexResult result = service.IndexAlbum(root_ / "trip");
  EXPECT_EQ(result.status_, AlbumIndexStatus::WRITTEN);
  ASSERT_EQ(result.files_.size(), 1u);
  EXPECT_EQ(result.files_[0], "a.jpg");
  EXPECT_EQ(result.messages_.size(), 2u);
}
};  // namespace photoshelf
