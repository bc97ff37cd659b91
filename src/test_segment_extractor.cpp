#include "geomap/ArtifactStore.hpp"
#include "geomap/SegmentExtractor.hpp"

#include <gtest/gtest.h>
#include <opencv2/imgcodecs.hpp>

#include <filesystem>
#include <memory>
#include <random>

namespace fs = std::filesystem;

namespace {

using geomap::ArtifactStore;
using geomap::BoundingBox;
using geomap::SegmentExtractor;

class SegmentExtractorTest : public ::testing::Test {
protected:
  void SetUp() override {
    std::random_device rd;
    m_dir = fs::temp_directory_path() /
            ("geomap_segments_" + std::to_string(rd()));
    m_store = std::make_unique<ArtifactStore>(m_dir);
    m_image = cv::Mat(300, 400, CV_8UC3, cv::Scalar(200, 180, 160));
  }

  void TearDown() override {
    m_store.reset();
    std::error_code ec;
    fs::remove_all(m_dir, ec);
  }

  fs::path m_dir;
  std::unique_ptr<ArtifactStore> m_store;
  cv::Mat m_image;
};

TEST_F(SegmentExtractorTest, WritesCropWithJobScopedName) {
  SegmentExtractor extractor(*m_store, geomap::SegmentConfig());

  auto result = extractor.extract(m_image, BoundingBox{10, 20, 110, 70},
                                  "job-1");
  ASSERT_TRUE(result.success) << result.errorMessage;
  EXPECT_EQ(result.filename.rfind("segment_job-1_", 0), 0u);
  EXPECT_EQ(result.filename.size(),
            std::string("segment_job-1_").size() + 8 + 4);
  EXPECT_EQ(result.filename.substr(result.filename.size() - 4), ".jpg");
  EXPECT_EQ(result.bbox, (BoundingBox{10, 20, 110, 70}));

  cv::Mat written = cv::imread((m_dir / result.filename).string());
  ASSERT_FALSE(written.empty());
  EXPECT_EQ(written.cols, 100);
  EXPECT_EQ(written.rows, 50);
}

TEST_F(SegmentExtractorTest, NamesDoNotCollide) {
  SegmentExtractor extractor(*m_store, geomap::SegmentConfig());

  auto a = extractor.extract(m_image, BoundingBox{0, 0, 50, 50}, "job-2");
  auto b = extractor.extract(m_image, BoundingBox{0, 0, 50, 50}, "job-2");
  ASSERT_TRUE(a.success);
  ASSERT_TRUE(b.success);
  EXPECT_NE(a.filename, b.filename);
}

TEST_F(SegmentExtractorTest, InvertedBoxUsesDefaultCrop) {
  SegmentExtractor extractor(*m_store, geomap::SegmentConfig());

  auto result = extractor.extract(m_image, BoundingBox{200, 10, 50, 90},
                                  "job-3");
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.bbox, (BoundingBox{0, 0, 100, 100}));
}

TEST_F(SegmentExtractorTest, DefaultCropShrinksToSmallImages) {
  SegmentExtractor extractor(*m_store, geomap::SegmentConfig());
  cv::Mat tiny(40, 60, CV_8UC3, cv::Scalar(0, 0, 0));

  auto result = extractor.extract(tiny, BoundingBox{0, 0, 0, 0}, "job-4");
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.bbox, (BoundingBox{0, 0, 60, 40}));
}

TEST_F(SegmentExtractorTest, OutOfBoundsBoxUsesDefaultCrop) {
  SegmentExtractor extractor(*m_store, geomap::SegmentConfig());

  BoundingBox box = extractor.effectiveBox(BoundingBox{-5, 0, 50, 50}, 400,
                                           300);
  EXPECT_EQ(box, (BoundingBox{0, 0, 100, 100}));
  box = extractor.effectiveBox(BoundingBox{0, 0, 401, 50}, 400, 300);
  EXPECT_EQ(box, (BoundingBox{0, 0, 100, 100}));
  box = extractor.effectiveBox(BoundingBox{0, 0, 400, 300}, 400, 300);
  EXPECT_EQ(box, (BoundingBox{0, 0, 400, 300}));
}

TEST_F(SegmentExtractorTest, WriteFailureYieldsErrorMarker) {
  SegmentExtractor extractor(*m_store, geomap::SegmentConfig());
  fs::remove_all(m_dir);

  geomap::SegmentResult result;
  EXPECT_NO_THROW(result = extractor.extract(
                      m_image, BoundingBox{0, 0, 10, 10}, "job-5"));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.filename, "segment_error_job-5");
  EXPECT_FALSE(result.errorMessage.empty());
}

TEST(ArtifactStoreTest, RejectsTraversalAndSeparators) {
  EXPECT_TRUE(ArtifactStore::isSafeFilename("segment_abc_0011aabb.jpg"));
  EXPECT_FALSE(ArtifactStore::isSafeFilename(""));
  EXPECT_FALSE(ArtifactStore::isSafeFilename(".."));
  EXPECT_FALSE(ArtifactStore::isSafeFilename("../etc/passwd"));
  EXPECT_FALSE(ArtifactStore::isSafeFilename("a/b.jpg"));
  EXPECT_FALSE(ArtifactStore::isSafeFilename("a\\b.jpg"));
  EXPECT_FALSE(ArtifactStore::isSafeFilename("segment..jpg"));
}

TEST(ArtifactStoreTest, LocateOnlyFindsExistingFiles) {
  std::random_device rd;
  fs::path dir =
      fs::temp_directory_path() / ("geomap_store_" + std::to_string(rd()));
  {
    ArtifactStore store(dir);
    EXPECT_TRUE(fs::is_directory(dir));
    EXPECT_FALSE(store.locate("missing.jpg").has_value());
    EXPECT_FALSE(store.locate("../missing.jpg").has_value());

    cv::Mat pixel(4, 4, CV_8UC3, cv::Scalar(1, 2, 3));
    ASSERT_TRUE(cv::imwrite((dir / "present.png").string(), pixel));
    auto path = store.locate("present.png");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, dir / "present.png");
  }
  fs::remove_all(dir);
}

} // namespace
