#include "PDFPageLoader.hpp"
#include "RegionClassifier.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace artfmt;

namespace {

// 200 x 200 pt page with a background panel, a 4 x 2 px image, a stroked
// right triangle, a stroked curve, a filled and stroked triangle and one line
// of text
const std::string kShapesPage = std::string(ARTFMT_TEST_DATA_DIR) +
                                "/shapes_page.pdf";

void expectRect(const cv::Rect2d &rect, double x, double y, double width,
                double height) {
  EXPECT_NEAR(rect.x, x, 1e-6);
  EXPECT_NEAR(rect.y, y, 1e-6);
  EXPECT_NEAR(rect.width, width, 1e-6);
  EXPECT_NEAR(rect.height, height, 1e-6);
}

} // namespace

TEST(RectangleDetectionTest, ClosedRectangleWithReturnPoint) {
  // re: four corners, closepath adds the return to the start
  std::vector<cv::Point2d> points = {
      {0, 0}, {100, 0}, {100, 50}, {0, 50}, {0, 0}};
  EXPECT_TRUE(isAxisAlignedRectangle(points, true));
}

TEST(RectangleDetectionTest, OpenOutlineReturningToStart) {
  std::vector<cv::Point2d> points = {
      {10, 10}, {10, 60}, {90, 60}, {90, 10}, {10.2, 10.1}};
  EXPECT_TRUE(isAxisAlignedRectangle(points, false));
}

TEST(RectangleDetectionTest, FourClosedCorners) {
  std::vector<cv::Point2d> points = {{0, 0}, {100, 0}, {100, 50}, {0, 50}};
  EXPECT_TRUE(isAxisAlignedRectangle(points, true));
  EXPECT_FALSE(isAxisAlignedRectangle(points, false));
}

TEST(RectangleDetectionTest, RightTriangleIsNotARectangle) {
  // m l l h: three corners plus the closing point
  std::vector<cv::Point2d> points = {{20, 80}, {80, 80}, {20, 120}, {20, 80}};
  EXPECT_FALSE(isAxisAlignedRectangle(points, true));
}

TEST(RectangleDetectionTest, ZigzagOnAGridIsNotARectangle) {
  std::vector<cv::Point2d> open = {
      {0, 0}, {10, 0}, {0, 10}, {10, 10}, {20, 10}};
  EXPECT_FALSE(isAxisAlignedRectangle(open, false));

  std::vector<cv::Point2d> returning = {
      {0, 0}, {10, 0}, {0, 10}, {10, 10}, {0, 0}};
  EXPECT_FALSE(isAxisAlignedRectangle(returning, false));
  EXPECT_FALSE(isAxisAlignedRectangle(returning, true));
}

TEST(RectangleDetectionTest, RepeatedCornerIsNotARectangle) {
  std::vector<cv::Point2d> points = {
      {0, 0}, {100, 0}, {100, 0}, {0, 50}, {0, 0}};
  EXPECT_FALSE(isAxisAlignedRectangle(points, true));
}

TEST(PDFPageLoaderTest, MissingFileFailsToLoad) {
  PDFPageLoader loader;
  auto result = loader.loadPage("does-not-exist.pdf", 0);
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.errorMessage.find("does-not-exist.pdf"), std::string::npos);
}

TEST(PDFPageLoaderTest, PageIndexOutOfRange) {
  PDFPageLoader loader;
  auto result = loader.loadPage(kShapesPage, 1);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.pageCount, 1);
  EXPECT_NE(result.errorMessage.find("out of range"), std::string::npos);
}

TEST(PDFPageLoaderTest, ExtractsImagesInTopLeftPageSpace) {
  PDFPageLoader loader;
  auto result = loader.loadPage(kShapesPage, 0);
  ASSERT_TRUE(result.success) << result.errorMessage;

  const PageContent &page = result.page;
  expectRect(page.bounds, 0, 0, 200, 200);

  ASSERT_EQ(page.images.size(), 1u);
  const PlacedImage &image = page.images[0];
  EXPECT_EQ(image.id, "xref:5");
  // Placed at y 140..190 in PDF space
  expectRect(image.placement, 10, 10, 100, 50);
  EXPECT_EQ(image.nativeWidth, 4);
  EXPECT_EQ(image.nativeHeight, 2);
}

TEST(PDFPageLoaderTest, ConvertsPathOperators) {
  PDFPageLoader loader;
  auto result = loader.loadPage(kShapesPage, 0);
  ASSERT_TRUE(result.success) << result.errorMessage;

  const auto &drawings = result.page.drawings;
  ASSERT_EQ(drawings.size(), 4u);

  const std::vector<PathOp> triangleOps = {PathOp::Move, PathOp::Line,
                                           PathOp::Line, PathOp::Line,
                                           PathOp::Close};

  // re f
  EXPECT_EQ(drawings[0].ops, std::vector<PathOp>{PathOp::Rect});
  EXPECT_TRUE(drawings[0].filled);
  expectRect(drawings[0].bounds, 0, 0, 200, 200);

  // m l l h S stays a triangle
  EXPECT_EQ(drawings[1].ops, triangleOps);
  EXPECT_FALSE(drawings[1].filled);
  EXPECT_NEAR(drawings[1].strokeWidth, 1.0, 1e-6);
  expectRect(drawings[1].bounds, 20, 80, 60, 40);

  // m c S
  const std::vector<PathOp> curveOps = {PathOp::Move, PathOp::Curve};
  EXPECT_EQ(drawings[2].ops, curveOps);
  EXPECT_FALSE(drawings[2].filled);
  expectRect(drawings[2].bounds, 120, 80, 60, 40);

  // B paints the triangle twice but yields one drawing
  EXPECT_EQ(drawings[3].ops, triangleOps);
  EXPECT_TRUE(drawings[3].filled);
  EXPECT_NEAR(drawings[3].strokeWidth, 2.0, 1e-6);
  expectRect(drawings[3].bounds, 120, 140, 60, 40);
}

TEST(PDFPageLoaderTest, TextLinesShareThePathCoordinateSpace) {
  PDFPageLoader loader;
  auto result = loader.loadPage(kShapesPage, 0);
  ASSERT_TRUE(result.success) << result.errorMessage;

  std::vector<cv::Rect2d> textLines;
  std::vector<cv::Rect2d> imageBlocks;
  for (const auto &block : result.page.textBlocks) {
    if (block.kind == BlockKind::Text) {
      textLines.push_back(block.bounds);
    } else {
      imageBlocks.push_back(block.bounds);
    }
  }

  // "Hello World", 12 pt on a baseline at y = 30 in PDF space
  ASSERT_EQ(textLines.size(), 1u);
  EXPECT_NEAR(textLines[0].x, 20.0, 1.0);
  EXPECT_GT(textLines[0].width, 40.0);
  EXPECT_LT(textLines[0].width, 90.0);
  EXPECT_GT(textLines[0].y, 150.0);
  EXPECT_LT(textLines[0].y + textLines[0].height, 180.0);

  ASSERT_EQ(imageBlocks.size(), 1u);
  expectRect(imageBlocks[0], 10, 10, 100, 50);
}

TEST(PDFPageLoaderTest, ClassifiesWholePage) {
  RegionClassifier classifier;
  auto result = classifier.classifyPDF(
      kShapesPage, 0, RegionRequest::fromPageRect(0, 0, 200, 200));
  ASSERT_TRUE(result.success) << result.errorMessage;

  const CoverageMetrics &m = result.metrics;
  EXPECT_EQ(m.regionSource, RegionSource::Explicit);
  EXPECT_NEAR(m.rasterCoverage, 0.125, 1e-9);
  // Panel 0.05, two triangles 0.3 x 0.06 each, curve 0.4 x 0.06
  EXPECT_NEAR(m.drawingCoverage, 0.11, 1e-6);
  // Triangles 5 each, curve 2, panel skipped
  EXPECT_EQ(m.vectorSegments, 12);
  EXPECT_EQ(m.rasterCount, 1);
  ASSERT_TRUE(m.nativeRaster.has_value());
  EXPECT_EQ(m.nativeRaster->imageId, "xref:5");
  EXPECT_NEAR(m.nativeRaster->dpiMin, 2.88, 1e-6);

  EXPECT_EQ(result.label, Label::HasRaster);
  EXPECT_EQ(result.rule, DecisionRule::ClearRasterMargin);
}

TEST(PDFPageLoaderTest, ClassifiesDefaultBottomHalf) {
  RegionClassifier classifier;
  auto result = classifier.classifyPDF(kShapesPage, 0, RegionRequest());
  ASSERT_TRUE(result.success) << result.errorMessage;

  EXPECT_EQ(result.metrics.regionSource, RegionSource::BottomHalf);
  expectRect(result.metrics.clip, 0, 100, 200, 100);
  EXPECT_DOUBLE_EQ(result.metrics.rasterCoverage, 0.0);
  EXPECT_EQ(result.label, Label::HasVector);
  EXPECT_EQ(result.rule, DecisionRule::NoRasterGuard);
}

TEST(WordGroupingTest, WordsOnOneLineAreMerged) {
  std::vector<cv::Rect2d> words = {cv::Rect2d(10, 100, 30, 10),
                                   cv::Rect2d(45, 101, 20, 10),
                                   cv::Rect2d(70, 100, 25, 10)};
  auto lines = groupWordsIntoLines(words);
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_DOUBLE_EQ(lines[0].x, 10.0);
  EXPECT_DOUBLE_EQ(lines[0].y, 100.0);
  EXPECT_DOUBLE_EQ(lines[0].width, 85.0);
  EXPECT_DOUBLE_EQ(lines[0].height, 11.0);
}

TEST(WordGroupingTest, SeparateLinesAndDistantWordsStayApart) {
  std::vector<cv::Rect2d> words = {
      cv::Rect2d(10, 100, 30, 10), cv::Rect2d(10, 130, 30, 10),
      cv::Rect2d(500, 100, 30, 10)};
  auto lines = groupWordsIntoLines(words);
  EXPECT_EQ(lines.size(), 3u);
}
