#include "Coverage.hpp"
#include "TestPages.hpp"

#include <gtest/gtest.h>

using namespace artfmt;
using namespace artfmt::test_pages;

class CoverageTest : public ::testing::Test {
protected:
  // 100 x 100 pt clip, area 10000
  const cv::Rect2d clip{0, 0, 100, 100};
  PageContent page = makePage(200, 200);
  CoverageConfig config;
  SegmentConfig segmentConfig;
};

TEST_F(CoverageTest, RasterCoverageOfSingleImage) {
  page.images.push_back(makeImage("xref:1", cv::Rect2d(0, 0, 100, 90), 10, 9));
  EXPECT_NEAR(rasterCoverage(page, clip), 0.9, 1e-9);
}

TEST_F(CoverageTest, RasterCoverageCountsOnlyThePartInsideClip) {
  page.images.push_back(
      makeImage("xref:1", cv::Rect2d(50, 50, 100, 100), 10, 10));
  EXPECT_NEAR(rasterCoverage(page, clip), 0.25, 1e-9);
}

TEST_F(CoverageTest, OverlappingImagesAreClampedToOne) {
  page.images.push_back(makeImage("xref:1", clip, 10, 10));
  page.images.push_back(makeImage("xref:2", clip, 10, 10));
  EXPECT_DOUBLE_EQ(rasterCoverage(page, clip), 1.0);
}

TEST_F(CoverageTest, TextCoverageSkipsNonTextBlocks) {
  page.textBlocks.push_back(makeTextBlock(cv::Rect2d(0, 0, 50, 20)));
  page.textBlocks.push_back(
      makeTextBlock(cv::Rect2d(0, 50, 100, 50), BlockKind::Image));
  EXPECT_NEAR(textCoverage(page, clip), 0.1, 1e-9);
}

TEST_F(CoverageTest, DegenerateClipYieldsZeroEverywhere) {
  const cv::Rect2d empty(10, 10, 0, 0);
  page.images.push_back(makeImage("xref:1", clip, 10, 10));
  page.textBlocks.push_back(makeTextBlock(clip));
  page.drawings.push_back(makeFilledBlob(clip));

  EXPECT_DOUBLE_EQ(rasterCoverage(page, empty), 0.0);
  EXPECT_DOUBLE_EQ(textCoverage(page, empty), 0.0);
  EXPECT_DOUBLE_EQ(drawingCoverage(page, empty, config), 0.0);
}

TEST_F(CoverageTest, FilledRectPanelIsDownWeighted) {
  // Filled, unstroked, single item, 20% of the clip
  page.drawings.push_back(makeFilledRect(cv::Rect2d(0, 0, 50, 40)));
  EXPECT_NEAR(drawingCoverage(page, clip, config), 0.05 * 0.2, 1e-9);
}

TEST_F(CoverageTest, FilledQuadPanelIsDownWeighted) {
  page.drawings.push_back(makeFilledQuad(cv::Rect2d(0, 0, 50, 40)));
  EXPECT_NEAR(drawingCoverage(page, clip, config), 0.05 * 0.2, 1e-9);
}

TEST_F(CoverageTest, SmallRectangleUsesRectangleWeight) {
  page.drawings.push_back(makeFilledRect(cv::Rect2d(0, 0, 10, 10)));
  EXPECT_NEAR(drawingCoverage(page, clip, config), 0.15 * 0.01, 1e-9);
}

TEST_F(CoverageTest, CurvedShapeUsesCurvedWeight) {
  page.drawings.push_back(makeFilledBlob(cv::Rect2d(0, 0, 20, 20)));
  EXPECT_NEAR(drawingCoverage(page, clip, config), 0.40 * 0.04, 1e-9);
}

TEST_F(CoverageTest, StraightShapeUsesStraightWeight) {
  page.drawings.push_back(makeDrawing(
      cv::Rect2d(0, 0, 20, 20), false, 1.0,
      {PathOp::Move, PathOp::Line, PathOp::Line, PathOp::Line, PathOp::Line,
       PathOp::Line, PathOp::Close}));
  EXPECT_NEAR(drawingCoverage(page, clip, config), 0.30 * 0.04, 1e-9);
}

TEST_F(CoverageTest, LargeStrokedShapeWithDetailIsNotAPanel) {
  // 30% of the clip but stroked and detailed: regular shape weight
  page.drawings.push_back(makeDrawing(
      cv::Rect2d(0, 0, 100, 30), true, 1.0,
      {PathOp::Move, PathOp::Curve, PathOp::Line, PathOp::Curve,
       PathOp::Line, PathOp::Close}));
  EXPECT_NEAR(drawingCoverage(page, clip, config), 0.40 * 0.3, 1e-9);
}

TEST_F(CoverageTest, HairlineStrokesAreIgnored) {
  page.drawings.push_back(makeDrawing(cv::Rect2d(0, 0, 50, 50), false, 0.1,
                                      {PathOp::Move, PathOp::Line}));
  EXPECT_DOUBLE_EQ(drawingCoverage(page, clip, config), 0.0);
  EXPECT_EQ(countVectorSegments(page, clip, segmentConfig), 0);
}

TEST_F(CoverageTest, DrawingsOutsideClipAreIgnored) {
  page.drawings.push_back(makeFilledBlob(cv::Rect2d(150, 150, 40, 40)));
  EXPECT_DOUBLE_EQ(drawingCoverage(page, clip, config), 0.0);
  EXPECT_EQ(countVectorSegments(page, clip, segmentConfig), 0);
}

TEST_F(CoverageTest, CoverageStaysWithinUnitRange) {
  for (int i = 0; i < 50; i++) {
    page.drawings.push_back(makeFilledBlob(clip));
    page.images.push_back(makeImage("inline:" + std::to_string(i), clip, 1, 1));
    page.textBlocks.push_back(makeTextBlock(clip));
  }

  double drawing = drawingCoverage(page, clip, config);
  double text = textCoverage(page, clip);
  EXPECT_DOUBLE_EQ(drawing, 1.0);
  EXPECT_DOUBLE_EQ(rasterCoverage(page, clip), 1.0);
  EXPECT_DOUBLE_EQ(text, 1.0);
  EXPECT_DOUBLE_EQ(effectiveVectorCoverage(text, drawing, config), 1.0);
}

TEST_F(CoverageTest, EffectiveVectorCoverageDampsDrawingsOnly) {
  EXPECT_NEAR(effectiveVectorCoverage(0.1, 0.2, config), 0.1 + 0.5 * 0.2,
              1e-12);

  config.drawingWeight = 1.0;
  EXPECT_NEAR(effectiveVectorCoverage(0.1, 0.2, config), 0.3, 1e-12);
}

TEST_F(CoverageTest, SegmentsCountEveryOperatorOfRetainedDrawings) {
  page.drawings.push_back(makeFilledQuad(cv::Rect2d(10, 10, 20, 20)));
  page.drawings.push_back(makeFilledBlob(cv::Rect2d(40, 40, 20, 20)));
  EXPECT_EQ(countVectorSegments(page, clip, segmentConfig), 10);
}

TEST_F(CoverageTest, FilledDrawingsCountAtZeroStrokeWidth) {
  page.drawings.push_back(makeDrawing(cv::Rect2d(10, 10, 20, 20), true, 0.0,
                                      {PathOp::Move, PathOp::Line,
                                       PathOp::Close}));
  EXPECT_EQ(countVectorSegments(page, clip, segmentConfig), 3);
}

TEST_F(CoverageTest, RectOperatorCountsOnlyWhenFilled) {
  page.drawings.push_back(
      makeDrawing(cv::Rect2d(10, 10, 10, 10), false, 1.0, {PathOp::Rect}));
  EXPECT_EQ(countVectorSegments(page, clip, segmentConfig), 0);

  page.drawings.push_back(makeFilledRect(cv::Rect2d(30, 30, 10, 10)));
  EXPECT_EQ(countVectorSegments(page, clip, segmentConfig), 1);
}

TEST_F(CoverageTest, TinyDrawingsAreNotCounted) {
  // 1 square point is 0.01% of the clip
  page.drawings.push_back(makeFilledQuad(cv::Rect2d(10, 10, 1, 1)));
  EXPECT_EQ(countVectorSegments(page, clip, segmentConfig), 0);
}

TEST_F(CoverageTest, LargeRectPanelsAreSkippedWhenEnabled) {
  page.drawings.push_back(makeFilledRect(clip));
  EXPECT_EQ(countVectorSegments(page, clip, segmentConfig), 0);

  segmentConfig.skipPanels = false;
  EXPECT_EQ(countVectorSegments(page, clip, segmentConfig), 1);
}

TEST_F(CoverageTest, LargeDetailedShapesAreCounted) {
  std::vector<PathOp> ops(12, PathOp::Curve);
  ops.insert(ops.begin(), PathOp::Move);
  page.drawings.push_back(makeDrawing(clip, true, 0.0, ops));
  EXPECT_EQ(countVectorSegments(page, clip, segmentConfig), 13);
}
